#pragma once
#include <string>
#include <functional>
#include <vector>
#include <unordered_map>
#include <memory>
#include <optional>
#include "ipc/protocol.hpp"

namespace devsnap::ipc {

// Client connection state
struct ClientConnection {
    int fd;
    uint32_t conn_id;
    std::vector<uint8_t> recv_buffer;
    std::vector<uint8_t> send_buffer;
    bool want_write = false;

    explicit ClientConnection(int fd, uint32_t id) : fd(fd), conn_id(id) {}
};

// Message handler callback type. A returned message is queued back to the sender.
using MessageHandler = std::function<std::optional<Message>(uint32_t conn_id, const Message&)>;

// Unix domain socket server. Every method must be called from the reactor thread.
class SocketServer {
public:
    explicit SocketServer(const std::string& socket_path);
    ~SocketServer();

    // Non-copyable
    SocketServer(const SocketServer&) = delete;
    SocketServer& operator=(const SocketServer&) = delete;

    // Initialize and bind socket
    bool init();

    // Set message handler
    void set_handler(MessageHandler handler);

    // Get server fd for event loop
    int get_server_fd() const { return server_fd_; }

    // Accept new connection, returns client fd
    int accept_connection();

    // Connection id for an accepted fd (0 if unknown)
    uint32_t conn_id_for(int client_fd) const;

    // fd for a connection id (-1 if gone)
    int fd_for(uint32_t conn_id) const;

    // Handle client data (read/process/respond)
    // Returns false if client disconnected
    bool handle_client(int client_fd);

    // Queue a message for a connection; false if the connection is gone
    bool send_to(uint32_t conn_id, const Message& msg);

    // Send pending data to client
    bool flush_client(int client_fd);

    // Check if client wants to write
    bool client_wants_write(int client_fd) const;

    // Remove client, returns its connection id (0 if unknown)
    uint32_t remove_client(int client_fd);

    // Cleanup
    void stop();

    // Get socket path
    const std::string& socket_path() const { return socket_path_; }

private:
    std::string socket_path_;
    int server_fd_ = -1;
    uint32_t next_conn_id_ = 1;
    std::unordered_map<int, std::unique_ptr<ClientConnection>> clients_;
    std::unordered_map<uint32_t, int> conn_fds_;
    MessageHandler handler_;

    // Process complete messages in client buffer
    // Returns false if the stream is corrupt
    bool process_messages(ClientConnection& client);
};

} // namespace devsnap::ipc
