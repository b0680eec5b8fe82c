#include "ipc/socket_server.hpp"
#include <spdlog/spdlog.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace devsnap::ipc {

namespace {

bool set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0) {
        return false;
    }
    return fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

} // namespace

SocketServer::SocketServer(const std::string& socket_path)
    : socket_path_(socket_path) {}

SocketServer::~SocketServer() {
    stop();
}

bool SocketServer::init() {
    struct sockaddr_un addr;
    if (socket_path_.size() >= sizeof(addr.sun_path)) {
        spdlog::error("Socket path too long: {}", socket_path_);
        return false;
    }

    // Remove a stale socket left by a previous run
    unlink(socket_path_.c_str());

    server_fd_ = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (server_fd_ < 0) {
        spdlog::error("Failed to create socket: {}", strerror(errno));
        return false;
    }

    std::memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, socket_path_.c_str(), sizeof(addr.sun_path) - 1);

    if (bind(server_fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        spdlog::error("Failed to bind {}: {}", socket_path_, strerror(errno));
        close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    if (listen(server_fd_, 64) < 0) {
        spdlog::error("Failed to listen on {}: {}", socket_path_, strerror(errno));
        close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    if (!set_nonblocking(server_fd_)) {
        spdlog::error("Failed to make server socket non-blocking: {}", strerror(errno));
        close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    spdlog::info("Agent socket listening on {}", socket_path_);
    return true;
}

void SocketServer::set_handler(MessageHandler handler) {
    handler_ = std::move(handler);
}

int SocketServer::accept_connection() {
    int client_fd = accept4(server_fd_, nullptr, nullptr, SOCK_NONBLOCK | SOCK_CLOEXEC);
    if (client_fd < 0) {
        if (errno != EAGAIN && errno != EWOULDBLOCK) {
            spdlog::error("Failed to accept connection: {}", strerror(errno));
        }
        return -1;
    }

    uint32_t conn_id = next_conn_id_++;
    clients_[client_fd] = std::make_unique<ClientConnection>(client_fd, conn_id);
    conn_fds_[conn_id] = client_fd;

    spdlog::debug("Agent connection {} accepted (fd={})", conn_id, client_fd);
    return client_fd;
}

uint32_t SocketServer::conn_id_for(int client_fd) const {
    auto it = clients_.find(client_fd);
    return it == clients_.end() ? 0 : it->second->conn_id;
}

int SocketServer::fd_for(uint32_t conn_id) const {
    auto it = conn_fds_.find(conn_id);
    return it == conn_fds_.end() ? -1 : it->second;
}

bool SocketServer::handle_client(int client_fd) {
    auto it = clients_.find(client_fd);
    if (it == clients_.end()) {
        return false;
    }
    auto& client = *it->second;

    uint8_t buf[8192];
    while (true) {
        ssize_t n = recv(client_fd, buf, sizeof(buf), 0);
        if (n > 0) {
            client.recv_buffer.insert(client.recv_buffer.end(), buf, buf + n);
            continue;
        }
        if (n == 0) {
            spdlog::debug("Agent connection {} closed by peer", client.conn_id);
            return false;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            break;
        }
        if (errno == EINTR) {
            continue;
        }
        spdlog::warn("recv failed on connection {}: {}", client.conn_id, strerror(errno));
        return false;
    }

    return process_messages(client);
}

bool SocketServer::process_messages(ClientConnection& client) {
    size_t offset = 0;

    while (offset < client.recv_buffer.size()) {
        const uint8_t* data = client.recv_buffer.data() + offset;
        size_t len = client.recv_buffer.size() - offset;

        if (Message::is_corrupt(data, len)) {
            spdlog::warn("Corrupt frame from connection {}, dropping connection", client.conn_id);
            return false;
        }

        auto size = Message::get_message_size(data, len);
        if (!size || len < *size) {
            break; // wait for the rest of the frame
        }

        auto msg = Message::deserialize(data, *size);
        offset += *size;
        if (!msg || !handler_) {
            continue;
        }

        auto reply = handler_(client.conn_id, *msg);
        if (reply) {
            auto bytes = reply->serialize();
            client.send_buffer.insert(client.send_buffer.end(), bytes.begin(), bytes.end());
            client.want_write = true;
        }
    }

    if (offset > 0) {
        client.recv_buffer.erase(client.recv_buffer.begin(),
                                 client.recv_buffer.begin() + static_cast<std::ptrdiff_t>(offset));
    }
    return true;
}

bool SocketServer::send_to(uint32_t conn_id, const Message& msg) {
    int fd = fd_for(conn_id);
    if (fd < 0) {
        return false;
    }

    auto& client = *clients_.at(fd);
    auto bytes = msg.serialize();
    client.send_buffer.insert(client.send_buffer.end(), bytes.begin(), bytes.end());
    client.want_write = true;
    return true;
}

bool SocketServer::flush_client(int client_fd) {
    auto it = clients_.find(client_fd);
    if (it == clients_.end()) {
        return false;
    }
    auto& client = *it->second;

    size_t sent_total = 0;
    while (sent_total < client.send_buffer.size()) {
        ssize_t n = send(client_fd, client.send_buffer.data() + sent_total,
                         client.send_buffer.size() - sent_total, MSG_NOSIGNAL);
        if (n > 0) {
            sent_total += static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            break;
        }
        spdlog::warn("send failed on connection {}: {}", client.conn_id, strerror(errno));
        return false;
    }

    client.send_buffer.erase(client.send_buffer.begin(),
                             client.send_buffer.begin() + static_cast<std::ptrdiff_t>(sent_total));
    client.want_write = !client.send_buffer.empty();
    return true;
}

bool SocketServer::client_wants_write(int client_fd) const {
    auto it = clients_.find(client_fd);
    return it != clients_.end() && it->second->want_write;
}

uint32_t SocketServer::remove_client(int client_fd) {
    auto it = clients_.find(client_fd);
    if (it == clients_.end()) {
        return 0;
    }

    uint32_t conn_id = it->second->conn_id;
    conn_fds_.erase(conn_id);
    clients_.erase(it);
    close(client_fd);

    spdlog::debug("Agent connection {} removed (fd={})", conn_id, client_fd);
    return conn_id;
}

void SocketServer::stop() {
    for (auto& [fd, client] : clients_) {
        close(fd);
    }
    clients_.clear();
    conn_fds_.clear();

    if (server_fd_ >= 0) {
        close(server_fd_);
        server_fd_ = -1;
        unlink(socket_path_.c_str());
    }
}

} // namespace devsnap::ipc
