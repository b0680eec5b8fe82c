/**
 * devsnap Broker
 *
 * Owns every subsystem and their lifecycle:
 * - Reactor (epoll event loop) + SocketServer (agent channel)
 * - SessionRegistry, CorrelationTable, CommandDispatcher
 * - TimerQueue (deadlines) + LivenessSweeper
 * - ChannelEventHandler, SnapService, HttpApi (transport facade)
 */
#pragma once
#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <unordered_map>
#include "broker/config.hpp"
#include "ipc/protocol.hpp"
#include "util/clock.hpp"

namespace devsnap::ipc {
class SocketServer;
} // namespace devsnap::ipc

namespace devsnap::facade {
class ChannelEventHandler;
class SnapService;
} // namespace devsnap::facade

namespace devsnap::http {
class HttpApi;
} // namespace devsnap::http

namespace devsnap::broker {

class CommandDispatcher;
class CorrelationTable;
class LivenessSweeper;
class Reactor;
class SessionRegistry;
class SocketChannel;
class TimerQueue;

class Broker {
public:
    using Config = BrokerConfig;

    explicit Broker(const Config& config, util::WallClock clock = util::now_ms);
    ~Broker();

    // Non-copyable
    Broker(const Broker&) = delete;
    Broker& operator=(const Broker&) = delete;

    // Bind the agent socket and HTTP API, start the sweeper
    bool init();

    // Run the event loop (blocks until shutdown), then tear everything down
    void run();

    // Request shutdown. Safe from any thread or a signal handler.
    void shutdown();

    // Route SIGINT/SIGTERM to shutdown()
    void install_signal_handlers();

    bool is_running() const { return running_; }

    // Port the HTTP API bound to (useful with http_port 0)
    int http_port() const;

    SessionRegistry& registry() { return *registry_; }
    CorrelationTable& correlation_table() { return *table_; }
    facade::SnapService& service() { return *service_; }

private:
    Config config_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
    bool initialized_ = false;

    std::unique_ptr<Reactor> reactor_;
    std::unique_ptr<ipc::SocketServer> socket_server_;
    std::unique_ptr<TimerQueue> timers_;
    std::unique_ptr<SessionRegistry> registry_;
    std::unique_ptr<CorrelationTable> table_;
    std::unique_ptr<CommandDispatcher> dispatcher_;
    std::unique_ptr<LivenessSweeper> sweeper_;
    std::unique_ptr<facade::ChannelEventHandler> events_;
    std::unique_ptr<facade::SnapService> service_;
    std::unique_ptr<http::HttpApi> http_;

    // Reactor thread only
    std::unordered_map<uint32_t, std::shared_ptr<SocketChannel>> channels_;

    // Event handlers
    void on_server_event(int fd, uint32_t events);
    void on_client_event(int fd, uint32_t conn_id, uint32_t events);

    // Inbound frame from a connection
    std::optional<ipc::Message> handle_message(uint32_t conn_id, const ipc::Message& msg);

    // Outbound frame posted by a SocketChannel
    bool deliver(uint32_t conn_id, const ipc::Message& msg);

    void close_client(int fd);

    // Update client in reactor (for write events)
    void update_client_events(int fd);

    void teardown();
};

} // namespace devsnap::broker
