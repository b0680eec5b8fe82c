#include "broker/broker.hpp"
#include "broker/command_dispatcher.hpp"
#include "broker/correlation_table.hpp"
#include "broker/liveness_sweeper.hpp"
#include "broker/reactor.hpp"
#include "broker/session_registry.hpp"
#include "broker/socket_channel.hpp"
#include "broker/timer_queue.hpp"
#include "facade/channel_events.hpp"
#include "facade/snap_service.hpp"
#include "http/http_api.hpp"
#include "ipc/socket_server.hpp"
#include <spdlog/spdlog.h>
#include <sys/epoll.h>
#include <csignal>

namespace devsnap::broker {

// Global broker pointer for signal handling
static Broker* g_broker = nullptr;

static void signal_handler(int) {
    if (g_broker) {
        g_broker->shutdown();
    }
}

Broker::Broker(const Config& config, util::WallClock clock)
    : config_(config)
{
    reactor_ = std::make_unique<Reactor>();
    socket_server_ = std::make_unique<ipc::SocketServer>(config_.socket_path);
    timers_ = std::make_unique<TimerQueue>();
    registry_ = std::make_unique<SessionRegistry>(std::move(clock));
    table_ = std::make_unique<CorrelationTable>(*timers_);
    dispatcher_ = std::make_unique<CommandDispatcher>(*registry_, *table_);
    sweeper_ = std::make_unique<LivenessSweeper>(*registry_, *timers_,
        config_.sweep_interval_ms, config_.stale_after_ms);
    events_ = std::make_unique<facade::ChannelEventHandler>(*registry_, *table_);

    facade::ServiceDefaults defaults;
    defaults.active_window_ms = config_.active_window_ms;
    defaults.dump_wait_ms = config_.dump_wait_ms;
    defaults.ping_wait_ms = config_.ping_wait_ms;
    defaults.max_wait_ms = config_.max_wait_ms;
    service_ = std::make_unique<facade::SnapService>(*registry_, *dispatcher_, defaults);

    http_ = std::make_unique<http::HttpApi>(*service_, config_.route_prefix, config_.http_worker_threads);
}

Broker::~Broker() {
    teardown();
    if (g_broker == this) {
        g_broker = nullptr;
    }
}

bool Broker::init() {
    spdlog::info("Initializing devsnap broker...");

    if (!reactor_->init()) {
        spdlog::error("Failed to initialize reactor");
        return false;
    }

    socket_server_->set_handler([this](uint32_t conn_id, const ipc::Message& msg) {
        return handle_message(conn_id, msg);
    });

    if (!socket_server_->init()) {
        spdlog::error("Failed to initialize socket server");
        return false;
    }

    int server_fd = socket_server_->get_server_fd();
    if (!reactor_->add(server_fd, EPOLLIN, [this](int fd, uint32_t events) {
            on_server_event(fd, events);
        })) {
        return false;
    }

    if (!sweeper_->start()) {
        return false;
    }

    if (!http_->start(config_.http_host, config_.http_port)) {
        spdlog::error("Failed to start HTTP API");
        return false;
    }

    initialized_ = true;
    spdlog::info("Broker initialized (active window {}ms, dump wait {}ms, ping wait {}ms)",
        config_.active_window_ms, config_.dump_wait_ms, config_.ping_wait_ms);
    return true;
}

void Broker::install_signal_handlers() {
    g_broker = this;
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
}

void Broker::run() {
    if (!initialized_) {
        spdlog::error("Broker::run called before a successful init");
        return;
    }

    running_ = true;
    spdlog::info("devsnap broker running");
    spdlog::info("Agents connect on: {}", config_.socket_path);

    while (!stop_requested_) {
        int n = reactor_->poll(100);
        if (n < 0) {
            spdlog::error("Reactor error, exiting");
            break;
        }
    }

    spdlog::info("Broker shutting down...");
    teardown();
    running_ = false;
    spdlog::info("Broker stopped");
}

void Broker::shutdown() {
    stop_requested_ = true;
}

int Broker::http_port() const {
    return http_->port();
}

void Broker::teardown() {
    // Fail whatever is still waiting so in-flight operator calls can answer,
    // then stop serving
    sweeper_->stop();
    table_->close();
    http_->stop();
    timers_->stop();

    for (auto& [conn_id, channel] : channels_) {
        channel->mark_closed();
    }
    channels_.clear();
    socket_server_->stop();
}

void Broker::on_server_event(int, uint32_t events) {
    if (!(events & EPOLLIN)) {
        return;
    }

    // Accept new connections
    while (true) {
        int client_fd = socket_server_->accept_connection();
        if (client_fd < 0) {
            break;
        }

        uint32_t conn_id = socket_server_->conn_id_for(client_fd);
        channels_[conn_id] = std::make_shared<SocketChannel>(*reactor_,
            [this](uint32_t id, const ipc::Message& msg) { return deliver(id, msg); },
            conn_id);

        if (!reactor_->add(client_fd, EPOLLIN | EPOLLHUP | EPOLLERR,
                [this, conn_id](int cfd, uint32_t ev) { on_client_event(cfd, conn_id, ev); })) {
            close_client(client_fd);
        }
    }
}

void Broker::on_client_event(int fd, uint32_t conn_id, uint32_t events) {
    if (socket_server_->conn_id_for(fd) != conn_id) {
        spdlog::debug("Ignoring event for stale connection {} on fd {}", conn_id, fd);
        return;
    }

    // Handle readable first so a final BYE before hangup is not lost
    if (events & EPOLLIN) {
        if (!socket_server_->handle_client(fd)) {
            close_client(fd);
            return;
        }
    }

    if (events & (EPOLLHUP | EPOLLERR)) {
        close_client(fd);
        return;
    }

    if (events & EPOLLOUT) {
        if (!socket_server_->flush_client(fd)) {
            close_client(fd);
            return;
        }
    }

    update_client_events(fd);
}

std::optional<ipc::Message> Broker::handle_message(uint32_t conn_id, const ipc::Message& msg) {
    auto it = channels_.find(conn_id);
    if (it == channels_.end()) {
        return std::nullopt;
    }
    return events_->handle(it->second, msg);
}

bool Broker::deliver(uint32_t conn_id, const ipc::Message& msg) {
    if (!socket_server_->send_to(conn_id, msg)) {
        return false;
    }

    int fd = socket_server_->fd_for(conn_id);
    if (!socket_server_->flush_client(fd)) {
        close_client(fd);
        return false;
    }
    update_client_events(fd);
    return true;
}

void Broker::close_client(int fd) {
    reactor_->remove(fd);
    uint32_t conn_id = socket_server_->remove_client(fd);
    if (conn_id == 0) {
        return;
    }

    auto it = channels_.find(conn_id);
    if (it != channels_.end()) {
        it->second->mark_closed();
        events_->on_disconnect(it->second.get());
        channels_.erase(it);
    }
}

void Broker::update_client_events(int fd) {
    if (socket_server_->conn_id_for(fd) == 0) {
        return;
    }

    uint32_t events = EPOLLIN | EPOLLHUP | EPOLLERR;
    if (socket_server_->client_wants_write(fd)) {
        events |= EPOLLOUT;
    }
    reactor_->modify(fd, events);
}

} // namespace devsnap::broker
