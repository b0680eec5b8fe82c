#pragma once
#include <atomic>
#include <cstdint>
#include <functional>
#include "broker/agent_channel.hpp"

namespace devsnap::broker {

class Reactor;

// Delivers a message to a connection; always invoked on the reactor thread
using DeliverFn = std::function<bool(uint32_t conn_id, const ipc::Message& msg)>;

// AgentChannel backed by one socket connection. Sends from any thread are
// marshalled onto the reactor thread.
class SocketChannel final : public AgentChannel {
public:
    SocketChannel(Reactor& reactor, DeliverFn deliver, uint32_t conn_id);

    bool send(const ipc::Message& msg) override;
    bool is_open() const override { return open_; }
    std::string describe() const override;

    // Called by the broker when the connection goes away
    void mark_closed() { open_ = false; }

private:
    Reactor& reactor_;
    DeliverFn deliver_;
    uint32_t conn_id_;
    std::atomic<bool> open_{true};
};

} // namespace devsnap::broker
