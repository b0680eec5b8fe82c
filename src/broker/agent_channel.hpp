#pragma once
#include <string>
#include "ipc/protocol.hpp"

namespace devsnap::broker {

// Handle used to push messages to one connected agent.
// Implementations must be safe to call from any thread.
class AgentChannel {
public:
    virtual ~AgentChannel() = default;

    // Queue a message for the agent. Returns false once the channel is closed.
    virtual bool send(const ipc::Message& msg) = 0;

    virtual bool is_open() const = 0;

    // Short label for logs
    virtual std::string describe() const = 0;
};

} // namespace devsnap::broker
