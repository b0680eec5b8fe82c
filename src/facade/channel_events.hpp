#pragma once
#include <memory>
#include <optional>
#include <nlohmann/json.hpp>
#include "ipc/protocol.hpp"

namespace devsnap::broker {
class AgentChannel;
class CorrelationTable;
class SessionRegistry;
} // namespace devsnap::broker

namespace devsnap::facade {

// Applies inbound agent events to the registry and the correlation table.
// Never throws: malformed events are logged and dropped.
class ChannelEventHandler {
public:
    ChannelEventHandler(broker::SessionRegistry& registry, broker::CorrelationTable& table);

    // Returns a message to send back to the agent, if any (ACK for HELLO)
    std::optional<ipc::Message> handle(const std::shared_ptr<broker::AgentChannel>& channel,
                                       const ipc::Message& msg);

    // Channel closed: drop every session it carried
    size_t on_disconnect(const broker::AgentChannel* channel);

private:
    broker::SessionRegistry& registry_;
    broker::CorrelationTable& table_;

    std::optional<ipc::Message> handle_hello(const std::shared_ptr<broker::AgentChannel>& channel,
                                             const nlohmann::json& j);
    void handle_pong(const nlohmann::json& j);
    void handle_bye(const nlohmann::json& j);
    void handle_result(ipc::EventType event, const nlohmann::json& j);
};

} // namespace devsnap::facade
