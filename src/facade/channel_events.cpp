#include "facade/channel_events.hpp"
#include "broker/agent_channel.hpp"
#include "broker/correlation_table.hpp"
#include "broker/session_registry.hpp"
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace devsnap::facade {

namespace {

// String field or empty; agents are free to send null or omit fields
std::string string_field(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        return {};
    }
    return it->get<std::string>();
}

} // namespace

ChannelEventHandler::ChannelEventHandler(broker::SessionRegistry& registry, broker::CorrelationTable& table)
    : registry_(registry), table_(table) {}

std::optional<ipc::Message> ChannelEventHandler::handle(const std::shared_ptr<broker::AgentChannel>& channel,
                                                        const ipc::Message& msg) {
    json j;
    try {
        j = json::parse(msg.payload_str());
    } catch (const std::exception& e) {
        spdlog::warn("Dropping {} with invalid payload: {}", ipc::event_to_string(msg.event), e.what());
        return std::nullopt;
    }
    if (!j.is_object()) {
        spdlog::warn("Dropping {}: payload is not an object", ipc::event_to_string(msg.event));
        return std::nullopt;
    }

    switch (msg.event) {
        case ipc::EventType::HELLO:
            return handle_hello(channel, j);
        case ipc::EventType::PONG:
            handle_pong(j);
            break;
        case ipc::EventType::BYE:
            handle_bye(j);
            break;
        case ipc::EventType::DUMP_RESULT:
        case ipc::EventType::PING_RESULT:
            handle_result(msg.event, j);
            break;
        default:
            spdlog::warn("Unexpected {} from agent {}", ipc::event_to_string(msg.event),
                channel ? channel->describe() : "?");
            break;
    }
    return std::nullopt;
}

std::optional<ipc::Message> ChannelEventHandler::handle_hello(const std::shared_ptr<broker::AgentChannel>& channel,
                                                              const json& j) {
    broker::SessionIdentity identity;
    identity.browser_id = string_field(j, "browserId");
    identity.page_id = string_field(j, "pageId");
    if (identity.browser_id.empty() || identity.page_id.empty()) {
        spdlog::warn("Dropping HELLO without browserId/pageId");
        return std::nullopt;
    }

    broker::SessionMetadata metadata;
    metadata.href = string_field(j, "href");
    metadata.title = string_field(j, "title");
    metadata.user_agent = string_field(j, "ua");
    if (metadata.user_agent.empty()) {
        metadata.user_agent = string_field(j, "userAgent");
    }

    registry_.upsert_on_hello(identity, metadata, channel);

    json ack;
    ack["sid"] = identity.sid();
    return ipc::Message(ipc::EventType::ACK, ack.dump());
}

void ChannelEventHandler::handle_pong(const json& j) {
    std::string sid = string_field(j, "sid");
    if (!registry_.touch(sid)) {
        spdlog::debug("Heartbeat for unknown session '{}' ignored", sid);
    }
}

void ChannelEventHandler::handle_bye(const json& j) {
    std::string sid = string_field(j, "sid");
    if (!sid.empty()) {
        registry_.remove(sid);
    }
}

void ChannelEventHandler::handle_result(ipc::EventType event, const json& j) {
    std::string request_id = string_field(j, "reqId");
    if (request_id.empty()) {
        spdlog::debug("Dropping {} without reqId", ipc::event_to_string(event));
        return;
    }

    auto ok = j.find("ok");
    bool failed = ok != j.end() && ok->is_boolean() && !ok->get<bool>();
    if (!failed) {
        table_.resolve(request_id, j);
        return;
    }

    std::string detail = "agent reported failure";
    auto error = j.find("error");
    if (error != j.end() && !error->is_null()) {
        detail = error->is_string() ? error->get<std::string>() : error->dump();
    }
    table_.reject(request_id, broker::DispatchError::AGENT_FAILURE, detail);
}

size_t ChannelEventHandler::on_disconnect(const broker::AgentChannel* channel) {
    return registry_.remove_channel(channel);
}

} // namespace devsnap::facade
