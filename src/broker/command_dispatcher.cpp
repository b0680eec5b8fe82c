#include "broker/command_dispatcher.hpp"
#include "broker/correlation_table.hpp"
#include "broker/session_registry.hpp"
#include "util/request_id.hpp"
#include <spdlog/spdlog.h>
#include <memory>

using json = nlohmann::json;

namespace devsnap::broker {

namespace {

DispatchResult failure(DispatchError error, const std::string& message) {
    DispatchResult result;
    result.success = false;
    result.error = error;
    result.message = message;
    return result;
}

std::future<DispatchResult> ready(DispatchResult result) {
    std::promise<DispatchResult> promise;
    promise.set_value(std::move(result));
    return promise.get_future();
}

} // namespace

CommandDispatcher::CommandDispatcher(SessionRegistry& registry, CorrelationTable& table)
    : registry_(registry), table_(table) {}

DispatchResult CommandDispatcher::dispatch(const Command& command) {
    return dispatch_async(command).get();
}

std::future<DispatchResult> CommandDispatcher::dispatch_async(const Command& command) {
    auto session = registry_.get(command.sid);
    if (!session) {
        spdlog::debug("{} to unknown session {}", command_name_to_string(command.name), command.sid);
        return ready(failure(DispatchError::UNKNOWN_SESSION, "no such session"));
    }
    if (!session->channel || !session->channel->is_open()) {
        return ready(failure(DispatchError::CHANNEL_CLOSED, "agent channel closed"));
    }

    std::string request_id = util::generate_request_id();
    if (request_id.empty()) {
        return ready(failure(DispatchError::INTERNAL, "failed to generate request id"));
    }

    auto promise = std::make_shared<std::promise<DispatchResult>>();
    auto future = promise->get_future();

    bool added = table_.add(request_id,
        [promise](const json& reply) {
            DispatchResult result;
            result.success = true;
            result.reply = reply;
            promise->set_value(std::move(result));
        },
        [promise](const WaiterError& error) {
            promise->set_value(failure(error.kind, error.message));
        },
        command.wait_ms);
    if (!added) {
        return ready(failure(DispatchError::SHUTDOWN, "broker is not accepting requests"));
    }

    ipc::EventType event = command.name == CommandName::DUMP ? ipc::EventType::DUMP : ipc::EventType::PING;
    ipc::Message msg(event, build_payload(command, request_id).dump());

    spdlog::debug("Dispatching {} {} to {} via {} (wait {}ms)", command_name_to_string(command.name),
        request_id, command.sid, session->channel->describe(), command.wait_ms);

    if (!session->channel->send(msg)) {
        table_.reject(request_id, DispatchError::CHANNEL_CLOSED, "agent channel closed");
    }

    return future;
}

json CommandDispatcher::build_payload(const Command& command, const std::string& request_id) {
    json payload;
    payload["reqId"] = request_id;
    if (command.name == CommandName::DUMP) {
        json types = json::array();
        for (auto kind : command.kinds) {
            types.push_back(data_kind_to_string(kind));
        }
        payload["types"] = types;
    }
    return payload;
}

} // namespace devsnap::broker
