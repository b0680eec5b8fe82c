#include "facade/snap_service.hpp"
#include "broker/command_dispatcher.hpp"
#include "broker/session_registry.hpp"
#include "util/data_url.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>

using json = nlohmann::json;

namespace devsnap::facade {

namespace {

// payload[key] of a reply envelope, or null
json payload_field(const json& reply, const char* key) {
    auto payload = reply.find("payload");
    if (payload == reply.end() || !payload->is_object()) {
        return nullptr;
    }
    auto it = payload->find(key);
    return it == payload->end() ? json(nullptr) : *it;
}

} // namespace

const char* error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE:            return "none";
        case ErrorKind::BAD_REQUEST:     return "bad_request";
        case ErrorKind::UNKNOWN_SESSION: return "unknown_session";
        case ErrorKind::TIMEOUT:         return "timeout";
        case ErrorKind::AGENT_FAILURE:   return "agent_failure";
        case ErrorKind::CHANNEL_CLOSED:  return "channel_closed";
        case ErrorKind::SHUTDOWN:        return "shutdown";
        case ErrorKind::INTERNAL:        return "internal";
        case ErrorKind::NOT_FOUND:       return "not_found";
        case ErrorKind::BAD_PAYLOAD:     return "bad_payload";
    }
    return "unknown";
}

ErrorKind from_dispatch_error(broker::DispatchError error) {
    switch (error) {
        case broker::DispatchError::NONE:            return ErrorKind::NONE;
        case broker::DispatchError::UNKNOWN_SESSION: return ErrorKind::UNKNOWN_SESSION;
        case broker::DispatchError::TIMEOUT:         return ErrorKind::TIMEOUT;
        case broker::DispatchError::AGENT_FAILURE:   return ErrorKind::AGENT_FAILURE;
        case broker::DispatchError::CHANNEL_CLOSED:  return ErrorKind::CHANNEL_CLOSED;
        case broker::DispatchError::SHUTDOWN:        return ErrorKind::SHUTDOWN;
        case broker::DispatchError::INTERNAL:        return ErrorKind::INTERNAL;
    }
    return ErrorKind::INTERNAL;
}

json session_summary_to_json(const broker::SessionSummary& summary) {
    json j;
    j["sid"] = summary.sid;
    j["browserId"] = summary.browser_id;
    j["pageId"] = summary.page_id;
    j["url"] = summary.url;
    j["title"] = summary.title;
    j["ua"] = summary.user_agent;
    j["lastSeen"] = summary.last_seen_ms;
    return j;
}

SnapService::SnapService(broker::SessionRegistry& registry, broker::CommandDispatcher& dispatcher,
                         ServiceDefaults defaults)
    : registry_(registry), dispatcher_(dispatcher), defaults_(defaults) {}

ServiceResult SnapService::bad_request(const std::string& message) {
    ServiceResult result;
    result.error_kind = ErrorKind::BAD_REQUEST;
    result.error = message;
    return result;
}

json SnapService::list_sessions(bool active, std::optional<int64_t> active_ms) const {
    bool only_active = active || active_ms.has_value();
    int64_t window = active_ms ? std::max<int64_t>(0, *active_ms) : defaults_.active_window_ms;

    json items = json::array();
    for (const auto& summary : registry_.list(only_active, window)) {
        items.push_back(session_summary_to_json(summary));
    }

    json out;
    out["sessions"] = items;
    return out;
}

ServiceResult SnapService::run_dump(const std::string& sid, std::vector<broker::DataKind> kinds,
                                    std::optional<int64_t> wait_ms) {
    if (sid.empty()) {
        return bad_request("sid required");
    }
    int64_t wait = wait_ms.value_or(defaults_.dump_wait_ms);
    if (wait <= 0) {
        return bad_request("waitMs must be positive");
    }
    if (wait > defaults_.max_wait_ms) {
        return bad_request("waitMs exceeds " + std::to_string(defaults_.max_wait_ms));
    }

    broker::Command command;
    command.name = broker::CommandName::DUMP;
    command.sid = sid;
    command.kinds = std::move(kinds);
    command.wait_ms = wait;

    auto dispatched = dispatcher_.dispatch(command);

    ServiceResult result;
    if (!dispatched.success) {
        result.error_kind = from_dispatch_error(dispatched.error);
        result.error = dispatched.message;
        return result;
    }

    result.success = true;
    result.body = std::move(dispatched.reply);
    return result;
}

ServiceResult SnapService::dump(const std::string& sid, const std::optional<std::vector<std::string>>& types,
                                std::optional<int64_t> wait_ms) {
    std::vector<broker::DataKind> kinds;
    if (!types) {
        kinds = broker::all_data_kinds();
    } else {
        for (const auto& name : *types) {
            auto kind = broker::data_kind_from_string(name);
            if (!kind) {
                return bad_request("unknown data kind: " + name);
            }
            if (std::find(kinds.begin(), kinds.end(), *kind) == kinds.end()) {
                kinds.push_back(*kind);
            }
        }
    }
    return run_dump(sid, std::move(kinds), wait_ms);
}

ServiceResult SnapService::dump_html(const std::string& sid, std::optional<int64_t> wait_ms) {
    auto result = run_dump(sid, {broker::DataKind::DOM_HTML}, wait_ms);
    if (!result.success) {
        return result;
    }

    json html = payload_field(result.body, "html");
    result.content_type = "text/html; charset=utf-8";
    result.raw = html.is_string() && !html.get<std::string>().empty()
        ? html.get<std::string>() : "<!-- no html -->";
    result.body = nullptr;
    return result;
}

ServiceResult SnapService::dump_console(const std::string& sid, std::optional<int64_t> wait_ms) {
    auto result = run_dump(sid, {broker::DataKind::CONSOLE_LOG}, wait_ms);
    if (!result.success) {
        return result;
    }

    json console = payload_field(result.body, "console");
    result.body = console.is_null() ? json::array() : console;
    return result;
}

ServiceResult SnapService::dump_network(const std::string& sid, std::optional<int64_t> wait_ms) {
    auto result = run_dump(sid, {broker::DataKind::NETWORK_LOG, broker::DataKind::PERFORMANCE_ENTRIES}, wait_ms);
    if (!result.success) {
        return result;
    }

    json logs = payload_field(result.body, "network");
    json perf = payload_field(result.body, "perf");

    json out;
    out["logs"] = logs.is_null() ? json::array() : logs;
    out["perf"] = perf.is_null() ? json::array() : perf;
    result.body = out;
    return result;
}

ServiceResult SnapService::screenshot(const std::string& sid, std::optional<int64_t> wait_ms) {
    auto result = run_dump(sid, {broker::DataKind::DOM_SCREENSHOT}, wait_ms);
    if (!result.success) {
        return result;
    }

    json data_url = payload_field(result.body, "screenshotDom");
    result.body = nullptr;
    if (!data_url.is_string() || data_url.get<std::string>().empty()) {
        result.success = false;
        result.error_kind = ErrorKind::NOT_FOUND;
        result.error = "no screenshot";
        return result;
    }

    auto decoded = util::decode_data_url(data_url.get<std::string>());
    if (!decoded) {
        spdlog::warn("Session {} sent an undecodable screenshot", sid);
        result.success = false;
        result.error_kind = ErrorKind::BAD_PAYLOAD;
        result.error = "bad dataurl";
        return result;
    }

    result.content_type = decoded->mime_type;
    result.raw.assign(decoded->bytes.begin(), decoded->bytes.end());
    return result;
}

ServiceResult SnapService::ping(const std::string& sid, std::optional<int64_t> wait_ms) {
    if (sid.empty()) {
        return bad_request("sid required");
    }
    int64_t wait = wait_ms.value_or(defaults_.ping_wait_ms);
    if (wait <= 0) {
        return bad_request("waitMs must be positive");
    }
    if (wait > defaults_.max_wait_ms) {
        return bad_request("waitMs exceeds " + std::to_string(defaults_.max_wait_ms));
    }

    broker::Command command;
    command.name = broker::CommandName::PING;
    command.sid = sid;
    command.wait_ms = wait;

    auto started = std::chrono::steady_clock::now();
    auto dispatched = dispatcher_.dispatch(command);
    auto rtt = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started).count();

    ServiceResult result;
    if (!dispatched.success) {
        result.error_kind = from_dispatch_error(dispatched.error);
        result.error = dispatched.message;
        return result;
    }

    auto ok = dispatched.reply.find("ok");
    auto payload = dispatched.reply.find("payload");

    result.success = true;
    result.body["ok"] = ok == dispatched.reply.end() || !ok->is_boolean() || ok->get<bool>();
    result.body["rttMs"] = rtt;
    result.body["payload"] = payload != dispatched.reply.end() && !payload->is_null()
        ? *payload : json::object();
    return result;
}

} // namespace devsnap::facade
