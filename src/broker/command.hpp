#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace devsnap::broker {

// Data an agent can be asked to gather in a dump
enum class DataKind {
    DOM_HTML,
    CONSOLE_LOG,
    NETWORK_LOG,
    PERFORMANCE_ENTRIES,
    DOM_SCREENSHOT
};

// Wire names: "html", "console", "network", "perf", "screenshotDom"
const char* data_kind_to_string(DataKind kind);
std::optional<DataKind> data_kind_from_string(const std::string& name);

// Every kind, in wire order
std::vector<DataKind> all_data_kinds();

enum class CommandName {
    DUMP,
    PING
};

const char* command_name_to_string(CommandName name);

struct Command {
    CommandName name = CommandName::PING;
    std::string sid;
    std::vector<DataKind> kinds;   // DUMP only
    int64_t wait_ms = 0;
};

enum class DispatchError {
    NONE,
    UNKNOWN_SESSION,   // target not in the registry, failed before any waiter existed
    TIMEOUT,           // no reply within the wait budget
    AGENT_FAILURE,     // agent replied ok:false
    CHANNEL_CLOSED,    // agent channel refused the command
    SHUTDOWN,          // broker stopped while the request was pending
    INTERNAL           // request id could not be minted
};

const char* dispatch_error_to_string(DispatchError error);

struct DispatchResult {
    bool success = false;
    nlohmann::json reply;          // full reply envelope {reqId, ok, payload}
    DispatchError error = DispatchError::NONE;
    std::string message;
};

} // namespace devsnap::broker
