#include "broker/command.hpp"

namespace devsnap::broker {

const char* data_kind_to_string(DataKind kind) {
    switch (kind) {
        case DataKind::DOM_HTML:            return "html";
        case DataKind::CONSOLE_LOG:         return "console";
        case DataKind::NETWORK_LOG:         return "network";
        case DataKind::PERFORMANCE_ENTRIES: return "perf";
        case DataKind::DOM_SCREENSHOT:      return "screenshotDom";
    }
    return "unknown";
}

std::optional<DataKind> data_kind_from_string(const std::string& name) {
    for (auto kind : all_data_kinds()) {
        if (name == data_kind_to_string(kind)) {
            return kind;
        }
    }
    return std::nullopt;
}

std::vector<DataKind> all_data_kinds() {
    return {
        DataKind::DOM_HTML,
        DataKind::CONSOLE_LOG,
        DataKind::NETWORK_LOG,
        DataKind::PERFORMANCE_ENTRIES,
        DataKind::DOM_SCREENSHOT
    };
}

const char* command_name_to_string(CommandName name) {
    switch (name) {
        case CommandName::DUMP: return "dump";
        case CommandName::PING: return "ping";
    }
    return "unknown";
}

const char* dispatch_error_to_string(DispatchError error) {
    switch (error) {
        case DispatchError::NONE:            return "none";
        case DispatchError::UNKNOWN_SESSION: return "unknown_session";
        case DispatchError::TIMEOUT:         return "timeout";
        case DispatchError::AGENT_FAILURE:   return "agent_failure";
        case DispatchError::CHANNEL_CLOSED:  return "channel_closed";
        case DispatchError::SHUTDOWN:        return "shutdown";
        case DispatchError::INTERNAL:        return "internal";
    }
    return "unknown";
}

} // namespace devsnap::broker
