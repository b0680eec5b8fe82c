#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "broker/command.hpp"

namespace devsnap::broker {
class CommandDispatcher;
class SessionRegistry;
struct SessionSummary;
} // namespace devsnap::broker

namespace devsnap::facade {

enum class ErrorKind {
    NONE,
    BAD_REQUEST,
    UNKNOWN_SESSION,
    TIMEOUT,
    AGENT_FAILURE,
    CHANNEL_CLOSED,
    SHUTDOWN,
    INTERNAL,
    NOT_FOUND,     // reply arrived but lacked the requested data
    BAD_PAYLOAD    // reply arrived but the data could not be decoded
};

const char* error_kind_to_string(ErrorKind kind);
ErrorKind from_dispatch_error(broker::DispatchError error);

struct ServiceResult {
    bool success = false;
    ErrorKind error_kind = ErrorKind::NONE;
    std::string error;

    // JSON body unless content_type says otherwise, then raw holds the bytes
    nlohmann::json body;
    std::string content_type = "application/json";
    std::string raw;
};

struct ServiceDefaults {
    int64_t active_window_ms = 45'000;
    int64_t dump_wait_ms = 5'000;
    int64_t ping_wait_ms = 3'000;
    int64_t max_wait_ms = 10 * 60'000;   // larger caller budgets are refused
};

nlohmann::json session_summary_to_json(const broker::SessionSummary& summary);

// Synchronous operator operations. Decodes arguments, hands the command to
// the dispatcher and shapes the reply; no correlation or timeout logic here.
class SnapService {
public:
    SnapService(broker::SessionRegistry& registry, broker::CommandDispatcher& dispatcher,
                ServiceDefaults defaults = {});

    // {"sessions": [...]}. Filtering applies when active is true or active_ms is given.
    nlohmann::json list_sessions(bool active, std::optional<int64_t> active_ms) const;

    // Raw reply envelope. types defaults to every kind.
    ServiceResult dump(const std::string& sid, const std::optional<std::vector<std::string>>& types,
                       std::optional<int64_t> wait_ms);

    // text/html of the page, or "<!-- no html -->"
    ServiceResult dump_html(const std::string& sid, std::optional<int64_t> wait_ms = std::nullopt);

    // Console ring slice as a JSON array
    ServiceResult dump_console(const std::string& sid, std::optional<int64_t> wait_ms = std::nullopt);

    // {"logs": network, "perf": performance entries}
    ServiceResult dump_network(const std::string& sid, std::optional<int64_t> wait_ms = std::nullopt);

    // Decoded screenshot bytes with the MIME type the agent declared
    ServiceResult screenshot(const std::string& sid, std::optional<int64_t> wait_ms = std::nullopt);

    // {"ok", "rttMs", "payload"}
    ServiceResult ping(const std::string& sid, std::optional<int64_t> wait_ms);

private:
    broker::SessionRegistry& registry_;
    broker::CommandDispatcher& dispatcher_;
    ServiceDefaults defaults_;

    ServiceResult run_dump(const std::string& sid, std::vector<broker::DataKind> kinds,
                           std::optional<int64_t> wait_ms);
    static ServiceResult bad_request(const std::string& message);
};

} // namespace devsnap::facade
