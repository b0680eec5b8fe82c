#pragma once
#include <future>
#include "broker/command.hpp"

namespace devsnap::broker {

class SessionRegistry;
class CorrelationTable;

// Sends a command to one session and waits for the correlated reply.
// The only place request ids are minted.
class CommandDispatcher {
public:
    CommandDispatcher(SessionRegistry& registry, CorrelationTable& table);

    CommandDispatcher(const CommandDispatcher&) = delete;
    CommandDispatcher& operator=(const CommandDispatcher&) = delete;

    // Blocks the calling thread until reply, failure or deadline
    DispatchResult dispatch(const Command& command);

    // Same, but the caller decides when to wait. Unknown sessions yield an
    // already-satisfied future.
    std::future<DispatchResult> dispatch_async(const Command& command);

private:
    SessionRegistry& registry_;
    CorrelationTable& table_;

    static nlohmann::json build_payload(const Command& command, const std::string& request_id);
};

} // namespace devsnap::broker
