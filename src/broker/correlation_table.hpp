#pragma once
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <nlohmann/json.hpp>
#include "broker/command.hpp"
#include "broker/timer_queue.hpp"

namespace devsnap::broker {

struct WaiterError {
    DispatchError kind = DispatchError::NONE;
    std::string message;
};

using ResolveFn = std::function<void(const nlohmann::json& reply)>;
using RejectFn = std::function<void(const WaiterError& error)>;

// Outstanding requests keyed by request id. Each waiter gets exactly one
// outcome: resolve, reject or its deadline, whichever removes it first.
// Callbacks run outside the table lock, on the thread that won the race.
class CorrelationTable {
public:
    // Deadlines are clamped to this many milliseconds
    static constexpr int64_t MAX_TIMEOUT_MS = 24 * 60 * 60'000LL;

    explicit CorrelationTable(TimerQueue& timers);
    ~CorrelationTable();

    CorrelationTable(const CorrelationTable&) = delete;
    CorrelationTable& operator=(const CorrelationTable&) = delete;

    // Store a waiter and arm its deadline. False for an empty or duplicate
    // id, or once the table is closed; nothing is registered then.
    bool add(const std::string& request_id, ResolveFn on_resolve, RejectFn on_reject,
             int64_t timeout_ms);

    // No-op returning false when the id is unknown (late, duplicate or forged reply)
    bool resolve(const std::string& request_id, const nlohmann::json& reply);
    bool reject(const std::string& request_id, DispatchError kind, const std::string& message);

    bool contains(const std::string& request_id) const;
    size_t pending() const;

    // Reject everything still pending with SHUTDOWN and refuse new waiters
    void close();

private:
    struct Waiter {
        ResolveFn on_resolve;
        RejectFn on_reject;
        TimerId timer = 0;
        int64_t timeout_ms = 0;
    };

    // Shared with deadline callbacks so a firing timer never outlives the map
    struct State {
        std::mutex mutex;
        std::unordered_map<std::string, Waiter> waiters;
        bool closed = false;
    };

    TimerQueue& timers_;
    std::shared_ptr<State> state_;

    std::optional<Waiter> take(const std::string& request_id);
    static void expire(const std::weak_ptr<State>& weak, const std::string& request_id);
};

} // namespace devsnap::broker
