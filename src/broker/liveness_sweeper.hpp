#pragma once
#include <cstdint>
#include <mutex>
#include "broker/timer_queue.hpp"

namespace devsnap::broker {

class SessionRegistry;

// Periodic backstop that evicts sessions which stopped sending heartbeats.
// Pending requests are left alone; they expire on their own deadlines.
class LivenessSweeper {
public:
    LivenessSweeper(SessionRegistry& registry, TimerQueue& timers,
                    int64_t interval_ms, int64_t stale_after_ms);
    ~LivenessSweeper();

    LivenessSweeper(const LivenessSweeper&) = delete;
    LivenessSweeper& operator=(const LivenessSweeper&) = delete;

    bool start();
    void stop();
    bool is_running() const;

    // One pass; returns the number of sessions evicted
    size_t sweep_once();

private:
    SessionRegistry& registry_;
    TimerQueue& timers_;
    int64_t interval_ms_;
    int64_t stale_after_ms_;

    mutable std::mutex mutex_;
    TimerId timer_ = 0;
};

} // namespace devsnap::broker
