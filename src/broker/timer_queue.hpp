#pragma once
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <thread>
#include <unordered_map>

namespace devsnap::broker {

using TimerId = uint64_t;

// Deadline scheduler backed by one worker thread. Callbacks run on that
// thread with no queue lock held, so they may schedule or cancel freely.
class TimerQueue {
public:
    using Clock = std::chrono::steady_clock;
    using Callback = std::function<void()>;

    TimerQueue();
    ~TimerQueue();

    TimerQueue(const TimerQueue&) = delete;
    TimerQueue& operator=(const TimerQueue&) = delete;

    // One-shot timer. Returns 0 once stopped.
    TimerId schedule_after(std::chrono::milliseconds delay, Callback fn);

    // Repeating timer, first run after one interval. Returns 0 once stopped.
    TimerId schedule_every(std::chrono::milliseconds interval, Callback fn);

    // True if the timer was still armed. A callback already running is not interrupted.
    bool cancel(TimerId id);

    // Drop every timer and join the worker. Idempotent.
    void stop();

    size_t armed() const;

private:
    struct Entry {
        Clock::time_point deadline;
        std::chrono::milliseconds period{0};
        Callback fn;
    };

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::unordered_map<TimerId, Entry> entries_;
    std::multimap<Clock::time_point, TimerId> deadlines_;
    TimerId next_id_ = 1;
    bool stopping_ = false;
    std::thread worker_;

    TimerId arm(std::chrono::milliseconds delay, std::chrono::milliseconds period, Callback fn);
    void erase_deadline(TimerId id, Clock::time_point deadline);
    void worker_loop();
};

} // namespace devsnap::broker
