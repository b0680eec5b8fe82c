#include "broker/timer_queue.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace devsnap::broker {

TimerQueue::TimerQueue() {
    worker_ = std::thread(&TimerQueue::worker_loop, this);
}

TimerQueue::~TimerQueue() {
    stop();
}

TimerId TimerQueue::schedule_after(std::chrono::milliseconds delay, Callback fn) {
    return arm(delay, std::chrono::milliseconds(0), std::move(fn));
}

TimerId TimerQueue::schedule_every(std::chrono::milliseconds interval, Callback fn) {
    if (interval.count() <= 0) {
        spdlog::warn("Refusing repeating timer with non-positive interval");
        return 0;
    }
    return arm(interval, interval, std::move(fn));
}

TimerId TimerQueue::arm(std::chrono::milliseconds delay, std::chrono::milliseconds period, Callback fn) {
    TimerId id = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return 0;
        }

        id = next_id_++;
        auto deadline = Clock::now() + std::max(delay, std::chrono::milliseconds(0));
        entries_.emplace(id, Entry{deadline, period, std::move(fn)});
        deadlines_.emplace(deadline, id);
    }
    cv_.notify_one();
    return id;
}

bool TimerQueue::cancel(TimerId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end()) {
        return false;
    }

    erase_deadline(id, it->second.deadline);
    entries_.erase(it);
    return true;
}

void TimerQueue::erase_deadline(TimerId id, Clock::time_point deadline) {
    auto range = deadlines_.equal_range(deadline);
    for (auto it = range.first; it != range.second; ++it) {
        if (it->second == id) {
            deadlines_.erase(it);
            return;
        }
    }
}

void TimerQueue::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
        entries_.clear();
        deadlines_.clear();
    }
    cv_.notify_all();
    if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
        worker_.join();
    }
}

size_t TimerQueue::armed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

void TimerQueue::worker_loop() {
    std::unique_lock<std::mutex> lock(mutex_);

    while (!stopping_) {
        if (deadlines_.empty()) {
            cv_.wait(lock);
            continue;
        }

        auto next = deadlines_.begin();
        if (next->first > Clock::now()) {
            cv_.wait_until(lock, next->first);
            continue;
        }

        TimerId id = next->second;
        deadlines_.erase(next);

        auto it = entries_.find(id);
        if (it == entries_.end()) {
            continue;
        }

        Callback fn;
        if (it->second.period.count() > 0) {
            // Re-arm before running so cancel() from inside the callback works
            fn = it->second.fn;
            it->second.deadline = Clock::now() + it->second.period;
            deadlines_.emplace(it->second.deadline, id);
        } else {
            fn = std::move(it->second.fn);
            entries_.erase(it);
        }

        lock.unlock();
        try {
            fn();
        } catch (const std::exception& e) {
            spdlog::error("Timer {} callback failed: {}", id, e.what());
        }
        lock.lock();
    }
}

} // namespace devsnap::broker
