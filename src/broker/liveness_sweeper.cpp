#include "broker/liveness_sweeper.hpp"
#include "broker/session_registry.hpp"
#include <spdlog/spdlog.h>

namespace devsnap::broker {

LivenessSweeper::LivenessSweeper(SessionRegistry& registry, TimerQueue& timers,
                                 int64_t interval_ms, int64_t stale_after_ms)
    : registry_(registry), timers_(timers),
      interval_ms_(interval_ms), stale_after_ms_(stale_after_ms) {}

LivenessSweeper::~LivenessSweeper() {
    stop();
}

bool LivenessSweeper::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (timer_ != 0) {
        return true;
    }

    timer_ = timers_.schedule_every(std::chrono::milliseconds(interval_ms_), [this]() { sweep_once(); });
    if (timer_ == 0) {
        spdlog::error("Failed to schedule liveness sweep");
        return false;
    }

    spdlog::info("Liveness sweep every {}ms (stale after {}ms)", interval_ms_, stale_after_ms_);
    return true;
}

void LivenessSweeper::stop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (timer_ != 0) {
        timers_.cancel(timer_);
        timer_ = 0;
    }
}

bool LivenessSweeper::is_running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return timer_ != 0;
}

size_t LivenessSweeper::sweep_once() {
    size_t evicted = registry_.evict_stale(stale_after_ms_);
    if (evicted > 0) {
        spdlog::debug("Liveness sweep evicted {} session(s), {} remain", evicted, registry_.size());
    }
    return evicted;
}

} // namespace devsnap::broker
