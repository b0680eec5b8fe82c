#include "broker/correlation_table.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <vector>

namespace devsnap::broker {

CorrelationTable::CorrelationTable(TimerQueue& timers)
    : timers_(timers), state_(std::make_shared<State>()) {}

CorrelationTable::~CorrelationTable() {
    close();
}

bool CorrelationTable::add(const std::string& request_id, ResolveFn on_resolve, RejectFn on_reject,
                           int64_t timeout_ms) {
    if (request_id.empty()) {
        return false;
    }

    std::lock_guard<std::mutex> lock(state_->mutex);
    if (state_->closed || state_->waiters.count(request_id) > 0) {
        return false;
    }

    timeout_ms = std::clamp<int64_t>(timeout_ms, 0, MAX_TIMEOUT_MS);

    std::weak_ptr<State> weak = state_;
    TimerId timer = timers_.schedule_after(std::chrono::milliseconds(timeout_ms),
        [weak, request_id]() { expire(weak, request_id); });
    if (timer == 0) {
        return false;
    }

    state_->waiters.emplace(request_id,
        Waiter{std::move(on_resolve), std::move(on_reject), timer, timeout_ms});
    return true;
}

std::optional<CorrelationTable::Waiter> CorrelationTable::take(const std::string& request_id) {
    std::optional<Waiter> waiter;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        auto it = state_->waiters.find(request_id);
        if (it == state_->waiters.end()) {
            return std::nullopt;
        }
        waiter = std::move(it->second);
        state_->waiters.erase(it);
    }

    timers_.cancel(waiter->timer);
    return waiter;
}

bool CorrelationTable::resolve(const std::string& request_id, const nlohmann::json& reply) {
    auto waiter = take(request_id);
    if (!waiter) {
        spdlog::debug("Ignoring reply for unknown request {}", request_id);
        return false;
    }

    waiter->on_resolve(reply);
    return true;
}

bool CorrelationTable::reject(const std::string& request_id, DispatchError kind, const std::string& message) {
    auto waiter = take(request_id);
    if (!waiter) {
        spdlog::debug("Ignoring failure for unknown request {}", request_id);
        return false;
    }

    waiter->on_reject(WaiterError{kind, message});
    return true;
}

void CorrelationTable::expire(const std::weak_ptr<State>& weak, const std::string& request_id) {
    auto state = weak.lock();
    if (!state) {
        return;
    }

    std::optional<Waiter> waiter;
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        auto it = state->waiters.find(request_id);
        if (it == state->waiters.end()) {
            return; // reply won the race
        }
        waiter = std::move(it->second);
        state->waiters.erase(it);
    }

    spdlog::debug("Request {} timed out after {}ms", request_id, waiter->timeout_ms);
    waiter->on_reject(WaiterError{DispatchError::TIMEOUT, "timeout"});
}

bool CorrelationTable::contains(const std::string& request_id) const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->waiters.count(request_id) > 0;
}

size_t CorrelationTable::pending() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->waiters.size();
}

void CorrelationTable::close() {
    std::vector<Waiter> drained;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->closed) {
            return;
        }
        state_->closed = true;
        drained.reserve(state_->waiters.size());
        for (auto& [id, waiter] : state_->waiters) {
            drained.push_back(std::move(waiter));
        }
        state_->waiters.clear();
    }

    for (auto& waiter : drained) {
        timers_.cancel(waiter.timer);
        waiter.on_reject(WaiterError{DispatchError::SHUTDOWN, "broker shutting down"});
    }

    if (!drained.empty()) {
        spdlog::info("Rejected {} pending request(s) on shutdown", drained.size());
    }
}

} // namespace devsnap::broker
