#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "broker/agent_channel.hpp"
#include "facade/channel_events.hpp"
#include "util/clock.hpp"

namespace devsnap::test {

// Wall clock the test moves by hand
class ManualClock {
public:
    explicit ManualClock(int64_t start_ms = 1'700'000'000'000) : now_(start_ms) {}

    util::WallClock fn() {
        return [this]() { return now_.load(); };
    }

    void advance(int64_t ms) { now_ += ms; }
    int64_t now() const { return now_.load(); }

private:
    std::atomic<int64_t> now_;
};

// AgentChannel that records everything sent to it
class RecordingChannel final : public broker::AgentChannel {
public:
    explicit RecordingChannel(std::string name = "recording") : name_(std::move(name)) {}

    bool send(const ipc::Message& msg) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!open_) {
            return false;
        }
        sent_.push_back(msg);
        cv_.notify_all();
        return true;
    }

    bool is_open() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return open_;
    }

    std::string describe() const override { return name_; }

    void close() {
        std::lock_guard<std::mutex> lock(mutex_);
        open_ = false;
    }

    size_t sent_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sent_.size();
    }

    // Wait for the n-th (0-based) message to arrive
    std::optional<ipc::Message> wait_for(size_t index,
                                         std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!cv_.wait_for(lock, timeout, [&]() { return sent_.size() > index; })) {
            return std::nullopt;
        }
        return sent_[index];
    }

    // reqId of the n-th message, empty if it never arrived
    std::string request_id(size_t index) {
        auto msg = wait_for(index);
        if (!msg) {
            return {};
        }
        return nlohmann::json::parse(msg->payload_str()).value("reqId", "");
    }

private:
    std::string name_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<ipc::Message> sent_;
    bool open_ = true;
};

// Agent that answers every command inline through the real inbound path.
// The responder sees the command payload and returns the result envelope,
// or nullopt to stay silent.
class ScriptedAgent final : public broker::AgentChannel {
public:
    using Responder = std::function<std::optional<nlohmann::json>(ipc::EventType, const nlohmann::json&)>;

    ScriptedAgent(facade::ChannelEventHandler& events, Responder responder)
        : events_(events), responder_(std::move(responder)) {}

    bool send(const ipc::Message& msg) override {
        if (!open_) {
            return false;
        }
        commands_++;
        auto command = nlohmann::json::parse(msg.payload_str());
        auto reply = responder_(msg.event, command);
        if (reply) {
            auto event = msg.event == ipc::EventType::DUMP ? ipc::EventType::DUMP_RESULT
                                                           : ipc::EventType::PING_RESULT;
            events_.handle(nullptr, ipc::Message(event, reply->dump()));
        }
        return true;
    }

    bool is_open() const override { return open_; }
    std::string describe() const override { return "scripted"; }

    void close() { open_ = false; }
    int commands() const { return commands_; }

private:
    facade::ChannelEventHandler& events_;
    Responder responder_;
    std::atomic<bool> open_{true};
    std::atomic<int> commands_{0};
};

inline ipc::Message json_message(ipc::EventType event, const nlohmann::json& j) {
    return ipc::Message(event, j.dump());
}

} // namespace devsnap::test
