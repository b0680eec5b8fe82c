#pragma once
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "broker/agent_channel.hpp"
#include "util/clock.hpp"

namespace devsnap::broker {

// Composite identity: one browser (durable id) x one page load
struct SessionIdentity {
    std::string browser_id;
    std::string page_id;

    std::string sid() const { return browser_id + ":" + page_id; }
};

// What an agent reports about its page in hello
struct SessionMetadata {
    std::string href;
    std::string title;
    std::string user_agent;
};

struct Session {
    SessionIdentity identity;
    SessionMetadata metadata;
    std::shared_ptr<AgentChannel> channel;
    int64_t last_seen_ms = 0;

    std::string sid() const { return identity.sid(); }
};

struct SessionSummary {
    std::string sid;
    std::string browser_id;
    std::string page_id;
    std::string url;
    std::string title;
    std::string user_agent;
    int64_t last_seen_ms = 0;
};

class SessionRegistry {
public:
    explicit SessionRegistry(util::WallClock clock = util::now_ms);

    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;

    // Insert or replace; last-seen becomes now
    void upsert_on_hello(const SessionIdentity& identity, const SessionMetadata& metadata,
                         std::shared_ptr<AgentChannel> channel);

    // Refresh last-seen. False if the session is unknown (heartbeat ignored).
    bool touch(const std::string& sid);

    void remove(const std::string& sid);

    // Remove every session bound to a channel that has closed
    size_t remove_channel(const AgentChannel* channel);

    // All sessions, or only those seen within window_ms when active_only
    std::vector<SessionSummary> list(bool active_only, int64_t window_ms) const;

    std::optional<Session> get(const std::string& sid) const;

    // Drop sessions whose last-seen is older than stale_after_ms
    size_t evict_stale(int64_t stale_after_ms);

    size_t size() const;

private:
    util::WallClock clock_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Session> sessions_;

    static SessionSummary summarize(const Session& session);
};

} // namespace devsnap::broker
