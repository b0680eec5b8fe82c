#include "broker/session_registry.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace devsnap::broker {

SessionRegistry::SessionRegistry(util::WallClock clock)
    : clock_(std::move(clock)) {}

void SessionRegistry::upsert_on_hello(const SessionIdentity& identity, const SessionMetadata& metadata,
                                      std::shared_ptr<AgentChannel> channel) {
    Session session;
    session.identity = identity;
    session.metadata = metadata;
    session.channel = std::move(channel);
    session.last_seen_ms = clock_();

    std::string sid = identity.sid();
    bool replaced = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto [it, inserted] = sessions_.insert_or_assign(sid, std::move(session));
        replaced = !inserted;
    }

    spdlog::info("Session {} {} ({})", sid, replaced ? "re-registered" : "registered", metadata.href);
}

bool SessionRegistry::touch(const std::string& sid) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(sid);
    if (it == sessions_.end()) {
        return false;
    }
    it->second.last_seen_ms = clock_();
    return true;
}

void SessionRegistry::remove(const std::string& sid) {
    size_t erased = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        erased = sessions_.erase(sid);
    }
    if (erased > 0) {
        spdlog::info("Session {} removed", sid);
    }
}

size_t SessionRegistry::remove_channel(const AgentChannel* channel) {
    if (!channel) {
        return 0;
    }

    std::vector<std::string> removed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = sessions_.begin(); it != sessions_.end();) {
            if (it->second.channel.get() == channel) {
                removed.push_back(it->first);
                it = sessions_.erase(it);
            } else {
                ++it;
            }
        }
    }

    for (const auto& sid : removed) {
        spdlog::info("Session {} removed (channel closed)", sid);
    }
    return removed.size();
}

std::vector<SessionSummary> SessionRegistry::list(bool active_only, int64_t window_ms) const {
    int64_t now = clock_();
    std::vector<SessionSummary> out;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        out.reserve(sessions_.size());
        for (const auto& [sid, session] : sessions_) {
            if (active_only && now - session.last_seen_ms > window_ms) {
                continue;
            }
            out.push_back(summarize(session));
        }
    }

    // Stable output for callers: most recently seen first
    std::sort(out.begin(), out.end(), [](const SessionSummary& a, const SessionSummary& b) {
        if (a.last_seen_ms != b.last_seen_ms) {
            return a.last_seen_ms > b.last_seen_ms;
        }
        return a.sid < b.sid;
    });
    return out;
}

std::optional<Session> SessionRegistry::get(const std::string& sid) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(sid);
    if (it == sessions_.end()) {
        return std::nullopt;
    }
    return it->second;
}

size_t SessionRegistry::evict_stale(int64_t stale_after_ms) {
    int64_t now = clock_();
    std::vector<std::string> evicted;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = sessions_.begin(); it != sessions_.end();) {
            if (now - it->second.last_seen_ms > stale_after_ms) {
                evicted.push_back(it->first);
                it = sessions_.erase(it);
            } else {
                ++it;
            }
        }
    }

    for (const auto& sid : evicted) {
        spdlog::info("Session {} evicted (no heartbeat for {}ms)", sid, stale_after_ms);
    }
    return evicted.size();
}

size_t SessionRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

SessionSummary SessionRegistry::summarize(const Session& session) {
    SessionSummary summary;
    summary.sid = session.sid();
    summary.browser_id = session.identity.browser_id;
    summary.page_id = session.identity.page_id;
    summary.url = session.metadata.href;
    summary.title = session.metadata.title;
    summary.user_agent = session.metadata.user_agent;
    summary.last_seen_ms = session.last_seen_ms;
    return summary;
}

} // namespace devsnap::broker
