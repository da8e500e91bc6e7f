#include "anticheat/session_store.h"
#include "anticheat/severity_classifier.h"
#include "utils/log.h"

namespace proctor {
namespace anticheat {

// ========== SessionState ==========

SessionState::SessionState(std::string sessionId)
    : sessionId_(std::move(sessionId))
    , flagsCount_(0)
    , lastActivity_(std::chrono::steady_clock::now()) {
}

SessionSnapshot SessionState::append(BehavioralEvent event) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    counts_[event.type]++;
    if (SeverityClassifier::isFlag(event.severity)) {
        flagsCount_++;
    }
    events_.push_back(std::move(event));
    lastActivity_ = std::chrono::steady_clock::now();

    SessionSnapshot result;
    result.counts = counts_;
    result.flagsCount = flagsCount_;
    return result;
}

SessionSnapshot SessionState::snapshot() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    SessionSnapshot result;
    result.events = events_;
    result.counts = counts_;
    result.flagsCount = flagsCount_;
    return result;
}

size_t SessionState::eventCount() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return events_.size();
}

std::chrono::steady_clock::time_point SessionState::lastActivity() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return lastActivity_;
}

// ========== SessionStore ==========

SessionStore::SessionStore(std::chrono::seconds ttl)
    : ttl_(ttl) {
}

std::shared_ptr<SessionState> SessionStore::getOrCreate(const std::string& sessionId) {
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = sessions_.find(sessionId);
        if (it != sessions_.end()) {
            return it->second;
        }
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto& slot = sessions_[sessionId];
    if (!slot) {
        slot = std::make_shared<SessionState>(sessionId);
        LOGD_FMT("Anti-cheat session created: " << sessionId);
    }
    return slot;
}

SessionSnapshot SessionStore::append(const std::string& sessionId, BehavioralEvent event) {
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = sessions_.find(sessionId);
        if (it != sessions_.end()) {
            return it->second->append(std::move(event));
        }
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto& slot = sessions_[sessionId];
    if (!slot) {
        slot = std::make_shared<SessionState>(sessionId);
        LOGD_FMT("Anti-cheat session created: " << sessionId);
    }
    return slot->append(std::move(event));
}

std::shared_ptr<SessionState> SessionStore::find(const std::string& sessionId) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = sessions_.find(sessionId);
    return it != sessions_.end() ? it->second : nullptr;
}

bool SessionStore::complete(const std::string& sessionId) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    bool removed = sessions_.erase(sessionId) > 0;
    if (removed) {
        LOGI_FMT("Anti-cheat session completed: " << sessionId);
    }
    return removed;
}

size_t SessionStore::evictExpired(std::chrono::steady_clock::time_point now) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    size_t removed = 0;
    for (auto it = sessions_.begin(); it != sessions_.end();) {
        if (now - it->second->lastActivity() > ttl_) {
            LOGI_FMT("Anti-cheat session expired: " << it->first);
            it = sessions_.erase(it);
            removed++;
        } else {
            ++it;
        }
    }
    return removed;
}

size_t SessionStore::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return sessions_.size();
}

std::vector<std::string> SessionStore::sessionIds() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(sessions_.size());
    for (const auto& entry : sessions_) {
        ids.push_back(entry.first);
    }
    return ids;
}

} // namespace anticheat
} // namespace proctor
