#ifndef PROCTOR_ANTICHEAT_SESSION_STORE_H
#define PROCTOR_ANTICHEAT_SESSION_STORE_H

#include "anticheat/event_types.h"
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>
#include <chrono>

namespace proctor {
namespace anticheat {

/**
 * @brief Per-type occurrence counts of a session
 */
using EventCounts = std::map<EventType, size_t>;

/**
 * @brief Consistent copy of a session's state
 */
struct SessionSnapshot {
    std::vector<BehavioralEvent> events;
    EventCounts counts;       ///< Maintained on append
    size_t flagsCount = 0;    ///< Maintained on append
};

/**
 * @brief Append-only event history of one session
 *
 * Appends take the writer lock; readers copy under the reader lock and so
 * always observe a prefix of the history. Counters are updated in the same
 * critical section as the append.
 */
class SessionState {
public:
    explicit SessionState(std::string sessionId);

    SessionState(const SessionState&) = delete;
    SessionState& operator=(const SessionState&) = delete;

    /**
     * @brief Append an event
     * @return Counters including the new event
     */
    SessionSnapshot append(BehavioralEvent event);

    /**
     * @brief Copy of the history and counters
     */
    SessionSnapshot snapshot() const;

    size_t eventCount() const;

    const std::string& sessionId() const { return sessionId_; }

    std::chrono::steady_clock::time_point lastActivity() const;

private:
    const std::string sessionId_;
    mutable std::shared_mutex mutex_;
    std::vector<BehavioralEvent> events_;
    EventCounts counts_;
    size_t flagsCount_;
    std::chrono::steady_clock::time_point lastActivity_;
};

/**
 * @brief Owner of all live session states
 *
 * A session is created by its first event, removed by complete() when the
 * interview ends, or by evictExpired() once idle for longer than the TTL.
 */
class SessionStore {
public:
    /**
     * @param ttl Idle time after which evictExpired() drops a session
     */
    explicit SessionStore(std::chrono::seconds ttl = std::chrono::hours(24));

    SessionStore(const SessionStore&) = delete;
    SessionStore& operator=(const SessionStore&) = delete;

    std::shared_ptr<SessionState> getOrCreate(const std::string& sessionId);

    /**
     * @brief Append an event, creating the session if needed
     *
     * Runs under the store's reader lock, so complete() and evictExpired()
     * see the session either before the event or with it.
     *
     * @return Counters including the new event
     */
    SessionSnapshot append(const std::string& sessionId, BehavioralEvent event);

    /**
     * @return nullptr for an unknown session
     */
    std::shared_ptr<SessionState> find(const std::string& sessionId) const;

    /**
     * @brief Drop a finished session
     * @return true if it existed
     */
    bool complete(const std::string& sessionId);

    /**
     * @brief Drop sessions idle for longer than the TTL
     * @return Number of sessions removed
     */
    size_t evictExpired(std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now());

    size_t size() const;

    std::vector<std::string> sessionIds() const;

    std::chrono::seconds ttl() const { return ttl_; }

private:
    const std::chrono::seconds ttl_;
    mutable std::shared_mutex mutex_;
    std::map<std::string, std::shared_ptr<SessionState>> sessions_;
};

} // namespace anticheat
} // namespace proctor

#endif // PROCTOR_ANTICHEAT_SESSION_STORE_H
