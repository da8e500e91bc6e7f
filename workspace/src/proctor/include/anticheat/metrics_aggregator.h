#ifndef PROCTOR_ANTICHEAT_METRICS_AGGREGATOR_H
#define PROCTOR_ANTICHEAT_METRICS_AGGREGATOR_H

#include "anticheat/event_types.h"
#include "anticheat/session_store.h"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace proctor {
namespace anticheat {

/**
 * @brief Score, flags and warning derived from a session's history
 */
struct AggregateMetrics {
    double aggregateScore = 0.0;     ///< Rounded to 2 decimals
    size_t flagsCount = 0;
    std::optional<std::string> warning;
    EventCounts eventCounts;
};

/**
 * @brief Reply to recordEvent()
 */
struct RecordResult {
    bool eventRecorded = true;
    Severity severity = Severity::LOW;
    double aggregateScore = 0.0;
    std::optional<std::string> warning;
    size_t flagsCount = 0;
};

/**
 * @brief A network or clipboard event as shown in the summary
 */
struct ActivityEntry {
    EventType type = EventType::TAB_SWITCH;
    std::string timestamp;
    nlohmann::json details;
};

struct TimelineEntry {
    EventType type = EventType::TAB_SWITCH;
    Severity severity = Severity::LOW;
    std::string timestamp;
};

/**
 * @brief Anti-cheat report for one interview
 */
struct InterviewSummary {
    size_t totalEvents = 0;
    size_t flagsCount = 0;
    double aggregateScore = 0.0;
    bool isFlagged = false;
    EventCounts eventsByType;
    std::optional<nlohmann::json> typingPatterns;      ///< Last details with "wpm"
    std::optional<nlohmann::json> codeStyleAnalysis;   ///< Last details with "style_consistency_score"
    std::vector<ActivityEntry> networkActivity;
    std::vector<ActivityEntry> clipboardAnalysis;
    std::vector<TimelineEntry> timeline;               ///< Most recent events, oldest first
};

void to_json(nlohmann::json& j, const RecordResult& result);
void to_json(nlohmann::json& j, const InterviewSummary& summary);

/**
 * @brief Records behavioral events and scores sessions
 *
 * Score: for every event type, weight * min(count, 10), summed, divided
 * by 5 and clamped to [0, 1]. Warnings, first match wins: score >= 0.7,
 * then five or more tab switches, then two or more large pastes. A session
 * is flagged at score >= 0.5.
 *
 * recordEvent() scores from the counters the session keeps on append;
 * getInterviewSummary() replays the whole history. Both give the same
 * numbers for the same history.
 */
class MetricsAggregator {
public:
    static constexpr size_t MAX_COUNT_PER_TYPE = 10;
    static constexpr double SCORE_DIVISOR = 5.0;
    static constexpr double CRITICAL_SCORE_THRESHOLD = 0.7;
    static constexpr double FLAGGED_SCORE_THRESHOLD = 0.5;
    static constexpr size_t TAB_SWITCH_WARNING_COUNT = 5;
    static constexpr size_t LARGE_PASTE_WARNING_COUNT = 2;
    static constexpr size_t TIMELINE_LENGTH = 20;

    static constexpr const char* CRITICAL_WARNING = "Critical: Multiple suspicious activities detected";
    static constexpr const char* TAB_SWITCH_WARNING = "Warning: Frequent tab switching detected";
    static constexpr const char* LARGE_PASTE_WARNING = "Warning: Multiple large code pastes detected";

    /**
     * @param store Session states; must outlive the aggregator
     */
    explicit MetricsAggregator(SessionStore& store);

    /**
     * @brief Classify and append an event, creating the session if needed
     *
     * @param details Free-form event details; anything but an object is
     *        recorded as an empty object
     */
    RecordResult recordEvent(const std::string& sessionId,
                             EventType type,
                             const nlohmann::json& details = nlohmann::json::object());

    /**
     * @brief Report for a session; an unknown session gives an empty report
     */
    InterviewSummary getInterviewSummary(const std::string& sessionId) const;

    /**
     * @brief Metrics by replaying a full history
     */
    static AggregateMetrics computeMetrics(const std::vector<BehavioralEvent>& events);

    /**
     * @brief Metrics from maintained counters
     */
    static AggregateMetrics computeMetrics(const EventCounts& counts, size_t flagsCount);

    SessionStore& store() { return store_; }

private:
    SessionStore& store_;
};

} // namespace anticheat
} // namespace proctor

#endif // PROCTOR_ANTICHEAT_METRICS_AGGREGATOR_H
