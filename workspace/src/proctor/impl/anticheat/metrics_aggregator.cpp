#include "anticheat/metrics_aggregator.h"
#include "anticheat/severity_classifier.h"
#include "utils/log.h"
#include <algorithm>
#include <cmath>

namespace proctor {
namespace anticheat {

namespace {

double roundScore(double score) {
    return std::round(score * 100.0) / 100.0;
}

size_t countOf(const EventCounts& counts, EventType type) {
    auto it = counts.find(type);
    return it != counts.end() ? it->second : 0;
}

bool isNetworkEvent(EventType type) {
    return type == EventType::EXTERNAL_SERVICE_REQUEST ||
           type == EventType::AI_SERVICE_REQUEST ||
           type == EventType::CALL_SERVICE_REQUEST;
}

bool isClipboardEvent(EventType type) {
    return type == EventType::LARGE_PASTE || type == EventType::FREQUENT_PASTE;
}

nlohmann::json countsToJson(const EventCounts& counts) {
    nlohmann::json j = nlohmann::json::object();
    for (const auto& entry : counts) {
        j[eventTypeToString(entry.first)] = entry.second;
    }
    return j;
}

nlohmann::json activityToJson(const std::vector<ActivityEntry>& entries) {
    nlohmann::json j = nlohmann::json::array();
    for (const auto& entry : entries) {
        j.push_back({
            {"type", eventTypeToString(entry.type)},
            {"timestamp", entry.timestamp},
            {"details", entry.details}
        });
    }
    return j;
}

} // namespace

void to_json(nlohmann::json& j, const RecordResult& result) {
    j = nlohmann::json{
        {"event_recorded", result.eventRecorded},
        {"severity", severityToString(result.severity)},
        {"aggregate_score", result.aggregateScore},
        {"warning", result.warning ? nlohmann::json(*result.warning) : nlohmann::json(nullptr)},
        {"flags_count", result.flagsCount}
    };
}

void to_json(nlohmann::json& j, const InterviewSummary& summary) {
    nlohmann::json timeline = nlohmann::json::array();
    for (const auto& entry : summary.timeline) {
        timeline.push_back({
            {"type", eventTypeToString(entry.type)},
            {"severity", severityToString(entry.severity)},
            {"timestamp", entry.timestamp}
        });
    }

    j = nlohmann::json{
        {"total_events", summary.totalEvents},
        {"flags_count", summary.flagsCount},
        {"aggregate_score", summary.aggregateScore},
        {"is_flagged", summary.isFlagged},
        {"events_by_type", countsToJson(summary.eventsByType)},
        {"typing_patterns", summary.typingPatterns ? *summary.typingPatterns : nlohmann::json(nullptr)},
        {"code_style_analysis", summary.codeStyleAnalysis ? *summary.codeStyleAnalysis : nlohmann::json(nullptr)},
        {"network_activity", activityToJson(summary.networkActivity)},
        {"clipboard_analysis", activityToJson(summary.clipboardAnalysis)},
        {"timeline", timeline}
    };
}

MetricsAggregator::MetricsAggregator(SessionStore& store)
    : store_(store) {
}

AggregateMetrics MetricsAggregator::computeMetrics(const EventCounts& counts, size_t flagsCount) {
    AggregateMetrics metrics;
    metrics.eventCounts = counts;
    metrics.flagsCount = flagsCount;

    double total = 0.0;
    for (const auto& entry : counts) {
        total += SeverityClassifier::weightOf(entry.first) *
                 static_cast<double>(std::min(entry.second, MAX_COUNT_PER_TYPE));
    }
    const double score = std::clamp(total / SCORE_DIVISOR, 0.0, 1.0);
    metrics.aggregateScore = roundScore(score);

    // Thresholds apply to the unrounded score
    if (score >= CRITICAL_SCORE_THRESHOLD) {
        metrics.warning = CRITICAL_WARNING;
    } else if (countOf(counts, EventType::TAB_SWITCH) >= TAB_SWITCH_WARNING_COUNT) {
        metrics.warning = TAB_SWITCH_WARNING;
    } else if (countOf(counts, EventType::LARGE_PASTE) >= LARGE_PASTE_WARNING_COUNT) {
        metrics.warning = LARGE_PASTE_WARNING;
    }
    return metrics;
}

AggregateMetrics MetricsAggregator::computeMetrics(const std::vector<BehavioralEvent>& events) {
    EventCounts counts;
    size_t flags = 0;
    for (const auto& event : events) {
        counts[event.type]++;
        if (SeverityClassifier::isFlag(event.severity)) {
            flags++;
        }
    }
    return computeMetrics(counts, flags);
}

RecordResult MetricsAggregator::recordEvent(const std::string& sessionId,
                                            EventType type,
                                            const nlohmann::json& details) {
    BehavioralEvent event;
    event.type = type;
    if (details.is_object()) {
        event.details = details;
    } else if (!details.is_null()) {
        LOGD_FMT("Ignoring non-object details for " << eventTypeToString(type) << " in session " << sessionId);
    }
    event.timestamp = std::chrono::system_clock::now();
    event.severity = SeverityClassifier::classify(type, event.details);

    RecordResult result;
    result.severity = event.severity;

    SessionSnapshot counters = store_.append(sessionId, std::move(event));
    AggregateMetrics metrics = computeMetrics(counters.counts, counters.flagsCount);

    result.aggregateScore = metrics.aggregateScore;
    result.warning = metrics.warning;
    result.flagsCount = metrics.flagsCount;

    LOGD_FMT("Session " << sessionId << ": " << eventTypeToString(type) << " ("
             << severityToString(result.severity) << "), score=" << result.aggregateScore
             << ", flags=" << result.flagsCount);
    if (result.warning) {
        LOGW_FMT("Session " << sessionId << ": " << *result.warning);
    }
    return result;
}

InterviewSummary MetricsAggregator::getInterviewSummary(const std::string& sessionId) const {
    InterviewSummary summary;
    std::shared_ptr<SessionState> state = store_.find(sessionId);
    if (!state) {
        return summary;
    }

    const SessionSnapshot snapshot = state->snapshot();
    const std::vector<BehavioralEvent>& events = snapshot.events;
    const AggregateMetrics metrics = computeMetrics(events);

    summary.totalEvents = events.size();
    summary.flagsCount = metrics.flagsCount;
    summary.aggregateScore = metrics.aggregateScore;
    summary.isFlagged = metrics.aggregateScore >= FLAGGED_SCORE_THRESHOLD;
    summary.eventsByType = metrics.eventCounts;

    for (const auto& event : events) {
        if (event.details.empty()) {
            continue;
        }
        if (event.details.contains("wpm")) {
            summary.typingPatterns = event.details;
        }
        if (event.details.contains("style_consistency_score")) {
            summary.codeStyleAnalysis = event.details;
        }
        if (isNetworkEvent(event.type)) {
            summary.networkActivity.push_back({event.type, formatTimestamp(event.timestamp), event.details});
        }
        if (isClipboardEvent(event.type)) {
            summary.clipboardAnalysis.push_back({event.type, formatTimestamp(event.timestamp), event.details});
        }
    }

    const size_t first = events.size() > TIMELINE_LENGTH ? events.size() - TIMELINE_LENGTH : 0;
    for (size_t i = first; i < events.size(); ++i) {
        summary.timeline.push_back({events[i].type, events[i].severity, formatTimestamp(events[i].timestamp)});
    }
    return summary;
}

} // namespace anticheat
} // namespace proctor
