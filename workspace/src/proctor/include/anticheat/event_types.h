#ifndef PROCTOR_ANTICHEAT_EVENT_TYPES_H
#define PROCTOR_ANTICHEAT_EVENT_TYPES_H

#include <nlohmann/json.hpp>
#include <string>
#include <chrono>

namespace proctor {
namespace anticheat {

/**
 * @brief Kinds of behavioral telemetry reported by the candidate's client
 */
enum class EventType {
    TAB_SWITCH,
    COPY_PASTE,
    DEVTOOLS_OPEN,
    FOCUS_LOSS,
    LARGE_PASTE,
    SUSPICIOUS_TYPING,
    CODE_CHANGE_TIMESTAMP,
    LARGE_CODE_CHANGE,
    EXTERNAL_SERVICE_REQUEST,
    AI_SERVICE_REQUEST,
    CALL_SERVICE_REQUEST,
    FREQUENT_PASTE,
    CODE_PASTE
};

/**
 * @brief Wire name, e.g. "tab_switch"
 */
std::string eventTypeToString(EventType type);

/**
 * @throws std::invalid_argument for an unknown wire name
 */
EventType eventTypeFromString(const std::string& name);

enum class Severity {
    LOW,
    MEDIUM,
    HIGH,
    CRITICAL
};

/**
 * @brief Wire name: "low", "medium", "high" or "critical"
 */
std::string severityToString(Severity severity);

/**
 * @brief One recorded event; never modified once appended to a session
 */
struct BehavioralEvent {
    EventType type = EventType::TAB_SWITCH;
    nlohmann::json details = nlohmann::json::object();
    std::chrono::system_clock::time_point timestamp;
    Severity severity = Severity::LOW;
};

/**
 * @brief ISO-8601 UTC text with microseconds, e.g. "2024-05-01T09:30:00.000123"
 */
std::string formatTimestamp(std::chrono::system_clock::time_point tp);

} // namespace anticheat
} // namespace proctor

#endif // PROCTOR_ANTICHEAT_EVENT_TYPES_H
