#include "anticheat/event_types.h"
#include <stdexcept>
#include <sstream>
#include <iomanip>
#include <ctime>
#include <map>

namespace proctor {
namespace anticheat {

namespace {

const std::map<EventType, std::string>& eventTypeNames() {
    static const std::map<EventType, std::string> names = {
        {EventType::TAB_SWITCH, "tab_switch"},
        {EventType::COPY_PASTE, "copy_paste"},
        {EventType::DEVTOOLS_OPEN, "devtools_open"},
        {EventType::FOCUS_LOSS, "focus_loss"},
        {EventType::LARGE_PASTE, "large_paste"},
        {EventType::SUSPICIOUS_TYPING, "suspicious_typing"},
        {EventType::CODE_CHANGE_TIMESTAMP, "code_change_timestamp"},
        {EventType::LARGE_CODE_CHANGE, "large_code_change"},
        {EventType::EXTERNAL_SERVICE_REQUEST, "external_service_request"},
        {EventType::AI_SERVICE_REQUEST, "ai_service_request"},
        {EventType::CALL_SERVICE_REQUEST, "call_service_request"},
        {EventType::FREQUENT_PASTE, "frequent_paste"},
        {EventType::CODE_PASTE, "code_paste"}
    };
    return names;
}

} // namespace

std::string eventTypeToString(EventType type) {
    auto it = eventTypeNames().find(type);
    return it != eventTypeNames().end() ? it->second : "unknown";
}

EventType eventTypeFromString(const std::string& name) {
    for (const auto& entry : eventTypeNames()) {
        if (entry.second == name) {
            return entry.first;
        }
    }
    throw std::invalid_argument("Unknown event type: " + name);
}

std::string severityToString(Severity severity) {
    switch (severity) {
        case Severity::LOW: return "low";
        case Severity::MEDIUM: return "medium";
        case Severity::HIGH: return "high";
        case Severity::CRITICAL: return "critical";
        default: return "unknown";
    }
}

std::string formatTimestamp(std::chrono::system_clock::time_point tp) {
    const auto time = std::chrono::system_clock::to_time_t(tp);
    const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
        tp.time_since_epoch()) % 1000000;

    std::tm tmBuf;
    gmtime_r(&time, &tmBuf);

    std::ostringstream oss;
    oss << std::put_time(&tmBuf, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(6) << micros.count();
    return oss.str();
}

} // namespace anticheat
} // namespace proctor
