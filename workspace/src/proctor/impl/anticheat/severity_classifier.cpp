#include "anticheat/severity_classifier.h"

namespace proctor {
namespace anticheat {

double SeverityClassifier::weightOf(EventType type) {
    switch (type) {
        case EventType::TAB_SWITCH: return 0.1;
        case EventType::COPY_PASTE: return 0.2;
        case EventType::DEVTOOLS_OPEN: return 0.3;
        case EventType::FOCUS_LOSS: return 0.05;
        case EventType::LARGE_PASTE: return 0.5;
        case EventType::SUSPICIOUS_TYPING: return 0.4;
        default: return DEFAULT_WEIGHT;
    }
}

Severity SeverityClassifier::classify(EventType type, const nlohmann::json& details) {
    if (type == EventType::LARGE_PASTE && details.is_object()) {
        double characters = 0;
        auto it = details.find("characters");
        if (it != details.end() && it->is_number()) {
            characters = it->get<double>();
        }

        if (characters > LARGE_PASTE_CRITICAL) {
            return Severity::CRITICAL;
        } else if (characters > LARGE_PASTE_HIGH) {
            return Severity::HIGH;
        } else if (characters > LARGE_PASTE_THRESHOLD) {
            return Severity::MEDIUM;
        }
    }

    const double weight = weightOf(type);
    if (weight >= HIGH_TIER_WEIGHT) {
        return Severity::HIGH;
    } else if (weight >= MEDIUM_TIER_WEIGHT) {
        return Severity::MEDIUM;
    }
    return Severity::LOW;
}

} // namespace anticheat
} // namespace proctor
