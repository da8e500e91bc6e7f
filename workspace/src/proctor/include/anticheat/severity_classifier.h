#ifndef PROCTOR_ANTICHEAT_SEVERITY_CLASSIFIER_H
#define PROCTOR_ANTICHEAT_SEVERITY_CLASSIFIER_H

#include "anticheat/event_types.h"
#include <nlohmann/json.hpp>

namespace proctor {
namespace anticheat {

/**
 * @brief Per-event severity from a fixed weight table
 *
 * Weights: tab_switch 0.1, copy_paste 0.2, devtools_open 0.3, focus_loss
 * 0.05, large_paste 0.5, suspicious_typing 0.4, everything else 0.1.
 * A weight of at least 0.4 is high, at least 0.2 medium, otherwise low.
 *
 * large_paste is graded by details["characters"] first: above 500 is
 * critical, above 300 high, above 200 medium. Smaller pastes fall through
 * to the weight tier (high).
 */
class SeverityClassifier {
public:
    static constexpr double DEFAULT_WEIGHT = 0.1;
    static constexpr double HIGH_TIER_WEIGHT = 0.4;
    static constexpr double MEDIUM_TIER_WEIGHT = 0.2;

    static constexpr double LARGE_PASTE_THRESHOLD = 200;
    static constexpr double LARGE_PASTE_HIGH = 300;
    static constexpr double LARGE_PASTE_CRITICAL = 500;

    static double weightOf(EventType type);

    static Severity classify(EventType type, const nlohmann::json& details);

    /**
     * @brief high and critical events count as flags
     */
    static bool isFlag(Severity severity) {
        return severity == Severity::HIGH || severity == Severity::CRITICAL;
    }
};

} // namespace anticheat
} // namespace proctor

#endif // PROCTOR_ANTICHEAT_SEVERITY_CLASSIFIER_H
