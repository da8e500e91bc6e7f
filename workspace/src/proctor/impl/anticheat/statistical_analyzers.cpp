#include "anticheat/statistical_analyzers.h"
#include "utils/log.h"
#include <algorithm>
#include <cmath>
#include <cstdlib>

namespace proctor {
namespace anticheat {

namespace {

double roundTo(double value, int decimals) {
    const double scale = std::pow(10.0, decimals);
    return std::round(value * scale) / scale;
}

double numberOr(const nlohmann::json& object, const char* key, double fallback) {
    auto it = object.find(key);
    if (it != object.end() && it->is_number()) {
        return it->get<double>();
    }
    return fallback;
}

int64_t clampMagnitude(int64_t value) {
    return std::clamp(value, -MAX_RECORD_MAGNITUDE, MAX_RECORD_MAGNITUDE);
}

int64_t integerOr(const nlohmann::json& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end()) {
        return 0;
    }
    if (it->is_number_unsigned()) {
        return it->get<uint64_t>() > static_cast<uint64_t>(MAX_RECORD_MAGNITUDE)
            ? MAX_RECORD_MAGNITUDE
            : static_cast<int64_t>(it->get<uint64_t>());
    }
    if (it->is_number_integer()) {
        return clampMagnitude(it->get<int64_t>());
    }
    if (it->is_number_float()) {
        const double value = it->get<double>();
        if (!std::isfinite(value)) {
            return 0;
        }
        const double limit = static_cast<double>(MAX_RECORD_MAGNITUDE);
        return static_cast<int64_t>(std::clamp(value, -limit, limit));
    }
    return 0;
}

template<typename T>
nlohmann::json optionalToJson(const std::optional<T>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

} // namespace

TypingAnalysis analyzeTypingPatterns(const nlohmann::json& patterns) {
    TypingAnalysis analysis;
    if (!patterns.is_object()) {
        return analysis;
    }

    auto it = patterns.find("keystroke_intervals");
    if (it == patterns.end() || !it->is_array() || it->size() < MIN_KEYSTROKE_INTERVALS) {
        return analysis;
    }

    std::vector<double> intervals;
    intervals.reserve(it->size());
    for (const auto& value : *it) {
        if (!value.is_number()) {
            LOGD("Keystroke intervals contain a non-numeric entry; no verdict");
            return analysis;
        }
        intervals.push_back(value.get<double>());
    }

    const double backspaceCount = numberOr(patterns, "backspace_count", 0);
    const double totalCharacters = numberOr(patterns, "total_characters", 0);

    double sum = 0;
    for (double interval : intervals) {
        sum += interval;
    }
    const double count = static_cast<double>(intervals.size());
    const double mean = sum / count;

    double squaredDeviation = 0;
    for (double interval : intervals) {
        squaredDeviation += (interval - mean) * (interval - mean);
    }
    const double stddev = std::sqrt(squaredDeviation / count);
    const double cv = mean > 0 ? stddev / mean : 0;

    const double totalSeconds = sum / 1000.0;
    const double wpm = totalSeconds > 0 ? (totalCharacters / 5.0) / (totalSeconds / 60.0) : 0;

    const double backspaceRatio = totalCharacters > 0 ? backspaceCount / totalCharacters : 0;

    int pauses = 0;
    for (double interval : intervals) {
        if (interval > PAUSE_THRESHOLD_MS) {
            pauses++;
        }
    }

    analysis.isSuspicious =
        cv < MIN_VARIATION ||
        wpm > MAX_WPM ||
        (backspaceRatio < MIN_BACKSPACE_RATIO && totalCharacters > MIN_CHARACTERS_FOR_CORRECTIONS) ||
        pauses < count * MIN_PAUSE_FRACTION;

    analysis.wpm = roundTo(wpm, 1);
    analysis.coefficientOfVariation = roundTo(cv, 3);
    analysis.meanIntervalMs = roundTo(mean, 1);
    analysis.backspaceRatio = roundTo(backspaceRatio, 3);
    analysis.pauseCount = pauses;
    if (analysis.isSuspicious) {
        analysis.reason = UNNATURAL_TYPING_REASON;
    }
    return analysis;
}

CodeChangeAnalysis analyzeCodeChanges(const std::vector<CodeChangeRecord>& history) {
    CodeChangeAnalysis analysis;
    if (history.size() < 2) {
        return analysis;
    }

    for (size_t i = 0; i + 1 < history.size(); ++i) {
        const int64_t lines = std::llabs(clampMagnitude(history[i].lines));
        const int64_t elapsed = clampMagnitude(history[i + 1].timestampMs) - clampMagnitude(history[i].timestampMs);
        if (lines > BURST_MIN_LINES && elapsed < BURST_MAX_INTERVAL_MS) {
            analysis.largeChanges.push_back({lines, elapsed});
        }
    }

    analysis.isSuspicious = !analysis.largeChanges.empty();
    if (analysis.isSuspicious) {
        analysis.reason = FAST_CODE_CHANGE_REASON;
    }
    return analysis;
}

std::vector<CodeChangeRecord> parseCodeChangeHistory(const nlohmann::json& history) {
    std::vector<CodeChangeRecord> records;
    if (!history.is_array()) {
        return records;
    }
    for (const auto& entry : history) {
        if (!entry.is_object()) {
            continue;
        }
        CodeChangeRecord record;
        record.timestampMs = integerOr(entry, "timestamp");
        record.lines = integerOr(entry, "lines");
        records.push_back(record);
    }
    return records;
}

void to_json(nlohmann::json& j, const TypingAnalysis& analysis) {
    j = nlohmann::json{
        {"is_suspicious", analysis.isSuspicious},
        {"wpm", optionalToJson(analysis.wpm)},
        {"coefficient_of_variation", optionalToJson(analysis.coefficientOfVariation)},
        {"mean_interval_ms", optionalToJson(analysis.meanIntervalMs)},
        {"backspace_ratio", optionalToJson(analysis.backspaceRatio)},
        {"pause_count", optionalToJson(analysis.pauseCount)},
        {"reason", optionalToJson(analysis.reason)}
    };
}

void to_json(nlohmann::json& j, const CodeChangeAnalysis& analysis) {
    nlohmann::json bursts = nlohmann::json::array();
    for (const auto& burst : analysis.largeChanges) {
        bursts.push_back({{"lines", burst.lines}, {"time_ms", burst.timeMs}});
    }
    j = nlohmann::json{
        {"is_suspicious", analysis.isSuspicious},
        {"large_changes_count", analysis.largeChanges.size()},
        {"large_changes", bursts},
        {"reason", optionalToJson(analysis.reason)}
    };
}

} // namespace anticheat
} // namespace proctor
