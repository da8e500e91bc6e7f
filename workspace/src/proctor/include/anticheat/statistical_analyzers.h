#ifndef PROCTOR_ANTICHEAT_STATISTICAL_ANALYZERS_H
#define PROCTOR_ANTICHEAT_STATISTICAL_ANALYZERS_H

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include <cstdint>

namespace proctor {
namespace anticheat {

/**
 * @brief Verdict on a keystroke timing sample
 *
 * All measurements are empty when the sample was too small or malformed.
 */
struct TypingAnalysis {
    bool isSuspicious = false;
    std::optional<double> wpm;                      ///< 1 decimal
    std::optional<double> coefficientOfVariation;   ///< 3 decimals
    std::optional<double> meanIntervalMs;           ///< 1 decimal
    std::optional<double> backspaceRatio;           ///< 3 decimals
    std::optional<int> pauseCount;
    std::optional<std::string> reason;
};

/**
 * @brief One code edit as reported by the editor
 */
struct CodeChangeRecord {
    int64_t timestampMs = 0;
    int64_t lines = 0;   ///< Signed line delta
};

struct CodeBurst {
    int64_t lines = 0;
    int64_t timeMs = 0;
};

struct CodeChangeAnalysis {
    bool isSuspicious = false;
    std::vector<CodeBurst> largeChanges;
    std::optional<std::string> reason;
};

constexpr size_t MIN_KEYSTROKE_INTERVALS = 10;
constexpr double PAUSE_THRESHOLD_MS = 2000.0;
constexpr double MIN_VARIATION = 0.1;
constexpr double MAX_WPM = 100.0;
constexpr double MIN_BACKSPACE_RATIO = 0.05;
constexpr double MIN_CHARACTERS_FOR_CORRECTIONS = 100.0;
constexpr double MIN_PAUSE_FRACTION = 0.1;

constexpr int64_t BURST_MIN_LINES = 50;
constexpr int64_t BURST_MAX_INTERVAL_MS = 5000;

// Timestamps and line deltas are clamped to this magnitude
constexpr int64_t MAX_RECORD_MAGNITUDE = 1000000000000000;

constexpr const char* UNNATURAL_TYPING_REASON = "Unnatural typing pattern detected";
constexpr const char* FAST_CODE_CHANGE_REASON = "Large code blocks added too quickly";

/**
 * @brief Judge typing rhythm
 *
 * Reads "keystroke_intervals" (ms), "backspace_count" and
 * "total_characters". Suspicious when any of: coefficient of variation
 * below 0.1, more than 100 WPM, fewer than 5% corrections over more than
 * 100 characters, or pauses (> 2s) in fewer than 10% of the intervals.
 */
TypingAnalysis analyzeTypingPatterns(const nlohmann::json& patterns);

/**
 * @brief Find large edits that followed each other too quickly
 *
 * Pair i is a burst when |lines[i]| > 50 and the next record came less
 * than 5 seconds later.
 */
CodeChangeAnalysis analyzeCodeChanges(const std::vector<CodeChangeRecord>& history);

/**
 * @brief Read [{"timestamp": ..., "lines": ...}, ...]; missing fields are 0
 *
 * Non-finite values read as 0; larger values are clamped to
 * MAX_RECORD_MAGNITUDE.
 */
std::vector<CodeChangeRecord> parseCodeChangeHistory(const nlohmann::json& history);

void to_json(nlohmann::json& j, const TypingAnalysis& analysis);
void to_json(nlohmann::json& j, const CodeChangeAnalysis& analysis);

} // namespace anticheat
} // namespace proctor

#endif // PROCTOR_ANTICHEAT_STATISTICAL_ANALYZERS_H
