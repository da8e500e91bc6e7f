#ifndef PROCTOR_EVALUATION_SUBMISSION_ANALYZER_H
#define PROCTOR_EVALUATION_SUBMISSION_ANALYZER_H

#include "evaluation/assessment_oracle.h"
#include "anticheat/metrics_aggregator.h"
#include "anticheat/statistical_analyzers.h"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace proctor {
namespace evaluation {

/**
 * @brief Everything learned about one submission's authorship
 */
struct SubmissionAnalysis {
    bool isSuspicious = false;
    AiDetection aiDetection;
    std::optional<anticheat::TypingAnalysis> patternAnalysis;
    StyleAnalysis styleAnalysis;
    std::optional<anticheat::CodeChangeAnalysis> codeChangeAnalysis;
};

void to_json(nlohmann::json& j, const SubmissionAnalysis& analysis);

/**
 * @brief Checks a submission for signs it was not written by the candidate
 *
 * Four independent checks, each recording an event in the candidate's
 * session when it fires:
 *  1. oracle authorship detection, suspicious with confidence above 0.7
 *     (suspicious_typing);
 *  2. keystroke rhythm, when typing patterns were captured (suspicious_typing);
 *  3. oracle style analysis reporting "too perfect" code (suspicious_typing);
 *  4. edit bursts, when a change history was captured (large_code_change).
 */
class SubmissionAnalyzer {
public:
    static constexpr double AI_CONFIDENCE_THRESHOLD = 0.7;

    /**
     * @param oracle Detection service; must outlive the analyzer
     * @param aggregator Receives the events; must outlive the analyzer
     */
    SubmissionAnalyzer(AssessmentOracle& oracle, anticheat::MetricsAggregator& aggregator);

    SubmissionAnalysis analyze(const std::string& sessionId,
                               const std::string& code,
                               const std::optional<nlohmann::json>& typingPatterns = std::nullopt,
                               const std::vector<std::string>& previousSubmissions = {},
                               const std::vector<anticheat::CodeChangeRecord>& codeChangeHistory = {});

private:
    AiDetection detectAuthorship(const std::string& code);
    StyleAnalysis analyzeStyle(const std::string& code, const std::vector<std::string>& previousSubmissions);

    AssessmentOracle& oracle_;
    anticheat::MetricsAggregator& aggregator_;
};

} // namespace evaluation
} // namespace proctor

#endif // PROCTOR_EVALUATION_SUBMISSION_ANALYZER_H
