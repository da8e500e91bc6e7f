#include "evaluation/assessment_oracle.h"

namespace proctor {
namespace evaluation {

CodeEvaluation CodeEvaluation::fallback() {
    CodeEvaluation evaluation;
    evaluation.feedback = "Error evaluating code";
    return evaluation;
}

AiDetection AiDetection::fallback() {
    AiDetection detection;
    detection.reasoning = "Unable to analyze code - JSON parsing failed";
    detection.verdict = "inconclusive";
    return detection;
}

StyleAnalysis StyleAnalysis::fallback() {
    StyleAnalysis analysis;
    analysis.reasoning = "Unable to analyze - JSON parsing failed";
    return analysis;
}

void to_json(nlohmann::json& j, const CodeEvaluation& evaluation) {
    j = nlohmann::json{
        {"score", evaluation.score},
        {"feedback", evaluation.feedback},
        {"strengths", evaluation.strengths},
        {"improvements", evaluation.improvements},
        {"code_quality", evaluation.codeQuality},
        {"efficiency", evaluation.efficiency},
        {"correctness", evaluation.correctness}
    };
}

void to_json(nlohmann::json& j, const AiDetection& detection) {
    j = nlohmann::json{
        {"is_suspicious", detection.isSuspicious},
        {"confidence", detection.confidence},
        {"reasoning", detection.reasoning},
        {"verdict", detection.verdict},
        {"key_indicators", detection.keyIndicators}
    };
}

void to_json(nlohmann::json& j, const StyleAnalysis& analysis) {
    j = nlohmann::json{
        {"style_consistency_score", analysis.styleConsistencyScore},
        {"is_too_perfect", analysis.isTooPerfect},
        {"style_change_detected", analysis.styleChangeDetected},
        {"reasoning", analysis.reasoning},
        {"indicators", analysis.indicators}
    };
}

} // namespace evaluation
} // namespace proctor
