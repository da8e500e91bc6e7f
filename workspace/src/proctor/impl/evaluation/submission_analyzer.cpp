#include "evaluation/submission_analyzer.h"
#include "utils/log.h"

namespace proctor {
namespace evaluation {

using anticheat::EventType;

void to_json(nlohmann::json& j, const SubmissionAnalysis& analysis) {
    j = nlohmann::json{
        {"is_suspicious", analysis.isSuspicious},
        {"ai_detection", analysis.aiDetection},
        {"pattern_analysis", analysis.patternAnalysis ? nlohmann::json(*analysis.patternAnalysis)
                                                      : nlohmann::json(nullptr)},
        {"style_analysis", analysis.styleAnalysis},
        {"code_change_analysis", analysis.codeChangeAnalysis ? nlohmann::json(*analysis.codeChangeAnalysis)
                                                             : nlohmann::json(nullptr)}
    };
}

SubmissionAnalyzer::SubmissionAnalyzer(AssessmentOracle& oracle, anticheat::MetricsAggregator& aggregator)
    : oracle_(oracle)
    , aggregator_(aggregator) {
}

AiDetection SubmissionAnalyzer::detectAuthorship(const std::string& code) {
    try {
        return oracle_.detectAiCode(code);
    } catch (const std::exception& e) {
        LOGW_FMT("Authorship detection unavailable: " << e.what());
        return AiDetection::fallback();
    }
}

StyleAnalysis SubmissionAnalyzer::analyzeStyle(const std::string& code,
                                               const std::vector<std::string>& previousSubmissions) {
    try {
        return oracle_.analyzeCodeStyle(code, previousSubmissions);
    } catch (const std::exception& e) {
        LOGW_FMT("Style analysis unavailable: " << e.what());
        return StyleAnalysis::fallback();
    }
}

SubmissionAnalysis SubmissionAnalyzer::analyze(const std::string& sessionId,
                                               const std::string& code,
                                               const std::optional<nlohmann::json>& typingPatterns,
                                               const std::vector<std::string>& previousSubmissions,
                                               const std::vector<anticheat::CodeChangeRecord>& codeChangeHistory) {
    SubmissionAnalysis analysis;

    analysis.aiDetection = detectAuthorship(code);
    if (analysis.aiDetection.isSuspicious && analysis.aiDetection.confidence > AI_CONFIDENCE_THRESHOLD) {
        aggregator_.recordEvent(sessionId, EventType::SUSPICIOUS_TYPING, {
            {"reason", "AI-generated code detected"},
            {"confidence", analysis.aiDetection.confidence}
        });
        analysis.isSuspicious = true;
    }

    if (typingPatterns && typingPatterns->is_object() && !typingPatterns->empty()) {
        analysis.patternAnalysis = anticheat::analyzeTypingPatterns(*typingPatterns);
        if (analysis.patternAnalysis->isSuspicious) {
            aggregator_.recordEvent(sessionId, EventType::SUSPICIOUS_TYPING, *analysis.patternAnalysis);
            analysis.isSuspicious = true;
        }
    }

    analysis.styleAnalysis = analyzeStyle(code, previousSubmissions);
    if (analysis.styleAnalysis.isTooPerfect) {
        aggregator_.recordEvent(sessionId, EventType::SUSPICIOUS_TYPING, {
            {"reason", "Code is too perfect - likely AI-generated"},
            {"style_consistency", analysis.styleAnalysis.styleConsistencyScore},
            {"indicators", analysis.styleAnalysis.indicators}
        });
        analysis.isSuspicious = true;
    }

    if (!codeChangeHistory.empty()) {
        analysis.codeChangeAnalysis = anticheat::analyzeCodeChanges(codeChangeHistory);
        if (analysis.codeChangeAnalysis->isSuspicious) {
            aggregator_.recordEvent(sessionId, EventType::LARGE_CODE_CHANGE, *analysis.codeChangeAnalysis);
            analysis.isSuspicious = true;
        }
    }

    if (analysis.isSuspicious) {
        LOGW_FMT("Session " << sessionId << ": submission flagged as suspicious");
    }
    return analysis;
}

} // namespace evaluation
} // namespace proctor
