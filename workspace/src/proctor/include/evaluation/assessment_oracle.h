#ifndef PROCTOR_EVALUATION_ASSESSMENT_ORACLE_H
#define PROCTOR_EVALUATION_ASSESSMENT_ORACLE_H

#include "sandbox/execution_types.h"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace proctor {
namespace evaluation {

/**
 * @brief Grade of a submission
 */
struct CodeEvaluation {
    double score = 0;                       ///< 0-100
    std::string feedback;
    std::vector<std::string> strengths;
    std::vector<std::string> improvements;
    double codeQuality = 0;
    double efficiency = 0;
    double correctness = 0;

    /**
     * @brief Used when the oracle cannot grade: score 0, "Error evaluating code"
     */
    static CodeEvaluation fallback();
};

/**
 * @brief Verdict on whether code was machine-written
 */
struct AiDetection {
    bool isSuspicious = false;
    double confidence = 0;                  ///< 0-1
    std::string reasoning;
    std::string verdict;                    ///< high_confidence_ai, likely_ai, inconclusive, likely_human
    nlohmann::json keyIndicators = nlohmann::json::array();

    /**
     * @brief Not suspicious, confidence 0, verdict "inconclusive"
     */
    static AiDetection fallback();
};

/**
 * @brief Stylistic consistency of a submission against earlier ones
 */
struct StyleAnalysis {
    double styleConsistencyScore = 0.5;     ///< 0-1
    bool isTooPerfect = false;
    bool styleChangeDetected = false;
    std::string reasoning;
    std::vector<std::string> indicators;

    /**
     * @brief Neutral score 0.5, nothing detected
     */
    static StyleAnalysis fallback();
};

/**
 * @brief What the oracle is told about the task being graded
 */
struct TaskContext {
    std::string title;
    std::string description;
    std::string taskType;
    sandbox::Language language = sandbox::Language::PYTHON;
    std::optional<sandbox::ExecutionResult> executionResult;
};

/**
 * @brief External grading and authorship-detection service
 *
 * Implementations talk to a language model and may throw
 * std::runtime_error when it cannot be reached or its reply cannot be
 * read. Callers substitute the fallback() value of the requested type.
 */
class AssessmentOracle {
public:
    virtual ~AssessmentOracle() = default;

    virtual CodeEvaluation evaluateCode(const std::string& code, const TaskContext& task) = 0;

    virtual AiDetection detectAiCode(const std::string& code) = 0;

    virtual StyleAnalysis analyzeCodeStyle(const std::string& code,
                                           const std::vector<std::string>& previousSubmissions) = 0;
};

void to_json(nlohmann::json& j, const CodeEvaluation& evaluation);
void to_json(nlohmann::json& j, const AiDetection& detection);
void to_json(nlohmann::json& j, const StyleAnalysis& analysis);

} // namespace evaluation
} // namespace proctor

#endif // PROCTOR_EVALUATION_ASSESSMENT_ORACLE_H
