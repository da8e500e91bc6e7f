#ifndef PROCTOR_EVALUATION_SUBMISSION_EVALUATOR_H
#define PROCTOR_EVALUATION_SUBMISSION_EVALUATOR_H

#include "evaluation/assessment_oracle.h"
#include "sandbox/sandbox_runner.h"
#include <optional>
#include <string>
#include <vector>

namespace proctor {
namespace evaluation {

/**
 * @brief Trim the code, then strip trailing whitespace from every line
 *
 * Whitespace-only code normalizes to "".
 */
std::string normalizeCode(const std::string& code);

/**
 * @brief SHA-256 of the normalized code, for correlating submissions in logs
 */
std::string codeFingerprint(const std::string& code);

enum class SubmissionErrorKind {
    COMPILATION,
    EXECUTION
};

std::string submissionErrorKindToString(SubmissionErrorKind kind);

/**
 * @brief Errors mentioning syntax, compile or parse are compilation errors
 */
SubmissionErrorKind classifySubmissionError(const std::string& error);

/**
 * @brief Test cases shown to the candidate on a practice run
 */
std::vector<sandbox::TestCase> visibleTestCases(const std::vector<sandbox::TestCase>& testCases,
                                                size_t count = 3);

/**
 * @brief Result of running a submission and grading it
 */
struct SubmissionOutcome {
    std::optional<sandbox::ExecutionResult> executionResult;
    std::optional<SubmissionErrorKind> errorKind;   ///< Set when execution failed
    CodeEvaluation evaluation;
    bool templateUnchanged = false;
};

void to_json(nlohmann::json& j, const SubmissionOutcome& outcome);

/**
 * @brief Runs and grades candidate submissions
 *
 * A submission equal to the starter template (after normalizeCode) scores
 * 0 without consulting the oracle. Oracle failures give
 * CodeEvaluation::fallback().
 */
class SubmissionEvaluator {
public:
    static constexpr const char* UNCHANGED_TEMPLATE_FEEDBACK =
        "You submitted the starter template without changes. Please implement a solution before submitting.";

    /**
     * @param oracle Grader; must outlive the evaluator
     * @param runner Sandbox used by submit() and runVisibleTests(); must outlive the evaluator
     */
    SubmissionEvaluator(AssessmentOracle& oracle, sandbox::SandboxRunner& runner);

    /**
     * @brief Grade code without running it
     */
    CodeEvaluation evaluate(const std::string& code,
                            const std::optional<std::string>& starterCode,
                            const TaskContext& task);

    /**
     * @brief Run every test case, then grade with the execution result attached
     */
    SubmissionOutcome submit(const sandbox::ExecutionRequest& request,
                             const std::optional<std::string>& starterCode,
                             TaskContext task);

    /**
     * @brief Practice run on the visible test cases only; no grading
     */
    SubmissionOutcome runVisibleTests(const sandbox::ExecutionRequest& request);

    /**
     * @brief Empty or starter-identical submission
     */
    static bool isUnchangedTemplate(const std::string& code, const std::optional<std::string>& starterCode);

private:
    SubmissionOutcome execute(const sandbox::ExecutionRequest& request);

    AssessmentOracle& oracle_;
    sandbox::SandboxRunner& runner_;
};

} // namespace evaluation
} // namespace proctor

#endif // PROCTOR_EVALUATION_SUBMISSION_EVALUATOR_H
