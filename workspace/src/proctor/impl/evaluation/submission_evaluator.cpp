#include "evaluation/submission_evaluator.h"
#include "utils/string_utils.h"
#include "utils/digest.h"
#include "utils/log.h"

namespace proctor {
namespace evaluation {

std::string normalizeCode(const std::string& code) {
    const std::string stripped = utils::trim(code);
    if (stripped.empty()) {
        return "";
    }

    std::string normalized;
    const std::vector<std::string> lines = utils::splitLines(stripped);
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) {
            normalized += '\n';
        }
        normalized += utils::rtrim(lines[i]);
    }
    return normalized;
}

std::string codeFingerprint(const std::string& code) {
    return utils::sha256Hex(normalizeCode(code));
}

std::string submissionErrorKindToString(SubmissionErrorKind kind) {
    switch (kind) {
        case SubmissionErrorKind::COMPILATION: return "compilation";
        case SubmissionErrorKind::EXECUTION: return "execution";
        default: return "unknown";
    }
}

SubmissionErrorKind classifySubmissionError(const std::string& error) {
    if (utils::containsIgnoreCase(error, "syntax") ||
        utils::containsIgnoreCase(error, "compile") ||
        utils::containsIgnoreCase(error, "parse")) {
        return SubmissionErrorKind::COMPILATION;
    }
    return SubmissionErrorKind::EXECUTION;
}

std::vector<sandbox::TestCase> visibleTestCases(const std::vector<sandbox::TestCase>& testCases, size_t count) {
    if (testCases.size() <= count) {
        return testCases;
    }
    return std::vector<sandbox::TestCase>(testCases.begin(), testCases.begin() + static_cast<std::ptrdiff_t>(count));
}

void to_json(nlohmann::json& j, const SubmissionOutcome& outcome) {
    j = nlohmann::json{
        {"execution_result", outcome.executionResult ? nlohmann::json(*outcome.executionResult)
                                                     : nlohmann::json(nullptr)},
        {"error_kind", outcome.errorKind ? nlohmann::json(submissionErrorKindToString(*outcome.errorKind))
                                         : nlohmann::json(nullptr)},
        {"evaluation", outcome.evaluation},
        {"template_unchanged", outcome.templateUnchanged}
    };
}

SubmissionEvaluator::SubmissionEvaluator(AssessmentOracle& oracle, sandbox::SandboxRunner& runner)
    : oracle_(oracle)
    , runner_(runner) {
}

bool SubmissionEvaluator::isUnchangedTemplate(const std::string& code, const std::optional<std::string>& starterCode) {
    if (!starterCode || starterCode->empty()) {
        return false;
    }
    const std::string submission = normalizeCode(code);
    return submission.empty() || submission == normalizeCode(*starterCode);
}

CodeEvaluation SubmissionEvaluator::evaluate(const std::string& code,
                                             const std::optional<std::string>& starterCode,
                                             const TaskContext& task) {
    const std::string fingerprint = codeFingerprint(code).substr(0, 16);

    if (isUnchangedTemplate(code, starterCode)) {
        LOGI_FMT("Submission " << fingerprint << " is the unchanged starter template");
        CodeEvaluation evaluation;
        evaluation.feedback = UNCHANGED_TEMPLATE_FEEDBACK;
        return evaluation;
    }

    try {
        CodeEvaluation evaluation = oracle_.evaluateCode(code, task);
        LOGI_FMT("Submission " << fingerprint << " graded " << evaluation.score);
        return evaluation;
    } catch (const std::exception& e) {
        LOGE_FMT("Grading of submission " << fingerprint << " failed: " << e.what());
        return CodeEvaluation::fallback();
    }
}

SubmissionOutcome SubmissionEvaluator::execute(const sandbox::ExecutionRequest& request) {
    SubmissionOutcome outcome;
    outcome.executionResult = runner_.execute(request);
    if (!outcome.executionResult->success) {
        outcome.errorKind = classifySubmissionError(outcome.executionResult->error.value_or(""));
        LOGD_FMT("Submission " << codeFingerprint(request.code).substr(0, 16) << " failed with a "
                 << submissionErrorKindToString(*outcome.errorKind) << " error");
    }
    return outcome;
}

SubmissionOutcome SubmissionEvaluator::submit(const sandbox::ExecutionRequest& request,
                                              const std::optional<std::string>& starterCode,
                                              TaskContext task) {
    SubmissionOutcome outcome;
    if (!request.testCases.empty()) {
        outcome = execute(request);
        task.executionResult = outcome.executionResult;
    }

    task.language = request.language;
    outcome.templateUnchanged = isUnchangedTemplate(request.code, starterCode);
    outcome.evaluation = evaluate(request.code, starterCode, task);
    return outcome;
}

SubmissionOutcome SubmissionEvaluator::runVisibleTests(const sandbox::ExecutionRequest& request) {
    sandbox::ExecutionRequest visible = request;
    visible.testCases = visibleTestCases(request.testCases);
    return execute(visible);
}

} // namespace evaluation
} // namespace proctor
