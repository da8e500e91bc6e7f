#ifndef PROCTOR_SANDBOX_EXECUTION_TYPES_H
#define PROCTOR_SANDBOX_EXECUTION_TYPES_H

#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace proctor {
namespace sandbox {

/**
 * @brief Languages a submission can be written in
 */
enum class Language {
    PYTHON,
    JAVASCRIPT,
    CPP
};

/**
 * @brief One input/expected-output pair of a batch run
 */
struct TestCase {
    std::string input;
    std::string expectedOutput;
};

/**
 * @brief A code submission to execute
 */
struct ExecutionRequest {
    std::string code;
    Language language = Language::PYTHON;
    std::vector<TestCase> testCases;          ///< Empty = single run
    std::optional<std::string> stdinData;     ///< Single run only
};

/**
 * @brief Outcome of one test case of a batch run
 */
struct TestResult {
    int testNumber = 0;                       ///< 1-based position in the batch
    bool passed = false;
    std::string input;
    std::string expected;                     ///< Trimmed expected output
    std::string actual;                       ///< Trimmed actual stdout
    std::optional<std::string> error;
    int64_t executionTimeMs = 0;
};

/**
 * @brief Outcome of a whole execution request
 *
 * success is true iff the program exited cleanly (single run) or every
 * test case passed (batch run). memoryUsedMb of 0 means "not measured".
 */
struct ExecutionResult {
    bool success = false;
    std::optional<std::string> output;
    std::optional<std::string> error;
    int64_t executionTimeMs = 0;
    double memoryUsedMb = 0.0;
    std::optional<std::vector<TestResult>> testResults;
};

/**
 * @brief What an execution backend is asked to run
 */
struct RunSpec {
    std::string image;
    std::vector<std::string> command;
    std::string hostDirectory;                ///< Bind-mounted at /code
    std::optional<std::string> stdinData;
};

/**
 * @brief What an execution backend reports back
 *
 * errorMessage carries backend-side failure text (engine errors, kill
 * reasons); stderr carries the sandboxed program's own error stream.
 */
struct RawRunResult {
    std::string stdoutData;
    std::string stderrData;
    int exitCode = -1;
    bool timedOut = false;
    bool oomKilled = false;
    std::string errorMessage;
    int64_t durationMs = 0;
};

void to_json(nlohmann::json& j, const TestCase& testCase);
void from_json(const nlohmann::json& j, TestCase& testCase);
void to_json(nlohmann::json& j, const TestResult& result);
void to_json(nlohmann::json& j, const ExecutionResult& result);

} // namespace sandbox
} // namespace proctor

#endif // PROCTOR_SANDBOX_EXECUTION_TYPES_H
