#include "sandbox/execution_types.h"

namespace proctor {
namespace sandbox {

namespace {

// Test data authored as JSON numbers or arrays is compared in its text form
std::string textOf(const nlohmann::json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_null()) {
        return "";
    }
    return value.dump();
}

template<typename T>
nlohmann::json optionalToJson(const std::optional<T>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

} // namespace

void to_json(nlohmann::json& j, const TestCase& testCase) {
    j = nlohmann::json{{"input", testCase.input}, {"output", testCase.expectedOutput}};
}

void from_json(const nlohmann::json& j, TestCase& testCase) {
    testCase.input = j.contains("input") ? textOf(j["input"]) : "";
    testCase.expectedOutput = j.contains("output") ? textOf(j["output"]) : "";
}

void to_json(nlohmann::json& j, const TestResult& result) {
    j = nlohmann::json{
        {"test_number", result.testNumber},
        {"passed", result.passed},
        {"input", result.input},
        {"expected", result.expected},
        {"actual", result.actual},
        {"error", optionalToJson(result.error)},
        {"execution_time_ms", result.executionTimeMs}
    };
}

void to_json(nlohmann::json& j, const ExecutionResult& result) {
    j = nlohmann::json{
        {"success", result.success},
        {"output", optionalToJson(result.output)},
        {"error", optionalToJson(result.error)},
        {"execution_time_ms", result.executionTimeMs},
        {"memory_used_mb", result.memoryUsedMb}
    };
    if (result.testResults) {
        j["test_results"] = *result.testResults;
    }
}

} // namespace sandbox
} // namespace proctor
