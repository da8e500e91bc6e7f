/**
 * @file test_sandbox_runner.cpp
 * @brief Unit tests for SandboxRunner with an in-process backend
 *
 * The fake backend reads the staged files from the host directory, so the
 * tests see exactly what a container would see under /code.
 */

#include <gtest/gtest.h>
#include "sandbox/sandbox_runner.h"
#include <atomic>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <mutex>
#include <thread>
#include <vector>

using namespace proctor::sandbox;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

namespace {

std::string readFile(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

/**
 * Behaves like the program "print(input().upper())" unless a handler is set.
 */
class FakeBackend : public ExecutionBackend {
public:
    using Handler = std::function<RawRunResult(const RunSpec&, const std::string& input)>;

    RawRunResult run(const RunSpec& spec) override {
        fs::path inputPath = fs::path(spec.hostDirectory) / INPUT_FILE_NAME;
        std::string input = fs::exists(inputPath) ? readFile(inputPath) : "";
        std::string source;
        for (const auto& entry : fs::directory_iterator(spec.hostDirectory)) {
            if (entry.path().filename().string().rfind("solution.", 0) == 0) {
                source = readFile(entry.path());
            }
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            specs.push_back(spec);
            sources.push_back(source);
            directories.push_back(spec.hostDirectory);
        }

        if (handler) {
            return handler(spec, input);
        }

        RawRunResult raw;
        raw.exitCode = 0;
        raw.durationMs = 5;
        for (char c : input) {
            raw.stdoutData += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
        return raw;
    }

    bool ping() override { return true; }
    BackendKind kind() const override { return BackendKind::CLI; }
    const LimitPolicy& policy() const override { return policy_; }

    Handler handler;
    std::vector<RunSpec> specs;
    std::vector<std::string> sources;
    std::vector<std::string> directories;

private:
    std::mutex mutex_;
    LimitPolicy policy_;
};

} // namespace

class SandboxRunnerTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeBackend> backend;
    fs::path root;

    void SetUp() override {
        backend = std::make_shared<FakeBackend>();
        char pattern[] = "/tmp/proctor-runner-test-XXXXXX";
        ASSERT_NE(mkdtemp(pattern), nullptr);
        root = pattern;
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root, ec);
    }

    std::unique_ptr<SandboxRunner> makeRunner(size_t threads = 2, size_t queue = 8) {
        BackendSelection selection;
        selection.kind = BackendKind::CLI;
        selection.reason = "test";
        selection.backend = backend;
        return std::make_unique<SandboxRunner>(selection, CommandResolver(), root.string(), threads, queue);
    }

    static ExecutionRequest pythonRequest(const std::string& code = "print(input().upper())") {
        ExecutionRequest request;
        request.code = code;
        request.language = Language::PYTHON;
        return request;
    }
};

// ============================================================================
// Disabled Backend Tests
// ============================================================================

TEST_F(SandboxRunnerTest, DisabledReturnsFixedResult) {
    SandboxRunner runner(BackendSelection(), CommandResolver(), root.string(), 1, 1);

    EXPECT_FALSE(runner.isEnabled());
    ExecutionResult result = runner.execute(pythonRequest());

    EXPECT_FALSE(result.success);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(*result.error, SandboxRunner::DISABLED_MESSAGE);
    EXPECT_EQ(result.executionTimeMs, 0);
    EXPECT_FALSE(result.testResults.has_value());
}

TEST_F(SandboxRunnerTest, ZeroWorkersRejected) {
    EXPECT_THROW(SandboxRunner(BackendSelection(), CommandResolver(), root.string(), 0, 1),
                 std::invalid_argument);
}

// ============================================================================
// Single Run Tests
// ============================================================================

TEST_F(SandboxRunnerTest, SingleRunStagesSourceAndUsesBareCommand) {
    auto runner = makeRunner();
    ExecutionResult result = runner->execute(pythonRequest("print('hi')"));

    EXPECT_TRUE(result.success);
    ASSERT_EQ(backend->specs.size(), 1u);
    EXPECT_EQ(backend->specs[0].image, "python:3.11-slim");
    EXPECT_EQ(backend->specs[0].command, (std::vector<std::string>{"python", "/code/solution.py"}));
    EXPECT_EQ(backend->sources[0], "print('hi')");
    EXPECT_FALSE(result.testResults.has_value());
}

TEST_F(SandboxRunnerTest, SingleRunWithStdinPipesInputFile) {
    auto runner = makeRunner();
    ExecutionRequest request = pythonRequest();
    request.stdinData = "hello\n";

    ExecutionResult result = runner->execute(request);

    EXPECT_TRUE(result.success);
    ASSERT_TRUE(result.output.has_value());
    EXPECT_EQ(*result.output, "HELLO");
    EXPECT_EQ(backend->specs[0].command[0], "sh");
    EXPECT_EQ(backend->specs[0].command[2], "cat /code/input.txt | python /code/solution.py");
}

TEST_F(SandboxRunnerTest, SingleRunOutputIsTrimmed) {
    backend->handler = [](const RunSpec&, const std::string&) {
        RawRunResult raw;
        raw.stdoutData = "\n  42\nwarning: unused\n\n";
        raw.exitCode = 0;
        return raw;
    };
    auto runner = makeRunner();

    ExecutionResult result = runner->execute(pythonRequest());

    EXPECT_TRUE(result.success);
    EXPECT_EQ(*result.output, "42\nwarning: unused");
}

TEST_F(SandboxRunnerTest, WorkDirectoryRemovedAfterRun) {
    auto runner = makeRunner();
    runner->execute(pythonRequest());

    ASSERT_EQ(backend->directories.size(), 1u);
    EXPECT_FALSE(fs::exists(backend->directories[0]));
    EXPECT_EQ(fs::path(backend->directories[0]).parent_path(), root);
}

TEST_F(SandboxRunnerTest, SingleRunFailureKeepsOutput) {
    backend->handler = [](const RunSpec&, const std::string&) {
        RawRunResult raw;
        raw.stdoutData = "partial\n";
        raw.stderrData = "Traceback: ZeroDivisionError\n";
        raw.exitCode = 1;
        raw.errorMessage = "Traceback: ZeroDivisionError";
        raw.durationMs = 12;
        return raw;
    };
    auto runner = makeRunner();

    ExecutionResult result = runner->execute(pythonRequest());
    EXPECT_FALSE(result.success);
    EXPECT_EQ(*result.output, "partial");
    EXPECT_EQ(*result.error, "Traceback: ZeroDivisionError");
    EXPECT_EQ(result.executionTimeMs, 12);
}

TEST_F(SandboxRunnerTest, SingleRunTimeout) {
    backend->handler = [](const RunSpec&, const std::string&) {
        RawRunResult raw;
        raw.exitCode = 137;
        raw.timedOut = true;
        raw.errorMessage = "Execution timed out after 10s";
        raw.durationMs = 10000;
        return raw;
    };
    auto runner = makeRunner();

    ExecutionResult result = runner->execute(pythonRequest());
    EXPECT_FALSE(result.success);
    EXPECT_EQ(*result.error, SandboxRunner::TIME_LIMIT_MESSAGE);
}

TEST_F(SandboxRunnerTest, SingleRunOutOfMemory) {
    backend->handler = [](const RunSpec&, const std::string&) {
        RawRunResult raw;
        raw.exitCode = 137;
        raw.oomKilled = true;
        return raw;
    };
    auto runner = makeRunner();

    ExecutionResult result = runner->execute(pythonRequest());
    EXPECT_FALSE(result.success);
    EXPECT_EQ(*result.error, SandboxRunner::MEMORY_LIMIT_MESSAGE);
}

TEST_F(SandboxRunnerTest, BackendExceptionBecomesResult) {
    backend->handler = [](const RunSpec&, const std::string&) -> RawRunResult {
        throw std::runtime_error("Image not available: python:3.11-slim");
    };
    auto runner = makeRunner();

    ExecutionResult result = runner->execute(pythonRequest());
    EXPECT_FALSE(result.success);
    EXPECT_EQ(*result.error, "Execution error: Image not available: python:3.11-slim");
}

// ============================================================================
// Batch Run Tests
// ============================================================================

TEST_F(SandboxRunnerTest, BatchAllPass) {
    auto runner = makeRunner();
    ExecutionRequest request = pythonRequest();
    request.testCases = {{"abc", "ABC"}, {"x y", "  X Y\n"}};

    ExecutionResult result = runner->execute(request);

    EXPECT_TRUE(result.success);
    EXPECT_EQ(*result.output, "Passed 2/2 tests");
    EXPECT_FALSE(result.error.has_value());
    EXPECT_EQ(result.executionTimeMs, 10);
    ASSERT_TRUE(result.testResults.has_value());
    ASSERT_EQ(result.testResults->size(), 2u);
    EXPECT_EQ((*result.testResults)[0].testNumber, 1);
    EXPECT_EQ((*result.testResults)[1].testNumber, 2);
    EXPECT_EQ((*result.testResults)[1].expected, "X Y");
    EXPECT_EQ((*result.testResults)[1].actual, "X Y");

    // Every case runs the wrapped command in the same sandbox directory
    ASSERT_EQ(backend->specs.size(), 2u);
    EXPECT_EQ(backend->specs[0].command[2], "cat /code/input.txt | python /code/solution.py");
    EXPECT_EQ(backend->directories[0], backend->directories[1]);
}

TEST_F(SandboxRunnerTest, BatchPartialFailure) {
    auto runner = makeRunner();
    ExecutionRequest request = pythonRequest();
    request.testCases = {{"a", "A"}, {"b", "b"}, {"c", "C"}};

    ExecutionResult result = runner->execute(request);

    EXPECT_FALSE(result.success);
    EXPECT_EQ(*result.output, "Passed 2/3 tests");
    EXPECT_EQ(*result.error, SandboxRunner::TESTS_FAILED_MESSAGE);
    EXPECT_TRUE((*result.testResults)[0].passed);
    EXPECT_FALSE((*result.testResults)[1].passed);
    EXPECT_TRUE((*result.testResults)[2].passed);
}

TEST_F(SandboxRunnerTest, BatchCaseExceptionDoesNotStopBatch) {
    backend->handler = [](const RunSpec&, const std::string& input) -> RawRunResult {
        if (input == "boom") {
            throw std::runtime_error("engine went away");
        }
        RawRunResult raw;
        raw.exitCode = 0;
        raw.stdoutData = input;
        raw.durationMs = 3;
        return raw;
    };
    auto runner = makeRunner();
    ExecutionRequest request = pythonRequest();
    request.testCases = {{"one", "one"}, {"boom", ""}, {"two", "two"}};

    ExecutionResult result = runner->execute(request);

    EXPECT_EQ(*result.output, "Passed 2/3 tests");
    const TestResult& broken = (*result.testResults)[1];
    EXPECT_FALSE(broken.passed);
    EXPECT_EQ(*broken.error, "Execution error: engine went away");
    EXPECT_EQ(result.executionTimeMs, 6);
}

TEST_F(SandboxRunnerTest, BatchRuntimeErrorRecordedPerCase) {
    backend->handler = [](const RunSpec&, const std::string&) {
        RawRunResult raw;
        raw.exitCode = 1;
        raw.errorMessage = "Process timeout";
        return raw;
    };
    auto runner = makeRunner();
    ExecutionRequest request = pythonRequest();
    request.testCases = {{"1", "1"}};

    ExecutionResult result = runner->execute(request);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(*(*result.testResults)[0].error, SandboxRunner::TIME_LIMIT_MESSAGE);
}

// ============================================================================
// Error Classification Tests
// ============================================================================

TEST(SandboxRunnerClassifyTest, FreeText) {
    EXPECT_EQ(SandboxRunner::classifyError("Container ran Out Of Memory"), SandboxRunner::MEMORY_LIMIT_MESSAGE);
    EXPECT_EQ(SandboxRunner::classifyError("Process killed"), SandboxRunner::MEMORY_LIMIT_MESSAGE);
    EXPECT_EQ(SandboxRunner::classifyError("Read TIMEOUT"), SandboxRunner::TIME_LIMIT_MESSAGE);
    EXPECT_EQ(SandboxRunner::classifyError("it timed out"), SandboxRunner::TIME_LIMIT_MESSAGE);
    EXPECT_EQ(SandboxRunner::classifyError("SyntaxError: invalid syntax"), "SyntaxError: invalid syntax");
}

TEST(SandboxRunnerClassifyTest, RawFlagsWinOverText) {
    RawRunResult oom;
    oom.oomKilled = true;
    oom.errorMessage = "timed out";
    EXPECT_EQ(SandboxRunner::classifyError(oom), SandboxRunner::MEMORY_LIMIT_MESSAGE);

    RawRunResult stderrOnly;
    stderrOnly.exitCode = 2;
    stderrOnly.stderrData = "  bad input \n";
    EXPECT_EQ(SandboxRunner::classifyError(stderrOnly), "bad input");

    RawRunResult silent;
    silent.exitCode = 3;
    EXPECT_EQ(SandboxRunner::classifyError(silent), "Process exited with code 3");
}

// ============================================================================
// Async Tests
// ============================================================================

TEST_F(SandboxRunnerTest, AsyncExecution) {
    auto runner = makeRunner(2, 8);
    ExecutionRequest request = pythonRequest();
    request.stdinData = "async";

    std::future<ExecutionResult> future = runner->executeAsync(request);
    ExecutionResult result = future.get();

    EXPECT_TRUE(result.success);
    EXPECT_EQ(*result.output, "ASYNC");
}

TEST_F(SandboxRunnerTest, AsyncQueueFull) {
    std::promise<void> release;
    std::shared_future<void> gate = release.get_future().share();
    std::promise<void> started;
    std::atomic<bool> signalled(false);
    backend->handler = [gate, &started, &signalled](const RunSpec&, const std::string&) {
        if (!signalled.exchange(true)) {
            started.set_value();
        }
        gate.wait();
        RawRunResult raw;
        raw.exitCode = 0;
        return raw;
    };
    auto runner = makeRunner(1, 1);

    auto running = runner->executeAsync(pythonRequest());
    started.get_future().wait();
    auto queued = runner->executeAsync(pythonRequest());
    auto rejected = runner->executeAsync(pythonRequest());

    std::future_status status = rejected.wait_for(0ms);
    release.set_value();

    ASSERT_EQ(status, std::future_status::ready);
    ExecutionResult rejectedResult = rejected.get();
    EXPECT_FALSE(rejectedResult.success);
    EXPECT_EQ(*rejectedResult.error, SandboxRunner::QUEUE_FULL_MESSAGE);
    EXPECT_TRUE(running.get().success);
    EXPECT_TRUE(queued.get().success);
}

TEST_F(SandboxRunnerTest, ResultJsonShape) {
    auto runner = makeRunner();
    ExecutionRequest request = pythonRequest();
    request.testCases = {{"a", "A"}};

    nlohmann::json j = runner->execute(request);
    EXPECT_EQ(j["success"], true);
    EXPECT_EQ(j["output"], "Passed 1/1 tests");
    EXPECT_TRUE(j["error"].is_null());
    EXPECT_EQ(j["test_results"][0]["test_number"], 1);
    EXPECT_EQ(j["test_results"][0]["passed"], true);
}
