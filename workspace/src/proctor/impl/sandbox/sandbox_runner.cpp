#include "sandbox/sandbox_runner.h"
#include "config/engine_properties.h"
#include "utils/string_utils.h"
#include "utils/log.h"
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <cstdlib>
#include <cstring>
#include <errno.h>

namespace fs = std::filesystem;

namespace proctor {
namespace sandbox {

namespace {

// Private per-request directory, removed on destruction
class WorkDirectory {
public:
    explicit WorkDirectory(const std::string& root) {
        fs::path parent = root.empty() ? fs::temp_directory_path() : fs::path(root);
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec) {
            throw std::runtime_error("Cannot create work root " + parent.string() + ": " + ec.message());
        }

        std::string pattern = (parent / "proctor-XXXXXX").string();
        if (mkdtemp(&pattern[0]) == nullptr) {
            throw std::runtime_error("mkdtemp(" + pattern + ") failed: " + strerror(errno));
        }
        path_ = pattern;
    }

    ~WorkDirectory() {
        std::error_code ec;
        fs::remove_all(path_, ec);
        if (ec) {
            LOGW_FMT("Failed to remove work directory " << path_ << ": " << ec.message());
        }
    }

    WorkDirectory(const WorkDirectory&) = delete;
    WorkDirectory& operator=(const WorkDirectory&) = delete;

    void writeFile(const std::string& name, const std::string& content) const {
        const fs::path target = path_ / name;
        std::ofstream out(target, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw std::runtime_error("Cannot write " + target.string());
        }
        out << content;
        out.close();
        if (!out) {
            throw std::runtime_error("Short write to " + target.string());
        }
    }

    std::string path() const { return path_.string(); }

private:
    fs::path path_;
};

ExecutionResult failureResult(const std::string& error) {
    ExecutionResult result;
    result.success = false;
    result.error = error;
    return result;
}

bool runSucceeded(const RawRunResult& raw) {
    return raw.exitCode == 0 && !raw.timedOut && !raw.oomKilled;
}

} // namespace

SandboxRunner::SandboxRunner(BackendSelection selection,
                             CommandResolver resolver,
                             std::string workdirRoot,
                             size_t workerThreads,
                             size_t queueCapacity)
    : selection_(std::move(selection))
    , resolver_(std::move(resolver))
    , workdirRoot_(std::move(workdirRoot))
    , pool_(std::make_unique<utils::WorkerPool>(workerThreads, queueCapacity)) {
    LOGI_FMT("SandboxRunner ready: backend=" << backendKindToString(selection_.kind)
             << ", workers=" << workerThreads << ", queue=" << queueCapacity);
}

SandboxRunner::SandboxRunner(BackendSelection selection, CommandResolver resolver, const EngineProperties& props)
    : SandboxRunner(std::move(selection), std::move(resolver), props.getWorkdirRoot(),
                    props.getWorkerThreads(), props.getQueueCapacity()) {
}

SandboxRunner::~SandboxRunner() {
    pool_->shutdown();
    pool_->wait();
}

ExecutionResult SandboxRunner::disabledResult() {
    ExecutionResult result = failureResult(DISABLED_MESSAGE);
    result.executionTimeMs = 0;
    return result;
}

std::string SandboxRunner::classifyError(const std::string& message) {
    if (utils::containsIgnoreCase(message, "out of memory") || utils::containsIgnoreCase(message, "killed")) {
        return MEMORY_LIMIT_MESSAGE;
    }
    if (utils::containsIgnoreCase(message, "timeout") || utils::containsIgnoreCase(message, "timed out")) {
        return TIME_LIMIT_MESSAGE;
    }
    return message;
}

std::string SandboxRunner::classifyError(const RawRunResult& raw) {
    if (raw.oomKilled) {
        return MEMORY_LIMIT_MESSAGE;
    }
    if (raw.timedOut) {
        return TIME_LIMIT_MESSAGE;
    }

    std::string message = raw.errorMessage;
    if (message.empty()) {
        message = utils::trim(raw.stderrData);
    }
    if (message.empty()) {
        message = "Process exited with code " + std::to_string(raw.exitCode);
    }
    return classifyError(message);
}

ExecutionResult SandboxRunner::execute(const ExecutionRequest& request) {
    if (!isEnabled()) {
        return disabledResult();
    }

    try {
        const LanguageProfile& profile = resolver_.resolve(request.language);
        if (request.testCases.empty()) {
            return runSingle(request, profile);
        }
        return runBatch(request, profile);
    } catch (const std::exception& e) {
        LOGE_FMT("Execution failed: " << e.what());
        return failureResult(std::string("Execution error: ") + e.what());
    }
}

std::future<ExecutionResult> SandboxRunner::executeAsync(ExecutionRequest request) {
    auto future = pool_->trySubmit([this, request = std::move(request)]() {
        return execute(request);
    });
    if (future) {
        return std::move(*future);
    }

    LOGW_FMT("Execution rejected: " << pool_->getPendingTaskCount() << " requests already queued");
    std::promise<ExecutionResult> rejected;
    rejected.set_value(failureResult(QUEUE_FULL_MESSAGE));
    return rejected.get_future();
}

ExecutionResult SandboxRunner::runSingle(const ExecutionRequest& request, const LanguageProfile& profile) {
    WorkDirectory workDir(workdirRoot_);
    workDir.writeFile(resolver_.sourceFileName(request.language), request.code);

    RunSpec spec;
    spec.image = profile.image;
    spec.command = profile.command;
    spec.hostDirectory = workDir.path();

    if (request.stdinData) {
        workDir.writeFile(INPUT_FILE_NAME, *request.stdinData);
        spec.command = CommandResolver::wrapCommandWithInput(profile.command);
    }

    RawRunResult raw = selection_.backend->run(spec);

    ExecutionResult result;
    result.success = runSucceeded(raw);
    result.output = utils::trim(raw.stdoutData);
    if (!result.success) {
        result.error = classifyError(raw);
    }
    result.executionTimeMs = raw.durationMs;

    LOGD_FMT("Single " << languageToString(request.language) << " run: success=" << result.success
             << ", " << result.executionTimeMs << "ms");
    return result;
}

ExecutionResult SandboxRunner::runBatch(const ExecutionRequest& request, const LanguageProfile& profile) {
    WorkDirectory workDir(workdirRoot_);
    workDir.writeFile(resolver_.sourceFileName(request.language), request.code);

    RunSpec spec;
    spec.image = profile.image;
    spec.command = CommandResolver::wrapCommandWithInput(profile.command);
    spec.hostDirectory = workDir.path();

    std::vector<TestResult> testResults;
    testResults.reserve(request.testCases.size());
    int64_t totalTimeMs = 0;
    size_t passedCount = 0;

    for (size_t i = 0; i < request.testCases.size(); ++i) {
        const TestCase& testCase = request.testCases[i];

        TestResult testResult;
        testResult.testNumber = static_cast<int>(i + 1);
        testResult.input = testCase.input;
        testResult.expected = utils::trim(testCase.expectedOutput);

        // One case failing at the backend level does not stop the batch
        bool ran = false;
        try {
            workDir.writeFile(INPUT_FILE_NAME, testCase.input);
            RawRunResult raw = selection_.backend->run(spec);
            testResult.actual = utils::trim(raw.stdoutData);
            testResult.executionTimeMs = raw.durationMs;
            ran = true;
            if (!runSucceeded(raw)) {
                testResult.error = classifyError(raw);
            }
        } catch (const std::exception& e) {
            LOGW_FMT("Test case " << testResult.testNumber << " failed to run: " << e.what());
            testResult.error = std::string("Execution error: ") + e.what();
        }

        testResult.passed = ran && testResult.actual == testResult.expected;
        if (testResult.passed) {
            ++passedCount;
        }
        totalTimeMs += testResult.executionTimeMs;
        testResults.push_back(std::move(testResult));
    }

    ExecutionResult result;
    result.success = passedCount == testResults.size();
    result.output = "Passed " + std::to_string(passedCount) + "/" + std::to_string(testResults.size()) + " tests";
    if (!result.success) {
        result.error = TESTS_FAILED_MESSAGE;
    }
    result.executionTimeMs = totalTimeMs;
    result.testResults = std::move(testResults);

    LOGI_FMT("Batch " << languageToString(request.language) << " run: " << *result.output
             << " in " << totalTimeMs << "ms");
    return result;
}

} // namespace sandbox
} // namespace proctor
