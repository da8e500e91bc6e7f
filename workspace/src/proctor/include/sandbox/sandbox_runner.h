#ifndef PROCTOR_SANDBOX_SANDBOX_RUNNER_H
#define PROCTOR_SANDBOX_SANDBOX_RUNNER_H

#include "sandbox/backend_selector.h"
#include "sandbox/command_resolver.h"
#include "sandbox/execution_types.h"
#include "utils/worker_pool.h"
#include <future>
#include <memory>
#include <string>

namespace proctor {

class EngineProperties;

namespace sandbox {

/**
 * @brief Executes submissions in the selected sandbox backend
 *
 * Each request gets a private working directory holding the source file
 * (and input.txt for piped input), removed when the request finishes.
 * Test cases run strictly one after another. execute() never throws:
 * sandbox failures, backend failures and a disabled backend all come back
 * as an ExecutionResult.
 *
 * Example Usage:
 * @code
 * BackendSelection selection = BackendSelector(props).select();
 * SandboxRunner runner(selection, CommandResolver(props), props);
 *
 * ExecutionRequest request;
 * request.code = "print(input())";
 * request.language = Language::PYTHON;
 * request.testCases = {{"hello", "hello"}};
 * ExecutionResult result = runner.execute(request);   // output "Passed 1/1 tests"
 * @endcode
 */
class SandboxRunner {
public:
    static constexpr const char* DISABLED_MESSAGE =
        "Code execution service is disabled because Docker is unavailable in this environment.";
    static constexpr const char* QUEUE_FULL_MESSAGE = "Execution queue is full";
    static constexpr const char* TESTS_FAILED_MESSAGE = "Some tests failed";
    static constexpr const char* MEMORY_LIMIT_MESSAGE = "Memory limit exceeded";
    static constexpr const char* TIME_LIMIT_MESSAGE = "Time limit exceeded";

    /**
     * @param selection Backend chosen at startup
     * @param resolver Language table
     * @param workdirRoot Parent of per-request directories ("" = system temp dir)
     * @param workerThreads Threads serving executeAsync()
     * @param queueCapacity Maximum queued async requests
     * @throws std::invalid_argument if workerThreads is 0
     */
    SandboxRunner(BackendSelection selection,
                  CommandResolver resolver,
                  std::string workdirRoot,
                  size_t workerThreads,
                  size_t queueCapacity);

    /**
     * @brief Working directory root and pool sizes taken from configuration
     */
    SandboxRunner(BackendSelection selection, CommandResolver resolver, const EngineProperties& props);

    /**
     * @brief Waits for queued async requests to finish
     */
    ~SandboxRunner();

    SandboxRunner(const SandboxRunner&) = delete;
    SandboxRunner& operator=(const SandboxRunner&) = delete;

    /**
     * @brief Run a request synchronously
     */
    ExecutionResult execute(const ExecutionRequest& request);

    /**
     * @brief Run a request on the worker pool
     *
     * When the backlog is full the returned future is already satisfied
     * with a QUEUE_FULL_MESSAGE result.
     */
    std::future<ExecutionResult> executeAsync(ExecutionRequest request);

    bool isEnabled() const { return selection_.isEnabled(); }

    const BackendSelection& selection() const { return selection_; }

    /**
     * @brief Map a free-text failure to its user-facing form
     *
     * Case-insensitive: "out of memory" or "killed" gives MEMORY_LIMIT_MESSAGE,
     * "timeout" or "timed out" gives TIME_LIMIT_MESSAGE, anything else is
     * returned unchanged.
     */
    static std::string classifyError(const std::string& message);

    /**
     * @brief Error text of a failed run
     *
     * The OOM and timeout flags win over the text; otherwise the backend
     * message (or stderr) goes through classifyError(const std::string&).
     */
    static std::string classifyError(const RawRunResult& raw);

    /**
     * @brief The fixed result returned while no backend is available
     */
    static ExecutionResult disabledResult();

private:
    ExecutionResult runSingle(const ExecutionRequest& request, const LanguageProfile& profile);
    ExecutionResult runBatch(const ExecutionRequest& request, const LanguageProfile& profile);

    BackendSelection selection_;
    CommandResolver resolver_;
    std::string workdirRoot_;
    std::unique_ptr<utils::WorkerPool> pool_;
};

} // namespace sandbox
} // namespace proctor

#endif // PROCTOR_SANDBOX_SANDBOX_RUNNER_H
