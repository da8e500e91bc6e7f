#ifndef PROCTOR_SANDBOX_CLI_BACKEND_H
#define PROCTOR_SANDBOX_CLI_BACKEND_H

#include "sandbox/execution_backend.h"
#include <string>
#include <vector>
#include <optional>
#include <chrono>

namespace proctor {
namespace sandbox {

/**
 * @brief Outcome of one supervised child process
 */
struct ProcessOutcome {
    std::string stdoutData;
    std::string stderrData;
    int exitCode = -1;          ///< 128 + signal when killed by a signal
    bool timedOut = false;
    std::string spawnError;     ///< Non-empty if the process never ran
};

/**
 * @brief Run argv as a child process under a wall-clock deadline
 *
 * stdin is fed from stdinData (or closed immediately); stdout and stderr
 * are captured in full. On expiry the child gets SIGKILL and is reaped.
 * SIGPIPE must be ignored by the process if the child may exit before
 * consuming its input.
 */
ProcessOutcome runSupervisedProcess(const std::vector<std::string>& argv,
                                    const std::optional<std::string>& stdinData,
                                    std::chrono::milliseconds timeout);

/**
 * @brief Fallback backend: drives the container engine's command-line client
 *
 * Each run is "docker run --rm" with a generated container name so the
 * container can be force-removed if the client has to be killed.
 */
class CliBackend : public ExecutionBackend {
public:
    /**
     * @param dockerBinary Client executable name or path
     */
    CliBackend(const std::string& dockerBinary, const LimitPolicy& policy);

    RawRunResult run(const RunSpec& spec) override;

    /**
     * @brief Same as isAvailable()
     */
    bool ping() override;

    BackendKind kind() const override { return BackendKind::CLI; }

    const LimitPolicy& policy() const override { return policy_; }

    /**
     * @brief Whether the client binary can be found
     */
    bool isAvailable() const;

    /**
     * @brief Full client argv for a run, binary first
     */
    std::vector<std::string> buildRunArguments(const RunSpec& spec, const std::string& containerName) const;

    /**
     * @brief Resolve name against PATH (names containing '/' are checked as is)
     * @return Absolute or given path of an executable file, or std::nullopt
     */
    static std::optional<std::string> findExecutable(const std::string& name);

private:
    void forceRemove(const std::string& containerName) const;

    std::string dockerBinary_;
    LimitPolicy policy_;
};

} // namespace sandbox
} // namespace proctor

#endif // PROCTOR_SANDBOX_CLI_BACKEND_H
