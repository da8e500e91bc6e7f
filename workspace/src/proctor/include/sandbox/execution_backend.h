#ifndef PROCTOR_SANDBOX_EXECUTION_BACKEND_H
#define PROCTOR_SANDBOX_EXECUTION_BACKEND_H

#include "sandbox/execution_types.h"
#include "sandbox/limit_policy.h"
#include <string>

namespace proctor {
namespace sandbox {

/**
 * @brief Which backend implementation serves executions
 */
enum class BackendKind {
    ENGINE_API,   ///< Container engine control API over its local socket
    CLI,          ///< Container engine command-line client
    DISABLED      ///< No usable backend; executions short-circuit
};

std::string backendKindToString(BackendKind kind);

/**
 * @brief Runs one command in a fresh sandbox
 *
 * Every run gets the working directory bind-mounted read-write at /code,
 * networking disabled, and the memory, CPU and wall-clock limits of the
 * policy the backend was built with.
 *
 * Sandboxed-program failures (non-zero exit, timeout, OOM) are reported in
 * the RawRunResult. Implementations may throw std::runtime_error when the
 * backend itself misbehaves; callers convert that into a result.
 */
class ExecutionBackend {
public:
    virtual ~ExecutionBackend() = default;

    /**
     * @brief Run spec.command in spec.image
     */
    virtual RawRunResult run(const RunSpec& spec) = 0;

    /**
     * @brief Health check used once at startup
     * @return true if the backend can accept runs
     */
    virtual bool ping() = 0;

    virtual BackendKind kind() const = 0;

    virtual const LimitPolicy& policy() const = 0;
};

} // namespace sandbox
} // namespace proctor

#endif // PROCTOR_SANDBOX_EXECUTION_BACKEND_H
