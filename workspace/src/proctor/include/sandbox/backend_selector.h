#ifndef PROCTOR_SANDBOX_BACKEND_SELECTOR_H
#define PROCTOR_SANDBOX_BACKEND_SELECTOR_H

#include "sandbox/execution_backend.h"
#include "sandbox/limit_policy.h"
#include <memory>
#include <functional>
#include <string>

namespace proctor {

class EngineProperties;

namespace sandbox {

/**
 * @brief Configured way of choosing a backend (sandbox.backend)
 */
enum class BackendStrategy {
    AUTO,       ///< Engine API if it answers, else CLI if installed, else disabled
    ENGINE,     ///< Engine API only
    CLI,        ///< CLI only
    DISABLED    ///< Never execute
};

/**
 * @throws std::invalid_argument for a name other than auto, engine, cli or disabled
 */
BackendStrategy parseBackendStrategy(const std::string& name);

std::string backendStrategyToString(BackendStrategy strategy);

/**
 * @brief Immutable outcome of backend selection
 */
struct BackendSelection {
    BackendKind kind = BackendKind::DISABLED;
    std::string reason;
    std::shared_ptr<ExecutionBackend> backend;   ///< nullptr when DISABLED

    bool isEnabled() const { return kind != BackendKind::DISABLED && backend != nullptr; }
};

/**
 * @brief Chooses the execution backend once at startup
 *
 * Candidates are built through factories so the probing order can be
 * exercised without a container engine.
 */
class BackendSelector {
public:
    using BackendFactory = std::function<std::unique_ptr<ExecutionBackend>(const LimitPolicy&)>;

    /**
     * @brief Strategy, policy and endpoints taken from configuration
     * @throws std::invalid_argument for an unknown strategy or invalid limits
     */
    explicit BackendSelector(const EngineProperties& props);

    BackendSelector(BackendStrategy strategy,
                    const LimitPolicy& policy,
                    BackendFactory engineFactory,
                    BackendFactory cliFactory);

    /**
     * @brief Try candidates in strategy order
     */
    BackendSelection select() const;

    BackendStrategy strategy() const { return strategy_; }

private:
    std::shared_ptr<ExecutionBackend> tryBackend(const BackendFactory& factory, const char* label) const;

    BackendStrategy strategy_;
    LimitPolicy policy_;
    BackendFactory engineFactory_;
    BackendFactory cliFactory_;
};

} // namespace sandbox
} // namespace proctor

#endif // PROCTOR_SANDBOX_BACKEND_SELECTOR_H
