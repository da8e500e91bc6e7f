#include "sandbox/backend_selector.h"
#include "sandbox/engine_api_backend.h"
#include "sandbox/cli_backend.h"
#include "config/engine_properties.h"
#include "utils/string_utils.h"
#include "utils/log.h"
#include <stdexcept>

namespace proctor {
namespace sandbox {

std::string backendKindToString(BackendKind kind) {
    switch (kind) {
        case BackendKind::ENGINE_API: return "engine";
        case BackendKind::CLI: return "cli";
        case BackendKind::DISABLED: return "disabled";
        default: return "unknown";
    }
}

BackendStrategy parseBackendStrategy(const std::string& name) {
    const std::string lower = utils::toLower(utils::trim(name));
    if (lower == "auto") return BackendStrategy::AUTO;
    if (lower == "engine") return BackendStrategy::ENGINE;
    if (lower == "cli") return BackendStrategy::CLI;
    if (lower == "disabled") return BackendStrategy::DISABLED;
    throw std::invalid_argument("Unknown sandbox backend strategy: " + name);
}

std::string backendStrategyToString(BackendStrategy strategy) {
    switch (strategy) {
        case BackendStrategy::AUTO: return "auto";
        case BackendStrategy::ENGINE: return "engine";
        case BackendStrategy::CLI: return "cli";
        case BackendStrategy::DISABLED: return "disabled";
        default: return "unknown";
    }
}

BackendSelector::BackendSelector(const EngineProperties& props)
    : strategy_(parseBackendStrategy(props.getBackendStrategy()))
    , policy_(LimitPolicy::fromProperties(props)) {
    const std::string dockerHost = props.getDockerHost();
    const std::string dockerBinary = props.getDockerBinary();

    engineFactory_ = [dockerHost](const LimitPolicy& policy) -> std::unique_ptr<ExecutionBackend> {
        return std::make_unique<EngineApiBackend>(dockerHost, policy);
    };
    cliFactory_ = [dockerBinary](const LimitPolicy& policy) -> std::unique_ptr<ExecutionBackend> {
        return std::make_unique<CliBackend>(dockerBinary, policy);
    };
}

BackendSelector::BackendSelector(BackendStrategy strategy,
                                 const LimitPolicy& policy,
                                 BackendFactory engineFactory,
                                 BackendFactory cliFactory)
    : strategy_(strategy)
    , policy_(policy)
    , engineFactory_(std::move(engineFactory))
    , cliFactory_(std::move(cliFactory)) {
}

std::shared_ptr<ExecutionBackend> BackendSelector::tryBackend(const BackendFactory& factory, const char* label) const {
    if (!factory) {
        return nullptr;
    }
    std::shared_ptr<ExecutionBackend> candidate = factory(policy_);
    if (candidate && candidate->ping()) {
        return candidate;
    }
    LOGD_FMT("Backend candidate '" << label << "' did not respond");
    return nullptr;
}

BackendSelection BackendSelector::select() const {
    BackendSelection selection;

    switch (strategy_) {
        case BackendStrategy::DISABLED:
            selection.reason = "Code execution disabled by configuration";
            break;

        case BackendStrategy::ENGINE:
            selection.backend = tryBackend(engineFactory_, "engine");
            selection.reason = selection.backend ? "Container engine API reachable"
                                                 : "Container engine API unreachable";
            break;

        case BackendStrategy::CLI:
            selection.backend = tryBackend(cliFactory_, "cli");
            selection.reason = selection.backend ? "Container CLI found"
                                                 : "Container CLI not found";
            break;

        case BackendStrategy::AUTO:
            selection.backend = tryBackend(engineFactory_, "engine");
            if (selection.backend) {
                selection.reason = "Container engine API reachable";
                break;
            }
            selection.backend = tryBackend(cliFactory_, "cli");
            selection.reason = selection.backend
                ? "Container engine API unreachable; falling back to the container CLI"
                : "Neither the container engine API nor the container CLI is available";
            break;
    }

    if (selection.backend) {
        selection.kind = selection.backend->kind();
        LOGI_FMT("Sandbox backend: " << backendKindToString(selection.kind) << " (" << selection.reason << ")");
    } else {
        selection.kind = BackendKind::DISABLED;
        LOGW_FMT("Sandbox backend disabled (" << selection.reason << ")");
    }
    return selection;
}

} // namespace sandbox
} // namespace proctor
