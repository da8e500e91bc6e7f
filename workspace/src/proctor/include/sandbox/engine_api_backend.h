#ifndef PROCTOR_SANDBOX_ENGINE_API_BACKEND_H
#define PROCTOR_SANDBOX_ENGINE_API_BACKEND_H

#include "sandbox/execution_backend.h"
#include "sandbox/docker_engine_client.h"
#include <nlohmann/json.hpp>
#include <string>
#include <utility>

namespace proctor {
namespace sandbox {

/**
 * @brief Primary backend: drives the container engine through its API
 *
 * Each run creates an ephemeral container (memory limit, CFS quota over a
 * 100ms period, networking disabled, working directory bound at /code),
 * starts it, waits up to the policy timeout, kills it on expiry, collects
 * the output and the OOM flag, and always removes it afterwards. A missing
 * image is pulled once, as `docker run` does.
 *
 * RawRunResult::stdoutData holds both streams interleaved in the order the
 * container wrote them; stderrData holds stderr alone for error text.
 */
class EngineApiBackend : public ExecutionBackend {
public:
    EngineApiBackend(const std::string& dockerHost, const LimitPolicy& policy);

    /**
     * @throws std::runtime_error if the engine rejects or drops an API call
     */
    RawRunResult run(const RunSpec& spec) override;

    /**
     * @brief GET /_ping
     */
    bool ping() override;

    BackendKind kind() const override { return BackendKind::ENGINE_API; }

    const LimitPolicy& policy() const override { return policy_; }

    /**
     * @brief Body of POST /containers/create for a run
     */
    static nlohmann::json buildCreateBody(const RunSpec& spec, const LimitPolicy& policy);

    /**
     * @brief Split "repo[:tag]" for POST /images/create
     *
     * A missing tag gives "latest"; a digest reference keeps the whole
     * string as the repository and an empty tag.
     */
    static std::pair<std::string, std::string> splitImageReference(const std::string& image);

private:
    void pullImage(const std::string& image);
    std::string createContainer(const RunSpec& spec);
    void removeContainer(const std::string& containerId);

    DockerEngineClient client_;
    LimitPolicy policy_;
};

} // namespace sandbox
} // namespace proctor

#endif // PROCTOR_SANDBOX_ENGINE_API_BACKEND_H
