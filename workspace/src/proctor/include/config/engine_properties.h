#ifndef PROCTOR_ENGINE_PROPERTIES_H
#define PROCTOR_ENGINE_PROPERTIES_H

#include "utils/properties.h"
#include <string>
#include <chrono>

namespace proctor {

/**
 * @brief Engine configuration properties
 *
 * Extends the base Properties class with the sandbox, executor and
 * anti-cheat settings, with strongly-typed accessors and defaults.
 */
class EngineProperties : public Properties {
public:
    // Property keys
    static constexpr const char* PROP_SANDBOX_TIMEOUT_SECONDS = "sandbox.timeout_seconds";
    static constexpr const char* PROP_SANDBOX_MEMORY_LIMIT = "sandbox.memory_limit";
    static constexpr const char* PROP_SANDBOX_CPU_LIMIT = "sandbox.cpu_limit";
    static constexpr const char* PROP_SANDBOX_BACKEND = "sandbox.backend";
    static constexpr const char* PROP_SANDBOX_DOCKER_HOST = "sandbox.docker_host";
    static constexpr const char* PROP_SANDBOX_DOCKER_BINARY = "sandbox.docker_binary";
    static constexpr const char* PROP_SANDBOX_WORKDIR_ROOT = "sandbox.workdir_root";
    static constexpr const char* PROP_SANDBOX_IMAGE_PREFIX = "sandbox.image.";

    static constexpr const char* PROP_EXECUTOR_WORKER_THREADS = "executor.worker_threads";
    static constexpr const char* PROP_EXECUTOR_QUEUE_CAPACITY = "executor.queue_capacity";

    static constexpr const char* PROP_ANTICHEAT_SESSION_TTL = "anticheat.session_ttl_seconds";

    static constexpr const char* PROP_LOG_LEVEL = "log.level";

    static constexpr const char* DEFAULT_DOCKER_HOST = "unix:///var/run/docker.sock";

    /**
     * @brief Default constructor with default values
     */
    EngineProperties();

    /**
     * @brief Construct from base Properties; missing keys get defaults
     */
    explicit EngineProperties(const Properties& props);

    int getTimeoutSeconds() const;
    void setTimeoutSeconds(int seconds);

    /**
     * @brief Docker-style memory ceiling, e.g. "128m"
     */
    std::string getMemoryLimit() const;
    void setMemoryLimit(const std::string& limit);

    /**
     * @brief CPU quota as a fraction of one core, e.g. 0.8
     */
    double getCpuLimit() const;
    void setCpuLimit(double cores);

    /**
     * @brief Backend strategy name: auto, engine, cli or disabled
     */
    std::string getBackendStrategy() const;
    void setBackendStrategy(const std::string& strategy);

    std::string getDockerHost() const;
    void setDockerHost(const std::string& host);

    std::string getDockerBinary() const;
    void setDockerBinary(const std::string& binary);

    /**
     * @brief Directory under which per-run working directories are created
     *
     * Empty means the system temporary directory.
     */
    std::string getWorkdirRoot() const;
    void setWorkdirRoot(const std::string& path);

    /**
     * @brief Container image override for a language ("" = built-in default)
     */
    std::string getImageOverride(const std::string& language) const;
    void setImageOverride(const std::string& language, const std::string& image);

    size_t getWorkerThreads() const;
    void setWorkerThreads(size_t threads);

    size_t getQueueCapacity() const;
    void setQueueCapacity(size_t capacity);

    std::chrono::seconds getSessionTtl() const;
    void setSessionTtl(std::chrono::seconds ttl);

    std::string getLogLevel() const;
    void setLogLevel(const std::string& level);

    /**
     * @brief Check the values that would make the engine unusable
     * @return true if timeout, CPU limit and thread count are positive and
     *         the backend strategy is known
     */
    bool validate() const;

private:
    void loadDefaults();
};

/**
 * @brief Load engine properties from a JSON configuration file
 *
 * Recognised sections: "sandbox", "executor", "anticheat", "log". A missing
 * file yields defaults with a warning; a malformed one yields defaults with
 * an error log. The DOCKER_HOST environment variable, when set, overrides
 * sandbox.docker_host.
 *
 * @param configPath Path to the JSON file
 */
EngineProperties loadEngineConfig(const std::string& configPath);

/**
 * @brief Apply the JSON document text to props (used by loadEngineConfig)
 * @throws nlohmann::json::exception on malformed text or mistyped values
 */
void applyEngineConfigJson(const std::string& jsonText, EngineProperties& props);

} // namespace proctor

#endif // PROCTOR_ENGINE_PROPERTIES_H
