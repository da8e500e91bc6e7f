#include "config/engine_properties.h"
#include "sandbox/limit_policy.h"
#include "utils/log.h"
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>
#include <cstdlib>

namespace proctor {

EngineProperties::EngineProperties() : Properties() {
    loadDefaults();
}

EngineProperties::EngineProperties(const Properties& props) : Properties() {
    loadDefaults();
    merge(props);
}

void EngineProperties::loadDefaults() {
    set(PROP_SANDBOX_TIMEOUT_SECONDS, 10);
    set(PROP_SANDBOX_MEMORY_LIMIT, std::string("128m"));
    set(PROP_SANDBOX_CPU_LIMIT, 0.8);
    set(PROP_SANDBOX_BACKEND, std::string("auto"));
    set(PROP_SANDBOX_DOCKER_HOST, std::string(DEFAULT_DOCKER_HOST));
    set(PROP_SANDBOX_DOCKER_BINARY, std::string("docker"));
    set(PROP_SANDBOX_WORKDIR_ROOT, std::string(""));
    set(PROP_EXECUTOR_WORKER_THREADS, 4);
    set(PROP_EXECUTOR_QUEUE_CAPACITY, 64);
    set(PROP_ANTICHEAT_SESSION_TTL, 86400);
    set(PROP_LOG_LEVEL, std::string("INFO"));
}

int EngineProperties::getTimeoutSeconds() const {
    return getInt(PROP_SANDBOX_TIMEOUT_SECONDS, 10);
}

void EngineProperties::setTimeoutSeconds(int seconds) {
    set(PROP_SANDBOX_TIMEOUT_SECONDS, seconds);
}

std::string EngineProperties::getMemoryLimit() const {
    return getString(PROP_SANDBOX_MEMORY_LIMIT, "128m");
}

void EngineProperties::setMemoryLimit(const std::string& limit) {
    set(PROP_SANDBOX_MEMORY_LIMIT, limit);
}

double EngineProperties::getCpuLimit() const {
    return getDouble(PROP_SANDBOX_CPU_LIMIT, 0.8);
}

void EngineProperties::setCpuLimit(double cores) {
    set(PROP_SANDBOX_CPU_LIMIT, cores);
}

std::string EngineProperties::getBackendStrategy() const {
    return getString(PROP_SANDBOX_BACKEND, "auto");
}

void EngineProperties::setBackendStrategy(const std::string& strategy) {
    set(PROP_SANDBOX_BACKEND, strategy);
}

std::string EngineProperties::getDockerHost() const {
    return getString(PROP_SANDBOX_DOCKER_HOST, DEFAULT_DOCKER_HOST);
}

void EngineProperties::setDockerHost(const std::string& host) {
    set(PROP_SANDBOX_DOCKER_HOST, host);
}

std::string EngineProperties::getDockerBinary() const {
    return getString(PROP_SANDBOX_DOCKER_BINARY, "docker");
}

void EngineProperties::setDockerBinary(const std::string& binary) {
    set(PROP_SANDBOX_DOCKER_BINARY, binary);
}

std::string EngineProperties::getWorkdirRoot() const {
    return getString(PROP_SANDBOX_WORKDIR_ROOT, "");
}

void EngineProperties::setWorkdirRoot(const std::string& path) {
    set(PROP_SANDBOX_WORKDIR_ROOT, path);
}

std::string EngineProperties::getImageOverride(const std::string& language) const {
    return getString(std::string(PROP_SANDBOX_IMAGE_PREFIX) + language, "");
}

void EngineProperties::setImageOverride(const std::string& language, const std::string& image) {
    set(std::string(PROP_SANDBOX_IMAGE_PREFIX) + language, image);
}

size_t EngineProperties::getWorkerThreads() const {
    int threads = getInt(PROP_EXECUTOR_WORKER_THREADS, 4);
    return threads > 0 ? static_cast<size_t>(threads) : 0;
}

void EngineProperties::setWorkerThreads(size_t threads) {
    set(PROP_EXECUTOR_WORKER_THREADS, static_cast<int>(threads));
}

size_t EngineProperties::getQueueCapacity() const {
    int capacity = getInt(PROP_EXECUTOR_QUEUE_CAPACITY, 64);
    return capacity > 0 ? static_cast<size_t>(capacity) : 0;
}

void EngineProperties::setQueueCapacity(size_t capacity) {
    set(PROP_EXECUTOR_QUEUE_CAPACITY, static_cast<int>(capacity));
}

std::chrono::seconds EngineProperties::getSessionTtl() const {
    return std::chrono::seconds(getInt(PROP_ANTICHEAT_SESSION_TTL, 86400));
}

void EngineProperties::setSessionTtl(std::chrono::seconds ttl) {
    set(PROP_ANTICHEAT_SESSION_TTL, static_cast<int>(ttl.count()));
}

std::string EngineProperties::getLogLevel() const {
    return getString(PROP_LOG_LEVEL, "INFO");
}

void EngineProperties::setLogLevel(const std::string& level) {
    set(PROP_LOG_LEVEL, level);
}

bool EngineProperties::validate() const {
    if (getTimeoutSeconds() <= 0) {
        return false;
    }

    if (getCpuLimit() <= 0.0) {
        return false;
    }

    try {
        sandbox::LimitPolicy::parseMemoryLimit(getMemoryLimit());
    } catch (const std::invalid_argument& e) {
        LOGE_FMT("Invalid " << PROP_SANDBOX_MEMORY_LIMIT << ": " << e.what());
        return false;
    }

    if (getWorkerThreads() == 0) {
        return false;
    }

    const std::string strategy = getBackendStrategy();
    return strategy == "auto" || strategy == "engine" ||
           strategy == "cli" || strategy == "disabled";
}

void applyEngineConfigJson(const std::string& jsonText, EngineProperties& props) {
    nlohmann::json config = nlohmann::json::parse(jsonText);

    if (config.contains("sandbox")) {
        auto& sandbox = config["sandbox"];
        if (sandbox.contains("timeout_seconds")) props.setTimeoutSeconds(sandbox["timeout_seconds"].get<int>());
        if (sandbox.contains("memory_limit")) props.setMemoryLimit(sandbox["memory_limit"].get<std::string>());
        if (sandbox.contains("cpu_limit")) {
            // accepted both as a number and as a quoted docker-style value
            auto& cpu = sandbox["cpu_limit"];
            if (cpu.is_string()) {
                props.set(EngineProperties::PROP_SANDBOX_CPU_LIMIT, cpu.get<std::string>());
            } else {
                props.setCpuLimit(cpu.get<double>());
            }
        }
        if (sandbox.contains("backend")) props.setBackendStrategy(sandbox["backend"].get<std::string>());
        if (sandbox.contains("docker_host")) props.setDockerHost(sandbox["docker_host"].get<std::string>());
        if (sandbox.contains("docker_binary")) props.setDockerBinary(sandbox["docker_binary"].get<std::string>());
        if (sandbox.contains("workdir_root")) props.setWorkdirRoot(sandbox["workdir_root"].get<std::string>());
        if (sandbox.contains("images")) {
            for (auto& [language, image] : sandbox["images"].items()) {
                props.setImageOverride(language, image.get<std::string>());
            }
        }
    }

    if (config.contains("executor")) {
        auto& executor = config["executor"];
        if (executor.contains("worker_threads")) props.setWorkerThreads(executor["worker_threads"].get<size_t>());
        if (executor.contains("queue_capacity")) props.setQueueCapacity(executor["queue_capacity"].get<size_t>());
    }

    if (config.contains("anticheat")) {
        auto& anticheat = config["anticheat"];
        if (anticheat.contains("session_ttl_seconds")) {
            props.setSessionTtl(std::chrono::seconds(anticheat["session_ttl_seconds"].get<int>()));
        }
    }

    if (config.contains("log")) {
        auto& log = config["log"];
        if (log.contains("level")) props.setLogLevel(log["level"].get<std::string>());
    }
}

EngineProperties loadEngineConfig(const std::string& configPath) {
    EngineProperties props;

    std::ifstream configFile(configPath);
    if (!configFile.is_open()) {
        LOGW_FMT("Configuration file not found: " << configPath << ", using defaults");
    } else {
        std::stringstream buffer;
        buffer << configFile.rdbuf();

        EngineProperties loaded;
        try {
            applyEngineConfigJson(buffer.str(), loaded);
            props = loaded;
            LOGI_FMT("Loaded configuration from " << configPath);
        } catch (const nlohmann::json::exception& e) {
            LOGE_FMT("Invalid configuration file " << configPath << ": " << e.what() << ", using defaults");
        }
    }

    const char* dockerHost = std::getenv("DOCKER_HOST");
    if (dockerHost != nullptr && dockerHost[0] != '\0') {
        LOGD_FMT("DOCKER_HOST overrides configured docker host: " << dockerHost);
        props.setDockerHost(dockerHost);
    }

    return props;
}

} // namespace proctor
