#include "sandbox/engine_api_backend.h"
#include "sandbox/command_resolver.h"
#include "utils/string_utils.h"
#include "utils/log.h"
#include <fstream>
#include <stdexcept>
#include <chrono>
#include <functional>

namespace proctor {
namespace sandbox {

namespace {

// Deadline for control calls (create, start, logs, inspect, remove)
constexpr std::chrono::milliseconds CONTROL_TIMEOUT{30000};
constexpr std::chrono::milliseconds PING_TIMEOUT{2000};
constexpr std::chrono::milliseconds PULL_TIMEOUT{300000};

constexpr const char* STDIN_FILE_NAME = ".stdin";
constexpr const char* STDIN_SANDBOX_PATH = "/code/.stdin";

// Removes the container however run() exits
class ContainerGuard {
public:
    ContainerGuard(std::function<void(const std::string&)> remover, std::string id)
        : remover_(std::move(remover)), id_(std::move(id)) {}
    ~ContainerGuard() { remover_(id_); }
    ContainerGuard(const ContainerGuard&) = delete;
    ContainerGuard& operator=(const ContainerGuard&) = delete;

private:
    std::function<void(const std::string&)> remover_;
    std::string id_;
};

std::string exitDescription(int exitCode) {
    if (exitCode == 137) {
        return "Process killed (exit code 137)";
    }
    return "Process exited with code " + std::to_string(exitCode);
}

} // namespace

EngineApiBackend::EngineApiBackend(const std::string& dockerHost, const LimitPolicy& policy)
    : client_(dockerHost)
    , policy_(policy) {
}

bool EngineApiBackend::ping() {
    EngineResponse response = client_.request("GET", "/_ping", std::nullopt, PING_TIMEOUT);
    if (!response.ok()) {
        LOGW_FMT("Container engine ping failed on " << client_.socketPath() << ": " << response.describeFailure());
        return false;
    }
    LOGI_FMT("Container engine reachable on " << client_.socketPath());
    return true;
}

nlohmann::json EngineApiBackend::buildCreateBody(const RunSpec& spec, const LimitPolicy& policy) {
    return nlohmann::json{
        {"Image", spec.image},
        {"Cmd", spec.command},
        {"WorkingDir", SANDBOX_MOUNT_POINT},
        {"NetworkDisabled", true},
        {"AttachStdout", true},
        {"AttachStderr", true},
        {"Tty", false},
        {"HostConfig", {
            {"Binds", {spec.hostDirectory + ":" + SANDBOX_MOUNT_POINT + ":rw"}},
            {"Memory", policy.memoryBytes()},
            {"MemorySwap", policy.memoryBytes()},
            {"CpuQuota", policy.cpuQuotaMicros()},
            {"CpuPeriod", policy.cpuPeriodMicros()},
            {"NetworkMode", "none"},
            {"AutoRemove", false}
        }}
    };
}

std::pair<std::string, std::string> EngineApiBackend::splitImageReference(const std::string& image) {
    if (image.find('@') != std::string::npos) {
        return {image, ""};
    }
    const size_t colon = image.rfind(':');
    const size_t slash = image.rfind('/');
    if (colon == std::string::npos || (slash != std::string::npos && colon < slash)) {
        return {image, "latest"};
    }
    return {image.substr(0, colon), image.substr(colon + 1)};
}

void EngineApiBackend::pullImage(const std::string& image) {
    const auto reference = splitImageReference(image);
    std::string path = "/images/create?fromImage=" + reference.first;
    if (!reference.second.empty()) {
        path += "&tag=" + reference.second;
    }

    LOGI_FMT("Pulling image " << image);
    EngineResponse response = client_.request("POST", path, std::nullopt, PULL_TIMEOUT);
    if (!response.ok()) {
        throw std::runtime_error("Image not available: " + image + " (" + response.describeFailure() + ")");
    }

    // Pull failures arrive as a progress line carrying "error"
    for (const std::string& line : utils::splitLines(response.body)) {
        auto progress = nlohmann::json::parse(line, nullptr, false);
        if (progress.is_object() && progress.contains("error")) {
            throw std::runtime_error("Image not available: " + image + " (" +
                                     progress["error"].dump() + ")");
        }
    }
}

std::string EngineApiBackend::createContainer(const RunSpec& spec) {
    const std::string body = buildCreateBody(spec, policy_).dump();
    EngineResponse response = client_.request("POST", "/containers/create", body, CONTROL_TIMEOUT);
    if (response.status == EngineCallStatus::OK && response.httpStatus == 404) {
        pullImage(spec.image);
        response = client_.request("POST", "/containers/create", body, CONTROL_TIMEOUT);
    }
    if (!response.ok()) {
        throw std::runtime_error("Failed to create container: " + response.describeFailure());
    }

    auto parsed = nlohmann::json::parse(response.body, nullptr, false);
    if (!parsed.is_object() || !parsed.contains("Id") || !parsed["Id"].is_string()) {
        throw std::runtime_error("Container engine returned no container id");
    }
    return parsed["Id"].get<std::string>();
}

void EngineApiBackend::removeContainer(const std::string& containerId) {
    EngineResponse response = client_.request(
        "DELETE", "/containers/" + containerId + "?force=true&v=true", std::nullopt, CONTROL_TIMEOUT);
    if (!response.ok() && response.httpStatus != 404) {
        LOGW_FMT("Failed to remove container " << containerId.substr(0, 12) << ": " << response.describeFailure());
    }
}

RawRunResult EngineApiBackend::run(const RunSpec& spec) {
    RunSpec effective = spec;
    if (spec.stdinData) {
        const std::string stdinPath = spec.hostDirectory + "/" + STDIN_FILE_NAME;
        std::ofstream stdinFile(stdinPath, std::ios::binary | std::ios::trunc);
        if (!stdinFile) {
            throw std::runtime_error("Cannot stage stdin at " + stdinPath);
        }
        stdinFile << *spec.stdinData;
        stdinFile.close();
        effective.command = CommandResolver::wrapCommandWithInput(spec.command, STDIN_SANDBOX_PATH);
    }

    const std::string containerId = createContainer(effective);
    const std::string shortId = containerId.substr(0, 12);
    ContainerGuard guard([this](const std::string& id) { removeContainer(id); }, containerId);
    LOGD_FMT("Created container " << shortId << " from " << effective.image);

    RawRunResult result;
    const auto startTime = std::chrono::steady_clock::now();

    EngineResponse started = client_.request(
        "POST", "/containers/" + containerId + "/start", std::nullopt, CONTROL_TIMEOUT);
    if (!started.ok()) {
        throw std::runtime_error("Failed to start container: " + started.describeFailure());
    }

    const auto waitTimeout = std::chrono::duration_cast<std::chrono::milliseconds>(policy_.timeout());
    EngineResponse waited = client_.request(
        "POST", "/containers/" + containerId + "/wait", std::nullopt, waitTimeout);

    if (waited.status == EngineCallStatus::TIMEOUT) {
        result.timedOut = true;
        LOGW_FMT("Container " << shortId << " exceeded " << policy_.timeout().count() << "s, killing");
        EngineResponse killed = client_.request(
            "POST", "/containers/" + containerId + "/kill", std::nullopt, CONTROL_TIMEOUT);
        if (!killed.ok()) {
            LOGW_FMT("Kill of container " << shortId << " failed: " << killed.describeFailure());
        }
    } else if (!waited.ok()) {
        throw std::runtime_error("Failed waiting for container: " + waited.describeFailure());
    } else {
        auto status = nlohmann::json::parse(waited.body, nullptr, false);
        if (status.is_object() && status.contains("StatusCode") && status["StatusCode"].is_number_integer()) {
            result.exitCode = status["StatusCode"].get<int>();
        }
    }

    result.durationMs = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - startTime).count();

    EngineResponse logs = client_.request(
        "GET", "/containers/" + containerId + "/logs?stdout=1&stderr=1", std::nullopt, CONTROL_TIMEOUT);
    if (logs.ok()) {
        DemultiplexedLogs streams = DockerEngineClient::demultiplexLogs(logs.body);
        result.stdoutData = std::move(streams.combinedData);
        result.stderrData = std::move(streams.stderrData);
    } else {
        LOGW_FMT("Could not read logs of container " << shortId << ": " << logs.describeFailure());
    }

    EngineResponse inspected = client_.request(
        "GET", "/containers/" + containerId + "/json", std::nullopt, CONTROL_TIMEOUT);
    if (inspected.ok()) {
        auto info = nlohmann::json::parse(inspected.body, nullptr, false);
        if (info.is_object() && info.contains("State") && info["State"].is_object()) {
            const auto& state = info["State"];
            result.oomKilled = state.value("OOMKilled", false);
            if (result.timedOut) {
                result.exitCode = state.value("ExitCode", result.exitCode);
            }
        }
    }

    if (result.timedOut) {
        result.errorMessage = "Execution timed out after " + std::to_string(policy_.timeout().count()) + "s";
    } else if (result.oomKilled) {
        result.errorMessage = "Container killed: out of memory";
    } else if (result.exitCode != 0) {
        std::string stderrText = utils::trim(result.stderrData);
        result.errorMessage = stderrText.empty() ? exitDescription(result.exitCode) : stderrText;
    }

    LOGD_FMT("Container " << shortId << " finished: exit=" << result.exitCode << ", timed_out="
             << result.timedOut << ", oom=" << result.oomKilled << ", " << result.durationMs << "ms");
    return result;
}

} // namespace sandbox
} // namespace proctor
