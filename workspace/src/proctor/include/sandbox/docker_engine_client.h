#ifndef PROCTOR_SANDBOX_DOCKER_ENGINE_CLIENT_H
#define PROCTOR_SANDBOX_DOCKER_ENGINE_CLIENT_H

#include <string>
#include <map>
#include <chrono>
#include <optional>

namespace proctor {
namespace sandbox {

/**
 * @brief Transport-level outcome of one engine API call
 */
enum class EngineCallStatus {
    OK,                 ///< A complete HTTP response was received
    CONNECT_FAILED,     ///< Socket could not be opened or connected
    TIMEOUT,            ///< No complete response before the deadline
    IO_ERROR,           ///< send/recv failed mid-request
    PROTOCOL_ERROR      ///< Response was not valid HTTP/1.x
};

std::string engineCallStatusToString(EngineCallStatus status);

/**
 * @brief Result of one engine API call
 */
struct EngineResponse {
    EngineCallStatus status = EngineCallStatus::IO_ERROR;
    int httpStatus = 0;
    std::map<std::string, std::string> headers;   ///< Lower-cased names
    std::string body;
    std::string message;                          ///< Transport error detail

    bool ok() const {
        return status == EngineCallStatus::OK && httpStatus >= 200 && httpStatus < 300;
    }

    /**
     * @brief Human-readable failure text (engine "message" field if present)
     */
    std::string describeFailure() const;
};

/**
 * @brief Output of a container split into its two streams
 */
struct DemultiplexedLogs {
    std::string stdoutData;
    std::string stderrData;
    std::string combinedData;   ///< Both streams in the order the frames arrived
};

/**
 * @brief Minimal HTTP/1.1 client for the container engine control socket
 *
 * One connection per request ("Connection: close"); the response is read
 * until EOF under a deadline. Only unix-socket endpoints are supported.
 */
class DockerEngineClient {
public:
    /**
     * @param dockerHost DOCKER_HOST-style endpoint; see normalizeDockerHost()
     */
    explicit DockerEngineClient(const std::string& dockerHost);

    /**
     * @brief Issue one request
     *
     * @param method HTTP method
     * @param path Request target, e.g. "/containers/create"
     * @param jsonBody Body sent as application/json when present
     * @param timeout Deadline for the whole exchange
     */
    EngineResponse request(const std::string& method,
                           const std::string& path,
                           const std::optional<std::string>& jsonBody,
                           std::chrono::milliseconds timeout) const;

    const std::string& socketPath() const { return socketPath_; }

    /**
     * @brief Map a DOCKER_HOST value to a unix socket path
     *
     * "unix:///run/docker.sock" and "unix://run/docker.sock" both give
     * "/run/docker.sock"; a bare absolute path is used as is. Schemes this
     * client cannot speak (tcp, http, https, npipe, http+docker) fall back
     * to /var/run/docker.sock.
     */
    static std::string normalizeDockerHost(const std::string& dockerHost);

    /**
     * @brief Parse a raw HTTP/1.x response (chunked bodies are decoded)
     */
    static EngineResponse parseResponse(const std::string& raw);

    /**
     * @brief Decode a chunked transfer-encoded body
     * @return std::nullopt when the framing is malformed
     */
    static std::optional<std::string> decodeChunked(const std::string& body);

    /**
     * @brief Split the engine's multiplexed log stream
     *
     * Each frame is an 8-byte header (stream id, 3 zero bytes, big-endian
     * length) followed by the payload. Stream 1 is stdout, 2 is stderr.
     * A truncated trailing frame keeps whatever payload bytes are present.
     */
    static DemultiplexedLogs demultiplexLogs(const std::string& raw);

private:
    std::string socketPath_;
};

} // namespace sandbox
} // namespace proctor

#endif // PROCTOR_SANDBOX_DOCKER_ENGINE_CLIENT_H
