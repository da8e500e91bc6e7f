#include "sandbox/docker_engine_client.h"
#include "utils/string_utils.h"
#include "utils/log.h"
#include <nlohmann/json.hpp>
#include <sys/socket.h>
#include <sys/un.h>
#include <poll.h>
#include <unistd.h>
#include <errno.h>
#include <cstring>
#include <sstream>
#include <algorithm>
#include <cstdint>

namespace proctor {
namespace sandbox {

namespace {

constexpr const char* DEFAULT_SOCKET_PATH = "/var/run/docker.sock";

// Closes the socket on every exit path of request()
class SocketGuard {
public:
    explicit SocketGuard(int fd) : fd_(fd) {}
    ~SocketGuard() {
        if (fd_ >= 0) {
            close(fd_);
        }
    }
    SocketGuard(const SocketGuard&) = delete;
    SocketGuard& operator=(const SocketGuard&) = delete;

    int get() const { return fd_; }

private:
    int fd_;
};

EngineResponse transportFailure(EngineCallStatus status, const std::string& message) {
    EngineResponse response;
    response.status = status;
    response.message = message;
    return response;
}

} // namespace

std::string engineCallStatusToString(EngineCallStatus status) {
    switch (status) {
        case EngineCallStatus::OK: return "OK";
        case EngineCallStatus::CONNECT_FAILED: return "CONNECT_FAILED";
        case EngineCallStatus::TIMEOUT: return "TIMEOUT";
        case EngineCallStatus::IO_ERROR: return "IO_ERROR";
        case EngineCallStatus::PROTOCOL_ERROR: return "PROTOCOL_ERROR";
        default: return "UNKNOWN";
    }
}

std::string EngineResponse::describeFailure() const {
    if (status != EngineCallStatus::OK) {
        return engineCallStatusToString(status) + ": " + message;
    }

    // The engine reports errors as {"message": "..."}
    auto parsed = nlohmann::json::parse(body, nullptr, false);
    if (parsed.is_object() && parsed.contains("message") && parsed["message"].is_string()) {
        return "HTTP " + std::to_string(httpStatus) + ": " + parsed["message"].get<std::string>();
    }
    return "HTTP " + std::to_string(httpStatus) + ": " + utils::trim(body);
}

DockerEngineClient::DockerEngineClient(const std::string& dockerHost)
    : socketPath_(normalizeDockerHost(dockerHost)) {
    LOGD_FMT("DockerEngineClient using socket " << socketPath_ << " (from '" << dockerHost << "')");
}

std::string DockerEngineClient::normalizeDockerHost(const std::string& dockerHost) {
    const std::string host = utils::trim(dockerHost);
    const std::string unixScheme = "unix://";

    if (host.compare(0, unixScheme.size(), unixScheme) == 0) {
        std::string path = host.substr(unixScheme.size());
        if (path.empty()) {
            return DEFAULT_SOCKET_PATH;
        }
        return path[0] == '/' ? path : "/" + path;
    }

    if (!host.empty() && host[0] == '/') {
        return host;
    }

    if (!host.empty()) {
        LOGW_FMT("Unsupported docker host '" << host << "', using " << DEFAULT_SOCKET_PATH);
    }
    return DEFAULT_SOCKET_PATH;
}

EngineResponse DockerEngineClient::request(const std::string& method,
                                           const std::string& path,
                                           const std::optional<std::string>& jsonBody,
                                           std::chrono::milliseconds timeout) const {
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    SocketGuard sock(socket(AF_UNIX, SOCK_STREAM, 0));
    if (sock.get() < 0) {
        return transportFailure(EngineCallStatus::CONNECT_FAILED,
                                std::string("socket() failed: ") + strerror(errno));
    }

    struct sockaddr_un addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    if (socketPath_.size() >= sizeof(addr.sun_path)) {
        return transportFailure(EngineCallStatus::CONNECT_FAILED, "Socket path too long: " + socketPath_);
    }
    std::strncpy(addr.sun_path, socketPath_.c_str(), sizeof(addr.sun_path) - 1);

    if (::connect(sock.get(), reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        return transportFailure(EngineCallStatus::CONNECT_FAILED,
                                "connect(" + socketPath_ + ") failed: " + strerror(errno));
    }

    std::ostringstream req;
    req << method << " " << path << " HTTP/1.1\r\n"
        << "Host: docker\r\n"
        << "User-Agent: proctor\r\n"
        << "Connection: close\r\n";
    if (jsonBody) {
        req << "Content-Type: application/json\r\n"
            << "Content-Length: " << jsonBody->size() << "\r\n";
    } else if (method == "POST") {
        req << "Content-Length: 0\r\n";
    }
    req << "\r\n";
    if (jsonBody) {
        req << *jsonBody;
    }

    const std::string payload = req.str();
    size_t sent = 0;
    while (sent < payload.size()) {
        ssize_t n = ::send(sock.get(), payload.data() + sent, payload.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return transportFailure(EngineCallStatus::IO_ERROR, std::string("send() failed: ") + strerror(errno));
        }
        sent += static_cast<size_t>(n);
    }

    std::string raw;
    char buffer[8192];
    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            return transportFailure(EngineCallStatus::TIMEOUT,
                                    method + " " + path + " timed out after " +
                                    std::to_string(timeout.count()) + "ms");
        }

        struct pollfd pfd;
        pfd.fd = sock.get();
        pfd.events = POLLIN;
        pfd.revents = 0;

        int ret = poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (ret < 0) {
            if (errno == EINTR) {
                continue;
            }
            return transportFailure(EngineCallStatus::IO_ERROR, std::string("poll() failed: ") + strerror(errno));
        }
        if (ret == 0) {
            continue;  // deadline re-checked at the top
        }

        ssize_t received = recv(sock.get(), buffer, sizeof(buffer), 0);
        if (received < 0) {
            if (errno == EINTR) {
                continue;
            }
            return transportFailure(EngineCallStatus::IO_ERROR, std::string("recv() failed: ") + strerror(errno));
        }
        if (received == 0) {
            break;
        }
        raw.append(buffer, static_cast<size_t>(received));
    }

    EngineResponse response = parseResponse(raw);
    LOGV_FMT("Engine " << method << " " << path << " -> " << engineCallStatusToString(response.status)
             << " " << response.httpStatus << " (" << response.body.size() << " bytes)");
    return response;
}

EngineResponse DockerEngineClient::parseResponse(const std::string& raw) {
    auto headerEnd = raw.find("\r\n\r\n");
    if (headerEnd == std::string::npos) {
        return transportFailure(EngineCallStatus::PROTOCOL_ERROR, "Incomplete HTTP response headers");
    }

    EngineResponse response;
    std::istringstream headerStream(raw.substr(0, headerEnd));
    std::string statusLine;
    std::getline(headerStream, statusLine);
    statusLine = utils::trim(statusLine);

    std::istringstream statusParts(statusLine);
    std::string version;
    statusParts >> version >> response.httpStatus;
    if (version.compare(0, 5, "HTTP/") != 0 || response.httpStatus < 100) {
        return transportFailure(EngineCallStatus::PROTOCOL_ERROR, "Malformed status line: " + statusLine);
    }

    std::string line;
    while (std::getline(headerStream, line)) {
        auto colon = line.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        response.headers[utils::toLower(utils::trim(line.substr(0, colon)))] =
            utils::trim(line.substr(colon + 1));
    }

    std::string body = raw.substr(headerEnd + 4);

    auto te = response.headers.find("transfer-encoding");
    if (te != response.headers.end() && utils::containsIgnoreCase(te->second, "chunked")) {
        auto decoded = decodeChunked(body);
        if (!decoded) {
            return transportFailure(EngineCallStatus::PROTOCOL_ERROR, "Malformed chunked body");
        }
        body = std::move(*decoded);
    } else {
        auto cl = response.headers.find("content-length");
        if (cl != response.headers.end()) {
            try {
                size_t length = std::stoul(cl->second);
                if (body.size() > length) {
                    body.resize(length);
                }
            } catch (const std::logic_error&) {
                return transportFailure(EngineCallStatus::PROTOCOL_ERROR, "Bad Content-Length: " + cl->second);
            }
        }
    }

    response.status = EngineCallStatus::OK;
    response.body = std::move(body);
    return response;
}

std::optional<std::string> DockerEngineClient::decodeChunked(const std::string& body) {
    std::string decoded;
    size_t pos = 0;

    while (pos < body.size()) {
        auto lineEnd = body.find("\r\n", pos);
        if (lineEnd == std::string::npos) {
            return std::nullopt;
        }

        std::string sizeText = body.substr(pos, lineEnd - pos);
        auto extension = sizeText.find(';');
        if (extension != std::string::npos) {
            sizeText.resize(extension);
        }

        size_t chunkSize = 0;
        try {
            chunkSize = std::stoul(utils::trim(sizeText), nullptr, 16);
        } catch (const std::logic_error&) {
            return std::nullopt;
        }

        pos = lineEnd + 2;
        if (chunkSize == 0) {
            return decoded;
        }
        if (pos + chunkSize > body.size()) {
            return std::nullopt;
        }

        decoded.append(body, pos, chunkSize);
        pos += chunkSize + 2;  // chunk data is followed by CRLF
    }

    // Connection closed without the terminating zero-size chunk
    return decoded;
}

DemultiplexedLogs DockerEngineClient::demultiplexLogs(const std::string& raw) {
    DemultiplexedLogs logs;
    size_t pos = 0;

    while (pos + 8 <= raw.size()) {
        const auto streamId = static_cast<unsigned char>(raw[pos]);
        const uint32_t length =
            (static_cast<uint32_t>(static_cast<unsigned char>(raw[pos + 4])) << 24) |
            (static_cast<uint32_t>(static_cast<unsigned char>(raw[pos + 5])) << 16) |
            (static_cast<uint32_t>(static_cast<unsigned char>(raw[pos + 6])) << 8) |
            static_cast<uint32_t>(static_cast<unsigned char>(raw[pos + 7]));
        pos += 8;

        const size_t available = std::min<size_t>(length, raw.size() - pos);
        std::string& target = (streamId == 2) ? logs.stderrData : logs.stdoutData;
        target.append(raw, pos, available);
        logs.combinedData.append(raw, pos, available);
        pos += available;
    }

    return logs;
}

} // namespace sandbox
} // namespace proctor
