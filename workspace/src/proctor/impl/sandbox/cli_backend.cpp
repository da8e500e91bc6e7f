#include "sandbox/cli_backend.h"
#include "sandbox/command_resolver.h"
#include "utils/string_utils.h"
#include "utils/digest.h"
#include "utils/log.h"
#include <sys/types.h>
#include <sys/wait.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <unistd.h>
#include <errno.h>
#include <cstring>
#include <cstdlib>
#include <sstream>
#include <stdexcept>
#include <algorithm>

namespace proctor {
namespace sandbox {

namespace {

constexpr std::chrono::milliseconds REMOVE_TIMEOUT{30000};
constexpr size_t WRITE_CHUNK = 4096;

// docker run exits with 125 when the client or daemon fails before the
// container command starts. A user program that exits 125 itself is
// indistinguishable here and is reported the same way.
constexpr int DOCKER_RUN_FAILURE = 125;

class FdGuard {
public:
    FdGuard() : fd_(-1) {}
    explicit FdGuard(int fd) : fd_(fd) {}
    ~FdGuard() { reset(); }
    FdGuard(const FdGuard&) = delete;
    FdGuard& operator=(const FdGuard&) = delete;

    int get() const { return fd_; }
    bool isOpen() const { return fd_ >= 0; }

    void reset(int fd = -1) {
        if (fd_ >= 0) {
            close(fd_);
        }
        fd_ = fd;
    }

private:
    int fd_;
};

bool openPipe(FdGuard& readEnd, FdGuard& writeEnd) {
    int fds[2];
    if (pipe2(fds, O_CLOEXEC) < 0) {
        return false;
    }
    readEnd.reset(fds[0]);
    writeEnd.reset(fds[1]);
    return true;
}

// Returns false once the stream is finished
bool drainInto(FdGuard& fd, std::string& sink) {
    char buffer[8192];
    ssize_t n = read(fd.get(), buffer, sizeof(buffer));
    if (n > 0) {
        sink.append(buffer, static_cast<size_t>(n));
        return true;
    }
    if (n < 0 && (errno == EINTR || errno == EAGAIN)) {
        return true;
    }
    fd.reset();
    return false;
}

int decodeWaitStatus(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

} // namespace

ProcessOutcome runSupervisedProcess(const std::vector<std::string>& argv,
                                    const std::optional<std::string>& stdinData,
                                    std::chrono::milliseconds timeout) {
    ProcessOutcome outcome;
    if (argv.empty()) {
        outcome.spawnError = "Empty command";
        return outcome;
    }

    FdGuard stdinRead, stdinWrite, stdoutRead, stdoutWrite, stderrRead, stderrWrite;
    if (!openPipe(stdinRead, stdinWrite) || !openPipe(stdoutRead, stdoutWrite) ||
        !openPipe(stderrRead, stderrWrite)) {
        outcome.spawnError = std::string("pipe() failed: ") + strerror(errno);
        return outcome;
    }

    // Built before fork(): the child must not allocate
    std::vector<char*> childArgv;
    childArgv.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        childArgv.push_back(const_cast<char*>(arg.c_str()));
    }
    childArgv.push_back(nullptr);

    const auto deadline = std::chrono::steady_clock::now() + timeout;

    pid_t pid = fork();
    if (pid < 0) {
        outcome.spawnError = std::string("fork() failed: ") + strerror(errno);
        return outcome;
    }

    if (pid == 0) {
        // ===== CHILD PROCESS =====
        dup2(stdinRead.get(), STDIN_FILENO);
        dup2(stdoutWrite.get(), STDOUT_FILENO);
        dup2(stderrWrite.get(), STDERR_FILENO);
        // Originals are O_CLOEXEC
        execvp(childArgv[0], childArgv.data());
        static const char message[] = "execvp failed\n";
        ssize_t ignored = write(STDERR_FILENO, message, sizeof(message) - 1);
        (void)ignored;
        _exit(127);
    }

    // ===== PARENT PROCESS =====
    stdinRead.reset();
    stdoutWrite.reset();
    stderrWrite.reset();

    size_t stdinOffset = 0;
    if (!stdinData || stdinData->empty()) {
        stdinWrite.reset();
    } else {
        fcntl(stdinWrite.get(), F_SETFL, fcntl(stdinWrite.get(), F_GETFL) | O_NONBLOCK);
    }

    while (stdoutRead.isOpen() || stderrRead.isOpen()) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            kill(pid, SIGKILL);
            outcome.timedOut = true;
            break;
        }

        struct pollfd fds[3];
        nfds_t count = 0;
        int stdoutIndex = -1, stderrIndex = -1, stdinIndex = -1;
        if (stdoutRead.isOpen()) {
            stdoutIndex = static_cast<int>(count);
            fds[count++] = {stdoutRead.get(), POLLIN, 0};
        }
        if (stderrRead.isOpen()) {
            stderrIndex = static_cast<int>(count);
            fds[count++] = {stderrRead.get(), POLLIN, 0};
        }
        if (stdinWrite.isOpen()) {
            stdinIndex = static_cast<int>(count);
            fds[count++] = {stdinWrite.get(), POLLOUT, 0};
        }

        int ret = poll(fds, count, static_cast<int>(remaining.count()));
        if (ret < 0) {
            if (errno == EINTR) {
                continue;
            }
            LOGE_FMT("poll() failed while supervising " << argv[0] << ": " << strerror(errno));
            kill(pid, SIGKILL);
            break;
        }
        if (ret == 0) {
            continue;
        }

        if (stdoutIndex >= 0 && fds[stdoutIndex].revents != 0) {
            drainInto(stdoutRead, outcome.stdoutData);
        }
        if (stderrIndex >= 0 && fds[stderrIndex].revents != 0) {
            drainInto(stderrRead, outcome.stderrData);
        }
        if (stdinIndex >= 0 && fds[stdinIndex].revents != 0) {
            if (fds[stdinIndex].revents & (POLLERR | POLLHUP)) {
                stdinWrite.reset();
            } else {
                size_t chunk = std::min(WRITE_CHUNK, stdinData->size() - stdinOffset);
                ssize_t n = write(stdinWrite.get(), stdinData->data() + stdinOffset, chunk);
                if (n > 0) {
                    stdinOffset += static_cast<size_t>(n);
                } else if (n < 0 && errno != EINTR && errno != EAGAIN) {
                    stdinWrite.reset();  // reader went away
                }
                if (stdinOffset >= stdinData->size()) {
                    stdinWrite.reset();
                }
            }
        }
    }

    stdinWrite.reset();
    stdoutRead.reset();
    stderrRead.reset();

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            LOGE_FMT("waitpid(" << pid << ") failed: " << strerror(errno));
            return outcome;
        }
    }
    outcome.exitCode = decodeWaitStatus(status);
    return outcome;
}

CliBackend::CliBackend(const std::string& dockerBinary, const LimitPolicy& policy)
    : dockerBinary_(dockerBinary)
    , policy_(policy) {
}

std::optional<std::string> CliBackend::findExecutable(const std::string& name) {
    auto isExecutableFile = [](const std::string& path) {
        struct stat st;
        return stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode) && access(path.c_str(), X_OK) == 0;
    };

    if (name.empty()) {
        return std::nullopt;
    }
    if (name.find('/') != std::string::npos) {
        if (isExecutableFile(name)) {
            return name;
        }
        return std::nullopt;
    }

    const char* pathEnv = std::getenv("PATH");
    if (pathEnv == nullptr) {
        return std::nullopt;
    }

    std::stringstream dirs(pathEnv);
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        std::string candidate = (dir.empty() ? std::string(".") : dir) + "/" + name;
        if (isExecutableFile(candidate)) {
            return candidate;
        }
    }
    return std::nullopt;
}

bool CliBackend::isAvailable() const {
    return findExecutable(dockerBinary_).has_value();
}

bool CliBackend::ping() {
    bool available = isAvailable();
    if (available) {
        LOGI_FMT("Container CLI found: " << *findExecutable(dockerBinary_));
    } else {
        LOGW_FMT("Container CLI '" << dockerBinary_ << "' not found on PATH");
    }
    return available;
}

std::vector<std::string> CliBackend::buildRunArguments(const RunSpec& spec, const std::string& containerName) const {
    std::vector<std::string> args = {
        dockerBinary_, "run", "--rm",
        "--name", containerName,
        "-v", spec.hostDirectory + ":" + SANDBOX_MOUNT_POINT + ":rw",
        "-w", SANDBOX_MOUNT_POINT,
        "-m", policy_.memoryLimit(),
        "--memory-swap", policy_.memoryLimit(),
        "--cpus", policy_.cpusArgument(),
        "--network", "none"
    };
    if (spec.stdinData) {
        args.push_back("-i");
    }
    args.push_back(spec.image);
    args.insert(args.end(), spec.command.begin(), spec.command.end());
    return args;
}

void CliBackend::forceRemove(const std::string& containerName) const {
    ProcessOutcome removed = runSupervisedProcess({dockerBinary_, "rm", "-f", containerName},
                                                  std::nullopt, REMOVE_TIMEOUT);
    if (!removed.spawnError.empty() || removed.exitCode != 0) {
        LOGW_FMT("Failed to remove container " << containerName << ": "
                 << (removed.spawnError.empty() ? utils::trim(removed.stderrData) : removed.spawnError));
    }
}

RawRunResult CliBackend::run(const RunSpec& spec) {
    const std::string containerName = "proctor-" + utils::randomHex(8);
    const auto timeout = std::chrono::duration_cast<std::chrono::milliseconds>(policy_.timeout());

    LOGD_FMT("Running " << spec.image << " via CLI as " << containerName);
    const auto startTime = std::chrono::steady_clock::now();
    ProcessOutcome outcome = runSupervisedProcess(buildRunArguments(spec, containerName), spec.stdinData, timeout);
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - startTime);

    if (!outcome.spawnError.empty()) {
        throw std::runtime_error("Failed to launch " + dockerBinary_ + ": " + outcome.spawnError);
    }

    RawRunResult result;
    result.stdoutData = std::move(outcome.stdoutData);
    result.stderrData = std::move(outcome.stderrData);
    result.exitCode = outcome.exitCode;

    if (outcome.timedOut) {
        // The killed client leaves the container running
        forceRemove(containerName);
        result.timedOut = true;
        result.durationMs = timeout.count();
        result.errorMessage = "Execution timed out after " + std::to_string(policy_.timeout().count()) + "s";
        LOGW_FMT("Container " << containerName << " exceeded " << policy_.timeout().count() << "s");
        return result;
    }

    result.durationMs = elapsed.count();

    if (result.exitCode == DOCKER_RUN_FAILURE) {
        throw std::runtime_error(dockerBinary_ + " run failed: " + utils::trim(result.stderrData));
    }
    if (result.exitCode != 0) {
        std::string stderrText = utils::trim(result.stderrData);
        if (!stderrText.empty()) {
            result.errorMessage = stderrText;
        } else if (result.exitCode == 137) {
            result.errorMessage = "Process killed (exit code 137)";
        } else {
            result.errorMessage = "Process exited with code " + std::to_string(result.exitCode);
        }
    }

    LOGD_FMT("Container " << containerName << " finished: exit=" << result.exitCode << ", "
             << result.durationMs << "ms");
    return result;
}

} // namespace sandbox
} // namespace proctor
