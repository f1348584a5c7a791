#include "core/process_runner.h"

#include "daemon/core/stop_signal.h"
#include "logging/logger.h"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <mutex>
#include <poll.h>
#include <spawn.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

extern char** environ;

namespace process_runner {

namespace {

constexpr int kPollSliceMs = 50;
constexpr auto kTermGrace = std::chrono::milliseconds(300);

struct Pipe {
    int fds[2] = {-1, -1};

    ~Pipe() {
        closeEnd(0);
        closeEnd(1);
    }

    bool open() {
        return pipe2(fds, O_CLOEXEC) == 0;
    }

    void closeEnd(int end) {
        if (fds[end] >= 0) {
            ::close(fds[end]);
            fds[end] = -1;
        }
    }
};

// A child that exits before reading its stdin must not take the daemon down.
void ignoreSigpipe() {
    static std::once_flag once;
    std::call_once(once, [] { std::signal(SIGPIPE, SIG_IGN); });
}

void killAndReap(pid_t pid, int& status) {
    kill(pid, SIGTERM);
    auto deadline = std::chrono::steady_clock::now() + kTermGrace;
    while (std::chrono::steady_clock::now() < deadline) {
        if (waitpid(pid, &status, WNOHANG) == pid) {
            return;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    kill(pid, SIGKILL);
    waitpid(pid, &status, 0);
}

}  // namespace

ProcessResult run(const std::vector<std::string>& argv, const std::string& stdinData,
                  std::chrono::milliseconds timeout, const daemon_core::StopSignal* cancel) {
    ProcessResult result;
    ignoreSigpipe();
    if (argv.empty()) {
        result.spawnError = EINVAL;
        return result;
    }

    Pipe inPipe;
    Pipe outPipe;
    Pipe errPipe;
    if (!inPipe.open() || !outPipe.open() || !errPipe.open()) {
        result.spawnError = errno;
        return result;
    }

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_adddup2(&actions, inPipe.fds[0], STDIN_FILENO);
    posix_spawn_file_actions_adddup2(&actions, outPipe.fds[1], STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(&actions, errPipe.fds[1], STDERR_FILENO);

    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        cargv.push_back(const_cast<char*>(arg.c_str()));
    }
    cargv.push_back(nullptr);

    pid_t pid = -1;
    int rc = posix_spawnp(&pid, argv[0].c_str(), &actions, nullptr, cargv.data(), environ);
    posix_spawn_file_actions_destroy(&actions);
    if (rc != 0) {
        LOG_ERROR("Failed to spawn '{}': {}", argv[0], std::strerror(rc));
        result.spawnError = rc;
        return result;
    }

    inPipe.closeEnd(0);
    outPipe.closeEnd(1);
    errPipe.closeEnd(1);

    int inFd = inPipe.fds[1];
    fcntl(inFd, F_SETFL, fcntl(inFd, F_GETFL) | O_NONBLOCK);
    size_t written = 0;
    if (stdinData.empty()) {
        inPipe.closeEnd(1);
    }

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    char buffer[4096];
    bool outOpen = true;
    bool errOpen = true;
    bool killed = false;
    int status = 0;

    while (outOpen || errOpen) {
        if (cancel && cancel->requested()) {
            result.cancelled = true;
            killed = true;
            break;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            result.timedOut = true;
            killed = true;
            break;
        }

        pollfd fds[3];
        nfds_t count = 0;
        int outIdx = -1;
        int errIdx = -1;
        int inIdx = -1;
        if (outOpen) {
            outIdx = static_cast<int>(count);
            fds[count++] = {outPipe.fds[0], POLLIN, 0};
        }
        if (errOpen) {
            errIdx = static_cast<int>(count);
            fds[count++] = {errPipe.fds[0], POLLIN, 0};
        }
        if (inPipe.fds[1] >= 0) {
            inIdx = static_cast<int>(count);
            fds[count++] = {inPipe.fds[1], POLLOUT, 0};
        }

        int ready = poll(fds, count, kPollSliceMs);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            LOG_ERROR("poll failed while running '{}': {}", argv[0], std::strerror(errno));
            killed = true;
            break;
        }
        if (ready == 0) {
            continue;
        }

        auto drain = [&](int idx, int fd, std::string& sink, bool& open) {
            if (idx < 0 || !(fds[idx].revents & (POLLIN | POLLHUP | POLLERR))) {
                return;
            }
            ssize_t n = ::read(fd, buffer, sizeof(buffer));
            if (n > 0) {
                sink.append(buffer, static_cast<size_t>(n));
            } else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
                open = false;
            }
        };
        drain(outIdx, outPipe.fds[0], result.out, outOpen);
        drain(errIdx, errPipe.fds[0], result.err, errOpen);

        if (inIdx >= 0 && (fds[inIdx].revents & (POLLOUT | POLLERR | POLLHUP))) {
            if (fds[inIdx].revents & (POLLERR | POLLHUP)) {
                inPipe.closeEnd(1);
            } else {
                ssize_t n = ::write(inPipe.fds[1], stdinData.data() + written,
                                    stdinData.size() - written);
                if (n > 0) {
                    written += static_cast<size_t>(n);
                } else if (n < 0 && errno != EAGAIN && errno != EINTR) {
                    inPipe.closeEnd(1);
                }
                if (written >= stdinData.size()) {
                    inPipe.closeEnd(1);
                }
            }
        }
    }

    // Both output pipes hit EOF. A child can still be alive after closing
    // them, so the reap stays under the same deadline and cancel.
    while (!killed) {
        pid_t reaped = waitpid(pid, &status, WNOHANG);
        if (reaped == pid) {
            break;
        }
        if (reaped < 0 && errno != EINTR) {
            LOG_ERROR("waitpid failed for '{}': {}", argv[0], std::strerror(errno));
            return result;
        }
        if (cancel && cancel->requested()) {
            result.cancelled = true;
            killed = true;
        } else if (std::chrono::steady_clock::now() >= deadline) {
            result.timedOut = true;
            killed = true;
        } else {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
    }

    if (killed) {
        killAndReap(pid, status);
        return result;
    }

    if (WIFEXITED(status)) {
        result.exited = true;
        result.exitCode = WEXITSTATUS(status);
    }
    return result;
}

std::vector<std::string> substitute(const std::vector<std::string>& argv,
                                    const std::vector<std::pair<std::string, std::string>>& vars) {
    std::vector<std::string> out;
    out.reserve(argv.size());
    for (std::string arg : argv) {
        for (const auto& [key, value] : vars) {
            const std::string token = "{" + key + "}";
            size_t pos = 0;
            while ((pos = arg.find(token, pos)) != std::string::npos) {
                arg.replace(pos, token.size(), value);
                pos += value.size();
            }
        }
        out.push_back(std::move(arg));
    }
    return out;
}

std::string trimWhitespace(const std::string& text) {
    const char* ws = " \t\r\n";
    size_t begin = text.find_first_not_of(ws);
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(ws);
    return text.substr(begin, end - begin + 1);
}

std::string joinArgs(const std::vector<std::string>& argv) {
    std::string joined;
    for (const auto& arg : argv) {
        if (!joined.empty()) {
            joined += ' ';
        }
        joined += arg;
    }
    return joined;
}

}  // namespace process_runner
