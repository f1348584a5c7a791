#include "daemon/core/process_lease.h"

#include "daemon/status/status_file.h"
#include "logging/logger.h"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fstream>
#include <thread>
#include <unistd.h>

namespace daemon_core {

namespace {

constexpr auto kPollInterval = std::chrono::milliseconds(50);

bool removeLeaseFile(const std::string& path) {
    if (unlink(path.c_str()) == 0 || errno == ENOENT) {
        return true;
    }
    LOG_WARN("Cannot remove lease file {}: {}", path, strerror(errno));
    return false;
}

std::string baseName(const std::string& path) {
    size_t slash = path.find_last_of('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

std::string describe(const std::optional<std::vector<std::string>>& argv) {
    if (!argv) {
        return "<unreadable>";
    }
    std::string joined;
    for (const auto& arg : *argv) {
        if (!joined.empty()) {
            joined += ' ';
        }
        joined += arg;
    }
    return joined;
}

bool identityConfirmed(const std::optional<std::vector<std::string>>& argv,
                       const std::string& executableName,
                       const std::vector<std::string>& markers) {
    if (!argv || argv->empty() || executableName.empty()) {
        return false;
    }
    const std::string program = baseName(argv->front());
    if (program != executableName) {
        return false;
    }
    return std::all_of(markers.begin(), markers.end(), [&](const std::string& marker) {
        return marker.empty() || marker == program ||
               std::find(argv->begin() + 1, argv->end(), marker) != argv->end();
    });
}

std::string ownExecutableName(const LeaseOptions& options, const ProcessOps& ops) {
    if (!options.executableName.empty()) {
        return options.executableName;
    }
    auto own = ops.arguments(ops.self());
    if (!own || own->empty()) {
        return "";
    }
    return baseName(own->front());
}

// Polls until the process is gone or the timeout elapses.
bool waitForExit(pid_t pid, std::chrono::milliseconds timeout, ProcessOps& ops) {
    auto waited = std::chrono::milliseconds(0);
    while (ops.exists(pid)) {
        if (waited >= timeout) {
            return false;
        }
        ops.sleepFor(kPollInterval);
        waited += kPollInterval;
    }
    return true;
}

}  // namespace

pid_t SystemProcessOps::self() const {
    return getpid();
}

bool SystemProcessOps::exists(pid_t pid) const {
    if (pid <= 0) {
        return false;
    }
    if (kill(pid, 0) == 0) {
        return true;
    }
    // EPERM: alive but owned by someone else
    return errno == EPERM;
}

std::optional<std::vector<std::string>> SystemProcessOps::arguments(pid_t pid) const {
    std::ifstream ifs("/proc/" + std::to_string(pid) + "/cmdline", std::ios::binary);
    if (!ifs) {
        return std::nullopt;
    }
    std::vector<std::string> argv;
    std::string arg;
    while (std::getline(ifs, arg, '\0')) {
        argv.push_back(arg);
    }
    return argv;
}

int SystemProcessOps::signal(pid_t pid, int sig) {
    if (kill(pid, sig) == 0) {
        return 0;
    }
    return errno;
}

void SystemProcessOps::sleepFor(std::chrono::milliseconds duration) {
    std::this_thread::sleep_for(duration);
}

const char* leaseOutcomeToString(LeaseOutcome outcome) {
    switch (outcome) {
    case LeaseOutcome::NoLease:
        return "no_lease";
    case LeaseOutcome::OwnPid:
        return "own_pid";
    case LeaseOutcome::StaleRemoved:
        return "stale_removed";
    case LeaseOutcome::UnidentifiedRemoved:
        return "unidentified_removed";
    case LeaseOutcome::PreviousTerminated:
        return "previous_terminated";
    case LeaseOutcome::Conflict:
        return "conflict";
    }
    return "unknown";
}

pid_t ProcessLease::readPid(const std::string& path) {
    std::ifstream leaseFile(path);
    if (!leaseFile.is_open()) {
        return 0;
    }
    long long value = 0;
    if (!(leaseFile >> value) || value <= 0 || value > 0x7fffffff) {
        return 0;
    }
    return static_cast<pid_t>(value);
}

LeaseOutcome ProcessLease::recover(const LeaseOptions& options, ProcessOps& ops) {
    if (access(options.path.c_str(), F_OK) != 0) {
        return LeaseOutcome::NoLease;
    }

    pid_t pid = readPid(options.path);
    if (pid == 0) {
        LOG_INFO("Lease {} is unreadable, removing it", options.path);
        removeLeaseFile(options.path);
        return LeaseOutcome::StaleRemoved;
    }

    if (pid == ops.self()) {
        LOG_DEBUG("Lease {} already names this process (PID {})", options.path, pid);
        return LeaseOutcome::OwnPid;
    }

    if (!ops.exists(pid)) {
        LOG_INFO("Stale lease recovered: PID {} is not running", pid);
        removeLeaseFile(options.path);
        return LeaseOutcome::StaleRemoved;
    }

    auto argv = ops.arguments(pid);
    if (!identityConfirmed(argv, ownExecutableName(options, ops), options.identityMarkers)) {
        LOG_INFO("Stale lease recovered: PID {} is not a voxd instance ({})", pid,
                 describe(argv));
        removeLeaseFile(options.path);
        return LeaseOutcome::UnidentifiedRemoved;
    }

    if (!options.replaceRunning) {
        LOG_ERROR("Another instance is already running (PID: {})", pid);
        return LeaseOutcome::Conflict;
    }

    LOG_WARN("Terminating previous instance (PID: {})", pid);
    int err = ops.signal(pid, SIGTERM);
    if (err == ESRCH) {
        removeLeaseFile(options.path);
        return LeaseOutcome::StaleRemoved;
    }
    if (err != 0) {
        LOG_ERROR("Cannot signal previous instance (PID: {}): {}", pid, strerror(err));
        return LeaseOutcome::Conflict;
    }

    if (!waitForExit(pid, options.grace, ops)) {
        LOG_WARN("Previous instance (PID: {}) ignored SIGTERM, sending SIGKILL", pid);
        err = ops.signal(pid, SIGKILL);
        if (err != 0 && err != ESRCH) {
            LOG_ERROR("Cannot kill previous instance (PID: {}): {}", pid, strerror(err));
            return LeaseOutcome::Conflict;
        }
        if (!waitForExit(pid, options.grace, ops)) {
            LOG_ERROR("Previous instance (PID: {}) survived SIGKILL", pid);
            return LeaseOutcome::Conflict;
        }
    }

    removeLeaseFile(options.path);
    return LeaseOutcome::PreviousTerminated;
}

std::optional<ProcessLease> ProcessLease::acquire(const LeaseOptions& options, ProcessOps& ops,
                                                  LeaseOutcome* outcome) {
    LeaseOutcome result = recover(options, ops);
    if (outcome) {
        *outcome = result;
    }
    if (result == LeaseOutcome::Conflict) {
        return std::nullopt;
    }

    pid_t self = ops.self();
    if (result != LeaseOutcome::OwnPid) {
        daemon_status::StatusFile file(options.path);
        if (!file.writeAtomically(std::to_string(self) + "\n")) {
            LOG_ERROR("Cannot write lease file {}: {}", options.path, strerror(errno));
            return std::nullopt;
        }
    }
    LOG_INFO("Lease acquired: {} (PID {})", options.path, self);
    return ProcessLease(options.path, self);
}

ProcessLease::ProcessLease(std::string path, pid_t pid) : path_(std::move(path)), pid_(pid) {}

ProcessLease::ProcessLease(ProcessLease&& other) noexcept
    : path_(std::move(other.path_)), pid_(other.pid_) {
    other.pid_ = 0;
}

ProcessLease& ProcessLease::operator=(ProcessLease&& other) noexcept {
    if (this == &other) {
        return *this;
    }
    release();
    path_ = std::move(other.path_);
    pid_ = other.pid_;
    other.pid_ = 0;
    return *this;
}

ProcessLease::~ProcessLease() {
    release();
}

const std::string& ProcessLease::path() const {
    return path_;
}

pid_t ProcessLease::pid() const {
    return pid_;
}

void ProcessLease::release() noexcept {
    if (pid_ == 0 || path_.empty()) {
        return;
    }
    // A newer instance may have replaced us; only remove our own lease.
    if (readPid(path_) == pid_) {
        unlink(path_.c_str());
    }
    pid_ = 0;
}

}  // namespace daemon_core
