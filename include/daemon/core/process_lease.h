#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <sys/types.h>
#include <vector>

namespace daemon_core {

// Process probing/signalling, injectable so lease recovery can be tested
// without touching real processes.
class ProcessOps {
   public:
    virtual ~ProcessOps() = default;

    virtual pid_t self() const = 0;
    // Non-destructive existence probe (kill(pid, 0)).
    virtual bool exists(pid_t pid) const = 0;
    // argv of the process (from /proc/<pid>/cmdline); nullopt if unreadable.
    virtual std::optional<std::vector<std::string>> arguments(pid_t pid) const = 0;
    // Returns 0 on success, errno otherwise.
    virtual int signal(pid_t pid, int sig) = 0;
    virtual void sleepFor(std::chrono::milliseconds duration) = 0;
};

class SystemProcessOps : public ProcessOps {
   public:
    pid_t self() const override;
    bool exists(pid_t pid) const override;
    std::optional<std::vector<std::string>> arguments(pid_t pid) const override;
    int signal(pid_t pid, int sig) override;
    void sleepFor(std::chrono::milliseconds duration) override;
};

enum class LeaseOutcome {
    NoLease,              // no lease file present
    OwnPid,               // lease already names this process; left untouched
    StaleRemoved,         // dead PID or unparseable content; file removed
    UnidentifiedRemoved,  // live PID that is not this application; file removed, no signal
    PreviousTerminated,   // identity confirmed, previous instance terminated
    Conflict              // confirmed live instance that must not or cannot be replaced
};

const char* leaseOutcomeToString(LeaseOutcome outcome);

// A live lease holder is treated as a previous instance only when the
// basename of its argv[0] equals executableName and every identity marker is
// one of its arguments (argv[0] compared by basename).
struct LeaseOptions {
    std::string path;
    bool replaceRunning = true;
    std::chrono::milliseconds grace{500};
    std::string executableName;  // empty: basename of our own argv[0]
    std::vector<std::string> identityMarkers;
};

// Single-instance lease backed by a PID file.
class ProcessLease {
   public:
    // Inspects an existing lease file and clears it. Never writes a new lease.
    static LeaseOutcome recover(const LeaseOptions& options, ProcessOps& ops);

    // recover() followed by an atomic write of our own PID.
    // Returns nullopt on Conflict or when the lease cannot be written.
    static std::optional<ProcessLease> acquire(const LeaseOptions& options, ProcessOps& ops,
                                               LeaseOutcome* outcome = nullptr);

    // Lease file content, 0 when missing or unparseable.
    static pid_t readPid(const std::string& path);

    ProcessLease(const ProcessLease&) = delete;
    ProcessLease& operator=(const ProcessLease&) = delete;

    ProcessLease(ProcessLease&& other) noexcept;
    ProcessLease& operator=(ProcessLease&& other) noexcept;

    // Removes the lease file if it still names our PID.
    ~ProcessLease();

    const std::string& path() const;
    pid_t pid() const;

   private:
    ProcessLease(std::string path, pid_t pid);

    void release() noexcept;

    std::string path_;
    pid_t pid_ = 0;
};

}  // namespace daemon_core
