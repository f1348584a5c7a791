#pragma once

#include "daemon/core/process_lease.h"
#include "daemon/status/status_file.h"

#include <optional>
#include <string>

namespace daemon_app {

// Per-process resources held for the daemon's whole lifetime: the single
// instance lease and the two status files (reset to idle on both ends).
class ProcessResources {
   public:
    struct Options {
        daemon_core::LeaseOptions lease;
        std::string stateFilePath;
        std::string interimFilePath;
    };

    // nullopt on lease conflict or when the lease cannot be written.
    static std::optional<ProcessResources> acquire(const Options& options,
                                                   daemon_core::ProcessOps& ops);

    ProcessResources(const ProcessResources&) = delete;
    ProcessResources& operator=(const ProcessResources&) = delete;

    ProcessResources(ProcessResources&&) noexcept = default;
    ProcessResources& operator=(ProcessResources&&) noexcept = default;

    ~ProcessResources();

    const daemon_core::ProcessLease& lease() const;
    daemon_core::LeaseOutcome leaseOutcome() const;

   private:
    ProcessResources(daemon_core::ProcessLease lease, daemon_core::LeaseOutcome outcome,
                     daemon_status::StatusFile stateFile, daemon_status::StatusFile interimFile);

    void resetStatusFiles();

    daemon_core::ProcessLease lease_;
    daemon_core::LeaseOutcome leaseOutcome_;
    daemon_status::StatusFile stateFile_;
    daemon_status::StatusFile interimFile_;
};

}  // namespace daemon_app
