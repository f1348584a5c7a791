#include "daemon/app/process_resources.h"

#include "daemon/session/app_state.h"
#include "logging/logger.h"

namespace daemon_app {

std::optional<ProcessResources> ProcessResources::acquire(const Options& options,
                                                          daemon_core::ProcessOps& ops) {
    daemon_core::LeaseOutcome outcome = daemon_core::LeaseOutcome::NoLease;
    auto lease = daemon_core::ProcessLease::acquire(options.lease, ops, &outcome);
    if (!lease) {
        return std::nullopt;
    }

    ProcessResources resources(std::move(*lease), outcome,
                               daemon_status::StatusFile(options.stateFilePath),
                               daemon_status::StatusFile(options.interimFilePath));
    resources.resetStatusFiles();
    return resources;
}

ProcessResources::ProcessResources(daemon_core::ProcessLease lease,
                                   daemon_core::LeaseOutcome outcome,
                                   daemon_status::StatusFile stateFile,
                                   daemon_status::StatusFile interimFile)
    : lease_(std::move(lease)),
      leaseOutcome_(outcome),
      stateFile_(std::move(stateFile)),
      interimFile_(std::move(interimFile)) {}

ProcessResources::~ProcessResources() {
    if (lease_.pid() != 0) {
        resetStatusFiles();
    }
}

const daemon_core::ProcessLease& ProcessResources::lease() const {
    return lease_;
}

daemon_core::LeaseOutcome ProcessResources::leaseOutcome() const {
    return leaseOutcome_;
}

void ProcessResources::resetStatusFiles() {
    if (!stateFile_.path().empty() &&
        !stateFile_.writeAtomically(
            std::string(daemon_session::appStateToString(daemon_session::AppState::Idle)) +
            "\n")) {
        LOG_WARN("Cannot reset state file {}", stateFile_.path());
    }
    if (!interimFile_.path().empty()) {
        interimFile_.removeIfExists();
    }
}

}  // namespace daemon_app
