#include "daemon/status/status_broadcast.h"

#include "logging/logger.h"

#include <cctype>

namespace daemon_status {

StatusBroadcast::StatusBroadcast(std::string statePath, std::string interimPath,
                                 std::chrono::milliseconds interimThrottle, Clock clock)
    : stateFile_(std::move(statePath)),
      interimFile_(std::move(interimPath)),
      interimThrottle_(interimThrottle),
      clock_(clock ? std::move(clock) : Clock([] { return std::chrono::steady_clock::now(); })) {}

bool StatusBroadcast::publishState(daemon_session::AppState state) {
    if (!stateFile_.writeAtomically(std::string(daemon_session::appStateToString(state)) + "\n")) {
        LOG_EVERY_N(WARN, 20, "Cannot write state file {}", stateFile_.path());
        return false;
    }
    return true;
}

void StatusBroadcast::publishInterim(const std::string& text) {
    auto now = clock_();
    if (lastInterimWrite_ && now - *lastInterimWrite_ < interimThrottle_) {
        pendingInterim_ = text;
        return;
    }
    pendingInterim_.reset();
    writeInterim(text);
}

void StatusBroadcast::flushPending() {
    if (!pendingInterim_) {
        return;
    }
    auto now = clock_();
    if (lastInterimWrite_ && now - *lastInterimWrite_ < interimThrottle_) {
        return;
    }
    std::string text = std::move(*pendingInterim_);
    pendingInterim_.reset();
    writeInterim(text);
}

void StatusBroadcast::clearInterim() {
    pendingInterim_.reset();
    lastInterimWrite_.reset();
    interimFile_.removeIfExists();
}

const std::string& StatusBroadcast::statePath() const {
    return stateFile_.path();
}

const std::string& StatusBroadcast::interimPath() const {
    return interimFile_.path();
}

bool StatusBroadcast::writeInterim(const std::string& text) {
    lastInterimWrite_ = clock_();
    if (!interimFile_.writeAtomically(text)) {
        LOG_EVERY_N(WARN, 20, "Cannot write interim file {}", interimFile_.path());
        return false;
    }
    return true;
}

daemon_session::AppState StatusBroadcast::readState(const std::string& path) {
    auto content = StatusFile(path).read();
    if (!content) {
        return daemon_session::AppState::Idle;
    }
    std::string trimmed = *content;
    while (!trimmed.empty() && std::isspace(static_cast<unsigned char>(trimmed.back()))) {
        trimmed.pop_back();
    }
    return daemon_session::parseAppState(trimmed).value_or(daemon_session::AppState::Idle);
}

std::string StatusBroadcast::readInterim(const std::string& path) {
    return StatusFile(path).read().value_or("");
}

}  // namespace daemon_status
