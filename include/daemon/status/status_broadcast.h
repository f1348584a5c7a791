#pragma once

#include "daemon/session/app_state.h"
#include "daemon/status/status_file.h"

#include <chrono>
#include <functional>
#include <optional>
#include <string>

namespace daemon_status {

// Mirrors the session state and interim transcript into two small files for
// external UI processes. Called from the control thread only.
class StatusBroadcast {
   public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    StatusBroadcast(std::string statePath, std::string interimPath,
                    std::chrono::milliseconds interimThrottle, Clock clock = {});

    bool publishState(daemon_session::AppState state);

    // Writes immediately unless the previous write is younger than the throttle
    // interval; otherwise the text is kept and written by flushPending().
    void publishInterim(const std::string& text);

    // Writes a held-back interim value once the throttle interval has passed.
    void flushPending();

    // Drops any pending value and removes the interim file.
    void clearInterim();

    const std::string& statePath() const;
    const std::string& interimPath() const;

    // Reader side: missing or unreadable state file means idle.
    static daemon_session::AppState readState(const std::string& path);
    static std::string readInterim(const std::string& path);

   private:
    bool writeInterim(const std::string& text);

    StatusFile stateFile_;
    StatusFile interimFile_;
    std::chrono::milliseconds interimThrottle_;
    Clock clock_;
    std::optional<std::chrono::steady_clock::time_point> lastInterimWrite_;
    std::optional<std::string> pendingInterim_;
};

}  // namespace daemon_status
