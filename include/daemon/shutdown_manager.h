#pragma once

#include "core/graceful_shutdown.h"

#include <atomic>
#include <functional>

namespace shutdown_manager {

class ShutdownManager {
   public:
    struct Dependencies {
        std::atomic<bool>* runningFlag = nullptr;
        std::atomic<bool>* reloadFlag = nullptr;
        // Stops the active session's capture as soon as the signal is seen.
        std::function<void()> cancelSession;
    };

    explicit ShutdownManager(Dependencies deps);

    // SIGINT/SIGTERM: shutdown, SIGHUP: reload, SIGPIPE: ignored.
    void installSignalHandlers();

    // systemd READY=1 (no-op without libsystemd)
    void notifyReady();

    // Called from the control loop: processes signals, feeds the watchdog.
    void tick();

    // STOPPING=1 notification, once.
    void runShutdownSequence();

    // Reset manager state between restarts
    void reset();

    bool isRunning() const;
    bool isReloadRequested() const;
    // Consumes the pending reload request (signal or control plane).
    bool takeReloadRequest();

   private:
    void sendWatchdog();
#ifdef VOXD_HAVE_SYSTEMD
    void sendReadyNotify();
    void sendStoppingNotify();
#endif

    Dependencies deps_;
    GracefulShutdown::Controller controller_;

    bool readyNotified_{false};
    bool stoppingNotified_{false};
    bool sequenceRan_{false};
};

}  // namespace shutdown_manager
