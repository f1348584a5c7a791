#ifndef VOXD_GRACEFUL_SHUTDOWN_H
#define VOXD_GRACEFUL_SHUTDOWN_H

#include <atomic>
#include <csignal>
#include <functional>

namespace GracefulShutdown {

// ========== Signal State ==========
// Flags set by the signal handler and polled by the control loop.
// volatile sig_atomic_t keeps access async-signal-safe.

struct SignalState {
    volatile sig_atomic_t shutdown = 0;  // SIGTERM, SIGINT
    volatile sig_atomic_t reload = 0;    // SIGHUP
    volatile sig_atomic_t received = 0;  // Last signal number (for logging)

    void reset() {
        shutdown = 0;
        reload = 0;
        received = 0;
    }
};

// ========== Shutdown Controller ==========
// Turns pending signal flags into actions. Testable without real signals:
// point it at a local SignalState and set the flags directly.

class Controller {
   public:
    using CancelSessionCallback = std::function<void()>;
    using LogCallback = std::function<void(int signal, const char* action)>;

    enum class Action { NONE, SHUTDOWN, RELOAD };

    Controller() = default;

    void setSignalState(SignalState* state) {
        signalState_ = state;
    }
    // Invoked once on shutdown so the active session stops capturing at once.
    void setCancelSessionCallback(CancelSessionCallback cb) {
        cancelSessionCallback_ = std::move(cb);
    }
    void setLogCallback(LogCallback cb) {
        logCallback_ = std::move(cb);
    }

    // Shutdown (SIGTERM/SIGINT) takes priority over reload (SIGHUP) and
    // discards a reload that is pending at the same time.
    // Returns true if a signal was processed.
    bool processPendingSignals();

    bool isRunning() const {
        return running_.load();
    }
    void setRunning(bool running) {
        running_ = running;
    }

    bool isReloadRequested() const {
        return reloadRequested_.load();
    }
    // Consumes a pending reload; returns whether one was pending.
    bool takeReloadRequest() {
        return reloadRequested_.exchange(false);
    }
    void clearReloadRequest() {
        reloadRequested_ = false;
    }

    int getLastSignal() const {
        return lastSignal_;
    }
    Action getLastAction() const {
        return lastAction_;
    }

   private:
    SignalState* signalState_ = nullptr;
    std::atomic<bool> running_{true};
    std::atomic<bool> reloadRequested_{false};

    CancelSessionCallback cancelSessionCallback_;
    LogCallback logCallback_;

    int lastSignal_ = 0;
    Action lastAction_ = Action::NONE;
};

// Async-signal-safe handler that only sets flags on the global state.
void signalHandler(int sig);

SignalState& getGlobalSignalState();

}  // namespace GracefulShutdown

#endif  // VOXD_GRACEFUL_SHUTDOWN_H
