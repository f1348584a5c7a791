#include "core/graceful_shutdown.h"

namespace GracefulShutdown {

static SignalState g_signalState;

SignalState& getGlobalSignalState() {
    return g_signalState;
}

// Only sets flags: everything else happens on the control thread.
void signalHandler(int sig) {
    g_signalState.received = sig;
    if (sig == SIGHUP) {
        g_signalState.reload = 1;
    } else {
        g_signalState.shutdown = 1;
    }
}

bool Controller::processPendingSignals() {
    if (!signalState_) {
        return false;
    }

    lastAction_ = Action::NONE;

    if (signalState_->shutdown) {
        signalState_->shutdown = 0;
        signalState_->reload = 0;
        lastSignal_ = signalState_->received;
        lastAction_ = Action::SHUTDOWN;
        reloadRequested_ = false;

        if (logCallback_) {
            logCallback_(lastSignal_, "shutting down");
        }
        if (running_.exchange(false) && cancelSessionCallback_) {
            cancelSessionCallback_();
        }
        return true;
    }

    if (signalState_->reload) {
        signalState_->reload = 0;
        lastSignal_ = signalState_->received;
        lastAction_ = Action::RELOAD;

        if (logCallback_) {
            logCallback_(lastSignal_, "reloading configuration");
        }
        reloadRequested_ = true;
        return true;
    }

    return false;
}

}  // namespace GracefulShutdown
