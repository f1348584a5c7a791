#include "daemon/shutdown_manager.h"

#include "logging/logger.h"

#include <csignal>
#include <stdexcept>
#include <utility>

#ifdef VOXD_HAVE_SYSTEMD
#include <systemd/sd-daemon.h>
#endif

namespace shutdown_manager {

ShutdownManager::ShutdownManager(Dependencies deps) : deps_(std::move(deps)) {
    if (!deps_.runningFlag || !deps_.reloadFlag) {
        throw std::invalid_argument("ShutdownManager requires running/reload flags");
    }

    controller_.setSignalState(&GracefulShutdown::getGlobalSignalState());
    controller_.setCancelSessionCallback([this]() {
        if (deps_.cancelSession) {
            deps_.cancelSession();
        }
    });
    controller_.setLogCallback([](int signal, const char* action) {
        LOG_INFO("Received signal {}, {}", signal, action);
    });
}

void ShutdownManager::installSignalHandlers() {
    std::signal(SIGINT, GracefulShutdown::signalHandler);
    std::signal(SIGTERM, GracefulShutdown::signalHandler);
    std::signal(SIGHUP, GracefulShutdown::signalHandler);
    // Writes to a delivery or refine command that exited early must not kill us.
    std::signal(SIGPIPE, SIG_IGN);
}

void ShutdownManager::notifyReady() {
#ifdef VOXD_HAVE_SYSTEMD
    if (!readyNotified_) {
        sendReadyNotify();
    }
#endif
}

void ShutdownManager::tick() {
    if (controller_.processPendingSignals()) {
        deps_.runningFlag->store(controller_.isRunning());
        if (controller_.getLastAction() == GracefulShutdown::Controller::Action::RELOAD) {
            deps_.reloadFlag->store(true);
        } else if (!controller_.isRunning()) {
            deps_.reloadFlag->store(false);
        }
    }
    if (readyNotified_ && controller_.isRunning()) {
        sendWatchdog();
    }
}

void ShutdownManager::runShutdownSequence() {
    if (sequenceRan_) {
        return;
    }
    sequenceRan_ = true;

    LOG_INFO("Shutting down...");
#ifdef VOXD_HAVE_SYSTEMD
    sendStoppingNotify();
#endif
}

void ShutdownManager::reset() {
    sequenceRan_ = false;
    readyNotified_ = false;
    stoppingNotified_ = false;
    deps_.runningFlag->store(true);
    deps_.reloadFlag->store(false);
    controller_.setRunning(true);
    controller_.clearReloadRequest();
    GracefulShutdown::getGlobalSignalState().reset();
}

bool ShutdownManager::isRunning() const {
    return controller_.isRunning() && deps_.runningFlag->load();
}

bool ShutdownManager::isReloadRequested() const {
    return deps_.reloadFlag->load();
}

bool ShutdownManager::takeReloadRequest() {
    controller_.clearReloadRequest();
    return deps_.reloadFlag->exchange(false);
}

void ShutdownManager::sendWatchdog() {
#ifdef VOXD_HAVE_SYSTEMD
    sd_notify(0, "WATCHDOG=1");
#endif
}

#ifdef VOXD_HAVE_SYSTEMD
void ShutdownManager::sendReadyNotify() {
    sd_notify(0, "READY=1\nSTATUS=Waiting for hotkey...\n");
    readyNotified_ = true;
    LOG_INFO("systemd: Notified READY=1");
}

void ShutdownManager::sendStoppingNotify() {
    if (!stoppingNotified_) {
        sd_notify(0, "STOPPING=1\nSTATUS=Shutting down...\n");
        stoppingNotified_ = true;
        LOG_INFO("systemd: Notified STOPPING=1");
    }
}
#endif

}  // namespace shutdown_manager
