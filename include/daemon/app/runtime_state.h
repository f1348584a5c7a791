#pragma once

#include "core/config_loader.h"

#include <atomic>

namespace daemon_app {

struct ControlFlags {
    std::atomic<bool> running{true};
    std::atomic<bool> reloadRequested{false};
    std::atomic<bool> zmqBindFailed{false};
};

// State shared by the whole daemon process across configuration reloads.
struct RuntimeState {
    AppConfig config;
    ControlFlags flags;
};

}  // namespace daemon_app
