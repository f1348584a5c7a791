#include "daemon/input/hotkey_router.h"

#include "logging/logger.h"

namespace daemon_input {

using daemon_session::ControlCommand;
using daemon_session::ControlCommandType;

HotkeyRouter::HotkeyRouter(std::chrono::milliseconds debounce, Post post, Clock clock)
    : post_(std::move(post)), clock_(std::move(clock)), debouncer_(debounce) {
    if (!clock_) {
        clock_ = [] { return std::chrono::steady_clock::now(); };
    }
}

void HotkeyRouter::onKey(HotkeyRole role, bool pressed, const std::string& sourceId) {
    if (!post_) {
        return;
    }
    if (role == HotkeyRole::Hold) {
        post_(ControlCommand{pressed ? ControlCommandType::HoldPress
                                     : ControlCommandType::HoldRelease,
                             sourceId});
        return;
    }

    if (!pressed) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!debouncer_.accept(clock_())) {
            LOG_DEBUG("Hotkey: toggle from {} debounced", sourceId);
            return;
        }
    }
    post_(ControlCommand{ControlCommandType::Toggle, sourceId});
}

}  // namespace daemon_input
