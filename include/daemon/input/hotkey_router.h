#pragma once

#include "daemon/input/trigger_debouncer.h"
#include "daemon/session/messages.h"

#include <chrono>
#include <functional>
#include <mutex>
#include <string>

namespace daemon_input {

enum class HotkeyRole { Toggle, Hold };

// Turns raw key press/release events into ControlCommands. Toggle presses are
// debounced; releases of toggle keys are ignored; hold releases are never
// debounced.
class HotkeyRouter {
   public:
    using Post = std::function<void(daemon_session::ControlCommand)>;
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    HotkeyRouter(std::chrono::milliseconds debounce, Post post, Clock clock = {});

    // Thread-safe (the evdev thread and tests call it directly).
    void onKey(HotkeyRole role, bool pressed, const std::string& sourceId);

   private:
    Post post_;
    Clock clock_;
    std::mutex mutex_;
    TriggerDebouncer debouncer_;
};

}  // namespace daemon_input
