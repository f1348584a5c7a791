#pragma once

#include "daemon/input/hotkey_binding.h"

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace daemon_input {

// (binding index, pressed, source id "evdev:/dev/input/eventN")
using HotkeyCallback = std::function<void(size_t, bool, const std::string&)>;

// Watches every keyboard-like /dev/input/event* node for the given bindings.
// Each device is its own key source, so one physical key seen by two nodes
// yields two press/release pairs with distinct source ids.
class EvdevHotkeyListener {
   public:
    explicit EvdevHotkeyListener(std::vector<HotkeyBinding> bindings,
                                 std::string inputDir = "/dev/input");
    ~EvdevHotkeyListener();

    EvdevHotkeyListener(const EvdevHotkeyListener&) = delete;
    EvdevHotkeyListener& operator=(const EvdevHotkeyListener&) = delete;

    // False when no readable keyboard device was found (usually a missing
    // 'input' group membership).
    bool start(HotkeyCallback callback);
    void stop();
    bool isRunning() const {
        return running_.load();
    }
    size_t deviceCount() const;

   private:
    struct Device;

    bool openKeyboards();
    void closeDevices();
    void listenLoop();

    std::vector<HotkeyBinding> bindings_;
    std::string inputDir_;
    std::vector<std::unique_ptr<Device>> devices_;
    HotkeyCallback callback_;
    std::thread thread_;
    std::atomic<bool> running_{false};
};

}  // namespace daemon_input
