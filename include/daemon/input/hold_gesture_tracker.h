#pragma once

#include <set>
#include <string>

namespace daemon_input {

// Resolves hold-to-talk press/release across several key sources that may
// observe the same physical key (e.g. two evdev nodes of one keyboard, or
// evdev plus the control socket).
class HoldGestureTracker {
   public:
    // True only the first time this source becomes active (key repeat and
    // duplicate presses return false).
    bool onPress(const std::string& sourceId);

    // True only when the last active source is released and the running
    // session was started by a hold gesture.
    bool onRelease(const std::string& sourceId);

    // The running session was started by hold (as opposed to toggle).
    void markStarted();

    bool isActive(const std::string& sourceId) const;
    bool anyActive() const;
    bool startedByHold() const;

    void reset();

   private:
    std::set<std::string> activeSources_;
    bool startedByHold_ = false;
};

}  // namespace daemon_input
