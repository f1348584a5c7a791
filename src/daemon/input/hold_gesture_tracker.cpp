#include "daemon/input/hold_gesture_tracker.h"

namespace daemon_input {

bool HoldGestureTracker::onPress(const std::string& sourceId) {
    return activeSources_.insert(sourceId).second;
}

bool HoldGestureTracker::onRelease(const std::string& sourceId) {
    if (activeSources_.erase(sourceId) == 0) {
        return false;
    }
    if (!activeSources_.empty() || !startedByHold_) {
        return false;
    }
    startedByHold_ = false;
    return true;
}

void HoldGestureTracker::markStarted() {
    startedByHold_ = true;
}

bool HoldGestureTracker::isActive(const std::string& sourceId) const {
    return activeSources_.count(sourceId) > 0;
}

bool HoldGestureTracker::anyActive() const {
    return !activeSources_.empty();
}

bool HoldGestureTracker::startedByHold() const {
    return startedByHold_;
}

void HoldGestureTracker::reset() {
    activeSources_.clear();
    startedByHold_ = false;
}

}  // namespace daemon_input
