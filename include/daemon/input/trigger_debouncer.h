#pragma once

#include <chrono>
#include <optional>

namespace daemon_input {

// Filters toggle presses that arrive within the debounce interval of the
// previously accepted one (double-fire, auto-repeat).
class TriggerDebouncer {
   public:
    using TimePoint = std::chrono::steady_clock::time_point;

    explicit TriggerDebouncer(std::chrono::milliseconds interval) : interval_(interval) {}

    bool accept(TimePoint now) {
        if (lastAccepted_ && now - *lastAccepted_ < interval_) {
            return false;
        }
        lastAccepted_ = now;
        return true;
    }

    void reset() {
        lastAccepted_.reset();
    }

   private:
    std::chrono::milliseconds interval_;
    std::optional<TimePoint> lastAccepted_;
};

}  // namespace daemon_input
