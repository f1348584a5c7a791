#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace daemon_core {

// Cooperative cancellation token, one per session. The control thread sets it;
// workers only read it between blocking operations.
class StopSignal {
   public:
    StopSignal() = default;

    StopSignal(const StopSignal&) = delete;
    StopSignal& operator=(const StopSignal&) = delete;

    void request() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            requested_.store(true, std::memory_order_release);
        }
        cv_.notify_all();
    }

    bool requested() const noexcept {
        return requested_.load(std::memory_order_acquire);
    }

    // Returns true if stop was requested before the timeout elapsed.
    bool waitFor(std::chrono::milliseconds timeout) const {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout,
                            [this] { return requested_.load(std::memory_order_acquire); });
    }

   private:
    std::atomic<bool> requested_{false};
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
};

}  // namespace daemon_core
