#include "daemon/core/background_task.h"

#include "logging/logger.h"

#include <exception>

namespace daemon_core {

BackgroundTask::BackgroundTask(std::string name, std::function<void()> fn)
    : name_(std::move(name)) {
    thread_ = std::thread([this, fn = std::move(fn)]() {
        try {
            fn();
        } catch (const std::exception& e) {
            LOG_ERROR("[{}] Task failed: {}", name_, e.what());
        }
        finished_.store(true, std::memory_order_release);
    });
}

BackgroundTask::~BackgroundTask() {
    join();
}

bool BackgroundTask::finished() const {
    return finished_.load(std::memory_order_acquire);
}

void BackgroundTask::join() {
    if (thread_.joinable()) {
        thread_.join();
    }
}

const std::string& BackgroundTask::name() const {
    return name_;
}

}  // namespace daemon_core
