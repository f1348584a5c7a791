#pragma once

#include <atomic>
#include <functional>
#include <string>
#include <thread>

namespace daemon_core {

// Runs one function on its own thread. The owner polls finished() and joins
// only completed tasks; the destructor joins unconditionally.
class BackgroundTask {
   public:
    BackgroundTask(std::string name, std::function<void()> fn);
    ~BackgroundTask();

    BackgroundTask(const BackgroundTask&) = delete;
    BackgroundTask& operator=(const BackgroundTask&) = delete;

    bool finished() const;
    void join();

    const std::string& name() const;

   private:
    std::string name_;
    std::atomic<bool> finished_{false};
    std::thread thread_;
};

}  // namespace daemon_core
