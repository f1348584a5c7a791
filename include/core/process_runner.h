#ifndef VOXD_PROCESS_RUNNER_H
#define VOXD_PROCESS_RUNNER_H

#include <chrono>
#include <string>
#include <utility>
#include <vector>

namespace daemon_core {
class StopSignal;
}  // namespace daemon_core

namespace process_runner {

struct ProcessResult {
    int exitCode = -1;      // valid when exited is true
    bool exited = false;    // terminated normally
    bool timedOut = false;  // killed after the timeout
    bool cancelled = false; // killed because the cancel signal fired
    int spawnError = 0;     // errno from posix_spawnp, 0 on success
    std::string out;
    std::string err;

    bool ok() const {
        return spawnError == 0 && exited && exitCode == 0;
    }
};

// Runs argv[0] (PATH lookup) with stdinData on stdin and collects stdout and
// stderr. The child is killed (SIGTERM, then SIGKILL) when the timeout
// elapses or cancel is requested.
ProcessResult run(const std::vector<std::string>& argv, const std::string& stdinData,
                  std::chrono::milliseconds timeout,
                  const daemon_core::StopSignal* cancel = nullptr);

// Replaces every "{key}" in each argument.
std::vector<std::string> substitute(const std::vector<std::string>& argv,
                                    const std::vector<std::pair<std::string, std::string>>& vars);

std::string trimWhitespace(const std::string& text);

std::string joinArgs(const std::vector<std::string>& argv);

}  // namespace process_runner

#endif  // VOXD_PROCESS_RUNNER_H
