#include "daemon/output/transcript_sink.h"

#include "core/process_runner.h"
#include "logging/logger.h"

#include <cstring>

namespace daemon_output {

CommandTranscriptSink::CommandTranscriptSink(std::vector<std::string> argv,
                                             std::chrono::milliseconds timeout)
    : argv_(std::move(argv)), timeout_(timeout) {}

bool CommandTranscriptSink::deliver(const std::string& text) {
    if (argv_.empty()) {
        return false;
    }
    auto result = process_runner::run(argv_, text, timeout_);
    if (result.spawnError != 0) {
        LOG_ERROR("Delivery: cannot start '{}': {}", argv_[0], std::strerror(result.spawnError));
        return false;
    }
    if (result.timedOut) {
        LOG_ERROR("Delivery: '{}' timed out after {} ms", argv_[0], timeout_.count());
        return false;
    }
    if (!result.ok()) {
        LOG_ERROR("Delivery: '{}' exited with status {}", argv_[0], result.exitCode);
        return false;
    }
    LOG_DEBUG("Delivery: {} chars via {}", text.size(), argv_[0]);
    return true;
}

}  // namespace daemon_output
