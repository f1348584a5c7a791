#include "daemon/transcription/command_provider.h"

#include "core/error_codes.h"
#include "core/process_runner.h"
#include "logging/logger.h"

#include <cerrno>
#include <cstring>

namespace daemon_transcription {

CommandProvider::CommandProvider(std::vector<std::string> argv, std::chrono::milliseconds timeout)
    : argv_(std::move(argv)), timeout_(timeout) {}

std::string CommandProvider::name() const {
    return "command";
}

bool CommandProvider::acceptsBuffer() const {
    return false;
}

std::string CommandProvider::transcribeFile(const std::string& path, const std::string& model,
                                            const std::string& language,
                                            const daemon_core::StopSignal* cancel) {
    if (argv_.empty()) {
        throw voxd::ProviderError(voxd::ErrorCode::PROVIDER_UNAVAILABLE,
                                  "transcription.command is empty");
    }
    auto argv = process_runner::substitute(
        argv_, {{"audio", path}, {"model", model}, {"language", language}});
    LOG_DEBUG("Running recognizer: {}", process_runner::joinArgs(argv));

    auto result = process_runner::run(argv, "", timeout_, cancel);
    if (result.spawnError != 0) {
        auto code = result.spawnError == ENOENT ? voxd::ErrorCode::PROVIDER_UNAVAILABLE
                                                : voxd::ErrorCode::PROVIDER_FAILED;
        throw voxd::ProviderError(code, "cannot start '" + argv[0] +
                                            "': " + std::strerror(result.spawnError));
    }
    if (result.cancelled) {
        throw voxd::ProviderError(voxd::ErrorCode::SESSION_CANCELLED, "recognizer cancelled");
    }
    if (result.timedOut) {
        throw voxd::ProviderError(voxd::ErrorCode::PROVIDER_TIMEOUT,
                                  "recognizer timed out after " +
                                      std::to_string(timeout_.count()) + " ms");
    }
    if (!result.ok()) {
        std::string detail = process_runner::trimWhitespace(result.err);
        if (detail.size() > 200) {
            detail = detail.substr(0, 200);
        }
        throw voxd::ProviderError(
            voxd::ErrorCode::PROVIDER_FAILED,
            "recognizer exited with status " + std::to_string(result.exitCode) +
                (detail.empty() ? std::string() : ": " + detail));
    }
    return process_runner::trimWhitespace(result.out);
}

}  // namespace daemon_transcription
