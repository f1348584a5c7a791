#include "daemon/transcription/refine_fallback.h"

#include "core/error_codes.h"
#include "core/process_runner.h"
#include "logging/logger.h"

#include <cerrno>
#include <cstring>

namespace daemon_transcription {

CommandRefiner::CommandRefiner(std::vector<std::string> argv, std::chrono::milliseconds timeout)
    : argv_(std::move(argv)), timeout_(timeout) {}

std::string CommandRefiner::name() const {
    return argv_.empty() ? std::string("command") : argv_.front();
}

std::string CommandRefiner::refine(const std::string& text,
                                   const daemon_core::StopSignal* cancel) {
    if (argv_.empty()) {
        throw voxd::RefineError("refine.command is empty");
    }
    auto result = process_runner::run(argv_, text, timeout_, cancel);
    if (result.spawnError != 0) {
        throw voxd::RefineError("cannot start '" + argv_[0] +
                                "': " + std::strerror(result.spawnError));
    }
    if (result.cancelled) {
        throw voxd::RefineError(voxd::ErrorCode::SESSION_CANCELLED, "refine cancelled");
    }
    if (result.timedOut) {
        throw voxd::RefineError(voxd::ErrorCode::PROVIDER_TIMEOUT,
                                "refine timed out after " + std::to_string(timeout_.count()) +
                                    " ms");
    }
    if (!result.ok()) {
        throw voxd::RefineError("refine command exited with status " +
                                std::to_string(result.exitCode));
    }
    return result.out;
}

RefineFallback::RefineFallback(std::shared_ptr<Refiner> refiner) : refiner_(std::move(refiner)) {}

bool RefineFallback::enabled() const {
    return refiner_ != nullptr;
}

std::string RefineFallback::maybeRefine(const std::string& text) const {
    return refineWithOutcome(text).text;
}

RefineOutcome RefineFallback::refineWithOutcome(const std::string& text,
                                                const daemon_core::StopSignal* cancel) const {
    if (!refiner_ || process_runner::trimWhitespace(text).empty()) {
        return RefineOutcome{text, false};
    }

    try {
        std::string refined = process_runner::trimWhitespace(refiner_->refine(text, cancel));
        if (refined.empty()) {
            LOG_WARN("Refine '{}' returned an empty result, keeping transcript",
                     refiner_->name());
            return RefineOutcome{text, false};
        }
        return RefineOutcome{refined, true};
    } catch (const voxd::DaemonError& e) {
        LOG_WARN("Refine '{}' failed [{}]: {}, keeping transcript", refiner_->name(),
                 voxd::errorCodeToString(e.code()), e.what());
    } catch (const std::exception& e) {
        LOG_WARN("Refine '{}' failed: {}, keeping transcript", refiner_->name(), e.what());
    }
    return RefineOutcome{text, false};
}

}  // namespace daemon_transcription
