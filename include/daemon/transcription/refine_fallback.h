#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace daemon_core {
class StopSignal;
}  // namespace daemon_core

namespace daemon_transcription {

// Post-processing of a finished transcript (LLM cleanup, punctuation, ...).
// May throw anything derived from std::exception. `cancel` may be null.
class Refiner {
   public:
    virtual ~Refiner() = default;
    virtual std::string name() const = 0;
    virtual std::string refine(const std::string& text, const daemon_core::StopSignal* cancel) = 0;
};

// Text on stdin, refined text on stdout.
class CommandRefiner : public Refiner {
   public:
    CommandRefiner(std::vector<std::string> argv, std::chrono::milliseconds timeout);

    std::string name() const override;
    // Throws voxd::RefineError on spawn failure, timeout, cancel or non-zero exit.
    std::string refine(const std::string& text, const daemon_core::StopSignal* cancel) override;

   private:
    std::vector<std::string> argv_;
    std::chrono::milliseconds timeout_;
};

struct RefineOutcome {
    std::string text;
    bool refined = false;  // false when the input was returned unchanged
};

// Best-effort wrapper: every refine failure, and any blank result, yields the
// original transcript. Never throws.
class RefineFallback {
   public:
    explicit RefineFallback(std::shared_ptr<Refiner> refiner);

    bool enabled() const;

    std::string maybeRefine(const std::string& text) const;
    RefineOutcome refineWithOutcome(const std::string& text,
                                    const daemon_core::StopSignal* cancel = nullptr) const;

   private:
    std::shared_ptr<Refiner> refiner_;
};

}  // namespace daemon_transcription
