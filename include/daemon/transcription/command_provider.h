#pragma once

#include "daemon/transcription/transcription_provider.h"

#include <chrono>
#include <string>
#include <vector>

namespace daemon_transcription {

// Runs an external recognizer (e.g. whisper.cpp's whisper-cli) on a WAV file.
// Placeholders in argv: {audio}, {model}, {language}. The transcript is the
// trimmed stdout.
class CommandProvider : public TranscriptionProvider {
   public:
    CommandProvider(std::vector<std::string> argv, std::chrono::milliseconds timeout);

    std::string name() const override;
    bool acceptsBuffer() const override;

    // Throws PROVIDER_TIMEOUT when the recognizer outlives the timeout and
    // SESSION_CANCELLED when `cancel` fires; the child is killed in both cases.
    std::string transcribeFile(const std::string& path, const std::string& model,
                               const std::string& language,
                               const daemon_core::StopSignal* cancel) override;

   private:
    std::vector<std::string> argv_;
    std::chrono::milliseconds timeout_;
};

}  // namespace daemon_transcription
