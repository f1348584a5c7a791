#pragma once

#include "daemon/core/background_task.h"
#include "daemon/core/stop_signal.h"
#include "daemon/input/audio_capture_worker.h"
#include "daemon/session/messages.h"
#include "daemon/session/session.h"
#include "daemon/transcription/provider_registry.h"

#include <chrono>
#include <future>
#include <memory>
#include <string>

namespace daemon_transcription {

struct CoordinatorSettings {
    std::string providerName = "command";
    std::string model;
    std::string language;
    bool streamingEnabled = true;
    int sampleRate = 16000;
    float vadThreshold = 0.015f;
    bool trimSilence = true;
    std::chrono::milliseconds requestTimeout{30000};
    std::chrono::milliseconds finalizeTimeout{2000};
};

// Dispatches a session's audio to the configured provider, either as one
// batch call after capture or as an incremental streaming session during it.
// A session's `cancel` signal aborts its provider work; the result then
// carries SESSION_CANCELLED and is dropped as stale by the state machine.
class TranscriptionCoordinator {
   public:
    TranscriptionCoordinator(ProviderRegistry& registry, CoordinatorSettings settings);

    // Capability check made when a session is armed: streaming only when the
    // provider supports it and configuration enables it.
    daemon_session::ProviderMode selectMode();

    // Worker thread: waits for the captured audio, then runBatch().
    std::unique_ptr<daemon_core::BackgroundTask> startBatch(
        daemon_session::SessionId sessionId, std::future<daemon_input::CapturedAudio> audio,
        daemon_input::SessionMessageQueue& messages,
        std::shared_ptr<daemon_core::StopSignal> cancel = nullptr);

    // Worker thread for the whole recording: runStreaming().
    std::unique_ptr<daemon_core::BackgroundTask> startStreaming(
        daemon_session::SessionId sessionId,
        std::shared_ptr<daemon_input::AudioBlockChannel> channel,
        std::future<daemon_input::CapturedAudio> audio,
        daemon_input::SessionMessageQueue& messages,
        std::shared_ptr<daemon_core::StopSignal> cancel = nullptr);

    // Blocking batch strategy. Never throws; failures become result errors.
    daemon_session::TranscriptResult runBatch(daemon_input::CapturedAudio audio,
                                              const daemon_core::StopSignal* cancel = nullptr);

    // Blocking streaming strategy. Interim text and the speech confirmation
    // are posted to `messages`; the returned result is the final outcome.
    daemon_session::TranscriptResult runStreaming(daemon_session::SessionId sessionId,
                                                  daemon_input::AudioBlockChannel& channel,
                                                  std::future<daemon_input::CapturedAudio>& audio,
                                                  daemon_input::SessionMessageQueue& messages,
                                                  const daemon_core::StopSignal* cancel = nullptr);

    const CoordinatorSettings& settings() const;

   private:
    std::string callProvider(const std::shared_ptr<TranscriptionProvider>& provider,
                             std::vector<float> samples, int sampleRate,
                             const daemon_core::StopSignal* cancel);

    ProviderRegistry& registry_;
    CoordinatorSettings settings_;
};

}  // namespace daemon_transcription
