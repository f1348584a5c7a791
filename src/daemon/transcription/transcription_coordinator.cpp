#include "daemon/transcription/transcription_coordinator.h"

#include "audio/audio_level.h"
#include "core/daemon_constants.h"
#include "core/error_codes.h"
#include "core/process_runner.h"
#include "daemon/transcription/temp_audio_file.h"
#include "logging/logger.h"

#include <algorithm>
#include <thread>

namespace daemon_transcription {

namespace {

using daemon_session::SessionError;
using daemon_session::TranscriptResult;

constexpr auto kChannelPollInterval = std::chrono::milliseconds(20);
constexpr auto kCallPollInterval = std::chrono::milliseconds(20);

bool cancelled(const daemon_core::StopSignal* cancel) {
    return cancel && cancel->requested();
}

TranscriptResult failure(voxd::ErrorCode code, const std::string& message) {
    return TranscriptResult{"", SessionError{code, message}};
}

std::string joinSegments(const std::string& head, const std::string& segment) {
    if (head.empty()) {
        return segment;
    }
    if (segment.empty()) {
        return head;
    }
    return head + " " + segment;
}

}  // namespace

TranscriptionCoordinator::TranscriptionCoordinator(ProviderRegistry& registry,
                                                   CoordinatorSettings settings)
    : registry_(registry), settings_(std::move(settings)) {}

const CoordinatorSettings& TranscriptionCoordinator::settings() const {
    return settings_;
}

daemon_session::ProviderMode TranscriptionCoordinator::selectMode() {
    if (!settings_.streamingEnabled) {
        return daemon_session::ProviderMode::Batch;
    }
    try {
        auto provider = registry_.get(settings_.providerName);
        if (provider->supportsStreaming()) {
            return daemon_session::ProviderMode::Streaming;
        }
    } catch (const voxd::ProviderError& e) {
        // Surfaces again, as a session error, when the batch call is made.
        LOG_WARN("Provider '{}' unavailable for capability check: {}", settings_.providerName,
                 e.what());
    }
    return daemon_session::ProviderMode::Batch;
}

std::unique_ptr<daemon_core::BackgroundTask> TranscriptionCoordinator::startBatch(
    daemon_session::SessionId sessionId, std::future<daemon_input::CapturedAudio> audio,
    daemon_input::SessionMessageQueue& messages, std::shared_ptr<daemon_core::StopSignal> cancel) {
    auto shared = std::make_shared<std::future<daemon_input::CapturedAudio>>(std::move(audio));
    return std::make_unique<daemon_core::BackgroundTask>(
        "transcribe-" + std::to_string(sessionId),
        [this, sessionId, shared, &messages, cancel = std::move(cancel)]() {
            TranscriptResult result = runBatch(shared->get(), cancel.get());
            messages.push({sessionId, std::move(result)});
        });
}

std::unique_ptr<daemon_core::BackgroundTask> TranscriptionCoordinator::startStreaming(
    daemon_session::SessionId sessionId, std::shared_ptr<daemon_input::AudioBlockChannel> channel,
    std::future<daemon_input::CapturedAudio> audio, daemon_input::SessionMessageQueue& messages,
    std::shared_ptr<daemon_core::StopSignal> cancel) {
    auto shared = std::make_shared<std::future<daemon_input::CapturedAudio>>(std::move(audio));
    return std::make_unique<daemon_core::BackgroundTask>(
        "stream-" + std::to_string(sessionId),
        [this, sessionId, channel = std::move(channel), shared, &messages,
         cancel = std::move(cancel)]() {
            TranscriptResult result =
                runStreaming(sessionId, *channel, *shared, messages, cancel.get());
            messages.push({sessionId, std::move(result)});
        });
}

TranscriptResult TranscriptionCoordinator::runBatch(daemon_input::CapturedAudio audio,
                                                    const daemon_core::StopSignal* cancel) {
    if (audio.error) {
        return TranscriptResult{"", audio.error};
    }
    if (audio.chunkCount == 0 || audio.samples.empty()) {
        LOG_INFO("No audio captured, transcription skipped");
        return TranscriptResult{};
    }
    if (!audio.speechDetected) {
        LOG_INFO("No speech detected (max rms {:.4f}), transcription skipped", audio.maxLevel);
        return TranscriptResult{};
    }

    std::vector<float> samples = std::move(audio.samples);
    if (settings_.trimSilence) {
        const size_t rawCount = samples.size();
        samples = AudioUtils::trimSilence(
            samples, audio.sampleRate, AudioUtils::trimThreshold(settings_.vadThreshold,
                                                                 audio.maxLevel),
            DaemonConstants::TRIM_WINDOW_MS, DaemonConstants::TRIM_HOP_MS,
            DaemonConstants::TRIM_PAD_MS);
        if (samples.size() < rawCount) {
            LOG_DEBUG("Trimmed silence: {:.2f}s -> {:.2f}s",
                      static_cast<double>(rawCount) / audio.sampleRate,
                      static_cast<double>(samples.size()) / audio.sampleRate);
        }
    }

    try {
        auto provider = registry_.get(settings_.providerName);
        auto started = std::chrono::steady_clock::now();
        std::string text = callProvider(provider, std::move(samples), audio.sampleRate, cancel);
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);
        if (text.empty()) {
            LOG_INFO("Provider '{}' recognized no speech ({} ms)", provider->name(),
                     elapsed.count());
        } else {
            LOG_INFO("Provider '{}' returned {} chars ({} ms)", provider->name(), text.size(),
                     elapsed.count());
        }
        return TranscriptResult{text, std::nullopt};
    } catch (const voxd::ProviderError& e) {
        if (e.code() == voxd::ErrorCode::SESSION_CANCELLED) {
            LOG_INFO("Transcription cancelled");
        } else {
            LOG_ERROR("Transcription failed [{}]: {}", voxd::errorCodeToString(e.code()),
                      e.what());
        }
        return failure(e.code(), e.what());
    } catch (const std::exception& e) {
        LOG_ERROR("Transcription failed: {}", e.what());
        return failure(voxd::ErrorCode::PROVIDER_FAILED, e.what());
    }
}

std::string TranscriptionCoordinator::callProvider(
    const std::shared_ptr<TranscriptionProvider>& provider, std::vector<float> samples,
    int sampleRate, const daemon_core::StopSignal* cancel) {
    auto promise = std::make_shared<std::promise<std::string>>();
    std::future<std::string> future = promise->get_future();
    auto callStop = std::make_shared<daemon_core::StopSignal>();
    const std::string model = settings_.model;
    const std::string language = settings_.language;

    // The call owns its inputs so that it can outlive an abandoned wait.
    std::thread call([provider, promise, callStop, model, language, sampleRate,
                      samples = std::move(samples)]() {
        try {
            if (provider->acceptsBuffer()) {
                promise->set_value(process_runner::trimWhitespace(provider->transcribe(
                    samples, sampleRate, model, language, callStop.get())));
            } else {
                TempAudioFile file(samples, sampleRate);
                promise->set_value(process_runner::trimWhitespace(
                    provider->transcribeFile(file.path(), model, language, callStop.get())));
            }
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
    });

    const auto deadline = std::chrono::steady_clock::now() + settings_.requestTimeout;
    bool timedOut = false;
    bool aborted = false;
    while (future.wait_for(kCallPollInterval) != std::future_status::ready) {
        if (cancelled(cancel)) {
            aborted = true;
            break;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            timedOut = true;
            break;
        }
    }

    if (!timedOut && !aborted) {
        call.join();
        return future.get();
    }

    callStop->request();
    if (future.wait_for(std::chrono::milliseconds(DaemonConstants::CALL_CANCEL_GRACE_MS)) ==
        std::future_status::ready) {
        call.join();
    } else {
        LOG_WARN("Provider '{}' did not return within {} ms of cancellation", provider->name(),
                 DaemonConstants::CALL_CANCEL_GRACE_MS);
        call.detach();
    }
    if (aborted) {
        throw voxd::ProviderError(voxd::ErrorCode::SESSION_CANCELLED, "transcription cancelled");
    }
    throw voxd::ProviderError(voxd::ErrorCode::PROVIDER_TIMEOUT,
                              "transcription timed out after " +
                                  std::to_string(settings_.requestTimeout.count()) + " ms");
}

TranscriptResult TranscriptionCoordinator::runStreaming(
    daemon_session::SessionId sessionId, daemon_input::AudioBlockChannel& channel,
    std::future<daemon_input::CapturedAudio>& audio, daemon_input::SessionMessageQueue& messages,
    const daemon_core::StopSignal* cancel) {
    std::unique_ptr<StreamingSession> stream;
    std::vector<std::vector<float>> preRoll;
    std::string finalText;
    std::string lastPartial;
    bool remoteClosed = false;

    auto handleEvent = [&](const StreamEvent& event) {
        switch (event.type) {
        case StreamEventType::Partial:
            if (event.text != lastPartial) {
                lastPartial = event.text;
                messages.push({sessionId, daemon_session::InterimTranscript{event.text}});
            }
            break;
        case StreamEventType::Final:
            finalText = joinSegments(finalText, process_runner::trimWhitespace(event.text));
            lastPartial.clear();
            messages.push({sessionId, daemon_session::InterimTranscript{finalText}});
            break;
        case StreamEventType::Closed:
            remoteClosed = true;
            break;
        }
    };

    auto closeStream = [&]() {
        if (!stream) {
            return;
        }
        try {
            stream->close();
        } catch (const std::exception& e) {
            LOG_WARN("Closing streaming session failed: {}", e.what());
        }
        stream.reset();
    };

    // Asks the control thread to stop capturing when we end before it does.
    auto requestStop = [&]() {
        if (!channel.finished()) {
            messages.push({sessionId, daemon_session::StatusUpdate{
                                          daemon_session::AppState::Transcribing}});
        }
    };

    try {
        std::shared_ptr<TranscriptionProvider> provider;
        while (!remoteClosed) {
            if (cancelled(cancel)) {
                LOG_INFO("Streaming transcription cancelled");
                closeStream();
                return failure(voxd::ErrorCode::SESSION_CANCELLED, "transcription cancelled");
            }
            auto block = channel.pop(kChannelPollInterval);
            if (block) {
                if (stream) {
                    stream->sendAudio(*block);
                } else {
                    float level = AudioUtils::computeRms(*block);
                    preRoll.push_back(std::move(*block));
                    if (level > settings_.vadThreshold) {
                        provider = registry_.get(settings_.providerName);
                        stream = provider->openStream(settings_.sampleRate, settings_.model,
                                                      settings_.language);
                        LOG_INFO("Streaming session opened on '{}' ({} pre-roll blocks)",
                                 provider->name(), preRoll.size());
                        messages.push({sessionId, daemon_session::StatusUpdate{
                                                      daemon_session::AppState::Recording}});
                        for (const auto& pending : preRoll) {
                            stream->sendAudio(pending);
                        }
                        preRoll.clear();
                    }
                }
            }
            if (stream) {
                while (auto event = stream->nextEvent(std::chrono::milliseconds(0))) {
                    handleEvent(*event);
                    if (remoteClosed) {
                        break;
                    }
                }
            }
            if (!block && channel.finished()) {
                break;
            }
        }

        if (remoteClosed) {
            LOG_INFO("Streaming session closed by provider");
            requestStop();
            closeStream();
            return TranscriptResult{finalText.empty() ? lastPartial : finalText, std::nullopt};
        }

        daemon_input::CapturedAudio captured = audio.get();
        if (captured.error) {
            closeStream();
            return TranscriptResult{"", captured.error};
        }
        if (!stream) {
            LOG_INFO("No speech detected (max rms {:.4f}), streaming session never opened",
                     captured.maxLevel);
            return TranscriptResult{};
        }

        stream->finalize();
        auto deadline = std::chrono::steady_clock::now() + settings_.finalizeTimeout;
        while (!remoteClosed && !cancelled(cancel) &&
               std::chrono::steady_clock::now() < deadline) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            auto event = stream->nextEvent(
                std::clamp(remaining, std::chrono::milliseconds(1), kChannelPollInterval));
            if (event) {
                handleEvent(*event);
            }
        }
        if (cancelled(cancel)) {
            closeStream();
            return failure(voxd::ErrorCode::SESSION_CANCELLED, "transcription cancelled");
        }
        if (!remoteClosed) {
            LOG_WARN("Streaming session did not close within {} ms, using received text",
                     settings_.finalizeTimeout.count());
        }
        closeStream();
        return TranscriptResult{finalText.empty() ? lastPartial : finalText, std::nullopt};
    } catch (const voxd::ProviderError& e) {
        LOG_ERROR("Streaming transcription failed [{}]: {}", voxd::errorCodeToString(e.code()),
                  e.what());
        closeStream();
        requestStop();
        return failure(e.code(), e.what());
    } catch (const std::exception& e) {
        LOG_ERROR("Streaming transcription failed: {}", e.what());
        closeStream();
        requestStop();
        return failure(voxd::ErrorCode::PROVIDER_FAILED, e.what());
    }
}

}  // namespace daemon_transcription
