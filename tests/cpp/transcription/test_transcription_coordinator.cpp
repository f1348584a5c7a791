#include "daemon/transcription/transcription_coordinator.h"
#include "fake_provider.h"

#include <chrono>
#include <gtest/gtest.h>
#include <thread>
#include <variant>

using namespace std::chrono_literals;
using daemon_input::CapturedAudio;
using daemon_session::DaemonMessage;
using daemon_session::ProviderMode;
using daemon_transcription::CoordinatorSettings;
using daemon_transcription::ProviderRegistry;
using daemon_transcription::TranscriptionCoordinator;
using voxd_test::FakeProvider;

namespace {

CapturedAudio speech(size_t samples = 16000, float amplitude = 0.3f) {
    CapturedAudio audio;
    audio.samples.assign(samples, amplitude);
    audio.sampleRate = 16000;
    audio.chunkCount = samples / 1600 + 1;
    audio.maxLevel = amplitude;
    audio.speechDetected = true;
    return audio;
}

std::future<CapturedAudio> ready(CapturedAudio audio) {
    std::promise<CapturedAudio> promise;
    promise.set_value(std::move(audio));
    return promise.get_future();
}

void pushBlock(daemon_input::AudioBlockChannel& channel, float amplitude, size_t frames = 1600) {
    std::vector<float> block(frames, amplitude);
    ASSERT_TRUE(channel.tryPush(block));
}

}  // namespace

class TranscriptionCoordinatorTest : public ::testing::Test {
   protected:
    void SetUp() override {
        provider = std::make_shared<FakeProvider>();
        registry.registerFactory("fake", [this] { return provider; });
        settings.providerName = "fake";
        settings.trimSilence = false;
        settings.requestTimeout = 5000ms;
        settings.finalizeTimeout = 500ms;
    }

    std::vector<DaemonMessage> drainMessages() {
        return messages.drain(1000);
    }

    std::shared_ptr<FakeProvider> provider;
    ProviderRegistry registry;
    CoordinatorSettings settings;
    daemon_input::SessionMessageQueue messages;
};

// ============================================================
// Mode selection
// ============================================================

TEST_F(TranscriptionCoordinatorTest, BatchWhenProviderCannotStream) {
    TranscriptionCoordinator coordinator(registry, settings);
    EXPECT_EQ(coordinator.selectMode(), ProviderMode::Batch);
}

TEST_F(TranscriptionCoordinatorTest, StreamingWhenSupportedAndEnabled) {
    provider->streaming = true;
    TranscriptionCoordinator coordinator(registry, settings);
    EXPECT_EQ(coordinator.selectMode(), ProviderMode::Streaming);
}

TEST_F(TranscriptionCoordinatorTest, BatchWhenStreamingDisabledByConfig) {
    provider->streaming = true;
    settings.streamingEnabled = false;
    TranscriptionCoordinator coordinator(registry, settings);
    EXPECT_EQ(coordinator.selectMode(), ProviderMode::Batch);
}

TEST_F(TranscriptionCoordinatorTest, BatchWhenProviderUnknown) {
    settings.providerName = "missing";
    TranscriptionCoordinator coordinator(registry, settings);
    EXPECT_EQ(coordinator.selectMode(), ProviderMode::Batch);
}

// ============================================================
// Batch strategy
// ============================================================

TEST_F(TranscriptionCoordinatorTest, BatchReturnsTrimmedTranscript) {
    provider->reply = "  hello world \n";
    TranscriptionCoordinator coordinator(registry, settings);

    auto result = coordinator.runBatch(speech());
    EXPECT_FALSE(result.error.has_value());
    EXPECT_EQ(result.text, "hello world");
    EXPECT_EQ(provider->batchCalls.load(), 1);
    EXPECT_EQ(provider->lastSampleCount.load(), 16000u);
}

TEST_F(TranscriptionCoordinatorTest, EmptyAudioSkipsProvider) {
    TranscriptionCoordinator coordinator(registry, settings);

    auto result = coordinator.runBatch(CapturedAudio{});
    EXPECT_FALSE(result.error.has_value());
    EXPECT_EQ(result.text, "");
    EXPECT_EQ(provider->batchCalls.load(), 0);
}

TEST_F(TranscriptionCoordinatorTest, SilentAudioSkipsProvider) {
    TranscriptionCoordinator coordinator(registry, settings);
    auto audio = speech(16000, 0.001f);
    audio.speechDetected = false;

    auto result = coordinator.runBatch(std::move(audio));
    EXPECT_FALSE(result.error.has_value());
    EXPECT_EQ(result.text, "");
    EXPECT_EQ(provider->batchCalls.load(), 0);
}

TEST_F(TranscriptionCoordinatorTest, CaptureErrorPassesThrough) {
    TranscriptionCoordinator coordinator(registry, settings);
    CapturedAudio audio;
    audio.error = daemon_session::SessionError{voxd::ErrorCode::CAPTURE_DEVICE_UNAVAILABLE,
                                               "no microphone"};

    auto result = coordinator.runBatch(std::move(audio));
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->code, voxd::ErrorCode::CAPTURE_DEVICE_UNAVAILABLE);
    EXPECT_EQ(provider->batchCalls.load(), 0);
}

TEST_F(TranscriptionCoordinatorTest, ProviderErrorBecomesResultError) {
    provider->failWith = voxd::ErrorCode::PROVIDER_AUTH;
    TranscriptionCoordinator coordinator(registry, settings);

    auto result = coordinator.runBatch(speech());
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->code, voxd::ErrorCode::PROVIDER_AUTH);
    EXPECT_EQ(result.text, "");
}

TEST_F(TranscriptionCoordinatorTest, UnknownProviderIsUnavailable) {
    settings.providerName = "missing";
    TranscriptionCoordinator coordinator(registry, settings);

    auto result = coordinator.runBatch(speech());
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->code, voxd::ErrorCode::PROVIDER_UNAVAILABLE);
}

TEST_F(TranscriptionCoordinatorTest, SlowProviderTimesOut) {
    provider->delay = 500ms;
    settings.requestTimeout = 50ms;
    TranscriptionCoordinator coordinator(registry, settings);

    auto start = std::chrono::steady_clock::now();
    auto result = coordinator.runBatch(speech());
    auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->code, voxd::ErrorCode::PROVIDER_TIMEOUT);
    EXPECT_LT(elapsed, 400ms);
    // The timed-out call was told to stop and has returned.
    EXPECT_EQ(provider->cancelledCalls.load(), 1);
}

TEST_F(TranscriptionCoordinatorTest, CancelAbortsRunningProviderCall) {
    provider->delay = 5000ms;
    settings.requestTimeout = 10000ms;
    TranscriptionCoordinator coordinator(registry, settings);

    daemon_core::StopSignal cancel;
    std::thread canceller([&cancel] {
        std::this_thread::sleep_for(100ms);
        cancel.request();
    });

    auto start = std::chrono::steady_clock::now();
    auto result = coordinator.runBatch(speech(), &cancel);
    auto elapsed = std::chrono::steady_clock::now() - start;
    canceller.join();

    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->code, voxd::ErrorCode::SESSION_CANCELLED);
    EXPECT_EQ(provider->cancelledCalls.load(), 1);
    EXPECT_LT(elapsed, 1000ms);
}

TEST_F(TranscriptionCoordinatorTest, TrimSilenceShortensProviderInput) {
    settings.trimSilence = true;
    TranscriptionCoordinator coordinator(registry, settings);

    CapturedAudio audio = speech(0);
    audio.samples.assign(16000, 0.0f);
    audio.samples.insert(audio.samples.end(), 8000, 0.3f);
    audio.samples.insert(audio.samples.end(), 16000, 0.0f);
    audio.chunkCount = 25;

    auto result = coordinator.runBatch(std::move(audio));
    EXPECT_FALSE(result.error.has_value());
    EXPECT_LT(provider->lastSampleCount.load(), 40000u);
    EXPECT_GE(provider->lastSampleCount.load(), 8000u);
}

namespace {

class FileOnlyProvider : public FakeProvider {
   public:
    bool acceptsBuffer() const override {
        return false;
    }
};

}  // namespace

TEST_F(TranscriptionCoordinatorTest, FileProvidersReceiveDecodedRecording) {
    auto fileProvider = std::make_shared<FileOnlyProvider>();
    registry.registerFactory("file", [fileProvider] { return fileProvider; });
    settings.providerName = "file";
    TranscriptionCoordinator coordinator(registry, settings);

    auto result = coordinator.runBatch(speech(3200));
    EXPECT_FALSE(result.error.has_value());
    EXPECT_EQ(result.text, "hello world");
    EXPECT_EQ(fileProvider->lastSampleCount.load(), 3200u);
}

TEST_F(TranscriptionCoordinatorTest, StartBatchPostsResultForSession) {
    TranscriptionCoordinator coordinator(registry, settings);
    auto task = coordinator.startBatch(42, ready(speech()), messages);
    task->join();

    auto sent = drainMessages();
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0].sessionId, 42u);
    const auto* result = std::get_if<daemon_session::TranscriptResult>(&sent[0].payload);
    ASSERT_NE(result, nullptr);
    EXPECT_EQ(result->text, "hello world");
}

// ============================================================
// Streaming strategy
// ============================================================

TEST_F(TranscriptionCoordinatorTest, StreamingCollectsPartialsAndFinal) {
    provider->streaming = true;
    TranscriptionCoordinator coordinator(registry, settings);

    daemon_input::AudioBlockChannel channel(16);
    pushBlock(channel, 0.3f);
    pushBlock(channel, 0.3f);
    channel.close();
    auto audio = ready(speech(3200));

    auto result = coordinator.runStreaming(9, channel, audio, messages);
    EXPECT_FALSE(result.error.has_value());
    EXPECT_EQ(result.text, "hello world");

    auto stream = provider->lastStream();
    ASSERT_NE(stream, nullptr);
    EXPECT_EQ(stream->blocksSent.load(), 2u);
    EXPECT_TRUE(stream->finalized.load());
    EXPECT_TRUE(stream->closed.load());

    auto sent = drainMessages();
    std::vector<std::string> interims;
    bool sawRecording = false;
    for (const auto& msg : sent) {
        EXPECT_EQ(msg.sessionId, 9u);
        if (const auto* interim = std::get_if<daemon_session::InterimTranscript>(&msg.payload)) {
            interims.push_back(interim->text);
        }
        if (const auto* status = std::get_if<daemon_session::StatusUpdate>(&msg.payload)) {
            sawRecording = sawRecording || status->state == daemon_session::AppState::Recording;
        }
    }
    EXPECT_TRUE(sawRecording);
    ASSERT_EQ(interims.size(), 3u);
    EXPECT_EQ(interims[0], "hel");
    EXPECT_EQ(interims[1], "hello");
    EXPECT_EQ(interims[2], "hello world");
}

TEST_F(TranscriptionCoordinatorTest, StreamingOpensLazilyWithPreRoll) {
    provider->streaming = true;
    TranscriptionCoordinator coordinator(registry, settings);

    daemon_input::AudioBlockChannel channel(16);
    pushBlock(channel, 0.001f);
    pushBlock(channel, 0.001f);
    pushBlock(channel, 0.3f);
    channel.close();
    auto audio = ready(speech(4800));

    auto result = coordinator.runStreaming(1, channel, audio, messages);
    EXPECT_FALSE(result.error.has_value());
    EXPECT_EQ(provider->streamsOpened.load(), 1);
    EXPECT_EQ(provider->lastStream()->blocksSent.load(), 3u);
}

TEST_F(TranscriptionCoordinatorTest, SilentStreamingNeverOpensSession) {
    provider->streaming = true;
    TranscriptionCoordinator coordinator(registry, settings);

    daemon_input::AudioBlockChannel channel(16);
    pushBlock(channel, 0.001f);
    pushBlock(channel, 0.002f);
    channel.close();
    auto quiet = speech(3200, 0.002f);
    quiet.speechDetected = false;
    auto audio = ready(std::move(quiet));

    auto result = coordinator.runStreaming(1, channel, audio, messages);
    EXPECT_FALSE(result.error.has_value());
    EXPECT_EQ(result.text, "");
    EXPECT_EQ(provider->streamsOpened.load(), 0);
}

TEST_F(TranscriptionCoordinatorTest, StreamingOpenFailureIsResultError) {
    provider->streaming = true;
    provider->failWith = voxd::ErrorCode::PROVIDER_NETWORK;
    TranscriptionCoordinator coordinator(registry, settings);

    daemon_input::AudioBlockChannel channel(16);
    pushBlock(channel, 0.3f);
    auto audio = ready(speech(1600));

    auto result = coordinator.runStreaming(1, channel, audio, messages);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->code, voxd::ErrorCode::PROVIDER_NETWORK);

    // Capture is still running, so the worker asks for a stop.
    auto sent = drainMessages();
    ASSERT_FALSE(sent.empty());
    const auto* status = std::get_if<daemon_session::StatusUpdate>(&sent.back().payload);
    ASSERT_NE(status, nullptr);
    EXPECT_EQ(status->state, daemon_session::AppState::Transcribing);
}

TEST_F(TranscriptionCoordinatorTest, StreamingCaptureErrorPassesThrough) {
    provider->streaming = true;
    TranscriptionCoordinator coordinator(registry, settings);

    daemon_input::AudioBlockChannel channel(16);
    channel.close();
    CapturedAudio failed;
    failed.error = daemon_session::SessionError{voxd::ErrorCode::CAPTURE_READ_FAILED, "xrun"};
    auto audio = ready(std::move(failed));

    auto result = coordinator.runStreaming(1, channel, audio, messages);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->code, voxd::ErrorCode::CAPTURE_READ_FAILED);
}

TEST_F(TranscriptionCoordinatorTest, RemoteCloseEndsSessionWithLatestText) {
    provider->streaming = true;
    provider->partials = {"good morning"};
    TranscriptionCoordinator coordinator(registry, settings);

    daemon_input::AudioBlockChannel channel(16);
    std::promise<CapturedAudio> capture;
    auto audio = capture.get_future();
    pushBlock(channel, 0.3f);

    daemon_session::TranscriptResult result;
    std::thread worker([&] { result = coordinator.runStreaming(3, channel, audio, messages); });

    auto deadline = std::chrono::steady_clock::now() + 2s;
    auto opened = [&] {
        auto stream = provider->lastStream();
        return stream && stream->blocksSent.load() > 0;
    };
    while (!opened() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }
    ASSERT_TRUE(opened());
    provider->lastStream()->push({daemon_transcription::StreamEventType::Closed, ""});
    worker.join();

    EXPECT_FALSE(result.error.has_value());
    EXPECT_EQ(result.text, "good morning");

    auto sent = drainMessages();
    ASSERT_FALSE(sent.empty());
    const auto* status = std::get_if<daemon_session::StatusUpdate>(&sent.back().payload);
    ASSERT_NE(status, nullptr);
    EXPECT_EQ(status->state, daemon_session::AppState::Transcribing);

    channel.close();
    capture.set_value(CapturedAudio{});
}

TEST_F(TranscriptionCoordinatorTest, CancelClosesOpenStream) {
    provider->streaming = true;
    TranscriptionCoordinator coordinator(registry, settings);

    daemon_input::AudioBlockChannel channel(16);
    std::promise<CapturedAudio> capture;
    auto audio = capture.get_future();
    pushBlock(channel, 0.3f);

    daemon_core::StopSignal cancel;
    daemon_session::TranscriptResult result;
    std::thread worker(
        [&] { result = coordinator.runStreaming(4, channel, audio, messages, &cancel); });

    auto deadline = std::chrono::steady_clock::now() + 2s;
    while (!provider->lastStream() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }
    ASSERT_NE(provider->lastStream(), nullptr);
    cancel.request();
    worker.join();

    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->code, voxd::ErrorCode::SESSION_CANCELLED);
    EXPECT_TRUE(provider->lastStream()->closed.load());

    channel.close();
    capture.set_value(CapturedAudio{});
}
