#include "daemon/input/audio_capture_worker.h"
#include "fake_audio_source.h"

#include <chrono>
#include <gtest/gtest.h>
#include <thread>
#include <variant>

using namespace std::chrono_literals;
using daemon_input::AudioCaptureWorker;
using daemon_input::CaptureWorkerDependencies;
using daemon_input::CapturedAudio;
using daemon_session::DaemonMessage;
using voxd_test::FakeAudioSource;

class AudioCaptureWorkerTest : public ::testing::Test {
   protected:
    daemon_input::SessionMessageQueue messages;
    std::shared_ptr<daemon_core::StopSignal> stop = std::make_shared<daemon_core::StopSignal>();

    CaptureWorkerDependencies deps(FakeAudioSource::Script script,
                                   std::shared_ptr<daemon_input::AudioBlockChannel> channel = {}) {
        CaptureWorkerDependencies d;
        d.sourceFactory = voxd_test::scriptedFactory(std::move(script));
        d.messages = &messages;
        d.stop = stop;
        d.streamChannel = std::move(channel);
        return d;
    }

    std::vector<DaemonMessage> drainAll() {
        return messages.drain(1000);
    }
};

TEST_F(AudioCaptureWorkerTest, ConcatenatesBlocksInOrderUntilStop) {
    FakeAudioSource::Script script;
    script.blocks = {voxd_test::toneBlock(0.1f, 4), voxd_test::toneBlock(0.2f, 4)};

    AudioCaptureWorker worker(7, 0.015f, deps(script));
    auto future = worker.takeResult();
    worker.start();

    std::this_thread::sleep_for(30ms);
    stop->request();
    ASSERT_EQ(future.wait_for(2s), std::future_status::ready);
    CapturedAudio audio = future.get();
    worker.join();

    ASSERT_EQ(audio.samples.size(), 8u);
    EXPECT_FLOAT_EQ(audio.samples[0], 0.1f);
    EXPECT_FLOAT_EQ(audio.samples[7], 0.2f);
    EXPECT_EQ(audio.chunkCount, 2u);
    EXPECT_EQ(audio.sampleRate, 16000);
    EXPECT_TRUE(audio.speechDetected);
    EXPECT_NEAR(audio.maxLevel, 0.2f, 1e-6f);
    EXPECT_FALSE(audio.error.has_value());
    EXPECT_TRUE(worker.finished());

    // One level per block; no stop hint because the stop was requested.
    auto sent = drainAll();
    ASSERT_EQ(sent.size(), 2u);
    for (const auto& msg : sent) {
        EXPECT_EQ(msg.sessionId, 7u);
        EXPECT_TRUE(std::holds_alternative<daemon_session::AudioLevel>(msg.payload));
    }
}

TEST_F(AudioCaptureWorkerTest, QuietBlocksDoNotCountAsSpeech) {
    FakeAudioSource::Script script;
    script.blocks = {voxd_test::toneBlock(0.001f), voxd_test::toneBlock(0.002f)};
    script.endAfterBlocks = true;

    AudioCaptureWorker worker(1, 0.015f, deps(script));
    auto future = worker.takeResult();
    worker.start();
    ASSERT_EQ(future.wait_for(2s), std::future_status::ready);
    auto audio = future.get();

    EXPECT_FALSE(audio.speechDetected);
    EXPECT_EQ(audio.chunkCount, 2u);
}

TEST_F(AudioCaptureWorkerTest, EndOfStreamAsksControlThreadToStop) {
    FakeAudioSource::Script script;
    script.blocks = {voxd_test::toneBlock(0.3f)};
    script.endAfterBlocks = true;

    AudioCaptureWorker worker(3, 0.015f, deps(script));
    auto future = worker.takeResult();
    worker.start();
    ASSERT_EQ(future.wait_for(2s), std::future_status::ready);
    worker.join();

    auto sent = drainAll();
    ASSERT_EQ(sent.size(), 2u);
    const auto* update = std::get_if<daemon_session::StatusUpdate>(&sent.back().payload);
    ASSERT_NE(update, nullptr);
    EXPECT_EQ(update->state, daemon_session::AppState::Transcribing);
}

TEST_F(AudioCaptureWorkerTest, OpenFailureBecomesCaptureError) {
    FakeAudioSource::Script script;
    script.failOpen = true;

    AudioCaptureWorker worker(4, 0.015f, deps(script));
    auto future = worker.takeResult();
    worker.start();
    ASSERT_EQ(future.wait_for(2s), std::future_status::ready);
    auto audio = future.get();

    ASSERT_TRUE(audio.error.has_value());
    EXPECT_EQ(audio.error->code, voxd::ErrorCode::CAPTURE_PERMISSION_DENIED);
    EXPECT_TRUE(audio.samples.empty());

    auto sent = drainAll();
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_TRUE(std::holds_alternative<daemon_session::StatusUpdate>(sent[0].payload));
}

TEST_F(AudioCaptureWorkerTest, StreamingChannelReceivesCopiesAndIsClosed) {
    auto channel = std::make_shared<daemon_input::AudioBlockChannel>(8);
    FakeAudioSource::Script script;
    script.blocks = {voxd_test::toneBlock(0.1f, 3), voxd_test::toneBlock(0.2f, 3)};
    script.endAfterBlocks = true;

    AudioCaptureWorker worker(5, 0.015f, deps(script, channel));
    auto future = worker.takeResult();
    worker.start();
    ASSERT_EQ(future.wait_for(2s), std::future_status::ready);
    auto audio = future.get();

    auto first = channel->pop(100ms);
    auto second = channel->pop(100ms);
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_FLOAT_EQ((*first)[0], 0.1f);
    EXPECT_FLOAT_EQ((*second)[0], 0.2f);
    EXPECT_TRUE(channel->finished());
    EXPECT_EQ(audio.samples.size(), 6u);
}

TEST_F(AudioCaptureWorkerTest, FullStreamingChannelDropsBlocksButKeepsRecording) {
    auto channel = std::make_shared<daemon_input::AudioBlockChannel>(1);
    FakeAudioSource::Script script;
    script.blocks = {voxd_test::toneBlock(0.1f, 2), voxd_test::toneBlock(0.1f, 2),
                     voxd_test::toneBlock(0.1f, 2)};
    script.endAfterBlocks = true;

    AudioCaptureWorker worker(6, 0.015f, deps(script, channel));
    auto future = worker.takeResult();
    worker.start();
    ASSERT_EQ(future.wait_for(2s), std::future_status::ready);
    auto audio = future.get();

    EXPECT_EQ(audio.samples.size(), 6u);
    EXPECT_TRUE(channel->pop(10ms).has_value());
    EXPECT_FALSE(channel->pop(10ms).has_value());
}

TEST_F(AudioCaptureWorkerTest, DestructorStopsRunningWorker) {
    FakeAudioSource::Script script;
    auto worker = std::make_unique<AudioCaptureWorker>(8, 0.015f, deps(script));
    auto future = worker->takeResult();
    worker->start();
    std::this_thread::sleep_for(10ms);

    worker.reset();
    EXPECT_TRUE(stop->requested());
    EXPECT_EQ(future.wait_for(0ms), std::future_status::ready);
}
