#include "core/error_codes.h"
#include "daemon/core/stop_signal.h"
#include "daemon/transcription/command_provider.h"
#include "daemon/transcription/temp_audio_file.h"

#include <filesystem>
#include <gtest/gtest.h>
#include <thread>

using namespace std::chrono_literals;
using daemon_transcription::CommandProvider;
using daemon_transcription::TempAudioFile;

namespace {

voxd::ErrorCode codeOf(CommandProvider& provider, const std::string& path) {
    try {
        provider.transcribeFile(path, "base", "en", nullptr);
    } catch (const voxd::ProviderError& e) {
        return e.code();
    }
    return voxd::ErrorCode::OK;
}

}  // namespace

TEST(CommandProviderTest, ReportsFileOnlyBackend) {
    CommandProvider provider({"echo"}, 1000ms);
    EXPECT_EQ(provider.name(), "command");
    EXPECT_FALSE(provider.acceptsBuffer());
    EXPECT_FALSE(provider.supportsStreaming());
}

TEST(CommandProviderTest, SubstitutesPlaceholdersAndTrimsStdout) {
    CommandProvider provider({"echo", "  {model}", "{language}", "{audio}  "}, 2000ms);
    EXPECT_EQ(provider.transcribeFile("/tmp/rec.wav", "base", "en", nullptr),
              "base en /tmp/rec.wav");
}

TEST(CommandProviderTest, ReadsRecordingFromTempFile) {
    TempAudioFile file(std::vector<float>(1600, 0.1f), 16000);
    ASSERT_TRUE(std::filesystem::exists(file.path()));

    CommandProvider provider({"sh", "-c", "test -s \"$0\" && echo heard", "{audio}"}, 2000ms);
    EXPECT_EQ(provider.transcribeFile(file.path(), "", "", nullptr), "heard");
}

TEST(CommandProviderTest, TempFileRemovedOnDestruction) {
    std::string path;
    {
        TempAudioFile file(std::vector<float>(160, 0.0f), 16000);
        path = file.path();
        EXPECT_TRUE(std::filesystem::exists(path));
    }
    EXPECT_FALSE(std::filesystem::exists(path));
}

TEST(CommandProviderTest, EmptyOutputIsNoSpeech) {
    CommandProvider provider({"true"}, 2000ms);
    EXPECT_EQ(provider.transcribeFile("/tmp/rec.wav", "", "", nullptr), "");
}

TEST(CommandProviderTest, NonZeroExitIsProviderFailure) {
    CommandProvider provider({"sh", "-c", "echo model missing >&2; exit 2"}, 2000ms);
    try {
        provider.transcribeFile("/tmp/rec.wav", "", "", nullptr);
        FAIL() << "expected ProviderError";
    } catch (const voxd::ProviderError& e) {
        EXPECT_EQ(e.code(), voxd::ErrorCode::PROVIDER_FAILED);
        EXPECT_NE(std::string(e.what()).find("model missing"), std::string::npos);
    }
}

TEST(CommandProviderTest, MissingBinaryIsUnavailable) {
    CommandProvider provider({"voxd-no-such-recognizer", "{audio}"}, 2000ms);
    EXPECT_EQ(codeOf(provider, "/tmp/rec.wav"), voxd::ErrorCode::PROVIDER_UNAVAILABLE);
}

TEST(CommandProviderTest, EmptyCommandIsUnavailable) {
    CommandProvider provider({}, 2000ms);
    EXPECT_EQ(codeOf(provider, "/tmp/rec.wav"), voxd::ErrorCode::PROVIDER_UNAVAILABLE);
}

TEST(CommandProviderTest, SlowRecognizerTimesOut) {
    CommandProvider provider({"sleep", "5"}, 100ms);
    EXPECT_EQ(codeOf(provider, "/tmp/rec.wav"), voxd::ErrorCode::PROVIDER_TIMEOUT);
}

TEST(CommandProviderTest, CancelKillsRecognizer) {
    CommandProvider provider({"sleep", "5"}, 10000ms);
    daemon_core::StopSignal cancel;
    std::thread canceller([&cancel] {
        std::this_thread::sleep_for(100ms);
        cancel.request();
    });

    auto start = std::chrono::steady_clock::now();
    try {
        provider.transcribeFile("/tmp/rec.wav", "", "", &cancel);
        ADD_FAILURE() << "expected ProviderError";
    } catch (const voxd::ProviderError& e) {
        EXPECT_EQ(e.code(), voxd::ErrorCode::SESSION_CANCELLED);
    }
    auto elapsed = std::chrono::steady_clock::now() - start;
    canceller.join();
    EXPECT_LT(elapsed, 2s);
}
