#include "audio/wav_io.h"
#include "core/error_codes.h"
#include "daemon/input/wav_file_audio_source.h"

#include <cctype>
#include <filesystem>
#include <gtest/gtest.h>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace std::chrono_literals;
using daemon_input::ReadStatus;
using daemon_input::WavFileAudioSource;

class WavFileAudioSourceTest : public ::testing::Test {
   protected:
    fs::path tempDir;

    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string name = "wav_source";
        if (info) {
            name = std::string(info->test_suite_name()) + "_" + std::string(info->name());
        }
        for (char& c : name) {
            if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-')) {
                c = '_';
            }
        }
        tempDir = fs::temp_directory_path() /
                  ("voxd_test_" + name + "_" + std::to_string(getpid()));
        fs::create_directories(tempDir);
    }

    void TearDown() override {
        fs::remove_all(tempDir);
    }

    std::string writeWav(const std::vector<float>& interleaved, int rate, int channels) {
        std::string path = (tempDir / "input.wav").string();
        AudioIO::WavWriter writer;
        EXPECT_TRUE(writer.open(path, rate, channels));
        EXPECT_TRUE(writer.writeBlock(interleaved.data(),
                                      static_cast<sf_count_t>(interleaved.size() / channels)));
        writer.close();
        return path;
    }
};

TEST_F(WavFileAudioSourceTest, ReadsBlocksThenEndOfStream) {
    std::vector<float> samples(250, 0.5f);
    auto path = writeWav(samples, 16000, 1);

    WavFileAudioSource source(path, 100, false);
    source.open();
    EXPECT_EQ(source.sampleRate(), 16000);
    EXPECT_EQ(source.describe(), "file:" + path);

    std::vector<float> block;
    ASSERT_EQ(source.read(block, 100ms), ReadStatus::Block);
    EXPECT_EQ(block.size(), 100u);
    EXPECT_NEAR(block[0], 0.5f, 1e-3f);
    ASSERT_EQ(source.read(block, 100ms), ReadStatus::Block);
    ASSERT_EQ(source.read(block, 100ms), ReadStatus::Block);
    EXPECT_EQ(block.size(), 50u);
    EXPECT_EQ(source.read(block, 100ms), ReadStatus::EndOfStream);
    source.close();
}

TEST_F(WavFileAudioSourceTest, StereoIsMixedDownToMono) {
    std::vector<float> interleaved;
    for (int i = 0; i < 64; ++i) {
        interleaved.push_back(0.5f);
        interleaved.push_back(0.0f);
    }
    auto path = writeWav(interleaved, 8000, 2);

    WavFileAudioSource source(path, 64, false);
    source.open();
    std::vector<float> block;
    ASSERT_EQ(source.read(block, 100ms), ReadStatus::Block);
    ASSERT_EQ(block.size(), 64u);
    EXPECT_NEAR(block[10], 0.25f, 1e-3f);
}

TEST_F(WavFileAudioSourceTest, MissingFileThrowsCaptureError) {
    WavFileAudioSource source((tempDir / "missing.wav").string(), 100, false);
    EXPECT_THROW(source.open(), voxd::CaptureError);
}

TEST_F(WavFileAudioSourceTest, ReadBeforeOpenThrows) {
    WavFileAudioSource source((tempDir / "missing.wav").string(), 100, false);
    std::vector<float> block;
    EXPECT_THROW(source.read(block, 10ms), voxd::CaptureError);
}

TEST_F(WavFileAudioSourceTest, PacedReplayReleasesInRealTime) {
    // 0.2 s of audio at 8 kHz in 400-frame (50 ms) blocks
    std::vector<float> samples(1600, 0.1f);
    auto path = writeWav(samples, 8000, 1);

    WavFileAudioSource source(path, 400, true);
    source.open();
    auto start = std::chrono::steady_clock::now();
    std::vector<float> block;
    int blocks = 0;
    while (true) {
        auto status = source.read(block, 100ms);
        if (status == ReadStatus::EndOfStream) {
            break;
        }
        if (status == ReadStatus::Block) {
            ++blocks;
        }
    }
    auto elapsed = std::chrono::steady_clock::now() - start;
    EXPECT_EQ(blocks, 4);
    EXPECT_GE(elapsed, 140ms);
}
