#pragma once

#include "audio/wav_io.h"
#include "daemon/input/audio_source.h"

#include <chrono>
#include <string>
#include <vector>

namespace daemon_input {

// Replays a sound file block by block (--replay, tests). Multi-channel files
// are mixed down to mono. When paced, blocks are released in real time.
class WavFileAudioSource : public AudioSource {
   public:
    WavFileAudioSource(std::string path, size_t periodFrames, bool paced);

    void open() override;
    ReadStatus read(std::vector<float>& block, std::chrono::milliseconds timeout) override;
    void close() override;

    int sampleRate() const override;
    std::string describe() const override;

   private:
    std::string path_;
    size_t periodFrames_;
    bool paced_;
    AudioIO::WavReader reader_;
    std::vector<float> interleaved_;
    std::chrono::steady_clock::time_point nextRelease_;
};

}  // namespace daemon_input
