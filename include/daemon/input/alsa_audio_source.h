#pragma once

#include "daemon/input/audio_source.h"

#include <alsa/asoundlib.h>
#include <cstdint>
#include <string>
#include <vector>

namespace daemon_input {

void convertS16ToFloat(const int16_t* src, size_t samples, std::vector<float>& dst);

// Microphone capture through ALSA (S16_LE, mono, non-blocking reads bounded by
// snd_pcm_wait so the caller observes its stop signal between periods).
class AlsaAudioSource : public AudioSource {
   public:
    AlsaAudioSource(std::string device, unsigned int sampleRate, snd_pcm_uframes_t periodFrames);
    ~AlsaAudioSource() override;

    AlsaAudioSource(const AlsaAudioSource&) = delete;
    AlsaAudioSource& operator=(const AlsaAudioSource&) = delete;

    void open() override;
    ReadStatus read(std::vector<float>& block, std::chrono::milliseconds timeout) override;
    void close() override;

    int sampleRate() const override;
    std::string describe() const override;

   private:
    std::string device_;
    unsigned int sampleRate_;
    snd_pcm_uframes_t periodFrames_;
    snd_pcm_t* handle_ = nullptr;
    std::vector<int16_t> raw_;
};

}  // namespace daemon_input
