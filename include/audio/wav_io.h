#ifndef VOXD_WAV_IO_H
#define VOXD_WAV_IO_H

#include <sndfile.h>
#include <string>
#include <vector>

namespace AudioIO {

struct AudioFile {
    std::vector<float> data;  // Interleaved audio data
    int sampleRate;
    int channels;
    int frames;

    AudioFile() : sampleRate(0), channels(0), frames(0) {}
};

class WavReader {
   public:
    WavReader();
    ~WavReader();

    WavReader(const WavReader&) = delete;
    WavReader& operator=(const WavReader&) = delete;

    bool open(const std::string& filename);
    void close();
    bool isOpen() const {
        return file_ != nullptr;
    }

    int getSampleRate() const {
        return info_.samplerate;
    }
    int getChannels() const {
        return info_.channels;
    }
    sf_count_t getFrames() const {
        return info_.frames;
    }

    bool readAll(AudioFile& output);

    // Returns the number of frames read (0 at end of file, -1 on error).
    sf_count_t readBlock(float* buffer, sf_count_t frames);

   private:
    SNDFILE* file_;
    SF_INFO info_;
};

// Writes 16-bit PCM WAV, the format speech recognizers accept without conversion.
class WavWriter {
   public:
    WavWriter();
    ~WavWriter();

    WavWriter(const WavWriter&) = delete;
    WavWriter& operator=(const WavWriter&) = delete;

    bool open(const std::string& filename, int sampleRate, int channels);
    void close();

    bool writeAll(const AudioFile& input);
    bool writeBlock(const float* buffer, sf_count_t frames);

   private:
    SNDFILE* file_;
    SF_INFO info_;
};

namespace Utils {
// Mix interleaved multi-channel audio down to mono (average)
void downmixToMono(const float* interleaved, float* mono, size_t frames, int channels);
}  // namespace Utils

}  // namespace AudioIO

#endif  // VOXD_WAV_IO_H
