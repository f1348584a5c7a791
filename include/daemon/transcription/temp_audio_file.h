#pragma once

#include <string>
#include <vector>

namespace daemon_transcription {

// WAV file in the temp directory holding a finalized recording; removed on
// destruction.
class TempAudioFile {
   public:
    // Throws voxd::ProviderError when the file cannot be written.
    TempAudioFile(const std::vector<float>& samples, int sampleRate);
    ~TempAudioFile();

    TempAudioFile(const TempAudioFile&) = delete;
    TempAudioFile& operator=(const TempAudioFile&) = delete;

    const std::string& path() const;

   private:
    std::string path_;
};

}  // namespace daemon_transcription
