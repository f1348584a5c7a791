#include "daemon/transcription/temp_audio_file.h"

#include "audio/wav_io.h"
#include "core/error_codes.h"
#include "logging/logger.h"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <system_error>
#include <unistd.h>

namespace daemon_transcription {

TempAudioFile::TempAudioFile(const std::vector<float>& samples, int sampleRate) {
    std::error_code ec;
    std::filesystem::path dir = std::filesystem::temp_directory_path(ec);
    if (ec) {
        dir = "/tmp";
    }
    std::string pattern = (dir / "voxd-XXXXXX.wav").string();
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');

    int fd = mkstemps(buffer.data(), 4);
    if (fd < 0) {
        throw voxd::ProviderError(voxd::ErrorCode::PROVIDER_FAILED,
                                  std::string("cannot create temp audio file: ") +
                                      std::strerror(errno));
    }
    ::close(fd);
    path_ = buffer.data();

    AudioIO::WavWriter writer;
    bool ok = writer.open(path_, sampleRate, 1) &&
              writer.writeBlock(samples.data(), static_cast<sf_count_t>(samples.size()));
    writer.close();
    if (!ok) {
        std::filesystem::remove(path_, ec);
        throw voxd::ProviderError(voxd::ErrorCode::PROVIDER_FAILED,
                                  "cannot write temp audio file '" + path_ + "'");
    }
    LOG_DEBUG("Recording written to {} ({} samples)", path_, samples.size());
}

TempAudioFile::~TempAudioFile() {
    if (path_.empty()) {
        return;
    }
    std::error_code ec;
    std::filesystem::remove(path_, ec);
    if (ec) {
        LOG_WARN("Cannot remove temp audio file {}: {}", path_, ec.message());
    }
}

const std::string& TempAudioFile::path() const {
    return path_;
}

}  // namespace daemon_transcription
