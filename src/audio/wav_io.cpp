#include "audio/wav_io.h"

#include "logging/logger.h"

#include <cstring>

namespace AudioIO {

WavReader::WavReader() : file_(nullptr) {
    std::memset(&info_, 0, sizeof(info_));
}

WavReader::~WavReader() {
    close();
}

bool WavReader::open(const std::string& filename) {
    close();
    std::memset(&info_, 0, sizeof(info_));
    file_ = sf_open(filename.c_str(), SFM_READ, &info_);
    if (!file_) {
        LOG_ERROR("Cannot open audio file {}: {}", filename, sf_strerror(nullptr));
        return false;
    }

    LOG_DEBUG("Opened {} ({} Hz, {} ch, {} frames, {:.2f} s)", filename, info_.samplerate,
              info_.channels, static_cast<long long>(info_.frames),
              static_cast<double>(info_.frames) / info_.samplerate);
    return true;
}

void WavReader::close() {
    if (file_) {
        sf_close(file_);
        file_ = nullptr;
    }
}

bool WavReader::readAll(AudioFile& output) {
    if (!file_) {
        LOG_ERROR("WavReader: file not opened");
        return false;
    }

    output.sampleRate = info_.samplerate;
    output.channels = info_.channels;
    output.frames = static_cast<int>(info_.frames);
    output.data.resize(static_cast<size_t>(info_.frames) * info_.channels);

    sf_count_t framesRead = sf_readf_float(file_, output.data.data(), info_.frames);
    if (framesRead != info_.frames) {
        LOG_ERROR("WavReader: incomplete read, expected {} frames, read {}",
                  static_cast<long long>(info_.frames), static_cast<long long>(framesRead));
        return false;
    }
    return true;
}

sf_count_t WavReader::readBlock(float* buffer, sf_count_t frames) {
    if (!file_) {
        return -1;
    }
    return sf_readf_float(file_, buffer, frames);
}

WavWriter::WavWriter() : file_(nullptr) {
    std::memset(&info_, 0, sizeof(info_));
}

WavWriter::~WavWriter() {
    close();
}

bool WavWriter::open(const std::string& filename, int sampleRate, int channels) {
    close();
    std::memset(&info_, 0, sizeof(info_));
    info_.samplerate = sampleRate;
    info_.channels = channels;
    info_.format = SF_FORMAT_WAV | SF_FORMAT_PCM_16;

    file_ = sf_open(filename.c_str(), SFM_WRITE, &info_);
    if (!file_) {
        LOG_ERROR("Cannot create audio file {}: {}", filename, sf_strerror(nullptr));
        return false;
    }
    // Clip instead of wrapping when float samples exceed [-1, 1]
    sf_command(file_, SFC_SET_CLIPPING, nullptr, SF_TRUE);
    return true;
}

void WavWriter::close() {
    if (file_) {
        sf_close(file_);
        file_ = nullptr;
    }
}

bool WavWriter::writeAll(const AudioFile& input) {
    if (!file_) {
        LOG_ERROR("WavWriter: file not opened");
        return false;
    }

    sf_count_t framesWritten = sf_writef_float(file_, input.data.data(), input.frames);
    if (framesWritten != input.frames) {
        LOG_ERROR("WavWriter: expected to write {} frames, wrote {}", input.frames,
                  static_cast<long long>(framesWritten));
        return false;
    }
    return true;
}

bool WavWriter::writeBlock(const float* buffer, sf_count_t frames) {
    if (!file_) {
        LOG_ERROR("WavWriter: file not opened");
        return false;
    }
    return sf_writef_float(file_, buffer, frames) == frames;
}

namespace Utils {

void downmixToMono(const float* interleaved, float* mono, size_t frames, int channels) {
    if (channels <= 1) {
        std::memcpy(mono, interleaved, frames * sizeof(float));
        return;
    }
    const float scale = 1.0f / static_cast<float>(channels);
    for (size_t i = 0; i < frames; ++i) {
        float sum = 0.0f;
        for (int ch = 0; ch < channels; ++ch) {
            sum += interleaved[i * channels + ch];
        }
        mono[i] = sum * scale;
    }
}

}  // namespace Utils

}  // namespace AudioIO
