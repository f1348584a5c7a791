#include "daemon/input/wav_file_audio_source.h"

#include "core/error_codes.h"
#include "logging/logger.h"

#include <algorithm>
#include <thread>

namespace daemon_input {

WavFileAudioSource::WavFileAudioSource(std::string path, size_t periodFrames, bool paced)
    : path_(std::move(path)), periodFrames_(periodFrames), paced_(paced) {}

void WavFileAudioSource::open() {
    if (reader_.isOpen()) {
        return;
    }
    if (!reader_.open(path_)) {
        throw voxd::CaptureError(voxd::ErrorCode::CAPTURE_DEVICE_UNAVAILABLE,
                                 "cannot open replay file '" + path_ + "'");
    }
    nextRelease_ = std::chrono::steady_clock::now();
    LOG_INFO("[Capture] Replaying {} ({} Hz, {} ch)", path_, reader_.getSampleRate(),
             reader_.getChannels());
}

ReadStatus WavFileAudioSource::read(std::vector<float>& block,
                                    std::chrono::milliseconds timeout) {
    if (!reader_.isOpen()) {
        throw voxd::CaptureError(voxd::ErrorCode::CAPTURE_READ_FAILED, "replay file not open");
    }

    if (paced_) {
        auto now = std::chrono::steady_clock::now();
        if (nextRelease_ > now) {
            if (nextRelease_ - now > timeout) {
                std::this_thread::sleep_for(timeout);
                return ReadStatus::Timeout;
            }
            std::this_thread::sleep_until(nextRelease_);
        }
    }

    const int channels = reader_.getChannels();
    interleaved_.resize(periodFrames_ * static_cast<size_t>(channels));
    sf_count_t frames =
        reader_.readBlock(interleaved_.data(), static_cast<sf_count_t>(periodFrames_));
    if (frames < 0) {
        throw voxd::CaptureError(voxd::ErrorCode::CAPTURE_READ_FAILED,
                                 "read failed on replay file '" + path_ + "'");
    }
    if (frames == 0) {
        return ReadStatus::EndOfStream;
    }

    block.resize(static_cast<size_t>(frames));
    AudioIO::Utils::downmixToMono(interleaved_.data(), block.data(), static_cast<size_t>(frames),
                                  channels);
    nextRelease_ += std::chrono::microseconds(static_cast<long long>(frames) * 1000000 /
                                              std::max(1, reader_.getSampleRate()));
    return ReadStatus::Block;
}

void WavFileAudioSource::close() {
    reader_.close();
}

int WavFileAudioSource::sampleRate() const {
    return reader_.getSampleRate();
}

std::string WavFileAudioSource::describe() const {
    return "file:" + path_;
}

}  // namespace daemon_input
