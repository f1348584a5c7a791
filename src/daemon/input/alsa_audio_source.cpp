#include "daemon/input/alsa_audio_source.h"

#include "core/daemon_constants.h"
#include "core/error_codes.h"
#include "logging/logger.h"

#include <algorithm>
#include <cerrno>

namespace daemon_input {

namespace {

voxd::CaptureError openFailure(const std::string& device, int err) {
    auto code = (err == -EACCES || err == -EPERM) ? voxd::ErrorCode::CAPTURE_PERMISSION_DENIED
                                                  : voxd::ErrorCode::CAPTURE_DEVICE_UNAVAILABLE;
    return voxd::CaptureError(code,
                              "cannot open microphone '" + device + "': " + snd_strerror(err));
}

}  // namespace

void convertS16ToFloat(const int16_t* src, size_t samples, std::vector<float>& dst) {
    dst.resize(samples);
    constexpr float scale = 1.0f / 32768.0f;
    for (size_t i = 0; i < samples; ++i) {
        dst[i] = static_cast<float>(src[i]) * scale;
    }
}

AlsaAudioSource::AlsaAudioSource(std::string device, unsigned int sampleRate,
                                 snd_pcm_uframes_t periodFrames)
    : device_(std::move(device)), sampleRate_(sampleRate), periodFrames_(periodFrames) {}

AlsaAudioSource::~AlsaAudioSource() {
    close();
}

void AlsaAudioSource::open() {
    if (handle_) {
        return;
    }

    snd_pcm_t* handle = nullptr;
    int err = snd_pcm_open(&handle, device_.c_str(), SND_PCM_STREAM_CAPTURE, SND_PCM_NONBLOCK);
    if (err < 0) {
        LOG_ERROR("[Capture] Cannot open capture device {}: {}", device_, snd_strerror(err));
        throw openFailure(device_, err);
    }

    snd_pcm_hw_params_t* hw_params;
    snd_pcm_hw_params_alloca(&hw_params);
    snd_pcm_hw_params_any(handle, hw_params);

    auto fail = [&](const char* what, int code) {
        LOG_ERROR("[Capture] {}: {}", what, snd_strerror(code));
        snd_pcm_close(handle);
        return voxd::CaptureError(voxd::ErrorCode::CAPTURE_DEVICE_UNAVAILABLE,
                                  std::string(what) + ": " + snd_strerror(code));
    };

    if ((err = snd_pcm_hw_params_set_access(handle, hw_params, SND_PCM_ACCESS_RW_INTERLEAVED)) <
            0 ||
        (err = snd_pcm_hw_params_set_format(handle, hw_params, SND_PCM_FORMAT_S16_LE)) < 0) {
        throw fail("Cannot set access/format", err);
    }
    if ((err = snd_pcm_hw_params_set_channels(handle, hw_params, DaemonConstants::CHANNELS)) <
        0) {
        throw fail("Cannot set mono capture", err);
    }

    unsigned int rate_near = sampleRate_;
    if ((err = snd_pcm_hw_params_set_rate_near(handle, hw_params, &rate_near, nullptr)) < 0) {
        throw fail("Cannot set sample rate", err);
    }
    if (rate_near != sampleRate_) {
        LOG_WARN("[Capture] Requested rate {} not supported, using {}", sampleRate_, rate_near);
        sampleRate_ = rate_near;
    }

    if ((err = snd_pcm_hw_params_set_period_size_near(handle, hw_params, &periodFrames_,
                                                      nullptr)) < 0) {
        throw fail("Cannot set period size", err);
    }
    snd_pcm_uframes_t buffer_frames = periodFrames_ * 4;
    if ((err = snd_pcm_hw_params_set_buffer_size_near(handle, hw_params, &buffer_frames)) < 0) {
        throw fail("Cannot set buffer size", err);
    }
    if ((err = snd_pcm_hw_params(handle, hw_params)) < 0) {
        throw fail("Cannot apply hardware parameters", err);
    }

    snd_pcm_hw_params_get_period_size(hw_params, &periodFrames_, nullptr);
    snd_pcm_hw_params_get_buffer_size(hw_params, &buffer_frames);

    if ((err = snd_pcm_prepare(handle)) < 0) {
        throw fail("Cannot prepare capture device", err);
    }
    if ((err = snd_pcm_start(handle)) < 0) {
        throw fail("Cannot start capture", err);
    }

    handle_ = handle;
    raw_.assign(periodFrames_ * DaemonConstants::CHANNELS, 0);
    LOG_INFO("[Capture] Device {} opened ({} Hz, period {} frames, buffer {} frames)", device_,
             sampleRate_, periodFrames_, buffer_frames);
}

ReadStatus AlsaAudioSource::read(std::vector<float>& block, std::chrono::milliseconds timeout) {
    if (!handle_) {
        throw voxd::CaptureError(voxd::ErrorCode::CAPTURE_READ_FAILED, "capture device not open");
    }

    int ready = snd_pcm_wait(handle_, static_cast<int>(timeout.count()));
    if (ready == 0) {
        return ReadStatus::Timeout;
    }
    if (ready < 0) {
        if (snd_pcm_recover(handle_, ready, 1) < 0) {
            throw voxd::CaptureError(voxd::ErrorCode::CAPTURE_READ_FAILED,
                                     std::string("capture wait failed: ") + snd_strerror(ready));
        }
        return ReadStatus::Timeout;
    }

    snd_pcm_sframes_t frames = snd_pcm_readi(handle_, raw_.data(), periodFrames_);
    if (frames == -EAGAIN || frames == 0) {
        return ReadStatus::Timeout;
    }
    if (frames == -EPIPE) {
        LOG_EVERY_N(WARN, 50, "[Capture] Overrun detected, recovering");
        snd_pcm_prepare(handle_);
        snd_pcm_start(handle_);
        return ReadStatus::Timeout;
    }
    if (frames < 0) {
        LOG_WARN("[Capture] Read error: {}", snd_strerror(static_cast<int>(frames)));
        if (snd_pcm_recover(handle_, static_cast<int>(frames), 1) < 0) {
            throw voxd::CaptureError(
                voxd::ErrorCode::CAPTURE_READ_FAILED,
                std::string("capture read failed: ") + snd_strerror(static_cast<int>(frames)));
        }
        return ReadStatus::Timeout;
    }

    convertS16ToFloat(raw_.data(), static_cast<size_t>(frames) * DaemonConstants::CHANNELS,
                      block);
    return ReadStatus::Block;
}

void AlsaAudioSource::close() {
    if (!handle_) {
        return;
    }
    snd_pcm_drop(handle_);
    snd_pcm_close(handle_);
    handle_ = nullptr;
    LOG_DEBUG("[Capture] Device {} closed", device_);
}

int AlsaAudioSource::sampleRate() const {
    return static_cast<int>(sampleRate_);
}

std::string AlsaAudioSource::describe() const {
    return "alsa:" + device_;
}

}  // namespace daemon_input
