#include "daemon/input/audio_capture_worker.h"

#include "audio/audio_level.h"
#include "core/daemon_constants.h"
#include "core/error_codes.h"
#include "logging/logger.h"

#include <algorithm>

namespace daemon_input {

AudioCaptureWorker::AudioCaptureWorker(daemon_session::SessionId sessionId, float vadThreshold,
                                       CaptureWorkerDependencies deps)
    : sessionId_(sessionId), vadThreshold_(vadThreshold), deps_(std::move(deps)) {}

AudioCaptureWorker::~AudioCaptureWorker() {
    if (thread_.joinable()) {
        if (deps_.stop) {
            deps_.stop->request();
        }
        thread_.join();
    }
}

void AudioCaptureWorker::start() {
    if (thread_.joinable()) {
        return;
    }
    thread_ = std::thread([this] { run(); });
}

std::future<CapturedAudio> AudioCaptureWorker::takeResult() {
    return promise_.get_future();
}

bool AudioCaptureWorker::finished() const {
    return finished_.load(std::memory_order_acquire);
}

void AudioCaptureWorker::join() {
    if (thread_.joinable()) {
        thread_.join();
    }
}

void AudioCaptureWorker::run() {
    CapturedAudio result;
    result.sampleRate = DaemonConstants::DEFAULT_SAMPLE_RATE;
    std::vector<std::vector<float>> chunks;
    bool endedBySource = false;
    const auto waitTimeout = std::chrono::milliseconds(DaemonConstants::CAPTURE_WAIT_TIMEOUT_MS);

    try {
        if (!deps_.sourceFactory || !deps_.messages || !deps_.stop) {
            throw voxd::CaptureError(voxd::ErrorCode::CAPTURE_DEVICE_UNAVAILABLE,
                                     "capture worker not configured");
        }
        std::unique_ptr<AudioSource> source = deps_.sourceFactory();
        if (!source) {
            throw voxd::CaptureError(voxd::ErrorCode::CAPTURE_DEVICE_UNAVAILABLE,
                                     "no audio source available");
        }
        source->open();
        result.sampleRate = source->sampleRate();
        LOG_DEBUG("[Capture] Session {} capturing from {}", sessionId_, source->describe());

        std::vector<float> block;
        while (!deps_.stop->requested()) {
            ReadStatus status = source->read(block, waitTimeout);
            if (status == ReadStatus::Timeout) {
                continue;
            }
            if (status == ReadStatus::EndOfStream) {
                endedBySource = true;
                break;
            }

            float level = AudioUtils::computeRms(block);
            result.maxLevel = std::max(result.maxLevel, level);
            if (level > vadThreshold_) {
                result.speechDetected = true;
            }
            deps_.messages->push({sessionId_, daemon_session::AudioLevel{level}});
            LOG_TRACE("[Capture] Session {} block {} rms={:.4f}", sessionId_, chunks.size(),
                      level);

            if (deps_.streamChannel) {
                std::vector<float> copy = block;
                if (!deps_.streamChannel->tryPush(copy)) {
                    LOG_EVERY_N(WARN, 50, "[Capture] Streaming channel full, block dropped");
                }
            }
            chunks.push_back(std::move(block));
            block = std::vector<float>();
        }
        source->close();
    } catch (const voxd::CaptureError& e) {
        LOG_ERROR("[Capture] Session {}: {}", sessionId_, e.what());
        result.error = daemon_session::SessionError{e.code(), e.what()};
        endedBySource = true;
    } catch (const std::exception& e) {
        LOG_ERROR("[Capture] Session {} failed: {}", sessionId_, e.what());
        result.error =
            daemon_session::SessionError{voxd::ErrorCode::CAPTURE_READ_FAILED, e.what()};
        endedBySource = true;
    }

    if (deps_.streamChannel) {
        deps_.streamChannel->close();
    }

    size_t total = 0;
    for (const auto& chunk : chunks) {
        total += chunk.size();
    }
    result.samples.reserve(total);
    for (auto& chunk : chunks) {
        result.samples.insert(result.samples.end(), chunk.begin(), chunk.end());
    }
    result.chunkCount = chunks.size();
    chunks.clear();

    LOG_DEBUG("[Capture] Session {} finalized: {} chunks, {} samples, max rms {:.4f}",
              sessionId_, result.chunkCount, result.samples.size(), result.maxLevel);

    // Capture ended without a stop request (device failure, end of replay):
    // ask the control thread to stop the session.
    if (endedBySource && deps_.messages && !(deps_.stop && deps_.stop->requested())) {
        deps_.messages->push(
            {sessionId_, daemon_session::StatusUpdate{daemon_session::AppState::Transcribing}});
    }

    promise_.set_value(std::move(result));
    finished_.store(true, std::memory_order_release);
}

}  // namespace daemon_input
