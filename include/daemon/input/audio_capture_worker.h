#pragma once

#include "daemon/core/message_queue.h"
#include "daemon/core/stop_signal.h"
#include "daemon/input/audio_source.h"
#include "daemon/session/messages.h"

#include <atomic>
#include <future>
#include <memory>
#include <optional>
#include <thread>
#include <vector>

namespace daemon_input {

// Finalized recording, handed over exactly once.
struct CapturedAudio {
    std::vector<float> samples;  // blocks concatenated in arrival order
    int sampleRate = 0;
    size_t chunkCount = 0;
    float maxLevel = 0.0f;
    bool speechDetected = false;  // some block exceeded the VAD threshold
    std::optional<daemon_session::SessionError> error;  // capture failure
};

using AudioBlockChannel = daemon_core::BoundedChannel<std::vector<float>>;
using SessionMessageQueue = daemon_core::MessageQueue<daemon_session::DaemonMessage>;

struct CaptureWorkerDependencies {
    AudioSourceFactory sourceFactory;
    SessionMessageQueue* messages = nullptr;
    std::shared_ptr<daemon_core::StopSignal> stop;
    // Streaming sessions only: every block is copied here as well.
    std::shared_ptr<AudioBlockChannel> streamChannel;
};

// Owns the audio source on a dedicated thread for one session.
class AudioCaptureWorker {
   public:
    AudioCaptureWorker(daemon_session::SessionId sessionId, float vadThreshold,
                       CaptureWorkerDependencies deps);
    ~AudioCaptureWorker();

    AudioCaptureWorker(const AudioCaptureWorker&) = delete;
    AudioCaptureWorker& operator=(const AudioCaptureWorker&) = delete;

    void start();

    // Valid once; the future becomes ready after the stop signal fires or the
    // source ends/fails.
    std::future<CapturedAudio> takeResult();

    bool finished() const;
    void join();

   private:
    void run();

    daemon_session::SessionId sessionId_;
    float vadThreshold_;
    CaptureWorkerDependencies deps_;
    std::promise<CapturedAudio> promise_;
    std::thread thread_;
    std::atomic<bool> finished_{false};
};

}  // namespace daemon_input
