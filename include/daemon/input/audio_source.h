#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace daemon_input {

enum class ReadStatus {
    Block,       // block filled with at least one frame
    Timeout,     // nothing available yet; caller re-checks its stop signal
    EndOfStream  // finite source exhausted
};

// Mono float capture stream owned by exactly one thread at a time.
class AudioSource {
   public:
    virtual ~AudioSource() = default;

    // Throws voxd::CaptureError when the device is unavailable or not permitted.
    virtual void open() = 0;

    // Waits at most `timeout` for one block of mono samples in [-1, 1].
    // Throws voxd::CaptureError on unrecoverable read failures.
    virtual ReadStatus read(std::vector<float>& block, std::chrono::milliseconds timeout) = 0;

    virtual void close() = 0;

    virtual int sampleRate() const = 0;
    virtual std::string describe() const = 0;
};

using AudioSourceFactory = std::function<std::unique_ptr<AudioSource>()>;

}  // namespace daemon_input
