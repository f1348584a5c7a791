#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace daemon_core {
class StopSignal;
}  // namespace daemon_core

namespace daemon_transcription {

enum class StreamEventType {
    Partial,  // interim hypothesis, superseded by the next one
    Final,    // finalized segment; segments are joined into the result
    Closed    // remote side ended the session
};

struct StreamEvent {
    StreamEventType type;
    std::string text;
};

// One incremental recognition session owned by a single worker thread.
class StreamingSession {
   public:
    virtual ~StreamingSession() = default;

    virtual void sendAudio(const std::vector<float>& samples) = 0;
    // Client-side end of input; the remote side flushes and then closes.
    virtual void finalize() = 0;
    // nullopt when no event arrived within the timeout.
    virtual std::optional<StreamEvent> nextEvent(std::chrono::milliseconds timeout) = 0;
    virtual void close() = 0;
};

// Transcription back-end. Calls may throw voxd::ProviderError (or any
// std::exception, which is reported as PROVIDER_FAILED). `cancel` (may be
// null) is set when the session is abandoned or the request timed out; a
// blocking call should return promptly once it fires.
class TranscriptionProvider {
   public:
    virtual ~TranscriptionProvider() = default;

    virtual std::string name() const = 0;

    virtual bool supportsStreaming() const {
        return false;
    }

    // False when the back-end needs a file path (transcribeFile).
    virtual bool acceptsBuffer() const {
        return true;
    }

    virtual std::string transcribe(const std::vector<float>& samples, int sampleRate,
                                   const std::string& model, const std::string& language,
                                   const daemon_core::StopSignal* cancel);

    // Default: decodes the file and forwards to transcribe().
    virtual std::string transcribeFile(const std::string& path, const std::string& model,
                                       const std::string& language,
                                       const daemon_core::StopSignal* cancel);

    virtual std::unique_ptr<StreamingSession> openStream(int sampleRate, const std::string& model,
                                                         const std::string& language);
};

}  // namespace daemon_transcription
