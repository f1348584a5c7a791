#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace daemon_output {

// Hands a final transcript to the rest of the system (clipboard, paste, ...).
class TranscriptSink {
   public:
    virtual ~TranscriptSink() = default;
    virtual bool deliver(const std::string& text) = 0;
};

// Pipes the transcript into a command's stdin (e.g. wl-copy, xclip).
class CommandTranscriptSink : public TranscriptSink {
   public:
    CommandTranscriptSink(std::vector<std::string> argv, std::chrono::milliseconds timeout);

    bool deliver(const std::string& text) override;

   private:
    std::vector<std::string> argv_;
    std::chrono::milliseconds timeout_;
};

}  // namespace daemon_output
