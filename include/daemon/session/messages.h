#pragma once

#include "daemon/session/app_state.h"
#include "daemon/session/session.h"

#include <optional>
#include <string>
#include <variant>

namespace daemon_session {

// Worker-reported state hint (e.g. streaming worker confirmed speech).
struct StatusUpdate {
    AppState state;
};

// RMS of one captured block.
struct AudioLevel {
    float level;
};

// Final outcome of the transcription worker. An empty text without error means
// no speech was recognized.
struct TranscriptResult {
    std::string text;
    std::optional<SessionError> error;
};

// Streaming partial; replaces the previous one.
struct InterimTranscript {
    std::string text;
};

// Outcome of the refine worker; always usable text.
struct RefineResult {
    std::string text;
    bool refined = false;
};

using MessagePayload =
    std::variant<StatusUpdate, AudioLevel, TranscriptResult, InterimTranscript, RefineResult>;

// Worker -> control thread message. The payload is copied in; nothing is shared.
struct DaemonMessage {
    SessionId sessionId = 0;
    MessagePayload payload;
};

// Trigger/control-plane -> control thread request.
enum class ControlCommandType { Toggle, Start, Stop, HoldPress, HoldRelease, Acknowledge };

struct ControlCommand {
    ControlCommandType type;
    std::string sourceId;  // hold commands only
};

const char* controlCommandTypeToString(ControlCommandType type);

}  // namespace daemon_session
