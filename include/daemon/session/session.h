#pragma once

#include "core/error_codes.h"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace daemon_session {

using SessionId = std::uint64_t;

enum class TriggerKind { Toggle, Hold };
enum class ProviderMode { Batch, Streaming };

const char* triggerKindToString(TriggerKind kind);
const char* providerModeToString(ProviderMode mode);

struct SessionError {
    voxd::ErrorCode code = voxd::ErrorCode::INTERNAL_UNKNOWN;
    std::string message;
};

// One hotkey activation. Owned by the control thread and replaced at every arm.
// Captured audio is not part of it: the capture worker owns the samples until
// it hands them to the transcription worker.
struct Session {
    SessionId id = 0;
    TriggerKind triggerKind = TriggerKind::Toggle;
    ProviderMode providerMode = ProviderMode::Batch;
    std::chrono::steady_clock::time_point startedAt;

    std::string interimText;                 // latest partial, replaced on update
    std::string transcript;                  // provider text, kept while refining
    std::optional<std::string> finalText;    // set on success
    std::optional<SessionError> error;       // set on failure; exclusive with finalText

    size_t levelCount = 0;   // AudioLevel messages seen
    float maxLevel = 0.0f;
};

}  // namespace daemon_session
