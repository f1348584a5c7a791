#include "daemon/session/messages.h"
#include "daemon/session/session.h"

namespace daemon_session {

const char* triggerKindToString(TriggerKind kind) {
    switch (kind) {
    case TriggerKind::Hold:
        return "hold";
    case TriggerKind::Toggle:
    default:
        return "toggle";
    }
}

const char* providerModeToString(ProviderMode mode) {
    switch (mode) {
    case ProviderMode::Streaming:
        return "streaming";
    case ProviderMode::Batch:
    default:
        return "batch";
    }
}

const char* controlCommandTypeToString(ControlCommandType type) {
    switch (type) {
    case ControlCommandType::Toggle:
        return "toggle";
    case ControlCommandType::Start:
        return "start";
    case ControlCommandType::Stop:
        return "stop";
    case ControlCommandType::HoldPress:
        return "hold_press";
    case ControlCommandType::HoldRelease:
        return "hold_release";
    case ControlCommandType::Acknowledge:
        return "ack";
    }
    return "unknown";
}

}  // namespace daemon_session
