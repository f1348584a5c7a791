#pragma once

#include <optional>
#include <string_view>

namespace daemon_session {

enum class AppState { Idle, Listening, Recording, Transcribing, Refining, Done, Error };

// Lower-case wire form used by the state file and control plane ("idle", "recording", ...).
inline const char* appStateToString(AppState state) {
    switch (state) {
    case AppState::Idle:
        return "idle";
    case AppState::Listening:
        return "listening";
    case AppState::Recording:
        return "recording";
    case AppState::Transcribing:
        return "transcribing";
    case AppState::Refining:
        return "refining";
    case AppState::Done:
        return "done";
    case AppState::Error:
        return "error";
    }
    return "idle";
}

inline std::optional<AppState> parseAppState(std::string_view text) {
    for (AppState state : {AppState::Idle, AppState::Listening, AppState::Recording,
                           AppState::Transcribing, AppState::Refining, AppState::Done,
                           AppState::Error}) {
        if (text == appStateToString(state)) {
            return state;
        }
    }
    return std::nullopt;
}

// Capture is running (stop is meaningful).
inline bool isCapturing(AppState state) {
    return state == AppState::Listening || state == AppState::Recording;
}

inline bool isTerminal(AppState state) {
    return state == AppState::Done || state == AppState::Error;
}

}  // namespace daemon_session
