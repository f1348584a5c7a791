#pragma once

#include "daemon/core/background_task.h"
#include "daemon/core/message_queue.h"
#include "daemon/core/stop_signal.h"
#include "daemon/input/audio_capture_worker.h"
#include "daemon/input/hold_gesture_tracker.h"
#include "daemon/session/app_state.h"
#include "daemon/session/messages.h"
#include "daemon/session/session.h"

#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace daemon_status {
class StatusBroadcast;
}  // namespace daemon_status

namespace daemon_transcription {
class TranscriptionCoordinator;
class RefineFallback;
}  // namespace daemon_transcription

namespace daemon_output {
class TranscriptSink;
}  // namespace daemon_output

namespace daemon_session {

struct SessionSettings {
    float vadThreshold = 0.015f;
    std::chrono::milliseconds doneDisplay{400};
    std::chrono::milliseconds errorDisplay{800};
    std::chrono::milliseconds transcribingTimeout{45000};
    size_t maxMessagesPerTick = 50;
};

struct SessionDependencies {
    daemon_input::AudioSourceFactory sourceFactory;
    daemon_transcription::TranscriptionCoordinator* coordinator = nullptr;
    daemon_transcription::RefineFallback* refine = nullptr;  // nullptr or disabled: no refine
    daemon_output::TranscriptSink* sink = nullptr;           // nullptr: no delivery
    daemon_status::StatusBroadcast* broadcast = nullptr;     // nullptr: no status files
    std::function<void(AppState, SessionId)> onStateChange;  // control-plane PUB
    std::function<std::chrono::steady_clock::time_point()> clock;
};

// Read-only view for other threads (control plane STATUS).
struct SessionSnapshot {
    AppState state = AppState::Idle;
    SessionId sessionId = 0;
    std::optional<TriggerKind> triggerKind;
    std::optional<ProviderMode> providerMode;
    std::string interimText;
    std::string lastText;
    std::optional<SessionError> lastError;
};

// Owns AppState and the current Session. Every method except post() and
// snapshot() must be called from the control thread.
class SessionStateMachine {
   public:
    SessionStateMachine(SessionSettings settings, SessionDependencies deps);
    ~SessionStateMachine();

    SessionStateMachine(const SessionStateMachine&) = delete;
    SessionStateMachine& operator=(const SessionStateMachine&) = delete;

    // Idle -> Listening. Ignored (false) in any other state.
    bool arm(TriggerKind kind);

    // Idle: arm; Listening/Recording: stop; otherwise ignored.
    void toggle();

    void holdPress(const std::string& sourceId);
    void holdRelease(const std::string& sourceId);

    // Listening|Recording -> Transcribing. Ignored (false) in any other state.
    bool requestStop();

    // Done|Error -> Idle before the display window elapses.
    void acknowledge();

    // Control commands first, then at most maxMessagesPerTick worker
    // messages, then timers (display window, watchdog) and worker reaping.
    void tick();

    // Thread-safe: queue a command for the next tick.
    void post(ControlCommand command);

    // Cancels the current session, joins every worker, resets the status files.
    void shutdown();

    AppState state() const;
    const std::optional<Session>& session() const;
    SessionSnapshot snapshot() const;

    // Worker -> control thread queue (exposed for workers and tests).
    daemon_input::SessionMessageQueue& messages();
    daemon_core::MessageQueue<ControlCommand>& commands();

    // Blocks until a command is posted or the timeout elapses.
    bool waitForCommand(std::chrono::milliseconds timeout);

    size_t pendingWorkers() const;

   private:
    std::chrono::steady_clock::time_point now() const;

    void handleCommand(const ControlCommand& command);
    void handleMessage(DaemonMessage message);
    void onAudioLevel(const AudioLevel& msg);
    void onStatusUpdate(const StatusUpdate& msg);
    void onTranscript(TranscriptResult msg);
    void onInterim(const InterimTranscript& msg);
    void onRefined(const RefineResult& msg);

    void transition(AppState next);
    void finishDone(const std::string& text);
    void finishError(const SessionError& error);
    void endSession();
    void retireWorkers();
    void reapWorkers(bool wait);
    void checkTimers();
    void cancelCalls();
    void updateSnapshot();

    SessionSettings settings_;
    SessionDependencies deps_;

    AppState state_ = AppState::Idle;
    std::optional<Session> session_;
    SessionId nextSessionId_ = 1;
    std::optional<std::chrono::steady_clock::time_point> revertAt_;
    // Start of the current Transcribing or Refining window.
    std::optional<std::chrono::steady_clock::time_point> watchdogStart_;

    daemon_input::HoldGestureTracker holdTracker_;
    std::shared_ptr<daemon_core::StopSignal> stop_;    // ends capture
    std::shared_ptr<daemon_core::StopSignal> cancel_;  // aborts provider and refine calls
    std::unique_ptr<daemon_input::AudioCaptureWorker> captureWorker_;
    std::future<daemon_input::CapturedAudio> capturedAudio_;
    std::unique_ptr<daemon_core::BackgroundTask> transcriptionTask_;
    std::unique_ptr<daemon_core::BackgroundTask> refineTask_;
    std::vector<std::unique_ptr<daemon_input::AudioCaptureWorker>> retiredCaptures_;
    std::vector<std::unique_ptr<daemon_core::BackgroundTask>> retiredTasks_;

    daemon_input::SessionMessageQueue messages_;
    daemon_core::MessageQueue<ControlCommand> commands_;

    mutable std::mutex snapshotMutex_;
    SessionSnapshot snapshot_;
    std::string lastText_;
    std::optional<SessionError> lastError_;
};

}  // namespace daemon_session
