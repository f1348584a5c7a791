#include "daemon/session/session_state_machine.h"

#include "core/daemon_constants.h"
#include "daemon/output/transcript_sink.h"
#include "daemon/status/status_broadcast.h"
#include "daemon/transcription/refine_fallback.h"
#include "daemon/transcription/transcription_coordinator.h"
#include "logging/logger.h"

#include <algorithm>
#include <stdexcept>

namespace daemon_session {

SessionStateMachine::SessionStateMachine(SessionSettings settings, SessionDependencies deps)
    : settings_(settings), deps_(std::move(deps)) {
    if (!deps_.sourceFactory || !deps_.coordinator) {
        throw std::invalid_argument("SessionStateMachine requires an audio source and coordinator");
    }
    if (!deps_.clock) {
        deps_.clock = [] { return std::chrono::steady_clock::now(); };
    }
    if (settings_.maxMessagesPerTick == 0) {
        settings_.maxMessagesPerTick = DaemonConstants::MAX_MESSAGES_PER_TICK;
    }
    updateSnapshot();
}

SessionStateMachine::~SessionStateMachine() {
    shutdown();
}

std::chrono::steady_clock::time_point SessionStateMachine::now() const {
    return deps_.clock();
}

bool SessionStateMachine::arm(TriggerKind kind) {
    if (state_ != AppState::Idle) {
        LOG_DEBUG("Arm ignored in state {}", appStateToString(state_));
        return false;
    }
    reapWorkers(false);

    Session session;
    session.id = nextSessionId_++;
    session.triggerKind = kind;
    session.providerMode = deps_.coordinator->selectMode();
    session.startedAt = now();

    stop_ = std::make_shared<daemon_core::StopSignal>();
    cancel_ = std::make_shared<daemon_core::StopSignal>();
    std::shared_ptr<daemon_input::AudioBlockChannel> channel;
    if (session.providerMode == ProviderMode::Streaming) {
        channel = std::make_shared<daemon_input::AudioBlockChannel>(
            DaemonConstants::STREAM_CHANNEL_CAPACITY);
    }

    captureWorker_ = std::make_unique<daemon_input::AudioCaptureWorker>(
        session.id, settings_.vadThreshold,
        daemon_input::CaptureWorkerDependencies{deps_.sourceFactory, &messages_, stop_, channel});
    capturedAudio_ = captureWorker_->takeResult();

    session_ = std::move(session);
    lastError_.reset();
    revertAt_.reset();
    watchdogStart_.reset();

    LOG_INFO("Session {} armed (trigger={}, mode={})", session_->id,
             triggerKindToString(session_->triggerKind),
             providerModeToString(session_->providerMode));
    transition(AppState::Listening);

    captureWorker_->start();
    if (channel) {
        transcriptionTask_ = deps_.coordinator->startStreaming(
            session_->id, channel, std::move(capturedAudio_), messages_, cancel_);
    }
    return true;
}

void SessionStateMachine::toggle() {
    if (state_ == AppState::Idle) {
        arm(TriggerKind::Toggle);
    } else if (isCapturing(state_)) {
        requestStop();
    } else {
        LOG_DEBUG("Toggle ignored in state {}", appStateToString(state_));
    }
}

void SessionStateMachine::holdPress(const std::string& sourceId) {
    if (!holdTracker_.onPress(sourceId)) {
        return;
    }
    if (state_ != AppState::Idle) {
        LOG_DEBUG("Hold press from {} ignored in state {}", sourceId, appStateToString(state_));
        return;
    }
    if (arm(TriggerKind::Hold)) {
        holdTracker_.markStarted();
    }
}

void SessionStateMachine::holdRelease(const std::string& sourceId) {
    if (holdTracker_.onRelease(sourceId)) {
        requestStop();
    }
}

bool SessionStateMachine::requestStop() {
    if (!session_ || !isCapturing(state_)) {
        LOG_DEBUG("Stop ignored in state {}", appStateToString(state_));
        return false;
    }

    stop_->request();
    holdTracker_.reset();
    watchdogStart_ = now();
    transition(AppState::Transcribing);

    if (session_->providerMode == ProviderMode::Batch) {
        transcriptionTask_ = deps_.coordinator->startBatch(session_->id,
                                                           std::move(capturedAudio_), messages_,
                                                           cancel_);
    }
    return true;
}

void SessionStateMachine::acknowledge() {
    if (isTerminal(state_)) {
        endSession();
    }
}

void SessionStateMachine::tick() {
    while (auto command = commands_.tryPop()) {
        handleCommand(*command);
    }

    auto batch = messages_.drain(settings_.maxMessagesPerTick);
    for (auto& message : batch) {
        handleMessage(std::move(message));
    }

    checkTimers();
    if (deps_.broadcast) {
        deps_.broadcast->flushPending();
    }
    reapWorkers(false);
}

void SessionStateMachine::post(ControlCommand command) {
    commands_.push(std::move(command));
}

bool SessionStateMachine::waitForCommand(std::chrono::milliseconds timeout) {
    return commands_.waitForItem(timeout);
}

void SessionStateMachine::handleCommand(const ControlCommand& command) {
    LOG_DEBUG("Command {} (source '{}') in state {}", controlCommandTypeToString(command.type),
              command.sourceId, appStateToString(state_));
    switch (command.type) {
    case ControlCommandType::Toggle:
        toggle();
        break;
    case ControlCommandType::Start:
        arm(TriggerKind::Toggle);
        break;
    case ControlCommandType::Stop:
        requestStop();
        break;
    case ControlCommandType::HoldPress:
        holdPress(command.sourceId);
        break;
    case ControlCommandType::HoldRelease:
        holdRelease(command.sourceId);
        break;
    case ControlCommandType::Acknowledge:
        acknowledge();
        break;
    }
}

void SessionStateMachine::handleMessage(DaemonMessage message) {
    if (!session_ || message.sessionId != session_->id) {
        LOG_DEBUG("Dropping stale message for session {}", message.sessionId);
        return;
    }

    if (auto* level = std::get_if<AudioLevel>(&message.payload)) {
        onAudioLevel(*level);
    } else if (auto* status = std::get_if<StatusUpdate>(&message.payload)) {
        onStatusUpdate(*status);
    } else if (auto* transcript = std::get_if<TranscriptResult>(&message.payload)) {
        onTranscript(std::move(*transcript));
    } else if (auto* interim = std::get_if<InterimTranscript>(&message.payload)) {
        onInterim(*interim);
    } else if (auto* refined = std::get_if<RefineResult>(&message.payload)) {
        onRefined(*refined);
    }
}

void SessionStateMachine::onAudioLevel(const AudioLevel& msg) {
    session_->levelCount++;
    session_->maxLevel = std::max(session_->maxLevel, msg.level);
    if (state_ == AppState::Listening && msg.level > settings_.vadThreshold) {
        LOG_INFO("Session {}: speech detected (rms {:.4f})", session_->id, msg.level);
        transition(AppState::Recording);
    }
}

void SessionStateMachine::onStatusUpdate(const StatusUpdate& msg) {
    if (msg.state == AppState::Recording && state_ == AppState::Listening) {
        transition(AppState::Recording);
    } else if (msg.state == AppState::Transcribing && isCapturing(state_)) {
        LOG_INFO("Session {}: capture ended by worker", session_->id);
        requestStop();
    }
}

void SessionStateMachine::onTranscript(TranscriptResult msg) {
    if (state_ != AppState::Transcribing) {
        LOG_DEBUG("Transcript ignored in state {}", appStateToString(state_));
        return;
    }
    if (msg.error) {
        finishError(*msg.error);
        return;
    }
    if (msg.text.empty()) {
        finishDone("");
        return;
    }
    if (deps_.refine && deps_.refine->enabled()) {
        session_->transcript = msg.text;
        watchdogStart_ = now();
        transition(AppState::Refining);
        auto* refine = deps_.refine;
        SessionId id = session_->id;
        std::string text = std::move(msg.text);
        refineTask_ = std::make_unique<daemon_core::BackgroundTask>(
            "refine-" + std::to_string(id), [this, refine, id, text, cancel = cancel_]() {
                auto outcome = refine->refineWithOutcome(text, cancel.get());
                messages_.push({id, RefineResult{outcome.text, outcome.refined}});
            });
        return;
    }
    finishDone(msg.text);
}

void SessionStateMachine::onInterim(const InterimTranscript& msg) {
    if (!isCapturing(state_) && state_ != AppState::Transcribing) {
        return;
    }
    session_->interimText = msg.text;
    if (deps_.broadcast) {
        deps_.broadcast->publishInterim(msg.text);
    }
    updateSnapshot();
}

void SessionStateMachine::onRefined(const RefineResult& msg) {
    if (state_ != AppState::Refining) {
        return;
    }
    LOG_DEBUG("Session {}: refine {}", session_->id, msg.refined ? "applied" : "skipped");
    finishDone(msg.text);
}

void SessionStateMachine::transition(AppState next) {
    if (next == state_) {
        return;
    }
    AppState previous = state_;
    state_ = next;
    SessionId id = session_ ? session_->id : 0;
    LOG_INFO("Session {}: {} -> {}", id, appStateToString(previous), appStateToString(next));

    if (deps_.broadcast) {
        deps_.broadcast->publishState(next);
    }
    if (deps_.onStateChange) {
        deps_.onStateChange(next, id);
    }
    updateSnapshot();
}

void SessionStateMachine::finishDone(const std::string& text) {
    session_->finalText = text;
    lastText_ = text;
    watchdogStart_.reset();
    cancelCalls();
    if (deps_.broadcast) {
        deps_.broadcast->clearInterim();
    }
    transition(AppState::Done);
    revertAt_ = now() + settings_.doneDisplay;
    retireWorkers();

    if (text.empty()) {
        LOG_INFO("Session {}: no speech recognized", session_->id);
        return;
    }
    if (deps_.sink) {
        auto* sink = deps_.sink;
        retiredTasks_.push_back(std::make_unique<daemon_core::BackgroundTask>(
            "deliver-" + std::to_string(session_->id), [sink, text]() {
                if (!sink->deliver(text)) {
                    LOG_WARN("Transcript delivery failed");
                }
            }));
    }
}

void SessionStateMachine::finishError(const SessionError& error) {
    LOG_ERROR("Session {} failed [{}]: {}", session_->id, voxd::errorCodeToString(error.code),
              error.message);
    session_->error = error;
    lastError_ = error;
    watchdogStart_.reset();
    if (stop_) {
        stop_->request();
    }
    cancelCalls();
    if (deps_.broadcast) {
        deps_.broadcast->clearInterim();
    }
    transition(AppState::Error);
    revertAt_ = now() + settings_.errorDisplay;
    retireWorkers();
}

void SessionStateMachine::endSession() {
    transition(AppState::Idle);
    if (stop_) {
        stop_->request();
    }
    cancelCalls();
    session_.reset();
    revertAt_.reset();
    watchdogStart_.reset();
    holdTracker_.reset();
    retireWorkers();
    if (deps_.broadcast) {
        deps_.broadcast->clearInterim();
    }
    updateSnapshot();
}

void SessionStateMachine::checkTimers() {
    auto current = now();
    if (watchdogStart_ && current - *watchdogStart_ > settings_.transcribingTimeout) {
        if (state_ == AppState::Transcribing) {
            finishError(
                SessionError{voxd::ErrorCode::SESSION_TIMEOUT, "transcription timed out"});
            return;
        }
        if (state_ == AppState::Refining) {
            LOG_WARN("Session {}: refine timed out, delivering unrefined transcript",
                     session_->id);
            finishDone(session_->transcript);
            return;
        }
    }
    if (revertAt_ && isTerminal(state_) && current >= *revertAt_) {
        endSession();
    }
}

void SessionStateMachine::cancelCalls() {
    if (cancel_) {
        cancel_->request();
    }
}

void SessionStateMachine::retireWorkers() {
    if (captureWorker_) {
        retiredCaptures_.push_back(std::move(captureWorker_));
    }
    if (transcriptionTask_) {
        retiredTasks_.push_back(std::move(transcriptionTask_));
    }
    if (refineTask_) {
        retiredTasks_.push_back(std::move(refineTask_));
    }
    capturedAudio_ = std::future<daemon_input::CapturedAudio>();
}

void SessionStateMachine::reapWorkers(bool wait) {
    auto reapCaptures = [wait](std::unique_ptr<daemon_input::AudioCaptureWorker>& worker) {
        if (wait || worker->finished()) {
            worker->join();
            return true;
        }
        return false;
    };
    retiredCaptures_.erase(
        std::remove_if(retiredCaptures_.begin(), retiredCaptures_.end(), reapCaptures),
        retiredCaptures_.end());

    auto reapTasks = [wait](std::unique_ptr<daemon_core::BackgroundTask>& task) {
        if (wait || task->finished()) {
            task->join();
            return true;
        }
        return false;
    };
    retiredTasks_.erase(std::remove_if(retiredTasks_.begin(), retiredTasks_.end(), reapTasks),
                        retiredTasks_.end());
}

void SessionStateMachine::shutdown() {
    if (stop_) {
        stop_->request();
    }
    cancelCalls();
    commands_.clear();
    retireWorkers();
    reapWorkers(true);
    messages_.clear();

    if (state_ != AppState::Idle) {
        transition(AppState::Idle);
    } else if (deps_.broadcast) {
        deps_.broadcast->publishState(AppState::Idle);
    }
    session_.reset();
    revertAt_.reset();
    watchdogStart_.reset();
    holdTracker_.reset();
    if (deps_.broadcast) {
        deps_.broadcast->clearInterim();
    }
    updateSnapshot();
}

AppState SessionStateMachine::state() const {
    return state_;
}

const std::optional<Session>& SessionStateMachine::session() const {
    return session_;
}

SessionSnapshot SessionStateMachine::snapshot() const {
    std::lock_guard<std::mutex> lock(snapshotMutex_);
    return snapshot_;
}

daemon_input::SessionMessageQueue& SessionStateMachine::messages() {
    return messages_;
}

daemon_core::MessageQueue<ControlCommand>& SessionStateMachine::commands() {
    return commands_;
}

size_t SessionStateMachine::pendingWorkers() const {
    return retiredCaptures_.size() + retiredTasks_.size() + (captureWorker_ ? 1 : 0) +
           (transcriptionTask_ ? 1 : 0) + (refineTask_ ? 1 : 0);
}

void SessionStateMachine::updateSnapshot() {
    SessionSnapshot snap;
    snap.state = state_;
    if (session_) {
        snap.sessionId = session_->id;
        snap.triggerKind = session_->triggerKind;
        snap.providerMode = session_->providerMode;
        snap.interimText = session_->interimText;
    }
    snap.lastText = lastText_;
    snap.lastError = lastError_;
    std::lock_guard<std::mutex> lock(snapshotMutex_);
    snapshot_ = std::move(snap);
}

}  // namespace daemon_session
