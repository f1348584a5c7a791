#include "daemon/control/control_plane.h"

#include "core/error_codes.h"
#include "logging/logger.h"

#include <utility>

namespace daemon_control {
namespace {

using daemon_session::ControlCommandType;

constexpr const char* kIpcSourceId = "ipc";

}  // namespace

ControlPlane::ControlPlane(ControlPlaneDependencies deps) : deps_(std::move(deps)) {
    registerHandlers();
}

ControlPlane::~ControlPlane() {
    stop();
}

bool ControlPlane::start() {
    zmqServer_ = std::make_unique<daemon_ipc::ZmqControlServer>(
        deps_.endpoint, [this](const std::string& raw) { return handle(raw); });

    if (zmqServer_->start()) {
        return true;
    }

    if (deps_.zmqBindFailed) {
        deps_.zmqBindFailed->store(true, std::memory_order_release);
    }
    zmqServer_.reset();
    return false;
}

void ControlPlane::stop() {
    if (zmqServer_) {
        zmqServer_->stop();
        zmqServer_.reset();
    }
}

void ControlPlane::publishState(daemon_session::AppState state,
                                daemon_session::SessionId sessionId) {
    if (!zmqServer_) {
        return;
    }
    nlohmann::json event;
    event["event"] = "state";
    event["state"] = daemon_session::appStateToString(state);
    event["session"] = sessionId;
    zmqServer_->publish(daemon_ipc::toWireJson(event));
}

std::string ControlPlane::handle(const std::string& raw) const {
    return commands_.dispatch(raw);
}

nlohmann::json ControlPlane::snapshotToJson(const daemon_session::SessionSnapshot& snapshot) {
    nlohmann::json data;
    data["state"] = daemon_session::appStateToString(snapshot.state);
    data["session"] = snapshot.sessionId;
    data["trigger"] = nullptr;
    if (snapshot.triggerKind) {
        data["trigger"] = daemon_session::triggerKindToString(*snapshot.triggerKind);
    }
    data["mode"] = nullptr;
    if (snapshot.providerMode) {
        data["mode"] = daemon_session::providerModeToString(*snapshot.providerMode);
    }
    data["interim"] = snapshot.interimText;
    data["last_text"] = snapshot.lastText;
    if (snapshot.lastError) {
        data["last_error"] = {{"code", voxd::errorCodeToString(snapshot.lastError->code)},
                              {"message", snapshot.lastError->message}};
    } else {
        data["last_error"] = nullptr;
    }
    return data;
}

void ControlPlane::registerHandlers() {
    commands_.add("PING", [this](const auto& req) { return handlePing(req); });
    commands_.add("STATUS", [this](const auto& req) { return handleStatus(req); });
    commands_.add("RELOAD", [this](const auto& req) { return handleReload(req); });
    commands_.add("TOGGLE", [this](const auto& req) {
        return handleCommand(req, ControlCommandType::Toggle);
    });
    commands_.add("START", [this](const auto& req) {
        return handleCommand(req, ControlCommandType::Start);
    });
    commands_.add("STOP", [this](const auto& req) {
        return handleCommand(req, ControlCommandType::Stop);
    });
    commands_.add("HOLD_PRESS", [this](const auto& req) {
        return handleCommand(req, ControlCommandType::HoldPress);
    });
    commands_.add("HOLD_RELEASE", [this](const auto& req) {
        return handleCommand(req, ControlCommandType::HoldRelease);
    });
    commands_.add("ACK", [this](const auto& req) {
        return handleCommand(req, ControlCommandType::Acknowledge);
    });
}

std::string ControlPlane::handleCommand(const daemon_ipc::ControlRequest& request,
                                        ControlCommandType type) {
    if (!deps_.postCommand) {
        return daemon_ipc::errorReply(request, voxd::ErrorCode::IPC_PROTOCOL_ERROR,
                                      "Session control unavailable");
    }
    std::string source = kIpcSourceId;
    if (!request.payload.empty()) {
        source += ":" + request.payload;
    }
    deps_.postCommand(daemon_session::ControlCommand{type, source});
    return daemon_ipc::okReply(request, "queued");
}

std::string ControlPlane::handlePing(const daemon_ipc::ControlRequest& request) {
    return daemon_ipc::okReply(request);
}

std::string ControlPlane::handleStatus(const daemon_ipc::ControlRequest& request) {
    if (!deps_.snapshot) {
        return daemon_ipc::errorReply(request, voxd::ErrorCode::IPC_PROTOCOL_ERROR,
                                      "Status unavailable");
    }
    return daemon_ipc::okReply(request, "", snapshotToJson(deps_.snapshot()));
}

std::string ControlPlane::handleReload(const daemon_ipc::ControlRequest& request) {
    if (!deps_.reloadRequested) {
        return daemon_ipc::errorReply(request, voxd::ErrorCode::IPC_PROTOCOL_ERROR,
                                      "Reload unavailable");
    }
    deps_.reloadRequested->store(true, std::memory_order_release);
    LOG_INFO("Control: configuration reload requested");
    return daemon_ipc::okReply(request, "reload scheduled");
}

}  // namespace daemon_control
