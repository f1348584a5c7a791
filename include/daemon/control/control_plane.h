#pragma once

#include "daemon/control/control_request.h"
#include "daemon/control/zmq_server.h"
#include "daemon/session/app_state.h"
#include "daemon/session/messages.h"
#include "daemon/session/session_state_machine.h"

#include <atomic>
#include <functional>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>

namespace daemon_control {

struct ControlPlaneDependencies {
    std::string endpoint = DaemonConstants::ZEROMQ_IPC_PATH;

    // Queues a command for the control thread (SessionStateMachine::post).
    std::function<void(daemon_session::ControlCommand)> postCommand;
    std::function<daemon_session::SessionSnapshot()> snapshot;

    std::atomic<bool>* reloadRequested = nullptr;
    std::atomic<bool>* zmqBindFailed = nullptr;
};

// ZeroMQ front-end of the daemon: REP commands are translated into
// ControlCommands, state transitions are published on the PUB socket.
class ControlPlane {
   public:
    explicit ControlPlane(ControlPlaneDependencies deps);
    ~ControlPlane();

    ControlPlane(const ControlPlane&) = delete;
    ControlPlane& operator=(const ControlPlane&) = delete;

    bool start();
    void stop();

    // {"event":"state","state":"recording","session":N}
    void publishState(daemon_session::AppState state, daemon_session::SessionId sessionId);

    // Socket-free entry point, also used by the listener thread.
    std::string handle(const std::string& raw) const;

    static nlohmann::json snapshotToJson(const daemon_session::SessionSnapshot& snapshot);

   private:
    void registerHandlers();
    std::string handleCommand(const daemon_ipc::ControlRequest& request,
                              daemon_session::ControlCommandType type);
    std::string handlePing(const daemon_ipc::ControlRequest& request);
    std::string handleStatus(const daemon_ipc::ControlRequest& request);
    std::string handleReload(const daemon_ipc::ControlRequest& request);

    ControlPlaneDependencies deps_;
    daemon_ipc::CommandTable commands_;
    std::unique_ptr<daemon_ipc::ZmqControlServer> zmqServer_;
};

}  // namespace daemon_control
