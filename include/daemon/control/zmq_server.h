#pragma once

#include "core/daemon_constants.h"

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace zmq {
class context_t;
class socket_t;
}  // namespace zmq

namespace daemon_ipc {

// REP socket for control requests plus a PUB socket for state events.
// Request parsing and reply formatting live in control_request.h; this
// class only moves bytes.
class ZmqControlServer {
   public:
    // Called on the listener thread with the raw request text.
    using RequestHandler = std::function<std::string(const std::string&)>;

    ZmqControlServer(std::string endpoint, RequestHandler handler, int pollIntervalMs = 100);
    ~ZmqControlServer();

    ZmqControlServer(const ZmqControlServer&) = delete;
    ZmqControlServer& operator=(const ZmqControlServer&) = delete;

    bool start();
    // Returns within one poll interval.
    void stop();

    bool isRunning() const {
        return running_.load();
    }
    bool hasBindError() const {
        return bindFailed_.load();
    }

    // Non-blocking; false when the PUB socket is not bound or the send failed.
    bool publish(const std::string& message);

    const std::string& endpoint() const {
        return endpoint_;
    }
    const std::string& pubEndpoint() const {
        return pubEndpoint_;
    }

    // ipc://x -> ipc://x.pub, tcp://host:N -> tcp://host:N+1
    static std::string derivePubEndpoint(const std::string& endpoint);

   private:
    void listen();
    void closeSockets();

    std::string endpoint_;
    std::string pubEndpoint_;
    RequestHandler handler_;
    int pollIntervalMs_;
    std::unique_ptr<zmq::context_t> context_;
    std::unique_ptr<zmq::socket_t> repSocket_;
    std::unique_ptr<zmq::socket_t> pubSocket_;
    std::mutex pubMutex_;
    std::thread listener_;
    std::atomic<bool> running_{false};
    std::atomic<bool> bindFailed_{false};
};

}  // namespace daemon_ipc
