#include "daemon/control/zmq_server.h"

#include "core/error_codes.h"
#include "logging/logger.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <unistd.h>
#include <zmq.hpp>

namespace daemon_ipc {
namespace {

constexpr const char* kIpcScheme = "ipc://";
constexpr const char* kTcpScheme = "tcp://";

bool hasScheme(const std::string& endpoint, const char* scheme) {
    return endpoint.rfind(scheme, 0) == 0;
}

// A stale socket file from a crashed run makes bind() fail with EADDRINUSE.
void unlinkIpcFile(const std::string& endpoint) {
    if (!hasScheme(endpoint, kIpcScheme)) {
        return;
    }
    const std::string path = endpoint.substr(std::strlen(kIpcScheme));
    if (!path.empty() && ::unlink(path.c_str()) != 0 && errno != ENOENT) {
        LOG_DEBUG("Control: cannot remove {}: {}", path, std::strerror(errno));
    }
}

std::string messageText(const zmq::message_t& message) {
    return std::string(static_cast<const char*>(message.data()), message.size());
}

}  // namespace

ZmqControlServer::ZmqControlServer(std::string endpoint, RequestHandler handler,
                                   int pollIntervalMs)
    : endpoint_(std::move(endpoint)),
      pubEndpoint_(derivePubEndpoint(endpoint_)),
      handler_(std::move(handler)),
      pollIntervalMs_(pollIntervalMs) {}

ZmqControlServer::~ZmqControlServer() {
    stop();
}

bool ZmqControlServer::start() {
    if (running_.load()) {
        return true;
    }

    try {
        context_ = std::make_unique<zmq::context_t>(1);

        unlinkIpcFile(endpoint_);
        repSocket_ = std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::rep);
        repSocket_->set(zmq::sockopt::linger, 0);
        repSocket_->bind(endpoint_);

        unlinkIpcFile(pubEndpoint_);
        {
            std::lock_guard<std::mutex> lock(pubMutex_);
            pubSocket_ = std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::pub);
            pubSocket_->set(zmq::sockopt::linger, 0);
            pubSocket_->bind(pubEndpoint_);
        }
    } catch (const zmq::error_t& e) {
        LOG_ERROR("Control: cannot bind {} [{}]: {}", endpoint_,
                  voxd::errorCodeToString(voxd::ErrorCode::IPC_BIND_FAILED), e.what());
        bindFailed_.store(true);
        closeSockets();
        return false;
    }

    bindFailed_.store(false);
    running_.store(true);
    listener_ = std::thread(&ZmqControlServer::listen, this);
    LOG_INFO("Control: requests on {}, events on {}", endpoint_, pubEndpoint_);
    return true;
}

void ZmqControlServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    if (listener_.joinable()) {
        listener_.join();
    }
    closeSockets();
    unlinkIpcFile(endpoint_);
    unlinkIpcFile(pubEndpoint_);
    LOG_DEBUG("Control: listener stopped");
}

bool ZmqControlServer::publish(const std::string& message) {
    std::lock_guard<std::mutex> lock(pubMutex_);
    if (!pubSocket_) {
        return false;
    }
    try {
        return pubSocket_->send(zmq::buffer(message), zmq::send_flags::dontwait).has_value();
    } catch (const zmq::error_t& e) {
        LOG_EVERY_N(WARN, 50, "Control: event dropped: {}", e.what());
        return false;
    }
}

void ZmqControlServer::listen() {
    const auto interval = std::chrono::milliseconds(pollIntervalMs_);

    while (running_.load()) {
        try {
            zmq::pollitem_t items[] = {{repSocket_->handle(), 0, ZMQ_POLLIN, 0}};
            zmq::poll(items, 1, interval);
            if ((items[0].revents & ZMQ_POLLIN) == 0) {
                continue;
            }

            zmq::message_t request;
            if (!repSocket_->recv(request, zmq::recv_flags::dontwait)) {
                continue;
            }

            const std::string raw = messageText(request);
            std::string reply;
            try {
                reply = handler_(raw);
            } catch (const std::exception& e) {
                // REP must answer every request or the socket wedges.
                LOG_ERROR("Control: request '{}' failed: {}", raw, e.what());
                reply = std::string("ERR:") + e.what();
            }
            repSocket_->send(zmq::buffer(reply), zmq::send_flags::none);
        } catch (const zmq::error_t& e) {
            if (running_.load()) {
                LOG_WARN("Control: listener error: {}", e.what());
            }
        }
    }
}

void ZmqControlServer::closeSockets() {
    repSocket_.reset();
    {
        std::lock_guard<std::mutex> lock(pubMutex_);
        pubSocket_.reset();
    }
    context_.reset();
}

std::string ZmqControlServer::derivePubEndpoint(const std::string& endpoint) {
    if (hasScheme(endpoint, kTcpScheme)) {
        const auto colon = endpoint.rfind(':');
        const std::string port = endpoint.substr(colon + 1);
        const bool numeric =
            !port.empty() && port.size() <= 5 &&
            std::all_of(port.begin(), port.end(),
                        [](unsigned char c) { return std::isdigit(c) != 0; });
        if (colon > std::strlen(kTcpScheme) && numeric) {
            return endpoint.substr(0, colon + 1) + std::to_string(std::stoi(port) + 1);
        }
    }
    return endpoint + DaemonConstants::ZEROMQ_PUB_SUFFIX;
}

}  // namespace daemon_ipc
