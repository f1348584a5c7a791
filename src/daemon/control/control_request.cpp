#include "daemon/control/control_request.h"

#include "logging/logger.h"

#include <algorithm>
#include <cctype>

namespace daemon_ipc {
namespace {

void trimRequestText(std::string& value) {
    auto pos = value.find('\0');
    if (pos != std::string::npos) {
        value.erase(pos);
    }
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back()))) {
        value.pop_back();
    }
}

std::string upperCase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return value;
}

bool hasData(const nlohmann::json& data) {
    return !data.is_null() && !data.empty();
}

}  // namespace

ControlRequest parseControlRequest(const std::string& raw) {
    ControlRequest request;
    request.raw = raw;
    if (raw.empty()) {
        return request;
    }

    if (raw.front() == '{') {
        request.isJson = true;
        try {
            request.json = nlohmann::json::parse(raw);
            const auto& body = *request.json;
            if (body.contains("cmd") && body["cmd"].is_string()) {
                request.command = upperCase(body["cmd"].get<std::string>());
            }
            if (body.contains("source") && body["source"].is_string()) {
                request.payload = body["source"].get<std::string>();
            }
        } catch (const nlohmann::json::exception& e) {
            request.parseError = e.what();
        }
        return request;
    }

    auto colonPos = raw.find(':');
    request.command = raw.substr(0, colonPos);
    if (colonPos != std::string::npos) {
        request.payload = raw.substr(colonPos + 1);
    }
    trimRequestText(request.command);
    trimRequestText(request.payload);
    request.command = upperCase(request.command);
    return request;
}

std::string okReply(const ControlRequest& request, const std::string& message,
                    const nlohmann::json& data) {
    if (request.isJson) {
        nlohmann::json resp;
        resp["status"] = "ok";
        if (!message.empty()) {
            resp["message"] = message;
        }
        if (hasData(data)) {
            resp["data"] = data;
        }
        return toWireJson(resp);
    }
    if (hasData(data)) {
        return "OK:" + toWireJson(data);
    }
    return message.empty() ? std::string("OK") : "OK:" + message;
}

std::string errorReply(const ControlRequest& request, voxd::ErrorCode code,
                       const std::string& message) {
    if (!request.isJson) {
        return "ERR:" + message;
    }
    nlohmann::json resp;
    resp["status"] = "error";
    resp["error_code"] = voxd::errorCodeToString(code);
    resp["message"] = message;
    return toWireJson(resp);
}

std::string toWireJson(const nlohmann::json& value) {
    return value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

void CommandTable::add(const std::string& command, Handler handler) {
    handlers_[command] = std::move(handler);
}

std::string CommandTable::dispatch(const std::string& raw) const {
    return dispatch(parseControlRequest(raw));
}

std::string CommandTable::dispatch(const ControlRequest& request) const {
    if (!request.parseError.empty()) {
        return errorReply(request, voxd::ErrorCode::IPC_PROTOCOL_ERROR,
                          "JSON parse error: " + request.parseError);
    }

    auto it = handlers_.find(request.command);
    if (it == handlers_.end()) {
        const std::string name = request.command.empty() ? "<empty>" : request.command;
        return errorReply(request, voxd::ErrorCode::IPC_INVALID_COMMAND,
                          "Unknown command: " + name);
    }

    try {
        return it->second(request);
    } catch (const std::exception& e) {
        LOG_ERROR("Control: {} failed: {}", request.command, e.what());
        return errorReply(request, voxd::ErrorCode::IPC_PROTOCOL_ERROR,
                          std::string("Handler exception: ") + e.what());
    }
}

}  // namespace daemon_ipc
