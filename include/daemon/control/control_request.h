#pragma once

#include "core/error_codes.h"

#include <functional>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace daemon_ipc {

// One control request: raw "CMD[:payload]" text or a JSON object
// {"cmd": "...", "source": "..."}. Replies use the format of the request.
struct ControlRequest {
    std::string raw;
    std::optional<nlohmann::json> json;
    std::string command;  // upper-cased
    std::string payload;  // text after ':' or the JSON "source"
    bool isJson = false;
    std::string parseError;
};

ControlRequest parseControlRequest(const std::string& raw);

// "OK", "OK:<message>", "OK:<data>" or {"status":"ok","message":..,"data":..}
std::string okReply(const ControlRequest& request, const std::string& message = "",
                    const nlohmann::json& data = {});

// "ERR:<message>" or {"status":"error","error_code":..,"message":..}
std::string errorReply(const ControlRequest& request, voxd::ErrorCode code,
                       const std::string& message);

// Compact dump; invalid UTF-8 (e.g. a split multibyte sequence in recognizer
// output) is replaced with U+FFFD instead of throwing.
std::string toWireJson(const nlohmann::json& value);

// Command name -> handler. Parse errors, unknown commands and handler
// exceptions all come back as error replies.
class CommandTable {
   public:
    using Handler = std::function<std::string(const ControlRequest&)>;

    void add(const std::string& command, Handler handler);

    std::string dispatch(const ControlRequest& request) const;
    std::string dispatch(const std::string& raw) const;

   private:
    std::map<std::string, Handler> handlers_;
};

}  // namespace daemon_ipc
