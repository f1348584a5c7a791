#include "core/error_codes.h"

#include <iomanip>
#include <sstream>
#include <unordered_map>

namespace voxd {

static const std::unordered_map<ErrorCode, const char*> kErrorCodeStrings = {
    {ErrorCode::OK, "OK"},

    // Audio capture
    {ErrorCode::CAPTURE_DEVICE_UNAVAILABLE, "CAPTURE_DEVICE_UNAVAILABLE"},
    {ErrorCode::CAPTURE_PERMISSION_DENIED, "CAPTURE_PERMISSION_DENIED"},
    {ErrorCode::CAPTURE_READ_FAILED, "CAPTURE_READ_FAILED"},

    // Transcription provider
    {ErrorCode::PROVIDER_NETWORK, "PROVIDER_NETWORK"},
    {ErrorCode::PROVIDER_AUTH, "PROVIDER_AUTH"},
    {ErrorCode::PROVIDER_RATE_LIMITED, "PROVIDER_RATE_LIMITED"},
    {ErrorCode::PROVIDER_TIMEOUT, "PROVIDER_TIMEOUT"},
    {ErrorCode::PROVIDER_MALFORMED_RESPONSE, "PROVIDER_MALFORMED_RESPONSE"},
    {ErrorCode::PROVIDER_UNAVAILABLE, "PROVIDER_UNAVAILABLE"},
    {ErrorCode::PROVIDER_FAILED, "PROVIDER_FAILED"},

    // IPC
    {ErrorCode::IPC_INVALID_COMMAND, "IPC_INVALID_COMMAND"},
    {ErrorCode::IPC_PROTOCOL_ERROR, "IPC_PROTOCOL_ERROR"},
    {ErrorCode::IPC_BIND_FAILED, "IPC_BIND_FAILED"},

    // Lease
    {ErrorCode::LEASE_CONFLICT, "LEASE_CONFLICT"},
    {ErrorCode::LEASE_STALE_RECOVERED, "LEASE_STALE_RECOVERED"},
    {ErrorCode::LEASE_WRITE_FAILED, "LEASE_WRITE_FAILED"},

    // Session / validation
    {ErrorCode::SESSION_TIMEOUT, "SESSION_TIMEOUT"},
    {ErrorCode::REFINE_FAILED, "REFINE_FAILED"},
    {ErrorCode::VALIDATION_INVALID_CONFIG, "VALIDATION_INVALID_CONFIG"},
    {ErrorCode::SESSION_CANCELLED, "SESSION_CANCELLED"},

    // Internal
    {ErrorCode::INTERNAL_UNKNOWN, "INTERNAL_UNKNOWN"},
};

static const std::unordered_map<std::string, ErrorCode> kStringToErrorCode = []() {
    std::unordered_map<std::string, ErrorCode> map;
    for (const auto& [code, str] : kErrorCodeStrings) {
        map[str] = code;
    }
    return map;
}();

const char* errorCodeToString(ErrorCode code) {
    auto it = kErrorCodeStrings.find(code);
    if (it != kErrorCodeStrings.end()) {
        return it->second;
    }
    return "UNKNOWN_ERROR";
}

const char* getErrorCategory(ErrorCode code) {
    if (code == ErrorCode::OK) {
        return "success";
    }
    if (isCaptureError(code)) {
        return "capture";
    }
    if (isProviderError(code)) {
        return "provider";
    }
    if (isIpcError(code)) {
        return "ipc";
    }
    if (isLeaseError(code)) {
        return "lease";
    }
    if (isSessionError(code)) {
        return "session";
    }
    return "internal";
}

std::string errorCodeToHex(ErrorCode code) {
    std::ostringstream oss;
    oss << "0x" << std::hex << std::uppercase << std::setfill('0') << std::setw(4)
        << static_cast<uint32_t>(code);
    return oss.str();
}

ErrorCode stringToErrorCode(const std::string& str) {
    auto it = kStringToErrorCode.find(str);
    if (it != kStringToErrorCode.end()) {
        return it->second;
    }
    return ErrorCode::INTERNAL_UNKNOWN;
}

}  // namespace voxd
