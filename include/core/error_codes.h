#ifndef VOXD_ERROR_CODES_H
#define VOXD_ERROR_CODES_H

#include <cstdint>
#include <stdexcept>
#include <string>

namespace voxd {

/**
 * @brief Error codes for the dictation daemon.
 *
 * Categories use the upper bits (0xF000 mask):
 * - 0x1xxx: Audio capture
 * - 0x2xxx: Transcription provider
 * - 0x3xxx: IPC/ZeroMQ control plane
 * - 0x4xxx: Process lease
 * - 0x5xxx: Session / validation
 * - 0xFxxx: Internal (reserved)
 */
enum class ErrorCode : uint32_t {
    OK = 0,

    // Audio capture (0x1000)
    CAPTURE_DEVICE_UNAVAILABLE = 0x1001,
    CAPTURE_PERMISSION_DENIED = 0x1002,
    CAPTURE_READ_FAILED = 0x1003,

    // Transcription provider (0x2000)
    PROVIDER_NETWORK = 0x2001,
    PROVIDER_AUTH = 0x2002,
    PROVIDER_RATE_LIMITED = 0x2003,
    PROVIDER_TIMEOUT = 0x2004,
    PROVIDER_MALFORMED_RESPONSE = 0x2005,
    PROVIDER_UNAVAILABLE = 0x2006,
    PROVIDER_FAILED = 0x2007,

    // IPC/ZeroMQ (0x3000)
    IPC_INVALID_COMMAND = 0x3001,
    IPC_PROTOCOL_ERROR = 0x3002,
    IPC_BIND_FAILED = 0x3003,

    // Process lease (0x4000)
    LEASE_CONFLICT = 0x4001,
    LEASE_STALE_RECOVERED = 0x4002,
    LEASE_WRITE_FAILED = 0x4003,

    // Session / validation (0x5000)
    SESSION_TIMEOUT = 0x5001,
    REFINE_FAILED = 0x5002,
    VALIDATION_INVALID_CONFIG = 0x5003,
    SESSION_CANCELLED = 0x5004,

    INTERNAL_UNKNOWN = 0xF001,
};

/**
 * @brief Convert ErrorCode to its name (e.g. "PROVIDER_TIMEOUT"),
 *        "UNKNOWN_ERROR" for unmapped values.
 */
const char* errorCodeToString(ErrorCode code);

/**
 * @brief Category name of an error code ("capture", "provider", ...).
 */
const char* getErrorCategory(ErrorCode code);

/**
 * @brief Hex representation (e.g. "0x2004").
 */
std::string errorCodeToHex(ErrorCode code);

/**
 * @brief Parse an error code name, INTERNAL_UNKNOWN if not found.
 */
ErrorCode stringToErrorCode(const std::string& str);

constexpr bool isCaptureError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x1000;
}
constexpr bool isProviderError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x2000;
}
constexpr bool isIpcError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x3000;
}
constexpr bool isLeaseError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x4000;
}
constexpr bool isSessionError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x5000;
}

/**
 * @brief Check if a failed provider call may succeed when retried later.
 *
 * Retryable: network failures, rate limiting, timeouts.
 */
constexpr bool isRetryable(ErrorCode code) {
    return code == ErrorCode::PROVIDER_NETWORK || code == ErrorCode::PROVIDER_RATE_LIMITED ||
           code == ErrorCode::PROVIDER_TIMEOUT;
}

/**
 * @brief Base for errors raised across a collaborator boundary.
 */
class DaemonError : public std::runtime_error {
   public:
    DaemonError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const {
        return code_;
    }

   private:
    ErrorCode code_;
};

// Device unavailable / permission denied; surfaces as the session Error state.
class CaptureError : public DaemonError {
   public:
    using DaemonError::DaemonError;
};

// Network, auth, rate-limit, timeout or malformed response from a provider.
class ProviderError : public DaemonError {
   public:
    explicit ProviderError(const std::string& message)
        : DaemonError(ErrorCode::PROVIDER_FAILED, message) {}
    ProviderError(ErrorCode code, const std::string& message) : DaemonError(code, message) {}
};

// Any refine failure. Never escapes RefineFallback.
class RefineError : public DaemonError {
   public:
    explicit RefineError(const std::string& message)
        : DaemonError(ErrorCode::REFINE_FAILED, message) {}
    RefineError(ErrorCode code, const std::string& message) : DaemonError(code, message) {}
};

}  // namespace voxd

#endif  // VOXD_ERROR_CODES_H
