/**
 * @file logger.h
 * @brief Logging for the voxd dictation daemon (spdlog)
 *
 * The daemon logs in two phases. Until the instance lease is held only
 * stderr is used, so a second instance never touches the running daemon's
 * log file. Once the lease is held the "logging" section of the config file
 * is applied, and it is applied again on every configuration reload. The
 * logger object itself never changes: a reload swaps the sinks behind it.
 */

#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace spdlog {
class logger;
}  // namespace spdlog

namespace voxd {
namespace logging {

enum class LogLevel : std::uint8_t {
    Trace,     // Per-block audio levels, queue traffic
    Debug,     // Worker lifecycle
    Info,      // State transitions, startup/shutdown
    Warn,      // Recoverable problems (refine fallback, stale lease)
    Error,     // Session errors (capture/provider)
    Critical,  // Daemon cannot continue
    Off
};

struct LogConfig {
    LogLevel level = LogLevel::Info;
    bool consoleOutput = true;
    bool coloredOutput = true;
    std::string filePath;  // empty: stderr only
    std::size_t maxFileSize = 5 * 1024 * 1024;
    std::size_t maxBackups = 3;
    // Empty picks a default: no timestamp when stderr is the systemd journal.
    std::string pattern;
};

/**
 * @brief Read the "logging" section of a JSON config file
 *
 * Keys: level, consoleOutput, coloredOutput, filePath, maxFileSize,
 * maxBackups, pattern. Returns false (leaving @p out untouched) when the
 * file cannot be read or parsed.
 */
bool loadLogConfig(const std::string& configPath, LogConfig& out);

/// stderr only, default level. Safe to call again after shutdown().
void initializeEarly();

/**
 * @brief Replace the sinks and level
 *
 * Returns false when the log file cannot be opened; stderr output is kept
 * in that case even if the config disabled it.
 */
bool apply(const LogConfig& config);

/// loadLogConfig() + apply(). Defaults are applied when the file has no usable section.
bool applyConfigFile(const std::string& configPath);

/// Level from the command line; outlives every later apply(). nullopt unpins.
void pinLevel(std::optional<LogLevel> level);

/// Flushes and detaches all sinks.
void shutdown();

std::shared_ptr<spdlog::logger> getLogger();

std::string_view levelToString(LogLevel level);

/// Case-insensitive; Info if unknown.
LogLevel stringToLevel(std::string_view str);

}  // namespace logging
}  // namespace voxd

#include <spdlog/spdlog.h>

#define LOG_TRACE(...)                                \
    do {                                              \
        auto logger = voxd::logging::getLogger();     \
        if (logger)                                   \
            SPDLOG_LOGGER_TRACE(logger, __VA_ARGS__); \
    } while (0)

#define LOG_DEBUG(...)                                \
    do {                                              \
        auto logger = voxd::logging::getLogger();     \
        if (logger)                                   \
            SPDLOG_LOGGER_DEBUG(logger, __VA_ARGS__); \
    } while (0)

#define LOG_INFO(...)                                \
    do {                                             \
        auto logger = voxd::logging::getLogger();    \
        if (logger)                                  \
            SPDLOG_LOGGER_INFO(logger, __VA_ARGS__); \
    } while (0)

#define LOG_WARN(...)                                \
    do {                                             \
        auto logger = voxd::logging::getLogger();    \
        if (logger)                                  \
            SPDLOG_LOGGER_WARN(logger, __VA_ARGS__); \
    } while (0)

#define LOG_ERROR(...)                                \
    do {                                              \
        auto logger = voxd::logging::getLogger();     \
        if (logger)                                   \
            SPDLOG_LOGGER_ERROR(logger, __VA_ARGS__); \
    } while (0)

#define LOG_CRITICAL(...)                                \
    do {                                                 \
        auto logger = voxd::logging::getLogger();        \
        if (logger)                                      \
            SPDLOG_LOGGER_CRITICAL(logger, __VA_ARGS__); \
    } while (0)

// Hot paths (per-block capture, queue overflow).
#define LOG_EVERY_N(level, n, ...)                            \
    do {                                                      \
        static std::atomic<uint64_t> log_count_##__LINE__{0}; \
        if (log_count_##__LINE__.fetch_add(1) % (n) == 0) {   \
            LOG_##level(__VA_ARGS__);                         \
        }                                                     \
    } while (0)

#define LOG_ONCE(level, ...)                                             \
    do {                                                                 \
        static std::atomic<bool> logged_##__LINE__{false};               \
        bool expected = false;                                           \
        if (logged_##__LINE__.compare_exchange_strong(expected, true)) { \
            LOG_##level(__VA_ARGS__);                                    \
        }                                                                \
    } while (0)
