#include "logging/logger.h"

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <mutex>
#include <nlohmann/json.hpp>
#include <spdlog/sinks/dist_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <vector>

namespace voxd {
namespace logging {

namespace {

constexpr const char* kLoggerName = "voxd";
constexpr const char* kTerminalPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v";
// journald adds its own timestamp and pid.
constexpr const char* kJournalPattern = "[%l] [%t] %v";

std::once_flag g_createOnce;
std::shared_ptr<spdlog::sinks::dist_sink_mt> g_sinks;
std::shared_ptr<spdlog::logger> g_logger;

std::mutex g_configMutex;
std::optional<LogLevel> g_pinnedLevel;
LogLevel g_configLevel = LogLevel::Info;

spdlog::level::level_enum toSpdlogLevel(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return spdlog::level::trace;
    case LogLevel::Debug:
        return spdlog::level::debug;
    case LogLevel::Info:
        return spdlog::level::info;
    case LogLevel::Warn:
        return spdlog::level::warn;
    case LogLevel::Error:
        return spdlog::level::err;
    case LogLevel::Critical:
        return spdlog::level::critical;
    case LogLevel::Off:
        return spdlog::level::off;
    }
    return spdlog::level::info;
}

bool stderrIsJournal() {
    return std::getenv("JOURNAL_STREAM") != nullptr;
}

void createLogger() {
    g_sinks = std::make_shared<spdlog::sinks::dist_sink_mt>();
    g_logger = std::make_shared<spdlog::logger>(kLoggerName, g_sinks);
    g_logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(g_logger);
}

spdlog::sink_ptr makeConsoleSink(const LogConfig& config) {
    const bool journal = stderrIsJournal();
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>(
        config.coloredOutput && !journal ? spdlog::color_mode::automatic
                                         : spdlog::color_mode::never);
    if (!config.pattern.empty()) {
        sink->set_pattern(config.pattern);
    } else {
        sink->set_pattern(journal ? kJournalPattern : kTerminalPattern);
    }
    return sink;
}

void applyLevelLocked() {
    g_logger->set_level(toSpdlogLevel(g_pinnedLevel.value_or(g_configLevel)));
}

}  // namespace

bool loadLogConfig(const std::string& configPath, LogConfig& out) {
    std::ifstream file(configPath);
    if (!file.is_open()) {
        return false;
    }

    try {
        nlohmann::json json;
        file >> json;
        if (!json.contains("logging") || !json["logging"].is_object()) {
            return false;
        }

        const auto& section = json["logging"];
        LogConfig config;
        config.level = stringToLevel(section.value("level", std::string("info")));
        config.consoleOutput = section.value("consoleOutput", config.consoleOutput);
        config.coloredOutput = section.value("coloredOutput", config.coloredOutput);
        config.filePath = section.value("filePath", config.filePath);
        config.maxFileSize = section.value("maxFileSize", config.maxFileSize);
        config.maxBackups = section.value("maxBackups", config.maxBackups);
        config.pattern = section.value("pattern", config.pattern);
        out = config;
        return true;
    } catch (const nlohmann::json::exception& e) {
        LOG_WARN("Logging: cannot read {}: {}", configPath, e.what());
        return false;
    }
}

void initializeEarly() {
    apply(LogConfig{});
}

bool apply(const LogConfig& config) {
    auto logger = getLogger();

    std::vector<spdlog::sink_ptr> sinks;
    if (config.consoleOutput) {
        sinks.push_back(makeConsoleSink(config));
    }

    bool fileOpened = true;
    if (!config.filePath.empty()) {
        try {
            auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.filePath, config.maxFileSize, config.maxBackups);
            file->set_pattern(config.pattern.empty() ? kTerminalPattern : config.pattern);
            sinks.push_back(file);
        } catch (const spdlog::spdlog_ex& e) {
            std::cerr << "Logging: cannot open " << config.filePath << ": " << e.what()
                      << std::endl;
            fileOpened = false;
            if (!config.consoleOutput) {
                sinks.push_back(makeConsoleSink(config));
            }
        }
    }

    {
        std::lock_guard<std::mutex> lock(g_configMutex);
        g_configLevel = config.level;
        g_sinks->set_sinks(std::move(sinks));
        applyLevelLocked();
    }

    if (!config.filePath.empty() && fileOpened) {
        LOG_INFO("Logging: level {}, file {} ({} MB x {})", levelToString(config.level),
                 config.filePath, config.maxFileSize / (1024 * 1024), config.maxBackups);
    } else {
        LOG_DEBUG("Logging: level {}, stderr only", levelToString(config.level));
    }
    return fileOpened;
}

bool applyConfigFile(const std::string& configPath) {
    LogConfig config;
    if (!loadLogConfig(configPath, config)) {
        LOG_DEBUG("Logging: no usable \"logging\" section in {}, using defaults", configPath);
    }
    return apply(config);
}

void pinLevel(std::optional<LogLevel> level) {
    getLogger();
    std::lock_guard<std::mutex> lock(g_configMutex);
    g_pinnedLevel = level;
    applyLevelLocked();
}

void shutdown() {
    auto logger = getLogger();
    logger->flush();
    std::lock_guard<std::mutex> lock(g_configMutex);
    g_sinks->set_sinks({});
}

std::shared_ptr<spdlog::logger> getLogger() {
    std::call_once(g_createOnce, createLogger);
    return g_logger;
}

std::string_view levelToString(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return "trace";
    case LogLevel::Debug:
        return "debug";
    case LogLevel::Info:
        return "info";
    case LogLevel::Warn:
        return "warn";
    case LogLevel::Error:
        return "error";
    case LogLevel::Critical:
        return "critical";
    case LogLevel::Off:
        return "off";
    }
    return "info";
}

LogLevel stringToLevel(std::string_view str) {
    std::string lower;
    lower.reserve(str.size());
    for (char c : str) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }

    if (lower == "trace")
        return LogLevel::Trace;
    if (lower == "debug")
        return LogLevel::Debug;
    if (lower == "warn" || lower == "warning")
        return LogLevel::Warn;
    if (lower == "error" || lower == "err")
        return LogLevel::Error;
    if (lower == "critical" || lower == "fatal")
        return LogLevel::Critical;
    if (lower == "off" || lower == "none")
        return LogLevel::Off;
    return LogLevel::Info;
}

}  // namespace logging
}  // namespace voxd
