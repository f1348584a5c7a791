#include "core/config_loader.h"

#include "core/daemon_constants.h"
#include "logging/logger.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

static std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

HotkeyMode parseHotkeyMode(const std::string& str) {
    std::string lower = toLower(str);
    if (lower == "hold" || lower == "push_to_talk" || lower == "ptt") {
        return HotkeyMode::Hold;
    }
    return HotkeyMode::Toggle;
}

const char* hotkeyModeToString(HotkeyMode mode) {
    switch (mode) {
    case HotkeyMode::Hold:
        return "hold";
    case HotkeyMode::Toggle:
    default:
        return "toggle";
    }
}

static std::vector<std::string> readArgv(const nlohmann::json& value) {
    std::vector<std::string> argv;
    if (value.is_string()) {
        argv.push_back(value.get<std::string>());
        return argv;
    }
    for (const auto& item : value) {
        argv.push_back(item.get<std::string>());
    }
    return argv;
}

static int clampMs(int value, int minValue, int maxValue, const char* key, bool verbose) {
    int clamped = std::clamp(value, minValue, maxValue);
    if (clamped != value && verbose) {
        LOG_WARN("Config: {} out of range ({}), clamped to {}", key, value, clamped);
    }
    return clamped;
}

bool loadAppConfig(const std::filesystem::path& configPath, AppConfig& outConfig, bool verbose) {
    outConfig = AppConfig{};

    std::ifstream file(configPath);
    if (!file.is_open()) {
        if (verbose) {
            std::cout << "Config: " << configPath << " not found, using defaults" << '\n';
        }
        return false;
    }

    try {
        nlohmann::json j;
        file >> j;

        if (j.contains("hotkey") && j["hotkey"].is_object()) {
            const auto& hk = j["hotkey"];
            if (hk.contains("mode") && hk["mode"].is_string()) {
                std::string modeStr = hk["mode"].get<std::string>();
                outConfig.hotkey.mode = parseHotkeyMode(modeStr);
                std::string normalized = toLower(modeStr);
                if (verbose && normalized != "toggle" &&
                    outConfig.hotkey.mode == HotkeyMode::Toggle) {
                    LOG_WARN("Config: Unknown hotkey.mode '{}', falling back to 'toggle'",
                             modeStr);
                }
            }
            if (hk.contains("toggleKey") && hk["toggleKey"].is_string()) {
                outConfig.hotkey.toggleKey = hk["toggleKey"].get<std::string>();
            }
            if (hk.contains("holdKey") && hk["holdKey"].is_string()) {
                outConfig.hotkey.holdKey = hk["holdKey"].get<std::string>();
            }
            if (hk.contains("debounceMs") && hk["debounceMs"].is_number_integer()) {
                outConfig.hotkey.debounceMs = hk["debounceMs"].get<int>();
            }
            if (hk.contains("evdevEnabled") && hk["evdevEnabled"].is_boolean()) {
                outConfig.hotkey.evdevEnabled = hk["evdevEnabled"].get<bool>();
            }
        }

        if (j.contains("audio") && j["audio"].is_object()) {
            const auto& audio = j["audio"];
            try {
                if (audio.contains("device") && audio["device"].is_string()) {
                    outConfig.audio.device = audio["device"].get<std::string>();
                }
                if (audio.contains("sampleRate") && audio["sampleRate"].is_number_integer()) {
                    outConfig.audio.sampleRate = audio["sampleRate"].get<unsigned int>();
                }
                if (audio.contains("periodFrames") && audio["periodFrames"].is_number_integer()) {
                    outConfig.audio.periodFrames = audio["periodFrames"].get<unsigned int>();
                }
                if (audio.contains("vadThreshold") && audio["vadThreshold"].is_number()) {
                    outConfig.audio.vadThreshold = audio["vadThreshold"].get<float>();
                }
                if (audio.contains("trimSilence") && audio["trimSilence"].is_boolean()) {
                    outConfig.audio.trimSilence = audio["trimSilence"].get<bool>();
                }
            } catch (const std::exception& e) {
                if (verbose) {
                    LOG_WARN("Config: Invalid audio settings, using defaults: {}", e.what());
                }
                outConfig.audio = AppConfig::AudioConfig{};
            }

            if (outConfig.audio.sampleRate == 0) {
                outConfig.audio.sampleRate = DaemonConstants::DEFAULT_SAMPLE_RATE;
            }
            if (outConfig.audio.periodFrames == 0) {
                outConfig.audio.periodFrames = DaemonConstants::DEFAULT_PERIOD_FRAMES;
            }
        }

        if (j.contains("transcription") && j["transcription"].is_object()) {
            const auto& tr = j["transcription"];
            if (tr.contains("provider") && tr["provider"].is_string()) {
                outConfig.transcription.provider = toLower(tr["provider"].get<std::string>());
            }
            if (tr.contains("model") && tr["model"].is_string()) {
                outConfig.transcription.model = tr["model"].get<std::string>();
            }
            if (tr.contains("language") && tr["language"].is_string()) {
                outConfig.transcription.language = tr["language"].get<std::string>();
            }
            if (tr.contains("streaming") && tr["streaming"].is_boolean()) {
                outConfig.transcription.streaming = tr["streaming"].get<bool>();
            }
            if (tr.contains("requestTimeoutMs") && tr["requestTimeoutMs"].is_number_integer()) {
                outConfig.transcription.requestTimeoutMs = tr["requestTimeoutMs"].get<int>();
            }
            if (tr.contains("command")) {
                outConfig.transcription.command = readArgv(tr["command"]);
            }
        }

        if (j.contains("refine") && j["refine"].is_object()) {
            const auto& refine = j["refine"];
            if (refine.contains("enabled") && refine["enabled"].is_boolean()) {
                outConfig.refine.enabled = refine["enabled"].get<bool>();
            }
            if (refine.contains("command")) {
                outConfig.refine.command = readArgv(refine["command"]);
            }
            if (refine.contains("timeoutMs") && refine["timeoutMs"].is_number_integer()) {
                outConfig.refine.timeoutMs = refine["timeoutMs"].get<int>();
            }
        }

        if (j.contains("delivery") && j["delivery"].is_object()) {
            const auto& delivery = j["delivery"];
            if (delivery.contains("command")) {
                outConfig.delivery.command = readArgv(delivery["command"]);
            }
        }

        if (j.contains("session") && j["session"].is_object()) {
            const auto& s = j["session"];
            if (s.contains("tickMs") && s["tickMs"].is_number_integer()) {
                outConfig.session.tickMs = s["tickMs"].get<int>();
            }
            if (s.contains("doneDisplayMs") && s["doneDisplayMs"].is_number_integer()) {
                outConfig.session.doneDisplayMs = s["doneDisplayMs"].get<int>();
            }
            if (s.contains("errorDisplayMs") && s["errorDisplayMs"].is_number_integer()) {
                outConfig.session.errorDisplayMs = s["errorDisplayMs"].get<int>();
            }
            if (s.contains("transcribingTimeoutMs") &&
                s["transcribingTimeoutMs"].is_number_integer()) {
                outConfig.session.transcribingTimeoutMs = s["transcribingTimeoutMs"].get<int>();
            }
            if (s.contains("maxMessagesPerTick") && s["maxMessagesPerTick"].is_number_integer()) {
                int value = s["maxMessagesPerTick"].get<int>();
                outConfig.session.maxMessagesPerTick =
                    value > 0 ? static_cast<size_t>(value) : DaemonConstants::MAX_MESSAGES_PER_TICK;
            }
        }

        if (j.contains("paths") && j["paths"].is_object()) {
            const auto& paths = j["paths"];
            if (paths.contains("stateFile") && paths["stateFile"].is_string()) {
                outConfig.paths.stateFile = paths["stateFile"].get<std::string>();
            }
            if (paths.contains("interimFile") && paths["interimFile"].is_string()) {
                outConfig.paths.interimFile = paths["interimFile"].get<std::string>();
            }
            if (paths.contains("leaseFile") && paths["leaseFile"].is_string()) {
                outConfig.paths.leaseFile = paths["leaseFile"].get<std::string>();
            }
            if (paths.contains("controlEndpoint") && paths["controlEndpoint"].is_string()) {
                outConfig.paths.controlEndpoint = paths["controlEndpoint"].get<std::string>();
            }
        }

        if (j.contains("lease") && j["lease"].is_object()) {
            const auto& lease = j["lease"];
            if (lease.contains("replaceRunning") && lease["replaceRunning"].is_boolean()) {
                outConfig.lease.replaceRunning = lease["replaceRunning"].get<bool>();
            }
            if (lease.contains("graceMs") && lease["graceMs"].is_number_integer()) {
                outConfig.lease.graceMs = lease["graceMs"].get<int>();
            }
            if (lease.contains("identityMarkers") && lease["identityMarkers"].is_array()) {
                outConfig.lease.identityMarkers = readArgv(lease["identityMarkers"]);
            }
            if (outConfig.lease.identityMarkers.empty()) {
                if (verbose) {
                    LOG_WARN("Config: lease.identityMarkers is empty, using '{}'",
                             DaemonConstants::LEASE_IDENTITY_MARKER);
                }
                outConfig.lease.identityMarkers = {DaemonConstants::LEASE_IDENTITY_MARKER};
            }
        }

        // Clamp timing values after parsing (ensures sane bounds)
        outConfig.hotkey.debounceMs =
            clampMs(outConfig.hotkey.debounceMs, 0, 2000, "hotkey.debounceMs", verbose);
        outConfig.session.tickMs =
            clampMs(outConfig.session.tickMs, 10, 500, "session.tickMs", verbose);
        outConfig.session.doneDisplayMs =
            clampMs(outConfig.session.doneDisplayMs, 0, 60000, "session.doneDisplayMs", verbose);
        outConfig.session.errorDisplayMs = clampMs(outConfig.session.errorDisplayMs, 0, 60000,
                                                   "session.errorDisplayMs", verbose);
        outConfig.session.transcribingTimeoutMs =
            clampMs(outConfig.session.transcribingTimeoutMs, 1000, 600000,
                    "session.transcribingTimeoutMs", verbose);
        outConfig.transcription.requestTimeoutMs =
            clampMs(outConfig.transcription.requestTimeoutMs, 100, 600000,
                    "transcription.requestTimeoutMs", verbose);
        outConfig.refine.timeoutMs =
            clampMs(outConfig.refine.timeoutMs, 100, 600000, "refine.timeoutMs", verbose);
        outConfig.lease.graceMs =
            clampMs(outConfig.lease.graceMs, 0, 10000, "lease.graceMs", verbose);
        outConfig.audio.vadThreshold = std::clamp(outConfig.audio.vadThreshold, 0.0f, 1.0f);

        if (outConfig.refine.enabled && outConfig.refine.command.empty()) {
            if (verbose) {
                LOG_WARN("Config: refine.enabled without refine.command, refine disabled");
            }
            outConfig.refine.enabled = false;
        }

        if (verbose) {
            std::cout << "Config: Loaded from " << std::filesystem::absolute(configPath) << '\n';
        }
        return true;
    } catch (const std::exception& e) {
        if (verbose) {
            LOG_ERROR("Config: Failed to parse {}: {}", configPath.string(), e.what());
        }
        outConfig = AppConfig{};
        return false;
    }
}
