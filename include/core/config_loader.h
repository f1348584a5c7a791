#ifndef VOXD_CONFIG_LOADER_H
#define VOXD_CONFIG_LOADER_H

#include "core/daemon_constants.h"

#include <filesystem>
#include <string>
#include <vector>

constexpr const char* DEFAULT_CONFIG_FILE = "config.json";

// Hotkey trigger semantics
enum class HotkeyMode {
    Toggle,  // press to start, press again to stop
    Hold     // record while held, stop when released
};

struct AppConfig {
    struct HotkeyConfig {
        HotkeyMode mode = HotkeyMode::Toggle;
        std::string toggleKey = "ctrl+period";
        std::string holdKey = "";  // empty = same as toggleKey when mode is hold
        int debounceMs = DaemonConstants::DEBOUNCE_INTERVAL_MS;
        bool evdevEnabled = true;
    } hotkey;

    struct AudioConfig {
        std::string device = "default";
        unsigned int sampleRate = DaemonConstants::DEFAULT_SAMPLE_RATE;
        unsigned int periodFrames = DaemonConstants::DEFAULT_PERIOD_FRAMES;
        float vadThreshold = DaemonConstants::VAD_THRESHOLD;
        bool trimSilence = true;
    } audio;

    struct TranscriptionConfig {
        std::string provider = "command";
        std::string model = "";
        std::string language = "";
        bool streaming = true;  // used only when the provider supports it
        int requestTimeoutMs = DaemonConstants::REQUEST_TIMEOUT_MS;
        // argv for the command provider; "{audio}", "{model}", "{language}" are substituted
        std::vector<std::string> command = {"whisper-cli", "-nt", "-np", "-f", "{audio}"};
    } transcription;

    struct RefineConfig {
        bool enabled = false;
        std::vector<std::string> command;  // text on stdin, refined text on stdout
        int timeoutMs = DaemonConstants::REFINE_TIMEOUT_MS;
    } refine;

    struct DeliveryConfig {
        std::vector<std::string> command = {"wl-copy"};  // empty = no delivery
    } delivery;

    struct SessionConfig {
        int tickMs = DaemonConstants::TICK_INTERVAL_MS;
        int doneDisplayMs = DaemonConstants::DONE_DISPLAY_MS;
        int errorDisplayMs = DaemonConstants::ERROR_DISPLAY_MS;
        int transcribingTimeoutMs = DaemonConstants::TRANSCRIBING_TIMEOUT_MS;
        size_t maxMessagesPerTick = DaemonConstants::MAX_MESSAGES_PER_TICK;
    } session;

    struct PathConfig {
        std::string stateFile = DaemonConstants::STATE_FILE_PATH;
        std::string interimFile = DaemonConstants::INTERIM_FILE_PATH;
        std::string leaseFile = DaemonConstants::LEASE_FILE_PATH;
        std::string controlEndpoint = DaemonConstants::ZEROMQ_IPC_PATH;
    } paths;

    struct LeaseConfig {
        bool replaceRunning = true;
        int graceMs = DaemonConstants::LEASE_GRACE_MS;
        std::vector<std::string> identityMarkers = {DaemonConstants::LEASE_IDENTITY_MARKER};
    } lease;
};

// Convert string to HotkeyMode (returns Toggle for invalid input)
HotkeyMode parseHotkeyMode(const std::string& str);

const char* hotkeyModeToString(HotkeyMode mode);

// Returns false (and leaves defaults in outConfig) when the file is missing or unparseable.
bool loadAppConfig(const std::filesystem::path& configPath, AppConfig& outConfig,
                   bool verbose = true);

#endif  // VOXD_CONFIG_LOADER_H
