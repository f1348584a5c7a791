#ifndef VOXD_DAEMON_CONSTANTS_H
#define VOXD_DAEMON_CONSTANTS_H

#include <cstddef>

// Constants shared across daemon components. Every value here is a default;
// AppConfig may override the ones that have a config key.

namespace DaemonConstants {

// Capture format expected by speech models
constexpr int DEFAULT_SAMPLE_RATE = 16000;
constexpr int CHANNELS = 1;
constexpr int DEFAULT_PERIOD_FRAMES = 1024;
constexpr int CAPTURE_WAIT_TIMEOUT_MS = 100;

// Voice activity detection (RMS of a float block in [-1, 1])
constexpr float VAD_THRESHOLD = 0.015f;
constexpr float TRIM_THRESHOLD_RATIO = 0.5f;   // trim threshold = VAD * ratio ...
constexpr float TRIM_MAX_RMS_RATIO = 0.03f;    // ... capped by maxLevel * ratio
constexpr int TRIM_WINDOW_MS = 20;
constexpr int TRIM_HOP_MS = 10;
constexpr int TRIM_PAD_MS = 250;

// Hotkey handling
constexpr int DEBOUNCE_INTERVAL_MS = 150;

// Session timing
constexpr int TICK_INTERVAL_MS = 50;
constexpr int DONE_DISPLAY_MS = 400;
constexpr int ERROR_DISPLAY_MS = 800;
constexpr int TRANSCRIBING_TIMEOUT_MS = 45000;
constexpr size_t MAX_MESSAGES_PER_TICK = 50;

// Provider calls
constexpr int REQUEST_TIMEOUT_MS = 30000;
constexpr int REFINE_TIMEOUT_MS = 20000;
constexpr int STREAM_FINALIZE_TIMEOUT_MS = 2000;
constexpr size_t STREAM_CHANNEL_CAPACITY = 256;
constexpr int DELIVERY_TIMEOUT_MS = 5000;
constexpr int CALL_CANCEL_GRACE_MS = 1000;  // wait for an aborted call to return

// Status broadcast
constexpr int INTERIM_THROTTLE_MS = 150;
constexpr const char* STATE_FILE_PATH = "/tmp/voxd.state";
constexpr const char* INTERIM_FILE_PATH = "/tmp/voxd.interim";

// Process lease
constexpr const char* LEASE_FILE_PATH = "/tmp/voxd.pid";
constexpr int LEASE_GRACE_MS = 500;
constexpr const char* LEASE_IDENTITY_MARKER = "voxd";

// ZeroMQ endpoints
constexpr const char* ZEROMQ_IPC_PATH = "ipc:///tmp/voxd.sock";
constexpr const char* ZEROMQ_PUB_SUFFIX = ".pub";

}  // namespace DaemonConstants

#endif  // VOXD_DAEMON_CONSTANTS_H
