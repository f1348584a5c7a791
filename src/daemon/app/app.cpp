#include "daemon/app/app.h"

#include "audio/wav_io.h"
#include "core/config_loader.h"
#include "core/daemon_constants.h"
#include "core/process_runner.h"
#include "daemon/control/control_plane.h"
#include "daemon/input/alsa_audio_source.h"
#include "daemon/input/evdev_hotkey_listener.h"
#include "daemon/input/hotkey_router.h"
#include "daemon/input/wav_file_audio_source.h"
#include "daemon/output/transcript_sink.h"
#include "daemon/session/session_state_machine.h"
#include "daemon/shutdown_manager.h"
#include "daemon/status/status_broadcast.h"
#include "daemon/transcription/command_provider.h"
#include "daemon/transcription/provider_registry.h"
#include "daemon/transcription/refine_fallback.h"
#include "daemon/transcription/transcription_coordinator.h"
#include "logging/logger.h"

#include <chrono>
#include <memory>
#include <utility>
#include <vector>

namespace daemon_app {

namespace {

using std::chrono::milliseconds;

constexpr const char* kReplaySourceId = "replay";

void print_config_summary(const AppConfig& cfg) {
    LOG_INFO("Config: hotkey mode={} toggle='{}' hold='{}' debounce={}ms",
             hotkeyModeToString(cfg.hotkey.mode), cfg.hotkey.toggleKey, cfg.hotkey.holdKey,
             cfg.hotkey.debounceMs);
    LOG_INFO("Config: audio device={} rate={}Hz period={} vad={:.4f} trim={}", cfg.audio.device,
             cfg.audio.sampleRate, cfg.audio.periodFrames, cfg.audio.vadThreshold,
             cfg.audio.trimSilence ? "on" : "off");
    LOG_INFO("Config: provider={} model='{}' language='{}' streaming={} timeout={}ms",
             cfg.transcription.provider, cfg.transcription.model, cfg.transcription.language,
             cfg.transcription.streaming ? "on" : "off", cfg.transcription.requestTimeoutMs);
    LOG_INFO("Config: refine={} delivery='{}'", cfg.refine.enabled ? "on" : "off",
             process_runner::joinArgs(cfg.delivery.command));
    LOG_DEBUG("Config: tick={}ms done={}ms error={}ms watchdog={}ms", cfg.session.tickMs,
              cfg.session.doneDisplayMs, cfg.session.errorDisplayMs,
              cfg.session.transcribingTimeoutMs);
}

void load_runtime_config(RuntimeState& state, const std::string& configFilePath) {
    AppConfig loaded;
    bool found = loadAppConfig(configFilePath, loaded);
    state.config = loaded;
    if (!found) {
        LOG_INFO("Config: Using defaults (no usable {} found)", configFilePath);
    }
    print_config_summary(state.config);
}

// Sample rate of a replay file, 0 when it cannot be opened.
int probe_replay_rate(const std::string& path) {
    AudioIO::WavReader reader;
    if (!reader.open(path)) {
        return 0;
    }
    int rate = reader.getSampleRate();
    reader.close();
    return rate;
}

daemon_input::AudioSourceFactory make_source_factory(const AppConfig& cfg,
                                                     const AppOverrides& overrides) {
    if (overrides.replayPath) {
        std::string path = *overrides.replayPath;
        size_t period = cfg.audio.periodFrames;
        return [path, period]() {
            return std::make_unique<daemon_input::WavFileAudioSource>(path, period, true);
        };
    }
    std::string device = cfg.audio.device;
    unsigned int rate = cfg.audio.sampleRate;
    auto period = static_cast<snd_pcm_uframes_t>(cfg.audio.periodFrames);
    return [device, rate, period]() {
        return std::make_unique<daemon_input::AlsaAudioSource>(device, rate, period);
    };
}

void register_providers(daemon_transcription::ProviderRegistry& registry, const AppConfig& cfg) {
    auto argv = cfg.transcription.command;
    milliseconds timeout(cfg.transcription.requestTimeoutMs);
    registry.registerFactory("command", [argv, timeout]() {
        return std::make_shared<daemon_transcription::CommandProvider>(argv, timeout);
    });
    if (!registry.has(cfg.transcription.provider)) {
        LOG_WARN("Provider '{}' is not available (known: {}); sessions will fail",
                 cfg.transcription.provider, process_runner::joinArgs(registry.names()));
    }
}

daemon_transcription::CoordinatorSettings make_coordinator_settings(const AppConfig& cfg,
                                                                    int sampleRate) {
    daemon_transcription::CoordinatorSettings settings;
    settings.providerName = cfg.transcription.provider;
    settings.model = cfg.transcription.model;
    settings.language = cfg.transcription.language;
    settings.streamingEnabled = cfg.transcription.streaming;
    settings.sampleRate = sampleRate;
    settings.vadThreshold = cfg.audio.vadThreshold;
    settings.trimSilence = cfg.audio.trimSilence;
    settings.requestTimeout = milliseconds(cfg.transcription.requestTimeoutMs);
    settings.finalizeTimeout = milliseconds(DaemonConstants::STREAM_FINALIZE_TIMEOUT_MS);
    return settings;
}

daemon_session::SessionSettings make_session_settings(const AppConfig& cfg) {
    daemon_session::SessionSettings settings;
    settings.vadThreshold = cfg.audio.vadThreshold;
    settings.doneDisplay = milliseconds(cfg.session.doneDisplayMs);
    settings.errorDisplay = milliseconds(cfg.session.errorDisplayMs);
    settings.transcribingTimeout = milliseconds(cfg.session.transcribingTimeoutMs);
    settings.maxMessagesPerTick = cfg.session.maxMessagesPerTick;
    return settings;
}

struct HotkeyPlan {
    std::vector<daemon_input::HotkeyBinding> bindings;
    std::vector<daemon_input::HotkeyRole> roles;
};

HotkeyPlan make_hotkey_plan(const AppConfig& cfg) {
    HotkeyPlan plan;
    auto add = [&plan](const std::string& text, daemon_input::HotkeyRole role) {
        if (text.empty()) {
            return;
        }
        if (auto binding = daemon_input::parseHotkey(text)) {
            plan.bindings.push_back(*binding);
            plan.roles.push_back(role);
        }
    };

    if (cfg.hotkey.mode == HotkeyMode::Hold) {
        add(cfg.hotkey.holdKey.empty() ? cfg.hotkey.toggleKey : cfg.hotkey.holdKey,
            daemon_input::HotkeyRole::Hold);
    } else {
        add(cfg.hotkey.toggleKey, daemon_input::HotkeyRole::Toggle);
        if (cfg.hotkey.holdKey != cfg.hotkey.toggleKey) {
            add(cfg.hotkey.holdKey, daemon_input::HotkeyRole::Hold);
        }
    }
    return plan;
}

}  // namespace

App::App(RuntimeState& state, std::string configFilePath)
    : state_(state), configFilePath_(std::move(configFilePath)) {}

int App::run(const AppOverrides& overrides) {
    daemon_session::SessionStateMachine* activeMachine = nullptr;
    shutdown_manager::ShutdownManager::Dependencies shutdownDeps{
        &state_.flags.running, &state_.flags.reloadRequested, [&activeMachine]() {
            if (activeMachine && activeMachine->state() != daemon_session::AppState::Idle) {
                LOG_WARN("Cancelling active session {}", activeMachine->snapshot().sessionId);
            }
        }};
    shutdown_manager::ShutdownManager shutdownManager(std::move(shutdownDeps));
    shutdownManager.installSignalHandlers();

    int exitCode = 0;
    bool reloading = false;

    do {
        shutdownManager.reset();
        state_.flags.zmqBindFailed.store(false);

        // main() applied the logging section before the first pass.
        if (reloading && !voxd::logging::applyConfigFile(configFilePath_)) {
            LOG_WARN("Logging: log file unavailable after reload, continuing on stderr");
        }
        load_runtime_config(state_, configFilePath_);
        const AppConfig& cfg = state_.config;

        int sampleRate = static_cast<int>(cfg.audio.sampleRate);
        if (overrides.replayPath) {
            sampleRate = probe_replay_rate(*overrides.replayPath);
            if (sampleRate <= 0) {
                LOG_ERROR("Cannot open replay file {}", *overrides.replayPath);
                exitCode = 1;
                break;
            }
            LOG_INFO("Replay: {} ({} Hz)", *overrides.replayPath, sampleRate);
        }

        daemon_status::StatusBroadcast broadcast(cfg.paths.stateFile, cfg.paths.interimFile,
                                                 milliseconds(DaemonConstants::INTERIM_THROTTLE_MS));

        daemon_transcription::ProviderRegistry registry;
        register_providers(registry, cfg);
        daemon_transcription::TranscriptionCoordinator coordinator(
            registry, make_coordinator_settings(cfg, sampleRate));

        std::shared_ptr<daemon_transcription::Refiner> refiner;
        if (cfg.refine.enabled) {
            refiner = std::make_shared<daemon_transcription::CommandRefiner>(
                cfg.refine.command, milliseconds(cfg.refine.timeoutMs));
        }
        daemon_transcription::RefineFallback refine(refiner);

        std::unique_ptr<daemon_output::TranscriptSink> sink;
        if (!cfg.delivery.command.empty()) {
            sink = std::make_unique<daemon_output::CommandTranscriptSink>(
                cfg.delivery.command, milliseconds(DaemonConstants::DELIVERY_TIMEOUT_MS));
        } else {
            LOG_INFO("Delivery disabled (no delivery command)");
        }

        daemon_control::ControlPlane* publisher = nullptr;
        daemon_session::SessionDependencies sessionDeps;
        sessionDeps.sourceFactory = make_source_factory(cfg, overrides);
        sessionDeps.coordinator = &coordinator;
        sessionDeps.refine = &refine;
        sessionDeps.sink = sink.get();
        sessionDeps.broadcast = &broadcast;
        sessionDeps.onStateChange = [&publisher](daemon_session::AppState next,
                                                 daemon_session::SessionId id) {
            if (publisher) {
                publisher->publishState(next, id);
            }
        };
        daemon_session::SessionStateMachine machine(make_session_settings(cfg),
                                                    std::move(sessionDeps));
        activeMachine = &machine;

        daemon_control::ControlPlaneDependencies controlDeps;
        controlDeps.endpoint = cfg.paths.controlEndpoint;
        controlDeps.postCommand = [&machine](daemon_session::ControlCommand command) {
            machine.post(std::move(command));
        };
        controlDeps.snapshot = [&machine]() { return machine.snapshot(); };
        controlDeps.reloadRequested = &state_.flags.reloadRequested;
        controlDeps.zmqBindFailed = &state_.flags.zmqBindFailed;
        daemon_control::ControlPlane controlPlane(std::move(controlDeps));
        if (!controlPlane.start()) {
            LOG_ERROR("Control plane failed to start on {}", cfg.paths.controlEndpoint);
            activeMachine = nullptr;
            machine.shutdown();
            exitCode = 1;
            break;
        }
        publisher = &controlPlane;

        daemon_input::HotkeyRouter router(
            milliseconds(cfg.hotkey.debounceMs),
            [&machine](daemon_session::ControlCommand command) {
                machine.post(std::move(command));
            });
        std::unique_ptr<daemon_input::EvdevHotkeyListener> hotkeys;
        if (cfg.hotkey.evdevEnabled && !overrides.replayPath) {
            HotkeyPlan plan = make_hotkey_plan(cfg);
            auto roles = plan.roles;
            hotkeys = std::make_unique<daemon_input::EvdevHotkeyListener>(std::move(plan.bindings));
            bool started = hotkeys->start(
                [&router, roles](size_t index, bool pressed, const std::string& sourceId) {
                    if (index < roles.size()) {
                        router.onKey(roles[index], pressed, sourceId);
                    }
                });
            if (!started) {
                LOG_WARN("Hotkeys unavailable; use the control socket {} instead",
                         cfg.paths.controlEndpoint);
                hotkeys.reset();
            }
        }

        LOG_INFO("voxd ready (state file {}, control {})", cfg.paths.stateFile,
                 cfg.paths.controlEndpoint);
        shutdownManager.notifyReady();

        bool replaySessionSeen = false;
        if (overrides.replayPath) {
            machine.post(daemon_session::ControlCommand{
                daemon_session::ControlCommandType::Start, kReplaySourceId});
        }

        const milliseconds tickInterval(cfg.session.tickMs);
        bool reloadPending = false;
        while (state_.flags.running.load() && !state_.flags.zmqBindFailed.load()) {
            machine.waitForCommand(tickInterval);
            machine.tick();
            shutdownManager.tick();

            if (overrides.replayPath) {
                if (machine.state() != daemon_session::AppState::Idle) {
                    replaySessionSeen = true;
                } else if (replaySessionSeen) {
                    auto snapshot = machine.snapshot();
                    LOG_INFO("Replay finished: '{}'", snapshot.lastText);
                    if (snapshot.lastError) {
                        exitCode = 1;
                    }
                    state_.flags.running = false;
                }
            }

            if (shutdownManager.isReloadRequested()) {
                if (machine.state() == daemon_session::AppState::Idle) {
                    reloadPending = true;
                    break;
                }
                LOG_ONCE(INFO, "Configuration reload deferred until the session ends");
            }
        }

        if (hotkeys) {
            hotkeys->stop();
        }
        activeMachine = nullptr;
        publisher = nullptr;
        controlPlane.stop();
        machine.shutdown();

        if (state_.flags.zmqBindFailed.load()) {
            exitCode = 1;
            break;
        }
        if (!reloadPending) {
            shutdownManager.runShutdownSequence();
        }
        reloading = true;
    } while (state_.flags.running.load() && shutdownManager.takeReloadRequest());

    return exitCode;
}

}  // namespace daemon_app
