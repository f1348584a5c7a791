#include "core/config_loader.h"
#include "daemon/app/app.h"
#include "daemon/app/process_resources.h"
#include "daemon/app/runtime_state.h"
#include "daemon/core/process_lease.h"
#include "logging/logger.h"

#include <chrono>
#include <iostream>
#include <optional>
#include <string>
#include <unistd.h>

namespace {

void printUsage(const char* programName) {
    std::cout << "voxd - push-to-talk dictation daemon" << std::endl;
    std::cout << "Usage: " << programName << " [options]" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --config <path>      Configuration file (default: " << DEFAULT_CONFIG_FILE
              << ")" << std::endl;
    std::cout << "  --replay <file.wav>  Transcribe a sound file as one session, then exit"
              << std::endl;
    std::cout << "  --log-level <level>  trace, debug, info, warn, error, critical" << std::endl;
    std::cout << "  --help               Show this help message" << std::endl;
    std::cout << std::endl;
    std::cout << "Control: echo TOGGLE | zmq client on ipc:///tmp/voxd.sock" << std::endl;
}

struct CliOptions {
    std::string configPath = DEFAULT_CONFIG_FILE;
    std::optional<std::string> replayPath;
    std::optional<std::string> logLevel;
    bool showHelp = false;
};

bool parseArguments(int argc, char* argv[], CliOptions& options) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            options.showHelp = true;
        } else if (arg == "--config" && i + 1 < argc) {
            options.configPath = argv[++i];
        } else if (arg == "--replay" && i + 1 < argc) {
            options.replayPath = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            options.logLevel = argv[++i];
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            return false;
        }
    }
    return true;
}

}  // namespace

int main(int argc, char* argv[]) {
    CliOptions cli;
    if (!parseArguments(argc, argv, cli)) {
        printUsage(argv[0]);
        return 2;
    }
    if (cli.showHelp) {
        printUsage(argv[0]);
        return 0;
    }

    // stderr-only logging until the lease is held
    voxd::logging::initializeEarly();
    if (cli.logLevel) {
        voxd::logging::pinLevel(voxd::logging::stringToLevel(*cli.logLevel));
    }

    AppConfig bootConfig;
    if (!loadAppConfig(cli.configPath, bootConfig, false)) {
        LOG_DEBUG("Lease settings: defaults ({} not loaded)", cli.configPath);
    }

    daemon_app::ProcessResources::Options resourceOptions;
    resourceOptions.lease.path = bootConfig.paths.leaseFile;
    resourceOptions.lease.replaceRunning = bootConfig.lease.replaceRunning;
    resourceOptions.lease.grace = std::chrono::milliseconds(bootConfig.lease.graceMs);
    resourceOptions.lease.identityMarkers = bootConfig.lease.identityMarkers;
    resourceOptions.stateFilePath = bootConfig.paths.stateFile;
    resourceOptions.interimFilePath = bootConfig.paths.interimFile;

    daemon_core::SystemProcessOps processOps;
    auto resources = daemon_app::ProcessResources::acquire(resourceOptions, processOps);
    if (!resources) {
        LOG_ERROR("Cannot acquire lease {}, exiting", resourceOptions.lease.path);
        return 1;
    }

    if (!voxd::logging::applyConfigFile(cli.configPath)) {
        LOG_WARN("Logging: log file unavailable, continuing on stderr");
    }

    LOG_INFO("========================================");
    LOG_INFO("  voxd - dictation daemon");
    LOG_INFO("========================================");
    LOG_INFO("PID: {} (lease {}: {})", getpid(), resources->lease().path(),
             daemon_core::leaseOutcomeToString(resources->leaseOutcome()));

    daemon_app::RuntimeState state;
    daemon_app::App app(state, cli.configPath);
    int exitCode = app.run(daemon_app::AppOverrides{cli.replayPath});

    LOG_INFO("voxd stopped (exit code {})", exitCode);
    resources.reset();
    voxd::logging::shutdown();
    return exitCode;
}
