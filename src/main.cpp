/**
 * @file main.cpp
 * @brief show_ingest entry point: live show input capture daemon
 */

#include "app/ingest_app.h"
#include "app/instance_lock.h"
#include "app/shutdown_controller.h"
#include "core/config_loader.h"
#include "core/error_codes.h"
#include "core/ingest_constants.h"
#include "logging/logger.h"

#include <iostream>
#include <optional>
#include <string>

using namespace show_ingest;

namespace {

struct CliOptions {
    std::string configPath;
    std::optional<std::string> logLevel;
    bool validateOnly = false;
    bool checkDevices = true;
};

void printUsage(const char* programName) {
    std::cout << "Usage: " << programName << " [options]" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --config <path>      Config file (default: $" << core::CONFIG_PATH_ENV
              << " or " << core::DEFAULT_CONFIG_FILE << ")" << std::endl;
    std::cout << "  --log-level <level>  Override logging.level (trace..critical, off)"
              << std::endl;
    std::cout << "  --validate-only      Load and validate the config, then exit" << std::endl;
    std::cout << "  --no-device-check    Do not require button paths to exist at startup"
              << std::endl;
    std::cout << "  --version            Print version and exit" << std::endl;
    std::cout << "  --help               Show this help message" << std::endl;
}

// Returns an exit code when the program should stop right away.
std::optional<int> parseArguments(int argc, char* argv[], CliOptions& options) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "--version") {
            std::cout << IngestConstants::PROGRAM_NAME << " " << IngestConstants::VERSION
                      << std::endl;
            return 0;
        } else if (arg == "--config" && i + 1 < argc) {
            options.configPath = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            options.logLevel = argv[++i];
        } else if (arg == "--validate-only") {
            options.validateOnly = true;
        } else if (arg == "--no-device-check") {
            options.checkDevices = false;
        } else {
            std::cerr << "Unknown or incomplete option: " << arg << std::endl;
            printUsage(argv[0]);
            return 2;
        }
    }
    return std::nullopt;
}

}  // namespace

int main(int argc, char* argv[]) {
    CliOptions options;
    if (auto exitCode = parseArguments(argc, argv, options)) {
        return *exitCode;
    }

    if (!logging::initializeEarly()) {
        std::cerr << "Failed to initialize early logging" << std::endl;
    }

    const std::string configPath = core::resolveConfigPath(options.configPath);
    core::IngestConfig config;
    if (auto err = core::loadIngestConfig(configPath, config, options.checkDevices)) {
        LOG_CRITICAL("[Main] Invalid config {}: [{}] {}", configPath,
                     errorCodeToString(err->code), err->message);
        logging::shutdown();
        return 1;
    }
    if (options.logLevel) {
        config.logging.level = logging::stringToLevel(*options.logLevel);
        // Ethics mode still caps verbosity when the level comes from the CLI.
        if (auto err = core::validateIngestConfig(config, false)) {
            LOG_CRITICAL("[Main] --log-level {}: {}", *options.logLevel, err->message);
            logging::shutdown();
            return 1;
        }
    }

    if (options.validateOnly) {
        LOG_INFO("[Main] Config {} is valid", configPath);
        logging::shutdown();
        return 0;
    }

    if (!logging::initialize(config.logging)) {
        std::cerr << "Failed to initialize logging" << std::endl;
        return 1;
    }
    LOG_INFO("[Main] {} {} starting (config: {}, show: '{}')", IngestConstants::PROGRAM_NAME,
             IngestConstants::VERSION, configPath, config.show.name);

    app::InstanceLock instanceLock(config.ingest.pidFile);
    const app::LockAttempt lockAttempt = instanceLock.acquire();
    if (lockAttempt.status != app::LockStatus::Acquired) {
        if (lockAttempt.status == app::LockStatus::HeldByOther) {
            LOG_ERROR("[Main] Another show_ingest owns {} (PID: {})", config.ingest.pidFile,
                      lockAttempt.ownerPid > 0 ? std::to_string(lockAttempt.ownerPid)
                                               : std::string("unknown"));
        } else {
            LOG_ERROR("[Main] Cannot lock {}: {}", config.ingest.pidFile, lockAttempt.detail);
        }
        logging::shutdown();
        return 1;
    }

    app::installTerminationHandlers();
    app::ShutdownController lifecycle(&app::processSignals());
    lifecycle.onAnnounce([](const std::string& msg) { LOG_INFO("[Main] {}", msg); });

    int exitCode = 0;
    try {
        app::IngestApp ingest(config);
        exitCode = ingest.run(lifecycle);
    } catch (const std::exception& e) {
        LOG_CRITICAL("[Main] Fatal: {}", e.what());
        exitCode = 1;
    }

    LOG_INFO("[Main] Exiting with code {}", exitCode);
    logging::shutdown();
    return exitCode;
}
