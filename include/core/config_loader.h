#ifndef SHOW_INGEST_CONFIG_LOADER_H
#define SHOW_INGEST_CONFIG_LOADER_H

#include "audio/audio_frame.h"
#include "core/error_codes.h"
#include "input/button_monitor.h"
#include "logging/logger.h"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace show_ingest::core {

constexpr const char* DEFAULT_CONFIG_FILE = "/etc/show_ingest/config.json";
constexpr const char* CONFIG_PATH_ENV = "SHOW_INGEST_CONFIG";

struct ModeConfig {
    bool ethics = false;  // requires logging.level error|critical
};

struct ShowConfig {
    std::string name;
    int actorsCount = 1;
    int avatarCount = 1;
};

struct MicConfig {
    std::string name;  // substring of the ALSA card name
    std::uint32_t channels = 1;
    std::uint32_t sampleRate = 48000;  // requested capture rate
    audio::SampleFormat sampleFormat = audio::SampleFormat::Int16;
    bool useNoiseReducer = false;
};

struct QueueConfig {
    std::size_t rawAudioCapacity = 50;
    std::size_t processedAudioCapacity = 50;
};

struct ReconnectConfig {
    std::uint32_t maxAttempts = 5;
    std::uint32_t backoffMs = 1000;
    std::uint32_t xrunBurstThreshold = 5;
    std::uint32_t livenessTimeoutMs = 1000;
};

struct TransportConfig {
    std::string endpoint = "tcp://*:5556";
    std::string buttonSubject = "INTERFACE";
    std::string audioSubject = "AUDIO";
    bool publishAudio = false;
};

struct IngestSettings {
    int audioChunksMs = 20;
    std::uint32_t targetSampleRate = 16000;
    int vadAggressiveness = 2;
    std::string vadBackend = "speex";
    int buttonDebounceMs = 200;
    float silenceThreshold = 0.01f;
    QueueConfig queues;
    ReconnectConfig reconnect;
    TransportConfig transport;
    std::string statsFile = "/tmp/show_ingest_stats.json";
    int statsIntervalMs = 5000;
    std::string pidFile = "/tmp/show_ingest.pid";

    input::ButtonDeviceConfig reset;
    std::vector<input::ButtonDeviceConfig> avatarControllers;
    std::vector<MicConfig> actorMics;
};

struct IngestConfig {
    logging::LogConfig logging;
    ModeConfig mode;
    ShowConfig show;
    IngestSettings ingest;
};

struct ConfigError {
    ErrorCode code = ErrorCode::VALIDATION_INVALID_CONFIG;
    std::string message;
};

/**
 * @brief Pick the config file: explicit CLI path, then $SHOW_INGEST_CONFIG,
 *        then DEFAULT_CONFIG_FILE.
 */
std::string resolveConfigPath(const std::string& cliPath);

/**
 * @brief Load, parse and validate a config file.
 *
 * Every problem is fatal: the returned ConfigError describes the first one
 * found. outConfig is only meaningful when nullopt is returned.
 *
 * @param validateDevicePaths Also require each button path to exist and be a
 *        character device.
 */
std::optional<ConfigError> loadIngestConfig(const std::filesystem::path& configPath,
                                            IngestConfig& outConfig,
                                            bool validateDevicePaths = false);

std::optional<ConfigError> parseIngestConfig(const std::string& jsonText, IngestConfig& outConfig,
                                             bool validateDevicePaths = false);

std::optional<ConfigError> validateIngestConfig(const IngestConfig& config,
                                                bool validateDevicePaths = false);

}  // namespace show_ingest::core

#endif  // SHOW_INGEST_CONFIG_LOADER_H
