#include "core/config_loader.h"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <nlohmann/json.hpp>
#include <set>
#include <sstream>
#include <sys/stat.h>
#include <utility>

namespace show_ingest::core {

namespace {

using nlohmann::json;

ConfigError configError(ErrorCode code, std::string message) {
    return ConfigError{code, std::move(message)};
}

// Whole, non-negative integer that fits T. nlohmann's own get<T>() would
// static_cast a negative value into a huge unsigned one.
template <typename T>
std::optional<ConfigError> readCount(const json& obj, const char* key, const std::string& where,
                                     T& out) {
    if (!obj.contains(key)) {
        return std::nullopt;
    }
    const json& value = obj.at(key);
    const std::string name = where + "." + key;
    if (!value.is_number_integer()) {
        return configError(ErrorCode::VALIDATION_INVALID_CONFIG, name + " must be an integer");
    }
    std::uint64_t magnitude = 0;
    if (value.is_number_unsigned()) {
        magnitude = value.get<std::uint64_t>();
    } else {
        const auto signedValue = value.get<std::int64_t>();
        if (signedValue < 0) {
            return configError(ErrorCode::VALIDATION_INVALID_CONFIG,
                               name + " must not be negative");
        }
        magnitude = static_cast<std::uint64_t>(signedValue);
    }
    if (magnitude > static_cast<std::uint64_t>(std::numeric_limits<T>::max())) {
        return configError(ErrorCode::VALIDATION_INVALID_CONFIG, name + " is out of range");
    }
    out = static_cast<T>(magnitude);
    return std::nullopt;
}

// Binds a role's single `key`, or a `keys` object of key name -> action name.
std::optional<ConfigError> parseKeyBindings(const json& entry, const std::string& where,
                                            input::ButtonAction defaultAction,
                                            input::KeyActionMap& out) {
    if (entry.contains("key")) {
        const std::string name = entry["key"].get<std::string>();
        auto key = input::parseKeyName(name);
        if (!key) {
            return configError(ErrorCode::VALIDATION_UNKNOWN_KEY,
                               where + ": unknown key '" + name + "'");
        }
        out.bind(*key, defaultAction);
    }
    if (entry.contains("keys")) {
        if (!entry["keys"].is_object()) {
            return configError(ErrorCode::VALIDATION_INVALID_CONFIG,
                               where + ".keys must be an object");
        }
        for (const auto& [keyName, actionValue] : entry["keys"].items()) {
            auto key = input::parseKeyName(keyName);
            if (!key) {
                return configError(ErrorCode::VALIDATION_UNKNOWN_KEY,
                                   where + ": unknown key '" + keyName + "'");
            }
            const std::string actionName = actionValue.get<std::string>();
            auto action = input::parseAction(actionName);
            if (!action) {
                return configError(ErrorCode::VALIDATION_UNKNOWN_ACTION,
                                   where + ": unknown action '" + actionName + "'");
            }
            out.bind(*key, *action);
        }
    }
    return std::nullopt;
}

std::optional<ConfigError> parseButton(const json& entry, const std::string& where, int avatarId,
                                       input::ButtonAction defaultAction,
                                       input::ButtonDeviceConfig& out) {
    if (!entry.is_object()) {
        return configError(ErrorCode::VALIDATION_INVALID_CONFIG, where + " must be an object");
    }
    out = input::ButtonDeviceConfig{};
    out.avatarId = avatarId;
    out.path = entry.value("path", std::string());
    out.grab = entry.value("grab", false);
    return parseKeyBindings(entry, where, defaultAction, out.keys);
}

std::optional<ConfigError> parseMic(const json& entry, const std::string& where, MicConfig& out) {
    if (!entry.is_object()) {
        return configError(ErrorCode::VALIDATION_INVALID_CONFIG, where + " must be an object");
    }
    out = MicConfig{};
    out.name = entry.value("name", std::string());
    if (auto err = readCount(entry, "channels", where, out.channels)) {
        return err;
    }
    if (auto err = readCount(entry, "sampleRate", where, out.sampleRate)) {
        return err;
    }
    out.useNoiseReducer = entry.value("useNoiseReducer", false);
    if (entry.contains("sampleFormat")) {
        const std::string fmt = entry["sampleFormat"].get<std::string>();
        auto parsed = audio::parseSampleFormat(fmt);
        if (!parsed) {
            return configError(ErrorCode::VALIDATION_INVALID_CONFIG,
                               where + ": unsupported sampleFormat '" + fmt + "'");
        }
        out.sampleFormat = *parsed;
    }
    return std::nullopt;
}

std::optional<ConfigError> parseIngestSection(const json& in, IngestSettings& out) {
    const std::string where = "ingest";
    if (auto err = readCount(in, "audioChunksMs", where, out.audioChunksMs)) {
        return err;
    }
    if (auto err = readCount(in, "targetSampleRate", where, out.targetSampleRate)) {
        return err;
    }
    if (auto err = readCount(in, "vadAggressiveness", where, out.vadAggressiveness)) {
        return err;
    }
    if (in.contains("vadBackend")) {
        out.vadBackend = in["vadBackend"].get<std::string>();
    }
    if (auto err = readCount(in, "buttonDebounceMs", where, out.buttonDebounceMs)) {
        return err;
    }
    if (in.contains("silenceThreshold")) {
        out.silenceThreshold = in["silenceThreshold"].get<float>();
    }
    if (in.contains("statsFile")) {
        out.statsFile = in["statsFile"].get<std::string>();
    }
    if (auto err = readCount(in, "statsIntervalMs", where, out.statsIntervalMs)) {
        return err;
    }
    if (in.contains("pidFile")) {
        out.pidFile = in["pidFile"].get<std::string>();
    }

    if (in.contains("queues") && in["queues"].is_object()) {
        const auto& q = in["queues"];
        for (auto [key, field] : {std::make_pair("rawAudioCapacity", &out.queues.rawAudioCapacity),
                                  std::make_pair("processedAudioCapacity",
                                                 &out.queues.processedAudioCapacity)}) {
            if (auto err = readCount(q, key, "ingest.queues", *field)) {
                return err;
            }
        }
    }
    if (in.contains("reconnect") && in["reconnect"].is_object()) {
        const auto& r = in["reconnect"];
        auto& rc = out.reconnect;
        if (auto err = readCount(r, "backoffMs", "ingest.reconnect", rc.backoffMs)) {
            return err;
        }
        // Liveness defaults to the reconnect delay.
        rc.livenessTimeoutMs = rc.backoffMs;
        for (auto [key, field] : {std::make_pair("maxAttempts", &rc.maxAttempts),
                                  std::make_pair("xrunBurstThreshold", &rc.xrunBurstThreshold),
                                  std::make_pair("livenessTimeoutMs", &rc.livenessTimeoutMs)}) {
            if (auto err = readCount(r, key, "ingest.reconnect", *field)) {
                return err;
            }
        }
    }
    if (in.contains("transport") && in["transport"].is_object()) {
        const auto& t = in["transport"];
        out.transport.endpoint = t.value("endpoint", out.transport.endpoint);
        out.transport.buttonSubject = t.value("buttonSubject", out.transport.buttonSubject);
        out.transport.audioSubject = t.value("audioSubject", out.transport.audioSubject);
        out.transport.publishAudio = t.value("publishAudio", out.transport.publishAudio);
    }

    if (!in.contains("reset")) {
        return configError(ErrorCode::VALIDATION_INVALID_CONFIG, "ingest.reset is required");
    }
    if (auto err = parseButton(in["reset"], "ingest.reset", input::kResetAvatarId,
                               input::ButtonAction::Reset, out.reset)) {
        return err;
    }

    out.avatarControllers.clear();
    if (in.contains("avatarControllers")) {
        if (!in["avatarControllers"].is_array()) {
            return configError(ErrorCode::VALIDATION_INVALID_CONFIG,
                               "ingest.avatarControllers must be an array");
        }
        int index = 0;
        for (const auto& entry : in["avatarControllers"]) {
            input::ButtonDeviceConfig button;
            const std::string where = "ingest.avatarControllers[" + std::to_string(index) + "]";
            if (auto err =
                    parseButton(entry, where, index, input::ButtonAction::Speak, button)) {
                return err;
            }
            out.avatarControllers.push_back(std::move(button));
            ++index;
        }
    }

    out.actorMics.clear();
    if (in.contains("actorMics")) {
        if (!in["actorMics"].is_array()) {
            return configError(ErrorCode::VALIDATION_INVALID_CONFIG,
                               "ingest.actorMics must be an array");
        }
        int index = 0;
        for (const auto& entry : in["actorMics"]) {
            MicConfig mic;
            if (auto err = parseMic(entry, "ingest.actorMics[" + std::to_string(index) + "]",
                                    mic)) {
                return err;
            }
            out.actorMics.push_back(std::move(mic));
            ++index;
        }
    }
    return std::nullopt;
}

bool isCharacterDevice(const std::string& path) {
    struct stat st {};
    if (::stat(path.c_str(), &st) != 0) {
        return false;
    }
    return S_ISCHR(st.st_mode);
}

}  // namespace

std::string resolveConfigPath(const std::string& cliPath) {
    if (!cliPath.empty()) {
        return cliPath;
    }
    const char* env = std::getenv(CONFIG_PATH_ENV);
    if (env && *env) {
        return env;
    }
    return DEFAULT_CONFIG_FILE;
}

std::optional<ConfigError> loadIngestConfig(const std::filesystem::path& configPath,
                                            IngestConfig& outConfig, bool validateDevicePaths) {
    std::ifstream file(configPath);
    if (!file.is_open()) {
        return configError(ErrorCode::VALIDATION_FILE_NOT_FOUND,
                           "cannot open config file " + configPath.string());
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return parseIngestConfig(buffer.str(), outConfig, validateDevicePaths);
}

std::optional<ConfigError> parseIngestConfig(const std::string& jsonText, IngestConfig& outConfig,
                                             bool validateDevicePaths) {
    outConfig = IngestConfig{};

    json j;
    try {
        j = json::parse(jsonText);
    } catch (const json::parse_error& e) {
        return configError(ErrorCode::VALIDATION_PARSE_ERROR, std::string("JSON: ") + e.what());
    }
    if (!j.is_object()) {
        return configError(ErrorCode::VALIDATION_PARSE_ERROR, "config root must be an object");
    }

    try {
        if (j.contains("logging") && j["logging"].is_object()) {
            outConfig.logging = logging::parseLogConfig(j["logging"]);
        }
        if (j.contains("mode") && j["mode"].is_object()) {
            outConfig.mode.ethics = j["mode"].value("ethics", false);
        }
        if (j.contains("show") && j["show"].is_object()) {
            const auto& show = j["show"];
            outConfig.show.name = show.value("name", std::string());
            outConfig.show.actorsCount = show.value("actorsCount", outConfig.show.actorsCount);
            outConfig.show.avatarCount = show.value("avatarCount", outConfig.show.avatarCount);
        }
        if (!j.contains("ingest") || !j["ingest"].is_object()) {
            return configError(ErrorCode::VALIDATION_INVALID_CONFIG,
                               "missing 'ingest' section");
        }
        if (auto err = parseIngestSection(j["ingest"], outConfig.ingest)) {
            return err;
        }
    } catch (const json::exception& e) {
        return configError(ErrorCode::VALIDATION_INVALID_CONFIG,
                           std::string("bad value type: ") + e.what());
    }

    return validateIngestConfig(outConfig, validateDevicePaths);
}

std::optional<ConfigError> validateIngestConfig(const IngestConfig& config,
                                                bool validateDevicePaths) {
    const IngestSettings& in = config.ingest;
    auto invalid = [](std::string message) {
        return configError(ErrorCode::VALIDATION_INVALID_CONFIG, std::move(message));
    };

    if (config.mode.ethics && config.logging.level != logging::LogLevel::Error &&
        config.logging.level != logging::LogLevel::Critical) {
        return invalid("ethics mode requires logging.level 'error' or 'critical'");
    }

    if (in.audioChunksMs != 10 && in.audioChunksMs != 20 && in.audioChunksMs != 30) {
        return invalid("ingest.audioChunksMs must be 10, 20 or 30");
    }
    if (in.targetSampleRate != 8000 && in.targetSampleRate != 16000 &&
        in.targetSampleRate != 32000 && in.targetSampleRate != 48000) {
        return invalid("ingest.targetSampleRate must be 8000, 16000, 32000 or 48000");
    }
    if (in.vadAggressiveness < 0 || in.vadAggressiveness > 3) {
        return invalid("ingest.vadAggressiveness must be in 0..3");
    }
    if (in.vadBackend != "speex" && in.vadBackend != "energy") {
        return invalid("ingest.vadBackend must be 'speex' or 'energy'");
    }
    if (in.buttonDebounceMs <= 0) {
        return invalid("ingest.buttonDebounceMs must be positive");
    }
    if (!(in.silenceThreshold > 0.0f)) {
        return invalid("ingest.silenceThreshold must be positive");
    }
    if (in.queues.rawAudioCapacity == 0 || in.queues.processedAudioCapacity == 0) {
        return invalid("ingest.queues capacities must be positive");
    }
    if (in.reconnect.maxAttempts == 0 || in.reconnect.backoffMs == 0 ||
        in.reconnect.xrunBurstThreshold == 0 || in.reconnect.livenessTimeoutMs == 0) {
        return invalid("ingest.reconnect values must be positive");
    }
    if (in.statsIntervalMs <= 0) {
        return invalid("ingest.statsIntervalMs must be positive");
    }
    if (in.transport.endpoint.empty() || in.transport.buttonSubject.empty() ||
        in.transport.audioSubject.empty()) {
        return invalid("ingest.transport endpoint and subjects must not be empty");
    }

    // Buttons
    if (in.reset.path.empty()) {
        return invalid("ingest.reset.path is required");
    }
    if (!in.reset.keys.contains(input::ButtonAction::Reset)) {
        return invalid("ingest.reset must bind a 'reset' action");
    }
    if (in.avatarControllers.empty()) {
        return invalid("at least one avatar controller is required");
    }
    std::set<std::string> paths{in.reset.path};
    for (const auto& button : in.avatarControllers) {
        if (button.path.empty()) {
            return invalid("avatar controller " + std::to_string(button.avatarId) +
                           " has no path");
        }
        if (!button.keys.contains(input::ButtonAction::Speak)) {
            return invalid("avatar controller " + button.path + " must bind a 'speak' action");
        }
        if (!paths.insert(button.path).second) {
            return configError(ErrorCode::VALIDATION_DUPLICATE_DEVICE,
                               "duplicate button device path " + button.path);
        }
    }
    if (config.show.avatarCount != static_cast<int>(in.avatarControllers.size())) {
        return configError(ErrorCode::VALIDATION_COUNT_MISMATCH,
                           "show.avatarCount (" + std::to_string(config.show.avatarCount) +
                               ") does not match " +
                               std::to_string(in.avatarControllers.size()) +
                               " avatar controllers");
    }

    // Mics
    std::set<std::string> micNames;
    for (const auto& mic : in.actorMics) {
        if (mic.name.empty()) {
            return invalid("actor mic name must not be empty");
        }
        if (mic.channels == 0 || mic.sampleRate == 0) {
            return invalid("actor mic " + mic.name + " needs positive channels and sampleRate");
        }
        if (!micNames.insert(mic.name).second) {
            return configError(ErrorCode::VALIDATION_DUPLICATE_DEVICE,
                               "duplicate mic name " + mic.name);
        }
    }
    if (config.show.actorsCount != static_cast<int>(in.actorMics.size())) {
        return configError(ErrorCode::VALIDATION_COUNT_MISMATCH,
                           "show.actorsCount (" + std::to_string(config.show.actorsCount) +
                               ") does not match " + std::to_string(in.actorMics.size()) +
                               " actor mics");
    }
    if (in.actorMics.size() != 1) {
        return configError(ErrorCode::VALIDATION_COUNT_MISMATCH,
                           "exactly one actor mic is supported");
    }

    if (validateDevicePaths) {
        for (const auto& path : paths) {
            if (!isCharacterDevice(path)) {
                return configError(ErrorCode::VALIDATION_DEVICE_NODE,
                                   "button path " + path + " is not a character device");
            }
        }
    }
    return std::nullopt;
}

}  // namespace show_ingest::core
