#include "logging/logger.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <iostream>
#include <mutex>
#include <nlohmann/json.hpp>
#include <spdlog/sinks/base_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <vector>

namespace show_ingest {
namespace logging {

namespace {

constexpr const char* kLoggerName = "show_ingest";

struct LevelInfo {
    LogLevel level;
    const char* name;
    spdlog::level::level_enum spd;
};

constexpr LevelInfo kLevels[] = {
    {LogLevel::Trace, "trace", spdlog::level::trace},
    {LogLevel::Debug, "debug", spdlog::level::debug},
    {LogLevel::Info, "info", spdlog::level::info},
    {LogLevel::Warn, "warn", spdlog::level::warn},
    {LogLevel::Error, "error", spdlog::level::err},
    {LogLevel::Critical, "critical", spdlog::level::critical},
    {LogLevel::Off, "off", spdlog::level::off},
};

struct LevelAlias {
    const char* name;
    LogLevel level;
};

constexpr LevelAlias kAliases[] = {
    {"warning", LogLevel::Warn},
    {"err", LogLevel::Error},
    {"fatal", LogLevel::Critical},
    {"none", LogLevel::Off},
};

spdlog::level::level_enum toSpd(LogLevel level) {
    for (const auto& info : kLevels) {
        if (info.level == level) {
            return info.spd;
        }
    }
    return spdlog::level::info;
}

LogLevel fromSpd(spdlog::level::level_enum level) {
    for (const auto& info : kLevels) {
        if (info.spd == level) {
            return info.level;
        }
    }
    return LogLevel::Info;
}

// Tallies warnings and errors for the stats file; never writes anything.
class CountingSink : public spdlog::sinks::base_sink<std::mutex> {
   public:
    LogCounters totals() const {
        return {warnings_.load(), errors_.load()};
    }

   protected:
    void sink_it_(const spdlog::details::log_msg& msg) override {
        if (msg.level == spdlog::level::warn) {
            warnings_.fetch_add(1, std::memory_order_relaxed);
        } else if (msg.level == spdlog::level::err || msg.level == spdlog::level::critical) {
            errors_.fetch_add(1, std::memory_order_relaxed);
        }
    }
    void flush_() override {}

   private:
    std::atomic<std::uint64_t> warnings_{0};
    std::atomic<std::uint64_t> errors_{0};
};

struct LoggerState {
    std::mutex mutex;
    std::shared_ptr<spdlog::logger> logger;
    std::shared_ptr<CountingSink> counter = std::make_shared<CountingSink>();
    std::atomic<bool> configured{false};
};

LoggerState& state() {
    static LoggerState s;
    return s;
}

std::vector<spdlog::sink_ptr> makeSinks(const LogConfig& config,
                                        const std::shared_ptr<CountingSink>& counter) {
    std::vector<spdlog::sink_ptr> sinks;
    if (config.consoleOutput) {
        auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        if (!config.coloredOutput) {
            console->set_color_mode(spdlog::color_mode::never);
        }
        sinks.push_back(console);
    }
    if (!config.filePath.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.filePath, config.maxFileSize, config.maxBackups));
    }
    counter->set_level(spdlog::level::warn);
    sinks.push_back(counter);
    return sinks;
}

void install(LoggerState& s, std::shared_ptr<spdlog::logger> logger) {
    s.logger = std::move(logger);
    spdlog::set_default_logger(s.logger);
}

}  // namespace

bool initialize(const LogConfig& config) {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);

    std::shared_ptr<spdlog::logger> logger;
    try {
        auto sinks = makeSinks(config, s.counter);
        logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Logger initialization failed: " << ex.what() << std::endl;
        return false;
    }

    logger->set_level(toSpd(config.level));
    logger->set_pattern(config.pattern);
    logger->flush_on(toSpd(config.flushLevel));
    install(s, logger);
    if (config.flushIntervalMs > 0) {
        const auto seconds = std::max<std::uint32_t>(1, (config.flushIntervalMs + 999) / 1000);
        spdlog::flush_every(std::chrono::seconds(seconds));
    }
    s.configured.store(true, std::memory_order_release);

    SPDLOG_LOGGER_INFO(s.logger, "[Logging] Initialized (level={}, file={})",
                       levelToString(config.level),
                       config.filePath.empty() ? "none" : config.filePath);
    return true;
}

bool initializeEarly() {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    if (s.configured.load(std::memory_order_acquire)) {
        return true;
    }
    try {
        std::vector<spdlog::sink_ptr> sinks{std::make_shared<spdlog::sinks::stderr_color_sink_mt>(),
                                            s.counter};
        s.counter->set_level(spdlog::level::warn);
        auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
        logger->set_level(spdlog::level::info);
        logger->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
        logger->flush_on(spdlog::level::warn);
        install(s, logger);
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Early logger initialization failed: " << ex.what() << std::endl;
        return false;
    }
    return true;
}

LogConfig parseLogConfig(const nlohmann::json& section) {
    LogConfig config;
    if (!section.is_object()) {
        return config;
    }
    if (section.contains("level")) {
        config.level = stringToLevel(section.at("level").get<std::string>());
    }
    config.filePath = section.value("filePath", config.filePath);
    config.maxFileSize = section.value("maxFileSize", config.maxFileSize);
    config.maxBackups = section.value("maxBackups", config.maxBackups);
    config.consoleOutput = section.value("consoleOutput", config.consoleOutput);
    config.coloredOutput = section.value("coloredOutput", config.coloredOutput);
    config.pattern = section.value("pattern", config.pattern);
    if (section.contains("flushLevel")) {
        config.flushLevel = stringToLevel(section.at("flushLevel").get<std::string>());
    }
    config.flushIntervalMs = section.value("flushIntervalMs", config.flushIntervalMs);
    return config;
}

void shutdown() {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    if (s.logger) {
        SPDLOG_LOGGER_INFO(s.logger, "[Logging] Shutdown");
        s.logger->flush();
    }
    s.configured.store(false, std::memory_order_release);
    spdlog::shutdown();
    s.logger.reset();
}

void setLevel(LogLevel level) {
    auto logger = getLogger();
    if (logger) {
        logger->set_level(toSpd(level));
    }
}

LogLevel getLevel() {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    return s.logger ? fromSpd(s.logger->level()) : LogLevel::Info;
}

void flush() {
    auto logger = getLogger();
    if (logger) {
        logger->flush();
    }
}

LogCounters counters() {
    return state().counter->totals();
}

std::shared_ptr<spdlog::logger> getLogger() {
    auto& s = state();
    {
        std::lock_guard<std::mutex> lock(s.mutex);
        if (s.logger) {
            return s.logger;
        }
    }
    // Nothing installed yet (tests, library use): fall back to defaults.
    initialize();
    std::lock_guard<std::mutex> lock(s.mutex);
    return s.logger;
}

std::string_view levelToString(LogLevel level) {
    for (const auto& info : kLevels) {
        if (info.level == level) {
            return info.name;
        }
    }
    return "info";
}

LogLevel stringToLevel(std::string_view str) {
    std::string lower(str);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    for (const auto& info : kLevels) {
        if (lower == info.name) {
            return info.level;
        }
    }
    for (const auto& alias : kAliases) {
        if (lower == alias.name) {
            return alias.level;
        }
    }
    return LogLevel::Info;
}

}  // namespace logging
}  // namespace show_ingest
