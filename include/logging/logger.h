/**
 * @file logger.h
 * @brief spdlog front end for the ingest daemon
 *
 * One process-wide logger fanning out to a console sink, an optional
 * rotating file and a counting sink whose totals end up in the stats file.
 * Call sites use the LOG_* macros and prefix messages with the component,
 * e.g. "[Session:/dev/input/event3]".
 */

#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <nlohmann/json_fwd.hpp>
#include <string>
#include <string_view>

namespace spdlog {
class logger;
}  // namespace spdlog

namespace show_ingest {
namespace logging {

enum class LogLevel : std::uint8_t { Trace, Debug, Info, Warn, Error, Critical, Off };

/**
 * @brief The "logging" section of the config file.
 */
struct LogConfig {
    LogLevel level = LogLevel::Info;
    std::string filePath;  // empty: no file
    std::size_t maxFileSize = 10 * 1024 * 1024;
    std::size_t maxBackups = 5;
    bool consoleOutput = true;
    bool coloredOutput = true;
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v";
    // Records at or above this level are flushed immediately.
    LogLevel flushLevel = LogLevel::Warn;
    // Background flush period; 0 relies on flushLevel only.
    std::uint32_t flushIntervalMs = 0;
};

// Warning and error totals since process start (survive re-initialisation).
struct LogCounters {
    std::uint64_t warnings = 0;
    std::uint64_t errors = 0;  // error + critical
};

/**
 * @brief Install the configured sinks, replacing any earlier logger.
 *
 * @return false if a sink could not be created (e.g. unwritable log file)
 */
bool initialize(const LogConfig& config = LogConfig{});

/**
 * @brief stderr-only logger for the window before the config is loaded.
 *
 * Does nothing once initialize() has run.
 */
bool initializeEarly();

/**
 * @brief Build a LogConfig from the "logging" JSON object.
 *
 * Missing keys keep their defaults and unknown level names map to Info.
 * A value of the wrong JSON type throws nlohmann::json::type_error.
 */
LogConfig parseLogConfig(const nlohmann::json& section);

void shutdown();

void setLevel(LogLevel level);
LogLevel getLevel();
void flush();

LogCounters counters();

// For the macros below. Installs a default logger on first use.
std::shared_ptr<spdlog::logger> getLogger();

std::string_view levelToString(LogLevel level);
// Case-insensitive; accepts "warning", "err", "fatal" and "none" as aliases.
LogLevel stringToLevel(std::string_view str);

}  // namespace logging
}  // namespace show_ingest

#include <spdlog/spdlog.h>

#define SHOW_INGEST_LOG(spdlog_macro, ...)                          \
    do {                                                            \
        auto show_ingest_logger_ = show_ingest::logging::getLogger(); \
        if (show_ingest_logger_)                                    \
            spdlog_macro(show_ingest_logger_, __VA_ARGS__);         \
    } while (0)

#define LOG_TRACE(...) SHOW_INGEST_LOG(SPDLOG_LOGGER_TRACE, __VA_ARGS__)
#define LOG_DEBUG(...) SHOW_INGEST_LOG(SPDLOG_LOGGER_DEBUG, __VA_ARGS__)
#define LOG_INFO(...) SHOW_INGEST_LOG(SPDLOG_LOGGER_INFO, __VA_ARGS__)
#define LOG_WARN(...) SHOW_INGEST_LOG(SPDLOG_LOGGER_WARN, __VA_ARGS__)
#define LOG_ERROR(...) SHOW_INGEST_LOG(SPDLOG_LOGGER_ERROR, __VA_ARGS__)
#define LOG_CRITICAL(...) SHOW_INGEST_LOG(SPDLOG_LOGGER_CRITICAL, __VA_ARGS__)

// Rate limit for per-chunk paths (queue evictions, xruns).
#define LOG_EVERY_N(level, n, ...)                                      \
    do {                                                                \
        static std::atomic<std::uint64_t> show_ingest_log_count_{0};    \
        if (show_ingest_log_count_.fetch_add(1) % (n) == 0) {           \
            LOG_##level(__VA_ARGS__);                                   \
        }                                                               \
    } while (0)
