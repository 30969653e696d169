#ifndef SHOW_INGEST_ERROR_CODES_H
#define SHOW_INGEST_ERROR_CODES_H

#include <cstdint>
#include <optional>
#include <string>

namespace show_ingest {

/**
 * @brief Error codes for the ingest pipeline.
 *
 * Categories use upper 4 bits of the 16-bit code (0xF000 mask):
 * - 0x1xxx: Audio capture / processing
 * - 0x2xxx: Device (ALSA PCM, evdev input)
 * - 0x3xxx: Transport (ZeroMQ publisher)
 * - 0x4xxx: Queue
 * - 0x5xxx: Validation (configuration)
 * - 0xFxxx: Internal (reserved)
 */
enum class ErrorCode : uint32_t {
    OK = 0,

    // Audio (0x1000)
    AUDIO_INVALID_RATE = 0x1001,
    AUDIO_UNSUPPORTED_FORMAT = 0x1002,
    AUDIO_XRUN_BURST = 0x1003,
    AUDIO_HEARTBEAT_TIMEOUT = 0x1004,
    AUDIO_CLASSIFIER_FAILED = 0x1005,
    AUDIO_DENOISE_FAILED = 0x1006,

    // Device (0x2000)
    DEVICE_NOT_FOUND = 0x2001,
    DEVICE_OPEN_FAILED = 0x2002,
    DEVICE_PARAMS_NOT_SUPPORTED = 0x2003,
    DEVICE_GRAB_FAILED = 0x2004,
    DEVICE_IO_ERROR = 0x2005,
    DEVICE_DISCONNECTED = 0x2006,
    DEVICE_RETRY_EXHAUSTED = 0x2007,

    // Transport (0x3000)
    TRANSPORT_INIT_FAILED = 0x3001,
    TRANSPORT_SEND_FAILED = 0x3002,
    TRANSPORT_NOT_CONNECTED = 0x3003,

    // Queue (0x4000)
    QUEUE_EMPTY = 0x4001,
    QUEUE_SHUTDOWN = 0x4002,

    // Validation (0x5000)
    VALIDATION_INVALID_CONFIG = 0x5001,
    VALIDATION_FILE_NOT_FOUND = 0x5002,
    VALIDATION_PARSE_ERROR = 0x5003,
    VALIDATION_DUPLICATE_DEVICE = 0x5004,
    VALIDATION_COUNT_MISMATCH = 0x5005,
    VALIDATION_UNKNOWN_KEY = 0x5006,
    VALIDATION_UNKNOWN_ACTION = 0x5007,
    VALIDATION_DEVICE_NODE = 0x5008,

    // Internal (0xF000) - Reserved for fallback
    /** @brief Unknown/unmapped error */
    INTERNAL_UNKNOWN = 0xF001,
};

/**
 * @brief Error value returned by device capabilities.
 *
 * Carries the pipeline code plus the lower-layer errno (ALSA/evdev) when one exists.
 */
struct DeviceError {
    ErrorCode code = ErrorCode::INTERNAL_UNKNOWN;
    std::string message;
    std::optional<int> sysErrno;  // errno / negative ALSA return, if any

    DeviceError() = default;
    DeviceError(ErrorCode c, std::string msg, std::optional<int> err = std::nullopt)
        : code(c), message(std::move(msg)), sysErrno(err) {}
};

/**
 * @brief Convert ErrorCode to string representation.
 * @param code The error code
 * @return String name (e.g., "DEVICE_OPEN_FAILED"), or "UNKNOWN_ERROR" for unknown codes
 */
const char* errorCodeToString(ErrorCode code);

/**
 * @brief Get the category name for an error code.
 * @param code The error code
 * @return Category name (e.g., "device"), or "internal" for unknown codes
 */
const char* getErrorCategory(ErrorCode code);

/**
 * @brief Convert ErrorCode to hex string.
 * @param code The error code
 * @return Hex string (e.g., "0x2002")
 */
std::string errorCodeToHex(ErrorCode code);

/**
 * @brief Convert string to ErrorCode enum.
 * @param str Error code string (e.g., "DEVICE_NOT_FOUND")
 * @return Corresponding ErrorCode, or INTERNAL_UNKNOWN if not found
 */
ErrorCode stringToErrorCode(const std::string& str);

// Category check helpers
constexpr bool isAudioError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x1000;
}
constexpr bool isDeviceError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x2000;
}
constexpr bool isTransportError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x3000;
}
constexpr bool isQueueError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x4000;
}
constexpr bool isValidationError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x5000;
}
constexpr bool isInternalError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0xF000;
}

/**
 * @brief Check if error is a transient hardware condition.
 *
 * Transient errors are recovered locally by a DeviceSession (retry with backoff)
 * and are surfaced only as status events. Retry exhaustion and validation errors
 * are never transient.
 */
constexpr bool isTransient(ErrorCode code) {
    return (isDeviceError(code) && code != ErrorCode::DEVICE_RETRY_EXHAUSTED) ||
           code == ErrorCode::AUDIO_XRUN_BURST || code == ErrorCode::AUDIO_HEARTBEAT_TIMEOUT;
}

}  // namespace show_ingest

#endif  // SHOW_INGEST_ERROR_CODES_H
