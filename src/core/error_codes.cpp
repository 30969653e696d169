#include "core/error_codes.h"

#include <iomanip>
#include <sstream>
#include <unordered_map>

namespace show_ingest {

// Error code to string mapping
static const std::unordered_map<ErrorCode, const char*> kErrorCodeStrings = {
    {ErrorCode::OK, "OK"},

    // Audio
    {ErrorCode::AUDIO_INVALID_RATE, "AUDIO_INVALID_RATE"},
    {ErrorCode::AUDIO_UNSUPPORTED_FORMAT, "AUDIO_UNSUPPORTED_FORMAT"},
    {ErrorCode::AUDIO_XRUN_BURST, "AUDIO_XRUN_BURST"},
    {ErrorCode::AUDIO_HEARTBEAT_TIMEOUT, "AUDIO_HEARTBEAT_TIMEOUT"},
    {ErrorCode::AUDIO_CLASSIFIER_FAILED, "AUDIO_CLASSIFIER_FAILED"},
    {ErrorCode::AUDIO_DENOISE_FAILED, "AUDIO_DENOISE_FAILED"},

    // Device
    {ErrorCode::DEVICE_NOT_FOUND, "DEVICE_NOT_FOUND"},
    {ErrorCode::DEVICE_OPEN_FAILED, "DEVICE_OPEN_FAILED"},
    {ErrorCode::DEVICE_PARAMS_NOT_SUPPORTED, "DEVICE_PARAMS_NOT_SUPPORTED"},
    {ErrorCode::DEVICE_GRAB_FAILED, "DEVICE_GRAB_FAILED"},
    {ErrorCode::DEVICE_IO_ERROR, "DEVICE_IO_ERROR"},
    {ErrorCode::DEVICE_DISCONNECTED, "DEVICE_DISCONNECTED"},
    {ErrorCode::DEVICE_RETRY_EXHAUSTED, "DEVICE_RETRY_EXHAUSTED"},

    // Transport
    {ErrorCode::TRANSPORT_INIT_FAILED, "TRANSPORT_INIT_FAILED"},
    {ErrorCode::TRANSPORT_SEND_FAILED, "TRANSPORT_SEND_FAILED"},
    {ErrorCode::TRANSPORT_NOT_CONNECTED, "TRANSPORT_NOT_CONNECTED"},

    // Queue
    {ErrorCode::QUEUE_EMPTY, "QUEUE_EMPTY"},
    {ErrorCode::QUEUE_SHUTDOWN, "QUEUE_SHUTDOWN"},

    // Validation
    {ErrorCode::VALIDATION_INVALID_CONFIG, "VALIDATION_INVALID_CONFIG"},
    {ErrorCode::VALIDATION_FILE_NOT_FOUND, "VALIDATION_FILE_NOT_FOUND"},
    {ErrorCode::VALIDATION_PARSE_ERROR, "VALIDATION_PARSE_ERROR"},
    {ErrorCode::VALIDATION_DUPLICATE_DEVICE, "VALIDATION_DUPLICATE_DEVICE"},
    {ErrorCode::VALIDATION_COUNT_MISMATCH, "VALIDATION_COUNT_MISMATCH"},
    {ErrorCode::VALIDATION_UNKNOWN_KEY, "VALIDATION_UNKNOWN_KEY"},
    {ErrorCode::VALIDATION_UNKNOWN_ACTION, "VALIDATION_UNKNOWN_ACTION"},
    {ErrorCode::VALIDATION_DEVICE_NODE, "VALIDATION_DEVICE_NODE"},

    // Internal
    {ErrorCode::INTERNAL_UNKNOWN, "INTERNAL_UNKNOWN"},
};

const char* errorCodeToString(ErrorCode code) {
    auto it = kErrorCodeStrings.find(code);
    if (it != kErrorCodeStrings.end()) {
        return it->second;
    }
    return "UNKNOWN_ERROR";
}

const char* getErrorCategory(ErrorCode code) {
    if (code == ErrorCode::OK) {
        return "ok";
    }
    if (isAudioError(code)) {
        return "audio";
    }
    if (isDeviceError(code)) {
        return "device";
    }
    if (isTransportError(code)) {
        return "transport";
    }
    if (isQueueError(code)) {
        return "queue";
    }
    if (isValidationError(code)) {
        return "validation";
    }
    return "internal";
}

std::string errorCodeToHex(ErrorCode code) {
    std::ostringstream oss;
    oss << "0x" << std::hex << std::setfill('0') << std::setw(4) << static_cast<uint32_t>(code);
    return oss.str();
}

ErrorCode stringToErrorCode(const std::string& str) {
    // Reverse lookup over the forward table keeps the two in sync.
    for (const auto& entry : kErrorCodeStrings) {
        if (str == entry.second) {
            return entry.first;
        }
    }
    return ErrorCode::INTERNAL_UNKNOWN;
}

}  // namespace show_ingest
