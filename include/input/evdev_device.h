#pragma once

#include "core/error_codes.h"
#include "device/device_session.h"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace show_ingest::input {

// Decoded evdev record. timestampMs is the kernel stamp on CLOCK_MONOTONIC
// (EVIOCSCLOCKID is set at open) and is only meaningful for intervals.
struct RawInputEvent {
    std::uint16_t type = 0;
    std::uint16_t code = 0;
    std::int32_t value = 0;
    std::int64_t timestampMs = 0;
};

class InputEventSource {
   public:
    virtual ~InputEventSource() = default;

    virtual std::optional<DeviceError> open(const std::string& path, bool grab) = 0;
    // Releases the grab (if held) before closing.
    virtual void close() = 0;
    // Data: at least one event appended to `out`.
    virtual device::ReadStatus read(std::vector<RawInputEvent>& out,
                                    std::chrono::milliseconds timeout) = 0;

    virtual std::optional<DeviceError> lastError() const {
        return std::nullopt;
    }
};

// /dev/input/event* reader (non-blocking fd + poll, optional EVIOCGRAB).
class EvdevDevice : public InputEventSource {
   public:
    EvdevDevice() = default;
    ~EvdevDevice() override;

    EvdevDevice(const EvdevDevice&) = delete;
    EvdevDevice& operator=(const EvdevDevice&) = delete;

    std::optional<DeviceError> open(const std::string& path, bool grab) override;
    void close() override;
    device::ReadStatus read(std::vector<RawInputEvent>& out,
                            std::chrono::milliseconds timeout) override;

    std::optional<DeviceError> lastError() const override {
        return lastError_;
    }

   private:
    device::ReadStatus hardError(const std::string& what, int err);

    int fd_ = -1;
    bool grabbed_ = false;
    std::string path_;
    std::optional<DeviceError> lastError_;
};

}  // namespace show_ingest::input
