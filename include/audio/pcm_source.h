#pragma once

#include "audio/audio_frame.h"
#include "core/error_codes.h"
#include "device/device_session.h"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace show_ingest::audio {

struct PcmConfig {
    std::string deviceHint;  // substring of the card name, or an ALSA PCM name
    std::uint32_t sampleRate = 48000;
    std::uint32_t channels = 1;
    SampleFormat format = SampleFormat::Int16;
    std::uint32_t periodFrames = 960;
};

// What the hardware actually agreed to. May differ from PcmConfig.
struct NegotiatedPcm {
    std::string deviceName;
    std::uint32_t sampleRate = 0;
    std::uint32_t channels = 0;
    SampleFormat format = SampleFormat::Int16;
    std::uint32_t periodFrames = 0;
    bool resampleRequired = false;
};

// Raw capture seam. AlsaCapture in production, fakes in tests.
class PcmSource {
   public:
    virtual ~PcmSource() = default;

    virtual std::optional<DeviceError> open(const PcmConfig& config, NegotiatedPcm& out) = 0;
    virtual void close() = 0;

    // Data: `out` holds exactly one period of interleaved frames.
    virtual device::ReadStatus read(std::vector<std::uint8_t>& out,
                                    std::chrono::milliseconds timeout) = 0;

    virtual std::optional<DeviceError> lastError() const {
        return std::nullopt;
    }
};

}  // namespace show_ingest::audio
