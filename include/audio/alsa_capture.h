#pragma once

#include "audio/pcm_source.h"

#include <alsa/asoundlib.h>
#include <optional>
#include <string>
#include <vector>

namespace show_ingest::audio {

struct CaptureCardInfo {
    int card = -1;
    std::string name;
    std::string longName;
};

/**
 * @brief ALSA capture PCM opened in non-blocking mode.
 *
 * The requested rate/format/channels are tested against the hardware before
 * being applied. An unsupported rate falls back to the nearest rate the
 * device accepts and marks the stream as resample-required; an unsupported
 * format falls back through int32 then int16.
 */
class AlsaCapture : public PcmSource {
   public:
    AlsaCapture() = default;
    ~AlsaCapture() override;

    AlsaCapture(const AlsaCapture&) = delete;
    AlsaCapture& operator=(const AlsaCapture&) = delete;

    std::optional<DeviceError> open(const PcmConfig& config, NegotiatedPcm& out) override;
    void close() override;
    device::ReadStatus read(std::vector<std::uint8_t>& out,
                            std::chrono::milliseconds timeout) override;

    std::optional<DeviceError> lastError() const override {
        return lastError_;
    }

    static std::vector<CaptureCardInfo> listCaptureCards();

    // Explicit ALSA PCM names ("hw:1,0", "plughw:...", "default") are used
    // as-is; anything else is matched as a substring of the card names.
    static std::optional<std::string> resolveDevice(const std::string& hint);

    static snd_pcm_format_t toAlsaFormat(SampleFormat format);

   private:
    device::ReadStatus failHard(ErrorCode code, const std::string& what, int err);

    snd_pcm_t* handle_ = nullptr;
    NegotiatedPcm negotiated_;
    std::size_t frameBytes_ = 0;
    std::vector<std::uint8_t> pending_;
    std::size_t pendingFrames_ = 0;
    std::optional<DeviceError> lastError_;
};

}  // namespace show_ingest::audio
