#pragma once

#include "audio/audio_frame.h"
#include "audio/pcm_source.h"
#include "device/device_session.h"
#include "pipeline/sliding_window_queue.h"

#include <atomic>
#include <mutex>
#include <string>
#include <vector>

namespace show_ingest::metrics {
struct PipelineStats;
}

namespace show_ingest::audio {

/**
 * @brief Microphone capability driven by a DeviceSession.
 *
 * Every clean chunk becomes an AudioFrame stamped with the negotiated rate,
 * format and channel count, and is put on the raw queue. Xrun chunks are
 * reported to the session and never queued.
 */
class AudioCaptureStage : public device::DeviceCapability {
   public:
    AudioCaptureStage(int sourceId, PcmSource& source, PcmConfig config,
                      pipeline::SlidingWindowQueue<AudioFrame>& output,
                      metrics::PipelineStats* stats = nullptr);

    const std::string& deviceId() const override {
        return config_.deviceHint;
    }
    const char* kind() const override {
        return "mic";
    }

    std::optional<DeviceError> open() override;
    void close() override;
    device::ReadStatus poll(std::chrono::milliseconds timeout) override;
    std::optional<DeviceError> lastError() const override {
        return source_.lastError();
    }

    NegotiatedPcm negotiated() const;
    bool resampleRequired() const {
        return resampleRequired_.load();
    }
    std::uint64_t framesEmitted() const {
        return framesEmitted_.load();
    }

   private:
    const int sourceId_;
    PcmSource& source_;
    const PcmConfig config_;
    pipeline::SlidingWindowQueue<AudioFrame>& output_;
    metrics::PipelineStats* stats_;

    mutable std::mutex negotiatedMutex_;
    NegotiatedPcm negotiated_;
    std::atomic<bool> resampleRequired_{false};
    std::atomic<std::uint64_t> framesEmitted_{0};
    std::vector<std::uint8_t> readBuffer_;
};

}  // namespace show_ingest::audio
