#include "audio/audio_capture_stage.h"

#include "core/clock_util.h"
#include "logging/logger.h"
#include "metrics/pipeline_stats.h"

#include <stdexcept>

namespace show_ingest::audio {

AudioCaptureStage::AudioCaptureStage(int sourceId, PcmSource& source, PcmConfig config,
                                     pipeline::SlidingWindowQueue<AudioFrame>& output,
                                     metrics::PipelineStats* stats)
    : sourceId_(sourceId),
      source_(source),
      config_(std::move(config)),
      output_(output),
      stats_(stats) {
    if (config_.sampleRate == 0) {
        throw std::invalid_argument("capture sample rate must be positive");
    }
    if (config_.channels == 0 || config_.periodFrames == 0) {
        throw std::invalid_argument("capture channels and period must be positive");
    }
}

std::optional<DeviceError> AudioCaptureStage::open() {
    NegotiatedPcm negotiated;
    if (auto err = source_.open(config_, negotiated)) {
        return err;
    }
    if (negotiated.sampleRate == 0) {
        source_.close();
        return DeviceError(ErrorCode::AUDIO_INVALID_RATE, "device negotiated a zero sample rate");
    }
    negotiated.resampleRequired = negotiated.resampleRequired ||
                                  negotiated.sampleRate != config_.sampleRate;
    resampleRequired_.store(negotiated.resampleRequired);
    if (negotiated.resampleRequired) {
        LOG_INFO("[Capture] {} delivers {} Hz, requested {} Hz; frames carry the device rate",
                 config_.deviceHint, negotiated.sampleRate, config_.sampleRate);
    }
    {
        std::lock_guard<std::mutex> lock(negotiatedMutex_);
        negotiated_ = negotiated;
    }
    return std::nullopt;
}

void AudioCaptureStage::close() {
    source_.close();
}

NegotiatedPcm AudioCaptureStage::negotiated() const {
    std::lock_guard<std::mutex> lock(negotiatedMutex_);
    return negotiated_;
}

device::ReadStatus AudioCaptureStage::poll(std::chrono::milliseconds timeout) {
    device::ReadStatus status = source_.read(readBuffer_, timeout);
    if (status == device::ReadStatus::Xrun) {
        if (stats_) {
            metrics::PipelineStats::bump(stats_->framesXrun);
        }
        LOG_EVERY_N(WARN, 50, "[Capture] xrun on {}, chunk discarded", config_.deviceHint);
        return status;
    }
    if (status != device::ReadStatus::Data) {
        return status;
    }

    // Short handoff only: build the frame and enqueue it.
    AudioFrame frame;
    {
        std::lock_guard<std::mutex> lock(negotiatedMutex_);
        frame.sampleRate = negotiated_.sampleRate;
        frame.channels = negotiated_.channels;
        frame.format = negotiated_.format;
    }
    frame.sourceId = sourceId_;
    frame.captureTime = core::steadySeconds();
    frame.wallTime = core::wallSeconds();
    frame.data = readBuffer_;

    const std::uint64_t droppedBefore = output_.droppedCount();
    if (output_.put(std::move(frame)) == pipeline::QueueStatus::Shutdown) {
        LOG_DEBUG("[Capture] Raw queue shut down, discarding chunk");
        return device::ReadStatus::Data;
    }
    if (output_.droppedCount() > droppedBefore) {
        LOG_EVERY_N(WARN, 100, "[Capture] Raw audio queue full, evicted oldest chunk ({} total)",
                    output_.droppedCount());
    }
    framesEmitted_.fetch_add(1);
    if (stats_) {
        metrics::PipelineStats::bump(stats_->framesCaptured);
    }
    return device::ReadStatus::Data;
}

}  // namespace show_ingest::audio
