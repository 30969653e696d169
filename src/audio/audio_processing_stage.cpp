#include "audio/audio_processing_stage.h"

#include "audio/level_meter.h"
#include "audio/sample_convert.h"
#include "logging/logger.h"
#include "metrics/pipeline_stats.h"

#include <stdexcept>

namespace show_ingest::audio {

AudioProcessingStage::AudioProcessingStage(ProcessingConfig config,
                                           std::unique_ptr<SpeechClassifier> classifier,
                                           std::unique_ptr<NoiseReducer> reducer,
                                           metrics::PipelineStats* stats)
    : config_(config),
      classifier_(std::move(classifier)),
      reducer_(std::move(reducer)),
      stats_(stats) {
    if (config_.targetSampleRate == 0) {
        throw std::invalid_argument("target sample rate must be positive");
    }
    if (!(config_.silenceThreshold > 0.0f)) {
        throw std::invalid_argument("silence threshold must be positive");
    }
    if (!classifier_) {
        throw std::invalid_argument("AudioProcessingStage requires a speech classifier");
    }
}

AudioProcessingStage::~AudioProcessingStage() {
    join();
}

PolyResampler& AudioProcessingStage::resamplerFor(std::uint32_t inputRate) {
    if (!resampler_ || resampler_->inputRate() != inputRate) {
        resampler_ = std::make_unique<PolyResampler>(inputRate, config_.targetSampleRate);
        LOG_INFO("[Processing] Resampling {} -> {} Hz (up={}, down={})", inputRate,
                 config_.targetSampleRate, resampler_->up(), resampler_->down());
    }
    return *resampler_;
}

TaggedAudioFrame AudioProcessingStage::process(const AudioFrame& input) {
    if (input.sampleRate == 0) {
        throw std::invalid_argument("input frame has no sample rate");
    }

    std::vector<std::int16_t> samples = toMonoInt16(input);
    samples = resamplerFor(input.sampleRate).process(samples);

    TaggedAudioFrame out;
    const float rms = LevelMeter::rms(samples.data(), samples.size());
    out.rmsDbfs = LevelMeter::toDbfs(rms);
    out.isSilence = LevelMeter::isSilent(rms, config_.silenceThreshold);

    out.isVoice = classifier_->isSpeech(samples, config_.targetSampleRate);
    out.vadState = segmenter_.update(out.isVoice);

    // Detection above is final; denoise only changes the payload.
    if (reducer_) {
        out.isDenoised = reducer_->process(samples, config_.targetSampleRate);
    }

    out.frame.sourceId = input.sourceId;
    out.frame.captureTime = input.captureTime;
    out.frame.wallTime = input.wallTime;
    out.frame.channels = 1;
    out.frame.format = SampleFormat::Int16;
    out.frame.sampleRate = config_.targetSampleRate;
    out.frame.data = int16ToBytes(samples);
    out.sequenceNum = nextSequence_.fetch_add(1);

    if (stats_) {
        metrics::PipelineStats::bump(stats_->framesProcessed);
        if (out.isVoice) {
            metrics::PipelineStats::bump(stats_->speechFrames);
        }
        if (out.isSilence) {
            metrics::PipelineStats::bump(stats_->silentFrames);
        }
    }
    return out;
}

void AudioProcessingStage::run(pipeline::SlidingWindowQueue<AudioFrame>& input,
                               pipeline::SlidingWindowQueue<TaggedAudioFrame>& output) {
    LOG_INFO("[Processing] Started (target={} Hz, vad={}, denoise={})", config_.targetSampleRate,
             classifier_->name(), reducer_ ? "on" : "off");
    AudioFrame frame;
    while (input.get(frame) == pipeline::QueueStatus::Ok) {
        TaggedAudioFrame tagged;
        try {
            tagged = process(frame);
        } catch (const std::exception& e) {
            LOG_ERROR("[Processing] Dropping frame from source {}: {}", frame.sourceId, e.what());
            continue;
        }
        if (tagged.vadState == VadState::Start || tagged.vadState == VadState::Stop) {
            LOG_DEBUG("[Processing] VAD {} at seq={} ({:.1f} dBFS)",
                      vadStateToString(tagged.vadState), tagged.sequenceNum, tagged.rmsDbfs);
        }
        const std::uint64_t droppedBefore = output.droppedCount();
        if (output.put(std::move(tagged)) == pipeline::QueueStatus::Shutdown) {
            break;
        }
        if (output.droppedCount() > droppedBefore) {
            LOG_EVERY_N(WARN, 100, "[Processing] Output queue full, evicted oldest frame ({} total)",
                        output.droppedCount());
        }
    }
    LOG_INFO("[Processing] Stopped after {} frames", nextSequence_.load());
}

void AudioProcessingStage::start(pipeline::SlidingWindowQueue<AudioFrame>& input,
                                 pipeline::SlidingWindowQueue<TaggedAudioFrame>& output) {
    if (thread_.joinable()) {
        return;
    }
    thread_ = std::thread([this, &input, &output] { run(input, output); });
}

void AudioProcessingStage::join() {
    if (thread_.joinable()) {
        thread_.join();
    }
}

}  // namespace show_ingest::audio
