#pragma once

#include "audio/audio_frame.h"
#include "audio/noise_reducer.h"
#include "audio/poly_resampler.h"
#include "audio/speech_classifier.h"
#include "audio/vad_segmenter.h"
#include "pipeline/sliding_window_queue.h"

#include <atomic>
#include <cstdint>
#include <memory>
#include <thread>

namespace show_ingest::metrics {
struct PipelineStats;
}

namespace show_ingest::audio {

struct ProcessingConfig {
    std::uint32_t targetSampleRate = 16000;
    float silenceThreshold = 0.01f;  // RMS on the [-1, 1] scale
};

/**
 * @brief Single-consumer stage turning raw frames into tagged frames.
 *
 * Order per frame: mono int16 conversion, rate conversion, RMS/silence,
 * VAD, then optional denoise. Level and VAD always describe the captured
 * signal; denoising only changes the shipped payload. Sequence numbers
 * start at 0 and increase by one per emitted frame for the stage lifetime.
 */
class AudioProcessingStage {
   public:
    // reducer may be null (no denoise).
    AudioProcessingStage(ProcessingConfig config, std::unique_ptr<SpeechClassifier> classifier,
                         std::unique_ptr<NoiseReducer> reducer = nullptr,
                         metrics::PipelineStats* stats = nullptr);
    ~AudioProcessingStage();

    AudioProcessingStage(const AudioProcessingStage&) = delete;
    AudioProcessingStage& operator=(const AudioProcessingStage&) = delete;

    TaggedAudioFrame process(const AudioFrame& input);

    // Consumes `input` until it is shut down, pushing results to `output`.
    void run(pipeline::SlidingWindowQueue<AudioFrame>& input,
             pipeline::SlidingWindowQueue<TaggedAudioFrame>& output);
    void start(pipeline::SlidingWindowQueue<AudioFrame>& input,
               pipeline::SlidingWindowQueue<TaggedAudioFrame>& output);
    void join();

    VadState vadState() const {
        return segmenter_.state();
    }
    std::uint64_t framesProcessed() const {
        return nextSequence_.load();
    }

   private:
    PolyResampler& resamplerFor(std::uint32_t inputRate);

    ProcessingConfig config_;
    std::unique_ptr<SpeechClassifier> classifier_;
    std::unique_ptr<NoiseReducer> reducer_;
    metrics::PipelineStats* stats_;

    std::unique_ptr<PolyResampler> resampler_;
    VadSegmenter segmenter_;
    std::atomic<std::uint64_t> nextSequence_{0};
    std::thread thread_;
};

}  // namespace show_ingest::audio
