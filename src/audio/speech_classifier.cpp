#include "audio/speech_classifier.h"

#include "audio/level_meter.h"
#include "logging/logger.h"

#include <algorithm>
#include <speex/speex_preprocess.h>
#include <stdexcept>

namespace show_ingest::audio {

namespace {

constexpr float kMinNoiseFloor = 1e-4f;
// 6, 9, 12, 15 dB above the floor.
constexpr float kMarginByAggressiveness[] = {1.995f, 2.818f, 3.981f, 5.623f};
constexpr int kProbStart[] = {35, 50, 65, 80};
constexpr int kProbContinue[] = {20, 35, 50, 65};

int checkedAggressiveness(int aggressiveness) {
    if (aggressiveness < 0 || aggressiveness > 3) {
        throw std::invalid_argument("VAD aggressiveness must be in 0..3");
    }
    return aggressiveness;
}

}  // namespace

// ========== EnergySpeechClassifier ==========

EnergySpeechClassifier::EnergySpeechClassifier(int aggressiveness)
    : marginFactor_(kMarginByAggressiveness[checkedAggressiveness(aggressiveness)]) {}

bool EnergySpeechClassifier::isSpeech(const std::vector<std::int16_t>& samples,
                                      std::uint32_t /*sampleRate*/) {
    const float rms = LevelMeter::rms(samples.data(), samples.size());
    const bool speech = rms > noiseFloorRms_ * marginFactor_;

    // Track the floor quickly while quiet, slowly while loud.
    if (rms < noiseFloorRms_ * 1.5f) {
        noiseFloorRms_ = noiseFloorRms_ * 0.995f + rms * 0.005f;
    } else {
        noiseFloorRms_ = noiseFloorRms_ * 0.9995f + rms * 0.0005f;
    }
    noiseFloorRms_ = std::max(noiseFloorRms_, kMinNoiseFloor);
    return speech;
}

// ========== SpeexSpeechClassifier ==========

SpeexSpeechClassifier::SpeexSpeechClassifier(int aggressiveness)
    : probStart_(kProbStart[checkedAggressiveness(aggressiveness)]),
      probContinue_(kProbContinue[aggressiveness]) {}

SpeexSpeechClassifier::~SpeexSpeechClassifier() {
    destroyState();
}

void SpeexSpeechClassifier::destroyState() {
    if (state_) {
        speex_preprocess_state_destroy(state_);
        state_ = nullptr;
    }
}

bool SpeexSpeechClassifier::ensureState(std::size_t frameSize, std::uint32_t sampleRate) {
    if (state_ && frameSize == frameSize_ && sampleRate == sampleRate_) {
        return true;
    }
    destroyState();
    state_ = speex_preprocess_state_init(static_cast<int>(frameSize), static_cast<int>(sampleRate));
    if (!state_) {
        LOG_ERROR("[Processing] speex_preprocess_state_init({}, {}) failed", frameSize,
                  sampleRate);
        return false;
    }
    int on = 1;
    int off = 0;
    speex_preprocess_ctl(state_, SPEEX_PREPROCESS_SET_VAD, &on);
    speex_preprocess_ctl(state_, SPEEX_PREPROCESS_SET_DENOISE, &off);
    speex_preprocess_ctl(state_, SPEEX_PREPROCESS_SET_AGC, &off);
    speex_preprocess_ctl(state_, SPEEX_PREPROCESS_SET_PROB_START, &probStart_);
    speex_preprocess_ctl(state_, SPEEX_PREPROCESS_SET_PROB_CONTINUE, &probContinue_);
    frameSize_ = frameSize;
    sampleRate_ = sampleRate;
    LOG_DEBUG("[Processing] speex VAD state for {} samples @ {} Hz", frameSize, sampleRate);
    return true;
}

bool SpeexSpeechClassifier::isSpeech(const std::vector<std::int16_t>& samples,
                                     std::uint32_t sampleRate) {
    if (samples.empty() || !ensureState(samples.size(), sampleRate)) {
        return false;
    }
    // The preprocessor may touch its input; the caller's frame stays intact.
    scratch_.assign(samples.begin(), samples.end());
    return speex_preprocess_run(state_, scratch_.data()) != 0;
}

std::unique_ptr<SpeechClassifier> makeSpeechClassifier(const std::string& backend,
                                                       int aggressiveness) {
    if (backend == "speex") {
        return std::make_unique<SpeexSpeechClassifier>(aggressiveness);
    }
    if (backend == "energy") {
        return std::make_unique<EnergySpeechClassifier>(aggressiveness);
    }
    throw std::invalid_argument("unknown VAD backend '" + backend + "'");
}

}  // namespace show_ingest::audio
