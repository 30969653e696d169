#include "audio/noise_reducer.h"

#include "logging/logger.h"

#include <speex/speex_preprocess.h>

namespace show_ingest::audio {

SpeexNoiseReducer::SpeexNoiseReducer(int suppressDb) : suppressDb_(suppressDb) {}

SpeexNoiseReducer::~SpeexNoiseReducer() {
    if (state_) {
        speex_preprocess_state_destroy(state_);
    }
}

bool SpeexNoiseReducer::process(std::vector<std::int16_t>& samples, std::uint32_t sampleRate) {
    if (samples.empty()) {
        return false;
    }
    if (!state_ || samples.size() != frameSize_ || sampleRate != sampleRate_) {
        if (state_) {
            speex_preprocess_state_destroy(state_);
        }
        state_ = speex_preprocess_state_init(static_cast<int>(samples.size()),
                                             static_cast<int>(sampleRate));
        if (!state_) {
            LOG_WARN("[Processing] Cannot create speex denoiser for {} samples @ {} Hz",
                     samples.size(), sampleRate);
            return false;
        }
        int on = 1;
        speex_preprocess_ctl(state_, SPEEX_PREPROCESS_SET_DENOISE, &on);
        speex_preprocess_ctl(state_, SPEEX_PREPROCESS_SET_NOISE_SUPPRESS, &suppressDb_);
        frameSize_ = samples.size();
        sampleRate_ = sampleRate;
    }
    speex_preprocess_run(state_, samples.data());
    return true;
}

}  // namespace show_ingest::audio
