#pragma once

#include "audio/audio_frame.h"

namespace show_ingest::audio {

/**
 * @brief Turns per-frame speech flags into segment boundaries.
 *
 * speech:     NA|STOP -> START, START|CONTINUE -> CONTINUE
 * non-speech: START|CONTINUE -> STOP, STOP -> NA, NA -> NA
 */
class VadSegmenter {
   public:
    static VadState next(VadState current, bool speech) {
        if (speech) {
            return (current == VadState::NA || current == VadState::Stop) ? VadState::Start
                                                                          : VadState::Continue;
        }
        if (current == VadState::Start || current == VadState::Continue) {
            return VadState::Stop;
        }
        return VadState::NA;
    }

    VadState update(bool speech) {
        state_ = next(state_, speech);
        return state_;
    }

    VadState state() const {
        return state_;
    }

    void reset() {
        state_ = VadState::NA;
    }

   private:
    VadState state_ = VadState::NA;
};

}  // namespace show_ingest::audio
