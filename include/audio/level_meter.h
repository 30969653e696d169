#pragma once

#include "audio/audio_frame.h"

#include <cmath>
#include <cstddef>
#include <cstdint>

namespace show_ingest::audio {

// Signal level on the normalised [-1, 1] scale (int16 / 32768).
namespace LevelMeter {

inline float rms(const std::int16_t* samples, std::size_t count) {
    if (count == 0) {
        return 0.0f;
    }
    double sumSquares = 0.0;
    for (std::size_t i = 0; i < count; ++i) {
        const double v = static_cast<double>(samples[i]) / 32768.0;
        sumSquares += v * v;
    }
    return static_cast<float>(std::sqrt(sumSquares / static_cast<double>(count)));
}

inline float toDbfs(float rmsValue) {
    if (rmsValue <= 0.0f) {
        return kSilenceFloorDbfs;
    }
    const float db = 20.0f * std::log10(rmsValue);
    return db < kSilenceFloorDbfs ? kSilenceFloorDbfs : db;
}

inline bool isSilent(float rmsValue, float threshold) {
    return rmsValue < threshold;
}

}  // namespace LevelMeter

}  // namespace show_ingest::audio
