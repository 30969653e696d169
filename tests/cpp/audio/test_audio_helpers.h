#pragma once

#include "audio/audio_frame.h"
#include "audio/sample_convert.h"

#include <cmath>
#include <cstdint>
#include <vector>

namespace show_ingest::audio::test {

inline std::vector<std::int16_t> sine(std::uint32_t rate, double freqHz, std::size_t count,
                                      double amplitude) {
    std::vector<std::int16_t> out(count);
    for (std::size_t i = 0; i < count; ++i) {
        const double t = static_cast<double>(i) / rate;
        out[i] = static_cast<std::int16_t>(
            std::lround(amplitude * std::sin(2.0 * 3.14159265358979323846 * freqHz * t)));
    }
    return out;
}

inline AudioFrame monoFrame(const std::vector<std::int16_t>& samples, std::uint32_t rate) {
    AudioFrame frame;
    frame.data = int16ToBytes(samples);
    frame.channels = 1;
    frame.sampleRate = rate;
    frame.format = SampleFormat::Int16;
    return frame;
}

inline std::vector<std::int16_t> samplesOf(const AudioFrame& frame) {
    return toMonoInt16(frame);
}

inline int zeroCrossings(const std::vector<std::int16_t>& s, std::size_t from, std::size_t to) {
    int n = 0;
    for (std::size_t i = from + 1; i < to; ++i) {
        if ((s[i - 1] < 0) != (s[i] < 0)) {
            ++n;
        }
    }
    return n;
}

inline double rmsOf(const std::vector<std::int16_t>& s, std::size_t from, std::size_t to) {
    double acc = 0.0;
    for (std::size_t i = from; i < to; ++i) {
        acc += static_cast<double>(s[i]) * s[i];
    }
    return std::sqrt(acc / static_cast<double>(to - from));
}

}  // namespace show_ingest::audio::test
