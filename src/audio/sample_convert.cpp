#include "audio/sample_convert.h"

#include <algorithm>
#include <cmath>
#include <cstring>

namespace show_ingest::audio {

namespace {

// Host is little-endian (ARM/x86 Linux), so memcpy decodes LE PCM.
template <typename T>
T loadSample(const std::uint8_t* p) {
    T v;
    std::memcpy(&v, p, sizeof(T));
    return v;
}

std::int32_t decodeAsInt16Range(SampleFormat format, const std::uint8_t* p) {
    switch (format) {
    case SampleFormat::Int16:
        return loadSample<std::int16_t>(p);
    case SampleFormat::Int32:
        return loadSample<std::int32_t>(p) >> 16;
    case SampleFormat::Float32: {
        float f = std::clamp(loadSample<float>(p), -1.0f, 1.0f);
        return static_cast<std::int32_t>(std::lround(f * 32767.0f));
    }
    case SampleFormat::Int8:
        return static_cast<std::int32_t>(loadSample<std::int8_t>(p)) * 256;
    case SampleFormat::UInt8:
        return (static_cast<std::int32_t>(loadSample<std::uint8_t>(p)) - 128) * 256;
    }
    return 0;
}

}  // namespace

std::vector<std::int16_t> toMonoInt16(const AudioFrame& frame) {
    const std::size_t channels = frame.channels == 0 ? 1 : frame.channels;
    const std::size_t sampleBytes = bytesPerSample(frame.format);
    const std::size_t frames = frame.frameCount();

    std::vector<std::int16_t> out(frames);
    const std::uint8_t* p = frame.data.data();
    for (std::size_t i = 0; i < frames; ++i) {
        std::int64_t acc = 0;
        for (std::size_t ch = 0; ch < channels; ++ch) {
            acc += decodeAsInt16Range(frame.format, p);
            p += sampleBytes;
        }
        const std::int64_t mean = acc / static_cast<std::int64_t>(channels);
        out[i] = static_cast<std::int16_t>(std::clamp<std::int64_t>(mean, -32768, 32767));
    }
    return out;
}

std::vector<std::uint8_t> int16ToBytes(const std::vector<std::int16_t>& samples) {
    std::vector<std::uint8_t> bytes(samples.size() * sizeof(std::int16_t));
    if (!samples.empty()) {
        std::memcpy(bytes.data(), samples.data(), bytes.size());
    }
    return bytes;
}

}  // namespace show_ingest::audio
