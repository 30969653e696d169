#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace show_ingest::audio {

enum class SampleFormat : std::uint8_t { Int16, Int32, Float32, Int8, UInt8 };

enum class VadState : std::uint8_t { NA, Start, Continue, Stop };

inline std::size_t bytesPerSample(SampleFormat format) {
    switch (format) {
    case SampleFormat::Int16:
        return 2;
    case SampleFormat::Int32:
    case SampleFormat::Float32:
        return 4;
    case SampleFormat::Int8:
    case SampleFormat::UInt8:
        return 1;
    }
    return 2;
}

inline const char* sampleFormatToString(SampleFormat format) {
    switch (format) {
    case SampleFormat::Int16:
        return "int16";
    case SampleFormat::Int32:
        return "int32";
    case SampleFormat::Float32:
        return "float32";
    case SampleFormat::Int8:
        return "int8";
    case SampleFormat::UInt8:
        return "uint8";
    }
    return "int16";
}

inline std::optional<SampleFormat> parseSampleFormat(std::string_view name) {
    if (name == "int16") {
        return SampleFormat::Int16;
    }
    if (name == "int32") {
        return SampleFormat::Int32;
    }
    if (name == "float32") {
        return SampleFormat::Float32;
    }
    if (name == "int8") {
        return SampleFormat::Int8;
    }
    if (name == "uint8") {
        return SampleFormat::UInt8;
    }
    return std::nullopt;
}

inline const char* vadStateToString(VadState state) {
    switch (state) {
    case VadState::NA:
        return "NA";
    case VadState::Start:
        return "START";
    case VadState::Continue:
        return "CONTINUE";
    case VadState::Stop:
        return "STOP";
    }
    return "NA";
}

/**
 * @brief One chunk of interleaved PCM as delivered by a capture source.
 *
 * data holds little-endian samples in `format`. sampleRate is the rate the
 * producing stage declared (the negotiated device rate for raw frames, the
 * target rate after processing). Frames are never mutated once queued.
 */
struct AudioFrame {
    int sourceId = 0;
    std::vector<std::uint8_t> data;
    std::uint32_t channels = 1;
    double captureTime = 0.0;  // steady clock seconds
    double wallTime = 0.0;     // system clock seconds
    std::uint32_t sampleRate = 0;
    SampleFormat format = SampleFormat::Int16;

    std::size_t frameCount() const {
        const std::size_t stride = bytesPerSample(format) * (channels == 0 ? 1 : channels);
        return data.size() / stride;
    }
};

constexpr float kSilenceFloorDbfs = -120.0f;

struct TaggedAudioFrame {
    AudioFrame frame;  // int16 mono at the target rate
    bool isDenoised = false;
    bool isSilence = false;
    bool isVoice = false;
    VadState vadState = VadState::NA;
    float rmsDbfs = kSilenceFloorDbfs;
    std::uint64_t sequenceNum = 0;
};

}  // namespace show_ingest::audio
