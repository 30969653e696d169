#pragma once

#include "audio/audio_frame.h"

#include <cstdint>
#include <vector>

namespace show_ingest::audio {

// Decode interleaved PCM of any supported format and average the channels
// down to a single int16 channel.
std::vector<std::int16_t> toMonoInt16(const AudioFrame& frame);

std::vector<std::uint8_t> int16ToBytes(const std::vector<std::int16_t>& samples);

}  // namespace show_ingest::audio
