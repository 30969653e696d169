#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace show_ingest::base64 {

// RFC 4648 standard alphabet with '=' padding.
std::string encode(const std::uint8_t* data, std::size_t length);
std::string encode(const std::vector<std::uint8_t>& data);

// Subscriber side: recovers the "pcm" field of an audio record. The daemon
// itself only encodes. nullopt on bad length, bad character or misplaced
// padding.
std::optional<std::vector<std::uint8_t>> decode(const std::string& encoded);

constexpr std::size_t encodedSize(std::size_t inputLength) {
    return ((inputLength + 2) / 3) * 4;
}

}  // namespace show_ingest::base64
