#include "core/base64.h"

#include <array>

namespace show_ingest::base64 {

namespace {

constexpr char kAlphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
constexpr std::uint8_t kInvalid = 0xFF;

std::array<std::uint8_t, 256> buildDecodeTable() {
    std::array<std::uint8_t, 256> table{};
    table.fill(kInvalid);
    for (std::uint8_t i = 0; i < 64; ++i) {
        table[static_cast<unsigned char>(kAlphabet[i])] = i;
    }
    return table;
}

const std::array<std::uint8_t, 256>& decodeTable() {
    static const std::array<std::uint8_t, 256> table = buildDecodeTable();
    return table;
}

}  // namespace

std::string encode(const std::uint8_t* data, std::size_t length) {
    std::string out;
    out.reserve(encodedSize(length));

    std::size_t i = 0;
    for (; i + 3 <= length; i += 3) {
        const std::uint32_t triple = (static_cast<std::uint32_t>(data[i]) << 16) |
                                     (static_cast<std::uint32_t>(data[i + 1]) << 8) | data[i + 2];
        out += kAlphabet[(triple >> 18) & 0x3F];
        out += kAlphabet[(triple >> 12) & 0x3F];
        out += kAlphabet[(triple >> 6) & 0x3F];
        out += kAlphabet[triple & 0x3F];
    }

    const std::size_t tail = length - i;
    if (tail == 0) {
        return out;
    }
    std::uint32_t triple = static_cast<std::uint32_t>(data[i]) << 16;
    if (tail == 2) {
        triple |= static_cast<std::uint32_t>(data[i + 1]) << 8;
    }
    out += kAlphabet[(triple >> 18) & 0x3F];
    out += kAlphabet[(triple >> 12) & 0x3F];
    out += tail == 2 ? kAlphabet[(triple >> 6) & 0x3F] : '=';
    out += '=';
    return out;
}

std::string encode(const std::vector<std::uint8_t>& data) {
    return encode(data.data(), data.size());
}

std::optional<std::vector<std::uint8_t>> decode(const std::string& encoded) {
    if (encoded.size() % 4 != 0) {
        return std::nullopt;
    }
    const auto& table = decodeTable();

    std::size_t padding = 0;
    if (!encoded.empty() && encoded.back() == '=') {
        padding = (encoded.size() >= 2 && encoded[encoded.size() - 2] == '=') ? 2 : 1;
    }

    std::vector<std::uint8_t> out;
    out.reserve((encoded.size() / 4) * 3);

    for (std::size_t i = 0; i < encoded.size(); i += 4) {
        const bool lastQuad = (i + 4 == encoded.size());
        std::uint32_t triple = 0;
        for (std::size_t k = 0; k < 4; ++k) {
            const char c = encoded[i + k];
            std::uint8_t v = 0;
            if (c == '=') {
                // Padding only in the final quad and only in the last two slots.
                if (!lastQuad || k < 4 - padding) {
                    return std::nullopt;
                }
            } else {
                v = table[static_cast<unsigned char>(c)];
                if (v == kInvalid) {
                    return std::nullopt;
                }
            }
            triple = (triple << 6) | v;
        }
        out.push_back(static_cast<std::uint8_t>((triple >> 16) & 0xFF));
        if (!lastQuad || padding < 2) {
            out.push_back(static_cast<std::uint8_t>((triple >> 8) & 0xFF));
        }
        if (!lastQuad || padding < 1) {
            out.push_back(static_cast<std::uint8_t>(triple & 0xFF));
        }
    }
    return out;
}

}  // namespace show_ingest::base64
