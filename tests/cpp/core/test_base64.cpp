/**
 * @file test_base64.cpp
 * @brief Unit tests for Base64 encoding/decoding (RFC 4648).
 */

#include "core/base64.h"

#include <cstring>
#include <gtest/gtest.h>
#include <vector>

using namespace show_ingest;

// ============================================================
// Encode Tests
// ============================================================

TEST(Base64, EncodeEmpty) {
    std::vector<uint8_t> empty;
    EXPECT_EQ(base64::encode(empty), "");
}

TEST(Base64, EncodePaddingVariants) {
    EXPECT_EQ(base64::encode(std::vector<uint8_t>{0x4D}), "TQ==");
    EXPECT_EQ(base64::encode(std::vector<uint8_t>{0x4D, 0x61}), "TWE=");
    EXPECT_EQ(base64::encode(std::vector<uint8_t>{0x4D, 0x61, 0x6E}), "TWFu");
}

TEST(Base64, EncodeBinaryData) {
    std::vector<uint8_t> data = {0x00, 0xFF, 0x7F, 0x80, 0x01};
    EXPECT_EQ(base64::encode(data), "AP9/gAE=");
    EXPECT_EQ(base64::encodedSize(data.size()), 8u);
}

// ============================================================
// Decode Tests
// ============================================================

TEST(Base64, DecodeHelloWorld) {
    auto result = base64::decode("SGVsbG8sIFdvcmxkIQ==");
    ASSERT_TRUE(result.has_value());
    const char* text = "Hello, World!";
    EXPECT_EQ(*result, std::vector<uint8_t>(text, text + strlen(text)));
}

TEST(Base64, DecodePcmPayload) {
    // Two little-endian int16 samples: 1, -1
    std::vector<uint8_t> pcm = {0x01, 0x00, 0xFF, 0xFF};
    auto result = base64::decode(base64::encode(pcm));
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, pcm);
}

TEST(Base64, DecodeRejectsBadLength) {
    EXPECT_FALSE(base64::decode("TQ=").has_value());
    EXPECT_FALSE(base64::decode("TWFuT").has_value());
}

TEST(Base64, DecodeRejectsInvalidCharacters) {
    EXPECT_FALSE(base64::decode("T@==").has_value());
    EXPECT_FALSE(base64::decode("TW u").has_value());
}

TEST(Base64, DecodeRejectsMisplacedPadding) {
    EXPECT_FALSE(base64::decode("TQ=A").has_value());
    EXPECT_FALSE(base64::decode("TQ==TWFu").has_value());
}
