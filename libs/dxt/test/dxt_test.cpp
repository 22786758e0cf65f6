#include "paakit/dxt.h"
#include "paakit/errors.h"

#include <gtest/gtest.h>

#include <algorithm>

using namespace paakit::dxt;

namespace {

// Builds an 8-byte color block.
std::array<uint8_t, 8> color_block(uint16_t c0, uint16_t c1, uint32_t indices) {
    return {static_cast<uint8_t>(c0), static_cast<uint8_t>(c0 >> 8),
            static_cast<uint8_t>(c1), static_cast<uint8_t>(c1 >> 8),
            static_cast<uint8_t>(indices), static_cast<uint8_t>(indices >> 8),
            static_cast<uint8_t>(indices >> 16), static_cast<uint8_t>(indices >> 24)};
}

// Index pattern 0,1,2,3 repeated over the 16 texels.
constexpr uint32_t kAllCodes = 0xE4E4E4E4;

} // namespace

TEST(Dxt, Expand565Replicates) {
    auto white = expand565(0xFFFF);
    EXPECT_EQ(white.r, 255);
    EXPECT_EQ(white.g, 255);
    EXPECT_EQ(white.b, 255);

    // Pure red 5-bit 16, green 6-bit 32, blue 0
    auto c = expand565(static_cast<uint16_t>((16 << 11) | (32 << 5)));
    EXPECT_EQ(c.r, 0x84);
    EXPECT_EQ(c.g, 0x82);
    EXPECT_EQ(c.b, 0);
}

TEST(Dxt, Dxt1OpaqueBranch) {
    auto block = color_block(0xFFFF, 0x0000, kAllCodes);
    auto texels = decode_dxt1_block(block.data());

    EXPECT_EQ(texels[0], (Texel{255, 255, 255, 255}));
    EXPECT_EQ(texels[1], (Texel{0, 0, 0, 255}));
    // 2:1 toward white, rounded to nearest
    EXPECT_EQ(texels[2], (Texel{170, 170, 170, 255}));
    EXPECT_EQ(texels[3], (Texel{85, 85, 85, 255}));
    for (const auto& t : texels)
        EXPECT_EQ(t[3], 255);
}

TEST(Dxt, Dxt1TransparentBranch) {
    auto block = color_block(0x0000, 0xFFFF, kAllCodes);
    auto texels = decode_dxt1_block(block.data());

    EXPECT_EQ(texels[0], (Texel{0, 0, 0, 255}));
    EXPECT_EQ(texels[1], (Texel{255, 255, 255, 255}));
    EXPECT_EQ(texels[2], (Texel{128, 128, 128, 255}));
    EXPECT_EQ(texels[3], (Texel{0, 0, 0, 0}));
    EXPECT_EQ(texels[15], (Texel{0, 0, 0, 0}));
}

TEST(Dxt, Dxt1EqualEndpointsUseThreeColorMode) {
    auto block = color_block(0x1234, 0x1234, 0xFFFFFFFF);
    auto texels = decode_dxt1_block(block.data());
    for (const auto& t : texels)
        EXPECT_EQ(t, (Texel{0, 0, 0, 0}));
}

TEST(Dxt, AlphaTableEightValues) {
    auto a = alpha_table(255, 0);
    EXPECT_EQ(a[0], 255);
    EXPECT_EQ(a[1], 0);
    // In weight order: code 0, codes 2..7, code 1
    std::array<uint8_t, 8> by_weight = {a[0], a[2], a[3], a[4], a[5], a[6], a[7], a[1]};
    std::array<uint8_t, 8> expected = {255, 219, 182, 146, 109, 73, 36, 0};
    EXPECT_EQ(by_weight, expected);
    for (size_t i = 1; i < by_weight.size(); i++)
        EXPECT_LT(by_weight[i], by_weight[i - 1]);
}

TEST(Dxt, AlphaTableSixValues) {
    auto a = alpha_table(0, 255);
    EXPECT_EQ(a[0], 0);
    EXPECT_EQ(a[1], 255);
    EXPECT_EQ(a[2], 51);
    EXPECT_EQ(a[3], 102);
    EXPECT_EQ(a[4], 153);
    EXPECT_EQ(a[5], 204);
    EXPECT_EQ(a[6], 0);
    EXPECT_EQ(a[7], 255);
    for (size_t i = 2; i <= 5; i++) {
        EXPECT_GT(a[i], 0);
        EXPECT_LT(a[i], 255);
    }

    // Equal endpoints also take the six-value table.
    auto b = alpha_table(100, 100);
    EXPECT_EQ(b[6], 0);
    EXPECT_EQ(b[7], 255);
    EXPECT_EQ(b[3], 100);
}

TEST(Dxt, Dxt5BlockAlphaIndices) {
    std::array<uint8_t, 16> block{};
    block[0] = 255;
    block[1] = 0;
    // Texel i uses alpha code i % 8: 48 bits 0,1,2,...,7,0,1,...
    uint64_t bits = 0;
    for (uint64_t i = 0; i < 16; i++)
        bits |= (i % 8) << (i * 3);
    for (size_t i = 0; i < 6; i++)
        block[2 + i] = static_cast<uint8_t>(bits >> (8 * i));
    auto color = color_block(0xFFFF, 0x0000, 0);
    std::copy(color.begin(), color.end(), block.begin() + 8);

    auto texels = decode_dxt5_block(block.data());
    auto table = alpha_table(255, 0);
    for (size_t i = 0; i < 16; i++) {
        EXPECT_EQ(texels[i][3], table[i % 8]) << "texel " << i;
        EXPECT_EQ(texels[i][0], 255);
    }
}

TEST(Dxt, Dxt5ColorBlockIgnoresEndpointOrder) {
    std::array<uint8_t, 16> block{};
    block[0] = 255;
    block[1] = 255;
    auto color = color_block(0x0000, 0xFFFF, kAllCodes);
    std::copy(color.begin(), color.end(), block.begin() + 8);

    auto texels = decode_dxt5_block(block.data());
    // Four-color table even though c0 < c1: code 3 is not transparent black.
    EXPECT_EQ(texels[2], (Texel{85, 85, 85, 255}));
    EXPECT_EQ(texels[3], (Texel{170, 170, 170, 255}));
}

TEST(Dxt, Dxt3ExplicitAlpha) {
    std::array<uint8_t, 16> block{};
    block[0] = 0xF0; // texel 0 -> 0, texel 1 -> 255
    block[1] = 0x08; // texel 2 -> 136, texel 3 -> 0
    auto color = color_block(0xFFFF, 0x0000, 0);
    std::copy(color.begin(), color.end(), block.begin() + 8);

    auto texels = decode_dxt3_block(block.data());
    EXPECT_EQ(texels[0][3], 0);
    EXPECT_EQ(texels[1][3], 255);
    EXPECT_EQ(texels[2][3], 136);
    EXPECT_EQ(texels[3][3], 0);
}

TEST(Dxt, DecodeImageBlockLayout) {
    // 8x4 image: left block white, right block black.
    std::vector<uint8_t> data;
    auto left = color_block(0xFFFF, 0x0000, 0x00000000);
    auto right = color_block(0xFFFF, 0x0000, 0x55555555);
    data.insert(data.end(), left.begin(), left.end());
    data.insert(data.end(), right.begin(), right.end());

    auto px = decode_dxt1(data.data(), data.size(), 8, 4);
    ASSERT_EQ(px.size(), 8u * 4u * 4u);
    for (int y = 0; y < 4; y++) {
        size_t row = static_cast<size_t>(y) * 8 * 4;
        EXPECT_EQ(px[row + 3 * 4], 255) << "row " << y;
        EXPECT_EQ(px[row + 4 * 4], 0) << "row " << y;
    }
}

TEST(Dxt, DecodeSmallMipmapCropsBlock) {
    auto block = color_block(0xFFFF, 0x0000, 0xE4E4E4E4);
    auto px = decode_dxt1(block.data(), block.size(), 2, 1);
    ASSERT_EQ(px.size(), 8u);
    EXPECT_EQ(px[0], 255);
    EXPECT_EQ(px[4], 0);
}

TEST(Dxt, EncodedSize) {
    EXPECT_EQ(encoded_size(16, 16, 8), 128u);
    EXPECT_EQ(encoded_size(16, 16, 16), 256u);
    EXPECT_EQ(encoded_size(1, 1, 8), 8u);
    EXPECT_EQ(encoded_size(6, 2, 16), 32u);
}

TEST(Dxt, SizeMismatchThrows) {
    std::vector<uint8_t> data(8);
    EXPECT_THROW(decode_dxt1(data.data(), data.size(), 8, 4), paakit::DecodeError);
    EXPECT_THROW(decode_dxt5(data.data(), data.size(), 4, 4), paakit::DecodeError);
    std::vector<uint8_t> big(24);
    EXPECT_THROW(decode_dxt1(big.data(), big.size(), 4, 4), paakit::DecodeError);
}
