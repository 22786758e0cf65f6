#include "paakit/lzss.h"
#include "paakit/errors.h"

#include <gtest/gtest.h>

#include <string>

using namespace paakit::lzss;

namespace {

void append_u32(std::vector<uint8_t>& v, uint32_t x) {
    for (int i = 0; i < 4; i++)
        v.push_back(static_cast<uint8_t>(x >> (8 * i)));
}

std::string as_string(const std::vector<uint8_t>& v) { return {v.begin(), v.end()}; }

} // namespace

TEST(Lzss, LiteralsAndBackReference) {
    // Three literals, then a pointer 3 bytes back with length 6.
    std::vector<uint8_t> src = {0x07, 'A', 'B', 'C', 0x03, 0x03};
    append_u32(src, (65 + 66 + 67) * 3);

    auto got = decompress(src.data(), src.size(), 9);
    EXPECT_EQ(as_string(got), "ABCABCABC");
}

TEST(Lzss, SpaceFillBeforeStart) {
    // rpos beyond the produced output is filled with spaces.
    std::vector<uint8_t> src = {0x00, 0x05, 0x00};
    append_u32(src, 3 * 0x20);

    auto got = decompress(src.data(), src.size(), 3);
    EXPECT_EQ(as_string(got), "   ");
}

TEST(Lzss, SignedChecksum) {
    std::vector<uint8_t> src = {0x03, 0xFF, 0x80};
    append_u32(src, static_cast<uint32_t>(-1 - 128));

    auto got = decompress_signed(src.data(), src.size(), 2);
    EXPECT_EQ(got, (std::vector<uint8_t>{0xFF, 0x80}));

    // The unsigned variant disagrees with the stored sum.
    EXPECT_THROW(decompress(src.data(), src.size(), 2, Checksum::Unsigned),
                 paakit::DecompressionError);
}

TEST(Lzss, NoChecksum) {
    std::vector<uint8_t> src = {0x03, 'h', 'i'};
    auto got = decompress(src.data(), src.size(), 2, Checksum::None);
    EXPECT_EQ(as_string(got), "hi");
}

TEST(Lzss, ChecksumMismatchThrows) {
    std::vector<uint8_t> src = {0x03, 'h', 'i'};
    append_u32(src, 0xDEADBEEF);
    EXPECT_THROW(decompress(src.data(), src.size(), 2), paakit::DecompressionError);
}

TEST(Lzss, MissingChecksumThrows) {
    std::vector<uint8_t> src = {0x03, 'h', 'i', 0x00};
    EXPECT_THROW(decompress(src.data(), src.size(), 2), paakit::DecompressionError);
}

TEST(Lzss, InputOverrunThrows) {
    std::vector<uint8_t> src = {0xFF, 'a', 'b'};
    EXPECT_THROW(decompress(src.data(), src.size(), 8), paakit::DecompressionError);
}

TEST(Lzss, ZeroSize) {
    std::vector<uint8_t> src;
    append_u32(src, 0);
    EXPECT_TRUE(decompress(src.data(), src.size(), 0).empty());
}
