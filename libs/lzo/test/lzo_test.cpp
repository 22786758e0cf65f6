#include "paakit/lzo.h"
#include "paakit/errors.h"

#include <gtest/gtest.h>

#include <string>

using namespace paakit::lzo;

TEST(Lzo, DecompressPureLiterals) {
    // Tag 1 copies 4 literals, then an M4 tag with a zero distance ends the stream.
    std::vector<uint8_t> compressed = {
        0x01,                 // t=1 -> copy 4 literals
        'A', 'B', 'C', 'D',
        0x11,                 // M4 tag
        0x00, 0x00,           // end-of-stream marker
    };

    auto got = decompress(compressed, 4);
    ASSERT_EQ(got.size(), 4u);
    EXPECT_EQ(std::string(got.begin(), got.end()), "ABCD");
}

TEST(Lzo, DecompressLiteralAndM3Match) {
    // Produce "ABCDAABC" (8 bytes)
    std::vector<uint8_t> compressed = {
        0x02,                         // t=2 -> 5 literals
        'A', 'B', 'C', 'D', 'A',
        33,                           // M3 tag (32|1), length 3
        16, 0,                        // distance 5
        0x11,                         // M4 tag
        0x00, 0x00,                   // end-of-stream marker
    };

    auto got = decompress(compressed, 8);
    ASSERT_EQ(got.size(), 8u);
    EXPECT_EQ(std::string(got.begin(), got.end()), "ABCDAABC");
}

TEST(Lzo, DecompressM2Match) {
    // Produce "ABCAABC" (7 bytes)
    std::vector<uint8_t> compressed = {
        0x01,                 // t=1 -> 4 literals
        'A', 'B', 'C', 'A',
        0x4C,                 // M2 tag, length 3
        0x00,                 // distance high bits
        0x11,                 // M4 tag
        0x00, 0x00,           // end-of-stream marker
    };

    auto got = decompress(compressed, 7);
    ASSERT_EQ(got.size(), 7u);
    EXPECT_EQ(std::string(got.begin(), got.end()), "ABCAABC");
}

TEST(Lzo, LongFirstLiteralRun) {
    // A first byte above 17 encodes a literal run of (byte - 17).
    std::vector<uint8_t> compressed = {
        17 + 5,
        'h', 'e', 'l', 'l', 'o',
        0x11, 0x00, 0x00,
    };

    auto got = decompress(compressed, 5);
    EXPECT_EQ(std::string(got.begin(), got.end()), "hello");
}

TEST(Lzo, EmptyInputThrows) {
    std::vector<uint8_t> empty;
    EXPECT_THROW(decompress(empty, 4), paakit::DecompressionError);
}

TEST(Lzo, TruncatedInputThrows) {
    std::vector<uint8_t> compressed = {0x01, 'A', 'B'};
    EXPECT_THROW(decompress(compressed, 4), paakit::DecompressionError);
}

TEST(Lzo, OutputUnderrunThrows) {
    // Stream ends after 4 bytes while 8 were expected.
    std::vector<uint8_t> compressed = {0x01, 'A', 'B', 'C', 'D', 0x11, 0x00, 0x00};
    EXPECT_THROW(decompress(compressed, 8), paakit::DecompressionError);
}

TEST(Lzo, OutputOverrunThrows) {
    std::vector<uint8_t> compressed = {0x01, 'A', 'B', 'C', 'D', 0x11, 0x00, 0x00};
    EXPECT_THROW(decompress(compressed, 2), paakit::DecompressionError);
}

TEST(Lzo, LookbehindOverrunThrows) {
    // M3 distance reaches before the start of the output.
    std::vector<uint8_t> compressed = {
        0x01, 'A', 'B', 'C', 'D',
        33, 0xFC, 0x00,
        0x11, 0x00, 0x00,
    };
    EXPECT_THROW(decompress(compressed, 16), paakit::DecompressionError);
}

TEST(Lzo, EndMarkerWithWrongLengthThrows) {
    // 0x12 is an M4 tag of length 4 with a zero distance, not the end marker.
    std::vector<uint8_t> compressed = {0x15, 1, 2, 3, 4, 0x12, 0x00, 0x00};
    EXPECT_THROW(decompress(compressed, 4), paakit::DecompressionError);
}
