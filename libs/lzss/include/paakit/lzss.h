#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace paakit::lzss {

// Checksum variant trailing the compressed stream.
enum class Checksum {
    Unsigned, // additive sum of output bytes
    Signed,   // additive sum of output bytes as int8 (PAA non-DXT mipmaps)
    None,
};

// decompress inflates exactly expected_size bytes from src and verifies the
// 4-byte trailing checksum unless checksum is None. Throws
// DecompressionError on input overrun or checksum mismatch.
std::vector<uint8_t> decompress(const uint8_t* src, size_t src_len, size_t expected_size,
                                Checksum checksum = Checksum::Unsigned);

// decompress_signed is the variant PAA uses for ARGB4444/ARGB1555/AI88/ARGB8888
// mipmaps whose stored size is below the decoded size.
inline std::vector<uint8_t> decompress_signed(const uint8_t* src, size_t src_len,
                                              size_t expected_size) {
    return decompress(src, src_len, expected_size, Checksum::Signed);
}

} // namespace paakit::lzss
