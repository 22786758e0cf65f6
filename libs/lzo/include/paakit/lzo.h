#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace paakit::lzo {

// decompress inflates an LZO1X-1 stream held in src and returns exactly
// expected_size bytes. Throws DecompressionError on a corrupt stream, on
// input overrun, or when the stream ends before expected_size bytes are
// produced.
std::vector<uint8_t> decompress(const uint8_t* src, size_t src_len, size_t expected_size);

inline std::vector<uint8_t> decompress(const std::vector<uint8_t>& src, size_t expected_size) {
    return decompress(src.data(), src.size(), expected_size);
}

} // namespace paakit::lzo
