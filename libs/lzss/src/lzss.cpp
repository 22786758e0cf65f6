#include "paakit/lzss.h"
#include "paakit/binutil.h"
#include "paakit/errors.h"

#include <format>

namespace paakit::lzss {

std::vector<uint8_t> decompress(const uint8_t* src, size_t src_len, size_t expected_size,
                                Checksum checksum) {
    std::vector<uint8_t> out(expected_size);
    size_t out_pos = 0;
    size_t ip = 0;
    uint32_t sum = 0;
    uint32_t flags = 0;

    auto remaining = static_cast<int64_t>(expected_size);

    auto next_byte = [&]() -> uint8_t {
        if (ip >= src_len)
            throw DecompressionError(
                std::format("lzss: input overrun at offset {} ({} of {} bytes decoded)",
                            ip, out_pos, expected_size));
        return src[ip++];
    };

    auto emit = [&](uint8_t v) {
        if (checksum == Checksum::Signed)
            sum += static_cast<uint32_t>(static_cast<int8_t>(v));
        else
            sum += v;
        out[out_pos++] = v;
        remaining--;
    };

    while (remaining > 0) {
        flags >>= 1;
        if ((flags & 0x100) == 0)
            flags = static_cast<uint32_t>(next_byte()) | 0xff00;

        if ((flags & 0x01) != 0) {
            emit(next_byte());
            continue;
        }

        // 2-byte pointer: 12-bit rpos + 4-bit rlen
        uint8_t b1 = next_byte();
        uint8_t b2 = next_byte();

        auto rpos = static_cast<size_t>(b1) | (static_cast<size_t>(b2 & 0xf0) << 4);
        int rlen = (b2 & 0x0f) + 3;

        // Space fill when rpos reaches before the start of the output
        while (rpos > out_pos && rlen > 0 && remaining > 0) {
            emit(0x20);
            rlen--;
        }

        rpos = out_pos - rpos;
        for (; rlen > 0 && remaining > 0; rlen--)
            emit(out[rpos++]);
    }

    if (checksum == Checksum::None)
        return out;

    if (ip + 4 > src_len)
        throw DecompressionError("lzss: truncated data, missing trailing checksum bytes");
    uint32_t stored = binutil::load_u32(src + ip);
    if (stored != sum)
        throw DecompressionError(
            std::format("lzss: checksum mismatch: expected {:#010x}, got {:#010x}", stored, sum));

    return out;
}

} // namespace paakit::lzss
