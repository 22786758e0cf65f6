#include "paakit/dxt.h"
#include "paakit/binutil.h"
#include "paakit/errors.h"

#include <format>

namespace paakit::dxt {

RGB expand565(uint16_t c) {
    auto r5 = static_cast<uint8_t>((c >> 11) & 0x1F);
    auto g6 = static_cast<uint8_t>((c >> 5) & 0x3F);
    auto b5 = static_cast<uint8_t>(c & 0x1F);
    return {static_cast<uint8_t>((r5 << 3) | (r5 >> 2)),
            static_cast<uint8_t>((g6 << 2) | (g6 >> 4)),
            static_cast<uint8_t>((b5 << 3) | (b5 >> 2))};
}

// Weighted average of two channels, rounded to nearest.
static uint8_t mix(uint32_t a, uint32_t wa, uint32_t b, uint32_t wb) {
    uint32_t d = wa + wb;
    return static_cast<uint8_t>((wa * a + wb * b + d / 2) / d);
}

static Texel mix(const RGB& x, uint32_t wx, const RGB& y, uint32_t wy) {
    return {mix(x.r, wx, y.r, wy), mix(x.g, wx, y.g, wy), mix(x.b, wx, y.b, wy), 255};
}

std::array<Texel, 4> color_table(uint16_t c0, uint16_t c1, bool opaque_only) {
    RGB e0 = expand565(c0), e1 = expand565(c1);

    std::array<Texel, 4> colors;
    colors[0] = {e0.r, e0.g, e0.b, 255};
    colors[1] = {e1.r, e1.g, e1.b, 255};
    if (opaque_only || c0 > c1) {
        colors[2] = mix(e0, 2, e1, 1);
        colors[3] = mix(e0, 1, e1, 2);
    } else {
        colors[2] = mix(e0, 1, e1, 1);
        colors[3] = {0, 0, 0, 0};
    }
    return colors;
}

std::array<uint8_t, 8> alpha_table(uint8_t a0, uint8_t a1) {
    std::array<uint8_t, 8> alphas;
    alphas[0] = a0;
    alphas[1] = a1;
    if (a0 > a1) {
        for (uint32_t i = 1; i <= 6; i++)
            alphas[i + 1] = mix(a0, 7 - i, a1, i);
    } else {
        for (uint32_t i = 1; i <= 4; i++)
            alphas[i + 1] = mix(a0, 5 - i, a1, i);
        alphas[6] = 0;
        alphas[7] = 255;
    }
    return alphas;
}

static Block color_block(const uint8_t* block, bool opaque_only) {
    auto colors = color_table(binutil::load_u16(block), binutil::load_u16(block + 2), opaque_only);
    uint32_t indices = binutil::load_u32(block + 4);
    Block texels;
    for (size_t i = 0; i < 16; i++)
        texels[i] = colors[(indices >> (i * 2)) & 3];
    return texels;
}

Block decode_dxt1_block(const uint8_t* block) {
    return color_block(block, false);
}

Block decode_dxt3_block(const uint8_t* block) {
    Block texels = color_block(block + 8, true);
    for (size_t i = 0; i < 16; i++) {
        uint8_t nibble = (i % 2 == 0) ? (block[i / 2] & 0x0F) : (block[i / 2] >> 4);
        texels[i][3] = static_cast<uint8_t>(nibble * 17);
    }
    return texels;
}

Block decode_dxt5_block(const uint8_t* block) {
    auto alphas = alpha_table(block[0], block[1]);
    uint64_t bits = binutil::load_u48(block + 2);
    Block texels = color_block(block + 8, true);
    for (size_t i = 0; i < 16; i++)
        texels[i][3] = alphas[(bits >> (i * 3)) & 7];
    return texels;
}

size_t encoded_size(int width, int height, size_t block_size) {
    auto bw = static_cast<size_t>((width + 3) / 4);
    auto bh = static_cast<size_t>((height + 3) / 4);
    return bw * bh * block_size;
}

using BlockFn = Block (*)(const uint8_t*);

static std::vector<uint8_t> decode_blocks(const char* name, const uint8_t* data, size_t data_len,
                                          int width, int height, size_t block_size,
                                          BlockFn decode_block) {
    if (width <= 0 || height <= 0)
        throw DecodeError(std::format("dxt: {} invalid dimensions {}x{}", name, width, height));
    size_t expected = encoded_size(width, height, block_size);
    if (data_len != expected)
        throw DecodeError(std::format("dxt: {} {}x{} needs {} bytes, got {}",
                                      name, width, height, expected, data_len));

    std::vector<uint8_t> out(static_cast<size_t>(width) * static_cast<size_t>(height) * 4);
    int bw = (width + 3) / 4, bh = (height + 3) / 4;
    for (int by = 0; by < bh; by++) {
        for (int bx = 0; bx < bw; bx++) {
            auto texels = decode_block(data + static_cast<size_t>(by * bw + bx) * block_size);
            for (int py = 0; py < 4; py++) {
                int y = by * 4 + py;
                if (y >= height) break;
                for (int px = 0; px < 4; px++) {
                    int x = bx * 4 + px;
                    if (x >= width) break;
                    const Texel& t = texels[static_cast<size_t>(py * 4 + px)];
                    size_t off = (static_cast<size_t>(y) * static_cast<size_t>(width) +
                                  static_cast<size_t>(x)) * 4;
                    out[off] = t[0]; out[off+1] = t[1]; out[off+2] = t[2]; out[off+3] = t[3];
                }
            }
        }
    }
    return out;
}

std::vector<uint8_t> decode_dxt1(const uint8_t* data, size_t data_len, int width, int height) {
    return decode_blocks("DXT1", data, data_len, width, height, 8, decode_dxt1_block);
}

std::vector<uint8_t> decode_dxt3(const uint8_t* data, size_t data_len, int width, int height) {
    return decode_blocks("DXT3", data, data_len, width, height, 16, decode_dxt3_block);
}

std::vector<uint8_t> decode_dxt5(const uint8_t* data, size_t data_len, int width, int height) {
    return decode_blocks("DXT5", data, data_len, width, height, 16, decode_dxt5_block);
}

} // namespace paakit::dxt
