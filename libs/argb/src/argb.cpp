#include "paakit/argb.h"
#include "paakit/binutil.h"
#include "paakit/errors.h"

#include <algorithm>
#include <format>

namespace paakit::argb {

static uint8_t expand4(uint32_t v) { return static_cast<uint8_t>((v << 4) | v); }
static uint8_t expand5(uint32_t v) { return static_cast<uint8_t>((v << 3) | (v >> 2)); }

Texel argb8888_texel(uint32_t v) {
    return {static_cast<uint8_t>(v >> 16), static_cast<uint8_t>(v >> 8),
            static_cast<uint8_t>(v), static_cast<uint8_t>(v >> 24)};
}

Texel argb4444_texel(uint16_t v) {
    return {expand4((v >> 8) & 0xF), expand4((v >> 4) & 0xF),
            expand4(v & 0xF), expand4((v >> 12) & 0xF)};
}

Texel argb1555_texel(uint16_t v) {
    return {expand5((v >> 10) & 0x1F), expand5((v >> 5) & 0x1F),
            expand5(v & 0x1F), static_cast<uint8_t>((v & 0x8000) ? 255 : 0)};
}

Texel ai88_texel(uint16_t v) {
    auto i = static_cast<uint8_t>(v & 0xFF);
    return {i, i, i, static_cast<uint8_t>(v >> 8)};
}

static size_t checked_pixel_count(const char* name, size_t word_size, size_t data_len,
                                  int width, int height) {
    if (width <= 0 || height <= 0)
        throw DecodeError(std::format("argb: {} invalid dimensions {}x{}", name, width, height));
    size_t pixels = static_cast<size_t>(width) * static_cast<size_t>(height);
    if (data_len != pixels * word_size)
        throw DecodeError(
            std::format("argb: {} {}x{} needs {} bytes, got {}",
                        name, width, height, pixels * word_size, data_len));
    return pixels;
}

template <typename Word, typename Fn>
static std::vector<uint8_t> decode_words(const char* name, const uint8_t* data, size_t data_len,
                                         int width, int height, Fn texel) {
    size_t pixels = checked_pixel_count(name, sizeof(Word), data_len, width, height);
    std::vector<uint8_t> out(pixels * 4);
    for (size_t i = 0; i < pixels; i++) {
        const uint8_t* p = data + i * sizeof(Word);
        Texel t;
        if constexpr (sizeof(Word) == 4)
            t = texel(binutil::load_u32(p));
        else
            t = texel(binutil::load_u16(p));
        std::copy(t.begin(), t.end(), out.begin() + static_cast<ptrdiff_t>(i * 4));
    }
    return out;
}

std::vector<uint8_t> decode_argb8888(const uint8_t* data, size_t data_len, int width, int height) {
    return decode_words<uint32_t>("ARGB8888", data, data_len, width, height, argb8888_texel);
}

std::vector<uint8_t> decode_argb4444(const uint8_t* data, size_t data_len, int width, int height) {
    return decode_words<uint16_t>("ARGB4444", data, data_len, width, height, argb4444_texel);
}

std::vector<uint8_t> decode_argb1555(const uint8_t* data, size_t data_len, int width, int height) {
    return decode_words<uint16_t>("ARGB1555", data, data_len, width, height, argb1555_texel);
}

std::vector<uint8_t> decode_ai88(const uint8_t* data, size_t data_len, int width, int height) {
    return decode_words<uint16_t>("AI88", data, data_len, width, height, ai88_texel);
}

} // namespace paakit::argb
