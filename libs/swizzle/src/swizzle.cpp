#include "paakit/swizzle.h"
#include "paakit/errors.h"

#include <algorithm>
#include <format>

namespace paakit::swizzle {

static uint8_t pick(const uint8_t* px, const Selector& s) {
    uint8_t v = 0;
    switch (s.source) {
    case Source::Red:   v = px[0]; break;
    case Source::Green: v = px[1]; break;
    case Source::Blue:  v = px[2]; break;
    case Source::Alpha: v = px[3]; break;
    case Source::Zero:  v = 0; break;
    case Source::One:   v = 255; break;
    }
    return s.invert ? static_cast<uint8_t>(255 - v) : v;
}

std::vector<uint8_t> swizzle_channels(const std::vector<uint8_t>& rgba, const Selectors& sel) {
    if (rgba.size() % 4 != 0)
        throw DecodeError(std::format("swizzle: buffer length {} is not a multiple of 4", rgba.size()));
    if (sel.is_identity())
        return rgba;

    std::vector<uint8_t> out(rgba.size());
    for (size_t i = 0; i < rgba.size(); i += 4) {
        const uint8_t* px = rgba.data() + i;
        out[i]     = pick(px, sel.red);
        out[i + 1] = pick(px, sel.green);
        out[i + 2] = pick(px, sel.blue);
        out[i + 3] = pick(px, sel.alpha);
    }
    return out;
}

std::vector<uint8_t> reverse_row_order(const std::vector<uint8_t>& rgba, int width, int height) {
    if (width < 0 || height < 0)
        throw DecodeError(std::format("swizzle: invalid dimensions {}x{}", width, height));
    size_t stride = static_cast<size_t>(width) * 4;
    size_t rows = static_cast<size_t>(height);
    if (rgba.size() != stride * rows)
        throw DecodeError(std::format("swizzle: {}x{} image needs {} bytes, got {}",
                                      width, height, stride * rows, rgba.size()));

    std::vector<uint8_t> out(rgba.size());
    for (size_t y = 0; y < rows; y++) {
        auto src = rgba.begin() + static_cast<ptrdiff_t>(y * stride);
        std::copy(src, src + static_cast<ptrdiff_t>(stride),
                  out.begin() + static_cast<ptrdiff_t>((rows - 1 - y) * stride));
    }
    return out;
}

} // namespace paakit::swizzle
