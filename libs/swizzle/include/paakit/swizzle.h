#pragma once

#include <cstdint>
#include <vector>

namespace paakit::swizzle {

// Source of one output channel.
enum class Source : uint8_t {
    Red,
    Green,
    Blue,
    Alpha,
    Zero, // constant 0
    One,  // constant 255
};

struct Selector {
    Source source = Source::Red;
    bool invert = false; // 255 - v

    bool operator==(const Selector&) const = default;
};

// Selectors holds one selector per output channel.
struct Selectors {
    Selector red{Source::Red, false};
    Selector green{Source::Green, false};
    Selector blue{Source::Blue, false};
    Selector alpha{Source::Alpha, false};

    bool operator==(const Selectors&) const = default;

    bool is_identity() const { return *this == Selectors{}; }
};

// swizzle_channels remaps every RGBA pixel of rgba. The output has the same
// length as the input. Throws DecodeError if the length is not a multiple of 4.
std::vector<uint8_t> swizzle_channels(const std::vector<uint8_t>& rgba, const Selectors& sel);

// reverse_row_order returns rgba with its scanlines in reverse order.
// rgba.size() must equal width * height * 4, otherwise DecodeError.
std::vector<uint8_t> reverse_row_order(const std::vector<uint8_t>& rgba, int width, int height);

} // namespace paakit::swizzle
