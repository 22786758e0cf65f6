#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace paakit::argb {

using Texel = std::array<uint8_t, 4>; // R, G, B, A

// --- Single pixel words ---
// Each word is read little-endian; layouts are listed from the most
// significant bit.

// A8 R8 G8 B8
Texel argb8888_texel(uint32_t v);
// A4 R4 G4 B4, nibble v expands to (v << 4) | v
Texel argb4444_texel(uint16_t v);
// A1 R5 G5 B5, alpha bit expands to 0/255, 5-bit channels by bit replication
Texel argb1555_texel(uint16_t v);
// A8 I8, greyscale with alpha
Texel ai88_texel(uint16_t v);

// --- Whole mipmaps ---
// Decode width*height words in row-major order into an RGBA buffer of
// width*height*4 bytes. data_len must equal width*height*word size exactly,
// otherwise DecodeError is thrown.

std::vector<uint8_t> decode_argb8888(const uint8_t* data, size_t data_len, int width, int height);
std::vector<uint8_t> decode_argb4444(const uint8_t* data, size_t data_len, int width, int height);
std::vector<uint8_t> decode_argb1555(const uint8_t* data, size_t data_len, int width, int height);
std::vector<uint8_t> decode_ai88(const uint8_t* data, size_t data_len, int width, int height);

} // namespace paakit::argb
