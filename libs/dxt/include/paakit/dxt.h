#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace paakit::dxt {

using Texel = std::array<uint8_t, 4>; // R, G, B, A
using Block = std::array<Texel, 16>;  // 4x4 texels, row-major

struct RGB { uint8_t r, g, b; };

// expand565 unpacks a 5:6:5 color, replicating the high bits into the low
// bits so that full-scale values reach 255.
RGB expand565(uint16_t c);

// color_table builds the four-entry palette of a DXT color block. With
// opaque_only set (DXT3/DXT5) the four-color table is used regardless of
// endpoint order; otherwise c0 <= c1 selects the three-color table with a
// transparent black fourth entry. Interpolation rounds to nearest.
std::array<Texel, 4> color_table(uint16_t c0, uint16_t c1, bool opaque_only);

// alpha_table builds the eight-entry DXT5 alpha palette. Codes 0 and 1 are
// the endpoints. With a0 > a1 codes 2..7 interpolate in sevenths; otherwise
// codes 2..5 interpolate in fifths and codes 6, 7 are 0 and 255.
std::array<uint8_t, 8> alpha_table(uint8_t a0, uint8_t a1);

// --- Single blocks ---

// DXT1: 8 bytes
Block decode_dxt1_block(const uint8_t* block);
// DXT3: 8 bytes of 4-bit explicit alpha + 8-byte color block
Block decode_dxt3_block(const uint8_t* block);
// DXT5: 8-byte interpolated alpha block + 8-byte color block
Block decode_dxt5_block(const uint8_t* block);

// encoded_size returns the byte size of a width x height image made of
// ceil(width/4) x ceil(height/4) blocks.
size_t encoded_size(int width, int height, size_t block_size);

// --- Whole mipmaps ---
// Decode row-major blocks into a width*height*4 RGBA buffer, top row first.
// Texels of edge blocks that fall outside the image are dropped.
// data_len must equal encoded_size() exactly, otherwise DecodeError is thrown.

std::vector<uint8_t> decode_dxt1(const uint8_t* data, size_t data_len, int width, int height);
std::vector<uint8_t> decode_dxt3(const uint8_t* data, size_t data_len, int width, int height);
std::vector<uint8_t> decode_dxt5(const uint8_t* data, size_t data_len, int width, int height);

} // namespace paakit::dxt
