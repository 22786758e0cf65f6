#pragma once

#include "paakit/swizzle.h"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <istream>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace paakit::paa {

// Pixel format code stored in the first two bytes of a PAA.
enum class Format : uint16_t {
    DXT1 = 0xFF01,
    DXT2 = 0xFF02,
    DXT3 = 0xFF03,
    DXT4 = 0xFF04,
    DXT5 = 0xFF05,
    ARGB4444 = 0x4444,
    ARGB1555 = 0x1555,
    AI88 = 0x8080,
    ARGB8888 = 0x8888,
};

// format_from_tag maps a stored format code to Format, or nullopt if unknown.
std::optional<Format> format_from_tag(uint16_t tag);

// format_name returns the upper-case name ("DXT1", "ARGB4444", ...).
std::string format_name(Format fmt);

bool is_dxt(Format fmt);

// expected_data_size is the decoded byte size of a width x height mipmap:
// the block span for DXT formats, width*height*word size otherwise.
size_t expected_data_size(Format fmt, int width, int height);

// RGBA pixel buffer (4 bytes per pixel, row-major, top-to-bottom).
struct Image {
    int width = 0;
    int height = 0;
    std::vector<uint8_t> pixels; // RGBA, size = width * height * 4

    void set(int x, int y, uint8_t r, uint8_t g, uint8_t b, uint8_t a) {
        size_t off = (static_cast<size_t>(y) * static_cast<size_t>(width) + static_cast<size_t>(x)) * 4;
        pixels[off] = r; pixels[off+1] = g; pixels[off+2] = b; pixels[off+3] = a;
    }

    void get(int x, int y, uint8_t& r, uint8_t& g, uint8_t& b, uint8_t& a) const {
        size_t off = (static_cast<size_t>(y) * static_cast<size_t>(width) + static_cast<size_t>(x)) * 4;
        r = pixels[off]; g = pixels[off+1]; b = pixels[off+2]; a = pixels[off+3];
    }
};

struct Color {
    uint8_t r = 0, g = 0, b = 0, a = 0;

    bool operator==(const Color&) const = default;
};

// --- TAGGs ---

// "CGVA": average color of the top level.
struct AverageColorTagg {
    Color color;
};

// "CXAM": per-channel maximum of the top level.
struct MaxColorTagg {
    Color color;
};

// "GALF": alpha interpretation hints. Unknown bits are kept.
struct FlagTagg {
    static constexpr uint32_t kInterpolatedAlpha = 1;
    static constexpr uint32_t kBinaryAlpha = 2;

    uint32_t flags = 0;

    bool interpolated_alpha() const { return (flags & kInterpolatedAlpha) != 0; }
    bool binary_alpha() const { return (flags & kBinaryAlpha) != 0; }
    bool uses_alpha() const { return flags != 0; }
};

// "ZIWS": channel remapping to apply after decoding.
struct SwizzleTagg {
    swizzle::Selectors selectors;
};

// "SFFO": file offsets of the mipmap records, zero slots dropped.
struct OffsetTagg {
    std::vector<uint32_t> offsets;
};

// Any other signature; the payload is kept verbatim.
struct UnknownTagg {
    std::vector<uint8_t> data;
};

using TaggPayload = std::variant<UnknownTagg, AverageColorTagg, MaxColorTagg,
                                 FlagTagg, SwizzleTagg, OffsetTagg>;

struct Tagg {
    std::string signature; // 4 characters following "GGAT", e.g. "CGVA"
    uint32_t length = 0;   // declared payload length
    TaggPayload payload;
};

// parse_tagg interprets a TAGG payload by signature. Unrecognized signatures
// yield UnknownTagg. A recognized signature with a malformed payload throws
// ChunkFormatError.
Tagg parse_tagg(const std::string& signature, const uint8_t* payload, size_t length);

// swizzle_selector decodes one packed swizzle command byte.
// Throws ChunkFormatError for values above 9.
swizzle::Selector swizzle_selector(uint8_t command);

// --- Mipmaps ---

struct Mipmap {
    int width = 0;
    int height = 0;
    bool lzo_compressed = false; // bit 15 of the stored width
    std::vector<uint8_t> data;   // encoded bytes as stored
    size_t offset = 0;           // byte offset of the record in the file

    // decode decompresses and decodes the level into RGBA.
    // Throws DecodeError or DecompressionError.
    Image decode(Format fmt) const;
};

// decode_mipmap decodes an already decompressed span of pixel data.
Image decode_mipmap(const uint8_t* data, size_t size, Format fmt, int width, int height);

// --- Files ---

struct File {
    Format format = Format::DXT1;
    std::vector<Tagg> taggs;
    std::vector<Mipmap> mipmaps; // level 0 first, sentinel excluded

    // get_tagg returns the first TAGG holding a T.
    template <typename T>
    std::optional<T> get_tagg() const {
        for (const auto& t : taggs) {
            if (const auto* p = std::get_if<T>(&t.payload))
                return *p;
        }
        return std::nullopt;
    }

    // find_unknown returns the first unrecognized TAGG with the given signature.
    std::optional<UnknownTagg> find_unknown(const std::string& signature) const;

    // has_alpha reports a Flag TAGG with a non-zero mask.
    bool has_alpha() const;
};

struct Header {
    Format format = Format::DXT1;
    std::vector<Tagg> taggs;
    int width = 0;  // first mipmap
    int height = 0;
};

// read parses a whole PAA. Throws ContainerFormatError or ChunkFormatError.
File read(const uint8_t* data, size_t size);
File read(std::istream& r);
File read_file(const std::filesystem::path& path);

// read_header parses the format, the TAGGs and the first mipmap's dimensions
// without reading any mipmap payload.
Header read_header(const uint8_t* data, size_t size);
Header read_header(std::istream& r);

// read_mipmap_at parses the single mipmap record starting at offset, as
// listed by an OffsetTagg.
Mipmap read_mipmap_at(const uint8_t* data, size_t size, size_t offset);

struct DecodeOptions {
    bool apply_swizzle = true; // apply the file's SwizzleTagg
    bool flip_rows = false;    // bottom row first
};

// decode_level decodes mipmap `level` of file and post-processes it.
// Throws DecodeError for a level past the end of the chain.
Image decode_level(const File& file, size_t level, const DecodeOptions& opts = {});

// decode reads a PAA and decodes its first mipmap with the file's swizzle applied.
std::pair<Image, Header> decode(std::istream& r);

} // namespace paakit::paa
