#include "paakit/paa.h"
#include "paakit/argb.h"
#include "paakit/binutil.h"
#include "paakit/dxt.h"
#include "paakit/errors.h"
#include "paakit/lzo.h"
#include "paakit/lzss.h"

#include <algorithm>
#include <format>
#include <fstream>

namespace paakit::paa {

// --- Format mapping ---

std::optional<Format> format_from_tag(uint16_t tag) {
    switch (tag) {
        case 0xFF01: return Format::DXT1;
        case 0xFF02: return Format::DXT2;
        case 0xFF03: return Format::DXT3;
        case 0xFF04: return Format::DXT4;
        case 0xFF05: return Format::DXT5;
        case 0x4444: return Format::ARGB4444;
        case 0x1555: return Format::ARGB1555;
        case 0x8080: return Format::AI88;
        case 0x8888: return Format::ARGB8888;
        default: return std::nullopt;
    }
}

std::string format_name(Format fmt) {
    switch (fmt) {
        case Format::DXT1: return "DXT1";
        case Format::DXT2: return "DXT2";
        case Format::DXT3: return "DXT3";
        case Format::DXT4: return "DXT4";
        case Format::DXT5: return "DXT5";
        case Format::ARGB4444: return "ARGB4444";
        case Format::ARGB1555: return "ARGB1555";
        case Format::AI88: return "AI88";
        case Format::ARGB8888: return "ARGB8888";
    }
    return std::format("0x{:04X}", static_cast<uint16_t>(fmt));
}

bool is_dxt(Format fmt) {
    switch (fmt) {
        case Format::DXT1: case Format::DXT2: case Format::DXT3:
        case Format::DXT4: case Format::DXT5:
            return true;
        default:
            return false;
    }
}

size_t expected_data_size(Format fmt, int width, int height) {
    if (width <= 0 || height <= 0) return 0;
    size_t pixels = static_cast<size_t>(width) * static_cast<size_t>(height);
    switch (fmt) {
        case Format::DXT1: return dxt::encoded_size(width, height, 8);
        case Format::DXT2: case Format::DXT3:
        case Format::DXT4: case Format::DXT5:
            return dxt::encoded_size(width, height, 16);
        case Format::ARGB4444: case Format::ARGB1555: case Format::AI88:
            return pixels * 2;
        case Format::ARGB8888:
            return pixels * 4;
    }
    return 0;
}

// --- Container parsing ---

static Format read_format(binutil::ByteReader& r) {
    uint16_t tag = r.read_u16();
    auto fmt = format_from_tag(tag);
    if (!fmt)
        throw ContainerFormatError(std::format("paa: unknown format code 0x{:04X}", tag));
    return *fmt;
}

// TAGGs run until the next four bytes are not "GGAT".
static std::vector<Tagg> read_taggs(binutil::ByteReader& r) {
    std::vector<Tagg> taggs;
    while (r.peek_matches("GGAT", 4)) {
        size_t start = r.pos();
        r.skip(4);
        std::string sig = r.read_signature();
        uint32_t len = r.read_u32();
        if (len > r.remaining())
            throw ContainerFormatError(
                std::format("paa: TAGG {} at offset {} declares {} bytes, only {} left",
                            sig, start, len, r.remaining()));
        taggs.push_back(parse_tagg(sig, r.current(), len));
        r.skip(len);
    }
    return taggs;
}

static void skip_palette(binutil::ByteReader& r) {
    uint16_t n_palette = r.read_u16();
    // Palette entries are BGR triplets (3 bytes each)
    if (n_palette > 0) r.skip(static_cast<size_t>(n_palette) * 3);
}

struct RecordHeader {
    size_t offset = 0;
    int width = 0;
    int height = 0;
    bool lzo_compressed = false;
    bool sentinel = false;
};

static RecordHeader read_record_header(binutil::ByteReader& r) {
    RecordHeader h;
    h.offset = r.pos();
    uint16_t width_raw = r.read_u16();
    uint16_t height_raw = r.read_u16();
    if (width_raw == 0 && height_raw == 0) {
        h.sentinel = true;
        return h;
    }

    h.lzo_compressed = (width_raw & 0x8000) != 0;
    h.width = width_raw & 0x7FFF;
    h.height = height_raw;
    if (h.width == 0 || h.height == 0)
        throw ContainerFormatError(std::format("paa: mipmap at offset {} has invalid dimensions {}x{}",
                                               h.offset, h.width, h.height));
    return h;
}

// Returns nullopt at the sentinel.
static std::optional<Mipmap> read_mipmap(binutil::ByteReader& r) {
    RecordHeader h = read_record_header(r);
    if (h.sentinel) return std::nullopt;

    uint32_t len = r.read_u24();
    if (len > r.remaining())
        throw ContainerFormatError(
            std::format("paa: mipmap {}x{} at offset {} declares {} bytes, only {} left",
                        h.width, h.height, h.offset, len, r.remaining()));

    Mipmap m;
    m.width = h.width;
    m.height = h.height;
    m.lzo_compressed = h.lzo_compressed;
    m.offset = h.offset;
    m.data = r.read_bytes(len);
    return m;
}

static void check_chain(const std::vector<Mipmap>& mips) {
    if (mips.empty()) return;
    int w0 = mips[0].width, h0 = mips[0].height;
    for (size_t i = 1; i < mips.size(); i++) {
        int shift = static_cast<int>(std::min<size_t>(i, 15));
        int ew = std::max(1, w0 >> shift), eh = std::max(1, h0 >> shift);
        if (mips[i].width != ew || mips[i].height != eh)
            throw ContainerFormatError(
                std::format("paa: mipmap {} is {}x{}, expected {}x{} for a {}x{} chain",
                            i, mips[i].width, mips[i].height, ew, eh, w0, h0));
    }
}

File read(const uint8_t* data, size_t size) {
    binutil::ByteReader r(data, size);

    File file;
    file.format = read_format(r);
    file.taggs = read_taggs(r);
    skip_palette(r);

    while (auto mip = read_mipmap(r))
        file.mipmaps.push_back(std::move(*mip));
    check_chain(file.mipmaps);

    // Optional trailing terminator
    if (!r.at_end()) {
        if (r.remaining() < 2)
            throw ContainerFormatError("paa: truncated terminator after mipmap sentinel");
        uint16_t term = r.read_u16();
        if (term != 0)
            throw ContainerFormatError(std::format("paa: invalid terminator 0x{:04X}", term));
    }
    return file;
}

File read(std::istream& r) {
    auto data = binutil::read_all(r);
    return read(data.data(), data.size());
}

File read_file(const std::filesystem::path& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f)
        throw Error(std::format("paa: cannot open {}", path.string()));
    return read(f);
}

Header read_header(const uint8_t* data, size_t size) {
    binutil::ByteReader r(data, size);

    Header hdr;
    hdr.format = read_format(r);
    hdr.taggs = read_taggs(r);
    skip_palette(r);

    RecordHeader first = read_record_header(r);
    hdr.width = first.width;
    hdr.height = first.height;
    return hdr;
}

Header read_header(std::istream& r) {
    auto data = binutil::read_all(r);
    return read_header(data.data(), data.size());
}

Mipmap read_mipmap_at(const uint8_t* data, size_t size, size_t offset) {
    binutil::ByteReader r(data, size);
    r.seek(offset);
    auto mip = read_mipmap(r);
    if (!mip)
        throw ContainerFormatError(std::format("paa: no mipmap at offset {}, found sentinel", offset));
    return std::move(*mip);
}

// --- Decoding ---

Image decode_mipmap(const uint8_t* data, size_t size, Format fmt, int width, int height) {
    Image img;
    img.width = width;
    img.height = height;

    switch (fmt) {
        case Format::DXT1: img.pixels = dxt::decode_dxt1(data, size, width, height); break;
        case Format::DXT2:
        case Format::DXT3: img.pixels = dxt::decode_dxt3(data, size, width, height); break;
        case Format::DXT4:
        case Format::DXT5: img.pixels = dxt::decode_dxt5(data, size, width, height); break;
        case Format::ARGB4444: img.pixels = argb::decode_argb4444(data, size, width, height); break;
        case Format::ARGB1555: img.pixels = argb::decode_argb1555(data, size, width, height); break;
        case Format::AI88: img.pixels = argb::decode_ai88(data, size, width, height); break;
        case Format::ARGB8888: img.pixels = argb::decode_argb8888(data, size, width, height); break;
        default:
            throw DecodeError(std::format("paa: unsupported format {}", format_name(fmt)));
    }
    return img;
}

Image Mipmap::decode(Format fmt) const {
    size_t expected = expected_data_size(fmt, width, height);

    // LZO when bit 15 of the width is set
    if (lzo_compressed) {
        auto raw = lzo::decompress(data, expected);
        return decode_mipmap(raw.data(), raw.size(), fmt, width, height);
    }

    // Non-DXT levels smaller than their decoded size are LZSS with a signed checksum.
    if (!is_dxt(fmt) && data.size() < expected) {
        auto raw = lzss::decompress_signed(data.data(), data.size(), expected);
        return decode_mipmap(raw.data(), raw.size(), fmt, width, height);
    }

    return decode_mipmap(data.data(), data.size(), fmt, width, height);
}

Image decode_level(const File& file, size_t level, const DecodeOptions& opts) {
    if (level >= file.mipmaps.size())
        throw DecodeError(std::format("paa: mipmap level {} out of range ({} levels)",
                                      level, file.mipmaps.size()));

    Image img = file.mipmaps[level].decode(file.format);
    if (opts.apply_swizzle) {
        if (auto sw = file.get_tagg<SwizzleTagg>(); sw && !sw->selectors.is_identity())
            img.pixels = swizzle::swizzle_channels(img.pixels, sw->selectors);
    }
    if (opts.flip_rows)
        img.pixels = swizzle::reverse_row_order(img.pixels, img.width, img.height);
    return img;
}

std::pair<Image, Header> decode(std::istream& r) {
    File file = read(r);
    Image img = decode_level(file, 0);

    Header hdr;
    hdr.format = file.format;
    hdr.width = img.width;
    hdr.height = img.height;
    hdr.taggs = std::move(file.taggs);
    return {std::move(img), std::move(hdr)};
}

} // namespace paakit::paa
