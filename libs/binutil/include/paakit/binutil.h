#pragma once

#include "paakit/errors.h"

#include <bit>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <format>
#include <istream>
#include <iterator>
#include <string>
#include <vector>

namespace paakit::binutil {

// Assumes little-endian (x86/x64). Fail at compile time otherwise.
static_assert(std::endian::native == std::endian::little,
              "paakit requires a little-endian platform");

// Little-endian loads from raw memory. Callers guarantee the bytes exist.
inline uint16_t load_u16(const uint8_t* p) { uint16_t v; std::memcpy(&v, p, 2); return v; }
inline uint32_t load_u32(const uint8_t* p) { uint32_t v; std::memcpy(&v, p, 4); return v; }

inline uint32_t load_u24(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16);
}

inline uint64_t load_u48(const uint8_t* p) {
    uint64_t v = 0;
    for (int i = 5; i >= 0; i--)
        v = (v << 8) | p[i];
    return v;
}

// ByteReader is a bounds-checked cursor over an in-memory buffer. Every read
// that would run past the end throws ContainerFormatError; nothing is read
// partially.
class ByteReader {
public:
    ByteReader(const uint8_t* data, size_t size) : data_(data), size_(size) {}

    size_t pos() const { return pos_; }
    size_t size() const { return size_; }
    size_t remaining() const { return size_ - pos_; }
    bool at_end() const { return pos_ >= size_; }

    void seek(size_t pos) {
        if (pos > size_)
            throw ContainerFormatError(
                std::format("binutil: seek to {} past end of data ({} bytes)", pos, size_));
        pos_ = pos;
    }

    // peek_matches reports whether the next bytes equal tag, without consuming.
    bool peek_matches(const char* tag, size_t n) const {
        return remaining() >= n && std::memcmp(data_ + pos_, tag, n) == 0;
    }

    const uint8_t* current() const { return data_ + pos_; }

    uint16_t read_u16() {
        require(2, "u16");
        uint16_t v = load_u16(data_ + pos_);
        pos_ += 2;
        return v;
    }

    uint32_t read_u24() {
        require(3, "u24");
        uint32_t v = load_u24(data_ + pos_);
        pos_ += 3;
        return v;
    }

    uint32_t read_u32() {
        require(4, "u32");
        uint32_t v = load_u32(data_ + pos_);
        pos_ += 4;
        return v;
    }

    std::string read_signature() {
        require(4, "signature");
        std::string s(reinterpret_cast<const char*>(data_ + pos_), 4);
        pos_ += 4;
        return s;
    }

    std::vector<uint8_t> read_bytes(size_t n) {
        require(n, "bytes");
        std::vector<uint8_t> out(data_ + pos_, data_ + pos_ + n);
        pos_ += n;
        return out;
    }

    void skip(size_t n) {
        require(n, "skip");
        pos_ += n;
    }

private:
    void require(size_t n, const char* what) const {
        if (n > remaining())
            throw ContainerFormatError(
                std::format("binutil: unexpected end of data reading {} ({} bytes at offset {}, {} left)",
                            what, n, pos_, remaining()));
    }

    const uint8_t* data_;
    size_t size_;
    size_t pos_ = 0;
};

// read_all slurps the rest of a stream into memory.
inline std::vector<uint8_t> read_all(std::istream& r) {
    std::vector<uint8_t> out{std::istreambuf_iterator<char>(r), std::istreambuf_iterator<char>()};
    if (r.bad())
        throw ContainerFormatError("binutil: stream read failed");
    return out;
}

} // namespace paakit::binutil
