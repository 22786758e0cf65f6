#include "paakit/lzo.h"
#include "paakit/errors.h"

#include <format>

namespace paakit::lzo {

static constexpr size_t m2_max_offset = 0x0800;

namespace {

// Decoder walks the LZO1X instruction stream. Tags are dispatched by range:
// >= 64 M2, >= 32 M3, >= 16 M4 (or end of stream), otherwise short M1.
class Decoder {
public:
    Decoder(const uint8_t* src, size_t src_len, size_t expected_size)
        : src_(src), src_len_(src_len), out_(expected_size), size_(expected_size) {}

    std::vector<uint8_t> run();

private:
    const uint8_t* src_;
    size_t src_len_;
    size_t ip_ = 0;
    std::vector<uint8_t> out_;
    size_t op_ = 0;
    size_t size_;

    uint8_t read() {
        if (ip_ >= src_len_)
            throw DecompressionError(
                std::format("lzo: input overrun at offset {} (input={} bytes)", ip_, src_len_));
        return src_[ip_++];
    }

    uint8_t peek_at(size_t offset) const {
        if (ip_ + offset >= src_len_)
            throw DecompressionError(
                std::format("lzo: input overrun peeking offset {} (input={} bytes)",
                            ip_ + offset, src_len_));
        return src_[ip_ + offset];
    }

    // The two low bits of the byte two positions back carry the trailing
    // literal count of the previous match.
    uint8_t ip_minus_2() const { return src_[ip_ - 2]; }

    size_t remaining() const { return size_ - op_; }

    void copy_literals(size_t n) {
        if (remaining() < n)
            throw DecompressionError(
                std::format("lzo: output overrun copying {} literals (remaining={})",
                            n, remaining()));
        if (src_len_ - ip_ < n)
            throw DecompressionError(
                std::format("lzo: input overrun copying {} literals", n));
        for (size_t i = 0; i < n; i++)
            out_[op_++] = src_[ip_++];
    }

    void copy_back(size_t m_pos, size_t length) {
        if (m_pos >= op_)
            throw DecompressionError(
                std::format("lzo: lookbehind overrun (mPos={}, op={})", m_pos, op_));
        if (remaining() < length)
            throw DecompressionError(
                std::format("lzo: output overrun in copyBack (need={}, remaining={})",
                            length, remaining()));
        for (size_t i = 0; i < length; i++)
            out_[op_++] = out_[m_pos++];
    }

    size_t read_run_length(size_t step) {
        size_t t = 0;
        while (peek_at(0) == 0) {
            read();
            t += step;
        }
        return t + read();
    }

    size_t match_done();
    size_t b3_inline();
    size_t m2(size_t t);
    size_t m3(size_t t);
    bool m4(size_t t, size_t& next);
    size_t short_m1(size_t t);
    std::vector<uint8_t> b5_then_loop(size_t t);
    std::vector<uint8_t> match_loop(size_t t);
};

size_t Decoder::match_done() {
    size_t t = ip_minus_2() & 3;
    if (t == 0) return b3_inline();

    copy_literals(t);
    return read();
}

size_t Decoder::b3_inline() {
    size_t t = read();
    if (t >= 16) return t;

    if (t == 0) t = 15 + read_run_length(255);
    copy_literals(t + 3);

    size_t tag = read();
    if (tag >= 16) return tag;

    // M1 match directly after a literal run reaches past the M2 window.
    size_t m_pos = op_ - (1 + m2_max_offset);
    m_pos -= tag >> 2;
    m_pos -= static_cast<size_t>(read()) << 2;
    copy_back(m_pos, 3);
    return match_done();
}

size_t Decoder::m2(size_t t) {
    size_t m_pos = op_ - 1;
    m_pos -= (t >> 2) & 7;
    m_pos -= static_cast<size_t>(read()) << 3;
    copy_back(m_pos, (t >> 5) + 1);
    return match_done();
}

size_t Decoder::m3(size_t t) {
    t &= 31;
    if (t == 0) t = 31 + read_run_length(255);

    uint8_t b0 = peek_at(0);
    uint8_t b1 = peek_at(1);
    size_t m_pos = op_ - 1 - ((b0 >> 2) + (static_cast<size_t>(b1) << 6));
    ip_ += 2;
    copy_back(m_pos, t + 2);
    return match_done();
}

// m4 returns true at the end-of-stream marker.
bool Decoder::m4(size_t t, size_t& next) {
    size_t m_pos = op_;
    m_pos -= (t & 8) << 11;

    t &= 7;
    if (t == 0) t = 7 + read_run_length(255);

    uint8_t b0 = peek_at(0);
    uint8_t b1 = peek_at(1);
    m_pos -= (b0 >> 2) + (static_cast<size_t>(b1) << 6);
    ip_ += 2;

    if (m_pos == op_) {
        if (t + 2 != 3)
            throw DecompressionError(
                std::format("lzo: invalid end of stream (match length {})", t + 2));
        if (op_ != size_)
            throw DecompressionError(
                std::format("lzo: output underrun (op={}, expected={})", op_, size_));
        return true;
    }
    m_pos -= 0x4000;
    copy_back(m_pos, t + 2);
    next = match_done();
    return false;
}

size_t Decoder::short_m1(size_t t) {
    size_t m_pos = op_ - 1;
    m_pos -= t >> 2;
    m_pos -= static_cast<size_t>(read()) << 2;
    copy_back(m_pos, 2);
    return match_done();
}

std::vector<uint8_t> Decoder::b5_then_loop(size_t t) {
    size_t m_pos = op_ - (1 + m2_max_offset);
    m_pos -= t >> 2;
    m_pos -= static_cast<size_t>(read()) << 2;
    copy_back(m_pos, 3);
    return match_loop(match_done());
}

std::vector<uint8_t> Decoder::match_loop(size_t t) {
    for (;;) {
        if (t >= 64) {
            t = m2(t);
        } else if (t >= 32) {
            t = m3(t);
        } else if (t >= 16) {
            size_t next = 0;
            if (m4(t, next)) return std::move(out_);
            t = next;
        } else {
            t = short_m1(t);
        }
    }
}

std::vector<uint8_t> Decoder::run() {
    uint8_t first = peek_at(0);

    if (first > 17) {
        size_t t = read() - 17u;
        copy_literals(t);
        size_t tag = read();
        if (t < 4 || tag >= 16) return match_loop(tag);
        return b5_then_loop(tag);
    }

    size_t t = read();
    if (t >= 16) return match_loop(t);

    if (t == 0) t = 15 + read_run_length(255);
    copy_literals(t + 3);

    size_t tag = read();
    if (tag >= 16) return match_loop(tag);
    return b5_then_loop(tag);
}

} // namespace

std::vector<uint8_t> decompress(const uint8_t* src, size_t src_len, size_t expected_size) {
    if (src_len == 0)
        throw DecompressionError("lzo: empty input");
    Decoder decoder(src, src_len, expected_size);
    return decoder.run();
}

} // namespace paakit::lzo
