#include "paakit/paa.h"
#include "paakit/binutil.h"
#include "paakit/errors.h"

#include <format>

namespace paakit::paa {

static void expect_length(const std::string& signature, size_t length, size_t expected) {
    if (length != expected)
        throw ChunkFormatError(std::format("paa: TAGG {} payload must be {} bytes, got {}",
                                           signature, expected, length));
}

// Stored as a little-endian ARGB8888 word: B, G, R, A.
static Color read_color(const uint8_t* p) {
    return {p[2], p[1], p[0], p[3]};
}

swizzle::Selector swizzle_selector(uint8_t command) {
    using swizzle::Source;
    switch (command) {
    case 0: return {Source::Alpha, false};
    case 1: return {Source::Red, false};
    case 2: return {Source::Green, false};
    case 3: return {Source::Blue, false};
    case 4: return {Source::Alpha, true};
    case 5: return {Source::Red, true};
    case 6: return {Source::Green, true};
    case 7: return {Source::Blue, true};
    case 8: return {Source::One, false};
    case 9: return {Source::Zero, false};
    default:
        throw ChunkFormatError(std::format("paa: invalid swizzle command {}", command));
    }
}

Tagg parse_tagg(const std::string& signature, const uint8_t* payload, size_t length) {
    Tagg tagg;
    tagg.signature = signature;
    tagg.length = static_cast<uint32_t>(length);

    if (signature == "CGVA") {
        expect_length(signature, length, 4);
        tagg.payload = AverageColorTagg{read_color(payload)};
    } else if (signature == "CXAM") {
        expect_length(signature, length, 4);
        tagg.payload = MaxColorTagg{read_color(payload)};
    } else if (signature == "GALF") {
        expect_length(signature, length, 4);
        tagg.payload = FlagTagg{binutil::load_u32(payload)};
    } else if (signature == "ZIWS") {
        // Byte 0 drives alpha, bytes 1..3 red, green, blue.
        expect_length(signature, length, 4);
        SwizzleTagg sw;
        sw.selectors.alpha = swizzle_selector(payload[0]);
        sw.selectors.red = swizzle_selector(payload[1]);
        sw.selectors.green = swizzle_selector(payload[2]);
        sw.selectors.blue = swizzle_selector(payload[3]);
        tagg.payload = sw;
    } else if (signature == "SFFO") {
        expect_length(signature, length, 64);
        OffsetTagg off;
        for (size_t i = 0; i < 16; i++) {
            uint32_t v = binutil::load_u32(payload + i * 4);
            if (v == 0) break;
            off.offsets.push_back(v);
        }
        tagg.payload = std::move(off);
    } else {
        tagg.payload = UnknownTagg{std::vector<uint8_t>(payload, payload + length)};
    }
    return tagg;
}

std::optional<UnknownTagg> File::find_unknown(const std::string& signature) const {
    for (const auto& t : taggs) {
        if (t.signature != signature) continue;
        if (const auto* p = std::get_if<UnknownTagg>(&t.payload))
            return *p;
    }
    return std::nullopt;
}

bool File::has_alpha() const {
    auto flag = get_tagg<FlagTagg>();
    return flag && flag->uses_alpha();
}

} // namespace paakit::paa
