#include "paakit/errors.h"
#include "paakit/paa.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "../common/cli_logger.h"

namespace fs = std::filesystem;
using json = nlohmann::ordered_json;

namespace paa = paakit::paa;

static std::string hex_encode(const std::vector<uint8_t>& data) {
    std::ostringstream ss;
    for (uint8_t b : data)
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(b);
    return ss.str();
}

static json color_json(const paa::Color& c) {
    return json::array({c.r, c.g, c.b, c.a});
}

static const char* source_name(paakit::swizzle::Source s) {
    using paakit::swizzle::Source;
    switch (s) {
        case Source::Red: return "R";
        case Source::Green: return "G";
        case Source::Blue: return "B";
        case Source::Alpha: return "A";
        case Source::Zero: return "0";
        case Source::One: return "1";
    }
    return "?";
}

static std::string selector_name(const paakit::swizzle::Selector& s) {
    std::string name = s.invert ? "1-" : "";
    return name + source_name(s.source);
}

static json tagg_json(const paa::Tagg& t) {
    json j = {{"signature", t.signature}, {"length", t.length}};
    if (const auto* avg = std::get_if<paa::AverageColorTagg>(&t.payload)) {
        j["type"] = "averageColor";
        j["color"] = color_json(avg->color);
    } else if (const auto* max = std::get_if<paa::MaxColorTagg>(&t.payload)) {
        j["type"] = "maxColor";
        j["color"] = color_json(max->color);
    } else if (const auto* flag = std::get_if<paa::FlagTagg>(&t.payload)) {
        j["type"] = "flag";
        j["flags"] = flag->flags;
        j["interpolatedAlpha"] = flag->interpolated_alpha();
        j["binaryAlpha"] = flag->binary_alpha();
    } else if (const auto* sw = std::get_if<paa::SwizzleTagg>(&t.payload)) {
        const auto& sel = sw->selectors;
        j["type"] = "swizzle";
        j["red"] = selector_name(sel.red);
        j["green"] = selector_name(sel.green);
        j["blue"] = selector_name(sel.blue);
        j["alpha"] = selector_name(sel.alpha);
    } else if (const auto* off = std::get_if<paa::OffsetTagg>(&t.payload)) {
        j["type"] = "offset";
        j["offsets"] = off->offsets;
    } else if (const auto* unk = std::get_if<paa::UnknownTagg>(&t.payload)) {
        j["type"] = "unknown";
        j["data"] = hex_encode(unk->data);
    }
    return j;
}

static json build_json(const paa::File& f, const std::string& filename, bool decode) {
    json taggs = json::array();
    for (const auto& t : f.taggs)
        taggs.push_back(tagg_json(t));

    json mipmaps = json::array();
    int failed = 0;
    for (size_t i = 0; i < f.mipmaps.size(); i++) {
        const auto& m = f.mipmaps[i];
        json mj = {
            {"level", i},
            {"width", m.width},
            {"height", m.height},
            {"lzoCompressed", m.lzo_compressed},
            {"dataSize", m.data.size()},
            {"offset", m.offset},
        };
        if (decode) {
            // Decode failures are scoped to the level.
            try {
                auto img = m.decode(f.format);
                mj["decoded"] = true;
                mj["decodedSize"] = img.pixels.size();
                LOGD("Decoded level", i, img.width, "x", img.height);
            } catch (const paakit::Error& e) {
                mj["decoded"] = false;
                mj["error"] = e.what();
                failed++;
                LOGW("level", i, e.what());
            }
        }
        mipmaps.push_back(std::move(mj));
    }

    json doc = {
        {"schemaVersion", 1},
        {"filename", filename},
        {"format", paa::format_name(f.format)},
        {"formatCode", static_cast<uint16_t>(f.format)},
        {"hasAlpha", f.has_alpha()},
        {"mipmapCount", f.mipmaps.size()},
    };
    if (!f.mipmaps.empty()) {
        doc["width"] = f.mipmaps[0].width;
        doc["height"] = f.mipmaps[0].height;
    }
    if (decode)
        doc["decodeFailures"] = failed;
    doc["taggs"] = std::move(taggs);
    doc["mipmaps"] = std::move(mipmaps);
    return doc;
}

static void print_usage() {
    paakit::cli::print("Usage: paa_info [flags] [input.paa]");
    paakit::cli::print("Parses a PAA texture and outputs structured JSON metadata.");
    paakit::cli::print("Reads from file argument or stdin (use - or omit argument).");
    paakit::cli::print("");
    paakit::cli::print("Flags:");
    paakit::cli::print("  --pretty   Pretty-print JSON output");
    paakit::cli::print("  --decode   Decode every mipmap and report failures");
    paakit::cli::print("  -v, -vv    Verbose / debug logging to stderr");
}

int main(int argc, char* argv[]) {
    bool pretty = false;
    bool decode = false;
    int verbosity = 0;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "--pretty") == 0) {
            pretty = true;
        } else if (std::strcmp(argv[i], "--decode") == 0) {
            decode = true;
        } else if (std::strcmp(argv[i], "-v") == 0 || std::strcmp(argv[i], "--verbose") == 0) {
            verbosity = std::min(verbosity + 1, 2);
        } else if (std::strcmp(argv[i], "-vv") == 0 || std::strcmp(argv[i], "--debug") == 0) {
            verbosity = 2;
        } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            print_usage();
            return 0;
        } else if (argv[i][0] == '-' && argv[i][1] != '\0') {
            LOGE("unknown flag", argv[i]);
            return 2;
        } else {
            positional.push_back(argv[i]);
        }
    }
    if (positional.size() > 1) {
        LOGE("expected at most one input file");
        return 2;
    }

    paakit::cli::set_verbosity(verbosity);

    bool from_stdin = positional.empty() || positional[0] == "-";
    std::string filename;
    std::ifstream file_stream;
    std::istream* input = nullptr;

    if (from_stdin) {
        input = &std::cin;
        filename = "stdin";
        LOGI("Reading PAA from stdin");
    } else {
        file_stream.open(positional[0], std::ios::binary);
        if (!file_stream) {
            LOGE("cannot open", positional[0]);
            return 1;
        }
        input = &file_stream;
        filename = fs::path(positional[0]).filename().string();
        LOGI("Reading", positional[0]);
    }

    paa::File f;
    try {
        f = paa::read(*input);
    } catch (const std::exception& e) {
        LOGE("parsing", filename, e.what());
        return 1;
    }

    LOGI("PAA:", filename, paa::format_name(f.format), f.mipmaps.size(), "mipmaps,",
         f.taggs.size(), "taggs");

    auto doc = build_json(f, filename, decode);
    if (pretty)
        std::cout << std::setw(2) << doc << '\n';
    else
        std::cout << doc << '\n';

    return doc.value("decodeFailures", 0) > 0 ? 1 : 0;
}
