#include "paakit/paa.h"

#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb_image_write.h>

#include "../common/cli_logger.h"

namespace fs = std::filesystem;
namespace paa = paakit::paa;

static void print_usage() {
    paakit::cli::print("Usage: paa2img [flags] <input.paa>");
    paakit::cli::print("");
    paakit::cli::print("Converts one mipmap of a PAA texture to PNG.");
    paakit::cli::print("Reads from file argument or stdin (use - or omit argument).");
    paakit::cli::print("");
    paakit::cli::print("Flags:");
    paakit::cli::print("  -o <path>     Output PNG path (use - for stdout)");
    paakit::cli::print("  --mip <N>     Mipmap level to convert (default 0)");
    paakit::cli::print("  --no-swizzle  Ignore the file's channel swizzle");
    paakit::cli::print("  --flip        Write rows bottom to top");
    paakit::cli::print("  -v, -vv       Verbose / debug logging to stderr");
}

static void write_png_to_stream(std::ostream& out, const paa::Image& img) {
    stbi_write_png_to_func(
        [](void* ctx, void* data, int size) {
            static_cast<std::ostream*>(ctx)->write(static_cast<const char*>(data), size);
        },
        &out, img.width, img.height, 4, img.pixels.data(), img.width * 4);
}

int main(int argc, char* argv[]) {
    std::string output;
    size_t level = 0;
    paa::DecodeOptions opts;
    int verbosity = 0;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-o") == 0 && i + 1 < argc) {
            output = argv[++i];
        } else if (std::strcmp(argv[i], "--mip") == 0 && i + 1 < argc) {
            char* end = nullptr;
            long v = std::strtol(argv[++i], &end, 10);
            if (end == argv[i] || *end != '\0' || v < 0) {
                LOGE("invalid mipmap level", argv[i]);
                return 2;
            }
            level = static_cast<size_t>(v);
        } else if (std::strcmp(argv[i], "--no-swizzle") == 0) {
            opts.apply_swizzle = false;
        } else if (std::strcmp(argv[i], "--flip") == 0) {
            opts.flip_rows = true;
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

    paakit::cli::set_verbosity(verbosity);

    bool from_stdin = positional.empty() || positional[0] == "-";
    std::string input_name;
    std::ifstream file_stream;
    std::istream* input = nullptr;

    if (from_stdin) {
        input = &std::cin;
        input_name = "stdin";
    } else {
        file_stream.open(positional[0], std::ios::binary);
        if (!file_stream) {
            LOGE("cannot open", positional[0]);
            return 1;
        }
        input = &file_stream;
        input_name = positional[0];
    }

    paa::File file;
    paa::Image img;
    try {
        file = paa::read(*input);
        LOGI("Format", paa::format_name(file.format), "with", file.mipmaps.size(), "mipmaps");
        if (opts.apply_swizzle && file.get_tagg<paa::SwizzleTagg>())
            LOGI("Applying channel swizzle");
        img = paa::decode_level(file, level, opts);
    } catch (const std::exception& e) {
        LOGE("decoding", input_name, e.what());
        return 1;
    }

    paakit::cli::log_plain("PAA:", input_name, "(" + paa::format_name(file.format) + ",",
                           std::to_string(img.width) + "x" + std::to_string(img.height) + ")");

    if (output == "-" || (from_stdin && output.empty())) {
        write_png_to_stream(std::cout, img);
    } else {
        std::string out_path = output;
        if (out_path.empty()) {
            fs::path p(input_name);
            out_path = (p.parent_path() / p.stem()).string();
            if (level > 0) out_path += "_mip" + std::to_string(level);
            out_path += ".png";
        }
        if (!stbi_write_png(out_path.c_str(), img.width, img.height, 4, img.pixels.data(), img.width * 4)) {
            LOGE("writing", out_path);
            return 1;
        }
        paakit::cli::log_plain("Output:", out_path);
    }

    return 0;
}
