//
// bitfont_compile: corpus to codepage table and packed glyph payload
//
// Usage: bitfont_compile --text_file <file> --bits_per_char <1|2|4> [options]
//

#include <bitfont/compiler.hh>
#include <failsafe/logger.hh>
#include <getopt.h>
#include <cstdlib>
#include <exception>
#include <stdexcept>
#include <iostream>
#include <string>
#include <vector>

using namespace bitfont;

namespace {

enum long_only_option {
    OPT_TRANSLATION = 256,
    OPT_FALLBACK,
    OPT_SIZE,
    OPT_PATCH_SOURCE,
    OPT_ARRAY,
    OPT_PATCH_HEADER,
    OPT_COUNT_MACRO
};

void print_usage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " --text_file <file> --bits_per_char <1|2|4> [options]\n"
              << "\n"
              << "Options:\n"
              << "  -t, --text_file <file>        UTF-8 corpus (required)\n"
              << "  -b, --bits_per_char <n>       Bits per pixel: 1, 2 or 4 (required)\n"
              << "  -o, --output_file <file>      Binary payload (default rome-v2.555)\n"
              << "  -f, --font_path <file>        Primary font file (default \"PingFang TC\")\n"
              << "      --fallback_font <file>    Fallback font, repeatable (default \"Arial Unicode MS\")\n"
              << "      --translation_file <file> Extra UTF-8 text appended to the corpus\n"
              << "      --size <render[:dim]>     Glyph size, repeatable (default 12, 15, 20)\n"
              << "      --patch_source <file>     Generated source holding the table array\n"
              << "      --array <name>            Table array name (default codepage_to_utf8)\n"
              << "      --patch_header <file>     Generated header holding the table size define\n"
              << "      --count_macro <name>      Size define (default IMAGE_FONT_MULTIBYTE_SIMP_CHINESE_MAX_CHARS)\n"
              << "  -h, --help                    Show this help\n";
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    static const option long_options[] = {
        {"text_file", required_argument, nullptr, 't'},
        {"bits_per_char", required_argument, nullptr, 'b'},
        {"output_file", required_argument, nullptr, 'o'},
        {"font_path", required_argument, nullptr, 'f'},
        {"fallback_font", required_argument, nullptr, OPT_FALLBACK},
        {"translation_file", required_argument, nullptr, OPT_TRANSLATION},
        {"size", required_argument, nullptr, OPT_SIZE},
        {"patch_source", required_argument, nullptr, OPT_PATCH_SOURCE},
        {"array", required_argument, nullptr, OPT_ARRAY},
        {"patch_header", required_argument, nullptr, OPT_PATCH_HEADER},
        {"count_macro", required_argument, nullptr, OPT_COUNT_MACRO},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0}
    };

    compile_options options;
    std::string primary_font = options.font_chain.front();
    std::vector<std::string> fallback_fonts;
    std::vector<size_descriptor> sizes;
    std::string array_name = array_patch_target{}.array_name;
    std::string count_macro = count_patch_target{}.macro;
    std::string patch_source;
    std::string patch_header;
    int bits = 0;

    try {
        int opt;
        while ((opt = getopt_long(argc, argv, "t:b:o:f:h", long_options, nullptr)) != -1) {
            switch (opt) {
                case 't':
                    options.text_file = optarg;
                    break;
                case 'b': {
                    std::size_t used = 0;
                    bits = std::stoi(optarg, &used);
                    if (optarg[used] != '\0') {
                        throw std::invalid_argument(std::string("bits_per_char: ") + optarg);
                    }
                    break;
                }
                case 'o':
                    options.output_file = optarg;
                    break;
                case 'f':
                    primary_font = optarg;
                    break;
                case OPT_FALLBACK:
                    fallback_fonts.emplace_back(optarg);
                    break;
                case OPT_TRANSLATION:
                    options.translation_file = optarg;
                    break;
                case OPT_SIZE:
                    sizes.push_back(parse_size_descriptor(optarg));
                    break;
                case OPT_PATCH_SOURCE:
                    patch_source = optarg;
                    break;
                case OPT_ARRAY:
                    array_name = optarg;
                    break;
                case OPT_PATCH_HEADER:
                    patch_header = optarg;
                    break;
                case OPT_COUNT_MACRO:
                    count_macro = optarg;
                    break;
                case 'h':
                    print_usage(argv[0]);
                    return EXIT_SUCCESS;
                default:
                    print_usage(argv[0]);
                    return EXIT_FAILURE;
            }
        }
    } catch (const std::logic_error& e) {
        std::cerr << "Invalid argument: " << e.what() << '\n';
        return EXIT_FAILURE;
    }

    if (options.text_file.empty() || bits == 0) {
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    try {
        options.depth = bit_depth_from_bits(bits);
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << '\n';
        return EXIT_FAILURE;
    }

    if (fallback_fonts.empty()) {
        fallback_fonts.assign(options.font_chain.begin() + 1, options.font_chain.end());
    }
    options.font_chain = {primary_font};
    options.font_chain.insert(options.font_chain.end(), fallback_fonts.begin(), fallback_fonts.end());

    if (!sizes.empty()) {
        options.sizes = sizes;
    }
    options.declaration.array_name = array_name;
    options.declaration.count_macro = count_macro;
    if (!patch_source.empty()) {
        options.source_patch = array_patch_target{patch_source, array_name};
    }
    if (!patch_header.empty()) {
        options.header_patch = count_patch_target{patch_header, count_macro};
    }

    try {
        compile_result result = compile(options);

        std::cout << "\nTotal characters processed (for map): " << result.table.size() << '\n';
        for (const auto& info : result.sizes) {
            std::cout << "  " << info.size.dimension << "px: " << info.glyphs_packed << " glyphs, "
                      << info.bytes << " bytes\n";
        }
        if (!result.skipped.empty()) {
            std::cout << "Skipped glyphs: " << result.skipped.size() << '\n';
        }
        std::cout << "Output file: " << result.payload_file.string() << " (" << result.payload_bytes
                  << " bytes)\n";
        std::cout << "Character map file: " << result.map_file.string() << '\n';
        if (result.patched_files > 0) {
            std::cout << "Patched files: " << result.patched_files << '\n';
        }
    } catch (const std::exception& e) {
        LOG_ERROR("bitfont_compile", "Compilation failed:", e.what());
        std::cerr << "Error: " << e.what() << '\n';
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
