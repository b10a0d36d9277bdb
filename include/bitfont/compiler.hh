/**
 * @file compiler.hh
 * @brief One complete corpus-to-font-asset compilation run.
 *
 * @section compiler_steps Steps
 *
 * 1. Read the corpus and the optional translation file (fatal on error).
 * 2. Build the glyph order and the codepage table.
 * 3. Stage source patches (fatal if a target is missing; nothing has
 *    been written yet).
 * 4. Rasterize and pack every glyph at every size.
 * 5. Write the binary payload (a failed write removes the partial file).
 * 6. Write the `.map` declaration file and commit the staged patches.
 *
 * @section compiler_example Example
 *
 * @code{.cpp}
 * compile_options options;
 * options.text_file = "story.txt";
 * options.depth = bit_depth::two;
 * options.output_file = "build/rome-v2.555";
 * options.font_chain = {"NotoSansCJK-Regular.ttc"};
 *
 * compile_result result = compile(options);
 * std::cout << result.table.size() << " characters\n";
 * @endcode
 */

#pragma once

#include <bitfont/export.h>
#include <bitfont/codepage/codepage_table.hh>
#include <bitfont/glyph_stream.hh>
#include <bitfont/pixel/pixel_packer.hh>
#include <bitfont/raster/glyph_rasterizer.hh>
#include <bitfont/raster/size_descriptor.hh>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace bitfont {
    /**
     * @brief An existing generated source whose table array is rewritten.
     */
    struct BITFONT_EXPORT array_patch_target {
        std::filesystem::path file;
        std::string array_name = "codepage_to_utf8";
    };

    /**
     * @brief An existing generated header whose table size define is rewritten.
     */
    struct BITFONT_EXPORT count_patch_target {
        std::filesystem::path file;
        std::string macro = "IMAGE_FONT_MULTIBYTE_SIMP_CHINESE_MAX_CHARS";
    };

    /**
     * @brief Configuration of a compilation run.
     */
    struct BITFONT_EXPORT compile_options {
        std::filesystem::path text_file;                         ///< UTF-8 corpus (required)
        std::optional<std::filesystem::path> translation_file;   ///< Appended after the corpus
        bit_depth depth = bit_depth::one;
        std::filesystem::path output_file = "rome-v2.555";       ///< Binary payload
        std::vector<std::string> font_chain = {"PingFang TC", "Arial Unicode MS"};
        std::vector<size_descriptor> sizes = default_size_descriptors();
        table_declaration declaration;                           ///< Names for the .map file
        std::optional<array_patch_target> source_patch;
        std::optional<count_patch_target> header_patch;
    };

    /**
     * @brief Everything a run produced.
     */
    struct BITFONT_EXPORT compile_result {
        codepage_table table;
        std::vector<size_stream_info> sizes;
        std::vector<skipped_glyph> skipped;
        std::size_t payload_bytes = 0;
        std::filesystem::path payload_file;
        std::filesystem::path map_file;
        std::size_t patched_files = 0;
    };

    /**
     * @brief `<output_file>.map`
     */
    [[nodiscard]] BITFONT_EXPORT std::filesystem::path map_file_for(const std::filesystem::path& output_file);

    /**
     * @brief Read the corpus followed by the optional translation file.
     * @throws std::runtime_error if either file cannot be read
     */
    [[nodiscard]] BITFONT_EXPORT std::string load_corpus(const compile_options& options);

    /**
     * @brief Run a compilation with a caller-provided rasterizer.
     *
     * @throws std::runtime_error on input, patch-target or write errors
     * @throws std::out_of_range if the corpus exhausts the codepage
     */
    BITFONT_EXPORT compile_result compile(const compile_options& options, glyph_rasterizer& rasterizer);

    /**
     * @brief Run a compilation with a ttf_rasterizer over options.font_chain.
     *
     * @throws std::runtime_error if no font of the chain loads at one of the
     *         configured sizes; nothing is written in that case
     */
    BITFONT_EXPORT compile_result compile(const compile_options& options);
} // namespace bitfont
