//
// Compilation run
//

#include <bitfont/compiler.hh>
#include <bitfont/codegen/source_patcher.hh>
#include <bitfont/codepage/glyph_order.hh>
#include <bitfont/raster/ttf_rasterizer.hh>
#include <bitfont/utils/file_io.hh>
#include <failsafe/failsafe.hh>
#include <failsafe/logger.hh>
#include <stdexcept>
#include <utility>

namespace bitfont {

    std::filesystem::path map_file_for(const std::filesystem::path& output_file) {
        auto map_file = output_file;
        map_file += ".map";
        return map_file;
    }

    std::string load_corpus(const compile_options& options) {
        THROW_IF(options.text_file.empty(), std::invalid_argument, "No input text file given");

        std::string corpus = read_text_file(options.text_file);
        LOG_INFO("compiler", "Read", corpus.size(), "bytes from", options.text_file.string());

        if (options.translation_file) {
            std::string translations = read_text_file(*options.translation_file);
            LOG_INFO("compiler", "Read", translations.size(), "bytes from", options.translation_file->string());
            corpus += translations;
        }
        return corpus;
    }

    compile_result compile(const compile_options& options, glyph_rasterizer& rasterizer) {
        THROW_IF(options.sizes.empty(), std::invalid_argument, "No glyph sizes configured");

        // Input
        const std::string corpus = load_corpus(options);

        glyph_order_builder builder;
        builder.add_text(corpus);
        const std::size_t scanned = builder.scanned();
        const auto order = std::move(builder).build();
        LOG_INFO("compiler", "Scanned", scanned, "characters,", order.size(), "admitted");

        compile_result result;
        result.table = codepage_table::build(order);

        // Validate every patch target before writing anything
        patch_set patches;
        if (options.source_patch) {
            patches.stage_array(options.source_patch->file, options.source_patch->array_name,
                                result.table.render_body());
        }
        if (options.header_patch) {
            patches.stage_define(options.header_patch->file, options.header_patch->macro,
                                 std::to_string(result.table.size()));
        }

        // Payload
        glyph_stream_assembler assembler(rasterizer, options.depth, options.sizes);
        glyph_stream stream = assembler.assemble(order);

        write_binary_file(options.output_file, stream.payload);
        LOG_INFO("compiler", "Rendered character data saved to", options.output_file.string());

        result.payload_file = options.output_file;
        result.payload_bytes = stream.payload.size();
        result.sizes = std::move(stream.sizes);
        result.skipped = std::move(stream.skipped);

        // Table
        result.map_file = map_file_for(options.output_file);
        write_text_file(result.map_file, result.table.render_declaration(options.declaration));
        LOG_INFO("compiler", "Character map saved to", result.map_file.string());

        result.patched_files = patches.commit();

        if (!result.skipped.empty()) {
            LOG_WARN("compiler", result.skipped.size(),
                     "glyph(s) skipped; the payload holds fewer glyphs than the table has entries");
        }
        return result;
    }

    compile_result compile(const compile_options& options) {
        ttf_rasterizer rasterizer(options.font_chain);
        for (const auto& size : options.sizes) {
            THROW_IF(!rasterizer.has_usable_font(size), std::runtime_error,
                     "No font in the chain can be loaded at size", size.render_size);
        }
        return compile(options, rasterizer);
    }
}
