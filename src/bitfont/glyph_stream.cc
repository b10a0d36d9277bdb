//
// Glyph payload assembly
//

#include <bitfont/glyph_stream.hh>
#include <bitfont/text/utf8.hh>
#include <failsafe/failsafe.hh>
#include <failsafe/logger.hh>
#include <stdexcept>
#include <utility>

namespace bitfont {

bool glyph_stream::complete(std::size_t glyph_count) const noexcept {
    for (const auto& info : sizes) {
        if (info.glyphs_packed != glyph_count) {
            return false;
        }
    }
    return true;
}

glyph_stream_assembler::glyph_stream_assembler(glyph_rasterizer& rasterizer,
                                               bit_depth depth,
                                               std::vector<size_descriptor> sizes)
    : m_rasterizer(rasterizer),
      m_depth(depth),
      m_sizes(std::move(sizes)) {
}

std::vector<std::uint8_t> glyph_stream_assembler::pack_glyph(char32_t codepoint,
                                                             const size_descriptor& size,
                                                             std::string& reason) const {
    auto result = m_rasterizer.rasterize(codepoint, size);
    if (!result.ok()) {
        reason = result.error.empty() ? std::string("rasterizer failed") : std::move(result.error);
        return {};
    }

    THROW_IF(result.raster->dimension() != size.dimension, std::runtime_error,
             "Rasterizer returned", result.raster->dimension(), "px raster for",
             format_codepoint(codepoint), "but", size.dimension, "px was requested");

    return pack_raster(*result.raster, m_depth);
}

glyph_stream glyph_stream_assembler::assemble(const std::vector<admitted_character>& order) const {
    glyph_stream stream;
    stream.payload.reserve(expected_payload_bytes(m_sizes, order.size(), m_depth));
    stream.sizes.reserve(m_sizes.size());

    for (std::size_t s = 0; s < m_sizes.size(); ++s) {
        const auto& size = m_sizes[s];

        size_stream_info info;
        info.size = size;
        info.offset = stream.payload.size();

        std::vector<std::uint8_t> buffer;
        buffer.reserve(order.size() * packed_glyph_bytes(size.dimension, m_depth));

        for (std::size_t g = 0; g < order.size(); ++g) {
            const char32_t cp = order[g].codepoint;
            std::string reason;
            auto packed = pack_glyph(cp, size, reason);
            if (packed.empty() && !reason.empty()) {
                LOG_WARN("glyph_stream", "Skipping", format_codepoint(cp), "at", size.dimension,
                         "px:", reason);
                stream.skipped.push_back({s, g, cp, std::move(reason)});
                continue;
            }
            buffer.insert(buffer.end(), packed.begin(), packed.end());
            ++info.glyphs_packed;
        }

        info.bytes = buffer.size();
        stream.payload.insert(stream.payload.end(), buffer.begin(), buffer.end());
        stream.sizes.push_back(info);

        LOG_INFO("glyph_stream", "Packed", info.glyphs_packed, "of", order.size(), "glyphs at",
                 size.dimension, "px,", info.bytes, "bytes");
    }

    return stream;
}

std::size_t expected_payload_bytes(const std::vector<size_descriptor>& sizes,
                                   std::size_t glyph_count,
                                   bit_depth depth) noexcept {
    std::size_t total = 0;
    for (const auto& size : sizes) {
        total += glyph_count * packed_glyph_bytes(size.dimension, depth);
    }
    return total;
}

} // namespace bitfont
