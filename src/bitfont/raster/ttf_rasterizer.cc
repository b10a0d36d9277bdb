//
// TrueType glyph rasterizer
//

#include <bitfont/raster/ttf_rasterizer.hh>
#include <bitfont/text/utf8.hh>
#include <failsafe/logger.hh>
#include <algorithm>
#include <utility>

namespace bitfont {

grayscale_raster compose_glyph(const glyph_coverage& glyph, std::uint16_t dimension) {
    grayscale_raster raster(dimension);
    if (glyph.coverage.empty()) {
        return raster;
    }

    const int dim = static_cast<int>(dimension);
    const int left = glyph.left;
    const int top = (dim - glyph.height) / 2;

    for (int gy = 0; gy < glyph.height; ++gy) {
        const int y = top + gy;
        if (y < 0 || y >= dim) continue;

        for (int gx = 0; gx < glyph.width; ++gx) {
            const int x = left + gx;
            if (x < 0 || x >= dim) continue;

            const auto coverage = glyph.coverage[static_cast<std::size_t>(gy * glyph.width + gx)];
            const auto sample = static_cast<std::uint8_t>(RASTER_WHITE - coverage);
            const auto px = static_cast<std::uint16_t>(x);
            const auto py = static_cast<std::uint16_t>(y);
            raster.set_pixel(px, py, std::min(raster.pixel(px, py), sample));
        }
    }

    return raster;
}

ttf_rasterizer::ttf_rasterizer(std::vector<std::string> font_chain)
    : m_font_chain(std::move(font_chain)) {
}

rasterize_result ttf_rasterizer::rasterize(char32_t codepoint, const size_descriptor& size) {
    const cached_face* chosen = nullptr;
    int glyph = 0;

    for (const auto& path : m_font_chain) {
        const cached_face* entry = m_cache.get(path, size.render_size);
        if (!entry) {
            continue;
        }
        if (auto index = entry->face.glyph_index(codepoint)) {
            chosen = entry;
            glyph = *index;
            break;
        }
        if (!chosen) {
            // Missing-glyph symbol of the first usable font, unless a later font has the glyph
            chosen = entry;
        }
    }

    if (!chosen) {
        return rasterize_result::failure("no usable font");
    }
    if (glyph == 0) {
        LOG_DEBUG("ttf_rasterizer", "No font covers", format_codepoint(codepoint),
                  "drawing missing glyph from", chosen->font_path);
    }

    auto coverage = chosen->face.render(glyph, size.render_size);
    if (!coverage) {
        return rasterize_result::failure("rendering failed in " + chosen->font_path);
    }
    return rasterize_result::success(compose_glyph(*coverage, size.dimension));
}

bool ttf_rasterizer::has_usable_font(const size_descriptor& size) {
    return std::any_of(m_font_chain.begin(), m_font_chain.end(), [&](const std::string& path) {
        return m_cache.get(path, size.render_size) != nullptr;
    });
}

const std::vector<std::string>& ttf_rasterizer::font_chain() const noexcept {
    return m_font_chain;
}

const font_cache& ttf_rasterizer::cache() const noexcept {
    return m_cache;
}

} // namespace bitfont
