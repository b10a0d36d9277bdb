/**
 * @file ttf_rasterizer.hh
 * @brief glyph_rasterizer backed by TrueType/OpenType fonts.
 *
 * @section ttf_rasterizer_chain Font Chain
 *
 * The rasterizer is configured with an ordered list of font files: the
 * primary font followed by fallbacks. For each character:
 *
 * 1. The first font that loads and contains the character renders it.
 * 2. If fonts load but none contains it, the first loaded font's
 *    missing-glyph symbol is rendered instead.
 * 3. If no font in the chain loads, rasterization fails with
 *    "no usable font".
 *
 * @section ttf_rasterizer_placement Placement
 *
 * The glyph is drawn black on a white square canvas of the size's
 * dimension. Horizontally it starts at the pen origin (x = 0) shifted by
 * its left bearing; vertically its ink box is centered in the canvas.
 * Ink falling outside the canvas is clipped.
 *
 * @code
 *   +------------+
 *   |            |   top = (dimension - ink_height) / 2
 *   |  ######    |
 *   |  #    #    |
 *   |  ######    |
 *   |            |
 *   +------------+
 *   ^ x = left bearing
 * @endcode
 */

#pragma once

#include <bitfont/export.h>
#include <bitfont/raster/glyph_rasterizer.hh>
#include <bitfont/raster/font_cache.hh>
#include <bitfont/utils/truetype_face.hh>
#include <string>
#include <vector>

namespace bitfont {
    /**
     * @brief Place a coverage bitmap onto a white square canvas.
     *
     * Coverage 255 becomes sample 0 (black). Overlapping ink keeps the
     * darker value.
     *
     * @param glyph Coverage bitmap from truetype_face::render
     * @param dimension Canvas side length
     * @return The composed raster
     */
    [[nodiscard]] BITFONT_EXPORT grayscale_raster compose_glyph(const glyph_coverage& glyph,
                                                                std::uint16_t dimension);

    /**
     * @brief TrueType rasterizer with a font fallback chain.
     *
     * Owns its font_cache; the cache lives exactly as long as the
     * rasterizer.
     */
    class BITFONT_EXPORT ttf_rasterizer : public glyph_rasterizer {
    public:
        /**
         * @param font_chain Primary font path followed by fallbacks
         */
        explicit ttf_rasterizer(std::vector<std::string> font_chain);

        rasterize_result rasterize(char32_t codepoint, const size_descriptor& size) override;

        /**
         * @brief True if at least one font of the chain loads at the size.
         */
        [[nodiscard]] bool has_usable_font(const size_descriptor& size);

        [[nodiscard]] const std::vector<std::string>& font_chain() const noexcept;

        [[nodiscard]] const font_cache& cache() const noexcept;

    private:
        std::vector<std::string> m_font_chain;
        font_cache m_cache;
    };
} // namespace bitfont
