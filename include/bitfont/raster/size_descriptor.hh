/**
 * @file size_descriptor.hh
 * @brief Glyph variant sizes produced by one compilation run.
 */

#pragma once

#include <bitfont/export.h>
#include <cstdint>
#include <string_view>
#include <vector>

namespace bitfont {
    /**
     * @brief One glyph variant: the font size to render at and the side
     *        length of the square raster to render into.
     *
     * The two are usually equal. The order of a size_descriptor list is
     * the order in which glyph streams appear in the binary payload.
     */
    struct BITFONT_EXPORT size_descriptor {
        float render_size = 0.0f;     ///< Font em size in pixels passed to the rasterizer
        std::uint16_t dimension = 0;  ///< Raster width and height in pixels

        bool operator==(const size_descriptor&) const = default;
    };

    /**
     * @brief The runtime's stock sizes: 12, 15 and 20 pixel square glyphs.
     */
    BITFONT_EXPORT std::vector<size_descriptor> default_size_descriptors();

    /**
     * @brief Parse `RENDER[:DIM]`, e.g. "12", "12.5:13".
     *
     * Without DIM the dimension is the render size truncated. The render
     * size must be finite and in (0, 65535], the dimension in [1, 65535].
     *
     * @throws std::invalid_argument on malformed or out-of-range input
     */
    [[nodiscard]] BITFONT_EXPORT size_descriptor parse_size_descriptor(std::string_view text);
} // namespace bitfont
