/**
 * @file glyph_rasterizer.hh
 * @brief Abstract glyph rasterizer consumed by the glyph stream assembler.
 *
 * The assembler only needs one operation from a font backend: turn a
 * character into a square grayscale raster at a given size, or report
 * why it could not. ttf_rasterizer implements this with stb_truetype;
 * tests substitute scripted fakes.
 *
 * @code{.cpp}
 * class solid_rasterizer : public glyph_rasterizer {
 * public:
 *     rasterize_result rasterize(char32_t, const size_descriptor& size) override {
 *         return rasterize_result::success(grayscale_raster(size.dimension, RASTER_BLACK));
 *     }
 * };
 * @endcode
 */

#pragma once

#include <bitfont/export.h>
#include <bitfont/raster/grayscale_raster.hh>
#include <bitfont/raster/size_descriptor.hh>
#include <optional>
#include <string>

namespace bitfont {
    /**
     * @brief Outcome of one rasterization: a raster or a diagnostic.
     */
    struct BITFONT_EXPORT rasterize_result {
        std::optional<grayscale_raster> raster;  ///< Set on success
        std::string error;                       ///< Diagnostic on failure

        [[nodiscard]] static rasterize_result success(grayscale_raster r);
        [[nodiscard]] static rasterize_result failure(std::string message);

        [[nodiscard]] bool ok() const noexcept { return raster.has_value(); }
    };

    /**
     * @brief Font backend interface.
     *
     * Implementations may block (disk, font parsing). Failures are never
     * retried by the caller.
     */
    class BITFONT_EXPORT glyph_rasterizer {
    public:
        virtual ~glyph_rasterizer();

        /**
         * @brief Render one character.
         *
         * @param codepoint Character to render
         * @param size Render size and raster dimension
         * @return A size.dimension square raster, or a failure
         */
        virtual rasterize_result rasterize(char32_t codepoint, const size_descriptor& size) = 0;
    };
} // namespace bitfont
