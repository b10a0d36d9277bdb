/**
 * @file truetype_face.hh
 * @brief One TrueType/OpenType face rendered through stb_truetype.
 *
 * truetype_face parses a face of a .ttf, .otf or .ttc file and renders
 * single glyphs to 8-bit coverage bitmaps. Placement on the square glyph
 * canvas is left to ttf_rasterizer.
 *
 * @code{.cpp}
 * auto bytes = std::make_shared<const std::vector<uint8_t>>(read_binary_file("NotoSansCJK-Regular.ttc"));
 * truetype_face face(bytes);
 *
 * if (auto index = face.glyph_index(0x4E2D)) {
 *     auto coverage = face.render(*index, 20.0f);
 * }
 * @endcode
 */

#pragma once

#include <bitfont/export.h>
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

namespace bitfont {
    /**
     * @brief Coverage bitmap of one rendered glyph.
     *
     * Coverage runs from 0 (no ink) to 255 (full ink), row-major,
     * width * height bytes. Glyphs without an outline, such as spaces,
     * have an empty bitmap.
     */
    struct BITFONT_EXPORT glyph_coverage {
        std::vector<uint8_t> coverage;
        int width = 0;
        int height = 0;
        int left = 0;   ///< Pen origin to left edge of the bitmap
        int top = 0;    ///< Baseline to top edge of the bitmap, negative above the baseline
    };

    /**
     * @brief A parsed font face.
     *
     * The face shares ownership of the file bytes, so copies of the same
     * file can back several faces.
     */
    class BITFONT_EXPORT truetype_face {
    public:
        /**
         * @param data Font file contents
         * @param face_index Face within a collection (0 for .ttf/.otf)
         */
        explicit truetype_face(std::shared_ptr<const std::vector<uint8_t>> data, int face_index = 0);

        ~truetype_face();

        truetype_face(truetype_face&& other) noexcept;
        truetype_face& operator=(truetype_face&& other) noexcept;

        /// @cond
        truetype_face(const truetype_face&) = delete;
        truetype_face& operator=(const truetype_face&) = delete;
        /// @endcond

        /**
         * @brief False if the bytes are not a font or the face index is out of range.
         */
        [[nodiscard]] bool is_valid() const noexcept;

        /**
         * @return Glyph index, or nullopt if the face has no glyph for the codepoint
         */
        [[nodiscard]] std::optional<int> glyph_index(char32_t codepoint) const;

        /**
         * @brief Render a glyph with the em square mapped to em_pixels.
         *
         * Glyph index 0 is the face's missing-glyph symbol. Ascenders and
         * descenders may extend past em_pixels.
         *
         * @return Coverage bitmap, or nullopt if the face is invalid
         */
        [[nodiscard]] std::optional<glyph_coverage> render(int glyph, float em_pixels) const;

    private:
        struct impl;
        std::unique_ptr<impl> m_impl;
    };
} // namespace bitfont
