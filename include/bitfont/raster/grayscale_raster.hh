/**
 * @file grayscale_raster.hh
 * @brief Square 8-bit grayscale glyph raster.
 *
 * A grayscale_raster is the hand-off between the glyph rasterizer and
 * the pixel packer. It stores one byte per pixel in row-major order,
 * where 0 is black (full ink) and 255 is white (background).
 *
 * @code
 *   dimension = 4
 *   +-----+-----+-----+-----+
 *   | 255 | 255 |  0  | 255 |  <- row 0 = samples[0..3]
 *   +-----+-----+-----+-----+
 *   | 255 |  0  |  0  | 255 |  <- row 1 = samples[4..7]
 *   +-----+-----+-----+-----+
 *   ...
 * @endcode
 */

#pragma once

#include <bitfont/export.h>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace bitfont {
    /// Sample value of an untouched canvas pixel
    inline constexpr std::uint8_t RASTER_WHITE = 255;

    /// Sample value of a fully inked pixel
    inline constexpr std::uint8_t RASTER_BLACK = 0;

    /**
     * @brief Square matrix of 8-bit grayscale samples.
     *
     * Owned transiently by the glyph stream assembler: produced fresh per
     * (character, size) pair and discarded after packing.
     */
    class BITFONT_EXPORT grayscale_raster {
    public:
        /**
         * @brief Create an empty (0 x 0) raster.
         */
        grayscale_raster();

        /**
         * @brief Create a dimension x dimension raster filled with one value.
         *
         * @param dimension Width and height in pixels
         * @param fill Initial sample value (white by default)
         */
        explicit grayscale_raster(std::uint16_t dimension, std::uint8_t fill = RASTER_WHITE);

        /**
         * @brief Adopt existing row-major samples.
         *
         * @param dimension Width and height in pixels
         * @param samples Exactly dimension * dimension bytes
         * @throws std::runtime_error if the sample count does not match
         */
        grayscale_raster(std::uint16_t dimension, std::vector<std::uint8_t> samples);

        [[nodiscard]] std::uint16_t dimension() const noexcept;

        /**
         * @brief Read one sample.
         * @throws std::runtime_error if (x, y) is outside the raster
         */
        [[nodiscard]] std::uint8_t pixel(std::uint16_t x, std::uint16_t y) const;

        /**
         * @brief Write one sample.
         * @throws std::runtime_error if (x, y) is outside the raster
         */
        void set_pixel(std::uint16_t x, std::uint16_t y, std::uint8_t value);

        /**
         * @brief Samples of row y, left to right.
         * @throws std::runtime_error if y is outside the raster
         */
        [[nodiscard]] std::span<const std::uint8_t> row(std::uint16_t y) const;

        /// All samples in row-major order
        [[nodiscard]] std::span<const std::uint8_t> samples() const noexcept;

    private:
        std::uint16_t m_dimension = 0;
        std::vector<std::uint8_t> m_samples;
    };
} // namespace bitfont
