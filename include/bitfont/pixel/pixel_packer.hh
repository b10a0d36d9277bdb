/**
 * @file pixel_packer.hh
 * @brief Grayscale quantization and sub-byte row packing.
 *
 * Glyph rasters are stored in the binary payload as packed 1, 2 or 4 bit
 * intensity codes. Code 0 is always the lightest bucket and the maximum
 * code (1, 3 or 15) the darkest.
 *
 * @section packer_layout Packed Layout
 *
 * Codes are accumulated least-significant-bits first. Each row of a glyph
 * is packed on its own: a row that does not fill its last byte leaves the
 * remaining high bits zero and the next row starts a fresh byte.
 *
 * @code
 *   bit depth 2, width 5 (codes c0..c4)
 *
 *   byte 0                          byte 1
 *   +----+----+----+----+           +----+----+----+----+
 *   | c3 | c2 | c1 | c0 |           | 0  | 0  | 0  | c4 |
 *   +----+----+----+----+           +----+----+----+----+
 *    7-6  5-4  3-2  1-0              7-6  5-4  3-2  1-0
 * @endcode
 *
 * Bytes per row are `ceil(width * depth / 8)`, so a glyph of dimension d
 * always occupies `d * ceil(d * depth / 8)` bytes regardless of content.
 *
 * @section packer_quantizer Quantizer Thresholds
 *
 * | Depth | Policy |
 * |-------|--------|
 * | 1 | sample < 128 -> 1, else 0 |
 * | 2 | < 0x44 -> 3, < 0x66 -> 2, < 0xAA -> 1, else 0 |
 * | 4 | (255 - sample) >> 4 |
 */

#pragma once

#include <bitfont/export.h>
#include <bitfont/raster/grayscale_raster.hh>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace bitfont {
    /**
     * @brief Bits used to encode one pixel's intensity.
     */
    enum class bit_depth : std::uint8_t {
        one = 1,   ///< Monochrome
        two = 2,   ///< Four gray levels
        four = 4   ///< Sixteen gray levels
    };

    /**
     * @brief Convert a bits-per-pixel count to a bit_depth.
     *
     * @param bits 1, 2 or 4
     * @throws std::invalid_argument for any other value
     */
    BITFONT_EXPORT bit_depth bit_depth_from_bits(int bits);

    /// Number of bits per pixel
    [[nodiscard]] constexpr unsigned bits_of(bit_depth depth) noexcept {
        return static_cast<unsigned>(depth);
    }

    /// Darkest code at a depth (1, 3 or 15)
    [[nodiscard]] constexpr std::uint8_t max_code(bit_depth depth) noexcept {
        return static_cast<std::uint8_t>((1u << bits_of(depth)) - 1u);
    }

    /**
     * @brief Map one grayscale sample to an intensity code.
     *
     * Pure and deterministic. The result is non-increasing as the sample
     * grows, at every depth.
     *
     * @param sample 0 (black) to 255 (white)
     * @param depth Output code width
     * @return Code in [0, max_code(depth)]
     */
    [[nodiscard]] BITFONT_EXPORT std::uint8_t quantize(std::uint8_t sample, bit_depth depth) noexcept;

    /**
     * @brief Packed size of one row.
     * @return ceil(width * depth / 8)
     */
    [[nodiscard]] BITFONT_EXPORT std::size_t packed_row_bytes(std::size_t width, bit_depth depth) noexcept;

    /**
     * @brief Packed size of one square glyph.
     * @return dimension * packed_row_bytes(dimension, depth)
     */
    [[nodiscard]] BITFONT_EXPORT std::size_t packed_glyph_bytes(std::uint16_t dimension, bit_depth depth) noexcept;

    /**
     * @brief Pack one row of already quantized codes and append it to out.
     *
     * @param codes One code per pixel, each at most max_code(depth)
     * @param depth Code width
     * @param out Destination, grows by packed_row_bytes(codes.size(), depth)
     */
    BITFONT_EXPORT void pack_codes(std::span<const std::uint8_t> codes, bit_depth depth,
                                   std::vector<std::uint8_t>& out);

    /**
     * @brief Quantize and pack one row of grayscale samples, appending to out.
     */
    BITFONT_EXPORT void pack_row(std::span<const std::uint8_t> samples, bit_depth depth,
                                 std::vector<std::uint8_t>& out);

    /**
     * @brief Quantize and pack a whole raster, row by row.
     *
     * @param raster Square grayscale raster
     * @param depth Code width
     * @return packed_glyph_bytes(raster.dimension(), depth) bytes
     */
    [[nodiscard]] BITFONT_EXPORT std::vector<std::uint8_t> pack_raster(const grayscale_raster& raster,
                                                                       bit_depth depth);
} // namespace bitfont
