/**
 * @file glyph_stream.hh
 * @brief Assembly of the packed binary glyph payload.
 *
 * @section stream_layout Payload Layout
 *
 * The payload has no header and no length prefixes. Glyphs are ordered
 * size-major, then in glyph order:
 *
 * @code
 *   +---------------------------+---------------------------+-----
 *   | size 0: g0 g1 g2 ... gN   | size 1: g0 g1 g2 ... gN   | ...
 *   +---------------------------+---------------------------+-----
 * @endcode
 *
 * Every glyph at a size occupies packed_glyph_bytes(dimension, depth)
 * bytes. A reader needs the same bit depth, size list and codepage table
 * to interpret it.
 *
 * @section stream_failures Rasterization Failures
 *
 * A character that fails to rasterize at a size is left out of that size's
 * stream: no placeholder bytes are written, a warning is logged and the
 * omission is listed in glyph_stream::skipped. The stream for that size
 * then holds fewer glyphs than the codepage table has entries; callers can
 * detect this through glyph_stream::complete().
 */

#pragma once

#include <bitfont/export.h>
#include <bitfont/codepage/glyph_order.hh>
#include <bitfont/pixel/pixel_packer.hh>
#include <bitfont/raster/glyph_rasterizer.hh>
#include <bitfont/raster/size_descriptor.hh>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace bitfont {
    /**
     * @brief A glyph left out of the payload.
     */
    struct BITFONT_EXPORT skipped_glyph {
        std::size_t size_index = 0;  ///< Index into the size list
        std::size_t glyph_index = 0; ///< Index into the glyph order
        char32_t codepoint = 0;
        std::string reason;          ///< Rasterizer diagnostic
    };

    /**
     * @brief Per-size statistics of an assembled payload.
     */
    struct BITFONT_EXPORT size_stream_info {
        size_descriptor size;
        std::size_t glyphs_packed = 0;  ///< Glyphs actually written
        std::size_t offset = 0;         ///< Byte offset of this size's stream
        std::size_t bytes = 0;          ///< Byte length of this size's stream
    };

    /**
     * @brief Assembled payload plus its report.
     */
    struct BITFONT_EXPORT glyph_stream {
        std::vector<std::uint8_t> payload;
        std::vector<size_stream_info> sizes;
        std::vector<skipped_glyph> skipped;

        /// True when every size holds exactly glyph_count glyphs
        [[nodiscard]] bool complete(std::size_t glyph_count) const noexcept;
    };

    /**
     * @brief Rasterizes and packs a glyph order at every configured size.
     *
     * The assembler borrows its rasterizer; the rasterizer must outlive it.
     */
    class BITFONT_EXPORT glyph_stream_assembler {
    public:
        glyph_stream_assembler(glyph_rasterizer& rasterizer,
                               bit_depth depth,
                               std::vector<size_descriptor> sizes);

        /**
         * @brief Build the payload for a glyph order.
         *
         * @throws std::runtime_error if the rasterizer returns a raster whose
         *         dimension differs from the requested size
         */
        [[nodiscard]] glyph_stream assemble(const std::vector<admitted_character>& order) const;

        /**
         * @brief Rasterize and pack a single glyph.
         * @return Packed bytes, or empty if rasterization failed (reason set)
         */
        [[nodiscard]] std::vector<std::uint8_t> pack_glyph(char32_t codepoint,
                                                           const size_descriptor& size,
                                                           std::string& reason) const;

        [[nodiscard]] bit_depth depth() const noexcept { return m_depth; }

        [[nodiscard]] const std::vector<size_descriptor>& sizes() const noexcept { return m_sizes; }

    private:
        glyph_rasterizer& m_rasterizer;
        bit_depth m_depth;
        std::vector<size_descriptor> m_sizes;
    };

    /**
     * @brief Expected payload length when every glyph rasterizes.
     */
    [[nodiscard]] BITFONT_EXPORT std::size_t expected_payload_bytes(const std::vector<size_descriptor>& sizes,
                                                                    std::size_t glyph_count,
                                                                    bit_depth depth) noexcept;
} // namespace bitfont
