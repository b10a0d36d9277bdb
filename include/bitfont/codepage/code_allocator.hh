/**
 * @file code_allocator.hh
 * @brief Two-byte codepage identifier allocation.
 *
 * The runtime's text encoding mixes single-byte ASCII with two-byte
 * codepage identifiers. To keep the two apart, no identifier may have a
 * low byte in [0x00, 0x7F]. Identifiers are handed out sequentially from
 * 0x8080, skipping the reserved low-byte range:
 *
 * @code
 *   0x8080 0x8081 ... 0x80FE 0x80FF
 *   0x8180 0x8181 ... 0x81FF
 *   ...
 *   0xFF80 ...        0xFFFF   <- last identifier
 * @endcode
 *
 * That gives 128 high bytes x 128 low bytes = 16384 identifiers. Asking
 * for more is an error rather than a silent wrap.
 */

#pragma once

#include <bitfont/export.h>
#include <bitfont/codepage/glyph_order.hh>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace bitfont {
    /**
     * @brief Sequential identifier allocator.
     */
    class BITFONT_EXPORT code_allocator {
    public:
        static constexpr std::uint16_t FIRST_ID = 0x8080;
        static constexpr std::uint16_t LAST_ID = 0xFFFF;
        static constexpr std::uint8_t RESERVED_LOW_LIMIT = 0x80;  ///< Low bytes below this are never used
        static constexpr std::size_t CAPACITY = 128 * 128;

        /**
         * @brief Identifier that follows id.
         *
         * A low byte of 0xFF carries into the high byte and resets the low
         * byte to 0x80; otherwise id + 1, moved to 0x80 if the low byte
         * wrapped to 0x00. The successor of 0xFFFF wraps to 0x0080 and is
         * not a valid identifier.
         */
        [[nodiscard]] static constexpr std::uint16_t successor(std::uint16_t id) noexcept {
            if ((id & 0xFFu) == 0xFFu) {
                return static_cast<std::uint16_t>((id & 0xFF00u) + 0x100u + 0x80u);
            }
            auto next = static_cast<std::uint16_t>(id + 1u);
            if ((next & 0xFFu) == 0x00u) {
                next = static_cast<std::uint16_t>(next + 0x80u);
            }
            return next;
        }

        /**
         * @brief Take the next identifier.
         * @throws std::out_of_range once all CAPACITY identifiers are used
         */
        std::uint16_t allocate();

        /// Identifier the next allocate() would return
        [[nodiscard]] std::uint16_t peek() const noexcept { return m_next; }

        /// Identifiers handed out so far
        [[nodiscard]] std::size_t allocated() const noexcept { return m_allocated; }

        [[nodiscard]] bool exhausted() const noexcept { return m_allocated >= CAPACITY; }

    private:
        std::uint16_t m_next = FIRST_ID;
        std::size_t m_allocated = 0;
    };

    /**
     * @brief One identifier per admitted character, in glyph order.
     * @throws std::out_of_range if the order has more than CAPACITY characters
     */
    [[nodiscard]] BITFONT_EXPORT std::vector<std::uint16_t> allocate_codes(
        const std::vector<admitted_character>& order);
} // namespace bitfont
