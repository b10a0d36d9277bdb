/**
 * @file glyph_order.hh
 * @brief Deduplicated, position-stable character sequence of a corpus.
 *
 * The glyph order drives both codepage identifier allocation and glyph
 * emission into the binary payload; the two must walk the same sequence.
 *
 * @section order_rules Admission Rules
 *
 * - Line feed and carriage return are ignored entirely.
 * - The first occurrence of a codepoint is admitted; later ones are not.
 * - U+3000 IDEOGRAPHIC SPACE is exempt from deduplication: every
 *   occurrence is admitted and receives its own identifier.
 *
 * @code{.cpp}
 * glyph_order_builder builder;
 * builder.add_text(corpus);
 * builder.add_text(translations);
 * auto order = std::move(builder).build();
 * @endcode
 */

#pragma once

#include <bitfont/export.h>
#include <cstddef>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace bitfont {
    /// Codepoint that is admitted on every occurrence
    inline constexpr char32_t IDEOGRAPHIC_SPACE = U'\u3000';

    /**
     * @brief A corpus character that survived deduplication.
     */
    struct BITFONT_EXPORT admitted_character {
        char32_t codepoint = 0;           ///< The character
        std::size_t corpus_position = 0;  ///< Index among scanned codepoints

        bool operator==(const admitted_character&) const = default;
    };

    /**
     * @brief Incremental corpus scanner producing the glyph order.
     *
     * Positions keep counting across add_text() calls, so several input
     * files behave like one concatenated corpus.
     */
    class BITFONT_EXPORT glyph_order_builder {
    public:
        /**
         * @brief Scan one codepoint.
         * @return true if it was admitted
         */
        bool add(char32_t codepoint);

        /**
         * @brief Scan every codepoint of a UTF-8 text.
         * @return Number of characters admitted from this text
         */
        std::size_t add_text(std::string_view utf8_text);

        /// Characters admitted so far
        [[nodiscard]] const std::vector<admitted_character>& characters() const noexcept;

        /// Codepoints scanned so far (including ignored and duplicate ones)
        [[nodiscard]] std::size_t scanned() const noexcept;

        /// Finish and take the glyph order
        [[nodiscard]] std::vector<admitted_character> build() &&;

    private:
        std::vector<admitted_character> m_order;
        std::unordered_set<char32_t> m_seen;
        std::size_t m_position = 0;
    };

    /**
     * @brief Glyph order of a single UTF-8 text.
     */
    [[nodiscard]] BITFONT_EXPORT std::vector<admitted_character> build_glyph_order(std::string_view utf8_text);
} // namespace bitfont
