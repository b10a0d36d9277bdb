/**
 * @file utf8.hh
 * @brief UTF-8 decoding and encoding for corpus scanning.
 *
 * The corpus and translation files are read as raw bytes. utf8_codepoints
 * walks that text one codepoint at a time; utf8_encode turns a codepoint
 * back into the bytes stored in a codepage table entry.
 *
 * | Bytes | Range | Lead byte |
 * |-------|-------|-----------|
 * | 1 | U+0000 - U+007F | 0xxxxxxx |
 * | 2 | U+0080 - U+07FF | 110xxxxx |
 * | 3 | U+0800 - U+FFFF | 1110xxxx |
 * | 4 | U+10000 - U+10FFFF | 11110xxx |
 *
 * @section utf8_errors Malformed input
 *
 * Malformed sequences decode to U+FFFD and are scanned like any other
 * character. A bad lead byte, a truncated sequence or a missing
 * continuation byte consumes one byte, so decoding resynchronizes on the
 * next byte. Overlong forms, surrogates and values above U+10FFFF consume
 * the whole sequence.
 */

#pragma once

#include <bitfont/export.h>
#include <cstddef>
#include <iterator>
#include <string>
#include <string_view>

namespace bitfont {
    /// Substituted for every malformed sequence
    inline constexpr char32_t REPLACEMENT_CHARACTER = 0xFFFD;

    /**
     * @brief One decoded codepoint and the number of bytes it used.
     */
    struct BITFONT_EXPORT utf8_decode_result {
        char32_t codepoint;  ///< U+FFFD on malformed or empty input
        int bytes_consumed;  ///< 0 only for empty input
    };

    /**
     * @brief Decode the codepoint at the start of @p str.
     */
    [[nodiscard]] BITFONT_EXPORT utf8_decode_result utf8_decode_one(std::string_view str);

    /**
     * @brief Encode a codepoint as 1 to 4 UTF-8 bytes.
     *
     * Surrogates and values above U+10FFFF are encoded as U+FFFD.
     */
    [[nodiscard]] BITFONT_EXPORT std::string utf8_encode(char32_t codepoint);

    /**
     * @brief "U+XXXX" notation for log messages (at least four hex digits).
     */
    [[nodiscard]] BITFONT_EXPORT std::string format_codepoint(char32_t codepoint);

    /**
     * @brief Forward range over the codepoints of a UTF-8 string.
     *
     * The range does not own the text.
     *
     * @code{.cpp}
     * for (char32_t cp : utf8_codepoints(corpus)) {
     *     builder.add(cp);
     * }
     * @endcode
     */
    class BITFONT_EXPORT utf8_codepoints {
    public:
        class BITFONT_EXPORT iterator {
        public:
            using value_type = char32_t;
            using difference_type = std::ptrdiff_t;
            using pointer = const char32_t*;
            using reference = char32_t;
            using iterator_category = std::forward_iterator_tag;

            iterator() = default;

            iterator(std::string_view text, std::size_t offset);

            char32_t operator*() const noexcept { return m_value; }

            iterator& operator++();

            iterator operator++(int);

            /// Byte offset of the current codepoint
            [[nodiscard]] std::size_t offset() const noexcept { return m_offset; }

            bool operator==(const iterator& other) const noexcept {
                return m_text.data() == other.m_text.data() && m_offset == other.m_offset;
            }

        private:
            void decode();

            std::string_view m_text;
            std::size_t m_offset = 0;
            std::size_t m_next = 0;
            char32_t m_value = 0;
        };

        explicit utf8_codepoints(std::string_view text) noexcept
            : m_text(text) {
        }

        [[nodiscard]] iterator begin() const { return {m_text, 0}; }

        [[nodiscard]] iterator end() const { return {m_text, m_text.size()}; }

    private:
        std::string_view m_text;
    };
} // namespace bitfont
