/**
 * @file codepage_table.hh
 * @brief Codepage identifier to UTF-8 lookup table.
 *
 * The runtime maps each two-byte codepage identifier back to a UTF-8
 * sequence through a generated C array. Each entry stores the first three
 * bytes of the character's UTF-8 encoding, zero-padded on the right:
 *
 * | Character | UTF-8 | Payload |
 * |-----------|-------|---------|
 * | 'A' (U+0041) | 41 | 41 00 00 |
 * | 'é' (U+00E9) | C3 A9 | C3 A9 00 |
 * | '中' (U+4E2D) | E4 B8 AD | E4 B8 AD |
 * | U+1F600 | F0 9F 98 80 | F0 9F 98 (truncated) |
 *
 * Entries render to a fixed literal shape so that regenerating a table
 * produces a stable textual diff:
 *
 * @code
 * static const chinese_entry codepage_to_utf8[IMAGE_FONT_MULTIBYTE_SIMP_CHINESE_MAX_CHARS] = {
 *     {0x8080, {0xe4, 0xb8, 0xad}},
 *     {0x8081, {0xe6, 0x96, 0x87}},
 * };
 * @endcode
 */

#pragma once

#include <bitfont/export.h>
#include <bitfont/codepage/glyph_order.hh>
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace bitfont {
    /// Bytes of UTF-8 kept per entry
    inline constexpr std::size_t CODEPAGE_PAYLOAD_BYTES = 3;

    using codepage_payload = std::array<std::uint8_t, CODEPAGE_PAYLOAD_BYTES>;

    /**
     * @brief UTF-8 of a codepoint truncated or zero-padded to three bytes.
     */
    [[nodiscard]] BITFONT_EXPORT codepage_payload utf8_payload(char32_t codepoint);

    /**
     * @brief One row of the lookup table.
     */
    struct BITFONT_EXPORT codepage_entry {
        std::uint16_t id = 0;        ///< Codepage identifier
        char32_t codepoint = 0;      ///< Source character
        codepage_payload payload{};  ///< Truncated/padded UTF-8

        bool operator==(const codepage_entry&) const = default;
    };

    /**
     * @brief Names used when emitting the table as a C declaration.
     */
    struct BITFONT_EXPORT table_declaration {
        std::string entry_type = "chinese_entry";
        std::string array_name = "codepage_to_utf8";
        std::string count_macro = "IMAGE_FONT_MULTIBYTE_SIMP_CHINESE_MAX_CHARS";
    };

    /**
     * @brief Entry literal, e.g. "{0x8080, {0xe4, 0xb8, 0xad}}".
     */
    [[nodiscard]] BITFONT_EXPORT std::string format_entry(const codepage_entry& entry);

    /**
     * @brief Ordered codepage entries of one compilation run.
     */
    class BITFONT_EXPORT codepage_table {
    public:
        codepage_table() = default;

        /**
         * @brief Allocate identifiers for a glyph order and build the table.
         * @throws std::out_of_range if the codepage is exhausted
         */
        [[nodiscard]] static codepage_table build(const std::vector<admitted_character>& order);

        /**
         * @brief Zip pre-allocated identifiers with a glyph order.
         * @throws std::runtime_error if the two sizes differ
         */
        [[nodiscard]] static codepage_table build(const std::vector<admitted_character>& order,
                                                  const std::vector<std::uint16_t>& ids);

        [[nodiscard]] const std::vector<codepage_entry>& entries() const noexcept { return m_entries; }

        [[nodiscard]] std::size_t size() const noexcept { return m_entries.size(); }

        [[nodiscard]] bool empty() const noexcept { return m_entries.empty(); }

        /**
         * @brief Array body: one "<indent><entry>,\n" line per entry.
         *
         * This is the text spliced between the braces of an existing array.
         */
        [[nodiscard]] std::string render_body(std::string_view indent = "    ") const;

        /**
         * @brief Standalone declaration including the array header and "};".
         */
        [[nodiscard]] std::string render_declaration(const table_declaration& decl) const;

    private:
        std::vector<codepage_entry> m_entries;
    };
} // namespace bitfont
