//
// Corpus deduplication
//

#include <bitfont/codepage/glyph_order.hh>
#include <bitfont/text/utf8.hh>
#include <utility>

namespace bitfont {

bool glyph_order_builder::add(char32_t codepoint) {
    const std::size_t position = m_position++;

    if (codepoint == U'\n' || codepoint == U'\r') {
        return false;
    }

    if (codepoint != IDEOGRAPHIC_SPACE) {
        if (!m_seen.insert(codepoint).second) {
            return false;
        }
    }

    m_order.push_back({codepoint, position});
    return true;
}

std::size_t glyph_order_builder::add_text(std::string_view utf8_text) {
    std::size_t admitted = 0;
    for (char32_t cp : utf8_codepoints(utf8_text)) {
        if (add(cp)) {
            ++admitted;
        }
    }
    return admitted;
}

const std::vector<admitted_character>& glyph_order_builder::characters() const noexcept {
    return m_order;
}

std::size_t glyph_order_builder::scanned() const noexcept {
    return m_position;
}

std::vector<admitted_character> glyph_order_builder::build() && {
    return std::move(m_order);
}

std::vector<admitted_character> build_glyph_order(std::string_view utf8_text) {
    glyph_order_builder builder;
    builder.add_text(utf8_text);
    return std::move(builder).build();
}

} // namespace bitfont
