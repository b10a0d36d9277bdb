//
// UTF-8 decoding and encoding
//

#include <bitfont/text/utf8.hh>
#include <cstdio>

namespace bitfont {

namespace {

struct sequence_shape {
    int length;         // 0 for bytes that cannot start a sequence
    char32_t payload;   // value bits carried by the lead byte
    char32_t minimum;   // smallest codepoint that needs this length
};

constexpr sequence_shape shape_of(unsigned char lead) {
    if (lead < 0x80) return {1, lead, 0};
    if ((lead & 0xE0) == 0xC0) return {2, static_cast<char32_t>(lead & 0x1Fu), 0x80};
    if ((lead & 0xF0) == 0xE0) return {3, static_cast<char32_t>(lead & 0x0Fu), 0x800};
    if ((lead & 0xF8) == 0xF0) return {4, static_cast<char32_t>(lead & 0x07u), 0x10000};
    return {0, 0, 0};
}

constexpr bool is_scalar_value(char32_t cp) {
    return cp <= 0x10FFFF && (cp < 0xD800 || cp > 0xDFFF);
}

} // anonymous namespace

utf8_decode_result utf8_decode_one(std::string_view str) {
    if (str.empty()) {
        return {REPLACEMENT_CHARACTER, 0};
    }

    const sequence_shape shape = shape_of(static_cast<unsigned char>(str[0]));
    if (shape.length == 0 || str.size() < static_cast<std::size_t>(shape.length)) {
        return {REPLACEMENT_CHARACTER, 1};
    }

    char32_t cp = shape.payload;
    for (int i = 1; i < shape.length; ++i) {
        const auto byte = static_cast<unsigned char>(str[static_cast<std::size_t>(i)]);
        if ((byte & 0xC0) != 0x80) {
            return {REPLACEMENT_CHARACTER, 1};
        }
        cp = (cp << 6) | (byte & 0x3Fu);
    }

    if (cp < shape.minimum || !is_scalar_value(cp)) {
        return {REPLACEMENT_CHARACTER, shape.length};
    }
    return {cp, shape.length};
}

std::string utf8_encode(char32_t codepoint) {
    if (!is_scalar_value(codepoint)) {
        codepoint = REPLACEMENT_CHARACTER;
    }

    if (codepoint < 0x80) {
        return std::string(1, static_cast<char>(codepoint));
    }

    // Continuation bytes are emitted back to front
    char buf[4];
    int length = codepoint < 0x800 ? 2 : codepoint < 0x10000 ? 3 : 4;
    for (int i = length - 1; i > 0; --i) {
        buf[i] = static_cast<char>(0x80 | (codepoint & 0x3F));
        codepoint >>= 6;
    }
    static constexpr unsigned char lead_marks[] = {0, 0, 0xC0, 0xE0, 0xF0};
    buf[0] = static_cast<char>(lead_marks[length] | codepoint);
    return std::string(buf, static_cast<std::size_t>(length));
}

std::string format_codepoint(char32_t codepoint) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "U+%04X", static_cast<unsigned>(codepoint));
    return buf;
}

utf8_codepoints::iterator::iterator(std::string_view text, std::size_t offset)
    : m_text(text),
      m_offset(offset) {
    decode();
}

void utf8_codepoints::iterator::decode() {
    if (m_offset >= m_text.size()) {
        m_offset = m_text.size();
        m_next = m_offset;
        m_value = 0;
        return;
    }
    auto [cp, bytes] = utf8_decode_one(m_text.substr(m_offset));
    m_value = cp;
    m_next = m_offset + static_cast<std::size_t>(bytes);
}

utf8_codepoints::iterator& utf8_codepoints::iterator::operator++() {
    m_offset = m_next;
    decode();
    return *this;
}

utf8_codepoints::iterator utf8_codepoints::iterator::operator++(int) {
    iterator before = *this;
    ++(*this);
    return before;
}

} // namespace bitfont
