//
// Codepage lookup table
//

#include <bitfont/codepage/codepage_table.hh>
#include <bitfont/codepage/code_allocator.hh>
#include <bitfont/text/utf8.hh>
#include <failsafe/enforce.hh>
#include <cstdio>

namespace bitfont {

codepage_payload utf8_payload(char32_t codepoint) {
    const std::string utf8 = utf8_encode(codepoint);
    codepage_payload payload{};
    for (std::size_t i = 0; i < payload.size() && i < utf8.size(); ++i) {
        payload[i] = static_cast<std::uint8_t>(utf8[i]);
    }
    return payload;
}

std::string format_entry(const codepage_entry& entry) {
    char buf[48];
    std::snprintf(buf, sizeof(buf), "{0x%04x, {0x%02x, 0x%02x, 0x%02x}}",
                  static_cast<unsigned>(entry.id),
                  static_cast<unsigned>(entry.payload[0]),
                  static_cast<unsigned>(entry.payload[1]),
                  static_cast<unsigned>(entry.payload[2]));
    return buf;
}

codepage_table codepage_table::build(const std::vector<admitted_character>& order) {
    return build(order, allocate_codes(order));
}

codepage_table codepage_table::build(const std::vector<admitted_character>& order,
                                     const std::vector<std::uint16_t>& ids) {
    ENFORCE(order.size() == ids.size());

    codepage_table table;
    table.m_entries.reserve(order.size());
    for (std::size_t i = 0; i < order.size(); ++i) {
        codepage_entry entry;
        entry.id = ids[i];
        entry.codepoint = order[i].codepoint;
        entry.payload = utf8_payload(order[i].codepoint);
        table.m_entries.push_back(entry);
    }
    return table;
}

std::string codepage_table::render_body(std::string_view indent) const {
    std::string out;
    out.reserve(m_entries.size() * (indent.size() + 32));
    for (const auto& entry : m_entries) {
        out.append(indent);
        out.append(format_entry(entry));
        out.append(",\n");
    }
    return out;
}

std::string codepage_table::render_declaration(const table_declaration& decl) const {
    std::string out = "static const " + decl.entry_type + " " + decl.array_name +
                      "[" + decl.count_macro + "] = {\n";
    out.append(render_body());
    out.append("};\n");
    return out;
}

} // namespace bitfont
