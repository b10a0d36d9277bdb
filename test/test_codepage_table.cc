//
// Unit tests for the codepage lookup table
//

#include <doctest/doctest.h>
#include <bitfont/codepage/codepage_table.hh>
#include <bitfont/codepage/glyph_order.hh>
#include <string>
#include <vector>

using namespace bitfont;

TEST_SUITE("codepage_table") {

    TEST_CASE("three-byte characters are stored whole") {
        const codepage_payload expected = {0xE4, 0xBD, 0xA0};
        CHECK(utf8_payload(0x4F60) == expected);
    }

    TEST_CASE("shorter encodings are zero padded") {
        const codepage_payload ascii = {0x41, 0x00, 0x00};
        CHECK(utf8_payload(U'A') == ascii);

        const codepage_payload latin = {0xC3, 0xA9, 0x00};
        CHECK(utf8_payload(0x00E9) == latin);
    }

    TEST_CASE("four-byte encodings are truncated") {
        // U+1F600 = F0 9F 98 80
        const codepage_payload expected = {0xF0, 0x9F, 0x98};
        CHECK(utf8_payload(0x1F600) == expected);
    }

    TEST_CASE("entry literal") {
        codepage_entry entry;
        entry.id = 0x8080;
        entry.codepoint = IDEOGRAPHIC_SPACE;
        entry.payload = utf8_payload(IDEOGRAPHIC_SPACE);
        CHECK(format_entry(entry) == "{0x8080, {0xe3, 0x80, 0x80}}");

        entry.id = 0x8180;
        entry.payload = utf8_payload(U'A');
        CHECK(format_entry(entry) == "{0x8180, {0x41, 0x00, 0x00}}");
    }

    TEST_CASE("table follows glyph order and allocated identifiers") {
        // U+3000, "A", U+3000
        auto table = codepage_table::build(build_glyph_order("\xE3\x80\x80" "A\xE3\x80\x80"));
        REQUIRE(table.size() == 3);
        CHECK(table.entries()[0].id == 0x8080);
        CHECK(table.entries()[0].codepoint == IDEOGRAPHIC_SPACE);
        CHECK(table.entries()[1].id == 0x8081);
        CHECK(table.entries()[1].codepoint == U'A');
        CHECK(table.entries()[2].id == 0x8082);
        CHECK(table.entries()[2].codepoint == IDEOGRAPHIC_SPACE);
    }

    TEST_CASE("explicit identifiers must match the order") {
        std::vector<admitted_character> order = {{U'A', 0}, {U'B', 1}};
        std::vector<std::uint16_t> ids = {0x9000};
        CHECK_THROWS((void)codepage_table::build(order, ids));

        ids.push_back(0x9001);
        auto table = codepage_table::build(order, ids);
        CHECK(table.entries()[1].id == 0x9001);
    }

    TEST_CASE("empty table") {
        auto table = codepage_table::build({});
        CHECK(table.empty());
        CHECK(table.render_body().empty());

        table_declaration decl;
        CHECK(table.render_declaration(decl) ==
              "static const chinese_entry codepage_to_utf8[IMAGE_FONT_MULTIBYTE_SIMP_CHINESE_MAX_CHARS] = {\n};\n");
    }

    TEST_CASE("rendered body and declaration") {
        // U+4F60 U+597D
        auto table = codepage_table::build(build_glyph_order("\xE4\xBD\xA0\xE5\xA5\xBD"));

        CHECK(table.render_body() ==
              "    {0x8080, {0xe4, 0xbd, 0xa0}},\n"
              "    {0x8081, {0xe5, 0xa5, 0xbd}},\n");
        CHECK(table.render_body("\t") ==
              "\t{0x8080, {0xe4, 0xbd, 0xa0}},\n"
              "\t{0x8081, {0xe5, 0xa5, 0xbd}},\n");

        table_declaration decl;
        decl.entry_type = "glyph_entry";
        decl.array_name = "lookup";
        decl.count_macro = "LOOKUP_SIZE";
        CHECK(table.render_declaration(decl) ==
              "static const glyph_entry lookup[LOOKUP_SIZE] = {\n"
              "    {0x8080, {0xe4, 0xbd, 0xa0}},\n"
              "    {0x8081, {0xe5, 0xa5, 0xbd}},\n"
              "};\n");
    }
}
