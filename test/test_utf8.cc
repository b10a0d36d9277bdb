//
// Unit tests for UTF-8 decoding and encoding
//

#include <doctest/doctest.h>
#include <bitfont/text/utf8.hh>
#include <vector>

using namespace bitfont;

TEST_SUITE("utf8") {

    TEST_CASE("decode ASCII") {
        auto [cp, len] = utf8_decode_one("Hello");
        CHECK(cp == 'H');
        CHECK(len == 1);
    }

    TEST_CASE("decode multi-byte UTF-8") {
        // U+00E9 = C3 A9
        auto [cp2, len2] = utf8_decode_one("\xC3\xA9");
        CHECK(cp2 == 0x00E9);
        CHECK(len2 == 2);

        // U+4E2D = E4 B8 AD
        auto [cp3, len3] = utf8_decode_one("\xE4\xB8\xAD");
        CHECK(cp3 == 0x4E2D);
        CHECK(len3 == 3);

        // U+3000 = E3 80 80
        auto [cp4, len4] = utf8_decode_one("\xE3\x80\x80");
        CHECK(cp4 == 0x3000);
        CHECK(len4 == 3);

        // U+1F600 = F0 9F 98 80
        auto [cp5, len5] = utf8_decode_one("\xF0\x9F\x98\x80");
        CHECK(cp5 == 0x1F600);
        CHECK(len5 == 4);
    }

    TEST_CASE("decode empty string") {
        auto [cp, len] = utf8_decode_one("");
        CHECK(cp == 0xFFFD);
        CHECK(len == 0);
    }

    TEST_CASE("invalid UTF-8 returns replacement character") {
        auto [cp1, len1] = utf8_decode_one("\xFF\xFE");
        CHECK(cp1 == 0xFFFD);
        CHECK(len1 == 1);

        auto [cp2, len2] = utf8_decode_one("\x80\x80");
        CHECK(cp2 == 0xFFFD);
        CHECK(len2 == 1);

        auto [cp3, len3] = utf8_decode_one("\xE4\xB8");
        CHECK(cp3 == 0xFFFD);
        CHECK(len3 == 1);
    }

    TEST_CASE("overlong encoding and surrogates rejected") {
        auto [cp1, len1] = utf8_decode_one("\xC0\xAF");
        CHECK(cp1 == 0xFFFD);

        auto [cp2, len2] = utf8_decode_one("\xED\xA0\x80");
        CHECK(cp2 == 0xFFFD);
    }

    TEST_CASE("iterate mixed script string") {
        std::vector<char32_t> codepoints;
        // "A", U+4E2D, U+3000, U+1F600
        for (char32_t cp : utf8_codepoints("A\xE4\xB8\xAD\xE3\x80\x80\xF0\x9F\x98\x80")) {
            codepoints.push_back(cp);
        }
        REQUIRE(codepoints.size() == 4);
        CHECK(codepoints[0] == 'A');
        CHECK(codepoints[1] == 0x4E2D);
        CHECK(codepoints[2] == 0x3000);
        CHECK(codepoints[3] == 0x1F600);
    }

    TEST_CASE("iterate empty string") {
        std::vector<char32_t> codepoints;
        for (char32_t cp : utf8_codepoints("")) {
            codepoints.push_back(cp);
        }
        CHECK(codepoints.empty());
    }

    TEST_CASE("malformed bytes resynchronize on the next byte") {
        std::vector<char32_t> codepoints;
        // bad lead, truncated 3-byte sequence, then "A"
        for (char32_t cp : utf8_codepoints("\xFF\xE4\xB8" "A")) {
            codepoints.push_back(cp);
        }
        const std::vector<char32_t> expected = {REPLACEMENT_CHARACTER, REPLACEMENT_CHARACTER,
                                                REPLACEMENT_CHARACTER, U'A'};
        CHECK(codepoints == expected);
    }

    TEST_CASE("iterator offsets and equality") {
        utf8_codepoints text("A\xE4\xB8\xAD" "B");
        auto it = text.begin();
        CHECK(it == text.begin());
        CHECK(it.offset() == 0);

        auto old = it++;
        CHECK(*old == 'A');
        CHECK(*it == 0x4E2D);
        CHECK(it.offset() == 1);
        CHECK(it != text.begin());

        ++it;
        CHECK(*it == 'B');
        CHECK(it.offset() == 4);
        ++it;
        CHECK(it == text.end());
    }

    TEST_CASE("encode by sequence length") {
        CHECK(utf8_encode(U'A') == "A");
        CHECK(utf8_encode(0x00E9) == "\xC3\xA9");
        CHECK(utf8_encode(0x4E2D) == "\xE4\xB8\xAD");
        CHECK(utf8_encode(0x3000) == "\xE3\x80\x80");
        CHECK(utf8_encode(0x1F600) == "\xF0\x9F\x98\x80");
    }

    TEST_CASE("encode invalid codepoints as replacement character") {
        CHECK(utf8_encode(0xD800) == "\xEF\xBF\xBD");
        CHECK(utf8_encode(0x110000) == "\xEF\xBF\xBD");
    }

    TEST_CASE("encoded text decodes back") {
        for (char32_t cp : {char32_t{0x24}, char32_t{0x7FF}, char32_t{0xFFFF}, char32_t{0x10FFFF}}) {
            const std::string bytes = utf8_encode(cp);
            auto [decoded, len] = utf8_decode_one(bytes);
            CHECK(decoded == cp);
            CHECK(static_cast<std::size_t>(len) == bytes.size());
        }
    }

    TEST_CASE("format_codepoint") {
        CHECK(format_codepoint(0x41) == "U+0041");
        CHECK(format_codepoint(0x3000) == "U+3000");
        CHECK(format_codepoint(0x1F600) == "U+1F600");
    }
}
