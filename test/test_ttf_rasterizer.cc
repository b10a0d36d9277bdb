//
// Unit tests for glyph placement and the TrueType rasterizer fallback chain
//

#include <doctest/doctest.h>
#include <bitfont/raster/ttf_rasterizer.hh>
#include <bitfont/utils/file_io.hh>
#include "test_data.hh"
#include <algorithm>
#include <memory>
#include <string>
#include <utility>
#include <vector>

using namespace bitfont;
using namespace bitfont::test;

namespace {
    glyph_coverage solid_bitmap(int width, int height, std::uint8_t coverage) {
        glyph_coverage glyph;
        glyph.width = width;
        glyph.height = height;
        glyph.coverage.assign(static_cast<std::size_t>(width * height), coverage);
        return glyph;
    }

    truetype_face load_face(const std::string& path) {
        return truetype_face(std::make_shared<const std::vector<uint8_t>>(read_binary_file(path)));
    }

    std::vector<std::uint8_t> samples_of(const grayscale_raster& raster) {
        return {raster.samples().begin(), raster.samples().end()};
    }

    // Raster a face draws for a glyph, placed the way ttf_rasterizer places it
    std::vector<std::uint8_t> expected_raster(const truetype_face& face, int glyph, const size_descriptor& size) {
        auto coverage = face.render(glyph, size.render_size);
        REQUIRE(coverage.has_value());
        return samples_of(compose_glyph(*coverage, size.dimension));
    }
}

TEST_SUITE("compose_glyph") {

    TEST_CASE("empty bitmap gives a white canvas") {
        glyph_coverage glyph;
        auto raster = compose_glyph(glyph, 6);
        CHECK(raster.dimension() == 6);
        for (auto s : raster.samples()) {
            CHECK(s == RASTER_WHITE);
        }
    }

    TEST_CASE("glyph is centred vertically at its horizontal bearing") {
        auto glyph = solid_bitmap(2, 2, 255);
        glyph.left = 1;

        auto raster = compose_glyph(glyph, 4);
        // rows 1 and 2, columns 1 and 2
        for (std::uint16_t y = 0; y < 4; ++y) {
            for (std::uint16_t x = 0; x < 4; ++x) {
                CAPTURE(x);
                CAPTURE(y);
                const bool inked = x >= 1 && x <= 2 && y >= 1 && y <= 2;
                CHECK(raster.pixel(x, y) == (inked ? RASTER_BLACK : RASTER_WHITE));
            }
        }
    }

    TEST_CASE("coverage is inverted into a grayscale sample") {
        auto glyph = solid_bitmap(1, 1, 0x40);
        auto raster = compose_glyph(glyph, 3);
        CHECK(raster.pixel(0, 1) == 0xBF);
    }

    TEST_CASE("ink outside the canvas is clipped") {
        auto glyph = solid_bitmap(3, 6, 255);
        glyph.left = 2;

        auto raster = compose_glyph(glyph, 4);
        // top = (4 - 6) / 2 = -1: glyph rows 1..4 land on canvas rows 0..3
        for (std::uint16_t y = 0; y < 4; ++y) {
            CHECK(raster.pixel(0, y) == RASTER_WHITE);
            CHECK(raster.pixel(1, y) == RASTER_WHITE);
            CHECK(raster.pixel(2, y) == RASTER_BLACK);
            CHECK(raster.pixel(3, y) == RASTER_BLACK);
        }
    }

    TEST_CASE("negative bearing is clipped on the left") {
        auto glyph = solid_bitmap(2, 2, 255);
        glyph.left = -1;

        auto raster = compose_glyph(glyph, 2);
        CHECK(raster.pixel(0, 0) == RASTER_BLACK);
        CHECK(raster.pixel(1, 0) == RASTER_WHITE);
    }
}

TEST_SUITE("truetype_face") {

    TEST_CASE("bytes that are not a font give an invalid face") {
        truetype_face empty(nullptr);
        CHECK_FALSE(empty.is_valid());

        truetype_face short_data(std::make_shared<const std::vector<uint8_t>>(4, std::uint8_t{0}));
        CHECK_FALSE(short_data.is_valid());

        truetype_face junk(std::make_shared<const std::vector<uint8_t>>(64, std::uint8_t{'x'}));
        CHECK_FALSE(junk.is_valid());
        CHECK_FALSE(junk.glyph_index(U'A').has_value());
        CHECK_FALSE(junk.render(0, 12.0f).has_value());
    }

    TEST_CASE("glyph lookup in real fonts") {
        auto lato = load_face(test_fonts::lato());
        auto mono = load_face(test_fonts::source_code_pro());
        REQUIRE(lato.is_valid());
        REQUIRE(mono.is_valid());

        CHECK(lato.glyph_index(U'H').has_value());
        CHECK(lato.glyph_index(U' ').has_value());
        CHECK_FALSE(lato.glyph_index(0x0100).has_value());
        CHECK_FALSE(lato.glyph_index(0x4E2D).has_value());

        CHECK(mono.glyph_index(0x0100).has_value());
        CHECK_FALSE(mono.glyph_index(0x4E2D).has_value());
    }

    TEST_CASE("render size maps the em square") {
        // Lato 'H': x 174..1336, y 0..1433 in a 2000 unit em
        auto lato = load_face(test_fonts::lato());
        auto glyph = lato.glyph_index(U'H');
        REQUIRE(glyph.has_value());

        auto at20 = lato.render(*glyph, 20.0f);
        REQUIRE(at20.has_value());
        CHECK(at20->left == 1);
        CHECK(at20->top == -15);
        CHECK(at20->width == 13);
        CHECK(at20->height == 15);
        REQUIRE(at20->coverage.size() == 13u * 15u);
        CHECK(*std::max_element(at20->coverage.begin(), at20->coverage.end()) > 200);

        auto at40 = lato.render(*glyph, 40.0f);
        REQUIRE(at40.has_value());
        CHECK(at40->height == 29);
    }

    TEST_CASE("blank glyph renders no coverage") {
        auto lato = load_face(test_fonts::lato());
        auto space = lato.glyph_index(U' ');
        REQUIRE(space.has_value());

        auto coverage = lato.render(*space, 20.0f);
        REQUIRE(coverage.has_value());
        CHECK(coverage->coverage.empty());
        CHECK(coverage->width == 0);
    }

    TEST_CASE("face can be moved") {
        truetype_face a(nullptr);
        truetype_face b(std::move(a));
        CHECK_FALSE(b.is_valid());
    }
}

TEST_SUITE("ttf_rasterizer") {

    TEST_CASE("missing fonts leave no usable font") {
        temp_directory dir;
        ttf_rasterizer rasterizer({(dir / "absent.ttf").string(), "Arial Unicode MS"});

        auto result = rasterizer.rasterize(U'A', size_descriptor{12.0f, 12});
        CHECK_FALSE(result.ok());
        CHECK(result.error == "no usable font");
        CHECK(rasterizer.cache().files_loaded() == 0);
    }

    TEST_CASE("file that is not a font is rejected") {
        temp_directory dir;
        auto junk = dir.write("junk.ttf", std::string(64, 'x'));
        ttf_rasterizer rasterizer({junk.string()});

        auto result = rasterizer.rasterize(0x4E2D, size_descriptor{15.0f, 15});
        CHECK_FALSE(result.ok());
        CHECK(result.error == "no usable font");
        CHECK(rasterizer.cache().files_loaded() == 1);
    }

    TEST_CASE("failed loads are cached per font and size") {
        temp_directory dir;
        auto junk = dir.write("junk.ttf", std::string(64, 'x'));
        ttf_rasterizer rasterizer({junk.string()});

        (void)rasterizer.rasterize(U'A', size_descriptor{12.0f, 12});
        (void)rasterizer.rasterize(U'B', size_descriptor{12.0f, 12});
        CHECK(rasterizer.cache().size() == 1);

        (void)rasterizer.rasterize(U'A', size_descriptor{20.0f, 20});
        CHECK(rasterizer.cache().size() == 2);
        CHECK(rasterizer.cache().files_loaded() == 1);
    }

    TEST_CASE("primary font draws the glyphs it has") {
        const size_descriptor size{20.0f, 20};
        ttf_rasterizer rasterizer({test_fonts::lato(), test_fonts::source_code_pro()});

        auto result = rasterizer.rasterize(U'H', size);
        REQUIRE(result.ok());
        const auto& raster = *result.raster;
        REQUIRE(raster.dimension() == 20);

        auto lato = load_face(test_fonts::lato());
        CHECK(samples_of(raster) == expected_raster(lato, *lato.glyph_index(U'H'), size));

        // 13x15 ink box at x = 1, rows (20 - 15) / 2 = 2 to 16
        bool inked = false;
        for (std::uint16_t y = 0; y < 20; ++y) {
            CAPTURE(y);
            CHECK(raster.pixel(0, y) == RASTER_WHITE);
            for (std::uint16_t x = 0; x < 20; ++x) {
                const bool outside = y < 2 || y > 16 || x > 13;
                if (outside) {
                    CHECK(raster.pixel(x, y) == RASTER_WHITE);
                } else if (raster.pixel(x, y) < 0x40) {
                    inked = true;
                }
            }
        }
        CHECK(inked);
        CHECK(rasterizer.cache().files_loaded() == 1);
    }

    TEST_CASE("later font supplies a glyph the primary lacks") {
        const size_descriptor size{20.0f, 20};
        ttf_rasterizer rasterizer({test_fonts::lato(), test_fonts::source_code_pro()});

        auto result = rasterizer.rasterize(0x0100, size);
        REQUIRE(result.ok());

        auto mono = load_face(test_fonts::source_code_pro());
        CHECK(samples_of(*result.raster) == expected_raster(mono, *mono.glyph_index(0x0100), size));
        CHECK(rasterizer.cache().files_loaded() == 2);
    }

    TEST_CASE("missing glyph comes from the first font that loads") {
        temp_directory dir;
        const size_descriptor size{20.0f, 20};
        ttf_rasterizer rasterizer({(dir / "absent.ttf").string(), test_fonts::lato(),
                                   test_fonts::source_code_pro()});

        auto result = rasterizer.rasterize(0x4E2D, size);
        REQUIRE(result.ok());

        auto lato = load_face(test_fonts::lato());
        auto mono = load_face(test_fonts::source_code_pro());
        CHECK(samples_of(*result.raster) == expected_raster(lato, 0, size));
        CHECK(samples_of(*result.raster) != expected_raster(mono, 0, size));
    }

    TEST_CASE("usable font check") {
        temp_directory dir;
        const size_descriptor size{12.0f, 12};

        ttf_rasterizer none({(dir / "absent.ttf").string()});
        CHECK_FALSE(none.has_usable_font(size));

        ttf_rasterizer fallback({(dir / "absent.ttf").string(), test_fonts::source_code_pro()});
        CHECK(fallback.has_usable_font(size));
    }

    TEST_CASE("empty chain") {
        ttf_rasterizer rasterizer(std::vector<std::string>{});
        CHECK(rasterizer.font_chain().empty());
        CHECK_FALSE(rasterizer.rasterize(U'A', size_descriptor{12.0f, 12}).ok());
    }
}
