//
// stb_truetype face
//

#include <bitfont/utils/truetype_face.hh>

// Disable warnings for stb_truetype (third-party header)
#if defined(__GNUC__) || defined(__clang__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wconversion"
#pragma GCC diagnostic ignored "-Wsign-conversion"
#pragma GCC diagnostic ignored "-Wold-style-cast"
#pragma GCC diagnostic ignored "-Wdouble-promotion"
#pragma GCC diagnostic ignored "-Wunused-function"
#if defined(__GNUC__) && !defined(__clang__)
#pragma GCC diagnostic ignored "-Wuseless-cast"
#endif
#endif

#define STB_TRUETYPE_IMPLEMENTATION
#include <stb_truetype.h>

#if defined(__GNUC__) || defined(__clang__)
#pragma GCC diagnostic pop
#endif

#include <utility>

namespace bitfont {

    namespace {
        // stb_truetype reads the sfnt/ttc header without bounds checks
        constexpr std::size_t MIN_FONT_BYTES = 12;
    }

    struct truetype_face::impl {
        std::shared_ptr<const std::vector<uint8_t>> bytes;
        stbtt_fontinfo info{};
        bool valid = false;

        impl(std::shared_ptr<const std::vector<uint8_t>> data, int face_index)
            : bytes(std::move(data)) {
            if (!bytes || bytes->size() < MIN_FONT_BYTES || face_index < 0) {
                return;
            }
            const int offset = stbtt_GetFontOffsetForIndex(bytes->data(), face_index);
            valid = offset >= 0 && stbtt_InitFont(&info, bytes->data(), offset) != 0;
        }
    };

    truetype_face::truetype_face(std::shared_ptr<const std::vector<uint8_t>> data, int face_index)
        : m_impl(std::make_unique<impl>(std::move(data), face_index)) {
    }

    truetype_face::~truetype_face() = default;

    truetype_face::truetype_face(truetype_face&& other) noexcept = default;

    truetype_face& truetype_face::operator=(truetype_face&& other) noexcept = default;

    bool truetype_face::is_valid() const noexcept {
        return m_impl && m_impl->valid;
    }

    std::optional<int> truetype_face::glyph_index(char32_t codepoint) const {
        if (!is_valid()) {
            return std::nullopt;
        }
        const int index = stbtt_FindGlyphIndex(&m_impl->info, static_cast<int>(codepoint));
        if (index == 0) {
            return std::nullopt;
        }
        return index;
    }

    std::optional<glyph_coverage> truetype_face::render(int glyph, float em_pixels) const {
        if (!is_valid()) {
            return std::nullopt;
        }

        const float scale = stbtt_ScaleForMappingEmToPixels(&m_impl->info, em_pixels);

        int x0 = 0, y0 = 0, x1 = 0, y1 = 0;
        stbtt_GetGlyphBitmapBox(&m_impl->info, glyph, scale, scale, &x0, &y0, &x1, &y1);

        glyph_coverage out;
        out.left = x0;
        out.top = y0;
        if (x1 <= x0 || y1 <= y0) {
            return out;
        }

        out.width = x1 - x0;
        out.height = y1 - y0;
        out.coverage.resize(static_cast<std::size_t>(out.width) * static_cast<std::size_t>(out.height));
        stbtt_MakeGlyphBitmap(&m_impl->info, out.coverage.data(), out.width, out.height, out.width,
                              scale, scale, glyph);
        return out;
    }

} // namespace bitfont
