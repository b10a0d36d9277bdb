//
// Glyph sizes
//

#include <bitfont/raster/size_descriptor.hh>
#include <failsafe/failsafe.hh>
#include <charconv>
#include <cmath>
#include <limits>
#include <string>

namespace bitfont {

namespace {
    constexpr int MAX_DIMENSION = std::numeric_limits<std::uint16_t>::max();

    template<typename T>
    bool parse_whole(std::string_view text, T& value) {
        const char* first = text.data();
        const char* last = text.data() + text.size();
        auto [end, ec] = std::from_chars(first, last, value);
        return !text.empty() && ec == std::errc{} && end == last;
    }
}

std::vector<size_descriptor> default_size_descriptors() {
    return {
        {12.0f, 12},
        {15.0f, 15},
        {20.0f, 20}
    };
}

size_descriptor parse_size_descriptor(std::string_view text) {
    const auto colon = text.find(':');

    float render_size = 0.0f;
    if (!parse_whole(text.substr(0, colon), render_size) || !std::isfinite(render_size) ||
        render_size <= 0.0f || render_size > static_cast<float>(MAX_DIMENSION)) {
        THROW_INVALID_ARG("Invalid render size in", std::string(text));
    }

    int dimension = static_cast<int>(render_size);
    if (colon != std::string_view::npos && !parse_whole(text.substr(colon + 1), dimension)) {
        THROW_INVALID_ARG("Invalid raster dimension in", std::string(text));
    }
    if (dimension <= 0 || dimension > MAX_DIMENSION) {
        THROW_INVALID_ARG("Raster dimension out of range in", std::string(text));
    }

    return {render_size, static_cast<std::uint16_t>(dimension)};
}

} // namespace bitfont
