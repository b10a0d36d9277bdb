//
// Glyph rasterizer interface
//

#include <bitfont/raster/glyph_rasterizer.hh>
#include <utility>

namespace bitfont {

rasterize_result rasterize_result::success(grayscale_raster r) {
    rasterize_result result;
    result.raster = std::move(r);
    return result;
}

rasterize_result rasterize_result::failure(std::string message) {
    rasterize_result result;
    result.error = std::move(message);
    return result;
}

glyph_rasterizer::~glyph_rasterizer() = default;

} // namespace bitfont
