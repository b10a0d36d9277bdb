//
// Square grayscale raster
//

#include <utility>
#include <failsafe/enforce.hh>
#include <bitfont/raster/grayscale_raster.hh>

namespace bitfont {
    grayscale_raster::grayscale_raster() = default;

    grayscale_raster::grayscale_raster(std::uint16_t dimension, std::uint8_t fill)
        : m_dimension(dimension),
          m_samples(static_cast <std::size_t>(dimension) * dimension, fill) {
    }

    grayscale_raster::grayscale_raster(std::uint16_t dimension, std::vector <std::uint8_t> samples)
        : m_dimension(dimension), m_samples(std::move(samples)) {
        ENFORCE(m_samples.size() == static_cast <std::size_t>(dimension) * dimension);
    }

    std::uint16_t grayscale_raster::dimension() const noexcept { return m_dimension; }

    std::uint8_t grayscale_raster::pixel(std::uint16_t x, std::uint16_t y) const {
        ENFORCE(x < m_dimension && y < m_dimension);
        return m_samples[static_cast <std::size_t>(y) * m_dimension + x];
    }

    void grayscale_raster::set_pixel(std::uint16_t x, std::uint16_t y, std::uint8_t value) {
        ENFORCE(x < m_dimension && y < m_dimension);
        m_samples[static_cast <std::size_t>(y) * m_dimension + x] = value;
    }

    std::span <const std::uint8_t> grayscale_raster::row(std::uint16_t y) const {
        ENFORCE(y < m_dimension);
        return {m_samples.data() + static_cast <std::size_t>(y) * m_dimension, m_dimension};
    }

    std::span <const std::uint8_t> grayscale_raster::samples() const noexcept {
        return {m_samples.data(), m_samples.size()};
    }
}
