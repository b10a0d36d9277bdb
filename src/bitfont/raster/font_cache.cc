//
// Run-scoped font face cache
//

#include <bitfont/raster/font_cache.hh>
#include <bitfont/utils/file_io.hh>
#include <failsafe/logger.hh>
#include <filesystem>
#include <stdexcept>

namespace bitfont {

    cached_face::cached_face(std::string path, float size, std::shared_ptr<const std::vector<uint8_t>> bytes)
        : font_path(std::move(path)),
          render_size(size),
          face(std::move(bytes)) {
    }

    font_cache::font_cache() = default;

    font_cache::~font_cache() = default;

    font_cache::font_cache(font_cache&&) noexcept = default;

    font_cache& font_cache::operator=(font_cache&&) noexcept = default;

    std::shared_ptr<const std::vector<uint8_t>> font_cache::load_file(const std::string& font_path) {
        auto it = m_files.find(font_path);
        if (it != m_files.end()) {
            return it->second;
        }

        std::shared_ptr<const std::vector<uint8_t>> bytes;
        std::error_code ec;
        if (!std::filesystem::is_regular_file(font_path, ec)) {
            LOG_WARN("font_cache", "Font not found:", font_path);
        } else {
            try {
                bytes = std::make_shared<const std::vector<uint8_t>>(read_binary_file(font_path));
                ++m_files_loaded;
            } catch (const std::runtime_error& e) {
                LOG_WARN("font_cache", "Font could not be read:", font_path, e.what());
            }
        }

        m_files.emplace(font_path, bytes);
        return bytes;
    }

    const cached_face* font_cache::get(const std::string& font_path, float render_size) {
        key k{font_path, render_size};
        auto it = m_faces.find(k);
        if (it != m_faces.end()) {
            return it->second.get();
        }

        std::unique_ptr<cached_face> face;
        if (auto bytes = load_file(font_path)) {
            face = std::make_unique<cached_face>(font_path, render_size, std::move(bytes));
            if (!face->face.is_valid()) {
                LOG_WARN("font_cache", "Not a usable TrueType/OpenType font:", font_path);
                face.reset();
            } else {
                LOG_DEBUG("font_cache", "Loaded", font_path, "at", render_size, "px");
            }
        }

        const cached_face* result = face.get();
        m_faces.emplace(std::move(k), std::move(face));
        return result;
    }

    std::size_t font_cache::size() const noexcept {
        return m_faces.size();
    }

    std::size_t font_cache::files_loaded() const noexcept {
        return m_files_loaded;
    }

} // namespace bitfont
