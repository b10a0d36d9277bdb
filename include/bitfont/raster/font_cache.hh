/**
 * @file font_cache.hh
 * @brief Run-scoped cache of loaded font faces.
 *
 * Faces are loaded once per (font path, render size) key and reused for
 * every character of the run. The cache is owned by its rasterizer and
 * lives as long as it does.
 *
 * @section cache_policy Policy
 *
 * - Entries are created lazily on the first request for a key.
 * - Entries are never evicted or invalidated during a run.
 * - A font file that fails to load is remembered as failed; later
 *   requests for it return nullptr without touching the disk again.
 * - File contents are shared between sizes of the same font.
 */

#pragma once

#include <bitfont/export.h>
#include <bitfont/utils/truetype_face.hh>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace bitfont {
    /**
     * @brief A font face ready to rasterize at one render size.
     */
    struct BITFONT_EXPORT cached_face {
        std::string font_path;      ///< Font identity
        float render_size = 0.0f;   ///< Em size in pixels
        truetype_face face;         ///< Shares the file bytes with other sizes

        cached_face(std::string path, float size, std::shared_ptr<const std::vector<uint8_t>> bytes);
    };

    /**
     * @brief Lazily populated (font path, size) -> face cache.
     */
    class BITFONT_EXPORT font_cache {
    public:
        font_cache();
        ~font_cache();

        /// @cond
        font_cache(const font_cache&) = delete;
        font_cache& operator=(const font_cache&) = delete;
        /// @endcond

        font_cache(font_cache&&) noexcept;
        font_cache& operator=(font_cache&&) noexcept;

        /**
         * @brief Get the face for a font at a size, loading it on first use.
         *
         * @param font_path Path to a TTF/OTF/TTC file
         * @param render_size Em size in pixels
         * @return The face, or nullptr if the font cannot be loaded
         */
        [[nodiscard]] const cached_face* get(const std::string& font_path, float render_size);

        /// Number of (font, size) entries, including failed ones
        [[nodiscard]] std::size_t size() const noexcept;

        /// Number of font files read from disk
        [[nodiscard]] std::size_t files_loaded() const noexcept;

    private:
        using key = std::pair<std::string, float>;

        std::shared_ptr<const std::vector<uint8_t>> load_file(const std::string& font_path);

        std::map<std::string, std::shared_ptr<const std::vector<uint8_t>>> m_files;
        std::map<key, std::unique_ptr<cached_face>> m_faces;
        std::size_t m_files_loaded = 0;
    };
} // namespace bitfont
