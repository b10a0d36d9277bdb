/**
 * @file source_patcher.hh
 * @brief In-place patching of generated C/C++ sources.
 *
 * The runtime keeps its codepage table and table size in checked-in
 * generated files. Rather than regenerating whole files, two narrow edits
 * are supported:
 *
 * - **Array body replacement**: everything between the `{` that opens the
 *   initializer of a named array and its matching `}` is replaced.
 *   Braces inside comments and string/character literals are ignored
 *   while matching.
 * - **Define rewrite**: the value of `#define NAME value` is replaced.
 *
 * @section patcher_staging Staging
 *
 * patch_set applies edits to in-memory copies first. Every edit is
 * validated when staged, so a missing array or macro is reported before
 * any file is touched; commit() then writes all staged files.
 *
 * Each file is first written to a sibling `<file>.bitfont-tmp`, and only
 * once every one of them is written are they renamed over their targets.
 * A failed write leaves the original sources as they were.
 *
 * @code{.cpp}
 * patch_set patches;
 * patches.stage_array("font_tables.c", "codepage_to_utf8", table.render_body());
 * patches.stage_define("font_tables.h", "IMAGE_FONT_MULTIBYTE_SIMP_CHINESE_MAX_CHARS",
 *                      std::to_string(table.size()));
 * // ... write other outputs ...
 * patches.commit();
 * @endcode
 */

#pragma once

#include <bitfont/export.h>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace bitfont {
    /**
     * @brief Positions of a matched brace pair.
     */
    struct BITFONT_EXPORT brace_span {
        std::size_t open = 0;   ///< Offset of '{'
        std::size_t close = 0;  ///< Offset of the matching '}'
    };

    /**
     * @brief Find the closing brace matching the '{' at offset open.
     * @return Offset of the matching '}', or nullopt if unbalanced
     */
    [[nodiscard]] BITFONT_EXPORT std::optional<std::size_t> match_brace(std::string_view text, std::size_t open);

    /**
     * @brief Locate the initializer braces of a named array.
     *
     * Looks for the identifier as a whole word, outside comments, followed
     * by an initializer `= {` before the next ';'.
     *
     * @return Brace positions, or nullopt if not found or unbalanced
     */
    [[nodiscard]] BITFONT_EXPORT std::optional<brace_span> find_array_braces(std::string_view text,
                                                                             std::string_view array_name);

    /**
     * @brief Replace the initializer body of a named array.
     *
     * The result has "{\n" + body + "}" where the old initializer was.
     *
     * @throws std::runtime_error if the array is not found
     */
    [[nodiscard]] BITFONT_EXPORT std::string replace_array_body(std::string_view text,
                                                                std::string_view array_name,
                                                                std::string_view body);

    /**
     * @brief Replace the value of every `#define macro value` line.
     *
     * @throws std::invalid_argument if macro is not an identifier
     * @throws std::runtime_error if no such define exists
     */
    [[nodiscard]] BITFONT_EXPORT std::string replace_define_value(std::string_view text,
                                                                  std::string_view macro,
                                                                  std::string_view value);

    /**
     * @brief Validated-then-committed set of file edits.
     */
    class BITFONT_EXPORT patch_set {
    public:
        /**
         * @brief Stage an array body replacement.
         * @throws std::runtime_error if the file cannot be read or the array is missing
         */
        void stage_array(const std::filesystem::path& file, std::string_view array_name, std::string_view body);

        /**
         * @brief Stage a define rewrite.
         * @throws std::runtime_error if the file cannot be read or the define is missing
         */
        void stage_define(const std::filesystem::path& file, std::string_view macro, std::string_view value);

        /**
         * @brief Write every staged file, replacing the targets by rename.
         * @return Number of files written
         * @throws std::runtime_error if a staging file cannot be written
         *         (no target is modified) or a rename fails
         */
        std::size_t commit();

        [[nodiscard]] bool empty() const noexcept { return m_files.empty(); }

        /// Staged files and their pending contents, in staging order
        [[nodiscard]] const std::vector<std::pair<std::filesystem::path, std::string>>& files() const noexcept {
            return m_files;
        }

    private:
        std::string& staged_text(const std::filesystem::path& file);

        std::vector<std::pair<std::filesystem::path, std::string>> m_files;
    };
} // namespace bitfont
