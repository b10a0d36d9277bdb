/**
 * @file file_io.hh
 * @brief Whole-file read and write helpers.
 */

#pragma once

#include <bitfont/export.h>
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace bitfont {
    /**
     * @brief Read a file into memory.
     * @throws std::runtime_error if the file cannot be opened or read
     */
    BITFONT_EXPORT std::vector<uint8_t> read_binary_file(const std::filesystem::path& path);

    /**
     * @brief Read a file into a string, bytes unchanged.
     * @throws std::runtime_error if the file cannot be opened or read
     */
    BITFONT_EXPORT std::string read_text_file(const std::filesystem::path& path);

    /**
     * @brief Replace a file's contents.
     *
     * If writing fails the partially written file is removed before the
     * error propagates, so no truncated output is left behind.
     *
     * @throws std::runtime_error if the file cannot be created or written
     */
    BITFONT_EXPORT void write_binary_file(const std::filesystem::path& path, std::span<const uint8_t> data);

    /**
     * @brief Text flavour of write_binary_file().
     */
    BITFONT_EXPORT void write_text_file(const std::filesystem::path& path, std::string_view text);
} // namespace bitfont
