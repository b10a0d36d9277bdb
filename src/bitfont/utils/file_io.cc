//
// Whole-file read and write helpers
//

#include <bitfont/utils/file_io.hh>
#include <failsafe/failsafe.hh>
#include <failsafe/logger.hh>
#include <fstream>
#include <system_error>

namespace bitfont {

    namespace {
        // Removes the target on scope exit unless released
        class partial_file_guard {
        public:
            explicit partial_file_guard(const std::filesystem::path& path)
                : m_path(path) {
            }

            ~partial_file_guard() {
                if (m_armed) {
                    std::error_code ec;
                    std::filesystem::remove(m_path, ec);
                    if (ec) {
                        LOG_ERROR("io", "Failed to remove partial file", m_path.string(), ec.message());
                    }
                }
            }

            void release() noexcept { m_armed = false; }

            partial_file_guard(const partial_file_guard&) = delete;
            partial_file_guard& operator=(const partial_file_guard&) = delete;

        private:
            std::filesystem::path m_path;
            bool m_armed = true;
        };
    }

    std::vector<uint8_t> read_binary_file(const std::filesystem::path& path) {
        std::ifstream file(path, std::ios::binary | std::ios::ate);
        THROW_IF(!file, std::runtime_error, "Cannot open file:", path.string());

        auto size = file.tellg();
        THROW_IF(size < 0, std::runtime_error, "Cannot determine size of file:", path.string());
        file.seekg(0, std::ios::beg);

        std::vector<uint8_t> data(static_cast<size_t>(size));
        THROW_IF(!file.read(reinterpret_cast<char*>(data.data()), size),
                 std::runtime_error, "Failed to read file:", path.string());

        return data;
    }

    std::string read_text_file(const std::filesystem::path& path) {
        auto data = read_binary_file(path);
        return {data.begin(), data.end()};
    }

    void write_binary_file(const std::filesystem::path& path, std::span<const uint8_t> data) {
        std::ofstream file(path, std::ios::binary | std::ios::trunc);
        THROW_IF(!file, std::runtime_error, "Cannot create file:", path.string());

        partial_file_guard guard(path);
        file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
        file.flush();
        THROW_IF(!file, std::runtime_error, "Failed to write file:", path.string());
        file.close();
        THROW_IF(file.fail(), std::runtime_error, "Failed to close file:", path.string());
        guard.release();
    }

    void write_text_file(const std::filesystem::path& path, std::string_view text) {
        write_binary_file(path, std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(text.data()), text.size()));
    }
}
