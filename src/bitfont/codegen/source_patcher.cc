//
// Generated source patching
//

#include <bitfont/codegen/source_patcher.hh>
#include <bitfont/utils/file_io.hh>
#include <failsafe/failsafe.hh>
#include <failsafe/logger.hh>
#include <cctype>
#include <regex>
#include <system_error>
#include <utility>
#include <vector>

namespace bitfont {

namespace {

bool is_ident_start(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) != 0 || c == '_';
}

bool is_ident_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

// If a comment or literal starts at i, return the offset just past it;
// otherwise return i. Unterminated constructs run to the end of text.
std::size_t skip_non_code(std::string_view text, std::size_t i) {
    const std::size_t n = text.size();
    if (i >= n) return i;

    const char c = text[i];
    if (c == '/' && i + 1 < n) {
        if (text[i + 1] == '/') {
            auto eol = text.find('\n', i + 2);
            return eol == std::string_view::npos ? n : eol + 1;
        }
        if (text[i + 1] == '*') {
            auto end = text.find("*/", i + 2);
            return end == std::string_view::npos ? n : end + 2;
        }
    }

    if (c == '"' || c == '\'') {
        std::size_t j = i + 1;
        while (j < n && text[j] != c) {
            if (text[j] == '\\') ++j;
            ++j;
        }
        return j < n ? j + 1 : n;
    }

    return i;
}

bool is_identifier(std::string_view s) {
    if (s.empty() || !is_ident_start(s.front())) return false;
    for (char c : s) {
        if (!is_ident_char(c)) return false;
    }
    return true;
}

// '=' at i that is neither part of a comparison nor a compound assignment
bool is_assignment(std::string_view text, std::size_t i) {
    if (text[i] != '=') return false;
    if (i + 1 < text.size() && text[i + 1] == '=') return false;
    if (i > 0 && std::string_view("=!<>+-*/%&|^").find(text[i - 1]) != std::string_view::npos) return false;
    return true;
}

// Sibling file a patch is written to before it replaces the target
std::filesystem::path staging_path_for(const std::filesystem::path& target) {
    auto staging = target;
    staging += ".bitfont-tmp";
    return staging;
}

// Removes staging files left behind by an incomplete commit
class staged_writes {
public:
    staged_writes() = default;

    ~staged_writes() {
        for (const auto& path : m_paths) {
            std::error_code ec;
            std::filesystem::remove(path, ec);
        }
    }

    void add(std::filesystem::path path) { m_paths.push_back(std::move(path)); }

    staged_writes(const staged_writes&) = delete;
    staged_writes& operator=(const staged_writes&) = delete;

private:
    std::vector<std::filesystem::path> m_paths;
};

} // anonymous namespace

std::optional<std::size_t> match_brace(std::string_view text, std::size_t open) {
    if (open >= text.size() || text[open] != '{') {
        return std::nullopt;
    }

    int depth = 0;
    std::size_t i = open;
    while (i < text.size()) {
        const std::size_t next = skip_non_code(text, i);
        if (next != i) {
            i = next;
            continue;
        }
        if (text[i] == '{') {
            ++depth;
        } else if (text[i] == '}') {
            if (--depth == 0) {
                return i;
            }
        }
        ++i;
    }
    return std::nullopt;
}

std::optional<brace_span> find_array_braces(std::string_view text, std::string_view array_name) {
    const std::size_t n = text.size();
    std::size_t i = 0;

    while (i < n) {
        const std::size_t next = skip_non_code(text, i);
        if (next != i) {
            i = next;
            continue;
        }

        if (!is_ident_char(text[i])) {
            ++i;
            continue;
        }

        const std::size_t start = i;
        while (i < n && is_ident_char(text[i])) ++i;
        if (text.substr(start, i - start) != array_name) {
            continue;
        }

        // Look for "= {" before the statement ends
        bool seen_assign = false;
        std::size_t j = i;
        while (j < n) {
            const std::size_t after = skip_non_code(text, j);
            if (after != j) {
                j = after;
                continue;
            }
            const char c = text[j];
            if (c == ';') break;
            if (is_assignment(text, j)) seen_assign = true;
            if (c == '{') {
                if (!seen_assign) break;
                auto close = match_brace(text, j);
                if (!close) {
                    return std::nullopt;
                }
                return brace_span{j, *close};
            }
            ++j;
        }
    }
    return std::nullopt;
}

std::string replace_array_body(std::string_view text, std::string_view array_name, std::string_view body) {
    auto span = find_array_braces(text, array_name);
    THROW_IF(!span, std::runtime_error, "Array initializer not found or unbalanced:", std::string(array_name));

    std::string out;
    out.reserve(text.size() + body.size());
    out.append(text.substr(0, span->open + 1));
    out.push_back('\n');
    out.append(body);
    out.append(text.substr(span->close));
    return out;
}

std::string replace_define_value(std::string_view text, std::string_view macro, std::string_view value) {
    if (!is_identifier(macro)) {
        THROW_INVALID_ARG("Not a macro name:", std::string(macro));
    }

    const std::regex define_re("^(\\s*#\\s*define\\s+" + std::string(macro) + "\\s+)(\\S+)(.*)$");

    std::string out;
    out.reserve(text.size() + value.size());
    std::size_t replaced = 0;
    std::size_t pos = 0;

    while (pos < text.size()) {
        auto eol = text.find('\n', pos);
        const bool has_newline = eol != std::string_view::npos;
        std::string line(text.substr(pos, has_newline ? eol - pos : std::string_view::npos));
        const bool has_cr = !line.empty() && line.back() == '\r';
        if (has_cr) line.pop_back();

        std::smatch m;
        if (std::regex_match(line, m, define_re)) {
            line = m[1].str() + std::string(value) + m[3].str();
            ++replaced;
        }

        out.append(line);
        if (has_cr) out.push_back('\r');
        if (has_newline) out.push_back('\n');
        pos = has_newline ? eol + 1 : text.size();
    }

    THROW_IF(replaced == 0, std::runtime_error, "#define not found:", std::string(macro));
    return out;
}

std::string& patch_set::staged_text(const std::filesystem::path& file) {
    for (auto& [path, text] : m_files) {
        if (path == file) {
            return text;
        }
    }
    m_files.emplace_back(file, read_text_file(file));
    return m_files.back().second;
}

void patch_set::stage_array(const std::filesystem::path& file, std::string_view array_name, std::string_view body) {
    std::string& text = staged_text(file);
    text = replace_array_body(text, array_name, body);
    LOG_DEBUG("source_patcher", "Staged array", std::string(array_name), "in", file.string());
}

void patch_set::stage_define(const std::filesystem::path& file, std::string_view macro, std::string_view value) {
    std::string& text = staged_text(file);
    text = replace_define_value(text, macro, value);
    LOG_DEBUG("source_patcher", "Staged", std::string(macro), "=", std::string(value), "in", file.string());
}

std::size_t patch_set::commit() {
    staged_writes pending;
    for (const auto& [path, text] : m_files) {
        auto staging = staging_path_for(path);
        write_text_file(staging, text);
        pending.add(std::move(staging));
    }

    for (const auto& entry : m_files) {
        const auto& path = entry.first;
        std::error_code ec;
        std::filesystem::rename(staging_path_for(path), path, ec);
        THROW_IF(ec, std::runtime_error, "Cannot replace", path.string(), ":", ec.message());
        LOG_INFO("source_patcher", "Patched", path.string());
    }
    return m_files.size();
}

} // namespace bitfont
