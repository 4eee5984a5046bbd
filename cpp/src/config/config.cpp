// ==============================================================================
// config.cpp - Конфигурация сканирования
// ==============================================================================

#include "filescanner/config.hpp"

#include "filescanner/platform.hpp"

#include <fstream>
#include <optional>
#include <sstream>

namespace filescanner::config {

namespace {

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v';
}

std::string_view trim_right(std::string_view s) {
    while (!s.empty() && is_space(s.back())) {
        s.remove_suffix(1);
    }
    return s;
}

std::string_view trim(std::string_view s) {
    s = trim_right(s);
    while (!s.empty() && is_space(s.front())) {
        s.remove_prefix(1);
    }
    return s;
}

bool starts_with(std::string_view s, std::string_view prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

/// "[Name]" -> "Name"
std::optional<std::string_view> section_header(std::string_view line) {
    if (line.size() >= 2 && line.front() == '[' && line.back() == ']') {
        return line.substr(1, line.size() - 2);
    }
    return std::nullopt;
}

/// Перебрать строки текста (последняя строка без '\n' тоже выдаётся)
template <typename Fn>
void for_each_line(std::string_view text, Fn&& fn) {
    std::size_t pos = 0;
    while (pos < text.size()) {
        std::size_t nl = text.find('\n', pos);
        if (nl == std::string_view::npos) {
            fn(text.substr(pos));
            return;
        }
        fn(text.substr(pos, nl - pos));
        pos = nl + 1;
    }
}

}  // namespace

// ----------------------------------------------------------------------------
// parse_list
// ----------------------------------------------------------------------------

std::vector<std::string> parse_list(std::string_view value) {
    std::vector<std::string> items;
    if (value.empty()) {
        return items;
    }

    std::size_t pos = 0;
    while (true) {
        std::size_t comma = value.find(',', pos);
        std::string_view item =
            value.substr(pos, comma == std::string_view::npos ? std::string_view::npos : comma - pos);
        items.emplace_back(trim(item));
        if (comma == std::string_view::npos) {
            break;
        }
        pos = comma + 1;
    }
    return items;
}

// ----------------------------------------------------------------------------
// parse_config
// ----------------------------------------------------------------------------

std::vector<ScanSection> parse_config(std::string_view text) {
    std::vector<ScanSection> sections;
    std::optional<ScanSection> current;

    for_each_line(text, [&](std::string_view raw) {
        std::string_view line = trim_right(raw);

        if (line.empty() || line.front() == '#') {
            return;
        }

        if (auto name = section_header(line)) {
            if (current.has_value()) {
                sections.push_back(std::move(*current));
            }
            current = ScanSection{};
            current->name = std::string(*name);
            return;
        }

        // Ключи вне секции не к чему привязать
        if (!current.has_value()) {
            return;
        }

        if (starts_with(line, KEY_COMMAND)) {
            current->command = std::string(trim(line.substr(KEY_COMMAND.size())));
        } else if (starts_with(line, KEY_EXAMPLE)) {
            // Перегенерируется после сканирования
        } else if (starts_with(line, KEY_KEYWORDS)) {
            current->keywords = parse_list(line.substr(KEY_KEYWORDS.size()));
        } else if (starts_with(line, KEY_EXTENSIONS)) {
            current->extensions = parse_list(line.substr(KEY_EXTENSIONS.size()));
        } else if (starts_with(line, KEY_FILES)) {
            current->files = parse_list(line.substr(KEY_FILES.size()));
        }
    });

    if (current.has_value()) {
        sections.push_back(std::move(*current));
    }

    return sections;
}

// ----------------------------------------------------------------------------
// Чтение файла
// ----------------------------------------------------------------------------

std::string read_config_text(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw ConfigError("failed to open config file - " + platform::path_to_utf8(path));
    }

    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad()) {
        throw ConfigError("failed to read config file - " + platform::path_to_utf8(path));
    }
    return ss.str();
}

std::vector<ScanSection> load_config(const std::filesystem::path& path) {
    return parse_config(read_config_text(path));
}

// ----------------------------------------------------------------------------
// Перезапись Example
// ----------------------------------------------------------------------------

std::string rewrite_examples(std::string_view text, const ResolvedCommands& resolved) {
    std::string out;
    out.reserve(text.size() + 64);

    std::optional<std::string> current;

    for_each_line(text, [&](std::string_view raw) {
        std::string_view line = trim_right(raw);

        if (auto name = section_header(line)) {
            current = std::string(*name);
        } else if (starts_with(line, KEY_EXAMPLE) && current.has_value()) {
            auto it = resolved.find(*current);
            if (it != resolved.end()) {
                out.append(KEY_EXAMPLE);
                out.append(it->second);
                // Окончание строки сохраняется: CRLF-файл остаётся CRLF
                if (!raw.empty() && raw.back() == '\r') {
                    out.push_back('\r');
                }
                out.push_back('\n');
                return;
            }
        }

        // Остальные строки - байт в байт (включая '\r' и хвостовые пробелы)
        out.append(raw);
        out.push_back('\n');
    });

    return out;
}

void rewrite_config_file(const std::filesystem::path& path, const ResolvedCommands& resolved) {
    std::string text = read_config_text(path);
    platform::replace_file_contents(path, rewrite_examples(text, resolved));
}

}  // namespace filescanner::config
