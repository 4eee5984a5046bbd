// ==============================================================================
// text.cpp - Чтение файлов как текста
// ==============================================================================

#include "filescanner/text.hpp"

#include <fstream>
#include <sstream>

namespace filescanner::io {

namespace {

bool in_range(unsigned char c, unsigned char lo, unsigned char hi) {
    return c >= lo && c <= hi;
}

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v';
}

}  // namespace

// ----------------------------------------------------------------------------
// sanitize_utf8
// ----------------------------------------------------------------------------

std::string sanitize_utf8(std::string_view bytes) {
    std::string out;
    out.reserve(bytes.size());

    std::size_t i = 0;
    const std::size_t n = bytes.size();
    while (i < n) {
        auto c = static_cast<unsigned char>(bytes[i]);

        if (c < 0x80) {
            out.push_back(static_cast<char>(c));
            ++i;
            continue;
        }

        // Длина последовательности и допустимый диапазон второго байта
        std::size_t len = 0;
        unsigned char lo = 0x80;
        unsigned char hi = 0xBF;
        if (in_range(c, 0xC2, 0xDF)) {
            len = 2;
        } else if (c == 0xE0) {
            len = 3;
            lo = 0xA0;
        } else if (in_range(c, 0xE1, 0xEC) || in_range(c, 0xEE, 0xEF)) {
            len = 3;
        } else if (c == 0xED) {
            len = 3;
            hi = 0x9F;
        } else if (c == 0xF0) {
            len = 4;
            lo = 0x90;
        } else if (in_range(c, 0xF1, 0xF3)) {
            len = 4;
        } else if (c == 0xF4) {
            len = 4;
            hi = 0x8F;
        }

        if (len == 0) {
            out.append(REPLACEMENT_CHARACTER);
            ++i;
            continue;
        }

        // Максимальная валидная часть заменяется одним U+FFFD
        std::size_t k = 1;
        while (k < len && i + k < n) {
            auto b = static_cast<unsigned char>(bytes[i + k]);
            bool ok = (k == 1) ? in_range(b, lo, hi) : in_range(b, 0x80, 0xBF);
            if (!ok) {
                break;
            }
            ++k;
        }

        if (k == len) {
            out.append(bytes.substr(i, len));
        } else {
            out.append(REPLACEMENT_CHARACTER);
        }
        i += k;
    }

    return out;
}

// ----------------------------------------------------------------------------
// read_text_file
// ----------------------------------------------------------------------------

std::optional<std::string> read_text_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::nullopt;
    }

    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad()) {
        return std::nullopt;
    }
    return sanitize_utf8(ss.str());
}

// ----------------------------------------------------------------------------
// Строки
// ----------------------------------------------------------------------------

bool for_each_file_line(const std::filesystem::path& path, const LineVisitor& fn) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return false;
    }

    std::string line;
    std::size_t line_no = 0;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        fn(++line_no, sanitize_utf8(line));
    }
    return !in.bad();
}

bool is_blank(std::string_view text) {
    for (char c : text) {
        if (!is_space(c)) {
            return false;
        }
    }
    return true;
}

}  // namespace filescanner::io
