// ==============================================================================
// pattern.cpp - Сопоставление имён и строк
// ==============================================================================

#include "filescanner/pattern.hpp"

#include <cstring>

namespace filescanner::pattern {

namespace {

constexpr auto REGEX_FLAGS = std::regex::ECMAScript | std::regex::icase;

// Символы, которые надо экранировать вне класса символов
constexpr const char* REGEX_SPECIAL = "\\^$.|?*+()[]{}";

// std::regex (libstdc++) рекурсивен по символам входа: длинная строка с
// квантификатором переполняет стек. Поиск идёт окнами с перекрытием.
constexpr std::size_t MATCH_WINDOW = 2048;
constexpr std::size_t MATCH_OVERLAP = 256;

/// Поиск по строке окнами не длиннее MATCH_WINDOW.
/// Совпадение длиной до MATCH_OVERLAP на границе окон не теряется.
bool search_windowed(std::string_view line, const std::regex& re) {
    if (line.size() <= MATCH_WINDOW) {
        return std::regex_search(line.begin(), line.end(), re);
    }

    for (std::size_t pos = 0;; pos += MATCH_WINDOW - MATCH_OVERLAP) {
        std::string_view window = line.substr(pos, MATCH_WINDOW);
        bool at_end = pos + window.size() >= line.size();

        auto flags = std::regex_constants::match_default;
        if (pos > 0) {
            // ^ и \b учитывают символ перед окном
            flags |= std::regex_constants::match_prev_avail;
        }
        if (!at_end) {
            flags |= std::regex_constants::match_not_eol;
        }

        if (std::regex_search(window.begin(), window.end(), re, flags)) {
            return true;
        }
        if (at_end) {
            return false;
        }
    }
}

void append_escaped(std::string& out, char c) {
    if (c != '\0' && std::strchr(REGEX_SPECIAL, c) != nullptr) {
        out.push_back('\\');
    }
    out.push_back(c);
}

}  // namespace

// ----------------------------------------------------------------------------
// glob_to_regex
// ----------------------------------------------------------------------------

std::string glob_to_regex(std::string_view glob) {
    std::string out;
    out.reserve(glob.size() * 2 + 2);
    out.push_back('^');

    std::size_t i = 0;
    const std::size_t n = glob.size();
    while (i < n) {
        char c = glob[i++];
        if (c == '*') {
            // Схлопываем "**" в один квантификатор
            while (i < n && glob[i] == '*') {
                ++i;
            }
            out += "[\\s\\S]*";
        } else if (c == '?') {
            out += "[\\s\\S]";
        } else if (c == '[') {
            std::size_t j = i;
            if (j < n && glob[j] == '!') {
                ++j;
            }
            if (j < n && glob[j] == ']') {
                ++j;
            }
            while (j < n && glob[j] != ']') {
                ++j;
            }
            if (j >= n) {
                // Нет закрывающей скобки: '[' трактуется буквально
                out += "\\[";
                continue;
            }

            std::string_view body = glob.substr(i, j - i);
            i = j + 1;

            out.push_back('[');
            std::size_t k = 0;
            if (!body.empty() && body[0] == '!') {
                out.push_back('^');
                k = 1;
            }
            for (; k < body.size(); ++k) {
                char b = body[k];
                if (b == '\\' || b == ']' || b == '[' || b == '^') {
                    out.push_back('\\');
                }
                out.push_back(b);
            }
            out.push_back(']');
        } else {
            append_escaped(out, c);
        }
    }

    out.push_back('$');
    return out;
}

std::string join_alternation(const std::vector<std::string>& keywords) {
    std::string out;
    for (std::size_t i = 0; i < keywords.size(); ++i) {
        if (i > 0) {
            out.push_back('|');
        }
        out += keywords[i];
    }
    return out;
}

// ----------------------------------------------------------------------------
// GlobSet
// ----------------------------------------------------------------------------

BuildResult<GlobSet> GlobSet::build(const std::vector<std::string>& patterns) {
    BuildResult<GlobSet> result;
    GlobSet set;
    set.regexes_.reserve(patterns.size());

    for (const auto& p : patterns) {
        try {
            set.regexes_.emplace_back(glob_to_regex(p), REGEX_FLAGS);
        } catch (const std::regex_error& e) {
            result.error = "invalid glob pattern '" + p + "' - " + e.what();
            return result;
        }
    }

    result.ok = true;
    result.value = std::move(set);
    return result;
}

bool GlobSet::matches_any(std::string_view name) const {
    for (const auto& re : regexes_) {
        if (std::regex_match(name.begin(), name.end(), re)) {
            return true;
        }
    }
    return false;
}

std::size_t GlobSet::count_matches(std::string_view name) const {
    std::size_t count = 0;
    for (const auto& re : regexes_) {
        if (std::regex_match(name.begin(), name.end(), re)) {
            ++count;
        }
    }
    return count;
}

// ----------------------------------------------------------------------------
// KeywordMatcher
// ----------------------------------------------------------------------------

BuildResult<KeywordMatcher> KeywordMatcher::build(const std::vector<std::string>& keywords) {
    BuildResult<KeywordMatcher> result;
    if (keywords.empty()) {
        result.error = "no keywords to search for";
        return result;
    }

    KeywordMatcher matcher;
    std::string alternation = join_alternation(keywords);
    try {
        matcher.regex_ = std::regex(alternation, REGEX_FLAGS);
    } catch (const std::regex_error& e) {
        result.error = "invalid keyword pattern '" + alternation + "' - " + e.what();
        return result;
    }

    result.ok = true;
    result.value = std::move(matcher);
    return result;
}

bool KeywordMatcher::search(std::string_view line) const {
    return search_windowed(line, regex_);
}

// ----------------------------------------------------------------------------
// Свободные функции
// ----------------------------------------------------------------------------

bool matches_glob(std::string_view name, std::string_view glob) {
    try {
        std::regex re(glob_to_regex(glob), REGEX_FLAGS);
        return std::regex_match(name.begin(), name.end(), re);
    } catch (const std::regex_error&) {
        return false;
    }
}

bool matches_any(std::string_view name, const std::vector<std::string>& globs) {
    for (const auto& g : globs) {
        if (matches_glob(name, g)) {
            return true;
        }
    }
    return false;
}

bool search_line(std::string_view line, std::string_view alternation) {
    std::regex re(std::string(alternation), REGEX_FLAGS);
    return search_windowed(line, re);
}

}  // namespace filescanner::pattern
