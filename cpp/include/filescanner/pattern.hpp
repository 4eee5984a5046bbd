// ==============================================================================
// filescanner/pattern.hpp - Сопоставление имён и строк
// ==============================================================================
//
// Назначение:
// - Glob (*, ?, [...], [!...]) по базовому имени файла, без учёта регистра
// - Поиск строк по альтернации ключевых слов (kw1|kw2|...), без учёта регистра
//
// Glob транслируется в std::regex один раз на секцию (GlobSet), чтобы не
// компилировать шаблоны заново для каждого файла.
//
// ==============================================================================

#ifndef FILESCANNER_PATTERN_HPP
#define FILESCANNER_PATTERN_HPP

#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace filescanner::pattern {

// ----------------------------------------------------------------------------
// Результат компиляции
// ----------------------------------------------------------------------------

template <typename T>
struct BuildResult {
    bool ok = false;
    std::optional<T> value;
    std::string error;
};

// ----------------------------------------------------------------------------
// GlobSet - набор скомпилированных glob шаблонов
// ----------------------------------------------------------------------------

class GlobSet {
public:
    /// Скомпилировать шаблоны; ошибка, если один из них не транслируется
    static BuildResult<GlobSet> build(const std::vector<std::string>& patterns);

    /// Имя совпадает хотя бы с одним шаблоном
    bool matches_any(std::string_view name) const;

    /// Количество шаблонов, с которыми совпадает имя
    std::size_t count_matches(std::string_view name) const;

    bool empty() const { return regexes_.empty(); }
    std::size_t size() const { return regexes_.size(); }

private:
    GlobSet() = default;

    std::vector<std::regex> regexes_;
};

// ----------------------------------------------------------------------------
// KeywordMatcher - альтернация ключевых слов
// ----------------------------------------------------------------------------

class KeywordMatcher {
public:
    /// Собрать regex "kw1|kw2|..." (ключевые слова трактуются как regex)
    static BuildResult<KeywordMatcher> build(const std::vector<std::string>& keywords);

    /// Строка содержит совпадение (поиск, а не полное совпадение)
    bool search(std::string_view line) const;

private:
    KeywordMatcher() = default;

    std::regex regex_;
};

// ----------------------------------------------------------------------------
// Свободные функции
// ----------------------------------------------------------------------------

/// Транслировать glob в ECMAScript regex (полное совпадение)
std::string glob_to_regex(std::string_view glob);

/// Собрать альтернацию из ключевых слов
std::string join_alternation(const std::vector<std::string>& keywords);

/// Проверить имя по одному glob шаблону (без учёта регистра).
/// Некорректный шаблон не совпадает ни с чем.
bool matches_glob(std::string_view name, std::string_view glob);

/// Проверить имя по списку glob шаблонов
bool matches_any(std::string_view name, const std::vector<std::string>& globs);

/// Найти в строке совпадение с альтернацией (без учёта регистра).
/// Длинные строки просматриваются окнами ограниченной длины.
/// @throws std::regex_error при некорректной альтернации
bool search_line(std::string_view line, std::string_view alternation);

}  // namespace filescanner::pattern

#endif  // FILESCANNER_PATTERN_HPP
