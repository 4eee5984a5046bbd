// ==============================================================================
// filescanner/scan.hpp - Выполнение секций сканирования
// ==============================================================================
//
// Назначение:
// - SearchMode - режим поиска секции (tagged variant)
// - resolve_command - подстановка KEYWORDS/EXTENSIONS/FILES в шаблон
// - search_content / locate_files / locate_and_dump - сами поиски
// - SectionExecutor - блок секции в отчёте + запуск поиска
//
// Режим определяется по шаблону команды, порядок проверки фиксирован:
//
//     "grep"                    -> ContentSearch
//     "find" и "-exec cat"      -> LocateAndDump
//     "find"                    -> Locate
//     иначе                     -> NoSearch
//
// Разрешённая команда служит только документацией и на поиск не влияет.
//
// ==============================================================================

#ifndef FILESCANNER_SCAN_HPP
#define FILESCANNER_SCAN_HPP

#include "filescanner/config.hpp"
#include "filescanner/discovery.hpp"
#include "filescanner/output.hpp"
#include "filescanner/report.hpp"

#include <filesystem>
#include <functional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace filescanner::scan {

// ----------------------------------------------------------------------------
// SearchMode
// ----------------------------------------------------------------------------

/// Поиск ключевых слов по строкам файлов
struct ContentSearch {};

/// Поиск файлов по имени с выводом содержимого
struct LocateAndDump {};

/// Поиск файлов по имени
struct Locate {};

/// Шаблон не распознан - только заголовок секции
struct NoSearch {};

using SearchMode = std::variant<ContentSearch, LocateAndDump, Locate, NoSearch>;

constexpr std::string_view CONTENT_MARKER = "grep";
constexpr std::string_view LOCATE_MARKER = "find";
constexpr std::string_view DUMP_MARKER = "-exec cat";

/// Определить режим по шаблону команды
SearchMode classify(std::string_view command);

/// Имя режима для отладочного вывода
const char* mode_name(const SearchMode& mode);

// ----------------------------------------------------------------------------
// Разрешённая команда
// ----------------------------------------------------------------------------

/// Подставить значения секции в шаблон.
///
/// - KEYWORDS   -> kw1|kw2
/// - EXTENSIONS -> --include="*.a" --include="*.b"   (если в шаблоне есть grep)
///                 \( -name "*.a" -o -name "*.b" \)  (иначе, если есть find)
/// - FILES      -> \( -name "f1" -o -name "f2" \)
///
/// Пустой список плейсхолдер не трогает. В конце "\\" схлопывается в "\".
std::string resolve_command(const config::ScanSection& section);

// ----------------------------------------------------------------------------
// Поиски
// ----------------------------------------------------------------------------

using ResultVisitor = std::function<void(report::ScanResult)>;

/// Ошибка компиляции шаблонов секции
class PatternError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Поиск строк, содержащих любое из ключевых слов.
/// Файлы фильтруются по extensions, если список не пуст, и читаются построчно.
/// При walk.check_interrupt флаг прерывания проверяется на каждой строке.
/// @return false, если обход корня был прерван ошибкой
/// @throws PatternError при некорректных шаблонах
bool search_content(const std::filesystem::path& root, const std::vector<std::string>& keywords,
                    const std::vector<std::string>& extensions, const io::WalkOptions& walk,
                    const ResultVisitor& visit);

/// Поиск файлов по имени.
/// extensions не пуст: каждый совпавший файл выдаётся один раз.
/// Иначе files: файл выдаётся по разу на каждый совпавший шаблон.
bool locate_files(const std::filesystem::path& root, const std::vector<std::string>& extensions,
                  const std::vector<std::string>& files, const io::WalkOptions& walk,
                  const ResultVisitor& visit);

/// Поиск файлов по имени с выдачей непустого содержимого
bool locate_and_dump(const std::filesystem::path& root, const std::vector<std::string>& patterns,
                     const io::WalkOptions& walk, const ResultVisitor& visit);

// ----------------------------------------------------------------------------
// SectionExecutor
// ----------------------------------------------------------------------------

struct SectionOutcome {
    std::string resolved_command;
    std::size_t result_count = 0;
    bool walk_complete = true;  // false: ошибка корня или некорректный шаблон
};

class SectionExecutor {
public:
    /// console - предупреждения о пропущенных секциях ([!]) и режим секции ([*])
    SectionExecutor(std::filesystem::path root, bool verbose, report::ReportSink& sink,
                    output::Writer& console);

    /// Выполнить секцию: заголовок в отчёт, метаданные (verbose), поиск,
    /// находки, "No matches found" (verbose, если находок нет)
    /// @throws platform::ScanInterrupted, report::ReportError
    SectionOutcome execute(const config::ScanSection& section);

private:
    bool run_mode(const config::ScanSection& section, const SearchMode& mode,
                  std::size_t& count);

    std::filesystem::path root_;
    bool verbose_;
    report::ReportSink& sink_;
    output::Writer& console_;
};

}  // namespace filescanner::scan

#endif  // FILESCANNER_SCAN_HPP
