// ==============================================================================
// filescanner/config.hpp - Конфигурация сканирования
// ==============================================================================
//
// Назначение:
// - Модель секций сканирования ([Name] + Command/Keywords/Extensions/Files)
// - Парсинг текстового формата конфигурации
// - Перезапись строк "Example: " разрешёнными командами
//
// Формат:
//
//     # комментарий
//     [Section Name]
//     Command: grep -rniE "KEYWORDS" EXTENSIONS .
//     Example: <генерируется при каждом запуске>
//     Keywords: password, token
//     Extensions: *.conf, *.env
//     Files: id_rsa, *.kdbx
//
// ==============================================================================

#ifndef FILESCANNER_CONFIG_HPP
#define FILESCANNER_CONFIG_HPP

#include <filesystem>
#include <map>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace filescanner::config {

// ----------------------------------------------------------------------------
// ScanSection - одно правило конфигурации
// ----------------------------------------------------------------------------

struct ScanSection {
    std::string name;                     // Текст между [ и ]
    std::string command;                  // Шаблон команды (может быть пустым)
    std::vector<std::string> keywords;    // Keywords: (регистр не важен)
    std::vector<std::string> extensions;  // Extensions: glob по имени файла
    std::vector<std::string> files;       // Files: glob по имени файла

    /// Секция с пустым шаблоном парсится, но не выполняется
    bool executable() const { return !command.empty(); }
};

/// Разрешённые команды по имени секции (повторное имя перезаписывает)
using ResolvedCommands = std::map<std::string, std::string>;

// ----------------------------------------------------------------------------
// Ошибки
// ----------------------------------------------------------------------------

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// ----------------------------------------------------------------------------
// Префиксы ключей
// ----------------------------------------------------------------------------

constexpr std::string_view KEY_COMMAND = "Command: ";
constexpr std::string_view KEY_EXAMPLE = "Example: ";
constexpr std::string_view KEY_KEYWORDS = "Keywords: ";
constexpr std::string_view KEY_EXTENSIONS = "Extensions: ";
constexpr std::string_view KEY_FILES = "Files: ";

// ----------------------------------------------------------------------------
// API
// ----------------------------------------------------------------------------

/// Разобрать список через запятую, обрезая пробелы у каждого элемента.
/// Пустая строка -> пустой список.
std::vector<std::string> parse_list(std::string_view value);

/// Разобрать текст конфигурации в упорядоченный список секций.
///
/// - Пустые строки и строки, начинающиеся с '#', пропускаются
/// - "[Name]" открывает новую секцию; последняя секция выдаётся в конце ввода
/// - Значение "Example: " игнорируется (оно перегенерируется)
/// - Неизвестные строки молча игнорируются
std::vector<ScanSection> parse_config(std::string_view text);

/// Прочитать и разобрать файл конфигурации
/// @throws ConfigError если файл не удаётся прочитать
std::vector<ScanSection> load_config(const std::filesystem::path& path);

/// Прочитать файл целиком
/// @throws ConfigError если файл не удаётся прочитать
std::string read_config_text(const std::filesystem::path& path);

/// Построить новый текст конфигурации: каждая строка "Example: " внутри
/// секции с разрешённой командой заменяется на "Example: <cmd>", остальные
/// строки переносятся как есть. Каждая строка завершается '\n'.
std::string rewrite_examples(std::string_view text, const ResolvedCommands& resolved);

/// Перечитать файл, переписать строки Example и атомарно записать обратно
/// @throws ConfigError / std::runtime_error при ошибке ввода-вывода
void rewrite_config_file(const std::filesystem::path& path, const ResolvedCommands& resolved);

}  // namespace filescanner::config

#endif  // FILESCANNER_CONFIG_HPP
