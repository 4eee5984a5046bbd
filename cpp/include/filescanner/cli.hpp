// ==============================================================================
// filescanner/cli.hpp - CLI парсинг
// ==============================================================================
//
// Назначение:
// - Парсинг argv
// - Генерация --help / --version
// - Диагностические ошибки CLI (exit code 2, как у clap/argparse)
//
// ==============================================================================

#ifndef FILESCANNER_CLI_HPP
#define FILESCANNER_CLI_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <variant>

namespace filescanner::cli {

// ----------------------------------------------------------------------------
// Глобальные опции
// ----------------------------------------------------------------------------

struct GlobalOptions {
    bool verbose = false;  // -v, --verbose
    bool quiet = false;    // -q, --quiet
};

// ----------------------------------------------------------------------------
// Команды
// ----------------------------------------------------------------------------

/// Сканирование (команда по умолчанию)
struct ScanCommand {
    std::filesystem::path config = "./filescanner.config";  // -c, --config
    std::filesystem::path root;                             // -r, --root (обязателен)
    std::filesystem::path output;                           // -o, --output
    bool jsonl = false;                                     // --jsonl
};

/// help - показать справку
struct HelpCommand {};

/// version - показать версию
struct VersionCommand {};

using Command = std::variant<ScanCommand, HelpCommand, VersionCommand>;

// ----------------------------------------------------------------------------
// Диагностика CLI
// ----------------------------------------------------------------------------

struct CliDiagnostic {
    int exit_code = 2;
    std::string stderr_message;
};

struct ParseResult {
    bool ok = false;
    GlobalOptions global;
    Command command;
    CliDiagnostic diagnostic;
};

// ----------------------------------------------------------------------------
// API
// ----------------------------------------------------------------------------

/// Парсить аргументы командной строки
ParseResult parse(int argc, char** argv);

/// Имя файла отчёта по умолчанию: findings_YYYYmmdd_HHMMSS.txt
std::string default_output_name();

/// Текст --help
std::string render_help();

/// Текст --version
std::string render_version();

// ----------------------------------------------------------------------------
// Константы
// ----------------------------------------------------------------------------

constexpr const char* VERSION = "1.0.0";

constexpr const char* ABOUT =
    "Recursively search filesystem for sensitive files and keywords based on config file.";

}  // namespace filescanner::cli

#endif  // FILESCANNER_CLI_HPP
