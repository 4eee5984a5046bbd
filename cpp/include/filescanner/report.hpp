// ==============================================================================
// filescanner/report.hpp - Отчёт о сканировании
// ==============================================================================
//
// Назначение:
// - ScanResult - одна находка (строка файла, путь или дамп содержимого)
// - ReportSink - файл отчёта только на дозапись: заголовок, блоки секций,
//   подвал; каждая строка сбрасывается на диск сразу
// - Форматы: текст (по умолчанию) и JSON Lines (RapidJSON)
// - В verbose режиме каждая строка дублируется в stdout (всегда текстом)
//
// ==============================================================================

#ifndef FILESCANNER_REPORT_HPP
#define FILESCANNER_REPORT_HPP

#include "filescanner/output.hpp"

#include <cstdio>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>

namespace filescanner::report {

// ----------------------------------------------------------------------------
// ScanResult
// ----------------------------------------------------------------------------

struct ScanResult {
    enum class Kind {
        ContentMatch,  // path:line:text
        FileMatch,     // path
        FileDump       // === path === + содержимое
    };

    Kind kind = Kind::FileMatch;
    std::filesystem::path path;
    std::size_t line_number = 0;  // Только ContentMatch, с 1
    std::string text;             // Строка (ContentMatch) или содержимое (FileDump)

    static ScanResult content_match(std::filesystem::path p, std::size_t line, std::string text);
    static ScanResult file_match(std::filesystem::path p);
    static ScanResult file_dump(std::filesystem::path p, std::string content);

    /// Текстовое представление (для FileDump - заголовок, '\n', содержимое)
    std::string render() const;
};

/// Имя вида результата для JSON ("content" / "file" / "dump")
const char* kind_name(ScanResult::Kind kind);

// ----------------------------------------------------------------------------
// Формат отчёта
// ----------------------------------------------------------------------------

enum class Format {
    Text,  // Построчный текст
    Jsonl  // Один JSON объект на строку
};

struct ReportOptions {
    std::filesystem::path output_path;
    Format format = Format::Text;
    bool verbose = false;  // Дублировать строки в stdout
};

// ----------------------------------------------------------------------------
// Ошибки
// ----------------------------------------------------------------------------

class ReportError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// ----------------------------------------------------------------------------
// ReportSink
// ----------------------------------------------------------------------------

class ReportSink {
public:
    ReportSink(ReportOptions opt, output::Writer& console);
    ~ReportSink();

    ReportSink(const ReportSink&) = delete;
    ReportSink& operator=(const ReportSink&) = delete;

    /// Создать родительские директории и открыть файл с усечением
    /// @throws ReportError
    void open();

    /// Закрыть файл (повторный вызов безопасен)
    void close();

    /// Заголовок: корень, конфигурация, время старта, разделитель
    void header(const std::filesystem::path& root, const std::filesystem::path& config,
                std::string_view started);

    /// Начало блока секции: пустая строка + "=== name ==="
    void begin_section(std::string_view name);

    /// Метаданные секции: "<label>: <value>"
    void meta(std::string_view label, std::string_view value);

    /// Пустая строка-разделитель (в JSONL не пишется)
    void blank();

    /// Служебная строка ("> Running search...", "No matches found", ошибки)
    void status(std::string_view text);

    /// Находка текущей секции
    void result(const ScanResult& r);

    /// Подвал: разделитель и время завершения
    void footer(std::string_view completed);

    std::size_t result_count() const { return result_count_; }

private:
    /// Записать строку в файл (+ '\n') и сбросить буфер
    void append(std::string_view line);

    /// Продублировать строку в stdout при verbose
    void mirror(std::string_view line);

    ReportOptions options_;
    output::Writer& console_;
    FILE* file_ = nullptr;
    std::string current_section_;
    std::size_t result_count_ = 0;
};

/// Разделитель заголовка/подвала: 40 символов '='
constexpr std::string_view SEPARATOR = "========================================";

}  // namespace filescanner::report

#endif  // FILESCANNER_REPORT_HPP
