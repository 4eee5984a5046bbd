// ==============================================================================
// filescanner/scanner.hpp - Один запуск сканирования
// ==============================================================================
//
// Порядок:
// 1. Открыть отчёт, записать заголовок
// 2. Разобрать конфигурацию
// 3. Выполнить секции в порядке файла, копя разрешённые команды
// 4. Записать подвал
// 5. Один раз переписать строки Example в конфигурации
//
// Исключение на любом шаге до 5 оставляет конфигурацию нетронутой. Флаг
// прерывания проверяется перед каждой секцией, после последней и ещё раз
// непосредственно перед перезаписью.
//
// ==============================================================================

#ifndef FILESCANNER_SCANNER_HPP
#define FILESCANNER_SCANNER_HPP

#include "filescanner/config.hpp"
#include "filescanner/output.hpp"
#include "filescanner/report.hpp"

#include <filesystem>
#include <functional>
#include <string>

namespace filescanner {

struct ScanOptions {
    std::filesystem::path root;
    std::filesystem::path config_path;
    std::filesystem::path output_path;
    report::Format format = report::Format::Text;
    bool verbose = false;

    /// Вызывается после каждой выполненной секции: имя и число находок
    std::function<void(const std::string&, std::size_t)> on_section;
};

struct ScanSummary {
    std::size_t sections_total = 0;     // Все секции файла
    std::size_t sections_executed = 0;  // С непустым Command
    std::size_t sections_incomplete = 0;  // Ошибка корня или шаблона
    std::size_t results = 0;
    std::filesystem::path output_path;
};

class Scanner {
public:
    Scanner(ScanOptions opt, output::Writer& console);

    /// Выполнить полный запуск
    /// @throws config::ConfigError, report::ReportError, platform::ScanInterrupted
    ScanSummary run();

private:
    ScanOptions options_;
    output::Writer& console_;
};

}  // namespace filescanner

#endif  // FILESCANNER_SCANNER_HPP
