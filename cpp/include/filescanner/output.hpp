// ==============================================================================
// filescanner/output.hpp - Пользовательский вывод
// ==============================================================================
//
// Назначение:
// - Единственная точка записи в stdout/stderr
// - Сообщения с префиксами [+] [!] [x] [*]
// - Цветной вывод (ANSI escape codes) при TTY
//
// Файл отчёта пишет report::ReportSink, не этот модуль.
//
// ==============================================================================

#ifndef FILESCANNER_OUTPUT_HPP
#define FILESCANNER_OUTPUT_HPP

#include <cstdio>
#include <string>
#include <string_view>

namespace filescanner::output {

// ----------------------------------------------------------------------------
// Потоки вывода
// ----------------------------------------------------------------------------

enum class Stream { Stdout, Stderr };

// ----------------------------------------------------------------------------
// ANSI цвета для терминала
// ----------------------------------------------------------------------------

enum class Color {
    Default,
    Green,   // Успех, информация
    Yellow,  // Предупреждения
    Red,     // Ошибки
    Cyan     // Отладка
};

// ----------------------------------------------------------------------------
// Конфигурация вывода
// ----------------------------------------------------------------------------

struct OutputConfig {
    bool quiet = false;    // -q: подавить informational stderr
    bool verbose = false;  // -v: метаданные секций и отладочные сообщения
};

// ----------------------------------------------------------------------------
// Writer - единый слой вывода в консоль
// ----------------------------------------------------------------------------

class Writer {
public:
    explicit Writer(const OutputConfig& cfg);
    ~Writer();

    Writer(const Writer&) = delete;
    Writer& operator=(const Writer&) = delete;

    /// Записать байты в поток
    void write(Stream s, std::string_view bytes);

    /// Записать строку с переводом строки
    void write_line(Stream s, std::string_view bytes);

    /// "[+] <message>" в stderr (если не quiet)
    void info(std::string_view message);

    /// "[!] <message>" в stderr (если не quiet)
    void warn(std::string_view message);

    /// "[x] <message>" в stderr (всегда)
    void error(std::string_view message);

    /// "[*] <message>" в stderr (только при verbose)
    void debug(std::string_view message);

    /// Сбросить буферы
    void flush();

private:
    void write_prefixed(std::string_view prefix, Color color, std::string_view message);
    void write_colored(Stream s, std::string_view message, Color color);
    FILE* get_file(Stream s) const;

    OutputConfig config_;
};

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

/// ANSI escape code для цвета ("" для Default)
std::string ansi_color_code(Color color);

/// Поддерживает ли поток цвета (TTY check)
bool supports_color(Stream s);

}  // namespace filescanner::output

#endif  // FILESCANNER_OUTPUT_HPP
