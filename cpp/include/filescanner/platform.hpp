// ==============================================================================
// filescanner/platform.hpp - Платформенные абстракции
// ==============================================================================
//
// Назначение:
// - Преобразования path <-> UTF-8
// - Определение TTY для цветного вывода
// - Локальное время для заголовков отчёта и имён файлов
// - Атомарная замена содержимого файла (write temp + rename)
// - Флаг прерывания (SIGINT/SIGTERM)
//
// Вся платформенная специфика изолирована здесь.
//
// ==============================================================================

#ifndef FILESCANNER_PLATFORM_HPP
#define FILESCANNER_PLATFORM_HPP

#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>

namespace filescanner::platform {

// ----------------------------------------------------------------------------
// Преобразования путей
// ----------------------------------------------------------------------------

/// Построить path из UTF-8 строки (на Windows через UTF-16)
std::filesystem::path path_from_utf8(std::string_view u8str);

/// Получить UTF-8 представление пути
std::string path_to_utf8(const std::filesystem::path& p);

// ----------------------------------------------------------------------------
// TTY detection
// ----------------------------------------------------------------------------

bool is_tty_stdout();
bool is_tty_stderr();

// ----------------------------------------------------------------------------
// Время
// ----------------------------------------------------------------------------

/// Текущее локальное время в формате strftime
/// Пример: format_local_time("%Y-%m-%d %H:%M:%S") -> "2024-05-01 13:37:00"
std::string format_local_time(const char* format);

// ----------------------------------------------------------------------------
// Файлы
// ----------------------------------------------------------------------------

/// Заменить содержимое файла целиком.
///
/// Данные пишутся во временный файл рядом с целевым, затем он
/// переименовывается поверх target. Прерывание до rename оставляет
/// target нетронутым.
///
/// @throws std::runtime_error при ошибке записи или переименования
void replace_file_contents(const std::filesystem::path& target, std::string_view bytes);

// ----------------------------------------------------------------------------
// Прерывание
// ----------------------------------------------------------------------------

/// Установить обработчики SIGINT/SIGTERM, которые только взводят флаг
void install_interrupt_handler();

/// Был ли получен сигнал прерывания
bool interrupted();

/// Сбросить флаг (используется тестами)
void reset_interrupted();

/// Взвести флаг вручную (используется тестами)
void request_interrupt();

/// Исключение, которым прерывается сканирование после сигнала
class ScanInterrupted : public std::runtime_error {
public:
    ScanInterrupted() : std::runtime_error("Scan interrupted by user") {}
};

/// Выбросить ScanInterrupted, если флаг взведён
void throw_if_interrupted();

}  // namespace filescanner::platform

#endif  // FILESCANNER_PLATFORM_HPP
