// ==============================================================================
// filescanner/discovery.hpp - Обход дерева файлов
// ==============================================================================
//
// Назначение:
// - Рекурсивный обход корня сканирования (depth-first)
// - Сначала файлы директории, затем рекурсия в поддиректории
// - Порядок внутри директории - как отдаёт ОС, без сортировки
// - Ошибки отдельных записей пропускаются молча
// - Ошибка чтения самого корня прерывает обход, накопленное сохраняется
//
// ==============================================================================

#ifndef FILESCANNER_DISCOVERY_HPP
#define FILESCANNER_DISCOVERY_HPP

#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace filescanner::io {

// ----------------------------------------------------------------------------
// WalkOptions - параметры обхода
// ----------------------------------------------------------------------------

struct WalkOptions {
    /// Вызывается при ошибке уровня корня (не открыть корень, сбой итерации).
    /// Может быть пустым - тогда ошибка просто прерывает обход.
    std::function<void(const std::string&)> on_error;

    /// Проверять флаг прерывания между записями
    /// (ScanInterrupted пробрасывается вызывающему)
    bool check_interrupt = true;
};

/// Посетитель найденного обычного файла
using FileVisitor = std::function<void(const std::filesystem::path&)>;

// ----------------------------------------------------------------------------
// API
// ----------------------------------------------------------------------------

/// Обойти root и вызвать visit для каждого обычного файла.
///
/// - Символические ссылки на директории не обходятся
/// - Символические ссылки на обычные файлы выдаются
/// - Поддиректории без доступа молча пропускаются
///
/// @return false, если обход был прерван ошибкой уровня корня
/// @throws platform::ScanInterrupted при получении сигнала прерывания
bool walk_files(const std::filesystem::path& root, const WalkOptions& opt,
                const FileVisitor& visit);

/// То же, но с накоплением результата в вектор
std::vector<std::filesystem::path> collect_files(const std::filesystem::path& root,
                                                 const WalkOptions& opt);

}  // namespace filescanner::io

#endif  // FILESCANNER_DISCOVERY_HPP
