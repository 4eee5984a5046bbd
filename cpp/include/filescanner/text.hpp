// ==============================================================================
// filescanner/text.hpp - Чтение файлов как текста
// ==============================================================================
//
// Поиск по содержимому читает файл построчно, дамп - целиком. Невалидные
// последовательности UTF-8 заменяются на U+FFFD, поэтому один "битый" файл
// не мешает поиску.
//
// ==============================================================================

#ifndef FILESCANNER_TEXT_HPP
#define FILESCANNER_TEXT_HPP

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace filescanner::io {

/// U+FFFD в UTF-8
constexpr std::string_view REPLACEMENT_CHARACTER = "\xef\xbf\xbd";

/// Заменить невалидные последовательности UTF-8 на U+FFFD
std::string sanitize_utf8(std::string_view bytes);

/// Прочитать файл как текст.
/// @return nullopt при ошибке открытия/чтения (нет доступа, файл исчез и т.п.)
std::optional<std::string> read_text_file(const std::filesystem::path& path);

/// Посетитель строки: номер (с 1) и текст без окончания строки
using LineVisitor = std::function<void(std::size_t, std::string_view)>;

/// Прочитать файл построчно, не загружая его целиком.
/// Завершающий "\n" или "\r\n" у строки отрезается; пустой хвост после
/// последнего '\n' строкой не считается. Каждая строка проходит sanitize_utf8.
/// @return false, если файл не открылся или чтение оборвалось ошибкой
///         (строки до ошибки уже переданы в fn)
bool for_each_file_line(const std::filesystem::path& path, const LineVisitor& fn);

/// Текст пуст после обрезки пробельных символов
bool is_blank(std::string_view text);

}  // namespace filescanner::io

#endif  // FILESCANNER_TEXT_HPP
