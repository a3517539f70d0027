/**
 * @file csv_reader.hpp
 * @brief Чтение CSV-таблиц разреза
 * @author Yan Bubenok <yan@bubenok.com>
 */

#pragma once

#include "document.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace strata::io {

/**
 * @brief Опции чтения CSV
 */
struct CsvReadOptions {
    std::optional<char> delimiter;     ///< Разделитель (по умолчанию автоопределение)
    size_t skip_lines = 0;             ///< Пропустить строк в начале
    std::optional<std::string> encoding;  ///< "UTF-8" или "CP1251" (по умолчанию автоопределение)
};

/**
 * @brief Чтение CSV файла как книги из одного листа
 *
 * Числовые ячейки получают SheetCell::number. Цветов у CSV нет.
 *
 * @param path Путь к файлу
 * @param options Опции чтения
 * @return Книга с одним листом
 * @throws DocumentReadError При ошибке чтения
 */
[[nodiscard]] Workbook readCsvWorkbook(
    const std::filesystem::path& path,
    const CsvReadOptions& options = {}
);

/**
 * @brief Разбор CSV из строки (без обращения к файлу)
 */
[[nodiscard]] Workbook parseCsvText(
    const std::string& content,
    const std::string& sheet_name,
    const CsvReadOptions& options = {}
);

/**
 * @brief Автоопределение разделителя по набору строк
 */
[[nodiscard]] char detectDelimiter(const std::vector<std::string>& lines);

/**
 * @brief Определение кодировки по первым байтам текста
 * @return "UTF-8" или "CP1251"
 */
[[nodiscard]] std::string detectEncoding(std::string_view content);

/**
 * @brief Преобразование текста из CP1251 в UTF-8
 */
[[nodiscard]] std::string convertCp1251ToUtf8(std::string_view input);

/**
 * @brief Проверка, может ли файл быть прочитан как CSV
 */
[[nodiscard]] bool canReadCsv(const std::filesystem::path& path) noexcept;

} // namespace strata::io
