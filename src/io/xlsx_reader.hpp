/**
 * @file xlsx_reader.hpp
 * @brief Чтение книг Office Open XML (.xlsx)
 * @author Yan Bubenok <yan@bubenok.com>
 */

#pragma once

#include "document.hpp"
#include "zip_archive.hpp"
#include <filesystem>
#include <optional>
#include <string_view>

namespace strata::io {

/// Строки и колонки за этими пределами пропускаются при чтении листа
constexpr size_t kMaxSheetRows = 65536;
constexpr size_t kMaxSheetColumns = 1024;

/**
 * @brief Чтение .xlsx файла
 *
 * Читает все листы, общие строки и цвета заливки ячеек
 * (fgColor: rgb без альфа-канала, theme:N, indexed:N).
 *
 * @throws DocumentReadError При ошибке чтения или повреждённом архиве
 */
[[nodiscard]] Workbook readXlsxWorkbook(const std::filesystem::path& path);

/**
 * @brief Чтение книги из уже открытого архива
 */
[[nodiscard]] Workbook readXlsxWorkbook(const ZipArchive& archive);

/**
 * @brief Индекс колонки по ссылке на ячейку ("C12" -> 2)
 *
 * Больше трёх букв (за XFD) не бывает: nullopt.
 */
[[nodiscard]] std::optional<size_t> columnIndexFromRef(std::string_view ref) noexcept;

} // namespace strata::io
