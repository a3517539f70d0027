/**
 * @file xls_reader.hpp
 * @brief Чтение книг Excel 97-2003 (.xls, BIFF)
 * @author Yan Bubenok <yan@bubenok.com>
 */

#pragma once

#include "document.hpp"
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace strata::io {

/**
 * @brief Цвет заливки по полям XF-записи BIFF8
 *
 * Узор заливки берётся из битов 26-31 linecolor, индекс цвета узора
 * из битов 0-6 groundcolor. Индексы переводятся по стандартной палитре
 * Excel (записи PALETTE libxls не разбирает).
 *
 * @return "#RRGGBB" или nullopt, если заливки нет
 */
[[nodiscard]] std::optional<std::string> xlsFillColor(uint32_t linecolor, uint16_t groundcolor);

/**
 * @brief Чтение .xls файла через libxls
 *
 * Ячейки получают значения и цвет заливки из XF-записи.
 *
 * @throws DocumentReadError При ошибке чтения
 */
[[nodiscard]] Workbook readXlsWorkbook(const std::filesystem::path& path);

} // namespace strata::io
