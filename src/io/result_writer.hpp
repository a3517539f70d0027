/**
 * @file result_writer.hpp
 * @brief Сериализация результата извлечения в JSON и Markdown
 * @author Yan Bubenok <yan@bubenok.com>
 */

#pragma once

#include "model/extraction_report.hpp"
#include "model/extraction_result.hpp"
#include <filesystem>
#include <string>

namespace strata::io {

/**
 * @brief Результат извлечения в JSON
 *
 * Слои: material, start_depth, end_depth, thickness (ft), confidence,
 * source, original_color, user_edited.
 */
[[nodiscard]] std::string resultToJson(const model::ExtractionResult& result, int indent = 2);

/**
 * @brief Только список слоёв в JSON
 */
[[nodiscard]] std::string layersToJson(const model::LayerList& layers, int indent = 2);

/**
 * @brief Отчёт в Markdown
 */
[[nodiscard]] std::string reportToMarkdown(const model::ExtractionReport& report);

/**
 * @brief Атомарная запись результата в JSON-файл
 */
void writeResultJson(const model::ExtractionResult& result, const std::filesystem::path& path);

/**
 * @brief Атомарная запись отчёта в Markdown
 */
void writeReportMarkdown(const model::ExtractionReport& report, const std::filesystem::path& path);

} // namespace strata::io
