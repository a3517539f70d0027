/**
 * @file extraction_report.hpp
 * @brief Статистика и отчёт по результату извлечения
 * @author Yan Bubenok <yan@bubenok.com>
 */

#pragma once

#include "extraction_result.hpp"
#include <string>
#include <vector>

namespace strata::model {

/**
 * @brief Доля материала в разрезе
 */
struct MaterialShare {
    std::string material;
    size_t layer_count = 0;
    Feet total_thickness{0.0};
    double percentage = 0.0;        ///< Доля суммарной мощности, %
};

/**
 * @brief Статистика по слоям результата
 */
struct ExtractionStatistics {
    size_t total_layers = 0;
    Feet total_depth{0.0};          ///< Подошва последнего слоя
    Feet average_thickness{0.0};
    std::vector<MaterialShare> materials;   ///< По убыванию мощности
    size_t high_confidence_layers = 0;
    size_t medium_confidence_layers = 0;
    size_t low_confidence_layers = 0;
    size_t user_edited_layers = 0;
};

/**
 * @brief Отчёт для пользователя
 */
struct ExtractionReport {
    std::string filename;
    bool success = false;
    ConfidenceScore confidence;
    ExtractionStatistics statistics;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
    std::vector<std::string> recommendations;
    std::vector<AttemptLogEntry> attempts;
};

} // namespace strata::model
