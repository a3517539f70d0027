/**
 * @file confidence_scorer.hpp
 * @brief Итоговая уверенность извлечения
 * @author Yan Bubenok <yan@bubenok.com>
 *
 * Базовое значение 0.5, затем:
 *   +0.2    все слои заполнены (материал, start < end);
 *   +0.2·k  k: доля слоёв с уверенностью high;
 *   +0.2    валидация пройдена, иначе −min(0.05·ошибок, 0.3);
 *   +min(0.02·колонок, 0.1)         для таблиц;
 *   +min(символов / 1000, 1)·0.1    для PDF;
 *   −min(0.03·ошибок, 0.2)          по всем накопленным ошибкам.
 * Результат ограничивается [0, 1].
 */

#pragma once

#include "model/config.hpp"
#include "model/extraction_result.hpp"
#include "model/layer.hpp"
#include "model/raw_extraction.hpp"
#include <optional>
#include <string>

namespace strata::core {

using namespace strata::model;

/**
 * @brief Данные для оценки
 */
struct ScoringInput {
    bool validation_passed = true;
    size_t validation_error_count = 0;
    SourceStructure structure;
    size_t error_count = 0;           ///< Все накопленные ошибки
};

/**
 * @brief Доля слоёв с уверенностью medium и high
 */
struct ConfidenceCheck {
    bool acceptable = false;
    double ratio = 0.0;
    size_t high = 0;
    size_t medium = 0;
    size_t low = 0;
    std::optional<std::string> warning;   ///< "Low extraction confidence: N%"
};

class ConfidenceScorer {
public:
    explicit ConfidenceScorer(ExtractionOptions options = {});

    [[nodiscard]] ConfidenceScore score(const LayerList& layers, const ScoringInput& input) const;

    /**
     * @brief Уровень: low < min_threshold <= medium < high_threshold <= high
     */
    [[nodiscard]] ConfidenceLevel levelFor(double score) const noexcept;

    /**
     * @brief Достаточно ли слоёв с уверенностью не ниже medium (>= 50%)
     */
    [[nodiscard]] ConfidenceCheck checkExtractionConfidence(const LayerList& layers) const;

private:
    ExtractionOptions options_;
};

} // namespace strata::core
