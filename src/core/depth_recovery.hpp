/**
 * @file depth_recovery.hpp
 * @brief Автоматическое исправление последовательности глубин
 * @author Yan Bubenok <yan@bubenok.com>
 *
 * Применяется координатором до того, как ошибка валидации глубин
 * станет окончательной. Материалы и цвета перемещаются вместе
 * с глубинами, соответствие индексов сохраняется.
 */

#pragma once

#include "model/raw_extraction.hpp"
#include "model/validation.hpp"

namespace strata::core {

using namespace strata::model;

/**
 * @brief Результат исправления
 */
struct DepthRecovery {
    bool applied = false;
    RawExtraction data;
    size_t interpolated = 0;        ///< Заполнено серединой между соседями
    size_t dropped = 0;             ///< Нечисловые без двух соседей
    size_t outliers_removed = 0;    ///< Больше двух медиан
    size_t duplicates_removed = 0;
};

/**
 * @brief Исправить глубины по найденным проблемам
 *
 * NonNumericDepth -> интерполяция; InconsistentDepthDirection ->
 * сортировка и удаление выбросов; DuplicateDepth -> удаление повторов
 * (остаётся первая точка). applied = false, если исправлять нечего.
 */
[[nodiscard]] DepthRecovery recoverDepthSequence(const RawExtraction& raw, const ValidationResult& validation);

/**
 * @brief Нужна ли попытка исправления
 */
[[nodiscard]] bool needsDepthRecovery(const ValidationResult& validation) noexcept;

} // namespace strata::core
