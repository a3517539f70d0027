/**
 * @file validation_service.hpp
 * @brief Проверка последовательности глубин и границ слоёв
 * @author Yan Bubenok <yan@bubenok.com>
 *
 * Функции не бросают исключений: все находки возвращаются
 * в ValidationResult.
 */

#pragma once

#include "model/config.hpp"
#include "model/layer.hpp"
#include "model/validation.hpp"
#include <vector>

namespace strata::core {

using namespace strata::model;

/**
 * @brief Пропущенные и нечисловые глубины
 */
struct MissingDepthReport {
    std::vector<double> missing;          ///< Ожидаемые, но отсутствующие глубины
    std::vector<size_t> invalid_indices;  ///< Индексы нечисловых значений
};

class ValidationService {
public:
    explicit ValidationService(DepthLimits limits = {});

    /**
     * @brief Проверка последовательности глубин
     *
     * NaN в depths считается нечисловым значением. Ошибки: пустой
     * набор, нечисловые значения. Предупреждения: отрицательные
     * глубины, смена направления, дубликаты, аномально большие шаги
     * (> 3 средних).
     */
    [[nodiscard]] ValidationResult validateDepthSequence(const std::vector<double>& depths) const;

    /**
     * @brief Равномерность шага
     *
     * Модальный шаг округляется до 0.1; последовательность равномерна,
     * если больше 80% шагов отличаются от моды не более чем на 10%.
     */
    [[nodiscard]] IntervalConsistency checkDepthIntervalConsistency(const std::vector<double>& depths) const;

    /**
     * @brief Поиск пропусков при известном шаге
     */
    [[nodiscard]] MissingDepthReport detectMissingDepths(
        const std::vector<double>& depths,
        double expected_interval
    ) const;

    /**
     * @brief Проверка границ слоёв
     *
     * Ошибка: кровля ниже подошвы. Предупреждения: перекрытия
     * и разрывы больше допуска.
     */
    [[nodiscard]] ValidationResult validateLayerBoundaries(const LayerList& layers) const;

    /**
     * @brief Проверка перед сохранением
     *
     * Непустой материал, start < end, без перекрытий.
     */
    [[nodiscard]] ValidationResult validateForSave(const LayerList& layers) const;

private:
    DepthLimits limits_;
};

} // namespace strata::core
