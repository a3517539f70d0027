/**
 * @file depth_normalizer.hpp
 * @brief Нормализация глубин к футам с проверкой диапазона и точности
 * @author Yan Bubenok <yan@bubenok.com>
 *
 * Этапы: число -> единица -> перевод в футы -> округление ->
 * проверка диапазона -> проверка потери точности.
 * Ошибка числа прерывает обработку, остальные этапы накапливают
 * замечания.
 */

#pragma once

#include "model/config.hpp"
#include "model/extraction_error.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace strata::core {

using namespace strata::model;

/**
 * @brief Исходное значение глубины: отсутствует, число или текст
 */
using DepthInput = std::variant<std::monostate, double, std::string>;

/**
 * @brief Результат нормализации одной глубины
 */
struct NormalizedDepth {
    bool success = false;
    std::optional<Feet> depth;              ///< Глубина в футах (при ошибке диапазона тоже заполнена)
    std::string original_value;
    std::string original_unit;
    DepthUnit detected_unit = DepthUnit::Feet;
    bool conversion_applied = false;        ///< Значение переводилось из метров
    size_t index = 0;                       ///< Позиция в пакете
    ErrorList errors;
    ErrorList warnings;
};

/**
 * @brief Элемент пакетной нормализации
 */
struct DepthBatchItem {
    DepthInput value;
    std::string unit;
};

/**
 * @brief Статистика пакета
 */
struct BatchStatistics {
    size_t total = 0;
    size_t successful = 0;
    size_t failed = 0;
    size_t with_warnings = 0;
};

/**
 * @brief Результат пакетной нормализации
 */
struct BatchNormalization {
    bool success = true;
    std::vector<NormalizedDepth> items;
    std::vector<std::string> errors;        ///< "Item i: ..."
    std::vector<std::string> warnings;
    BatchStatistics statistics;
};

/**
 * @brief Интервал глубин (кровля, подошва) в футах
 */
struct DepthInterval {
    Feet start{0.0};
    Feet end{0.0};
};

/**
 * @brief Разрыв или перекрытие между соседними интервалами
 */
struct IntervalIssue {
    size_t first_index = 0;
    size_t second_index = 0;
    Feet amount{0.0};
};

/**
 * @brief Результат проверки последовательности интервалов
 */
struct SequenceCheck {
    bool success = true;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
    std::vector<IntervalIssue> gaps;
    std::vector<IntervalIssue> overlaps;
};

/**
 * @brief Нормализатор глубин
 *
 * Словарь единиц и пределы передаются при создании и не меняются.
 */
class DepthNormalizer {
public:
    DepthNormalizer(DepthLimits limits, UnitVocabulary units);

    /**
     * @brief Нормализовать глубину
     *
     * @param raw Число, текст ("12.5 ft") или отсутствующее значение
     * @param unit Обозначение единицы; пустое -> футы с предупреждением
     */
    [[nodiscard]] NormalizedDepth normalize(const DepthInput& raw, std::string_view unit) const;

    /**
     * @brief Нормализовать набор глубин
     *
     * Сообщения получают префикс "Item <i>: ".
     */
    [[nodiscard]] BatchNormalization normalizeBatch(const std::vector<DepthBatchItem>& items) const;

    /**
     * @brief Поиск разрывов (> порога) и перекрытий между интервалами
     *
     * Интервалы упорядочиваются по кровле; индексы в результате
     * ссылаются на исходный порядок.
     */
    [[nodiscard]] SequenceCheck validateSequence(const std::vector<DepthInterval>& intervals) const;

    /**
     * @brief Единица по обозначению
     *
     * Точное совпадение, затем частичное. nullopt, если не распознано.
     * partial = true при частичном совпадении.
     */
    [[nodiscard]] std::optional<DepthUnit> resolveUnit(std::string_view unit, bool* partial = nullptr) const;

    [[nodiscard]] const DepthLimits& limits() const noexcept { return limits_; }

private:
    DepthLimits limits_;
    UnitVocabulary units_;
};

} // namespace strata::core
