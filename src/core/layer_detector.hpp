/**
 * @file layer_detector.hpp
 * @brief Разбиение точек сигнала на слои
 * @author Yan Bubenok <yan@bubenok.com>
 *
 * Точки сортируются по глубине, ключ точки — материал или
 * "color:<цвет>". Новый слой начинается при смене ключа относительно
 * предыдущей точки, поэтому A,A,B,B,A,A даёт три слоя.
 * Подошва слоя — кровля следующего; подошва последнего — максимальная
 * глубина, а если она совпадает с кровлей, продлевается на мощность
 * предыдущего слоя (или на 3 ft для единственного слоя).
 */

#pragma once

#include "model/layer.hpp"
#include "model/raw_extraction.hpp"

namespace strata::core {

using namespace strata::model;

/// Мощность единственного слоя, если подошву взять неоткуда, ft
constexpr double kDefaultLastLayerThickness = 3.0;

class LayerDetector {
public:
    /**
     * @brief Основное разбиение по материалу, затем по цвету
     *
     * Точка без материала получает ключ "color:<цвет>", так что лист
     * только с заливкой разбивается по цвету здесь же.
     * Точки без материала и цвета не начинают слой, но их глубина
     * учитывается при определении подошвы последнего слоя.
     */
    [[nodiscard]] LayerList detect(const RawExtraction& raw, LayerSource source) const;

    /**
     * @brief Один слой на каждый интервал между соседними глубинами
     *
     * Материал "Unknown", уверенность low, источник fallback.
     */
    [[nodiscard]] LayerList detectFromThickness(const RawExtraction& raw) const;

    /**
     * @brief Уверенность слоя по виду сигнала
     *
     * Текст (с цветом или без) -> high, только цвет -> medium,
     * ничего -> low.
     */
    [[nodiscard]] static constexpr ConfidenceLevel confidenceFor(SignalKind kind) noexcept {
        switch (kind) {
            case SignalKind::Both:
            case SignalKind::TextOnly:
                return ConfidenceLevel::High;
            case SignalKind::ColorOnly:
                return ConfidenceLevel::Medium;
            case SignalKind::Neither:
                return ConfidenceLevel::Low;
        }
        return ConfidenceLevel::Low;
    }
};

/**
 * @brief Слой после правки пользователем
 *
 * Возвращает копию с confidence = high и user_edited = true.
 */
[[nodiscard]] ExtractedLayer updateConfidenceForEdit(ExtractedLayer layer) noexcept;

} // namespace strata::core
