/**
 * @file raw_extraction.hpp
 * @brief Сырые сигналы, извлечённые из документа разрезом
 * @author Yan Bubenok <yan@bubenok.com>
 */

#pragma once

#include "units.hpp"
#include <cmath>
#include <optional>
#include <string>
#include <vector>

namespace strata::model {

/**
 * @brief Какие сигналы несёт точка
 */
enum class SignalKind {
    TextOnly,   ///< Только текст материала
    ColorOnly,  ///< Только цвет заливки
    Both,       ///< Текст и цвет
    Neither     ///< Ни того, ни другого (только глубина)
};

[[nodiscard]] constexpr SignalKind classifySignal(bool has_text, bool has_color) noexcept {
    if (has_text && has_color) return SignalKind::Both;
    if (has_text) return SignalKind::TextOnly;
    if (has_color) return SignalKind::ColorOnly;
    return SignalKind::Neither;
}

[[nodiscard]] constexpr bool hasText(SignalKind kind) noexcept {
    return kind == SignalKind::TextOnly || kind == SignalKind::Both;
}

[[nodiscard]] constexpr bool hasColor(SignalKind kind) noexcept {
    return kind == SignalKind::ColorOnly || kind == SignalKind::Both;
}

/**
 * @brief Одна точка сигнала (глубина + материал? + цвет?)
 */
struct SignalPoint {
    double depth = 0.0;
    std::optional<std::string> material;
    std::optional<std::string> color;     ///< "#RRGGBB", "theme:N" или "indexed:N"
    SignalKind kind = SignalKind::Neither;
    size_t source_index = 0;              ///< Индекс в исходных массивах
};

/**
 * @brief Метаданные структуры источника
 *
 * Используются оценкой уверенности и выбором шаблонного восстановления.
 */
struct SourceStructure {
    bool has_headers = false;
    size_t column_count = 0;                 ///< Число колонок таблицы
    size_t mapped_columns = 0;               ///< Сопоставлено колонок (глубина, материал, ...)
    std::optional<size_t> depth_column;
    std::optional<size_t> material_column;
    std::string depth_header;
    std::string material_header;
    std::string sheet_name;
    size_t text_length = 0;                  ///< Объём текста (для PDF)
    size_t page_count = 0;
    std::vector<std::string> format_hints;   ///< Распознанные признаки формата
};

/**
 * @brief Результат разбора документа
 *
 * Параллельные массивы одинаковой длины. NaN в depths означает
 * отсутствующую или нечисловую глубину.
 */
struct RawExtraction {
    std::vector<double> depths;
    std::vector<std::optional<std::string>> materials;
    std::vector<std::optional<std::string>> colors;
    std::optional<DepthUnit> depth_unit;     ///< Подсказка единицы из документа
    SourceStructure structure;
    std::vector<std::string> warnings;       ///< Замечания парсера

    [[nodiscard]] size_t size() const noexcept { return depths.size(); }
    [[nodiscard]] bool empty() const noexcept { return depths.empty(); }

    /**
     * @brief Добавить точку сигнала
     */
    void addPoint(double depth,
                  std::optional<std::string> material,
                  std::optional<std::string> color = std::nullopt) {
        depths.push_back(depth);
        materials.push_back(std::move(material));
        colors.push_back(std::move(color));
    }

    /**
     * @brief Выравнивание длин массивов (недостающие значения пустые)
     */
    void alignLengths() {
        const size_t n = depths.size();
        materials.resize(n);
        colors.resize(n);
    }

    /**
     * @brief Вид сигнала для точки i
     */
    [[nodiscard]] SignalKind kindAt(size_t i) const noexcept {
        const bool text = i < materials.size() && materials[i].has_value() && !materials[i]->empty();
        const bool color = i < colors.size() && colors[i].has_value() && !colors[i]->empty();
        return classifySignal(text, color);
    }

    [[nodiscard]] size_t materialCount() const noexcept {
        size_t count = 0;
        for (size_t i = 0; i < depths.size(); ++i) {
            if (hasText(kindAt(i))) ++count;
        }
        return count;
    }

    [[nodiscard]] size_t numericDepthCount() const noexcept {
        size_t count = 0;
        for (double d : depths) {
            if (std::isfinite(d)) ++count;
        }
        return count;
    }

    /**
     * @brief Точки сигнала с заполненным SignalKind (без NaN-глубин)
     */
    [[nodiscard]] std::vector<SignalPoint> points() const {
        std::vector<SignalPoint> result;
        result.reserve(depths.size());
        for (size_t i = 0; i < depths.size(); ++i) {
            if (!std::isfinite(depths[i])) continue;
            SignalPoint p;
            p.depth = depths[i];
            p.kind = kindAt(i);
            if (hasText(p.kind)) p.material = materials[i];
            if (hasColor(p.kind)) p.color = colors[i];
            p.source_index = i;
            result.push_back(std::move(p));
        }
        return result;
    }
};

} // namespace strata::model
