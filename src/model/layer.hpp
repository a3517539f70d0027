/**
 * @file layer.hpp
 * @brief Слой разреза
 * @author Yan Bubenok <yan@bubenok.com>
 */

#pragma once

#include "units.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace strata::model {

/**
 * @brief Уровень уверенности
 */
enum class ConfidenceLevel {
    Low,
    Medium,
    High
};

/**
 * @brief Источник слоя
 */
enum class LayerSource {
    ExcelImport,   ///< excel-import
    PdfImport,     ///< pdf-import
    Fallback       ///< fallback
};

/**
 * @brief Извлечённый слой
 *
 * Инвариант: start_depth < end_depth, material не пуст.
 */
struct ExtractedLayer {
    std::string material;
    Feet start_depth{0.0};
    Feet end_depth{0.0};
    ConfidenceLevel confidence = ConfidenceLevel::Low;
    LayerSource source = LayerSource::Fallback;
    std::optional<std::string> original_color;
    bool user_edited = false;

    [[nodiscard]] Feet thickness() const noexcept { return end_depth - start_depth; }

    bool operator==(const ExtractedLayer&) const = default;
};

using LayerList = std::vector<ExtractedLayer>;

[[nodiscard]] constexpr std::string_view toString(ConfidenceLevel level) noexcept {
    switch (level) {
        case ConfidenceLevel::High: return "high";
        case ConfidenceLevel::Medium: return "medium";
        case ConfidenceLevel::Low: return "low";
    }
    return "low";
}

[[nodiscard]] constexpr std::string_view toString(LayerSource source) noexcept {
    switch (source) {
        case LayerSource::ExcelImport: return "excel-import";
        case LayerSource::PdfImport: return "pdf-import";
        case LayerSource::Fallback: return "fallback";
    }
    return "fallback";
}

/**
 * @brief Парсинг уровня уверенности из строки
 */
[[nodiscard]] inline std::optional<ConfidenceLevel> parseConfidenceLevel(std::string_view str) noexcept {
    if (str == "high") return ConfidenceLevel::High;
    if (str == "medium") return ConfidenceLevel::Medium;
    if (str == "low") return ConfidenceLevel::Low;
    return std::nullopt;
}

} // namespace strata::model
