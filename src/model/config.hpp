/**
 * @file config.hpp
 * @brief Конфигурация конвейера извлечения
 * @author Yan Bubenok <yan@bubenok.com>
 *
 * Словари единиц и материалов передаются компонентам при создании
 * и после этого не изменяются.
 */

#pragma once

#include "units.hpp"
#include <string>
#include <utility>
#include <vector>

namespace strata::model {

/**
 * @brief Словарь обозначений единиц глубины
 */
struct UnitVocabulary {
    std::vector<std::pair<std::string, DepthUnit>> aliases;  ///< Порядок важен для частичного совпадения
    DepthUnit default_unit = DepthUnit::Feet;
};

/**
 * @brief Словарь материалов
 */
struct MaterialVocabulary {
    std::vector<std::string> keywords;                               ///< clay, sand, ...
    std::vector<std::pair<std::string, std::string>> canonical_names; ///< "sandy clay" -> "Sandy Clay"
};

/**
 * @brief Пределы и точность нормализации глубин (в футах)
 */
struct DepthLimits {
    double min_depth = 0.0;
    double max_depth = 1000.0;
    double warning_depth = 500.0;
    int decimal_places = 2;
    double precision_tolerance = 0.001;
    double gap_threshold = 0.1;            ///< Разрыв/перекрытие между интервалами
};

/**
 * @brief Пороги менеджера восстановления
 */
struct FallbackThresholds {
    double min_confidence = 0.3;
    double partial_extraction = 0.5;
    size_t max_recovery_attempts = 3;
    bool enable_guided_correction = true;
    bool enable_template_matching = true;
};

/**
 * @brief Опции координатора
 */
struct ExtractionOptions {
    double min_confidence_threshold = 0.5;
    double high_confidence_threshold = 0.8;
    bool auto_validate = true;
    bool continue_on_error = true;
};

/**
 * @brief Полная конфигурация
 */
struct ExtractionConfig {
    ExtractionOptions options;
    FallbackThresholds fallback;
    DepthLimits depth_limits;
    UnitVocabulary units;
    MaterialVocabulary materials;
};

/**
 * @brief Словарь единиц по умолчанию
 */
[[nodiscard]] inline UnitVocabulary defaultUnitVocabulary() {
    UnitVocabulary vocab;
    vocab.aliases = {
        {"ft", DepthUnit::Feet}, {"feet", DepthUnit::Feet},
        {"foot", DepthUnit::Feet}, {"'", DepthUnit::Feet},
        {"m", DepthUnit::Meters}, {"meter", DepthUnit::Meters},
        {"meters", DepthUnit::Meters}, {"metre", DepthUnit::Meters},
        {"metres", DepthUnit::Meters}
    };
    return vocab;
}

/**
 * @brief Словарь материалов по умолчанию
 */
[[nodiscard]] inline MaterialVocabulary defaultMaterialVocabulary() {
    MaterialVocabulary vocab;
    vocab.keywords = {
        "clay", "sand", "gravel", "silt", "rock", "limestone", "sandstone",
        "shale", "topsoil", "fill", "bedrock", "loam", "boulder", "cobble",
        "peat", "organic"
    };
    vocab.canonical_names = {
        {"sandy clay", "Sandy Clay"}, {"clayey sand", "Clayey Sand"},
        {"silty sand", "Silty Sand"}, {"sandy silt", "Sandy Silt"},
        {"gravelly sand", "Gravelly Sand"}, {"sandy gravel", "Sandy Gravel"},
        {"top soil", "Topsoil"}, {"bed rock", "Bedrock"}
    };
    return vocab;
}

/**
 * @brief Конфигурация по умолчанию
 */
[[nodiscard]] inline ExtractionConfig defaultConfig() {
    ExtractionConfig config;
    config.units = defaultUnitVocabulary();
    config.materials = defaultMaterialVocabulary();
    return config;
}

} // namespace strata::model
