/**
 * @file fallback.hpp
 * @brief Стратегии восстановления и сессии проверки
 * @author Yan Bubenok <yan@bubenok.com>
 */

#pragma once

#include "layer.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace strata::model {

/**
 * @brief Тип стратегии восстановления
 */
enum class FallbackStrategyType {
    PartialExtraction,
    GuidedCorrection,
    TemplateBased,
    ManualEntry
};

/**
 * @brief Оценка трудозатрат пользователя
 */
enum class Effort {
    None,
    Low,
    Medium,
    High
};

/**
 * @brief Выбранная стратегия восстановления
 *
 * Отсутствие type означает, что восстановление невозможно.
 */
struct FallbackStrategy {
    std::optional<FallbackStrategyType> type;
    bool can_recover = false;
    Effort estimated_effort = Effort::None;
    std::string reason;
    std::string user_guidance;
    std::vector<std::string> actions;
};

/**
 * @brief Важность исправления
 */
enum class CorrectionSeverity {
    Low = 1,
    Medium = 2,
    High = 3
};

/**
 * @brief Исправление, которое предлагается пользователю
 */
struct CorrectionItem {
    std::string type;                     ///< Категория исходной ошибки
    std::string message;
    CorrectionSeverity severity = CorrectionSeverity::Medium;
    std::string suggested_action;
    std::vector<size_t> affected_items;   ///< Индексы слоёв
};

/**
 * @brief Слой без полного набора данных
 */
struct MissingFields {
    size_t item_index = 0;
    std::vector<std::string> fields;
};

/**
 * @brief Сопоставление колонок для шаблонного восстановления
 */
struct TemplateMapping {
    std::string id;
    std::string name;
    double confidence = 0.0;
    std::optional<size_t> depth_column;
    std::optional<size_t> material_column;
    std::string depth_header;
    std::string material_header;
    std::vector<std::string> format_hints;
};

/**
 * @brief Указания для ручного ввода
 */
struct ManualEntryGuidance {
    std::string title;
    std::vector<std::string> instructions;
    std::vector<std::string> tips;
};

/**
 * @brief Сессия восстановления для внешнего интерфейса проверки
 */
struct RecoverySession {
    std::string id;
    FallbackStrategyType strategy = FallbackStrategyType::ManualEntry;
    bool success = false;
    std::string original_file;
    LayerList layers;
    double confidence = 0.0;
    std::vector<std::string> suggested_actions;
    std::vector<std::string> next_steps;
    std::vector<MissingFields> missing_fields;        ///< PartialExtraction
    std::vector<CorrectionItem> corrections;          ///< GuidedCorrection (по приоритету)
    std::optional<TemplateMapping> template_mapping;  ///< TemplateBased
    std::optional<ManualEntryGuidance> manual_guidance; ///< ManualEntry
    std::string error;                                ///< При неудаче
};

[[nodiscard]] constexpr std::string_view toString(FallbackStrategyType type) noexcept {
    switch (type) {
        case FallbackStrategyType::PartialExtraction: return "partial_extraction";
        case FallbackStrategyType::GuidedCorrection: return "guided_correction";
        case FallbackStrategyType::TemplateBased: return "template_based";
        case FallbackStrategyType::ManualEntry: return "manual_entry";
    }
    return "manual_entry";
}

[[nodiscard]] constexpr std::string_view toString(Effort effort) noexcept {
    switch (effort) {
        case Effort::None: return "none";
        case Effort::Low: return "low";
        case Effort::Medium: return "medium";
        case Effort::High: return "high";
    }
    return "none";
}

[[nodiscard]] constexpr std::string_view toString(CorrectionSeverity severity) noexcept {
    switch (severity) {
        case CorrectionSeverity::Low: return "low";
        case CorrectionSeverity::Medium: return "medium";
        case CorrectionSeverity::High: return "high";
    }
    return "medium";
}

} // namespace strata::model
