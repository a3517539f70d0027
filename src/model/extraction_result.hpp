/**
 * @file extraction_result.hpp
 * @brief Итоговый результат извлечения разреза
 * @author Yan Bubenok <yan@bubenok.com>
 */

#pragma once

#include "extraction_error.hpp"
#include "fallback.hpp"
#include "layer.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace strata::model {

/**
 * @brief Тип файла
 */
enum class FileType {
    Excel,   ///< .xlsx, .xls, .csv
    Pdf      ///< .pdf
};

[[nodiscard]] constexpr std::string_view toString(FileType type) noexcept {
    return type == FileType::Pdf ? "pdf" : "excel";
}

/**
 * @brief Статус попытки разбора
 */
enum class AttemptStatus {
    Success,
    Failed,
    Skipped   ///< Отменено до запуска
};

[[nodiscard]] constexpr std::string_view toString(AttemptStatus status) noexcept {
    switch (status) {
        case AttemptStatus::Success: return "success";
        case AttemptStatus::Failed: return "failed";
        case AttemptStatus::Skipped: return "skipped";
    }
    return "failed";
}

/**
 * @brief Запись журнала попыток
 */
struct AttemptLogEntry {
    std::string method;           ///< primary_excel, alternative_sheet, ...
    AttemptStatus status = AttemptStatus::Failed;
    std::optional<std::string> error;
};

/**
 * @brief Итоговая оценка уверенности
 */
struct ConfidenceScore {
    double score = 0.0;           ///< 0..1
    ConfidenceLevel level = ConfidenceLevel::Low;
};

/**
 * @brief Метаданные извлечения
 */
struct ExtractionMetadata {
    std::string filename;
    std::optional<FileType> file_type;
    std::string depth_unit = "feet";               ///< Единица исходного документа
    double depth_resolution = 0.0;                 ///< Модальный шаг глубин, ft
    double total_depth = 0.0;                      ///< Максимальная глубина, ft
    std::string extraction_timestamp;              ///< ISO-8601 UTC
    int64_t processing_time_ms = 0;
    std::vector<AttemptLogEntry> extraction_attempts;
    size_t mapped_columns = 0;
    size_t text_length = 0;
    bool has_headers = false;
    size_t column_count = 0;
    std::vector<std::string> format_hints;
    size_t high_confidence_layers = 0;
    size_t medium_confidence_layers = 0;
    size_t low_confidence_layers = 0;
    bool fallback_used = false;
};

/**
 * @brief Результат извлечения
 *
 * Создаётся заново на каждый вызов и далее не изменяется.
 */
struct ExtractionResult {
    bool success = false;
    std::optional<LayerList> data;
    ConfidenceScore confidence;
    ErrorList errors;
    std::vector<std::string> warnings;
    ExtractionMetadata metadata;
    std::optional<ClassificationReport> classification;
    std::optional<FallbackStrategy> fallback_strategy;
    std::optional<RecoverySession> recovery_session;
    std::optional<std::string> user_guidance;

    [[nodiscard]] std::vector<std::string> errorMessages() const {
        std::vector<std::string> out;
        out.reserve(errors.size());
        for (const auto& e : errors) out.push_back(e.message);
        return out;
    }

    [[nodiscard]] size_t layerCount() const noexcept {
        return data.has_value() ? data->size() : 0;
    }

    /**
     * @brief Требуется ли проверка пользователем
     */
    [[nodiscard]] bool requiresReview() const noexcept {
        return !success || fallback_strategy.has_value();
    }
};

} // namespace strata::model
