/**
 * @file extraction_error.hpp
 * @brief Типизированные ошибки извлечения и их классификация
 * @author Yan Bubenok <yan@bubenok.com>
 */

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace strata::model {

/**
 * @brief Категория ошибки
 */
enum class ErrorSeverity {
    Fatal,        ///< Прервать извлечение, сохранение невозможно
    Recoverable,  ///< Обязательная проверка пользователем, снижение уверенности
    Warning       ///< Только сообщить
};

/**
 * @brief Код ошибки, формируемый в месте её возникновения
 */
enum class ErrorCode {
    // Фатальные
    UnsupportedFileType,
    FileNotFound,
    FileCorrupted,
    InvalidFileFormat,
    NoSheets,
    NoTextContent,          ///< PDF без текстового слоя
    NoDepthValues,          ///< Глубины не найдены
    NoMaterials,            ///< Материалы не найдены
    DepthColumnNotFound,
    MaterialColumnNotFound,
    InsufficientData,
    Cancelled,

    // Восстановимые
    NonNumericDepth,
    InvalidDepthValue,
    InconsistentDepthDirection,
    DuplicateDepth,
    LayerInverted,
    LayerOverlap,
    NoLayersDetected,
    PartialExtraction,
    ValidationFailed,

    // Предупреждения
    DepthGap,
    LayerGap,
    NegativeDepth,
    UnitAssumed,
    DepthAboveWarningThreshold,
    PrecisionLoss,
    LowConfidence,

    Unclassified            ///< Текст от внешних библиотек, классифицируется по правилам
};

/**
 * @brief Ошибка извлечения
 */
struct ExtractionError {
    ErrorCode code = ErrorCode::Unclassified;
    std::string message;

    bool operator==(const ExtractionError&) const = default;
};

using ErrorList = std::vector<ExtractionError>;

/**
 * @brief Классификация одной ошибки
 */
struct ErrorClassification {
    ErrorSeverity type = ErrorSeverity::Warning;
    bool should_abort = false;
    bool allow_save = true;
    bool force_review = false;
    double confidence_impact = 0.0;   ///< Насколько снижается уверенность (0..1)
    std::string message;

    bool operator==(const ErrorClassification&) const = default;
};

/**
 * @brief Сводная классификация набора ошибок
 */
struct ClassificationReport {
    std::vector<ErrorClassification> classifications;
    bool allow_save = true;      ///< AND по всем
    bool should_abort = false;   ///< OR по всем
    bool force_review = false;   ///< OR по всем
    std::optional<ErrorSeverity> overall_type;  ///< Наихудшая категория
    size_t fatal_count = 0;
    size_t recoverable_count = 0;
    size_t warning_count = 0;
    double total_confidence_impact = 0.0;       ///< Не больше 1

    [[nodiscard]] size_t total() const noexcept { return classifications.size(); }
};

/**
 * @brief Отчёт об ошибке для пользовательского интерфейса
 */
struct ErrorReport {
    std::string title;
    std::string message;
    std::vector<std::string> actions;
};

[[nodiscard]] constexpr std::string_view toString(ErrorSeverity severity) noexcept {
    switch (severity) {
        case ErrorSeverity::Fatal: return "fatal";
        case ErrorSeverity::Recoverable: return "recoverable";
        case ErrorSeverity::Warning: return "warning";
    }
    return "warning";
}

/**
 * @brief Категория кода ошибки (nullopt для Unclassified)
 */
[[nodiscard]] constexpr std::optional<ErrorSeverity> severityOf(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::UnsupportedFileType:
        case ErrorCode::FileNotFound:
        case ErrorCode::FileCorrupted:
        case ErrorCode::InvalidFileFormat:
        case ErrorCode::NoSheets:
        case ErrorCode::NoTextContent:
        case ErrorCode::NoDepthValues:
        case ErrorCode::NoMaterials:
        case ErrorCode::DepthColumnNotFound:
        case ErrorCode::MaterialColumnNotFound:
        case ErrorCode::InsufficientData:
        case ErrorCode::Cancelled:
            return ErrorSeverity::Fatal;

        case ErrorCode::NonNumericDepth:
        case ErrorCode::InvalidDepthValue:
        case ErrorCode::InconsistentDepthDirection:
        case ErrorCode::DuplicateDepth:
        case ErrorCode::LayerInverted:
        case ErrorCode::LayerOverlap:
        case ErrorCode::NoLayersDetected:
        case ErrorCode::PartialExtraction:
        case ErrorCode::ValidationFailed:
            return ErrorSeverity::Recoverable;

        case ErrorCode::DepthGap:
        case ErrorCode::LayerGap:
        case ErrorCode::NegativeDepth:
        case ErrorCode::UnitAssumed:
        case ErrorCode::DepthAboveWarningThreshold:
        case ErrorCode::PrecisionLoss:
        case ErrorCode::LowConfidence:
            return ErrorSeverity::Warning;

        case ErrorCode::Unclassified:
            return std::nullopt;
    }
    return std::nullopt;
}

/**
 * @brief Строковый идентификатор кода (для JSON)
 */
[[nodiscard]] constexpr std::string_view toString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::UnsupportedFileType: return "unsupported_file_type";
        case ErrorCode::FileNotFound: return "file_not_found";
        case ErrorCode::FileCorrupted: return "file_corrupted";
        case ErrorCode::InvalidFileFormat: return "invalid_file_format";
        case ErrorCode::NoSheets: return "no_sheets";
        case ErrorCode::NoTextContent: return "no_text_content";
        case ErrorCode::NoDepthValues: return "no_depth_values";
        case ErrorCode::NoMaterials: return "no_materials";
        case ErrorCode::DepthColumnNotFound: return "depth_column_not_found";
        case ErrorCode::MaterialColumnNotFound: return "material_column_not_found";
        case ErrorCode::InsufficientData: return "insufficient_data";
        case ErrorCode::Cancelled: return "cancelled";
        case ErrorCode::NonNumericDepth: return "non_numeric_depth";
        case ErrorCode::InvalidDepthValue: return "invalid_depth_value";
        case ErrorCode::InconsistentDepthDirection: return "inconsistent_depth_direction";
        case ErrorCode::DuplicateDepth: return "duplicate_depth";
        case ErrorCode::LayerInverted: return "layer_inverted";
        case ErrorCode::LayerOverlap: return "layer_overlap";
        case ErrorCode::NoLayersDetected: return "no_layers_detected";
        case ErrorCode::PartialExtraction: return "partial_extraction";
        case ErrorCode::ValidationFailed: return "validation_failed";
        case ErrorCode::DepthGap: return "depth_gap";
        case ErrorCode::LayerGap: return "layer_gap";
        case ErrorCode::NegativeDepth: return "negative_depth";
        case ErrorCode::UnitAssumed: return "unit_assumed";
        case ErrorCode::DepthAboveWarningThreshold: return "depth_above_warning_threshold";
        case ErrorCode::PrecisionLoss: return "precision_loss";
        case ErrorCode::LowConfidence: return "low_confidence";
        case ErrorCode::Unclassified: return "unclassified";
    }
    return "unclassified";
}

} // namespace strata::model
