/**
 * @file validation.hpp
 * @brief Результаты валидации последовательности глубин и границ слоёв
 * @author Yan Bubenok <yan@bubenok.com>
 */

#pragma once

#include "extraction_error.hpp"
#include <optional>
#include <string>
#include <vector>

namespace strata::model {

/**
 * @brief Тип ошибки валидации
 */
enum class ValidationErrorType {
    MissingDepths,          ///< Нет глубин или ни одной числовой
    NonNumericDepth,        ///< Часть глубин не числа
    InvertedLayer,          ///< Кровля ниже подошвы
    MissingMaterial,        ///< Пустой материал
    LayerOverlap            ///< Перекрытие слоёв (при сохранении)
};

/**
 * @brief Ошибка валидации
 */
struct ValidationError {
    ValidationErrorType type;
    std::string field;                   ///< Имя поля с ошибкой
    std::string message;                 ///< Описание ошибки
    std::optional<size_t> item_index;    ///< Индекс элемента (для ошибок в массиве)

    [[nodiscard]] std::string toString() const {
        if (item_index.has_value()) {
            return "Layer " + std::to_string(*item_index + 1) + ": " + message;
        }
        return message;
    }

    /**
     * @brief Код ошибки извлечения, соответствующий типу
     */
    [[nodiscard]] ErrorCode code() const noexcept {
        switch (type) {
            case ValidationErrorType::MissingDepths: return ErrorCode::NoDepthValues;
            case ValidationErrorType::NonNumericDepth: return ErrorCode::NonNumericDepth;
            case ValidationErrorType::InvertedLayer: return ErrorCode::LayerInverted;
            case ValidationErrorType::LayerOverlap: return ErrorCode::LayerOverlap;
            case ValidationErrorType::MissingMaterial: return ErrorCode::ValidationFailed;
        }
        return ErrorCode::ValidationFailed;
    }
};

/**
 * @brief Типизированное предупреждение валидации
 */
struct ValidationWarning {
    ErrorCode code = ErrorCode::Unclassified;
    std::string message;
};

/**
 * @brief Статистика последовательности глубин
 */
struct DepthStatistics {
    size_t count = 0;
    double min = 0.0;
    double max = 0.0;
    bool is_increasing = true;
    size_t unique_count = 0;
};

/**
 * @brief Результат валидации
 */
struct ValidationResult {
    bool is_valid = true;
    std::vector<ValidationError> errors;
    std::vector<ValidationWarning> warnings;  ///< Некритичные замечания
    std::optional<DepthStatistics> stats;

    void addError(ValidationErrorType type, const std::string& field,
                  const std::string& message, std::optional<size_t> index = std::nullopt) {
        is_valid = false;
        errors.push_back({type, field, message, index});
    }

    void addWarning(ErrorCode code, const std::string& message) {
        warnings.push_back({code, message});
    }

    [[nodiscard]] bool hasErrors() const noexcept { return !errors.empty(); }
    [[nodiscard]] bool hasWarnings() const noexcept { return !warnings.empty(); }

    [[nodiscard]] std::vector<std::string> errorMessages() const {
        std::vector<std::string> out;
        out.reserve(errors.size());
        for (const auto& e : errors) out.push_back(e.toString());
        return out;
    }

    [[nodiscard]] std::vector<std::string> warningMessages() const {
        std::vector<std::string> out;
        out.reserve(warnings.size());
        for (const auto& w : warnings) out.push_back(w.message);
        return out;
    }
};

/**
 * @brief Результат проверки равномерности шага глубин
 */
struct IntervalConsistency {
    bool consistent = true;
    std::optional<double> mode_interval;   ///< Модальный шаг (округлён до 0.1)
    double consistency_ratio = 1.0;        ///< Доля шагов в пределах 10% от моды
};

} // namespace strata::model
