/**
 * @file error_classifier.hpp
 * @brief Классификация ошибок извлечения: fatal / recoverable / warning
 * @author Yan Bubenok <yan@bubenok.com>
 *
 * Типизированные ошибки классифицируются по коду. Текст без кода
 * (сообщения сторонних библиотек) сопоставляется с таблицей правил:
 * сначала фатальные, затем восстановимые; всё остальное считается
 * предупреждением. Результат зависит только от входа.
 */

#pragma once

#include "model/extraction_error.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace strata::core {

using namespace strata::model;

class ErrorClassifier {
public:
    /**
     * @brief Классифицировать типизированную ошибку
     *
     * Unclassified передаётся в classifyError(message).
     */
    [[nodiscard]] ErrorClassification classify(const ExtractionError& error) const;

    /**
     * @brief Классифицировать текст ошибки
     *
     * Пустой текст считается фатальной ошибкой.
     */
    [[nodiscard]] ErrorClassification classifyError(std::string_view message) const;

    /**
     * @brief Сводная классификация набора ошибок
     */
    [[nodiscard]] ClassificationReport classifyErrors(const ErrorList& errors) const;
    [[nodiscard]] ClassificationReport classifyErrors(const std::vector<std::string>& messages) const;

    /**
     * @brief Заголовок, текст и действия для пользователя
     */
    [[nodiscard]] ErrorReport createErrorReport(const ClassificationReport& report) const;

    [[nodiscard]] static double confidenceImpact(ErrorSeverity severity) noexcept;
};

} // namespace strata::core
