/**
 * @file error_classifier.cpp
 * @brief Реализация классификации ошибок
 * @author Yan Bubenok <yan@bubenok.com>
 */

#include "error_classifier.hpp"
#include "io/text_utils.hpp"
#include <algorithm>

namespace strata::core {

namespace {

/**
 * @brief Правило: фрагменты, которые должны встретиться в тексте по порядку
 */
struct Rule {
    ErrorSeverity severity;
    std::vector<std::string_view> fragments;
    bool allow_save = false;
};

const std::vector<Rule>& rules() {
    static const std::vector<Rule> table = {
        // Фатальные
        {ErrorSeverity::Fatal, {"file", "corrupt"}},
        {ErrorSeverity::Fatal, {"cannot", "read", "file"}},
        {ErrorSeverity::Fatal, {"invalid", "file", "format"}},
        {ErrorSeverity::Fatal, {"unsupported", "file", "type"}},
        {ErrorSeverity::Fatal, {"no", "data", "found"}},
        {ErrorSeverity::Fatal, {"no depth values"}},
        {ErrorSeverity::Fatal, {"no text content"}},
        {ErrorSeverity::Fatal, {"contains no sheets"}},
        {ErrorSeverity::Fatal, {"could not identify", "depth"}},
        {ErrorSeverity::Fatal, {"critical", "parsing", "error"}},
        {ErrorSeverity::Fatal, {"schema", "violation"}},
        {ErrorSeverity::Fatal, {"extraction cancelled"}},

        // Восстановимые
        {ErrorSeverity::Recoverable, {"missing", "required", "field"}},
        {ErrorSeverity::Recoverable, {"invalid", "depth", "value"}},
        {ErrorSeverity::Recoverable, {"start depth", ">", "end depth"}},
        {ErrorSeverity::Recoverable, {"overlap"}},
        {ErrorSeverity::Recoverable, {"duplicate"}, true},
        {ErrorSeverity::Recoverable, {"inconsistent"}, true},
        {ErrorSeverity::Recoverable, {"non-numeric"}, true},
        {ErrorSeverity::Recoverable, {"ambiguous", "material"}, true},
        {ErrorSeverity::Recoverable, {"could not identify", "material"}, true},
        {ErrorSeverity::Recoverable, {"no material layers"}, true},
        {ErrorSeverity::Recoverable, {"partial", "extraction"}, true},
        {ErrorSeverity::Recoverable, {"validation", "failed"}, true},
    };
    return table;
}

bool matchesInOrder(const std::string& text, const std::vector<std::string_view>& fragments) {
    size_t pos = 0;
    for (auto fragment : fragments) {
        const size_t found = text.find(fragment, pos);
        if (found == std::string::npos) {
            return false;
        }
        pos = found + fragment.size();
    }
    return true;
}

// Восстановимые ошибки, после которых слои структурно некорректны
constexpr bool blocksSave(ErrorCode code) noexcept {
    return code == ErrorCode::LayerInverted ||
           code == ErrorCode::LayerOverlap ||
           code == ErrorCode::InvalidDepthValue;
}

ErrorClassification makeClassification(ErrorSeverity severity, bool recoverable_allow_save, std::string message) {
    ErrorClassification c;
    c.type = severity;
    c.message = std::move(message);
    c.confidence_impact = ErrorClassifier::confidenceImpact(severity);
    switch (severity) {
        case ErrorSeverity::Fatal:
            c.should_abort = true;
            c.allow_save = false;
            c.force_review = false;
            break;
        case ErrorSeverity::Recoverable:
            c.should_abort = false;
            c.allow_save = recoverable_allow_save;
            c.force_review = true;
            break;
        case ErrorSeverity::Warning:
            c.should_abort = false;
            c.allow_save = true;
            c.force_review = false;
            break;
    }
    return c;
}

} // anonymous namespace

double ErrorClassifier::confidenceImpact(ErrorSeverity severity) noexcept {
    switch (severity) {
        case ErrorSeverity::Fatal: return 1.0;
        case ErrorSeverity::Recoverable: return 0.3;
        case ErrorSeverity::Warning: return 0.05;
    }
    return 0.05;
}

ErrorClassification ErrorClassifier::classify(const ExtractionError& error) const {
    const auto severity = severityOf(error.code);
    if (!severity.has_value()) {
        return classifyError(error.message);
    }
    return makeClassification(*severity, !blocksSave(error.code), error.message);
}

ErrorClassification ErrorClassifier::classifyError(std::string_view message) const {
    const std::string text = io::toLower(io::trim(message));
    if (text.empty()) {
        return makeClassification(ErrorSeverity::Fatal, false, "Unknown error");
    }

    for (const auto& rule : rules()) {
        if (matchesInOrder(text, rule.fragments)) {
            return makeClassification(rule.severity, rule.allow_save, std::string(message));
        }
    }
    return makeClassification(ErrorSeverity::Warning, true, std::string(message));
}

namespace {

ClassificationReport aggregate(std::vector<ErrorClassification> items) {
    ClassificationReport report;
    for (const auto& c : items) {
        report.allow_save = report.allow_save && c.allow_save;
        report.should_abort = report.should_abort || c.should_abort;
        report.force_review = report.force_review || c.force_review;
        report.total_confidence_impact += c.confidence_impact;

        switch (c.type) {
            case ErrorSeverity::Fatal: ++report.fatal_count; break;
            case ErrorSeverity::Recoverable: ++report.recoverable_count; break;
            case ErrorSeverity::Warning: ++report.warning_count; break;
        }
    }
    report.total_confidence_impact = std::min(report.total_confidence_impact, 1.0);

    if (report.fatal_count > 0) {
        report.overall_type = ErrorSeverity::Fatal;
        // Фатальная ошибка отменяет проверку: сохранять нечего
        report.force_review = false;
        report.allow_save = false;
    } else if (report.recoverable_count > 0) {
        report.overall_type = ErrorSeverity::Recoverable;
    } else if (report.warning_count > 0) {
        report.overall_type = ErrorSeverity::Warning;
    }

    report.classifications = std::move(items);
    return report;
}

} // anonymous namespace

ClassificationReport ErrorClassifier::classifyErrors(const ErrorList& errors) const {
    std::vector<ErrorClassification> items;
    items.reserve(errors.size());
    for (const auto& e : errors) {
        items.push_back(classify(e));
    }
    return aggregate(std::move(items));
}

ClassificationReport ErrorClassifier::classifyErrors(const std::vector<std::string>& messages) const {
    std::vector<ErrorClassification> items;
    items.reserve(messages.size());
    for (const auto& m : messages) {
        items.push_back(classifyError(m));
    }
    return aggregate(std::move(items));
}

ErrorReport ErrorClassifier::createErrorReport(const ClassificationReport& report) const {
    if (!report.overall_type.has_value()) {
        return {"Extraction Complete", "No issues detected.", {"Save", "Review Data"}};
    }

    switch (*report.overall_type) {
        case ErrorSeverity::Fatal:
            return {"Extraction Failed",
                    "Critical errors prevent data extraction. Please check the file and try again.",
                    {"Close", "Try Different File"}};
        case ErrorSeverity::Recoverable:
            return {"Review Required",
                    "Data quality issues detected. Please review and correct the extracted data before saving.",
                    {"Review Data", "Cancel"}};
        case ErrorSeverity::Warning:
            break;
    }
    return {"Extraction Complete with Warnings",
            "Minor issues detected but extraction was successful. You may save or review the data.",
            {"Save", "Review Data", "Cancel"}};
}

} // namespace strata::core
