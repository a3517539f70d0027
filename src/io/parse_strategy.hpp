/**
 * @file parse_strategy.hpp
 * @brief Стратегии разбора документа
 * @author Yan Bubenok <yan@bubenok.com>
 *
 * Координатор перебирает стратегии по порядку до первой успешной.
 * Исключения читателей не выходят за пределы attempt().
 */

#pragma once

#include "pdf_signal_extractor.hpp"
#include "sheet_signal_extractor.hpp"
#include "model/config.hpp"
#include "model/extraction_error.hpp"
#include "model/extraction_result.hpp"
#include "model/raw_extraction.hpp"
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace strata::io {

/**
 * @brief Неудачная попытка разбора
 */
struct ParseFailure {
    model::ErrorCode code = model::ErrorCode::Unclassified;
    std::string message;
};

using ParseOutcome = std::variant<model::RawExtraction, ParseFailure>;

/**
 * @brief Стратегия разбора документа
 */
class ParseStrategy {
public:
    virtual ~ParseStrategy() = default;

    /**
     * @brief Имя для журнала попыток (primary_excel, page_by_page, ...)
     */
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;

    /**
     * @brief Попытка разбора; не бросает исключений при проблемах документа
     */
    [[nodiscard]] virtual ParseOutcome attempt(const std::filesystem::path& path) const = 0;
};

using StrategyList = std::vector<std::unique_ptr<ParseStrategy>>;

/**
 * @brief Первый лист, строгое сопоставление заголовков
 */
class PrimarySheetStrategy : public ParseStrategy {
public:
    explicit PrimarySheetStrategy(SheetSignalExtractor extractor);

    [[nodiscard]] std::string_view name() const noexcept override { return "primary_excel"; }
    [[nodiscard]] ParseOutcome attempt(const std::filesystem::path& path) const override;

private:
    SheetSignalExtractor extractor_;
};

/**
 * @brief Остальные листы книги по порядку
 */
class AlternativeSheetStrategy : public ParseStrategy {
public:
    explicit AlternativeSheetStrategy(SheetSignalExtractor extractor);

    [[nodiscard]] std::string_view name() const noexcept override { return "alternative_sheet"; }
    [[nodiscard]] ParseOutcome attempt(const std::filesystem::path& path) const override;

private:
    SheetSignalExtractor extractor_;
};

/**
 * @brief Все листы, поиск заголовков по подстроке, лист без колонки материала
 */
class RelaxedSheetStrategy : public ParseStrategy {
public:
    explicit RelaxedSheetStrategy(SheetSignalExtractor extractor);

    [[nodiscard]] std::string_view name() const noexcept override { return "relaxed_detection"; }
    [[nodiscard]] ParseOutcome attempt(const std::filesystem::path& path) const override;

private:
    SheetSignalExtractor extractor_;
};

/**
 * @brief Разбор PDF с заданными параметрами группировки строк
 */
class PdfTextStrategy : public ParseStrategy {
public:
    PdfTextStrategy(std::string name, PdfSignalExtractor extractor, PdfExtractionOptions options);

    [[nodiscard]] std::string_view name() const noexcept override { return name_; }
    [[nodiscard]] ParseOutcome attempt(const std::filesystem::path& path) const override;

private:
    std::string name_;
    PdfSignalExtractor extractor_;
    PdfExtractionOptions options_;
};

/**
 * @brief Упорядоченный список стратегий для типа файла
 *
 * Excel: primary_excel, alternative_sheet, relaxed_detection.
 * PDF: primary_pdf, alternative_text_extraction, page_by_page.
 */
[[nodiscard]] StrategyList makeStrategies(model::FileType type, const model::ExtractionConfig& config);

} // namespace strata::io
