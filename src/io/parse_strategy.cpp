/**
 * @file parse_strategy.cpp
 * @brief Реализация стратегий разбора
 * @author Yan Bubenok <yan@bubenok.com>
 */

#include "parse_strategy.hpp"
#include "format_registry.hpp"
#include "pdf_reader.hpp"
#include <spdlog/spdlog.h>

namespace strata::io {

using model::ErrorCode;
using model::RawExtraction;

namespace {

// Исключения читателей превращаются в ParseFailure
template <typename Parse>
ParseOutcome guarded(std::string_view strategy, Parse&& parse) {
    try {
        return parse();
    } catch (const DocumentReadError& e) {
        spdlog::debug("{}: {}", strategy, e.what());
        return ParseFailure{e.code(), e.what()};
    } catch (const std::exception& e) {
        spdlog::debug("{}: unexpected reader error: {}", strategy, e.what());
        return ParseFailure{ErrorCode::Unclassified, e.what()};
    }
}

} // anonymous namespace

PrimarySheetStrategy::PrimarySheetStrategy(SheetSignalExtractor extractor)
    : extractor_(std::move(extractor)) {}

ParseOutcome PrimarySheetStrategy::attempt(const std::filesystem::path& path) const {
    return guarded(name(), [&]() -> ParseOutcome {
        const Workbook workbook = readWorkbook(path);
        if (workbook.sheets.empty()) {
            return ParseFailure{ErrorCode::NoSheets, "Workbook contains no sheets"};
        }
        return extractor_.extract(workbook.sheets.front());
    });
}

AlternativeSheetStrategy::AlternativeSheetStrategy(SheetSignalExtractor extractor)
    : extractor_(std::move(extractor)) {}

ParseOutcome AlternativeSheetStrategy::attempt(const std::filesystem::path& path) const {
    return guarded(name(), [&]() -> ParseOutcome {
        const Workbook workbook = readWorkbook(path);
        if (workbook.sheets.size() < 2) {
            return ParseFailure{ErrorCode::InsufficientData, "Workbook has no other sheets to try"};
        }

        ParseFailure last{ErrorCode::InsufficientData, "No sheet contains strata data"};
        for (size_t i = 1; i < workbook.sheets.size(); ++i) {
            try {
                return extractor_.extract(workbook.sheets[i]);
            } catch (const DocumentReadError& e) {
                spdlog::debug("{}: sheet '{}': {}", name(), workbook.sheets[i].name, e.what());
                last = ParseFailure{e.code(), e.what()};
            }
        }
        return last;
    });
}

RelaxedSheetStrategy::RelaxedSheetStrategy(SheetSignalExtractor extractor)
    : extractor_(std::move(extractor)) {}

ParseOutcome RelaxedSheetStrategy::attempt(const std::filesystem::path& path) const {
    return guarded(name(), [&]() -> ParseOutcome {
        const Workbook workbook = readWorkbook(path);

        SheetExtractionOptions options;
        options.relaxed = true;

        ParseFailure last{ErrorCode::NoSheets, "Workbook contains no sheets"};
        for (const auto& sheet : workbook.sheets) {
            try {
                RawExtraction raw = extractor_.extract(sheet, options);
                raw.structure.format_hints.push_back("relaxed");
                return raw;
            } catch (const DocumentReadError& e) {
                spdlog::debug("{}: sheet '{}': {}", name(), sheet.name, e.what());
                last = ParseFailure{e.code(), e.what()};
            }
        }
        return last;
    });
}

PdfTextStrategy::PdfTextStrategy(std::string name, PdfSignalExtractor extractor, PdfExtractionOptions options)
    : name_(std::move(name))
    , extractor_(std::move(extractor))
    , options_(options) {}

ParseOutcome PdfTextStrategy::attempt(const std::filesystem::path& path) const {
    return guarded(name(), [&]() -> ParseOutcome {
        return extractor_.extract(readPdfText(path), options_);
    });
}

StrategyList makeStrategies(model::FileType type, const model::ExtractionConfig& config) {
    StrategyList strategies;

    if (type == model::FileType::Excel) {
        const SheetSignalExtractor extractor(config.materials, config.units);
        strategies.push_back(std::make_unique<PrimarySheetStrategy>(extractor));
        strategies.push_back(std::make_unique<AlternativeSheetStrategy>(extractor));
        strategies.push_back(std::make_unique<RelaxedSheetStrategy>(extractor));
        return strategies;
    }

    const PdfSignalExtractor extractor(config.materials, config.units);

    PdfExtractionOptions primary;

    // Подписи, смещённые относительно описаний (колонки разной высоты)
    PdfExtractionOptions alternative;
    alternative.line_threshold = 12.0;
    alternative.correlation_distance = 100.0;

    PdfExtractionOptions per_page;
    per_page.per_page = true;

    strategies.push_back(std::make_unique<PdfTextStrategy>("primary_pdf", extractor, primary));
    strategies.push_back(std::make_unique<PdfTextStrategy>("alternative_text_extraction", extractor, alternative));
    strategies.push_back(std::make_unique<PdfTextStrategy>("page_by_page", extractor, per_page));
    return strategies;
}

} // namespace strata::io
