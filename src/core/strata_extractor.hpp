/**
 * @file strata_extractor.hpp
 * @brief Координатор извлечения разреза из файла
 * @author Yan Bubenok <yan@bubenok.com>
 *
 * Последовательность: тип файла -> стратегии разбора по порядку ->
 * перевод глубин в футы -> проверка и исправление глубин ->
 * выделение слоёв (с альтернативами) -> оценка уверенности ->
 * классификация ошибок -> стратегия восстановления.
 * Ошибки документа не выходят за пределы extractFromFile().
 */

#pragma once

#include "confidence_scorer.hpp"
#include "depth_normalizer.hpp"
#include "error_classifier.hpp"
#include "fallback_manager.hpp"
#include "layer_detector.hpp"
#include "validation_service.hpp"
#include "io/parse_strategy.hpp"
#include "model/config.hpp"
#include "model/extraction_report.hpp"
#include "model/extraction_result.hpp"
#include <atomic>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace strata::core {

using namespace strata::model;

/**
 * @brief Фабрика стратегий разбора для типа файла
 */
using StrategyFactory = std::function<io::StrategyList(FileType, const ExtractionConfig&)>;

class StrataExtractor {
public:
    explicit StrataExtractor(ExtractionConfig config = defaultConfig());

    /**
     * @brief Извлечь слои из файла
     *
     * Не бросает исключений из-за содержимого документа: любая
     * проблема возвращается как ExtractionResult с success = false.
     */
    [[nodiscard]] ExtractionResult extractFromFile(const std::filesystem::path& path);

    /**
     * @brief Сбросить состояние предыдущего вызова
     */
    void reset();

    [[nodiscard]] bool isFileSupported(const std::filesystem::path& path) const;
    [[nodiscard]] std::map<FileType, std::vector<std::string>> getSupportedFileTypes() const;

    /**
     * @brief Слой после правки пользователем (high, user_edited)
     */
    [[nodiscard]] ExtractedLayer updateConfidenceForEdit(const ExtractedLayer& layer) const;

    /**
     * @brief Подменить стратегии разбора (по умолчанию io::makeStrategies)
     */
    void setStrategyFactory(StrategyFactory factory);

    /**
     * @brief Флаг отмены, проверяется между попытками разбора
     *
     * Флаг принадлежит вызывающей стороне и должен жить дольше вызова.
     */
    void setCancellationFlag(const std::atomic<bool>* flag) noexcept { cancel_ = flag; }

    /**
     * @brief Статистика по последнему результату
     */
    [[nodiscard]] std::optional<ExtractionStatistics> getStatistics() const;

    /**
     * @brief Отчёт по последнему результату
     */
    [[nodiscard]] std::optional<ExtractionReport> generateReport() const;

    [[nodiscard]] const std::optional<ExtractionResult>& lastResult() const noexcept { return last_result_; }
    [[nodiscard]] const ExtractionConfig& config() const noexcept { return config_; }

private:
    [[nodiscard]] ExtractionResult run(const std::filesystem::path& path);
    void normalizeDepths(RawExtraction& raw, ExtractionResult& result) const;
    void applyFallback(ExtractionResult& result, const SourceStructure& structure,
                       const std::filesystem::path& path);
    [[nodiscard]] bool cancelled() const noexcept;

    ExtractionConfig config_;
    DepthNormalizer normalizer_;
    ValidationService validator_;
    LayerDetector detector_;
    ConfidenceScorer scorer_;
    ErrorClassifier classifier_;
    FallbackManager fallback_;
    StrategyFactory strategy_factory_;
    const std::atomic<bool>* cancel_ = nullptr;
    std::optional<ExtractionResult> last_result_;
};

/**
 * @brief Статистика по набору слоёв
 */
[[nodiscard]] ExtractionStatistics computeStatistics(const LayerList& layers);

} // namespace strata::core
