/**
 * @file fallback_manager.hpp
 * @brief Выбор и выполнение стратегии восстановления
 * @author Yan Bubenok <yan@bubenok.com>
 *
 * Порядок выбора: фатальная ошибка -> без восстановления;
 * есть слои и уверенность >= partial -> частичное извлечение;
 * есть слои и уверенность >= minimum -> исправление по подсказкам;
 * распознаваемая структура -> по шаблону; иначе ручной ввод.
 * Ни одна стратегия не сохраняет данные сама: результат всегда
 * сессия для проверки пользователем.
 */

#pragma once

#include "model/config.hpp"
#include "model/extraction_result.hpp"
#include "model/fallback.hpp"
#include "model/raw_extraction.hpp"
#include <string>
#include <vector>

namespace strata::core {

using namespace strata::model;

/**
 * @brief Исходные данные для сессии восстановления
 */
struct FallbackContext {
    std::string file;
    LayerList layers;
    double confidence = 0.0;
    ClassificationReport classification;
    SourceStructure structure;
};

/**
 * @brief Запись о попытке восстановления
 */
struct RecoveryAttempt {
    std::string id;
    FallbackStrategyType strategy = FallbackStrategyType::ManualEntry;
    bool success = false;
    std::string error;
};

class FallbackManager {
public:
    explicit FallbackManager(FallbackThresholds thresholds = {});

    /**
     * @brief Выбрать стратегию по результату и классификации ошибок
     */
    [[nodiscard]] FallbackStrategy determineFallbackStrategy(
        const ExtractionResult& result,
        const ClassificationReport& classification
    ) const;

    /**
     * @brief Подготовить сессию восстановления
     *
     * Не бросает: при невозможности (нет стратегии, исчерпан лимит
     * попыток, не найден шаблон) success = false и заполнено error.
     */
    [[nodiscard]] RecoverySession executeFallbackStrategy(
        const FallbackStrategy& strategy,
        const FallbackContext& context
    );

    /**
     * @brief Можно ли попробовать шаблон
     *
     * Заголовки, число колонок или распознанные признаки формата.
     */
    [[nodiscard]] bool canUseTemplateMatching(const ExtractionMetadata& metadata) const noexcept;

    /**
     * @brief Сопоставление колонок по структуре источника
     */
    [[nodiscard]] std::optional<TemplateMapping> findTemplateMapping(const SourceStructure& structure) const;

    /**
     * @brief Слои без материала или с нулевой мощностью
     */
    [[nodiscard]] std::vector<MissingFields> identifyMissingFields(const LayerList& layers) const;

    /**
     * @brief Исправления по классификации ошибок и слоям с низкой уверенностью
     */
    [[nodiscard]] std::vector<CorrectionItem> generateCorrectionGuidance(
        const LayerList& layers,
        const ClassificationReport& classification
    ) const;

    /**
     * @brief Сортировка: важность (high > medium > low), затем число затронутых слоёв
     */
    [[nodiscard]] static std::vector<CorrectionItem> prioritizeCorrections(std::vector<CorrectionItem> corrections);

    [[nodiscard]] static CorrectionSeverity mapErrorToSeverity(ErrorSeverity type) noexcept;

    /**
     * @brief Ручной ввод: всегда доступен
     */
    [[nodiscard]] static FallbackStrategy manualEntryStrategy();

    [[nodiscard]] const std::vector<RecoveryAttempt>& attempts() const noexcept { return attempts_; }
    [[nodiscard]] const FallbackThresholds& thresholds() const noexcept { return thresholds_; }

    void reset() { attempts_.clear(); }

private:
    [[nodiscard]] std::string generateRecoveryId() const;

    FallbackThresholds thresholds_;
    std::vector<RecoveryAttempt> attempts_;
};

} // namespace strata::core
