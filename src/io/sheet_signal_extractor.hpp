/**
 * @file sheet_signal_extractor.hpp
 * @brief Извлечение сигналов разреза из табличного листа
 * @author Yan Bubenok <yan@bubenok.com>
 */

#pragma once

#include "document.hpp"
#include "vocabulary_matcher.hpp"
#include "model/config.hpp"
#include "model/raw_extraction.hpp"
#include <optional>
#include <string>

namespace strata::io {

/**
 * @brief Режим поиска колонок
 */
struct SheetExtractionOptions {
    bool relaxed = false;              ///< Подстрока в заголовке, лист без колонки материала
    size_t header_search_rows = 6;     ///< Сколько первых строк просматривать
    size_t inference_rows = 10;        ///< Строк для вывода колонки по значениям
};

/**
 * @brief Найденная колонка
 */
struct ColumnMatch {
    size_t index = 0;
    std::string header;                ///< Заголовок или "Depth (inferred)"
    std::optional<size_t> header_row;  ///< nullopt, если колонка выведена по значениям
};

/**
 * @brief Извлечение глубин, материалов и цветов заливки из листа
 */
class SheetSignalExtractor {
public:
    SheetSignalExtractor(model::MaterialVocabulary materials, model::UnitVocabulary units);

    /**
     * @brief Извлечь сигналы из листа
     *
     * Строка попадает в результат, только если в ней есть глубина.
     *
     * @throws DocumentReadError DepthColumnNotFound, MaterialColumnNotFound, NoDepthValues, NoMaterials
     */
    [[nodiscard]] model::RawExtraction extract(
        const Sheet& sheet,
        const SheetExtractionOptions& options = {}
    ) const;

    /**
     * @brief Поиск колонки глубины: по заголовку, затем по возрастающим числам
     */
    [[nodiscard]] std::optional<ColumnMatch> findDepthColumn(
        const Sheet& sheet,
        const SheetExtractionOptions& options = {}
    ) const;

    /**
     * @brief Поиск колонки материала: по заголовку, затем по текстовым значениям
     */
    [[nodiscard]] std::optional<ColumnMatch> findMaterialColumn(
        const Sheet& sheet,
        std::optional<size_t> exclude_column,
        const SheetExtractionOptions& options = {}
    ) const;

private:
    MaterialMatcher materials_;
    model::UnitVocabulary units_;
};

/**
 * @brief Глубина из ячейки: число или ведущее число строки ("12.5 ft")
 */
[[nodiscard]] std::optional<double> depthFromCell(const SheetCell& cell);

} // namespace strata::io
