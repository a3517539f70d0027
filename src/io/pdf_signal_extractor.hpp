/**
 * @file pdf_signal_extractor.hpp
 * @brief Извлечение сигналов разреза из текста PDF
 * @author Yan Bubenok <yan@bubenok.com>
 */

#pragma once

#include "document.hpp"
#include "vocabulary_matcher.hpp"
#include "model/config.hpp"
#include "model/raw_extraction.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace strata::io {

/**
 * @brief Параметры разбора текста
 */
struct PdfExtractionOptions {
    double line_threshold = 5.0;         ///< Разница y, при которой фрагменты в одной строке
    double correlation_distance = 50.0;  ///< Макс. расстояние по y от глубины до материала
    bool per_page = false;               ///< Каждая страница независимо, нечитаемые пропускаются
};

/**
 * @brief Строка текста, собранная из фрагментов
 */
struct TextLine {
    double y = 0.0;
    size_t page = 0;
    std::vector<TextItem> items;
    std::string text;                    ///< Фрагменты через пробел
};

/**
 * @brief Найденная подпись глубины
 */
struct DepthLabel {
    double value = 0.0;
    std::string text;
    double x = 0.0;
    double y = 0.0;
    size_t page = 0;
    size_t line_index = 0;
};

/**
 * @brief Строка с описанием материала
 */
struct MaterialRegion {
    std::string material;                ///< Нормализованное имя
    std::string original_text;
    double x = 0.0;
    double y = 0.0;
    size_t page = 0;
    size_t line_index = 0;
    double confidence = 0.0;
};

/**
 * @brief Разбор текста PDF: подписи глубин, описания материалов и их сопоставление
 */
class PdfSignalExtractor {
public:
    PdfSignalExtractor(model::MaterialVocabulary materials, model::UnitVocabulary units);

    /**
     * @brief Извлечь сигналы из текста документа
     *
     * Каждой глубине сопоставляется ближайший по вертикали материал
     * той же страницы. Цветов у PDF нет.
     *
     * @throws DocumentReadError NoTextContent, NoDepthValues, NoMaterials
     */
    [[nodiscard]] model::RawExtraction extract(
        const PdfText& text,
        const PdfExtractionOptions& options = {}
    ) const;

    [[nodiscard]] std::vector<DepthLabel> detectDepthLabels(const std::vector<TextLine>& lines) const;
    [[nodiscard]] std::vector<MaterialRegion> identifyMaterialRegions(const std::vector<TextLine>& lines) const;

    /**
     * @brief Единица по числу упоминаний (nullopt, если не упоминается)
     */
    [[nodiscard]] std::optional<model::DepthUnit> detectDepthUnit(const std::vector<TextLine>& lines) const;

private:
    struct PageSignals {
        std::vector<DepthLabel> depths;
        std::vector<MaterialRegion> materials;
    };

    void correlate(
        const std::vector<DepthLabel>& depths,
        const std::vector<MaterialRegion>& materials,
        double max_distance,
        model::RawExtraction& raw
    ) const;

    MaterialMatcher materials_;
    model::UnitVocabulary units_;
};

/**
 * @brief Группировка фрагментов в строки
 *
 * Фрагменты упорядочиваются по странице и y. Соседние фрагменты
 * с разницей y меньше порога попадают в одну строку, внутри строки
 * порядок по x.
 */
[[nodiscard]] std::vector<TextLine> groupIntoLines(std::vector<TextItem> items, double threshold);

/**
 * @brief Значение глубины из подписи
 *
 * Распознаются "12.5", "12 ft", "40 m", "10'", "10-20" (начало диапазона)
 * и "Depth: 12". Значение должно быть в диапазоне [0, 10000).
 */
[[nodiscard]] std::optional<double> matchDepthLabel(std::string_view text);

} // namespace strata::io
