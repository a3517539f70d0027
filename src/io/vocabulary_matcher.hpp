/**
 * @file vocabulary_matcher.hpp
 * @brief Поиск материалов и единиц глубины в тексте по словарям
 * @author Yan Bubenok <yan@bubenok.com>
 */

#pragma once

#include "model/config.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace strata::io {

/**
 * @brief Сопоставление текста со словарём материалов
 */
class MaterialMatcher {
public:
    explicit MaterialMatcher(model::MaterialVocabulary vocabulary);

    /**
     * @brief Содержит ли текст ключевое слово материала
     */
    [[nodiscard]] bool containsKeyword(std::string_view text) const;

    /**
     * @brief Каноническое имя материала
     *
     * Составные названия из словаря ("sandy clay" -> "Sandy Clay"),
     * иначе каждое слово с заглавной буквы.
     */
    [[nodiscard]] std::string normalize(std::string_view text) const;

    /**
     * @brief Уверенность в том, что текст является описанием материала (0..1)
     */
    [[nodiscard]] double confidence(std::string_view text) const;

    [[nodiscard]] const model::MaterialVocabulary& vocabulary() const noexcept { return vocabulary_; }

private:
    model::MaterialVocabulary vocabulary_;
};

/**
 * @brief Единица глубины, упомянутая в заголовке или подписи
 *
 * Ищет обозначения словаря как отдельные слова, в том числе в скобках:
 * "Depth (m)", "DEPTH FT", "10'".
 */
[[nodiscard]] std::optional<model::DepthUnit> detectUnitInText(
    std::string_view text,
    const model::UnitVocabulary& units
);

} // namespace strata::io
