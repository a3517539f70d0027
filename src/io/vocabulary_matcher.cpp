/**
 * @file vocabulary_matcher.cpp
 * @brief Поиск материалов и единиц глубины в тексте по словарям
 * @author Yan Bubenok <yan@bubenok.com>
 */

#include "vocabulary_matcher.hpp"
#include "text_utils.hpp"
#include <algorithm>
#include <cctype>

namespace strata::io {

MaterialMatcher::MaterialMatcher(model::MaterialVocabulary vocabulary)
    : vocabulary_(std::move(vocabulary)) {}

bool MaterialMatcher::containsKeyword(std::string_view text) const {
    const std::string lowered = toLower(text);
    return std::any_of(vocabulary_.keywords.begin(), vocabulary_.keywords.end(),
        [&lowered](const std::string& keyword) {
            return lowered.find(keyword) != std::string::npos;
        });
}

std::string MaterialMatcher::normalize(std::string_view text) const {
    const std::string lowered = toLower(collapseWhitespace(text));
    for (const auto& [pattern, canonical] : vocabulary_.canonical_names) {
        if (lowered.find(pattern) != std::string::npos) {
            return canonical;
        }
    }
    return titleCase(text);
}

double MaterialMatcher::confidence(std::string_view text) const {
    const std::string lowered = toLower(trim(text));
    double result = 0.5;
    for (const auto& keyword : vocabulary_.keywords) {
        if (lowered == keyword) {
            result = 0.9;
            break;
        }
        if (lowered.find(keyword) != std::string::npos) {
            result = std::max(result, 0.7);
        }
    }
    // Длинные подписи и подписи с цифрами скорее примечания
    if (text.size() > 50) {
        result *= 0.8;
    }
    if (std::any_of(text.begin(), text.end(),
            [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; })) {
        result *= 0.9;
    }
    return result;
}

std::optional<model::DepthUnit> detectUnitInText(
    std::string_view text,
    const model::UnitVocabulary& units
) {
    std::string lowered = toLower(text);
    // Скобки и разделители превращаем в пробелы
    for (auto& c : lowered) {
        if (c == '(' || c == ')' || c == '[' || c == ']' || c == ',' || c == ';' || c == ':' || c == '/') {
            c = ' ';
        }
    }

    const auto words = splitWords(lowered);
    for (const auto& [alias, unit] : units.aliases) {
        if (alias.size() == 1 && !std::isalpha(static_cast<unsigned char>(alias.front()))) {
            // Знак вроде ' после числа
            if (lowered.find(alias) != std::string::npos) {
                return unit;
            }
            continue;
        }
        if (std::find(words.begin(), words.end(), alias) != words.end()) {
            return unit;
        }
    }
    return std::nullopt;
}

} // namespace strata::io
