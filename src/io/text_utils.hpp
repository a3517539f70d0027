/**
 * @file text_utils.hpp
 * @brief Утилиты для нормализации текста ячеек и фрагментов PDF
 */

#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace strata::io {

/**
 * @brief Удаление пробельных символов по краям
 */
[[nodiscard]] std::string trim(std::string_view str);

/**
 * @brief Удаление UTF-8 BOM в начале строки
 */
[[nodiscard]] std::string stripBom(std::string_view str);

/**
 * @brief Перевод строки в нижний регистр (ASCII, остальные байты без изменений)
 */
[[nodiscard]] std::string toLower(std::string_view input);

/**
 * @brief Схлопывание последовательностей пробелов в один пробел
 */
[[nodiscard]] std::string collapseWhitespace(std::string_view input);

/**
 * @brief Каждое слово с заглавной буквы ("sandy clay" -> "Sandy Clay")
 */
[[nodiscard]] std::string titleCase(std::string_view input);

/**
 * @brief Разбор числа; строка должна быть числом целиком
 *
 * Десятичная запятая допускается. Возвращает NaN при ошибке.
 */
[[nodiscard]] double parseDouble(std::string_view str);

/**
 * @brief Проверка, что в тексте есть слово (границы: не буквы)
 */
[[nodiscard]] bool containsWord(std::string_view text, std::string_view word);

/**
 * @brief Разбиение строки по пробелам
 */
[[nodiscard]] std::vector<std::string> splitWords(std::string_view input);

/**
 * @brief Число без незначащих нулей ("12.5", "1000", "0.0044")
 */
[[nodiscard]] std::string formatNumber(double value, int max_decimals = 4);

} // namespace strata::io
