/**
 * @file text_utils.cpp
 * @brief Утилиты для нормализации текста ячеек и фрагментов PDF
 */

#include "text_utils.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace strata::io {

namespace {

bool isSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool isAlpha(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) != 0;
}

} // anonymous namespace

std::string trim(std::string_view str) {
    size_t start = 0;
    while (start < str.size() && isSpace(str[start])) {
        ++start;
    }
    size_t end = str.size();
    while (end > start && isSpace(str[end - 1])) {
        --end;
    }
    return std::string(str.substr(start, end - start));
}

std::string stripBom(std::string_view str) {
    if (str.size() >= 3 &&
        static_cast<unsigned char>(str[0]) == 0xEF &&
        static_cast<unsigned char>(str[1]) == 0xBB &&
        static_cast<unsigned char>(str[2]) == 0xBF) {
        return std::string(str.substr(3));
    }
    return std::string(str);
}

std::string toLower(std::string_view input) {
    std::string result(input);
    std::transform(result.begin(), result.end(), result.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string collapseWhitespace(std::string_view input) {
    std::string result;
    result.reserve(input.size());
    bool last_was_space = false;
    for (char c : input) {
        if (isSpace(c)) {
            if (!last_was_space && !result.empty()) {
                result += ' ';
            }
            last_was_space = true;
        } else {
            result += c;
            last_was_space = false;
        }
    }
    while (!result.empty() && result.back() == ' ') {
        result.pop_back();
    }
    return result;
}

std::string titleCase(std::string_view input) {
    std::string result = toLower(collapseWhitespace(input));
    bool word_start = true;
    for (auto& c : result) {
        if (isAlpha(c)) {
            if (word_start) {
                c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
            }
            word_start = false;
        } else {
            word_start = (c == ' ' || c == '-' || c == '/');
        }
    }
    return result;
}

double parseDouble(std::string_view str) {
    std::string normalized = trim(str);
    if (normalized.empty()) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    std::replace(normalized.begin(), normalized.end(), ',', '.');

    try {
        size_t pos = 0;
        double value = std::stod(normalized, &pos);
        if (pos != normalized.size()) {
            return std::numeric_limits<double>::quiet_NaN();
        }
        return value;
    } catch (const std::invalid_argument&) {
        return std::numeric_limits<double>::quiet_NaN();
    } catch (const std::out_of_range&) {
        return std::numeric_limits<double>::quiet_NaN();
    }
}

bool containsWord(std::string_view text, std::string_view word) {
    if (word.empty()) return false;
    size_t pos = text.find(word);
    while (pos != std::string_view::npos) {
        const bool left_ok = pos == 0 || !isAlpha(text[pos - 1]);
        const size_t end = pos + word.size();
        const bool right_ok = end >= text.size() || !isAlpha(text[end]);
        if (left_ok && right_ok) {
            return true;
        }
        pos = text.find(word, pos + 1);
    }
    return false;
}

std::vector<std::string> splitWords(std::string_view input) {
    std::vector<std::string> words;
    std::string current;
    for (char c : input) {
        if (isSpace(c)) {
            if (!current.empty()) {
                words.push_back(current);
                current.clear();
            }
        } else {
            current += c;
        }
    }
    if (!current.empty()) {
        words.push_back(current);
    }
    return words;
}

std::string formatNumber(double value, int max_decimals) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(max_decimals) << value;
    std::string text = out.str();
    // Незначащие нули дробной части
    if (text.find('.') != std::string::npos) {
        while (!text.empty() && text.back() == '0') text.pop_back();
        if (!text.empty() && text.back() == '.') text.pop_back();
    }
    if (text == "-0") text = "0";
    return text;
}

} // namespace strata::io
