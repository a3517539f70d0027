/**
 * @file document.hpp
 * @brief Декодированное содержимое документов (таблицы и текст PDF)
 * @author Yan Bubenok <yan@bubenok.com>
 */

#pragma once

#include "model/extraction_error.hpp"
#include <algorithm>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace strata::io {

/**
 * @brief Ячейка таблицы
 */
struct SheetCell {
    std::string text;                   ///< Текстовое представление значения
    std::optional<double> number;       ///< Числовое значение, если ячейка числовая
    std::optional<std::string> fill_color; ///< "#RRGGBB", "theme:N" или "indexed:N"

    [[nodiscard]] bool empty() const noexcept {
        return text.empty() && !number.has_value();
    }
};

using SheetRow = std::vector<SheetCell>;

/**
 * @brief Лист книги
 */
struct Sheet {
    std::string name;
    std::vector<SheetRow> rows;

    [[nodiscard]] size_t columnCount() const noexcept {
        size_t count = 0;
        for (const auto& row : rows) {
            count = std::max(count, row.size());
        }
        return count;
    }

    /**
     * @brief Ячейка по индексам (nullptr, если её нет)
     */
    [[nodiscard]] const SheetCell* cell(size_t row, size_t col) const noexcept {
        if (row >= rows.size() || col >= rows[row].size()) {
            return nullptr;
        }
        return &rows[row][col];
    }
};

/**
 * @brief Книга (CSV читается как книга из одного листа)
 */
struct Workbook {
    std::vector<Sheet> sheets;
};

/**
 * @brief Фрагмент текста PDF с положением на странице
 *
 * Координаты в пунктах, начало в левом верхнем углу страницы.
 */
struct TextItem {
    std::string text;
    double x = 0.0;
    double y = 0.0;
    double width = 0.0;
    double height = 0.0;
    size_t page = 0;
};

/**
 * @brief Текстовое содержимое PDF
 */
struct PdfText {
    std::vector<TextItem> items;
    size_t page_count = 0;
    std::vector<double> page_heights;

    [[nodiscard]] size_t textLength() const noexcept {
        size_t length = 0;
        for (const auto& item : items) {
            length += item.text.size();
        }
        return length;
    }
};

/**
 * @brief Ошибка чтения документа
 */
class DocumentReadError : public std::runtime_error {
public:
    DocumentReadError(model::ErrorCode code, const std::string& message, size_t line = 0)
        : std::runtime_error(message)
        , code_(code)
        , line_(line) {}

    [[nodiscard]] model::ErrorCode code() const noexcept { return code_; }
    [[nodiscard]] size_t line() const noexcept { return line_; }

private:
    model::ErrorCode code_;
    size_t line_;
};

} // namespace strata::io
