/**
 * @file sheet_signal_extractor.cpp
 * @brief Реализация извлечения сигналов из табличного листа
 * @author Yan Bubenok <yan@bubenok.com>
 */

#include "sheet_signal_extractor.hpp"
#include "text_utils.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>

namespace strata::io {

using model::ErrorCode;
using model::RawExtraction;

namespace {

const std::array<std::string_view, 6> kDepthHeaders = {
    "depth", "elevation", "elev", "from", "top", "start depth"
};

const std::array<std::string_view, 11> kMaterialHeaders = {
    "strata", "material", "soil type", "soil", "lithology", "description",
    "layer", "formation", "geology", "rock type", "unit"
};

// Заголовок в нижнем регистре без скобок и лишних пробелов
std::string normalizeHeader(std::string_view header) {
    std::string lowered = toLower(header);
    for (auto& c : lowered) {
        if (c == '(' || c == ')' || c == '[' || c == ']' || c == '_' || c == ':') {
            c = ' ';
        }
    }
    return collapseWhitespace(lowered);
}

// "depth ft" -> "depth": единица в конце заголовка не влияет на сопоставление
std::string stripUnitSuffix(const std::string& header, const model::UnitVocabulary& units) {
    auto words = splitWords(header);
    if (words.size() > 1) {
        const auto& last = words.back();
        const bool is_unit = std::any_of(units.aliases.begin(), units.aliases.end(),
            [&last](const auto& alias) { return alias.first == last; });
        if (is_unit) {
            words.pop_back();
        }
    }
    std::string result;
    for (const auto& w : words) {
        if (!result.empty()) result += ' ';
        result += w;
    }
    return result;
}

template <size_t N>
bool matchesHeader(const std::string& header, const std::array<std::string_view, N>& patterns, bool relaxed) {
    for (const auto& pattern : patterns) {
        if (header == pattern) return true;
        if (relaxed && containsWord(header, pattern)) return true;
    }
    return false;
}

bool isTextCell(const SheetCell& cell) {
    return !trim(cell.text).empty() && !cell.number.has_value() && std::isnan(parseDouble(cell.text));
}

} // anonymous namespace

std::optional<double> depthFromCell(const SheetCell& cell) {
    if (cell.number.has_value()) {
        return cell.number;
    }
    const std::string text = trim(cell.text);
    if (text.empty()) {
        return std::nullopt;
    }

    // Ведущее число: знак, цифры, десятичная точка/запятая
    size_t end = 0;
    if (end < text.size() && (text[end] == '-' || text[end] == '+')) ++end;
    bool has_digits = false;
    bool has_separator = false;
    while (end < text.size()) {
        const char c = text[end];
        if (std::isdigit(static_cast<unsigned char>(c))) {
            has_digits = true;
        } else if ((c == '.' || c == ',') && !has_separator) {
            has_separator = true;
        } else {
            break;
        }
        ++end;
    }
    if (!has_digits) {
        return std::nullopt;
    }
    const double value = parseDouble(text.substr(0, end));
    if (std::isnan(value)) {
        return std::nullopt;
    }
    return value;
}

SheetSignalExtractor::SheetSignalExtractor(model::MaterialVocabulary materials, model::UnitVocabulary units)
    : materials_(std::move(materials))
    , units_(std::move(units)) {}

std::optional<ColumnMatch> SheetSignalExtractor::findDepthColumn(
    const Sheet& sheet,
    const SheetExtractionOptions& options
) const {
    const size_t header_rows = std::min(options.header_search_rows, sheet.rows.size());
    for (size_t row = 0; row < header_rows; ++row) {
        for (size_t col = 0; col < sheet.rows[row].size(); ++col) {
            const auto& cell = sheet.rows[row][col];
            if (cell.number.has_value()) continue;
            const std::string header = stripUnitSuffix(normalizeHeader(cell.text), units_);
            if (!header.empty() && matchesHeader(header, kDepthHeaders, options.relaxed)) {
                return ColumnMatch{col, trim(cell.text), row};
            }
        }
    }

    // Колонка с числами, возрастающими в большинстве шагов
    const size_t column_count = sheet.columnCount();
    for (size_t col = 0; col < column_count; ++col) {
        std::vector<double> values;
        for (size_t row = 0; row < sheet.rows.size() && row <= options.inference_rows; ++row) {
            const auto* cell = sheet.cell(row, col);
            if (cell && cell->number.has_value()) {
                values.push_back(*cell->number);
            }
        }
        if (values.size() < 3) continue;

        size_t increasing = 0;
        for (size_t i = 1; i < values.size(); ++i) {
            if (values[i] > values[i - 1]) ++increasing;
        }
        if (static_cast<double>(increasing) >= 0.7 * static_cast<double>(values.size() - 1)) {
            return ColumnMatch{col, "Depth (inferred)", std::nullopt};
        }
    }

    return std::nullopt;
}

std::optional<ColumnMatch> SheetSignalExtractor::findMaterialColumn(
    const Sheet& sheet,
    std::optional<size_t> exclude_column,
    const SheetExtractionOptions& options
) const {
    const size_t header_rows = std::min(options.header_search_rows, sheet.rows.size());
    for (size_t row = 0; row < header_rows; ++row) {
        for (size_t col = 0; col < sheet.rows[row].size(); ++col) {
            if (exclude_column.has_value() && col == *exclude_column) continue;
            const auto& cell = sheet.rows[row][col];
            if (cell.number.has_value()) continue;
            const std::string header = normalizeHeader(cell.text);
            if (!header.empty() && matchesHeader(header, kMaterialHeaders, options.relaxed)) {
                return ColumnMatch{col, trim(cell.text), row};
            }
        }
    }

    // Колонка, где хотя бы половина значений текстовые
    const size_t column_count = sheet.columnCount();
    for (size_t col = 0; col < column_count; ++col) {
        if (exclude_column.has_value() && col == *exclude_column) continue;
        size_t text_count = 0;
        size_t total_count = 0;
        for (size_t row = 1; row < sheet.rows.size() && row <= options.inference_rows; ++row) {
            const auto* cell = sheet.cell(row, col);
            if (!cell || cell->empty()) continue;
            ++total_count;
            if (isTextCell(*cell)) ++text_count;
        }
        if (total_count >= 3 && static_cast<double>(text_count) >= 0.5 * static_cast<double>(total_count)) {
            return ColumnMatch{col, "Material (inferred)", std::nullopt};
        }
    }

    return std::nullopt;
}

RawExtraction SheetSignalExtractor::extract(
    const Sheet& sheet,
    const SheetExtractionOptions& options
) const {
    auto depth_column = findDepthColumn(sheet, options);
    if (!depth_column.has_value()) {
        throw DocumentReadError(ErrorCode::DepthColumnNotFound,
            "Could not identify depth column in the spreadsheet");
    }

    auto material_column = findMaterialColumn(sheet, depth_column->index, options);

    bool sheet_has_colors = false;
    for (const auto& row : sheet.rows) {
        for (const auto& cell : row) {
            if (cell.fill_color.has_value()) {
                sheet_has_colors = true;
                break;
            }
        }
        if (sheet_has_colors) break;
    }

    if (!material_column.has_value() && !(options.relaxed && sheet_has_colors)) {
        throw DocumentReadError(ErrorCode::MaterialColumnNotFound,
            "Could not identify strata/material column in the spreadsheet");
    }

    RawExtraction raw;
    raw.structure.sheet_name = sheet.name;
    raw.structure.column_count = sheet.columnCount();
    raw.structure.depth_column = depth_column->index;
    raw.structure.depth_header = depth_column->header;
    raw.structure.has_headers = depth_column->header_row.has_value();
    raw.structure.mapped_columns = 1;
    if (material_column.has_value()) {
        raw.structure.material_column = material_column->index;
        raw.structure.material_header = material_column->header;
        raw.structure.has_headers = raw.structure.has_headers || material_column->header_row.has_value();
        raw.structure.mapped_columns += 1;
    }
    if (sheet_has_colors) {
        raw.structure.mapped_columns += 1;
        raw.structure.format_hints.push_back("fill-colors");
    }
    if (raw.structure.has_headers) {
        raw.structure.format_hints.push_back("header:" + depth_column->header);
    }

    if (depth_column->header_row.has_value()) {
        raw.depth_unit = detectUnitInText(depth_column->header, units_);
        if (raw.depth_unit.has_value()) {
            raw.structure.format_hints.push_back("unit:" + std::string(model::unitName(*raw.depth_unit)));
        }
    }

    size_t first_row = 0;
    if (depth_column->header_row.has_value()) {
        first_row = *depth_column->header_row + 1;
    }
    if (material_column.has_value() && material_column->header_row.has_value()) {
        first_row = std::max(first_row, *material_column->header_row + 1);
    }

    for (size_t row = first_row; row < sheet.rows.size(); ++row) {
        const auto* depth_cell = sheet.cell(row, depth_column->index);
        if (!depth_cell) continue;
        auto depth = depthFromCell(*depth_cell);
        if (!depth.has_value()) continue;

        std::optional<std::string> material;
        std::optional<std::string> color;
        if (material_column.has_value()) {
            if (const auto* cell = sheet.cell(row, material_column->index)) {
                const std::string text = trim(cell->text);
                if (!text.empty()) {
                    material = materials_.containsKeyword(text) ? materials_.normalize(text) : text;
                }
                color = cell->fill_color;
            }
        }
        if (!color.has_value() && options.relaxed) {
            for (const auto& cell : sheet.rows[row]) {
                if (cell.fill_color.has_value()) {
                    color = cell.fill_color;
                    break;
                }
            }
        }

        raw.addPoint(*depth, std::move(material), std::move(color));
    }

    if (raw.empty()) {
        throw DocumentReadError(ErrorCode::NoDepthValues,
            "No depth values found in sheet '" + sheet.name + "'");
    }

    const bool has_colors = std::any_of(raw.colors.begin(), raw.colors.end(),
        [](const std::optional<std::string>& c) { return c.has_value() && !c->empty(); });
    if (raw.materialCount() == 0 && !has_colors) {
        throw DocumentReadError(ErrorCode::NoMaterials,
            "No material descriptions found in sheet '" + sheet.name + "'");
    }

    spdlog::debug("Sheet '{}': depth column {} ('{}'), material column {}, {} signal points",
                  sheet.name, depth_column->index, depth_column->header,
                  material_column.has_value() ? std::to_string(material_column->index) : std::string("-"),
                  raw.size());
    return raw;
}

} // namespace strata::io
