/**
 * @file xlsx_reader.cpp
 * @brief Реализация чтения .xlsx
 * @author Yan Bubenok <yan@bubenok.com>
 */

#include "xlsx_reader.hpp"
#include "text_utils.hpp"
#include <pugixml.hpp>
#include <spdlog/spdlog.h>
#include <cmath>
#include <cstring>
#include <unordered_map>

namespace strata::io {

using model::ErrorCode;

namespace {

// Имя элемента без префикса пространства имён ("x:row" -> "row")
std::string_view localName(const pugi::xml_node& node) {
    std::string_view name = node.name();
    auto colon = name.find(':');
    return colon == std::string_view::npos ? name : name.substr(colon + 1);
}

pugi::xml_node child(const pugi::xml_node& node, std::string_view name) {
    for (auto c : node.children()) {
        if (localName(c) == name) return c;
    }
    return {};
}

std::vector<pugi::xml_node> children(const pugi::xml_node& node, std::string_view name) {
    std::vector<pugi::xml_node> result;
    for (auto c : node.children()) {
        if (localName(c) == name) result.push_back(c);
    }
    return result;
}

// Атрибут с учётом префикса ("r:id" ищется как "id" с любым префиксом)
pugi::xml_attribute attribute(const pugi::xml_node& node, std::string_view name) {
    for (auto a : node.attributes()) {
        std::string_view attr_name = a.name();
        if (attr_name == name) return a;
        auto colon = attr_name.find(':');
        if (colon != std::string_view::npos && attr_name.substr(colon + 1) == name &&
            attr_name.substr(0, colon) != "xmlns") {
            return a;
        }
    }
    return {};
}

void loadXml(pugi::xml_document& doc, const std::string& content, const std::string& part) {
    pugi::xml_parse_result result = doc.load_buffer(content.data(), content.size());
    if (!result) {
        throw DocumentReadError(ErrorCode::FileCorrupted,
            "File is corrupt: XML error in " + part + ": " + result.description());
    }
}

// Весь текст элементов <t> внутри узла (учитывает rich text <r><t>)
std::string collectText(const pugi::xml_node& node) {
    std::string text;
    for (auto c : node.children()) {
        if (localName(c) == "t") {
            text += c.text().get();
        } else if (localName(c) == "r") {
            text += collectText(c);
        }
    }
    return text;
}

std::vector<std::string> readSharedStrings(const ZipArchive& archive) {
    std::vector<std::string> strings;
    if (!archive.contains("xl/sharedStrings.xml")) {
        return strings;
    }
    pugi::xml_document doc;
    loadXml(doc, archive.read("xl/sharedStrings.xml"), "sharedStrings");
    for (const auto& si : children(doc.document_element(), "si")) {
        strings.push_back(collectText(si));
    }
    return strings;
}

std::optional<std::string> colorFromNode(const pugi::xml_node& color) {
    if (!color) return std::nullopt;

    if (auto rgb = attribute(color, "rgb")) {
        std::string value = rgb.value();
        // ARGB -> RGB
        if (value.size() == 8) value = value.substr(2);
        if (value.empty()) return std::nullopt;
        return "#" + value;
    }
    if (auto theme = attribute(color, "theme")) {
        return "theme:" + std::string(theme.value());
    }
    if (auto indexed = attribute(color, "indexed")) {
        // 64: системный цвет по умолчанию, не заливка
        if (std::strcmp(indexed.value(), "64") == 0) return std::nullopt;
        return "indexed:" + std::string(indexed.value());
    }
    return std::nullopt;
}

// Цвет заливки для каждого индекса стиля ячейки (cellXfs)
std::vector<std::optional<std::string>> readStyleFills(const ZipArchive& archive) {
    std::vector<std::optional<std::string>> style_colors;
    if (!archive.contains("xl/styles.xml")) {
        return style_colors;
    }
    pugi::xml_document doc;
    loadXml(doc, archive.read("xl/styles.xml"), "styles");
    auto root = doc.document_element();

    std::vector<std::optional<std::string>> fills;
    for (const auto& fill : children(child(root, "fills"), "fill")) {
        auto pattern = child(fill, "patternFill");
        std::string type = attribute(pattern, "patternType").value();
        if (!pattern || type.empty() || type == "none" || type == "gray125") {
            fills.push_back(std::nullopt);
            continue;
        }
        fills.push_back(colorFromNode(child(pattern, "fgColor")));
    }

    for (const auto& xf : children(child(root, "cellXfs"), "xf")) {
        const auto fill_id = static_cast<size_t>(attribute(xf, "fillId").as_uint(0));
        style_colors.push_back(fill_id < fills.size() ? fills[fill_id] : std::nullopt);
    }
    return style_colors;
}

struct SheetRef {
    std::string name;
    std::string part;
};

std::vector<SheetRef> readSheetRefs(const ZipArchive& archive) {
    pugi::xml_document workbook;
    loadXml(workbook, archive.read("xl/workbook.xml"), "workbook");

    std::unordered_map<std::string, std::string> targets;
    if (archive.contains("xl/_rels/workbook.xml.rels")) {
        pugi::xml_document rels;
        loadXml(rels, archive.read("xl/_rels/workbook.xml.rels"), "workbook relationships");
        for (const auto& rel : children(rels.document_element(), "Relationship")) {
            std::string target = attribute(rel, "Target").value();
            if (!target.empty() && target.front() == '/') {
                target = target.substr(1);
            } else {
                target = "xl/" + target;
            }
            targets[attribute(rel, "Id").value()] = target;
        }
    }

    std::vector<SheetRef> refs;
    auto sheets = children(child(workbook.document_element(), "sheets"), "sheet");
    for (size_t i = 0; i < sheets.size(); ++i) {
        SheetRef ref;
        ref.name = attribute(sheets[i], "name").value();
        auto it = targets.find(attribute(sheets[i], "id").value());
        ref.part = it != targets.end()
            ? it->second
            : "xl/worksheets/sheet" + std::to_string(i + 1) + ".xml";
        refs.push_back(std::move(ref));
    }
    return refs;
}

Sheet readSheet(
    const ZipArchive& archive,
    const SheetRef& ref,
    const std::vector<std::string>& shared_strings,
    const std::vector<std::optional<std::string>>& style_colors
) {
    Sheet sheet;
    sheet.name = ref.name;

    pugi::xml_document doc;
    loadXml(doc, archive.read(ref.part), ref.part);

    size_t skipped = 0;
    for (const auto& row : children(child(doc.document_element(), "sheetData"), "row")) {
        // Номер строки 1-based; пропущенные строки остаются пустыми
        size_t row_index = sheet.rows.size();
        if (auto r = attribute(row, "r")) {
            const auto number = static_cast<size_t>(r.as_uint(0));
            if (number > 0) row_index = number - 1;
        }
        if (row_index >= kMaxSheetRows) {
            ++skipped;
            continue;
        }
        if (row_index >= sheet.rows.size()) {
            sheet.rows.resize(row_index + 1);
        }
        SheetRow& cells = sheet.rows[row_index];

        for (const auto& c : children(row, "c")) {
            size_t col = cells.size();
            if (auto r = attribute(c, "r")) {
                col = columnIndexFromRef(r.value()).value_or(col);
            }
            if (col >= kMaxSheetColumns) {
                ++skipped;
                continue;
            }
            if (col >= cells.size()) {
                cells.resize(col + 1);
            }
            SheetCell& cell = cells[col];

            const std::string type = attribute(c, "t").value();
            const std::string raw = child(c, "v").text().get();

            if (type == "s") {
                const auto idx = static_cast<size_t>(child(c, "v").text().as_uint(0));
                if (idx < shared_strings.size()) {
                    cell.text = shared_strings[idx];
                }
            } else if (type == "inlineStr") {
                cell.text = collectText(child(c, "is"));
            } else if (type == "str" || type == "e") {
                cell.text = raw;
            } else if (type == "b") {
                cell.text = raw == "1" ? "TRUE" : "FALSE";
            } else {
                cell.text = raw;
                const double value = parseDouble(raw);
                if (!std::isnan(value)) {
                    cell.number = value;
                }
            }

            if (auto s = attribute(c, "s")) {
                const auto style = static_cast<size_t>(s.as_uint(0));
                if (style < style_colors.size()) {
                    cell.fill_color = style_colors[style];
                }
            }
        }
    }

    if (skipped > 0) {
        spdlog::warn("XLSX sheet '{}': {} rows/cells beyond {}x{} skipped",
                     sheet.name, skipped, kMaxSheetRows, kMaxSheetColumns);
    }
    return sheet;
}

} // anonymous namespace

std::optional<size_t> columnIndexFromRef(std::string_view ref) noexcept {
    size_t index = 0;
    size_t letters = 0;
    for (char ch : ref) {
        if (ch >= 'A' && ch <= 'Z') {
            index = index * 26 + static_cast<size_t>(ch - 'A' + 1);
        } else if (ch >= 'a' && ch <= 'z') {
            index = index * 26 + static_cast<size_t>(ch - 'a' + 1);
        } else {
            break;
        }
        if (++letters > 3) {
            return std::nullopt;
        }
    }
    if (letters == 0) {
        return std::nullopt;
    }
    return index - 1;
}

Workbook readXlsxWorkbook(const ZipArchive& archive) {
    if (!archive.contains("xl/workbook.xml")) {
        throw DocumentReadError(ErrorCode::InvalidFileFormat, "Invalid file format: workbook part not found");
    }

    const auto shared_strings = readSharedStrings(archive);
    const auto style_colors = readStyleFills(archive);

    Workbook workbook;
    for (const auto& ref : readSheetRefs(archive)) {
        if (!archive.contains(ref.part)) {
            spdlog::warn("XLSX: sheet '{}' part {} is missing, skipped", ref.name, ref.part);
            continue;
        }
        workbook.sheets.push_back(readSheet(archive, ref, shared_strings, style_colors));
    }

    if (workbook.sheets.empty()) {
        throw DocumentReadError(ErrorCode::NoSheets, "Workbook contains no sheets");
    }
    spdlog::debug("XLSX: {} sheets, {} shared strings", workbook.sheets.size(), shared_strings.size());
    return workbook;
}

Workbook readXlsxWorkbook(const std::filesystem::path& path) {
    return readXlsxWorkbook(ZipArchive::fromFile(path));
}

} // namespace strata::io
