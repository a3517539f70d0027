/**
 * @file pdf_signal_extractor.cpp
 * @brief Реализация разбора текста PDF
 * @author Yan Bubenok <yan@bubenok.com>
 */

#include "pdf_signal_extractor.hpp"
#include "text_utils.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>

namespace strata::io {

using model::DepthUnit;
using model::ErrorCode;
using model::RawExtraction;

namespace {

constexpr double kMaxLabelDepth = 10000.0;
constexpr double kDuplicateTolerance = 0.01;
constexpr std::string_view kEnDash = "\xE2\x80\x93";

bool isDigit(char c) noexcept {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

bool isSpace(char c) noexcept {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

// Конец числа вида 12 или 12.5, начиная с pos (pos, если числа нет)
size_t scanNumber(std::string_view s, size_t pos) noexcept {
    size_t end = pos;
    while (end < s.size() && isDigit(s[end])) ++end;
    if (end == pos) return pos;
    if (end + 1 < s.size() && s[end] == '.' && isDigit(s[end + 1])) {
        ++end;
        while (end < s.size() && isDigit(s[end])) ++end;
    }
    return end;
}

size_t skipSpaces(std::string_view s, size_t pos) noexcept {
    while (pos < s.size() && isSpace(s[pos])) ++pos;
    return pos;
}

std::optional<double> numberAt(std::string_view s, size_t begin, size_t end) {
    const double value = parseDouble(s.substr(begin, end - begin));
    if (std::isnan(value)) return std::nullopt;
    return value;
}

// Длина разделителя диапазона ("-" или "–") в позиции pos
size_t dashLength(std::string_view s, size_t pos) noexcept {
    if (pos < s.size() && s[pos] == '-') return 1;
    if (s.substr(pos, kEnDash.size()) == kEnDash) return kEnDash.size();
    return 0;
}

// Удаление ведущего диапазона "10-20" или числа с единицей "10 ft"
std::string stripLeadingDepth(std::string_view text) {
    std::string_view s = text;
    size_t end = scanNumber(s, 0);
    if (end == 0) {
        return std::string(s);
    }

    size_t pos = skipSpaces(s, end);
    if (const size_t dash = dashLength(s, pos); dash > 0) {
        const size_t second_begin = skipSpaces(s, pos + dash);
        const size_t second_end = scanNumber(s, second_begin);
        if (second_end > second_begin) {
            return trim(s.substr(second_end));
        }
    }

    // Единица после числа, только как отдельное слово
    const std::string rest_lower = toLower(s.substr(pos));
    for (std::string_view unit : {"feet", "ft", "meters", "meter", "m", "'"}) {
        if (rest_lower.compare(0, unit.size(), unit) == 0) {
            const size_t after = unit.size();
            if (unit == "'" || after >= rest_lower.size() || isSpace(rest_lower[after])) {
                return trim(s.substr(pos + after));
            }
        }
    }
    if (end < s.size() && s[end] == '\'') {
        return trim(s.substr(end + 1));
    }
    return trim(s.substr(end));
}

bool sameLine(const TextItem& a, double y, double threshold) noexcept {
    return std::abs(a.y - y) < threshold;
}

} // anonymous namespace

std::vector<TextLine> groupIntoLines(std::vector<TextItem> items, double threshold) {
    std::stable_sort(items.begin(), items.end(), [](const TextItem& a, const TextItem& b) {
        if (a.page != b.page) return a.page < b.page;
        if (a.y != b.y) return a.y < b.y;
        return a.x < b.x;
    });

    std::vector<TextLine> lines;
    TextLine current;
    bool has_current = false;

    auto flush = [&lines](TextLine& line) {
        if (line.items.empty()) return;
        std::stable_sort(line.items.begin(), line.items.end(),
            [](const TextItem& a, const TextItem& b) { return a.x < b.x; });
        line.text.clear();
        for (const auto& item : line.items) {
            if (!line.text.empty()) line.text += ' ';
            line.text += item.text;
        }
        lines.push_back(std::move(line));
        line = TextLine{};
    };

    for (auto& item : items) {
        if (trim(item.text).empty()) continue;
        if (has_current && item.page == current.page && sameLine(item, current.y, threshold)) {
            current.y = item.y;
            current.items.push_back(std::move(item));
            continue;
        }
        flush(current);
        current.page = item.page;
        current.y = item.y;
        current.items.push_back(std::move(item));
        has_current = true;
    }
    flush(current);
    return lines;
}

std::optional<double> matchDepthLabel(std::string_view text) {
    const std::string trimmed = trim(text);
    const std::string_view s = trimmed;

    auto accept = [](std::optional<double> v) -> std::optional<double> {
        if (v.has_value() && *v >= 0.0 && *v < kMaxLabelDepth) return v;
        return std::nullopt;
    };

    const size_t end = scanNumber(s, 0);
    if (end > 0) {
        const auto value = numberAt(s, 0, end);
        const std::string_view rest = s.substr(end);

        // "10'"
        if (rest == "'") return accept(value);

        // "12", "12 ft", "40 meters"
        const std::string unit = toLower(trim(rest));
        if (unit.empty() || unit == "ft" || unit == "feet" || unit == "m" ||
            unit == "meter" || unit == "meters") {
            return accept(value);
        }

        // "10-20", "10 - 20 Clay"
        const size_t dash_pos = skipSpaces(s, end);
        if (dashLength(s, dash_pos) == 1) {
            const size_t second_begin = skipSpaces(s, dash_pos + 1);
            if (scanNumber(s, second_begin) > second_begin) {
                return accept(value);
            }
        }
    }

    // "Depth: 12"
    const std::string lowered = toLower(s);
    size_t pos = lowered.find("depth");
    while (pos != std::string::npos) {
        size_t num_begin = pos + 5;
        while (num_begin < lowered.size() && (lowered[num_begin] == ':' || isSpace(lowered[num_begin]))) {
            ++num_begin;
        }
        const size_t num_end = scanNumber(lowered, num_begin);
        if (num_end > num_begin) {
            return accept(numberAt(lowered, num_begin, num_end));
        }
        pos = lowered.find("depth", pos + 1);
    }
    return std::nullopt;
}

PdfSignalExtractor::PdfSignalExtractor(model::MaterialVocabulary materials, model::UnitVocabulary units)
    : materials_(std::move(materials))
    , units_(std::move(units)) {}

std::vector<DepthLabel> PdfSignalExtractor::detectDepthLabels(const std::vector<TextLine>& lines) const {
    std::vector<DepthLabel> depths;

    for (size_t line_index = 0; line_index < lines.size(); ++line_index) {
        const auto& line = lines[line_index];
        bool line_has_depth = false;

        for (const auto& item : line.items) {
            if (auto value = matchDepthLabel(item.text)) {
                depths.push_back(DepthLabel{*value, trim(item.text), item.x, item.y, line.page, line_index});
                line_has_depth = true;
            }
        }

        // Подпись, разбитая на несколько фрагментов ("Depth:" "12")
        if (!line_has_depth) {
            if (auto value = matchDepthLabel(line.text)) {
                const double x = line.items.empty() ? 0.0 : line.items.front().x;
                depths.push_back(DepthLabel{*value, line.text, x, line.y, line.page, line_index});
            }
        }
    }

    std::stable_sort(depths.begin(), depths.end(),
        [](const DepthLabel& a, const DepthLabel& b) { return a.value < b.value; });

    std::vector<DepthLabel> unique;
    for (auto& d : depths) {
        const bool duplicate = std::any_of(unique.begin(), unique.end(),
            [&d](const DepthLabel& u) { return std::abs(u.value - d.value) < kDuplicateTolerance; });
        if (!duplicate) {
            unique.push_back(std::move(d));
        }
    }
    return unique;
}

std::vector<MaterialRegion> PdfSignalExtractor::identifyMaterialRegions(const std::vector<TextLine>& lines) const {
    std::vector<MaterialRegion> regions;

    for (size_t line_index = 0; line_index < lines.size(); ++line_index) {
        const auto& line = lines[line_index];
        if (!materials_.containsKeyword(line.text)) continue;

        const std::string text = stripLeadingDepth(trim(line.text));
        if (text.empty()) continue;

        MaterialRegion region;
        region.material = materials_.normalize(text);
        region.original_text = line.text;
        region.x = line.items.empty() ? 0.0 : line.items.front().x;
        region.y = line.y;
        region.page = line.page;
        region.line_index = line_index;
        region.confidence = materials_.confidence(text);
        regions.push_back(std::move(region));
    }
    return regions;
}

std::optional<DepthUnit> PdfSignalExtractor::detectDepthUnit(const std::vector<TextLine>& lines) const {
    size_t feet_count = 0;
    size_t meter_count = 0;
    for (const auto& line : lines) {
        const std::string text = toLower(line.text);
        bool mentions_feet = false;
        bool mentions_meters = false;
        for (const auto& [alias, unit] : units_.aliases) {
            if (alias.empty()) continue;
            const bool found = std::isalpha(static_cast<unsigned char>(alias.front()))
                ? containsWord(text, alias)
                : text.find(alias) != std::string::npos;
            if (!found) continue;
            if (unit == DepthUnit::Meters) {
                mentions_meters = true;
            } else {
                mentions_feet = true;
            }
        }
        if (mentions_feet) ++feet_count;
        if (mentions_meters) ++meter_count;
    }
    if (feet_count == 0 && meter_count == 0) {
        return std::nullopt;
    }
    return meter_count > feet_count ? DepthUnit::Meters : DepthUnit::Feet;
}

void PdfSignalExtractor::correlate(
    const std::vector<DepthLabel>& depths,
    const std::vector<MaterialRegion>& materials,
    double max_distance,
    RawExtraction& raw
) const {
    for (const auto& depth : depths) {
        const MaterialRegion* closest = nullptr;
        double min_distance = std::numeric_limits<double>::infinity();
        for (const auto& material : materials) {
            if (material.page != depth.page) continue;
            const double distance = std::abs(material.y - depth.y);
            if (distance < min_distance) {
                min_distance = distance;
                closest = &material;
            }
        }

        std::optional<std::string> name;
        if (closest != nullptr && min_distance < max_distance) {
            name = closest->material;
        }
        raw.addPoint(depth.value, std::move(name));
    }
}

RawExtraction PdfSignalExtractor::extract(const PdfText& text, const PdfExtractionOptions& options) const {
    if (text.items.empty() || text.textLength() == 0) {
        throw DocumentReadError(ErrorCode::NoTextContent, "No text content found in PDF (may be image-based)");
    }

    const auto lines = groupIntoLines(text.items, options.line_threshold);

    RawExtraction raw;
    raw.structure.text_length = text.textLength();
    raw.structure.page_count = text.page_count;
    raw.structure.format_hints.push_back("pdf-text");
    raw.depth_unit = detectDepthUnit(lines);
    if (raw.depth_unit.has_value()) {
        raw.structure.format_hints.push_back("unit:" + std::string(model::unitName(*raw.depth_unit)));
    }

    if (options.per_page) {
        size_t readable_pages = 0;
        bool any_depths = false;
        for (size_t page = 0; page < std::max<size_t>(text.page_count, 1); ++page) {
            std::vector<TextLine> page_lines;
            for (const auto& line : lines) {
                if (line.page == page) page_lines.push_back(line);
            }
            if (page_lines.empty()) continue;

            PageSignals signals{detectDepthLabels(page_lines), identifyMaterialRegions(page_lines)};
            any_depths = any_depths || !signals.depths.empty();
            if (signals.depths.empty() || signals.materials.empty()) {
                spdlog::debug("PDF page {}: {} depths, {} materials, skipped",
                              page + 1, signals.depths.size(), signals.materials.size());
                raw.warnings.push_back("Page " + std::to_string(page + 1) + " has no readable strata data");
                continue;
            }
            ++readable_pages;
            correlate(signals.depths, signals.materials, options.correlation_distance, raw);
        }

        if (readable_pages == 0) {
            if (!any_depths) {
                throw DocumentReadError(ErrorCode::NoDepthValues, "Could not identify depth values in the PDF");
            }
            throw DocumentReadError(ErrorCode::NoMaterials, "Could not identify material descriptions in the PDF");
        }
        raw.structure.format_hints.push_back("page-by-page");
        spdlog::debug("PDF: {} of {} pages readable, {} signal points", readable_pages, text.page_count, raw.size());
        return raw;
    }

    const auto depths = detectDepthLabels(lines);
    const auto materials = identifyMaterialRegions(lines);
    if (depths.empty()) {
        throw DocumentReadError(ErrorCode::NoDepthValues, "Could not identify depth values in the PDF");
    }
    if (materials.empty()) {
        throw DocumentReadError(ErrorCode::NoMaterials, "Could not identify material descriptions in the PDF");
    }

    correlate(depths, materials, options.correlation_distance, raw);
    spdlog::debug("PDF: {} lines, {} depth labels, {} material lines", lines.size(), depths.size(), materials.size());
    return raw;
}

} // namespace strata::io
