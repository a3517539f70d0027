/**
 * @file depth_normalizer.cpp
 * @brief Реализация нормализации глубин
 * @author Yan Bubenok <yan@bubenok.com>
 */

#include "depth_normalizer.hpp"
#include "io/text_utils.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>

namespace strata::core {

using io::formatNumber;

namespace {

// Число из текста: остаются только цифры, '.' и '-'
std::optional<double> parseNumericDepth(const DepthInput& raw, ErrorList& errors, std::string& original) {
    if (std::holds_alternative<std::monostate>(raw)) {
        errors.push_back({ErrorCode::InvalidDepthValue, "Depth value is null or undefined"});
        return std::nullopt;
    }

    if (const auto* number = std::get_if<double>(&raw)) {
        original = formatNumber(*number, 6);
        if (!std::isfinite(*number)) {
            errors.push_back({ErrorCode::InvalidDepthValue, "Depth value is NaN or infinite"});
            return std::nullopt;
        }
        return *number;
    }

    const auto& text = std::get<std::string>(raw);
    original = text;
    const std::string cleaned = io::trim(text);
    if (cleaned.empty()) {
        errors.push_back({ErrorCode::InvalidDepthValue, "Depth value is empty string"});
        return std::nullopt;
    }

    std::string sanitized;
    for (char c : cleaned) {
        if ((c >= '0' && c <= '9') || c == '.' || c == '-') {
            sanitized += c;
        }
    }
    if (sanitized.empty()) {
        errors.push_back({ErrorCode::NonNumericDepth, "No numeric content found in depth value"});
        return std::nullopt;
    }

    // Ведущее число, как parseFloat: "12.5-3" -> 12.5
    size_t end = 0;
    if (sanitized[end] == '-') ++end;
    bool seen_dot = false;
    while (end < sanitized.size()) {
        const char c = sanitized[end];
        if (c == '.' && !seen_dot) {
            seen_dot = true;
        } else if (c < '0' || c > '9') {
            break;
        }
        ++end;
    }
    const double value = io::parseDouble(sanitized.substr(0, end));
    if (std::isnan(value) || !std::isfinite(value)) {
        errors.push_back({ErrorCode::NonNumericDepth, "Cannot parse depth value: '" + text + "'"});
        return std::nullopt;
    }
    return value;
}

} // anonymous namespace

DepthNormalizer::DepthNormalizer(DepthLimits limits, UnitVocabulary units)
    : limits_(limits)
    , units_(std::move(units)) {}

std::optional<DepthUnit> DepthNormalizer::resolveUnit(std::string_view unit, bool* partial) const {
    if (partial != nullptr) *partial = false;

    const std::string cleaned = io::toLower(io::trim(unit));
    if (cleaned.empty()) {
        return std::nullopt;
    }

    for (const auto& [alias, resolved] : units_.aliases) {
        if (cleaned == alias) {
            return resolved;
        }
    }
    for (const auto& [alias, resolved] : units_.aliases) {
        if (cleaned.find(alias) != std::string::npos || alias.find(cleaned) != std::string::npos) {
            if (partial != nullptr) *partial = true;
            return resolved;
        }
    }
    return std::nullopt;
}

NormalizedDepth DepthNormalizer::normalize(const DepthInput& raw, std::string_view unit) const {
    NormalizedDepth result;
    result.original_unit = std::string(unit);

    // 1. Число
    const auto numeric = parseNumericDepth(raw, result.errors, result.original_value);
    if (!numeric.has_value()) {
        return result;
    }

    // 2. Единица
    const std::string unit_text = io::trim(unit);
    bool partial = false;
    const auto resolved = resolveUnit(unit_text, &partial);
    if (unit_text.empty()) {
        result.warnings.push_back({ErrorCode::UnitAssumed,
            "No unit specified, assuming " + std::string(unitName(units_.default_unit))});
        result.detected_unit = units_.default_unit;
    } else if (!resolved.has_value()) {
        result.warnings.push_back({ErrorCode::UnitAssumed,
            "Unknown unit '" + unit_text + "', assuming " + std::string(unitName(units_.default_unit))});
        result.detected_unit = units_.default_unit;
    } else {
        result.detected_unit = *resolved;
        if (partial) {
            result.warnings.push_back({ErrorCode::UnitAssumed,
                "Partial unit match: '" + unit_text + "' interpreted as " + std::string(unitName(*resolved))});
        }
    }

    // 3. Перевод в футы
    const double in_feet = toFeet(*numeric, result.detected_unit).value;
    result.conversion_applied = result.detected_unit != DepthUnit::Feet;

    // 4. Округление
    const double rounded = roundTo(in_feet, limits_.decimal_places);
    result.depth = Feet{rounded};

    // 5. Диапазон
    if (rounded < limits_.min_depth) {
        result.errors.push_back({ErrorCode::InvalidDepthValue,
            "Depth " + formatNumber(rounded) + " ft is below minimum (" + formatNumber(limits_.min_depth) + " ft)"});
    }
    if (rounded > limits_.max_depth) {
        result.errors.push_back({ErrorCode::InvalidDepthValue,
            "Depth " + formatNumber(rounded) + " ft exceeds maximum (" + formatNumber(limits_.max_depth) + " ft)"});
    } else if (rounded > limits_.warning_depth) {
        result.warnings.push_back({ErrorCode::DepthAboveWarningThreshold,
            "Depth " + formatNumber(rounded) + " ft exceeds warning threshold (" +
            formatNumber(limits_.warning_depth) + " ft)"});
    }

    // 6. Потеря точности (сравнение в футах, до и после округления)
    const double difference = std::abs(in_feet - rounded);
    if (difference > limits_.precision_tolerance) {
        result.warnings.push_back({ErrorCode::PrecisionLoss,
            "Precision loss: " + formatNumber(in_feet, 6) + " rounded to " + formatNumber(rounded) +
            " (difference: " + formatNumber(difference) + ")"});
    }

    result.success = result.errors.empty();
    return result;
}

BatchNormalization DepthNormalizer::normalizeBatch(const std::vector<DepthBatchItem>& items) const {
    BatchNormalization batch;
    batch.statistics.total = items.size();

    for (size_t i = 0; i < items.size(); ++i) {
        NormalizedDepth item = normalize(items[i].value, items[i].unit);
        item.index = i;

        if (item.success) {
            ++batch.statistics.successful;
        } else {
            ++batch.statistics.failed;
            batch.success = false;
        }
        if (!item.warnings.empty()) {
            ++batch.statistics.with_warnings;
        }

        const std::string prefix = "Item " + std::to_string(i) + ": ";
        for (const auto& e : item.errors) batch.errors.push_back(prefix + e.message);
        for (const auto& w : item.warnings) batch.warnings.push_back(prefix + w.message);

        batch.items.push_back(std::move(item));
    }
    return batch;
}

SequenceCheck DepthNormalizer::validateSequence(const std::vector<DepthInterval>& intervals) const {
    SequenceCheck check;
    if (intervals.size() < 2) {
        return check;
    }

    std::vector<size_t> order(intervals.size());
    std::iota(order.begin(), order.end(), size_t{0});
    std::stable_sort(order.begin(), order.end(), [&intervals](size_t a, size_t b) {
        return intervals[a].start < intervals[b].start;
    });

    for (size_t k = 0; k + 1 < order.size(); ++k) {
        const auto& current = intervals[order[k]];
        const auto& next = intervals[order[k + 1]];
        const double gap = next.start.value - current.end.value;

        if (gap < -limits_.precision_tolerance) {
            check.overlaps.push_back({order[k], order[k + 1], Feet{-gap}});
            check.errors.push_back("Depth overlap detected: " + formatNumber(current.end.value) + " ft and " +
                                   formatNumber(next.start.value) + " ft");
            check.success = false;
        } else if (gap > limits_.gap_threshold) {
            check.gaps.push_back({order[k], order[k + 1], Feet{gap}});
            check.warnings.push_back("Depth gap detected: " + formatNumber(gap, 2) + " ft between " +
                                     formatNumber(current.end.value) + " ft and " +
                                     formatNumber(next.start.value) + " ft");
        }
    }
    return check;
}

} // namespace strata::core
