/**
 * @file validation_service.cpp
 * @brief Реализация проверок глубин и слоёв
 * @author Yan Bubenok <yan@bubenok.com>
 */

#include "validation_service.hpp"
#include "io/text_utils.hpp"
#include <algorithm>
#include <cmath>
#include <map>
#include <numeric>
#include <set>

namespace strata::core {

using io::formatNumber;

namespace {

constexpr double kDirectionRatio = 0.2;
constexpr double kLargeGapFactor = 3.0;
constexpr double kConsistencyShare = 0.8;
constexpr double kModeTolerance = 0.1;

std::string quoted(const std::string& text) {
    return "\"" + text + "\"";
}

LayerList sortedByStart(const LayerList& layers) {
    LayerList sorted = layers;
    std::stable_sort(sorted.begin(), sorted.end(), [](const ExtractedLayer& a, const ExtractedLayer& b) {
        return a.start_depth < b.start_depth;
    });
    return sorted;
}

} // anonymous namespace

ValidationService::ValidationService(DepthLimits limits)
    : limits_(limits) {}

ValidationResult ValidationService::validateDepthSequence(const std::vector<double>& depths) const {
    ValidationResult result;

    if (depths.empty()) {
        result.addError(ValidationErrorType::MissingDepths, "depths", "No depth values found in the file");
        return result;
    }

    std::vector<double> valid;
    valid.reserve(depths.size());
    for (double d : depths) {
        if (std::isfinite(d)) valid.push_back(d);
    }

    const size_t non_numeric = depths.size() - valid.size();
    if (non_numeric > 0) {
        result.addError(ValidationErrorType::NonNumericDepth, "depths",
            "Found " + std::to_string(non_numeric) + " non-numeric depth values");
    }
    if (valid.empty()) {
        result.addError(ValidationErrorType::MissingDepths, "depths", "No valid numeric depth values found");
        return result;
    }

    const auto negative = static_cast<size_t>(std::count_if(valid.begin(), valid.end(),
        [](double d) { return d < 0.0; }));
    if (negative > 0) {
        result.addWarning(ErrorCode::NegativeDepth,
            "Found " + std::to_string(negative) + " negative depth values");
    }

    // Направление: большинство шагов задаёт направление, при меньшинстве > 20% замечание
    size_t increasing = 0;
    size_t decreasing = 0;
    for (size_t i = 1; i < valid.size(); ++i) {
        if (valid[i] > valid[i - 1]) ++increasing;
        else if (valid[i] < valid[i - 1]) ++decreasing;
    }
    if (increasing > 0 && decreasing > 0) {
        const double ratio = static_cast<double>(std::min(increasing, decreasing)) /
                             static_cast<double>(std::max(increasing, decreasing));
        if (ratio > kDirectionRatio) {
            result.addWarning(ErrorCode::InconsistentDepthDirection,
                "Depth sequence has inconsistent direction changes");
        }
    }

    const std::set<double> unique(valid.begin(), valid.end());
    if (unique.size() < valid.size()) {
        result.addWarning(ErrorCode::DuplicateDepth,
            "Found " + std::to_string(valid.size() - unique.size()) + " duplicate depth values");
    }

    std::vector<double> sorted = valid;
    std::sort(sorted.begin(), sorted.end());
    if (sorted.size() > 1) {
        std::vector<double> intervals;
        for (size_t i = 1; i < sorted.size(); ++i) {
            intervals.push_back(sorted[i] - sorted[i - 1]);
        }
        const double mean = std::accumulate(intervals.begin(), intervals.end(), 0.0) /
                            static_cast<double>(intervals.size());
        const auto large = static_cast<size_t>(std::count_if(intervals.begin(), intervals.end(),
            [mean](double v) { return v > mean * kLargeGapFactor; }));
        if (large > 0) {
            result.addWarning(ErrorCode::DepthGap,
                "Found " + std::to_string(large) + " unusually large gaps in depth sequence");
        }
    }

    DepthStatistics stats;
    stats.count = valid.size();
    stats.min = sorted.front();
    stats.max = sorted.back();
    stats.is_increasing = increasing >= decreasing;
    stats.unique_count = unique.size();
    result.stats = stats;

    return result;
}

IntervalConsistency ValidationService::checkDepthIntervalConsistency(const std::vector<double>& depths) const {
    IntervalConsistency result;
    if (depths.size() < 2) {
        return result;
    }

    std::vector<double> intervals;
    for (size_t i = 1; i < depths.size(); ++i) {
        intervals.push_back(std::abs(depths[i] - depths[i - 1]));
    }

    // Мода шагов, округлённых до 0.1; при равенстве первый встреченный
    std::map<long long, size_t> counts;
    std::vector<long long> first_seen;
    for (double interval : intervals) {
        const auto key = static_cast<long long>(std::llround(interval * 10.0));
        if (counts[key]++ == 0) {
            first_seen.push_back(key);
        }
    }
    long long mode_key = first_seen.front();
    for (long long key : first_seen) {
        if (counts[key] > counts[mode_key]) mode_key = key;
    }
    const double mode = static_cast<double>(mode_key) / 10.0;

    const double tolerance = mode * kModeTolerance;
    const auto matching = static_cast<size_t>(std::count_if(intervals.begin(), intervals.end(),
        [mode, tolerance](double v) { return std::abs(v - mode) <= tolerance; }));

    result.mode_interval = mode;
    result.consistency_ratio = static_cast<double>(matching) / static_cast<double>(intervals.size());
    result.consistent = result.consistency_ratio > kConsistencyShare;
    return result;
}

MissingDepthReport ValidationService::detectMissingDepths(
    const std::vector<double>& depths,
    double expected_interval
) const {
    MissingDepthReport report;

    for (size_t i = 0; i < depths.size(); ++i) {
        if (!std::isfinite(depths[i])) {
            report.invalid_indices.push_back(i);
        }
    }

    if (depths.size() < 2 || !(expected_interval > 0.0)) {
        return report;
    }

    std::vector<double> sorted;
    for (double d : depths) {
        if (std::isfinite(d)) sorted.push_back(d);
    }
    std::sort(sorted.begin(), sorted.end());

    for (size_t i = 1; i < sorted.size(); ++i) {
        const double gap = sorted[i] - sorted[i - 1];
        const auto steps = std::llround(gap / expected_interval);
        for (long long j = 1; j < steps; ++j) {
            report.missing.push_back(sorted[i - 1] + static_cast<double>(j) * expected_interval);
        }
    }
    return report;
}

ValidationResult ValidationService::validateLayerBoundaries(const LayerList& layers) const {
    ValidationResult result;
    if (layers.empty()) {
        return result;
    }

    const LayerList sorted = sortedByStart(layers);
    for (size_t i = 0; i < sorted.size(); ++i) {
        const auto& layer = sorted[i];

        if (layer.start_depth > layer.end_depth) {
            result.addError(ValidationErrorType::InvertedLayer, "start_depth",
                "Layer " + quoted(layer.material) + ": start depth (" + formatNumber(layer.start_depth.value) +
                ") > end depth (" + formatNumber(layer.end_depth.value) + ")");
        }

        if (i + 1 < sorted.size()) {
            const auto& next = sorted[i + 1];
            if (layer.end_depth > next.start_depth) {
                result.addWarning(ErrorCode::LayerOverlap,
                    "Layers " + quoted(layer.material) + " and " + quoted(next.material) + " overlap");
            }
            const double gap = next.start_depth.value - layer.end_depth.value;
            if (gap > limits_.gap_threshold) {
                result.addWarning(ErrorCode::LayerGap,
                    "Gap of " + formatNumber(gap) + " between layers " + quoted(layer.material) +
                    " and " + quoted(next.material));
            }
        }
    }
    return result;
}

ValidationResult ValidationService::validateForSave(const LayerList& layers) const {
    ValidationResult result;

    for (size_t i = 0; i < layers.size(); ++i) {
        const auto& layer = layers[i];
        if (io::trim(layer.material).empty()) {
            result.addError(ValidationErrorType::MissingMaterial, "material", "Material is required", i);
        }
        if (!(layer.start_depth < layer.end_depth)) {
            result.addError(ValidationErrorType::InvertedLayer, "end_depth",
                "Start depth must be less than end depth", i);
        }
    }

    const auto boundaries = validateLayerBoundaries(layers);
    for (const auto& warning : boundaries.warnings) {
        if (warning.code == ErrorCode::LayerOverlap) {
            result.addError(ValidationErrorType::LayerOverlap, "start_depth", warning.message);
        } else {
            result.addWarning(warning.code, warning.message);
        }
    }
    return result;
}

} // namespace strata::core
