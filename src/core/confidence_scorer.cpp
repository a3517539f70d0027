/**
 * @file confidence_scorer.cpp
 * @brief Реализация оценки уверенности
 * @author Yan Bubenok <yan@bubenok.com>
 */

#include "confidence_scorer.hpp"
#include "io/text_utils.hpp"
#include <algorithm>
#include <cmath>

namespace strata::core {

namespace {

constexpr double kBaseScore = 0.5;
constexpr double kCompletenessBonus = 0.2;
constexpr double kHighShareBonus = 0.2;
constexpr double kValidationBonus = 0.2;
constexpr double kValidationPenaltyPerError = 0.05;
constexpr double kMaxValidationPenalty = 0.3;
constexpr double kColumnBonus = 0.02;
constexpr double kMaxColumnBonus = 0.1;
constexpr double kTextVolumeScale = 1000.0;
constexpr double kTextBonus = 0.1;
constexpr double kErrorPenalty = 0.03;
constexpr double kMaxErrorPenalty = 0.2;
constexpr double kAcceptableShare = 0.5;

bool isComplete(const ExtractedLayer& layer) {
    return !io::trim(layer.material).empty() && layer.start_depth < layer.end_depth;
}

} // anonymous namespace

ConfidenceScorer::ConfidenceScorer(ExtractionOptions options)
    : options_(options) {}

ConfidenceLevel ConfidenceScorer::levelFor(double score) const noexcept {
    if (score >= options_.high_confidence_threshold) return ConfidenceLevel::High;
    if (score >= options_.min_confidence_threshold) return ConfidenceLevel::Medium;
    return ConfidenceLevel::Low;
}

ConfidenceScore ConfidenceScorer::score(const LayerList& layers, const ScoringInput& input) const {
    double value = kBaseScore;

    if (!layers.empty()) {
        if (std::all_of(layers.begin(), layers.end(), isComplete)) {
            value += kCompletenessBonus;
        }
        const auto high = std::count_if(layers.begin(), layers.end(), [](const ExtractedLayer& l) {
            return l.confidence == ConfidenceLevel::High;
        });
        value += kHighShareBonus * static_cast<double>(high) / static_cast<double>(layers.size());
    }

    if (input.validation_passed) {
        value += kValidationBonus;
    } else {
        value -= std::min(static_cast<double>(input.validation_error_count) * kValidationPenaltyPerError,
                          kMaxValidationPenalty);
    }

    if (input.structure.mapped_columns > 0) {
        value += std::min(static_cast<double>(input.structure.mapped_columns) * kColumnBonus, kMaxColumnBonus);
    }
    if (input.structure.text_length > 0) {
        value += std::min(static_cast<double>(input.structure.text_length) / kTextVolumeScale, 1.0) * kTextBonus;
    }

    value -= std::min(static_cast<double>(input.error_count) * kErrorPenalty, kMaxErrorPenalty);
    value = std::clamp(value, 0.0, 1.0);

    return {value, levelFor(value)};
}

ConfidenceCheck ConfidenceScorer::checkExtractionConfidence(const LayerList& layers) const {
    ConfidenceCheck check;
    for (const auto& layer : layers) {
        switch (layer.confidence) {
            case ConfidenceLevel::High: ++check.high; break;
            case ConfidenceLevel::Medium: ++check.medium; break;
            case ConfidenceLevel::Low: ++check.low; break;
        }
    }

    if (!layers.empty()) {
        check.ratio = static_cast<double>(check.high + check.medium) / static_cast<double>(layers.size());
    }
    check.acceptable = !layers.empty() && check.ratio >= kAcceptableShare;
    if (!check.acceptable) {
        check.warning = "Low extraction confidence: " +
                        std::to_string(static_cast<int>(std::lround(check.ratio * 100.0))) + "%";
    }
    return check;
}

} // namespace strata::core
