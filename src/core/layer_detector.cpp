/**
 * @file layer_detector.cpp
 * @brief Реализация разбиения на слои
 * @author Yan Bubenok <yan@bubenok.com>
 */

#include "layer_detector.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace strata::core {

namespace {

const std::string kUnknownMaterial = "Unknown";

/**
 * @brief Серия точек с одинаковым ключом
 */
struct Run {
    std::string key;
    double start = 0.0;
    std::string material;
    std::optional<std::string> color;
    SignalKind kind = SignalKind::Neither;
};

std::vector<SignalPoint> sortedPoints(const RawExtraction& raw) {
    auto points = raw.points();
    std::stable_sort(points.begin(), points.end(), [](const SignalPoint& a, const SignalPoint& b) {
        return a.depth < b.depth;
    });
    return points;
}

/**
 * @brief Последовательное разбиение по ключу
 *
 * key_of возвращает nullopt для точек, которые не начинают серию.
 */
template <typename KeyFn>
std::vector<Run> segment(const std::vector<SignalPoint>& points, KeyFn key_of) {
    std::vector<Run> runs;
    for (const auto& point : points) {
        const std::optional<std::string> key = key_of(point);
        if (!key.has_value()) {
            continue;
        }
        if (!runs.empty() && runs.back().key == *key) {
            auto& run = runs.back();
            if (!run.color.has_value() && point.color.has_value()) {
                run.color = point.color;
            }
            if (run.material.empty() && point.material.has_value()) {
                run.material = *point.material;
            }
            continue;
        }

        Run run;
        run.key = *key;
        run.start = point.depth;
        run.material = point.material.value_or("");
        run.color = point.color;
        run.kind = point.kind;
        runs.push_back(std::move(run));
    }
    return runs;
}

/**
 * @brief Слои из серий
 *
 * Подошва — кровля следующей серии; подошва последней определяется
 * по max_depth. Серии нулевой мощности (одинаковая кровля) отбрасываются.
 */
LayerList buildLayers(const std::vector<Run>& runs, double max_depth, LayerSource source) {
    LayerList layers;
    if (runs.empty()) {
        return layers;
    }

    for (size_t i = 0; i < runs.size(); ++i) {
        const auto& run = runs[i];
        double end = 0.0;
        if (i + 1 < runs.size()) {
            end = runs[i + 1].start;
        } else if (max_depth > run.start) {
            end = max_depth;
        } else if (i > 0) {
            end = run.start + (run.start - runs[i - 1].start);
        } else {
            end = run.start + kDefaultLastLayerThickness;
        }

        if (!(end > run.start)) {
            spdlog::debug("Run '{}' at {} ft has zero thickness, skipped", run.key, run.start);
            continue;
        }

        ExtractedLayer layer;
        layer.material = run.material.empty() ? kUnknownMaterial : run.material;
        layer.start_depth = Feet{run.start};
        layer.end_depth = Feet{end};
        layer.confidence = LayerDetector::confidenceFor(run.kind);
        layer.source = source;
        layer.original_color = run.color;
        layers.push_back(std::move(layer));
    }
    return layers;
}

} // anonymous namespace

LayerList LayerDetector::detect(const RawExtraction& raw, LayerSource source) const {
    const auto points = sortedPoints(raw);
    if (points.empty()) {
        return {};
    }

    const auto runs = segment(points, [](const SignalPoint& p) -> std::optional<std::string> {
        if (hasText(p.kind)) return *p.material;
        if (hasColor(p.kind)) return "color:" + *p.color;
        return std::nullopt;
    });

    auto layers = buildLayers(runs, points.back().depth, source);
    spdlog::debug("Layer detection: {} signal points, {} runs, {} layers", points.size(), runs.size(), layers.size());
    return layers;
}

LayerList LayerDetector::detectFromThickness(const RawExtraction& raw) const {
    const auto points = sortedPoints(raw);
    LayerList layers;
    if (points.empty()) {
        return layers;
    }

    std::vector<double> depths;
    for (const auto& p : points) {
        if (depths.empty() || p.depth > depths.back()) {
            depths.push_back(p.depth);
        }
    }
    if (depths.size() == 1) {
        depths.push_back(depths.front() + kDefaultLastLayerThickness);
    }

    for (size_t i = 0; i + 1 < depths.size(); ++i) {
        ExtractedLayer layer;
        layer.material = kUnknownMaterial;
        layer.start_depth = Feet{depths[i]};
        layer.end_depth = Feet{depths[i + 1]};
        layer.confidence = ConfidenceLevel::Low;
        layer.source = LayerSource::Fallback;
        layers.push_back(std::move(layer));
    }
    return layers;
}

ExtractedLayer updateConfidenceForEdit(ExtractedLayer layer) noexcept {
    layer.confidence = ConfidenceLevel::High;
    layer.user_edited = true;
    return layer;
}

} // namespace strata::core
