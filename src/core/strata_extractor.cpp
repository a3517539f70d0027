/**
 * @file strata_extractor.cpp
 * @brief Реализация координатора извлечения
 * @author Yan Bubenok <yan@bubenok.com>
 */

#include "strata_extractor.hpp"
#include "depth_recovery.hpp"
#include "io/format_registry.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <cmath>
#include <ctime>
#include <map>

namespace strata::core {
namespace {

using Clock = std::chrono::steady_clock;

std::string isoTimestampNow() {
    const auto now = std::chrono::system_clock::now();
    const auto time = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&time, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return std::string(buf);
}

void addOnce(std::vector<std::string>& list, const std::string& message) {
    if (std::find(list.begin(), list.end(), message) == list.end()) {
        list.push_back(message);
    }
}

void addOnce(ErrorList& list, ExtractionError error) {
    if (std::find(list.begin(), list.end(), error) == list.end()) {
        list.push_back(std::move(error));
    }
}

// Модальный шаг между соседними различными глубинами (точность 0.01 ft)
double modalInterval(const std::vector<double>& depths) {
    std::vector<double> sorted;
    for (double d : depths) {
        if (std::isfinite(d)) sorted.push_back(d);
    }
    std::sort(sorted.begin(), sorted.end());
    sorted.erase(std::unique(sorted.begin(), sorted.end()), sorted.end());
    if (sorted.size() < 2) {
        return 0.0;
    }

    std::map<long long, size_t> counts;
    long long mode_key = 0;
    size_t mode_count = 0;
    for (size_t i = 1; i < sorted.size(); ++i) {
        const auto key = std::llround((sorted[i] - sorted[i - 1]) * 100.0);
        const size_t count = ++counts[key];
        if (count > mode_count) {
            mode_count = count;
            mode_key = key;
        }
    }
    return static_cast<double>(mode_key) / 100.0;
}

void fillStructureMetadata(ExtractionMetadata& metadata, const SourceStructure& structure) {
    metadata.mapped_columns = structure.mapped_columns;
    metadata.text_length = structure.text_length;
    metadata.has_headers = structure.has_headers;
    metadata.column_count = structure.column_count;
    metadata.format_hints = structure.format_hints;
}

} // anonymous namespace

StrataExtractor::StrataExtractor(ExtractionConfig config)
    : config_(std::move(config))
    , normalizer_(config_.depth_limits, config_.units)
    , validator_(config_.depth_limits)
    , scorer_(config_.options)
    , fallback_(config_.fallback)
    , strategy_factory_(io::makeStrategies) {}

void StrataExtractor::reset() {
    last_result_.reset();
    fallback_.reset();
}

bool StrataExtractor::isFileSupported(const std::filesystem::path& path) const {
    return io::isFileSupported(path);
}

std::map<FileType, std::vector<std::string>> StrataExtractor::getSupportedFileTypes() const {
    return io::getSupportedFileTypes();
}

ExtractedLayer StrataExtractor::updateConfidenceForEdit(const ExtractedLayer& layer) const {
    return core::updateConfidenceForEdit(layer);
}

void StrataExtractor::setStrategyFactory(StrategyFactory factory) {
    strategy_factory_ = factory ? std::move(factory) : StrategyFactory(io::makeStrategies);
}

bool StrataExtractor::cancelled() const noexcept {
    return cancel_ != nullptr && cancel_->load();
}

ExtractionResult StrataExtractor::extractFromFile(const std::filesystem::path& path) {
    reset();
    const auto started = Clock::now();

    ExtractionResult result = run(path);
    result.metadata.processing_time_ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started).count();

    spdlog::info("{}: {} layers, confidence {:.2f} ({}){}",
                 result.metadata.filename, result.layerCount(), result.confidence.score,
                 toString(result.confidence.level), result.success ? "" : ", review required");

    last_result_ = result;
    return result;
}

ExtractionResult StrataExtractor::run(const std::filesystem::path& path) {
    ExtractionResult result;
    result.metadata.filename = path.filename().string();
    result.metadata.extraction_timestamp = isoTimestampNow();

    // 1. Тип файла
    const auto file_type = io::detectFileType(path);
    if (!file_type.has_value()) {
        result.errors.push_back({ErrorCode::UnsupportedFileType, "Unsupported file type: " + path.string()});
        result.classification = classifier_.classifyErrors(result.errors);
        return result;
    }
    result.metadata.file_type = *file_type;

    // 2. Стратегии разбора по порядку
    const auto strategies = strategy_factory_(*file_type, config_);
    auto& attempts = result.metadata.extraction_attempts;
    std::optional<RawExtraction> raw;
    std::optional<io::ParseFailure> primary_failure;
    bool was_cancelled = false;

    for (const auto& strategy : strategies) {
        AttemptLogEntry entry;
        entry.method = std::string(strategy->name());

        if (was_cancelled || cancelled()) {
            was_cancelled = true;
            entry.status = AttemptStatus::Skipped;
            entry.error = "cancelled";
            attempts.push_back(std::move(entry));
            continue;
        }

        spdlog::debug("{}: attempt {}", result.metadata.filename, entry.method);
        auto outcome = strategy->attempt(path);
        if (auto* extraction = std::get_if<RawExtraction>(&outcome)) {
            entry.status = AttemptStatus::Success;
            attempts.push_back(std::move(entry));
            raw = std::move(*extraction);
            break;
        }

        const auto& failure = std::get<io::ParseFailure>(outcome);
        spdlog::warn("{}: {} failed: {}", result.metadata.filename, entry.method, failure.message);
        entry.status = AttemptStatus::Failed;
        entry.error = failure.message;
        attempts.push_back(std::move(entry));
        if (!primary_failure.has_value()) {
            primary_failure = failure;
        }
        if (!config_.options.continue_on_error) {
            break;
        }
    }

    if (was_cancelled) {
        result.errors.push_back({ErrorCode::Cancelled, "Extraction cancelled"});
        result.classification = classifier_.classifyErrors(result.errors);
        return result;
    }

    if (!raw.has_value()) {
        if (primary_failure.has_value()) {
            result.errors.push_back({primary_failure->code, primary_failure->message});
        } else {
            result.errors.push_back({ErrorCode::InsufficientData,
                "No extraction strategy available for " + std::string(toString(*file_type)) + " files"});
        }
        result.classification = classifier_.classifyErrors(result.errors);
        applyFallback(result, SourceStructure{}, path);
        return result;
    }

    fillStructureMetadata(result.metadata, raw->structure);
    for (const auto& w : raw->warnings) {
        addOnce(result.warnings, w);
    }

    // 3. Глубины в футах
    result.metadata.depth_unit = std::string(unitName(raw->depth_unit.value_or(config_.units.default_unit)));
    normalizeDepths(*raw, result);

    // 4. Проверка последовательности глубин с попыткой исправления
    bool validation_passed = true;
    size_t validation_errors = 0;
    if (config_.options.auto_validate) {
        auto validation = validator_.validateDepthSequence(raw->depths);
        if (needsDepthRecovery(validation)) {
            auto recovery = recoverDepthSequence(*raw, validation);
            if (recovery.applied) {
                auto revalidated = validator_.validateDepthSequence(recovery.data.depths);
                if (!revalidated.hasErrors()) {
                    spdlog::warn("{}: depth data corrected ({} interpolated, {} dropped, {} outliers, {} duplicates)",
                                 result.metadata.filename, recovery.interpolated, recovery.dropped,
                                 recovery.outliers_removed, recovery.duplicates_removed);
                    result.warnings.push_back("Depth data was automatically corrected");
                    *raw = std::move(recovery.data);
                    validation = std::move(revalidated);
                }
            }
        }
        for (const auto& w : validation.warnings) {
            addOnce(result.warnings, w.message);
        }
        for (const auto& e : validation.errors) {
            result.errors.push_back({e.code(), e.toString()});
        }
        validation_passed = validation.is_valid;
        validation_errors = validation.errors.size();
    }

    // 5. Слои
    const LayerSource source = *file_type == FileType::Pdf ? LayerSource::PdfImport : LayerSource::ExcelImport;
    LayerList layers = detector_.detect(*raw, source);
    if (layers.empty()) {
        layers = detector_.detectFromThickness(*raw);
        if (!layers.empty()) {
            result.warnings.push_back("Used alternative layer detection method");
        } else {
            result.errors.push_back({ErrorCode::NoLayersDetected, "No material layers could be detected"});
        }
    }

    const auto boundaries = validator_.validateLayerBoundaries(layers);
    for (const auto& w : boundaries.warnings) {
        addOnce(result.warnings, w.message);
    }
    for (const auto& e : boundaries.errors) {
        result.errors.push_back({e.code(), e.toString()});
    }

    result.metadata.depth_resolution = modalInterval(raw->depths);
    if (!layers.empty()) {
        result.metadata.total_depth = layers.back().end_depth.value;
    } else if (raw->numericDepthCount() > 0) {
        for (double d : raw->depths) {
            if (std::isfinite(d)) result.metadata.total_depth = std::max(result.metadata.total_depth, d);
        }
    }

    // 6. Уверенность
    ScoringInput input;
    input.validation_passed = validation_passed && boundaries.is_valid;
    input.validation_error_count = validation_errors + boundaries.errors.size();
    input.structure = raw->structure;
    input.error_count = result.errors.size();
    result.confidence = scorer_.score(layers, input);

    const auto check = scorer_.checkExtractionConfidence(layers);
    result.metadata.high_confidence_layers = check.high;
    result.metadata.medium_confidence_layers = check.medium;
    result.metadata.low_confidence_layers = check.low;
    if (check.warning.has_value() && !layers.empty()) {
        result.warnings.push_back(*check.warning);
    }
    if (!layers.empty()) {
        result.data = std::move(layers);
    }

    // 7. Классификация и решение
    result.classification = classifier_.classifyErrors(result.errors);
    const auto& classification = *result.classification;
    const bool acceptable = check.acceptable &&
                            result.confidence.score >= config_.options.min_confidence_threshold;

    if (result.data.has_value() && classification.allow_save && !classification.should_abort &&
        !classification.force_review && acceptable) {
        result.success = true;
        return result;
    }

    applyFallback(result, raw->structure, path);
    return result;
}

void StrataExtractor::normalizeDepths(RawExtraction& raw, ExtractionResult& result) const {
    const std::string unit = raw.depth_unit.has_value() ? std::string(unitName(*raw.depth_unit)) : std::string();

    for (auto& depth : raw.depths) {
        if (!std::isfinite(depth)) {
            continue;
        }
        const auto normalized = normalizer_.normalize(depth, unit);
        if (normalized.depth.has_value()) {
            depth = normalized.depth->value;
        }
        for (const auto& e : normalized.errors) {
            addOnce(result.errors, e);
        }
        for (const auto& w : normalized.warnings) {
            addOnce(result.warnings, w.message);
        }
    }
}

void StrataExtractor::applyFallback(
    ExtractionResult& result,
    const SourceStructure& structure,
    const std::filesystem::path& path
) {
    const auto& classification = *result.classification;
    auto strategy = fallback_.determineFallbackStrategy(result, classification);
    result.user_guidance = strategy.user_guidance;

    if (!strategy.can_recover) {
        result.fallback_strategy = std::move(strategy);
        return;
    }

    FallbackContext context;
    context.file = path.string();
    context.layers = result.data.value_or(LayerList{});
    context.confidence = result.confidence.score;
    context.classification = classification;
    context.structure = structure;

    auto session = fallback_.executeFallbackStrategy(strategy, context);
    if (!session.success && strategy.type != FallbackStrategyType::ManualEntry) {
        spdlog::warn("{}: recovery strategy {} failed: {}", result.metadata.filename,
                     toString(*strategy.type), session.error);
        result.warnings.push_back("Recovery strategy " + std::string(toString(*strategy.type)) +
                                  " failed: " + session.error);
        strategy = FallbackManager::manualEntryStrategy();
        result.user_guidance = strategy.user_guidance;
        session = fallback_.executeFallbackStrategy(strategy, context);
    }

    result.fallback_strategy = std::move(strategy);
    result.metadata.fallback_used = true;
    if (session.success) {
        result.recovery_session = std::move(session);
    } else {
        result.warnings.push_back("Recovery session could not be prepared: " + session.error);
    }
}

std::optional<ExtractionStatistics> StrataExtractor::getStatistics() const {
    if (!last_result_.has_value()) {
        return std::nullopt;
    }
    return computeStatistics(last_result_->data.value_or(LayerList{}));
}

std::optional<ExtractionReport> StrataExtractor::generateReport() const {
    if (!last_result_.has_value()) {
        return std::nullopt;
    }
    const auto& result = *last_result_;

    ExtractionReport report;
    report.filename = result.metadata.filename;
    report.success = result.success;
    report.confidence = result.confidence;
    report.statistics = computeStatistics(result.data.value_or(LayerList{}));
    report.errors = result.errorMessages();
    report.warnings = result.warnings;
    report.attempts = result.metadata.extraction_attempts;

    if (report.statistics.low_confidence_layers > 0) {
        report.recommendations.push_back("Review " + std::to_string(report.statistics.low_confidence_layers) +
                                         " low-confidence layer(s) against the original chart");
    }
    if (result.user_guidance.has_value() && !result.user_guidance->empty()) {
        report.recommendations.push_back(*result.user_guidance);
    }
    if (!result.warnings.empty()) {
        report.recommendations.push_back("Review the extraction warnings before saving");
    }
    if (report.recommendations.empty() && result.success) {
        report.recommendations.push_back("Extracted layers are ready to save");
    }
    return report;
}

ExtractionStatistics computeStatistics(const LayerList& layers) {
    ExtractionStatistics stats;
    stats.total_layers = layers.size();
    if (layers.empty()) {
        return stats;
    }

    Feet total_thickness{0.0};
    std::map<std::string, MaterialShare> by_material;
    for (const auto& layer : layers) {
        const Feet thickness = layer.thickness();
        total_thickness += thickness;
        stats.total_depth = std::max(stats.total_depth, layer.end_depth);

        auto& share = by_material[layer.material];
        share.material = layer.material;
        ++share.layer_count;
        share.total_thickness += thickness;

        switch (layer.confidence) {
            case ConfidenceLevel::High: ++stats.high_confidence_layers; break;
            case ConfidenceLevel::Medium: ++stats.medium_confidence_layers; break;
            case ConfidenceLevel::Low: ++stats.low_confidence_layers; break;
        }
        if (layer.user_edited) ++stats.user_edited_layers;
    }
    stats.average_thickness = total_thickness / static_cast<double>(layers.size());

    for (auto& [name, share] : by_material) {
        share.percentage = total_thickness.value > 0.0
            ? roundTo(share.total_thickness / total_thickness * 100.0, 1)
            : 0.0;
        stats.materials.push_back(share);
    }
    std::stable_sort(stats.materials.begin(), stats.materials.end(),
        [](const MaterialShare& a, const MaterialShare& b) { return a.total_thickness > b.total_thickness; });
    return stats;
}

} // namespace strata::core
