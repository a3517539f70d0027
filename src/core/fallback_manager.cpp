/**
 * @file fallback_manager.cpp
 * @brief Реализация стратегий восстановления
 * @author Yan Bubenok <yan@bubenok.com>
 */

#include "fallback_manager.hpp"
#include "io/text_utils.hpp"
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <random>

namespace strata::core {

namespace {

std::string percent(double confidence) {
    return fmt::format("{:.1f}", confidence * 100.0);
}

std::string suggestedAction(const std::string& message) {
    const std::string text = io::toLower(message);
    if (text.find("overlap") != std::string::npos) {
        return "Adjust the layer boundaries so that adjacent layers share one depth";
    }
    if (text.find("start depth") != std::string::npos || text.find("gap") != std::string::npos) {
        return "Check the layer boundary depths against the original chart";
    }
    if (text.find("depth") != std::string::npos) {
        return "Verify the depth values and their unit";
    }
    if (text.find("material") != std::string::npos) {
        return "Confirm the material description for the affected layers";
    }
    return "Review and correct the highlighted issue";
}

// Слои, материал которых упомянут в сообщении в кавычках
std::vector<size_t> affectedLayers(const LayerList& layers, const std::string& message) {
    std::vector<size_t> indices;
    for (size_t i = 0; i < layers.size(); ++i) {
        const std::string quoted = "\"" + layers[i].material + "\"";
        if (!layers[i].material.empty() && message.find(quoted) != std::string::npos) {
            indices.push_back(i);
        }
    }
    return indices;
}

} // anonymous namespace

FallbackManager::FallbackManager(FallbackThresholds thresholds)
    : thresholds_(thresholds) {}

CorrectionSeverity FallbackManager::mapErrorToSeverity(ErrorSeverity type) noexcept {
    switch (type) {
        case ErrorSeverity::Fatal: return CorrectionSeverity::High;
        case ErrorSeverity::Recoverable: return CorrectionSeverity::Medium;
        case ErrorSeverity::Warning: return CorrectionSeverity::Low;
    }
    return CorrectionSeverity::Medium;
}

bool FallbackManager::canUseTemplateMatching(const ExtractionMetadata& metadata) const noexcept {
    return metadata.has_headers || metadata.column_count > 0 || !metadata.format_hints.empty();
}

FallbackStrategy FallbackManager::determineFallbackStrategy(
    const ExtractionResult& result,
    const ClassificationReport& classification
) const {
    FallbackStrategy strategy;

    if (classification.should_abort) {
        strategy.reason = "Fatal error prevents any recovery";
        strategy.user_guidance = "Please check the file format and try with a different file.";
        strategy.can_recover = false;
        strategy.estimated_effort = Effort::None;
        return strategy;
    }

    const double confidence = result.confidence.score;
    const size_t layer_count = result.layerCount();
    const bool has_partial_data = layer_count > 0;

    if (has_partial_data && confidence >= thresholds_.partial_extraction) {
        strategy.type = FallbackStrategyType::PartialExtraction;
        strategy.reason = "Some data was successfully extracted";
        strategy.actions = {"Review extracted data", "Manually add missing information", "Validate and save"};
        strategy.user_guidance = std::to_string(layer_count) + " items were extracted with " +
                                 percent(confidence) + "% confidence. Please review and complete the missing data.";
        strategy.can_recover = true;
        strategy.estimated_effort = Effort::Low;
        return strategy;
    }

    if (has_partial_data && confidence >= thresholds_.min_confidence && thresholds_.enable_guided_correction) {
        strategy.type = FallbackStrategyType::GuidedCorrection;
        strategy.reason = "Low confidence extraction requires user guidance";
        strategy.actions = {"Review uncertain extractions", "Correct identified issues", "Re-validate data"};
        strategy.user_guidance = "Extraction completed with low confidence (" + percent(confidence) +
                                 "%). Please review and correct the highlighted issues.";
        strategy.can_recover = true;
        strategy.estimated_effort = Effort::Medium;
        return strategy;
    }

    if (thresholds_.enable_template_matching && canUseTemplateMatching(result.metadata)) {
        strategy.type = FallbackStrategyType::TemplateBased;
        strategy.reason = "File structure suggests template-based approach";
        strategy.actions = {"Apply template matching", "Map data to template fields", "Review mapped data"};
        strategy.user_guidance =
            "The file appears to follow a recognizable pattern. We can try to match it against known templates.";
        strategy.can_recover = true;
        strategy.estimated_effort = Effort::Medium;
        return strategy;
    }

    return manualEntryStrategy();
}

FallbackStrategy FallbackManager::manualEntryStrategy() {
    FallbackStrategy strategy;
    strategy.type = FallbackStrategyType::ManualEntry;
    strategy.reason = "Automatic extraction failed, manual entry required";
    strategy.actions = {"Open manual entry interface", "Enter data manually", "Use file as reference"};
    strategy.user_guidance =
        "Automatic extraction was not successful. You can enter the data manually while viewing the original file.";
    strategy.can_recover = true;
    strategy.estimated_effort = Effort::High;
    return strategy;
}

RecoverySession FallbackManager::executeFallbackStrategy(
    const FallbackStrategy& strategy,
    const FallbackContext& context
) {
    RecoverySession session;
    session.id = generateRecoveryId();
    session.original_file = context.file;
    session.confidence = context.confidence;

    if (!strategy.type.has_value() || !strategy.can_recover) {
        session.error = "No recovery strategy available";
        return session;
    }
    session.strategy = *strategy.type;

    if (attempts_.size() >= thresholds_.max_recovery_attempts) {
        session.error = "Maximum recovery attempts (" + std::to_string(thresholds_.max_recovery_attempts) +
                        ") reached";
        spdlog::warn("Recovery {} refused: {}", session.id, session.error);
        return session;
    }

    RecoveryAttempt attempt;
    attempt.id = session.id;
    attempt.strategy = session.strategy;

    switch (session.strategy) {
        case FallbackStrategyType::PartialExtraction:
            session.layers = context.layers;
            session.missing_fields = identifyMissingFields(context.layers);
            session.suggested_actions = {
                "Review extracted items for accuracy",
                "Add missing required fields",
                "Verify data completeness"
            };
            session.next_steps = {
                "User reviews partial data",
                "User completes missing information",
                "System validates completed data",
                "Data is saved if validation passes"
            };
            session.success = true;
            break;

        case FallbackStrategyType::GuidedCorrection:
            session.layers = context.layers;
            session.corrections = prioritizeCorrections(
                generateCorrectionGuidance(context.layers, context.classification));
            session.suggested_actions = {"Review uncertain extractions", "Correct identified issues"};
            session.next_steps = {
                "User follows correction guidance",
                "System validates each correction",
                "Confidence score updates in real-time",
                "Data is saved when confidence threshold is met"
            };
            session.success = true;
            break;

        case FallbackStrategyType::TemplateBased: {
            auto mapping = findTemplateMapping(context.structure);
            if (!mapping.has_value()) {
                session.error = "No suitable template found";
                break;
            }
            session.layers = context.layers;
            session.template_mapping = std::move(mapping);
            session.suggested_actions = {"Confirm the detected column mapping"};
            session.next_steps = {
                "Template applied successfully",
                "User reviews template-mapped data",
                "User confirms or adjusts mappings",
                "Data is validated and saved"
            };
            session.success = true;
            break;
        }

        case FallbackStrategyType::ManualEntry:
            session.manual_guidance = ManualEntryGuidance{
                "Manual Data Entry",
                {
                    "Use the original file as reference",
                    "Enter layers from the top of the boring downward",
                    "Required fields: Material, Start Depth, End Depth (feet)",
                    "The system will validate data as you enter it"
                },
                {
                    "Each layer should start where the previous one ends",
                    "Convert depths in meters to feet (1 m = 3.28084 ft)",
                    "Use consistent material names"
                }
            };
            session.suggested_actions = {"Open the original file side by side", "Enter data manually"};
            session.next_steps = {
                "User enters data manually",
                "System provides real-time validation",
                "User can reference original file",
                "Data is saved when complete and valid"
            };
            session.success = true;
            break;
    }

    attempt.success = session.success;
    attempt.error = session.error;
    attempts_.push_back(std::move(attempt));

    spdlog::debug("Recovery {}: strategy {}, {}", session.id, toString(session.strategy),
                  session.success ? "prepared" : session.error);
    return session;
}

std::optional<TemplateMapping> FallbackManager::findTemplateMapping(const SourceStructure& structure) const {
    if (structure.depth_column.has_value()) {
        TemplateMapping mapping;
        mapping.id = "tabular-depth-material";
        mapping.name = "Depth and material columns";
        mapping.depth_column = structure.depth_column;
        mapping.material_column = structure.material_column;
        mapping.depth_header = structure.depth_header;
        mapping.material_header = structure.material_header;
        mapping.format_hints = structure.format_hints;
        // Уверенность выше, если обе колонки найдены по заголовкам
        if (structure.material_column.has_value() && structure.has_headers) {
            mapping.confidence = 0.8;
        } else if (structure.material_column.has_value()) {
            mapping.confidence = 0.6;
        } else {
            mapping.confidence = 0.4;
        }
        return mapping;
    }

    if (structure.text_length > 0 || structure.page_count > 0) {
        TemplateMapping mapping;
        mapping.id = "text-depth-labels";
        mapping.name = "Depth labels with material descriptions";
        mapping.format_hints = structure.format_hints;
        mapping.confidence = structure.format_hints.empty() ? 0.3 : 0.5;
        return mapping;
    }

    return std::nullopt;
}

std::vector<MissingFields> FallbackManager::identifyMissingFields(const LayerList& layers) const {
    std::vector<MissingFields> result;
    for (size_t i = 0; i < layers.size(); ++i) {
        MissingFields item;
        item.item_index = i;
        if (io::trim(layers[i].material).empty() || layers[i].material == "Unknown") {
            item.fields.push_back("material");
        }
        if (!(layers[i].start_depth < layers[i].end_depth)) {
            item.fields.push_back("end_depth");
        }
        if (!item.fields.empty()) {
            result.push_back(std::move(item));
        }
    }
    return result;
}

std::vector<CorrectionItem> FallbackManager::generateCorrectionGuidance(
    const LayerList& layers,
    const ClassificationReport& classification
) const {
    std::vector<CorrectionItem> corrections;

    for (const auto& c : classification.classifications) {
        CorrectionItem item;
        item.type = std::string(toString(c.type));
        item.message = c.message;
        item.severity = mapErrorToSeverity(c.type);
        item.suggested_action = suggestedAction(c.message);
        item.affected_items = affectedLayers(layers, c.message);
        corrections.push_back(std::move(item));
    }

    for (size_t i = 0; i < layers.size(); ++i) {
        if (layers[i].confidence != ConfidenceLevel::Low) {
            continue;
        }
        CorrectionItem item;
        item.type = "low_confidence";
        item.message = "Layer " + std::to_string(i + 1) + " (" + layers[i].material + ") has low confidence";
        item.severity = CorrectionSeverity::Low;
        item.suggested_action = "Confirm the material and boundaries of this layer";
        item.affected_items = {i};
        corrections.push_back(std::move(item));
    }
    return corrections;
}

std::vector<CorrectionItem> FallbackManager::prioritizeCorrections(std::vector<CorrectionItem> corrections) {
    std::stable_sort(corrections.begin(), corrections.end(), [](const CorrectionItem& a, const CorrectionItem& b) {
        if (a.severity != b.severity) {
            return static_cast<int>(a.severity) > static_cast<int>(b.severity);
        }
        return a.affected_items.size() > b.affected_items.size();
    });
    return corrections;
}

std::string FallbackManager::generateRecoveryId() const {
    static constexpr char kAlphabet[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    thread_local std::mt19937 rng{std::random_device{}()};
    std::uniform_int_distribution<size_t> pick(0, sizeof(kAlphabet) - 2);

    std::string suffix;
    for (int i = 0; i < 6; ++i) {
        suffix += kAlphabet[pick(rng)];
    }

    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return "recovery_" + std::to_string(ms) + "_" + suffix;
}

} // namespace strata::core
