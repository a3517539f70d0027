/**
 * @file result_writer.cpp
 * @brief Запись результата извлечения
 */

#include "result_writer.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace strata::io {
namespace {

using namespace strata::model;
using json = nlohmann::json;

template <typename T>
json optionalToJson(const std::optional<T>& value) {
    if (value.has_value()) {
        return *value;
    }
    return nullptr;
}

json layerToJson(const ExtractedLayer& layer) {
    return {
        {"material", layer.material},
        {"start_depth", layer.start_depth.value},
        {"end_depth", layer.end_depth.value},
        {"thickness", layer.thickness().value},
        {"confidence", std::string(toString(layer.confidence))},
        {"source", std::string(toString(layer.source))},
        {"original_color", optionalToJson(layer.original_color)},
        {"user_edited", layer.user_edited}
    };
}

json layerListToJson(const LayerList& layers) {
    json j = json::array();
    for (const auto& layer : layers) {
        j.push_back(layerToJson(layer));
    }
    return j;
}

json classificationToJson(const ClassificationReport& report) {
    json items = json::array();
    for (const auto& c : report.classifications) {
        items.push_back({
            {"type", std::string(toString(c.type))},
            {"should_abort", c.should_abort},
            {"allow_save", c.allow_save},
            {"force_review", c.force_review},
            {"confidence_impact", c.confidence_impact},
            {"message", c.message}
        });
    }
    json j = {
        {"classifications", items},
        {"allow_save", report.allow_save},
        {"should_abort", report.should_abort},
        {"force_review", report.force_review},
        {"fatal_count", report.fatal_count},
        {"recoverable_count", report.recoverable_count},
        {"warning_count", report.warning_count},
        {"total_confidence_impact", report.total_confidence_impact}
    };
    j["overall_type"] = report.overall_type.has_value()
        ? json(std::string(toString(*report.overall_type)))
        : json(nullptr);
    return j;
}

json strategyToJson(const FallbackStrategy& strategy) {
    json j = {
        {"can_recover", strategy.can_recover},
        {"estimated_effort", std::string(toString(strategy.estimated_effort))},
        {"reason", strategy.reason},
        {"user_guidance", strategy.user_guidance},
        {"actions", strategy.actions}
    };
    j["type"] = strategy.type.has_value()
        ? json(std::string(toString(*strategy.type)))
        : json(nullptr);
    return j;
}

json sessionToJson(const RecoverySession& session) {
    json j = {
        {"id", session.id},
        {"strategy", std::string(toString(session.strategy))},
        {"success", session.success},
        {"original_file", session.original_file},
        {"layers", layerListToJson(session.layers)},
        {"confidence", session.confidence},
        {"suggested_actions", session.suggested_actions},
        {"next_steps", session.next_steps}
    };

    if (!session.missing_fields.empty()) {
        json missing = json::array();
        for (const auto& m : session.missing_fields) {
            missing.push_back({{"item_index", m.item_index}, {"fields", m.fields}});
        }
        j["missing_fields"] = missing;
    }

    if (!session.corrections.empty()) {
        json corrections = json::array();
        for (const auto& c : session.corrections) {
            corrections.push_back({
                {"type", c.type},
                {"message", c.message},
                {"severity", std::string(toString(c.severity))},
                {"suggested_action", c.suggested_action},
                {"affected_items", c.affected_items}
            });
        }
        j["corrections"] = corrections;
    }

    if (session.template_mapping.has_value()) {
        const auto& t = *session.template_mapping;
        j["template_mapping"] = {
            {"id", t.id},
            {"name", t.name},
            {"confidence", t.confidence},
            {"depth_column", optionalToJson(t.depth_column)},
            {"material_column", optionalToJson(t.material_column)},
            {"depth_header", t.depth_header},
            {"material_header", t.material_header},
            {"format_hints", t.format_hints}
        };
    }

    if (session.manual_guidance.has_value()) {
        const auto& g = *session.manual_guidance;
        j["manual_guidance"] = {
            {"title", g.title},
            {"instructions", g.instructions},
            {"tips", g.tips}
        };
    }

    if (!session.error.empty()) {
        j["error"] = session.error;
    }
    return j;
}

json metadataToJson(const ExtractionMetadata& m) {
    json attempts = json::array();
    for (const auto& a : m.extraction_attempts) {
        attempts.push_back({
            {"method", a.method},
            {"status", std::string(toString(a.status))},
            {"error", optionalToJson(a.error)}
        });
    }

    json j = {
        {"filename", m.filename},
        {"depth_unit", m.depth_unit},
        {"depth_resolution", m.depth_resolution},
        {"total_depth", m.total_depth},
        {"extraction_timestamp", m.extraction_timestamp},
        {"processing_time_ms", m.processing_time_ms},
        {"extraction_attempts", attempts},
        {"mapped_columns", m.mapped_columns},
        {"text_length", m.text_length},
        {"has_headers", m.has_headers},
        {"column_count", m.column_count},
        {"format_hints", m.format_hints},
        {"high_confidence_layers", m.high_confidence_layers},
        {"medium_confidence_layers", m.medium_confidence_layers},
        {"low_confidence_layers", m.low_confidence_layers},
        {"fallback_used", m.fallback_used}
    };
    j["file_type"] = m.file_type.has_value()
        ? json(std::string(toString(*m.file_type)))
        : json(nullptr);
    return j;
}

json buildJson(const ExtractionResult& result) {
    json j;
    j["success"] = result.success;
    j["data"] = result.data.has_value() ? layerListToJson(*result.data) : json(nullptr);
    j["confidence"] = {
        {"score", result.confidence.score},
        {"level", std::string(toString(result.confidence.level))}
    };

    json errors = json::array();
    for (const auto& e : result.errors) {
        errors.push_back({{"code", std::string(toString(e.code))}, {"message", e.message}});
    }
    j["errors"] = errors;
    j["warnings"] = result.warnings;
    j["metadata"] = metadataToJson(result.metadata);

    if (result.classification.has_value()) {
        j["classification"] = classificationToJson(*result.classification);
    }
    if (result.fallback_strategy.has_value()) {
        j["fallback_strategy"] = strategyToJson(*result.fallback_strategy);
    }
    if (result.recovery_session.has_value()) {
        j["recovery_session"] = sessionToJson(*result.recovery_session);
    }
    if (result.user_guidance.has_value()) {
        j["user_guidance"] = *result.user_guidance;
    }
    return j;
}

std::string formatFeet(Feet value) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(2) << value.value;
    return out.str();
}

// Запись через временный файл + rename
void atomicWrite(const std::filesystem::path& path, const std::string& content) {
    const auto dir = path.parent_path();
    if (!dir.empty()) {
        std::filesystem::create_directories(dir);
    }

    auto tmp = path;
    tmp += ".tmp";

    {
        std::ofstream ofs(tmp, std::ios::binary);
        if (!ofs) {
            throw std::runtime_error("Cannot open temporary file for writing: " + tmp.string());
        }
        ofs.write(content.data(), static_cast<std::streamsize>(content.size()));
        if (!ofs) {
            throw std::runtime_error("Cannot write temporary file: " + tmp.string());
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        std::filesystem::remove(tmp, ec);
        throw std::runtime_error("Cannot save file: " + path.string());
    }
}

} // anonymous namespace

std::string resultToJson(const ExtractionResult& result, int indent) {
    return buildJson(result).dump(indent);
}

std::string layersToJson(const LayerList& layers, int indent) {
    return layerListToJson(layers).dump(indent);
}

std::string reportToMarkdown(const ExtractionReport& report) {
    std::ostringstream out;
    const auto& stats = report.statistics;

    out << "# Strata extraction report\n\n";
    out << "- File: " << report.filename << "\n";
    out << "- Status: " << (report.success ? "success" : "needs attention") << "\n";
    out << "- Confidence: " << static_cast<int>(report.confidence.score * 100.0 + 0.5) << "% ("
        << toString(report.confidence.level) << ")\n";
    out << "- Layers: " << stats.total_layers << "\n";
    out << "- Total depth: " << formatFeet(stats.total_depth) << " ft\n";
    out << "- Average thickness: " << formatFeet(stats.average_thickness) << " ft\n\n";

    if (!stats.materials.empty()) {
        out << "## Materials\n";
        out << "| Material | Layers | Thickness, ft | Share |\n";
        out << "|----------|--------|---------------|-------|\n";
        for (const auto& m : stats.materials) {
            out << "| " << m.material << " | " << m.layer_count << " | " << formatFeet(m.total_thickness)
                << " | " << std::fixed << std::setprecision(1) << m.percentage << "% |\n";
        }
        out << "\n";
    }

    out << "## Confidence\n";
    out << "- High: " << stats.high_confidence_layers
        << ", medium: " << stats.medium_confidence_layers
        << ", low: " << stats.low_confidence_layers
        << ", edited: " << stats.user_edited_layers << "\n\n";

    if (!report.attempts.empty()) {
        out << "## Attempts\n";
        for (const auto& a : report.attempts) {
            out << "- " << a.method << ": " << toString(a.status);
            if (a.error.has_value()) {
                out << " (" << *a.error << ")";
            }
            out << "\n";
        }
        out << "\n";
    }

    auto list = [&out](const char* title, const std::vector<std::string>& items) {
        if (items.empty()) return;
        out << "## " << title << "\n";
        for (const auto& item : items) {
            out << "- " << item << "\n";
        }
        out << "\n";
    };
    list("Errors", report.errors);
    list("Warnings", report.warnings);
    list("Recommendations", report.recommendations);

    return out.str();
}

void writeResultJson(const ExtractionResult& result, const std::filesystem::path& path) {
    atomicWrite(path, resultToJson(result) + "\n");
}

void writeReportMarkdown(const ExtractionReport& report, const std::filesystem::path& path) {
    atomicWrite(path, reportToMarkdown(report));
}

} // namespace strata::io
