/**
 * @file config_io.cpp
 * @brief Реализация чтения и записи конфигурации
 * @author Yan Bubenok <yan@bubenok.com>
 */

#include "config_io.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <iterator>

namespace strata::io {

using json = nlohmann::json;
using model::DepthUnit;
using model::ExtractionConfig;

namespace {

DepthUnit unitFromJson(const json& j) {
    const auto name = j.get<std::string>();
    if (name == "feet" || name == "ft") return DepthUnit::Feet;
    if (name == "meters" || name == "m") return DepthUnit::Meters;
    throw ConfigError("Unknown depth unit in configuration: " + name);
}

template <typename T>
void readValue(const json& j, const char* key, T& target) {
    if (j.contains(key) && !j.at(key).is_null()) {
        target = j.at(key).get<T>();
    }
}

void readOptions(const json& j, ExtractionConfig& config) {
    readValue(j, "min_confidence_threshold", config.options.min_confidence_threshold);
    readValue(j, "high_confidence_threshold", config.options.high_confidence_threshold);
    readValue(j, "auto_validate", config.options.auto_validate);
    readValue(j, "continue_on_error", config.options.continue_on_error);
    // Флаги восстановления допускаются и в "options"
    readValue(j, "enable_guided_correction", config.fallback.enable_guided_correction);
    readValue(j, "enable_template_matching", config.fallback.enable_template_matching);
}

void readFallback(const json& j, ExtractionConfig& config) {
    readValue(j, "min_confidence", config.fallback.min_confidence);
    readValue(j, "partial_extraction", config.fallback.partial_extraction);
    readValue(j, "max_recovery_attempts", config.fallback.max_recovery_attempts);
    readValue(j, "enable_guided_correction", config.fallback.enable_guided_correction);
    readValue(j, "enable_template_matching", config.fallback.enable_template_matching);
}

void readDepthLimits(const json& j, ExtractionConfig& config) {
    readValue(j, "min_depth", config.depth_limits.min_depth);
    readValue(j, "max_depth", config.depth_limits.max_depth);
    readValue(j, "warning_depth", config.depth_limits.warning_depth);
    readValue(j, "decimal_places", config.depth_limits.decimal_places);
    readValue(j, "precision_tolerance", config.depth_limits.precision_tolerance);
    readValue(j, "gap_threshold", config.depth_limits.gap_threshold);
}

void readUnits(const json& j, ExtractionConfig& config) {
    if (j.contains("default_unit")) {
        config.units.default_unit = unitFromJson(j.at("default_unit"));
    }
    if (j.contains("aliases")) {
        config.units.aliases.clear();
        for (const auto& entry : j.at("aliases")) {
            auto alias = entry.at("alias").get<std::string>();
            if (alias.empty()) {
                throw ConfigError("Empty unit alias in configuration");
            }
            config.units.aliases.emplace_back(std::move(alias), unitFromJson(entry.at("unit")));
        }
    }
}

void readMaterials(const json& j, ExtractionConfig& config) {
    if (j.contains("keywords")) {
        config.materials.keywords = j.at("keywords").get<std::vector<std::string>>();
    }
    if (j.contains("canonical_names")) {
        config.materials.canonical_names.clear();
        for (const auto& entry : j.at("canonical_names")) {
            config.materials.canonical_names.emplace_back(
                entry.at("pattern").get<std::string>(),
                entry.at("name").get<std::string>());
        }
    }
}

void checkRanges(const ExtractionConfig& config) {
    auto in_unit_range = [](double v) { return v >= 0.0 && v <= 1.0; };

    const auto& o = config.options;
    if (!in_unit_range(o.min_confidence_threshold) || !in_unit_range(o.high_confidence_threshold) ||
        o.min_confidence_threshold > o.high_confidence_threshold) {
        throw ConfigError("Confidence thresholds must satisfy 0 <= min <= high <= 1");
    }

    const auto& f = config.fallback;
    if (!in_unit_range(f.min_confidence) || !in_unit_range(f.partial_extraction) ||
        f.min_confidence > f.partial_extraction) {
        throw ConfigError("Fallback thresholds must satisfy 0 <= min_confidence <= partial_extraction <= 1");
    }

    const auto& d = config.depth_limits;
    if (d.min_depth >= d.max_depth) {
        throw ConfigError("depth_limits.min_depth must be less than max_depth");
    }
    if (d.decimal_places < 0 || d.decimal_places > 6) {
        throw ConfigError("depth_limits.decimal_places must be between 0 and 6");
    }
    if (d.precision_tolerance < 0.0 || d.gap_threshold < 0.0) {
        throw ConfigError("depth_limits tolerances must not be negative");
    }
    if (config.materials.keywords.empty()) {
        throw ConfigError("Material vocabulary must contain at least one keyword");
    }
}

json unitToJson(DepthUnit unit) {
    return std::string(model::unitName(unit));
}

} // anonymous namespace

ExtractionConfig configFromJson(const std::string& text) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& e) {
        throw ConfigError("Configuration JSON parse error: " + std::string(e.what()));
    }
    if (!j.is_object()) {
        throw ConfigError("Configuration must be a JSON object");
    }

    ExtractionConfig config = model::defaultConfig();
    try {
        if (j.contains("options")) readOptions(j.at("options"), config);
        if (j.contains("fallback")) readFallback(j.at("fallback"), config);
        if (j.contains("depth_limits")) readDepthLimits(j.at("depth_limits"), config);
        if (j.contains("units")) readUnits(j.at("units"), config);
        if (j.contains("materials")) readMaterials(j.at("materials"), config);
    } catch (const json::exception& e) {
        throw ConfigError("Invalid configuration value: " + std::string(e.what()));
    }

    checkRanges(config);
    return config;
}

ExtractionConfig loadConfig(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw ConfigError("Cannot open configuration file: " + path.string());
    }
    const std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    return configFromJson(content);
}

std::string configToJson(const ExtractionConfig& config, int indent) {
    json j;

    j["options"] = {
        {"min_confidence_threshold", config.options.min_confidence_threshold},
        {"high_confidence_threshold", config.options.high_confidence_threshold},
        {"auto_validate", config.options.auto_validate},
        {"continue_on_error", config.options.continue_on_error}
    };
    j["fallback"] = {
        {"min_confidence", config.fallback.min_confidence},
        {"partial_extraction", config.fallback.partial_extraction},
        {"max_recovery_attempts", config.fallback.max_recovery_attempts},
        {"enable_guided_correction", config.fallback.enable_guided_correction},
        {"enable_template_matching", config.fallback.enable_template_matching}
    };
    j["depth_limits"] = {
        {"min_depth", config.depth_limits.min_depth},
        {"max_depth", config.depth_limits.max_depth},
        {"warning_depth", config.depth_limits.warning_depth},
        {"decimal_places", config.depth_limits.decimal_places},
        {"precision_tolerance", config.depth_limits.precision_tolerance},
        {"gap_threshold", config.depth_limits.gap_threshold}
    };

    json aliases = json::array();
    for (const auto& [alias, unit] : config.units.aliases) {
        aliases.push_back({{"alias", alias}, {"unit", unitToJson(unit)}});
    }
    j["units"] = {{"default_unit", unitToJson(config.units.default_unit)}, {"aliases", aliases}};

    json canonical = json::array();
    for (const auto& [pattern, name] : config.materials.canonical_names) {
        canonical.push_back({{"pattern", pattern}, {"name", name}});
    }
    j["materials"] = {{"keywords", config.materials.keywords}, {"canonical_names", canonical}};

    return j.dump(indent);
}

} // namespace strata::io
