/**
 * @file test_extractor_strategies.cpp
 * @brief Интеграционные тесты координатора с подменёнными стратегиями разбора
 */

#include <doctest/doctest.h>
#include "core/strata_extractor.hpp"
#include <algorithm>
#include <atomic>
#include <cmath>
#include <limits>
#include <memory>
#include <string>
#include <vector>

using namespace strata::core;
using namespace strata::model;
using strata::io::ParseFailure;
using strata::io::ParseOutcome;
using strata::io::ParseStrategy;
using strata::io::StrategyList;

namespace {

class FakeStrategy : public ParseStrategy {
public:
    FakeStrategy(std::string name, ParseOutcome outcome, std::atomic<bool>* cancel_after = nullptr)
        : name_(std::move(name))
        , outcome_(std::move(outcome))
        , cancel_after_(cancel_after) {}

    [[nodiscard]] std::string_view name() const noexcept override { return name_; }

    [[nodiscard]] ParseOutcome attempt(const std::filesystem::path&) const override {
        if (cancel_after_ != nullptr) {
            cancel_after_->store(true);
        }
        return outcome_;
    }

private:
    std::string name_;
    ParseOutcome outcome_;
    std::atomic<bool>* cancel_after_;
};

RawExtraction tabular(const std::vector<double>& depths, const std::vector<std::string>& materials) {
    RawExtraction raw;
    for (size_t i = 0; i < depths.size(); ++i) {
        std::optional<std::string> material;
        if (i < materials.size() && !materials[i].empty()) {
            material = materials[i];
        }
        raw.addPoint(depths[i], material);
    }
    raw.depth_unit = DepthUnit::Feet;
    raw.structure.has_headers = true;
    raw.structure.column_count = 2;
    raw.structure.mapped_columns = 2;
    raw.structure.depth_column = 0;
    raw.structure.material_column = 1;
    return raw;
}

ParseFailure failure(ErrorCode code, std::string message) {
    return ParseFailure{code, std::move(message)};
}

bool contains(const std::vector<std::string>& items, const std::string& value) {
    return std::find(items.begin(), items.end(), value) != items.end();
}

} // namespace

TEST_CASE("next strategy runs after a failure") {
    StrataExtractor extractor;
    const auto raw = tabular({0.0, 5.0, 10.0}, {"Clay", "Clay", "Sand"});
    extractor.setStrategyFactory([raw](FileType, const ExtractionConfig&) {
        StrategyList list;
        list.push_back(std::make_unique<FakeStrategy>(
            "first", failure(ErrorCode::DepthColumnNotFound, "Depth column not found")));
        list.push_back(std::make_unique<FakeStrategy>("second", raw));
        list.push_back(std::make_unique<FakeStrategy>("third", failure(ErrorCode::NoSheets, "unused")));
        return list;
    });

    const auto result = extractor.extractFromFile("boring.xlsx");

    const auto& attempts = result.metadata.extraction_attempts;
    REQUIRE(attempts.size() == 2);
    CHECK(attempts[0].method == "first");
    CHECK(attempts[0].status == AttemptStatus::Failed);
    CHECK(*attempts[0].error == "Depth column not found");
    CHECK(attempts[1].method == "second");
    CHECK(attempts[1].status == AttemptStatus::Success);
    CHECK_FALSE(attempts[1].error.has_value());

    CHECK(result.success);
    CHECK(result.errors.empty());
    REQUIRE(result.data.has_value());
    REQUIRE(result.data->size() == 2);
    // Последний слой продлевается на предыдущий шаг кровель
    CHECK((*result.data)[1].start_depth.value == doctest::Approx(10.0));
    CHECK((*result.data)[1].end_depth.value == doctest::Approx(20.0));
    CHECK(result.metadata.has_headers);
    CHECK(result.metadata.mapped_columns == 2);
}

TEST_CASE("continue_on_error=false stops after the first failure") {
    auto config = defaultConfig();
    config.options.continue_on_error = false;
    StrataExtractor extractor(config);
    const auto raw = tabular({0.0, 5.0}, {"Clay", "Sand"});
    extractor.setStrategyFactory([raw](FileType, const ExtractionConfig&) {
        StrategyList list;
        list.push_back(std::make_unique<FakeStrategy>(
            "first", failure(ErrorCode::DepthColumnNotFound, "Depth column not found")));
        list.push_back(std::make_unique<FakeStrategy>("second", raw));
        return list;
    });

    const auto result = extractor.extractFromFile("boring.xlsx");

    CHECK_FALSE(result.success);
    REQUIRE(result.metadata.extraction_attempts.size() == 1);
    REQUIRE(result.errors.size() == 1);
    CHECK(result.errors[0].code == ErrorCode::DepthColumnNotFound);
    REQUIRE(result.fallback_strategy.has_value());
    CHECK_FALSE(result.fallback_strategy->can_recover);
}

TEST_CASE("cancellation skips remaining strategies") {
    std::atomic<bool> cancel{false};
    StrataExtractor extractor;
    extractor.setCancellationFlag(&cancel);
    const auto raw = tabular({0.0, 5.0}, {"Clay", "Sand"});
    extractor.setStrategyFactory([raw, &cancel](FileType, const ExtractionConfig&) {
        StrategyList list;
        list.push_back(std::make_unique<FakeStrategy>(
            "first", failure(ErrorCode::FileCorrupted, "File is corrupt"), &cancel));
        list.push_back(std::make_unique<FakeStrategy>("second", raw));
        list.push_back(std::make_unique<FakeStrategy>("third", raw));
        return list;
    });

    const auto result = extractor.extractFromFile("boring.xlsx");

    const auto& attempts = result.metadata.extraction_attempts;
    REQUIRE(attempts.size() == 3);
    CHECK(attempts[0].status == AttemptStatus::Failed);
    CHECK(attempts[1].status == AttemptStatus::Skipped);
    CHECK(*attempts[1].error == "cancelled");
    CHECK(attempts[2].status == AttemptStatus::Skipped);

    CHECK_FALSE(result.success);
    CHECK_FALSE(result.data.has_value());
    REQUIRE(result.errors.size() == 1);
    CHECK(result.errors[0].code == ErrorCode::Cancelled);
    CHECK(result.errors[0].message == "Extraction cancelled");
    CHECK_FALSE(result.fallback_strategy.has_value());
    CHECK_FALSE(result.recovery_session.has_value());
}

TEST_CASE("unclassified failures lead to a manual entry session") {
    StrataExtractor extractor;
    extractor.setStrategyFactory([](FileType, const ExtractionConfig&) {
        StrategyList list;
        list.push_back(std::make_unique<FakeStrategy>(
            "first", failure(ErrorCode::Unclassified, "Something odd happened")));
        list.push_back(std::make_unique<FakeStrategy>(
            "second", failure(ErrorCode::Unclassified, "Still odd")));
        return list;
    });

    const auto result = extractor.extractFromFile("boring.xlsx");

    CHECK_FALSE(result.success);
    REQUIRE(result.errors.size() == 1);
    CHECK(result.errors[0].message == "Something odd happened");
    REQUIRE(result.classification.has_value());
    CHECK_FALSE(result.classification->should_abort);

    REQUIRE(result.fallback_strategy.has_value());
    REQUIRE(result.fallback_strategy->type.has_value());
    CHECK(*result.fallback_strategy->type == FallbackStrategyType::ManualEntry);
    REQUIRE(result.recovery_session.has_value());
    CHECK(result.recovery_session->success);
    CHECK(result.recovery_session->manual_guidance.has_value());
    CHECK(result.metadata.fallback_used);
    REQUIRE(result.user_guidance.has_value());
    CHECK(*result.user_guidance == result.fallback_strategy->user_guidance);
}

TEST_CASE("no strategies for the file type is reported") {
    StrataExtractor extractor;
    extractor.setStrategyFactory([](FileType, const ExtractionConfig&) { return StrategyList{}; });

    const auto result = extractor.extractFromFile("boring.xls");

    CHECK_FALSE(result.success);
    CHECK(result.metadata.extraction_attempts.empty());
    REQUIRE(result.errors.size() == 1);
    CHECK(result.errors[0].code == ErrorCode::InsufficientData);
    CHECK(result.errors[0].message == "No extraction strategy available for excel files");
}

TEST_CASE("non-numeric depths are interpolated") {
    StrataExtractor extractor;
    const double nan = std::numeric_limits<double>::quiet_NaN();
    const auto raw = tabular({0.0, nan, 10.0, 15.0}, {"Clay", "Clay", "Sand", "Sand"});
    extractor.setStrategyFactory([raw](FileType, const ExtractionConfig&) {
        StrategyList list;
        list.push_back(std::make_unique<FakeStrategy>("primary", raw));
        return list;
    });

    const auto result = extractor.extractFromFile("boring.xlsx");

    CHECK(contains(result.warnings, "Depth data was automatically corrected"));
    CHECK(result.errors.empty());
    REQUIRE(result.data.has_value());
    REQUIRE(result.data->size() == 2);
    CHECK((*result.data)[0].end_depth.value == doctest::Approx(10.0));
    CHECK((*result.data)[1].end_depth.value == doctest::Approx(15.0));
    CHECK(result.metadata.depth_resolution == doctest::Approx(5.0));
}

TEST_CASE("color-only signal yields medium confidence layers") {
    StrataExtractor extractor;
    RawExtraction raw;
    raw.addPoint(0.0, std::nullopt, std::string("#8B4513"));
    raw.addPoint(5.0, std::nullopt, std::string("#8B4513"));
    raw.addPoint(10.0, std::nullopt, std::string("#FFFF00"));
    raw.addPoint(20.0, std::nullopt, std::nullopt);
    raw.depth_unit = DepthUnit::Feet;
    extractor.setStrategyFactory([raw](FileType, const ExtractionConfig&) {
        StrategyList list;
        list.push_back(std::make_unique<FakeStrategy>("primary", raw));
        return list;
    });

    const auto result = extractor.extractFromFile("boring.xlsx");

    REQUIRE(result.data.has_value());
    const auto& layers = *result.data;
    REQUIRE(layers.size() == 2);
    CHECK(layers[0].confidence == ConfidenceLevel::Medium);
    CHECK(layers[0].material == "Unknown");
    CHECK(*layers[0].original_color == "#8B4513");
    CHECK(layers[1].start_depth.value == doctest::Approx(10.0));
    CHECK(layers[1].end_depth.value == doctest::Approx(20.0));
    CHECK(result.metadata.medium_confidence_layers == 2);
    // Цветовые слои строит основное разбиение, запасной путь не нужен
    CHECK(std::find(result.warnings.begin(), result.warnings.end(),
                    "Used alternative layer detection method") == result.warnings.end());
}

TEST_CASE("layers without any signal go to partial extraction") {
    StrataExtractor extractor;
    RawExtraction raw;
    raw.addPoint(0.0, std::nullopt);
    raw.addPoint(5.0, std::nullopt);
    raw.addPoint(10.0, std::nullopt);
    raw.depth_unit = DepthUnit::Feet;
    extractor.setStrategyFactory([raw](FileType, const ExtractionConfig&) {
        StrategyList list;
        list.push_back(std::make_unique<FakeStrategy>("primary", raw));
        return list;
    });

    const auto result = extractor.extractFromFile("boring.pdf");

    CHECK_FALSE(result.success);
    REQUIRE(result.data.has_value());
    REQUIRE(result.data->size() == 2);
    CHECK((*result.data)[0].confidence == ConfidenceLevel::Low);
    CHECK((*result.data)[0].source == LayerSource::Fallback);
    CHECK(contains(result.warnings, "Used alternative layer detection method"));
    CHECK(contains(result.warnings, "Low extraction confidence: 0%"));

    REQUIRE(result.fallback_strategy.has_value());
    CHECK(*result.fallback_strategy->type == FallbackStrategyType::PartialExtraction);
    REQUIRE(result.recovery_session.has_value());
    CHECK(result.recovery_session->layers.size() == 2);
    CHECK(result.requiresReview());
}

TEST_CASE("recovery attempts reset between extractions") {
    auto config = defaultConfig();
    config.fallback.max_recovery_attempts = 1;
    StrataExtractor extractor(config);
    extractor.setStrategyFactory([](FileType, const ExtractionConfig&) {
        StrategyList list;
        list.push_back(std::make_unique<FakeStrategy>(
            "primary", failure(ErrorCode::Unclassified, "Something odd happened")));
        return list;
    });

    const auto first = extractor.extractFromFile("boring.xlsx");
    const auto second = extractor.extractFromFile("boring.xlsx");

    CHECK(first.recovery_session.has_value());
    CHECK(second.recovery_session.has_value());
}
