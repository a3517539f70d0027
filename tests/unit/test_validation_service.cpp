/**
 * @file test_validation_service.cpp
 * @brief Юнит-тесты проверок глубин и границ слоёв
 */

#include <doctest/doctest.h>
#include "core/validation_service.hpp"
#include <limits>

using namespace strata::core;
using namespace strata::model;

namespace {

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

bool hasWarning(const ValidationResult& result, ErrorCode code) {
    for (const auto& w : result.warnings) {
        if (w.code == code) return true;
    }
    return false;
}

ExtractedLayer makeLayer(std::string material, double start, double end) {
    ExtractedLayer layer;
    layer.material = std::move(material);
    layer.start_depth = Feet{start};
    layer.end_depth = Feet{end};
    layer.confidence = ConfidenceLevel::High;
    layer.source = LayerSource::ExcelImport;
    return layer;
}

} // namespace

TEST_CASE("clean increasing sequence validates without errors") {
    ValidationService service;
    const auto result = service.validateDepthSequence({0.0, 5.0, 10.0, 15.0, 20.0});

    CHECK(result.is_valid);
    CHECK(result.errors.empty());
    CHECK(result.warnings.empty());
    REQUIRE(result.stats.has_value());
    CHECK(result.stats->count == 5);
    CHECK(result.stats->min == doctest::Approx(0.0));
    CHECK(result.stats->max == doctest::Approx(20.0));
    CHECK(result.stats->is_increasing);
    CHECK(result.stats->unique_count == 5);
}

TEST_CASE("empty depth list reports missing depths") {
    ValidationService service;
    const auto result = service.validateDepthSequence({});

    CHECK_FALSE(result.is_valid);
    REQUIRE(result.errors.size() == 1);
    CHECK(result.errors.front().type == ValidationErrorType::MissingDepths);
    CHECK(result.errors.front().message.find("No depth values") != std::string::npos);
}

TEST_CASE("non-numeric depths are counted") {
    ValidationService service;
    const auto result = service.validateDepthSequence({0.0, kNaN, 10.0, kNaN});

    CHECK_FALSE(result.is_valid);
    REQUIRE(result.errors.size() == 1);
    CHECK(result.errors.front().type == ValidationErrorType::NonNumericDepth);
    CHECK(result.errors.front().message == "Found 2 non-numeric depth values");
    CHECK(result.errors.front().code() == ErrorCode::NonNumericDepth);

    const auto all_invalid = service.validateDepthSequence({kNaN, kNaN});
    CHECK(all_invalid.errors.size() == 2);
    CHECK_FALSE(all_invalid.stats.has_value());
}

TEST_CASE("negative, duplicate and reversed depths produce warnings") {
    ValidationService service;

    const auto negative = service.validateDepthSequence({-2.0, 0.0, 2.0, 4.0});
    CHECK(negative.is_valid);
    CHECK(hasWarning(negative, ErrorCode::NegativeDepth));

    const auto duplicates = service.validateDepthSequence({0.0, 5.0, 5.0, 10.0});
    CHECK(hasWarning(duplicates, ErrorCode::DuplicateDepth));

    const auto zigzag = service.validateDepthSequence({0.0, 10.0, 5.0, 15.0, 8.0, 20.0});
    CHECK(hasWarning(zigzag, ErrorCode::InconsistentDepthDirection));

    const auto mostly_increasing = service.validateDepthSequence({0, 1, 2, 3, 4, 5, 6, 5.5, 7, 8, 9});
    CHECK_FALSE(hasWarning(mostly_increasing, ErrorCode::InconsistentDepthDirection));
}

TEST_CASE("unusually large gaps are reported") {
    ValidationService service;
    const auto result = service.validateDepthSequence({0, 1, 2, 3, 4, 5, 6, 7, 8, 9, 60});
    CHECK(hasWarning(result, ErrorCode::DepthGap));
}

TEST_CASE("interval consistency uses the modal step") {
    ValidationService service;

    const auto regular = service.checkDepthIntervalConsistency({0.0, 2.5, 5.0, 7.5, 10.0, 12.5});
    CHECK(regular.consistent);
    REQUIRE(regular.mode_interval.has_value());
    CHECK(*regular.mode_interval == doctest::Approx(2.5));
    CHECK(regular.consistency_ratio == doctest::Approx(1.0));

    const auto irregular = service.checkDepthIntervalConsistency({0.0, 1.0, 4.0, 5.0, 12.0, 13.0});
    CHECK_FALSE(irregular.consistent);

    const auto single = service.checkDepthIntervalConsistency({3.0});
    CHECK(single.consistent);
    CHECK_FALSE(single.mode_interval.has_value());
}

TEST_CASE("detectMissingDepths fills expected steps") {
    ValidationService service;
    const auto report = service.detectMissingDepths({0.0, 5.0, 20.0, kNaN}, 5.0);

    REQUIRE(report.missing.size() == 2);
    CHECK(report.missing[0] == doctest::Approx(10.0));
    CHECK(report.missing[1] == doctest::Approx(15.0));
    REQUIRE(report.invalid_indices.size() == 1);
    CHECK(report.invalid_indices.front() == 3);

    CHECK(service.detectMissingDepths({0.0, 10.0}, 0.0).missing.empty());
}

TEST_CASE("layer boundaries: inverted layer is an error, overlap and gap are warnings") {
    ValidationService service;

    const auto inverted = service.validateLayerBoundaries({makeLayer("Clay", 10.0, 5.0)});
    CHECK_FALSE(inverted.is_valid);
    REQUIRE(inverted.errors.size() == 1);
    CHECK(inverted.errors.front().message.find("start depth (10) > end depth (5)") != std::string::npos);

    const auto overlapping = service.validateLayerBoundaries({
        makeLayer("Clay", 0.0, 6.0),
        makeLayer("Sand", 5.0, 10.0),
        makeLayer("Gravel", 12.0, 15.0)
    });
    CHECK(overlapping.is_valid);
    CHECK(hasWarning(overlapping, ErrorCode::LayerOverlap));
    CHECK(hasWarning(overlapping, ErrorCode::LayerGap));

    CHECK(service.validateLayerBoundaries({}).is_valid);
}

TEST_CASE("validateForSave rejects empty material, inverted layers and overlaps") {
    ValidationService service;

    const auto good = service.validateForSave({makeLayer("Clay", 0.0, 5.0), makeLayer("Sand", 5.0, 10.0)});
    CHECK(good.is_valid);

    const auto bad = service.validateForSave({makeLayer("  ", 0.0, 5.0), makeLayer("Sand", 4.0, 4.0)});
    CHECK_FALSE(bad.is_valid);

    bool has_material_error = false;
    bool has_depth_error = false;
    bool has_overlap_error = false;
    for (const auto& e : bad.errors) {
        if (e.type == ValidationErrorType::MissingMaterial) {
            has_material_error = true;
            CHECK(e.toString() == "Layer 1: Material is required");
        }
        if (e.type == ValidationErrorType::InvertedLayer) has_depth_error = true;
        if (e.type == ValidationErrorType::LayerOverlap) has_overlap_error = true;
    }
    CHECK(has_material_error);
    CHECK(has_depth_error);
    CHECK(has_overlap_error);
}
