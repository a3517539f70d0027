/**
 * @file test_depth_normalizer.cpp
 * @brief Юнит-тесты нормализации глубин
 */

#include <doctest/doctest.h>
#include "core/depth_normalizer.hpp"
#include <limits>

using namespace strata::core;
using namespace strata::model;

namespace {

DepthNormalizer makeNormalizer() {
    return DepthNormalizer(DepthLimits{}, defaultUnitVocabulary());
}

bool hasWarning(const NormalizedDepth& result, ErrorCode code) {
    for (const auto& w : result.warnings) {
        if (w.code == code) return true;
    }
    return false;
}

} // namespace

TEST_CASE("normalize converts meters to feet and rounds to two decimals") {
    const auto normalizer = makeNormalizer();
    const auto result = normalizer.normalize(10.0, "m");

    REQUIRE(result.success);
    REQUIRE(result.depth.has_value());
    CHECK(result.depth->value == doctest::Approx(32.81));
    CHECK(result.detected_unit == DepthUnit::Meters);
    CHECK(result.conversion_applied);
    CHECK(hasWarning(result, ErrorCode::PrecisionLoss));
}

TEST_CASE("normalize keeps feet unchanged") {
    const auto normalizer = makeNormalizer();
    const auto result = normalizer.normalize(12.5, "feet");

    REQUIRE(result.success);
    CHECK(result.depth->value == doctest::Approx(12.5));
    CHECK_FALSE(result.conversion_applied);
    CHECK(result.warnings.empty());
}

TEST_CASE("normalize parses depth text with unit suffix") {
    const auto normalizer = makeNormalizer();
    const auto result = normalizer.normalize(std::string("12.5 ft"), "ft");

    REQUIRE(result.success);
    CHECK(result.depth->value == doctest::Approx(12.5));
    CHECK(result.original_value == "12.5 ft");
}

TEST_CASE("missing unit assumes feet with a warning") {
    const auto normalizer = makeNormalizer();
    const auto result = normalizer.normalize(5.0, "");

    REQUIRE(result.success);
    CHECK(result.detected_unit == DepthUnit::Feet);
    REQUIRE(result.warnings.size() == 1);
    CHECK(result.warnings.front().message == "No unit specified, assuming feet");
}

TEST_CASE("unknown unit falls back to default and partial unit is reported") {
    const auto normalizer = makeNormalizer();

    const auto unknown = normalizer.normalize(5.0, "furlongs");
    CHECK(unknown.success);
    CHECK(hasWarning(unknown, ErrorCode::UnitAssumed));
    CHECK(unknown.warnings.front().message.find("Unknown unit 'furlongs'") != std::string::npos);

    bool partial = false;
    const auto unit = normalizer.resolveUnit("Meters (MSL)", &partial);
    REQUIRE(unit.has_value());
    CHECK(*unit == DepthUnit::Meters);
    CHECK(partial);
}

TEST_CASE("null, empty and non-numeric input is rejected") {
    const auto normalizer = makeNormalizer();

    const auto null_value = normalizer.normalize(std::monostate{}, "ft");
    CHECK_FALSE(null_value.success);
    CHECK_FALSE(null_value.depth.has_value());
    REQUIRE(null_value.errors.size() == 1);
    CHECK(null_value.errors.front().code == ErrorCode::InvalidDepthValue);

    const auto empty = normalizer.normalize(std::string("   "), "ft");
    CHECK_FALSE(empty.success);
    CHECK(empty.errors.front().message == "Depth value is empty string");

    const auto text = normalizer.normalize(std::string("clay"), "ft");
    CHECK_FALSE(text.success);
    CHECK(text.errors.front().code == ErrorCode::NonNumericDepth);

    const auto nan = normalizer.normalize(std::numeric_limits<double>::quiet_NaN(), "ft");
    CHECK_FALSE(nan.success);
}

TEST_CASE("depth outside limits keeps the value but fails") {
    const auto normalizer = makeNormalizer();

    const auto deep = normalizer.normalize(1200.0, "ft");
    CHECK_FALSE(deep.success);
    REQUIRE(deep.depth.has_value());
    CHECK(deep.depth->value == doctest::Approx(1200.0));
    CHECK(deep.errors.front().message.find("exceeds maximum") != std::string::npos);

    const auto negative = normalizer.normalize(-1.0, "ft");
    CHECK_FALSE(negative.success);
    CHECK(negative.errors.front().message.find("below minimum") != std::string::npos);

    const auto warning = normalizer.normalize(600.0, "ft");
    CHECK(warning.success);
    CHECK(hasWarning(warning, ErrorCode::DepthAboveWarningThreshold));
}

TEST_CASE("normalizeBatch prefixes messages with item index") {
    const auto normalizer = makeNormalizer();
    const auto batch = normalizer.normalizeBatch({
        {0.0, "ft"},
        {std::string("abc"), "ft"},
        {3.0, ""}
    });

    CHECK_FALSE(batch.success);
    CHECK(batch.statistics.total == 3);
    CHECK(batch.statistics.successful == 2);
    CHECK(batch.statistics.failed == 1);
    CHECK(batch.statistics.with_warnings == 1);
    REQUIRE(batch.errors.size() == 1);
    CHECK(batch.errors.front().rfind("Item 1: ", 0) == 0);
    REQUIRE(batch.warnings.size() == 1);
    CHECK(batch.warnings.front().rfind("Item 2: ", 0) == 0);
    CHECK(batch.items[2].index == 2);
}

TEST_CASE("validateSequence reports gaps and overlaps in start order") {
    const auto normalizer = makeNormalizer();

    const auto check = normalizer.validateSequence({
        {Feet{10.0}, Feet{20.0}},
        {Feet{0.0}, Feet{10.0}},
        {Feet{25.0}, Feet{30.0}},
        {Feet{28.0}, Feet{35.0}}
    });

    CHECK_FALSE(check.success);
    REQUIRE(check.gaps.size() == 1);
    CHECK(check.gaps.front().first_index == 0);
    CHECK(check.gaps.front().second_index == 2);
    CHECK(check.gaps.front().amount.value == doctest::Approx(5.0));
    REQUIRE(check.overlaps.size() == 1);
    CHECK(check.overlaps.front().amount.value == doctest::Approx(2.0));
    CHECK(check.errors.front().rfind("Depth overlap detected", 0) == 0);
}

TEST_CASE("validateSequence accepts contiguous intervals") {
    const auto normalizer = makeNormalizer();
    const auto check = normalizer.validateSequence({
        {Feet{0.0}, Feet{5.0}},
        {Feet{5.0}, Feet{10.0}},
        {Feet{10.05}, Feet{12.0}}
    });
    CHECK(check.success);
    CHECK(check.gaps.empty());
    CHECK(check.warnings.empty());
}
