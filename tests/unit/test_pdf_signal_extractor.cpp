/**
 * @file test_pdf_signal_extractor.cpp
 * @brief Юнит-тесты разбора текста PDF
 */

#include <doctest/doctest.h>
#include "io/pdf_signal_extractor.hpp"
#include "model/config.hpp"
#include <algorithm>

using namespace strata::io;
using namespace strata::model;

namespace {

PdfSignalExtractor makeExtractor() {
    return PdfSignalExtractor(defaultMaterialVocabulary(), defaultUnitVocabulary());
}

TextItem item(std::string text, double x, double y, size_t page = 0) {
    TextItem t;
    t.text = std::move(text);
    t.x = x;
    t.y = y;
    t.width = 10.0 * static_cast<double>(t.text.size());
    t.height = 10.0;
    t.page = page;
    return t;
}

// Колонка подписей глубин слева, описания справа
PdfText boringLog() {
    PdfText text;
    text.page_count = 1;
    text.page_heights = {792.0};
    text.items = {
        item("0 ft", 50, 100), item("Topsoil", 150, 100),
        item("5 ft", 50, 150), item("Sandy clay", 150, 152),
        item("12 ft", 50, 200), item("Sand", 150, 201),
        item("20 ft", 50, 300)
    };
    return text;
}

} // namespace

TEST_CASE("matchDepthLabel recognizes depth label forms") {
    CHECK(*matchDepthLabel("10'") == doctest::Approx(10.0));
    CHECK(*matchDepthLabel("12 ft") == doctest::Approx(12.0));
    CHECK(*matchDepthLabel("40 meters") == doctest::Approx(40.0));
    CHECK(*matchDepthLabel("10-20 Clay") == doctest::Approx(10.0));
    CHECK(*matchDepthLabel("Depth: 12.5") == doctest::Approx(12.5));
    CHECK(*matchDepthLabel("7") == doctest::Approx(7.0));

    CHECK_FALSE(matchDepthLabel("Clay").has_value());
    CHECK_FALSE(matchDepthLabel("12000").has_value());
    CHECK_FALSE(matchDepthLabel("5 blows").has_value());
}

TEST_CASE("groupIntoLines joins items with close baselines") {
    const auto lines = groupIntoLines({
        item("Clay", 150, 102),
        item("5 ft", 50, 100),
        item("Sand", 150, 140),
        item("  ", 10, 140)
    }, 5.0);

    REQUIRE(lines.size() == 2);
    CHECK(lines[0].text == "5 ft Clay");
    CHECK(lines[0].items.size() == 2);
    CHECK(lines[1].text == "Sand");
}

TEST_CASE("extract correlates depth labels with nearest material") {
    const auto raw = makeExtractor().extract(boringLog());

    REQUIRE(raw.size() == 4);
    CHECK(raw.depths[0] == doctest::Approx(0.0));
    CHECK(raw.depths[3] == doctest::Approx(20.0));
    CHECK(*raw.materials[0] == "Topsoil");
    CHECK(*raw.materials[1] == "Sandy Clay");
    CHECK(*raw.materials[2] == "Sand");
    // Слишком далеко от любого описания
    CHECK_FALSE(raw.materials[3].has_value());
    REQUIRE(raw.depth_unit.has_value());
    CHECK(*raw.depth_unit == DepthUnit::Feet);
    CHECK(raw.structure.page_count == 1);
    CHECK(raw.structure.text_length > 0);
    CHECK(raw.kindAt(0) == SignalKind::TextOnly);
}

TEST_CASE("material regions strip leading depth text") {
    const auto extractor = makeExtractor();
    const auto lines = groupIntoLines({item("10-20 Silty sand", 50, 100), item("Notes", 50, 200)}, 5.0);

    const auto regions = extractor.identifyMaterialRegions(lines);
    REQUIRE(regions.size() == 1);
    CHECK(regions[0].material == "Silty Sand");
    CHECK(regions[0].original_text == "10-20 Silty sand");
    CHECK(regions[0].confidence > 0.0);
}

TEST_CASE("depth labels are sorted and deduplicated") {
    const auto extractor = makeExtractor();
    const auto lines = groupIntoLines({
        item("10 ft", 50, 300), item("0 ft", 50, 100), item("10'", 300, 300)
    }, 5.0);

    const auto labels = extractor.detectDepthLabels(lines);
    REQUIRE(labels.size() == 2);
    CHECK(labels[0].value == doctest::Approx(0.0));
    CHECK(labels[1].value == doctest::Approx(10.0));
}

TEST_CASE("unit detection counts mentions") {
    const auto extractor = makeExtractor();
    const auto metric = groupIntoLines({item("Depth (m)", 50, 50), item("3 m Clay", 50, 100)}, 5.0);
    REQUIRE(extractor.detectDepthUnit(metric).has_value());
    CHECK(*extractor.detectDepthUnit(metric) == DepthUnit::Meters);

    const auto none = groupIntoLines({item("Clay", 50, 50)}, 5.0);
    CHECK_FALSE(extractor.detectDepthUnit(none).has_value());
}

TEST_CASE("extract reports missing text, depths and materials") {
    const auto extractor = makeExtractor();

    PdfText empty;
    empty.page_count = 1;
    try {
        (void)extractor.extract(empty);
        FAIL("expected DocumentReadError");
    } catch (const DocumentReadError& e) {
        CHECK(e.code() == ErrorCode::NoTextContent);
    }

    PdfText no_depths;
    no_depths.page_count = 1;
    no_depths.items = {item("Clay", 50, 100), item("Sand", 50, 150)};
    try {
        (void)extractor.extract(no_depths);
        FAIL("expected DocumentReadError");
    } catch (const DocumentReadError& e) {
        CHECK(e.code() == ErrorCode::NoDepthValues);
    }

    PdfText no_materials;
    no_materials.page_count = 1;
    no_materials.items = {item("5 ft", 50, 100), item("10 ft", 50, 150)};
    try {
        (void)extractor.extract(no_materials);
        FAIL("expected DocumentReadError");
    } catch (const DocumentReadError& e) {
        CHECK(e.code() == ErrorCode::NoMaterials);
    }
}

TEST_CASE("per-page mode skips unreadable pages") {
    auto text = boringLog();
    text.page_count = 2;
    text.items.push_back(item("Notes", 50, 100, 1));

    PdfExtractionOptions options;
    options.per_page = true;
    const auto raw = makeExtractor().extract(text, options);

    CHECK(raw.size() == 4);
    REQUIRE(raw.warnings.size() == 1);
    CHECK(raw.warnings[0] == "Page 2 has no readable strata data");
    const auto& hints = raw.structure.format_hints;
    CHECK(std::find(hints.begin(), hints.end(), "page-by-page") != hints.end());
}
