/**
 * @file test_sheet_signal_extractor.cpp
 * @brief Юнит-тесты извлечения сигналов из табличного листа
 */

#include <doctest/doctest.h>
#include "io/csv_reader.hpp"
#include "io/sheet_signal_extractor.hpp"
#include "model/config.hpp"

using namespace strata::io;
using namespace strata::model;

namespace {

SheetSignalExtractor makeExtractor() {
    return SheetSignalExtractor(defaultMaterialVocabulary(), defaultUnitVocabulary());
}

Sheet sheetFromCsv(const std::string& content) {
    return parseCsvText(content, "Log").sheets.front();
}

} // namespace

TEST_CASE("detectDelimiter prefers a consistent separator") {
    CHECK(detectDelimiter({"Depth;Material", "0;Clay", "5;Sand"}) == ';');
    CHECK(detectDelimiter({"Depth\tMaterial", "0\tClay"}) == '\t');
    CHECK(detectDelimiter({"Depth,Material,Notes", "0,Clay,", "5,Sand,wet"}) == ',');
}

TEST_CASE("depth and material columns found by header") {
    const auto sheet = sheetFromCsv(
        "Boring B-1,,\n"
        "Depth (ft),Soil Type,Blow count\n"
        "0,sandy clay,5\n"
        "5,Sand,12\n"
        "10,Sand,15\n");
    const auto extractor = makeExtractor();

    const auto depth = extractor.findDepthColumn(sheet);
    REQUIRE(depth.has_value());
    CHECK(depth->index == 0);
    CHECK(depth->header == "Depth (ft)");
    REQUIRE(depth->header_row.has_value());
    CHECK(*depth->header_row == 1);

    const auto material = extractor.findMaterialColumn(sheet, depth->index);
    REQUIRE(material.has_value());
    CHECK(material->index == 1);

    const auto raw = extractor.extract(sheet);
    REQUIRE(raw.size() == 3);
    CHECK(raw.depths[1] == doctest::Approx(5.0));
    REQUIRE(raw.materials[0].has_value());
    CHECK(*raw.materials[0] == "Sandy Clay");
    REQUIRE(raw.depth_unit.has_value());
    CHECK(*raw.depth_unit == DepthUnit::Feet);
    CHECK(raw.structure.has_headers);
    CHECK(raw.structure.mapped_columns == 2);
    CHECK(raw.structure.sheet_name == "Log");
}

TEST_CASE("meter header sets the unit hint") {
    const auto raw = makeExtractor().extract(sheetFromCsv("Depth [m];Lithology\n0;Clay\n2;Silt\n"));
    REQUIRE(raw.depth_unit.has_value());
    CHECK(*raw.depth_unit == DepthUnit::Meters);
    CHECK(raw.size() == 2);
}

TEST_CASE("headerless sheet infers columns from values") {
    const auto sheet = sheetFromCsv(
        "0,Topsoil\n"
        "2,Clay\n"
        "4,Clay\n"
        "6,Sand\n"
        "8,Gravel\n");
    const auto extractor = makeExtractor();

    const auto depth = extractor.findDepthColumn(sheet);
    REQUIRE(depth.has_value());
    CHECK(depth->header == "Depth (inferred)");
    CHECK_FALSE(depth->header_row.has_value());

    const auto raw = extractor.extract(sheet);
    CHECK(raw.size() == 5);
    CHECK_FALSE(raw.structure.has_headers);
    CHECK_FALSE(raw.depth_unit.has_value());
}

TEST_CASE("rows without a depth are skipped") {
    const auto raw = makeExtractor().extract(sheetFromCsv(
        "Depth,Material\n"
        "0,Clay\n"
        ",note row\n"
        "5,Sand\n"));
    REQUIRE(raw.size() == 2);
    CHECK(raw.depths[1] == doctest::Approx(5.0));
}

TEST_CASE("missing columns raise typed document errors") {
    const auto extractor = makeExtractor();

    const auto no_depth = sheetFromCsv("Name,Material\nA,Clay\nB,Sand\n");
    CHECK_THROWS_AS((void)extractor.extract(no_depth), DocumentReadError);
    try {
        (void)extractor.extract(no_depth);
    } catch (const DocumentReadError& e) {
        CHECK(e.code() == ErrorCode::DepthColumnNotFound);
    }

    const auto no_material = sheetFromCsv("Depth,Value\n0,1\n5,2\n10,3\n");
    try {
        (void)extractor.extract(no_material);
        FAIL("expected DocumentReadError");
    } catch (const DocumentReadError& e) {
        CHECK(e.code() == ErrorCode::MaterialColumnNotFound);
    }

    const auto no_values = sheetFromCsv("Depth,Material\nn/a,Clay\n");
    try {
        (void)extractor.extract(no_values);
        FAIL("expected DocumentReadError");
    } catch (const DocumentReadError& e) {
        CHECK(e.code() == ErrorCode::NoDepthValues);
        CHECK(std::string(e.what()) == "No depth values found in sheet 'Log'");
    }
}

TEST_CASE("empty material column without colors is reported separately") {
    const auto sheet = sheetFromCsv("Depth,Material\n0,\n5,\n10,\n");
    const auto extractor = makeExtractor();
    REQUIRE(extractor.findMaterialColumn(sheet, 0).has_value());

    try {
        (void)extractor.extract(sheet);
        FAIL("expected DocumentReadError");
    } catch (const DocumentReadError& e) {
        CHECK(e.code() == ErrorCode::NoMaterials);
        CHECK(std::string(e.what()) == "No material descriptions found in sheet 'Log'");
    }

    SheetExtractionOptions relaxed;
    relaxed.relaxed = true;
    CHECK_THROWS_AS((void)extractor.extract(sheet, relaxed), DocumentReadError);
}

TEST_CASE("relaxed mode matches headers containing keywords") {
    const auto sheet = sheetFromCsv("Sample depth,Field description\n0,Clay\n5,Sand\n");
    const auto extractor = makeExtractor();

    CHECK_FALSE(extractor.findDepthColumn(sheet).has_value());

    SheetExtractionOptions relaxed;
    relaxed.relaxed = true;
    const auto depth = extractor.findDepthColumn(sheet, relaxed);
    REQUIRE(depth.has_value());
    CHECK(depth->index == 0);
    CHECK(depth->header_row.has_value());

    const auto raw = extractor.extract(sheet, relaxed);
    CHECK(raw.size() == 2);
}

TEST_CASE("fill colors are carried into the signal") {
    Sheet sheet;
    sheet.name = "Colors";
    auto cell = [](std::string text, std::optional<double> number, std::optional<std::string> color) {
        SheetCell c;
        c.text = std::move(text);
        c.number = number;
        c.fill_color = std::move(color);
        return c;
    };
    sheet.rows = {
        {cell("Depth", std::nullopt, std::nullopt), cell("Material", std::nullopt, std::nullopt)},
        {cell("0", 0.0, std::nullopt), cell("Clay", std::nullopt, std::string("#8B4513"))},
        {cell("5", 5.0, std::nullopt), cell("", std::nullopt, std::string("#FFFF00"))}
    };

    const auto raw = makeExtractor().extract(sheet);
    REQUIRE(raw.size() == 2);
    CHECK(raw.kindAt(0) == SignalKind::Both);
    CHECK(raw.kindAt(1) == SignalKind::ColorOnly);
    CHECK(raw.structure.mapped_columns == 3);
}

TEST_CASE("depthFromCell reads leading numbers") {
    SheetCell numeric;
    numeric.number = 7.5;
    CHECK(*depthFromCell(numeric) == doctest::Approx(7.5));

    SheetCell text;
    text.text = "12.5 ft";
    CHECK(*depthFromCell(text) == doctest::Approx(12.5));

    SheetCell comma;
    comma.text = "3,25";
    CHECK(*depthFromCell(comma) == doctest::Approx(3.25));

    SheetCell words;
    words.text = "bottom";
    CHECK_FALSE(depthFromCell(words).has_value());
}
