/**
 * @file test_csv_reader.cpp
 * @brief Юнит-тесты чтения CSV: кодировка и разделитель
 */

#include <doctest/doctest.h>
#include "io/csv_reader.hpp"
#include <filesystem>

using namespace strata::io;

namespace {

std::filesystem::path makeSourcePath(const std::string& relative) {
    return std::filesystem::path(STRATA_SOURCE_DIR) / relative;
}

} // namespace

TEST_CASE("CP1251 boring log is decoded to UTF-8") {
    const auto workbook = readCsvWorkbook(makeSourcePath("tests/fixtures/strata_cp1251.csv"));

    REQUIRE(workbook.sheets.size() == 1);
    const auto& rows = workbook.sheets[0].rows;
    REQUIRE(rows.size() == 4);
    REQUIRE(rows[0].size() == 3);
    CHECK(rows[0][1].text == "Material");
    CHECK(rows[0][2].text == "\xD0\x9E\xD0\xBF\xD0\xB8\xD1\x81\xD0\xB0\xD0\xBD\xD0\xB8\xD0\xB5");  // Описание
    CHECK(rows[1][2].text == "\xD0\x93\xD0\xBB\xD0\xB8\xD0\xBD\xD0\xB0");  // Глина
    REQUIRE(rows[2][0].number.has_value());
    CHECK(*rows[2][0].number == doctest::Approx(5.0));
}

TEST_CASE("encoding detection distinguishes UTF-8 and CP1251") {
    CHECK(detectEncoding("Depth,Material\n0,Clay\n") == "UTF-8");
    CHECK(detectEncoding("\xEF\xBB\xBF" "Depth") == "UTF-8");
    CHECK(detectEncoding("\xD0\x93\xD0\xBB\xD0\xB8\xD0\xBD\xD0\xB0") == "UTF-8");
    CHECK(detectEncoding("\xC3\xEB\xE8\xED\xE0;0") == "CP1251");
}

TEST_CASE("CP1251 conversion keeps ASCII and maps Cyrillic") {
    CHECK(convertCp1251ToUtf8("Clay 5") == "Clay 5");
    CHECK(convertCp1251ToUtf8("\xCF\xE5\xF1\xEE\xEA") == "\xD0\x9F\xD0\xB5\xD1\x81\xD0\xBE\xD0\xBA");  // Песок
    CHECK(convertCp1251ToUtf8("\xB9") == "\xE2\x84\x96");  // №
    CHECK(convertCp1251ToUtf8("\x98") == "?");
}

TEST_CASE("explicit encoding overrides detection") {
    CsvReadOptions options;
    options.encoding = "UTF-8";
    const auto workbook = parseCsvText("Depth;Note\n0;\xC3\xEB\xE8\xED\xE0\n", "log", options);
    REQUIRE(workbook.sheets[0].rows.size() == 2);
    CHECK(workbook.sheets[0].rows[1][1].text == "\xC3\xEB\xE8\xED\xE0");
}
