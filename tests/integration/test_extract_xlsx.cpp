/**
 * @file test_extract_xlsx.cpp
 * @brief Интеграционные тесты: чтение .xlsx и извлечение разреза
 */

#include <doctest/doctest.h>
#include "core/strata_extractor.hpp"
#include "io/xlsx_reader.hpp"
#include "io/zip_archive.hpp"
#include <miniz.h>
#include <filesystem>
#include <fstream>
#include <string>
#include <utility>
#include <vector>

using namespace strata::core;
using namespace strata::model;
using strata::io::ZipArchive;

namespace {

// ZIP-контейнер в памяти через писатель miniz (deflate)
std::vector<uint8_t> buildZip(const std::vector<std::pair<std::string, std::string>>& parts) {
    mz_zip_archive zip{};
    REQUIRE(mz_zip_writer_init_heap(&zip, 0, 0));
    for (const auto& [name, data] : parts) {
        REQUIRE(mz_zip_writer_add_mem(&zip, name.c_str(), data.data(), data.size(),
                                      MZ_DEFAULT_COMPRESSION));
    }
    void* buffer = nullptr;
    size_t size = 0;
    REQUIRE(mz_zip_writer_finalize_heap_archive(&zip, &buffer, &size));
    const auto* begin = static_cast<const uint8_t*>(buffer);
    std::vector<uint8_t> out(begin, begin + size);
    mz_free(buffer);
    mz_zip_writer_end(&zip);
    return out;
}

std::string inlineCell(const std::string& ref, const std::string& text, int style = 0) {
    std::string cell = "<c r=\"" + ref + "\" t=\"inlineStr\"";
    if (style > 0) cell += " s=\"" + std::to_string(style) + "\"";
    return cell + "><is><t>" + text + "</t></is></c>";
}

std::string numberCell(const std::string& ref, const std::string& value) {
    return "<c r=\"" + ref + "\"><v>" + value + "</v></c>";
}

std::string worksheet(const std::vector<std::string>& rows) {
    std::string xml = "<?xml version=\"1.0\" encoding=\"UTF-8\"?>"
        "<worksheet xmlns=\"http://schemas.openxmlformats.org/spreadsheetml/2006/main\"><sheetData>";
    for (size_t i = 0; i < rows.size(); ++i) {
        xml += "<row r=\"" + std::to_string(i + 1) + "\">" + rows[i] + "</row>";
    }
    return xml + "</sheetData></worksheet>";
}

std::string workbookXml(const std::vector<std::string>& sheet_names) {
    std::string xml = "<?xml version=\"1.0\" encoding=\"UTF-8\"?>"
        "<workbook xmlns=\"http://schemas.openxmlformats.org/spreadsheetml/2006/main\" "
        "xmlns:r=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships\"><sheets>";
    for (size_t i = 0; i < sheet_names.size(); ++i) {
        const auto n = std::to_string(i + 1);
        xml += "<sheet name=\"" + sheet_names[i] + "\" sheetId=\"" + n + "\" r:id=\"rId" + n + "\"/>";
    }
    return xml + "</sheets></workbook>";
}

// Стиль 1: коричневая заливка, стиль 2: жёлтая
const std::string kStyles =
    "<?xml version=\"1.0\" encoding=\"UTF-8\"?>"
    "<styleSheet xmlns=\"http://schemas.openxmlformats.org/spreadsheetml/2006/main\">"
    "<fills count=\"4\">"
    "<fill><patternFill patternType=\"none\"/></fill>"
    "<fill><patternFill patternType=\"gray125\"/></fill>"
    "<fill><patternFill patternType=\"solid\"><fgColor rgb=\"FF8B4513\"/></patternFill></fill>"
    "<fill><patternFill patternType=\"solid\"><fgColor rgb=\"FFFFFF00\"/></patternFill></fill>"
    "</fills>"
    "<cellXfs count=\"3\"><xf fillId=\"0\"/><xf fillId=\"2\"/><xf fillId=\"3\"/></cellXfs>"
    "</styleSheet>";

std::string strataSheet() {
    return worksheet({
        inlineCell("A1", "Depth (ft)") + inlineCell("B1", "Material"),
        numberCell("A2", "0") + inlineCell("B2", "Clay", 1),
        numberCell("A3", "5") + inlineCell("B3", "Clay", 1),
        numberCell("A4", "10") + inlineCell("B4", "Sand", 2),
        numberCell("A5", "15") + inlineCell("B5", "Sand", 2),
        numberCell("A6", "20")
    });
}

std::filesystem::path writeTempFile(const std::string& name, const std::vector<uint8_t>& bytes) {
    const auto dir = std::filesystem::temp_directory_path() / "strata_extract_xlsx";
    std::filesystem::create_directories(dir);
    const auto path = dir / name;
    std::ofstream out(path, std::ios::binary);
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    return path;
}

void removeTempDir() {
    std::error_code ec;
    std::filesystem::remove_all(std::filesystem::temp_directory_path() / "strata_extract_xlsx", ec);
}

} // namespace

TEST_CASE("columnIndexFromRef converts cell references") {
    CHECK(*strata::io::columnIndexFromRef("A1") == 0);
    CHECK(*strata::io::columnIndexFromRef("B12") == 1);
    CHECK(*strata::io::columnIndexFromRef("AA3") == 26);
    CHECK_FALSE(strata::io::columnIndexFromRef("12").has_value());
    CHECK(*strata::io::columnIndexFromRef("XFD1") == 16383);
    CHECK_FALSE(strata::io::columnIndexFromRef("ABCD1").has_value());
}

TEST_CASE("far-away cell references are skipped instead of allocated") {
    const auto sheet_xml = worksheet({
        inlineCell("A1", "Depth") + inlineCell("B1", "Material"),
        numberCell("A2", "0") + inlineCell("B2", "Clay") + numberCell("XFD2", "1")
    });
    // Строка с номером за пределом листа
    const auto far_row = sheet_xml.substr(0, sheet_xml.find("</sheetData>")) +
        "<row r=\"1048576\">" + numberCell("A1048576", "5") + "</row></sheetData></worksheet>";

    const ZipArchive archive(buildZip({
        {"xl/workbook.xml", workbookXml({"Log"})},
        {"xl/worksheets/sheet1.xml", far_row}
    }));

    const auto workbook = strata::io::readXlsxWorkbook(archive);
    REQUIRE(workbook.sheets.size() == 1);
    const auto& rows = workbook.sheets[0].rows;
    REQUIRE(rows.size() == 2);
    CHECK(rows[1].size() == 2);
    CHECK(rows[1][1].text == "Clay");
}

TEST_CASE("workbook is read from a deflated ZIP archive") {
    const ZipArchive archive(buildZip({
        {"xl/workbook.xml", workbookXml({"Boring B-1"})},
        {"xl/styles.xml", kStyles},
        {"xl/worksheets/sheet1.xml", strataSheet()}
    }));

    CHECK(archive.entries().size() == 3);
    CHECK(archive.contains("xl/styles.xml"));
    CHECK_FALSE(archive.contains("xl/sharedStrings.xml"));
    CHECK_THROWS_AS((void)archive.read("xl/sharedStrings.xml"), strata::io::DocumentReadError);

    const auto workbook = strata::io::readXlsxWorkbook(archive);
    REQUIRE(workbook.sheets.size() == 1);
    const auto& sheet = workbook.sheets[0];
    CHECK(sheet.name == "Boring B-1");
    REQUIRE(sheet.rows.size() == 6);
    CHECK(sheet.rows[0][0].text == "Depth (ft)");
    REQUIRE(sheet.rows[2][0].number.has_value());
    CHECK(*sheet.rows[2][0].number == doctest::Approx(5.0));
    REQUIRE(sheet.rows[1][1].fill_color.has_value());
    CHECK(*sheet.rows[1][1].fill_color == "#8B4513");
    CHECK(*sheet.rows[3][1].fill_color == "#FFFF00");
    CHECK_FALSE(sheet.rows[1][0].fill_color.has_value());
}

TEST_CASE("broken archives raise document errors") {
    CHECK_THROWS_AS(ZipArchive(std::vector<uint8_t>{'P', 'K'}), strata::io::DocumentReadError);

    // Обрезанный архив: центральный каталог потерян
    auto truncated = buildZip({{"xl/workbook.xml", workbookXml({"Log"})}});
    truncated.resize(truncated.size() / 2);
    CHECK_THROWS_AS(ZipArchive(std::move(truncated)), strata::io::DocumentReadError);

    const ZipArchive no_workbook(buildZip({{"docProps/app.xml", "<Properties/>"}}));
    try {
        (void)strata::io::readXlsxWorkbook(no_workbook);
        FAIL("expected DocumentReadError");
    } catch (const strata::io::DocumentReadError& e) {
        CHECK(e.code() == ErrorCode::InvalidFileFormat);
    }
}

TEST_CASE("xlsx file is extracted with fill colors") {
    const auto path = writeTempFile("boring.xlsx", buildZip({
        {"xl/workbook.xml", workbookXml({"Log"})},
        {"xl/styles.xml", kStyles},
        {"xl/worksheets/sheet1.xml", strataSheet()}
    }));

    StrataExtractor extractor;
    const auto result = extractor.extractFromFile(path);

    REQUIRE(result.data.has_value());
    const auto& layers = *result.data;
    REQUIRE(layers.size() == 2);
    CHECK(layers[0].material == "Clay");
    CHECK(layers[0].end_depth.value == doctest::Approx(10.0));
    CHECK(layers[0].confidence == ConfidenceLevel::High);
    REQUIRE(layers[0].original_color.has_value());
    CHECK(*layers[0].original_color == "#8B4513");
    CHECK(layers[1].material == "Sand");
    CHECK(layers[1].end_depth.value == doctest::Approx(20.0));
    CHECK(result.metadata.file_type == FileType::Excel);
    CHECK(result.metadata.extraction_attempts[0].status == AttemptStatus::Success);

    removeTempDir();
}

TEST_CASE("data on the second sheet is found by the alternative strategy") {
    const auto notes = worksheet({
        inlineCell("A1", "Project") + inlineCell("B1", "Client"),
        inlineCell("A2", "Site 7") + inlineCell("B2", "City")
    });
    const auto path = writeTempFile("two_sheets.xlsx", buildZip({
        {"xl/workbook.xml", workbookXml({"Notes", "Log"})},
        {"xl/styles.xml", kStyles},
        {"xl/worksheets/sheet1.xml", notes},
        {"xl/worksheets/sheet2.xml", strataSheet()}
    }));

    StrataExtractor extractor;
    const auto result = extractor.extractFromFile(path);

    const auto& attempts = result.metadata.extraction_attempts;
    REQUIRE(attempts.size() == 2);
    CHECK(attempts[0].method == "primary_excel");
    CHECK(attempts[0].status == AttemptStatus::Failed);
    REQUIRE(attempts[0].error.has_value());
    CHECK(attempts[1].method == "alternative_sheet");
    CHECK(attempts[1].status == AttemptStatus::Success);
    REQUIRE(result.data.has_value());
    CHECK(result.data->size() == 2);

    removeTempDir();
}
