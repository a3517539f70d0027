/**
 * @file xls_reader.cpp
 * @brief Реализация чтения .xls через libxls
 * @author Yan Bubenok <yan@bubenok.com>
 */

#include "xls_reader.hpp"
#include "text_utils.hpp"
#include <xls.h>
#include <spdlog/spdlog.h>
#include <array>
#include <cmath>
#include <iomanip>
#include <memory>
#include <sstream>

namespace strata::io {

using model::ErrorCode;

namespace {

struct XlsWorkbookCloser {
    void operator()(xls::xlsWorkBook* wb) const {
        if (wb) xls::xls_close_WB(wb);
    }
};

struct XlsWorksheetCloser {
    void operator()(xls::xlsWorkSheet* ws) const {
        if (ws) xls::xls_close_WS(ws);
    }
};

// Стандартная палитра BIFF8, индексы 8-63; 0-7 совпадают с 8-15
constexpr std::array<uint32_t, 56> kDefaultPalette = {
    0x000000, 0xFFFFFF, 0xFF0000, 0x00FF00, 0x0000FF, 0xFFFF00, 0xFF00FF, 0x00FFFF,
    0x800000, 0x008000, 0x000080, 0x808000, 0x800080, 0x008080, 0xC0C0C0, 0x808080,
    0x9999FF, 0x993366, 0xFFFFCC, 0xCCFFFF, 0x660066, 0xFF8080, 0x0066CC, 0xCCCCFF,
    0x000080, 0xFF00FF, 0xFFFF00, 0x00FFFF, 0x800080, 0x800000, 0x008080, 0x0000FF,
    0x00CCFF, 0xCCFFFF, 0xCCFFCC, 0xFFFF99, 0x99CCFF, 0xFF99CC, 0xCC99FF, 0xFFCC99,
    0x3366FF, 0x33CCCC, 0x99CC00, 0xFFCC00, 0xFF9900, 0xFF6600, 0x666699, 0x969696,
    0x003366, 0x339966, 0x003300, 0x333300, 0x993300, 0x993366, 0x333399, 0x333333
};

std::optional<std::string> cellFill(const xls::xlsWorkBook* wb, const xls::xlsCell* cell) {
    if (!wb || !cell || cell->xf >= wb->xfs.count) {
        return std::nullopt;
    }
    const auto& xf = wb->xfs.xf[cell->xf];
    return xlsFillColor(xf.linecolor, xf.groundcolor);
}

SheetCell toSheetCell(const xls::xlsWorkBook* wb, const xls::xlsCell* cell) {
    SheetCell result;
    if (!cell) return result;
    result.fill_color = cellFill(wb, cell);

    switch (cell->id) {
        case XLS_RECORD_NUMBER:
        case XLS_RECORD_RK:
        case XLS_RECORD_FORMULA:
        case XLS_RECORD_FORMULA_ALT:
            // У формул со строковым результатом str заполнен
            if (cell->str == nullptr && std::isfinite(cell->d)) {
                result.number = cell->d;
                std::ostringstream oss;
                oss << std::setprecision(15) << cell->d;
                result.text = oss.str();
                return result;
            }
            break;
        case XLS_RECORD_BOOLERR:
            result.text = cell->d != 0.0 ? "TRUE" : "FALSE";
            return result;
        default:
            break;
    }

    if (cell->str) {
        result.text = trim(cell->str);
        const double value = parseDouble(result.text);
        if (!std::isnan(value)) {
            result.number = value;
        }
    }
    return result;
}

} // anonymous namespace

std::optional<std::string> xlsFillColor(uint32_t linecolor, uint16_t groundcolor) {
    const uint32_t pattern = (linecolor >> 26) & 0x3F;
    if (pattern == 0) {
        return std::nullopt;
    }

    uint32_t index = groundcolor & 0x7F;
    if (index < 8) {
        index += 8;
    }
    // 64 и выше: системные цвета окна, не заливка
    if (index >= 8 + kDefaultPalette.size()) {
        return std::nullopt;
    }

    std::ostringstream oss;
    oss << '#' << std::uppercase << std::hex << std::setw(6) << std::setfill('0')
        << kDefaultPalette[index - 8];
    return oss.str();
}

Workbook readXlsWorkbook(const std::filesystem::path& path) {
    xls::xls_error_t err = xls::LIBXLS_OK;
    std::unique_ptr<xls::xlsWorkBook, XlsWorkbookCloser> wb(
        xls::xls_open_file(path.string().c_str(), "UTF-8", &err));
    if (!wb) {
        throw DocumentReadError(ErrorCode::FileCorrupted,
            "Cannot read file: " + path.string() + " (" + xls::xls_getError(err) + ")");
    }

    Workbook workbook;
    for (xls::DWORD i = 0; i < wb->sheets.count; ++i) {
        std::unique_ptr<xls::xlsWorkSheet, XlsWorksheetCloser> ws(
            xls::xls_getWorkSheet(wb.get(), static_cast<int>(i)));
        if (!ws) continue;
        if (xls::xls_parseWorkSheet(ws.get()) != xls::LIBXLS_OK) {
            spdlog::warn("XLS: sheet {} could not be parsed, skipped", i);
            continue;
        }

        Sheet sheet;
        if (wb->sheets.sheet[i].name) {
            sheet.name = wb->sheets.sheet[i].name;
        }

        const int last_row = ws->rows.lastrow;
        const int last_col = ws->rows.lastcol;
        for (int r = 0; r <= last_row; ++r) {
            SheetRow row;
            for (int c = 0; c <= last_col; ++c) {
                row.push_back(toSheetCell(wb.get(),
                    xls::xls_cell(ws.get(), static_cast<xls::WORD>(r), static_cast<xls::WORD>(c))));
            }
            while (!row.empty() && row.back().empty() && !row.back().fill_color.has_value()) {
                row.pop_back();
            }
            sheet.rows.push_back(std::move(row));
        }
        workbook.sheets.push_back(std::move(sheet));
    }

    if (workbook.sheets.empty()) {
        throw DocumentReadError(ErrorCode::NoSheets, "Workbook contains no sheets");
    }
    spdlog::debug("XLS: {} sheets", workbook.sheets.size());
    return workbook;
}

} // namespace strata::io
