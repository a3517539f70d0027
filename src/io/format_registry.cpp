/**
 * @file format_registry.cpp
 * @brief Реализация реестра форматов
 * @author Yan Bubenok <yan@bubenok.com>
 */

#include "format_registry.hpp"
#include "csv_reader.hpp"
#include "pdf_reader.hpp"
#include "text_utils.hpp"
#include "xls_reader.hpp"
#include "xlsx_reader.hpp"
#include "zip_archive.hpp"
#include <fstream>

namespace strata::io {

using model::ErrorCode;
using model::FileType;

namespace {

// Сигнатура составного документа OLE2 (контейнер .xls)
bool hasOleSignature(const std::filesystem::path& path) noexcept {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return false;
    }
    unsigned char header[8] = {};
    file.read(reinterpret_cast<char*>(header), sizeof(header));
    if (file.gcount() != static_cast<std::streamsize>(sizeof(header))) {
        return false;
    }
    const unsigned char ole[8] = {0xD0, 0xCF, 0x11, 0xE0, 0xA1, 0xB1, 0x1A, 0xE1};
    for (size_t i = 0; i < sizeof(header); ++i) {
        if (header[i] != ole[i]) return false;
    }
    return true;
}

} // anonymous namespace

std::string_view getFormatName(SourceFormat format) noexcept {
    switch (format) {
        case SourceFormat::CSV: return "CSV (text with delimiters)";
        case SourceFormat::XLSX: return "Excel workbook (Office Open XML)";
        case SourceFormat::XLS: return "Excel 97-2003 workbook";
        case SourceFormat::PDF: return "PDF document";
        case SourceFormat::Unknown:
        default: return "Unknown format";
    }
}

std::vector<std::string> getFormatExtensions(SourceFormat format) {
    switch (format) {
        case SourceFormat::CSV:
            return {".csv"};
        case SourceFormat::XLSX:
            return {".xlsx"};
        case SourceFormat::XLS:
            return {".xls"};
        case SourceFormat::PDF:
            return {".pdf"};
        case SourceFormat::Unknown:
        default:
            return {};
    }
}

std::optional<FileType> fileTypeOf(SourceFormat format) noexcept {
    switch (format) {
        case SourceFormat::CSV:
        case SourceFormat::XLSX:
        case SourceFormat::XLS:
            return FileType::Excel;
        case SourceFormat::PDF:
            return FileType::Pdf;
        case SourceFormat::Unknown:
        default:
            return std::nullopt;
    }
}

SourceFormat formatFromExtension(const std::filesystem::path& path) {
    const std::string ext = toLower(path.extension().string());
    for (auto format : {SourceFormat::XLSX, SourceFormat::XLS, SourceFormat::CSV, SourceFormat::PDF}) {
        for (const auto& candidate : getFormatExtensions(format)) {
            if (ext == candidate) {
                return format;
            }
        }
    }
    return SourceFormat::Unknown;
}

std::optional<FileType> detectFileType(const std::filesystem::path& path) {
    return fileTypeOf(formatFromExtension(path));
}

std::map<FileType, std::vector<std::string>> getSupportedFileTypes() {
    std::map<FileType, std::vector<std::string>> types;
    for (auto format : {SourceFormat::XLSX, SourceFormat::XLS, SourceFormat::CSV, SourceFormat::PDF}) {
        auto& extensions = types[*fileTypeOf(format)];
        for (const auto& ext : getFormatExtensions(format)) {
            extensions.push_back(ext);
        }
    }
    return types;
}

bool isFileSupported(const std::filesystem::path& path) {
    return detectFileType(path).has_value();
}

DetectionInfo detectFormat(const std::filesystem::path& path) {
    DetectionInfo info;

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        info.error_message = "File not found: " + path.string();
        return info;
    }

    const SourceFormat by_extension = formatFromExtension(path);
    if (by_extension == SourceFormat::Unknown) {
        info.error_message = "Unsupported file type: " + path.string();
        return info;
    }

    info.result = FormatDetectionResult::Detected;
    info.format = by_extension;

    // Расширение подтверждается содержимым
    switch (by_extension) {
        case SourceFormat::XLSX:
            info.confidence = hasZipSignature(path) ? 1.0 : 0.3;
            break;
        case SourceFormat::XLS:
            info.confidence = hasOleSignature(path) ? 1.0 : 0.3;
            break;
        case SourceFormat::PDF:
            info.confidence = hasPdfSignature(path) ? 1.0 : 0.3;
            break;
        case SourceFormat::CSV:
            info.confidence = canReadCsv(path) ? 0.9 : 0.3;
            break;
        case SourceFormat::Unknown:
        default:
            break;
    }
    return info;
}

Workbook readWorkbook(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        throw DocumentReadError(ErrorCode::FileNotFound, "Cannot read file: " + path.string());
    }

    switch (formatFromExtension(path)) {
        case SourceFormat::CSV:
            return readCsvWorkbook(path);

        case SourceFormat::XLSX:
            return readXlsxWorkbook(path);

        case SourceFormat::XLS:
            // Иногда .xls на деле оказывается .xlsx или CSV
            if (hasZipSignature(path)) {
                return readXlsxWorkbook(path);
            }
            if (!hasOleSignature(path) && canReadCsv(path)) {
                return readCsvWorkbook(path);
            }
            return readXlsWorkbook(path);

        case SourceFormat::PDF:
        case SourceFormat::Unknown:
        default:
            throw DocumentReadError(ErrorCode::InvalidFileFormat,
                "Invalid file format: " + path.filename().string() + " is not a spreadsheet");
    }
}

} // namespace strata::io
