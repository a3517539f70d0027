/**
 * @file csv_reader.cpp
 * @brief Реализация чтения CSV-таблиц разреза
 * @author Yan Bubenok <yan@bubenok.com>
 */

#include "csv_reader.hpp"
#include "text_utils.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <array>
#include <cmath>
#include <fstream>
#include <sstream>

namespace strata::io {

using model::ErrorCode;

namespace {

std::vector<std::string> splitLine(std::string_view line, char delimiter) {
    std::vector<std::string> result;
    std::string current;
    bool in_quotes = false;

    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];

        if (c == '"') {
            // Удвоенная кавычка внутри поля
            if (in_quotes && i + 1 < line.size() && line[i + 1] == '"') {
                current += '"';
                ++i;
            } else {
                in_quotes = !in_quotes;
            }
        } else if (c == delimiter && !in_quotes) {
            result.push_back(trim(current));
            current.clear();
        } else {
            current += c;
        }
    }

    result.push_back(trim(current));
    return result;
}

SheetCell makeCell(const std::string& field) {
    SheetCell cell;
    cell.text = field;
    double value = parseDouble(field);
    if (!std::isnan(value)) {
        cell.number = value;
    }
    return cell;
}

constexpr size_t kEncodingProbeSize = 1024;

// CP1251 -> UTF-8 для байтов 0x80-0xFF (0x98 не определён)
constexpr std::array<const char*, 128> kCp1251ToUtf8 = {
    "\xD0\x82", "\xD0\x83", "\xE2\x80\x9A", "\xD1\x93", "\xE2\x80\x9E", "\xE2\x80\xA6", "\xE2\x80\xA0", "\xE2\x80\xA1",
    "\xE2\x82\xAC", "\xE2\x80\xB0", "\xD0\x89", "\xE2\x80\xB9", "\xD0\x8A", "\xD0\x8C", "\xD0\x8B", "\xD0\x8F",
    "\xD1\x92", "\xE2\x80\x98", "\xE2\x80\x99", "\xE2\x80\x9C", "\xE2\x80\x9D", "\xE2\x80\xA2", "\xE2\x80\x93", "\xE2\x80\x94",
    nullptr, "\xE2\x84\xA2", "\xD1\x99", "\xE2\x80\xBA", "\xD1\x9A", "\xD1\x9C", "\xD1\x9B", "\xD1\x9F",
    "\xC2\xA0", "\xD0\x8E", "\xD1\x9E", "\xD0\x88", "\xC2\xA4", "\xD2\x90", "\xC2\xA6", "\xC2\xA7",
    "\xD0\x81", "\xC2\xA9", "\xD0\x84", "\xC2\xAB", "\xC2\xAC", "\xC2\xAD", "\xC2\xAE", "\xD0\x87",
    "\xC2\xB0", "\xC2\xB1", "\xD0\x86", "\xD1\x96", "\xD2\x91", "\xC2\xB5", "\xC2\xB6", "\xC2\xB7",
    "\xD1\x91", "\xE2\x84\x96", "\xD1\x94", "\xC2\xBB", "\xD1\x98", "\xD0\x85", "\xD1\x95", "\xD1\x97",
    "\xD0\x90", "\xD0\x91", "\xD0\x92", "\xD0\x93", "\xD0\x94", "\xD0\x95", "\xD0\x96", "\xD0\x97",
    "\xD0\x98", "\xD0\x99", "\xD0\x9A", "\xD0\x9B", "\xD0\x9C", "\xD0\x9D", "\xD0\x9E", "\xD0\x9F",
    "\xD0\xA0", "\xD0\xA1", "\xD0\xA2", "\xD0\xA3", "\xD0\xA4", "\xD0\xA5", "\xD0\xA6", "\xD0\xA7",
    "\xD0\xA8", "\xD0\xA9", "\xD0\xAA", "\xD0\xAB", "\xD0\xAC", "\xD0\xAD", "\xD0\xAE", "\xD0\xAF",
    "\xD0\xB0", "\xD0\xB1", "\xD0\xB2", "\xD0\xB3", "\xD0\xB4", "\xD0\xB5", "\xD0\xB6", "\xD0\xB7",
    "\xD0\xB8", "\xD0\xB9", "\xD0\xBA", "\xD0\xBB", "\xD0\xBC", "\xD0\xBD", "\xD0\xBE", "\xD0\xBF",
    "\xD1\x80", "\xD1\x81", "\xD1\x82", "\xD1\x83", "\xD1\x84", "\xD1\x85", "\xD1\x86", "\xD1\x87",
    "\xD1\x88", "\xD1\x89", "\xD1\x8A", "\xD1\x8B", "\xD1\x8C", "\xD1\x8D", "\xD1\x8E", "\xD1\x8F"
};

} // anonymous namespace

std::string convertCp1251ToUtf8(std::string_view input) {
    std::string result;
    result.reserve(input.size() * 2);

    for (char ch : input) {
        const auto c = static_cast<unsigned char>(ch);
        if (c < 0x80) {
            result += ch;
        } else if (const char* utf8 = kCp1251ToUtf8[c - 0x80]) {
            result += utf8;
        } else {
            result += '?';
        }
    }

    return result;
}

std::string detectEncoding(std::string_view content) {
    const size_t size = std::min(content.size(), kEncodingProbeSize);
    const auto byte = [&content](size_t i) { return static_cast<unsigned char>(content[i]); };

    if (size >= 3 && byte(0) == 0xEF && byte(1) == 0xBB && byte(2) == 0xBF) {
        return "UTF-8";
    }

    int utf8_sequences = 0;
    int cp1251_chars = 0;
    int invalid_utf8 = 0;

    for (size_t i = 0; i < size; ++i) {
        const unsigned char c = byte(i);
        if (c < 0x80) {
            continue;
        }

        if ((c & 0xE0) == 0xC0 && i + 1 < size) {
            if ((byte(i + 1) & 0xC0) == 0x80) {
                ++utf8_sequences;
                ++i;
                continue;
            }
        } else if ((c & 0xF0) == 0xE0 && i + 2 < size) {
            if ((byte(i + 1) & 0xC0) == 0x80 && (byte(i + 2) & 0xC0) == 0x80) {
                ++utf8_sequences;
                i += 2;
                continue;
            }
        }

        // Кириллица CP1251 лежит в 0xC0-0xFF
        if (c >= 0xC0) {
            ++cp1251_chars;
        } else {
            ++invalid_utf8;
        }
    }

    if (utf8_sequences > 0 && invalid_utf8 == 0) {
        return "UTF-8";
    }
    if (cp1251_chars > utf8_sequences) {
        return "CP1251";
    }
    return "UTF-8";
}

char detectDelimiter(const std::vector<std::string>& lines) {
    std::array<char, 4> candidates = {',', ';', '\t', '|'};
    std::array<int, 4> counts = {0, 0, 0, 0};

    for (const auto& line : lines) {
        for (size_t i = 0; i < candidates.size(); ++i) {
            counts[i] += static_cast<int>(std::count(line.begin(), line.end(), candidates[i]));
        }
    }

    // Предпочитаем разделитель, встречающийся одинаковое число раз в каждой строке
    for (size_t i = 0; i < candidates.size(); ++i) {
        if (counts[i] == 0) continue;

        int expected_count = -1;
        bool consistent = true;
        for (const auto& line : lines) {
            int count = static_cast<int>(std::count(line.begin(), line.end(), candidates[i]));
            if (expected_count < 0) {
                expected_count = count;
            } else if (count != expected_count) {
                consistent = false;
                break;
            }
        }

        if (consistent && expected_count > 0) {
            return candidates[i];
        }
    }

    // Иначе самый частый
    size_t best = 0;
    for (size_t i = 1; i < candidates.size(); ++i) {
        if (counts[i] > counts[best]) {
            best = i;
        }
    }

    return candidates[best];
}

Workbook parseCsvText(
    const std::string& content,
    const std::string& sheet_name,
    const CsvReadOptions& options
) {
    const std::string encoding = options.encoding.value_or(detectEncoding(content));
    std::string decoded;
    if (encoding == "CP1251") {
        decoded = convertCp1251ToUtf8(content);
        spdlog::debug("CSV '{}': CP1251 converted to UTF-8", sheet_name);
    }
    const std::string& text = encoding == "CP1251" ? decoded : content;

    std::vector<std::string> lines;
    std::istringstream stream(text);
    std::string line;
    size_t line_number = 0;
    while (std::getline(stream, line)) {
        ++line_number;
        if (line_number <= options.skip_lines) continue;
        if (line_number == 1) {
            line = stripBom(line);
        }
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(line);
    }

    // Пустые строки в конце не нужны
    while (!lines.empty() && trim(lines.back()).empty()) {
        lines.pop_back();
    }

    if (lines.empty()) {
        throw DocumentReadError(ErrorCode::InsufficientData, "No data found in CSV file");
    }

    std::vector<std::string> sample;
    for (const auto& l : lines) {
        if (!trim(l).empty()) sample.push_back(l);
        if (sample.size() >= 20) break;
    }
    const char delimiter = options.delimiter.value_or(detectDelimiter(sample));

    Sheet sheet;
    sheet.name = sheet_name;
    sheet.rows.reserve(lines.size());
    for (const auto& l : lines) {
        SheetRow row;
        if (!trim(l).empty()) {
            for (const auto& field : splitLine(l, delimiter)) {
                row.push_back(makeCell(field));
            }
        }
        sheet.rows.push_back(std::move(row));
    }

    spdlog::debug("CSV '{}': {} rows, delimiter '{}'", sheet_name, sheet.rows.size(),
                  delimiter == '\t' ? std::string("\\t") : std::string(1, delimiter));

    Workbook workbook;
    workbook.sheets.push_back(std::move(sheet));
    return workbook;
}

Workbook readCsvWorkbook(
    const std::filesystem::path& path,
    const CsvReadOptions& options
) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw DocumentReadError(ErrorCode::FileNotFound, "Cannot read file: " + path.string());
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    return parseCsvText(buffer.str(), path.stem().string(), options);
}

bool canReadCsv(const std::filesystem::path& path) noexcept {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return false;
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return false;
    }

    // Бинарные файлы содержат нулевые байты
    std::array<char, 512> buffer{};
    file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    const auto read = static_cast<size_t>(file.gcount());
    return std::find(buffer.begin(), buffer.begin() + static_cast<std::ptrdiff_t>(read), '\0') ==
           buffer.begin() + static_cast<std::ptrdiff_t>(read);
}

} // namespace strata::io
