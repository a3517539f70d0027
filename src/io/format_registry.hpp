/**
 * @file format_registry.hpp
 * @brief Реестр форматов исходных документов
 * @author Yan Bubenok <yan@bubenok.com>
 */

#pragma once

#include "document.hpp"
#include "model/extraction_result.hpp"
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace strata::io {

/**
 * @brief Результат определения формата
 */
enum class FormatDetectionResult {
    Detected,       ///< Формат определён
    Unknown         ///< Формат не распознан
};

/**
 * @brief Конкретный формат документа
 */
enum class SourceFormat {
    Unknown,
    CSV,        ///< .csv
    XLSX,       ///< .xlsx (Office Open XML)
    XLS,        ///< .xls (BIFF)
    PDF         ///< .pdf
};

/**
 * @brief Информация о детекции формата
 */
struct DetectionInfo {
    FormatDetectionResult result = FormatDetectionResult::Unknown;
    SourceFormat format = SourceFormat::Unknown;
    double confidence = 0.0;               ///< 0.0 - 1.0
    std::string error_message;             ///< При ошибке
};

/**
 * @brief Получить название формата
 */
[[nodiscard]] std::string_view getFormatName(SourceFormat format) noexcept;

/**
 * @brief Получить расширения файлов для формата
 */
[[nodiscard]] std::vector<std::string> getFormatExtensions(SourceFormat format);

/**
 * @brief Семейство парсеров для формата (nullopt для Unknown)
 */
[[nodiscard]] std::optional<model::FileType> fileTypeOf(SourceFormat format) noexcept;

/**
 * @brief Формат по расширению (без учёта регистра)
 */
[[nodiscard]] SourceFormat formatFromExtension(const std::filesystem::path& path);

/**
 * @brief Тип файла по расширению
 *
 * .xlsx, .xls, .csv -> Excel; .pdf -> Pdf; остальное -> nullopt.
 */
[[nodiscard]] std::optional<model::FileType> detectFileType(const std::filesystem::path& path);

/**
 * @brief Поддерживаемые расширения по типам файлов
 */
[[nodiscard]] std::map<model::FileType, std::vector<std::string>> getSupportedFileTypes();

/**
 * @brief Поддерживается ли файл (по расширению)
 */
[[nodiscard]] bool isFileSupported(const std::filesystem::path& path);

/**
 * @brief Определить формат файла по расширению и сигнатуре
 *
 * @param path Путь к файлу
 * @return Информация о формате
 */
[[nodiscard]] DetectionInfo detectFormat(const std::filesystem::path& path);

/**
 * @brief Чтение табличного документа (CSV, XLSX, XLS) как книги
 *
 * @throws DocumentReadError При ошибке чтения или неподходящем формате
 */
[[nodiscard]] Workbook readWorkbook(const std::filesystem::path& path);

} // namespace strata::io
