/**
 * @file pdf_reader.hpp
 * @brief Чтение текста PDF с координатами фрагментов
 * @author Yan Bubenok <yan@bubenok.com>
 */

#pragma once

#include "document.hpp"
#include <filesystem>

namespace strata::io {

/**
 * @brief Чтение всех текстовых фрагментов PDF (poppler-cpp)
 *
 * Страницы, текст которых не удалось получить, пропускаются с предупреждением.
 *
 * @throws DocumentReadError Если документ не открывается или защищён паролем
 */
[[nodiscard]] PdfText readPdfText(const std::filesystem::path& path);

/**
 * @brief Проверка сигнатуры PDF (%PDF-)
 */
[[nodiscard]] bool hasPdfSignature(const std::filesystem::path& path) noexcept;

} // namespace strata::io
