/**
 * @file pdf_reader.cpp
 * @brief Реализация чтения текста PDF через poppler-cpp
 * @author Yan Bubenok <yan@bubenok.com>
 */

#include "pdf_reader.hpp"
#include <poppler-document.h>
#include <poppler-page.h>
#include <spdlog/spdlog.h>
#include <array>
#include <fstream>
#include <string_view>
#include <memory>

namespace strata::io {

using model::ErrorCode;

PdfText readPdfText(const std::filesystem::path& path) {
    std::unique_ptr<poppler::document> doc(
        poppler::document::load_from_file(path.string()));
    if (!doc) {
        throw DocumentReadError(ErrorCode::FileCorrupted, "Cannot read file: " + path.string());
    }
    if (doc->is_locked()) {
        throw DocumentReadError(ErrorCode::InvalidFileFormat,
            "Invalid file format: PDF is password protected");
    }

    PdfText result;
    const int page_count = doc->pages();
    result.page_count = page_count > 0 ? static_cast<size_t>(page_count) : 0;

    for (int page_index = 0; page_index < page_count; ++page_index) {
        std::unique_ptr<poppler::page> page(doc->create_page(page_index));
        if (!page) {
            spdlog::warn("PDF: page {} could not be opened, skipped", page_index + 1);
            result.page_heights.push_back(0.0);
            continue;
        }
        const poppler::rectf page_rect = page->page_rect();
        result.page_heights.push_back(page_rect.height());

        // text_list() отдаёт координаты с началом в левом верхнем углу
        for (const auto& box : page->text_list()) {
            poppler::byte_array bytes = box.text().to_utf8();
            std::string text(bytes.begin(), bytes.end());
            if (text.empty()) {
                continue;
            }
            const poppler::rectf bbox = box.bbox();
            TextItem item;
            item.text = std::move(text);
            item.x = bbox.x();
            item.y = bbox.y();
            item.width = bbox.width();
            item.height = bbox.height();
            item.page = static_cast<size_t>(page_index);
            result.items.push_back(std::move(item));
        }
    }

    spdlog::debug("PDF: {} pages, {} text items", result.page_count, result.items.size());
    return result;
}

bool hasPdfSignature(const std::filesystem::path& path) noexcept {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return false;
    }
    std::array<char, 5> magic{};
    file.read(magic.data(), static_cast<std::streamsize>(magic.size()));
    return file.gcount() == 5 && std::string_view(magic.data(), magic.size()) == "%PDF-";
}

} // namespace strata::io
