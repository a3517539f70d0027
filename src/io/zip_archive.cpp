/**
 * @file zip_archive.cpp
 * @brief Реализация чтения ZIP-контейнера
 * @author Yan Bubenok <yan@bubenok.com>
 */

#include "zip_archive.hpp"
#include "document.hpp"
#include <miniz.h>
#include <array>
#include <fstream>
#include <iterator>

namespace strata::io {

using model::ErrorCode;

/**
 * @brief Читатель miniz вместе с буфером архива
 *
 * Буфер живёт дольше читателя: miniz ссылается на него без копии.
 */
struct ZipArchive::Reader {
    std::vector<uint8_t> bytes;
    mz_zip_archive zip{};
    bool open = false;

    ~Reader() {
        if (open) {
            mz_zip_reader_end(&zip);
        }
    }
};

ZipArchive::ZipArchive(std::vector<uint8_t> bytes)
    : reader_(std::make_unique<Reader>()) {
    reader_->bytes = std::move(bytes);
    if (reader_->bytes.empty()) {
        throw DocumentReadError(ErrorCode::InvalidFileFormat, "Invalid file format: not a ZIP archive");
    }

    mz_zip_archive* zip = &reader_->zip;
    if (!mz_zip_reader_init_mem(zip, reader_->bytes.data(), reader_->bytes.size(), 0)) {
        throw DocumentReadError(ErrorCode::InvalidFileFormat,
            std::string("Invalid file format: ZIP directory not readable (") +
            mz_zip_get_error_string(mz_zip_get_last_error(zip)) + ")");
    }
    reader_->open = true;

    const mz_uint count = mz_zip_reader_get_num_files(zip);
    entries_.reserve(count);
    for (mz_uint i = 0; i < count; ++i) {
        mz_zip_archive_file_stat st;
        if (!mz_zip_reader_file_stat(zip, i, &st)) {
            throw DocumentReadError(ErrorCode::FileCorrupted, "File is corrupt: bad ZIP directory entry");
        }
        entries_.push_back({st.m_filename, st.m_comp_size, st.m_uncomp_size});
    }
}

ZipArchive::~ZipArchive() = default;
ZipArchive::ZipArchive(ZipArchive&&) noexcept = default;
ZipArchive& ZipArchive::operator=(ZipArchive&&) noexcept = default;

ZipArchive ZipArchive::fromFile(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw DocumentReadError(ErrorCode::FileNotFound, "Cannot read file: " + path.string());
    }
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(file)),
                               std::istreambuf_iterator<char>());
    return ZipArchive(std::move(bytes));
}

bool ZipArchive::contains(const std::string& name) const noexcept {
    return mz_zip_reader_locate_file(&reader_->zip, name.c_str(), nullptr, 0) >= 0;
}

std::string ZipArchive::read(const std::string& name) const {
    const int index = mz_zip_reader_locate_file(&reader_->zip, name.c_str(), nullptr, 0);
    if (index < 0) {
        throw DocumentReadError(ErrorCode::InvalidFileFormat, "Invalid file format: missing part " + name);
    }

    size_t size = 0;
    void* data = mz_zip_reader_extract_to_heap(&reader_->zip, static_cast<mz_uint>(index), &size, 0);
    if (!data) {
        throw DocumentReadError(ErrorCode::FileCorrupted,
            "File is corrupt: cannot extract " + name + " (" +
            mz_zip_get_error_string(mz_zip_get_last_error(&reader_->zip)) + ")");
    }
    std::string out(static_cast<const char*>(data), size);
    mz_free(data);
    return out;
}

bool hasZipSignature(const std::filesystem::path& path) noexcept {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return false;
    }
    std::array<char, 4> magic{};
    file.read(magic.data(), static_cast<std::streamsize>(magic.size()));
    return file.gcount() == 4 && magic[0] == 'P' && magic[1] == 'K' &&
           magic[2] == '\x03' && magic[3] == '\x04';
}

} // namespace strata::io
