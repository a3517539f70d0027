/**
 * @file zip_archive.hpp
 * @brief Чтение ZIP-контейнера (основа .xlsx)
 * @author Yan Bubenok <yan@bubenok.com>
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace strata::io {

/**
 * @brief Запись центрального каталога
 */
struct ZipEntry {
    std::string name;
    uint64_t compressed_size = 0;
    uint64_t uncompressed_size = 0;
};

/**
 * @brief ZIP-архив в памяти (miniz)
 */
class ZipArchive {
public:
    /**
     * @brief Разбор архива из байтов
     * @throws DocumentReadError Если центральный каталог не найден или повреждён
     */
    explicit ZipArchive(std::vector<uint8_t> bytes);
    ~ZipArchive();
    ZipArchive(ZipArchive&&) noexcept;
    ZipArchive& operator=(ZipArchive&&) noexcept;

    /**
     * @brief Чтение архива из файла
     * @throws DocumentReadError При ошибке чтения
     */
    [[nodiscard]] static ZipArchive fromFile(const std::filesystem::path& path);

    [[nodiscard]] const std::vector<ZipEntry>& entries() const noexcept { return entries_; }

    [[nodiscard]] bool contains(const std::string& name) const noexcept;

    /**
     * @brief Распакованное содержимое записи
     * @throws DocumentReadError Если записи нет или данные повреждены
     */
    [[nodiscard]] std::string read(const std::string& name) const;

private:
    struct Reader;

    std::unique_ptr<Reader> reader_;
    std::vector<ZipEntry> entries_;
};

/**
 * @brief Проверка сигнатуры ZIP (PK\x03\x04)
 */
[[nodiscard]] bool hasZipSignature(const std::filesystem::path& path) noexcept;

} // namespace strata::io
