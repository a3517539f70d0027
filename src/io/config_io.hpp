/**
 * @file config_io.hpp
 * @brief Чтение и запись конфигурации извлечения (JSON)
 * @author Yan Bubenok <yan@bubenok.com>
 */

#pragma once

#include "model/config.hpp"
#include <filesystem>
#include <stdexcept>
#include <string>

namespace strata::io {

/**
 * @brief Ошибка конфигурации
 */
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Загрузка конфигурации из файла
 *
 * Все ключи необязательны: отсутствующие берутся из defaultConfig(),
 * неизвестные игнорируются.
 *
 * @throws ConfigError При ошибке чтения, разбора или недопустимых значениях
 */
[[nodiscard]] model::ExtractionConfig loadConfig(const std::filesystem::path& path);

/**
 * @brief Конфигурация из JSON-строки
 * @throws ConfigError При ошибке разбора
 */
[[nodiscard]] model::ExtractionConfig configFromJson(const std::string& json);

/**
 * @brief Конфигурация в JSON (с отступами)
 */
[[nodiscard]] std::string configToJson(const model::ExtractionConfig& config, int indent = 2);

} // namespace strata::io
