/**
 * @file main.cpp
 * @brief Точка входа strata_cli
 * @author Yan Bubenok <yan@bubenok.com>
 */

#include "core/strata_extractor.hpp"
#include "io/config_io.hpp"
#include "io/format_registry.hpp"
#include "io/result_writer.hpp"
#include <spdlog/spdlog.h>
#include <filesystem>
#include <iostream>
#include <string_view>

namespace {

using namespace strata::model;

constexpr int kExitSuccess = 0;
constexpr int kExitFailure = 1;
constexpr int kExitNeedsReview = 2;

void printUsage() {
    std::cerr << "Использование:\n"
              << "  strata_cli --extract <файл> [--config <cfg.json>] [--out <result.json>]\n"
              << "             [--report <report.md>] [--verbose]\n"
              << "  strata_cli --supported-types\n";
}

int printSupportedTypes() {
    for (const auto& [type, extensions] : strata::io::getSupportedFileTypes()) {
        std::cout << toString(type) << ":";
        for (const auto& ext : extensions) {
            std::cout << " " << ext;
        }
        std::cout << "\n";
    }
    return kExitSuccess;
}

int exitCodeFor(const ExtractionResult& result) {
    if (result.success) {
        return kExitSuccess;
    }
    if (result.recovery_session.has_value() && result.recovery_session->success) {
        return kExitNeedsReview;
    }
    return kExitFailure;
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::warn);

    try {
        if (argc >= 2 && std::string_view(argv[1]) == "--supported-types") {
            return printSupportedTypes();
        }

        // Извлечение разреза: --extract <файл> [опции]
        if (argc >= 3 && std::string_view(argv[1]) == "--extract") {
            const std::filesystem::path input_path(argv[2]);
            std::filesystem::path config_path;
            std::filesystem::path out_path;
            std::filesystem::path report_path;

            for (int i = 3; i < argc; ++i) {
                std::string_view arg(argv[i]);
                if (arg == "--config" && i + 1 < argc) {
                    config_path = argv[++i];
                } else if (arg == "--out" && i + 1 < argc) {
                    out_path = argv[++i];
                } else if (arg == "--report" && i + 1 < argc) {
                    report_path = argv[++i];
                } else if (arg == "--verbose") {
                    spdlog::set_level(spdlog::level::debug);
                } else {
                    std::cerr << "Неизвестный аргумент: " << arg << std::endl;
                    printUsage();
                    return kExitFailure;
                }
            }

            ExtractionConfig config = config_path.empty() ? defaultConfig() : strata::io::loadConfig(config_path);
            strata::core::StrataExtractor extractor(std::move(config));
            const auto result = extractor.extractFromFile(input_path);

            if (out_path.empty()) {
                std::cout << strata::io::resultToJson(result) << std::endl;
            } else {
                strata::io::writeResultJson(result, out_path);
                std::cerr << "Результат записан: " << out_path.string() << std::endl;
            }

            if (!report_path.empty()) {
                if (const auto report = extractor.generateReport()) {
                    strata::io::writeReportMarkdown(*report, report_path);
                }
            }

            return exitCodeFor(result);
        }

        printUsage();
        return kExitFailure;
    } catch (const strata::io::ConfigError& e) {
        std::cerr << "Ошибка конфигурации: " << e.what() << std::endl;
        return kExitFailure;
    } catch (const std::exception& e) {
        std::cerr << "Ошибка: " << e.what() << std::endl;
        return kExitFailure;
    }
}
