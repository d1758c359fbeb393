/**
 * @file CliOptions.hpp
 * @brief Command-line overrides for a single extraction.
 */

#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace fileextractor::app {

/**
 * @struct CliOptions
 * @brief Parsed command line. Unset members fall back to settings.json.
 */
struct CliOptions {
    std::filesystem::path folder;
    std::optional<std::string> mode;
    bool includeHidden = false;
    std::vector<std::string> extensions;      ///< Raw tokens, possibly comma separated.
    std::vector<std::string> excludeFiles;
    std::vector<std::string> excludeFolders;
    std::optional<std::filesystem::path> output;
    std::optional<std::filesystem::path> report;
    std::optional<std::filesystem::path> config;
    std::optional<double> pollIntervalSeconds;
    std::optional<double> maxFileSizeMb;
    std::optional<std::size_t> chunkSize;
    std::optional<std::string> logLevel;
};

} // namespace fileextractor::app
