/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading/saving application configuration (settings.json).
 *
 * Provides a unified way to access the extractor settings without scattering
 * JSON parsing logic throughout the codebase.
 */

#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "domain/ExtractionRequest.hpp"

namespace spdlog {
class logger;
}

namespace fileextractor::infrastructure {

/// Upper bound on the recent folder history.
inline constexpr std::size_t kMaxRecentFolders = 10;

/**
 * @class ConfigValidationError
 * @brief Raised when configuration values fail validation.
 */
class ConfigValidationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @struct AppSettings
 * @brief Typed view of settings.json.
 */
struct AppSettings {
    std::string outputFile = "output.txt";
    std::string mode = "inclusion";
    bool includeHidden = false;
    std::vector<std::string> extensions;
    std::vector<std::string> excludeFiles;
    std::vector<std::string> excludeFolders;
    std::optional<double> maxFileSizeMb;
    std::size_t chunkSize = domain::kDefaultChunkSize;
    std::size_t queueCapacity = 256;
    std::size_t pollIntervalMs = 100;
    std::vector<std::string> priorityFiles;
    std::vector<std::string> recentFolders;
    std::string logLevel = "INFO";
    std::string logFile = "file_extractor.log";
};

class ConfigLoader {
public:
    /** @brief Settings with every default filled in. */
    static AppSettings Defaults();

    /**
     * @brief Parses and normalises a settings document.
     *
     * Missing keys take their default value; unknown keys are ignored.
     * @throws ConfigValidationError on a wrong type or an invalid value.
     */
    static AppSettings FromJson(const nlohmann::json& j);

    static nlohmann::json ToJson(const AppSettings& settings);

    /** @throws ConfigValidationError naming the first offending key. */
    static void Validate(const AppSettings& settings);

    /**
     * @brief Loads settings from disk.
     *
     * A missing, unreadable or invalid file is replaced by the defaults;
     * a valid one is rewritten in normalised form.
     */
    static AppSettings Load(const std::filesystem::path& path,
                            const std::shared_ptr<spdlog::logger>& logger = nullptr);

    /**
     * @brief Writes settings atomically (temp file + rename).
     * @throws std::runtime_error when the file cannot be written.
     */
    static void Save(const std::filesystem::path& path, const AppSettings& settings);

    /**
     * @brief Moves folder to the front of the recent list.
     * @param limit Clamped to [1, kMaxRecentFolders].
     * @throws std::invalid_argument when folder is blank.
     */
    static void UpdateRecentFolders(AppSettings& settings, const std::string& folder, std::size_t limit = 5);

    /**
     * @brief Builds the engine request for root from validated settings.
     *
     * An empty extension list under inclusion resolves to the defaults.
     * @throws ConfigValidationError when the settings are invalid.
     */
    static domain::ExtractionRequest BuildRequest(const AppSettings& settings,
                                                  const std::filesystem::path& root);
};

} // namespace fileextractor::infrastructure
