/**
 * @file FileExtractorApp.hpp
 * @brief Command-line application class for FileExtractor.
 */

#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>

#include "app/CliOptions.hpp"
#include "domain/ExtractionRequest.hpp"
#include "domain/StatusMessage.hpp"
#include "infrastructure/ConfigLoader.hpp"

namespace spdlog {
class logger;
}

namespace fileextractor::app {

/// Exit codes of the command-line front end.
inline constexpr int kExitCompleted = 0;
inline constexpr int kExitFailed = 1;
inline constexpr int kExitCancelled = 130;

/**
 * @brief Merges command-line overrides into the loaded settings.
 *
 * Comma separated values are split and de-duplicated. Without explicit
 * extensions the configured ones are kept.
 * @throws infrastructure::ConfigValidationError when the merged settings are invalid.
 */
infrastructure::AppSettings ApplyOverrides(infrastructure::AppSettings settings, const CliOptions& options);

/** @brief Maps a terminal outcome to the process exit code. */
int ExitCodeFor(domain::RunOutcome outcome);

/**
 * @class FileExtractorApp
 * @brief Orchestrates one command-line run: configuration, extraction, report.
 */
class FileExtractorApp {
public:
    /**
     * @param options Parsed command line.
     * @param logger Injected logger; when null, Init() builds one from the settings.
     */
    explicit FileExtractorApp(CliOptions options, std::shared_ptr<spdlog::logger> logger = nullptr);

    /**
     * @brief Initializes, runs the extraction and polls it to completion.
     * @return Exit code (0 completed, 1 failed, 130 cancelled).
     */
    int Run();

    /** @brief Terminal result of the last Run(), if it produced one. */
    const std::optional<domain::TerminalResult>& LastResult() const { return m_result; }

private:
    /**
     * @brief Loads settings, applies overrides, configures logging and builds the request.
     * @return True if initialization succeeded.
     */
    bool Init();

    /**
     * @brief Drains the run's status channel until its State message arrives.
     */
    int Execute();

    void Shutdown();

    CliOptions m_options;
    std::shared_ptr<spdlog::logger> m_logger;
    std::filesystem::path m_settingsPath;
    infrastructure::AppSettings m_settings;
    domain::ExtractionRequest m_request;
    std::chrono::milliseconds m_pollInterval{100};
    std::optional<domain::TerminalResult> m_result;
};

} // namespace fileextractor::app
