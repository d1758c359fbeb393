/**
 * @file CliArguments.cpp
 * @brief Command-line parsing with CLI11.
 */

#include "app/CliArguments.hpp"

#include <string>
#include <vector>

#include <CLI/CLI.hpp>

namespace fileextractor::app {

std::optional<CliOptions> ParseArguments(int argc, char** argv, int& exitCode) {
    CLI::App app{"Concatenate the text files of a directory tree into one output file"};
    app.name("file_extractor");

    CliOptions options;
    std::string folder;
    std::string mode;
    std::string output;
    std::string report;
    std::string config;
    double pollInterval = 0.0;
    double maxFileSizeMb = 0.0;
    std::size_t chunkSize = 0;
    std::string logLevel;

    app.add_option("folder", folder, "Folder to extract")->required()->check(CLI::ExistingDirectory);
    auto* modeOpt = app.add_option("--mode", mode, "Extension filter mode")
                        ->check(CLI::IsMember({"inclusion", "exclusion"}, CLI::ignore_case));
    app.add_flag("--include-hidden", options.includeHidden, "Include hidden files and folders");
    app.add_option("--extensions", options.extensions, "Extensions to include or exclude (comma separated)");
    app.add_option("--exclude-files", options.excludeFiles, "File name patterns to skip (comma separated)");
    app.add_option("--exclude-folders", options.excludeFolders, "Folder name patterns to skip (comma separated)");
    auto* outputOpt = app.add_option("--output", output, "Output file path");
    auto* reportOpt = app.add_option("--report", report, "Optional JSON report path to generate after extraction");
    auto* configOpt = app.add_option("--config", config, "Settings file (settings.json)");
    auto* pollOpt = app.add_option("--poll-interval", pollInterval, "Seconds between status queue polls")
                        ->check(CLI::PositiveNumber);
    auto* sizeOpt = app.add_option("--max-file-size-mb", maxFileSizeMb, "Warn about files larger than this many MB")
                        ->check(CLI::PositiveNumber);
    auto* chunkOpt = app.add_option("--chunk-size", chunkSize, "Streaming chunk size in bytes")
                         ->check(CLI::PositiveNumber);
    auto* levelOpt = app.add_option("--log-level", logLevel, "Logging level")
                         ->check(CLI::IsMember({"DEBUG", "INFO", "WARNING", "ERROR", "CRITICAL"}, CLI::ignore_case));

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        exitCode = app.exit(e);
        return std::nullopt;
    }

    options.folder = folder;
    if (modeOpt->count()) options.mode = mode;
    if (outputOpt->count()) options.output = output;
    if (reportOpt->count()) options.report = report;
    if (configOpt->count()) options.config = config;
    if (pollOpt->count()) options.pollIntervalSeconds = pollInterval;
    if (sizeOpt->count()) options.maxFileSizeMb = maxFileSizeMb;
    if (chunkOpt->count()) options.chunkSize = chunkSize;
    if (levelOpt->count()) options.logLevel = logLevel;
    return options;
}

} // namespace fileextractor::app
