/**
 * @file Logging.hpp
 * @brief Explicit construction of the application logger.
 */

#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <spdlog/common.h>

namespace spdlog {
class logger;
}

namespace fileextractor::infrastructure {

/// Name of the application logger.
inline constexpr const char* kLoggerName = "file_extractor";

/**
 * @struct LoggingOptions
 * @brief Sinks and level of the application logger.
 */
struct LoggingOptions {
    std::string level = "INFO";                 ///< DEBUG, INFO, WARNING, ERROR or CRITICAL.
    bool console = true;                        ///< Colour sink on stdout.
    std::optional<std::filesystem::path> logFile; ///< Rotating file sink when set.
    std::size_t maxFileBytes = 2 * 1024 * 1024;
    std::size_t backupCount = 5;
    std::vector<spdlog::sink_ptr> extraSinks;   ///< Additional sinks (tests, GUI transcript).
};

/**
 * @brief Parses a level name (case-insensitive). "WARNING" maps to warn.
 */
std::optional<spdlog::level::level_enum> ParseLogLevel(const std::string& name);

/**
 * @brief Builds the application logger from options.
 *
 * The logger is not registered globally; callers inject it where needed.
 * @throws std::invalid_argument for an unknown level name.
 * @throws spdlog::spdlog_ex when the log file cannot be opened.
 */
std::shared_ptr<spdlog::logger> configureLogging(const LoggingOptions& options);

} // namespace fileextractor::infrastructure
