/**
 * @file Logging.cpp
 * @brief Implementation of configureLogging.
 */

#include "infrastructure/Logging.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace fileextractor::infrastructure {

namespace {

const char* kPattern = "%Y-%m-%d %H:%M:%S - %l - [thread %t] - %v";

} // namespace

std::optional<spdlog::level::level_enum> ParseLogLevel(const std::string& name) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char c) { return std::toupper(c); });

    if (upper == "DEBUG") return spdlog::level::debug;
    if (upper == "INFO") return spdlog::level::info;
    if (upper == "WARNING" || upper == "WARN") return spdlog::level::warn;
    if (upper == "ERROR") return spdlog::level::err;
    if (upper == "CRITICAL") return spdlog::level::critical;
    return std::nullopt;
}

std::shared_ptr<spdlog::logger> configureLogging(const LoggingOptions& options) {
    auto level = ParseLogLevel(options.level);
    if (!level) {
        throw std::invalid_argument("Unknown log level: " + options.level);
    }

    std::vector<spdlog::sink_ptr> sinks;
    if (options.console) {
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    }
    if (options.logFile) {
        if (options.logFile->has_parent_path()) {
            // A missing directory surfaces as a sink construction error below.
            std::error_code ec;
            std::filesystem::create_directories(options.logFile->parent_path(), ec);
        }
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            options.logFile->string(), options.maxFileBytes, options.backupCount));
    }
    sinks.insert(sinks.end(), options.extraSinks.begin(), options.extraSinks.end());

    auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
    logger->set_pattern(kPattern);
    logger->set_level(*level);
    logger->flush_on(spdlog::level::warn);
    return logger;
}

} // namespace fileextractor::infrastructure
