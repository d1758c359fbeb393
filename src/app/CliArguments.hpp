/**
 * @file CliArguments.hpp
 * @brief Command-line parsing for the file_extractor executable.
 */

#pragma once

#include <optional>

#include "app/CliOptions.hpp"

namespace fileextractor::app {

/**
 * @brief Parses argv into CliOptions.
 * @param exitCode Set when parsing ends the process (help, usage errors).
 * @return The options, or nullopt when the process should exit with exitCode.
 */
std::optional<CliOptions> ParseArguments(int argc, char** argv, int& exitCode);

} // namespace fileextractor::app
