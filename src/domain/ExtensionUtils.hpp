/**
 * @file ExtensionUtils.hpp
 * @brief Canonicalisation of extension tokens and shared defaults.
 */

#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace fileextractor::domain {

/** @brief Extensions used when none are supplied under Inclusion. */
const std::vector<std::string>& DefaultExtensions();

/** @brief File and folder names excluded by default. */
const std::vector<std::string>& DefaultExcludes();

/** @brief Root-level files emitted ahead of the walk by default. */
const std::vector<std::string>& DefaultPriorityFiles();

/**
 * @brief Normalises raw extension tokens.
 *
 * "TXT", "*.txt" and ".Txt" all become ".txt". "*" and "*.*" become the
 * wildcard. Empty tokens are dropped and duplicates removed, first occurrence wins.
 */
std::vector<std::string> NormaliseExtensionTokens(const std::vector<std::string>& rawTokens);

/** @brief Lower-cased extension of a path (".txt"), empty when it has none. */
std::string CanonicalExtension(const std::filesystem::path& path);

/**
 * @brief Splits comma separated values, trims them and removes duplicates.
 */
std::vector<std::string> SplitCommaSeparated(const std::vector<std::string>& values);

} // namespace fileextractor::domain
