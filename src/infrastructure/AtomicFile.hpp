/**
 * @file AtomicFile.hpp
 * @brief Whole-file replacement through a temporary sibling and a rename.
 */

#pragma once

#include <filesystem>
#include <string>

namespace fileextractor::infrastructure {

/**
 * @brief Writes content to path so readers see either the old or the new file.
 *
 * The parent directory is created when missing.
 * @throws std::runtime_error when any step fails; the temp file is removed.
 */
void WriteFileAtomically(const std::filesystem::path& path, const std::string& content);

} // namespace fileextractor::infrastructure
