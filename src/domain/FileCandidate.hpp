/**
 * @file FileCandidate.hpp
 * @brief Transient description of a file met during traversal.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

namespace fileextractor::domain {

/**
 * @struct FileCandidate
 * @brief A file found under the root folder. Never persisted.
 */
struct FileCandidate {
    std::filesystem::path path;         ///< Full path as reached by the walk.
    std::filesystem::path relativePath; ///< Path relative to the root folder.
    std::uintmax_t sizeBytes = 0;
    std::string extension;              ///< Canonical extension (".txt", or empty).
};

} // namespace fileextractor::domain
