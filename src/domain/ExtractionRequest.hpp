/**
 * @file ExtractionRequest.hpp
 * @brief Value object describing a single extraction run.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace fileextractor::domain {

/**
 * @enum ExtractionMode
 * @brief How the extension set is interpreted.
 */
enum class ExtractionMode {
    Inclusion,  ///< Only files whose extension is in the set qualify.
    Exclusion   ///< Every file whose extension is NOT in the set qualifies.
};

/// Extension token matching every file under Inclusion.
inline const std::string kWildcardExtension = "*";

/// Default streaming chunk size in bytes.
inline constexpr std::size_t kDefaultChunkSize = 8192;

inline std::string ModeToString(ExtractionMode mode) {
    switch (mode) {
        case ExtractionMode::Inclusion: return "inclusion";
        case ExtractionMode::Exclusion: return "exclusion";
        default: return "unknown";
    }
}

inline std::optional<ExtractionMode> ParseMode(const std::string& text) {
    if (text == "inclusion") return ExtractionMode::Inclusion;
    if (text == "exclusion") return ExtractionMode::Exclusion;
    return std::nullopt;
}

/**
 * @struct ExtractionRequest
 * @brief Fully normalised input of the extraction engine.
 *
 * Built once by the configuration/CLI layer. Extensions are already in the
 * canonical dotted lower-case form and an empty set under Inclusion has
 * already been resolved to an explicit list or to the wildcard.
 */
struct ExtractionRequest {
    std::filesystem::path rootFolder;
    ExtractionMode mode = ExtractionMode::Inclusion;
    std::set<std::string> extensions;
    bool includeHidden = false;
    std::vector<std::string> excludeFilePatterns;   ///< Glob patterns tested against file names.
    std::vector<std::string> excludeFolderPatterns; ///< Glob patterns tested against directory names.
    std::filesystem::path outputPath;
    std::optional<std::uintmax_t> sizeWarningThreshold; ///< Soft limit in bytes; absent disables the warning.
    std::size_t chunkSize = kDefaultChunkSize;
    std::vector<std::string> priorityFiles; ///< Root-level file names emitted before the walk.

    bool hasWildcard() const {
        return extensions.count(kWildcardExtension) > 0;
    }
};

} // namespace fileextractor::domain
