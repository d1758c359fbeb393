/**
 * @file FilterPredicate.hpp
 * @brief Pure inclusion/exclusion rules shared by the scan and processing passes.
 */

#pragma once

#include <string>
#include <vector>
#include "domain/ExtractionRequest.hpp"
#include "domain/FileCandidate.hpp"

namespace fileextractor::domain {

/**
 * @brief Decides whether a candidate qualifies for extraction.
 *
 * Rules, in order:
 *  1. any directory of the relative path matching an exclude-folder pattern rejects;
 *  2. hidden names (leading '.') reject unless hidden files are included;
 *  3. a file name matching an exclude-file pattern rejects;
 *  4. the canonical extension is tested against the set according to the mode.
 */
bool MatchesFilter(const FileCandidate& candidate, const ExtractionRequest& request);

/** @brief Applies rules 1 and 2 to a single directory name. */
bool ShouldDescendInto(const std::string& directoryName, const ExtractionRequest& request);

/** @brief Rule 4 alone. */
bool ExtensionQualifies(const std::string& canonicalExtension, const ExtractionRequest& request);

/** @brief Shell glob match ('*', '?', '[...]'), case-sensitive. */
bool MatchesGlob(const std::string& name, const std::string& pattern);

bool MatchesAnyGlob(const std::string& name, const std::vector<std::string>& patterns);

inline bool IsHiddenName(const std::string& name) {
    return !name.empty() && name.front() == '.';
}

} // namespace fileextractor::domain
