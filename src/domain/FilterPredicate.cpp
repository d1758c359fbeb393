/**
 * @file FilterPredicate.cpp
 * @brief Implementation of the filter rules.
 */

#include "domain/FilterPredicate.hpp"

#include <fnmatch.h>

namespace fileextractor::domain {

bool MatchesGlob(const std::string& name, const std::string& pattern) {
    return ::fnmatch(pattern.c_str(), name.c_str(), 0) == 0;
}

bool MatchesAnyGlob(const std::string& name, const std::vector<std::string>& patterns) {
    for (const auto& pattern : patterns) {
        if (MatchesGlob(name, pattern)) return true;
    }
    return false;
}

bool ShouldDescendInto(const std::string& directoryName, const ExtractionRequest& request) {
    if (MatchesAnyGlob(directoryName, request.excludeFolderPatterns)) return false;
    if (!request.includeHidden && IsHiddenName(directoryName)) return false;
    return true;
}

bool ExtensionQualifies(const std::string& canonicalExtension, const ExtractionRequest& request) {
    const bool listed = request.extensions.count(canonicalExtension) > 0;
    switch (request.mode) {
        case ExtractionMode::Inclusion:
            return listed || request.hasWildcard();
        case ExtractionMode::Exclusion:
            return !listed && !request.hasWildcard();
        default:
            return false;
    }
}

bool MatchesFilter(const FileCandidate& candidate, const ExtractionRequest& request) {
    for (const auto& component : candidate.relativePath.parent_path()) {
        const std::string dirName = component.string();
        if (dirName.empty() || dirName == ".") continue;
        if (!ShouldDescendInto(dirName, request)) return false;
    }

    const std::string fileName = candidate.relativePath.filename().string();
    if (!request.includeHidden && IsHiddenName(fileName)) return false;
    if (MatchesAnyGlob(fileName, request.excludeFilePatterns)) return false;

    return ExtensionQualifies(candidate.extension, request);
}

} // namespace fileextractor::domain
