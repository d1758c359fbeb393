/**
 * @file DirectoryWalker.hpp
 * @brief Deterministic, pruning traversal shared by the scan and processing passes.
 */

#pragma once

#include <filesystem>
#include <functional>
#include <vector>
#include "domain/ExtractionRequest.hpp"
#include "domain/FileCandidate.hpp"
#include "domain/StatusMessage.hpp"

namespace fileextractor::application {

/// Failure to read a directory or an entry during traversal.
using TraversalError = domain::FileError;

/**
 * @enum WalkControl
 * @brief Returned by a file visitor to continue or stop the walk.
 */
enum class WalkControl {
    Continue,
    Stop
};

/**
 * @class DirectoryWalker
 * @brief Visits every qualifying file under the request's root folder.
 *
 * Within a directory, entries are visited in byte order of their names,
 * files first, then sub-directories (top-down, depth first). Excluded and
 * hidden directories are pruned, never descended into, and directory
 * symlinks are not followed. The destination file is never reported.
 */
class DirectoryWalker {
public:
    using FileVisitor = std::function<WalkControl(const domain::FileCandidate&)>;
    using ErrorVisitor = std::function<void(const TraversalError&)>;
    using StopPredicate = std::function<bool()>;

    explicit DirectoryWalker(const domain::ExtractionRequest& request);

    /**
     * @brief Walks the tree.
     * @param onFile Called for each qualifying file.
     * @param onError Called for each unreadable directory or entry; the walk goes on.
     * @param stopRequested Polled before each directory; may be empty.
     * @param skipPriorityFiles Skip the root-level priority files (already emitted).
     * @return false when the walk was stopped by the visitor or by stopRequested.
     */
    bool walk(const FileVisitor& onFile,
              const ErrorVisitor& onError,
              const StopPredicate& stopRequested = nullptr,
              bool skipPriorityFiles = false) const;

    /**
     * @brief Qualifying root-level priority files, in configured order.
     *
     * Names carrying a directory component are ignored.
     */
    std::vector<domain::FileCandidate> priorityCandidates() const;

private:
    bool isDestination(const std::filesystem::path& path) const;
    bool isPriorityName(const std::filesystem::path& relativePath) const;
    domain::FileCandidate makeCandidate(const std::filesystem::path& path, std::uintmax_t size) const;

    const domain::ExtractionRequest& m_request;
    std::filesystem::path m_root;
};

} // namespace fileextractor::application
