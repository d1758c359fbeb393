/**
 * @file DirectoryWalker.cpp
 * @brief Implementation of DirectoryWalker.
 */

#include "application/DirectoryWalker.hpp"
#include "domain/ExtensionUtils.hpp"
#include "domain/FilterPredicate.hpp"

#include <algorithm>
#include <stack>
#include <string>
#include <system_error>

namespace fs = std::filesystem;

namespace fileextractor::application {

namespace {

TraversalError MakeError(const fs::path& path, const std::error_code& ec) {
    TraversalError error;
    error.path = path.string();
    error.kind = (ec == std::errc::permission_denied) ? domain::ErrorKind::PermissionDenied
                                                      : domain::ErrorKind::IOError;
    error.message = ec.message();
    return error;
}

struct ListedEntry {
    fs::path path;
    std::string name;
    std::uintmax_t size = 0;
};

} // namespace

DirectoryWalker::DirectoryWalker(const domain::ExtractionRequest& request)
    : m_request(request), m_root(request.rootFolder) {}

bool DirectoryWalker::isDestination(const fs::path& path) const {
    if (m_request.outputPath.empty()) return false;
    if (path.filename() != m_request.outputPath.filename()) return false;
    std::error_code ec;
    return fs::equivalent(path, m_request.outputPath, ec);
}

bool DirectoryWalker::isPriorityName(const fs::path& relativePath) const {
    if (relativePath.has_parent_path()) return false;
    const std::string name = relativePath.filename().string();
    return std::find(m_request.priorityFiles.begin(), m_request.priorityFiles.end(), name)
           != m_request.priorityFiles.end();
}

domain::FileCandidate DirectoryWalker::makeCandidate(const fs::path& path, std::uintmax_t size) const {
    domain::FileCandidate candidate;
    candidate.path = path;
    candidate.relativePath = path.lexically_relative(m_root);
    candidate.sizeBytes = size;
    candidate.extension = domain::CanonicalExtension(path);
    return candidate;
}

std::vector<domain::FileCandidate> DirectoryWalker::priorityCandidates() const {
    std::vector<domain::FileCandidate> candidates;
    std::vector<std::string> seen;
    for (const auto& name : m_request.priorityFiles) {
        if (name.empty() || std::find(seen.begin(), seen.end(), name) != seen.end()) continue;
        seen.push_back(name);

        // Only plain root-level names; the walk skips exactly these.
        const fs::path relative(name);
        if (relative.has_parent_path() || relative.is_absolute() || relative == "." || relative == "..") continue;

        fs::path path = m_root / relative;
        std::error_code ec;
        if (!fs::is_regular_file(path, ec) || isDestination(path)) continue;

        std::uintmax_t size = fs::file_size(path, ec);
        if (ec) size = 0;

        auto candidate = makeCandidate(path, size);
        if (domain::MatchesFilter(candidate, m_request)) {
            candidates.push_back(std::move(candidate));
        }
    }
    return candidates;
}

bool DirectoryWalker::walk(const FileVisitor& onFile,
                           const ErrorVisitor& onError,
                           const StopPredicate& stopRequested,
                           bool skipPriorityFiles) const {
    std::stack<fs::path> pending;
    pending.push(m_root);

    while (!pending.empty()) {
        if (stopRequested && stopRequested()) return false;

        fs::path current = pending.top();
        pending.pop();

        std::error_code ec;
        fs::directory_iterator it(current, fs::directory_options::none, ec);
        if (ec) {
            if (onError) onError(MakeError(current, ec));
            continue;
        }

        std::vector<ListedEntry> files;
        std::vector<ListedEntry> directories;

        for (fs::directory_iterator end; it != end; it.increment(ec)) {
            if (ec) break;
            const fs::directory_entry& entry = *it;
            std::error_code entryEc;
            ListedEntry listed{entry.path(), entry.path().filename().string(), 0};

            const bool isLink = entry.is_symlink(entryEc);
            if (entry.is_directory(entryEc)) {
                if (!isLink) directories.push_back(std::move(listed));
                continue;
            }
            if (entryEc) {
                // Dangling symlinks are not errors.
                if (entryEc != std::errc::no_such_file_or_directory && onError) {
                    onError(MakeError(entry.path(), entryEc));
                }
                continue;
            }
            if (!entry.is_regular_file(entryEc)) continue;

            listed.size = entry.file_size(entryEc);
            if (entryEc) listed.size = 0;
            files.push_back(std::move(listed));
        }
        if (ec) {
            if (onError) onError(MakeError(current, ec));
        }

        auto byName = [](const ListedEntry& a, const ListedEntry& b) { return a.name < b.name; };
        std::sort(files.begin(), files.end(), byName);
        std::sort(directories.begin(), directories.end(), byName);

        for (const auto& file : files) {
            if (isDestination(file.path)) continue;

            auto candidate = makeCandidate(file.path, file.size);
            if (skipPriorityFiles && isPriorityName(candidate.relativePath)) continue;
            if (!domain::MatchesFilter(candidate, m_request)) continue;

            if (onFile(candidate) == WalkControl::Stop) return false;
        }

        for (auto dir = directories.rbegin(); dir != directories.rend(); ++dir) {
            if (domain::ShouldDescendInto(dir->name, m_request)) {
                pending.push(dir->path);
            }
        }
    }
    return true;
}

} // namespace fileextractor::application
