/**
 * @file MetadataScanner.hpp
 * @brief Pre-pass counting the qualifying files of a request.
 */

#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <vector>
#include "application/DirectoryWalker.hpp"
#include "domain/ExtractionRequest.hpp"

namespace spdlog {
class logger;
}

namespace fileextractor::application {

/**
 * @struct ScanResult
 * @brief Outcome of a metadata scan.
 */
struct ScanResult {
    std::size_t total = 0;
    std::vector<TraversalError> errors;
    bool cancelled = false;
};

/**
 * @class MetadataScanner
 * @brief Walks the tree once without reading content and counts qualifying files.
 *
 * Uses the same DirectoryWalker and filter as the processing pass, so the
 * count is exact for an unchanged tree.
 */
class MetadataScanner {
public:
    explicit MetadataScanner(std::shared_ptr<spdlog::logger> logger = nullptr);

    /**
     * @brief Counts the qualifying files of the request.
     * @param stopRequested Polled between directories; a true result ends the scan early.
     */
    ScanResult scan(const domain::ExtractionRequest& request,
                    const std::function<bool()>& stopRequested = nullptr) const;

private:
    std::shared_ptr<spdlog::logger> m_logger;
};

} // namespace fileextractor::application
