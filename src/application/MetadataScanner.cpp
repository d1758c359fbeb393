/**
 * @file MetadataScanner.cpp
 * @brief Implementation of MetadataScanner.
 */

#include "application/MetadataScanner.hpp"

#include <spdlog/spdlog.h>

namespace fileextractor::application {

MetadataScanner::MetadataScanner(std::shared_ptr<spdlog::logger> logger)
    : m_logger(std::move(logger)) {}

ScanResult MetadataScanner::scan(const domain::ExtractionRequest& request,
                                 const std::function<bool()>& stopRequested) const {
    ScanResult result;
    DirectoryWalker walker(request);

    bool finished = walker.walk(
        [&result](const domain::FileCandidate&) {
            ++result.total;
            return WalkControl::Continue;
        },
        [&result, this](const TraversalError& error) {
            if (m_logger) {
                m_logger->debug("[MetadataScanner] Skipping unreadable path {}: {}", error.path, error.message);
            }
            result.errors.push_back(error);
        },
        stopRequested);

    result.cancelled = !finished;
    if (m_logger) {
        m_logger->info("[MetadataScanner] {} qualifying files under {} ({} traversal errors)",
                       result.total, request.rootFolder.string(), result.errors.size());
    }
    return result;
}

} // namespace fileextractor::application
