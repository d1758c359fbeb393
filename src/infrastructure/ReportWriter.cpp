/**
 * @file ReportWriter.cpp
 * @brief Implementation of ReportWriter.
 */

#include "infrastructure/ReportWriter.hpp"
#include "infrastructure/AtomicFile.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

#include <nlohmann/json.hpp>

namespace fileextractor::infrastructure {

using nlohmann::json;

namespace {

std::string FormatTimestamp(std::chrono::system_clock::time_point when) {
    std::time_t t = std::chrono::system_clock::to_time_t(when);
    std::tm tm{};
    localtime_r(&t, &tm);
    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    return ss.str();
}

} // namespace

json ReportWriter::ToJson(const domain::TerminalResult& result, const domain::ExtractionRequest& context) {
    const double elapsedSeconds = static_cast<double>(result.elapsed.count()) / 1000.0;
    const double rate = elapsedSeconds > 0.0 ? static_cast<double>(result.filesProcessed) / elapsedSeconds : 0.0;

    json statistics;
    statistics["total_files"] = result.totalFiles;
    statistics["processed_files"] = result.filesProcessed;
    statistics["skipped_files"] = result.filesSkipped;
    statistics["bytes_written"] = result.bytesWritten;
    statistics["elapsed_seconds"] = elapsedSeconds;
    statistics["files_per_second"] = rate;
    statistics["dropped_messages"] = result.droppedMessages;
    statistics["max_queue_depth"] = result.maxQueueDepth;

    json summary = json::object();
    for (const auto& [extension, stats] : result.extensionSummary) {
        const std::string key = extension.empty() ? "(none)" : extension;
        summary[key] = {{"count", stats.count}, {"total_bytes", stats.totalBytes}};
    }

    std::uintmax_t totalSize = 0;
    for (const auto& entry : result.extensionSummary) {
        totalSize += entry.second.totalBytes;
    }

    json fileDetails = json::object();
    for (const auto& detail : result.fileDetails) {
        fileDetails[detail.path] = {{"size", detail.sizeBytes},
                                    {"hash", detail.sha256},
                                    {"extension", detail.extension},
                                    {"processed_time", FormatTimestamp(detail.processedAt)}};
    }

    json errors = json::array();
    for (const auto& error : result.errors) {
        errors.push_back({{"path", error.path},
                          {"kind", domain::ErrorKindToString(error.kind)},
                          {"message", error.message}});
    }

    json configuration;
    configuration["mode"] = domain::ModeToString(context.mode);
    configuration["extensions"] = context.extensions;
    configuration["include_hidden"] = context.includeHidden;
    configuration["exclude_files"] = context.excludeFilePatterns;
    configuration["exclude_folders"] = context.excludeFolderPatterns;

    json report;
    report["report_generated_at"] = FormatTimestamp(std::chrono::system_clock::now());
    report["source_folder"] = context.rootFolder.string();
    report["output_file"] = context.outputPath.string();
    report["outcome"] = domain::OutcomeToString(result.outcome);
    report["failure_reason"] = result.failureReason.empty() ? json(nullptr) : json(result.failureReason);
    report["statistics"] = statistics;
    report["total_size"] = totalSize;
    report["extension_summary"] = summary;
    report["file_details"] = fileDetails;
    report["errors"] = errors;
    report["configuration"] = configuration;
    return report;
}

void ReportWriter::WriteReport(const std::filesystem::path& path,
                               const domain::TerminalResult& result,
                               const domain::ExtractionRequest& context) {
    WriteFileAtomically(path, ToJson(result, context).dump(4) + "\n");
}

} // namespace fileextractor::infrastructure
