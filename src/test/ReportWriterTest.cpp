#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "infrastructure/ReportWriter.hpp"
#include "TestSupport.hpp"

using namespace fileextractor;
using infrastructure::ReportWriter;

namespace fs = std::filesystem;

int main() {
    std::cout << "[Test] Starting ReportWriter Test..." << std::endl;
    test::ScratchDir scratch("fe_report");

    auto request = test::MakeRequest("/data/project", "/data/out.txt", {".txt", ".md"});
    domain::TerminalResult result;
    result.outcome = domain::RunOutcome::Completed;
    result.totalFiles = 5;
    result.filesProcessed = 4;
    result.filesSkipped = 1;
    result.bytesWritten = 1234;
    result.elapsed = std::chrono::milliseconds(2000);
    result.droppedMessages = 3;
    result.maxQueueDepth = 17;
    result.extensionSummary[".txt"] = {3, 900};
    result.extensionSummary[".md"] = {1, 100};
    result.errors.push_back({"/data/project/bad.txt", domain::ErrorKind::DecodeError, "Cannot decode file"});

    auto report = ReportWriter::ToJson(result, request);
    assert(report["outcome"] == "completed");
    assert(report["failure_reason"].is_null());
    assert(report["source_folder"] == "/data/project");
    assert(report["output_file"] == "/data/out.txt");
    assert(report["report_generated_at"].get<std::string>().size() == 19);

    const auto& stats = report["statistics"];
    assert(stats["total_files"] == 5);
    assert(stats["processed_files"] == 4);
    assert(stats["skipped_files"] == 1);
    assert(stats["bytes_written"] == 1234);
    assert(stats["elapsed_seconds"].get<double>() == 2.0);
    assert(stats["files_per_second"].get<double>() == 2.0);
    assert(stats["dropped_messages"] == 3);
    assert(stats["max_queue_depth"] == 17);

    assert(report["extension_summary"][".txt"]["count"] == 3);
    assert(report["extension_summary"][".md"]["total_bytes"] == 100);
    assert(report["errors"].size() == 1);
    assert(report["errors"][0]["kind"] == "DecodeError");
    assert(report["configuration"]["mode"] == "inclusion");
    assert(report["configuration"]["extensions"].size() == 2);
    assert(report["configuration"]["include_hidden"] == false);
    std::cout << "[PASS] Report carries statistics, errors and configuration." << std::endl;

    assert(report["total_size"] == 1000);
    assert(report["file_details"].is_object() && report["file_details"].empty());

    domain::FileDetail detail;
    detail.path = "/data/project/notes.txt";
    detail.sizeBytes = 42;
    detail.sha256 = "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";
    detail.extension = ".txt";
    detail.processedAt = std::chrono::system_clock::now();
    result.fileDetails.push_back(detail);

    report = ReportWriter::ToJson(result, request);
    const auto& entry = report["file_details"]["/data/project/notes.txt"];
    assert(entry["size"] == 42);
    assert(entry["hash"] == detail.sha256);
    assert(entry["extension"] == ".txt");
    assert(entry["processed_time"].get<std::string>().size() == 19);
    std::cout << "[PASS] Report lists per-file details and the total size." << std::endl;

    result.outcome = domain::RunOutcome::Failed;
    result.failureReason = "Folder not found: /data/project";
    result.elapsed = std::chrono::milliseconds(0);
    report = ReportWriter::ToJson(result, request);
    assert(report["outcome"] == "failed");
    assert(report["failure_reason"] == "Folder not found: /data/project");
    assert(report["statistics"]["files_per_second"].get<double>() == 0.0);
    std::cout << "[PASS] Failed runs record their reason." << std::endl;

    const fs::path path = scratch.path() / "reports" / "run.json";
    ReportWriter::WriteReport(path, result, request);
    auto onDisk = nlohmann::json::parse(test::ReadFile(path));
    assert(onDisk["outcome"] == "failed");
    std::cout << "[PASS] Report is written to disk." << std::endl;

    test::WriteFile(scratch.path() / "blocker", "file, not a directory");
    bool threw = false;
    try {
        ReportWriter::WriteReport(scratch.path() / "blocker" / "run.json", result, request);
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);
    std::cout << "[PASS] An unwritable report path raises." << std::endl;

    std::cout << "[Test] All ReportWriter tests passed." << std::endl;
    return 0;
}
