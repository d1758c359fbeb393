/**
 * @file ExtractionEngine.cpp
 * @brief Implementation of ExtractionEngine.
 */

#include "application/ExtractionEngine.hpp"
#include "application/DirectoryWalker.hpp"
#include "application/MetadataScanner.hpp"
#include "application/StreamingFileTransfer.hpp"
#include "infrastructure/DestinationWriter.hpp"

#include <filesystem>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <system_error>

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace fileextractor::application {

using domain::ErrorKind;
using domain::LogLevel;
using domain::RunOutcome;

struct ExtractionEngine::RunContext {
    std::chrono::steady_clock::time_point startedAt = std::chrono::steady_clock::now();
    domain::TerminalResult result;
    std::unique_ptr<infrastructure::DestinationWriter> writer;
    bool cancelled = false;
    std::string destinationError;
};

namespace {

ErrorKind ToErrorKind(TransferStatus status) {
    switch (status) {
        case TransferStatus::DecodeError: return ErrorKind::DecodeError;
        case TransferStatus::PermissionDenied: return ErrorKind::PermissionDenied;
        default: return ErrorKind::IOError;
    }
}

} // namespace

std::string EngineStateToString(EngineState state) {
    switch (state) {
        case EngineState::Idle: return "Idle";
        case EngineState::Scanning: return "Scanning";
        case EngineState::Processing: return "Processing";
        case EngineState::Completed: return "Completed";
        case EngineState::Cancelled: return "Cancelled";
        case EngineState::Failed: return "Failed";
        default: return "Unknown";
    }
}

ExtractionEngine::ExtractionEngine(domain::ExtractionRequest request,
                                   std::shared_ptr<StatusChannel> channel,
                                   std::shared_ptr<domain::CancellationToken> token,
                                   std::shared_ptr<spdlog::logger> logger)
    : m_request(std::move(request)),
      m_channel(std::move(channel)),
      m_token(std::move(token)),
      m_logger(std::move(logger)) {
    if (!m_channel) throw std::invalid_argument("ExtractionEngine requires a status channel");
    if (!m_token) throw std::invalid_argument("ExtractionEngine requires a cancellation token");
}

void ExtractionEngine::setState(EngineState state) {
    m_state.store(state);
    if (m_logger) m_logger->debug("[ExtractionEngine] State -> {}", EngineStateToString(state));
}

void ExtractionEngine::pushLog(LogLevel level, const std::string& text) {
    m_channel->push(domain::MakeLog(level, text));
}

domain::TerminalResult ExtractionEngine::run() {
    EngineState expected = EngineState::Idle;
    if (!m_state.compare_exchange_strong(expected, EngineState::Scanning)) {
        throw std::logic_error("ExtractionEngine::run may only be called once");
    }

    RunContext ctx;
    try {
        return execute(ctx);
    } catch (const std::exception& e) {
        if (m_channel->terminalPushed()) throw;
        if (m_logger) m_logger->error("[ExtractionEngine] Unexpected error: {}", e.what());
        return fail(ctx, ErrorKind::IOError, std::string("Unexpected error during extraction: ") + e.what());
    }
}

domain::TerminalResult ExtractionEngine::execute(RunContext& ctx) {
    setState(EngineState::Scanning);

    std::error_code ec;
    if (!fs::exists(m_request.rootFolder, ec)) {
        return fail(ctx, ErrorKind::FolderNotFound, "Folder not found: " + m_request.rootFolder.string());
    }
    if (!fs::is_directory(m_request.rootFolder, ec)) {
        return fail(ctx, ErrorKind::FolderNotFound, "Not a directory: " + m_request.rootFolder.string());
    }

    ctx.writer = std::make_unique<infrastructure::DestinationWriter>(m_request.outputPath);
    try {
        ctx.writer->open();
    } catch (const std::runtime_error& e) {
        return fail(ctx, ErrorKind::IOError, e.what());
    }

    if (m_logger) m_logger->info("[ExtractionEngine] Scanning {}", m_request.rootFolder.string());
    MetadataScanner scanner(m_logger);
    ScanResult scan = scanner.scan(m_request, [this] { return m_token->isCancelled(); });
    if (scan.cancelled) {
        ctx.cancelled = true;
        if (!ctx.writer->close()) {
            return fail(ctx, ErrorKind::IOError, "Output stream failed: " + ctx.writer->lastError());
        }
        pushLog(LogLevel::Warning, "Extraction cancelled during scan");
        return finish(ctx, RunOutcome::Cancelled);
    }

    ctx.result.totalFiles = scan.total;
    setState(EngineState::Processing);
    m_channel->push(domain::MakeProgress(0, ctx.result.totalFiles, ""));

    processAll(ctx);

    if (!ctx.destinationError.empty()) {
        return fail(ctx, ErrorKind::IOError, "Output stream failed: " + ctx.destinationError);
    }
    if (!ctx.writer->close()) {
        return fail(ctx, ErrorKind::IOError, "Output stream failed: " + ctx.writer->lastError());
    }

    if (ctx.cancelled) {
        pushLog(LogLevel::Warning, "Extraction cancelled after " + std::to_string(ctx.result.filesProcessed)
                                       + " of " + std::to_string(ctx.result.totalFiles) + " files");
        return finish(ctx, RunOutcome::Cancelled);
    }

    const auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - ctx.startedAt).count();
    const double rate = elapsed > 0.0 ? static_cast<double>(ctx.result.filesProcessed) / elapsed : 0.0;

    pushLog(LogLevel::Info, "Extraction complete. Processed " + std::to_string(ctx.result.filesProcessed)
                                + " files. Results written to " + m_request.outputPath.string() + ".");

    std::ostringstream metrics;
    metrics << std::fixed << std::setprecision(2)
            << "Extraction metrics: processed=" << ctx.result.filesProcessed
            << ", elapsed=" << elapsed << "s"
            << ", rate=" << rate << " files/s"
            << ", max_queue_depth=" << m_channel->maxDepth();
    if (m_logger) m_logger->info("[ExtractionEngine] {}", metrics.str());
    pushLog(LogLevel::Info, metrics.str());

    return finish(ctx, RunOutcome::Completed);
}

void ExtractionEngine::processAll(RunContext& ctx) {
    DirectoryWalker walker(m_request);
    StreamingFileTransfer transfer(m_request, *m_channel, *m_token, m_logger);
    auto& result = ctx.result;

    auto handleFile = [&](const domain::FileCandidate& candidate) {
        if (m_token->isCancelled()) {
            ctx.cancelled = true;
            return WalkControl::Stop;
        }
        if (result.filesProcessed + result.filesSkipped >= result.totalFiles) {
            std::string text = candidate.path.string() + " appeared after the scan; not processed";
            result.errors.push_back(domain::FileError{candidate.path.string(), ErrorKind::IOError, text});
            if (m_logger) m_logger->warn("[ExtractionEngine] {}", text);
            pushLog(LogLevel::Warning, text);
            return WalkControl::Continue;
        }

        TransferOutcome outcome = transfer.transfer(candidate, *ctx.writer);
        if (outcome.ok()) {
            ++result.filesProcessed;
            result.bytesWritten += outcome.bytesWritten;
            auto& stats = result.extensionSummary[candidate.extension];
            ++stats.count;
            stats.totalBytes += candidate.sizeBytes;
            result.fileDetails.push_back(domain::FileDetail{candidate.path.string(), candidate.sizeBytes,
                                                            outcome.sha256, candidate.extension,
                                                            std::chrono::system_clock::now()});
            m_channel->push(domain::MakeProgress(result.filesProcessed, result.totalFiles,
                                                 candidate.relativePath.generic_string()));
            return WalkControl::Continue;
        }
        if (outcome.status == TransferStatus::Cancelled) {
            ctx.cancelled = true;
            return WalkControl::Stop;
        }
        if (outcome.destinationFailure) {
            ctx.destinationError = outcome.message;
            return WalkControl::Stop;
        }

        ++result.filesSkipped;
        result.errors.push_back(domain::FileError{candidate.path.string(), ToErrorKind(outcome.status), outcome.message});
        if (m_logger) m_logger->error("[ExtractionEngine] {}", outcome.message);
        pushLog(LogLevel::Error, outcome.message);
        return WalkControl::Continue;
    };

    for (const auto& candidate : walker.priorityCandidates()) {
        if (handleFile(candidate) == WalkControl::Stop) return;
    }

    bool finished = walker.walk(
        handleFile,
        [&](const TraversalError& error) {
            result.errors.push_back(error);
            std::string text = "Skipping unreadable path " + error.path + ": " + error.message;
            if (m_logger) m_logger->warn("[ExtractionEngine] {}", text);
            pushLog(LogLevel::Warning, text);
        },
        [this] { return m_token->isCancelled(); },
        true);

    if (!finished && ctx.destinationError.empty() && m_token->isCancelled()) {
        ctx.cancelled = true;
    }
}

domain::TerminalResult ExtractionEngine::finish(RunContext& ctx, RunOutcome outcome) {
    switch (outcome) {
        case RunOutcome::Completed: setState(EngineState::Completed); break;
        case RunOutcome::Cancelled: setState(EngineState::Cancelled); break;
        case RunOutcome::Failed: setState(EngineState::Failed); break;
    }

    auto& result = ctx.result;
    result.outcome = outcome;
    result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - ctx.startedAt);

    if (m_logger) {
        m_logger->info("[ExtractionEngine] Run {}: {}/{} files processed, {} skipped, {} bytes written, {} errors",
                       domain::OutcomeToString(outcome), result.filesProcessed, result.totalFiles,
                       result.filesSkipped, result.bytesWritten, result.errors.size());
    }

    m_channel->push(domain::StateMessage{result});
    result.droppedMessages = m_channel->droppedMessages();
    result.maxQueueDepth = m_channel->maxDepth();
    return result;
}

domain::TerminalResult ExtractionEngine::fail(RunContext& ctx, ErrorKind kind, const std::string& reason) {
    if (ctx.writer && ctx.writer->isOpen() && !ctx.writer->close() && m_logger) {
        m_logger->warn("[ExtractionEngine] Closing output after failure: {}", ctx.writer->lastError());
    }
    ctx.result.failureKind = kind;
    ctx.result.failureReason = reason;
    if (m_logger) m_logger->error("[ExtractionEngine] Extraction failed: {}", reason);
    pushLog(LogLevel::Error, "Error during extraction: " + reason);
    return finish(ctx, RunOutcome::Failed);
}

} // namespace fileextractor::application
