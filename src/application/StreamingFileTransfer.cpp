/**
 * @file StreamingFileTransfer.cpp
 * @brief Implementation of StreamingFileTransfer.
 */

#include "application/StreamingFileTransfer.hpp"
#include "application/Utf8Validator.hpp"
#include "infrastructure/Sha256Hasher.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <system_error>
#include <vector>

#include <spdlog/spdlog.h>

namespace fileextractor::application {

namespace {

const std::string kSeparator = "\n\n\n";

} // namespace

StreamingFileTransfer::StreamingFileTransfer(const domain::ExtractionRequest& request,
                                             StatusChannel& channel,
                                             const domain::CancellationToken& token,
                                             std::shared_ptr<spdlog::logger> logger)
    : m_request(request), m_channel(channel), m_token(token), m_logger(std::move(logger)) {}

TransferOutcome StreamingFileTransfer::fail(infrastructure::DestinationWriter& writer, std::uintmax_t start,
                                            TransferStatus status, std::string message, bool destinationFailure) {
    if (!writer.rollbackTo(start) && m_logger) {
        m_logger->warn("[StreamingFileTransfer] Rollback failed: {}", writer.lastError());
    }
    TransferOutcome outcome;
    outcome.status = status;
    outcome.message = std::move(message);
    outcome.destinationFailure = destinationFailure;
    return outcome;
}

TransferOutcome StreamingFileTransfer::transfer(const domain::FileCandidate& candidate,
                                                infrastructure::DestinationWriter& writer) {
    const std::string displayPath = candidate.path.string();

    if (m_token.isCancelled()) {
        return TransferOutcome{TransferStatus::Cancelled, 0, "Cancelled before " + displayPath, false};
    }

    if (m_request.sizeWarningThreshold && candidate.sizeBytes > *m_request.sizeWarningThreshold) {
        std::string text = "Processing large file beyond configured threshold: " + displayPath + " ("
                           + std::to_string(candidate.sizeBytes) + " bytes > "
                           + std::to_string(*m_request.sizeWarningThreshold) + " bytes)";
        if (m_logger) m_logger->warn("[StreamingFileTransfer] {}", text);
        m_channel.push(domain::MakeLog(domain::LogLevel::Warning, std::move(text)));
    }

    errno = 0;
    std::ifstream source(candidate.path, std::ios::in | std::ios::binary);
    if (!source.is_open()) {
        std::error_code ec(errno, std::generic_category());
        TransferOutcome outcome;
        outcome.status = (ec == std::errc::permission_denied) ? TransferStatus::PermissionDenied
                                                              : TransferStatus::IOError;
        outcome.message = "Cannot open " + displayPath + (errno != 0 ? ": " + ec.message() : "");
        return outcome;
    }

    infrastructure::Sha256Hasher hasher;
    const std::uintmax_t start = writer.position();
    const std::string header = candidate.relativePath.generic_string() + ":\n";
    if (!writer.write(header)) {
        return fail(writer, start, TransferStatus::IOError, writer.lastError(), true);
    }

    Utf8Validator validator;
    std::vector<char> buffer(m_request.chunkSize > 0 ? m_request.chunkSize : domain::kDefaultChunkSize);

    while (true) {
        if (m_token.isCancelled()) {
            return fail(writer, start, TransferStatus::Cancelled, "Cancelled while processing " + displayPath);
        }

        source.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        const std::streamsize count = source.gcount();
        if (source.bad()) {
            return fail(writer, start, TransferStatus::IOError,
                        "Error reading " + displayPath + ": " + std::strerror(errno));
        }
        if (count <= 0) break;

        if (!validator.feed(buffer.data(), static_cast<std::size_t>(count))) {
            return fail(writer, start, TransferStatus::DecodeError,
                        "Cannot decode file " + displayPath + ": invalid UTF-8 at byte "
                            + std::to_string(validator.errorOffset()));
        }
        if (!hasher.update(buffer.data(), static_cast<std::size_t>(count))) {
            return fail(writer, start, TransferStatus::IOError, "Cannot hash " + displayPath);
        }
        if (!writer.write(buffer.data(), static_cast<std::size_t>(count))) {
            return fail(writer, start, TransferStatus::IOError, writer.lastError(), true);
        }
        if (m_logger) m_logger->trace("[StreamingFileTransfer] {}: {} bytes copied", displayPath, count);
        if (source.eof()) break;
    }

    if (!validator.finish()) {
        return fail(writer, start, TransferStatus::DecodeError,
                    "Cannot decode file " + displayPath + ": truncated UTF-8 sequence at end of file");
    }
    if (!writer.write(kSeparator) || !writer.flush()) {
        return fail(writer, start, TransferStatus::IOError, writer.lastError(), true);
    }

    TransferOutcome outcome;
    if (!hasher.finalHex(outcome.sha256)) {
        return fail(writer, start, TransferStatus::IOError, "Cannot hash " + displayPath);
    }
    outcome.bytesWritten = writer.position() - start;
    if (m_logger) m_logger->debug("[StreamingFileTransfer] Processed {} ({} bytes)", displayPath, outcome.bytesWritten);
    return outcome;
}

} // namespace fileextractor::application
