/**
 * @file StreamingFileTransfer.hpp
 * @brief Chunked copy of one qualifying file into the run's output.
 */

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include "application/StatusChannel.hpp"
#include "domain/CancellationToken.hpp"
#include "domain/ExtractionRequest.hpp"
#include "domain/FileCandidate.hpp"
#include "infrastructure/DestinationWriter.hpp"

namespace spdlog {
class logger;
}

namespace fileextractor::application {

/**
 * @enum TransferStatus
 * @brief Result category of a single file transfer.
 */
enum class TransferStatus {
    Success,
    DecodeError,
    PermissionDenied,
    IOError,
    Cancelled
};

/**
 * @struct TransferOutcome
 * @brief What happened to one file.
 */
struct TransferOutcome {
    TransferStatus status = TransferStatus::Success;
    std::uintmax_t bytesWritten = 0;
    std::string message;
    bool destinationFailure = false; ///< The output stream itself failed.
    std::string sha256;              ///< Content digest, set on success.

    bool ok() const { return status == TransferStatus::Success; }
};

/**
 * @class StreamingFileTransfer
 * @brief Copies a file as `<relative path>:\n<content>\n\n\n` in bounded chunks.
 *
 * Files above the soft size threshold produce a warning and are still
 * copied. Content must be valid UTF-8 and is hashed with SHA-256 as it is
 * copied. Any failure, or a cancellation observed between chunks, rolls the
 * output back to where this file began.
 */
class StreamingFileTransfer {
public:
    StreamingFileTransfer(const domain::ExtractionRequest& request,
                          StatusChannel& channel,
                          const domain::CancellationToken& token,
                          std::shared_ptr<spdlog::logger> logger = nullptr);

    TransferOutcome transfer(const domain::FileCandidate& candidate, infrastructure::DestinationWriter& writer);

private:
    TransferOutcome fail(infrastructure::DestinationWriter& writer, std::uintmax_t start,
                         TransferStatus status, std::string message, bool destinationFailure = false);

    const domain::ExtractionRequest& m_request;
    StatusChannel& m_channel;
    const domain::CancellationToken& m_token;
    std::shared_ptr<spdlog::logger> m_logger;
};

} // namespace fileextractor::application
