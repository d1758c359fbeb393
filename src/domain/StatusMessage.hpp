/**
 * @file StatusMessage.hpp
 * @brief Messages exchanged between an extraction run and its consumer.
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace fileextractor::domain {

/**
 * @enum LogLevel
 * @brief Severity of a Log status message.
 */
enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error
};

/**
 * @enum ErrorKind
 * @brief Error taxonomy of the engine.
 */
enum class ErrorKind {
    PermissionDenied, ///< Directory or file unreadable.
    DecodeError,      ///< Content is not valid UTF-8 text.
    IOError,          ///< Read or write failure.
    FolderNotFound    ///< Root folder missing at start.
};

/**
 * @enum RunOutcome
 * @brief Terminal state of a run.
 */
enum class RunOutcome {
    Completed,
    Cancelled,
    Failed
};

inline std::string LogLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warning: return "warning";
        case LogLevel::Error: return "error";
        default: return "unknown";
    }
}

inline std::string ErrorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::PermissionDenied: return "PermissionDenied";
        case ErrorKind::DecodeError: return "DecodeError";
        case ErrorKind::IOError: return "IOError";
        case ErrorKind::FolderNotFound: return "FolderNotFound";
        default: return "Unknown";
    }
}

inline std::string OutcomeToString(RunOutcome outcome) {
    switch (outcome) {
        case RunOutcome::Completed: return "completed";
        case RunOutcome::Cancelled: return "cancelled";
        case RunOutcome::Failed: return "failed";
        default: return "unknown";
    }
}

/**
 * @struct FileError
 * @brief A per-file or per-directory failure recorded during a run.
 */
struct FileError {
    std::string path;
    ErrorKind kind = ErrorKind::IOError;
    std::string message;
};

/**
 * @struct ExtensionStats
 * @brief Aggregate of processed files sharing one extension.
 */
struct ExtensionStats {
    std::size_t count = 0;
    std::uintmax_t totalBytes = 0; ///< Sum of source file sizes.
};

/**
 * @struct FileDetail
 * @brief One successfully transferred file.
 */
struct FileDetail {
    std::string path;                  ///< Absolute source path.
    std::uintmax_t sizeBytes = 0;
    std::string sha256;                ///< Lower-case hex digest of the content.
    std::string extension;             ///< Canonical extension, empty when none.
    std::chrono::system_clock::time_point processedAt;
};

/**
 * @struct ProgressSnapshot
 * @brief Progress of the processing pass. total never changes once published.
 */
struct ProgressSnapshot {
    std::size_t processed = 0;
    std::size_t total = 0;
    std::string currentPath;
};

/**
 * @struct TerminalResult
 * @brief Aggregate statistics delivered with the terminal State message.
 */
struct TerminalResult {
    RunOutcome outcome = RunOutcome::Completed;
    std::string failureReason;                ///< Set for Failed runs only.
    std::optional<ErrorKind> failureKind;     ///< Set for Failed runs only.
    std::size_t filesProcessed = 0;
    std::size_t filesSkipped = 0;             ///< Qualifying files that failed to transfer.
    std::size_t totalFiles = 0;               ///< Qualifying files counted by the scan.
    std::uintmax_t bytesWritten = 0;
    std::chrono::milliseconds elapsed{0};
    std::vector<FileError> errors;
    std::size_t droppedMessages = 0;          ///< Log messages lost to backpressure.
    std::size_t maxQueueDepth = 0;
    std::map<std::string, ExtensionStats> extensionSummary;
    std::vector<FileDetail> fileDetails;      ///< In transfer order.
};

struct LogMessage {
    LogLevel level = LogLevel::Info;
    std::string text;
};

struct ProgressMessage {
    ProgressSnapshot snapshot;
};

struct StateMessage {
    TerminalResult result;
};

/// Tagged union carried by the status channel.
using StatusMessage = std::variant<LogMessage, ProgressMessage, StateMessage>;

/**
 * @enum MessageClass
 * @brief Eviction class of a StatusMessage.
 */
enum class MessageClass {
    Log,
    Progress,
    State
};

inline MessageClass ClassOf(const StatusMessage& message) {
    if (std::holds_alternative<LogMessage>(message)) return MessageClass::Log;
    if (std::holds_alternative<ProgressMessage>(message)) return MessageClass::Progress;
    return MessageClass::State;
}

inline StatusMessage MakeLog(LogLevel level, std::string text) {
    return LogMessage{level, std::move(text)};
}

inline StatusMessage MakeProgress(std::size_t processed, std::size_t total, std::string currentPath) {
    return ProgressMessage{ProgressSnapshot{processed, total, std::move(currentPath)}};
}

} // namespace fileextractor::domain
