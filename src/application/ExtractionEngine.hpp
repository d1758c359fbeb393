/**
 * @file ExtractionEngine.hpp
 * @brief Orchestrates one extraction run: scan, process, report.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include "application/StatusChannel.hpp"
#include "domain/CancellationToken.hpp"
#include "domain/ExtractionRequest.hpp"
#include "domain/StatusMessage.hpp"

namespace spdlog {
class logger;
}

namespace fileextractor::application {

/**
 * @enum EngineState
 * @brief Lifecycle of an ExtractionEngine.
 */
enum class EngineState {
    Idle,
    Scanning,
    Processing,
    Completed,
    Cancelled,
    Failed
};

std::string EngineStateToString(EngineState state);

/**
 * @class ExtractionEngine
 * @brief Runs a single extraction synchronously on the calling thread.
 *
 * Idle -> Scanning -> Processing -> {Completed | Cancelled | Failed}.
 * Every run pushes exactly one State message to the channel, and it is
 * the last message pushed. Per-file failures are recorded and the run goes
 * on; only a missing root folder or a failing destination stream end the
 * run as Failed.
 */
class ExtractionEngine {
public:
    ExtractionEngine(domain::ExtractionRequest request,
                     std::shared_ptr<StatusChannel> channel,
                     std::shared_ptr<domain::CancellationToken> token,
                     std::shared_ptr<spdlog::logger> logger = nullptr);

    /**
     * @brief Executes the run.
     * @return The terminal result, identical to the one pushed in the State message
     *         apart from the channel counters stamped at push time.
     * @throws std::logic_error when called more than once.
     */
    domain::TerminalResult run();

    /** @brief Current state; safe to call from any thread. */
    EngineState state() const { return m_state.load(); }

private:
    struct RunContext;

    domain::TerminalResult execute(RunContext& ctx);
    void processAll(RunContext& ctx);
    domain::TerminalResult finish(RunContext& ctx, domain::RunOutcome outcome);
    domain::TerminalResult fail(RunContext& ctx, domain::ErrorKind kind, const std::string& reason);

    void setState(EngineState state);
    void pushLog(domain::LogLevel level, const std::string& text);

    const domain::ExtractionRequest m_request;
    std::shared_ptr<StatusChannel> m_channel;
    std::shared_ptr<domain::CancellationToken> m_token;
    std::shared_ptr<spdlog::logger> m_logger;
    std::atomic<EngineState> m_state{EngineState::Idle};
};

} // namespace fileextractor::application
