/**
 * @file ExtractorService.hpp
 * @brief Runs extractions on a dedicated background worker.
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include "application/ExtractionEngine.hpp"
#include "application/StatusChannel.hpp"
#include "domain/CancellationToken.hpp"
#include "domain/ExtractionRequest.hpp"
#include "domain/StatusMessage.hpp"

namespace spdlog {
class logger;
}

namespace fileextractor::application {

/// Default capacity of a run's status channel.
inline constexpr std::size_t kDefaultQueueCapacity = 256;

/**
 * @class ExtractionRun
 * @brief Handle to one extraction executing on its own worker thread.
 *
 * Owns the run's status channel and cancellation token. The worker is
 * joined by wait() or, at the latest, by the destructor.
 */
class ExtractionRun {
public:
    ExtractionRun(domain::ExtractionRequest request, std::size_t queueCapacity,
                  std::shared_ptr<spdlog::logger> logger);
    ~ExtractionRun();

    ExtractionRun(const ExtractionRun&) = delete;
    ExtractionRun& operator=(const ExtractionRun&) = delete;

    /** @brief Channel the consumer drains until the State message arrives. */
    std::shared_ptr<StatusChannel> channel() const { return m_channel; }

    /** @brief Requests cooperative cancellation. */
    void cancel() { m_token->cancel(); }

    bool isCancellationRequested() const { return m_token->isCancelled(); }

    bool isRunning() const;

    /** @brief Blocks until the worker has finished. */
    void wait();

    /** @brief Waits up to timeout; returns true when the worker has finished. */
    bool waitFor(std::chrono::milliseconds timeout);

    EngineState state() const { return m_engine->state(); }

    /** @brief Terminal result once the run has finished. */
    std::optional<domain::TerminalResult> result() const;

private:
    friend class ExtractorService;

    void start();
    void workerLoop();
    void join();

    std::shared_ptr<StatusChannel> m_channel;
    std::shared_ptr<domain::CancellationToken> m_token;
    std::unique_ptr<ExtractionEngine> m_engine;
    std::shared_ptr<spdlog::logger> m_logger;

    std::thread m_worker;
    std::mutex m_joinMutex;
    mutable std::mutex m_mutex;
    std::condition_variable m_doneCv;
    bool m_finished = false;
    std::optional<domain::TerminalResult> m_result;
};

/**
 * @class ExtractorService
 * @brief Starts at most one extraction at a time and keeps the latest run.
 */
class ExtractorService {
public:
    explicit ExtractorService(std::shared_ptr<spdlog::logger> logger = nullptr,
                              std::size_t queueCapacity = kDefaultQueueCapacity);
    ~ExtractorService();

    /**
     * @brief Starts a run on a new worker thread.
     * @throws std::runtime_error when the previous run is still active.
     * @throws std::invalid_argument when the queue capacity is zero.
     */
    std::shared_ptr<ExtractionRun> start(domain::ExtractionRequest request);

    bool isRunning() const;

    /** @brief Cancels the active run, if any. */
    void cancel();

    /** @brief Terminal result of the most recent finished run. */
    std::optional<domain::TerminalResult> lastResult() const;

private:
    std::shared_ptr<spdlog::logger> m_logger;
    std::size_t m_queueCapacity;
    mutable std::mutex m_mutex;
    std::shared_ptr<ExtractionRun> m_current;
};

} // namespace fileextractor::application
