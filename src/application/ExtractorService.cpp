/**
 * @file ExtractorService.cpp
 * @brief Implementation of ExtractionRun and ExtractorService.
 */

#include "application/ExtractorService.hpp"

#include <stdexcept>

#include <spdlog/spdlog.h>

namespace fileextractor::application {

ExtractionRun::ExtractionRun(domain::ExtractionRequest request, std::size_t queueCapacity,
                             std::shared_ptr<spdlog::logger> logger)
    : m_channel(std::make_shared<StatusChannel>(queueCapacity)),
      m_token(std::make_shared<domain::CancellationToken>()),
      m_logger(std::move(logger)) {
    m_engine = std::make_unique<ExtractionEngine>(std::move(request), m_channel, m_token, m_logger);
}

ExtractionRun::~ExtractionRun() {
    join();
}

void ExtractionRun::start() {
    m_worker = std::thread(&ExtractionRun::workerLoop, this);
}

void ExtractionRun::workerLoop() {
    domain::TerminalResult result;
    try {
        result = m_engine->run();
    } catch (const std::exception& e) {
        // The engine reports its own failures; this only guards the thread boundary.
        if (m_logger) m_logger->critical("[ExtractionRun] Worker terminated: {}", e.what());
        result.outcome = domain::RunOutcome::Failed;
        result.failureReason = e.what();
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_result = std::move(result);
        m_finished = true;
    }
    m_doneCv.notify_all();
}

void ExtractionRun::join() {
    std::lock_guard<std::mutex> lock(m_joinMutex);
    if (m_worker.joinable()) {
        m_worker.join();
    }
}

bool ExtractionRun::isRunning() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return !m_finished;
}

void ExtractionRun::wait() {
    join();
}

bool ExtractionRun::waitFor(std::chrono::milliseconds timeout) {
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        if (!m_doneCv.wait_for(lock, timeout, [this] { return m_finished; })) {
            return false;
        }
    }
    join();
    return true;
}

std::optional<domain::TerminalResult> ExtractionRun::result() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_result;
}

ExtractorService::ExtractorService(std::shared_ptr<spdlog::logger> logger, std::size_t queueCapacity)
    : m_logger(std::move(logger)), m_queueCapacity(queueCapacity) {}

ExtractorService::~ExtractorService() {
    std::shared_ptr<ExtractionRun> current;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        current = m_current;
    }
    if (current && current->isRunning()) {
        current->cancel();
        current->wait();
    }
}

std::shared_ptr<ExtractionRun> ExtractorService::start(domain::ExtractionRequest request) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_current && m_current->isRunning()) {
        throw std::runtime_error("Extraction already in progress");
    }

    auto run = std::make_shared<ExtractionRun>(std::move(request), m_queueCapacity, m_logger);
    run->start();
    m_current = run;
    if (m_logger) m_logger->info("[ExtractorService] Extraction worker started");
    return run;
}

bool ExtractorService::isRunning() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_current && m_current->isRunning();
}

void ExtractorService::cancel() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_current || !m_current->isRunning()) return;
    m_current->cancel();
    if (m_logger) m_logger->info("[ExtractorService] Extraction cancellation requested by user");
}

std::optional<domain::TerminalResult> ExtractorService::lastResult() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_current) return std::nullopt;
    return m_current->result();
}

} // namespace fileextractor::application
