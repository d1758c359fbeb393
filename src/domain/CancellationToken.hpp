/**
 * @file CancellationToken.hpp
 * @brief Cooperative cancellation flag shared between a caller and a run.
 */

#pragma once

#include <atomic>

namespace fileextractor::domain {

/**
 * @class CancellationToken
 * @brief Set-once flag. A fresh token is created for every run and never reset.
 */
class CancellationToken {
public:
    CancellationToken() = default;
    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    /** @brief Requests cancellation. Idempotent. */
    void cancel() noexcept { m_cancelled.store(true, std::memory_order_release); }

    bool isCancelled() const noexcept { return m_cancelled.load(std::memory_order_acquire); }

private:
    std::atomic<bool> m_cancelled{false};
};

} // namespace fileextractor::domain
