/**
 * @file StatusChannel.hpp
 * @brief Bounded status queue between an extraction run and its consumer.
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>
#include "domain/StatusMessage.hpp"

namespace fileextractor::application {

/**
 * @class StatusChannel
 * @brief Bounded FIFO with a non-blocking producer and a timed consumer.
 *
 * When full, a push evicts instead of blocking:
 * - State evicts the oldest Log, else the oldest Progress, and always succeeds;
 * - Progress evicts the oldest Log, else the oldest Progress (coalescing);
 * - Log evicts the oldest Log, and is dropped when no Log is queued.
 * Every Log lost this way is counted in droppedMessages(). The final count
 * and the peak depth are stamped into the TerminalResult of the State message.
 */
class StatusChannel {
public:
    /** @throws std::invalid_argument when capacity is zero. */
    explicit StatusChannel(std::size_t capacity);

    StatusChannel(const StatusChannel&) = delete;
    StatusChannel& operator=(const StatusChannel&) = delete;

    /**
     * @brief Enqueues a message without blocking.
     * @throws std::logic_error when called after the State message was pushed.
     */
    void push(domain::StatusMessage message);

    /**
     * @brief Waits up to timeout for the next message.
     * @return The message, or nullopt when the timeout elapsed first.
     */
    std::optional<domain::StatusMessage> pop(std::chrono::milliseconds timeout);

    /** @brief Non-blocking pop. */
    std::optional<domain::StatusMessage> tryPop();

    /** @brief Pops everything currently queued. */
    std::vector<domain::StatusMessage> drain();

    std::size_t size() const;
    std::size_t capacity() const { return m_capacity; }
    std::size_t droppedMessages() const;
    std::size_t coalescedProgress() const;
    std::size_t maxDepth() const;

    /** @brief True once the State message has been pushed. */
    bool terminalPushed() const;

    /** @brief True once the consumer has popped the State message. */
    bool terminalDelivered() const;

private:
    bool evictOldest(domain::MessageClass messageClass);
    std::optional<domain::StatusMessage> takeFrontLocked();

    const std::size_t m_capacity;
    std::deque<domain::StatusMessage> m_queue;
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;

    std::size_t m_dropped = 0;
    std::size_t m_coalesced = 0;
    std::size_t m_maxDepth = 0;
    bool m_terminalPushed = false;
    bool m_terminalDelivered = false;
};

} // namespace fileextractor::application
