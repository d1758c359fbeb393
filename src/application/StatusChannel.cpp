/**
 * @file StatusChannel.cpp
 * @brief Implementation of StatusChannel.
 */

#include "application/StatusChannel.hpp"

#include <algorithm>
#include <stdexcept>

namespace fileextractor::application {

using domain::MessageClass;

StatusChannel::StatusChannel(std::size_t capacity) : m_capacity(capacity) {
    if (m_capacity == 0) {
        throw std::invalid_argument("StatusChannel capacity must be at least 1");
    }
}

void StatusChannel::push(domain::StatusMessage message) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_terminalPushed) {
            throw std::logic_error("StatusChannel: push after the terminal State message");
        }

        const MessageClass incoming = domain::ClassOf(message);

        if (m_queue.size() >= m_capacity) {
            switch (incoming) {
                case MessageClass::State:
                case MessageClass::Progress:
                    if (!evictOldest(MessageClass::Log)) {
                        evictOldest(MessageClass::Progress);
                    }
                    break;
                case MessageClass::Log:
                    if (!evictOldest(MessageClass::Log)) {
                        ++m_dropped;
                        return;
                    }
                    break;
            }
        }

        m_queue.push_back(std::move(message));
        m_maxDepth = std::max(m_maxDepth, m_queue.size());

        if (incoming == MessageClass::State) {
            m_terminalPushed = true;
            auto& state = std::get<domain::StateMessage>(m_queue.back());
            state.result.droppedMessages = m_dropped;
            state.result.maxQueueDepth = m_maxDepth;
        }
    }
    m_cv.notify_one();
}

bool StatusChannel::evictOldest(MessageClass messageClass) {
    auto it = std::find_if(m_queue.begin(), m_queue.end(), [messageClass](const domain::StatusMessage& m) {
        return domain::ClassOf(m) == messageClass;
    });
    if (it == m_queue.end()) {
        return false;
    }
    m_queue.erase(it);
    if (messageClass == MessageClass::Log) {
        ++m_dropped;
    } else if (messageClass == MessageClass::Progress) {
        ++m_coalesced;
    }
    return true;
}

std::optional<domain::StatusMessage> StatusChannel::takeFrontLocked() {
    if (m_queue.empty()) {
        return std::nullopt;
    }
    domain::StatusMessage message = std::move(m_queue.front());
    m_queue.pop_front();
    if (domain::ClassOf(message) == MessageClass::State) {
        m_terminalDelivered = true;
    }
    return message;
}

std::optional<domain::StatusMessage> StatusChannel::pop(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_cv.wait_for(lock, timeout, [this] { return !m_queue.empty(); });
    return takeFrontLocked();
}

std::optional<domain::StatusMessage> StatusChannel::tryPop() {
    std::lock_guard<std::mutex> lock(m_mutex);
    return takeFrontLocked();
}

std::vector<domain::StatusMessage> StatusChannel::drain() {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<domain::StatusMessage> drained;
    while (auto message = takeFrontLocked()) {
        drained.push_back(std::move(*message));
    }
    return drained;
}

std::size_t StatusChannel::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_queue.size();
}

std::size_t StatusChannel::droppedMessages() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_dropped;
}

std::size_t StatusChannel::coalescedProgress() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_coalesced;
}

std::size_t StatusChannel::maxDepth() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_maxDepth;
}

bool StatusChannel::terminalPushed() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_terminalPushed;
}

bool StatusChannel::terminalDelivered() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_terminalDelivered;
}

} // namespace fileextractor::application
