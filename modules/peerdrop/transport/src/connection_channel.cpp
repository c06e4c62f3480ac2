#include "connection_channel.h"
#include "logger.h"

ConnectionChannel::ConnectionChannel(uint64_t connection_id, size_t capacity)
    : m_id(connection_id), m_capacity(capacity == 0 ? 1 : capacity) {}

bool ConnectionChannel::push(TransportEvent event) {
    std::function<void()> notifier;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_closed) {
            return false;
        }
        const bool is_data = std::holds_alternative<TransportDataEvent>(event);
        if (is_data) {
            if (m_data_events >= m_capacity) {
                LOG_WARN("CHAN: Channel " + std::to_string(m_id) + " full (" +
                         std::to_string(m_capacity) + " data events), rejecting push");
                return false;
            }
            ++m_data_events;
        }
        m_events.push_back(std::move(event));
        notifier = m_notifier;
    }
    if (notifier) {
        notifier();
    }
    return true;
}

bool ConnectionChannel::pop(TransportEvent& out) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_events.empty()) {
        return false;
    }
    out = std::move(m_events.front());
    m_events.pop_front();
    if (std::holds_alternative<TransportDataEvent>(out)) {
        --m_data_events;
    }
    return true;
}

size_t ConnectionChannel::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_events.size();
}

bool ConnectionChannel::empty() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_events.empty();
}

void ConnectionChannel::close() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_closed = true;
    m_events.clear();
    m_data_events = 0;
    m_notifier = nullptr;
}

bool ConnectionChannel::isClosed() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_closed;
}

void ConnectionChannel::setNotifier(std::function<void()> notifier) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_notifier = std::move(notifier);
}
