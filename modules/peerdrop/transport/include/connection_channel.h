#ifndef CONNECTION_CHANNEL_H
#define CONNECTION_CHANNEL_H

#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <variant>

// --- Transport reported the link usable ---
struct TransportOpenEvent {};

// --- One discrete message delivered by the transport ---
struct TransportDataEvent {
    std::string payload;
};

// --- Orderly close (carries no message) ---
struct TransportClosedEvent {};

// --- Transport fault ---
struct TransportErrorEvent {
    std::string message;
};

using TransportEvent = std::variant<
    TransportOpenEvent,
    TransportDataEvent,
    TransportClosedEvent,
    TransportErrorEvent
>;

/**
 * @brief Bounded FIFO of transport events for exactly one connection.
 *
 * Transport threads push; the event loop thread pops. Capacity bounds data
 * events only: open/close/error are always admitted so the connection
 * lifecycle can never stall behind a full queue. Once closed, pushes are
 * dropped and pending events are discarded.
 */
class ConnectionChannel {
public:
    ConnectionChannel(uint64_t connection_id, size_t capacity);

    uint64_t id() const { return m_id; }
    size_t capacity() const { return m_capacity; }

    // Returns false when the channel is closed or a data event does not fit.
    bool push(TransportEvent event);
    bool pop(TransportEvent& out);

    size_t size() const;
    bool empty() const;

    void close();
    bool isClosed() const;

    // Invoked (outside the channel lock) after every accepted push.
    void setNotifier(std::function<void()> notifier);

private:
    const uint64_t m_id;
    const size_t m_capacity;

    mutable std::mutex m_mutex;
    std::deque<TransportEvent> m_events;
    size_t m_data_events = 0;
    bool m_closed = false;
    std::function<void()> m_notifier;
};

#endif // CONNECTION_CHANNEL_H
