#ifndef SESSION_EVENTS_H
#define SESSION_EVENTS_H

#include "connection_channel.h"
#include "transport_connection.h"
#include <cstdint>
#include <functional>
#include <memory>
#include <variant>

// --- A transport event drained from a connection's channel ---
struct ChannelEvent {
    uint64_t connection_id;
    TransportEvent event;
};

// --- The signaling service handed us an inbound connection ---
struct IncomingConnectionEvent {
    std::shared_ptr<ITransportConnection> connection;
};

// --- Connecting did not reach Connected in time ---
struct ConnectTimeoutEvent {
    uint64_t connection_id;
};

// --- A paced or back-pressured sender may continue ---
struct SenderResumeEvent {
    uint64_t transfer_id;
};

// --- Work posted from another thread (CLI commands) ---
struct DeferredTaskEvent {
    std::function<void()> task;
};

using SessionEvent = std::variant<
    ChannelEvent,
    IncomingConnectionEvent,
    ConnectTimeoutEvent,
    SenderResumeEvent,
    DeferredTaskEvent
>;

#endif // SESSION_EVENTS_H
