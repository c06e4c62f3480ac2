#ifndef CONNECTION_STATE_MACHINE_H
#define CONNECTION_STATE_MACHINE_H

#include <chrono>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <vector>

// =======================================================
// Authoritative Connection State (FSM owns this exclusively)
// =======================================================
enum class ConnectionState {
    DISCONNECTED,   // Initial and terminal
    CONNECTING,     // Outgoing or incoming attempt, timeout armed
    CONNECTED       // Transport reported open
};

// =======================================================
// FSM Input Events (external stimuli only)
// =======================================================
enum class ConnectionEvent {
    CONNECT_REQUESTED,
    INCOMING_ACCEPTED,
    TRANSPORT_OPEN,
    TRANSPORT_CLOSED,
    TRANSPORT_ERROR,
    TIMEOUT,
    DISCONNECT_REQUESTED
};

// =======================================================
// FSM Output Actions (INTENTS ONLY, executed by the coordinator)
// =======================================================
enum class ConnectionAction {
    START_TIMEOUT,
    CLEAR_TIMEOUT,
    CLOSE_TRANSPORT,
    ABORT_TRANSFER,
    REPORT_ERROR,
    CLEAR_ERROR,
    RELEASE_CONNECTION
};

// =======================================================
// FSM Result (pure description of what to do next)
// =======================================================
struct FSMResult {
    ConnectionState new_state;
    std::vector<ConnectionAction> actions;

    explicit FSMResult(ConnectionState state)
        : new_state(state) {}

    FSMResult(ConnectionState state, std::initializer_list<ConnectionAction> action_list)
        : new_state(state), actions(action_list) {}

    bool has(ConnectionAction action) const;
};

// =======================================================
// Connection Context
// =======================================================
struct ConnectionContext {
    uint64_t connection_id = 0;
    std::string remote_id;
    bool outbound = false;

    ConnectionState state = ConnectionState::DISCONNECTED;
    std::chrono::steady_clock::time_point last_state_change;

    ConnectionContext() = default;
    ConnectionContext(uint64_t id, const std::string& remote, bool is_outbound)
        : connection_id(id), remote_id(remote), outbound(is_outbound),
          last_state_change(std::chrono::steady_clock::now()) {}
};

// =======================================================
// Connection State Machine (PURE LOGIC ONLY)
// =======================================================
class ConnectionStateMachine {
public:
    // Pure FSM step:
    // (Context + Event) -> (New State + Actions)
    FSMResult handle_event(ConnectionContext& ctx, ConnectionEvent event);

private:
    // Transition table logic (NO side effects)
    FSMResult compute_transition(ConnectionState current, ConnectionEvent event) const;
};

const char* connection_state_to_string(ConnectionState state);
const char* connection_event_to_string(ConnectionEvent event);

#endif // CONNECTION_STATE_MACHINE_H
