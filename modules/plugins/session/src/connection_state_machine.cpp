#include "connection_state_machine.h"
#include "logger.h"
#include <algorithm>

bool FSMResult::has(ConnectionAction action) const {
    return std::find(actions.begin(), actions.end(), action) != actions.end();
}

// ==========================================================
// FSM ENTRY POINT (PURE except timestamp update)
// ==========================================================
FSMResult ConnectionStateMachine::handle_event(ConnectionContext& ctx, ConnectionEvent event) {
    const ConnectionState old_state = ctx.state;

    FSMResult result = compute_transition(old_state, event);

    if (result.new_state != old_state) {
        ctx.state = result.new_state;
        ctx.last_state_change = std::chrono::steady_clock::now();

        LOG_INFO(
            std::string("CONN: ") +
            connection_state_to_string(old_state) +
            " --(" + connection_event_to_string(event) + ")--> " +
            connection_state_to_string(result.new_state) +
            " remote=" + ctx.remote_id +
            " id=" + std::to_string(ctx.connection_id)
        );
    }

    return result;
}

// ==========================================================
// PURE FSM TRANSITION TABLE (AUTHORITATIVE)
// ==========================================================
FSMResult ConnectionStateMachine::compute_transition(ConnectionState current,
                                                     ConnectionEvent event) const {
    switch (current) {

    // ------------------------------------------------------
    case ConnectionState::DISCONNECTED:
        if (event == ConnectionEvent::CONNECT_REQUESTED ||
            event == ConnectionEvent::INCOMING_ACCEPTED)
            return FSMResult(
                ConnectionState::CONNECTING,
                { ConnectionAction::START_TIMEOUT }
            );
        break;

    // ------------------------------------------------------
    case ConnectionState::CONNECTING:
        if (event == ConnectionEvent::TRANSPORT_OPEN)
            return FSMResult(
                ConnectionState::CONNECTED,
                { ConnectionAction::CLEAR_TIMEOUT, ConnectionAction::CLEAR_ERROR }
            );

        // The timer is gone once it fired; nothing to clear.
        if (event == ConnectionEvent::TIMEOUT)
            return FSMResult(
                ConnectionState::DISCONNECTED,
                { ConnectionAction::CLOSE_TRANSPORT,
                  ConnectionAction::REPORT_ERROR,
                  ConnectionAction::RELEASE_CONNECTION }
            );
        [[fallthrough]];

    // ------------------------------------------------------
    case ConnectionState::CONNECTED:
        if (event == ConnectionEvent::TRANSPORT_CLOSED)
            return FSMResult(
                ConnectionState::DISCONNECTED,
                { ConnectionAction::CLEAR_TIMEOUT,
                  ConnectionAction::ABORT_TRANSFER,
                  ConnectionAction::RELEASE_CONNECTION }
            );

        if (event == ConnectionEvent::TRANSPORT_ERROR)
            return FSMResult(
                ConnectionState::DISCONNECTED,
                { ConnectionAction::CLEAR_TIMEOUT,
                  ConnectionAction::ABORT_TRANSFER,
                  ConnectionAction::REPORT_ERROR,
                  ConnectionAction::RELEASE_CONNECTION }
            );

        if (event == ConnectionEvent::DISCONNECT_REQUESTED)
            return FSMResult(
                ConnectionState::DISCONNECTED,
                { ConnectionAction::CLEAR_TIMEOUT,
                  ConnectionAction::CLOSE_TRANSPORT,
                  ConnectionAction::ABORT_TRANSFER,
                  ConnectionAction::RELEASE_CONNECTION }
            );
        break;
    }

    LOG_DEBUG(
        std::string("CONN: Ignored transition ") +
        connection_state_to_string(current) +
        " + " + connection_event_to_string(event)
    );

    return FSMResult(current);
}

// ==========================================================
// DEBUG HELPERS
// ==========================================================
const char* connection_state_to_string(ConnectionState state) {
    switch (state) {
        case ConnectionState::DISCONNECTED: return "DISCONNECTED";
        case ConnectionState::CONNECTING: return "CONNECTING";
        case ConnectionState::CONNECTED: return "CONNECTED";
    }
    return "UNKNOWN";
}

const char* connection_event_to_string(ConnectionEvent event) {
    switch (event) {
        case ConnectionEvent::CONNECT_REQUESTED: return "CONNECT_REQUESTED";
        case ConnectionEvent::INCOMING_ACCEPTED: return "INCOMING_ACCEPTED";
        case ConnectionEvent::TRANSPORT_OPEN: return "TRANSPORT_OPEN";
        case ConnectionEvent::TRANSPORT_CLOSED: return "TRANSPORT_CLOSED";
        case ConnectionEvent::TRANSPORT_ERROR: return "TRANSPORT_ERROR";
        case ConnectionEvent::TIMEOUT: return "TIMEOUT";
        case ConnectionEvent::DISCONNECT_REQUESTED: return "DISCONNECT_REQUESTED";
    }
    return "UNKNOWN";
}
