#ifndef SESSION_ERROR_H
#define SESSION_ERROR_H

#include <string>

enum class SessionErrorKind {
    NONE,
    IDENTITY_INIT_FAILURE,   // Signaling could not allocate an identity; user retries
    CONNECTION_TIMEOUT,      // Connecting did not complete in time
    CONNECTION_ERROR,        // Transport fault; connection torn down
    TRANSFER_ABORTED,        // Connection lost mid send/receive
    PROTOCOL_ERROR,          // Bad or unexpected message; connection kept
    INVALID_REQUEST,         // Operation not allowed in the current state
    STORAGE_FAILURE          // Received file could not be saved
};

struct SessionError {
    SessionErrorKind kind = SessionErrorKind::NONE;
    std::string message;

    bool empty() const { return kind == SessionErrorKind::NONE; }
};

inline const char* session_error_kind_to_string(SessionErrorKind kind) {
    switch (kind) {
        case SessionErrorKind::NONE: return "NONE";
        case SessionErrorKind::IDENTITY_INIT_FAILURE: return "IDENTITY_INIT_FAILURE";
        case SessionErrorKind::CONNECTION_TIMEOUT: return "CONNECTION_TIMEOUT";
        case SessionErrorKind::CONNECTION_ERROR: return "CONNECTION_ERROR";
        case SessionErrorKind::TRANSFER_ABORTED: return "TRANSFER_ABORTED";
        case SessionErrorKind::PROTOCOL_ERROR: return "PROTOCOL_ERROR";
        case SessionErrorKind::INVALID_REQUEST: return "INVALID_REQUEST";
        case SessionErrorKind::STORAGE_FAILURE: return "STORAGE_FAILURE";
    }
    return "UNKNOWN";
}

#endif // SESSION_ERROR_H
