#pragma once

#include "connection_state_machine.h"
#include "session_error.h"
#include "transfer_types.h"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

class EventLoop;
class FileArtifactStore;
class SessionCoordinator;
class TcpTransport;

// Point-in-time view of the session for the CLI.
struct NodeStatus {
    std::string local_id;
    ConnectionState connection_state = ConnectionState::DISCONNECTED;
    std::string remote_id;

    TransferDirection transfer_direction = TransferDirection::NONE;
    TransferState transfer_state = TransferState::IDLE;
    uint8_t transfer_progress = 0;
    std::string transfer_file;

    SessionError last_error;

    bool has_artifact = false;
    FileInfo artifact_info;
    std::string artifact_path;
};

/**
 * @brief Desktop wrapper around the session engine.
 *
 * Owns the TCP transport, the artifact store, the EventLoop and the
 * SessionCoordinator, and runs the loop on its own thread. Public methods
 * may be called from any thread: they post the work to the loop and wait
 * for the result.
 */
class PeerNode {
public:
    PeerNode();
    ~PeerNode();

    // port < 0 keeps signaling.listen_port from the configuration.
    bool start(int port = -1);
    void stop();
    bool isRunning() const { return running_; }
    std::string getPeerId() const;

    bool connectToPeer(const std::string& peer_id, std::string* error = nullptr);
    bool disconnect(std::string* error = nullptr);
    bool sendFile(const std::string& path, std::string* error = nullptr);
    bool discardArtifact();
    NodeStatus getStatus();

    // Desktop UI integration. Invoked on the event loop thread.
    void setEventCallbacks(
        std::function<void(ConnectionState state, const std::string& remote_id)> on_connection,
        std::function<void(TransferDirection direction, TransferState state, uint8_t progress)> on_transfer,
        std::function<void(const SessionError& error)> on_error,
        std::function<void(const FileInfo& info, const std::string& path)> on_artifact);

    void clearEventCallbacks();

private:
    // Runs fn on the loop thread and waits for it.
    void runOnLoop(std::function<void()> fn);
    void installObserver();

    std::atomic<bool> running_{false};
    std::string peer_id_;

    std::unique_ptr<TcpTransport> transport_;
    std::unique_ptr<FileArtifactStore> store_;
    std::unique_ptr<EventLoop> loop_;
    std::unique_ptr<SessionCoordinator> coordinator_;
    std::thread loop_thread_;

    // Callbacks for desktop UI (protected by callbacks_mutex_)
    mutable std::mutex callbacks_mutex_;
    std::function<void(ConnectionState, const std::string&)> on_connection_cb_;
    std::function<void(TransferDirection, TransferState, uint8_t)> on_transfer_cb_;
    std::function<void(const SessionError&)> on_error_cb_;
    std::function<void(const FileInfo&, const std::string&)> on_artifact_cb_;
};
