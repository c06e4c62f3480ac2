#ifndef SESSION_COORDINATOR_H
#define SESSION_COORDINATOR_H

#include "artifact_store.h"
#include "connection_state_machine.h"
#include "event_loop.h"
#include "local_file.h"
#include "session_error.h"
#include "session_events.h"
#include "signaling_service.h"
#include "transfer_receiver.h"
#include "transfer_sender.h"
#include "transfer_types.h"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

// Presentation-layer hooks. All are invoked on the event loop thread.
struct SessionObserver {
    std::function<void(ConnectionState state, const std::string& remote_id)> on_connection_state;
    std::function<void(TransferDirection direction, TransferState state, uint8_t progress)> on_transfer;
    std::function<void(const SessionError& error)> on_error;
    std::function<void(const ReceivedArtifact& artifact)> on_artifact;
};

/**
 * @brief Single owner of the live connection and the current transfer.
 *
 * At most one connection (an inbound request while one exists is rejected)
 * and at most one active transfer in either direction. Inbound messages are
 * routed to the TransferReceiver, user sends to a TransferSender. Every
 * method must be called on the thread that runs the EventLoop; other
 * threads post work with EventLoop::pushEvent(DeferredTaskEvent{...}).
 */
class SessionCoordinator {
public:
    SessionCoordinator(EventLoop& loop,
                       ISignalingService& signaling,
                       IArtifactStore& store,
                       TransferConfig transfer_config,
                       std::chrono::milliseconds connect_timeout,
                       size_t channel_capacity = 4096);
    ~SessionCoordinator();

    SessionCoordinator(const SessionCoordinator&) = delete;
    SessionCoordinator& operator=(const SessionCoordinator&) = delete;

    void setObserver(SessionObserver observer) { m_observer = std::move(observer); }

    // Obtains the local identity once. On failure the coordinator stays
    // uninitialised and initialize() may be retried.
    bool initialize();
    bool isInitialized() const { return !m_local_id.empty(); }

    bool connectToPeer(const std::string& remote_id);
    bool acceptConnection(std::shared_ptr<ITransportConnection> connection);
    bool disconnect();

    bool sendFile(LocalFile file);
    bool sendFile(const std::string& path);

    // Releases the held artifact and its backing resource. No-op without one.
    bool discardArtifact();

    // EventLoop entry point.
    void handleEvent(const SessionEvent& event);

    // Snapshot accessors
    uint64_t instanceId() const { return m_instance_id; }
    const std::string& localId() const { return m_local_id; }
    ConnectionState connectionState() const { return m_ctx.state; }
    std::string remoteId() const;
    uint64_t connectionId() const { return m_ctx.connection_id; }
    TransferDirection transferDirection() const { return m_direction; }
    TransferState transferState() const;
    uint8_t transferProgress() const;
    const FileInfo* transferFileInfo() const;
    bool isTransferActive() const;
    const SessionError& lastError() const { return m_last_error; }
    const ReceivedArtifact* artifact() const { return m_artifact ? &*m_artifact : nullptr; }

private:
    void beginConnection(std::shared_ptr<ITransportConnection> connection,
                         const std::string& remote_id, bool outbound, ConnectionEvent event);
    void driveConnection(ConnectionEvent event, SessionErrorKind error_kind = SessionErrorKind::NONE,
                         const std::string& error_message = "");
    void releaseConnection();

    void onChannelEvent(const ChannelEvent& event);
    void onConnectTimeout(const ConnectTimeoutEvent& event);
    void onSenderResume(const SenderResumeEvent& event);
    void onInboundMessage(const std::string& payload);

    void continueSending();
    void abortTransfer(const std::string& reason);
    void finishReceive();
    void releaseArtifact();

    bool rejectRequest(const std::string& message);
    void reportError(SessionErrorKind kind, const std::string& message);
    void notifyConnectionState();
    void notifyTransfer();

    std::string timeoutTimerId() const;
    std::string resumeTimerId() const;

    // Unique for the process lifetime; names this coordinator's timers.
    const uint64_t m_instance_id;
    EventLoop& m_loop;
    ISignalingService& m_signaling;
    IArtifactStore& m_store;
    const TransferConfig m_transfer_config;
    const std::chrono::milliseconds m_connect_timeout;
    const size_t m_channel_capacity;

    std::string m_local_id;

    // Connection
    ConnectionStateMachine m_fsm;
    ConnectionContext m_ctx;
    std::shared_ptr<ITransportConnection> m_connection;
    std::shared_ptr<ConnectionChannel> m_channel;
    uint64_t m_next_connection_id = 0;

    // Transfer
    TransferDirection m_direction = TransferDirection::NONE;
    std::unique_ptr<TransferSender> m_sender;
    TransferReceiver m_receiver;
    uint64_t m_transfer_id = 0;

    std::optional<ReceivedArtifact> m_artifact;
    SessionError m_last_error;
    SessionObserver m_observer;
};

#endif // SESSION_COORDINATOR_H
