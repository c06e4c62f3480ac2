#include "session_coordinator.h"
#include "logger.h"
#include <atomic>
#include <stdexcept>
#include <type_traits>

namespace {
constexpr const char* kConnectionLost = "Connection lost during transfer";

uint64_t next_instance_id() {
    static std::atomic<uint64_t> counter{0};
    return ++counter;
}
}

SessionCoordinator::SessionCoordinator(EventLoop& loop,
                                       ISignalingService& signaling,
                                       IArtifactStore& store,
                                       TransferConfig transfer_config,
                                       std::chrono::milliseconds connect_timeout,
                                       size_t channel_capacity)
    : m_instance_id(next_instance_id()),
      m_loop(loop),
      m_signaling(signaling),
      m_store(store),
      m_transfer_config(transfer_config),
      m_connect_timeout(connect_timeout),
      m_channel_capacity(channel_capacity),
      m_receiver(transfer_config) {}

SessionCoordinator::~SessionCoordinator() {
    if (isInitialized()) {
        m_signaling.setIncomingConnectionCallback(nullptr);
    }
    m_loop.removeScheduledEvent(timeoutTimerId());
    m_loop.removeScheduledEvent(resumeTimerId());
    if (m_connection) {
        m_connection->close();
        releaseConnection();
    }
    // A saved artifact stays on disk; only an explicit discard releases it.
}

// ============================================================================
// USER OPERATIONS
// ============================================================================

bool SessionCoordinator::initialize() {
    if (isInitialized()) {
        return true;
    }

    std::string id;
    try {
        id = m_signaling.allocateIdentity();
    } catch (const std::exception& e) {
        reportError(SessionErrorKind::IDENTITY_INIT_FAILURE,
                    std::string("Failed to obtain a peer identity: ") + e.what());
        return false;
    }
    if (id.empty()) {
        reportError(SessionErrorKind::IDENTITY_INIT_FAILURE,
                    "Failed to obtain a peer identity: signaling returned an empty id");
        return false;
    }

    m_local_id = id;
    m_signaling.setIncomingConnectionCallback([this](std::shared_ptr<ITransportConnection> connection) {
        // Transport thread: hand over to the loop.
        m_loop.pushEvent(IncomingConnectionEvent{std::move(connection)});
    });
    if (m_last_error.kind == SessionErrorKind::IDENTITY_INIT_FAILURE) {
        m_last_error = {};
    }

    LOG_INFO("SESSION: Local peer id " + m_local_id);
    return true;
}

bool SessionCoordinator::connectToPeer(const std::string& remote_id) {
    if (!isInitialized()) {
        return rejectRequest("Cannot connect: no local peer identity yet");
    }
    if (remote_id.empty()) {
        return rejectRequest("Cannot connect: empty peer id");
    }
    if (remote_id == m_local_id) {
        return rejectRequest("Cannot connect to our own peer id");
    }
    if (m_ctx.state != ConnectionState::DISCONNECTED) {
        return rejectRequest(std::string("Cannot connect: already ") +
                             connection_state_to_string(m_ctx.state) + " to " + m_ctx.remote_id);
    }

    std::shared_ptr<ITransportConnection> connection;
    try {
        connection = m_signaling.connect(remote_id);
    } catch (const std::exception& e) {
        reportError(SessionErrorKind::CONNECTION_ERROR, std::string("Connection error: ") + e.what());
        return false;
    }
    if (!connection) {
        reportError(SessionErrorKind::CONNECTION_ERROR, "Connection error: no transport for " + remote_id);
        return false;
    }

    beginConnection(std::move(connection), remote_id, true, ConnectionEvent::CONNECT_REQUESTED);
    return true;
}

bool SessionCoordinator::acceptConnection(std::shared_ptr<ITransportConnection> connection) {
    if (!connection) {
        return false;
    }
    if (!isInitialized() || m_ctx.state != ConnectionState::DISCONNECTED) {
        LOG_WARN("SESSION: Rejecting incoming connection from " + connection->remotePeerId() +
                 " (state " + connection_state_to_string(m_ctx.state) + ")");
        connection->close();
        return false;
    }

    const std::string remote_id = connection->remotePeerId();
    beginConnection(std::move(connection), remote_id, false, ConnectionEvent::INCOMING_ACCEPTED);
    return true;
}

bool SessionCoordinator::disconnect() {
    if (m_ctx.state == ConnectionState::DISCONNECTED) {
        return rejectRequest("Not connected");
    }
    driveConnection(ConnectionEvent::DISCONNECT_REQUESTED);
    return true;
}

bool SessionCoordinator::sendFile(LocalFile file) {
    if (m_ctx.state != ConnectionState::CONNECTED || !m_connection) {
        return rejectRequest("Cannot send " + file.name + ": not connected to a peer");
    }
    if (isTransferActive()) {
        return rejectRequest("Cannot send " + file.name + ": a transfer is already in progress");
    }

    m_loop.removeScheduledEvent(resumeTimerId());
    ++m_transfer_id;
    m_direction = TransferDirection::SEND;
    m_sender = std::make_unique<TransferSender>(m_transfer_config);
    m_sender->setProgressCallback([this](uint8_t) { notifyTransfer(); });

    if (!m_sender->start(m_connection, std::move(file))) {
        reportError(SessionErrorKind::TRANSFER_ABORTED, "File transfer failed: " + m_sender->lastError());
        notifyTransfer();
        return false;
    }

    notifyTransfer();
    continueSending();
    return true;
}

bool SessionCoordinator::sendFile(const std::string& path) {
    LocalFile file;
    std::string error;
    if (!load_local_file(path, file, &error)) {
        return rejectRequest("Cannot read " + path + ": " + error);
    }
    return sendFile(std::move(file));
}

bool SessionCoordinator::discardArtifact() {
    if (!m_artifact) {
        LOG_DEBUG("SESSION: Nothing to discard");
        return true;
    }
    LOG_INFO("SESSION: Discarding " + m_artifact->info.name);
    releaseArtifact();
    return true;
}

// ============================================================================
// EVENT DISPATCH
// ============================================================================

void SessionCoordinator::handleEvent(const SessionEvent& event) {
    std::visit([this](auto&& arg) {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, ChannelEvent>) onChannelEvent(arg);
        else if constexpr (std::is_same_v<T, IncomingConnectionEvent>) acceptConnection(arg.connection);
        else if constexpr (std::is_same_v<T, ConnectTimeoutEvent>) onConnectTimeout(arg);
        else if constexpr (std::is_same_v<T, SenderResumeEvent>) onSenderResume(arg);
        else if constexpr (std::is_same_v<T, DeferredTaskEvent>) {
            if (arg.task) arg.task();
        }
    }, event);
}

void SessionCoordinator::onChannelEvent(const ChannelEvent& event) {
    if (!m_connection || event.connection_id != m_ctx.connection_id) {
        LOG_DEBUG("SESSION: Dropping event for stale connection " + std::to_string(event.connection_id));
        return;
    }

    std::visit([this](auto&& arg) {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, TransportOpenEvent>) {
            driveConnection(ConnectionEvent::TRANSPORT_OPEN);
        } else if constexpr (std::is_same_v<T, TransportDataEvent>) {
            if (m_ctx.state != ConnectionState::CONNECTED) {
                LOG_WARN("SESSION: Data before the connection opened, dropped");
                return;
            }
            onInboundMessage(arg.payload);
        } else if constexpr (std::is_same_v<T, TransportClosedEvent>) {
            driveConnection(ConnectionEvent::TRANSPORT_CLOSED);
        } else if constexpr (std::is_same_v<T, TransportErrorEvent>) {
            driveConnection(ConnectionEvent::TRANSPORT_ERROR, SessionErrorKind::CONNECTION_ERROR,
                            "Connection error: " + arg.message);
        }
    }, event.event);
}

void SessionCoordinator::onConnectTimeout(const ConnectTimeoutEvent& event) {
    if (event.connection_id != m_ctx.connection_id || m_ctx.state != ConnectionState::CONNECTING) {
        return;
    }
    const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(m_connect_timeout).count();
    driveConnection(ConnectionEvent::TIMEOUT, SessionErrorKind::CONNECTION_TIMEOUT,
                    "Connection to " + m_ctx.remote_id + " timed out after " + std::to_string(seconds) +
                    " seconds. Make sure both devices are on the same network, or configure a "
                    "TURN relay for NAT traversal.");
}

void SessionCoordinator::onSenderResume(const SenderResumeEvent& event) {
    if (!m_sender || event.transfer_id != m_transfer_id ||
        m_sender->state() != TransferState::ACTIVE) {
        return;
    }
    continueSending();
}

void SessionCoordinator::onInboundMessage(const std::string& payload) {
    TransferMessage message;
    std::string error;
    const wire::DecodeStatus status = wire::decode_transfer_message(payload, message, &error);
    if (status != wire::DecodeStatus::OK) {
        const std::string reason = "Dropped invalid message from " + m_ctx.remote_id + ": " + error;
        if (m_receiver.onInvalidFrame(reason) == ReceiveResult::ABORTED) {
            reportError(SessionErrorKind::PROTOCOL_ERROR, m_receiver.lastError());
            notifyTransfer();
            return;
        }
        reportError(SessionErrorKind::PROTOCOL_ERROR, reason);
        return;
    }

    LOG_DEBUG(std::string("SESSION: Inbound ") + transfer_message_name(message));

    if (const auto* start = std::get_if<FileStartMessage>(&message)) {
        if (m_sender && m_sender->state() == TransferState::ACTIVE) {
            m_receiver.refuse(*start, "a local send is in progress");
            reportError(SessionErrorKind::PROTOCOL_ERROR, m_receiver.lastError());
            return;
        }
    }

    switch (m_receiver.handleMessage(message)) {
        case ReceiveResult::STARTED:
        case ReceiveResult::RESTARTED:
            m_direction = TransferDirection::RECEIVE;
            m_sender.reset();
            ++m_transfer_id;
            notifyTransfer();
            break;
        case ReceiveResult::CHUNK_ACCEPTED:
            notifyTransfer();
            break;
        case ReceiveResult::COMPLETED:
            finishReceive();
            break;
        case ReceiveResult::ABORTED:
            reportError(SessionErrorKind::PROTOCOL_ERROR, m_receiver.lastError());
            notifyTransfer();
            break;
        case ReceiveResult::IGNORED:
        case ReceiveResult::REFUSED:
            reportError(SessionErrorKind::PROTOCOL_ERROR, m_receiver.lastError());
            break;
        case ReceiveResult::DISCARDED:
            break;
    }
}

// ============================================================================
// CONNECTION LIFECYCLE
// ============================================================================

void SessionCoordinator::beginConnection(std::shared_ptr<ITransportConnection> connection,
                                         const std::string& remote_id, bool outbound,
                                         ConnectionEvent event) {
    m_ctx = ConnectionContext(++m_next_connection_id, remote_id, outbound);
    m_connection = std::move(connection);
    m_channel = std::make_shared<ConnectionChannel>(m_ctx.connection_id, m_channel_capacity);

    LOG_INFO(std::string("SESSION: ") + (outbound ? "Connecting to " : "Accepting connection from ") +
             remote_id + " (connection " + std::to_string(m_ctx.connection_id) + ")");

    driveConnection(event);

    m_loop.attachChannel(m_channel);
    m_connection->bindChannel(m_channel);
}

void SessionCoordinator::driveConnection(ConnectionEvent event, SessionErrorKind error_kind,
                                         const std::string& error_message) {
    const ConnectionState before = m_ctx.state;
    const FSMResult result = m_fsm.handle_event(m_ctx, event);

    for (ConnectionAction action : result.actions) {
        switch (action) {
            case ConnectionAction::START_TIMEOUT:
                m_loop.addScheduledEvent(timeoutTimerId(), ConnectTimeoutEvent{m_ctx.connection_id},
                                         m_loop.now() + m_connect_timeout);
                break;
            case ConnectionAction::CLEAR_TIMEOUT:
                m_loop.removeScheduledEvent(timeoutTimerId());
                break;
            case ConnectionAction::CLOSE_TRANSPORT:
                if (m_connection) {
                    m_connection->close();
                }
                break;
            case ConnectionAction::ABORT_TRANSFER:
                abortTransfer(kConnectionLost);
                break;
            case ConnectionAction::REPORT_ERROR:
                reportError(error_kind, error_message);
                break;
            case ConnectionAction::CLEAR_ERROR:
                m_last_error = {};
                break;
            case ConnectionAction::RELEASE_CONNECTION:
                releaseConnection();
                break;
        }
    }

    if (m_ctx.state != before) {
        notifyConnectionState();
    }
}

void SessionCoordinator::releaseConnection() {
    if (m_channel) {
        m_loop.detachChannel(m_channel->id());
        m_channel->close();
        m_channel.reset();
    }
    if (m_connection) {
        // Idempotent on every transport; guarantees the socket is gone.
        m_connection->close();
        m_connection.reset();
    }
}

// ============================================================================
// TRANSFER
// ============================================================================

void SessionCoordinator::continueSending() {
    switch (m_sender->step()) {
        case SendStepResult::YIELD:
            m_loop.addScheduledEvent(resumeTimerId(), SenderResumeEvent{m_transfer_id},
                                     m_loop.now() + m_sender->resumeDelay());
            break;
        case SendStepResult::FINISHED:
            notifyTransfer();
            break;
        case SendStepResult::ABORTED:
            reportError(SessionErrorKind::TRANSFER_ABORTED, "File transfer failed: " + m_sender->lastError());
            notifyTransfer();
            break;
    }
}

void SessionCoordinator::abortTransfer(const std::string& reason) {
    bool aborted = false;
    if (m_sender && m_sender->state() == TransferState::ACTIVE) {
        m_loop.removeScheduledEvent(resumeTimerId());
        m_sender->abort(reason);
        aborted = true;
    }
    if (m_receiver.abort(reason)) {
        aborted = true;
    }
    if (aborted) {
        reportError(SessionErrorKind::TRANSFER_ABORTED, reason);
        notifyTransfer();
    }
}

void SessionCoordinator::finishReceive() {
    ReceivedArtifact artifact = m_receiver.takeArtifact();

    // The previous artifact is replaced, so its resource goes first.
    releaseArtifact();

    std::string handle;
    std::string error;
    if (m_store.publish(artifact.info, *artifact.content, handle, &error)) {
        artifact.resource_handle = handle;
    } else {
        reportError(SessionErrorKind::STORAGE_FAILURE, "Could not save " + artifact.info.name + ": " + error);
    }

    m_artifact = std::move(artifact);
    notifyTransfer();
    if (m_observer.on_artifact) {
        m_observer.on_artifact(*m_artifact);
    }
}

void SessionCoordinator::releaseArtifact() {
    if (!m_artifact) {
        return;
    }
    if (!m_store.release(m_artifact->resource_handle)) {
        reportError(SessionErrorKind::STORAGE_FAILURE, "Could not remove " + m_artifact->resource_handle);
    }
    m_artifact.reset();
}

// ============================================================================
// SNAPSHOT
// ============================================================================

std::string SessionCoordinator::remoteId() const {
    return m_ctx.state == ConnectionState::DISCONNECTED ? std::string() : m_ctx.remote_id;
}

TransferState SessionCoordinator::transferState() const {
    if (m_direction == TransferDirection::SEND && m_sender) {
        return m_sender->state();
    }
    if (m_direction == TransferDirection::RECEIVE) {
        return m_receiver.state();
    }
    return TransferState::IDLE;
}

uint8_t SessionCoordinator::transferProgress() const {
    if (m_direction == TransferDirection::SEND && m_sender) {
        return m_sender->progress();
    }
    if (m_direction == TransferDirection::RECEIVE) {
        return m_receiver.progress();
    }
    return 0;
}

const FileInfo* SessionCoordinator::transferFileInfo() const {
    if (m_direction == TransferDirection::SEND && m_sender) {
        return &m_sender->fileInfo();
    }
    if (m_direction == TransferDirection::RECEIVE) {
        return &m_receiver.fileInfo();
    }
    return nullptr;
}

bool SessionCoordinator::isTransferActive() const {
    return (m_sender && m_sender->state() == TransferState::ACTIVE) ||
           m_receiver.state() == TransferState::ACTIVE;
}

// ============================================================================
// REPORTING
// ============================================================================

bool SessionCoordinator::rejectRequest(const std::string& message) {
    reportError(SessionErrorKind::INVALID_REQUEST, message);
    return false;
}

void SessionCoordinator::reportError(SessionErrorKind kind, const std::string& message) {
    m_last_error = SessionError{kind, message};
    if (kind == SessionErrorKind::INVALID_REQUEST || kind == SessionErrorKind::PROTOCOL_ERROR) {
        LOG_WARN(std::string("SESSION: ") + session_error_kind_to_string(kind) + ": " + message);
    } else {
        LOG_ERROR(std::string("SESSION: ") + session_error_kind_to_string(kind) + ": " + message);
    }
    if (m_observer.on_error) {
        m_observer.on_error(m_last_error);
    }
}

void SessionCoordinator::notifyConnectionState() {
    if (m_observer.on_connection_state) {
        m_observer.on_connection_state(m_ctx.state, m_ctx.remote_id);
    }
}

void SessionCoordinator::notifyTransfer() {
    if (m_observer.on_transfer) {
        m_observer.on_transfer(m_direction, transferState(), transferProgress());
    }
}

std::string SessionCoordinator::timeoutTimerId() const {
    return "connect-timeout:" + std::to_string(m_instance_id);
}

std::string SessionCoordinator::resumeTimerId() const {
    return "sender-resume:" + std::to_string(m_instance_id);
}
