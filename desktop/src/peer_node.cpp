#include "peer_node.h"
#include "artifact_store.h"
#include "config_manager.h"
#include "event_loop.h"
#include "logger.h"
#include "session_coordinator.h"
#include "tcp_transport.h"

#include <future>

PeerNode::PeerNode() = default;

PeerNode::~PeerNode() {
    stop();
}

bool PeerNode::start(int port) {
    if (running_) {
        LOG_WARN("NODE: Already running");
        return true;
    }

    ConfigManager& config = ConfigManager::getInstance();
    TcpTransport::Options options = TcpTransport::optionsFromConfig();
    if (port >= 0) {
        options.listen_port = port;
    }

    transport_ = std::make_unique<TcpTransport>(options);
    store_ = std::make_unique<FileArtifactStore>(config.getDownloadDir());
    loop_ = std::make_unique<EventLoop>();
    coordinator_ = std::make_unique<SessionCoordinator>(
        *loop_, *transport_, *store_, load_transfer_config(),
        std::chrono::milliseconds(config.getConnectTimeoutMs()), config.getChannelCapacity());

    installObserver();
    loop_->setEventHandler([this](const SessionEvent& event) { coordinator_->handleEvent(event); });

    // The loop is not running yet, so this thread may drive the coordinator.
    if (!coordinator_->initialize()) {
        LOG_ERROR("NODE: " + coordinator_->lastError().message);
        coordinator_.reset();
        loop_.reset();
        store_.reset();
        transport_.reset();
        return false;
    }
    peer_id_ = coordinator_->localId();
    setSessionId(peer_id_);

    loop_thread_ = std::thread([this] { loop_->run(); });
    running_ = true;
    LOG_INFO("NODE: Started as " + peer_id_ + ", downloads go to " + config.getDownloadDir());
    return true;
}

void PeerNode::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    LOG_INFO("NODE: Stopping");

    // No more inbound connections; the accept thread is joined here.
    transport_->stop();

    loop_->stop();
    if (loop_thread_.joinable()) {
        loop_thread_.join();
    }

    // Loop thread is gone: tear down in dependency order on this thread.
    coordinator_.reset();
    loop_.reset();
    store_.reset();
    transport_.reset();
}

std::string PeerNode::getPeerId() const {
    return peer_id_;
}

bool PeerNode::connectToPeer(const std::string& peer_id, std::string* error) {
    bool ok = false;
    runOnLoop([&] {
        ok = coordinator_->connectToPeer(peer_id);
        if (!ok && error) *error = coordinator_->lastError().message;
    });
    return ok;
}

bool PeerNode::disconnect(std::string* error) {
    bool ok = false;
    runOnLoop([&] {
        ok = coordinator_->disconnect();
        if (!ok && error) *error = coordinator_->lastError().message;
    });
    return ok;
}

bool PeerNode::sendFile(const std::string& path, std::string* error) {
    // Reading the file happens here, off the loop thread.
    LocalFile file;
    std::string load_error;
    if (!load_local_file(path, file, &load_error)) {
        const SessionError failure{SessionErrorKind::INVALID_REQUEST, "Cannot read " + path + ": " + load_error};
        if (error) *error = failure.message;
        std::function<void(const SessionError&)> cb;
        {
            std::lock_guard<std::mutex> lock(callbacks_mutex_);
            cb = on_error_cb_;
        }
        if (cb) cb(failure);
        return false;
    }

    bool ok = false;
    runOnLoop([&] {
        ok = coordinator_->sendFile(std::move(file));
        if (!ok && error) *error = coordinator_->lastError().message;
    });
    return ok;
}

bool PeerNode::discardArtifact() {
    bool ok = false;
    runOnLoop([&] { ok = coordinator_->discardArtifact(); });
    return ok;
}

NodeStatus PeerNode::getStatus() {
    NodeStatus status;
    status.local_id = peer_id_;
    runOnLoop([&] {
        status.connection_state = coordinator_->connectionState();
        status.remote_id = coordinator_->remoteId();
        status.transfer_direction = coordinator_->transferDirection();
        status.transfer_state = coordinator_->transferState();
        status.transfer_progress = coordinator_->transferProgress();
        if (const FileInfo* info = coordinator_->transferFileInfo()) {
            status.transfer_file = info->name;
        }
        status.last_error = coordinator_->lastError();
        if (const ReceivedArtifact* artifact = coordinator_->artifact()) {
            status.has_artifact = true;
            status.artifact_info = artifact->info;
            status.artifact_path = artifact->resource_handle;
        }
    });
    return status;
}

void PeerNode::setEventCallbacks(
    std::function<void(ConnectionState, const std::string&)> on_connection,
    std::function<void(TransferDirection, TransferState, uint8_t)> on_transfer,
    std::function<void(const SessionError&)> on_error,
    std::function<void(const FileInfo&, const std::string&)> on_artifact) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    on_connection_cb_ = std::move(on_connection);
    on_transfer_cb_ = std::move(on_transfer);
    on_error_cb_ = std::move(on_error);
    on_artifact_cb_ = std::move(on_artifact);
}

void PeerNode::clearEventCallbacks() {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    on_connection_cb_ = nullptr;
    on_transfer_cb_ = nullptr;
    on_error_cb_ = nullptr;
    on_artifact_cb_ = nullptr;
}

void PeerNode::runOnLoop(std::function<void()> fn) {
    if (!running_ || !loop_) {
        return;
    }
    auto done = std::make_shared<std::promise<void>>();
    std::future<void> finished = done->get_future();
    loop_->pushEvent(DeferredTaskEvent{[fn = std::move(fn), done] {
        fn();
        done->set_value();
    }});
    finished.wait();
}

void PeerNode::installObserver() {
    SessionObserver observer;
    observer.on_connection_state = [this](ConnectionState state, const std::string& remote_id) {
        std::function<void(ConnectionState, const std::string&)> cb;
        {
            std::lock_guard<std::mutex> lock(callbacks_mutex_);
            cb = on_connection_cb_;
        }
        if (cb) cb(state, remote_id);
    };
    observer.on_transfer = [this](TransferDirection direction, TransferState state, uint8_t progress) {
        std::function<void(TransferDirection, TransferState, uint8_t)> cb;
        {
            std::lock_guard<std::mutex> lock(callbacks_mutex_);
            cb = on_transfer_cb_;
        }
        if (cb) cb(direction, state, progress);
    };
    observer.on_error = [this](const SessionError& error) {
        std::function<void(const SessionError&)> cb;
        {
            std::lock_guard<std::mutex> lock(callbacks_mutex_);
            cb = on_error_cb_;
        }
        if (cb) cb(error);
    };
    observer.on_artifact = [this](const ReceivedArtifact& artifact) {
        std::function<void(const FileInfo&, const std::string&)> cb;
        {
            std::lock_guard<std::mutex> lock(callbacks_mutex_);
            cb = on_artifact_cb_;
        }
        if (cb) cb(artifact.info, artifact.resource_handle);
    };
    coordinator_->setObserver(std::move(observer));
}
