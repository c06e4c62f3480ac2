#include "event_loop.h"
#include "logger.h"
#include "loopback_transport.h"
#include "session_coordinator.h"

#include <chrono>
#include <iostream>
#include <optional>
#include <random>
#include <string>
#include <vector>

static int tests_failed = 0;

#define TEST_ASSERT(cond, msg) \
    do { \
        if (!(cond)) { \
            std::cerr << "FAIL: " << msg << " [" << __FILE__ << ":" << __LINE__ << "]" << std::endl; \
            tests_failed++; \
            return false; \
        } \
    } while (0)

using namespace std::chrono_literals;

// One side of a session: coordinator, its loop on a manual clock, and what it reported.
struct TestPeer {
    ManualClock clock;
    EventLoop loop;
    LoopbackSignaling signaling;
    MemoryArtifactStore store;
    SessionCoordinator coordinator;

    std::vector<SessionError> errors;
    std::vector<ConnectionState> states;
    std::vector<uint8_t> progress;
    int artifacts = 0;

    TestPeer(LoopbackNetwork& network, const std::string& id, TransferConfig config = TransferConfig{})
        : signaling(network, id),
          coordinator(loop, signaling, store, config, std::chrono::milliseconds(15000)) {
        loop.setClock([this] { return clock.now(); });
        loop.setEventHandler([this](const SessionEvent& event) { coordinator.handleEvent(event); });

        SessionObserver observer;
        observer.on_error = [this](const SessionError& error) { errors.push_back(error); };
        observer.on_connection_state = [this](ConnectionState state, const std::string&) { states.push_back(state); };
        observer.on_transfer = [this](TransferDirection, TransferState state, uint8_t p) {
            if (state == TransferState::ACTIVE || state == TransferState::COMPLETED) progress.push_back(p);
        };
        observer.on_artifact = [this](const ReceivedArtifact&) { ++artifacts; };
        coordinator.setObserver(std::move(observer));
    }
};

// Runs both loops until neither has work. Due timers fire only when allowed,
// by moving each clock to its next deadline.
static void pump(TestPeer& a, TestPeer& b, bool fire_timers = true) {
    for (int i = 0; i < 100000; ++i) {
        size_t handled = a.loop.runOnce() + b.loop.runOnce();
        if (handled > 0) {
            continue;
        }
        if (!fire_timers) {
            return;
        }
        bool advanced = false;
        for (TestPeer* p : {&a, &b}) {
            if (auto due = p->loop.nextDueTime()) {
                if (*due > p->clock.now()) p->clock.current = *due;
                advanced = true;
            }
        }
        if (!advanced) {
            return;
        }
    }
}

static LocalFile make_file(const std::string& name, size_t size) {
    std::mt19937 rng(42);
    LocalFile file;
    file.name = name;
    file.mime_type = guess_mime_type(name);
    file.data.resize(size);
    for (auto& b : file.data) b = static_cast<uint8_t>(rng() & 0xFF);
    return file;
}

static TransferConfig slow_config() {
    TransferConfig cfg;
    cfg.chunk_size = 4;
    cfg.pacing_interval_chunks = 1;
    cfg.pacing_delay = 10ms;
    return cfg;
}

static bool connect_pair(TestPeer& a, TestPeer& b) {
    if (!a.coordinator.initialize() || !b.coordinator.initialize()) return false;
    if (!a.coordinator.connectToPeer(b.coordinator.localId())) return false;
    pump(a, b, false);
    return a.coordinator.connectionState() == ConnectionState::CONNECTED &&
           b.coordinator.connectionState() == ConnectionState::CONNECTED;
}

static bool test_connect_timeout_fires_once() {
    LoopbackNetwork network;
    TestPeer a(network, "alice");
    TEST_ASSERT(a.coordinator.initialize(), "initialize failed");

    TEST_ASSERT(a.coordinator.connectToPeer("nobody"), "connectToPeer should start an attempt");
    TEST_ASSERT(a.coordinator.connectionState() == ConnectionState::CONNECTING, "Should be CONNECTING");
    TEST_ASSERT(a.coordinator.remoteId() == "nobody", "remoteId while connecting");
    a.loop.runUntilIdle();

    a.clock.advance(14999ms);
    a.loop.runUntilIdle();
    TEST_ASSERT(a.coordinator.connectionState() == ConnectionState::CONNECTING, "No timeout before 15 s");
    TEST_ASSERT(a.errors.empty(), "No error before the deadline");

    a.clock.advance(1ms);
    a.loop.runUntilIdle();
    TEST_ASSERT(a.coordinator.connectionState() == ConnectionState::DISCONNECTED, "Timeout -> DISCONNECTED");
    TEST_ASSERT(a.errors.size() == 1, "Exactly one error");
    TEST_ASSERT(a.errors[0].kind == SessionErrorKind::CONNECTION_TIMEOUT, "Error kind CONNECTION_TIMEOUT");
    TEST_ASSERT(a.errors[0].message.find("nobody timed out after 15 seconds") != std::string::npos,
                "Timeout message: " << a.errors[0].message);
    TEST_ASSERT(a.errors[0].message.find("TURN relay") != std::string::npos, "Timeout message carries the hint");
    TEST_ASSERT(a.signaling.last_outbound->isClosed(), "Timed out link is closed");
    TEST_ASSERT(a.coordinator.remoteId().empty(), "No remote once disconnected");

    // A late open on the abandoned link changes nothing.
    a.signaling.last_outbound->openNow();
    a.clock.advance(60000ms);
    a.loop.runUntilIdle();
    TEST_ASSERT(a.errors.size() == 1, "Timeout reported only once");
    TEST_ASSERT(a.coordinator.connectionState() == ConnectionState::DISCONNECTED, "Stays DISCONNECTED");
    TEST_ASSERT(!a.loop.nextDueTime(), "No timer left behind");
    return true;
}

static bool test_connect_and_reject_second_connection() {
    LoopbackNetwork network;
    TestPeer a(network, "alice");
    TestPeer b(network, "bob");
    TestPeer c(network, "carol");

    TEST_ASSERT(connect_pair(a, b), "alice and bob should connect");
    TEST_ASSERT(a.coordinator.remoteId() == "bob" && b.coordinator.remoteId() == "alice", "Remote ids");
    TEST_ASSERT(!a.loop.nextDueTime(), "Connect timeout cleared once open");
    TEST_ASSERT((a.states == std::vector<ConnectionState>{ConnectionState::CONNECTING, ConnectionState::CONNECTED}),
                "alice state sequence");

    TEST_ASSERT(c.coordinator.initialize(), "carol initialize");
    TEST_ASSERT(c.coordinator.connectToPeer("bob"), "carol starts an attempt");
    pump(b, c, false);
    TEST_ASSERT(b.signaling.last_inbound->isClosed(), "bob closes the second connection");
    TEST_ASSERT(b.coordinator.remoteId() == "alice", "bob keeps alice");
    TEST_ASSERT(b.coordinator.connectionState() == ConnectionState::CONNECTED, "bob stays CONNECTED");
    TEST_ASSERT(c.coordinator.connectionState() == ConnectionState::DISCONNECTED, "carol is turned away");

    TEST_ASSERT(!a.coordinator.connectToPeer("carol"), "Connecting while connected is rejected");
    TEST_ASSERT(a.coordinator.lastError().kind == SessionErrorKind::INVALID_REQUEST, "INVALID_REQUEST");
    TEST_ASSERT(a.coordinator.remoteId() == "bob", "The existing link is kept");
    return true;
}

static bool test_end_to_end_transfer() {
    LoopbackNetwork network;
    TestPeer a(network, "alice");
    TestPeer b(network, "bob");
    TEST_ASSERT(connect_pair(a, b), "connect");

    LocalFile file = make_file("holiday.jpg", 40000);
    const std::vector<uint8_t> original = file.data;
    TEST_ASSERT(a.coordinator.sendFile(std::move(file)), "sendFile failed");
    pump(a, b);

    TEST_ASSERT(a.coordinator.transferDirection() == TransferDirection::SEND, "alice direction");
    TEST_ASSERT(a.coordinator.transferState() == TransferState::COMPLETED, "alice finished");
    TEST_ASSERT(a.coordinator.transferProgress() == 100, "alice progress");
    TEST_ASSERT((a.progress.back() == 100), "alice reported 100%");

    TEST_ASSERT(b.coordinator.transferDirection() == TransferDirection::RECEIVE, "bob direction");
    TEST_ASSERT(b.coordinator.transferState() == TransferState::COMPLETED, "bob finished");
    TEST_ASSERT((b.progress == std::vector<uint8_t>{0, 41, 82, 100, 100}), "bob progress sequence");
    TEST_ASSERT(b.artifacts == 1, "One artifact announced");

    const ReceivedArtifact* artifact = b.coordinator.artifact();
    TEST_ASSERT(artifact != nullptr, "bob holds the artifact");
    TEST_ASSERT(artifact->info.name == "holiday.jpg" && artifact->info.mime_type == "image/jpeg", "Artifact metadata");
    TEST_ASSERT(*artifact->content == original, "Artifact content");
    TEST_ASSERT(b.store.files.count(artifact->resource_handle) == 1, "Artifact published to the store");
    TEST_ASSERT(a.errors.empty() && b.errors.empty(), "No errors on a clean transfer");

    // Discard is idempotent.
    TEST_ASSERT(b.coordinator.discardArtifact(), "discard");
    TEST_ASSERT(b.coordinator.artifact() == nullptr, "Artifact gone");
    TEST_ASSERT(b.store.files.empty() && b.store.release_calls == 1, "Resource released once");
    TEST_ASSERT(b.coordinator.discardArtifact(), "Second discard succeeds");
    TEST_ASSERT(b.store.release_calls == 1, "Second discard releases nothing");

    // A second transfer in the other direction reuses the link.
    TEST_ASSERT(b.coordinator.sendFile(make_file("reply.txt", 5)), "Reply send");
    pump(a, b);
    TEST_ASSERT(a.coordinator.artifact() && a.coordinator.artifact()->info.size == 5, "alice got the reply");
    return true;
}

static bool test_paused_sender_keeps_dispatching() {
    LoopbackNetwork network;
    TestPeer a(network, "alice", slow_config());
    TestPeer b(network, "bob", slow_config());
    TEST_ASSERT(connect_pair(a, b), "connect");

    TEST_ASSERT(a.coordinator.sendFile(make_file("notes.txt", 12)), "sendFile");
    TEST_ASSERT(a.signaling.last_outbound->sent.size() == 2, "start + first chunk before the pause");
    TEST_ASSERT(a.loop.nextDueTime().has_value(), "Resume is scheduled");
    TEST_ASSERT(a.coordinator.isTransferActive(), "alice is sending");

    pump(a, b, false);
    TEST_ASSERT(b.coordinator.transferState() == TransferState::ACTIVE, "bob is receiving");
    TEST_ASSERT(b.coordinator.transferProgress() == 33, "bob saw the first chunk");

    // bob leaves mid-transfer; alice handles the close while paused.
    TEST_ASSERT(b.coordinator.disconnect(), "bob disconnects");
    TEST_ASSERT(b.coordinator.artifact() == nullptr, "No artifact from a partial transfer");
    TEST_ASSERT(b.coordinator.transferState() == TransferState::ABORTED, "bob's receive aborted");
    TEST_ASSERT(b.coordinator.lastError().kind == SessionErrorKind::TRANSFER_ABORTED, "bob reports the abort");

    a.loop.runOnce();
    TEST_ASSERT(a.coordinator.connectionState() == ConnectionState::DISCONNECTED, "alice sees the close");
    TEST_ASSERT(a.coordinator.transferState() == TransferState::ABORTED, "alice's send aborted");
    TEST_ASSERT(a.coordinator.lastError().kind == SessionErrorKind::TRANSFER_ABORTED, "alice reports the abort");
    TEST_ASSERT(a.coordinator.lastError().message == "Connection lost during transfer", "Abort message");
    TEST_ASSERT(!a.loop.nextDueTime(), "Resume timer cancelled");

    a.clock.advance(1000ms);
    a.loop.runUntilIdle();
    TEST_ASSERT(a.signaling.last_outbound->sent.size() == 2, "Nothing sent after the close");
    return true;
}

static bool test_start_during_send_is_refused() {
    LoopbackNetwork network;
    TestPeer a(network, "alice", slow_config());
    TestPeer b(network, "bob", slow_config());
    TEST_ASSERT(connect_pair(a, b), "connect");

    TEST_ASSERT(a.coordinator.sendFile(make_file("notes.txt", 12)), "sendFile");
    auto bob_side = b.signaling.last_inbound;

    // bob's side of the link announces its own file while alice is sending.
    bob_side->send(wire::encode_transfer_message(FileStartMessage{FileInfo{"clash.bin", 4, ""}}));
    a.loop.runUntilIdle();
    TEST_ASSERT(a.coordinator.lastError().kind == SessionErrorKind::PROTOCOL_ERROR, "Refusal is a protocol error");
    TEST_ASSERT(a.coordinator.transferDirection() == TransferDirection::SEND, "alice keeps sending");

    FileChunkMessage chunk;
    chunk.index = 0;
    chunk.progress = 100;
    chunk.data = {1, 2, 3, 4};
    bob_side->send(wire::encode_transfer_message(chunk));
    bob_side->send(wire::encode_transfer_message(FileCompleteMessage{FileInfo{"clash.bin", 4, ""}}));
    const size_t errors_before = a.errors.size();
    a.loop.runUntilIdle();
    TEST_ASSERT(a.errors.size() == errors_before, "The refused transfer is dropped quietly");

    pump(a, b);
    TEST_ASSERT(a.coordinator.transferState() == TransferState::COMPLETED, "alice's send completes");
    TEST_ASSERT(a.coordinator.artifact() == nullptr, "alice stored nothing");
    TEST_ASSERT(b.coordinator.artifact() != nullptr && b.coordinator.artifact()->info.size == 12, "bob got notes.txt");
    return true;
}

static bool test_rejected_requests() {
    LoopbackNetwork network;
    TestPeer a(network, "alice");

    TEST_ASSERT(!a.coordinator.connectToPeer("bob"), "Connect before initialize is rejected");
    TEST_ASSERT(a.coordinator.lastError().kind == SessionErrorKind::INVALID_REQUEST, "INVALID_REQUEST");

    TEST_ASSERT(a.coordinator.initialize(), "initialize");
    TEST_ASSERT(!a.coordinator.connectToPeer("alice"), "Connecting to ourselves is rejected");
    TEST_ASSERT(!a.coordinator.connectToPeer(""), "Empty id is rejected");
    TEST_ASSERT(!a.coordinator.sendFile(make_file("x.bin", 3)), "Send without a connection is rejected");
    TEST_ASSERT(a.coordinator.lastError().kind == SessionErrorKind::INVALID_REQUEST, "INVALID_REQUEST");
    TEST_ASSERT(!a.coordinator.disconnect(), "Disconnect without a connection is rejected");
    TEST_ASSERT(!a.coordinator.sendFile(std::string("/nonexistent/peerdrop/file.bin")), "Unreadable path is rejected");
    TEST_ASSERT(a.coordinator.discardArtifact(), "Discard without an artifact is a no-op");

    a.signaling.fail_connect = true;
    TEST_ASSERT(!a.coordinator.connectToPeer("bob"), "Signaling failure fails the connect");
    TEST_ASSERT(a.coordinator.lastError().kind == SessionErrorKind::CONNECTION_ERROR, "CONNECTION_ERROR");
    TEST_ASSERT(a.coordinator.connectionState() == ConnectionState::DISCONNECTED, "Still DISCONNECTED");
    return true;
}

static bool test_identity_failure_then_retry() {
    LoopbackNetwork network;
    TestPeer a(network, "alice");
    a.signaling.fail_identity_attempts = 1;

    TEST_ASSERT(!a.coordinator.initialize(), "First initialize fails");
    TEST_ASSERT(!a.coordinator.isInitialized(), "Not initialized");
    TEST_ASSERT(a.coordinator.lastError().kind == SessionErrorKind::IDENTITY_INIT_FAILURE, "IDENTITY_INIT_FAILURE");
    TEST_ASSERT(!a.signaling.hasIncomingCallback(), "No inbound callback without an identity");

    TEST_ASSERT(a.coordinator.initialize(), "Retry succeeds");
    TEST_ASSERT(a.coordinator.localId() == "alice", "Identity assigned");
    TEST_ASSERT(a.coordinator.lastError().empty(), "Identity error cleared");
    TEST_ASSERT(a.signaling.hasIncomingCallback(), "Inbound callback installed");

    TEST_ASSERT(a.coordinator.initialize(), "initialize is idempotent");
    TEST_ASSERT(a.signaling.identity_calls == 2, "No extra allocation once initialized");
    return true;
}

static bool test_transport_error_and_bad_input() {
    LoopbackNetwork network;
    TestPeer a(network, "alice");
    TestPeer b(network, "bob");
    TEST_ASSERT(connect_pair(a, b), "connect");

    b.signaling.last_inbound->send("garbage");
    a.loop.runUntilIdle();
    TEST_ASSERT(a.coordinator.lastError().kind == SessionErrorKind::PROTOCOL_ERROR, "Invalid frame is a protocol error");
    TEST_ASSERT(a.coordinator.connectionState() == ConnectionState::CONNECTED, "Invalid frame keeps the link");

    FileChunkMessage stray;
    stray.index = 0;
    stray.progress = 10;
    stray.data = {9};
    b.signaling.last_inbound->send(wire::encode_transfer_message(stray));
    a.loop.runUntilIdle();
    TEST_ASSERT(a.coordinator.lastError().kind == SessionErrorKind::PROTOCOL_ERROR, "Chunk without a transfer");

    a.signaling.last_outbound->injectError("connection reset by peer");
    a.loop.runUntilIdle();
    TEST_ASSERT(a.coordinator.connectionState() == ConnectionState::DISCONNECTED, "Error -> DISCONNECTED");
    TEST_ASSERT(a.coordinator.lastError().kind == SessionErrorKind::CONNECTION_ERROR, "CONNECTION_ERROR");
    TEST_ASSERT(a.coordinator.lastError().message == "Connection error: connection reset by peer", "Error message");
    TEST_ASSERT(a.signaling.last_outbound->isClosed(), "Failed link is closed");

    // Reconnecting clears the previous error.
    pump(a, b, false);
    TEST_ASSERT(b.coordinator.connectionState() == ConnectionState::DISCONNECTED, "bob sees the close");
    TEST_ASSERT(a.coordinator.connectToPeer("bob"), "Reconnect");
    pump(a, b, false);
    TEST_ASSERT(a.coordinator.connectionState() == ConnectionState::CONNECTED, "Reconnected");
    TEST_ASSERT(a.coordinator.lastError().empty(), "Error cleared on open");
    return true;
}

static FileChunkMessage chunk_of(uint32_t index, std::vector<uint8_t> data, uint8_t progress) {
    FileChunkMessage chunk;
    chunk.index = index;
    chunk.progress = progress;
    chunk.data = std::move(data);
    return chunk;
}

static bool test_lost_chunk_aborts_receive() {
    LoopbackNetwork network;
    TestPeer a(network, "alice");
    TestPeer b(network, "bob");
    TEST_ASSERT(connect_pair(a, b), "connect");
    auto bob_side = b.signaling.last_inbound;

    const FileInfo info{"parts.bin", 8, "application/octet-stream"};
    bob_side->send(wire::encode_transfer_message(FileStartMessage{info}));
    bob_side->send(wire::encode_transfer_message(chunk_of(0, {1, 2, 3, 4}, 50)));
    bob_side->send("garbage");
    a.loop.runUntilIdle();
    TEST_ASSERT(a.coordinator.transferState() == TransferState::ABORTED, "Undecodable frame ends the receive");
    TEST_ASSERT(a.coordinator.lastError().kind == SessionErrorKind::PROTOCOL_ERROR, "PROTOCOL_ERROR");
    TEST_ASSERT(a.coordinator.connectionState() == ConnectionState::CONNECTED, "The link is kept");

    const size_t errors_before = a.errors.size();
    bob_side->send(wire::encode_transfer_message(chunk_of(1, {5, 6, 7, 8}, 100)));
    bob_side->send(wire::encode_transfer_message(FileCompleteMessage{info}));
    a.loop.runUntilIdle();
    TEST_ASSERT(a.errors.size() == errors_before, "Rest of the broken transfer is dropped quietly");
    TEST_ASSERT(a.coordinator.transferState() == TransferState::ABORTED, "No completion after the loss");
    TEST_ASSERT(a.coordinator.artifact() == nullptr && a.artifacts == 0, "No artifact");
    TEST_ASSERT(a.store.files.empty(), "Nothing published");
    return true;
}

static bool test_short_transfer_is_not_an_artifact() {
    LoopbackNetwork network;
    TestPeer a(network, "alice");
    TestPeer b(network, "bob");
    TEST_ASSERT(connect_pair(a, b), "connect");
    auto bob_side = b.signaling.last_inbound;

    const FileInfo info{"short.bin", 8, "application/octet-stream"};
    bob_side->send(wire::encode_transfer_message(FileStartMessage{info}));
    bob_side->send(wire::encode_transfer_message(chunk_of(0, {1, 2, 3, 4}, 50)));
    bob_side->send(wire::encode_transfer_message(FileCompleteMessage{info}));
    a.loop.runUntilIdle();

    TEST_ASSERT(a.coordinator.transferState() == TransferState::ABORTED, "Short transfer aborts");
    TEST_ASSERT(a.coordinator.lastError().kind == SessionErrorKind::PROTOCOL_ERROR, "PROTOCOL_ERROR");
    TEST_ASSERT(a.coordinator.artifact() == nullptr && a.artifacts == 0, "No artifact");
    TEST_ASSERT(a.store.files.empty(), "Nothing published");
    return true;
}

static bool test_oversized_chunk_config_still_delivers() {
    TransferConfig config;
    config.chunk_size = 11u * 1024u * 1024u;
    LoopbackNetwork network;
    TestPeer a(network, "alice", config);
    TestPeer b(network, "bob", config);
    TEST_ASSERT(connect_pair(a, b), "connect");

    LocalFile file = make_file("disk.img", config.chunk_size);
    const std::vector<uint8_t> original = file.data;
    TEST_ASSERT(a.coordinator.sendFile(std::move(file)), "sendFile");
    pump(a, b);

    TEST_ASSERT(b.errors.empty(), "Every frame decodes on the receiving side");
    TEST_ASSERT(b.coordinator.transferState() == TransferState::COMPLETED, "bob finished");
    TEST_ASSERT(b.coordinator.artifact() != nullptr, "bob holds the artifact");
    TEST_ASSERT(*b.coordinator.artifact()->content == original, "Content intact");
    return true;
}

static bool test_timer_ids_survive_address_reuse() {
    LoopbackNetwork network;
    ManualClock clock;
    EventLoop loop;
    loop.setClock([&clock] { return clock.now(); });
    LoopbackSignaling signaling(network, "alice");
    MemoryArtifactStore store;

    std::optional<SessionCoordinator> coordinator;
    coordinator.emplace(loop, signaling, store, TransferConfig{}, std::chrono::milliseconds(15000));
    const uint64_t first_id = coordinator->instanceId();
    TEST_ASSERT(coordinator->initialize(), "initialize");
    TEST_ASSERT(coordinator->connectToPeer("nobody"), "connect");
    TEST_ASSERT(loop.nextDueTime().has_value(), "Timeout scheduled");
    coordinator.reset();
    TEST_ASSERT(!loop.nextDueTime(), "Destroyed coordinator leaves no timer");

    // Same storage, so the same address; the timers must still be its own.
    coordinator.emplace(loop, signaling, store, TransferConfig{}, std::chrono::milliseconds(15000));
    TEST_ASSERT(coordinator->instanceId() != first_id, "New coordinator gets a fresh id");
    return true;
}

static bool test_storage_failure_keeps_artifact() {
    LoopbackNetwork network;
    TestPeer a(network, "alice");
    TestPeer b(network, "bob");
    TEST_ASSERT(connect_pair(a, b), "connect");
    b.store.fail_publish = true;

    TEST_ASSERT(a.coordinator.sendFile(make_file("data.csv", 100)), "sendFile");
    pump(a, b);
    TEST_ASSERT(b.coordinator.lastError().kind == SessionErrorKind::STORAGE_FAILURE, "STORAGE_FAILURE");
    const ReceivedArtifact* artifact = b.coordinator.artifact();
    TEST_ASSERT(artifact != nullptr && artifact->resource_handle.empty(), "Artifact kept without a handle");
    TEST_ASSERT(artifact->content->size() == 100, "Content kept in memory");
    return true;
}

int main() {
    set_log_level(LogLevel::WARNING);
    std::cout << "--- SessionCoordinator tests ---" << std::endl;

    if (test_connect_timeout_fires_once()) std::cout << "PASS: connect timeout" << std::endl;
    if (test_connect_and_reject_second_connection()) std::cout << "PASS: single connection" << std::endl;
    if (test_end_to_end_transfer()) std::cout << "PASS: end-to-end transfer" << std::endl;
    if (test_paused_sender_keeps_dispatching()) std::cout << "PASS: close while sender paused" << std::endl;
    if (test_start_during_send_is_refused()) std::cout << "PASS: start during send" << std::endl;
    if (test_rejected_requests()) std::cout << "PASS: rejected requests" << std::endl;
    if (test_identity_failure_then_retry()) std::cout << "PASS: identity retry" << std::endl;
    if (test_transport_error_and_bad_input()) std::cout << "PASS: transport error and bad input" << std::endl;
    if (test_lost_chunk_aborts_receive()) std::cout << "PASS: lost chunk aborts receive" << std::endl;
    if (test_short_transfer_is_not_an_artifact()) std::cout << "PASS: short transfer" << std::endl;
    if (test_oversized_chunk_config_still_delivers()) std::cout << "PASS: oversized chunk size" << std::endl;
    if (test_timer_ids_survive_address_reuse()) std::cout << "PASS: timer ids per instance" << std::endl;
    if (test_storage_failure_keeps_artifact()) std::cout << "PASS: storage failure" << std::endl;

    if (tests_failed != 0) {
        std::cerr << "FAILED: " << tests_failed << " test(s)" << std::endl;
        return 1;
    }

    std::cout << "ALL PASS" << std::endl;
    return 0;
}
