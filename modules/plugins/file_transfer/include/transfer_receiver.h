#ifndef TRANSFER_RECEIVER_H
#define TRANSFER_RECEIVER_H

#include "transfer_message.h"
#include "transfer_types.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

enum class ReceiveResult {
    STARTED,          // New receive session
    RESTARTED,        // Start while active: previous session discarded
    CHUNK_ACCEPTED,
    COMPLETED,        // Artifact ready (takeArtifact)
    IGNORED,          // Message outside an active session
    DISCARDED,        // Message belonging to a refused/aborted transfer
    REFUSED,          // Start rejected (size limit or local send in progress)
    ABORTED           // Protocol violation ended the session
};

const char* receive_result_to_string(ReceiveResult result);

/**
 * @brief Incoming half of one transfer.
 *
 * Accumulates chunks in receipt order and assembles them on file-complete.
 * Chunk indices must arrive as 0, 1, 2, ... and the buffered total may not
 * exceed the declared size or max_receive_bytes. On file-complete the total
 * must equal the declared size. Violations abort the session without an
 * artifact and without touching the connection. lastError() describes every non-success
 * result.
 */
class TransferReceiver {
public:
    explicit TransferReceiver(TransferConfig config);

    ReceiveResult handleMessage(const TransferMessage& message);

    ReceiveResult onStart(const FileStartMessage& start);
    ReceiveResult onChunk(const FileChunkMessage& chunk);
    ReceiveResult onComplete(const FileCompleteMessage& complete);

    // A frame that could not be decoded. While a session is active the content
    // can no longer be assembled, so the session is aborted; otherwise IGNORED.
    ReceiveResult onInvalidFrame(const std::string& reason);

    // Rejects an announced transfer; its chunks and complete are dropped quietly.
    ReceiveResult refuse(const FileStartMessage& start, const std::string& reason);

    // Connection loss. Drops buffered chunks. Returns true if a session was active.
    bool abort(const std::string& reason);

    bool hasArtifact() const { return m_artifact.has_value(); }
    // Moves the assembled artifact out (empty content if none).
    ReceivedArtifact takeArtifact();

    TransferState state() const { return m_state; }
    uint8_t progress() const { return m_progress; }
    uint64_t bytesReceived() const { return m_bytes_received; }
    size_t chunksReceived() const { return m_chunks.size(); }
    const FileInfo& fileInfo() const { return m_info; }
    const std::string& lastError() const { return m_last_error; }

private:
    ReceiveResult failSession(const std::string& reason);
    void clearBuffer();

    TransferConfig m_config;

    TransferState m_state = TransferState::IDLE;
    FileInfo m_info;
    std::vector<std::vector<uint8_t>> m_chunks;
    uint64_t m_bytes_received = 0;
    uint8_t m_progress = 0;
    bool m_discarding = false;
    std::string m_last_error;

    std::optional<ReceivedArtifact> m_artifact;
};

#endif // TRANSFER_RECEIVER_H
