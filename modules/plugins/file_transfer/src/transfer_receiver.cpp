#include "transfer_receiver.h"
#include "logger.h"
#include <memory>

const char* receive_result_to_string(ReceiveResult result) {
    switch (result) {
        case ReceiveResult::STARTED: return "STARTED";
        case ReceiveResult::RESTARTED: return "RESTARTED";
        case ReceiveResult::CHUNK_ACCEPTED: return "CHUNK_ACCEPTED";
        case ReceiveResult::COMPLETED: return "COMPLETED";
        case ReceiveResult::IGNORED: return "IGNORED";
        case ReceiveResult::DISCARDED: return "DISCARDED";
        case ReceiveResult::REFUSED: return "REFUSED";
        case ReceiveResult::ABORTED: return "ABORTED";
    }
    return "UNKNOWN";
}

TransferReceiver::TransferReceiver(TransferConfig config)
    : m_config(std::move(config)) {}

ReceiveResult TransferReceiver::handleMessage(const TransferMessage& message) {
    if (const auto* start = std::get_if<FileStartMessage>(&message)) {
        return onStart(*start);
    }
    if (const auto* chunk = std::get_if<FileChunkMessage>(&message)) {
        return onChunk(*chunk);
    }
    return onComplete(std::get<FileCompleteMessage>(message));
}

ReceiveResult TransferReceiver::onStart(const FileStartMessage& start) {
    const bool was_active = (m_state == TransferState::ACTIVE);
    if (was_active) {
        LOG_WARN("FT: Protocol violation: file-start for " + start.info.name +
                 " while receiving " + m_info.name + " (" + std::to_string(m_bytes_received) +
                 " bytes buffered); discarding the previous transfer");
    }
    clearBuffer();

    if (start.info.size > m_config.max_receive_bytes) {
        m_state = TransferState::IDLE;
        m_discarding = true;
        m_last_error = "Refused " + start.info.name + ": " + std::to_string(start.info.size) +
                       " bytes exceeds the receive limit of " +
                       std::to_string(m_config.max_receive_bytes) + " bytes";
        LOG_WARN("FT: " + m_last_error);
        return ReceiveResult::REFUSED;
    }

    m_info = start.info;
    m_state = TransferState::ACTIVE;
    m_discarding = false;
    m_last_error.clear();
    LOG_INFO("FT: Receiving " + m_info.name + " (" + std::to_string(m_info.size) + " bytes, " +
             m_info.mime_type + ")");
    return was_active ? ReceiveResult::RESTARTED : ReceiveResult::STARTED;
}

ReceiveResult TransferReceiver::onChunk(const FileChunkMessage& chunk) {
    if (m_state != TransferState::ACTIVE) {
        if (m_discarding) {
            return ReceiveResult::DISCARDED;
        }
        m_last_error = "Received chunk " + std::to_string(chunk.index) + " with no active transfer";
        LOG_WARN("FT: " + m_last_error);
        return ReceiveResult::IGNORED;
    }

    if (chunk.index != m_chunks.size()) {
        return failSession("Out-of-order chunk for " + m_info.name + ": expected index " +
                           std::to_string(m_chunks.size()) + ", got " + std::to_string(chunk.index));
    }

    const uint64_t total = m_bytes_received + chunk.data.size();
    if (total > m_info.size) {
        return failSession("Chunk data for " + m_info.name + " exceeds the declared size (" +
                           std::to_string(total) + " > " + std::to_string(m_info.size) + " bytes)");
    }
    if (total > m_config.max_receive_bytes) {
        return failSession("Chunk data for " + m_info.name + " exceeds the receive limit");
    }

    m_chunks.push_back(chunk.data);
    m_bytes_received = total;
    if (chunk.progress > m_progress) {
        m_progress = chunk.progress;
    }
    LOG_DEBUG("FT: Chunk " + std::to_string(chunk.index) + " (" + std::to_string(chunk.data.size()) +
              " bytes) progress=" + std::to_string(m_progress) + "%");
    return ReceiveResult::CHUNK_ACCEPTED;
}

ReceiveResult TransferReceiver::onComplete(const FileCompleteMessage& complete) {
    if (m_state != TransferState::ACTIVE) {
        if (m_discarding) {
            m_discarding = false;
            return ReceiveResult::DISCARDED;
        }
        m_last_error = "Received file-complete for " + complete.info.name + " with no active transfer";
        LOG_WARN("FT: " + m_last_error);
        return ReceiveResult::IGNORED;
    }

    if (m_bytes_received != m_info.size) {
        const ReceiveResult result = failSession(
            "Incomplete transfer of " + m_info.name + ": declared " + std::to_string(m_info.size) +
            " bytes, received " + std::to_string(m_bytes_received));
        // Nothing of this transfer follows its file-complete.
        m_discarding = false;
        return result;
    }

    auto content = std::make_shared<std::vector<uint8_t>>();
    content->reserve(static_cast<size_t>(m_bytes_received));
    for (const auto& piece : m_chunks) {
        content->insert(content->end(), piece.begin(), piece.end());
    }

    if (complete.info.size != m_info.size || complete.info.name != m_info.name) {
        LOG_WARN("FT: file-complete metadata (" + complete.info.name + ", " +
                 std::to_string(complete.info.size) + " bytes) differs from file-start");
    }

    ReceivedArtifact artifact;
    artifact.info = m_info;
    artifact.content = std::move(content);
    m_artifact = std::move(artifact);

    clearBuffer();
    m_state = TransferState::COMPLETED;
    m_progress = 100;
    LOG_INFO("FT: Received " + m_info.name + " (" + std::to_string(m_artifact->content->size()) + " bytes)");
    return ReceiveResult::COMPLETED;
}

ReceiveResult TransferReceiver::onInvalidFrame(const std::string& reason) {
    if (m_state != TransferState::ACTIVE) {
        m_last_error = reason;
        return ReceiveResult::IGNORED;
    }
    return failSession("Lost a frame while receiving " + m_info.name + ": " + reason);
}

ReceiveResult TransferReceiver::refuse(const FileStartMessage& start, const std::string& reason) {
    if (m_state == TransferState::ACTIVE) {
        clearBuffer();
        m_state = TransferState::ABORTED;
    }
    m_discarding = true;
    m_last_error = "Refused " + start.info.name + ": " + reason;
    LOG_WARN("FT: " + m_last_error);
    return ReceiveResult::REFUSED;
}

bool TransferReceiver::abort(const std::string& reason) {
    m_discarding = false;
    if (m_state != TransferState::ACTIVE) {
        return false;
    }
    LOG_WARN("FT: Receive of " + m_info.name + " aborted after " + std::to_string(m_bytes_received) +
             " bytes: " + reason);
    clearBuffer();
    m_state = TransferState::ABORTED;
    m_last_error = reason;
    return true;
}

ReceivedArtifact TransferReceiver::takeArtifact() {
    ReceivedArtifact out;
    if (m_artifact) {
        out = std::move(*m_artifact);
        m_artifact.reset();
    }
    return out;
}

ReceiveResult TransferReceiver::failSession(const std::string& reason) {
    LOG_WARN("FT: Protocol violation: " + reason);
    clearBuffer();
    m_state = TransferState::ABORTED;
    m_discarding = true;
    m_last_error = reason;
    return ReceiveResult::ABORTED;
}

void TransferReceiver::clearBuffer() {
    m_chunks.clear();
    m_bytes_received = 0;
    m_progress = 0;
}
