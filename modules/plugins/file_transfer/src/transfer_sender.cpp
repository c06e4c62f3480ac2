#include "transfer_sender.h"
#include "logger.h"
#include <algorithm>

namespace {
constexpr const char* kConnectionLost = "Connection lost during transfer";
}

TransferSender::TransferSender(TransferConfig config)
    : m_config(std::move(config)) {
    if (m_config.chunk_size == 0) {
        m_config.chunk_size = CHUNK_SIZE;
    } else if (m_config.chunk_size > wire::kMaxChunkDataSize) {
        LOG_WARN("FT: Chunk size " + std::to_string(m_config.chunk_size) + " capped at " +
                 std::to_string(wire::kMaxChunkDataSize) + " bytes");
        m_config.chunk_size = wire::kMaxChunkDataSize;
    }
}

bool TransferSender::start(std::shared_ptr<ITransportConnection> connection, LocalFile file) {
    if (m_state != TransferState::IDLE) {
        m_last_error = "Sender already used";
        LOG_WARN("FT: start() called twice on the same sender");
        return false;
    }

    m_connection = std::move(connection);
    m_info = file.info();
    m_data = std::move(file.data);
    m_state = TransferState::ACTIVE;

    if (!connectionUsable()) {
        abort(kConnectionLost);
        return false;
    }

    LOG_INFO("FT: Sending " + m_info.name + " (" + std::to_string(m_info.size) + " bytes, " +
             m_info.mime_type + ")");

    if (!m_connection->send(wire::encode_transfer_message(FileStartMessage{m_info}))) {
        abort(kConnectionLost);
        return false;
    }

    if (m_info.size == 0) {
        reportProgress(100);
    }
    return true;
}

SendStepResult TransferSender::step() {
    if (m_state == TransferState::COMPLETED) {
        return SendStepResult::FINISHED;
    }
    if (m_state != TransferState::ACTIVE) {
        return SendStepResult::ABORTED;
    }

    const uint64_t size = m_data.size();
    const uint64_t interval_bytes =
        static_cast<uint64_t>(m_config.chunk_size) * m_config.pacing_interval_chunks;

    while (m_offset < size) {
        if (!connectionUsable()) {
            abort(kConnectionLost);
            return SendStepResult::ABORTED;
        }

        if (m_config.max_buffered_bytes > 0 &&
            m_connection->bufferedAmount() > m_config.max_buffered_bytes) {
            m_resume_delay = std::max(m_config.pacing_delay, std::chrono::milliseconds(1));
            LOG_DEBUG("FT: Transport buffer above " + std::to_string(m_config.max_buffered_bytes) +
                      " bytes, backing off");
            return SendStepResult::YIELD;
        }

        const uint64_t previous = m_offset;
        const uint64_t length = std::min<uint64_t>(m_config.chunk_size, size - m_offset);

        FileChunkMessage chunk;
        chunk.index = m_next_index;
        chunk.progress = compute_progress(previous + length, size);
        chunk.data.assign(m_data.begin() + static_cast<std::ptrdiff_t>(previous),
                          m_data.begin() + static_cast<std::ptrdiff_t>(previous + length));

        if (!m_connection->send(wire::encode_transfer_message(chunk))) {
            // A link that is still open refused the record itself.
            abort(connectionUsable() ? "Transport refused chunk " + std::to_string(chunk.index) +
                                           " (" + std::to_string(length) + " bytes)"
                                     : std::string(kConnectionLost));
            return SendStepResult::ABORTED;
        }

        m_offset = previous + length;
        ++m_next_index;
        reportProgress(chunk.progress);

        // Placeholder pacing: pause briefly each time a checkpoint is crossed.
        if (interval_bytes > 0 && m_offset < size &&
            (m_offset / interval_bytes) > (previous / interval_bytes)) {
            m_resume_delay = m_config.pacing_delay;
            return SendStepResult::YIELD;
        }
    }

    if (!connectionUsable() ||
        !m_connection->send(wire::encode_transfer_message(FileCompleteMessage{m_info}))) {
        abort(kConnectionLost);
        return SendStepResult::ABORTED;
    }

    m_state = TransferState::COMPLETED;
    m_connection.reset();
    m_data.clear();
    LOG_INFO("FT: Sent " + m_info.name + " in " + std::to_string(m_next_index) + " chunks");
    return SendStepResult::FINISHED;
}

void TransferSender::abort(const std::string& reason) {
    if (m_state != TransferState::ACTIVE) {
        return;
    }
    m_state = TransferState::ABORTED;
    m_last_error = reason;
    m_connection.reset();
    m_data.clear();
    LOG_WARN("FT: Send of " + m_info.name + " aborted after " + std::to_string(m_offset) +
             " bytes: " + reason);
}

bool TransferSender::connectionUsable() const {
    return m_connection && m_connection->isOpen();
}

void TransferSender::reportProgress(uint8_t percent) {
    // Progress never goes backwards.
    if (percent < m_progress) {
        return;
    }
    m_progress = percent;
    if (m_on_progress) {
        m_on_progress(percent);
    }
}
