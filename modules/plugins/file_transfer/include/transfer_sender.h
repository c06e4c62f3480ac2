#ifndef TRANSFER_SENDER_H
#define TRANSFER_SENDER_H

#include "local_file.h"
#include "transfer_message.h"
#include "transfer_types.h"
#include "transport_connection.h"

#include <chrono>
#include <functional>
#include <memory>
#include <string>

enum class SendStepResult {
    YIELD,      // Paused; call step() again after resumeDelay()
    FINISHED,   // Complete was sent
    ABORTED     // Connection lost; Complete was not sent
};

/**
 * @brief Outgoing half of one transfer.
 *
 * Emits file-start, then the content in chunk_size slices (offset 0 first),
 * then file-complete. step() never blocks: it returns YIELD at pacing
 * checkpoints and while the transport reports more buffered bytes than
 * max_buffered_bytes, and the owner schedules the next step. Connection
 * liveness is checked before every chunk.
 */
class TransferSender {
public:
    using ProgressCallback = std::function<void(uint8_t percent)>;

    explicit TransferSender(TransferConfig config);

    // Sends file-start. Returns false (state ABORTED, lastError set) if the
    // link is unusable. An empty file reports 100% here.
    bool start(std::shared_ptr<ITransportConnection> connection, LocalFile file);

    SendStepResult step();

    // Forcibly ends an active send. No-op once finished.
    void abort(const std::string& reason);

    TransferState state() const { return m_state; }
    uint8_t progress() const { return m_progress; }
    uint64_t bytesSent() const { return m_offset; }
    uint32_t chunksSent() const { return m_next_index; }
    const FileInfo& fileInfo() const { return m_info; }
    const std::string& lastError() const { return m_last_error; }
    std::chrono::milliseconds resumeDelay() const { return m_resume_delay; }

    void setProgressCallback(ProgressCallback callback) { m_on_progress = std::move(callback); }

private:
    bool connectionUsable() const;
    void reportProgress(uint8_t percent);

    TransferConfig m_config;
    std::shared_ptr<ITransportConnection> m_connection;
    FileInfo m_info;
    std::vector<uint8_t> m_data;

    TransferState m_state = TransferState::IDLE;
    uint64_t m_offset = 0;
    uint32_t m_next_index = 0;
    uint8_t m_progress = 0;
    std::chrono::milliseconds m_resume_delay{0};
    std::string m_last_error;

    ProgressCallback m_on_progress;
};

#endif // TRANSFER_SENDER_H
