#include "transfer_types.h"
#include "config_manager.h"
#include "logger.h"
#include "transfer_message.h"
#include <cmath>

TransferConfig load_transfer_config() {
    ConfigManager& config = ConfigManager::getInstance();
    TransferConfig out;

    out.chunk_size = config.getChunkSize();
    if (out.chunk_size == 0) {
        LOG_WARN("FT: file_transfer.chunk_size must be positive, using " + std::to_string(CHUNK_SIZE));
        out.chunk_size = CHUNK_SIZE;
    } else if (out.chunk_size > wire::kMaxChunkDataSize) {
        LOG_WARN("FT: file_transfer.chunk_size " + std::to_string(out.chunk_size) +
                 " does not fit in one frame, using " + std::to_string(wire::kMaxChunkDataSize));
        out.chunk_size = wire::kMaxChunkDataSize;
    }
    out.pacing_interval_chunks = config.getPacingIntervalChunks();

    int delay_ms = config.getPacingDelayMs();
    if (delay_ms < 0) {
        delay_ms = 0;
    }
    out.pacing_delay = std::chrono::milliseconds(delay_ms);
    out.max_buffered_bytes = config.getMaxBufferedBytes();
    out.max_receive_bytes = config.getMaxReceiveBytes();
    return out;
}

uint8_t compute_progress(uint64_t sent, uint64_t total) {
    if (total == 0 || sent >= total) {
        return 100;
    }
    const double ratio = static_cast<double>(sent) / static_cast<double>(total);
    const long long percent = std::llround(ratio * 100.0);
    if (percent < 0) {
        return 0;
    }
    return static_cast<uint8_t>(percent > 100 ? 100 : percent);
}

const char* transfer_state_to_string(TransferState state) {
    switch (state) {
        case TransferState::IDLE: return "IDLE";
        case TransferState::ACTIVE: return "ACTIVE";
        case TransferState::COMPLETED: return "COMPLETED";
        case TransferState::ABORTED: return "ABORTED";
    }
    return "UNKNOWN";
}

const char* transfer_direction_to_string(TransferDirection direction) {
    switch (direction) {
        case TransferDirection::NONE: return "NONE";
        case TransferDirection::SEND: return "SEND";
        case TransferDirection::RECEIVE: return "RECEIVE";
    }
    return "UNKNOWN";
}
