#ifndef TRANSFER_TYPES_H
#define TRANSFER_TYPES_H

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

/**
 * TRANSFER TYPES AND COMMON DEFINITIONS
 *
 * Shared enums and structures used by the sender, the receiver and the
 * SessionCoordinator.
 */

// ============================================================================
// ENUMS - Transfer Control
// ============================================================================

enum class TransferState {
    IDLE,           // No transfer yet
    ACTIVE,         // Currently transferring
    COMPLETED,      // Complete sent / artifact assembled
    ABORTED         // Connection lost or protocol violation
};

enum class TransferDirection {
    NONE,           // No transfer yet
    SEND,           // Outgoing transfer
    RECEIVE         // Incoming transfer
};

// ============================================================================
// CONSTANTS
// ============================================================================

constexpr uint32_t CHUNK_SIZE = 16 * 1024;                          // 16KB chunks
constexpr uint32_t PACING_INTERVAL_CHUNKS = 10;                     // Pause every 10 chunks
constexpr uint32_t PACING_DELAY_MS = 10;                            // for 10ms
constexpr uint32_t CONNECT_TIMEOUT_MS = 15000;                      // Connecting -> Disconnected
constexpr uint64_t MAX_BUFFERED_BYTES = 1024 * 1024;                // Sender high-water mark
constexpr uint64_t MAX_RECEIVE_BYTES = 2ull * 1024 * 1024 * 1024;   // Whole file is held in memory

// ============================================================================
// STRUCTURES
// ============================================================================

/**
 * File metadata carried by file-start and file-complete.
 */
struct FileInfo {
    std::string name;
    uint64_t size = 0;
    std::string mime_type;
};

/**
 * A fully received file. The content is shared so that observers can keep it
 * without copying; resource_handle names the backing resource in the
 * artifact store (empty when it could not be published).
 */
struct ReceivedArtifact {
    FileInfo info;
    std::shared_ptr<const std::vector<uint8_t>> content;
    std::string resource_handle;
};

/**
 * Tunables shared by sender and receiver.
 */
struct TransferConfig {
    uint32_t chunk_size = CHUNK_SIZE;
    // The fixed pause is a placeholder heuristic. max_buffered_bytes is the
    // real backpressure signal (transport buffered amount).
    uint32_t pacing_interval_chunks = PACING_INTERVAL_CHUNKS;
    std::chrono::milliseconds pacing_delay{PACING_DELAY_MS};
    uint64_t max_buffered_bytes = MAX_BUFFERED_BYTES;
    uint64_t max_receive_bytes = MAX_RECEIVE_BYTES;
};

// Reads the file_transfer section of ConfigManager.
TransferConfig load_transfer_config();

// round(sent / total * 100), clamped to [0, 100]. An empty file is 100% done.
uint8_t compute_progress(uint64_t sent, uint64_t total);

const char* transfer_state_to_string(TransferState state);
const char* transfer_direction_to_string(TransferDirection direction);

#endif // TRANSFER_TYPES_H
