#ifndef TRANSFER_MESSAGE_H
#define TRANSFER_MESSAGE_H

#include "transfer_types.h"
#include "wire_codec.h"

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

// --- Announces a transfer ---
struct FileStartMessage {
    FileInfo info;
};

// --- One slice of content, in order. index is zero-based ---
struct FileChunkMessage {
    uint32_t index = 0;
    uint8_t progress = 0;
    std::vector<uint8_t> data;
};

// --- Ends a transfer; repeats the metadata of the start ---
struct FileCompleteMessage {
    FileInfo info;
};

using TransferMessage = std::variant<
    FileStartMessage,
    FileChunkMessage,
    FileCompleteMessage
>;

const char* transfer_message_name(const TransferMessage& message);

namespace wire {

inline constexpr size_t kChunkHeaderSize = 5;  // index u32 BE + progress u8
// Largest chunk whose frame still decodes on the receiving side.
inline constexpr uint32_t kMaxChunkDataSize = kMaxMessageSize - static_cast<uint32_t>(kChunkHeaderSize);

std::string encode_transfer_message(const TransferMessage& message);

// Decodes one frame into a validated message. On any status other than OK,
// *error (when given) receives a human-readable reason.
DecodeStatus decode_transfer_message(std::string_view data, TransferMessage& out,
                                     std::string* error = nullptr);

} // namespace wire

#endif // TRANSFER_MESSAGE_H
