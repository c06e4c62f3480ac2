#pragma once

#include "message_types.h"

#include <cstdint>
#include <string>
#include <string_view>

namespace wire {

// Maximum allowed payload size to prevent DoS attacks (10 MB)
inline constexpr uint32_t kMaxMessageSize = 10u * 1024u * 1024u;
inline constexpr size_t kHeaderSize = 5;

enum class DecodeStatus {
    OK,
    TRUNCATED,      // Shorter than the header or the declared length
    UNKNOWN_TYPE,   // Frame type byte is not a MessageType
    TOO_LARGE,      // Declared length above kMaxMessageSize
    MALFORMED       // Trailing bytes, or payload rejected by the message layer
};

// Simple binary format: [type: 1 byte][length: 4 bytes big-endian][payload: length bytes]
std::string encode_message(MessageType type, std::string_view payload);

// Decodes exactly one frame. The transport delivers discrete messages, so
// bytes after the declared payload make the frame MALFORMED.
DecodeStatus decode_message(std::string_view data, MessageType& type, std::string_view& payload);

const char* decode_status_to_string(DecodeStatus status);

} // namespace wire
