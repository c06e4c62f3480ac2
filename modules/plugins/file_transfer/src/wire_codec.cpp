#include "wire_codec.h"

#include <iostream>

namespace {
    inline void wire_debug_log(const std::string& msg) {
#ifdef PEERDROP_WIRE_CODEC_DEBUG
        std::cout << msg << std::endl;
#else
        (void)msg;
#endif
    }

    inline bool is_valid_message_type(uint8_t raw) {
        switch (static_cast<MessageType>(raw)) {
            case MessageType::FILE_START:
            case MessageType::FILE_CHUNK:
            case MessageType::FILE_COMPLETE:
                return true;
        }
        return false;
    }
}

namespace wire {

std::string encode_message(MessageType type, std::string_view payload) {
    const uint32_t length = static_cast<uint32_t>(payload.size());

    std::string encoded;
    encoded.reserve(kHeaderSize + length);

    encoded.push_back(static_cast<char>(type));

    // length big-endian
    encoded.push_back(static_cast<char>((length >> 24) & 0xFF));
    encoded.push_back(static_cast<char>((length >> 16) & 0xFF));
    encoded.push_back(static_cast<char>((length >> 8) & 0xFF));
    encoded.push_back(static_cast<char>(length & 0xFF));

    encoded.append(payload.data(), payload.size());
    return encoded;
}

DecodeStatus decode_message(std::string_view data, MessageType& type, std::string_view& payload) {
    if (data.empty()) {
        return DecodeStatus::TRUNCATED;
    }

    const uint8_t raw_type = static_cast<uint8_t>(data[0]);
    if (!is_valid_message_type(raw_type)) {
        wire_debug_log("WIRE_DEBUG: Unknown frame type: " + std::to_string(raw_type));
        return DecodeStatus::UNKNOWN_TYPE;
    }

    if (data.size() < kHeaderSize) {
        return DecodeStatus::TRUNCATED;
    }

    const uint32_t length = (static_cast<uint32_t>(static_cast<uint8_t>(data[1])) << 24) |
                            (static_cast<uint32_t>(static_cast<uint8_t>(data[2])) << 16) |
                            (static_cast<uint32_t>(static_cast<uint8_t>(data[3])) << 8) |
                            static_cast<uint32_t>(static_cast<uint8_t>(data[4]));

    if (length > kMaxMessageSize) {
        wire_debug_log("WIRE_DEBUG: Length too large: " + std::to_string(length));
        return DecodeStatus::TOO_LARGE;
    }

    if (data.size() < kHeaderSize + length) {
        wire_debug_log("WIRE_DEBUG: Data incomplete. Expected " + std::to_string(kHeaderSize + length) +
                       ", got " + std::to_string(data.size()));
        return DecodeStatus::TRUNCATED;
    }

    if (data.size() > kHeaderSize + length) {
        wire_debug_log("WIRE_DEBUG: Trailing bytes after frame: " +
                       std::to_string(data.size() - kHeaderSize - length));
        return DecodeStatus::MALFORMED;
    }

    type = static_cast<MessageType>(raw_type);
    payload = data.substr(kHeaderSize, length);
    return DecodeStatus::OK;
}

const char* decode_status_to_string(DecodeStatus status) {
    switch (status) {
        case DecodeStatus::OK: return "OK";
        case DecodeStatus::TRUNCATED: return "TRUNCATED";
        case DecodeStatus::UNKNOWN_TYPE: return "UNKNOWN_TYPE";
        case DecodeStatus::TOO_LARGE: return "TOO_LARGE";
        case DecodeStatus::MALFORMED: return "MALFORMED";
    }
    return "UNKNOWN";
}

} // namespace wire
