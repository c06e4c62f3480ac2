#include "transfer_message.h"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

constexpr const char* kStartType = "file-start";
constexpr const char* kCompleteType = "file-complete";

void set_error(std::string* error, const std::string& reason) {
    if (error) {
        *error = reason;
    }
}

std::string encode_file_info(const char* type, const FileInfo& info) {
    json j;
    j["type"] = type;
    j["fileInfo"] = {
        {"name", info.name},
        {"size", info.size},
        {"type", info.mime_type}
    };
    return j.dump();
}

wire::DecodeStatus decode_file_info(std::string_view payload, const char* expected_type,
                                    FileInfo& out, std::string* error) {
    try {
        json j = json::parse(payload.begin(), payload.end());
        if (!j.is_object()) {
            set_error(error, "control payload is not a JSON object");
            return wire::DecodeStatus::MALFORMED;
        }

        auto type_it = j.find("type");
        if (type_it == j.end() || !type_it->is_string() || type_it->get<std::string>() != expected_type) {
            set_error(error, std::string("type field does not match frame (expected ") + expected_type + ")");
            return wire::DecodeStatus::MALFORMED;
        }

        auto info_it = j.find("fileInfo");
        if (info_it == j.end() || !info_it->is_object()) {
            set_error(error, "missing fileInfo object");
            return wire::DecodeStatus::MALFORMED;
        }
        const json& info = *info_it;

        auto name_it = info.find("name");
        auto size_it = info.find("size");
        auto mime_it = info.find("type");
        if (name_it == info.end() || !name_it->is_string()) {
            set_error(error, "fileInfo.name missing or not a string");
            return wire::DecodeStatus::MALFORMED;
        }
        // Non-negative integers parse as number_unsigned; anything else is rejected.
        if (size_it == info.end() || !size_it->is_number_unsigned()) {
            set_error(error, "fileInfo.size missing or not a non-negative integer");
            return wire::DecodeStatus::MALFORMED;
        }
        if (mime_it == info.end() || !mime_it->is_string()) {
            set_error(error, "fileInfo.type missing or not a string");
            return wire::DecodeStatus::MALFORMED;
        }

        out.name = name_it->get<std::string>();
        out.size = size_it->get<uint64_t>();
        out.mime_type = mime_it->get<std::string>();
        return wire::DecodeStatus::OK;
    } catch (const json::exception& e) {
        set_error(error, std::string("invalid JSON: ") + e.what());
        return wire::DecodeStatus::MALFORMED;
    }
}

std::string encode_chunk(const FileChunkMessage& chunk) {
    std::string payload;
    payload.reserve(wire::kChunkHeaderSize + chunk.data.size());
    payload.push_back(static_cast<char>((chunk.index >> 24) & 0xFF));
    payload.push_back(static_cast<char>((chunk.index >> 16) & 0xFF));
    payload.push_back(static_cast<char>((chunk.index >> 8) & 0xFF));
    payload.push_back(static_cast<char>(chunk.index & 0xFF));
    payload.push_back(static_cast<char>(chunk.progress));
    payload.append(reinterpret_cast<const char*>(chunk.data.data()), chunk.data.size());
    return payload;
}

wire::DecodeStatus decode_chunk(std::string_view payload, FileChunkMessage& out, std::string* error) {
    if (payload.size() < wire::kChunkHeaderSize) {
        set_error(error, "chunk header truncated");
        return wire::DecodeStatus::MALFORMED;
    }
    if (payload.size() == wire::kChunkHeaderSize) {
        set_error(error, "chunk carries no data");
        return wire::DecodeStatus::MALFORMED;
    }

    const uint8_t progress = static_cast<uint8_t>(payload[4]);
    if (progress > 100) {
        set_error(error, "chunk progress out of range: " + std::to_string(progress));
        return wire::DecodeStatus::MALFORMED;
    }

    out.index = (static_cast<uint32_t>(static_cast<uint8_t>(payload[0])) << 24) |
                (static_cast<uint32_t>(static_cast<uint8_t>(payload[1])) << 16) |
                (static_cast<uint32_t>(static_cast<uint8_t>(payload[2])) << 8) |
                static_cast<uint32_t>(static_cast<uint8_t>(payload[3]));
    out.progress = progress;
    out.data.assign(reinterpret_cast<const uint8_t*>(payload.data()) + wire::kChunkHeaderSize,
                    reinterpret_cast<const uint8_t*>(payload.data()) + payload.size());
    return wire::DecodeStatus::OK;
}

} // namespace

const char* transfer_message_name(const TransferMessage& message) {
    if (std::holds_alternative<FileStartMessage>(message)) return kStartType;
    if (std::holds_alternative<FileChunkMessage>(message)) return "file-chunk";
    return kCompleteType;
}

namespace wire {

std::string encode_transfer_message(const TransferMessage& message) {
    if (const auto* start = std::get_if<FileStartMessage>(&message)) {
        return encode_message(MessageType::FILE_START, encode_file_info(kStartType, start->info));
    }
    if (const auto* chunk = std::get_if<FileChunkMessage>(&message)) {
        return encode_message(MessageType::FILE_CHUNK, encode_chunk(*chunk));
    }
    const auto& complete = std::get<FileCompleteMessage>(message);
    return encode_message(MessageType::FILE_COMPLETE, encode_file_info(kCompleteType, complete.info));
}

DecodeStatus decode_transfer_message(std::string_view data, TransferMessage& out, std::string* error) {
    MessageType type;
    std::string_view payload;
    DecodeStatus status = decode_message(data, type, payload);
    if (status != DecodeStatus::OK) {
        set_error(error, std::string("frame rejected: ") + decode_status_to_string(status));
        return status;
    }

    switch (type) {
        case MessageType::FILE_START: {
            FileStartMessage start;
            status = decode_file_info(payload, kStartType, start.info, error);
            if (status == DecodeStatus::OK) {
                out = std::move(start);
            }
            return status;
        }
        case MessageType::FILE_CHUNK: {
            FileChunkMessage chunk;
            status = decode_chunk(payload, chunk, error);
            if (status == DecodeStatus::OK) {
                out = std::move(chunk);
            }
            return status;
        }
        case MessageType::FILE_COMPLETE: {
            FileCompleteMessage complete;
            status = decode_file_info(payload, kCompleteType, complete.info, error);
            if (status == DecodeStatus::OK) {
                out = std::move(complete);
            }
            return status;
        }
    }
    set_error(error, "unhandled frame type");
    return DecodeStatus::UNKNOWN_TYPE;
}

} // namespace wire
