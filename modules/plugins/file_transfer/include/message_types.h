#pragma once

#include <cstdint>

enum class MessageType : uint8_t {
    FILE_START     = 0x21,   // JSON {"type":"file-start","fileInfo":{...}}
    FILE_CHUNK     = 0x22,   // binary [index u32 BE][progress u8][bytes]
    FILE_COMPLETE  = 0x23    // JSON {"type":"file-complete","fileInfo":{...}}
};
