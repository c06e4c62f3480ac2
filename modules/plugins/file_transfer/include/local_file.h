#ifndef LOCAL_FILE_H
#define LOCAL_FILE_H

#include "transfer_types.h"
#include <cstdint>
#include <string>
#include <vector>

// A file selected for sending: metadata plus its whole content.
struct LocalFile {
    std::string name;
    std::string mime_type;
    std::vector<uint8_t> data;

    FileInfo info() const { return FileInfo{name, static_cast<uint64_t>(data.size()), mime_type}; }
};

// Reads path into out (name = base name). Returns false and sets *error on failure.
bool load_local_file(const std::string& path, LocalFile& out, std::string* error = nullptr);

// MIME type from the file extension; application/octet-stream when unknown.
std::string guess_mime_type(const std::string& file_name);

#endif // LOCAL_FILE_H
