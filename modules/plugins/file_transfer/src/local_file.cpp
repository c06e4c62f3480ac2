#include "local_file.h"
#include "logger.h"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <system_error>
#include <unordered_map>

bool load_local_file(const std::string& path, LocalFile& out, std::string* error) {
    auto fail = [&](const std::string& reason) {
        LOG_WARN("FT: Cannot load " + path + ": " + reason);
        if (error) {
            *error = reason;
        }
        return false;
    };

    std::error_code ec;
    const std::filesystem::path fs_path(path);
    if (!std::filesystem::is_regular_file(fs_path, ec)) {
        return fail(ec ? ec.message() : "not a regular file");
    }
    const auto file_size = std::filesystem::file_size(fs_path, ec);
    if (ec) {
        return fail(ec.message());
    }

    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return fail("failed to open for reading");
    }

    std::vector<uint8_t> data(static_cast<size_t>(file_size));
    if (!data.empty()) {
        in.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(data.size()));
        if (in.gcount() != static_cast<std::streamsize>(data.size())) {
            return fail("short read (" + std::to_string(in.gcount()) + " of " +
                        std::to_string(data.size()) + " bytes)");
        }
    }

    out.name = fs_path.filename().string();
    out.mime_type = guess_mime_type(out.name);
    out.data = std::move(data);
    LOG_DEBUG("FT: Loaded " + out.name + " (" + std::to_string(out.data.size()) + " bytes, " +
              out.mime_type + ")");
    return true;
}

std::string guess_mime_type(const std::string& file_name) {
    static const std::unordered_map<std::string, std::string> kTypes = {
        {"txt", "text/plain"},
        {"md", "text/markdown"},
        {"html", "text/html"},
        {"htm", "text/html"},
        {"css", "text/css"},
        {"csv", "text/csv"},
        {"js", "text/javascript"},
        {"json", "application/json"},
        {"xml", "application/xml"},
        {"pdf", "application/pdf"},
        {"zip", "application/zip"},
        {"gz", "application/gzip"},
        {"tar", "application/x-tar"},
        {"png", "image/png"},
        {"jpg", "image/jpeg"},
        {"jpeg", "image/jpeg"},
        {"gif", "image/gif"},
        {"webp", "image/webp"},
        {"svg", "image/svg+xml"},
        {"mp3", "audio/mpeg"},
        {"wav", "audio/wav"},
        {"mp4", "video/mp4"},
        {"webm", "video/webm"},
    };

    const auto dot = file_name.find_last_of('.');
    if (dot == std::string::npos || dot + 1 >= file_name.size()) {
        return "application/octet-stream";
    }
    std::string ext = file_name.substr(dot + 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    auto it = kTypes.find(ext);
    return it != kTypes.end() ? it->second : "application/octet-stream";
}
