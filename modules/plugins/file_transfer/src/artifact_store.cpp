#include "artifact_store.h"
#include "logger.h"
#include <filesystem>
#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

namespace {
constexpr int kMaxNameAttempts = 1000;
}

std::string sanitize_file_name(const std::string& name) {
    // Keep only the last path component, whichever separator the peer used.
    const auto slash = name.find_last_of("/\\");
    std::string base = (slash == std::string::npos) ? name : name.substr(slash + 1);

    std::string out;
    out.reserve(base.size());
    for (char c : base) {
        const unsigned char uc = static_cast<unsigned char>(c);
        if (uc < 0x20 || uc == 0x7F || c == ':') {
            out.push_back('_');
        } else {
            out.push_back(c);
        }
    }

    if (out.empty() || out == "." || out == "..") {
        return "download";
    }
    return out;
}

FileArtifactStore::FileArtifactStore(std::string download_dir)
    : m_download_dir(std::move(download_dir)) {}

bool FileArtifactStore::publish(const FileInfo& info, const std::vector<uint8_t>& content,
                                std::string& handle_out, std::string* error) {
    auto fail = [&](const std::string& reason) {
        LOG_ERROR("STORE: Cannot publish " + info.name + ": " + reason);
        if (error) {
            *error = reason;
        }
        return false;
    };

    std::error_code ec;
    fs::create_directories(m_download_dir, ec);
    if (ec) {
        return fail("cannot create " + m_download_dir + ": " + ec.message());
    }

    const fs::path safe(sanitize_file_name(info.name));
    const std::string stem = safe.stem().string();
    const std::string ext = safe.extension().string();

    fs::path target = fs::path(m_download_dir) / safe;
    for (int attempt = 1; fs::exists(target, ec); ++attempt) {
        if (attempt > kMaxNameAttempts) {
            return fail("no free file name for " + safe.string());
        }
        target = fs::path(m_download_dir) / (stem + " (" + std::to_string(attempt) + ")" + ext);
    }

    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        return fail("failed to open " + target.string() + " for writing");
    }
    if (!content.empty()) {
        out.write(reinterpret_cast<const char*>(content.data()), static_cast<std::streamsize>(content.size()));
    }
    out.close();
    if (!out) {
        fs::remove(target, ec);
        return fail("write failed for " + target.string());
    }

    handle_out = target.string();
    LOG_INFO("STORE: Saved " + info.name + " as " + handle_out + " (" + std::to_string(content.size()) + " bytes)");
    return true;
}

bool FileArtifactStore::release(const std::string& handle) {
    if (handle.empty()) {
        return true;
    }
    std::error_code ec;
    const bool removed = fs::remove(handle, ec);
    if (ec) {
        LOG_WARN("STORE: Failed to remove " + handle + ": " + ec.message());
        return false;
    }
    if (removed) {
        LOG_INFO("STORE: Released " + handle);
    } else {
        LOG_DEBUG("STORE: " + handle + " already released");
    }
    return true;
}
