#ifndef ARTIFACT_STORE_H
#define ARTIFACT_STORE_H

#include "transfer_types.h"
#include <cstdint>
#include <string>
#include <vector>

// Turns received content into a downloadable resource and releases it again.
class IArtifactStore {
public:
    virtual ~IArtifactStore() = default;

    // On success stores the resource handle in handle_out.
    virtual bool publish(const FileInfo& info, const std::vector<uint8_t>& content,
                         std::string& handle_out, std::string* error = nullptr) = 0;

    // Releasing an unknown or already released handle is a no-op that succeeds.
    virtual bool release(const std::string& handle) = 0;
};

/**
 * @brief Writes each artifact as a file under a download directory.
 *
 * The handle is the written path. Names are reduced to a safe base name and
 * made unique ("report (1).pdf") so an earlier download is never overwritten.
 */
class FileArtifactStore : public IArtifactStore {
public:
    explicit FileArtifactStore(std::string download_dir);

    bool publish(const FileInfo& info, const std::vector<uint8_t>& content,
                 std::string& handle_out, std::string* error = nullptr) override;
    bool release(const std::string& handle) override;

    const std::string& downloadDir() const { return m_download_dir; }

private:
    std::string m_download_dir;
};

// Strips directory components and control characters; never returns "", "." or "..".
std::string sanitize_file_name(const std::string& name);

#endif // ARTIFACT_STORE_H
