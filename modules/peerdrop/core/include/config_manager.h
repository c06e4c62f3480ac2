#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>
#include <vector>

using json = nlohmann::json;

// Process-wide configuration backed by config.json.
// Every getter falls back to a built-in default when the key is absent, so the
// engine runs without a configuration file.
class ConfigManager {
public:
    static ConfigManager& getInstance();

    bool loadConfig(const std::string& config_path);
    bool loadConfigFromString(const std::string& content);

    // Overrides a single value, creating intermediate objects as needed.
    bool setValueAtPath(const std::vector<std::string>& path, const json& value);

    // Drops all loaded values (defaults apply again).
    void reset();

    // Connection
    int getConnectTimeoutMs() const;
    size_t getChannelCapacity() const;

    // File Transfer
    uint32_t getChunkSize() const;
    uint32_t getPacingIntervalChunks() const;
    int getPacingDelayMs() const;
    uint64_t getMaxBufferedBytes() const;
    uint64_t getMaxReceiveBytes() const;
    std::string getDownloadDir() const;

    // Signaling / TCP transport
    int getListenPort() const;
    std::string getBindAddress() const;
    std::string getAdvertiseAddress() const;

    // Logging
    std::string getLogLevel() const;
    bool isConsoleOutput() const;

private:
    ConfigManager() = default;

    json section(const char* name) const;

    json m_config = json::object();
};
