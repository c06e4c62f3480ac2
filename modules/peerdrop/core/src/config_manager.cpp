#include "config_manager.h"
#include "logger.h"
#include <fstream>
#include <limits>
#include <sstream>
#include <type_traits>

namespace {

// True when v holds a T without conversion or narrowing.
template <typename T>
bool holds_type(const json& v) {
    if constexpr (std::is_same_v<T, bool>) {
        return v.is_boolean();
    } else if constexpr (std::is_same_v<T, std::string>) {
        return v.is_string();
    } else {
        // Values set from C++ ints are signed even when non-negative.
        if (v.is_number_unsigned()) {
            return v.get<uint64_t>() <= static_cast<uint64_t>(std::numeric_limits<T>::max());
        }
        if (!v.is_number_integer()) {
            return false;
        }
        const int64_t n = v.get<int64_t>();
        if constexpr (std::is_unsigned_v<T>) {
            return n >= 0 && static_cast<uint64_t>(n) <= static_cast<uint64_t>(std::numeric_limits<T>::max());
        } else {
            return n >= static_cast<int64_t>(std::numeric_limits<T>::min()) &&
                   n <= static_cast<int64_t>(std::numeric_limits<T>::max());
        }
    }
}

// Missing keys and values of the wrong type or range yield the default.
template <typename T>
T read_value(const json& section, const char* section_name, const char* key, const T& fallback) {
    auto it = section.find(key);
    if (it == section.end()) {
        return fallback;
    }
    if (!holds_type<T>(*it)) {
        LOG_WARN(std::string("CONFIG: Ignoring ") + section_name + "." + key + " = " + it->dump() +
                 " (wrong type or out of range), using the default");
        return fallback;
    }
    return it->get<T>();
}

} // namespace

ConfigManager& ConfigManager::getInstance() {
    static ConfigManager instance;
    return instance;
}

bool ConfigManager::loadConfig(const std::string& config_path) {
    std::ifstream config_file(config_path);
    if (!config_file.is_open()) {
        LOG_ERROR("CONFIG: Failed to open config file: " + config_path);
        return false;
    }
    std::stringstream buffer;
    buffer << config_file.rdbuf();
    if (!loadConfigFromString(buffer.str())) {
        LOG_ERROR("CONFIG: Rejected config file: " + config_path);
        return false;
    }
    LOG_INFO("CONFIG: Configuration loaded successfully from: " + config_path);
    return true;
}

bool ConfigManager::loadConfigFromString(const std::string& content) {
    try {
        json parsed = json::parse(content);
        if (!parsed.is_object()) {
            LOG_ERROR("CONFIG: Top-level configuration must be a JSON object");
            return false;
        }
        m_config = std::move(parsed);
        return true;
    } catch (const json::exception& e) {
        LOG_ERROR(std::string("CONFIG: Config parsing failed: ") + e.what());
        return false;
    }
}

bool ConfigManager::setValueAtPath(const std::vector<std::string>& path, const json& value) {
    if (path.empty()) {
        return false;
    }
    json* node = &m_config;
    for (size_t i = 0; i + 1 < path.size(); ++i) {
        json& child = (*node)[path[i]];
        if (!child.is_object()) {
            child = json::object();
        }
        node = &child;
    }
    (*node)[path.back()] = value;
    return true;
}

void ConfigManager::reset() {
    m_config = json::object();
}

json ConfigManager::section(const char* name) const {
    auto it = m_config.find(name);
    if (it == m_config.end() || !it->is_object()) {
        return json::object();
    }
    return *it;
}

int ConfigManager::getConnectTimeoutMs() const {
    const int timeout_ms = read_value(section("connection"), "connection", "timeout_ms", 15000);
    if (timeout_ms <= 0) {
        LOG_WARN("CONFIG: connection.timeout_ms must be positive, using 15000");
        return 15000;
    }
    return timeout_ms;
}

size_t ConfigManager::getChannelCapacity() const {
    return read_value(section("connection"), "connection", "channel_capacity", static_cast<size_t>(4096));
}

uint32_t ConfigManager::getChunkSize() const {
    return read_value(section("file_transfer"), "file_transfer", "chunk_size", static_cast<uint32_t>(16 * 1024));
}

uint32_t ConfigManager::getPacingIntervalChunks() const {
    return read_value(section("file_transfer"), "file_transfer", "pacing_interval_chunks", static_cast<uint32_t>(10));
}

int ConfigManager::getPacingDelayMs() const {
    return read_value(section("file_transfer"), "file_transfer", "pacing_delay_ms", 10);
}

uint64_t ConfigManager::getMaxBufferedBytes() const {
    return read_value(section("file_transfer"), "file_transfer", "max_buffered_bytes", static_cast<uint64_t>(1024 * 1024));
}

uint64_t ConfigManager::getMaxReceiveBytes() const {
    return read_value(section("file_transfer"), "file_transfer", "max_receive_bytes", static_cast<uint64_t>(2ull * 1024 * 1024 * 1024));
}

std::string ConfigManager::getDownloadDir() const {
    return read_value(section("file_transfer"), "file_transfer", "download_dir", std::string("downloads"));
}

int ConfigManager::getListenPort() const {
    return read_value(section("signaling"), "signaling", "listen_port", 30001);
}

std::string ConfigManager::getBindAddress() const {
    return read_value(section("signaling"), "signaling", "bind_address", std::string("0.0.0.0"));
}

std::string ConfigManager::getAdvertiseAddress() const {
    return read_value(section("signaling"), "signaling", "advertise_address", std::string("127.0.0.1"));
}

std::string ConfigManager::getLogLevel() const {
    return read_value(section("logging"), "logging", "level", std::string("info"));
}

bool ConfigManager::isConsoleOutput() const {
    return read_value(section("logging"), "logging", "console_output", true);
}
