#include "logger.h"
#include <mutex>
#include <string>
#include <iostream>
#include <algorithm>
#include <cctype>

/**
 * @brief The session ID for logging.
 */
static std::string g_sessionId = "NO_SESSION";

/**
 * @brief Mutex for protecting the logger.
 */
static std::mutex g_logMutex;

/**
 * @brief Global log level (for conditional logging)
 * Default: INFO (skips DEBUG messages)
 */
static LogLevel g_log_level = LogLevel::INFO;

/**
 * @brief Optional sink replacing stderr output.
 */
static std::function<void(const std::string&)> g_log_callback;

/**
 * @brief Sets the session ID for logging.
 * @param session_id The session ID to set.
 */
void setSessionId(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(g_logMutex);
    g_sessionId = session_id;
}

void setLogCallback(std::function<void(const std::string&)> callback) {
    std::lock_guard<std::mutex> lock(g_logMutex);
    g_log_callback = std::move(callback);
}

/**
 * @brief Sets the global log level (for conditional logging)
 * @param level The log level to set.
 */
void set_log_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(g_logMutex);
    g_log_level = level;
}

/**
 * @brief Gets the current global log level
 * @return The current log level.
 */
LogLevel get_log_level() {
    std::lock_guard<std::mutex> lock(g_logMutex);
    return g_log_level;
}

LogLevel parse_log_level(const std::string& value) {
    std::string v = value;
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "debug") return LogLevel::DEBUG;
    if (v == "info") return LogLevel::INFO;
    if (v == "warn" || v == "warning") return LogLevel::WARNING;
    if (v == "error") return LogLevel::ERROR;
    if (v == "none") return LogLevel::NONE;
    return LogLevel::INFO;
}

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "debug";
        case LogLevel::INFO: return "info";
        case LogLevel::WARNING: return "warning";
        case LogLevel::ERROR: return "error";
        case LogLevel::NONE: return "none";
    }
    return "unknown";
}

/**
 * @brief Logs a message to the configured sink (stderr by default).
 * @param message The message to log.
 */
void nativeLog(const std::string& message) {
    std::function<void(const std::string&)> callback;
    std::string log_message;
    {
        std::lock_guard<std::mutex> lock(g_logMutex);
        log_message = "[" + g_sessionId + "] " + message;
        callback = g_log_callback;
    }

    // Never invoke the callback while holding g_logMutex: it may log again.
    if (callback) {
        callback(log_message);
        return;
    }

    std::lock_guard<std::mutex> lock(g_logMutex);
    std::cerr << log_message << std::endl;
}
