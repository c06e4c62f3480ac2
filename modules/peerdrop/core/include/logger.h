#ifndef LOGGER_H
#define LOGGER_H

#include <string>
#include <functional>

// Log level enumeration for conditional logging
enum class LogLevel {
    DEBUG = 0,     // Every message (most verbose)
    INFO = 1,      // Important events
    WARNING = 2,   // Problems only
    ERROR = 3,     // Errors only
    NONE = 4,      // Disable all logging
};

// Label prepended to every log line. Set to the local peer identity once it is known.
void setSessionId(const std::string& session_id);
void nativeLog(const std::string& message);

// Route log lines to a callback instead of stderr (used by the desktop CLI).
// Pass an empty function to restore stderr output.
void setLogCallback(std::function<void(const std::string&)> callback);

// Default: INFO (skips debug messages)
void set_log_level(LogLevel level);
LogLevel get_log_level();

// Parses debug|info|warn|warning|error|none (case-insensitive). Unknown values map to INFO.
LogLevel parse_log_level(const std::string& value);
const char* log_level_name(LogLevel level);

// Logging macros for conditional compilation
#define LOG_DEBUG(msg) if (get_log_level() <= LogLevel::DEBUG) nativeLog(msg)
#define LOG_INFO(msg)  if (get_log_level() <= LogLevel::INFO) nativeLog(msg)
#define LOG_WARN(msg)  if (get_log_level() <= LogLevel::WARNING) nativeLog(msg)
#define LOG_ERROR(msg) if (get_log_level() <= LogLevel::ERROR) nativeLog(msg)

#endif // LOGGER_H
