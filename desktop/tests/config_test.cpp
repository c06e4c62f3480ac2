#include "config_manager.h"
#include "logger.h"
#include "tcp_transport.h"
#include "transfer_message.h"
#include "transfer_types.h"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

static int tests_failed = 0;

#define TEST_ASSERT(cond, msg) \
    do { \
        if (!(cond)) { \
            std::cerr << "FAIL: " << msg << " [" << __FILE__ << ":" << __LINE__ << "]" << std::endl; \
            tests_failed++; \
            return false; \
        } \
    } while (0)

static bool test_defaults() {
    ConfigManager& config = ConfigManager::getInstance();
    config.reset();

    TEST_ASSERT(config.getConnectTimeoutMs() == 15000, "Default connect timeout");
    TEST_ASSERT(config.getChannelCapacity() == 4096, "Default channel capacity");
    TEST_ASSERT(config.getChunkSize() == 16384, "Default chunk size");
    TEST_ASSERT(config.getPacingIntervalChunks() == 10, "Default pacing interval");
    TEST_ASSERT(config.getPacingDelayMs() == 10, "Default pacing delay");
    TEST_ASSERT(config.getMaxBufferedBytes() == 1024 * 1024, "Default buffered limit");
    TEST_ASSERT(config.getDownloadDir() == "downloads", "Default download dir");
    TEST_ASSERT(config.getListenPort() == 30001, "Default listen port");
    TEST_ASSERT(config.getLogLevel() == "info", "Default log level");
    TEST_ASSERT(config.isConsoleOutput(), "Console output on by default");

    const TransferConfig transfer = load_transfer_config();
    TEST_ASSERT(transfer.chunk_size == CHUNK_SIZE, "TransferConfig chunk size default");
    TEST_ASSERT(transfer.pacing_delay == std::chrono::milliseconds(PACING_DELAY_MS), "TransferConfig delay default");
    TEST_ASSERT(transfer.max_receive_bytes == MAX_RECEIVE_BYTES, "TransferConfig receive limit default");
    return true;
}

static bool test_load_from_string() {
    ConfigManager& config = ConfigManager::getInstance();
    config.reset();

    const std::string text = R"({
        "connection": { "timeout_ms": 5000 },
        "file_transfer": { "chunk_size": 8192, "pacing_delay_ms": 0, "download_dir": "/tmp/inbox" },
        "signaling": { "listen_port": 0, "advertise_address": "10.0.0.5" },
        "logging": { "level": "debug", "console_output": false }
    })";
    TEST_ASSERT(config.loadConfigFromString(text), "Valid config rejected");
    TEST_ASSERT(config.getConnectTimeoutMs() == 5000, "timeout_ms override");
    TEST_ASSERT(config.getChunkSize() == 8192, "chunk_size override");
    TEST_ASSERT(config.getPacingIntervalChunks() == 10, "Missing keys keep defaults");
    TEST_ASSERT(config.getDownloadDir() == "/tmp/inbox", "download_dir override");
    TEST_ASSERT(config.getLogLevel() == "debug" && !config.isConsoleOutput(), "logging section");

    const TransferConfig transfer = load_transfer_config();
    TEST_ASSERT(transfer.chunk_size == 8192, "TransferConfig picks up chunk_size");
    TEST_ASSERT(transfer.pacing_delay == std::chrono::milliseconds(0), "TransferConfig picks up pacing delay");

    const TcpTransport::Options options = TcpTransport::optionsFromConfig();
    TEST_ASSERT(options.listen_port == 0, "Transport listen port");
    TEST_ASSERT(options.advertise_address == "10.0.0.5", "Transport advertise address");
    TEST_ASSERT(options.bind_address == "0.0.0.0", "Transport bind address default");
    TEST_ASSERT(options.connect_timeout_ms == 5000, "Transport timeout follows connection.timeout_ms");

    TEST_ASSERT(!config.loadConfigFromString("{ broken"), "Invalid JSON must be rejected");
    TEST_ASSERT(config.getChunkSize() == 8192, "Rejected input keeps the previous configuration");
    TEST_ASSERT(!config.loadConfigFromString("[1, 2, 3]"), "Top level must be an object");

    TEST_ASSERT(config.setValueAtPath({"file_transfer", "chunk_size"}, 0), "setValueAtPath");
    TEST_ASSERT(load_transfer_config().chunk_size == CHUNK_SIZE, "Zero chunk size falls back to the default");
    TEST_ASSERT(config.setValueAtPath({"new_section", "nested", "key"}, "v"), "setValueAtPath creates objects");
    TEST_ASSERT(!config.setValueAtPath({}, 1), "Empty path is rejected");
    return true;
}

static bool test_wrong_types_fall_back() {
    ConfigManager& config = ConfigManager::getInstance();
    config.reset();

    const std::string text = R"({
        "connection": { "timeout_ms": "15000", "channel_capacity": -5 },
        "file_transfer": { "chunk_size": -1, "pacing_delay_ms": 2.5, "download_dir": 42,
                           "max_receive_bytes": -1 },
        "signaling": { "listen_port": 99999999999, "bind_address": null },
        "logging": { "level": ["debug"], "console_output": "yes" }
    })";
    TEST_ASSERT(config.loadConfigFromString(text), "Well-formed JSON is accepted");

    TEST_ASSERT(config.getConnectTimeoutMs() == 15000, "String timeout falls back");
    TEST_ASSERT(config.getChannelCapacity() == 4096, "Negative capacity falls back");
    TEST_ASSERT(config.getChunkSize() == 16384, "Negative chunk size falls back instead of wrapping");
    TEST_ASSERT(config.getPacingDelayMs() == 10, "Fractional delay falls back");
    TEST_ASSERT(config.getDownloadDir() == "downloads", "Numeric download dir falls back");
    TEST_ASSERT(config.getMaxReceiveBytes() == MAX_RECEIVE_BYTES, "Negative receive limit falls back");
    TEST_ASSERT(config.getListenPort() == 30001, "Port beyond int range falls back");
    TEST_ASSERT(config.getBindAddress() == "0.0.0.0", "Null bind address falls back");
    TEST_ASSERT(config.getLogLevel() == "info", "Array log level falls back");
    TEST_ASSERT(config.isConsoleOutput(), "String console_output falls back");

    const TransferConfig transfer = load_transfer_config();
    TEST_ASSERT(transfer.chunk_size == CHUNK_SIZE, "TransferConfig never sees the wrapped value");

    TEST_ASSERT(config.setValueAtPath({"connection", "timeout_ms"}, -1), "set timeout");
    TEST_ASSERT(config.getConnectTimeoutMs() == 15000, "Non-positive timeout falls back");
    config.reset();
    return true;
}

static bool test_chunk_size_capped_at_frame_limit() {
    ConfigManager& config = ConfigManager::getInstance();
    config.reset();

    TEST_ASSERT(config.setValueAtPath({"file_transfer", "chunk_size"}, 11 * 1024 * 1024), "set chunk_size");
    TEST_ASSERT(load_transfer_config().chunk_size == wire::kMaxChunkDataSize, "Oversized chunk is capped");

    TEST_ASSERT(config.setValueAtPath({"file_transfer", "chunk_size"}, wire::kMaxChunkDataSize), "set limit");
    TEST_ASSERT(load_transfer_config().chunk_size == wire::kMaxChunkDataSize, "The limit itself is allowed");
    TEST_ASSERT(wire::kHeaderSize + wire::kChunkHeaderSize + wire::kMaxChunkDataSize <= TcpConnection::kMaxRecordSize,
                "A full chunk frame fits in one TCP record");
    config.reset();
    return true;
}

static bool test_load_file() {
    ConfigManager& config = ConfigManager::getInstance();
    config.reset();

    const auto path = std::filesystem::temp_directory_path() / "peerdrop_config_test.json";
    {
        std::ofstream out(path);
        out << R"({ "signaling": { "listen_port": 41000 } })";
    }
    TEST_ASSERT(config.loadConfig(path.string()), "loadConfig failed");
    TEST_ASSERT(config.getListenPort() == 41000, "Value from file");

    std::error_code ec;
    std::filesystem::remove(path, ec);
    TEST_ASSERT(!config.loadConfig(path.string()), "Missing file must fail");
    TEST_ASSERT(config.getListenPort() == 41000, "Failed load keeps the previous configuration");
    config.reset();
    return true;
}

static bool test_logger() {
    TEST_ASSERT(parse_log_level("DEBUG") == LogLevel::DEBUG, "Case-insensitive debug");
    TEST_ASSERT(parse_log_level("warn") == LogLevel::WARNING, "warn alias");
    TEST_ASSERT(parse_log_level("warning") == LogLevel::WARNING, "warning");
    TEST_ASSERT(parse_log_level("none") == LogLevel::NONE, "none");
    TEST_ASSERT(parse_log_level("chatty") == LogLevel::INFO, "Unknown level falls back to info");
    TEST_ASSERT(std::string(log_level_name(LogLevel::ERROR)) == "error", "log_level_name");

    std::vector<std::string> lines;
    setLogCallback([&lines](const std::string& line) { lines.push_back(line); });
    set_log_level(LogLevel::WARNING);
    LOG_INFO("TEST: filtered out");
    LOG_WARN("TEST: kept");
    setLogCallback(nullptr);

    TEST_ASSERT(lines.size() == 1, "Only messages at or above the level are emitted");
    TEST_ASSERT(lines[0].find("TEST: kept") != std::string::npos, "Callback receives the message");
    return true;
}

int main() {
    set_log_level(LogLevel::ERROR);
    std::cout << "--- Configuration tests ---" << std::endl;

    if (test_defaults()) std::cout << "PASS: defaults" << std::endl;
    if (test_load_from_string()) std::cout << "PASS: load from string" << std::endl;
    if (test_wrong_types_fall_back()) std::cout << "PASS: wrong types fall back" << std::endl;
    if (test_chunk_size_capped_at_frame_limit()) std::cout << "PASS: chunk size cap" << std::endl;
    if (test_load_file()) std::cout << "PASS: load from file" << std::endl;
    if (test_logger()) std::cout << "PASS: logger" << std::endl;

    if (tests_failed != 0) {
        std::cerr << "FAILED: " << tests_failed << " test(s)" << std::endl;
        return 1;
    }

    std::cout << "ALL PASS" << std::endl;
    return 0;
}
