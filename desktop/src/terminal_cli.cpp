#include "terminal_cli.h"
#include "logger.h"
#include "peer_node.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <iostream>
#include <sstream>
#include <thread>
#include <unistd.h>

std::string format_size(uint64_t bytes) {
    static const char* kUnits[] = {"B", "KB", "MB", "GB", "TB"};
    double value = static_cast<double>(bytes);
    size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < sizeof(kUnits) / sizeof(kUnits[0])) {
        value /= 1024.0;
        ++unit;
    }
    char buf[32];
    if (unit == 0) {
        std::snprintf(buf, sizeof(buf), "%llu B", static_cast<unsigned long long>(bytes));
    } else {
        std::snprintf(buf, sizeof(buf), "%.1f %s", value, kUnits[unit]);
    }
    return buf;
}

TerminalCLI::TerminalCLI(PeerNode& peer_node, bool daemon_mode, bool show_logs)
    : node(peer_node)
    , daemon_mode_(daemon_mode)
    , show_logs_(show_logs)
    , running(false)
{
    // Set up log callback EARLY so we capture logs even during engine startup.
    setLogCallback([this](const std::string& msg) {
        this->capture_log_line(msg);
    });

    node.setEventCallbacks(
        [this](ConnectionState state, const std::string& remote_id) { this->on_connection_state(state, remote_id); },
        [this](TransferDirection direction, TransferState state, uint8_t progress) {
            this->on_transfer(direction, state, progress);
        },
        [this](const SessionError& error) { this->on_error(error); },
        [this](const FileInfo& info, const std::string& path) { this->on_artifact(info, path); }
    );
}

TerminalCLI::~TerminalCLI() {
    // Prevent callbacks into a destroyed UI.
    node.clearEventCallbacks();
    setLogCallback(nullptr);
}

void TerminalCLI::run() {
    running = true;
    if (daemon_mode_) {
        run_daemon();
    } else {
        run_plain();
    }
}

void TerminalCLI::run_plain() {
    print_line("PeerDrop. Your peer id: " + node.getPeerId());
    print_line("Type 'help' for commands. Ctrl-D to exit.");

    std::string line;
    while (running) {
        {
            std::lock_guard<std::mutex> lock(output_mutex);
            std::cout << "peerdrop> " << std::flush;
        }
        if (!std::getline(std::cin, line)) {
            break;
        }
        if (line.empty()) {
            continue;
        }
        process_command(line);
    }

    print_line("Goodbye!");
}

void TerminalCLI::run_daemon() {
    // Daemon mode: no stdin reading; receives files until killed
    print_line("PeerDrop daemon started. Use 'kill -TERM " + std::to_string(getpid()) + "' to stop.");
    print_line("Peer ID: " + node.getPeerId());

    while (running) {
        std::this_thread::sleep_for(std::chrono::seconds(1));
    }

    print_line("Goodbye!");
}

void TerminalCLI::stop() {
    running = false;
}

void TerminalCLI::print_line(const std::string& msg) {
    std::lock_guard<std::mutex> lock(output_mutex);
    std::cout << msg << std::endl;
}

void TerminalCLI::capture_log_line(const std::string& line) {
    if (!show_logs_) {
        return;
    }
    // Level filtering already happened in the LOG_* macros.
    std::lock_guard<std::mutex> lock(output_mutex);
    std::cerr << line << std::endl;
}

// ============================================================================
// ENGINE EVENTS
// ============================================================================

void TerminalCLI::on_connection_state(ConnectionState state, const std::string& remote_id) {
    switch (state) {
        case ConnectionState::CONNECTING:
            print_line("* Connecting to " + remote_id + " ...");
            break;
        case ConnectionState::CONNECTED:
            print_line("* Connected to " + remote_id);
            break;
        case ConnectionState::DISCONNECTED:
            print_line("* Disconnected from " + remote_id);
            break;
    }
}

void TerminalCLI::on_transfer(TransferDirection direction, TransferState state, uint8_t progress) {
    const char* verb = (direction == TransferDirection::SEND) ? "Sending" : "Receiving";

    if (state == TransferState::ACTIVE) {
        // Print every 10% (and the first report) to keep the console readable.
        const int bucket = progress / 10;
        if (last_progress_printed_ < 0 || bucket > last_progress_printed_ / 10) {
            last_progress_printed_ = progress;
            print_line(std::string("  ") + verb + ": " + std::to_string(progress) + "%");
        }
        return;
    }

    last_progress_printed_ = -1;
    if (state == TransferState::COMPLETED && direction == TransferDirection::SEND) {
        print_line("* File sent successfully");
    } else if (state == TransferState::ABORTED) {
        print_line(std::string("* ") + verb + " stopped");
    }
}

void TerminalCLI::on_error(const SessionError& error) {
    print_line(std::string("! ") + error.message);
}

void TerminalCLI::on_artifact(const FileInfo& info, const std::string& path) {
    std::string line = "* File received: " + info.name + " (" + format_size(info.size) + ", " +
                       (info.mime_type.empty() ? std::string("unknown type") : info.mime_type) + ")";
    if (!path.empty()) {
        line += " saved to " + path;
    }
    print_line(line);
    print_line("  Use 'discard' to delete it.");
}

// ============================================================================
// COMMANDS
// ============================================================================

void TerminalCLI::process_command(const std::string& input) {
    std::istringstream iss(input);
    std::string cmd;
    iss >> cmd;
    std::transform(cmd.begin(), cmd.end(), cmd.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (cmd == "help" || cmd == "h" || cmd == "?") {
        cmd_help();
    } else if (cmd == "quit" || cmd == "exit" || cmd == "q") {
        cmd_quit();
    } else if (cmd == "id") {
        cmd_id();
    } else if (cmd == "connect" || cmd == "c") {
        std::string peer_id;
        iss >> peer_id;
        cmd_connect(peer_id);
    } else if (cmd == "disconnect" || cmd == "dc") {
        cmd_disconnect();
    } else if (cmd == "send") {
        std::string path;
        std::getline(iss, path);
        const auto first = path.find_first_not_of(' ');
        path = (first == std::string::npos) ? std::string() : path.substr(first);
        cmd_send(path);
    } else if (cmd == "status" || cmd == "stat" || cmd == "s") {
        cmd_status();
    } else if (cmd == "discard") {
        cmd_discard();
    } else if (cmd == "logfilter" || cmd == "log" || cmd == "lf") {
        std::string level;
        iss >> level;
        cmd_log_filter(level);
    } else if (!cmd.empty()) {
        print_line("Unknown: " + cmd + " (type 'help')");
    }
}

void TerminalCLI::cmd_help() {
    print_line("Commands:");
    print_line("  help              Show this help");
    print_line("  id                Show your peer id (share it with the other side)");
    print_line("  connect <id>      Connect to a peer (host:port)");
    print_line("  disconnect        Close the current connection");
    print_line("  send <path>       Send a file to the connected peer");
    print_line("  status            Show connection and transfer state");
    print_line("  discard           Delete the last received file");
    print_line("  logfilter <lvl>   debug|info|warn|error|none");
    print_line("  quit              Exit");
}

void TerminalCLI::cmd_quit() {
    print_line("Shutting down...");
    running = false;
}

void TerminalCLI::cmd_id() {
    print_line(node.getPeerId());
}

void TerminalCLI::cmd_connect(const std::string& peer_id) {
    if (peer_id.empty()) {
        print_line("Usage: connect <host:port>");
        return;
    }
    std::string error;
    if (!node.connectToPeer(peer_id, &error)) {
        // The error callback already printed the reason.
        LOG_DEBUG("CLI: connect failed: " + error);
    }
}

void TerminalCLI::cmd_disconnect() {
    std::string error;
    if (!node.disconnect(&error)) {
        LOG_DEBUG("CLI: disconnect failed: " + error);
    }
}

void TerminalCLI::cmd_send(const std::string& path) {
    if (path.empty()) {
        print_line("Usage: send <path>");
        return;
    }
    std::string error;
    if (!node.sendFile(path, &error)) {
        LOG_DEBUG("CLI: send failed: " + error);
    }
}

void TerminalCLI::cmd_status() {
    const NodeStatus status = node.getStatus();

    print_line("Peer id:     " + status.local_id);
    std::string connection = connection_state_to_string(status.connection_state);
    if (!status.remote_id.empty()) {
        connection += " (" + status.remote_id + ")";
    }
    print_line("Connection:  " + connection);

    if (status.transfer_direction != TransferDirection::NONE) {
        print_line(std::string("Transfer:    ") + transfer_direction_to_string(status.transfer_direction) + " " +
                   status.transfer_file + " " + transfer_state_to_string(status.transfer_state) + " " +
                   std::to_string(status.transfer_progress) + "%");
    } else {
        print_line("Transfer:    none");
    }

    if (status.has_artifact) {
        print_line("Received:    " + status.artifact_info.name + " (" + format_size(status.artifact_info.size) +
                   ", " + status.artifact_info.mime_type + ")" +
                   (status.artifact_path.empty() ? std::string(" not saved") : " at " + status.artifact_path));
    }
    if (!status.last_error.empty()) {
        print_line(std::string("Last error:  [") + session_error_kind_to_string(status.last_error.kind) + "] " +
                   status.last_error.message);
    }
}

void TerminalCLI::cmd_discard() {
    const NodeStatus status = node.getStatus();
    if (!status.has_artifact) {
        print_line("Nothing to discard");
        return;
    }
    node.discardArtifact();
    print_line("Discarded " + status.artifact_info.name);
}

void TerminalCLI::cmd_log_filter(const std::string& level) {
    if (level.empty()) {
        print_line(std::string("Log level: ") + log_level_name(get_log_level()));
        return;
    }
    set_log_level(parse_log_level(level));
    print_line(std::string("Log level: ") + log_level_name(get_log_level()));
}
