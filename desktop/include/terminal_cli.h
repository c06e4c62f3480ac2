/**
 * terminal_cli.h - Line-oriented console for a PeerNode
 *
 *   peerdrop> connect 192.168.1.20:30001
 *   peerdrop> send ./report.pdf
 *   peerdrop> status
 *
 * Session events (connection state, progress, errors, received files) are
 * printed as they happen. Engine log lines go through the logger callback
 * and are filtered by 'logfilter'.
 */

#ifndef TERMINAL_CLI_H
#define TERMINAL_CLI_H

#include "connection_state_machine.h"
#include "session_error.h"
#include "transfer_types.h"

#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>

class PeerNode;

class TerminalCLI {
public:
    explicit TerminalCLI(PeerNode& node, bool daemon_mode = false, bool show_logs = true);
    ~TerminalCLI();

    void run();
    void stop();

    // Callbacks from engine (event loop thread)
    void on_connection_state(ConnectionState state, const std::string& remote_id);
    void on_transfer(TransferDirection direction, TransferState state, uint8_t progress);
    void on_error(const SessionError& error);
    void on_artifact(const FileInfo& info, const std::string& path);

    // Called by the logger callback
    void capture_log_line(const std::string& line);

    // Exposed for scripted use; one command per call.
    void process_command(const std::string& input);

private:
    PeerNode& node;
    bool daemon_mode_;
    bool show_logs_;
    std::atomic<bool> running;

    // Last progress value printed, to print only every 10%.
    int last_progress_printed_ = -1;

    std::mutex output_mutex;

    // Plain (line) loop
    void run_plain();

    // Daemon (headless) loop - no stdin
    void run_daemon();

    void print_line(const std::string& msg);

    // Command handlers
    void cmd_help();
    void cmd_quit();
    void cmd_id();
    void cmd_connect(const std::string& peer_id);
    void cmd_disconnect();
    void cmd_send(const std::string& path);
    void cmd_status();
    void cmd_discard();
    void cmd_log_filter(const std::string& level);
};

// "1.5 MB" style size for display.
std::string format_size(uint64_t bytes);

#endif // TERMINAL_CLI_H
