#include "peer_node.h"
#include "terminal_cli.h"
#include "logger.h"
#include "config_manager.h"
#include <iostream>
#include <string>
#include <signal.h>
#include <filesystem>

namespace {

TerminalCLI* g_cli = nullptr;

void handle_termination(int) {
    if (g_cli) {
        g_cli->stop();
    }
}

} // namespace

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [OPTIONS]\n\n"
              << "Options:\n"
              << "  --port PORT     Listen port, 0 picks a free one (default: from config, 30001)\n"
              << "  --config FILE   Path to configuration file (default: config.json)\n"
              << "  --log-level LVL Log level: debug|info|warning|error|none (default: from config)\n"
              << "  --daemon        Run without reading stdin; receives files until killed\n"
              << "  --help          Show this help message\n"
              << "\nInteractive CLI (after startup):\n"
              << "  Type 'help' to see commands. Typical session:\n"
              << "    id                      print the id to give to the other side\n"
              << "    connect <host:port>     connect to the other side\n"
              << "    send <path>             send a file\n"
              << std::endl;
}

int main(int argc, char* argv[]) {
    // Ignore SIGPIPE to prevent process termination on socket write errors
    signal(SIGPIPE, SIG_IGN);

    int port = -1;
    std::string config_path = "config.json";
    bool config_explicit = false;
    std::string requested_log_level;
    bool daemon_mode = false;

    // Parse arguments
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--config") {
            if (i + 1 < argc) {
                config_path = argv[++i];
                config_explicit = true;
            } else {
                std::cerr << "Error: --config requires an argument" << std::endl;
                return 1;
            }
        } else if (arg == "--port") {
            if (i + 1 < argc) {
                try {
                    int p = std::stoi(argv[++i]);
                    if (p < 0 || p > 65535) {
                        std::cerr << "Error: Port must be between 0 and 65535" << std::endl;
                        return 1;
                    }
                    port = p;
                } catch (const std::exception& e) {
                    std::cerr << "Error: Invalid port number: " << e.what() << std::endl;
                    return 1;
                }
            } else {
                std::cerr << "Error: --port requires an argument" << std::endl;
                return 1;
            }
        } else if (arg == "--log-level") {
            if (i + 1 < argc) {
                requested_log_level = argv[++i];
            } else {
                std::cerr << "Error: --log-level requires an argument" << std::endl;
                return 1;
            }
        } else if (arg == "--daemon") {
            daemon_mode = true;
        } else {
            std::cerr << "Error: Unknown option: " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    ConfigManager& config = ConfigManager::getInstance();
    std::error_code ec;
    if (std::filesystem::exists(config_path, ec)) {
        if (!config.loadConfig(config_path)) {
            std::cerr << "Error: Failed to load configuration from " << config_path << std::endl;
            return 1;
        }
    } else if (config_explicit) {
        std::cerr << "Error: Configuration file not found: " << config_path << std::endl;
        return 1;
    } else {
        std::cerr << "Warning: " << config_path << " not found, using built-in defaults" << std::endl;
    }

    set_log_level(parse_log_level(requested_log_level.empty() ? config.getLogLevel() : requested_log_level));

    PeerNode node;

    // Create CLI FIRST so log callback is registered before engine starts
    TerminalCLI cli(node, daemon_mode, config.isConsoleOutput());
    if (daemon_mode) {
        // Plain mode keeps the default handlers; Ctrl-D or 'quit' ends it.
        g_cli = &cli;
        signal(SIGINT, handle_termination);
        signal(SIGTERM, handle_termination);
    }

    nativeLog("MAIN: Starting node, port=" + (port < 0 ? std::string("config") : std::to_string(port)));
    if (!node.start(port)) {
        g_cli = nullptr;
        std::cerr << "Error: Failed to start PeerDrop node" << std::endl;
        return 1;
    }

    // Run interactive CLI
    cli.run();

    node.stop();
    g_cli = nullptr;
    return 0;
}
