#include "config.hpp"
#include "dispatcher.hpp"
#include "mcp_server.hpp"
#include "socket_server.hpp"
#include "tool.hpp"
#include "transport.hpp"
#include <iostream>
#include <string>
#include <cstring>
#include <thread>
#include <atomic>
#include <csignal>
#include <chrono>

static std::atomic<bool> g_shutdown{false};

static void signal_handler(int /*sig*/) {
    g_shutdown.store(true);
}

static void print_usage() {
    std::cout << "Usage: sshmcp [options]\n"
              << "\n"
              << "Serves SSH diagnostic tools over the Model Context Protocol.\n"
              << "Without --listen, MCP runs over stdin/stdout.\n"
              << "\n"
              << "Options:\n"
              << "  --listen HOST:PORT   Serve MCP sessions over TCP instead of stdio\n"
              << "  --config PATH        Config file (default: ~/.sshmcp/config.json)\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Tools:\n"
              << "  check_ssh_connection  TCP reachability plus a batch-mode ssh auth probe\n"
              << "  generate_ssh_config   Render (and optionally validate) a Host stanza\n"
              << "  list_ssh_keys         Inventory keys in a directory\n"
              << "  ssh_security_audit    Audit keys and client/server configuration\n"
              << "  port_scanner          TCP connect scan of a port range\n"
              << "  generate_ssh_key      Prepare an ssh-keygen command\n"
              << "  check_ssh_config      Summarize the client config and key directory\n"
              << "  create_ssh_tunnel     Build an ssh port-forwarding command\n"
              << "\n"
              << "Environment variables:\n"
              << "  SSHMCP_LISTEN        Same as --listen\n"
              << "  SSHMCP_SSH_BINARY    ssh client to run (default: ssh)\n"
              << "  SSHMCP_KEY_DIR       Default key directory (default: ~/.ssh)\n"
              << "  SSHMCP_SSHD_CONFIG   sshd_config to audit (default: /etc/ssh/sshd_config)\n";
}

static int run_listen(sshmcp::McpServer& server, const sshmcp::Config& config) {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    sshmcp::SocketServer listener(config.server.listen, server,
                                  config.limits.max_message_bytes,
                                  std::chrono::seconds(config.limits.idle_timeout_s));
    std::string error;
    if (!listener.start(error)) {
        std::cerr << "Error: " << error << "\n";
        return 1;
    }
    std::cerr << "[listen] Serving MCP on " << config.server.listen
              << " (port " << listener.port() << ")\n";

    while (!g_shutdown.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    std::cerr << "[listen] Shutting down\n";
    listener.stop();
    return 0;
}

int main(int argc, char* argv[]) try {
    std::string listen_addr;
    std::string config_path = "~/.sshmcp/config.json";

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if (std::strcmp(argv[i], "--listen") == 0 && i + 1 < argc) {
            listen_addr = argv[++i];
        } else if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    // A peer that disconnects mid-response must not kill the process
    std::signal(SIGPIPE, SIG_IGN);

    auto config = sshmcp::Config::load_from(config_path);
    if (!listen_addr.empty()) {
        config.server.listen = listen_addr;
    }

    sshmcp::Dispatcher dispatcher(sshmcp::create_builtin_tools(config),
                                  config.log_tool_calls);
    sshmcp::McpServer server(dispatcher, config.server);

    if (!config.server.listen.empty()) {
        return run_listen(server, config);
    }

    // stdout carries the protocol; everything else goes to stderr
    std::ios::sync_with_stdio(false);
    sshmcp::StreamTransport transport(std::cin, std::cout, config.limits.max_message_bytes);
    sshmcp::SessionEnd end = server.serve(transport);
    if (end != sshmcp::SessionEnd::Eof) {
        std::cerr << "[mcp] Session ended: " << sshmcp::session_end_name(end) << "\n";
        return 1;
    }
    return 0;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << "\n";
    return 1;
}
