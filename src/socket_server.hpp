#pragma once
#include "mcp_server.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>
#include <thread>

namespace sshmcp {

// TCP front end for McpServer. Each accepted connection is one MCP
// session; sessions are served one at a time (later clients wait in the
// listen backlog). Runs its accept loop in a background thread.
class SocketServer {
public:
    // listen_addr: "host:port" or "[v6addr]:port"; port 0 picks a free port
    SocketServer(std::string listen_addr, McpServer& server,
                 size_t max_message, std::chrono::seconds idle_timeout);
    ~SocketServer();

    SocketServer(const SocketServer&) = delete;
    SocketServer& operator=(const SocketServer&) = delete;

    // Start background accept thread. Returns false and populates error on failure.
    bool start(std::string& error);

    // Signal the accept thread to stop and join it. An open session is
    // closed at its next read.
    void stop();

    // Bound port, valid after start()
    uint16_t port() const { return bound_port_; }

private:
    void accept_loop();
    void close_fds();

    std::string listen_addr_;
    McpServer& server_;
    size_t max_message_;
    std::chrono::seconds idle_timeout_;

    int server_fd_ = -1;
    int shutdown_pipe_[2] = {-1, -1};
    uint16_t bound_port_ = 0;
    std::atomic<bool> running_{false};
    std::atomic<bool> stopping_{false};
    std::thread thread_;
};

// Parse "host:port" (or "[v6]:port") into host and port. Returns false if
// the string is malformed or the port is out of range.
bool parse_listen_addr(const std::string& addr, std::string& host, uint16_t& port);

} // namespace sshmcp
