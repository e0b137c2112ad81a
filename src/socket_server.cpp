#include "socket_server.hpp"
#include "net_probe.hpp"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <iostream>

namespace sshmcp {

// ── Address parsing ───────────────────────────────────────────────

bool parse_listen_addr(const std::string& addr, std::string& host, uint16_t& port) {
    auto pos = addr.rfind(':');
    if (pos == std::string::npos || pos == 0) return false;
    host = addr.substr(0, pos);
    if (host.size() >= 2 && host.front() == '[' && host.back() == ']')
        host = host.substr(1, host.size() - 2);
    if (host.empty()) return false;

    std::string digits = addr.substr(pos + 1);
    if (digits.empty() || digits.size() > 5) return false;
    for (char c : digits) {
        if (c < '0' || c > '9') return false;
    }
    int p = std::stoi(digits);
    if (p > 65535) return false;
    port = static_cast<uint16_t>(p);
    return true;
}

// ── SocketServer ──────────────────────────────────────────────────

SocketServer::SocketServer(std::string listen_addr, McpServer& server,
                           size_t max_message, std::chrono::seconds idle_timeout)
    : listen_addr_(std::move(listen_addr))
    , server_(server)
    , max_message_(max_message)
    , idle_timeout_(idle_timeout)
{}

SocketServer::~SocketServer() {
    stop();
    close_fds();
}

void SocketServer::close_fds() {
    if (server_fd_ >= 0)         { ::close(server_fd_);         server_fd_ = -1; }
    if (shutdown_pipe_[0] >= 0)  { ::close(shutdown_pipe_[0]);  shutdown_pipe_[0] = -1; }
    if (shutdown_pipe_[1] >= 0)  { ::close(shutdown_pipe_[1]);  shutdown_pipe_[1] = -1; }
}

bool SocketServer::start(std::string& error) {
    std::string host;
    uint16_t port;
    if (!parse_listen_addr(listen_addr_, host, port)) {
        error = "Invalid listen address: " + listen_addr_;
        return false;
    }

    struct sockaddr_storage ss{};
    socklen_t ss_len = 0;
    auto* v4 = reinterpret_cast<sockaddr_in*>(&ss);
    auto* v6 = reinterpret_cast<sockaddr_in6*>(&ss);
    if (::inet_pton(AF_INET, host.c_str(), &v4->sin_addr) == 1) {
        v4->sin_family = AF_INET;
        v4->sin_port = htons(port);
        ss_len = sizeof(sockaddr_in);
    } else if (::inet_pton(AF_INET6, host.c_str(), &v6->sin6_addr) == 1) {
        v6->sin6_family = AF_INET6;
        v6->sin6_port = htons(port);
        ss_len = sizeof(sockaddr_in6);
    } else {
        error = "Invalid bind address: " + host;
        return false;
    }

    if (::pipe2(shutdown_pipe_, O_CLOEXEC) != 0) {
        error = "Failed to create shutdown pipe";
        return false;
    }

    server_fd_ = ::socket(ss.ss_family, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (server_fd_ < 0) {
        error = "Failed to create server socket";
        close_fds();
        return false;
    }

    int opt = 1;
    ::setsockopt(server_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

#ifdef SO_NOSIGPIPE  // macOS
    ::setsockopt(server_fd_, SOL_SOCKET, SO_NOSIGPIPE, &opt, sizeof(opt));
#endif

    if (::bind(server_fd_, reinterpret_cast<sockaddr*>(&ss), ss_len) != 0) {
        error = std::string("bind failed: ") + std::strerror(errno);
        close_fds();
        return false;
    }

    if (::listen(server_fd_, 16) != 0) {
        error = std::string("listen failed: ") + std::strerror(errno);
        close_fds();
        return false;
    }

    struct sockaddr_storage bound{};
    socklen_t bound_len = sizeof(bound);
    if (::getsockname(server_fd_, reinterpret_cast<sockaddr*>(&bound), &bound_len) == 0) {
        bound_port_ = bound.ss_family == AF_INET6
            ? ntohs(reinterpret_cast<sockaddr_in6*>(&bound)->sin6_port)
            : ntohs(reinterpret_cast<sockaddr_in*>(&bound)->sin_port);
    }

    stopping_.store(false);
    running_.store(true);
    thread_ = std::thread([this]() { accept_loop(); });
    return true;
}

void SocketServer::stop() {
    if (!running_.exchange(false)) return;
    stopping_.store(true);
    char b = 0;
    if (shutdown_pipe_[1] >= 0 && ::write(shutdown_pipe_[1], &b, 1) < 0) {
        std::cerr << "[listen] Failed to signal accept loop: " << std::strerror(errno) << "\n";
    }
    if (thread_.joinable()) thread_.join();
    close_fds();
}

void SocketServer::accept_loop() {
    while (running_.load()) {
        struct pollfd fds[2];
        fds[0].fd = server_fd_;         fds[0].events = POLLIN;
        fds[1].fd = shutdown_pipe_[0];  fds[1].events = POLLIN;

        int ret = ::poll(fds, 2, 1000);
        if (ret <= 0) continue;              // timeout or transient error
        if (fds[1].revents & POLLIN) break;  // shutdown signal
        if (!(fds[0].revents & POLLIN)) continue;

        struct sockaddr_storage peer{};
        socklen_t plen = sizeof(peer);
        int cfd = ::accept4(server_fd_, reinterpret_cast<sockaddr*>(&peer), &plen, SOCK_CLOEXEC);
        if (cfd < 0) {
            if (errno != EINTR && errno != EAGAIN && errno != ECONNABORTED)
                std::cerr << "[listen] accept failed: " << std::strerror(errno) << "\n";
            continue;
        }

        ResolvedAddress peer_addr{peer.ss_family, peer, plen};
        std::string who = format_address(peer_addr);
        std::cerr << "[listen] Session opened: " << who << "\n";

        FdTransport transport(cfd, max_message_, idle_timeout_, &stopping_);
        try {
            SessionEnd end = server_.serve(transport);
            std::cerr << "[listen] Session closed: " << who
                      << " (" << session_end_name(end) << ")\n";
        } catch (const std::exception& e) {
            // One broken session must not take the listener down
            std::cerr << "[listen] Session aborted: " << who << ": " << e.what() << "\n";
        }
        ::close(cfd);
    }
}

} // namespace sshmcp
