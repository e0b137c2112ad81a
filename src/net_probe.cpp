#include "net_probe.hpp"
#include "util.hpp"

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace sshmcp {

namespace {

// ── RAII socket ──────────────────────────────────────────────────

struct Socket {
    int fd = -1;
    explicit Socket(int f) : fd(f) {}
    ~Socket() { if (fd >= 0) ::close(fd); }
    Socket(const Socket&) = delete;
    Socket& operator=(const Socket&) = delete;
};

void set_port(ResolvedAddress& a, uint16_t port) {
    if (a.family == AF_INET) {
        reinterpret_cast<sockaddr_in*>(&a.addr)->sin_port = htons(port);
    } else if (a.family == AF_INET6) {
        reinterpret_cast<sockaddr_in6*>(&a.addr)->sin6_port = htons(port);
    }
}

// Ranks failure details so the most informative one wins across addresses
int detail_rank(const std::string& detail) {
    if (detail == "refused") return 3;
    if (detail == "timeout") return 2;
    if (detail == "unreachable") return 1;
    return 0;
}

std::string classify_errno(int err) {
    if (err == ECONNREFUSED) return "refused";
    if (err == ETIMEDOUT) return "timeout";
    return "unreachable";
}

} // namespace

std::vector<ResolvedAddress> resolve_host(const std::string& host, std::string& error) {
    std::vector<ResolvedAddress> result;

    struct addrinfo hints{};
    hints.ai_family   = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* res = nullptr;
    int rc = ::getaddrinfo(host.c_str(), nullptr, &hints, &res);
    if (rc != 0) {
        error = ::gai_strerror(rc);
        return result;
    }

    for (auto* ai = res; ai; ai = ai->ai_next) {
        if (ai->ai_family != AF_INET && ai->ai_family != AF_INET6) continue;
        if (ai->ai_addrlen > sizeof(sockaddr_storage)) continue;
        ResolvedAddress a;
        a.family = ai->ai_family;
        std::memcpy(&a.addr, ai->ai_addr, ai->ai_addrlen);
        a.addr_len = ai->ai_addrlen;
        result.push_back(a);
    }
    ::freeaddrinfo(res);

    if (result.empty()) error = "no usable addresses";
    return result;
}

std::string format_address(const ResolvedAddress& address) {
    char buf[INET6_ADDRSTRLEN] = {0};
    if (address.family == AF_INET) {
        auto* sin = reinterpret_cast<const sockaddr_in*>(&address.addr);
        ::inet_ntop(AF_INET, &sin->sin_addr, buf, sizeof(buf));
    } else if (address.family == AF_INET6) {
        auto* sin6 = reinterpret_cast<const sockaddr_in6*>(&address.addr);
        ::inet_ntop(AF_INET6, &sin6->sin6_addr, buf, sizeof(buf));
    }
    return buf;
}

ProbeOutcome probe_addresses(const std::vector<ResolvedAddress>& addresses,
                             uint16_t port, std::chrono::milliseconds timeout) {
    ProbeOutcome outcome;
    if (addresses.empty()) {
        outcome.detail = "resolution_failed";
        return outcome;
    }

    auto start = std::chrono::steady_clock::now();
    auto deadline = start + timeout;
    std::string best_detail;

    for (auto target : addresses) {
        set_port(target, port);

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) {
            if (detail_rank("timeout") > detail_rank(best_detail)) best_detail = "timeout";
            break;
        }

        Socket sock(::socket(target.family, SOCK_STREAM | SOCK_CLOEXEC, 0));
        if (sock.fd < 0) {
            if (detail_rank("unreachable") > detail_rank(best_detail)) best_detail = "unreachable";
            continue;
        }

        // Non-blocking connect so we can honour the deadline.
        int flags = ::fcntl(sock.fd, F_GETFL, 0);
        ::fcntl(sock.fd, F_SETFL, flags | O_NONBLOCK);

        std::string detail;
        int rc = ::connect(sock.fd, reinterpret_cast<const sockaddr*>(&target.addr),
                           target.addr_len);
        if (rc == 0) {
            outcome.reachable = true;
        } else if (errno == EINPROGRESS) {
            struct pollfd pfd{};
            pfd.fd = sock.fd;
            pfd.events = POLLOUT;
            do {
                remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                    deadline - std::chrono::steady_clock::now()).count();
                rc = remaining > 0 ? ::poll(&pfd, 1, static_cast<int>(remaining)) : 0;
            } while (rc < 0 && errno == EINTR);

            if (rc > 0) {
                int err = 0;
                socklen_t elen = sizeof(err);
                ::getsockopt(sock.fd, SOL_SOCKET, SO_ERROR, &err, &elen);
                if (err == 0) outcome.reachable = true;
                else detail = classify_errno(err);
            } else if (rc == 0) {
                detail = "timeout";
            } else {
                detail = classify_errno(errno);
            }
        } else {
            detail = classify_errno(errno);
        }

        if (outcome.reachable) {
            outcome.latency_ms = elapsed_ms(start);
            outcome.address = format_address(target);
            outcome.detail.clear();
            return outcome;
        }
        if (detail_rank(detail) > detail_rank(best_detail)) best_detail = detail;
    }

    outcome.detail = best_detail.empty() ? "unreachable" : best_detail;
    return outcome;
}

ProbeOutcome probe_tcp(const std::string& host, uint16_t port,
                       std::chrono::milliseconds timeout) {
    std::string error;
    auto addresses = resolve_host(host, error);
    if (addresses.empty()) {
        ProbeOutcome outcome;
        outcome.detail = "resolution_failed";
        return outcome;
    }
    return probe_addresses(addresses, port, timeout);
}

} // namespace sshmcp
