#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>
#include <sys/socket.h>

namespace sshmcp {

struct ProbeOutcome {
    bool reachable = false;
    int64_t latency_ms = 0;
    std::string detail;   // timeout | refused | unreachable | resolution_failed
    std::string address;  // numeric address that answered
};

struct ResolvedAddress {
    int family = AF_UNSPEC;
    sockaddr_storage addr{};
    socklen_t addr_len = 0;
};

// getaddrinfo wrapper; empty result means resolution failed (error is set).
std::vector<ResolvedAddress> resolve_host(const std::string& host, std::string& error);

// Connect to each address in turn (non-blocking connect + poll) within one
// shared deadline. No bytes are exchanged.
ProbeOutcome probe_addresses(const std::vector<ResolvedAddress>& addresses,
                             uint16_t port, std::chrono::milliseconds timeout);

// resolve_host + probe_addresses
ProbeOutcome probe_tcp(const std::string& host, uint16_t port,
                       std::chrono::milliseconds timeout);

// Numeric form of an address ("127.0.0.1", "::1")
std::string format_address(const ResolvedAddress& address);

} // namespace sshmcp
