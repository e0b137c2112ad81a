#include "port_scanner.hpp"
#include "tool_util.hpp"
#include "../config.hpp"
#include "../net_probe.hpp"
#include "../util.hpp"

#include <algorithm>
#include <atomic>
#include <thread>

namespace sshmcp {

namespace {

bool parse_port(const std::string& s, uint32_t& out) {
    if (s.empty() || s.size() > 5) return false;
    uint32_t v = 0;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
        v = v * 10 + static_cast<uint32_t>(c - '0');
    }
    out = v;
    return true;
}

ToolFailure bad_range(const std::string& token) {
    return ToolFailure{ErrorKind::InvalidInput,
                       "invalid port range element '" + token + "' (expected N or N-M, 1..65535)"};
}

} // namespace

std::optional<ToolFailure> parse_port_range(const std::string& spec,
                                            std::vector<uint16_t>& ports) {
    std::vector<uint16_t> result;
    for (const auto& raw : split(spec, ',')) {
        std::string token = trim(raw);
        if (token.empty()) continue;

        uint32_t first = 0, last = 0;
        auto dash = token.find('-');
        if (dash == std::string::npos) {
            if (!parse_port(token, first)) return bad_range(token);
            last = first;
        } else if (!parse_port(trim(token.substr(0, dash)), first) ||
                   !parse_port(trim(token.substr(dash + 1)), last)) {
            return bad_range(token);
        }
        if (first < 1 || first > 65535 || last < 1 || last > 65535) {
            return bad_range(token);
        }
        for (uint32_t p = first; p <= last; p++) {
            result.push_back(static_cast<uint16_t>(p));
        }
    }
    std::sort(result.begin(), result.end());
    result.erase(std::unique(result.begin(), result.end()), result.end());
    ports = std::move(result);
    return std::nullopt;
}

PortScannerTool::PortScannerTool(const Config& cfg)
    : max_ports_(cfg.limits.max_scan_ports)
    , max_concurrency_(cfg.limits.max_concurrency)
{
    descriptor_.name = "port_scanner";
    descriptor_.description =
        "TCP connect scan of a port range on one host. Each port gets its own "
        "timeout and at most max_concurrency probes run at once.";
    descriptor_.params = {
        string_param("host", "Hostname or IP address to scan", true),
        string_param("port_range", "Ports to scan: \"22\", \"20-25\" or \"22,80,8000-8010\"", true),
        int_param("timeout_per_port", "Connect timeout per port in milliseconds",
                  false, 1000, 10, 30000),
        int_param("max_concurrency", "Maximum simultaneous probes",
                  false, cfg.limits.default_concurrency, 1, cfg.limits.max_concurrency),
    };
}

ToolResult PortScannerTool::execute(const nlohmann::json& args) {
    std::string host = arg_string(args, "host");
    std::string range = arg_string(args, "port_range");
    auto timeout = std::chrono::milliseconds(arg_int(args, "timeout_per_port", 1000));
    auto concurrency = static_cast<size_t>(
        std::clamp<int64_t>(arg_int(args, "max_concurrency", 16), 1, max_concurrency_));

    if (host.empty()) {
        return ToolResult::failure(ErrorKind::InvalidInput, "host must not be empty");
    }

    std::vector<uint16_t> ports;
    if (auto err = parse_port_range(range, ports)) {
        return ToolResult::failure(err->kind, err->message);
    }
    if (ports.size() > max_ports_) {
        return ToolResult::failure(ErrorKind::InvalidInput,
            "port range covers " + std::to_string(ports.size()) +
            " ports; the limit is " + std::to_string(max_ports_));
    }

    auto start = std::chrono::steady_clock::now();
    std::vector<ProbeOutcome> outcomes(ports.size());

    std::string resolve_error;
    std::vector<ResolvedAddress> addresses;
    if (!ports.empty()) addresses = resolve_host(host, resolve_error);

    if (!ports.empty() && addresses.empty()) {
        for (auto& o : outcomes) o.detail = "resolution_failed";
    } else if (!ports.empty()) {
        // Each worker owns the slots it claims; no locking needed
        std::atomic<size_t> next{0};
        auto worker = [&]() {
            for (size_t i = next++; i < ports.size(); i = next++) {
                outcomes[i] = probe_addresses(addresses, ports[i], timeout);
            }
        };
        size_t workers = std::min(concurrency, ports.size());
        std::vector<std::thread> pool;
        pool.reserve(workers);
        try {
            for (size_t w = 0; w < workers; w++) {
                pool.emplace_back(worker);
            }
        } catch (...) {
            for (auto& t : pool) t.join();
            throw;
        }
        for (auto& t : pool) t.join();
    }

    nlohmann::json results = nlohmann::json::array();
    size_t open_count = 0;
    for (size_t i = 0; i < ports.size(); i++) {
        nlohmann::json r = {{"port", ports[i]}, {"reachable", outcomes[i].reachable}};
        if (outcomes[i].reachable) {
            open_count++;
            r["latency_ms"] = outcomes[i].latency_ms;
        } else {
            r["detail"] = outcomes[i].detail;
        }
        results.push_back(std::move(r));
    }

    nlohmann::json payload = {
        {"host", host},
        {"ports_scanned", ports.size()},
        {"open_count", open_count},
        {"elapsed_ms", elapsed_ms(start)},
        {"results", std::move(results)},
    };
    if (!resolve_error.empty()) payload["resolution_error"] = resolve_error;
    return ToolResult::success(std::move(payload));
}

} // namespace sshmcp
