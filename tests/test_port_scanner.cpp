#include <catch2/catch_test_macros.hpp>
#include "tools/port_scanner.hpp"
#include "config.hpp"
#include "dispatcher.hpp"
#include "test_support.hpp"
#include <chrono>

using namespace sshmcp;
using namespace sshmcp_test;

static std::vector<uint16_t> ports_of(const std::string& spec) {
    std::vector<uint16_t> ports;
    auto err = parse_port_range(spec, ports);
    REQUIRE_FALSE(err);
    return ports;
}

static ToolResult run_scan(const Config& cfg, const nlohmann::json& args) {
    std::vector<std::unique_ptr<Tool>> tools;
    tools.push_back(std::make_unique<PortScannerTool>(cfg));
    Dispatcher d(std::move(tools));
    return d.dispatch({"port_scanner", args});
}

// ── parse_port_range ─────────────────────────────────────────────

TEST_CASE("parse_port_range: single port", "[port_scanner]") {
    REQUIRE(ports_of("22") == std::vector<uint16_t>{22});
}

TEST_CASE("parse_port_range: inclusive range", "[port_scanner]") {
    REQUIRE(ports_of("20-25") == std::vector<uint16_t>{20, 21, 22, 23, 24, 25});
}

TEST_CASE("parse_port_range: mixed list is sorted", "[port_scanner]") {
    auto ports = ports_of("8000-8010, 80 ,22");
    REQUIRE(ports.size() == 13);
    REQUIRE(ports.front() == 22);
    REQUIRE(ports[1] == 80);
    REQUIRE(ports.back() == 8010);
}

TEST_CASE("parse_port_range: duplicates collapse", "[port_scanner]") {
    REQUIRE(ports_of("22,22,20-23") == std::vector<uint16_t>{20, 21, 22, 23});
}

TEST_CASE("parse_port_range: blank input and reversed ranges yield nothing", "[port_scanner]") {
    REQUIRE(ports_of("").empty());
    REQUIRE(ports_of(" , ").empty());
    REQUIRE(ports_of("25-20").empty());
    REQUIRE(ports_of("25-20,22") == std::vector<uint16_t>{22});
}

TEST_CASE("parse_port_range: full range boundaries", "[port_scanner]") {
    auto ports = ports_of("1,65535");
    REQUIRE(ports == std::vector<uint16_t>{1, 65535});
}

TEST_CASE("parse_port_range: malformed tokens are InvalidInput", "[port_scanner]") {
    for (const char* bad : {"abc", "0", "70000", "22-", "-22", "1-2-3", "22x", "0-10", "65530-65536"}) {
        std::vector<uint16_t> ports = {99};
        auto err = parse_port_range(bad, ports);
        INFO(bad);
        REQUIRE(err);
        REQUIRE(err->kind == ErrorKind::InvalidInput);
        REQUIRE(err->message.find("invalid port range") != std::string::npos);
        // Output untouched on failure
        REQUIRE(ports == std::vector<uint16_t>{99});
    }
}

// ── PortScannerTool ──────────────────────────────────────────────

TEST_CASE("PortScannerTool: open and closed loopback ports", "[port_scanner]") {
    LoopbackListener listener;
    REQUIRE(listener.port != 0);
    uint16_t closed = closed_loopback_port();
    REQUIRE(closed != 0);

    Config cfg;
    auto result = run_scan(cfg, {
        {"host", "127.0.0.1"},
        {"port_range", std::to_string(listener.port) + "," + std::to_string(closed)},
        {"timeout_per_port", 2000},
    });
    REQUIRE(result.ok());
    const auto& p = result.payload();
    REQUIRE(p["host"] == "127.0.0.1");
    REQUIRE(p["ports_scanned"] == 2);
    REQUIRE(p["open_count"] == 1);
    REQUIRE_FALSE(p.contains("resolution_error"));

    bool saw_open = false, saw_closed = false;
    for (const auto& r : p["results"]) {
        if (r["port"] == listener.port) {
            saw_open = true;
            REQUIRE(r["reachable"] == true);
            REQUIRE(r["latency_ms"].get<int64_t>() >= 0);
            REQUIRE_FALSE(r.contains("detail"));
        } else {
            saw_closed = true;
            REQUIRE(r["port"] == closed);
            REQUIRE(r["reachable"] == false);
            REQUIRE(r["detail"] == "refused");
        }
    }
    REQUIRE(saw_open);
    REQUIRE(saw_closed);
}

TEST_CASE("PortScannerTool: results follow ascending port order", "[port_scanner]") {
    LoopbackListener a;
    LoopbackListener b;
    REQUIRE(a.port != 0);
    REQUIRE(b.port != 0);

    Config cfg;
    auto result = run_scan(cfg, {
        {"host", "127.0.0.1"},
        {"port_range", std::to_string(b.port) + "," + std::to_string(a.port)},
        {"max_concurrency", 1},
    });
    REQUIRE(result.ok());
    const auto& results = result.payload()["results"];
    REQUIRE(results.size() == 2);
    REQUIRE(results[0]["port"].get<uint16_t>() < results[1]["port"].get<uint16_t>());
    REQUIRE(result.payload()["open_count"] == 2);
}

TEST_CASE("PortScannerTool: too many ports is InvalidInput", "[port_scanner]") {
    Config cfg;
    cfg.limits.max_scan_ports = 10;
    auto result = run_scan(cfg, {{"host", "127.0.0.1"}, {"port_range", "1-11"}});
    REQUIRE_FALSE(result.ok());
    REQUIRE(result.error().kind == ErrorKind::InvalidInput);
    REQUIRE(result.error().message.find("limit is 10") != std::string::npos);

    auto at_limit = run_scan(cfg, {{"host", "127.0.0.1"},
                                   {"port_range", std::to_string(closed_loopback_port())},
                                   {"timeout_per_port", 500}});
    REQUIRE(at_limit.ok());
}

TEST_CASE("PortScannerTool: malformed range is InvalidInput", "[port_scanner]") {
    Config cfg;
    auto result = run_scan(cfg, {{"host", "127.0.0.1"}, {"port_range", "ssh"}});
    REQUIRE_FALSE(result.ok());
    REQUIRE(result.error().kind == ErrorKind::InvalidInput);
}

TEST_CASE("PortScannerTool: empty range scans nothing", "[port_scanner]") {
    Config cfg;
    auto result = run_scan(cfg, {{"host", "nonexistent.invalid"}, {"port_range", "30-20"}});
    REQUIRE(result.ok());
    REQUIRE(result.payload()["ports_scanned"] == 0);
    REQUIRE(result.payload()["open_count"] == 0);
    REQUIRE(result.payload()["results"].empty());
}

TEST_CASE("PortScannerTool: unresolvable host marks every port", "[port_scanner]") {
    Config cfg;
    auto result = run_scan(cfg, {{"host", "nonexistent.invalid"}, {"port_range", "22,80"}});
    REQUIRE(result.ok());
    const auto& p = result.payload();
    REQUIRE(p["open_count"] == 0);
    REQUIRE(p.contains("resolution_error"));
    REQUIRE(p["results"].size() == 2);
    for (const auto& r : p["results"]) {
        REQUIRE(r["reachable"] == false);
        REQUIRE(r["detail"] == "resolution_failed");
    }
}

TEST_CASE("PortScannerTool: empty host is InvalidInput", "[port_scanner]") {
    Config cfg;
    auto result = run_scan(cfg, {{"host", ""}, {"port_range", "22"}});
    REQUIRE_FALSE(result.ok());
    REQUIRE(result.error().kind == ErrorKind::InvalidInput);
}

TEST_CASE("PortScannerTool: argument bounds are enforced", "[port_scanner]") {
    Config cfg;
    SECTION("concurrency below one") {
        auto result = run_scan(cfg, {{"host", "127.0.0.1"}, {"port_range", "22"},
                                     {"max_concurrency", 0}});
        REQUIRE_FALSE(result.ok());
        REQUIRE(result.error().kind == ErrorKind::InvalidArguments);
    }
    SECTION("concurrency above the configured cap") {
        auto result = run_scan(cfg, {{"host", "127.0.0.1"}, {"port_range", "22"},
                                     {"max_concurrency", 100000}});
        REQUIRE_FALSE(result.ok());
        REQUIRE(result.error().kind == ErrorKind::InvalidArguments);
    }
    SECTION("timeout below the minimum") {
        auto result = run_scan(cfg, {{"host", "127.0.0.1"}, {"port_range", "22"},
                                     {"timeout_per_port", 1}});
        REQUIRE_FALSE(result.ok());
        REQUIRE(result.error().kind == ErrorKind::InvalidArguments);
    }
    SECTION("missing port_range") {
        auto result = run_scan(cfg, {{"host", "127.0.0.1"}});
        REQUIRE_FALSE(result.ok());
        REQUIRE(result.error().kind == ErrorKind::InvalidArguments);
    }
}

TEST_CASE("PortScannerTool: zero concurrency in the config still allows scans", "[port_scanner]") {
    Config cfg = Config::from_json({{"limits", {{"max_concurrency", 0}}}});
    PortScannerTool tool(cfg);
    const auto* param = tool.descriptor().find_param("max_concurrency");
    REQUIRE(param != nullptr);
    REQUIRE(*param->minimum == 1);
    REQUIRE(*param->maximum == 1);
    REQUIRE(param->default_value.has_value());
    REQUIRE(*param->default_value == 1);

    auto result = run_scan(cfg, {{"host", "127.0.0.1"},
                                 {"port_range", std::to_string(closed_loopback_port())},
                                 {"timeout_per_port", 500}});
    REQUIRE(result.ok());
    REQUIRE(result.payload()["ports_scanned"] == 1);
}

TEST_CASE("PortScannerTool: probes overlap up to the concurrency bound", "[port_scanner]") {
    // Unroutable address: each probe either times out or fails fast
    Config cfg;
    auto start = std::chrono::steady_clock::now();
    auto result = run_scan(cfg, {
        {"host", "10.255.255.1"},
        {"port_range", "1000-1007"},
        {"timeout_per_port", 300},
        {"max_concurrency", 8},
    });
    auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE(result.ok());
    REQUIRE(result.payload()["ports_scanned"] == 8);
    for (const auto& r : result.payload()["results"]) {
        REQUIRE(r["reachable"] == false);
    }
    // Serially this would take 8 x 300 ms
    REQUIRE(elapsed < std::chrono::milliseconds(1500));
}
