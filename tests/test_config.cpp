#include <catch2/catch_test_macros.hpp>
#include "config.hpp"
#include <fstream>
#include <filesystem>
#include <cstdlib>
#include <unistd.h>
#include <nlohmann/json.hpp>

using namespace sshmcp;

// ── Default values ───────────────────────────────────────────────

TEST_CASE("Config: default values are sensible", "[config]") {
    Config cfg;
    REQUIRE(cfg.server.name == "ssh-tools");
    REQUIRE(cfg.server.listen.empty());
    REQUIRE(cfg.limits.max_output_bytes == 65536);
    REQUIRE(cfg.limits.max_message_bytes == 1048576);
    REQUIRE(cfg.limits.max_scan_ports == 1024);
    REQUIRE(cfg.limits.default_concurrency == 16);
    REQUIRE(cfg.limits.max_concurrency == 256);
    REQUIRE(cfg.limits.idle_timeout_s == 300);
    REQUIRE(cfg.ssh.binary == "ssh");
    REQUIRE(cfg.ssh.key_directory == "~/.ssh");
    REQUIRE(cfg.ssh.sshd_config == "/etc/ssh/sshd_config");
    REQUIRE(cfg.log_tool_calls);
}

TEST_CASE("Config::defaults_json: round-trips to the struct defaults", "[config]") {
    Config from_defaults = Config::from_json(Config::defaults_json());
    Config plain;
    REQUIRE(from_defaults.server.name == plain.server.name);
    REQUIRE(from_defaults.server.version == plain.server.version);
    REQUIRE(from_defaults.limits.max_scan_ports == plain.limits.max_scan_ports);
    REQUIRE(from_defaults.limits.idle_timeout_s == plain.limits.idle_timeout_s);
    REQUIRE(from_defaults.ssh.client_config == plain.ssh.client_config);
}

// ── from_json ────────────────────────────────────────────────────

TEST_CASE("Config::from_json: reads every section", "[config]") {
    auto j = nlohmann::json::parse(R"({
        "server": {"name": "diag", "version": "2.0", "listen": "127.0.0.1:7000"},
        "limits": {"max_output_bytes": 1024, "max_scan_ports": 10,
                   "default_concurrency": 4, "max_concurrency": 8},
        "ssh": {"binary": "/opt/ssh", "key_directory": "/keys"},
        "log_tool_calls": false
    })");
    Config cfg = Config::from_json(j);
    REQUIRE(cfg.server.name == "diag");
    REQUIRE(cfg.server.version == "2.0");
    REQUIRE(cfg.server.listen == "127.0.0.1:7000");
    REQUIRE(cfg.limits.max_output_bytes == 1024);
    REQUIRE(cfg.limits.max_scan_ports == 10);
    REQUIRE(cfg.limits.default_concurrency == 4);
    REQUIRE(cfg.limits.max_concurrency == 8);
    REQUIRE(cfg.ssh.binary == "/opt/ssh");
    REQUIRE(cfg.ssh.key_directory == "/keys");
    REQUIRE(cfg.ssh.sshd_config == "/etc/ssh/sshd_config");
    REQUIRE_FALSE(cfg.log_tool_calls);
}

TEST_CASE("Config::from_json: wrong types are ignored", "[config]") {
    auto j = nlohmann::json::parse(R"({
        "server": {"name": 42},
        "limits": {"max_scan_ports": "many", "max_output_bytes": -5},
        "log_tool_calls": "yes"
    })");
    Config cfg = Config::from_json(j);
    REQUIRE(cfg.server.name == "ssh-tools");
    REQUIRE(cfg.limits.max_scan_ports == 1024);
    REQUIRE(cfg.limits.max_output_bytes == 65536);
    REQUIRE(cfg.log_tool_calls);
}

TEST_CASE("Config::from_json: concurrency settings stay usable", "[config]") {
    auto j = nlohmann::json::parse(R"({
        "limits": {"default_concurrency": 64, "max_concurrency": 0}
    })");
    Config cfg = Config::from_json(j);
    REQUIRE(cfg.limits.max_concurrency == 1);
    REQUIRE(cfg.limits.default_concurrency == 1);
}

TEST_CASE("Config::from_json: values past 32 bits keep the default", "[config]") {
    auto j = nlohmann::json::parse(R"({
        "limits": {"max_concurrency": 4294967297, "max_scan_ports": 4294967296,
                   "idle_timeout_s": 4294967295}
    })");
    Config cfg = Config::from_json(j);
    REQUIRE(cfg.limits.max_concurrency == 256);
    REQUIRE(cfg.limits.max_scan_ports == 1024);
    REQUIRE(cfg.limits.idle_timeout_s == 4294967295u);
}

TEST_CASE("Config::from_json: zero limits are raised to one", "[config]") {
    auto j = nlohmann::json::parse(R"({
        "limits": {"max_output_bytes": 0, "max_message_bytes": 0,
                   "max_scan_ports": 0, "idle_timeout_s": 0}
    })");
    Config cfg = Config::from_json(j);
    REQUIRE(cfg.limits.max_output_bytes == 1);
    REQUIRE(cfg.limits.max_message_bytes == 1);
    REQUIRE(cfg.limits.max_scan_ports == 1);
    REQUIRE(cfg.limits.idle_timeout_s == 0);
}

TEST_CASE("Config::from_json: non-object yields defaults", "[config]") {
    Config cfg = Config::from_json(nlohmann::json::array());
    REQUIRE(cfg.server.name == "ssh-tools");
}

// ── Config::load_from ────────────────────────────────────────────

static std::string make_temp_dir() {
    auto path = std::filesystem::temp_directory_path() / "sshmcp_cfg_XXXXXX";
    std::string tmpl = path.string();
    char* result = mkdtemp(tmpl.data());
    return result ? std::string(result) : "";
}

// RAII guard: redirects HOME to a temp dir, clears env vars, restores on destruction
struct ConfigTestGuard {
    std::string dir;
    std::string old_home;

    ConfigTestGuard() {
        dir = make_temp_dir();
        old_home = std::getenv("HOME") ? std::getenv("HOME") : "";
        setenv("HOME", dir.c_str(), 1);
        unsetenv("SSHMCP_LISTEN");
        unsetenv("SSHMCP_SSH_BINARY");
        unsetenv("SSHMCP_KEY_DIR");
        unsetenv("SSHMCP_SSHD_CONFIG");
    }

    ~ConfigTestGuard() {
        setenv("HOME", old_home.c_str(), 1);
        unsetenv("SSHMCP_LISTEN");
        unsetenv("SSHMCP_SSH_BINARY");
        unsetenv("SSHMCP_KEY_DIR");
        unsetenv("SSHMCP_SSHD_CONFIG");
        std::filesystem::remove_all(dir);
    }

    ConfigTestGuard(const ConfigTestGuard&) = delete;
    ConfigTestGuard& operator=(const ConfigTestGuard&) = delete;

    std::string config_path() const { return dir + "/.sshmcp/config.json"; }

    void write_config(const std::string& content) {
        std::filesystem::create_directories(dir + "/.sshmcp");
        std::ofstream f(config_path());
        f << content;
    }
};

TEST_CASE("Config::load: reads file from home directory", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());
    g.write_config(R"({"server": {"name": "from-file"}, "limits": {"max_scan_ports": 50}})");

    Config cfg = Config::load();
    REQUIRE(cfg.server.name == "from-file");
    REQUIRE(cfg.limits.max_scan_ports == 50);
    // Missing keys fall back to defaults
    REQUIRE(cfg.limits.max_concurrency == 256);
    REQUIRE(cfg.ssh.binary == "ssh");
}

TEST_CASE("Config::load: missing file yields defaults and creates nothing", "[config]") {
    ConfigTestGuard g;
    Config cfg = Config::load();
    REQUIRE(cfg.server.name == "ssh-tools");
    REQUIRE_FALSE(std::filesystem::exists(g.config_path()));
}

TEST_CASE("Config::load: malformed file falls back to defaults", "[config]") {
    ConfigTestGuard g;
    g.write_config("{ not json");
    Config cfg = Config::load();
    REQUIRE(cfg.server.name == "ssh-tools");
    REQUIRE(cfg.limits.max_scan_ports == 1024);
}

TEST_CASE("Config::load_from: explicit path with tilde", "[config]") {
    ConfigTestGuard g;
    std::ofstream(g.dir + "/custom.json") << R"({"ssh": {"binary": "/usr/local/bin/ssh"}})";

    Config cfg = Config::load_from("~/custom.json");
    REQUIRE(cfg.ssh.binary == "/usr/local/bin/ssh");
}

TEST_CASE("Config::load: environment overrides file", "[config]") {
    ConfigTestGuard g;
    g.write_config(R"({"server": {"listen": "127.0.0.1:1"}, "ssh": {"binary": "file-ssh"}})");
    setenv("SSHMCP_LISTEN", "0.0.0.0:9000", 1);
    setenv("SSHMCP_SSH_BINARY", "/env/ssh", 1);
    setenv("SSHMCP_KEY_DIR", "/env/keys", 1);
    setenv("SSHMCP_SSHD_CONFIG", "/env/sshd_config", 1);

    Config cfg = Config::load();
    REQUIRE(cfg.server.listen == "0.0.0.0:9000");
    REQUIRE(cfg.ssh.binary == "/env/ssh");
    REQUIRE(cfg.ssh.key_directory == "/env/keys");
    REQUIRE(cfg.ssh.sshd_config == "/env/sshd_config");
}
