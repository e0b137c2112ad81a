#pragma once
#include <string>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace sshmcp {

struct ServerConfig {
    std::string name = "ssh-tools";
    std::string version = "1.0.0";
    std::string listen;  // "host:port"; empty = stdio
};

struct LimitsConfig {
    uint32_t max_output_bytes = 65536;     // per captured stream
    uint32_t max_message_bytes = 1048576;  // per framed request line
    uint32_t max_scan_ports = 1024;
    uint32_t default_concurrency = 16;
    uint32_t max_concurrency = 256;
    uint32_t idle_timeout_s = 300;         // TCP sessions; 0 = never
};

struct SshConfig {
    std::string binary = "ssh";
    std::string key_directory = "~/.ssh";
    std::string client_config = "~/.ssh/config";
    std::string sshd_config = "/etc/ssh/sshd_config";
};

struct Config {
    ServerConfig server;
    LimitsConfig limits;
    SshConfig ssh;
    bool log_tool_calls = true;

    // Load from ~/.sshmcp/config.json + env vars
    static Config load();

    // Load from an explicit path + env vars. A missing file yields defaults.
    static Config load_from(const std::string& path);

    // Build from already-parsed JSON (no env overrides). Unknown keys and
    // values of the wrong type are ignored.
    static Config from_json(const nlohmann::json& j);

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Apply SSHMCP_* environment overrides
    void apply_env();
};

} // namespace sshmcp
