#include "config.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>

namespace sshmcp {

nlohmann::json Config::defaults_json() {
    return {
        {"server", {
            {"name", "ssh-tools"},
            {"version", "1.0.0"},
            {"listen", ""}
        }},
        {"limits", {
            {"max_output_bytes", 65536},
            {"max_message_bytes", 1048576},
            {"max_scan_ports", 1024},
            {"default_concurrency", 16},
            {"max_concurrency", 256},
            {"idle_timeout_s", 300}
        }},
        {"ssh", {
            {"binary", "ssh"},
            {"key_directory", "~/.ssh"},
            {"client_config", "~/.ssh/config"},
            {"sshd_config", "/etc/ssh/sshd_config"}
        }},
        {"log_tool_calls", true}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                      const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

static void read_string(const nlohmann::json& obj, const char* key, std::string& out) {
    if (obj.contains(key) && obj[key].is_string())
        out = obj[key].get<std::string>();
}

// Negative values and values past 32 bits keep the default rather than wrapping
static void read_uint(const nlohmann::json& obj, const char* key, uint32_t& out) {
    if (!obj.contains(key) || !obj[key].is_number_integer()) return;
    const auto& v = obj[key];
    bool in_range = v.is_number_unsigned()
        ? v.get<uint64_t>() <= std::numeric_limits<uint32_t>::max()
        : v.get<int64_t>() >= 0 && v.get<int64_t>() <= std::numeric_limits<uint32_t>::max();
    if (!in_range) {
        std::cerr << "[config] Ignoring out-of-range " << key << ": " << v.dump() << "\n";
        return;
    }
    out = static_cast<uint32_t>(v.get<uint64_t>());
}

Config Config::from_json(const nlohmann::json& j) {
    Config cfg;
    if (!j.is_object()) return cfg;

    if (j.contains("server") && j["server"].is_object()) {
        auto& s = j["server"];
        read_string(s, "name", cfg.server.name);
        read_string(s, "version", cfg.server.version);
        read_string(s, "listen", cfg.server.listen);
    }

    if (j.contains("limits") && j["limits"].is_object()) {
        auto& l = j["limits"];
        read_uint(l, "max_output_bytes", cfg.limits.max_output_bytes);
        read_uint(l, "max_message_bytes", cfg.limits.max_message_bytes);
        read_uint(l, "max_scan_ports", cfg.limits.max_scan_ports);
        read_uint(l, "default_concurrency", cfg.limits.default_concurrency);
        read_uint(l, "max_concurrency", cfg.limits.max_concurrency);
        read_uint(l, "idle_timeout_s", cfg.limits.idle_timeout_s);
    }

    if (j.contains("ssh") && j["ssh"].is_object()) {
        auto& s = j["ssh"];
        read_string(s, "binary", cfg.ssh.binary);
        read_string(s, "key_directory", cfg.ssh.key_directory);
        read_string(s, "client_config", cfg.ssh.client_config);
        read_string(s, "sshd_config", cfg.ssh.sshd_config);
    }

    if (j.contains("log_tool_calls") && j["log_tool_calls"].is_boolean())
        cfg.log_tool_calls = j["log_tool_calls"].get<bool>();

    // Keep the limits usable whatever the file says (idle_timeout_s 0 = never)
    if (cfg.limits.max_output_bytes == 0) cfg.limits.max_output_bytes = 1;
    if (cfg.limits.max_message_bytes == 0) cfg.limits.max_message_bytes = 1;
    if (cfg.limits.max_scan_ports == 0) cfg.limits.max_scan_ports = 1;
    if (cfg.limits.max_concurrency == 0) cfg.limits.max_concurrency = 1;
    if (cfg.limits.default_concurrency == 0) cfg.limits.default_concurrency = 1;
    if (cfg.limits.default_concurrency > cfg.limits.max_concurrency)
        cfg.limits.default_concurrency = cfg.limits.max_concurrency;

    return cfg;
}

void Config::apply_env() {
    if (const char* v = std::getenv("SSHMCP_LISTEN"))
        server.listen = v;
    if (const char* v = std::getenv("SSHMCP_SSH_BINARY"))
        ssh.binary = v;
    if (const char* v = std::getenv("SSHMCP_KEY_DIR"))
        ssh.key_directory = v;
    if (const char* v = std::getenv("SSHMCP_SSHD_CONFIG"))
        ssh.sshd_config = v;
}

Config Config::load_from(const std::string& path) {
    std::string config_path = expand_home(path);
    nlohmann::json j = defaults_json();

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            j = merge_defaults(nlohmann::json::parse(file), defaults_json());
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Ignoring malformed " << config_path
                      << ": " << e.what() << "\n";
            j = defaults_json();
        }
    }

    Config cfg = from_json(j);
    cfg.apply_env();
    return cfg;
}

Config Config::load() {
    return load_from("~/.sshmcp/config.json");
}

} // namespace sshmcp
