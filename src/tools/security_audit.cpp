#include "security_audit.hpp"
#include "tool_util.hpp"
#include "../config.hpp"
#include "../util.hpp"

#include <algorithm>
#include <cerrno>
#include <filesystem>
#include <iostream>
#include <sys/stat.h>

namespace fs = std::filesystem;

namespace sshmcp {

const char* severity_name(Severity severity) {
    switch (severity) {
        case Severity::Info:     return "info";
        case Severity::Warning:  return "warning";
        case Severity::Critical: return "critical";
    }
    return "info";
}

void sort_findings(std::vector<AuditFinding>& findings) {
    std::stable_sort(findings.begin(), findings.end(),
                     [](const AuditFinding& a, const AuditFinding& b) {
                         if (a.severity != b.severity) return a.severity > b.severity;
                         if (a.check_id != b.check_id) return a.check_id < b.check_id;
                         if (a.path != b.path) return a.path < b.path;
                         return a.line.value_or(0) < b.line.value_or(0);
                     });
}

AuditScope resolve_audit_scope(const std::string& target, const AuditPaths& paths) {
    AuditScope scope;
    scope.target = target;

    if (target == "system") {
        scope.key_directory = expand_home(paths.key_directory);
        scope.configs.push_back({expand_home(paths.client_config), false});
        scope.configs.push_back({expand_home(paths.sshd_config), true});
        return scope;
    }

    std::string path = expand_home(target);
    std::error_code ec;
    auto status = fs::status(path, ec);
    if (ec || !fs::exists(status)) return scope;

    if (fs::is_directory(status)) {
        scope.key_directory = path;
        scope.configs.push_back({(fs::path(path) / "config").string(), false});
    } else {
        std::string name = fs::path(path).filename().string();
        scope.configs.push_back({path, name.find("sshd") != std::string::npos});
    }
    return scope;
}

namespace {

struct LoadedConfig {
    std::string path;
    bool server = false;
    uint32_t mode = 0;
    std::vector<ConfigDirective> directives;
    std::optional<ToolFailure> error;
};

// Everything the checks read, loaded once per audit
struct AuditInputs {
    const AuditScope& scope;
    std::optional<uint32_t> key_dir_mode;
    std::optional<ToolFailure> key_dir_error;
    std::optional<std::vector<KeyScanEntry>> keys;
    std::vector<LoadedConfig> configs;
};

using Findings = std::vector<AuditFinding>;
// Returns a skip reason when the check had nothing it could examine
using CheckFn = std::optional<std::string> (*)(const AuditInputs&, Findings&);

struct CheckDef {
    const char* id;
    unsigned categories;
    CheckFn run;
};

std::optional<uint32_t> stat_mode(const std::string& path, std::optional<ToolFailure>& error) {
    struct stat st{};
    if (::stat(path.c_str(), &st) != 0) {
        std::error_code ec(errno, std::generic_category());
        error = ToolFailure{error_kind_for(ec), path + ": " + ec.message()};
        return std::nullopt;
    }
    return static_cast<uint32_t>(st.st_mode) & 07777;
}

AuditInputs load_inputs(const AuditScope& scope) {
    AuditInputs in{scope, std::nullopt, std::nullopt, std::nullopt, {}};

    if (scope.key_directory) {
        in.key_dir_mode = stat_mode(*scope.key_directory, in.key_dir_error);
        if (in.key_dir_mode) {
            auto scan = scan_key_directory(*scope.key_directory);
            if (auto* entries = std::get_if<std::vector<KeyScanEntry>>(&scan)) {
                in.keys = std::move(*entries);
            } else {
                in.key_dir_error = std::get<ToolFailure>(scan);
            }
        }
    }

    for (const auto& file : scope.configs) {
        LoadedConfig loaded;
        loaded.path = file.path;
        loaded.server = file.server;
        if (auto mode = stat_mode(file.path, loaded.error)) {
            loaded.mode = *mode;
            std::string contents;
            if (auto err = read_text_file(file.path, contents)) {
                loaded.error = *err;
            } else {
                loaded.directives = parse_ssh_config(contents);
            }
        }
        in.configs.push_back(std::move(loaded));
    }
    return in;
}

std::string key_dir_skip_reason(const AuditInputs& in) {
    if (!in.scope.key_directory) return "no key directory in audit scope";
    if (in.key_dir_error) return in.key_dir_error->message;
    return "key directory could not be scanned";
}

// Loaded configs matching a role; collects the reason when none qualify
std::vector<const LoadedConfig*> configs_for(const AuditInputs& in, bool want_client,
                                             bool want_server, std::string& reason) {
    std::vector<const LoadedConfig*> result;
    std::string kinds = want_client && want_server ? "ssh or sshd"
                      : want_server ? "sshd" : "ssh client";
    reason = "no " + kinds + " configuration in audit scope";
    for (const auto& c : in.configs) {
        if (!(c.server ? want_server : want_client)) continue;
        if (c.error) {
            reason = "cannot read " + c.error->message;
            continue;
        }
        result.push_back(&c);
    }
    return result;
}

void add(Findings& out, const char* id, Severity severity, std::string description,
         std::string path, std::optional<size_t> line = std::nullopt) {
    out.push_back(AuditFinding{id, severity, std::move(description), std::move(path), line});
}

// ── Checks ───────────────────────────────────────────────────────

std::optional<std::string> check_key_dir_permissions(const AuditInputs& in, Findings& out) {
    if (!in.key_dir_mode) return key_dir_skip_reason(in);
    uint32_t mode = *in.key_dir_mode;
    if (mode & 022) {
        add(out, "SSH001", Severity::Critical,
            "Key directory is writable by group or others (mode " + format_mode(mode) +
            ", expected 0700)", *in.scope.key_directory);
    } else if (mode & 077) {
        add(out, "SSH001", Severity::Warning,
            "Key directory is accessible by group or others (mode " + format_mode(mode) +
            ", expected 0700)", *in.scope.key_directory);
    }
    return std::nullopt;
}

std::optional<std::string> check_private_key_permissions(const AuditInputs& in, Findings& out) {
    if (!in.keys) return key_dir_skip_reason(in);
    for (const auto& entry : *in.keys) {
        if (!entry.info || entry.info->kind != KeyFileKind::PrivateKey) continue;
        if (entry.mode & 077) {
            add(out, "SSH002", Severity::Critical,
                "Private key is accessible by group or others (mode " +
                format_mode(entry.mode) + ", expected 0600)", entry.path);
        }
    }
    return std::nullopt;
}

std::optional<std::string> check_writable_files(const AuditInputs& in, Findings& out) {
    std::string reason;
    auto clients = configs_for(in, true, false, reason);
    if (!in.keys && clients.empty()) return key_dir_skip_reason(in) + "; " + reason;

    if (in.keys) {
        for (const auto& entry : *in.keys) {
            if (!entry.info || entry.info->kind != KeyFileKind::PublicKey) continue;
            if (entry.mode & 022) {
                add(out, "SSH003", Severity::Warning,
                    "Public key is writable by group or others (mode " +
                    format_mode(entry.mode) + ")", entry.path);
            }
        }
    }
    for (const auto* c : clients) {
        if (c->mode & 022) {
            add(out, "SSH003", Severity::Warning,
                "SSH client config is writable by group or others (mode " +
                format_mode(c->mode) + "); ssh refuses to use it", c->path);
        }
    }
    return std::nullopt;
}

std::optional<std::string> check_weak_keys(const AuditInputs& in, Findings& out) {
    if (!in.keys) return key_dir_skip_reason(in);
    for (const auto& entry : *in.keys) {
        if (!entry.info) continue;
        const auto& info = *entry.info;
        if (info.type == "dsa") {
            add(out, "SSH004", Severity::Critical,
                "DSA key: the algorithm is deprecated and disabled in current OpenSSH", entry.path);
        } else if (info.type == "rsa" && info.bits != 0 && info.bits < 2048) {
            add(out, "SSH004", Severity::Critical,
                "RSA key of " + std::to_string(info.bits) + " bits (minimum 2048)", entry.path);
        } else if (info.type == "rsa" && info.bits != 0 && info.bits < 3072) {
            add(out, "SSH004", Severity::Info,
                "RSA key of " + std::to_string(info.bits) +
                " bits; 3072+ or Ed25519 is recommended", entry.path);
        }
    }
    return std::nullopt;
}

bool is_deprecated_algorithm(const std::string& name) {
    static const char* const deprecated[] = {
        // ciphers
        "3des-cbc", "aes128-cbc", "aes192-cbc", "aes256-cbc", "blowfish-cbc",
        "cast128-cbc", "arcfour", "arcfour128", "arcfour256",
        "rijndael-cbc@lysator.liu.se",
        // MACs
        "hmac-md5", "hmac-md5-96", "hmac-sha1-96", "hmac-ripemd160",
        "hmac-md5-etm@openssh.com", "hmac-md5-96-etm@openssh.com",
        "hmac-sha1-96-etm@openssh.com",
        // key exchange
        "diffie-hellman-group1-sha1", "diffie-hellman-group14-sha1",
        "diffie-hellman-group-exchange-sha1",
        // host key / signature
        "ssh-dss", "ssh-dss-cert-v01@openssh.com", "ssh-rsa",
        "ssh-rsa-cert-v01@openssh.com",
    };
    for (const char* d : deprecated) {
        if (name == d) return true;
    }
    return false;
}

std::optional<std::string> check_deprecated_algorithms(const AuditInputs& in, Findings& out) {
    static const char* const keywords[] = {
        "ciphers", "macs", "kexalgorithms", "hostkeyalgorithms",
        "pubkeyacceptedalgorithms", "pubkeyacceptedkeytypes",
    };
    std::string reason;
    auto configs = configs_for(in, true, true, reason);
    if (configs.empty()) return reason;

    for (const auto* c : configs) {
        for (const auto& d : c->directives) {
            if (std::find_if(std::begin(keywords), std::end(keywords),
                             [&](const char* k) { return d.keyword == k; }) == std::end(keywords)) {
                continue;
            }
            std::string list = d.value;
            // "-list" removes from the defaults, so nothing is enabled
            if (!list.empty() && list[0] == '-') continue;
            if (!list.empty() && (list[0] == '+' || list[0] == '^')) list = list.substr(1);
            for (const auto& raw : split(list, ',')) {
                std::string algo = trim(raw);
                if (is_deprecated_algorithm(algo)) {
                    add(out, "SSH005", Severity::Warning,
                        "Deprecated algorithm " + algo + " enabled by " + d.keyword,
                        c->path, d.line);
                }
            }
        }
    }
    return std::nullopt;
}

std::optional<std::string> check_password_authentication(const AuditInputs& in, Findings& out) {
    std::string reason;
    auto configs = configs_for(in, false, true, reason);
    if (configs.empty()) return reason;
    for (const auto* c : configs) {
        for (const auto& d : c->directives) {
            if (d.keyword == "passwordauthentication" && to_lower(d.value) == "yes") {
                add(out, "SSH006", Severity::Warning,
                    "Password authentication is enabled; prefer public key authentication",
                    c->path, d.line);
            }
        }
    }
    return std::nullopt;
}

std::optional<std::string> check_root_login(const AuditInputs& in, Findings& out) {
    std::string reason;
    auto configs = configs_for(in, false, true, reason);
    if (configs.empty()) return reason;
    for (const auto* c : configs) {
        for (const auto& d : c->directives) {
            if (d.keyword != "permitrootlogin") continue;
            std::string value = to_lower(d.value);
            if (value == "yes") {
                add(out, "SSH007", Severity::Critical,
                    "Root login is permitted with any authentication method",
                    c->path, d.line);
            } else if (value != "no" && value != "prohibit-password" &&
                       value != "without-password" && value != "forced-commands-only") {
                add(out, "SSH007", Severity::Warning,
                    "Unrecognized PermitRootLogin value: " + d.value, c->path, d.line);
            }
        }
    }
    return std::nullopt;
}

std::optional<std::string> check_protocol_version(const AuditInputs& in, Findings& out) {
    std::string reason;
    auto configs = configs_for(in, true, true, reason);
    if (configs.empty()) return reason;
    for (const auto* c : configs) {
        for (const auto& d : c->directives) {
            if (d.keyword != "protocol") continue;
            for (const auto& v : split(d.value, ',')) {
                if (trim(v) == "1") {
                    add(out, "SSH008", Severity::Critical,
                        "SSH protocol version 1 is enabled", c->path, d.line);
                    break;
                }
            }
        }
    }
    return std::nullopt;
}

std::optional<std::string> check_empty_passwords(const AuditInputs& in, Findings& out) {
    std::string reason;
    auto configs = configs_for(in, false, true, reason);
    if (configs.empty()) return reason;
    for (const auto* c : configs) {
        for (const auto& d : c->directives) {
            if (d.keyword == "permitemptypasswords" && to_lower(d.value) == "yes") {
                add(out, "SSH009", Severity::Critical,
                    "Accounts with empty passwords may log in", c->path, d.line);
            }
        }
    }
    return std::nullopt;
}

std::optional<std::string> check_strict_host_keys(const AuditInputs& in, Findings& out) {
    std::string reason;
    auto configs = configs_for(in, true, false, reason);
    if (configs.empty()) return reason;
    for (const auto* c : configs) {
        for (const auto& d : c->directives) {
            std::string value = to_lower(d.value);
            if (d.keyword == "stricthostkeychecking" && (value == "no" || value == "off")) {
                add(out, "SSH010", Severity::Warning,
                    "Host key checking is disabled; connections are open to MITM",
                    c->path, d.line);
            }
        }
    }
    return std::nullopt;
}

const CheckDef kChecks[] = {
    {"SSH001", kAuditKeys, check_key_dir_permissions},
    {"SSH002", kAuditKeys, check_private_key_permissions},
    {"SSH003", kAuditKeys | kAuditClient, check_writable_files},
    {"SSH004", kAuditKeys, check_weak_keys},
    {"SSH005", kAuditClient | kAuditServer, check_deprecated_algorithms},
    {"SSH006", kAuditServer, check_password_authentication},
    {"SSH007", kAuditServer, check_root_login},
    {"SSH008", kAuditClient | kAuditServer, check_protocol_version},
    {"SSH009", kAuditServer, check_empty_passwords},
    {"SSH010", kAuditClient, check_strict_host_keys},
};

} // namespace

AuditReport run_security_audit(const AuditScope& scope, unsigned categories) {
    AuditReport report;
    AuditInputs inputs = load_inputs(scope);

    for (const auto& check : kChecks) {
        if ((check.categories & categories) == 0) continue;

        std::optional<std::string> skipped;
        Findings found;
        try {
            skipped = check.run(inputs, found);
        } catch (const std::exception& e) {
            std::cerr << "[audit] " << check.id << " failed: " << e.what() << "\n";
            skipped = std::string("check failed: ") + e.what();
            found.clear();
        }

        if (skipped) {
            report.checks_skipped++;
            add(report.findings, check.id, Severity::Info,
                "check skipped: " + *skipped, scope.target);
            continue;
        }
        report.checks_run++;
        report.findings.insert(report.findings.end(), found.begin(), found.end());
    }

    sort_findings(report.findings);
    return report;
}

nlohmann::json audit_report_json(const std::string& target, const AuditReport& report) {
    nlohmann::json findings = nlohmann::json::array();
    size_t counts[3] = {0, 0, 0};
    for (const auto& f : report.findings) {
        counts[static_cast<int>(f.severity)]++;
        nlohmann::json j = {
            {"check_id", f.check_id},
            {"severity", severity_name(f.severity)},
            {"description", f.description},
            {"path", f.path},
        };
        if (f.line) j["line"] = *f.line;
        findings.push_back(std::move(j));
    }

    return {
        {"target", target},
        {"findings", std::move(findings)},
        {"summary", {
            {"critical", counts[2]},
            {"warning", counts[1]},
            {"info", counts[0]},
            {"checks_run", report.checks_run},
            {"checks_skipped", report.checks_skipped},
        }},
    };
}

SecurityAuditTool::SecurityAuditTool(const Config& cfg) {
    paths_.key_directory = cfg.ssh.key_directory;
    paths_.client_config = cfg.ssh.client_config;
    paths_.sshd_config = cfg.ssh.sshd_config;

    descriptor_.name = "ssh_security_audit";
    descriptor_.description =
        "Audit SSH security: key and directory permissions, weak key algorithms, "
        "deprecated ciphers/MACs/KEX, password and root login, protocol version. "
        "Checks that cannot run are reported as skipped info findings.";
    descriptor_.params = {
        defaulted_string_param("target",
                               "\"system\" for the user's ~/.ssh plus /etc/ssh/sshd_config, "
                               "or a key directory or config file path",
                               "system"),
        enum_param("scope", "Limit the audit to one group of checks",
                   {"all", "keys", "client", "server"}, "all"),
    };
}

ToolResult SecurityAuditTool::execute(const nlohmann::json& args) {
    std::string target = arg_string(args, "target", "system");
    if (target.empty()) target = "system";

    std::string scope_name = arg_string(args, "scope", "all");
    unsigned categories = kAuditAll;
    if (scope_name == "keys") categories = kAuditKeys;
    else if (scope_name == "client") categories = kAuditClient;
    else if (scope_name == "server") categories = kAuditServer;

    AuditScope scope = resolve_audit_scope(target, paths_);
    AuditReport report = run_security_audit(scope, categories);
    return ToolResult::success(audit_report_json(target, report));
}

} // namespace sshmcp
