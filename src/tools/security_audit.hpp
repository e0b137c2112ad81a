#pragma once
#include "../tool.hpp"
#include "../ssh_config_file.hpp"
#include "list_keys.hpp"
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace sshmcp {

enum class Severity { Info = 0, Warning = 1, Critical = 2 };

const char* severity_name(Severity severity);

struct AuditFinding {
    std::string check_id;
    Severity severity = Severity::Info;
    std::string description;
    std::string path;
    std::optional<size_t> line;
};

// Descending severity, then check id, path and line
void sort_findings(std::vector<AuditFinding>& findings);

struct AuditConfigFile {
    std::string path;
    bool server = false;  // sshd_config rather than ssh_config
};

// What one audit looks at. An empty scope makes every check skip.
struct AuditScope {
    std::string target;
    std::optional<std::string> key_directory;
    std::vector<AuditConfigFile> configs;
};

struct AuditPaths {
    std::string key_directory;
    std::string client_config;
    std::string sshd_config;
};

// "system" → the configured paths; a directory → it and its "config";
// a file → that config (server if the name contains "sshd"); anything
// missing → empty scope.
AuditScope resolve_audit_scope(const std::string& target, const AuditPaths& paths);

enum AuditCategory : unsigned {
    kAuditKeys = 1u << 0,
    kAuditClient = 1u << 1,
    kAuditServer = 1u << 2,
    kAuditAll = kAuditKeys | kAuditClient | kAuditServer,
};

struct AuditReport {
    std::vector<AuditFinding> findings;  // sorted
    size_t checks_run = 0;
    size_t checks_skipped = 0;
};

// Run the fixed check battery over the scope. Checks whose category is
// outside `categories` are not run at all.
AuditReport run_security_audit(const AuditScope& scope, unsigned categories = kAuditAll);

nlohmann::json audit_report_json(const std::string& target, const AuditReport& report);

class SecurityAuditTool : public Tool {
public:
    explicit SecurityAuditTool(const Config& cfg);

    const ToolDescriptor& descriptor() const override { return descriptor_; }
    ToolResult execute(const nlohmann::json& args) override;

private:
    ToolDescriptor descriptor_;
    AuditPaths paths_;
};

} // namespace sshmcp
