#include "tool.hpp"
#include "config.hpp"
#include "tools/check_connection.hpp"
#include "tools/generate_config.hpp"
#include "tools/list_keys.hpp"
#include "tools/security_audit.hpp"
#include "tools/port_scanner.hpp"
#include "tools/generate_key.hpp"
#include "tools/check_config.hpp"
#include "tools/create_tunnel.hpp"

namespace sshmcp {

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::UnknownTool:      return "unknown_tool";
        case ErrorKind::InvalidArguments: return "invalid_arguments";
        case ErrorKind::InvalidInput:     return "invalid_input";
        case ErrorKind::Timeout:          return "timeout";
        case ErrorKind::NotFound:         return "not_found";
        case ErrorKind::PermissionDenied: return "permission_denied";
        case ErrorKind::SpawnError:       return "spawn_error";
        case ErrorKind::InternalError:    return "internal_error";
    }
    return "internal_error";
}

const char* param_type_name(ParamType type) {
    switch (type) {
        case ParamType::String:     return "string";
        case ParamType::Integer:    return "integer";
        case ParamType::Boolean:    return "boolean";
        case ParamType::Enum:       return "enum";
        case ParamType::StringList: return "string list";
    }
    return "unknown";
}

const ParamSpec* ToolDescriptor::find_param(const std::string& param_name) const {
    for (const auto& p : params) {
        if (p.name == param_name) return &p;
    }
    return nullptr;
}

std::vector<std::unique_ptr<Tool>> create_builtin_tools(const Config& cfg) {
    std::vector<std::unique_ptr<Tool>> tools;
    tools.push_back(std::make_unique<CheckConnectionTool>(cfg));
    tools.push_back(std::make_unique<GenerateConfigTool>(cfg));
    tools.push_back(std::make_unique<ListKeysTool>(cfg));
    tools.push_back(std::make_unique<SecurityAuditTool>(cfg));
    tools.push_back(std::make_unique<PortScannerTool>(cfg));
    tools.push_back(std::make_unique<GenerateKeyTool>(cfg));
    tools.push_back(std::make_unique<CheckConfigTool>(cfg));
    tools.push_back(std::make_unique<CreateTunnelTool>(cfg));
    return tools;
}

ParamSpec string_param(std::string name, std::string description, bool required) {
    ParamSpec p;
    p.name = std::move(name);
    p.type = ParamType::String;
    p.required = required;
    p.description = std::move(description);
    return p;
}

ParamSpec defaulted_string_param(std::string name, std::string description,
                                 std::string default_value) {
    ParamSpec p = string_param(std::move(name), std::move(description), false);
    p.default_value = std::move(default_value);
    return p;
}

ParamSpec int_param(std::string name, std::string description, bool required,
                    std::optional<int64_t> default_value,
                    int64_t minimum, int64_t maximum) {
    ParamSpec p;
    p.name = std::move(name);
    p.type = ParamType::Integer;
    p.required = required;
    p.description = std::move(description);
    if (default_value) p.default_value = *default_value;
    p.minimum = minimum;
    p.maximum = maximum;
    return p;
}

ParamSpec bool_param(std::string name, std::string description, bool default_value) {
    ParamSpec p;
    p.name = std::move(name);
    p.type = ParamType::Boolean;
    p.description = std::move(description);
    p.default_value = default_value;
    return p;
}

ParamSpec enum_param(std::string name, std::string description,
                     std::vector<std::string> values, std::string default_value) {
    ParamSpec p;
    p.name = std::move(name);
    p.type = ParamType::Enum;
    p.description = std::move(description);
    p.enum_values = std::move(values);
    p.default_value = std::move(default_value);
    return p;
}

ParamSpec string_list_param(std::string name, std::string description) {
    ParamSpec p;
    p.name = std::move(name);
    p.type = ParamType::StringList;
    p.description = std::move(description);
    return p;
}

} // namespace sshmcp
