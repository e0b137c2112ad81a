#pragma once
#include <string>
#include <memory>
#include <vector>
#include <variant>
#include <optional>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace sshmcp {

struct Config;

enum class ErrorKind {
    UnknownTool,
    InvalidArguments,
    InvalidInput,
    Timeout,
    NotFound,
    PermissionDenied,
    SpawnError,
    InternalError,
};

// Wire name, e.g. "invalid_arguments"
const char* error_kind_name(ErrorKind kind);

struct ToolFailure {
    ErrorKind kind;
    std::string message;
};

// Exactly one of a success payload or a typed failure.
class ToolResult {
public:
    static ToolResult success(nlohmann::json payload) {
        return ToolResult(std::move(payload));
    }
    static ToolResult failure(ErrorKind kind, std::string message) {
        return ToolResult(ToolFailure{kind, std::move(message)});
    }

    bool ok() const { return std::holds_alternative<nlohmann::json>(value_); }
    const nlohmann::json& payload() const { return std::get<nlohmann::json>(value_); }
    const ToolFailure& error() const { return std::get<ToolFailure>(value_); }

private:
    explicit ToolResult(nlohmann::json payload) : value_(std::move(payload)) {}
    explicit ToolResult(ToolFailure failure) : value_(std::move(failure)) {}

    std::variant<nlohmann::json, ToolFailure> value_;
};

enum class ParamType { String, Integer, Boolean, Enum, StringList };

const char* param_type_name(ParamType type);

struct ParamSpec {
    std::string name;
    ParamType type = ParamType::String;
    bool required = false;
    std::string description;
    std::optional<nlohmann::json> default_value;
    std::vector<std::string> enum_values;  // Enum only
    std::optional<int64_t> minimum;        // Integer only
    std::optional<int64_t> maximum;        // Integer only
};

struct ToolDescriptor {
    std::string name;
    std::string description;
    std::vector<ParamSpec> params;

    const ParamSpec* find_param(const std::string& param_name) const;
};

// Handlers receive arguments that already passed validate_arguments():
// every declared param with a default is present and correctly typed.
class Tool {
public:
    virtual ~Tool() = default;
    virtual const ToolDescriptor& descriptor() const = 0;
    virtual ToolResult execute(const nlohmann::json& args) = 0;

    const std::string& tool_name() const { return descriptor().name; }
};

// Create all built-in tools, configured from cfg
std::vector<std::unique_ptr<Tool>> create_builtin_tools(const Config& cfg);

// ── ParamSpec builders ──────────────────────────────────────────

ParamSpec string_param(std::string name, std::string description, bool required);
ParamSpec defaulted_string_param(std::string name, std::string description,
                                 std::string default_value);
ParamSpec int_param(std::string name, std::string description, bool required,
                    std::optional<int64_t> default_value,
                    int64_t minimum, int64_t maximum);
ParamSpec bool_param(std::string name, std::string description, bool default_value);
ParamSpec enum_param(std::string name, std::string description,
                     std::vector<std::string> values, std::string default_value);
ParamSpec string_list_param(std::string name, std::string description);

} // namespace sshmcp
