#pragma once
#include "tool.hpp"
#include <string>
#include <vector>
#include <memory>
#include <unordered_map>
#include <nlohmann/json.hpp>

namespace sshmcp {

struct ToolRequest {
    std::string name;
    nlohmann::json arguments;  // object, or null for "no arguments"
};

// Owns the tool set fixed at startup and runs one request at a time
// through validate → execute. Nothing thrown by a handler escapes.
class Dispatcher {
public:
    // Throws std::invalid_argument on duplicate or empty tool names
    explicit Dispatcher(std::vector<std::unique_ptr<Tool>> tools, bool log_calls = false);

    ToolResult dispatch(const ToolRequest& request);

    // tools/list array, in registration order
    nlohmann::json catalog() const;

    const Tool* find(const std::string& name) const;
    size_t size() const { return tools_.size(); }

private:
    ToolResult execute(Tool& tool, const nlohmann::json& args);

    std::vector<std::unique_ptr<Tool>> tools_;
    std::unordered_map<std::string, Tool*> by_name_;
    bool log_calls_;
};

// MCP CallToolResult for a ToolResult
nlohmann::json to_call_tool_result(const ToolResult& result);

} // namespace sshmcp
