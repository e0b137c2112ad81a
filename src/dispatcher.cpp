#include "dispatcher.hpp"
#include "schema.hpp"
#include "util.hpp"

#include <chrono>
#include <iostream>
#include <stdexcept>

namespace sshmcp {

Dispatcher::Dispatcher(std::vector<std::unique_ptr<Tool>> tools, bool log_calls)
    : tools_(std::move(tools))
    , log_calls_(log_calls)
{
    for (const auto& tool : tools_) {
        const std::string& name = tool->tool_name();
        if (name.empty()) {
            throw std::invalid_argument("Tool with empty name");
        }
        if (!by_name_.emplace(name, tool.get()).second) {
            throw std::invalid_argument("Duplicate tool: " + name);
        }
    }
}

const Tool* Dispatcher::find(const std::string& name) const {
    auto it = by_name_.find(name);
    return it == by_name_.end() ? nullptr : it->second;
}

nlohmann::json Dispatcher::catalog() const {
    nlohmann::json list = nlohmann::json::array();
    for (const auto& tool : tools_) {
        const auto& d = tool->descriptor();
        list.push_back({
            {"name", d.name},
            {"description", d.description},
            {"inputSchema", input_schema_json(d)},
        });
    }
    return list;
}

ToolResult Dispatcher::dispatch(const ToolRequest& request) {
    auto start = std::chrono::steady_clock::now();

    // Validating
    auto it = by_name_.find(request.name);
    if (it == by_name_.end()) {
        return ToolResult::failure(ErrorKind::UnknownTool, "Unknown tool: " + request.name);
    }
    Tool& tool = *it->second;

    nlohmann::json args;
    std::vector<std::string> ignored;
    if (auto err = validate_arguments(tool.descriptor(), request.arguments, args, &ignored)) {
        if (log_calls_) {
            std::cerr << "[tool] " << request.name << " rejected: " << err->message << "\n";
        }
        return ToolResult::failure(err->kind, err->message);
    }
    if (log_calls_ && !ignored.empty()) {
        std::string names;
        for (const auto& n : ignored) names += (names.empty() ? "" : ", ") + n;
        std::cerr << "[tool] " << request.name << " ignoring unknown arguments: " << names << "\n";
    }

    // Executing
    ToolResult result = execute(tool, args);

    if (log_calls_) {
        std::cerr << "[tool] " << request.name << " "
                  << (result.ok() ? "ok" : error_kind_name(result.error().kind))
                  << " (" << elapsed_ms(start) << " ms)\n";
    }
    return result;
}

ToolResult Dispatcher::execute(Tool& tool, const nlohmann::json& args) {
    try {
        return tool.execute(args);
    } catch (const std::exception& e) {
        std::cerr << "[tool] " << tool.tool_name() << " threw: " << e.what() << "\n";
        return ToolResult::failure(ErrorKind::InternalError,
                                   std::string("Internal error: ") + e.what());
    } catch (...) {
        std::cerr << "[tool] " << tool.tool_name() << " threw a non-standard exception\n";
        return ToolResult::failure(ErrorKind::InternalError,
                                   "Internal error: unknown exception");
    }
}

nlohmann::json to_call_tool_result(const ToolResult& result) {
    if (result.ok()) {
        // Tool output may carry raw bytes (stderr, key comments)
        std::string text = result.payload().dump(
            2, ' ', false, nlohmann::json::error_handler_t::replace);
        return {
            {"content", nlohmann::json::array({
                {{"type", "text"}, {"text", text}}
            })},
            {"structuredContent", result.payload()},
            {"isError", false},
        };
    }

    const auto& err = result.error();
    std::string kind = error_kind_name(err.kind);
    return {
        {"content", nlohmann::json::array({
            {{"type", "text"}, {"text", kind + ": " + err.message}}
        })},
        {"structuredContent", {
            {"error", {{"kind", kind}, {"message", err.message}}}
        }},
        {"isError", true},
    };
}

} // namespace sshmcp
