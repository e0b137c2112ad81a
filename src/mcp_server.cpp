#include "mcp_server.hpp"

#include <algorithm>
#include <iostream>

namespace sshmcp {

static const char* const kSupportedVersions[] = {
    "2024-11-05",
    "2025-03-26",
    "2025-06-18",
};

const char* session_end_name(SessionEnd end) {
    switch (end) {
        case SessionEnd::Eof:          return "eof";
        case SessionEnd::FramingError: return "framing_error";
        case SessionEnd::WriteFailed:  return "write_failed";
    }
    return "unknown";
}

nlohmann::json jsonrpc_result(const nlohmann::json& id, nlohmann::json result) {
    return {{"jsonrpc", "2.0"}, {"id", id}, {"result", std::move(result)}};
}

nlohmann::json jsonrpc_error(const nlohmann::json& id, int code, const std::string& message) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", {{"code", code}, {"message", message}}}
    };
}

// The id to echo in an error reply; null when absent or malformed
static nlohmann::json request_id(const nlohmann::json& message) {
    if (!message.is_object() || !message.contains("id")) return nullptr;
    const auto& id = message["id"];
    if (id.is_string() || id.is_number()) return id;
    return nullptr;
}

static std::string dump_message(const nlohmann::json& j) {
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

McpServer::McpServer(Dispatcher& dispatcher, ServerConfig info)
    : dispatcher_(dispatcher), info_(std::move(info)) {}

nlohmann::json McpServer::handle_initialize(const nlohmann::json& params) const {
    std::string version = kDefaultProtocolVersion;
    if (params.is_object() && params.contains("protocolVersion") &&
        params["protocolVersion"].is_string()) {
        auto requested = params["protocolVersion"].get<std::string>();
        auto begin = std::begin(kSupportedVersions);
        auto end = std::end(kSupportedVersions);
        if (std::find(begin, end, requested) != end) version = requested;
    }

    if (params.is_object() && params.contains("clientInfo") &&
        params["clientInfo"].is_object()) {
        const auto& client = params["clientInfo"];
        std::string name = client.contains("name") && client["name"].is_string()
            ? client["name"].get<std::string>() : "unknown";
        std::cerr << "[mcp] initialize from " << name
                  << " (protocol " << version << ")\n";
    }

    return {
        {"protocolVersion", version},
        {"capabilities", {{"tools", {{"listChanged", false}}}}},
        {"serverInfo", {{"name", info_.name}, {"version", info_.version}}}
    };
}

nlohmann::json McpServer::handle_call(const nlohmann::json& id, const nlohmann::json& params) {
    if (!params.is_object() || !params.contains("name"))
        return jsonrpc_error(id, kInvalidParams, "Missing tool name");
    if (!params["name"].is_string())
        return jsonrpc_error(id, kInvalidParams, "Tool name must be a string");

    ToolRequest request;
    request.name = params["name"].get<std::string>();
    if (params.contains("arguments")) request.arguments = params["arguments"];

    ToolResult result = dispatcher_.dispatch(request);
    return jsonrpc_result(id, to_call_tool_result(result));
}

std::optional<nlohmann::json> McpServer::handle(const nlohmann::json& message) {
    if (!message.is_object())
        return jsonrpc_error(nullptr, kInvalidRequest, "Request must be a JSON object");

    // A malformed id cannot be echoed back
    nlohmann::json id = nullptr;
    bool is_notification = !message.contains("id");
    if (!is_notification) {
        const auto& raw_id = message["id"];
        if (!raw_id.is_string() && !raw_id.is_number() && !raw_id.is_null())
            return jsonrpc_error(nullptr, kInvalidRequest, "Invalid id");
        id = raw_id;
    }

    if (!message.contains("jsonrpc") || message["jsonrpc"] != "2.0") {
        if (is_notification) return std::nullopt;
        return jsonrpc_error(id, kInvalidRequest, "Invalid JSON-RPC version");
    }
    if (!message.contains("method") || !message["method"].is_string()) {
        if (is_notification) return std::nullopt;
        return jsonrpc_error(id, kInvalidRequest, "Missing method");
    }

    std::string method = message["method"].get<std::string>();
    nlohmann::json params = message.contains("params") ? message["params"] : nlohmann::json();

    if (is_notification) {
        if (method.rfind("notifications/", 0) != 0)
            std::cerr << "[mcp] Ignoring notification: " << method << "\n";
        return std::nullopt;
    }

    if (!params.is_null() && !params.is_object() && !params.is_array())
        return jsonrpc_error(id, kInvalidRequest, "params must be an object or array");

    if (method == "initialize") return jsonrpc_result(id, handle_initialize(params));
    if (method == "ping") return jsonrpc_result(id, nlohmann::json::object());
    if (method == "tools/list")
        return jsonrpc_result(id, {{"tools", dispatcher_.catalog()}});
    if (method == "tools/call") return handle_call(id, params);

    return jsonrpc_error(id, kMethodNotFound, "Method not found: " + method);
}

SessionEnd McpServer::serve(Transport& transport) {
    std::string line;
    while (true) {
        ReadStatus status = transport.read_message(line);
        if (status == ReadStatus::Eof) return SessionEnd::Eof;
        if (status == ReadStatus::FramingError) {
            std::cerr << "[mcp] Message exceeds size limit, closing session\n";
            // Best effort: the session ends whether or not this arrives
            if (!transport.write_message(dump_message(
                    jsonrpc_error(nullptr, kInvalidRequest, "Message too large")))) {
                return SessionEnd::WriteFailed;
            }
            return SessionEnd::FramingError;
        }

        nlohmann::json message;
        try {
            message = nlohmann::json::parse(line);
        } catch (const nlohmann::json::parse_error& e) {
            std::cerr << "[mcp] Parse error: " << e.what() << "\n";
            // Framing is line based, so the next line is still a clean start
            if (!transport.write_message(dump_message(jsonrpc_error(
                    nullptr, kParseError, std::string("Parse error: ") + e.what())))) {
                return SessionEnd::WriteFailed;
            }
            continue;
        }

        std::optional<nlohmann::json> response;
        try {
            response = handle(message);
        } catch (const std::exception& e) {
            std::cerr << "[mcp] Request failed: " << e.what() << "\n";
            // Notifications stay unanswered even when they fail
            if (message.is_object() && !message.contains("id")) continue;
            response = jsonrpc_error(request_id(message), kInternalError,
                                     std::string("Internal error: ") + e.what());
        }
        if (response && !transport.write_message(dump_message(*response)))
            return SessionEnd::WriteFailed;
    }
}

} // namespace sshmcp
