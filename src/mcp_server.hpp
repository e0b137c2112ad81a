#pragma once
#include "config.hpp"
#include "dispatcher.hpp"
#include "transport.hpp"
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace sshmcp {

// JSON-RPC 2.0 error codes
constexpr int kParseError = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;
constexpr int kInternalError = -32603;

constexpr const char* kDefaultProtocolVersion = "2024-11-05";

enum class SessionEnd { Eof, FramingError, WriteFailed };

const char* session_end_name(SessionEnd end);

nlohmann::json jsonrpc_result(const nlohmann::json& id, nlohmann::json result);
nlohmann::json jsonrpc_error(const nlohmann::json& id, int code, const std::string& message);

// MCP front end over a Dispatcher. Holds no per-request state, so one
// instance can serve any number of sessions one after another.
class McpServer {
public:
    McpServer(Dispatcher& dispatcher, ServerConfig info);

    // One parsed message in, at most one response out. Notifications
    // (no "id") never get a response.
    std::optional<nlohmann::json> handle(const nlohmann::json& message);

    // Read → handle → write until the session ends
    SessionEnd serve(Transport& transport);

private:
    nlohmann::json handle_initialize(const nlohmann::json& params) const;
    nlohmann::json handle_call(const nlohmann::json& id, const nlohmann::json& params);

    Dispatcher& dispatcher_;
    ServerConfig info_;
};

} // namespace sshmcp
