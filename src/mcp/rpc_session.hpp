#pragma once
// =============================================================================
// PortalBridge - MCP JSON-RPC session
// =============================================================================
// Transport-independent JSON-RPC 2.0 handling shared by the WebSocket server
// and the reverse connection.
//
// Request:  {"jsonrpc":"2.0","id":1,"method":"tools/call","params":{"name":"android.tap","arguments":{"x":1,"y":2}}}
// Response: {"jsonrpc":"2.0","id":1,"result":{"content":[{"type":"text","text":"{...}"}]}}
// Error:    {"jsonrpc":"2.0","id":1,"error":{"code":-32601,"message":"Method not found: foo"}}
//
// Notifications (no "id") never get a response.
// =============================================================================

#include <atomic>
#include <optional>
#include <string>

#include "nlohmann/json.hpp"
#include "../config_store.hpp"
#include "tool_registry.hpp"

namespace portal::mcp {

constexpr const char* PROTOCOL_VERSION = "2024-11-05";

namespace rpc {
constexpr int PARSE_ERROR      = -32700;
constexpr int INVALID_REQUEST  = -32600;
constexpr int METHOD_NOT_FOUND = -32601;
constexpr int INVALID_PARAMS   = -32602;
constexpr int INTERNAL_ERROR   = -32603;
// reverse connection backpressure
constexpr int QUEUED           = -32001;
constexpr int QUEUE_FULL       = -32002;
} // namespace rpc

struct ServerInfo {
    std::string name = "portal-bridge";
    std::string version = "1.0.0";
};

class RpcSession {
public:
    RpcSession(ToolRegistry& registry, const config::ConfigStore& config,
               ServerInfo info = ServerInfo{});

    // nullopt = nothing to send (notification, or an inbound response)
    std::optional<nlohmann::json> handle(const nlohmann::json& message);
    // Parses first; unparseable text -> -32700 with id null
    std::optional<std::string> handle_text(const std::string& text);

    // true after the first initialize request
    bool initialized() const { return initialized_.load(); }
    void reset() { initialized_ = false; }

    size_t enabled_tool_count() const;

    static nlohmann::json make_result(const nlohmann::json& id, nlohmann::json result);
    static nlohmann::json make_error(const nlohmann::json& id, int code, const std::string& message);

    // --- message classification ---
    static bool is_request(const nlohmann::json& m);       // method + id
    static bool is_notification(const nlohmann::json& m);  // method, no id
    static bool is_response(const nlohmann::json& m);      // result|error, no method

private:
    nlohmann::json handle_initialize();
    nlohmann::json handle_tools_list();
    nlohmann::json handle_tools_call(const nlohmann::json& id, const nlohmann::json& params);

    ToolRegistry& registry_;
    const config::ConfigStore& config_;
    ServerInfo info_;
    std::atomic<bool> initialized_{false};
};

} // namespace portal::mcp
