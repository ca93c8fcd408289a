// =============================================================================
// PortalBridge - MCP JSON-RPC session Implementation
// =============================================================================

#include "rpc_session.hpp"

#include "../portal_log.hpp"

using json = nlohmann::json;

namespace portal::mcp {

RpcSession::RpcSession(ToolRegistry& registry, const config::ConfigStore& config, ServerInfo info)
    : registry_(registry), config_(config), info_(std::move(info)) {}

size_t RpcSession::enabled_tool_count() const {
    return registry_.enabled_count(config_.enabled_tools());
}

// =============================================================================
// Envelope helpers
// =============================================================================

json RpcSession::make_result(const json& id, json result) {
    json j;
    j["jsonrpc"] = "2.0";
    j["id"] = id;
    j["result"] = std::move(result);
    return j;
}

json RpcSession::make_error(const json& id, int code, const std::string& message) {
    json j;
    j["jsonrpc"] = "2.0";
    j["id"] = id;
    j["error"] = {{"code", code}, {"message", message}};
    return j;
}

bool RpcSession::is_request(const json& m) {
    return m.is_object() && m.contains("method") && m.contains("id") && !m["id"].is_null();
}

bool RpcSession::is_notification(const json& m) {
    return m.is_object() && m.contains("method") && (!m.contains("id") || m["id"].is_null());
}

bool RpcSession::is_response(const json& m) {
    return m.is_object() && !m.contains("method") && (m.contains("result") || m.contains("error"));
}

// =============================================================================
// Dispatch
// =============================================================================

std::optional<std::string> RpcSession::handle_text(const std::string& text) {
    json message;
    try {
        message = json::parse(text);
    } catch (const json::parse_error& e) {
        PLOG_WARN("rpc", "Parse error: %s", e.what());
        return make_error(nullptr, rpc::PARSE_ERROR, "Parse error").dump();
    }
    auto reply = handle(message);
    if (!reply) return std::nullopt;
    return reply->dump();
}

std::optional<json> RpcSession::handle(const json& message) {
    if (!message.is_object()) {
        return make_error(nullptr, rpc::INVALID_REQUEST, "Invalid Request");
    }

    if (is_response(message)) {
        // こちらからリクエストは出さないのでログのみ
        PLOG_DEBUG("rpc", "Ignoring inbound response id=%s", message.value("id", json()).dump().c_str());
        return std::nullopt;
    }

    const json id = message.contains("id") ? message["id"] : json();
    if (!message.contains("method") || !message["method"].is_string()) {
        return make_error(id, rpc::INVALID_REQUEST, "Invalid Request");
    }
    const std::string method = message["method"].get<std::string>();
    const json params = message.contains("params") ? message["params"] : json::object();

    if (is_notification(message)) {
        if (method == "notifications/initialized") {
            PLOG_INFO("rpc", "Client initialized");
        } else {
            PLOG_DEBUG("rpc", "Notification ignored: %s", method.c_str());
        }
        return std::nullopt;
    }

    try {
        if (method == "initialize") {
            return make_result(id, handle_initialize());
        }
        if (method == "tools/list") {
            return make_result(id, handle_tools_list());
        }
        if (method == "tools/call") {
            return handle_tools_call(id, params);
        }
        if (method == "ping") {
            return make_result(id, json::object());
        }
        return make_error(id, rpc::METHOD_NOT_FOUND, "Method not found: " + method);

    } catch (const std::exception& e) {
        PLOG_ERROR("rpc", "%s failed: %s", method.c_str(), e.what());
        return make_error(id, rpc::INTERNAL_ERROR, std::string("Internal error: ") + e.what());
    }
}

// =============================================================================
// Methods
// =============================================================================

json RpcSession::handle_initialize() {
    initialized_ = true;
    PLOG_INFO("rpc", "initialize (protocol %s, %zu tools enabled)", PROTOCOL_VERSION, enabled_tool_count());
    return json{
        {"protocolVersion", PROTOCOL_VERSION},
        {"serverInfo", {{"name", info_.name}, {"version", info_.version}}},
        {"capabilities", {{"tools", {{"listChanged", false}}}}},
    };
}

json RpcSession::handle_tools_list() {
    json tools = json::array();
    for (const ToolDefinition* def : registry_.list(config_.enabled_tools())) {
        tools.push_back(def->to_json());
    }
    return json{{"tools", std::move(tools)}};
}

json RpcSession::handle_tools_call(const json& id, const json& params) {
    if (!params.is_object() || !params.contains("name") || !params["name"].is_string()) {
        return make_error(id, rpc::INVALID_PARAMS, "Missing tool name");
    }
    const std::string name = params["name"].get<std::string>();

    ToolHandler* tool = registry_.find(name);
    if (!tool || !ToolRegistry::is_enabled(name, config_.enabled_tools())) {
        return make_error(id, rpc::INVALID_PARAMS, "Unknown tool: " + name);
    }

    json args = json::object();
    if (params.contains("arguments") && params["arguments"].is_object()) {
        args = params["arguments"];
    }

    PLOG_DEBUG("rpc", "tools/call %s %s", name.c_str(), args.dump().c_str());
    json out = tool->execute(args);

    json result;
    result["content"] = json::array({json{{"type", "text"}, {"text", out.dump()}}});
    if (out.is_object() && out.value("success", true) == false) {
        result["isError"] = true;
    }
    return make_result(id, std::move(result));
}

} // namespace portal::mcp
