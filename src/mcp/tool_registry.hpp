#pragma once
// =============================================================================
// PortalBridge - MCP tool registry
// =============================================================================
// Tools return a JSON object: {"success":true, ...} or {"success":false,"error":"..."}.
// RpcSession wraps that object as text content and flags isError on failure.
// The registry is filled once at startup and read-only afterwards.
// =============================================================================

#include <functional>
#include <initializer_list>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"
#include "../action_result.hpp"

namespace portal::mcp {

struct ToolDefinition {
    std::string name;
    std::string description;
    nlohmann::json input_schema = nlohmann::json::object();

    nlohmann::json to_json() const {
        return nlohmann::json{{"name", name}, {"description", description}, {"inputSchema", input_schema}};
    }
};

class ToolHandler {
public:
    virtual ~ToolHandler() = default;
    virtual const ToolDefinition& definition() const = 0;
    virtual nlohmann::json execute(const nlohmann::json& arguments) = 0;
};

// std::function でツール本体を持つ汎用実装
class FunctionTool : public ToolHandler {
public:
    using Fn = std::function<nlohmann::json(const nlohmann::json&)>;

    FunctionTool(ToolDefinition def, Fn fn) : def_(std::move(def)), fn_(std::move(fn)) {}

    const ToolDefinition& definition() const override { return def_; }
    nlohmann::json execute(const nlohmann::json& arguments) override { return fn_(arguments); }

private:
    ToolDefinition def_;
    Fn fn_;
};

using EnabledSet = std::optional<std::set<std::string>>;

class ToolRegistry {
public:
    ToolRegistry() = default;
    ToolRegistry(const ToolRegistry&) = delete;
    ToolRegistry& operator=(const ToolRegistry&) = delete;

    // Replaces an existing tool with the same name
    void add(std::unique_ptr<ToolHandler> tool);
    void add(ToolDefinition def, FunctionTool::Fn fn);

    ToolHandler* find(const std::string& name) const;

    // nullopt enabled = every tool
    static bool is_enabled(const std::string& name, const EnabledSet& enabled);
    std::vector<const ToolDefinition*> list(const EnabledSet& enabled = std::nullopt) const;

    size_t size() const { return tools_.size(); }
    size_t enabled_count(const EnabledSet& enabled) const { return list(enabled).size(); }

private:
    std::vector<std::unique_ptr<ToolHandler>> tools_;  // 登録順
    std::map<std::string, size_t> index_;
};

// =============================================================================
// Helpers shared by the tool sets
// =============================================================================

struct PropSpec {
    const char* name;
    const char* type;         // "string" | "integer" | "boolean"
    const char* description;
};

nlohmann::json object_schema(std::initializer_list<PropSpec> props,
                             std::initializer_list<const char*> required = {});

nlohmann::json tool_error(const std::string& message);
nlohmann::json tool_success(nlohmann::json fields = nlohmann::json::object());

// Dispatcher result -> tool JSON ({"success":true,"message"|"data":...})
nlohmann::json from_action(const ActionResult& result);

std::optional<int> arg_int(const nlohmann::json& args, const char* key);
std::optional<std::string> arg_string(const nlohmann::json& args, const char* key);
bool arg_bool(const nlohmann::json& args, const char* key, bool def);

} // namespace portal::mcp
