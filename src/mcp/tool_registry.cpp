// =============================================================================
// PortalBridge - MCP tool registry
// =============================================================================

#include "tool_registry.hpp"

#include <cmath>

#include "../json_number.hpp"
#include "../portal_log.hpp"

using json = nlohmann::json;

namespace portal::mcp {

void ToolRegistry::add(std::unique_ptr<ToolHandler> tool) {
    const std::string name = tool->definition().name;
    auto it = index_.find(name);
    if (it != index_.end()) {
        PLOG_WARN("mcp", "Tool %s registered twice, replacing", name.c_str());
        tools_[it->second] = std::move(tool);
        return;
    }
    index_[name] = tools_.size();
    tools_.push_back(std::move(tool));
}

void ToolRegistry::add(ToolDefinition def, FunctionTool::Fn fn) {
    add(std::make_unique<FunctionTool>(std::move(def), std::move(fn)));
}

ToolHandler* ToolRegistry::find(const std::string& name) const {
    auto it = index_.find(name);
    return it == index_.end() ? nullptr : tools_[it->second].get();
}

bool ToolRegistry::is_enabled(const std::string& name, const EnabledSet& enabled) {
    return !enabled || enabled->count(name) > 0;
}

std::vector<const ToolDefinition*> ToolRegistry::list(const EnabledSet& enabled) const {
    std::vector<const ToolDefinition*> out;
    for (const auto& t : tools_) {
        if (is_enabled(t->definition().name, enabled)) out.push_back(&t->definition());
    }
    return out;
}

// =============================================================================
// Helpers
// =============================================================================

json object_schema(std::initializer_list<PropSpec> props,
                   std::initializer_list<const char*> required) {
    json properties = json::object();
    for (const auto& p : props) {
        properties[p.name] = {{"type", p.type}, {"description", p.description}};
    }
    json schema = {{"type", "object"}, {"properties", std::move(properties)}};
    if (required.size() > 0) {
        json req = json::array();
        for (const char* r : required) req.push_back(r);
        schema["required"] = std::move(req);
    }
    return schema;
}

json tool_error(const std::string& message) {
    return json{{"success", false}, {"error", message}};
}

json tool_success(json fields) {
    json out = {{"success", true}};
    if (fields.is_object()) {
        for (auto it = fields.begin(); it != fields.end(); ++it) out[it.key()] = it.value();
    }
    return out;
}

json from_action(const ActionResult& result) {
    if (result.is_err()) return tool_error(result.error().message);

    const auto& out = result.value();
    if (is_binary(out)) {
        const auto& bin = std::get<BinaryPayload>(out);
        return tool_success({{"content_type", bin.content_type}, {"size", bin.bytes.size()}});
    }
    const auto& data = std::get<json>(out);
    if (data.is_object() && data.contains("message")) {
        return tool_success({{"message", data["message"]}});
    }
    return tool_success({{"data", data}});
}

std::optional<int> arg_int(const json& args, const char* key) {
    if (!args.is_object() || !args.contains(key)) return std::nullopt;
    const auto& v = args[key];
    if (v.is_number_float()) {
        const double d = v.get<double>();
        if (std::isnan(d)) return std::nullopt;
        return saturate_int(std::round(d));
    }
    if (!v.is_number()) return std::nullopt;
    return json_to_int(v);
}

std::optional<std::string> arg_string(const json& args, const char* key) {
    if (!args.is_object() || !args.contains(key) || !args[key].is_string()) return std::nullopt;
    return args[key].get<std::string>();
}

bool arg_bool(const json& args, const char* key, bool def) {
    if (!args.is_object() || !args.contains(key) || !args[key].is_boolean()) return def;
    return args[key].get<bool>();
}

} // namespace portal::mcp
