// =============================================================================
// PortalBridge - Coordinate-level MCP tools
// =============================================================================

#include "device_tools.hpp"

#include "../base64.hpp"
#include "../portal_log.hpp"
#include "../tree_compactor.hpp"

using json = nlohmann::json;

namespace portal::mcp {

namespace {

json missing(const char* name) {
    return tool_error(std::string("Missing required parameter: ") + name);
}

} // namespace

Result<std::string> screen_text(DeviceGateway& gateway, bool filter) {
    auto tree = gateway.snapshot_tree();
    if (tree.is_err()) return tree.error();

    const Rect screen = gateway.screen_bounds();
    auto elements = filter ? compact(*tree.value(), screen) : compact(*tree.value());
    return render_text(elements, gateway.phone_state(), screen);
}

void register_device_tools(ToolRegistry& registry, CommandDispatcher& dispatcher) {
    CommandDispatcher* d = &dispatcher;

    // --- screen / packages ---

    registry.add(
        {"android.screen.dump",
         "Current screen as a compact list of interactive elements "
         "(class, text, bounds x,y,w,h, short resource id, flags) plus phone state.",
         object_schema({{"filter", "boolean", "Drop elements not visible on screen (default true)"}})},
        [d](const json& args) {
            auto text = screen_text(d->gateway(), arg_bool(args, "filter", true));
            if (text.is_err()) return tool_error(text.error().message);
            return tool_success({{"text", text.value()}});
        });

    registry.add(
        {"android.packages.list",
         "Installed launchable apps (label, package name, system flag).",
         object_schema({{"filter", "string", "user (default) | system | all"}})},
        [d](const json& args) {
            std::string filter = arg_string(args, "filter").value_or(
                arg_string(args, "type").value_or("user"));
            if (filter != "user" && filter != "system" && filter != "all") {
                return tool_error("filter must be one of: user, system, all");
            }
            json pkgs = json::array();
            for (const auto& p : d->gateway().packages()) {
                if (filter == "user" && p.is_system_app) continue;
                if (filter == "system" && !p.is_system_app) continue;
                pkgs.push_back({{"packageName", p.package_name},
                                {"label", p.label},
                                {"isSystemApp", p.is_system_app}});
            }
            const size_t count = pkgs.size();
            return tool_success({{"count", count}, {"packages", std::move(pkgs)}});
        });

    registry.add(
        {"android.launch_app",
         "Launch an app by package name, optionally a specific activity.",
         object_schema({{"package", "string", "Package name, e.g. com.android.settings"},
                        {"activity", "string", "Activity class name (optional)"}},
                       {"package"})},
        [d](const json& args) {
            auto pkg = arg_string(args, "package");
            if (!pkg || pkg->empty()) return missing("package");
            json params = {{"package", *pkg}};
            if (auto act = arg_string(args, "activity")) params["activity"] = *act;
            return from_action(d->dispatch("app", params));
        });

    // --- text ---

    registry.add(
        {"android.text.input",
         "Type text into the focused input field.",
         object_schema({{"text", "string", "Text to enter"},
                        {"clear", "boolean", "Replace existing content (default true)"}},
                       {"text"})},
        [d](const json& args) {
            auto text = arg_string(args, "text");
            if (!text) return missing("text");
            return from_action(d->dispatch("input", {{"base64_text", base64Encode(*text)},
                                                     {"clear", arg_bool(args, "clear", true)}}));
        });

    registry.add(
        {"android.input.clear", "Clear the focused input field.", object_schema({})},
        [d](const json&) { return from_action(d->dispatch("clear", json::object())); });

    registry.add(
        {"android.key.send",
         "Send an Android key event (66 = ENTER, 67 = DEL, 4 = BACK).",
         object_schema({{"key_code", "integer", "Android KeyEvent code"}}, {"key_code"})},
        [d](const json& args) {
            auto code = arg_int(args, "key_code");
            if (!code) return missing("key_code");
            return from_action(d->dispatch("key", {{"key_code", *code}}));
        });

    // --- gestures ---

    registry.add(
        {"android.tap", "Tap at screen coordinates.",
         object_schema({{"x", "integer", "X coordinate"}, {"y", "integer", "Y coordinate"}},
                       {"x", "y"})},
        [d](const json& args) {
            auto x = arg_int(args, "x");
            auto y = arg_int(args, "y");
            if (!x) return missing("x");
            if (!y) return missing("y");
            return from_action(d->dispatch("tap", {{"x", *x}, {"y", *y}}));
        });

    registry.add(
        {"android.double_tap", "Double tap at screen coordinates.",
         object_schema({{"x", "integer", "X coordinate"}, {"y", "integer", "Y coordinate"}},
                       {"x", "y"})},
        [d](const json& args) {
            auto x = arg_int(args, "x");
            auto y = arg_int(args, "y");
            if (!x) return missing("x");
            if (!y) return missing("y");
            return from_action(d->dispatch("double_tap", {{"x", *x}, {"y", *y}}));
        });

    registry.add(
        {"android.long_press", "Long press at screen coordinates.",
         object_schema({{"x", "integer", "X coordinate"}, {"y", "integer", "Y coordinate"},
                        {"duration", "integer", "Hold time in ms (default 1000)"}},
                       {"x", "y"})},
        [d](const json& args) {
            auto x = arg_int(args, "x");
            auto y = arg_int(args, "y");
            if (!x) return missing("x");
            if (!y) return missing("y");
            const int duration = arg_int(args, "duration").value_or(DEFAULT_LONG_PRESS_MS);
            return from_action(d->dispatch("long_press", {{"x", *x}, {"y", *y}, {"duration", duration}}));
        });

    registry.add(
        {"android.swipe", "Swipe between two points.",
         object_schema({{"startX", "integer", "Start X"}, {"startY", "integer", "Start Y"},
                        {"endX", "integer", "End X"}, {"endY", "integer", "End Y"},
                        {"duration", "integer", "Duration in ms (default 300, 10..5000)"}},
                       {"startX", "startY", "endX", "endY"})},
        [d](const json& args) {
            json params = json::object();
            for (const char* k : {"startX", "startY", "endX", "endY"}) {
                auto v = arg_int(args, k);
                if (!v) return missing(k);
                params[k] = *v;
            }
            params["duration"] = arg_int(args, "duration").value_or(DEFAULT_SWIPE_MS);
            return from_action(d->dispatch("swipe", params));
        });

    PLOG_DEBUG("mcp", "Device tools registered (%zu total)", registry.size());
}

} // namespace portal::mcp
