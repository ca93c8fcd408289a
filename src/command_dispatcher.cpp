// =============================================================================
// PortalBridge - CommandDispatcher Implementation
// =============================================================================

#include "command_dispatcher.hpp"

#include <cctype>
#include <chrono>

#include "base64.hpp"
#include "json_number.hpp"
#include "portal_log.hpp"
#include "tree_compactor.hpp"
#include "tree_json.hpp"

using json = nlohmann::json;

namespace portal {

namespace {

bool starts_with(const std::string& s, const char* prefix) {
    return s.compare(0, std::char_traits<char>::length(prefix), prefix) == 0;
}

std::string lower(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

json message(const std::string& text) {
    return json{{"message", text}};
}

ActionResult from_void(const Result<void>& r, const std::string& ok_message) {
    if (r.is_err()) return r.error();
    return action_ok(message(ok_message));
}

} // namespace

CommandDispatcher::CommandDispatcher(DeviceGateway& gateway, config::ConfigStore& config)
    : gateway_(gateway), config_(config) {}

// ---------------------------------------------------------------------------
// Normalization
// ---------------------------------------------------------------------------

std::string CommandDispatcher::normalize_action(const std::string& action) {
    std::string m = action;
    if (starts_with(m, "/action/")) {
        m = m.substr(8);
    } else if (starts_with(m, "action.")) {
        m = m.substr(7);
    }
    if (starts_with(m, "/")) m = m.substr(1);

    if (m == "keyboard/input" || m == "text.input")  return "input";
    if (m == "keyboard/clear" || m == "input.clear") return "clear";
    if (m == "keyboard/key"   || m == "key.send")    return "key";
    if (m == "launch_app")                           return "app";
    return m;
}

const std::vector<std::string>& CommandDispatcher::action_names() {
    static const std::vector<std::string> names = {
        "tap", "double_tap", "long_press", "swipe", "global", "app", "input", "clear",
        "key", "overlay_offset", "overlay_visible", "socket_port", "screenshot",
        "ping", "a11y_tree", "a11y_tree_full", "state", "state_full", "phone_state",
        "version", "packages",
    };
    return names;
}

// ---------------------------------------------------------------------------
// Param readers
// ---------------------------------------------------------------------------

int CommandDispatcher::int_param(const json& params, const char* key, int def) {
    if (!params.is_object() || !params.contains(key)) return def;
    return json_to_int(params[key]).value_or(def);
}

bool CommandDispatcher::bool_param(const json& params, const char* key, bool def) {
    if (!params.is_object() || !params.contains(key)) return def;
    const auto& v = params[key];
    if (v.is_boolean()) return v.get<bool>();
    if (v.is_number())  return v.get<double>() != 0.0;
    if (v.is_string()) {
        const auto s = lower(v.get<std::string>());
        if (s == "true" || s == "1")  return true;
        if (s == "false" || s == "0") return false;
    }
    return def;
}

std::string CommandDispatcher::string_param(const json& params, const char* key,
                                            const std::string& def) {
    if (!params.is_object() || !params.contains(key)) return def;
    const auto& v = params[key];
    if (v.is_string()) return v.get<std::string>();
    if (v.is_number() || v.is_boolean()) return v.dump();
    return def;
}

// ---------------------------------------------------------------------------
// Dispatch
// ---------------------------------------------------------------------------

ActionResult CommandDispatcher::dispatch(const std::string& action, const json& params) {
    const std::string method = normalize_action(action);
    const auto t0 = std::chrono::steady_clock::now();

    ActionResult result = action_err(ErrorCode::OperationFailed, "not dispatched");
    try {
        result = route(method, params);
    } catch (const std::exception& e) {
        result = action_err(ErrorCode::OperationFailed, std::string("Error executing ") + method + ": " + e.what());
    }

    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - t0).count();
    if (result.is_ok()) {
        PLOG_DEBUG("dispatch", "%s ok (%lld ms)", method.c_str(), (long long)ms);
    } else {
        PLOG_WARN("dispatch", "%s failed [%s]: %s (%lld ms)", method.c_str(),
                  errorCodeName(result.error().kind()), result.error().message.c_str(),
                  (long long)ms);
    }
    return result;
}

ActionResult CommandDispatcher::route(const std::string& method, const json& params) {
    if (method == "tap")             return handle_tap(params);
    if (method == "double_tap")      return handle_double_tap(params);
    if (method == "long_press")      return handle_long_press(params);
    if (method == "swipe")           return handle_swipe(params);
    if (method == "global")          return handle_global(params);
    if (method == "app")             return handle_app(params);
    if (method == "input")           return handle_input(params);
    if (method == "clear")           return handle_clear();
    if (method == "key")             return handle_key(params);
    if (method == "overlay_offset")  return handle_overlay_offset(params);
    if (method == "overlay_visible") return handle_overlay_visible(params);
    if (method == "socket_port")     return handle_socket_port(params);
    if (method == "screenshot")      return handle_screenshot(params);

    if (method == "ping")            return action_ok(json("pong"));
    if (method == "a11y_tree")       return handle_a11y_tree();
    if (method == "a11y_tree_full")  return handle_a11y_tree_full(params);
    if (method == "state")           return handle_state();
    if (method == "state_full")      return handle_state_full(params);
    if (method == "phone_state")     return handle_phone_state();
    if (method == "version")         return action_ok(json(gateway_.version()));
    if (method == "packages")        return handle_packages();

    return action_err(ErrorCode::UnknownAction, "Unknown method: " + method);
}

// ---------------------------------------------------------------------------
// Gesture / input handlers
// ---------------------------------------------------------------------------

ActionResult CommandDispatcher::handle_tap(const json& p) {
    const int x = int_param(p, "x", 0);
    const int y = int_param(p, "y", 0);
    return from_void(gateway_.tap(x, y),
                     "Tap performed at (" + std::to_string(x) + ", " + std::to_string(y) + ")");
}

ActionResult CommandDispatcher::handle_double_tap(const json& p) {
    const int x = int_param(p, "x", 0);
    const int y = int_param(p, "y", 0);
    return from_void(gateway_.double_tap(x, y),
                     "Double tap performed at (" + std::to_string(x) + ", " + std::to_string(y) + ")");
}

ActionResult CommandDispatcher::handle_long_press(const json& p) {
    const int x = int_param(p, "x", 0);
    const int y = int_param(p, "y", 0);
    const int duration = int_param(p, "duration", DEFAULT_LONG_PRESS_MS);
    return from_void(gateway_.long_press(x, y, duration),
                     "Long press performed at (" + std::to_string(x) + ", " + std::to_string(y) + ")");
}

ActionResult CommandDispatcher::handle_swipe(const json& p) {
    return from_void(gateway_.swipe(int_param(p, "startX", 0), int_param(p, "startY", 0),
                                    int_param(p, "endX", 0), int_param(p, "endY", 0),
                                    int_param(p, "duration", DEFAULT_SWIPE_MS)),
                     "Swipe performed");
}

ActionResult CommandDispatcher::handle_global(const json& p) {
    const int id = int_param(p, "action", 0);
    return from_void(gateway_.global_action(id), "Global action " + std::to_string(id) + " performed");
}

ActionResult CommandDispatcher::handle_app(const json& p) {
    const std::string pkg = string_param(p, "package");
    if (pkg.empty()) {
        return action_err(ErrorCode::MissingParameter, "Missing required param: 'package'");
    }
    std::optional<std::string> activity;
    const std::string act = string_param(p, "activity");
    if (!act.empty() && act != "null") activity = act;

    return from_void(gateway_.launch_app(pkg, activity), "Started app " + pkg);
}

ActionResult CommandDispatcher::handle_input(const json& p) {
    const std::string encoded = string_param(p, "base64_text");
    if (encoded.empty()) {
        return action_err(ErrorCode::MissingParameter, "Missing required param: 'base64_text'");
    }
    auto bytes = base64Decode(encoded);
    if (!bytes) {
        return action_err(ErrorCode::MalformedInput, "Invalid base64_text");
    }
    const bool clear = bool_param(p, "clear", true);
    const std::string text(bytes->begin(), bytes->end());
    return from_void(gateway_.input_text(text, clear),
                     std::string("input done (clear=") + (clear ? "true" : "false") + ")");
}

ActionResult CommandDispatcher::handle_clear() {
    return from_void(gateway_.clear_text(), "Text cleared");
}

ActionResult CommandDispatcher::handle_key(const json& p) {
    const int code = int_param(p, "key_code", 0);
    return from_void(gateway_.send_key(code), "Key event sent - code: " + std::to_string(code));
}

// ---------------------------------------------------------------------------
// Config passthrough
// ---------------------------------------------------------------------------

ActionResult CommandDispatcher::handle_overlay_offset(const json& p) {
    const int offset = int_param(p, "offset", 0);
    config_.set("overlay", "offset", offset);
    return action_ok(message("Overlay offset updated to " + std::to_string(offset)));
}

ActionResult CommandDispatcher::handle_overlay_visible(const json& p) {
    const bool visible = bool_param(p, "visible", true);
    config_.set("overlay", "visible", visible);
    return action_ok(message(std::string("Overlay visibility set to ") + (visible ? "true" : "false")));
}

ActionResult CommandDispatcher::handle_socket_port(const json& p) {
    const int port = int_param(p, "port", 0);
    if (port < 1 || port > 65535) {
        return action_err(ErrorCode::OperationFailed,
                          "Failed to update socket server port to " + std::to_string(port) +
                          " (bind failed or invalid)");
    }
    // HttpServer は ConfigChangedEvent を受けて再起動する
    config_.set("server", "http_port", port);
    return action_ok(message("Socket server port updated to " + std::to_string(port)));
}

ActionResult CommandDispatcher::handle_screenshot(const json& p) {
    auto png = gateway_.screenshot(bool_param(p, "hideOverlay", true));
    if (png.is_err()) return png.error();
    BinaryPayload payload;
    payload.bytes = std::move(png).value();
    payload.content_type = "image/png";
    return action_ok(std::move(payload));
}

// ---------------------------------------------------------------------------
// Queries
// ---------------------------------------------------------------------------

ActionResult CommandDispatcher::handle_a11y_tree() {
    auto tree = gateway_.snapshot_tree();
    if (tree.is_err()) return tree.error();
    const Rect screen = gateway_.screen_bounds();
    return action_ok(elements_to_json(compact(*tree.value(), screen)));
}

ActionResult CommandDispatcher::handle_a11y_tree_full(const json& p) {
    auto tree = gateway_.snapshot_tree();
    if (tree.is_err()) return tree.error();

    if (!bool_param(p, "filter", true)) {
        return action_ok(node_to_json(*tree.value()));
    }
    auto pruned = filter_visible(*tree.value(), gateway_.screen_bounds());
    if (!pruned) {
        return action_err(ErrorCode::OperationFailed, "No active window or root filtered out");
    }
    return action_ok(node_to_json(*pruned));
}

ActionResult CommandDispatcher::handle_state() {
    auto tree = gateway_.snapshot_tree();
    if (tree.is_err()) return tree.error();
    const Rect screen = gateway_.screen_bounds();

    json out;
    out["a11y_tree"] = elements_to_json(compact(*tree.value(), screen));
    out["phone_state"] = phone_state_to_json(gateway_.phone_state());
    return action_ok(std::move(out));
}

ActionResult CommandDispatcher::handle_state_full(const json& p) {
    auto tree = gateway_.snapshot_tree();
    if (tree.is_err()) return tree.error();
    const Rect screen = gateway_.screen_bounds();

    json out;
    if (bool_param(p, "filter", true)) {
        auto pruned = filter_visible(*tree.value(), screen);
        if (!pruned) {
            return action_err(ErrorCode::OperationFailed, "No active window or root filtered out");
        }
        out["a11y_tree"] = node_to_json(*pruned);
    } else {
        out["a11y_tree"] = node_to_json(*tree.value());
    }
    out["phone_state"] = phone_state_to_json(gateway_.phone_state());
    out["device_context"] = {
        {"screen_bounds", {{"width", screen.width()}, {"height", screen.height()}}},
    };
    return action_ok(std::move(out));
}

ActionResult CommandDispatcher::handle_phone_state() {
    return action_ok(phone_state_to_json(gateway_.phone_state()));
}

ActionResult CommandDispatcher::handle_packages() {
    return action_ok(packages_to_json(gateway_.packages()));
}

} // namespace portal
