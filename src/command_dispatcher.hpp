#pragma once
// =============================================================================
// PortalBridge - CommandDispatcher
// =============================================================================
// Single entry point for every device action, shared by the HTTP adapter,
// the MCP tools and the reverse connection.
//
//   dispatch("tap", {"x": 540, "y": 960})          -> {"message": "Tap performed at (540, 960)"}
//   dispatch("/action/screenshot", {})             -> BinaryPayload (PNG)
//   dispatch("keyboard/input", {"base64_text": ..})-> {"message": "input done (clear=true)"}
//
// Action names are normalized first: "/action/tap", "action.tap" and "/tap"
// all reach "tap". dispatch() never throws.
// =============================================================================

#include <string>
#include <vector>

#include "nlohmann/json.hpp"
#include "action_result.hpp"
#include "config_store.hpp"
#include "device_gateway.hpp"

namespace portal {

class CommandDispatcher {
public:
    CommandDispatcher(DeviceGateway& gateway, config::ConfigStore& config);

    CommandDispatcher(const CommandDispatcher&) = delete;
    CommandDispatcher& operator=(const CommandDispatcher&) = delete;

    ActionResult dispatch(const std::string& action, const nlohmann::json& params);

    // Prefix stripping + alias resolution
    static std::string normalize_action(const std::string& action);
    static const std::vector<std::string>& action_names();

    // --- permissive param readers (numbers, numeric strings, bool strings) ---
    static int int_param(const nlohmann::json& params, const char* key, int def);
    static bool bool_param(const nlohmann::json& params, const char* key, bool def);
    static std::string string_param(const nlohmann::json& params, const char* key,
                                    const std::string& def = "");

    DeviceGateway& gateway() { return gateway_; }

private:
    ActionResult route(const std::string& method, const nlohmann::json& params);

    // --- gesture / input handlers ---
    ActionResult handle_tap(const nlohmann::json& p);
    ActionResult handle_double_tap(const nlohmann::json& p);
    ActionResult handle_long_press(const nlohmann::json& p);
    ActionResult handle_swipe(const nlohmann::json& p);
    ActionResult handle_global(const nlohmann::json& p);
    ActionResult handle_app(const nlohmann::json& p);
    ActionResult handle_input(const nlohmann::json& p);
    ActionResult handle_clear();
    ActionResult handle_key(const nlohmann::json& p);

    // --- config passthrough ---
    ActionResult handle_overlay_offset(const nlohmann::json& p);
    ActionResult handle_overlay_visible(const nlohmann::json& p);
    ActionResult handle_socket_port(const nlohmann::json& p);

    ActionResult handle_screenshot(const nlohmann::json& p);

    // --- queries ---
    ActionResult handle_a11y_tree();
    ActionResult handle_a11y_tree_full(const nlohmann::json& p);
    ActionResult handle_state();
    ActionResult handle_state_full(const nlohmann::json& p);
    ActionResult handle_phone_state();
    ActionResult handle_packages();

    DeviceGateway& gateway_;
    config::ConfigStore& config_;
};

} // namespace portal
