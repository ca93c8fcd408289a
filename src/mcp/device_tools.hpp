#pragma once
// =============================================================================
// PortalBridge - Coordinate-level MCP tools (android.*)
// =============================================================================
// Thin adapters over CommandDispatcher. Unlike the HTTP surface these require
// their coordinates / text: a missing argument is a tool-level error.
// =============================================================================

#include <string>

#include "nlohmann/json.hpp"
#include "../command_dispatcher.hpp"
#include "tool_registry.hpp"

namespace portal::mcp {

// android.screen.dump, android.packages.list, android.launch_app,
// android.text.input, android.input.clear, android.key.send, android.tap,
// android.double_tap, android.long_press, android.swipe
void register_device_tools(ToolRegistry& registry, CommandDispatcher& dispatcher);

// Compacted text of the current screen (phone state + elements), used by
// android.screen.dump and by the element tools' screen_state.
Result<std::string> screen_text(DeviceGateway& gateway, bool filter = true);

} // namespace portal::mcp
