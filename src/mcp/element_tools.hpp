#pragma once
// =============================================================================
// PortalBridge - Element-level MCP tools (android.element.*)
// =============================================================================
// Locate a node with ElementFinder, then act on its bounds through the same
// dispatcher actions as the coordinate tools. Successful actions wait for the
// UI to settle and attach the compacted screen as "screen_state".
// =============================================================================

#include <chrono>

#include "../command_dispatcher.hpp"
#include "../config_store.hpp"
#include "../element_finder.hpp"
#include "tool_registry.hpp"

namespace portal::mcp {

struct ElementToolOptions {
    std::chrono::milliseconds click_settle{400};   // click / long press / double tap
    std::chrono::milliseconds scroll_settle{500};  // scroll / drag
    std::chrono::milliseconds text_settle{300};    // set_text
    int drag_duration_ms = 500;
    int scroll_duration_ms = 300;

    // tools.settle_delays=false -> all settle delays 0
    static ElementToolOptions from_config(const config::ConfigStore& config);
    static ElementToolOptions no_delays();
};

// android.element.find / click / scroll / long_press / set_text / double_tap /
// drag / toggle_checkbox, and android.wait_for_element
void register_element_tools(ToolRegistry& registry, CommandDispatcher& dispatcher,
                            ElementFinder& finder, config::ConfigStore& config,
                            const ElementToolOptions& options);

} // namespace portal::mcp
