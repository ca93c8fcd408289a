// =============================================================================
// PortalBridge - Element-level MCP tools
// =============================================================================

#include "element_tools.hpp"

#include <memory>
#include <optional>
#include <thread>

#include "../portal_log.hpp"
#include "../wait_condition.hpp"
#include "device_tools.hpp"

using json = nlohmann::json;

namespace portal::mcp {

ElementToolOptions ElementToolOptions::from_config(const config::ConfigStore& config) {
    return config.settle_delays() ? ElementToolOptions{} : no_delays();
}

ElementToolOptions ElementToolOptions::no_delays() {
    ElementToolOptions o;
    o.click_settle = std::chrono::milliseconds(0);
    o.scroll_settle = std::chrono::milliseconds(0);
    o.text_settle = std::chrono::milliseconds(0);
    return o;
}

namespace {

const char* const NO_QUERY = "At least one search parameter is required";

json query_schema(json extra_props = json::object(), std::initializer_list<const char*> required = {}) {
    json schema = object_schema({
        {"resource_id", "string", "resource-id, full (com.app:id/name) or short (name)"},
        {"text", "string", "Text contained in the element (case-insensitive)"},
        {"content_description", "string", "Exact content-description"},
        {"class_name", "string", "Class name, e.g. android.widget.Button or Button"},
    }, required);
    for (auto it = extra_props.begin(); it != extra_props.end(); ++it) {
        schema["properties"][it.key()] = it.value();
    }
    return schema;
}

json prop(const char* type, const char* description) {
    return json{{"type", type}, {"description", description}};
}

class ElementTools {
public:
    ElementTools(CommandDispatcher& d, ElementFinder& f, config::ConfigStore& c,
                 const ElementToolOptions& o)
        : dispatcher_(d), finder_(f), config_(c), opt_(o) {}

    // 見つからなければ tool_error を error_out に入れて nullopt
    std::optional<ElementMatch> locate(const json& args, json& error_out) {
        auto q = ElementQuery::from_json(args);
        if (q.empty()) {
            error_out = tool_error(NO_QUERY);
            return std::nullopt;
        }
        auto m = finder_.find(q);
        if (m.is_err()) {
            error_out = tool_error(m.error().message);
            return std::nullopt;
        }
        return std::move(m).value();
    }

    json settled(std::chrono::milliseconds delay, json fields) {
        if (delay.count() > 0) std::this_thread::sleep_for(delay);
        auto text = screen_text(dispatcher_.gateway());
        if (text.is_ok()) {
            fields["screen_state"] = text.value();
        } else {
            PLOG_DEBUG("mcp", "screen_state unavailable: %s", text.error().message.c_str());
        }
        return tool_success(std::move(fields));
    }

    json find(const json& args) {
        json err;
        auto m = locate(args, err);
        if (!m) return err;
        return tool_success({{"element", ElementFinder::match_to_json(**m)},
                             {"matched_by", m->matched_by}});
    }

    json click(const json& args) {
        json err;
        auto m = locate(args, err);
        if (!m) return err;
        if (!(*m)->enabled) return tool_error("Element is not enabled");

        const auto& b = (*m)->bounds;
        auto r = dispatcher_.dispatch("tap", {{"x", b.center_x()}, {"y", b.center_y()}});
        if (r.is_err()) return tool_error("Failed to perform click action: " + r.error().message);
        return settled(opt_.click_settle, {{"message", "Element clicked successfully"}});
    }

    json long_press(const json& args) {
        json err;
        auto m = locate(args, err);
        if (!m) return err;

        const auto& b = (*m)->bounds;
        const int duration = arg_int(args, "duration").value_or(DEFAULT_LONG_PRESS_MS);
        auto r = dispatcher_.dispatch("long_press",
                                      {{"x", b.center_x()}, {"y", b.center_y()}, {"duration", duration}});
        if (r.is_err()) return tool_error("Failed to long press element: " + r.error().message);
        return settled(opt_.click_settle, {{"message", "Element long pressed successfully"}});
    }

    json double_tap(const json& args) {
        json err;
        auto m = locate(args, err);
        if (!m) return err;

        const auto& b = (*m)->bounds;
        auto r = dispatcher_.dispatch("double_tap", {{"x", b.center_x()}, {"y", b.center_y()}});
        if (r.is_err()) return tool_error("Failed to double tap element: " + r.error().message);
        return settled(opt_.click_settle, {{"message", "Element double tapped successfully"}});
    }

    json scroll(const json& args) {
        const std::string direction = arg_string(args, "direction").value_or("forward");
        if (direction != "forward" && direction != "backward") {
            return tool_error("direction must be 'forward' or 'backward'");
        }
        json err;
        auto m = locate(args, err);
        if (!m) return err;
        if (!(*m)->scrollable) return tool_error("Element is not scrollable");

        // 要素内で縦方向にスワイプ (forward = 指を上へ)
        const auto& b = (*m)->bounds;
        const int x = b.center_x();
        const int near_top = static_cast<int>(b.top + b.height64() / 4);
        const int near_bottom = static_cast<int>(b.top + b.height64() * 3 / 4);
        const bool forward = direction == "forward";
        auto r = dispatcher_.dispatch("swipe", {
            {"startX", x}, {"startY", forward ? near_bottom : near_top},
            {"endX", x},   {"endY", forward ? near_top : near_bottom},
            {"duration", opt_.scroll_duration_ms},
        });
        if (r.is_err()) return tool_error("Failed to scroll element: " + r.error().message);
        return settled(opt_.scroll_settle, {{"message", "Element scrolled " + direction + " successfully"}});
    }

    json set_text(const json& args) {
        auto text = arg_string(args, "input");
        if (!text) text = arg_string(args, "value");
        if (!text) return tool_error("Missing required parameter: input");

        json err;
        auto m = locate(args, err);
        if (!m) return err;
        if (!(*m)->editable) return tool_error("Element is not editable");

        FocusedNode target;
        target.resource_id = (*m)->resource_id;
        target.text = (*m)->text;
        target.bounds = (*m)->bounds;
        auto r = dispatcher_.gateway().set_text(target, *text);
        if (r.is_err()) return tool_error("Failed to set text: " + r.error().message);
        return settled(opt_.text_settle, {{"message", "Text set successfully"}});
    }

    json drag(const json& args) {
        auto tx = arg_int(args, "target_x");
        auto ty = arg_int(args, "target_y");
        if (!tx) return tool_error("Missing required parameter: target_x");
        if (!ty) return tool_error("Missing required parameter: target_y");

        json err;
        auto m = locate(args, err);
        if (!m) return err;

        const int sx = (*m)->bounds.center_x();
        const int sy = (*m)->bounds.center_y();
        auto r = dispatcher_.dispatch("swipe", {{"startX", sx}, {"startY", sy},
                                                {"endX", *tx}, {"endY", *ty},
                                                {"duration", opt_.drag_duration_ms}});
        if (r.is_err()) return tool_error(r.error().message);
        return settled(opt_.scroll_settle, {{"message",
            "Element dragged successfully from (" + std::to_string(sx) + "," + std::to_string(sy) +
            ") to (" + std::to_string(*tx) + "," + std::to_string(*ty) + ")"}});
    }

    json toggle_checkbox(const json& args) {
        json err;
        auto m = locate(args, err);
        if (!m) return err;
        if (!(*m)->checkable) return tool_error("Element is not checkable");

        const bool current = (*m)->checked;
        bool wanted = !current;
        if (args.is_object() && args.contains("checked") && args["checked"].is_boolean()) {
            wanted = args["checked"].get<bool>();
        }
        if (wanted == current) {
            return tool_success({{"message", "Checkbox already in requested state"},
                                 {"checked", current}, {"changed", false}});
        }

        const auto& b = (*m)->bounds;
        auto r = dispatcher_.dispatch("tap", {{"x", b.center_x()}, {"y", b.center_y()}});
        if (r.is_err()) return tool_error("Failed to toggle checkbox: " + r.error().message);
        return settled(opt_.click_settle, {{"message", "Checkbox toggled"},
                                           {"checked", wanted}, {"changed", true}});
    }

    json wait_for_element(const json& args) {
        auto q = ElementQuery::from_json(args);
        if (q.empty()) return tool_error(NO_QUERY);

        WaitOptions wo;
        wo.max_wait = std::chrono::milliseconds(
            arg_int(args, "timeout_ms").value_or(config_.wait_max_ms()));
        wo.interval = std::chrono::milliseconds(
            arg_int(args, "interval_ms").value_or(config_.wait_poll_interval_ms()));

        std::optional<ElementMatch> found;
        const auto t0 = std::chrono::steady_clock::now();
        auto r = wait_for_condition([&] {
            auto m = finder_.find(q);
            if (m.is_err()) return false;
            found = std::move(m).value();
            return true;
        }, wo);
        const auto waited = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - t0).count();

        if (r.is_err() || !found) {
            return tool_error("Timed out after " + std::to_string(wo.max_wait.count()) +
                              " ms waiting for element (" + q.describe() + ")");
        }
        return tool_success({{"element", ElementFinder::match_to_json(**found)},
                             {"matched_by", found->matched_by},
                             {"waited_ms", waited}});
    }

private:
    CommandDispatcher& dispatcher_;
    ElementFinder& finder_;
    config::ConfigStore& config_;
    ElementToolOptions opt_;
};

} // namespace

void register_element_tools(ToolRegistry& registry, CommandDispatcher& dispatcher,
                            ElementFinder& finder, config::ConfigStore& config,
                            const ElementToolOptions& options) {
    // ツール群が共有する状態。registry の寿命に合わせて保持する
    auto tools = std::make_shared<ElementTools>(dispatcher, finder, config, options);

    registry.add({"android.element.find",
                  "Find an element by resource-id, text, content-description or class name "
                  "(tried in that order) and return its properties and bounds.",
                  query_schema(json{{"exact", prop("boolean", "Exact text match (default false)")}})},
                 [tools](const json& a) { return tools->find(a); });

    registry.add({"android.element.click",
                  "Locate an element and tap its center. Returns the screen afterwards.",
                  query_schema()},
                 [tools](const json& a) { return tools->click(a); });

    registry.add({"android.element.scroll",
                  "Scroll a scrollable element forward (down/right) or backward (up/left).",
                  query_schema(json{{"direction", prop("string", "forward (default) | backward")}})},
                 [tools](const json& a) { return tools->scroll(a); });

    registry.add({"android.element.long_press",
                  "Locate an element and long press its center.",
                  query_schema(json{{"duration", prop("integer", "Hold time in ms (default 1000)")}})},
                 [tools](const json& a) { return tools->long_press(a); });

    registry.add({"android.element.set_text",
                  "Locate an editable element and replace its text.",
                  query_schema(json{{"input", prop("string", "Text to set")}}, {"input"})},
                 [tools](const json& a) { return tools->set_text(a); });

    registry.add({"android.element.double_tap",
                  "Locate an element and double tap its center.",
                  query_schema()},
                 [tools](const json& a) { return tools->double_tap(a); });

    registry.add({"android.element.drag",
                  "Drag an element from its center to the target coordinates.",
                  query_schema(json{{"target_x", prop("integer", "Target X")},
                                    {"target_y", prop("integer", "Target Y")}},
                               {"target_x", "target_y"})},
                 [tools](const json& a) { return tools->drag(a); });

    registry.add({"android.element.toggle_checkbox",
                  "Toggle a checkable element, or set it to the given state.",
                  query_schema(json{{"checked", prop("boolean", "Desired state (default: flip)")}})},
                 [tools](const json& a) { return tools->toggle_checkbox(a); });

    registry.add({"android.wait_for_element",
                  "Poll until an element matching the query appears, or time out.",
                  query_schema(json{{"timeout_ms", prop("integer", "Maximum wait in ms")},
                                    {"interval_ms", prop("integer", "Poll interval in ms")}})},
                 [tools](const json& a) { return tools->wait_for_element(a); });

    PLOG_DEBUG("mcp", "Element tools registered (%zu total)", registry.size());
}

} // namespace portal::mcp
