// =============================================================================
// PortalBridge - Tree / state JSON codec
// =============================================================================

#include "tree_json.hpp"
#include "json_number.hpp"

#include <stdexcept>
#include <string>

namespace portal {

using nlohmann::json;

json rect_to_json(const Rect& r) {
    return json{{"left", r.left}, {"top", r.top}, {"right", r.right}, {"bottom", r.bottom}};
}

json node_to_json(const RawNode& node) {
    json j;
    j["text"]               = node.text;
    j["contentDescription"] = node.content_description;
    j["resourceId"]         = node.resource_id;
    j["className"]          = node.class_name;
    j["packageName"]        = node.package_name;
    j["boundsInScreen"]     = rect_to_json(node.bounds);
    j["isClickable"]        = node.clickable;
    j["isLongClickable"]    = node.long_clickable;
    j["isEditable"]         = node.editable;
    j["isFocused"]          = node.focused;
    j["isSelected"]         = node.selected;
    j["isChecked"]          = node.checked;
    j["isCheckable"]        = node.checkable;
    j["isScrollable"]       = node.scrollable;
    j["isFocusable"]        = node.focusable;
    j["isEnabled"]          = node.enabled;

    json children = json::array();
    for (const auto& c : node.children) children.push_back(node_to_json(c));
    j["children"] = std::move(children);
    return j;
}

namespace {

int rect_edge(const json& j, const char* key) {
    if (!j.contains(key)) return 0;
    const auto& v = j[key];
    if (!v.is_number()) throw std::invalid_argument(std::string("bounds.") + key + " must be a number");
    auto n = json_to_int(v);
    if (!n) throw std::invalid_argument(std::string("bounds.") + key + " is NaN");
    return *n;
}

// 例外は呼び出し側 (node_from_json) で Result に変換
Rect parse_rect(const json& j) {
    Rect r;
    if (j.is_object()) {
        r.left   = rect_edge(j, "left");
        r.top    = rect_edge(j, "top");
        r.right  = rect_edge(j, "right");
        r.bottom = rect_edge(j, "bottom");
    } else if (j.is_string()) {
        // "l, t, r, b"
        const auto s = j.get<std::string>();
        int e[4];
        size_t start = 0;
        for (int i = 0; i < 4; ++i) {
            const size_t comma = s.find(',', start);
            if ((i < 3) != (comma != std::string::npos)) throw std::invalid_argument("bad bounds string: " + s);
            auto v = parse_int(s.substr(start, comma == std::string::npos ? std::string::npos : comma - start));
            if (!v) throw std::invalid_argument("bad bounds string: " + s);
            e[i] = *v;
            start = comma + 1;
        }
        r = Rect{e[0], e[1], e[2], e[3]};
    } else {
        throw std::invalid_argument("bounds must be an object or string");
    }
    return r;
}

RawNode parse_node(const json& j, int depth) {
    if (!j.is_object()) throw std::invalid_argument("node must be an object");
    if (depth > 512) throw std::invalid_argument("tree too deep");

    RawNode n;
    n.text                = j.value("text", std::string());
    n.content_description = j.value("contentDescription", std::string());
    n.resource_id         = j.value("resourceId", std::string());
    n.class_name          = j.value("className", std::string());
    n.package_name        = j.value("packageName", std::string());

    if (j.contains("boundsInScreen")) {
        n.bounds = parse_rect(j["boundsInScreen"]);
    } else if (j.contains("bounds")) {
        n.bounds = parse_rect(j["bounds"]);
    }

    n.clickable      = j.value("isClickable", false);
    n.long_clickable = j.value("isLongClickable", false);
    n.editable       = j.value("isEditable", false);
    n.focused        = j.value("isFocused", false);
    n.selected       = j.value("isSelected", false);
    n.checked        = j.value("isChecked", false);
    n.checkable      = j.value("isCheckable", false);
    n.scrollable     = j.value("isScrollable", false);
    n.focusable      = j.value("isFocusable", false);
    n.enabled        = j.value("isEnabled", true);

    if (j.contains("children")) {
        const auto& arr = j["children"];
        if (!arr.is_array()) throw std::invalid_argument("children must be an array");
        n.children.reserve(arr.size());
        for (const auto& c : arr) n.children.push_back(parse_node(c, depth + 1));
    }
    return n;
}

} // namespace

Result<RawNode> node_from_json(const json& j) {
    try {
        return parse_node(j, 0);
    } catch (const json::exception& e) {
        return Err<RawNode>(ErrorCode::MalformedInput, std::string("tree JSON: ") + e.what());
    } catch (const std::invalid_argument& e) {
        return Err<RawNode>(ErrorCode::MalformedInput, std::string("tree JSON: ") + e.what());
    }
}

json phone_state_to_json(const PhoneState& state) {
    json j;
    j["currentApp"]      = state.current_app;
    j["packageName"]     = state.package_name;
    j["activityName"]    = state.activity_name;
    j["keyboardVisible"] = state.keyboard_visible;
    j["isEditable"]      = state.is_editable;
    if (state.focused_element) {
        j["focusedElement"] = {
            {"text", state.focused_element->text},
            {"resourceId", state.focused_element->resource_id},
        };
    } else {
        j["focusedElement"] = nullptr;
    }
    return j;
}

Result<PhoneState> phone_state_from_json(const json& j) {
    if (!j.is_object()) {
        return Err<PhoneState>(ErrorCode::MalformedInput, "phone_state must be an object");
    }
    try {
        PhoneState s;
        s.current_app      = j.value("currentApp", std::string());
        s.package_name     = j.value("packageName", std::string());
        s.activity_name    = j.value("activityName", std::string());
        s.keyboard_visible = j.value("keyboardVisible", false);
        s.is_editable      = j.value("isEditable", false);
        if (j.contains("focusedElement") && j["focusedElement"].is_object()) {
            const auto& f = j["focusedElement"];
            FocusedNode node;
            // text は null のこともある
            if (f.contains("text") && f["text"].is_string()) node.text = f["text"].get<std::string>();
            node.resource_id = f.value("resourceId", std::string());
            s.focused_element = node;
        }
        return s;
    } catch (const json::exception& e) {
        return Err<PhoneState>(ErrorCode::MalformedInput, std::string("phone_state JSON: ") + e.what());
    }
}

json package_to_json(const PackageInfo& pkg) {
    return json{
        {"packageName", pkg.package_name},
        {"label", pkg.label},
        {"versionName", pkg.version_name},
        {"versionCode", pkg.version_code},
        {"isSystemApp", pkg.is_system_app},
    };
}

json packages_to_json(const std::vector<PackageInfo>& pkgs) {
    json arr = json::array();
    for (const auto& p : pkgs) arr.push_back(package_to_json(p));
    return json{{"count", pkgs.size()}, {"packages", std::move(arr)}};
}

json element_to_json(const CompactElement& e) {
    return json{
        {"text", e.display_text},
        {"bounds", std::to_string(e.x) + "," + std::to_string(e.y) + "," +
                   std::to_string(e.w) + "," + std::to_string(e.h)},
        {"resourceId", e.resource_id},
        {"className", e.short_class_name},
        {"flags", e.flags},
    };
}

json elements_to_json(const std::vector<CompactElement>& elems) {
    json arr = json::array();
    for (const auto& e : elems) arr.push_back(element_to_json(e));
    return arr;
}

} // namespace portal
