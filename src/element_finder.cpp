// =============================================================================
// PortalBridge - ElementFinder Implementation
// =============================================================================

#include "element_finder.hpp"

#include <algorithm>
#include <cctype>
#include <functional>
#include <vector>

#include "portal_log.hpp"
#include "tree_compactor.hpp"

namespace portal {

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

const RawNode* find_first(const RawNode& node, const std::function<bool(const RawNode&)>& pred) {
    if (pred(node)) return &node;
    for (const auto& c : node.children) {
        if (const RawNode* hit = find_first(c, pred)) return hit;
    }
    return nullptr;
}

std::string root_package(const RawNode& root) {
    if (!root.package_name.empty()) return root.package_name;
    const RawNode* n = find_first(root, [](const RawNode& x) { return !x.package_name.empty(); });
    return n ? n->package_name : std::string();
}

std::string json_str(const nlohmann::json& j, const char* key) {
    if (j.is_object() && j.contains(key) && j[key].is_string()) return j[key].get<std::string>();
    return {};
}

} // namespace

ElementQuery ElementQuery::from_json(const nlohmann::json& args) {
    ElementQuery q;
    q.resource_id = json_str(args, "resource_id");
    q.text = json_str(args, "text");
    q.content_description = json_str(args, "content_description");
    q.class_name = json_str(args, "class_name");
    if (args.is_object() && args.contains("exact") && args["exact"].is_boolean()) {
        q.exact_text = args["exact"].get<bool>();
    }
    return q;
}

std::string ElementQuery::describe() const {
    std::string s;
    auto add = [&s](const char* k, const std::string& v) {
        if (v.empty()) return;
        if (!s.empty()) s += ", ";
        s += k;
        s += "=";
        s += v;
    };
    add("resource_id", resource_id);
    add("text", text);
    add("content_description", content_description);
    add("class_name", class_name);
    return s;
}

ElementFinder::ElementFinder(DeviceGateway& gateway) : gateway_(gateway) {}

const RawNode* ElementFinder::find_in(const RawNode& root, const ElementQuery& q,
                                      std::string* matched_by) {
    auto hit = [matched_by](const RawNode* n, const char* how) {
        if (n && matched_by) *matched_by = how;
        return n;
    };

    if (!q.resource_id.empty()) {
        std::vector<std::string> ids{q.resource_id};
        if (q.resource_id.find(':') == std::string::npos) {
            const auto pkg = root_package(root);
            if (!pkg.empty()) ids.push_back(pkg + ":id/" + short_resource_id(q.resource_id));
        }
        for (const auto& id : ids) {
            const RawNode* n = find_first(root, [&id](const RawNode& x) { return x.resource_id == id; });
            if (n) return hit(n, "resource_id");
        }
    }

    if (!q.text.empty()) {
        const RawNode* n = nullptr;
        if (q.exact_text) {
            n = find_first(root, [&q](const RawNode& x) { return x.text == q.text; });
        } else {
            const auto needle = to_lower(q.text);
            n = find_first(root, [&needle](const RawNode& x) {
                return to_lower(x.text).find(needle) != std::string::npos ||
                       to_lower(x.content_description).find(needle) != std::string::npos;
            });
        }
        if (n) return hit(n, "text");
    }

    if (!q.content_description.empty()) {
        const RawNode* n = find_first(root, [&q](const RawNode& x) {
            return x.content_description == q.content_description;
        });
        if (n) return hit(n, "content_description");
    }

    if (!q.class_name.empty()) {
        const bool qualified = q.class_name.find('.') != std::string::npos;
        const RawNode* n = find_first(root, [&q, qualified](const RawNode& x) {
            return qualified ? x.class_name == q.class_name
                             : short_class_name(x.class_name) == q.class_name;
        });
        if (n) return hit(n, "class_name");
    }

    return nullptr;
}

Result<ElementMatch> ElementFinder::find(const ElementQuery& query) {
    if (query.empty()) {
        return Err<ElementMatch>(ErrorCode::MissingParameter, "At least one search parameter is required");
    }

    auto snap = gateway_.snapshot_tree();
    if (snap.is_err()) return snap.error();

    ElementMatch m;
    m.snapshot = std::move(snap).value();
    m.node = find_in(*m.snapshot, query, &m.matched_by);
    if (!m.node) {
        PLOG_DEBUG("finder", "Element not found (%s)", query.describe().c_str());
        return Err<ElementMatch>(ErrorCode::OperationFailed, "Element not found");
    }
    PLOG_DEBUG("finder", "Found element by %s (%s)", m.matched_by.c_str(), query.describe().c_str());
    return m;
}

nlohmann::json ElementFinder::match_to_json(const RawNode& n) {
    return nlohmann::json{
        {"resource_id", n.resource_id},
        {"text", n.text},
        {"content_description", n.content_description},
        {"class_name", n.class_name},
        {"bounds", {
            {"left", n.bounds.left}, {"top", n.bounds.top},
            {"right", n.bounds.right}, {"bottom", n.bounds.bottom},
            {"centerX", n.bounds.center_x()}, {"centerY", n.bounds.center_y()},
        }},
        {"clickable", n.clickable},
        {"long_clickable", n.long_clickable},
        {"scrollable", n.scrollable},
        {"checkable", n.checkable},
        {"checked", n.checked},
        {"editable", n.editable},
        {"enabled", n.enabled},
        {"focusable", n.focusable},
        {"focused", n.focused},
    };
}

} // namespace portal
