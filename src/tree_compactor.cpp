// =============================================================================
// PortalBridge - TreeCompactor Implementation
// =============================================================================

#include "tree_compactor.hpp"

#include <sstream>

#include "portal_log.hpp"
#include "tree_json.hpp"

namespace portal {

using nlohmann::json;

namespace {

const char* const CONTAINER_NAMES[] = {
    "FrameLayout", "View", "LinearLayout", "ViewPager", "RecyclerView", "ViewGroup",
};

bool is_continuation(unsigned char c) { return (c & 0xC0) == 0x80; }

bool is_kept(const RawNode& n) {
    if (is_meaningful_text(n.text)) return true;
    if (!n.content_description.empty()) return true;
    if (!n.resource_id.empty()) return true;
    return n.clickable || n.focusable || n.checkable || n.editable;
}

CompactElement make_element(const RawNode& n) {
    CompactElement e;
    e.display_text = truncate_text(n.text.empty() ? n.content_description : n.text);
    e.x = n.bounds.left;
    e.y = n.bounds.top;
    e.w = n.bounds.width();
    e.h = n.bounds.height();
    e.resource_id = n.resource_id;
    e.short_class_name = short_class_name(n.class_name);
    e.flags = flags_of(n);
    return e;
}

// pre-order; 上限に達したら以降は辿らない
void collect(const RawNode& n, std::vector<CompactElement>& out) {
    if (out.size() >= COMPACT_MAX_ELEMENTS) return;
    if (is_kept(n)) out.push_back(make_element(n));
    for (const auto& c : n.children) {
        if (out.size() >= COMPACT_MAX_ELEMENTS) return;
        collect(c, out);
    }
}

// 子を先に処理し、生き残った子孫がいれば親も残す
std::optional<RawNode> prune(const RawNode& n, const Rect& screen) {
    std::vector<RawNode> kept_children;
    for (const auto& c : n.children) {
        auto pc = prune(c, screen);
        if (pc) kept_children.push_back(std::move(*pc));
    }
    if (kept_children.empty() && visible_fraction(n.bounds, screen) < VISIBILITY_MIN_FRACTION) {
        return std::nullopt;
    }

    RawNode copy;
    copy.text = n.text;
    copy.content_description = n.content_description;
    copy.resource_id = n.resource_id;
    copy.class_name = n.class_name;
    copy.package_name = n.package_name;
    copy.bounds = n.bounds;
    copy.clickable = n.clickable;
    copy.long_clickable = n.long_clickable;
    copy.editable = n.editable;
    copy.focused = n.focused;
    copy.selected = n.selected;
    copy.checked = n.checked;
    copy.checkable = n.checkable;
    copy.scrollable = n.scrollable;
    copy.focusable = n.focusable;
    copy.enabled = n.enabled;
    copy.children = std::move(kept_children);
    return copy;
}

} // namespace

// =============================================================================
// Helpers
// =============================================================================

size_t utf8_length(const std::string& s) {
    size_t n = 0;
    for (unsigned char c : s) {
        if (!is_continuation(c)) ++n;
    }
    return n;
}

std::string truncate_text(const std::string& s, size_t max_chars) {
    size_t count = 0;
    for (size_t i = 0; i < s.size(); ++i) {
        if (is_continuation(static_cast<unsigned char>(s[i]))) continue;
        if (count == max_chars) {
            return s.substr(0, i) + "\xE2\x80\xA6";  // U+2026
        }
        ++count;
    }
    return s;
}

bool is_meaningful_text(const std::string& text) {
    if (text.empty()) return false;
    for (const char* name : CONTAINER_NAMES) {
        if (text == name) return false;
    }
    if (text.size() <= 2) {
        bool all_symbol = true;
        for (char c : text) {
            if (c != '|' && c != '-' && c != '_' && c != '=' && c != '~') {
                all_symbol = false;
                break;
            }
        }
        if (all_symbol) return false;
    }
    return true;
}

std::string short_class_name(const std::string& class_name) {
    auto pos = class_name.rfind('.');
    return pos == std::string::npos ? class_name : class_name.substr(pos + 1);
}

std::string short_resource_id(const std::string& resource_id) {
    auto pos = resource_id.rfind('/');
    return pos == std::string::npos ? resource_id : resource_id.substr(pos + 1);
}

std::string flags_of(const RawNode& n) {
    std::string f;
    if (n.clickable)      f += 'c';
    if (n.long_clickable) f += 'l';
    if (n.editable)       f += 'e';
    if (n.focused)        f += 'f';
    if (n.selected)       f += 's';
    if (n.checked)        f += 'k';
    return f;
}

double visible_fraction(const Rect& node, const Rect& screen) {
    const int64_t total = node.area();
    if (total == 0) return 0.0;
    if (node.contains(screen) && screen.area() > 0) return 1.0;
    return static_cast<double>(node.intersect(screen).area()) / static_cast<double>(total);
}

// =============================================================================
// Compaction
// =============================================================================

std::vector<CompactElement> compact(const RawNode& root, const std::optional<Rect>& screen) {
    std::vector<CompactElement> out;
    if (screen) {
        auto pruned = filter_visible(root, *screen);
        if (!pruned) return out;
        collect(*pruned, out);
    } else {
        collect(root, out);
    }
    return out;
}

std::optional<RawNode> filter_visible(const RawNode& root, const Rect& screen) {
    return prune(root, screen);
}

std::string render_text(const std::vector<CompactElement>& elements,
                        const std::optional<PhoneState>& phone,
                        const std::optional<Rect>& screen) {
    std::ostringstream out;

    if (phone) {
        out << "[Phone State]\n";
        if (!phone->current_app.empty())   out << "App: " << phone->current_app << "\n";
        if (!phone->package_name.empty())  out << "Package: " << phone->package_name << "\n";
        if (!phone->activity_name.empty()) out << "Activity: " << phone->activity_name << "\n";
        out << "Keyboard: " << (phone->keyboard_visible ? "visible" : "hidden") << "\n";
        out << "Editable: " << (phone->is_editable ? "yes" : "no") << "\n";
        if (phone->focused_element) {
            const auto& f = *phone->focused_element;
            if (!f.text.empty() || !f.resource_id.empty()) {
                out << "Focused:";
                if (!f.text.empty()) out << " " << f.text;
                if (!f.resource_id.empty()) out << " #" << short_resource_id(f.resource_id);
                out << "\n";
            }
        }
    }

    if (screen && screen->area() > 0) {
        out << "Screen: " << screen->width() << "x" << screen->height() << "\n";
    }
    if (phone || screen) out << "\n";

    out << "[Interactive Elements]\n";
    if (elements.empty()) {
        out << "(no interactive elements)\n";
        return out.str();
    }

    size_t i = 0;
    for (const auto& e : elements) {
        out << ++i << ".";
        if (!e.short_class_name.empty()) out << " [" << e.short_class_name << "]";
        if (!e.display_text.empty()) out << " " << e.display_text;
        out << " @" << e.x << "," << e.y << "," << e.w << "," << e.h;
        if (!e.resource_id.empty()) out << " #" << short_resource_id(e.resource_id);
        if (!e.flags.empty()) out << " " << e.flags;
        out << "\n";
    }
    out << "Total: " << elements.size() << " elements\n";
    return out.str();
}

nlohmann::json compact_wire(const std::string& source_json) {
    json doc;
    try {
        doc = json::parse(source_json);
    } catch (const json::exception& e) {
        return json{{"success", false}, {"error", std::string("invalid JSON: ") + e.what()}};
    }

    // {"a11y_tree": ..., "phone_state": ...} / [root, ...] / root
    std::optional<PhoneState> phone;
    json roots = json::array();
    if (doc.is_object() && doc.contains("a11y_tree")) {
        const auto& t = doc["a11y_tree"];
        if (t.is_array()) roots = t;
        else roots.push_back(t);
        if (doc.contains("phone_state")) {
            auto ps = phone_state_from_json(doc["phone_state"]);
            if (ps.is_err()) {
                return json{{"success", false}, {"error", ps.error().message}};
            }
            phone = std::move(ps).value();
        }
    } else if (doc.is_array()) {
        roots = doc;
    } else if (doc.is_object()) {
        roots.push_back(doc);
    } else {
        return json{{"success", false}, {"error", "tree JSON must be an object or array"}};
    }

    std::vector<CompactElement> elements;
    for (const auto& r : roots) {
        if (elements.size() >= COMPACT_MAX_ELEMENTS) break;
        auto node = node_from_json(r);
        if (node.is_err()) {
            return json{{"success", false}, {"error", node.error().message}};
        }
        for (auto& e : compact(node.value())) {
            if (elements.size() >= COMPACT_MAX_ELEMENTS) break;
            elements.push_back(std::move(e));
        }
    }

    PLOG_DEBUG("compactor", "wire: %zu bytes -> %zu elements", source_json.size(), elements.size());
    return json{
        {"success", true},
        {"elements", elements_to_json(elements)},
        {"text", render_text(elements, phone)},
    };
}

} // namespace portal
