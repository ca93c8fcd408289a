#pragma once
// =============================================================================
// PortalBridge - TreeCompactor
// =============================================================================
// Reduces a raw accessibility tree to a bounded list of meaningful elements
// (at most 100) so it fits in a remote model's context.
//
//   auto elems = compact(*snapshot, gateway.screen_bounds());
//   std::string text = render_text(elems, gateway.phone_state(), screen);
//
// All functions are pure: the input tree is never mutated and the same input
// always yields the same output.
// =============================================================================

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"
#include "device_automation.hpp"

namespace portal {

constexpr size_t COMPACT_MAX_ELEMENTS   = 100;
constexpr size_t COMPACT_MAX_TEXT_CHARS = 80;
constexpr double VISIBILITY_MIN_FRACTION = 0.01;

struct CompactElement {
    std::string display_text;
    int x = 0;
    int y = 0;
    int w = 0;
    int h = 0;
    std::string resource_id;
    std::string short_class_name;
    std::string flags;  // "clefsk" の順 (該当するもののみ)
};

// --- helpers (exposed for tests) ---

// Code-point aware truncation: over-long text becomes max_chars code points + "…"
std::string truncate_text(const std::string& s, size_t max_chars = COMPACT_MAX_TEXT_CHARS);
size_t utf8_length(const std::string& s);

// Container class names and short punctuation runs carry no meaning
bool is_meaningful_text(const std::string& text);
std::string short_class_name(const std::string& class_name);
// "com.app:id/button_ok" -> "button_ok"
std::string short_resource_id(const std::string& resource_id);
std::string flags_of(const RawNode& node);

// area(node ∩ screen) / area(node); degenerate bounds -> 0, full cover -> 1
double visible_fraction(const Rect& node, const Rect& screen);

// --- main API ---

std::vector<CompactElement> compact(const RawNode& root,
                                    const std::optional<Rect>& screen = std::nullopt);

// Pruned copy keeping nodes that pass the visibility filter or have
// surviving descendants. nullopt when the root itself is filtered out.
std::optional<RawNode> filter_visible(const RawNode& root, const Rect& screen);

std::string render_text(const std::vector<CompactElement>& elements,
                        const std::optional<PhoneState>& phone = std::nullopt,
                        const std::optional<Rect>& screen = std::nullopt);

// Serialized tree in, {"success":true,"elements":[...],"text":"..."} out.
// Accepts a single root object, an array of roots, or a state object with an
// "a11y_tree" member (and optional "phone_state"). Never throws.
nlohmann::json compact_wire(const std::string& source_json);

} // namespace portal
