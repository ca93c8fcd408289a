#pragma once
// =============================================================================
// PortalBridge - DeviceAutomation (platform binding interface)
// =============================================================================
// The accessibility / input facilities of the device, as seen by the bridge.
// A platform binding implements this; SimulatedDevice is the in-memory one
// used by the daemon without a binding and by the tests.
//
// Tree snapshots are immutable and shared: one snapshot per query, freed as a
// whole when the last holder drops it.
// =============================================================================

#include <algorithm>
#include <cstdint>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "result.hpp"

namespace portal {

// =============================================================================
// Geometry
// =============================================================================

inline int saturate_extent(int64_t v) {
    return static_cast<int>(std::clamp<int64_t>(v, INT32_MIN, INT32_MAX));
}

struct Rect {
    int left = 0;
    int top = 0;
    int right = 0;
    int bottom = 0;

    // 64bit で計算し int に飽和 (ツリーの座標は信用しない)
    int64_t width64() const  { return static_cast<int64_t>(right) - left; }
    int64_t height64() const { return static_cast<int64_t>(bottom) - top; }
    int width() const  { return saturate_extent(width64()); }
    int height() const { return saturate_extent(height64()); }
    // 退化矩形は面積0
    int64_t area() const {
        if (width64() <= 0 || height64() <= 0) return 0;
        return width64() * height64();
    }
    int center_x() const { return static_cast<int>(left + width64() / 2); }
    int center_y() const { return static_cast<int>(top + height64() / 2); }

    Rect intersect(const Rect& o) const {
        Rect r{std::max(left, o.left), std::max(top, o.top),
               std::min(right, o.right), std::min(bottom, o.bottom)};
        if (r.width64() <= 0 || r.height64() <= 0) return Rect{};
        return r;
    }

    bool contains(const Rect& o) const {
        return left <= o.left && top <= o.top && right >= o.right && bottom >= o.bottom;
    }

    bool operator==(const Rect& o) const {
        return left == o.left && top == o.top && right == o.right && bottom == o.bottom;
    }
};

// =============================================================================
// UI tree
// =============================================================================

struct RawNode {
    std::string text;
    std::string content_description;
    std::string resource_id;
    std::string class_name;
    std::string package_name;
    Rect bounds;

    bool clickable = false;
    bool long_clickable = false;
    bool editable = false;
    bool focused = false;
    bool selected = false;
    bool checked = false;
    bool checkable = false;
    bool scrollable = false;
    bool focusable = false;
    bool enabled = true;

    std::vector<RawNode> children;
};

using TreeSnapshot = std::shared_ptr<const RawNode>;

// =============================================================================
// Gestures
// =============================================================================

struct GesturePoint {
    int x = 0;
    int y = 0;
};

// path.size()==1 は静止タッチ (tap / long press)
struct Stroke {
    std::vector<GesturePoint> path;
    int64_t start_ms = 0;
    int64_t duration_ms = 0;
};

struct Gesture {
    std::vector<Stroke> strokes;
};

// =============================================================================
// Device state
// =============================================================================

struct FocusedNode {
    std::string resource_id;
    std::string text;
    Rect bounds;
};

struct PhoneState {
    std::string current_app;
    std::string package_name;
    std::string activity_name;
    bool keyboard_visible = false;
    bool is_editable = false;
    std::optional<FocusedNode> focused_element;
};

struct PackageInfo {
    std::string package_name;
    std::string label;
    std::string version_name;
    int64_t version_code = 0;
    bool is_system_app = false;
};

// =============================================================================
// DeviceAutomation
// =============================================================================
// Calls are not required to be thread-safe; DeviceGateway serializes them.

class DeviceAutomation {
public:
    virtual ~DeviceAutomation() = default;

    // Active window root, or an error when no window is available
    virtual Result<TreeSnapshot> snapshot_tree() = 0;
    virtual Rect screen_bounds() = 0;

    // false when the system rejected the gesture
    virtual bool perform_gesture(const Gesture& gesture) = 0;
    virtual bool perform_global_action(int action_id) = 0;

    virtual std::optional<FocusedNode> focused_editable_node() = 0;
    virtual bool set_node_text(const FocusedNode& node, const std::string& text) = 0;
    virtual bool send_key(int key_code) = 0;

    virtual Result<void> launch_app(const std::string& package,
                                    const std::optional<std::string>& activity) = 0;

    // PNG bytes; completes asynchronously
    virtual std::future<Result<std::vector<uint8_t>>> capture_screenshot(bool hide_overlay) = 0;

    virtual PhoneState phone_state() = 0;
    virtual std::vector<PackageInfo> packages() = 0;
    virtual std::string version() = 0;
};

} // namespace portal
