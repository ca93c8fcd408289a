#pragma once
// =============================================================================
// PortalBridge - SimulatedDevice
// =============================================================================
// In-memory DeviceAutomation. The daemon falls back to it when no platform
// binding is linked (--tree fixture.json); the tests drive it directly.
//
// Gestures are recorded as text:
//   "tap:540,960"  "long_press:10,20,1000"  "swipe:0,0,100,100,300"
//   "gesture:2"    (multi-stroke, e.g. pinch)
// =============================================================================

#include <cstdint>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "device_automation.hpp"
#include "result.hpp"

namespace portal {

class SimulatedDevice : public DeviceAutomation {
public:
    SimulatedDevice();
    ~SimulatedDevice() override;

    SimulatedDevice(const SimulatedDevice&) = delete;
    SimulatedDevice& operator=(const SimulatedDevice&) = delete;

    // --- fixture setup ---
    void set_tree(RawNode root);
    void clear_tree();  // snapshot_tree() fails afterwards (no active window)
    Result<void> load_tree_file(const std::string& path);
    void set_screen(const Rect& screen);
    void set_phone_state(const PhoneState& state);
    void set_packages(std::vector<PackageInfo> pkgs);
    void set_focused_field(std::optional<FocusedNode> node);
    void set_version(const std::string& v);
    void set_screenshot_bytes(std::vector<uint8_t> png);

    // --- failure injection ---
    void fail_gestures(bool fail);
    void fail_launch(bool fail);
    void fail_screenshot(bool fail);
    void stall_screenshot(bool stall);  // future never completes
    void throw_on_gesture(bool t);

    // --- observation ---
    std::vector<std::string> gesture_log() const;
    std::vector<Gesture> gestures() const;
    std::vector<int> global_actions() const;
    std::vector<int> key_events() const;
    std::vector<std::string> launched() const;
    std::string focused_text() const;
    int snapshot_count() const;
    void clear_log();

    // --- DeviceAutomation ---
    Result<TreeSnapshot> snapshot_tree() override;
    Rect screen_bounds() override;
    bool perform_gesture(const Gesture& gesture) override;
    bool perform_global_action(int action_id) override;
    std::optional<FocusedNode> focused_editable_node() override;
    bool set_node_text(const FocusedNode& node, const std::string& text) override;
    bool send_key(int key_code) override;
    Result<void> launch_app(const std::string& package,
                            const std::optional<std::string>& activity) override;
    std::future<Result<std::vector<uint8_t>>> capture_screenshot(bool hide_overlay) override;
    PhoneState phone_state() override;
    std::vector<PackageInfo> packages() override;
    std::string version() override;

    // 1x1 PNG
    static std::vector<uint8_t> placeholder_png();

private:
    mutable std::mutex mutex_;

    TreeSnapshot tree_;
    Rect screen_{0, 0, 1080, 2400};
    PhoneState phone_;
    std::vector<PackageInfo> packages_;
    std::optional<FocusedNode> focused_;
    std::string version_ = "portal-sim-1.0";
    std::vector<uint8_t> png_;

    bool fail_gestures_ = false;
    bool fail_launch_ = false;
    bool fail_screenshot_ = false;
    bool stall_screenshot_ = false;
    bool throw_on_gesture_ = false;

    std::vector<std::string> log_;
    std::vector<Gesture> gestures_;
    std::vector<int> global_actions_;
    std::vector<int> keys_;
    std::vector<std::string> launched_;
    int snapshot_count_ = 0;

    // stall 時に保持 (破棄で broken_promise)
    std::vector<std::promise<Result<std::vector<uint8_t>>>> stalled_;
};

} // namespace portal
