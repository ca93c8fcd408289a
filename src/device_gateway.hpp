#pragma once
// =============================================================================
// PortalBridge - DeviceGateway
// =============================================================================
// Serializes access to the DeviceAutomation binding (one gesture channel, one
// focused node) and turns coordinate-level requests into Gestures.
// Every call returns a Result; binding-level rejections become OperationFailed.
// =============================================================================

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "device_automation.hpp"
#include "result.hpp"

namespace portal {

constexpr int TAP_DURATION_MS        = 50;
constexpr int DOUBLE_TAP_GAP_MS      = 100;
constexpr int DEFAULT_LONG_PRESS_MS  = 1000;
constexpr int DEFAULT_SWIPE_MS       = 300;
constexpr int SWIPE_MIN_MS           = 10;
constexpr int SWIPE_MAX_MS           = 5000;
constexpr auto SCREENSHOT_TIMEOUT    = std::chrono::seconds(5);

class DeviceGateway {
public:
    explicit DeviceGateway(DeviceAutomation& device);

    DeviceGateway(const DeviceGateway&) = delete;
    DeviceGateway& operator=(const DeviceGateway&) = delete;

    // --- reads ---
    Result<TreeSnapshot> snapshot_tree();
    Rect screen_bounds();
    PhoneState phone_state();
    std::vector<PackageInfo> packages();
    std::string version();

    // --- gestures ---
    Result<void> tap(int x, int y);
    // 2回のタップの間もロックを保持する (他のジェスチャが割り込まない)
    Result<void> double_tap(int x, int y);
    Result<void> long_press(int x, int y, int duration_ms = DEFAULT_LONG_PRESS_MS);
    // duration is clamped to [SWIPE_MIN_MS, SWIPE_MAX_MS]
    Result<void> swipe(int x1, int y1, int x2, int y2, int duration_ms = DEFAULT_SWIPE_MS);
    Result<void> global_action(int action_id);

    // --- text ---
    Result<void> input_text(const std::string& text, bool clear);
    Result<void> clear_text();
    // 指定ノードへ直接テキストを設定 (フォーカスも移る)
    Result<void> set_text(const FocusedNode& target, const std::string& text);
    Result<void> send_key(int key_code);

    Result<void> launch_app(const std::string& package,
                            const std::optional<std::string>& activity);

    Result<std::vector<uint8_t>> screenshot(
        bool hide_overlay,
        std::chrono::milliseconds timeout = SCREENSHOT_TIMEOUT);

    static int clamp_swipe_duration(int duration_ms);

private:
    Result<void> tap_locked(int x, int y);

    DeviceAutomation& device_;
    std::mutex mutex_;
};

} // namespace portal
