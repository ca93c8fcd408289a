// =============================================================================
// PortalBridge - DeviceGateway Implementation
// =============================================================================

#include "device_gateway.hpp"

#include <algorithm>
#include <future>
#include <thread>

#include "portal_log.hpp"

namespace portal {

namespace {

Gesture point_gesture(int x, int y, int duration_ms) {
    Stroke s;
    s.path.push_back({x, y});
    s.duration_ms = duration_ms;
    Gesture g;
    g.strokes.push_back(std::move(s));
    return g;
}

std::string at(int x, int y) {
    return "(" + std::to_string(x) + ", " + std::to_string(y) + ")";
}

} // namespace

DeviceGateway::DeviceGateway(DeviceAutomation& device) : device_(device) {}

// =============================================================================
// Reads
// =============================================================================

Result<TreeSnapshot> DeviceGateway::snapshot_tree() {
    std::lock_guard<std::mutex> lock(mutex_);
    return device_.snapshot_tree();
}

Rect DeviceGateway::screen_bounds() {
    std::lock_guard<std::mutex> lock(mutex_);
    return device_.screen_bounds();
}

PhoneState DeviceGateway::phone_state() {
    std::lock_guard<std::mutex> lock(mutex_);
    return device_.phone_state();
}

std::vector<PackageInfo> DeviceGateway::packages() {
    std::lock_guard<std::mutex> lock(mutex_);
    return device_.packages();
}

std::string DeviceGateway::version() {
    std::lock_guard<std::mutex> lock(mutex_);
    return device_.version();
}

// =============================================================================
// Gestures
// =============================================================================

Result<void> DeviceGateway::tap_locked(int x, int y) {
    if (!device_.perform_gesture(point_gesture(x, y, TAP_DURATION_MS))) {
        return Error(ErrorCode::OperationFailed, "Failed to perform tap at " + at(x, y));
    }
    return Ok();
}

Result<void> DeviceGateway::tap(int x, int y) {
    std::lock_guard<std::mutex> lock(mutex_);
    return tap_locked(x, y);
}

Result<void> DeviceGateway::double_tap(int x, int y) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto first = tap_locked(x, y);
    if (first.is_err()) {
        return Error(ErrorCode::OperationFailed, "Failed to perform double tap at " + at(x, y));
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(DOUBLE_TAP_GAP_MS));
    auto second = tap_locked(x, y);
    if (second.is_err()) {
        return Error(ErrorCode::OperationFailed, "Failed to perform double tap at " + at(x, y));
    }
    return Ok();
}

Result<void> DeviceGateway::long_press(int x, int y, int duration_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!device_.perform_gesture(point_gesture(x, y, duration_ms))) {
        return Error(ErrorCode::OperationFailed, "Failed to perform long press at " + at(x, y));
    }
    return Ok();
}

int DeviceGateway::clamp_swipe_duration(int duration_ms) {
    return std::clamp(duration_ms, SWIPE_MIN_MS, SWIPE_MAX_MS);
}

Result<void> DeviceGateway::swipe(int x1, int y1, int x2, int y2, int duration_ms) {
    Stroke s;
    s.path.push_back({x1, y1});
    s.path.push_back({x2, y2});
    s.duration_ms = clamp_swipe_duration(duration_ms);
    Gesture g;
    g.strokes.push_back(std::move(s));

    std::lock_guard<std::mutex> lock(mutex_);
    if (!device_.perform_gesture(g)) {
        return Error(ErrorCode::OperationFailed, "Failed to perform swipe");
    }
    return Ok();
}

Result<void> DeviceGateway::global_action(int action_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!device_.perform_global_action(action_id)) {
        return Error(ErrorCode::OperationFailed,
                     "Failed to perform global action " + std::to_string(action_id));
    }
    return Ok();
}

// =============================================================================
// Text
// =============================================================================

Result<void> DeviceGateway::input_text(const std::string& text, bool clear) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto node = device_.focused_editable_node();
    if (!node) {
        return Error(ErrorCode::OperationFailed, "No focused input field");
    }
    const std::string value = clear ? text : node->text + text;
    if (!device_.set_node_text(*node, value)) {
        return Error(ErrorCode::OperationFailed, "input failed");
    }
    return Ok();
}

Result<void> DeviceGateway::clear_text() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto node = device_.focused_editable_node();
    if (!node) {
        return Error(ErrorCode::OperationFailed, "No focused input field");
    }
    if (!device_.set_node_text(*node, "")) {
        return Error(ErrorCode::OperationFailed, "Failed to clear text");
    }
    return Ok();
}

Result<void> DeviceGateway::set_text(const FocusedNode& target, const std::string& text) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!device_.set_node_text(target, text)) {
        return Error(ErrorCode::OperationFailed, "set text rejected by the device");
    }
    return Ok();
}

Result<void> DeviceGateway::send_key(int key_code) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!device_.send_key(key_code)) {
        return Error(ErrorCode::OperationFailed,
                     "Failed to send key event - code: " + std::to_string(key_code));
    }
    return Ok();
}

Result<void> DeviceGateway::launch_app(const std::string& package,
                                       const std::optional<std::string>& activity) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto r = device_.launch_app(package, activity);
    if (r.is_err()) {
        return Error(ErrorCode::OperationFailed, "Error starting app: " + r.error().message);
    }
    return Ok();
}

// =============================================================================
// Screenshot
// =============================================================================

Result<std::vector<uint8_t>> DeviceGateway::screenshot(bool hide_overlay,
                                                       std::chrono::milliseconds timeout) {
    std::future<Result<std::vector<uint8_t>>> future;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        future = device_.capture_screenshot(hide_overlay);
    }

    // 待機中はロックを持たない (ジェスチャを止めない)
    if (future.wait_for(timeout) != std::future_status::ready) {
        PLOG_WARN("gateway", "Screenshot timeout after %lld ms", (long long)timeout.count());
        return Err<std::vector<uint8_t>>(ErrorCode::OperationFailed, "Screenshot timeout");
    }

    try {
        auto r = future.get();
        if (r.is_err()) {
            return Err<std::vector<uint8_t>>(ErrorCode::OperationFailed,
                                             "Failed to get screenshot: " + r.error().message);
        }
        return r;
    } catch (const std::future_error& e) {
        return Err<std::vector<uint8_t>>(ErrorCode::OperationFailed,
                                         std::string("Failed to get screenshot: ") + e.what());
    }
}

} // namespace portal
