// =============================================================================
// PortalBridge - SimulatedDevice Implementation
// =============================================================================

#include "simulated_device.hpp"

#include <fstream>
#include <iterator>
#include <stdexcept>

#include "nlohmann/json.hpp"
#include "portal_log.hpp"
#include "tree_json.hpp"

namespace portal {

namespace {
constexpr int KEYCODE_DEL = 67;
constexpr int64_t LONG_PRESS_MIN_MS = 500;
}

SimulatedDevice::SimulatedDevice() : png_(placeholder_png()) {
    phone_.current_app = "Launcher";
    phone_.package_name = "com.android.launcher";
}

SimulatedDevice::~SimulatedDevice() = default;

// =============================================================================
// Fixture setup
// =============================================================================

void SimulatedDevice::set_tree(RawNode root) {
    std::lock_guard<std::mutex> lock(mutex_);
    tree_ = std::make_shared<const RawNode>(std::move(root));
}

void SimulatedDevice::clear_tree() {
    std::lock_guard<std::mutex> lock(mutex_);
    tree_.reset();
}

Result<void> SimulatedDevice::load_tree_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return Error(ErrorCode::OperationFailed, "cannot open tree fixture: " + path);
    }

    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(file);
    } catch (const nlohmann::json::exception& e) {
        return Error(ErrorCode::MalformedInput, std::string("tree fixture parse error: ") + e.what());
    }

    // state 形式 {"a11y_tree": root|[root], "phone_state": {...}} も受け付ける
    const nlohmann::json* root = &doc;
    if (doc.is_object() && doc.contains("a11y_tree")) {
        root = &doc["a11y_tree"];
        if (root->is_array()) {
            if (root->empty()) return Error(ErrorCode::MalformedInput, "a11y_tree is empty");
            root = &(*root)[0];
        }
        if (doc.contains("phone_state")) {
            auto ps = phone_state_from_json(doc["phone_state"]);
            if (ps.is_err()) return ps.error();
            set_phone_state(ps.value());
        }
    }

    auto node = node_from_json(*root);
    if (node.is_err()) return node.error();

    RawNode tree = std::move(node).value();
    if (tree.bounds.area() > 0) set_screen(tree.bounds);
    set_tree(std::move(tree));
    PLOG_INFO("simdev", "Loaded tree fixture %s", path.c_str());
    return Ok();
}

void SimulatedDevice::set_screen(const Rect& screen) {
    std::lock_guard<std::mutex> lock(mutex_);
    screen_ = screen;
}

void SimulatedDevice::set_phone_state(const PhoneState& state) {
    std::lock_guard<std::mutex> lock(mutex_);
    phone_ = state;
}

void SimulatedDevice::set_packages(std::vector<PackageInfo> pkgs) {
    std::lock_guard<std::mutex> lock(mutex_);
    packages_ = std::move(pkgs);
}

void SimulatedDevice::set_focused_field(std::optional<FocusedNode> node) {
    std::lock_guard<std::mutex> lock(mutex_);
    focused_ = std::move(node);
}

void SimulatedDevice::set_version(const std::string& v) {
    std::lock_guard<std::mutex> lock(mutex_);
    version_ = v;
}

void SimulatedDevice::set_screenshot_bytes(std::vector<uint8_t> png) {
    std::lock_guard<std::mutex> lock(mutex_);
    png_ = std::move(png);
}

void SimulatedDevice::fail_gestures(bool fail)    { std::lock_guard<std::mutex> l(mutex_); fail_gestures_ = fail; }
void SimulatedDevice::fail_launch(bool fail)      { std::lock_guard<std::mutex> l(mutex_); fail_launch_ = fail; }
void SimulatedDevice::fail_screenshot(bool fail)  { std::lock_guard<std::mutex> l(mutex_); fail_screenshot_ = fail; }
void SimulatedDevice::stall_screenshot(bool s)    { std::lock_guard<std::mutex> l(mutex_); stall_screenshot_ = s; }
void SimulatedDevice::throw_on_gesture(bool t)    { std::lock_guard<std::mutex> l(mutex_); throw_on_gesture_ = t; }

// =============================================================================
// Observation
// =============================================================================

std::vector<std::string> SimulatedDevice::gesture_log() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return log_;
}

std::vector<Gesture> SimulatedDevice::gestures() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return gestures_;
}

std::vector<int> SimulatedDevice::global_actions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return global_actions_;
}

std::vector<int> SimulatedDevice::key_events() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return keys_;
}

std::vector<std::string> SimulatedDevice::launched() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return launched_;
}

std::string SimulatedDevice::focused_text() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return focused_ ? focused_->text : std::string();
}

int SimulatedDevice::snapshot_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return snapshot_count_;
}

void SimulatedDevice::clear_log() {
    std::lock_guard<std::mutex> lock(mutex_);
    log_.clear();
    gestures_.clear();
    global_actions_.clear();
    keys_.clear();
    launched_.clear();
}

// =============================================================================
// DeviceAutomation
// =============================================================================

Result<TreeSnapshot> SimulatedDevice::snapshot_tree() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++snapshot_count_;
    if (!tree_) return Err<TreeSnapshot>(ErrorCode::OperationFailed, "No active window");
    return tree_;
}

Rect SimulatedDevice::screen_bounds() {
    std::lock_guard<std::mutex> lock(mutex_);
    return screen_;
}

bool SimulatedDevice::perform_gesture(const Gesture& gesture) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (throw_on_gesture_) throw std::runtime_error("gesture binding crashed");
    if (fail_gestures_ || gesture.strokes.empty()) return false;

    gestures_.push_back(gesture);

    std::string entry;
    if (gesture.strokes.size() > 1) {
        entry = "gesture:" + std::to_string(gesture.strokes.size());
    } else {
        const auto& s = gesture.strokes.front();
        if (s.path.empty()) return false;
        const auto& a = s.path.front();
        const auto& b = s.path.back();
        if (s.path.size() == 1) {
            if (s.duration_ms >= LONG_PRESS_MIN_MS) {
                entry = "long_press:" + std::to_string(a.x) + "," + std::to_string(a.y) +
                        "," + std::to_string(s.duration_ms);
            } else {
                entry = "tap:" + std::to_string(a.x) + "," + std::to_string(a.y);
            }
        } else {
            entry = "swipe:" + std::to_string(a.x) + "," + std::to_string(a.y) + "," +
                    std::to_string(b.x) + "," + std::to_string(b.y) + "," +
                    std::to_string(s.duration_ms);
        }
    }
    log_.push_back(entry);
    return true;
}

bool SimulatedDevice::perform_global_action(int action_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (fail_gestures_) return false;
    global_actions_.push_back(action_id);
    log_.push_back("global:" + std::to_string(action_id));
    return true;
}

std::optional<FocusedNode> SimulatedDevice::focused_editable_node() {
    std::lock_guard<std::mutex> lock(mutex_);
    return focused_;
}

bool SimulatedDevice::set_node_text(const FocusedNode& node, const std::string& text) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (fail_gestures_) return false;
    // 別ノード指定ならフォーカスをそこへ移す
    if (!focused_ || focused_->resource_id != node.resource_id) focused_ = node;
    focused_->text = text;
    log_.push_back("set_text:" + node.resource_id);
    return true;
}

bool SimulatedDevice::send_key(int key_code) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!focused_) return false;
    keys_.push_back(key_code);
    if (key_code == KEYCODE_DEL && !focused_->text.empty()) {
        // UTF-8 の1文字分を削る
        auto& t = focused_->text;
        size_t i = t.size() - 1;
        while (i > 0 && (static_cast<unsigned char>(t[i]) & 0xC0) == 0x80) --i;
        t.erase(i);
    }
    return true;
}

Result<void> SimulatedDevice::launch_app(const std::string& package,
                                         const std::optional<std::string>& activity) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (fail_launch_) {
        return Error(ErrorCode::OperationFailed, "Could not create intent for " + package);
    }
    launched_.push_back(activity ? package + "/" + *activity : package);
    phone_.package_name = package;
    phone_.activity_name = activity.value_or("");
    for (const auto& p : packages_) {
        if (p.package_name == package) phone_.current_app = p.label;
    }
    return Ok();
}

std::future<Result<std::vector<uint8_t>>> SimulatedDevice::capture_screenshot(bool hide_overlay) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::promise<Result<std::vector<uint8_t>>> promise;
    auto future = promise.get_future();

    log_.push_back(std::string("screenshot:") + (hide_overlay ? "hidden" : "shown"));
    if (stall_screenshot_) {
        stalled_.push_back(std::move(promise));
    } else if (fail_screenshot_) {
        promise.set_value(Err<std::vector<uint8_t>>(ErrorCode::OperationFailed, "capture rejected"));
    } else {
        promise.set_value(png_);
    }
    return future;
}

PhoneState SimulatedDevice::phone_state() {
    std::lock_guard<std::mutex> lock(mutex_);
    PhoneState s = phone_;
    if (focused_) {
        s.keyboard_visible = true;
        s.is_editable = true;
        s.focused_element = focused_;
    }
    return s;
}

std::vector<PackageInfo> SimulatedDevice::packages() {
    std::lock_guard<std::mutex> lock(mutex_);
    return packages_;
}

std::string SimulatedDevice::version() {
    std::lock_guard<std::mutex> lock(mutex_);
    return version_;
}

std::vector<uint8_t> SimulatedDevice::placeholder_png() {
    static const uint8_t PNG_1X1[] = {
        0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A,
        0x00, 0x00, 0x00, 0x0D, 0x49, 0x48, 0x44, 0x52,
        0x00, 0x00, 0x00, 0x01, 0x00, 0x00, 0x00, 0x01,
        0x08, 0x06, 0x00, 0x00, 0x00, 0x1F, 0x15, 0xC4,
        0x89, 0x00, 0x00, 0x00, 0x0D, 0x49, 0x44, 0x41,
        0x54, 0x78, 0x9C, 0x63, 0x00, 0x01, 0x00, 0x00,
        0x05, 0x00, 0x01, 0x0D, 0x0A, 0x2D, 0xB4, 0x00,
        0x00, 0x00, 0x00, 0x49, 0x45, 0x4E, 0x44, 0xAE,
        0x42, 0x60, 0x82,
    };
    return std::vector<uint8_t>(std::begin(PNG_1X1), std::end(PNG_1X1));
}

} // namespace portal
