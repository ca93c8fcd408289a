#pragma once
// =============================================================================
// PortalBridge - Config Store
// =============================================================================
// Sectioned JSON settings (portal.json) read by many threads, written rarely.
// Writes publish ConfigChangedEvent on the owning EventBus so the servers can
// rebind / restart without polling.
//
//   {
//     "server":  {"http_port": 8080, "websocket_port": 8081},
//     "auth":    {"enabled": true, "token": "..."},
//     "reverse": {"enabled": false, "url": "ws://host:9000/mcp"},
//     "tools":   {"enabled": ["android.tap", "android.screen.dump"]}
//   }
// =============================================================================

#include <cstddef>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <type_traits>

#include "nlohmann/json.hpp"
#include "event_bus.hpp"
#include "json_number.hpp"
#include "portal_log.hpp"
#include "result.hpp"

namespace portal::config {

constexpr int DEFAULT_HTTP_PORT            = 8080;
constexpr int DEFAULT_WEBSOCKET_PORT       = 8081;
constexpr int DEFAULT_HEARTBEAT_INTERVAL   = 30000;
constexpr int DEFAULT_HEARTBEAT_TIMEOUT    = 10000;
constexpr int DEFAULT_INITIAL_BACKOFF_MS   = 1000;
constexpr int DEFAULT_MAX_BACKOFF_MS       = 60000;
constexpr int DEFAULT_QUEUE_CAPACITY       = 10;
constexpr int DEFAULT_REQUEST_TTL_MS       = 30000;
constexpr int DEFAULT_WAIT_POLL_MS         = 200;
constexpr int DEFAULT_WAIT_MAX_MS          = 10000;

// Safe JSON accessor with section/key and default value
template<typename T>
T jsonGet(const nlohmann::json& j, const std::string& section,
          const std::string& key, const T& def) {
    try {
        if (j.contains(section) && j[section].is_object() && j[section].contains(key)) {
            const auto& v = j[section][key];
            if constexpr (std::is_same<T, int>::value) {
                // 範囲外は飽和、数値以外は既定値
                if (!v.is_number()) return def;
                return json_to_int(v).value_or(def);
            } else {
                return v.get<T>();
            }
        }
    } catch (const nlohmann::json::exception& e) {
        PLOG_DEBUG("config", "%s.%s has unexpected type (%s), using default",
                   section.c_str(), key.c_str(), e.what());
    }
    return def;
}

struct ReverseSettings {
    bool enabled = false;
    std::string url;
    int heartbeat_interval_ms = DEFAULT_HEARTBEAT_INTERVAL;
    int heartbeat_timeout_ms  = DEFAULT_HEARTBEAT_TIMEOUT;
    int initial_backoff_ms    = DEFAULT_INITIAL_BACKOFF_MS;
    int max_backoff_ms        = DEFAULT_MAX_BACKOFF_MS;
    size_t queue_capacity     = DEFAULT_QUEUE_CAPACITY;
    int request_ttl_ms        = DEFAULT_REQUEST_TTL_MS;
};

class ConfigStore {
public:
    explicit ConfigStore(EventBus& bus);

    ConfigStore(const ConfigStore&) = delete;
    ConfigStore& operator=(const ConfigStore&) = delete;

    // @param path    Path to config file
    // @param strict  If true, only try the exact path (no fallback search)
    // A missing file is not an error: defaults stay in effect.
    Result<void, IoError> load(const std::string& path = "portal.json", bool strict = false);

    // Replace the whole document from JSON text (tests, --config-json)
    Result<void> load_from_string(const std::string& text);

    Result<void, IoError> save() const;
    Result<void, IoError> save_as(const std::string& path);
    std::string path() const;

    template<typename T>
    T get(const std::string& section, const std::string& key, const T& def) const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return jsonGet<T>(doc_, section, key, def);
    }

    bool contains(const std::string& section, const std::string& key) const;

    // Publishes ConfigChangedEvent when the stored value actually changes
    void set(const std::string& section, const std::string& key, nlohmann::json value);

    nlohmann::json snapshot() const;

    // --- typed accessors ---
    bool http_enabled() const      { return get<bool>("server", "http_enabled", true); }
    int  http_port() const         { return get<int>("server", "http_port", DEFAULT_HTTP_PORT); }
    bool websocket_enabled() const { return get<bool>("server", "websocket_enabled", true); }
    int  websocket_port() const    { return get<int>("server", "websocket_port", DEFAULT_WEBSOCKET_PORT); }
    std::string bind_address() const { return get<std::string>("server", "bind_address", "0.0.0.0"); }

    bool auth_enabled() const { return get<bool>("auth", "enabled", true); }
    // 未設定なら生成して保存する
    std::string auth_token();

    ReverseSettings reverse() const;

    int  overlay_offset() const { return get<int>("overlay", "offset", 0); }
    bool overlay_visible() const { return get<bool>("overlay", "visible", true); }

    // nullopt = no filter, every registered tool is enabled
    std::optional<std::set<std::string>> enabled_tools() const;
    bool settle_delays() const { return get<bool>("tools", "settle_delays", true); }

    int wait_poll_interval_ms() const { return get<int>("wait", "poll_interval_ms", DEFAULT_WAIT_POLL_MS); }
    int wait_max_ms() const           { return get<int>("wait", "max_wait_ms", DEFAULT_WAIT_MAX_MS); }

    std::string log_path() const  { return get<std::string>("log", "path", "portal.log"); }
    std::string log_level() const { return get<std::string>("log", "level", "info"); }

private:
    static std::string generate_token();

    EventBus& bus_;
    mutable std::shared_mutex mutex_;
    nlohmann::json doc_ = nlohmann::json::object();
    std::string path_;
};

} // namespace portal::config
