// =============================================================================
// PortalBridge - Config Store Implementation
// =============================================================================

#include "config_store.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <mutex>
#include <random>

namespace portal::config {

ConfigStore::ConfigStore(EventBus& bus) : bus_(bus) {}

Result<void, IoError> ConfigStore::load(const std::string& path, bool strict) {
    std::string used = path;
    std::ifstream file(path);
    if (!file.is_open() && !strict) {
        for (const char* alt : {"portal.json", "../portal.json"}) {
            file.clear();
            file.open(alt);
            if (file.is_open()) { used = alt; break; }
        }
    }

    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        path_ = path;  // save() は要求されたパスに書く
    }

    if (!file.is_open()) {
        PLOG_WARN("config", "%s not found, using defaults", path.c_str());
        return Result<void, IoError>();
    }

    nlohmann::json parsed;
    try {
        parsed = nlohmann::json::parse(file);
    } catch (const nlohmann::json::exception& e) {
        PLOG_ERROR("config", "JSON parse error in %s: %s", used.c_str(), e.what());
        return Result<void, IoError>();
    }
    if (!parsed.is_object()) {
        PLOG_ERROR("config", "%s: top level must be an object, using defaults", used.c_str());
        return Result<void, IoError>();
    }

    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        doc_ = std::move(parsed);
        path_ = used;
    }
    PLOG_INFO("config", "Loaded %s", used.c_str());
    return Result<void, IoError>();
}

Result<void> ConfigStore::load_from_string(const std::string& text) {
    nlohmann::json parsed;
    try {
        parsed = nlohmann::json::parse(text);
    } catch (const nlohmann::json::exception& e) {
        return Error(ErrorCode::MalformedInput, std::string("config JSON parse error: ") + e.what());
    }
    if (!parsed.is_object()) {
        return Error(ErrorCode::MalformedInput, "config JSON must be an object");
    }
    std::unique_lock<std::shared_mutex> lock(mutex_);
    doc_ = std::move(parsed);
    return Ok();
}

Result<void, IoError> ConfigStore::save() const {
    std::string path;
    std::string text;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        path = path_;
        text = doc_.dump(2);
    }
    if (path.empty()) {
        return IoError("config has no file path", IoError::Kind::NotFound);
    }

    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) {
        auto kind = (errno == EACCES) ? IoError::Kind::PermissionDenied : IoError::Kind::Other;
        return IoError("cannot write " + path + ": " + std::strerror(errno), kind);
    }
    out << text << "\n";
    if (!out) {
        return IoError("write failed: " + path);
    }
    PLOG_DEBUG("config", "Saved %s", path.c_str());
    return Result<void, IoError>();
}

Result<void, IoError> ConfigStore::save_as(const std::string& path) {
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        path_ = path;
    }
    return save();
}

std::string ConfigStore::path() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return path_;
}

bool ConfigStore::contains(const std::string& section, const std::string& key) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return doc_.contains(section) && doc_[section].is_object() && doc_[section].contains(key);
}

void ConfigStore::set(const std::string& section, const std::string& key, nlohmann::json value) {
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        if (!doc_.contains(section) || !doc_[section].is_object()) {
            doc_[section] = nlohmann::json::object();
        }
        auto& slot = doc_[section];
        if (slot.contains(key) && slot[key] == value) return;
        slot[key] = value;
    }

    PLOG_INFO("config", "%s.%s = %s", section.c_str(), key.c_str(), value.dump().c_str());

    ConfigChangedEvent ev;
    ev.section = section;
    ev.key = key;
    ev.value = std::move(value);
    bus_.publish(ev);
}

nlohmann::json ConfigStore::snapshot() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return doc_;
}

std::string ConfigStore::auth_token() {
    auto token = get<std::string>("auth", "token", "");
    if (!token.empty()) return token;

    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        // 別スレッドが先に生成していればそれを使う
        if (doc_.contains("auth") && doc_["auth"].is_object() &&
            doc_["auth"].contains("token") && doc_["auth"]["token"].is_string() &&
            !doc_["auth"]["token"].get<std::string>().empty()) {
            return doc_["auth"]["token"].get<std::string>();
        }
        if (!doc_.contains("auth") || !doc_["auth"].is_object()) {
            doc_["auth"] = nlohmann::json::object();
        }
        token = generate_token();
        doc_["auth"]["token"] = token;
    }
    PLOG_INFO("config", "Generated new auth token");

    if (!path().empty()) {
        auto saved = save();
        if (saved.is_err()) {
            PLOG_WARN("config", "auth token not persisted: %s", saved.error().message.c_str());
        }
    }
    return token;
}

namespace {

// 負値 (backoff は 0 も) は設定ミスとして既定値に戻す
int at_least(int value, int min, int def, const char* key) {
    if (value >= min) return value;
    PLOG_WARN("config", "reverse.%s = %d is out of range, using %d", key, value, def);
    return def;
}

} // namespace

ReverseSettings ConfigStore::reverse() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    ReverseSettings r;
    r.enabled               = jsonGet<bool>(doc_, "reverse", "enabled", false);
    r.url                   = jsonGet<std::string>(doc_, "reverse", "url", "");
    r.heartbeat_interval_ms = at_least(jsonGet<int>(doc_, "reverse", "heartbeat_interval_ms", DEFAULT_HEARTBEAT_INTERVAL),
                                       1, DEFAULT_HEARTBEAT_INTERVAL, "heartbeat_interval_ms");
    r.heartbeat_timeout_ms  = at_least(jsonGet<int>(doc_, "reverse", "heartbeat_timeout_ms", DEFAULT_HEARTBEAT_TIMEOUT),
                                       0, DEFAULT_HEARTBEAT_TIMEOUT, "heartbeat_timeout_ms");
    r.initial_backoff_ms    = at_least(jsonGet<int>(doc_, "reverse", "initial_backoff_ms", DEFAULT_INITIAL_BACKOFF_MS),
                                       1, DEFAULT_INITIAL_BACKOFF_MS, "initial_backoff_ms");
    r.max_backoff_ms        = at_least(jsonGet<int>(doc_, "reverse", "max_backoff_ms", DEFAULT_MAX_BACKOFF_MS),
                                       r.initial_backoff_ms, std::max(DEFAULT_MAX_BACKOFF_MS, r.initial_backoff_ms),
                                       "max_backoff_ms");
    r.queue_capacity        = static_cast<size_t>(
        at_least(jsonGet<int>(doc_, "reverse", "queue_capacity", DEFAULT_QUEUE_CAPACITY),
                 0, DEFAULT_QUEUE_CAPACITY, "queue_capacity"));
    r.request_ttl_ms        = at_least(jsonGet<int>(doc_, "reverse", "request_ttl_ms", DEFAULT_REQUEST_TTL_MS),
                                       0, DEFAULT_REQUEST_TTL_MS, "request_ttl_ms");
    return r;
}

std::optional<std::set<std::string>> ConfigStore::enabled_tools() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    if (!doc_.contains("tools") || !doc_["tools"].is_object() ||
        !doc_["tools"].contains("enabled")) {
        return std::nullopt;
    }
    const auto& arr = doc_["tools"]["enabled"];
    if (!arr.is_array()) {
        PLOG_WARN("config", "tools.enabled is not an array, all tools enabled");
        return std::nullopt;
    }
    std::set<std::string> names;
    for (const auto& v : arr) {
        if (v.is_string()) names.insert(v.get<std::string>());
    }
    return names;
}

std::string ConfigStore::generate_token() {
    static const char HEX[] = "0123456789abcdef";
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::uniform_int_distribution<int> dist(0, 15);
    std::string out;
    out.reserve(32);
    for (int i = 0; i < 32; ++i) out.push_back(HEX[dist(gen)]);
    return out;
}

} // namespace portal::config
