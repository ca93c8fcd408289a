// =============================================================================
// Unit tests for ConfigStore (src/config_store.hpp)
// Tests: defaults, file loading, set() events, auth token, tool filter
// =============================================================================
#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include "config_store.hpp"

using namespace portal;
using namespace portal::config;

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------
static void writeTmpJson(const char* path, const char* content) {
    std::ofstream f(path);
    f << content;
}

// ---------------------------------------------------------------------------
// Defaults when nothing is loaded
// ---------------------------------------------------------------------------
TEST(ConfigStoreTest, DefaultValues) {
    EventBus bus;
    ConfigStore cfg(bus);

    EXPECT_TRUE(cfg.http_enabled());
    EXPECT_EQ(cfg.http_port(), 8080);
    EXPECT_TRUE(cfg.websocket_enabled());
    EXPECT_EQ(cfg.websocket_port(), 8081);
    EXPECT_EQ(cfg.bind_address(), "0.0.0.0");
    EXPECT_TRUE(cfg.auth_enabled());
    EXPECT_FALSE(cfg.enabled_tools().has_value());
    EXPECT_TRUE(cfg.settle_delays());
    EXPECT_EQ(cfg.log_level(), "info");

    auto r = cfg.reverse();
    EXPECT_FALSE(r.enabled);
    EXPECT_TRUE(r.url.empty());
    EXPECT_EQ(r.initial_backoff_ms, 1000);
    EXPECT_EQ(r.max_backoff_ms, 60000);
    EXPECT_EQ(r.queue_capacity, 10u);
    EXPECT_EQ(r.request_ttl_ms, 30000);
}

// ---------------------------------------------------------------------------
// Missing file is not an error
// ---------------------------------------------------------------------------
TEST(ConfigStoreTest, MissingFileKeepsDefaults) {
    EventBus bus;
    ConfigStore cfg(bus);
    auto r = cfg.load("__nonexistent_portal_xyz.json", true);
    EXPECT_TRUE(r.is_ok());
    EXPECT_EQ(cfg.http_port(), 8080);
}

TEST(ConfigStoreTest, LoadFromFile) {
    const char* path = "__test_portal_cfg.json";
    writeTmpJson(path, R"({
        "server":  {"http_port": 9000, "websocket_enabled": false},
        "reverse": {"enabled": true, "url": "ws://10.0.0.2:9100/mcp", "queue_capacity": 4},
        "tools":   {"enabled": ["android.tap", "android.screen.dump"]}
    })");

    EventBus bus;
    ConfigStore cfg(bus);
    ASSERT_TRUE(cfg.load(path, true).is_ok());

    EXPECT_EQ(cfg.http_port(), 9000);
    EXPECT_FALSE(cfg.websocket_enabled());
    EXPECT_EQ(cfg.path(), path);

    auto r = cfg.reverse();
    EXPECT_TRUE(r.enabled);
    EXPECT_EQ(r.url, "ws://10.0.0.2:9100/mcp");
    EXPECT_EQ(r.queue_capacity, 4u);

    auto tools = cfg.enabled_tools();
    ASSERT_TRUE(tools.has_value());
    EXPECT_EQ(tools->size(), 2u);
    EXPECT_EQ(tools->count("android.tap"), 1u);

    std::remove(path);
}

TEST(ConfigStoreTest, ParseErrorKeepsDefaults) {
    const char* path = "__test_portal_bad.json";
    writeTmpJson(path, "{ not json");

    EventBus bus;
    ConfigStore cfg(bus);
    EXPECT_TRUE(cfg.load(path, true).is_ok());
    EXPECT_EQ(cfg.http_port(), 8080);

    std::remove(path);
}

// ---------------------------------------------------------------------------
// Wrong types fall back to defaults
// ---------------------------------------------------------------------------
TEST(ConfigStoreTest, WrongTypeUsesDefault) {
    EventBus bus;
    ConfigStore cfg(bus);
    ASSERT_TRUE(cfg.load_from_string(R"({"server": {"http_port": "eighty"}})").is_ok());
    EXPECT_EQ(cfg.http_port(), 8080);
}

TEST(ConfigStoreTest, HugeIntegerSaturates) {
    EventBus bus;
    ConfigStore cfg(bus);
    ASSERT_TRUE(cfg.load_from_string(R"({"wait": {"max_wait_ms": 1e20, "poll_interval_ms": 9000000000}})").is_ok());
    EXPECT_EQ(cfg.wait_max_ms(), INT32_MAX);
    EXPECT_EQ(cfg.wait_poll_interval_ms(), INT32_MAX);
}

TEST(ConfigStoreTest, NegativeReverseLimitsUseDefaults) {
    EventBus bus;
    ConfigStore cfg(bus);
    ASSERT_TRUE(cfg.load_from_string(R"({"reverse": {
        "queue_capacity": -1, "request_ttl_ms": -5, "initial_backoff_ms": 0,
        "max_backoff_ms": -100, "heartbeat_interval_ms": -1, "heartbeat_timeout_ms": -1}})").is_ok());
    auto r = cfg.reverse();
    EXPECT_EQ(r.queue_capacity, static_cast<size_t>(DEFAULT_QUEUE_CAPACITY));
    EXPECT_EQ(r.request_ttl_ms, DEFAULT_REQUEST_TTL_MS);
    EXPECT_EQ(r.initial_backoff_ms, DEFAULT_INITIAL_BACKOFF_MS);
    EXPECT_EQ(r.max_backoff_ms, DEFAULT_MAX_BACKOFF_MS);
    EXPECT_EQ(r.heartbeat_interval_ms, DEFAULT_HEARTBEAT_INTERVAL);
    EXPECT_EQ(r.heartbeat_timeout_ms, DEFAULT_HEARTBEAT_TIMEOUT);
}

TEST(ConfigStoreTest, ZeroQueueCapacityIsKept) {
    EventBus bus;
    ConfigStore cfg(bus);
    ASSERT_TRUE(cfg.load_from_string(R"({"reverse": {"queue_capacity": 0, "max_backoff_ms": 500,
                                                     "initial_backoff_ms": 2000}})").is_ok());
    auto r = cfg.reverse();
    EXPECT_EQ(r.queue_capacity, 0u);
    // max は initial 未満にならない
    EXPECT_EQ(r.max_backoff_ms, DEFAULT_MAX_BACKOFF_MS);
}

TEST(ConfigStoreTest, LoadFromStringRejectsNonObject) {
    EventBus bus;
    ConfigStore cfg(bus);
    auto r = cfg.load_from_string("[1,2,3]");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().kind(), ErrorCode::MalformedInput);
}

// ---------------------------------------------------------------------------
// set() publishes ConfigChangedEvent only on change
// ---------------------------------------------------------------------------
TEST(ConfigStoreTest, SetPublishesChange) {
    EventBus bus;
    ConfigStore cfg(bus);
    int events = 0;
    std::string last_key;

    auto sub = bus.subscribe<ConfigChangedEvent>([&](const ConfigChangedEvent& e) {
        events++;
        last_key = e.section + "." + e.key;
    });

    cfg.set("reverse", "enabled", true);
    EXPECT_EQ(events, 1);
    EXPECT_EQ(last_key, "reverse.enabled");
    EXPECT_TRUE(cfg.reverse().enabled);

    cfg.set("reverse", "enabled", true);  // unchanged
    EXPECT_EQ(events, 1);

    cfg.set("server", "http_port", 8181);
    EXPECT_EQ(events, 2);
    EXPECT_EQ(cfg.http_port(), 8181);
}

// ---------------------------------------------------------------------------
// auth token is generated once and persisted
// ---------------------------------------------------------------------------
TEST(ConfigStoreTest, AuthTokenGeneratedAndStable) {
    const char* path = "__test_portal_token.json";
    writeTmpJson(path, "{}");

    EventBus bus;
    ConfigStore cfg(bus);
    ASSERT_TRUE(cfg.load(path, true).is_ok());

    std::string token = cfg.auth_token();
    EXPECT_EQ(token.size(), 32u);
    EXPECT_EQ(cfg.auth_token(), token);

    ConfigStore reloaded(bus);
    ASSERT_TRUE(reloaded.load(path, true).is_ok());
    EXPECT_EQ(reloaded.auth_token(), token);

    std::remove(path);
}

TEST(ConfigStoreTest, ConfiguredTokenIsUsed) {
    EventBus bus;
    ConfigStore cfg(bus);
    ASSERT_TRUE(cfg.load_from_string(R"({"auth": {"token": "secret"}})").is_ok());
    EXPECT_EQ(cfg.auth_token(), "secret");
}

TEST(ConfigStoreTest, NonArrayToolFilterMeansAll) {
    EventBus bus;
    ConfigStore cfg(bus);
    ASSERT_TRUE(cfg.load_from_string(R"({"tools": {"enabled": "android.tap"}})").is_ok());
    EXPECT_FALSE(cfg.enabled_tools().has_value());
}

TEST(ConfigStoreTest, EmptyToolFilterDisablesAll) {
    EventBus bus;
    ConfigStore cfg(bus);
    ASSERT_TRUE(cfg.load_from_string(R"({"tools": {"enabled": []}})").is_ok());
    auto tools = cfg.enabled_tools();
    ASSERT_TRUE(tools.has_value());
    EXPECT_TRUE(tools->empty());
}

TEST(ConfigStoreTest, SaveWithoutPathFails) {
    EventBus bus;
    ConfigStore cfg(bus);
    auto r = cfg.save();
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().kind, IoError::Kind::NotFound);
}
