// =============================================================================
// Unit tests for the reverse connection state machine (socket-free)
// Tests: backoff, enable gate, handshake, pending queue, notification, URL
// =============================================================================
#include <gtest/gtest.h>
#include "reverse_connection.hpp"
#include "mcp/device_tools.hpp"
#include "simulated_device.hpp"

using namespace portal;
using namespace portal::mcp;
using nlohmann::json;
using namespace std::chrono_literals;

// ---------------------------------------------------------------------------
// BackoffPolicy
// ---------------------------------------------------------------------------
TEST(BackoffPolicyTest, DoublesUpToCap) {
    BackoffPolicy b(1000ms, 60000ms);
    const long long expected[] = {1000, 2000, 4000, 8000, 16000, 32000, 60000, 60000};
    for (long long e : expected) {
        EXPECT_EQ(b.next_delay().count(), e);
    }
    EXPECT_EQ(b.failures(), 8);
}

TEST(BackoffPolicyTest, ResetAfterSuccess) {
    BackoffPolicy b(1000ms, 60000ms);
    b.next_delay();
    b.next_delay();
    EXPECT_EQ(b.peek().count(), 4000);
    b.reset();
    EXPECT_EQ(b.failures(), 0);
    EXPECT_EQ(b.next_delay().count(), 1000);
}

// ---------------------------------------------------------------------------
// Machine fixture
// ---------------------------------------------------------------------------
class ReverseMachineTest : public ::testing::Test {
protected:
    ReverseMachineTest()
        : config(bus), gateway(device), dispatcher(gateway, config), session(registry, config) {
        register_device_tools(registry, dispatcher);
        device.set_tree(RawNode{});
    }

    std::unique_ptr<ReverseConnectionMachine> make_machine(size_t capacity = 10) {
        ReverseConnectionMachine::Options opt;
        opt.queue_capacity = capacity;
        opt.request_ttl = 30000ms;
        opt.initial_backoff = 1000ms;
        opt.max_backoff = 60000ms;
        return std::make_unique<ReverseConnectionMachine>(
            session, bus,
            [this] { return enabled; },
            [this](const std::string& s) { sent.push_back(json::parse(s)); },
            opt,
            [this] { return now; });
    }

    static std::string tap_request(int id, int x = 1, int y = 2) {
        return json{{"jsonrpc", "2.0"}, {"id", id}, {"method", "tools/call"},
                    {"params", {{"name", "android.tap"}, {"arguments", {{"x", x}, {"y", y}}}}}}.dump();
    }

    static std::string initialize_request(int id = 0) {
        return json{{"jsonrpc", "2.0"}, {"id", id}, {"method", "initialize"},
                    {"params", {{"protocolVersion", "2024-11-05"}}}}.dump();
    }

    void open(ReverseConnectionMachine& m) {
        ASSERT_TRUE(m.begin_connect());
        m.on_open();
        ASSERT_EQ(m.state(), ConnectionState::AwaitingHandshake);
    }

    EventBus bus;
    config::ConfigStore config;
    SimulatedDevice device;
    DeviceGateway gateway;
    CommandDispatcher dispatcher;
    ToolRegistry registry;
    RpcSession session;

    bool enabled = true;
    std::vector<json> sent;
    ReverseConnectionMachine::Clock::time_point now = ReverseConnectionMachine::Clock::now();
};

// ---------------------------------------------------------------------------
// Lifecycle
// ---------------------------------------------------------------------------
TEST_F(ReverseMachineTest, DisabledStaysDisconnected) {
    enabled = false;
    auto m = make_machine();
    EXPECT_FALSE(m->begin_connect());
    EXPECT_EQ(m->state(), ConnectionState::Disconnected);
    EXPECT_FALSE(m->schedule_retry().has_value());
}

TEST_F(ReverseMachineTest, StateEventsPublished) {
    std::vector<std::pair<int, int>> transitions;
    auto sub = bus.subscribe<ConnectionStateEvent>([&](const ConnectionStateEvent& e) {
        transitions.emplace_back(e.old_state, e.new_state);
    });

    auto m = make_machine();
    open(*m);
    m->on_message(initialize_request());
    m->on_closed("remote closed");

    ASSERT_EQ(transitions.size(), 4u);
    EXPECT_EQ(transitions[0].second, static_cast<int>(ConnectionState::Connecting));
    EXPECT_EQ(transitions[1].second, static_cast<int>(ConnectionState::AwaitingHandshake));
    EXPECT_EQ(transitions[2].second, static_cast<int>(ConnectionState::Ready));
    EXPECT_EQ(transitions[3].second, static_cast<int>(ConnectionState::Disconnected));
}

TEST_F(ReverseMachineTest, BeginConnectOnlyFromDisconnected) {
    auto m = make_machine();
    EXPECT_TRUE(m->begin_connect());
    EXPECT_FALSE(m->begin_connect());
    EXPECT_EQ(m->state(), ConnectionState::Connecting);
}

TEST_F(ReverseMachineTest, BackoffGrowsAndResetsOnOpen) {
    auto m = make_machine();
    ASSERT_TRUE(m->begin_connect());
    m->on_failure("connection refused");
    EXPECT_EQ(m->schedule_retry()->count(), 1000);
    ASSERT_TRUE(m->begin_connect());
    m->on_failure("connection refused");
    EXPECT_EQ(m->schedule_retry()->count(), 2000);
    ASSERT_TRUE(m->begin_connect());
    m->on_failure("connection refused");
    EXPECT_EQ(m->schedule_retry()->count(), 4000);

    ASSERT_TRUE(m->begin_connect());
    m->on_open();
    EXPECT_EQ(m->backoff().failures(), 0);
    m->on_closed("bye");
    EXPECT_EQ(m->schedule_retry()->count(), 1000);
}

// ---------------------------------------------------------------------------
// Handshake
// ---------------------------------------------------------------------------
TEST_F(ReverseMachineTest, InitializeMakesReady) {
    auto m = make_machine();
    open(*m);
    m->on_message(initialize_request(5));

    EXPECT_EQ(m->state(), ConnectionState::Ready);
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0]["id"], 5);
    EXPECT_EQ(sent[0]["result"]["protocolVersion"], "2024-11-05");
}

TEST_F(ReverseMachineTest, ListAndPingAnsweredBeforeHandshake) {
    auto m = make_machine();
    open(*m);
    m->on_message(R"({"jsonrpc":"2.0","id":1,"method":"tools/list"})");
    m->on_message(R"({"jsonrpc":"2.0","id":2,"method":"ping"})");

    EXPECT_EQ(m->state(), ConnectionState::AwaitingHandshake);
    ASSERT_EQ(sent.size(), 2u);
    EXPECT_TRUE(sent[0]["result"]["tools"].is_array());
    EXPECT_TRUE(sent[1]["result"].is_object());
}

TEST_F(ReverseMachineTest, ParseErrorReplied) {
    auto m = make_machine();
    open(*m);
    m->on_message("{{{");
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0]["error"]["code"], rpc::PARSE_ERROR);
}

TEST_F(ReverseMachineTest, InboundResponsesIgnored) {
    auto m = make_machine();
    open(*m);
    m->on_message(R"({"jsonrpc":"2.0","id":1,"result":{}})");
    EXPECT_TRUE(sent.empty());
}

// ---------------------------------------------------------------------------
// Pending queue
// ---------------------------------------------------------------------------
TEST_F(ReverseMachineTest, CallBeforeHandshakeIsQueuedWithNotice) {
    auto m = make_machine();
    open(*m);
    m->on_message(tap_request(1));

    EXPECT_EQ(m->queue_size(), 1u);
    EXPECT_TRUE(device.gesture_log().empty());
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0]["method"], "notifications/queued");
    EXPECT_EQ(sent[0]["params"]["requestId"], 1);
    EXPECT_EQ(sent[0]["params"]["code"], rpc::QUEUED);
    EXPECT_FALSE(sent[0].contains("id"));
}

TEST_F(ReverseMachineTest, QueueBoundRejectsEleventh) {
    auto m = make_machine(10);
    open(*m);
    for (int i = 1; i <= 10; ++i) m->on_message(tap_request(i));
    EXPECT_EQ(m->queue_size(), 10u);

    sent.clear();
    m->on_message(tap_request(11));
    EXPECT_EQ(m->queue_size(), 10u);
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0]["id"], 11);
    EXPECT_EQ(sent[0]["error"]["code"], rpc::QUEUE_FULL);
    EXPECT_EQ(sent[0]["error"]["message"], "Request queue full, retry later");
}

TEST_F(ReverseMachineTest, QueueDrainsInOrderAfterInitialize) {
    auto m = make_machine();
    open(*m);
    m->on_message(tap_request(1, 10, 10));
    m->on_message(tap_request(2, 20, 20));
    m->on_message(tap_request(3, 30, 30));
    sent.clear();

    m->on_message(initialize_request(0));
    EXPECT_EQ(m->queue_size(), 0u);

    // initialize reply first, then 1, 2, 3
    ASSERT_EQ(sent.size(), 4u);
    EXPECT_EQ(sent[0]["id"], 0);
    EXPECT_EQ(sent[1]["id"], 1);
    EXPECT_EQ(sent[2]["id"], 2);
    EXPECT_EQ(sent[3]["id"], 3);

    auto log = device.gesture_log();
    ASSERT_EQ(log.size(), 3u);
    EXPECT_EQ(log[0], "tap:10,10");
    EXPECT_EQ(log[2], "tap:30,30");
}

TEST_F(ReverseMachineTest, ExpiredRequestsDroppedSilently) {
    auto m = make_machine();
    open(*m);
    m->on_message(tap_request(1));
    now += 20s;
    m->on_message(tap_request(2));
    now += 15s;  // 1 は 35s 経過、2 は 15s
    sent.clear();

    m->on_message(initialize_request(0));
    ASSERT_EQ(sent.size(), 2u);
    EXPECT_EQ(sent[1]["id"], 2);
    EXPECT_EQ(device.gesture_log().size(), 1u);
}

TEST_F(ReverseMachineTest, ExpiredEntriesFreeCapacity) {
    auto m = make_machine(2);
    open(*m);
    m->on_message(tap_request(1));
    m->on_message(tap_request(2));
    now += 31s;
    sent.clear();

    m->on_message(tap_request(3));
    EXPECT_EQ(m->queue_size(), 1u);
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0]["method"], "notifications/queued");
}

TEST_F(ReverseMachineTest, DisconnectClearsQueue) {
    auto m = make_machine();
    open(*m);
    m->on_message(tap_request(1));
    m->on_message(tap_request(2));
    m->on_failure("reset by peer");
    EXPECT_EQ(m->queue_size(), 0u);
    EXPECT_EQ(m->state(), ConnectionState::Disconnected);
    EXPECT_FALSE(session.initialized());
}

TEST_F(ReverseMachineTest, ReadyHandlesCallsDirectly) {
    auto m = make_machine();
    open(*m);
    m->on_message(initialize_request());
    sent.clear();

    m->on_message(tap_request(42, 7, 8));
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0]["id"], 42);
    EXPECT_EQ(device.gesture_log().back(), "tap:7,8");
}

// ---------------------------------------------------------------------------
// Connected notification: once per process
// ---------------------------------------------------------------------------
TEST_F(ReverseMachineTest, NotificationOnlyOnce) {
    std::vector<ConnectionNotificationEvent> notes;
    auto sub = bus.subscribe<ConnectionNotificationEvent>([&](const ConnectionNotificationEvent& e) {
        notes.push_back(e);
    });

    auto m = make_machine();
    open(*m);
    m->on_message(initialize_request());
    m->on_closed("drop");
    open(*m);
    m->on_message(initialize_request());

    ASSERT_EQ(notes.size(), 1u);
    EXPECT_EQ(notes[0].tool_count, registry.size());
    EXPECT_NE(notes[0].message.find("tools available"), std::string::npos);
    EXPECT_TRUE(m->has_notified());
}

// ---------------------------------------------------------------------------
// Options / URL
// ---------------------------------------------------------------------------
TEST(ReverseOptionsTest, FromSettings) {
    config::ReverseSettings s;
    s.queue_capacity = 3;
    s.request_ttl_ms = 500;
    s.max_backoff_ms = 8000;
    auto o = ReverseConnectionMachine::Options::from_settings(s);
    EXPECT_EQ(o.queue_capacity, 3u);
    EXPECT_EQ(o.request_ttl.count(), 500);
    EXPECT_EQ(o.initial_backoff.count(), 1000);
    EXPECT_EQ(o.max_backoff.count(), 8000);
}

TEST(WsUrlTest, Parses) {
    auto r = parse_ws_url("ws://10.0.2.2:9100/mcp/device");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value().host, "10.0.2.2");
    EXPECT_EQ(r.value().port, "9100");
    EXPECT_EQ(r.value().path, "/mcp/device");

    auto d = parse_ws_url("ws://relay.example.com");
    ASSERT_TRUE(d.is_ok());
    EXPECT_EQ(d.value().port, "80");
    EXPECT_EQ(d.value().path, "/");
}

TEST(WsUrlTest, Rejects) {
    EXPECT_TRUE(parse_ws_url("wss://secure.example.com").is_err());
    EXPECT_TRUE(parse_ws_url("http://example.com").is_err());
    EXPECT_TRUE(parse_ws_url("ws://host:abc/").is_err());
    EXPECT_TRUE(parse_ws_url("ws://:9000/").is_err());
    EXPECT_TRUE(parse_ws_url("").is_err());
}

TEST(ConnectionStateTest, Names) {
    EXPECT_STREQ(connection_state_name(ConnectionState::AwaitingHandshake), "AwaitingHandshake");
    EXPECT_STREQ(connection_state_name(ConnectionState::Ready), "Ready");
}
