// =============================================================================
// Socket tests for ReverseConnectionClient (src/reverse_connection.hpp)
// Tests: dial-out to an in-process Beast acceptor, queued call before the
//        handshake, FIFO drain, reconnect, wss:// rejection, shutdown
// =============================================================================
#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include "reverse_connection.hpp"
#include "mcp/device_tools.hpp"
#include "simulated_device.hpp"

using namespace portal;
using nlohmann::json;
using namespace std::chrono_literals;

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;

// ---------------------------------------------------------------------------
// Remote MCP client side: accepts the device's connection
// ---------------------------------------------------------------------------
class RemotePeer {
public:
    RemotePeer() : acceptor_(ioc_, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0)) {}

    int port() const { return acceptor_.local_endpoint().port(); }

    bool accept(std::chrono::milliseconds limit = 5000ms) {
        ws_.reset();
        bool done = false;
        beast::error_code result;
        acceptor_.async_accept([&](beast::error_code ec, tcp::socket socket) {
            if (ec) {
                result = ec;
                done = true;
                return;
            }
            ws_ = std::make_unique<websocket::stream<tcp::socket>>(std::move(socket));
            ws_->async_accept([&](beast::error_code hs) {
                result = hs;
                done = true;
            });
        });
        if (!run_until(done, limit)) {
            acceptor_.cancel();
            if (ws_) beast::get_lowest_layer(*ws_).cancel();
            drain(done);
        }
        return !result && ws_ != nullptr;
    }

    std::optional<json> read(std::chrono::milliseconds limit = 5000ms) {
        if (!ws_) return std::nullopt;
        buffer_.clear();
        bool done = false;
        beast::error_code result;
        ws_->async_read(buffer_, [&](beast::error_code ec, std::size_t) {
            result = ec;
            done = true;
        });
        if (!run_until(done, limit)) {
            beast::get_lowest_layer(*ws_).cancel();
            drain(done);
            return std::nullopt;
        }
        if (result) return std::nullopt;
        return json::parse(beast::buffers_to_string(buffer_.data()));
    }

    void write(const json& message) {
        ws_->text(true);
        ws_->write(net::buffer(message.dump()));
    }

    void close() {
        beast::error_code ec;
        if (ws_) ws_->close(websocket::close_code::normal, ec);
    }

private:
    bool run_until(const bool& done, std::chrono::milliseconds limit) {
        ioc_.restart();
        const auto deadline = std::chrono::steady_clock::now() + limit;
        while (!done && std::chrono::steady_clock::now() < deadline) ioc_.run_one_for(50ms);
        return done;
    }

    // キャンセル後、ハンドラの完了を待つ
    void drain(const bool& done) {
        ioc_.restart();
        while (!done) ioc_.run_one_for(50ms);
    }

    net::io_context ioc_;
    tcp::acceptor acceptor_;
    std::unique_ptr<websocket::stream<tcp::socket>> ws_;
    beast::flat_buffer buffer_;
};

// ---------------------------------------------------------------------------
// Fixture
// ---------------------------------------------------------------------------
class ReverseClientTest : public ::testing::Test {
protected:
    ReverseClientTest() : config(bus), gateway(device), dispatcher(gateway, config) {
        mcp::register_device_tools(registry, dispatcher);
        device.set_tree(RawNode{});
        notify_sub = bus.subscribe<ConnectionNotificationEvent>(
            [this](const ConnectionNotificationEvent&) { notifications++; });
    }

    void configure(const std::string& url) {
        json doc = {{"reverse", {{"enabled", true}, {"url", url}, {"initial_backoff_ms", 50},
                                 {"max_backoff_ms", 200}}}};
        ASSERT_TRUE(config.load_from_string(doc.dump()).is_ok());
    }

    static bool waitFor(const std::function<bool()>& cond, std::chrono::milliseconds limit = 3000ms) {
        const auto deadline = std::chrono::steady_clock::now() + limit;
        while (std::chrono::steady_clock::now() < deadline) {
            if (cond()) return true;
            std::this_thread::sleep_for(10ms);
        }
        return cond();
    }

    static json tap(int id, int x, int y) {
        return {{"jsonrpc", "2.0"}, {"id", id}, {"method", "tools/call"},
                {"params", {{"name", "android.tap"}, {"arguments", {{"x", x}, {"y", y}}}}}};
    }

    static json initialize(int id) {
        return {{"jsonrpc", "2.0"}, {"id", id}, {"method", "initialize"},
                {"params", {{"protocolVersion", "2024-11-05"}}}};
    }

    EventBus bus;
    config::ConfigStore config;
    SimulatedDevice device;
    DeviceGateway gateway;
    CommandDispatcher dispatcher;
    mcp::ToolRegistry registry;
    std::atomic<int> notifications{0};
    SubscriptionHandle notify_sub;
};

// ---------------------------------------------------------------------------
// Connect -> queue -> handshake -> drain
// ---------------------------------------------------------------------------
TEST_F(ReverseClientTest, QueuedCallDrainedAfterHandshake) {
    RemotePeer peer;
    configure("ws://127.0.0.1:" + std::to_string(peer.port()) + "/mcp");
    ReverseConnectionClient client(registry, config, bus);
    ASSERT_TRUE(client.start());

    ASSERT_TRUE(peer.accept());
    ASSERT_TRUE(waitFor([&] { return client.state() == ConnectionState::AwaitingHandshake; }));

    // ハンドシェイク前の呼び出しはキューに入る
    peer.write(tap(5, 30, 40));
    auto note = peer.read();
    ASSERT_TRUE(note.has_value());
    EXPECT_EQ((*note)["method"], "notifications/queued");
    EXPECT_EQ((*note)["params"]["requestId"], 5);
    EXPECT_EQ((*note)["params"]["code"], -32001);
    EXPECT_TRUE(device.gesture_log().empty());

    peer.write(initialize(1));
    auto init = peer.read();
    ASSERT_TRUE(init.has_value());
    EXPECT_EQ((*init)["id"], 1);
    EXPECT_EQ((*init)["result"]["serverInfo"]["name"], "portal-bridge");

    auto drained = peer.read();
    ASSERT_TRUE(drained.has_value());
    EXPECT_EQ((*drained)["id"], 5);
    EXPECT_EQ((*drained)["result"]["content"][0]["type"], "text");
    ASSERT_EQ(device.gesture_log().size(), 1u);
    EXPECT_EQ(device.gesture_log()[0], "tap:30,40");

    EXPECT_EQ(client.state(), ConnectionState::Ready);
    EXPECT_EQ(notifications.load(), 1);

    peer.write({{"jsonrpc", "2.0"}, {"id", 6}, {"method", "ping"}});
    auto pong = peer.read();
    ASSERT_TRUE(pong.has_value());
    EXPECT_EQ((*pong)["id"], 6);

    client.stop();
    EXPECT_EQ(client.state(), ConnectionState::Disconnected);
}

TEST_F(ReverseClientTest, ReconnectsAfterRemoteClose) {
    RemotePeer peer;
    configure("ws://127.0.0.1:" + std::to_string(peer.port()) + "/");
    ReverseConnectionClient client(registry, config, bus);
    ASSERT_TRUE(client.start());

    ASSERT_TRUE(peer.accept());
    peer.write(initialize(1));
    ASSERT_TRUE(peer.read().has_value());
    ASSERT_TRUE(waitFor([&] { return client.state() == ConnectionState::Ready; }));

    peer.close();
    ASSERT_TRUE(peer.accept());  // backoff 50 ms 後に再接続
    peer.write(initialize(2));
    auto init = peer.read();
    ASSERT_TRUE(init.has_value());
    EXPECT_EQ((*init)["id"], 2);

    // 通知はプロセス中1回だけ
    EXPECT_EQ(notifications.load(), 1);
    client.stop();
}

TEST_F(ReverseClientTest, ListAnsweredBeforeHandshake) {
    RemotePeer peer;
    configure("ws://127.0.0.1:" + std::to_string(peer.port()) + "/");
    ReverseConnectionClient client(registry, config, bus);
    ASSERT_TRUE(client.start());
    ASSERT_TRUE(peer.accept());

    peer.write({{"jsonrpc", "2.0"}, {"id", 3}, {"method", "tools/list"}});
    auto list = peer.read();
    ASSERT_TRUE(list.has_value());
    EXPECT_EQ((*list)["result"]["tools"].size(), registry.size());
    EXPECT_EQ(client.state(), ConnectionState::AwaitingHandshake);
    client.stop();
}

// ---------------------------------------------------------------------------
// Refusals
// ---------------------------------------------------------------------------
TEST_F(ReverseClientTest, SecureUrlRejected) {
    configure("wss://relay.example.com/mcp");
    ReverseConnectionClient client(registry, config, bus);
    EXPECT_FALSE(client.start());
    EXPECT_FALSE(client.is_running());
    EXPECT_EQ(client.state(), ConnectionState::Disconnected);
}

TEST_F(ReverseClientTest, DisabledDoesNotStart) {
    ASSERT_TRUE(config.load_from_string(R"({"reverse": {"enabled": false, "url": "ws://127.0.0.1:1/"}})").is_ok());
    ReverseConnectionClient client(registry, config, bus);
    EXPECT_FALSE(client.start());
}

TEST_F(ReverseClientTest, NoStartAfterShutdownEvent) {
    RemotePeer peer;
    ASSERT_TRUE(config.load_from_string(R"({"reverse": {"enabled": false}})").is_ok());
    ReverseConnectionClient client(registry, config, bus);

    bus.publish(ShutdownEvent{});
    config.set("reverse", "url", "ws://127.0.0.1:" + std::to_string(peer.port()) + "/");
    config.set("reverse", "enabled", true);
    std::this_thread::sleep_for(200ms);

    EXPECT_FALSE(client.is_running());
    EXPECT_FALSE(client.start());
}

TEST_F(ReverseClientTest, EnabledByConfigChange) {
    RemotePeer peer;
    ASSERT_TRUE(config.load_from_string(R"({"reverse": {"enabled": false}})").is_ok());
    ReverseConnectionClient client(registry, config, bus);

    config.set("reverse", "url", "ws://127.0.0.1:" + std::to_string(peer.port()) + "/");
    config.set("reverse", "enabled", true);
    ASSERT_TRUE(peer.accept());
    EXPECT_TRUE(waitFor([&] { return client.is_running(); }));
    client.stop();
}
