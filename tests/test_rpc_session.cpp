// =============================================================================
// Unit tests for the MCP JSON-RPC session and the android.* device tools
// =============================================================================
#include <gtest/gtest.h>
#include "mcp/rpc_session.hpp"
#include "mcp/device_tools.hpp"
#include "simulated_device.hpp"

using namespace portal;
using namespace portal::mcp;
using nlohmann::json;

// ---------------------------------------------------------------------------
// Fixture
// ---------------------------------------------------------------------------
class RpcSessionTest : public ::testing::Test {
protected:
    RpcSessionTest()
        : config(bus), gateway(device), dispatcher(gateway, config), session(registry, config) {
        register_device_tools(registry, dispatcher);
    }

    void SetUp() override {
        RawNode root;
        root.class_name = "android.widget.FrameLayout";
        root.bounds = {0, 0, 1080, 2400};
        RawNode ok;
        ok.class_name = "android.widget.Button";
        ok.text = "OK";
        ok.clickable = true;
        ok.bounds = {0, 0, 200, 100};
        root.children.push_back(ok);
        device.set_tree(root);
    }

    json call(const std::string& tool, json args = json::object(), json id = 7) {
        json req = {{"jsonrpc", "2.0"}, {"id", id}, {"method", "tools/call"},
                    {"params", {{"name", tool}, {"arguments", args}}}};
        auto reply = session.handle(req);
        EXPECT_TRUE(reply.has_value());
        return reply ? *reply : json();
    }

    // content[0].text をパースしたツール出力
    static json tool_output(const json& reply) {
        return json::parse(reply["result"]["content"][0]["text"].get<std::string>());
    }

    EventBus bus;
    config::ConfigStore config;
    SimulatedDevice device;
    DeviceGateway gateway;
    CommandDispatcher dispatcher;
    ToolRegistry registry;
    RpcSession session;
};

// ---------------------------------------------------------------------------
// Classification / envelopes
// ---------------------------------------------------------------------------
TEST(RpcEnvelopeTest, Classification) {
    EXPECT_TRUE(RpcSession::is_request({{"method", "ping"}, {"id", 1}}));
    EXPECT_TRUE(RpcSession::is_notification({{"method", "notifications/initialized"}}));
    EXPECT_TRUE(RpcSession::is_notification({{"method", "x"}, {"id", nullptr}}));
    EXPECT_TRUE(RpcSession::is_response({{"id", 1}, {"result", json::object()}}));
    EXPECT_FALSE(RpcSession::is_response({{"id", 1}, {"method", "ping"}}));
}

TEST(RpcEnvelopeTest, ErrorShape) {
    auto e = RpcSession::make_error("abc", rpc::METHOD_NOT_FOUND, "Method not found: x");
    EXPECT_EQ(e["jsonrpc"], "2.0");
    EXPECT_EQ(e["id"], "abc");
    EXPECT_EQ(e["error"]["code"], -32601);
    EXPECT_FALSE(e.contains("result"));
}

// ---------------------------------------------------------------------------
// Protocol methods
// ---------------------------------------------------------------------------
TEST_F(RpcSessionTest, Initialize) {
    EXPECT_FALSE(session.initialized());
    auto reply = session.handle({{"jsonrpc", "2.0"}, {"id", 1}, {"method", "initialize"},
                                 {"params", {{"protocolVersion", "2024-11-05"}}}});
    ASSERT_TRUE(reply.has_value());
    EXPECT_EQ((*reply)["id"], 1);
    EXPECT_EQ((*reply)["result"]["protocolVersion"], "2024-11-05");
    EXPECT_EQ((*reply)["result"]["serverInfo"]["name"], "portal-bridge");
    EXPECT_TRUE((*reply)["result"]["capabilities"].contains("tools"));
    EXPECT_TRUE(session.initialized());

    session.reset();
    EXPECT_FALSE(session.initialized());
}

TEST_F(RpcSessionTest, NotificationsGetNoReply) {
    EXPECT_FALSE(session.handle({{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}}).has_value());
    EXPECT_FALSE(session.handle({{"jsonrpc", "2.0"}, {"method", "tools/call"}}).has_value());
}

TEST_F(RpcSessionTest, InboundResponsesIgnored) {
    EXPECT_FALSE(session.handle({{"jsonrpc", "2.0"}, {"id", 3}, {"result", json::object()}}).has_value());
}

TEST_F(RpcSessionTest, ToolsListAll) {
    auto reply = session.handle({{"jsonrpc", "2.0"}, {"id", 2}, {"method", "tools/list"}});
    ASSERT_TRUE(reply.has_value());
    const auto& tools = (*reply)["result"]["tools"];
    EXPECT_EQ(tools.size(), registry.size());
    EXPECT_EQ(tools[0]["name"], "android.screen.dump");
    EXPECT_TRUE(tools[0].contains("inputSchema"));
}

TEST_F(RpcSessionTest, ToolsListFiltered) {
    config.set("tools", "enabled", json::array({"android.tap", "android.swipe"}));
    auto reply = session.handle({{"jsonrpc", "2.0"}, {"id", 2}, {"method", "tools/list"}});
    ASSERT_TRUE(reply.has_value());
    const auto& tools = (*reply)["result"]["tools"];
    ASSERT_EQ(tools.size(), 2u);
    EXPECT_EQ(session.enabled_tool_count(), 2u);
}

TEST_F(RpcSessionTest, UnknownMethod) {
    auto reply = session.handle({{"jsonrpc", "2.0"}, {"id", 4}, {"method", "resources/list"}});
    ASSERT_TRUE(reply.has_value());
    EXPECT_EQ((*reply)["error"]["code"], rpc::METHOD_NOT_FOUND);
    EXPECT_EQ((*reply)["id"], 4);
}

TEST_F(RpcSessionTest, PingReturnsEmptyObject) {
    auto reply = session.handle({{"jsonrpc", "2.0"}, {"id", "p"}, {"method", "ping"}});
    ASSERT_TRUE(reply.has_value());
    EXPECT_TRUE((*reply)["result"].is_object());
    EXPECT_TRUE((*reply)["result"].empty());
}

TEST_F(RpcSessionTest, ParseAndShapeErrors) {
    auto text = session.handle_text("{not json");
    ASSERT_TRUE(text.has_value());
    auto j = json::parse(*text);
    EXPECT_EQ(j["error"]["code"], rpc::PARSE_ERROR);
    EXPECT_TRUE(j["id"].is_null());

    auto arr = session.handle(json::array({1, 2}));
    ASSERT_TRUE(arr.has_value());
    EXPECT_EQ((*arr)["error"]["code"], rpc::INVALID_REQUEST);
}

// ---------------------------------------------------------------------------
// tools/call
// ---------------------------------------------------------------------------
TEST_F(RpcSessionTest, CallTapWrapsOutputAsText) {
    auto reply = call("android.tap", {{"x", 100}, {"y", 50}});
    EXPECT_EQ(reply["id"], 7);
    EXPECT_EQ(reply["result"]["content"][0]["type"], "text");
    EXPECT_FALSE(reply["result"].contains("isError"));

    auto out = tool_output(reply);
    EXPECT_TRUE(out["success"].get<bool>());
    EXPECT_EQ(out["message"], "Tap performed at (100, 50)");
    EXPECT_EQ(device.gesture_log().back(), "tap:100,50");
}

TEST(ToolArgsTest, ArgIntRoundsAndSaturates) {
    json a = json::parse(R"({"f": 2.5, "big": 1e20, "neg": -1e300,
                             "i64": -9000000000, "s": "12", "b": true})");
    EXPECT_EQ(arg_int(a, "f"), 3);
    EXPECT_EQ(arg_int(a, "big"), INT32_MAX);
    EXPECT_EQ(arg_int(a, "neg"), INT32_MIN);
    EXPECT_EQ(arg_int(a, "i64"), INT32_MIN);
    EXPECT_FALSE(arg_int(a, "s").has_value());
    EXPECT_FALSE(arg_int(a, "b").has_value());
    EXPECT_FALSE(arg_int(a, "missing").has_value());
}

TEST_F(RpcSessionTest, CallTapWithHugeCoordinate) {
    auto reply = call("android.tap", json::parse(R"({"x": 1e20, "y": 5})"));
    EXPECT_FALSE(reply["result"].contains("isError"));
    EXPECT_EQ(device.gesture_log().back(), "tap:2147483647,5");
}

TEST_F(RpcSessionTest, CallMissingCoordinateIsToolError) {
    auto reply = call("android.tap", {{"x", 100}});
    EXPECT_TRUE(reply["result"]["isError"].get<bool>());
    EXPECT_EQ(tool_output(reply)["error"], "Missing required parameter: y");
    EXPECT_TRUE(device.gesture_log().empty());
}

TEST_F(RpcSessionTest, CallDeviceFailureIsToolError) {
    device.fail_gestures(true);
    auto reply = call("android.swipe", {{"startX", 0}, {"startY", 0}, {"endX", 10}, {"endY", 10}});
    EXPECT_TRUE(reply["result"]["isError"].get<bool>());
    EXPECT_EQ(tool_output(reply)["error"], "Failed to perform swipe");
}

TEST_F(RpcSessionTest, CallUnknownOrDisabledTool) {
    auto reply = call("android.fly");
    EXPECT_EQ(reply["error"]["code"], rpc::INVALID_PARAMS);

    config.set("tools", "enabled", json::array({"android.screen.dump"}));
    auto disabled = call("android.tap", {{"x", 1}, {"y", 1}});
    EXPECT_EQ(disabled["error"]["code"], rpc::INVALID_PARAMS);
    EXPECT_TRUE(device.gesture_log().empty());
}

TEST_F(RpcSessionTest, CallWithoutName) {
    auto reply = session.handle({{"jsonrpc", "2.0"}, {"id", 9}, {"method", "tools/call"},
                                 {"params", json::object()}});
    ASSERT_TRUE(reply.has_value());
    EXPECT_EQ((*reply)["error"]["code"], rpc::INVALID_PARAMS);
}

TEST_F(RpcSessionTest, ToolExceptionIsInternalError) {
    registry.add({"test.boom", "throws", object_schema({})},
                 [](const json&) -> json { throw std::runtime_error("kaboom"); });
    auto reply = call("test.boom");
    EXPECT_EQ(reply["error"]["code"], rpc::INTERNAL_ERROR);
    EXPECT_NE(reply["error"]["message"].get<std::string>().find("kaboom"), std::string::npos);
}

// ---------------------------------------------------------------------------
// Device tools
// ---------------------------------------------------------------------------
TEST_F(RpcSessionTest, ScreenDump) {
    auto out = tool_output(call("android.screen.dump"));
    ASSERT_TRUE(out["success"].get<bool>());
    const auto text = out["text"].get<std::string>();
    EXPECT_NE(text.find("[Button] OK"), std::string::npos);
    EXPECT_NE(text.find("App: Launcher"), std::string::npos);
}

TEST_F(RpcSessionTest, PackagesListFilter) {
    std::vector<PackageInfo> pkgs(2);
    pkgs[0].package_name = "com.android.settings";
    pkgs[0].label = "Settings";
    pkgs[0].is_system_app = true;
    pkgs[1].package_name = "com.example.mail";
    pkgs[1].label = "Mail";
    device.set_packages(pkgs);

    auto user = tool_output(call("android.packages.list"));
    EXPECT_EQ(user["count"], 1);
    EXPECT_EQ(user["packages"][0]["label"], "Mail");

    auto all = tool_output(call("android.packages.list", {{"filter", "all"}}));
    EXPECT_EQ(all["count"], 2);

    auto bad = call("android.packages.list", {{"filter", "weird"}});
    EXPECT_TRUE(bad["result"]["isError"].get<bool>());
}

TEST_F(RpcSessionTest, TextInputEncodesForDispatcher) {
    device.set_focused_field(FocusedNode{"com.app:id/q", "", {}});
    auto out = tool_output(call("android.text.input", {{"text", "\xE6\x97\xA5\xE6\x9C\xAC"}}));
    EXPECT_TRUE(out["success"].get<bool>());
    EXPECT_EQ(device.focused_text(), "\xE6\x97\xA5\xE6\x9C\xAC");
}

TEST_F(RpcSessionTest, LaunchAppRequiresPackage) {
    auto reply = call("android.launch_app");
    EXPECT_TRUE(reply["result"]["isError"].get<bool>());
    auto ok = tool_output(call("android.launch_app", {{"package", "com.example.mail"}}));
    EXPECT_TRUE(ok["success"].get<bool>());
    EXPECT_EQ(device.launched().back(), "com.example.mail");
}

TEST_F(RpcSessionTest, HandleTextRoundTrip) {
    auto text = session.handle_text(R"({"jsonrpc":"2.0","id":11,"method":"tools/call",)"
                                    R"("params":{"name":"android.key.send","arguments":{"key_code":4}}})");
    ASSERT_TRUE(text.has_value());
    auto j = json::parse(*text);
    EXPECT_EQ(j["id"], 11);
    // 入力欄が無いので key.send は失敗する
    EXPECT_TRUE(j["result"]["isError"].get<bool>());
}
