#pragma once
// =============================================================================
// PortalBridge - WebSocket JSON-RPC Server
// =============================================================================
// MCP over WebSocket (default port 8081) using Boost.Beast.
// One io thread and one session at a time: messages of that session are
// handled strictly in arrival order; a second client is refused while the
// first one is connected.
// =============================================================================

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core.hpp>

#include "config_store.hpp"
#include "mcp/tool_registry.hpp"

namespace portal {

class WebSocketServer {
public:
    static constexpr size_t MAX_MESSAGE_BYTES = 10 * 1024 * 1024;

    WebSocketServer(mcp::ToolRegistry& registry, config::ConfigStore& config);
    ~WebSocketServer();

    WebSocketServer(const WebSocketServer&) = delete;
    WebSocketServer& operator=(const WebSocketServer&) = delete;

    bool start(int port);
    void stop();
    bool is_running() const { return running_.load(); }
    int port() const { return port_.load(); }
    bool has_session() const { return session_active_.load(); }

    // accept 失敗時の扱い: 停止 / 即再試行 / 少し待って再試行 (fd 枯渇)
    enum class AcceptRetry { Stop, Now, Later };
    static AcceptRetry accept_retry_for(const boost::beast::error_code& ec, bool running);
    static constexpr int ACCEPT_RETRY_DELAY_MS = 200;

private:
    class Session;

    void do_accept();
    void on_accept(boost::beast::error_code ec, boost::asio::ip::tcp::socket socket);

    mcp::ToolRegistry& registry_;
    config::ConfigStore& config_;

    std::mutex lifecycle_mutex_;
    std::atomic<bool> running_{false};
    std::atomic<int> port_{0};
    std::atomic<bool> session_active_{false};

    boost::asio::io_context ioc_;
    std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;
    boost::asio::steady_timer accept_retry_{ioc_};
    std::weak_ptr<Session> session_;  // io thread only
    std::thread io_thread_;
};

} // namespace portal
