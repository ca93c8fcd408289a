#pragma once
// =============================================================================
// PortalBridge - Reverse Connection
// =============================================================================
// The device dials out to a remote MCP client and serves the tool set over
// that socket (JSON-RPC server role on a client-initiated WebSocket).
//
//   Disconnected --begin_connect--> Connecting --on_open--> AwaitingHandshake
//        ^                                                        |
//        |                                             initialize handled
//        +------ on_closed / on_failure (backoff) <---- Ready <---+
//
// ReverseConnectionMachine holds the protocol state and is driven by plain
// callbacks, so it runs without sockets in the tests.
// ReverseConnectionClient is the Boost.Beast transport around it.
// =============================================================================

#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include "nlohmann/json.hpp"
#include "config_store.hpp"
#include "event_bus.hpp"
#include "mcp/rpc_session.hpp"
#include "result.hpp"

namespace portal {

enum class ConnectionState : int {
    Disconnected = 0,
    Connecting,
    AwaitingHandshake,
    Ready,
};

const char* connection_state_name(ConnectionState s);

// =============================================================================
// BackoffPolicy - 1s, 2s, 4s ... capped; reset() after a successful open
// =============================================================================

class BackoffPolicy {
public:
    BackoffPolicy(std::chrono::milliseconds initial, std::chrono::milliseconds max)
        : initial_(initial), max_(max), current_(initial) {}

    // Delay for this failure; the following one doubles
    std::chrono::milliseconds next_delay();
    void reset();

    std::chrono::milliseconds peek() const { return current_; }
    int failures() const { return failures_; }

private:
    std::chrono::milliseconds initial_;
    std::chrono::milliseconds max_;
    std::chrono::milliseconds current_;
    int failures_ = 0;
};

// =============================================================================
// ReverseConnectionMachine
// =============================================================================

struct PendingRequest {
    nlohmann::json id;
    std::string method;
    nlohmann::json message;  // original request, replayed through RpcSession
    std::chrono::steady_clock::time_point enqueued_at;
};

class ReverseConnectionMachine {
public:
    using Clock = std::chrono::steady_clock;
    using SendFn = std::function<void(const std::string&)>;
    using NowFn = std::function<Clock::time_point()>;
    using EnabledFn = std::function<bool()>;

    struct Options {
        size_t queue_capacity = config::DEFAULT_QUEUE_CAPACITY;
        std::chrono::milliseconds request_ttl{config::DEFAULT_REQUEST_TTL_MS};
        std::chrono::milliseconds initial_backoff{config::DEFAULT_INITIAL_BACKOFF_MS};
        std::chrono::milliseconds max_backoff{config::DEFAULT_MAX_BACKOFF_MS};

        static Options from_settings(const config::ReverseSettings& s);
    };

    ReverseConnectionMachine(mcp::RpcSession& rpc, EventBus& bus, EnabledFn enabled,
                             SendFn send, Options options,
                             NowFn now = [] { return Clock::now(); });

    ConnectionState state() const { return state_.load(); }

    // Disconnected -> Connecting; false (and no transition) when disabled
    bool begin_connect();
    void on_open();
    void on_closed(const std::string& reason);
    void on_failure(const std::string& reason);

    // Delay before the next attempt, or nullopt when the feature is disabled
    std::optional<std::chrono::milliseconds> schedule_retry();

    // One inbound text frame
    void on_message(const std::string& text);

    size_t queue_size() const;
    bool has_notified() const { return notified_; }
    const BackoffPolicy& backoff() const { return backoff_; }

private:
    void transition(ConnectionState next, const std::string& message);
    void disconnect(const std::string& reason);
    void handle_before_ready(const nlohmann::json& msg);
    void enqueue(const nlohmann::json& msg);
    void drain_queue();
    size_t purge_expired_locked();
    void send_json(const nlohmann::json& j);

    mcp::RpcSession& rpc_;
    EventBus& bus_;
    EnabledFn enabled_;
    SendFn send_;
    Options options_;
    NowFn now_;

    std::atomic<ConnectionState> state_{ConnectionState::Disconnected};
    BackoffPolicy backoff_;
    mutable std::mutex queue_mutex_;
    std::deque<PendingRequest> queue_;
    bool notified_ = false;  // プロセス中1回だけ通知
};

// =============================================================================
// ReverseConnectionClient - Boost.Beast transport
// =============================================================================

struct WsUrl {
    std::string host;
    std::string port = "80";
    std::string path = "/";
};

// ws://host[:port][/path]; wss:// and other schemes are rejected
Result<WsUrl> parse_ws_url(const std::string& url);

class ReverseConnectionClient {
public:
    ReverseConnectionClient(mcp::ToolRegistry& registry, config::ConfigStore& config, EventBus& bus);
    ~ReverseConnectionClient();

    ReverseConnectionClient(const ReverseConnectionClient&) = delete;
    ReverseConnectionClient& operator=(const ReverseConnectionClient&) = delete;

    // No-op (false) when reverse.enabled is off, the URL is unusable or a
    // ShutdownEvent was published
    bool start();
    void stop();
    bool is_running() const { return running_.load(); }

    // Thread-safe; dropped when no connection is open
    void send(std::string message);

    ConnectionState state() const { return machine_.state(); }

private:
    void connect();
    void on_resolve(boost::beast::error_code ec, boost::asio::ip::tcp::resolver::results_type results);
    void on_connect(boost::beast::error_code ec, boost::asio::ip::tcp::resolver::results_type::endpoint_type ep);
    void on_handshake(boost::beast::error_code ec);
    void do_read();
    void on_read(boost::beast::error_code ec, std::size_t bytes);
    void do_write();
    void on_write(boost::beast::error_code ec, std::size_t bytes);
    void fail(boost::beast::error_code ec, const char* what);
    void schedule_reconnect();
    void close_stream();

    void on_config_changed(const ConfigChangedEvent& e);

    config::ConfigStore& config_;
    mcp::RpcSession rpc_;
    ReverseConnectionMachine machine_;

    boost::asio::io_context ioc_;
    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> work_;
    boost::asio::ip::tcp::resolver resolver_;
    boost::asio::steady_timer reconnect_timer_;
    std::unique_ptr<boost::beast::websocket::stream<boost::beast::tcp_stream>> ws_;
    boost::beast::flat_buffer buffer_;
    std::deque<std::string> outbox_;  // io thread only
    bool open_ = false;               // io thread only

    WsUrl url_;
    config::ReverseSettings settings_;
    std::mutex lifecycle_mutex_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stopping_{false};
    std::atomic<bool> shutting_down_{false};  // ShutdownEvent: 再接続も再起動もしない
    std::thread io_thread_;
    boost::asio::thread_pool control_{1};
    SubscriptionHandle config_sub_;
    SubscriptionHandle shutdown_sub_;
};

} // namespace portal
