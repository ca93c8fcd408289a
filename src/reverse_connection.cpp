// =============================================================================
// PortalBridge - Reverse Connection Implementation
// =============================================================================

#include "reverse_connection.hpp"

#include <algorithm>
#include <cctype>

#include <boost/asio/connect.hpp>
#include <boost/asio/post.hpp>

#include "portal_log.hpp"

using json = nlohmann::json;
namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

namespace portal {

const char* connection_state_name(ConnectionState s) {
    switch (s) {
        case ConnectionState::Disconnected:      return "Disconnected";
        case ConnectionState::Connecting:        return "Connecting";
        case ConnectionState::AwaitingHandshake: return "AwaitingHandshake";
        case ConnectionState::Ready:             return "Ready";
    }
    return "Unknown";
}

// =============================================================================
// BackoffPolicy
// =============================================================================

std::chrono::milliseconds BackoffPolicy::next_delay() {
    const auto delay = std::min(current_, max_);
    ++failures_;
    current_ = std::min(current_ * 2, max_);
    return delay;
}

void BackoffPolicy::reset() {
    current_ = initial_;
    failures_ = 0;
}

// =============================================================================
// ReverseConnectionMachine
// =============================================================================

ReverseConnectionMachine::Options
ReverseConnectionMachine::Options::from_settings(const config::ReverseSettings& s) {
    Options o;
    o.queue_capacity = s.queue_capacity;
    o.request_ttl = std::chrono::milliseconds(s.request_ttl_ms);
    o.initial_backoff = std::chrono::milliseconds(s.initial_backoff_ms);
    o.max_backoff = std::chrono::milliseconds(s.max_backoff_ms);
    return o;
}

ReverseConnectionMachine::ReverseConnectionMachine(mcp::RpcSession& rpc, EventBus& bus,
                                                   EnabledFn enabled, SendFn send,
                                                   Options options, NowFn now)
    : rpc_(rpc), bus_(bus), enabled_(std::move(enabled)), send_(std::move(send)),
      options_(options), now_(std::move(now)),
      backoff_(options.initial_backoff, options.max_backoff) {}

void ReverseConnectionMachine::transition(ConnectionState next, const std::string& message) {
    const ConnectionState prev = state_.exchange(next);
    if (prev == next) return;
    PLOG_INFO("reverse", "%s -> %s%s%s", connection_state_name(prev), connection_state_name(next),
              message.empty() ? "" : ": ", message.c_str());

    ConnectionStateEvent ev;
    ev.old_state = static_cast<int>(prev);
    ev.new_state = static_cast<int>(next);
    ev.message = message;
    bus_.publish(ev);
}

bool ReverseConnectionMachine::begin_connect() {
    if (!enabled_()) {
        PLOG_INFO("reverse", "Reverse connection disabled, staying disconnected");
        return false;
    }
    if (state_.load() != ConnectionState::Disconnected) return false;
    transition(ConnectionState::Connecting, "");
    return true;
}

void ReverseConnectionMachine::on_open() {
    backoff_.reset();
    rpc_.reset();
    transition(ConnectionState::AwaitingHandshake, "connected, waiting for initialize");
}

void ReverseConnectionMachine::on_closed(const std::string& reason) {
    disconnect("closed: " + reason);
}

void ReverseConnectionMachine::on_failure(const std::string& reason) {
    disconnect("failure: " + reason);
}

void ReverseConnectionMachine::disconnect(const std::string& reason) {
    rpc_.reset();
    size_t dropped = 0;
    {
        // 新しい接続の相手には無意味な id なので捨てる
        std::lock_guard<std::mutex> lk(queue_mutex_);
        dropped = queue_.size();
        queue_.clear();
    }
    if (dropped > 0) {
        PLOG_WARN("reverse", "Dropped %zu queued request(s) on disconnect", dropped);
    }
    transition(ConnectionState::Disconnected, reason);
}

std::optional<std::chrono::milliseconds> ReverseConnectionMachine::schedule_retry() {
    if (!enabled_()) return std::nullopt;
    const auto delay = backoff_.next_delay();
    PLOG_INFO("reverse", "Reconnecting in %lld ms (attempt %d)",
              (long long)delay.count(), backoff_.failures());
    return delay;
}

size_t ReverseConnectionMachine::queue_size() const {
    std::lock_guard<std::mutex> lk(queue_mutex_);
    return queue_.size();
}

void ReverseConnectionMachine::send_json(const json& j) {
    send_(j.dump());
}

// ---------------------------------------------------------------------------
// Inbound messages
// ---------------------------------------------------------------------------
void ReverseConnectionMachine::on_message(const std::string& text) {
    json msg;
    try {
        msg = json::parse(text);
    } catch (const json::parse_error& e) {
        PLOG_WARN("reverse", "Parse error: %s", e.what());
        send_json(mcp::RpcSession::make_error(nullptr, mcp::rpc::PARSE_ERROR, "Parse error"));
        return;
    }

    if (mcp::RpcSession::is_response(msg)) {
        PLOG_DEBUG("reverse", "Response from remote ignored: %s", text.substr(0, 200).c_str());
        return;
    }

    if (state_.load() == ConnectionState::Ready) {
        if (auto reply = rpc_.handle(msg)) send_json(*reply);
        return;
    }
    handle_before_ready(msg);
}

void ReverseConnectionMachine::handle_before_ready(const json& msg) {
    const std::string method = (msg.is_object() && msg.contains("method") && msg["method"].is_string())
        ? msg["method"].get<std::string>() : std::string();

    if (method == "initialize" && mcp::RpcSession::is_request(msg)) {
        if (auto reply = rpc_.handle(msg)) send_json(*reply);
        transition(ConnectionState::Ready, "initialized");

        if (!notified_) {
            notified_ = true;
            ConnectionNotificationEvent ev;
            ev.tool_count = rpc_.enabled_tool_count();
            ev.message = "Connected and initialized (" + std::to_string(ev.tool_count) + " tools available)";
            bus_.publish(ev);
        }
        // 以降のメッセージより先にキューを処理する
        drain_queue();
        return;
    }

    if (method == "tools/call" && mcp::RpcSession::is_request(msg)) {
        enqueue(msg);
        return;
    }

    // tools/list, ping, notifications はそのまま処理
    if (auto reply = rpc_.handle(msg)) send_json(*reply);
}

void ReverseConnectionMachine::enqueue(const json& msg) {
    const json id = msg["id"];
    {
        std::lock_guard<std::mutex> lk(queue_mutex_);
        purge_expired_locked();
        if (queue_.size() >= options_.queue_capacity) {
            PLOG_WARN("reverse", "Queue full (%zu), rejecting id=%s", queue_.size(), id.dump().c_str());
            send_json(mcp::RpcSession::make_error(id, mcp::rpc::QUEUE_FULL,
                                                  "Request queue full, retry later"));
            return;
        }
        queue_.push_back(PendingRequest{id, msg["method"].get<std::string>(), msg, now_()});
        PLOG_INFO("reverse", "Queued id=%s until handshake (%zu pending)", id.dump().c_str(), queue_.size());
    }

    json note;
    note["jsonrpc"] = "2.0";
    note["method"] = "notifications/queued";
    note["params"] = {{"requestId", id},
                      {"code", mcp::rpc::QUEUED},
                      {"message", "Request queued, will process automatically"}};
    send_json(note);
}

size_t ReverseConnectionMachine::purge_expired_locked() {
    const auto now = now_();
    const size_t before = queue_.size();
    queue_.erase(std::remove_if(queue_.begin(), queue_.end(),
                                [&](const PendingRequest& r) {
                                    return now - r.enqueued_at > options_.request_ttl;
                                }),
                 queue_.end());
    const size_t purged = before - queue_.size();
    if (purged > 0) PLOG_DEBUG("reverse", "Purged %zu expired request(s)", purged);
    return purged;
}

void ReverseConnectionMachine::drain_queue() {
    std::deque<PendingRequest> batch;
    {
        std::lock_guard<std::mutex> lk(queue_mutex_);
        purge_expired_locked();
        batch.swap(queue_);
    }
    if (batch.empty()) return;

    PLOG_INFO("reverse", "Draining %zu queued request(s)", batch.size());
    for (const auto& r : batch) {
        // 待機中に期限切れになったものは応答せず捨てる
        if (now_() - r.enqueued_at > options_.request_ttl) {
            PLOG_DEBUG("reverse", "Dropping expired id=%s", r.id.dump().c_str());
            continue;
        }
        if (auto reply = rpc_.handle(r.message)) send_json(*reply);
    }
}

// =============================================================================
// URL
// =============================================================================

Result<WsUrl> parse_ws_url(const std::string& url) {
    const std::string ws = "ws://";
    if (url.rfind("wss://", 0) == 0) {
        return Err<WsUrl>(ErrorCode::MalformedInput, "wss:// is not supported: " + url);
    }
    if (url.rfind(ws, 0) != 0) {
        return Err<WsUrl>(ErrorCode::MalformedInput, "Expected ws:// URL: " + url);
    }

    WsUrl out;
    std::string rest = url.substr(ws.size());
    auto slash = rest.find('/');
    std::string hostport = rest.substr(0, slash);
    if (slash != std::string::npos) out.path = rest.substr(slash);

    auto colon = hostport.rfind(':');
    if (colon != std::string::npos) {
        out.port = hostport.substr(colon + 1);
        hostport = hostport.substr(0, colon);
        if (out.port.empty() ||
            !std::all_of(out.port.begin(), out.port.end(), [](unsigned char c) { return std::isdigit(c); })) {
            return Err<WsUrl>(ErrorCode::MalformedInput, "Invalid port in URL: " + url);
        }
    }
    if (hostport.empty()) {
        return Err<WsUrl>(ErrorCode::MalformedInput, "Missing host in URL: " + url);
    }
    out.host = hostport;
    return out;
}

// =============================================================================
// ReverseConnectionClient
// =============================================================================

ReverseConnectionClient::ReverseConnectionClient(mcp::ToolRegistry& registry,
                                                 config::ConfigStore& config, EventBus& bus)
    : config_(config),
      rpc_(registry, config),
      machine_(rpc_, bus,
               [&config] { return config.reverse().enabled; },
               [this](const std::string& s) { send(s); },
               ReverseConnectionMachine::Options::from_settings(config.reverse())),
      resolver_(ioc_),
      reconnect_timer_(ioc_) {
    config_sub_ = bus.subscribe<ConfigChangedEvent>(
        [this](const ConfigChangedEvent& e) { on_config_changed(e); });
    shutdown_sub_ = bus.subscribe<ShutdownEvent>([this](const ShutdownEvent&) {
        shutting_down_ = true;
        stopping_ = true;
    });
}

ReverseConnectionClient::~ReverseConnectionClient() {
    config_sub_.reset();
    shutdown_sub_.reset();
    control_.join();
    stop();
}

bool ReverseConnectionClient::start() {
    std::lock_guard<std::mutex> lk(lifecycle_mutex_);
    if (running_.load()) return true;
    if (shutting_down_.load()) return false;

    settings_ = config_.reverse();
    if (!settings_.enabled) {
        PLOG_DEBUG("reverse", "reverse.enabled is false");
        return false;
    }
    auto url = parse_ws_url(settings_.url);
    if (url.is_err()) {
        // 設定ミスは再試行しない
        PLOG_ERROR("reverse", "%s", url.error().message.c_str());
        return false;
    }
    url_ = url.value();

    stopping_ = false;
    ioc_.restart();
    work_.emplace(net::make_work_guard(ioc_));
    running_ = true;
    net::post(ioc_, [this] {
        if (machine_.begin_connect()) connect();
    });
    io_thread_ = std::thread([this] {
        ioc_.run();
        PLOG_DEBUG("reverse", "io thread exit");
    });

    PLOG_INFO("reverse", "Reverse connection started -> %s", settings_.url.c_str());
    return true;
}

void ReverseConnectionClient::stop() {
    std::lock_guard<std::mutex> lk(lifecycle_mutex_);
    if (!running_.load()) return;
    stopping_ = true;

    net::post(ioc_, [this] {
        reconnect_timer_.cancel();
        resolver_.cancel();
        close_stream();
        if (machine_.state() != ConnectionState::Disconnected) machine_.on_closed("stopped");
    });
    work_.reset();
    if (io_thread_.joinable()) io_thread_.join();
    running_ = false;

    PLOG_INFO("reverse", "Reverse connection stopped");
}

void ReverseConnectionClient::send(std::string message) {
    net::post(ioc_, [this, m = std::move(message)]() mutable {
        if (!open_ || !ws_) {
            PLOG_DEBUG("reverse", "Not connected, dropping outbound message");
            return;
        }
        outbox_.push_back(std::move(m));
        if (outbox_.size() == 1) do_write();
    });
}

// ---------------------------------------------------------------------------
// Connect sequence (io thread)
// ---------------------------------------------------------------------------
void ReverseConnectionClient::connect() {
    ws_ = std::make_unique<websocket::stream<beast::tcp_stream>>(ioc_);
    buffer_.clear();
    outbox_.clear();
    open_ = false;

    PLOG_INFO("reverse", "Connecting to %s:%s%s", url_.host.c_str(), url_.port.c_str(), url_.path.c_str());
    resolver_.async_resolve(url_.host, url_.port,
                            beast::bind_front_handler(&ReverseConnectionClient::on_resolve, this));
}

void ReverseConnectionClient::on_resolve(beast::error_code ec, tcp::resolver::results_type results) {
    if (ec) return fail(ec, "resolve");
    beast::get_lowest_layer(*ws_).expires_after(std::chrono::seconds(30));
    beast::get_lowest_layer(*ws_).async_connect(
        results, beast::bind_front_handler(&ReverseConnectionClient::on_connect, this));
}

void ReverseConnectionClient::on_connect(beast::error_code ec, tcp::resolver::results_type::endpoint_type ep) {
    if (ec) return fail(ec, "connect");
    beast::get_lowest_layer(*ws_).expires_never();

    // keep-alive ping で相手の生存を確認する
    websocket::stream_base::timeout opt{};
    opt.handshake_timeout = std::chrono::seconds(30);
    opt.idle_timeout = std::chrono::milliseconds(static_cast<int64_t>(settings_.heartbeat_interval_ms) +
                                                 settings_.heartbeat_timeout_ms);
    opt.keep_alive_pings = true;
    ws_->set_option(opt);
    ws_->set_option(websocket::stream_base::decorator([](websocket::request_type& req) {
        req.set(beast::http::field::user_agent, "portal-bridge");
    }));

    const std::string host = url_.host + ":" + std::to_string(ep.port());
    ws_->async_handshake(host, url_.path,
                         beast::bind_front_handler(&ReverseConnectionClient::on_handshake, this));
}

void ReverseConnectionClient::on_handshake(beast::error_code ec) {
    if (ec) return fail(ec, "handshake");
    open_ = true;
    machine_.on_open();
    do_read();
}

void ReverseConnectionClient::do_read() {
    ws_->async_read(buffer_, beast::bind_front_handler(&ReverseConnectionClient::on_read, this));
}

void ReverseConnectionClient::on_read(beast::error_code ec, std::size_t) {
    if (ec) return fail(ec, "read");
    const std::string text = beast::buffers_to_string(buffer_.data());
    buffer_.consume(buffer_.size());

    machine_.on_message(text);
    if (ws_) do_read();
}

void ReverseConnectionClient::do_write() {
    ws_->text(true);
    ws_->async_write(net::buffer(outbox_.front()),
                     beast::bind_front_handler(&ReverseConnectionClient::on_write, this));
}

void ReverseConnectionClient::on_write(beast::error_code ec, std::size_t) {
    if (ec) return fail(ec, "write");
    outbox_.pop_front();
    if (!outbox_.empty()) do_write();
}

void ReverseConnectionClient::close_stream() {
    open_ = false;
    outbox_.clear();
    if (ws_) {
        beast::error_code ignore;
        beast::get_lowest_layer(*ws_).socket().shutdown(tcp::socket::shutdown_both, ignore);
        beast::get_lowest_layer(*ws_).close();
    }
}

// 読み書き両方の失敗が来ることがあるので、切断処理は一度だけ
void ReverseConnectionClient::fail(beast::error_code ec, const char* what) {
    // 自分で閉じたストリームの残りハンドラ
    if (ec == net::error::operation_aborted) return;
    if (machine_.state() == ConnectionState::Disconnected) return;

    const bool closed = ec == websocket::error::closed;
    close_stream();
    if (closed) {
        machine_.on_closed(std::string(what) + ": " + ec.message());
    } else {
        PLOG_WARN("reverse", "%s failed: %s", what, ec.message().c_str());
        machine_.on_failure(std::string(what) + ": " + ec.message());
    }
    if (!stopping_.load()) schedule_reconnect();
}

void ReverseConnectionClient::schedule_reconnect() {
    auto delay = machine_.schedule_retry();
    if (!delay) {
        PLOG_INFO("reverse", "Reverse connection disabled, not reconnecting");
        return;
    }
    reconnect_timer_.expires_after(*delay);
    reconnect_timer_.async_wait([this](beast::error_code ec) {
        if (ec || stopping_.load()) return;
        if (machine_.begin_connect()) connect();
    });
}

// ---------------------------------------------------------------------------
// Live reconfiguration
// ---------------------------------------------------------------------------
void ReverseConnectionClient::on_config_changed(const ConfigChangedEvent& e) {
    if (e.section != "reverse") return;
    if (e.key != "enabled" && e.key != "url") return;
    if (shutting_down_.load()) return;
    net::post(control_, [this] {
        stop();
        if (config_.reverse().enabled) start();
    });
}

} // namespace portal
