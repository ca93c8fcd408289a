// =============================================================================
// PortalBridge - WebSocket JSON-RPC Server Implementation
// =============================================================================

#include "websocket_server.hpp"

#include <cerrno>
#include <chrono>
#include <deque>
#include <functional>

#include <boost/asio/post.hpp>
#include <boost/beast/websocket.hpp>

#include "mcp/rpc_session.hpp"
#include "portal_log.hpp"

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

namespace portal {

// =============================================================================
// Session
// =============================================================================

class WebSocketServer::Session : public std::enable_shared_from_this<Session> {
public:
    Session(tcp::socket socket, mcp::ToolRegistry& registry, const config::ConfigStore& config,
            std::function<void()> on_closed)
        : ws_(std::move(socket)), rpc_(registry, config), on_closed_(std::move(on_closed)) {}

    void run() {
        ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
        ws_.set_option(websocket::stream_base::decorator([](websocket::response_type& res) {
            res.set(beast::http::field::server, "portal-bridge");
        }));
        ws_.read_message_max(MAX_MESSAGE_BYTES);
        ws_.async_accept(beast::bind_front_handler(&Session::on_handshake, shared_from_this()));
    }

    // io thread only
    void shutdown() {
        beast::error_code ec;
        beast::get_lowest_layer(ws_).socket().shutdown(tcp::socket::shutdown_both, ec);
        beast::get_lowest_layer(ws_).close();
    }

private:
    void on_handshake(beast::error_code ec) {
        if (ec) {
            PLOG_WARN("ws", "Handshake failed: %s", ec.message().c_str());
            finish();
            return;
        }
        PLOG_INFO("ws", "Client connected");
        do_read();
    }

    void do_read() {
        ws_.async_read(buffer_, beast::bind_front_handler(&Session::on_read, shared_from_this()));
    }

    void on_read(beast::error_code ec, std::size_t) {
        if (ec) {
            if (ec == websocket::error::closed) {
                PLOG_INFO("ws", "Client disconnected");
            } else {
                PLOG_WARN("ws", "Read failed: %s", ec.message().c_str());
            }
            finish();
            return;
        }

        const std::string text = beast::buffers_to_string(buffer_.data());
        buffer_.consume(buffer_.size());

        // 到着順に処理 (io スレッド上で同期実行)
        auto reply = rpc_.handle_text(text);
        if (reply) queue_write(std::move(*reply));
        do_read();
    }

    void queue_write(std::string message) {
        outbox_.push_back(std::move(message));
        if (outbox_.size() > 1) return;  // 書き込み中
        do_write();
    }

    void do_write() {
        ws_.text(true);
        ws_.async_write(net::buffer(outbox_.front()),
                        beast::bind_front_handler(&Session::on_write, shared_from_this()));
    }

    void on_write(beast::error_code ec, std::size_t) {
        if (ec) {
            PLOG_WARN("ws", "Write failed: %s", ec.message().c_str());
            outbox_.clear();
            return;  // 読み込み側が切断を検出して finish する
        }
        outbox_.pop_front();
        if (!outbox_.empty()) do_write();
    }

    void finish() {
        if (on_closed_) {
            auto cb = std::move(on_closed_);
            on_closed_ = nullptr;
            cb();
        }
    }

    websocket::stream<beast::tcp_stream> ws_;
    beast::flat_buffer buffer_;
    mcp::RpcSession rpc_;
    std::deque<std::string> outbox_;
    std::function<void()> on_closed_;
};

// =============================================================================
// Server
// =============================================================================

WebSocketServer::WebSocketServer(mcp::ToolRegistry& registry, config::ConfigStore& config)
    : registry_(registry), config_(config) {}

WebSocketServer::~WebSocketServer() {
    stop();
}

bool WebSocketServer::start(int port) {
    std::lock_guard<std::mutex> lk(lifecycle_mutex_);
    if (running_.load()) return true;

    beast::error_code ec;
    auto address = net::ip::make_address(config_.bind_address(), ec);
    if (ec) {
        PLOG_WARN("ws", "Invalid bind address '%s', using 0.0.0.0", config_.bind_address().c_str());
        address = net::ip::address_v4::any();
    }
    const tcp::endpoint endpoint(address, static_cast<unsigned short>(port));

    ioc_.restart();
    acceptor_ = std::make_unique<tcp::acceptor>(ioc_);
    acceptor_->open(endpoint.protocol(), ec);
    if (!ec) acceptor_->set_option(net::socket_base::reuse_address(true), ec);
    if (!ec) acceptor_->bind(endpoint, ec);
    if (!ec) acceptor_->listen(net::socket_base::max_listen_connections, ec);
    if (ec) {
        PLOG_ERROR("ws", "Failed to listen on port %d: %s", port, ec.message().c_str());
        acceptor_.reset();
        return false;
    }

    port_ = acceptor_->local_endpoint(ec).port();
    running_ = true;
    do_accept();
    io_thread_ = std::thread([this] {
        ioc_.run();
        PLOG_DEBUG("ws", "io thread exit");
    });

    PLOG_INFO("ws", "WebSocket server started on port %d", port_.load());
    return true;
}

void WebSocketServer::stop() {
    std::lock_guard<std::mutex> lk(lifecycle_mutex_);
    if (!running_.load()) return;
    running_ = false;

    net::post(ioc_, [this] {
        beast::error_code ec;
        accept_retry_.cancel();
        if (acceptor_) acceptor_->close(ec);
        if (auto s = session_.lock()) s->shutdown();
    });
    if (io_thread_.joinable()) io_thread_.join();
    acceptor_.reset();
    session_active_ = false;

    PLOG_INFO("ws", "WebSocket server stopped");
}

WebSocketServer::AcceptRetry WebSocketServer::accept_retry_for(const beast::error_code& ec, bool running) {
    if (!running || ec == net::error::operation_aborted || ec == net::error::bad_descriptor) {
        return AcceptRetry::Stop;
    }
    if (ec == net::error::no_descriptors || ec == net::error::no_buffer_space ||
        ec == net::error::no_memory ||
        ec == beast::error_code(ENFILE, boost::system::system_category())) {
        return AcceptRetry::Later;
    }
    return AcceptRetry::Now;
}

void WebSocketServer::do_accept() {
    acceptor_->async_accept(beast::bind_front_handler(&WebSocketServer::on_accept, this));
}

void WebSocketServer::on_accept(beast::error_code ec, tcp::socket socket) {
    if (ec) {
        switch (accept_retry_for(ec, running_.load())) {
        case AcceptRetry::Stop:
            return;  // acceptor closed
        case AcceptRetry::Now:
            PLOG_WARN("ws", "accept failed: %s", ec.message().c_str());
            do_accept();
            return;
        case AcceptRetry::Later:
            PLOG_WARN("ws", "accept failed: %s, retrying in %d ms", ec.message().c_str(),
                      ACCEPT_RETRY_DELAY_MS);
            accept_retry_.expires_after(std::chrono::milliseconds(ACCEPT_RETRY_DELAY_MS));
            accept_retry_.async_wait([this](beast::error_code wait_ec) {
                if (!wait_ec && running_.load()) do_accept();
            });
            return;
        }
    }

    if (session_active_.load()) {
        PLOG_WARN("ws", "Rejecting second client: a session is already active");
        beast::error_code ignore;
        socket.shutdown(tcp::socket::shutdown_both, ignore);
        socket.close(ignore);
    } else {
        session_active_ = true;
        auto session = std::make_shared<Session>(std::move(socket), registry_, config_,
                                                 [this] { session_active_ = false; });
        session_ = session;
        session->run();
    }

    if (running_.load()) do_accept();
}

} // namespace portal
