// =============================================================================
// PortalBridge - HTTP Server Implementation
// =============================================================================

#include "http_server.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstring>

#include <boost/asio/post.hpp>

#include "portal_log.hpp"

namespace portal {

namespace {

bool send_all(int fd, const std::string& data) {
    size_t total = 0;
    while (total < data.size()) {
        ssize_t sent = ::send(fd, data.data() + total, data.size() - total, MSG_NOSIGNAL);
        if (sent <= 0) {
            if (sent < 0 && errno == EINTR) continue;
            return false;
        }
        total += static_cast<size_t>(sent);
    }
    return true;
}

// EINTR は再試行
ssize_t recv_some(int fd, char* buf, size_t len) {
    for (;;) {
        ssize_t n = ::recv(fd, buf, len, 0);
        if (n < 0 && errno == EINTR) continue;
        return n;
    }
}

HttpResponse error_response(int status, const std::string& message) {
    return HttpResponse::json_body(error_envelope(message), status);
}

} // namespace

HttpServer::HttpServer(HttpRouter& router, config::ConfigStore& config, EventBus& bus)
    : router_(router), config_(config) {
    config_sub_ = bus.subscribe<ConfigChangedEvent>(
        [this](const ConfigChangedEvent& e) { on_config_changed(e); });
    shutdown_sub_ = bus.subscribe<ShutdownEvent>([this](const ShutdownEvent&) { shutting_down_ = true; });
}

HttpServer::~HttpServer() {
    config_sub_.reset();
    shutdown_sub_.reset();
    control_.join();
    stop();
}

// ---------------------------------------------------------------------------
// start / stop
// ---------------------------------------------------------------------------
bool HttpServer::start(int port) {
    std::lock_guard<std::mutex> lk(lifecycle_mutex_);
    if (running_.load()) return true;

    int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        PLOG_ERROR("http", "socket() failed: %s", std::strerror(errno));
        return false;
    }

    int opt = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    const std::string bind_addr = config_.bind_address();
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(port));
    if (::inet_pton(AF_INET, bind_addr.c_str(), &addr.sin_addr) != 1) {
        PLOG_WARN("http", "Invalid bind address '%s', using 0.0.0.0", bind_addr.c_str());
        addr.sin_addr.s_addr = htonl(INADDR_ANY);
    }

    if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        PLOG_ERROR("http", "bind() failed on port %d: %s", port, std::strerror(errno));
        ::close(fd);
        return false;
    }
    if (::listen(fd, LISTEN_BACKLOG) < 0) {
        PLOG_ERROR("http", "listen() failed: %s", std::strerror(errno));
        ::close(fd);
        return false;
    }

    sockaddr_in bound{};
    socklen_t bound_len = sizeof(bound);
    if (::getsockname(fd, reinterpret_cast<sockaddr*>(&bound), &bound_len) == 0) {
        port_ = ntohs(bound.sin_port);
    } else {
        port_ = port;
    }
    listen_fd_ = fd;
    workers_ = std::make_unique<boost::asio::thread_pool>(WORKER_COUNT);
    running_ = true;
    accept_thread_ = std::thread(&HttpServer::accept_loop, this);

    PLOG_INFO("http", "HTTP server started on %s:%d", bind_addr.c_str(), port_.load());
    return true;
}

void HttpServer::stop() {
    std::lock_guard<std::mutex> lk(lifecycle_mutex_);
    if (!running_.load()) return;
    running_ = false;

    // accept() を起こしてから close (fd 再利用との競合を避ける)
    const int fd = listen_fd_.load();
    if (fd >= 0) ::shutdown(fd, SHUT_RDWR);
    if (accept_thread_.joinable()) accept_thread_.join();
    if (fd >= 0) ::close(fd);
    listen_fd_ = -1;

    // 処理中の接続は最後まで応答させる
    if (workers_) {
        workers_->join();
        workers_.reset();
    }
    PLOG_INFO("http", "HTTP server stopped (port %d)", port_.load());
}

// ---------------------------------------------------------------------------
// Accept loop
// ---------------------------------------------------------------------------
void HttpServer::accept_loop() {
    const int fd = listen_fd_.load();
    while (running_.load()) {
        sockaddr_in client_addr{};
        socklen_t addr_len = sizeof(client_addr);
        int client = ::accept4(fd, reinterpret_cast<sockaddr*>(&client_addr), &addr_len, SOCK_CLOEXEC);
        if (client < 0) {
            const int err = errno;
            if (!running_.load()) break;  // listener closed for shutdown
            if (err == EINTR || err == ECONNABORTED || err == EPROTO) continue;
            if (err == EMFILE || err == ENFILE || err == ENOBUFS || err == ENOMEM) {
                PLOG_WARN("http", "accept() failed: %s, retrying in %d ms", std::strerror(err),
                          ACCEPT_RETRY_DELAY_MS);
                std::this_thread::sleep_for(std::chrono::milliseconds(ACCEPT_RETRY_DELAY_MS));
                continue;
            }
            PLOG_ERROR("http", "accept() failed: %s, listener stopped", std::strerror(err));
            break;
        }
        boost::asio::post(*workers_, [this, client] { handle_client(client); });
    }
}

// ---------------------------------------------------------------------------
// One request / response per connection
// ---------------------------------------------------------------------------
void HttpServer::handle_client(int client_fd) {
    const int timeout_ms = recv_timeout_ms_.load();
    timeval tv{};
    tv.tv_sec = timeout_ms / 1000;
    tv.tv_usec = (timeout_ms % 1000) * 1000;
    ::setsockopt(client_fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

    HttpResponse response;
    try {
        response = read_and_route(client_fd);
    } catch (const std::exception& e) {
        PLOG_ERROR("http", "Request handling failed: %s", e.what());
        response = error_response(500, std::string("Internal error: ") + e.what());
    }

    if (!send_all(client_fd, response.serialize())) {
        PLOG_DEBUG("http", "send() failed: %s", std::strerror(errno));
    }
    ::close(client_fd);
}

HttpResponse HttpServer::read_and_route(int client_fd) {
    std::string buffer;
    char chunk[8192];
    size_t head_end = std::string::npos;

    while (head_end == std::string::npos) {
        ssize_t n = recv_some(client_fd, chunk, sizeof(chunk));
        if (n <= 0) {
            return error_response(400, n == 0 ? "Empty request" : "Receive timeout");
        }
        buffer.append(chunk, static_cast<size_t>(n));
        head_end = buffer.find("\r\n\r\n");
        if (head_end == std::string::npos && buffer.size() > HTTP_MAX_HEAD_BYTES) {
            return error_response(413, "Request header too large");
        }
    }

    auto parsed = parse_request_head(buffer.substr(0, head_end));
    if (parsed.is_err()) {
        PLOG_WARN("http", "%s", parsed.error().message.c_str());
        return error_response(400, parsed.error().message);
    }
    HttpRequest req = std::move(parsed).value();

    req.body = buffer.substr(head_end + 4);
    const long long length = req.content_length();
    if (length > static_cast<long long>(HTTP_MAX_BODY_BYTES) || req.body.size() > HTTP_MAX_BODY_BYTES) {
        return error_response(413, "Request body too large");
    }
    while (length >= 0 && req.body.size() < static_cast<size_t>(length)) {
        ssize_t n = recv_some(client_fd, chunk, sizeof(chunk));
        if (n <= 0) return error_response(400, "Incomplete request body");
        req.body.append(chunk, static_cast<size_t>(n));
    }
    if (length >= 0 && req.body.size() > static_cast<size_t>(length)) {
        req.body.resize(static_cast<size_t>(length));
    }

    PLOG_DEBUG("http", "%s %s (%zu bytes)", req.method.c_str(), req.path.c_str(), req.body.size());
    return router_.route(req);
}

// ---------------------------------------------------------------------------
// Live reconfiguration
// ---------------------------------------------------------------------------
void HttpServer::on_config_changed(const ConfigChangedEvent& e) {
    if (e.section != "server") return;
    if (e.key != "http_port" && e.key != "http_enabled") return;
    // ワーカースレッドから呼ばれることがあるので制御スレッドで再起動する
    boost::asio::post(control_, [this] { apply_config(); });
}

void HttpServer::apply_config() {
    if (shutting_down_.load()) return;
    if (!config_.http_enabled()) {
        PLOG_INFO("http", "HTTP server disabled by config");
        stop();
        return;
    }
    const int wanted = config_.http_port();
    if (running_.load() && port_.load() == wanted) return;

    PLOG_INFO("http", "Restarting HTTP server on port %d", wanted);
    stop();
    if (!start(wanted)) {
        PLOG_ERROR("http", "Failed to restart HTTP server on port %d", wanted);
    }
}

} // namespace portal
