#pragma once
// =============================================================================
// PortalBridge - HTTP Server
// =============================================================================
// Blocking socket server for the local REST-style API (default port 8080).
// One accept thread; every accepted connection is handed to a 5-worker pool
// and serves exactly one request/response (Connection: close).
//
// Listens for ConfigChangedEvent(server.http_port / server.http_enabled) and
// restarts itself on a control thread, so a POST /socket_port handled by a
// worker can move the listener without joining its own pool. After a
// ShutdownEvent config changes are ignored until the owner calls stop().
// =============================================================================

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <boost/asio/thread_pool.hpp>

#include "config_store.hpp"
#include "event_bus.hpp"
#include "http_request.hpp"

namespace portal {

class HttpServer {
public:
    static constexpr size_t WORKER_COUNT = 5;
    static constexpr int RECV_TIMEOUT_MS = 30000;
    static constexpr int LISTEN_BACKLOG = 16;
    static constexpr int ACCEPT_RETRY_DELAY_MS = 200;

    HttpServer(HttpRouter& router, config::ConfigStore& config, EventBus& bus);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    bool start(int port);
    void stop();
    bool is_running() const { return running_.load(); }
    int port() const { return port_.load(); }

    // 既定 RECV_TIMEOUT_MS。次に受け付ける接続から有効
    void set_receive_timeout_ms(int ms) { recv_timeout_ms_ = ms; }

private:
    void accept_loop();
    void handle_client(int client_fd);
    HttpResponse read_and_route(int client_fd);
    void on_config_changed(const ConfigChangedEvent& e);
    void apply_config();

    HttpRouter& router_;
    config::ConfigStore& config_;

    std::mutex lifecycle_mutex_;  // start/stop
    std::atomic<bool> running_{false};
    std::atomic<int> port_{0};
    std::atomic<int> listen_fd_{-1};
    std::atomic<int> recv_timeout_ms_{RECV_TIMEOUT_MS};
    std::thread accept_thread_;
    std::unique_ptr<boost::asio::thread_pool> workers_;
    boost::asio::thread_pool control_{1};

    std::atomic<bool> shutting_down_{false};  // ShutdownEvent 以降は再起動しない
    SubscriptionHandle config_sub_;
    SubscriptionHandle shutdown_sub_;
};

} // namespace portal
