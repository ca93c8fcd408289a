// =============================================================================
// PortalBridge - Daemon Entry Point
// =============================================================================
// portal_daemon [--config portal.json] [--tree fixture.json] [--log-level debug]
//
// Without a platform binding linked in, the daemon drives a SimulatedDevice
// whose UI tree comes from --tree (tree_json format).
// =============================================================================

#include <csignal>
#include <cstdio>
#include <cstring>
#include <string>

#include <pthread.h>

#include "command_dispatcher.hpp"
#include "config_store.hpp"
#include "device_gateway.hpp"
#include "element_finder.hpp"
#include "event_bus.hpp"
#include "http_request.hpp"
#include "http_server.hpp"
#include "mcp/device_tools.hpp"
#include "mcp/element_tools.hpp"
#include "mcp/tool_registry.hpp"
#include "portal_log.hpp"
#include "reverse_connection.hpp"
#include "simulated_device.hpp"
#include "websocket_server.hpp"

namespace {

struct Options {
    std::string config_path = "portal.json";
    bool config_explicit = false;
    std::string tree_path;
    std::string log_level;
};

void usage(const char* argv0) {
    std::fprintf(stderr,
                 "Usage: %s [--config path] [--tree fixture.json] [--log-level level]\n"
                 "  --config     settings file (default: portal.json, also ../portal.json)\n"
                 "  --tree       UI tree fixture for the simulated device\n"
                 "  --log-level  trace|debug|info|warn|error (overrides log.level)\n",
                 argv0);
}

// false = exit (usage printed)
bool parse_args(int argc, char** argv, Options& opt) {
    for (int i = 1; i < argc; ++i) {
        const char* a = argv[i];
        auto next = [&](const char* name) -> const char* {
            if (i + 1 >= argc) {
                std::fprintf(stderr, "%s requires a value\n", name);
                return nullptr;
            }
            return argv[++i];
        };

        if (std::strcmp(a, "--config") == 0) {
            const char* v = next(a);
            if (!v) return false;
            opt.config_path = v;
            opt.config_explicit = true;
        } else if (std::strcmp(a, "--tree") == 0) {
            const char* v = next(a);
            if (!v) return false;
            opt.tree_path = v;
        } else if (std::strcmp(a, "--log-level") == 0) {
            const char* v = next(a);
            if (!v) return false;
            opt.log_level = v;
        } else if (std::strcmp(a, "--help") == 0 || std::strcmp(a, "-h") == 0) {
            return false;
        } else {
            std::fprintf(stderr, "Unknown argument: %s\n", a);
            return false;
        }
    }
    return true;
}

} // namespace

int main(int argc, char** argv) {
    using namespace portal;

    Options opt;
    if (!parse_args(argc, argv, opt)) {
        usage(argv[0]);
        return 2;
    }

    // シグナルは sigwait で受ける (全スレッドでブロック)
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    EventBus bus;
    config::ConfigStore config(bus);
    auto loaded = config.load(opt.config_path, opt.config_explicit);
    if (loaded.is_err()) {
        PLOG_ERROR("main", "Config: %s", loaded.error().message.c_str());
        if (opt.config_explicit) return 1;
    }

    log::setLogLevel(log::levelFromString(opt.log_level.empty() ? config.log_level() : opt.log_level));
    if (!log::openLogFile(config.log_path().c_str())) {
        PLOG_WARN("main", "Could not open log file %s", config.log_path().c_str());
    }
    PLOG_INFO("main", "PortalBridge starting");

    SimulatedDevice device;
    if (!opt.tree_path.empty()) {
        auto r = device.load_tree_file(opt.tree_path);
        if (r.is_err()) {
            PLOG_FATAL("main", "Failed to load tree %s: %s", opt.tree_path.c_str(), r.error().message.c_str());
            return 1;
        }
        PLOG_INFO("main", "UI tree loaded from %s", opt.tree_path.c_str());
    } else {
        PLOG_WARN("main", "No --tree given: tree queries report no active window");
    }

    DeviceGateway gateway(device);
    CommandDispatcher dispatcher(gateway, config);
    ElementFinder finder(gateway);

    mcp::ToolRegistry registry;
    mcp::register_device_tools(registry, dispatcher);
    mcp::register_element_tools(registry, dispatcher, finder, config,
                                mcp::ElementToolOptions::from_config(config));
    PLOG_INFO("main", "%zu tools registered, %zu enabled", registry.size(),
              registry.enabled_count(config.enabled_tools()));

    if (config.auth_enabled()) {
        PLOG_INFO("main", "HTTP auth enabled (token in %s)",
                  config.path().empty() ? "memory" : config.path().c_str());
    }

    HttpRouter router(dispatcher, config);
    HttpServer http(router, config, bus);
    if (config.http_enabled() && !http.start(config.http_port())) {
        PLOG_ERROR("main", "HTTP server failed to start on port %d", config.http_port());
    }

    WebSocketServer ws(registry, config);
    if (config.websocket_enabled() && !ws.start(config.websocket_port())) {
        PLOG_ERROR("main", "WebSocket server failed to start on port %d", config.websocket_port());
    }

    ReverseConnectionClient reverse(registry, config, bus);
    auto notify_sub = bus.subscribe<ConnectionNotificationEvent>([](const ConnectionNotificationEvent& e) {
        PLOG_INFO("main", "%s", e.message.c_str());
    });
    reverse.start();

    int sig = 0;
    sigwait(&signals, &sig);
    PLOG_INFO("main", "Signal %d received, shutting down", sig);
    bus.publish(ShutdownEvent{});

    reverse.stop();
    ws.stop();
    http.stop();

    PLOG_INFO("main", "PortalBridge stopped");
    log::closeLogFile();
    return 0;
}
