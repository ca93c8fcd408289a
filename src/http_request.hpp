#pragma once
// =============================================================================
// PortalBridge - HTTP request parsing / routing
// =============================================================================
// Socket-free half of the HTTP adapter: request head parsing, body decoding
// (JSON or url-encoded form) and path -> dispatcher routing.
//
//   GET  /a11y_tree_full?filter=false       -> dispatch("a11y_tree_full", {filter:false})
//   POST /keyboard/input  base64_text=..    -> dispatch("keyboard/input", {...})
//   POST /action/tap      {"x":1,"y":2}     -> dispatch("/action/tap", {...})
// =============================================================================

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"
#include "command_dispatcher.hpp"
#include "config_store.hpp"
#include "result.hpp"

namespace portal {

constexpr size_t HTTP_MAX_HEAD_BYTES = 64 * 1024;
constexpr size_t HTTP_MAX_BODY_BYTES = 10 * 1024 * 1024;

struct HttpRequest {
    std::string method;                          // "GET", "POST", ...
    std::string path;                            // without query string
    std::map<std::string, std::string> query;    // decoded
    std::map<std::string, std::string> headers;  // lower-case names
    std::string body;

    // case-insensitive; "" if absent
    std::string header(const std::string& name) const;
    // -1 if absent or not a number
    long long content_length() const;
};

struct HttpResponse {
    int status = 200;
    std::string content_type = "application/json";
    std::string body;

    // status line + headers + body
    std::string serialize() const;

    static HttpResponse json_body(const nlohmann::json& j, int status = 200);
    static HttpResponse binary(std::vector<uint8_t> bytes, const std::string& content_type);
};

const char* http_status_text(int status);

// "%41+b" -> "A b"
std::string url_decode(const std::string& s);
// "a=1&b=x" -> {a:"1", b:"x"}
std::map<std::string, std::string> parse_query(const std::string& qs);

// Request line + headers (everything before the blank line)
Result<HttpRequest> parse_request_head(const std::string& head);

// JSON object or url-encoded form, auto-typed ("12" -> 12, "TRUE" -> true).
// Empty body -> {}.
Result<nlohmann::json> parse_post_body(const std::string& body);

class HttpRouter {
public:
    HttpRouter(CommandDispatcher& dispatcher, config::ConfigStore& config);

    HttpResponse route(const HttpRequest& req);

    // /ping は常に認証不要
    bool authorized(const HttpRequest& req);

private:
    HttpResponse handle_get(const HttpRequest& req);
    HttpResponse handle_post(const HttpRequest& req);
    HttpResponse respond(const ActionResult& result, const std::string& binary_type);

    CommandDispatcher& dispatcher_;
    config::ConfigStore& config_;
};

} // namespace portal
