// =============================================================================
// PortalBridge - HTTP request parsing / routing Implementation
// =============================================================================

#include "http_request.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <sstream>

#include "portal_log.hpp"

using json = nlohmann::json;

namespace portal {

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

bool starts_with(const std::string& s, const char* prefix) {
    return s.rfind(prefix, 0) == 0;
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// フォーム値の自動型付け: 整数 / true / false / 文字列
json auto_type(const std::string& v) {
    const std::string lower = to_lower(v);
    if (lower == "true")  return true;
    if (lower == "false") return false;

    const size_t start = (!v.empty() && v[0] == '-') ? 1 : 0;
    const bool digits_only = v.size() > start &&
        std::all_of(v.begin() + start, v.end(), [](unsigned char c) { return std::isdigit(c); });
    if (digits_only && v.size() <= 11) {
        errno = 0;
        long long n = std::strtoll(v.c_str(), nullptr, 10);
        if (errno == 0 && n >= INT_MIN && n <= INT_MAX) return static_cast<int>(n);
    }
    return v;
}

bool query_false(const HttpRequest& req, const char* key) {
    auto it = req.query.find(key);
    return it != req.query.end() && to_lower(it->second) == "false";
}

} // namespace

// =============================================================================
// HttpRequest / HttpResponse
// =============================================================================

std::string HttpRequest::header(const std::string& name) const {
    auto it = headers.find(to_lower(name));
    return it == headers.end() ? std::string() : it->second;
}

long long HttpRequest::content_length() const {
    const std::string v = header("content-length");
    if (v.empty()) return -1;
    char* end = nullptr;
    errno = 0;
    long long n = std::strtoll(v.c_str(), &end, 10);
    if (errno != 0 || *end != '\0' || n < 0) return -1;
    return n;
}

const char* http_status_text(int status) {
    switch (status) {
        case 200: return "OK";
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 413: return "Payload Too Large";
        case 500: return "Internal Server Error";
        default:  return "Unknown";
    }
}

std::string HttpResponse::serialize() const {
    std::ostringstream os;
    os << "HTTP/1.1 " << status << " " << http_status_text(status) << "\r\n"
       << "Content-Type: " << content_type << "\r\n"
       << "Content-Length: " << body.size() << "\r\n"
       << "Access-Control-Allow-Origin: *\r\n"
       << "Connection: close\r\n"
       << "\r\n"
       << body;
    return os.str();
}

HttpResponse HttpResponse::json_body(const json& j, int status) {
    HttpResponse r;
    r.status = status;
    r.content_type = "application/json";
    r.body = j.dump();
    return r;
}

HttpResponse HttpResponse::binary(std::vector<uint8_t> bytes, const std::string& content_type) {
    HttpResponse r;
    r.content_type = content_type;
    r.body.assign(bytes.begin(), bytes.end());
    return r;
}

// =============================================================================
// Parsing
// =============================================================================

std::string url_decode(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '+') {
            out += ' ';
        } else if (s[i] == '%' && i + 2 < s.size()) {
            int hi = hex_value(s[i + 1]);
            int lo = hex_value(s[i + 2]);
            if (hi < 0 || lo < 0) {
                out += s[i];
                continue;
            }
            out += static_cast<char>((hi << 4) | lo);
            i += 2;
        } else {
            out += s[i];
        }
    }
    return out;
}

std::map<std::string, std::string> parse_query(const std::string& qs) {
    std::map<std::string, std::string> out;
    std::istringstream is(qs);
    std::string pair;
    while (std::getline(is, pair, '&')) {
        if (pair.empty()) continue;
        auto eq = pair.find('=');
        if (eq == std::string::npos) {
            out[url_decode(pair)] = "";
        } else {
            out[url_decode(pair.substr(0, eq))] = url_decode(pair.substr(eq + 1));
        }
    }
    return out;
}

Result<HttpRequest> parse_request_head(const std::string& head) {
    std::istringstream is(head);
    std::string line;
    if (!std::getline(is, line)) {
        return Err<HttpRequest>(ErrorCode::MalformedInput, "Empty request");
    }
    if (!line.empty() && line.back() == '\r') line.pop_back();

    std::istringstream rl(line);
    std::string method, target;
    rl >> method >> target;
    if (method.empty() || target.empty()) {
        return Err<HttpRequest>(ErrorCode::MalformedInput, "Malformed request line");
    }

    HttpRequest req;
    req.method = method;
    auto q = target.find('?');
    if (q == std::string::npos) {
        req.path = target;
    } else {
        req.path = target.substr(0, q);
        req.query = parse_query(target.substr(q + 1));
    }

    while (std::getline(is, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) break;
        auto colon = line.find(':');
        if (colon == std::string::npos) continue;
        req.headers[to_lower(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
    }
    return req;
}

Result<json> parse_post_body(const std::string& body) {
    const std::string data = trim(body);
    if (data.empty()) return json::object();

    if (data[0] == '{') {
        try {
            json j = json::parse(data);
            if (!j.is_object()) {
                return Err<json>(ErrorCode::MalformedInput, "JSON body must be an object");
            }
            return j;
        } catch (const json::parse_error& e) {
            return Err<json>(ErrorCode::MalformedInput, std::string("Invalid JSON body: ") + e.what());
        }
    }

    json out = json::object();
    std::istringstream is(data);
    std::string pair;
    while (std::getline(is, pair, '&')) {
        auto eq = pair.find('=');
        if (eq == std::string::npos) continue;
        out[url_decode(pair.substr(0, eq))] = auto_type(url_decode(pair.substr(eq + 1)));
    }
    return out;
}

// =============================================================================
// HttpRouter
// =============================================================================

HttpRouter::HttpRouter(CommandDispatcher& dispatcher, config::ConfigStore& config)
    : dispatcher_(dispatcher), config_(config) {}

bool HttpRouter::authorized(const HttpRequest& req) {
    if (req.path == "/ping") return true;
    if (!config_.auth_enabled()) return true;

    std::string token = req.header("authorization");
    if (starts_with(token, "Bearer ")) token = trim(token.substr(7));
    return !token.empty() && token == config_.auth_token();
}

HttpResponse HttpRouter::route(const HttpRequest& req) {
    if (!authorized(req)) {
        PLOG_WARN("http", "Unauthorized %s %s", req.method.c_str(), req.path.c_str());
        return HttpResponse::json_body(error_envelope("Unauthorized"), 401);
    }

    if (req.method == "GET")  return handle_get(req);
    if (req.method == "POST") return handle_post(req);
    return HttpResponse::json_body(error_envelope("Method not allowed: " + req.method), 405);
}

HttpResponse HttpRouter::respond(const ActionResult& result, const std::string& binary_type) {
    if (result.is_err()) {
        return HttpResponse::json_body(error_envelope(result.error().message));
    }
    const ActionOutput& out = result.value();
    if (is_binary(out)) {
        const auto& payload = std::get<BinaryPayload>(out);
        return HttpResponse::binary(payload.bytes, binary_type);
    }
    return HttpResponse::json_body(success_envelope(std::get<json>(out)));
}

HttpResponse HttpRouter::handle_get(const HttpRequest& req) {
    const std::string& p = req.path;

    if (starts_with(p, "/screenshot")) {
        json params = {{"hideOverlay", !query_false(req, "hideOverlay")}};
        return respond(dispatcher_.dispatch("screenshot", params), "image/png");
    }

    // 長いプレフィックスから順に
    static const char* const routes[] = {
        "/ping", "/a11y_tree_full", "/a11y_tree", "/state_full", "/state",
        "/phone_state", "/version", "/packages",
    };
    for (const char* r : routes) {
        if (!starts_with(p, r)) continue;
        json params = json::object();
        if (std::string(r) == "/a11y_tree_full" || std::string(r) == "/state_full") {
            params["filter"] = !query_false(req, "filter");
        }
        return respond(dispatcher_.dispatch(r + 1, params), "application/octet-stream");
    }

    return HttpResponse::json_body(error_envelope("Unknown endpoint: " + p));
}

HttpResponse HttpRouter::handle_post(const HttpRequest& req) {
    auto params = parse_post_body(req.body);
    if (params.is_err()) {
        PLOG_WARN("http", "POST %s: %s", req.path.c_str(), params.error().message.c_str());
        return HttpResponse::json_body(error_envelope(params.error().message), 400);
    }
    return respond(dispatcher_.dispatch(req.path, params.value()), "application/octet-stream");
}

} // namespace portal
