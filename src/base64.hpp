#pragma once
// =============================================================================
// PortalBridge - Base64 (RFC 4648, standard alphabet)
// =============================================================================
// keyboard/input は base64_text を受け取る。MCP の text.input はプレーン文字列を
// ここでエンコードしてから同じ経路に流す。
// =============================================================================

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace portal {

inline constexpr char BASE64_TABLE[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

inline std::string base64Encode(const uint8_t* data, size_t len) {
    std::string result;
    result.reserve((len + 2) / 3 * 4);

    for (size_t i = 0; i < len; i += 3) {
        uint32_t n = static_cast<uint32_t>(data[i]) << 16;
        if (i + 1 < len) n |= static_cast<uint32_t>(data[i + 1]) << 8;
        if (i + 2 < len) n |= static_cast<uint32_t>(data[i + 2]);

        result.push_back(BASE64_TABLE[(n >> 18) & 0x3F]);
        result.push_back(BASE64_TABLE[(n >> 12) & 0x3F]);
        result.push_back((i + 1 < len) ? BASE64_TABLE[(n >> 6) & 0x3F] : '=');
        result.push_back((i + 2 < len) ? BASE64_TABLE[n & 0x3F] : '=');
    }
    return result;
}

inline std::string base64Encode(const std::string& s) {
    return base64Encode(reinterpret_cast<const uint8_t*>(s.data()), s.size());
}

// Whitespace (line-wrapped input) is skipped. Returns nullopt on any other
// character outside the alphabet or on a bad length/padding.
inline std::optional<std::vector<uint8_t>> base64Decode(const std::string& in) {
    auto value_of = [](char c) -> int {
        if (c >= 'A' && c <= 'Z') return c - 'A';
        if (c >= 'a' && c <= 'z') return c - 'a' + 26;
        if (c >= '0' && c <= '9') return c - '0' + 52;
        if (c == '+') return 62;
        if (c == '/') return 63;
        return -1;
    };

    std::string clean;
    clean.reserve(in.size());
    for (char c : in) {
        if (c == ' ' || c == '\n' || c == '\r' || c == '\t') continue;
        clean.push_back(c);
    }
    if (clean.size() % 4 != 0) return std::nullopt;

    std::vector<uint8_t> out;
    out.reserve(clean.size() / 4 * 3);
    for (size_t i = 0; i < clean.size(); i += 4) {
        int v[4];
        int pad = 0;
        for (int k = 0; k < 4; ++k) {
            char c = clean[i + k];
            if (c == '=') {
                // padding only in the last quad, last two positions
                if (i + 4 != clean.size() || k < 2) return std::nullopt;
                v[k] = 0;
                ++pad;
            } else {
                if (pad > 0) return std::nullopt;
                v[k] = value_of(c);
                if (v[k] < 0) return std::nullopt;
            }
        }
        uint32_t n = (static_cast<uint32_t>(v[0]) << 18) | (static_cast<uint32_t>(v[1]) << 12) |
                     (static_cast<uint32_t>(v[2]) << 6) | static_cast<uint32_t>(v[3]);
        out.push_back(static_cast<uint8_t>((n >> 16) & 0xFF));
        if (pad < 2) out.push_back(static_cast<uint8_t>((n >> 8) & 0xFF));
        if (pad < 1) out.push_back(static_cast<uint8_t>(n & 0xFF));
    }
    return out;
}

} // namespace portal
