#pragma once
// =============================================================================
// PortalBridge - JSON number narrowing
// =============================================================================
// Coordinates and durations arrive as arbitrary JSON numbers or numeric
// strings. Everything is narrowed to int through these helpers: out-of-range
// values saturate at INT_MIN / INT_MAX, NaN and non-numbers yield nullopt.
// =============================================================================

#include <cerrno>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <optional>
#include <string>

#include "nlohmann/json.hpp"

namespace portal {

inline int saturate_int(int64_t v) {
    if (v < std::numeric_limits<int>::min()) return std::numeric_limits<int>::min();
    if (v > std::numeric_limits<int>::max()) return std::numeric_limits<int>::max();
    return static_cast<int>(v);
}

inline std::optional<int> saturate_int(double v) {
    if (std::isnan(v)) return std::nullopt;
    if (v <= static_cast<double>(std::numeric_limits<int>::min())) return std::numeric_limits<int>::min();
    if (v >= static_cast<double>(std::numeric_limits<int>::max())) return std::numeric_limits<int>::max();
    return static_cast<int>(v);
}

// 前後の空白は許容、それ以外の余分な文字は nullopt
inline std::optional<int> parse_int(const std::string& text) {
    const char* p = text.c_str();
    while (*p == ' ' || *p == '\t') ++p;
    if (*p == '\0') return std::nullopt;
    char* end = nullptr;
    errno = 0;
    const long long n = std::strtoll(p, &end, 10);
    if (end == p) return std::nullopt;
    while (*end == ' ' || *end == '\t') ++end;
    if (*end != '\0') return std::nullopt;
    if (errno == ERANGE) {
        return n < 0 ? std::numeric_limits<int>::min() : std::numeric_limits<int>::max();
    }
    return saturate_int(static_cast<int64_t>(n));
}

// 整数 / 浮動小数 (切り捨て) / 10進文字列 を int に
inline std::optional<int> json_to_int(const nlohmann::json& v) {
    if (v.is_number_unsigned()) {
        const uint64_t u = v.get<uint64_t>();
        if (u > static_cast<uint64_t>(std::numeric_limits<int>::max())) return std::numeric_limits<int>::max();
        return static_cast<int>(u);
    }
    if (v.is_number_integer()) return saturate_int(v.get<int64_t>());
    if (v.is_number_float())   return saturate_int(v.get<double>());
    if (v.is_string()) return parse_int(v.get_ref<const std::string&>());
    return std::nullopt;
}

} // namespace portal
