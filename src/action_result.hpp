#pragma once
// =============================================================================
// PortalBridge - Action results
// =============================================================================
// Dispatcher output: JSON data or a binary payload (PNG screenshot).
// Transports wrap it into {"success":true,"data":...} / {"success":false,"error":...}.
// =============================================================================

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include "nlohmann/json.hpp"
#include "result.hpp"

namespace portal {

struct BinaryPayload {
    std::vector<uint8_t> bytes;
    std::string content_type = "application/octet-stream";
};

using ActionOutput = std::variant<nlohmann::json, BinaryPayload>;
using ActionResult = Result<ActionOutput>;

inline bool is_binary(const ActionOutput& out) {
    return std::holds_alternative<BinaryPayload>(out);
}

inline ActionResult action_ok(nlohmann::json data) {
    return ActionResult(ActionOutput(std::in_place_index<0>, std::move(data)));
}

inline ActionResult action_ok(BinaryPayload payload) {
    return ActionResult(ActionOutput(std::in_place_index<1>, std::move(payload)));
}

inline ActionResult action_err(ErrorCode code, std::string message) {
    return ActionResult(Error(code, std::move(message)));
}

inline nlohmann::json success_envelope(nlohmann::json data) {
    nlohmann::json j;
    j["success"] = true;
    j["data"] = std::move(data);
    return j;
}

inline nlohmann::json error_envelope(const std::string& message) {
    return nlohmann::json{{"success", false}, {"error", message}};
}

} // namespace portal
