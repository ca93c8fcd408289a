#pragma once
// =============================================================================
// PortalBridge - Tree / state JSON codec
// =============================================================================
// Full node form:
//   {"text":"OK","contentDescription":"","resourceId":"com.app:id/ok",
//    "className":"android.widget.Button","packageName":"com.app",
//    "boundsInScreen":{"left":0,"top":0,"right":100,"bottom":50},
//    "isClickable":true, ..., "children":[...]}
// =============================================================================

#include <vector>

#include "nlohmann/json.hpp"
#include "device_automation.hpp"
#include "result.hpp"
#include "tree_compactor.hpp"

namespace portal {

nlohmann::json rect_to_json(const Rect& r);
nlohmann::json node_to_json(const RawNode& node);
// Missing members take their defaults; wrong types are MalformedInput
Result<RawNode> node_from_json(const nlohmann::json& j);

nlohmann::json phone_state_to_json(const PhoneState& state);
Result<PhoneState> phone_state_from_json(const nlohmann::json& j);

nlohmann::json package_to_json(const PackageInfo& pkg);
nlohmann::json packages_to_json(const std::vector<PackageInfo>& pkgs);

nlohmann::json element_to_json(const CompactElement& e);
nlohmann::json elements_to_json(const std::vector<CompactElement>& elems);

} // namespace portal
