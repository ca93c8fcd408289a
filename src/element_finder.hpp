#pragma once
// =============================================================================
// PortalBridge - ElementFinder
// =============================================================================
// 検索順序:
//   1. resource-id (完全一致。"name" だけなら "<package>:id/name" も試す)
//   2. テキスト (大文字小文字無視の部分一致、exact_text なら完全一致)
//   3. content-description (完全一致)
//   4. クラス名 (完全名または短縮名)
// 最初に見つかったノード (pre-order) を返す。
// =============================================================================

#include <string>

#include "nlohmann/json.hpp"
#include "device_automation.hpp"
#include "device_gateway.hpp"
#include "result.hpp"

namespace portal {

struct ElementQuery {
    std::string resource_id;
    std::string text;
    std::string content_description;
    std::string class_name;
    bool exact_text = false;

    bool empty() const {
        return resource_id.empty() && text.empty() && content_description.empty() && class_name.empty();
    }

    // {"resource_id":..., "text":..., "content_description":..., "class_name":..., "exact":bool}
    static ElementQuery from_json(const nlohmann::json& args);
    std::string describe() const;
};

// node は snapshot が保持する木の中を指す
struct ElementMatch {
    TreeSnapshot snapshot;
    const RawNode* node = nullptr;
    std::string matched_by;  // "resource_id" | "text" | "content_description" | "class_name"

    const RawNode& operator*() const { return *node; }
    const RawNode* operator->() const { return node; }
};

class ElementFinder {
public:
    explicit ElementFinder(DeviceGateway& gateway);

    // Takes a fresh snapshot. Errors: MissingParameter (empty query),
    // OperationFailed (no window / not found)
    Result<ElementMatch> find(const ElementQuery& query);

    // Pure search over an existing tree
    static const RawNode* find_in(const RawNode& root, const ElementQuery& query,
                                  std::string* matched_by = nullptr);

    static nlohmann::json match_to_json(const RawNode& node);

private:
    DeviceGateway& gateway_;
};

} // namespace portal
