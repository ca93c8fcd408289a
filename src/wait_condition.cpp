// =============================================================================
// PortalBridge - Bounded polling wait
// =============================================================================

#include "wait_condition.hpp"

#include <algorithm>
#include <string>
#include <thread>

namespace portal {

namespace {
// キャンセル応答性のため、長い interval も細かく刻んで眠る
constexpr auto CANCEL_SLICE = std::chrono::milliseconds(20);
}

Result<void> wait_for_condition(const std::function<bool()>& predicate,
                                const WaitOptions& options,
                                const CancellationToken* cancel) {
    using clock = std::chrono::steady_clock;
    const auto deadline = clock::now() + options.max_wait;
    const auto interval = std::max(options.interval, std::chrono::milliseconds(1));

    while (true) {
        if (cancel && cancel->is_cancelled()) {
            return Error(ErrorCode::Cancelled, "wait cancelled");
        }
        if (predicate()) return Ok();

        const auto now = clock::now();
        if (now >= deadline) {
            return Error(ErrorCode::Timeout,
                         "condition not met within " + std::to_string(options.max_wait.count()) + " ms");
        }

        const auto wake = std::min(deadline, now + interval);
        while (clock::now() < wake) {
            if (cancel && cancel->is_cancelled()) {
                return Error(ErrorCode::Cancelled, "wait cancelled");
            }
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(wake - clock::now());
            std::this_thread::sleep_for(std::min<std::chrono::milliseconds>(
                std::max(remaining, std::chrono::milliseconds(1)), CANCEL_SLICE));
        }
    }
}

} // namespace portal
