#pragma once
// =============================================================================
// PortalBridge - Bounded polling wait
// =============================================================================
//   CancellationToken cancel;
//   auto r = wait_for_condition([&] { return finder.find(q).has_value(); },
//                               WaitOptions{}, &cancel);
//   if (r.is_err() && r.error().is(ErrorCode::Timeout)) ...
// =============================================================================

#include <atomic>
#include <chrono>
#include <functional>

#include "result.hpp"

namespace portal {

class CancellationToken {
public:
    void cancel() { cancelled_.store(true); }
    bool is_cancelled() const { return cancelled_.load(); }
    void reset() { cancelled_.store(false); }

private:
    std::atomic<bool> cancelled_{false};
};

struct WaitOptions {
    std::chrono::milliseconds interval{200};
    std::chrono::milliseconds max_wait{10000};
};

// Polls predicate on the calling thread until it returns true (Ok), the
// deadline passes (Timeout) or the token is cancelled (Cancelled).
// The predicate is evaluated at least once.
Result<void> wait_for_condition(const std::function<bool()>& predicate,
                                const WaitOptions& options = WaitOptions{},
                                const CancellationToken* cancel = nullptr);

} // namespace portal
