#pragma once

#include <map>
#include <mutex>
#include <string>

#include "common/Clock.h"

namespace perpscalp {
namespace execution {

// Per-group request budget over a one second window.
struct RateLimitWindow {
    int max_per_second = 0;
    int current_count = 0;
    long long window_start_ms = 0;
};

// Fixed-window limiter keyed by request group ("order", "cancel", "query").
// Windows follow the injected clock, so replay time governs the budget.
class RateLimiter {
public:
    RateLimiter(const common::IClock& clock,
                int order_per_second = 10,
                int cancel_per_second = 10,
                int query_per_second = 20);

    // Non-blocking: false when the group's window is exhausted.
    bool tryAcquire(const std::string& group);

    int getRemainingRequests(const std::string& group);
    int rejectedRequests() const;

private:
    RateLimitWindow& windowFor(const std::string& group);
    void resetWindowIfNeeded(RateLimitWindow& window);

    const common::IClock& clock_;
    std::map<std::string, RateLimitWindow> windows_;
    mutable std::mutex mutex_;
    int rejected_requests_ = 0;
};

} // namespace execution
} // namespace perpscalp
