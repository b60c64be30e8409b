#include "execution/RateLimiter.h"
#include "common/Logger.h"
#include <algorithm>

namespace perpscalp {
namespace execution {

namespace {
constexpr long long kWindowMs = 1000;
}

RateLimiter::RateLimiter(const common::IClock& clock,
                         int order_per_second,
                         int cancel_per_second,
                         int query_per_second)
    : clock_(clock)
{
    const long long now = clock_.nowMs();
    windows_["order"] = RateLimitWindow{order_per_second, 0, now};
    windows_["cancel"] = RateLimitWindow{cancel_per_second, 0, now};
    windows_["query"] = RateLimitWindow{query_per_second, 0, now};

    LOG_INFO("RateLimiter initialized: order={}/s cancel={}/s query={}/s",
             order_per_second, cancel_per_second, query_per_second);
}

RateLimitWindow& RateLimiter::windowFor(const std::string& group) {
    auto it = windows_.find(group);
    if (it == windows_.end()) {
        // Unknown groups share the query budget.
        it = windows_.find("query");
    }
    return it->second;
}

bool RateLimiter::tryAcquire(const std::string& group) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto& window = windowFor(group);
    resetWindowIfNeeded(window);

    if (window.current_count < window.max_per_second) {
        window.current_count++;
        return true;
    }

    rejected_requests_++;
    LOG_DEBUG("Rate limit reached for group {}", group);
    return false;
}

int RateLimiter::getRemainingRequests(const std::string& group) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& window = windowFor(group);
    resetWindowIfNeeded(window);
    return std::max(0, window.max_per_second - window.current_count);
}

int RateLimiter::rejectedRequests() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return rejected_requests_;
}

void RateLimiter::resetWindowIfNeeded(RateLimitWindow& window) {
    const long long now = clock_.nowMs();
    // A clock set backwards by replay also starts a fresh window.
    if (now - window.window_start_ms >= kWindowMs || now < window.window_start_ms) {
        window.current_count = 0;
        window.window_start_ms = now;
    }
}

} // namespace execution
} // namespace perpscalp
