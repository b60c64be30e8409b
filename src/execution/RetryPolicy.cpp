#include "execution/RetryPolicy.h"

#include <algorithm>
#include <cmath>
#include <thread>

namespace perpscalp {
namespace execution {

RetryPolicy::RetryPolicy(const RetryConfig& config, Sleeper sleeper)
    : config_(config)
    , sleeper_(std::move(sleeper))
{
    if (!sleeper_) {
        sleeper_ = [](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); };
    }
}

std::chrono::milliseconds RetryPolicy::backoffFor(int retry) const {
    if (retry < 1) {
        return std::chrono::milliseconds(0);
    }
    const double raw = static_cast<double>(config_.initial_backoff_ms) *
                       std::pow(config_.multiplier, static_cast<double>(retry - 1));
    const double capped = std::min(raw, static_cast<double>(config_.max_backoff_ms));
    return std::chrono::milliseconds(static_cast<long long>(capped));
}

void RetryPolicy::sleep(std::chrono::milliseconds delay) const {
    sleeper_(delay);
}

} // namespace execution
} // namespace perpscalp
