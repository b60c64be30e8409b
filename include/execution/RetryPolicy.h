#pragma once

#include <chrono>
#include <functional>
#include <string>

#include "common/Logger.h"
#include "network/IExchangeGateway.h"

namespace perpscalp {
namespace execution {

struct RetryConfig {
    int max_attempts = 3;
    long long initial_backoff_ms = 200;
    double multiplier = 2.0;
    long long max_backoff_ms = 2000;
};

// Bounded exponential backoff around gateway calls. Only transient error
// kinds (network, rate limit) are retried.
class RetryPolicy {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    explicit RetryPolicy(const RetryConfig& config, Sleeper sleeper = Sleeper());

    // Delay before the given retry (1 = first retry).
    std::chrono::milliseconds backoffFor(int retry) const;

    template <typename T>
    network::GatewayResult<T> execute(const std::string& action,
                                      const std::function<network::GatewayResult<T>()>& call) const {
        const int attempts = config_.max_attempts < 1 ? 1 : config_.max_attempts;
        network::GatewayResult<T> result;
        for (int attempt = 1; attempt <= attempts; ++attempt) {
            result = call();
            if (result.ok() || !network::isTransient(result.error.kind)) {
                return result;
            }
            if (attempt == attempts) {
                break;
            }
            const auto delay = backoffFor(attempt);
            LOG_WARN("{} failed ({}: {}), retry {}/{} in {}ms", action,
                     network::gatewayErrorKindToString(result.error.kind), result.error.message,
                     attempt, attempts - 1, delay.count());
            sleep(delay);
        }
        LOG_ERROR("{} failed after {} attempts: {}", action, attempts, result.error.message);
        return result;
    }

    const RetryConfig& config() const { return config_; }

private:
    void sleep(std::chrono::milliseconds delay) const;

    RetryConfig config_;
    Sleeper sleeper_;
};

} // namespace execution
} // namespace perpscalp
