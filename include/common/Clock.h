#pragma once

#include <atomic>
#include <chrono>

namespace perpscalp {
namespace common {

// Injected time source. Components never read the wall clock directly so
// that paper replay and tests stay deterministic.
class IClock {
public:
    virtual ~IClock() = default;

    // Milliseconds since the Unix epoch.
    virtual long long nowMs() const = 0;
};

class SystemClock : public IClock {
public:
    long long nowMs() const override {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    }
};

// Driven externally by the replay feed or by tests.
class ManualClock : public IClock {
public:
    explicit ManualClock(long long start_ms = 0) : now_ms_(start_ms) {}

    long long nowMs() const override { return now_ms_.load(std::memory_order_acquire); }

    void set(long long ms) { now_ms_.store(ms, std::memory_order_release); }
    void advance(long long delta_ms) { now_ms_.fetch_add(delta_ms, std::memory_order_acq_rel); }

private:
    std::atomic<long long> now_ms_;
};

} // namespace common
} // namespace perpscalp
