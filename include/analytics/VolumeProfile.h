#pragma once

#include <deque>
#include "common/Types.h"

namespace perpscalp {
namespace analytics {

struct VolumeWindowStats {
    double current_volume = 0.0;
    double trailing_average = 0.0;
    double buy_volume = 0.0;
    double sell_volume = 0.0;
    int trailing_windows = 0;
    bool valid = false;
};

// Rolling buy/sell volume bucketed into fixed windows. Keeps the current
// window plus `trailing_windows` completed ones; older buckets are evicted.
class VolumeProfile {
public:
    VolumeProfile(long long window_ms, int trailing_windows);

    // false when the sample falls before the retained range
    bool add(long long ts_ms, double volume, OrderSide aggressor);

    // Stats with `ts_ms`'s window as the current one. Windows without
    // samples count as zero volume; windows before the first sample do not
    // count at all.
    VolumeWindowStats stats(long long ts_ms) const;

    long long lastSampleMs() const { return last_sample_ms_; }
    long long windowMs() const { return window_ms_; }
    bool empty() const { return buckets_.empty(); }

private:
    struct Bucket {
        long long index = 0;
        double buy = 0.0;
        double sell = 0.0;
    };

    long long bucketIndex(long long ts_ms) const { return ts_ms / window_ms_; }
    void evictBefore(long long min_index);

    long long window_ms_;
    int trailing_windows_;
    std::deque<Bucket> buckets_;
    long long first_index_ = -1;
    long long last_sample_ms_ = -1;
};

} // namespace analytics
} // namespace perpscalp
