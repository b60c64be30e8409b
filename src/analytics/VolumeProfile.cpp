#include "analytics/VolumeProfile.h"
#include <algorithm>

namespace perpscalp {
namespace analytics {

VolumeProfile::VolumeProfile(long long window_ms, int trailing_windows)
    : window_ms_(std::max(1LL, window_ms))
    , trailing_windows_(std::max(1, trailing_windows)) {}

bool VolumeProfile::add(long long ts_ms, double volume, OrderSide aggressor) {
    if (volume < 0.0 || ts_ms < 0) {
        return false;
    }

    const long long index = bucketIndex(ts_ms);
    if (!buckets_.empty() && index < buckets_.front().index) {
        return false;
    }

    auto it = std::find_if(buckets_.begin(), buckets_.end(),
                           [index](const Bucket& b) { return b.index >= index; });
    if (it == buckets_.end() || it->index != index) {
        Bucket bucket;
        bucket.index = index;
        it = buckets_.insert(it, bucket);
    }

    if (aggressor == OrderSide::BUY) {
        it->buy += volume;
    } else {
        it->sell += volume;
    }

    if (first_index_ < 0 || index < first_index_) {
        first_index_ = index;
    }
    last_sample_ms_ = std::max(last_sample_ms_, ts_ms);

    evictBefore(buckets_.back().index - trailing_windows_);
    return true;
}

void VolumeProfile::evictBefore(long long min_index) {
    while (!buckets_.empty() && buckets_.front().index < min_index) {
        buckets_.pop_front();
    }
}

VolumeWindowStats VolumeProfile::stats(long long ts_ms) const {
    VolumeWindowStats out;
    if (first_index_ < 0) {
        return out;
    }

    const long long current = bucketIndex(ts_ms);
    const long long from = std::max(current - trailing_windows_, first_index_);
    double trailing_sum = 0.0;

    for (const auto& bucket : buckets_) {
        if (bucket.index == current) {
            out.buy_volume = bucket.buy;
            out.sell_volume = bucket.sell;
            out.current_volume = bucket.buy + bucket.sell;
        } else if (bucket.index >= from && bucket.index < current) {
            trailing_sum += bucket.buy + bucket.sell;
        }
    }

    out.trailing_windows = static_cast<int>(std::max(0LL, current - from));
    if (out.trailing_windows > 0) {
        out.trailing_average = trailing_sum / out.trailing_windows;
    }
    out.valid = out.trailing_windows > 0 && out.trailing_average > 0.0;
    return out;
}

} // namespace analytics
} // namespace perpscalp
