#pragma once

#include <string>

namespace perpscalp {
namespace common {

// Trading-day arithmetic. A day starts at UTC midnight shifted by
// `utc_offset_minutes` (0 = UTC day, e.g. 480 for an exchange day that rolls
// at 00:00 UTC+8).
class DailyBoundary {
public:
    static long long dayStartMs(long long ts_ms, int utc_offset_minutes);
    static long long nextBoundaryMs(long long ts_ms, int utc_offset_minutes);

    // YYYYMMDD of the trading day containing ts_ms
    static std::string dayKey(long long ts_ms, int utc_offset_minutes);
};

} // namespace common
} // namespace perpscalp
