#include "common/DailyBoundary.h"

#include <cstdio>
#include <ctime>

namespace perpscalp {
namespace common {

namespace {
constexpr long long kDayMs = 24LL * 60 * 60 * 1000;

long long floorDiv(long long a, long long b) {
    long long q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) {
        --q;
    }
    return q;
}
}

long long DailyBoundary::dayStartMs(long long ts_ms, int utc_offset_minutes) {
    const long long offset_ms = static_cast<long long>(utc_offset_minutes) * 60 * 1000;
    const long long local = ts_ms + offset_ms;
    return floorDiv(local, kDayMs) * kDayMs - offset_ms;
}

long long DailyBoundary::nextBoundaryMs(long long ts_ms, int utc_offset_minutes) {
    return dayStartMs(ts_ms, utc_offset_minutes) + kDayMs;
}

std::string DailyBoundary::dayKey(long long ts_ms, int utc_offset_minutes) {
    const long long offset_ms = static_cast<long long>(utc_offset_minutes) * 60 * 1000;
    std::time_t seconds = static_cast<std::time_t>(floorDiv(ts_ms + offset_ms, 1000));

    std::tm tm_utc{};
#ifdef _WIN32
    gmtime_s(&tm_utc, &seconds);
#else
    gmtime_r(&seconds, &tm_utc);
#endif

    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d%02d%02d",
                  tm_utc.tm_year + 1900, tm_utc.tm_mon + 1, tm_utc.tm_mday);
    return std::string(buf);
}

} // namespace common
} // namespace perpscalp
