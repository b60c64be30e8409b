#pragma once
// ===================================================================
// Per-instrument price tick / lot step helpers.
//
// Perpetual venues reject orders whose price is off the tick grid or
// whose quantity is off the lot grid (or below the minimum lot), so every
// price and size leaving the engine goes through these helpers.
// ===================================================================

#include <cmath>

namespace perpscalp {
namespace common {

struct InstrumentSpec {
    double tick_size = 0.01;
    double lot_step = 0.001;
    double min_qty = 0.001;
    double min_stop_distance_pct = 0.1;   // stop at least this % away from entry
};

// Small epsilon so 0.3 / 0.1 does not floor to 2.
inline double roundDownToStep(double value, double step) {
    if (step <= 0.0) return value;
    return std::floor(value / step + 1e-9) * step;
}

inline double roundUpToStep(double value, double step) {
    if (step <= 0.0) return value;
    return std::ceil(value / step - 1e-9) * step;
}

inline double roundToStep(double value, double step) {
    if (step <= 0.0) return value;
    return std::round(value / step) * step;
}

// Buy-side trigger prices round down, sell-side round up, so the rounded
// stop is never closer to the entry than the computed one.
inline double roundStopPrice(double price, double tick, bool is_long) {
    return is_long ? roundDownToStep(price, tick) : roundUpToStep(price, tick);
}

} // namespace common
} // namespace perpscalp
