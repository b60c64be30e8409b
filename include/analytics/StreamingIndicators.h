#pragma once

#include <optional>
#include "common/RingBuffer.h"
#include "common/Types.h"

namespace perpscalp {
namespace analytics {

// O(1) incremental calculators. Each returns an empty optional while it is
// warming up; no numeric placeholder is ever exposed.

class SmaCalculator {
public:
    explicit SmaCalculator(int period);
    std::optional<double> update(double value);
    std::optional<double> value() const;

private:
    int period_;
    common::RingBuffer<double> window_;
    double sum_ = 0.0;
};

class EmaCalculator {
public:
    explicit EmaCalculator(int period);
    std::optional<double> update(double value);
    std::optional<double> value() const { return ema_; }

private:
    int period_;
    double alpha_;
    int seen_ = 0;
    double seed_sum_ = 0.0;
    std::optional<double> ema_;
};

// Wilder ATR seeded with the mean of the first N true ranges
class AtrCalculator {
public:
    explicit AtrCalculator(int period);
    std::optional<double> update(const Candle& candle);
    std::optional<double> value() const { return atr_; }

private:
    int period_;
    std::optional<double> prev_close_;
    int tr_count_ = 0;
    double tr_seed_sum_ = 0.0;
    std::optional<double> atr_;
};

// Wilder RSI seeded with simple averages of the first N changes
class RsiCalculator {
public:
    explicit RsiCalculator(int period);
    std::optional<double> update(double close);
    std::optional<double> value() const { return rsi_; }

private:
    static double fromAverages(double avg_gain, double avg_loss);

    int period_;
    std::optional<double> prev_close_;
    int change_count_ = 0;
    double avg_gain_ = 0.0;
    double avg_loss_ = 0.0;
    std::optional<double> rsi_;
};

enum class VwapMode { SESSION, ROLLING };

// Session mode resets at the daily boundary, rolling mode covers the last
// `rolling_period` candles.
class VwapCalculator {
public:
    VwapCalculator(VwapMode mode, int rolling_period, int reset_utc_offset_minutes);
    std::optional<double> update(const Candle& candle);
    std::optional<double> value() const;
    // SESSION mode: start of the session the last candle belonged to.
    long long sessionStartMs() const { return session_start_ms_; }

private:
    struct Sample {
        double tpv = 0.0;
        double volume = 0.0;
    };

    VwapMode mode_;
    int rolling_period_;
    int reset_utc_offset_minutes_;
    long long session_start_ms_ = -1;
    common::RingBuffer<Sample> window_;
    double sum_tpv_ = 0.0;
    double sum_volume_ = 0.0;
};

} // namespace analytics
} // namespace perpscalp
