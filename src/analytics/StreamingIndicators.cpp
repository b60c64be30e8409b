#include "analytics/StreamingIndicators.h"
#include "analytics/TechnicalIndicators.h"
#include "common/DailyBoundary.h"
#include <algorithm>
#include <cmath>

namespace perpscalp {
namespace analytics {

// ===== SMA =====

SmaCalculator::SmaCalculator(int period)
    : period_(std::max(1, period))
    , window_(static_cast<size_t>(std::max(1, period))) {}

std::optional<double> SmaCalculator::update(double value) {
    auto evicted = window_.push(value);
    sum_ += value;
    if (evicted) {
        sum_ -= *evicted;
    }
    return this->value();
}

std::optional<double> SmaCalculator::value() const {
    if (!window_.full()) return std::nullopt;
    return sum_ / period_;
}

// ===== EMA =====

EmaCalculator::EmaCalculator(int period)
    : period_(std::max(1, period))
    , alpha_(2.0 / (std::max(1, period) + 1.0)) {}

std::optional<double> EmaCalculator::update(double value) {
    if (ema_) {
        ema_ = (value - *ema_) * alpha_ + *ema_;
        return ema_;
    }

    seed_sum_ += value;
    ++seen_;
    if (seen_ == period_) {
        ema_ = seed_sum_ / period_;
    }
    return ema_;
}

// ===== ATR =====

AtrCalculator::AtrCalculator(int period) : period_(std::max(1, period)) {}

std::optional<double> AtrCalculator::update(const Candle& candle) {
    if (!prev_close_) {
        prev_close_ = candle.close;
        return atr_;
    }

    const double tr = std::max({
        candle.high - candle.low,
        std::abs(candle.high - *prev_close_),
        std::abs(candle.low - *prev_close_)
    });
    prev_close_ = candle.close;

    if (atr_) {
        atr_ = *atr_ + (tr - *atr_) / period_;
        return atr_;
    }

    tr_seed_sum_ += tr;
    ++tr_count_;
    if (tr_count_ == period_) {
        atr_ = tr_seed_sum_ / period_;
    }
    return atr_;
}

// ===== RSI =====

RsiCalculator::RsiCalculator(int period) : period_(std::max(1, period)) {}

double RsiCalculator::fromAverages(double avg_gain, double avg_loss) {
    if (avg_loss <= 0.0) return 100.0;
    double rs = avg_gain / avg_loss;
    return 100.0 - (100.0 / (1.0 + rs));
}

std::optional<double> RsiCalculator::update(double close) {
    if (!prev_close_) {
        prev_close_ = close;
        return rsi_;
    }

    const double change = close - *prev_close_;
    prev_close_ = close;
    const double gain = change > 0 ? change : 0.0;
    const double loss = change < 0 ? -change : 0.0;

    if (change_count_ < period_) {
        avg_gain_ += gain;
        avg_loss_ += loss;
        ++change_count_;
        if (change_count_ == period_) {
            avg_gain_ /= period_;
            avg_loss_ /= period_;
            rsi_ = fromAverages(avg_gain_, avg_loss_);
        }
        return rsi_;
    }

    avg_gain_ = (avg_gain_ * (period_ - 1) + gain) / period_;
    avg_loss_ = (avg_loss_ * (period_ - 1) + loss) / period_;
    rsi_ = fromAverages(avg_gain_, avg_loss_);
    return rsi_;
}

// ===== VWAP =====

VwapCalculator::VwapCalculator(VwapMode mode, int rolling_period, int reset_utc_offset_minutes)
    : mode_(mode)
    , rolling_period_(std::max(1, rolling_period))
    , reset_utc_offset_minutes_(reset_utc_offset_minutes)
    , window_(static_cast<size_t>(std::max(1, rolling_period))) {}

std::optional<double> VwapCalculator::update(const Candle& candle) {
    const Sample sample{TechnicalIndicators::typicalPrice(candle) * candle.volume, candle.volume};

    if (mode_ == VwapMode::SESSION) {
        const long long day_start =
            common::DailyBoundary::dayStartMs(candle.open_time, reset_utc_offset_minutes_);
        if (day_start != session_start_ms_) {
            session_start_ms_ = day_start;
            sum_tpv_ = 0.0;
            sum_volume_ = 0.0;
        }
        sum_tpv_ += sample.tpv;
        sum_volume_ += sample.volume;
        return value();
    }

    auto evicted = window_.push(sample);
    sum_tpv_ += sample.tpv;
    sum_volume_ += sample.volume;
    if (evicted) {
        sum_tpv_ -= evicted->tpv;
        sum_volume_ -= evicted->volume;
    }
    return value();
}

std::optional<double> VwapCalculator::value() const {
    if (mode_ == VwapMode::ROLLING && !window_.full()) return std::nullopt;
    if (sum_volume_ <= 0.0) return std::nullopt;
    return sum_tpv_ / sum_volume_;
}

} // namespace analytics
} // namespace perpscalp
