#pragma once

namespace perpscalp {
namespace strategy {

// EMA crossover direction, vetoed when RSI is exhausted in that direction
struct TrendMomentumRuleConfig {
    bool enabled = true;
    double weight = 0.5;
    double rsi_overbought = 70.0;
    double rsi_oversold = 30.0;
};

// Price on the trend side of VWAP, but not stretched past the band
struct VwapAlignmentRuleConfig {
    bool enabled = true;
    double weight = 0.25;
    double min_deviation_atr = 0.25;
    double max_deviation_atr = 2.0;
};

// Fade a stretch beyond band_atr x ATR from VWAP
struct MeanReversionRuleConfig {
    bool enabled = true;
    double weight = 0.5;
    double band_atr = 2.5;
};

// Trend-following entries must sit on the right side of both SMAs:
// long needs close > fast SMA > slow SMA, short the mirror
struct TrendFilterConfig {
    bool enabled = true;
};

// No long within buffer_atr x ATR of resistance, no short as close to support
struct LevelFilterConfig {
    bool enabled = true;
    double buffer_atr = 1.0;
};

struct ConfirmationGateConfig {
    double min_relative_volume = 1.2;
    double min_abs_imbalance = 0.0;
};

struct SignalConfig {
    double min_confidence = 0.5;
    double max_entry_slippage_pct = 0.002;
    TrendMomentumRuleConfig trend;
    VwapAlignmentRuleConfig vwap;
    MeanReversionRuleConfig mean_reversion;
    TrendFilterConfig trend_filter;
    LevelFilterConfig level_filter;
    ConfirmationGateConfig gate;
};

} // namespace strategy
} // namespace perpscalp
