#pragma once

#include <optional>
#include <vector>
#include "common/Types.h"

namespace perpscalp {
namespace analytics {

// Batch reference formulas over a full history (oldest first).
// The streaming IndicatorPipeline must agree with these; an empty optional
// means the history is shorter than the lookback.
class TechnicalIndicators {
public:
    // RSI with Wilder smoothing. 100 when the average loss is zero.
    static std::optional<double> calculateRSI(const std::vector<double>& prices, int period = 14);

    // ATR: first value is the mean of the first `period` true ranges,
    // then ATR_t = ATR_{t-1} + (TR_t - ATR_{t-1}) / period.
    static std::optional<double> calculateATR(const std::vector<Candle>& candles, int period = 14);

    // EMA seeded by the SMA of the first `period` prices, alpha = 2/(N+1)
    static std::optional<double> calculateEMA(const std::vector<double>& prices, int period);
    static std::vector<double> calculateEMAVector(const std::vector<double>& prices, int period);

    // Mean of the last `period` prices
    static std::optional<double> calculateSMA(const std::vector<double>& prices, int period);

    // Typical-price VWAP over every candle passed in
    static std::optional<double> calculateVWAP(const std::vector<Candle>& candles);

    // Lowest and highest close once the outer `trim_pct` percent on each
    // side is discarded as outliers. Needs at least `min_count` closes.
    struct PriceLevels {
        double support = 0.0;
        double resistance = 0.0;
    };
    static std::optional<PriceLevels> calculateSupportResistance(
        const std::vector<double>& closes, double trim_pct = 5.0, size_t min_count = 10);

    // Linear interpolation between closest ranks
    static double percentile(std::vector<double> values, double pct);

    static std::vector<double> calculateTrueRanges(const std::vector<Candle>& candles);
    static std::vector<double> extractClosePrices(const std::vector<Candle>& candles);

    static double typicalPrice(const Candle& candle) {
        return (candle.high + candle.low + candle.close) / 3.0;
    }
};

} // namespace analytics
} // namespace perpscalp
