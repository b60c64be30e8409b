#include "analytics/TechnicalIndicators.h"
#include <algorithm>
#include <cmath>

namespace perpscalp {
namespace analytics {

std::optional<double> TechnicalIndicators::calculateRSI(const std::vector<double>& prices, int period) {
    if (period <= 0 || prices.size() < static_cast<size_t>(period + 1)) {
        return std::nullopt;
    }

    double avg_gain = 0.0;
    double avg_loss = 0.0;

    // seed: simple average over the first `period` changes
    for (int i = 1; i <= period; ++i) {
        double change = prices[i] - prices[i - 1];
        if (change > 0) avg_gain += change;
        else avg_loss += -change;
    }
    avg_gain /= period;
    avg_loss /= period;

    for (size_t i = period + 1; i < prices.size(); ++i) {
        double change = prices[i] - prices[i - 1];
        double gain = change > 0 ? change : 0.0;
        double loss = change < 0 ? -change : 0.0;
        avg_gain = (avg_gain * (period - 1) + gain) / period;
        avg_loss = (avg_loss * (period - 1) + loss) / period;
    }

    if (avg_loss <= 0.0) return 100.0;

    double rs = avg_gain / avg_loss;
    return 100.0 - (100.0 / (1.0 + rs));
}

std::vector<double> TechnicalIndicators::calculateTrueRanges(const std::vector<Candle>& candles) {
    std::vector<double> tr_values;
    if (candles.size() < 2) return tr_values;
    tr_values.reserve(candles.size() - 1);

    // first TR needs a previous close, so it starts at index 1
    for (size_t i = 1; i < candles.size(); ++i) {
        const auto& current = candles[i];
        const double prev_close = candles[i - 1].close;
        tr_values.push_back(std::max({
            current.high - current.low,
            std::abs(current.high - prev_close),
            std::abs(current.low - prev_close)
        }));
    }
    return tr_values;
}

std::optional<double> TechnicalIndicators::calculateATR(const std::vector<Candle>& candles, int period) {
    if (period <= 0) return std::nullopt;

    const auto tr_values = calculateTrueRanges(candles);
    if (tr_values.size() < static_cast<size_t>(period)) return std::nullopt;

    double atr = 0.0;
    for (int i = 0; i < period; ++i) atr += tr_values[i];
    atr /= period;

    for (size_t i = period; i < tr_values.size(); ++i) {
        atr = atr + (tr_values[i] - atr) / period;
    }
    return atr;
}

std::optional<double> TechnicalIndicators::calculateEMA(const std::vector<double>& prices, int period) {
    const auto series = calculateEMAVector(prices, period);
    if (series.empty()) return std::nullopt;
    return series.back();
}

std::vector<double> TechnicalIndicators::calculateEMAVector(
    const std::vector<double>& prices,
    int period
) {
    std::vector<double> ema_values;
    if (period <= 0 || prices.size() < static_cast<size_t>(period)) return ema_values;

    const double multiplier = 2.0 / (period + 1.0);

    double ema = 0.0;
    for (int i = 0; i < period; ++i) ema += prices[i];
    ema /= period;
    ema_values.push_back(ema);

    for (size_t i = period; i < prices.size(); ++i) {
        ema = (prices[i] - ema) * multiplier + ema;
        ema_values.push_back(ema);
    }
    return ema_values;
}

std::optional<double> TechnicalIndicators::calculateSMA(const std::vector<double>& prices, int period) {
    if (period <= 0 || prices.size() < static_cast<size_t>(period)) return std::nullopt;

    double sum = 0.0;
    for (size_t i = prices.size() - period; i < prices.size(); ++i) {
        sum += prices[i];
    }
    return sum / period;
}

std::optional<double> TechnicalIndicators::calculateVWAP(const std::vector<Candle>& candles) {
    double cumulative_tpv = 0.0;
    double cumulative_volume = 0.0;

    for (const auto& candle : candles) {
        cumulative_tpv += typicalPrice(candle) * candle.volume;
        cumulative_volume += candle.volume;
    }

    if (cumulative_volume <= 0.0) return std::nullopt;
    return cumulative_tpv / cumulative_volume;
}

double TechnicalIndicators::percentile(std::vector<double> values, double pct) {
    if (values.empty()) return 0.0;
    std::sort(values.begin(), values.end());
    const double rank = std::clamp(pct, 0.0, 100.0) / 100.0 * static_cast<double>(values.size() - 1);
    const size_t lower = static_cast<size_t>(std::floor(rank));
    const size_t upper = std::min(lower + 1, values.size() - 1);
    return values[lower] + (values[upper] - values[lower]) * (rank - static_cast<double>(lower));
}

std::optional<TechnicalIndicators::PriceLevels> TechnicalIndicators::calculateSupportResistance(
    const std::vector<double>& closes, double trim_pct, size_t min_count) {
    if (closes.empty() || closes.size() < min_count) return std::nullopt;

    const double lower_bound = percentile(closes, trim_pct);
    const double upper_bound = percentile(closes, 100.0 - trim_pct);

    std::optional<double> support;
    std::optional<double> resistance;
    for (double close : closes) {
        if (close >= lower_bound && (!support || close < *support)) support = close;
        if (close <= upper_bound && (!resistance || close > *resistance)) resistance = close;
    }
    if (!support || !resistance) return std::nullopt;

    PriceLevels levels;
    levels.support = *support;
    levels.resistance = *resistance;
    return levels;
}

std::vector<double> TechnicalIndicators::extractClosePrices(const std::vector<Candle>& candles) {
    std::vector<double> closes;
    closes.reserve(candles.size());
    for (const auto& candle : candles) {
        closes.push_back(candle.close);
    }
    return closes;
}

} // namespace analytics
} // namespace perpscalp
