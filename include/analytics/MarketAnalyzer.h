#pragma once

#include <optional>
#include <string>

#include "analytics/OrderbookAnalyzer.h"
#include "analytics/VolumeProfile.h"
#include "common/Types.h"

namespace perpscalp {
namespace analytics {

enum class VolumeSource { TRADES, CANDLES };

struct AnalyzerConfig {
    int depth_levels = 10;
    VolumeSource volume_source = VolumeSource::CANDLES;
    long long volume_window_ms = 60000;     // one bucket; candle interval in CANDLES mode
    int trailing_windows = 20;
    double unusual_volume_multiplier = 1.5;
    long long max_book_age_ms = 5000;
    long long max_volume_age_ms = 180000;
};

// Confirmation inputs for the signal gate. Imbalance is derived from the
// latest book on read, never cached.
struct ConfirmationMetrics {
    double imbalance_ratio = 0.0;
    double relative_volume = 0.0;
    bool unusual_activity = false;
    double buy_volume = 0.0;
    double sell_volume = 0.0;
    double spread_pct = 0.0;
    bool stale = true;
    std::string stale_reason = "no data";
    long long as_of_ms = 0;
};

// Per-symbol order-book and volume state. Owned by one symbol worker, so it
// is not synchronized.
class MarketAnalyzer {
public:
    explicit MarketAnalyzer(const AnalyzerConfig& config = AnalyzerConfig());

    // Snapshots older than the current one are ignored.
    bool onOrderBook(const OrderBookSnapshot& book);
    bool onTrade(const Trade& trade);
    bool onClosedCandle(const Candle& candle);

    ConfirmationMetrics metrics(long long now_ms) const;

    std::optional<OrderbookMetrics> bookMetrics(double target_notional) const;

    const AnalyzerConfig& config() const { return config_; }

private:
    AnalyzerConfig config_;
    VolumeProfile volume_;
    std::optional<OrderBookSnapshot> book_;
    long long last_candle_time_ = -1;
};

} // namespace analytics
} // namespace perpscalp
