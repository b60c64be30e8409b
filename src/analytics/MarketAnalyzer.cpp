#include "analytics/MarketAnalyzer.h"
#include "common/Logger.h"
#include <cmath>

namespace perpscalp {
namespace analytics {

MarketAnalyzer::MarketAnalyzer(const AnalyzerConfig& config)
    : config_(config)
    , volume_(config.volume_window_ms, config.trailing_windows) {}

bool MarketAnalyzer::onOrderBook(const OrderBookSnapshot& book) {
    if (book_ && book.timestamp < book_->timestamp) {
        LOG_WARN("{} order book older than current snapshot ignored ({} < {})",
                 book.symbol, book.timestamp, book_->timestamp);
        return false;
    }
    book_ = book;
    return true;
}

bool MarketAnalyzer::onTrade(const Trade& trade) {
    if (config_.volume_source != VolumeSource::TRADES) {
        return false;
    }
    if (!std::isfinite(trade.size) || trade.size <= 0.0) {
        return false;
    }
    return volume_.add(trade.timestamp, trade.size, trade.aggressor);
}

bool MarketAnalyzer::onClosedCandle(const Candle& candle) {
    last_candle_time_ = candle.open_time;
    if (config_.volume_source != VolumeSource::CANDLES) {
        return false;
    }
    // A candle has no aggressor; attribute its volume by the body direction.
    const OrderSide side = candle.close >= candle.open ? OrderSide::BUY : OrderSide::SELL;
    return volume_.add(candle.open_time, candle.volume, side);
}

ConfirmationMetrics MarketAnalyzer::metrics(long long now_ms) const {
    ConfirmationMetrics out;
    out.as_of_ms = now_ms;

    if (!book_) {
        out.stale_reason = "no order book";
        return out;
    }
    if (now_ms - book_->timestamp > config_.max_book_age_ms) {
        out.stale_reason = "order book older than " + std::to_string(config_.max_book_age_ms) + "ms";
        return out;
    }
    if (volume_.empty()) {
        out.stale_reason = "no volume samples";
        return out;
    }
    if (now_ms - volume_.lastSampleMs() > config_.max_volume_age_ms) {
        out.stale_reason = "volume samples older than " + std::to_string(config_.max_volume_age_ms) + "ms";
        return out;
    }

    // In candle mode the current window is the last closed candle.
    const long long window_ts = config_.volume_source == VolumeSource::CANDLES
        ? last_candle_time_
        : now_ms;
    const auto stats = volume_.stats(window_ts);
    if (!stats.valid) {
        out.stale_reason = "insufficient volume history";
        return out;
    }

    out.imbalance_ratio = OrderbookAnalyzer::imbalanceRatio(*book_, config_.depth_levels);
    out.relative_volume = stats.current_volume / stats.trailing_average;
    out.unusual_activity = out.relative_volume >= config_.unusual_volume_multiplier;
    out.buy_volume = stats.buy_volume;
    out.sell_volume = stats.sell_volume;
    if (!book_->bids.empty() && !book_->asks.empty()) {
        const double mid = (book_->bids.front().price + book_->asks.front().price) * 0.5;
        if (mid > 0.0) {
            out.spread_pct = (book_->asks.front().price - book_->bids.front().price) / mid;
        }
    }
    out.stale = false;
    out.stale_reason.clear();
    return out;
}

std::optional<OrderbookMetrics> MarketAnalyzer::bookMetrics(double target_notional) const {
    if (!book_) {
        return std::nullopt;
    }
    return OrderbookAnalyzer::analyze(*book_, target_notional, config_.depth_levels);
}

} // namespace analytics
} // namespace perpscalp
