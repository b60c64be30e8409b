#include "analytics/OrderbookAnalyzer.h"
#include <algorithm>
#include <cmath>

namespace perpscalp {
namespace analytics {

namespace {

double sumSize(const std::vector<BookLevel>& levels, int depth_limit) {
    const int depth = std::min(depth_limit, static_cast<int>(levels.size()));
    double total = 0.0;
    for (int i = 0; i < depth; ++i) {
        if (levels[i].size > 0.0 && std::isfinite(levels[i].size)) {
            total += levels[i].size;
        }
    }
    return total;
}

}

double OrderbookAnalyzer::imbalanceRatio(const OrderBookSnapshot& book, int depth_limit) {
    const double bid_volume = sumSize(book.bids, depth_limit);
    const double ask_volume = sumSize(book.asks, depth_limit);
    const double total = bid_volume + ask_volume;
    if (total <= 0.0) {
        return 0.0;
    }
    return (bid_volume - ask_volume) / total;
}

OrderbookMetrics OrderbookAnalyzer::analyze(
    const OrderBookSnapshot& book,
    double target_notional,
    int depth_limit
) {
    OrderbookMetrics metrics;
    metrics.target_notional = target_notional;

    if (book.bids.empty() || book.asks.empty() || depth_limit <= 0) {
        return metrics;
    }

    metrics.best_bid = book.bids.front().price;
    metrics.best_ask = book.asks.front().price;

    if (metrics.best_bid > 0.0 && metrics.best_ask > 0.0) {
        metrics.mid_price = (metrics.best_bid + metrics.best_ask) * 0.5;
        metrics.spread_pct = (metrics.best_ask - metrics.best_bid) / metrics.mid_price;
    }

    metrics.bid_volume = sumSize(book.bids, depth_limit);
    metrics.ask_volume = sumSize(book.asks, depth_limit);
    metrics.imbalance = imbalanceRatio(book, depth_limit);

    metrics.vwap_buy = estimateVWAPForNotional(book, target_notional, true, depth_limit);
    metrics.vwap_sell = estimateVWAPForNotional(book, target_notional, false, depth_limit);
    metrics.valid = metrics.mid_price > 0.0 && metrics.best_ask >= metrics.best_bid;

    return metrics;
}

double OrderbookAnalyzer::estimateVWAPForNotional(
    const OrderBookSnapshot& book,
    double target_notional,
    bool is_buy,
    int depth_limit
) {
    const auto& levels = is_buy ? book.asks : book.bids;
    if (levels.empty() || target_notional <= 0.0) {
        return 0.0;
    }

    double remaining = target_notional;
    double total_qty = 0.0;
    double total_cost = 0.0;
    const int depth = std::min(depth_limit, static_cast<int>(levels.size()));

    for (int i = 0; i < depth && remaining > 0.0; ++i) {
        const double price = levels[i].price;
        const double size = levels[i].size;
        if (price <= 0.0 || size <= 0.0) {
            continue;
        }

        const double take_notional = std::min(remaining, price * size);
        const double take_qty = take_notional / price;

        total_qty += take_qty;
        total_cost += take_qty * price;
        remaining -= take_notional;
    }

    if (total_qty <= 0.0) {
        return 0.0;
    }
    return total_cost / total_qty;
}

double OrderbookAnalyzer::estimateSlippagePctForNotional(
    const OrderBookSnapshot& book,
    double target_notional,
    bool is_buy,
    double reference_price,
    int depth_limit
) {
    if (reference_price <= 0.0) {
        return 0.0;
    }

    const double vwap = estimateVWAPForNotional(book, target_notional, is_buy, depth_limit);
    if (vwap <= 0.0) {
        return 0.0;
    }

    return is_buy ? (vwap - reference_price) / reference_price
                  : (reference_price - vwap) / reference_price;
}

} // namespace analytics
} // namespace perpscalp
