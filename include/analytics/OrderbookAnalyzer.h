#pragma once

#include "common/Types.h"

namespace perpscalp {
namespace analytics {

struct OrderbookMetrics {
    double best_bid;
    double best_ask;
    double mid_price;
    double spread_pct;
    double bid_volume;
    double ask_volume;
    double imbalance;       // (bid - ask) / (bid + ask), in [-1, 1]
    double vwap_buy;
    double vwap_sell;
    double target_notional;
    bool valid;

    OrderbookMetrics()
        : best_bid(0.0)
        , best_ask(0.0)
        , mid_price(0.0)
        , spread_pct(0.0)
        , bid_volume(0.0)
        , ask_volume(0.0)
        , imbalance(0.0)
        , vwap_buy(0.0)
        , vwap_sell(0.0)
        , target_notional(0.0)
        , valid(false)
    {}
};

class OrderbookAnalyzer {
public:
    static OrderbookMetrics analyze(
        const OrderBookSnapshot& book,
        double target_notional,
        int depth_limit = 10
    );

    static double imbalanceRatio(const OrderBookSnapshot& book, int depth_limit = 10);

    // Average fill price when sweeping `target_notional` through the book.
    static double estimateVWAPForNotional(
        const OrderBookSnapshot& book,
        double target_notional,
        bool is_buy,
        int depth_limit = 20
    );

    static double estimateSlippagePctForNotional(
        const OrderBookSnapshot& book,
        double target_notional,
        bool is_buy,
        double reference_price,
        int depth_limit = 20
    );
};

} // namespace analytics
} // namespace perpscalp
