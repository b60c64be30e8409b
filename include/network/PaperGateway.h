#pragma once

#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "common/Clock.h"
#include "execution/RateLimiter.h"
#include "network/IExchangeGateway.h"

namespace perpscalp {
namespace network {

struct PaperGatewayConfig {
    double initial_margin = 10000.0;
    double leverage = 5.0;
    long long candle_interval_ms = 60000;
    int book_levels = 10;
    double tick_size = 0.01;
    int order_rate_per_second = 10;
    int cancel_rate_per_second = 10;
    int query_rate_per_second = 50;
};

// In-process venue. Orders rest until a published candle trades through
// them; fills are reported through the order update handler after the
// candle has been matched, never from inside placeOrder().
class PaperGateway : public IExchangeGateway {
public:
    PaperGateway(const PaperGatewayConfig& config, const common::IClock& clock);

    bool subscribeMarketData(const std::string& symbol, MarketDataHandler handler) override;
    void unsubscribe(const std::string& symbol) override;
    void setOrderUpdateHandler(OrderUpdateHandler handler) override;

    GatewayResult<std::string> placeOrder(const Order& order) override;
    GatewayResult<bool> cancelOrder(const std::string& order_id) override;

    GatewayResult<double> queryMargin() override;
    GatewayResult<std::vector<VenuePosition>> queryPositions() override;

    // Market data feed. A candle first matches resting orders, then reaches
    // subscribers preceded by an order book synthesized from it.
    void publishCandle(const std::string& symbol, const Candle& candle);
    void publishTrade(const std::string& symbol, const Trade& trade);
    void publishOrderBook(const OrderBookSnapshot& book);

    // Failure injection: the next `count` calls fail with `kind`.
    void failNextOrders(GatewayErrorKind kind, int count = 1);
    void failNextCancels(GatewayErrorKind kind, int count = 1);

    // Seeds a venue position, e.g. to exercise reconciliation.
    void setPosition(const std::string& symbol, double signed_size, double entry_price);

    std::vector<Order> workingOrders(const std::string& symbol) const;
    int placedOrderCount() const;
    int rateLimitedRequests() const;

    static OrderBookSnapshot synthesizeBook(const std::string& symbol, const Candle& candle,
                                            long long timestamp, int levels, double tick_size);

private:
    std::vector<OrderUpdate> matchCandle(const std::string& symbol, const Candle& candle);
    bool triggers(const Order& order, const Candle& candle, double& fill_price) const;
    void applyFill(const Order& order, double price, double size);
    void dispatch(const std::vector<OrderUpdate>& updates);
    void dispatchMarket(const std::string& symbol, const MarketEvent& event);

    PaperGatewayConfig config_;
    const common::IClock& clock_;
    execution::RateLimiter rate_limiter_;

    mutable std::mutex mutex_;
    std::map<std::string, MarketDataHandler> market_handlers_;
    OrderUpdateHandler update_handler_;
    std::map<std::string, Order> orders_;
    std::map<std::string, VenuePosition> positions_;
    double realized_pnl_ = 0.0;
    long long next_order_id_ = 1;
    int placed_orders_ = 0;
    std::deque<GatewayErrorKind> order_failures_;
    std::deque<GatewayErrorKind> cancel_failures_;
};

} // namespace network
} // namespace perpscalp
