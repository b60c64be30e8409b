#include "network/PaperGateway.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <string>
#include <vector>

using namespace perpscalp;
using network::GatewayErrorKind;
using network::PaperGateway;

namespace {
constexpr long long kBase = 1704067200000LL;
constexpr long long kMinute = 60000LL;

bool near(double a, double b, double eps = 1e-9) {
    return std::abs(a - b) <= eps;
}

network::PaperGatewayConfig testConfig() {
    network::PaperGatewayConfig config;
    config.initial_margin = 10000.0;
    config.leverage = 5.0;
    config.candle_interval_ms = kMinute;
    config.book_levels = 5;
    config.order_rate_per_second = 1000;
    config.cancel_rate_per_second = 1000;
    config.query_rate_per_second = 1000;
    return config;
}

Order makeOrder(OrderKind kind, OrderSide side, double price, double size, bool reduce_only = false) {
    Order order;
    order.symbol = "BTCUSDT";
    order.kind = kind;
    order.side = side;
    order.price = price;
    order.size = size;
    order.reduce_only = reduce_only;
    return order;
}

void testRejectsInvalidOrders() {
    common::ManualClock clock(kBase);
    PaperGateway gateway(testConfig(), clock);

    auto result = gateway.placeOrder(makeOrder(OrderKind::ENTRY, OrderSide::BUY, 100.0, 0.0));
    assert(!result.ok() && result.error.kind == GatewayErrorKind::VALIDATION);
    result = gateway.placeOrder(makeOrder(OrderKind::STOP, OrderSide::SELL, 0.0, 1.0));
    assert(!result.ok() && result.error.kind == GatewayErrorKind::VALIDATION);

    gateway.failNextOrders(GatewayErrorKind::NETWORK);
    result = gateway.placeOrder(makeOrder(OrderKind::ENTRY, OrderSide::BUY, 100.0, 1.0));
    assert(!result.ok() && result.error.kind == GatewayErrorKind::NETWORK);
    result = gateway.placeOrder(makeOrder(OrderKind::ENTRY, OrderSide::BUY, 100.0, 1.0));
    assert(result.ok());
    assert(gateway.placedOrderCount() == 1);

    auto cancel = gateway.cancelOrder("nope");
    assert(!cancel.ok() && cancel.error.kind == GatewayErrorKind::VALIDATION);
    assert(gateway.cancelOrder(*result.value).ok());
    assert(gateway.workingOrders("BTCUSDT").empty());
}

void testFillsPrecedeMarketData() {
    common::ManualClock clock(kBase);
    PaperGateway gateway(testConfig(), clock);

    std::vector<std::string> seen;
    long long book_ts = 0;
    double fill_price = 0.0;
    gateway.setOrderUpdateHandler([&](const network::OrderUpdate& update) {
        seen.push_back("fill");
        fill_price = update.avg_price;
        assert(update.status == OrderStatus::FILLED);
        assert(near(update.filled_size, 1.0));
        assert(update.ts_ms == kBase + kMinute);
    });
    gateway.subscribeMarketData("BTCUSDT", [&](const network::MarketEvent& event) {
        if (event.type == network::MarketEventType::ORDER_BOOK) {
            seen.push_back("book");
            book_ts = event.book.timestamp;
        } else if (event.type == network::MarketEventType::CANDLE) {
            seen.push_back("candle");
        }
    });

    assert(gateway.placeOrder(makeOrder(OrderKind::ENTRY, OrderSide::BUY, 100.0, 1.0)).ok());
    // Gap down through the limit fills at the open
    gateway.publishCandle("BTCUSDT", Candle(kBase, 99.0, 99.5, 98.5, 99.2, 10.0));

    assert(seen.size() == 3);
    assert(seen[0] == "fill" && seen[1] == "book" && seen[2] == "candle");
    assert(near(fill_price, 99.0));
    assert(book_ts == kBase + kMinute);

    // Other symbols see nothing
    seen.clear();
    gateway.publishCandle("ETHUSDT", Candle(kBase, 10.0, 11.0, 9.0, 10.5, 1.0));
    assert(seen.empty());
}

void testStopAndLimitTriggers() {
    common::ManualClock clock(kBase);
    PaperGateway gateway(testConfig(), clock);

    std::vector<network::OrderUpdate> updates;
    gateway.setOrderUpdateHandler([&](const network::OrderUpdate& u) { updates.push_back(u); });

    gateway.setPosition("BTCUSDT", 2.0, 100.0);
    auto stop = gateway.placeOrder(makeOrder(OrderKind::STOP, OrderSide::SELL, 95.0, 1.0, true));
    auto target = gateway.placeOrder(makeOrder(OrderKind::TAKE_PROFIT, OrderSide::SELL, 105.0, 1.0, true));

    // Neither level is touched
    gateway.publishCandle("BTCUSDT", Candle(kBase, 100.0, 104.0, 96.0, 101.0, 10.0));
    assert(updates.empty());

    // Target reached at its own price
    gateway.publishCandle("BTCUSDT", Candle(kBase + kMinute, 103.0, 106.0, 102.0, 104.0, 10.0));
    assert(updates.size() == 1);
    assert(updates[0].order_id == *target.value);
    assert(near(updates[0].avg_price, 105.0));

    // Gap through the stop slips to the open
    gateway.publishCandle("BTCUSDT", Candle(kBase + 2 * kMinute, 94.0, 94.5, 92.0, 93.0, 10.0));
    assert(updates.size() == 2);
    assert(updates[1].order_id == *stop.value);
    assert(near(updates[1].avg_price, 94.0));
    assert(gateway.queryPositions().value->empty());

    // Reduce-only with no exposure left is cancelled, never opens a position
    gateway.placeOrder(makeOrder(OrderKind::EXIT, OrderSide::SELL, 0.0, 1.0, true));
    gateway.publishCandle("BTCUSDT", Candle(kBase + 3 * kMinute, 93.0, 93.5, 92.5, 93.0, 10.0));
    assert(updates.size() == 3);
    assert(updates[2].status == OrderStatus::CANCELLED);
    assert(gateway.queryPositions().value->empty());
}

void testMarginAndPositions() {
    common::ManualClock clock(kBase);
    PaperGateway gateway(testConfig(), clock);
    assert(near(*gateway.queryMargin().value, 10000.0));

    gateway.placeOrder(makeOrder(OrderKind::ENTRY, OrderSide::BUY, 0.0, 1.0));
    gateway.publishCandle("BTCUSDT", Candle(kBase, 100.0, 101.0, 99.0, 100.5, 10.0));
    auto positions = gateway.queryPositions();
    assert(positions.ok() && positions.value->size() == 1);
    assert(near((*positions.value)[0].size, 1.0));
    assert(near((*positions.value)[0].entry_price, 100.0));
    // 100 notional at 5x leverage
    assert(near(*gateway.queryMargin().value, 9980.0));

    gateway.placeOrder(makeOrder(OrderKind::EXIT, OrderSide::SELL, 0.0, 1.0, true));
    gateway.publishCandle("BTCUSDT", Candle(kBase + kMinute, 110.0, 111.0, 109.0, 110.5, 10.0));
    assert(gateway.queryPositions().value->empty());
    assert(near(*gateway.queryMargin().value, 10010.0));
}

void testCancelAndQueryBudgets() {
    common::ManualClock clock(kBase);
    auto config = testConfig();
    config.cancel_rate_per_second = 2;
    config.query_rate_per_second = 3;
    PaperGateway gateway(config, clock);

    std::vector<std::string> ids;
    for (int i = 0; i < 3; ++i) {
        auto placed = gateway.placeOrder(makeOrder(OrderKind::ENTRY, OrderSide::BUY, 90.0 - i, 1.0));
        assert(placed.ok());
        ids.push_back(*placed.value);
    }

    assert(gateway.cancelOrder(ids[0]).ok());
    assert(gateway.cancelOrder(ids[1]).ok());
    auto cancel = gateway.cancelOrder(ids[2]);
    assert(!cancel.ok() && cancel.error.kind == GatewayErrorKind::RATE_LIMITED);
    // A throttled cancel leaves the order working
    assert(gateway.workingOrders("BTCUSDT").size() == 1);

    // Queries draw on their own budget, shared by margin and positions
    assert(gateway.queryMargin().ok());
    assert(gateway.queryPositions().ok());
    assert(gateway.queryMargin().ok());
    auto margin = gateway.queryMargin();
    assert(!margin.ok() && margin.error.kind == GatewayErrorKind::RATE_LIMITED);
    auto positions = gateway.queryPositions();
    assert(!positions.ok() && positions.error.kind == GatewayErrorKind::RATE_LIMITED);
    assert(gateway.rateLimitedRequests() == 3);

    // Orders were never throttled by the other groups
    assert(gateway.placeOrder(makeOrder(OrderKind::ENTRY, OrderSide::BUY, 80.0, 1.0)).ok());

    clock.advance(999);
    assert(!gateway.cancelOrder(ids[2]).ok());
    clock.advance(1);
    assert(gateway.cancelOrder(ids[2]).ok());
    assert(gateway.queryMargin().ok());
    assert(gateway.rateLimitedRequests() == 4);
}

void testSynthesizedBook() {
    // Bullish body leans resting size toward the bid
    auto book = PaperGateway::synthesizeBook("BTCUSDT", Candle(kBase, 100.0, 102.0, 99.0, 101.5, 40.0),
                                             kBase + kMinute, 3, 0.5);
    assert(book.bids.size() == 3 && book.asks.size() == 3);
    assert(near(book.bids[0].price, 101.0));
    assert(near(book.asks[0].price, 102.0));
    assert(book.bids[0].size > book.asks[0].size);
    assert(book.bids[2].price < book.bids[1].price);

    auto flat = PaperGateway::synthesizeBook("BTCUSDT", Candle(kBase, 100.0, 100.0, 100.0, 100.0, 0.0),
                                             kBase, 2, 0.0);
    assert(near(flat.bids[0].size, flat.asks[0].size));
    assert(near(flat.bids[0].price, 99.99));
}
}

int main() {
    std::cout << "[TEST] Starting PaperGateway Test..." << std::endl;

    testRejectsInvalidOrders();
    testFillsPrecedeMarketData();
    testStopAndLimitTriggers();
    testMarginAndPositions();
    testCancelAndQueryBudgets();
    testSynthesizedBook();

    std::cout << "[TEST] PaperGateway Test PASSED!" << std::endl;
    return 0;
}
