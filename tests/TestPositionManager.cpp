#include "execution/PositionManager.h"
#include "network/PaperGateway.h"

#include <algorithm>
#include <cassert>
#include <chrono>
#include <cmath>
#include <iostream>
#include <mutex>
#include <vector>

using namespace perpscalp;
using execution::PositionManager;
using execution::PositionState;
using core::NotificationType;

namespace {
// 2024-01-01 10:00:00 UTC
constexpr long long kMorning = 1704103200000LL;
constexpr long long kMinute = 60000LL;

bool near(double a, double b, double eps = 1e-6) {
    return std::abs(a - b) <= eps;
}

class RecordingSink : public core::INotificationSink {
public:
    void notify(const core::Notification& notification) override {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back(notification);
    }

    int count(NotificationType type) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<int>(std::count_if(events_.begin(), events_.end(),
            [type](const core::Notification& e) { return e.type == type; }));
    }

private:
    mutable std::mutex mutex_;
    std::vector<core::Notification> events_;
};

risk::RiskLimits testLimits() {
    risk::RiskLimits limits;
    limits.max_trades_per_day = 20;
    limits.max_daily_loss = 1000.0;
    limits.max_position_size = 100.0;
    limits.max_consecutive_losses = 0;
    limits.min_entry_interval_sec = 0;
    return limits;
}

network::PaperGatewayConfig gatewayConfig() {
    network::PaperGatewayConfig config;
    config.candle_interval_ms = kMinute;
    config.order_rate_per_second = 1000;
    config.cancel_rate_per_second = 1000;
    config.query_rate_per_second = 1000;
    return config;
}

strategy::Signal makeSignal(Direction direction, const std::string& symbol = "BTCUSDT",
                            double price = 100.0, double atr = 2.0) {
    strategy::Signal signal;
    signal.symbol = symbol;
    signal.direction = direction;
    signal.confidence = 0.75;
    signal.reference_price = price;
    signal.atr = atr;
    signal.timestamp = kMorning;
    return signal;
}

// Wires a paper venue, risk manager and position manager on a manual clock.
struct Harness {
    common::ManualClock clock{kMorning};
    RecordingSink sink;
    std::vector<long long> sleeps;
    network::PaperGateway gateway{gatewayConfig(), clock};
    risk::RiskManager risk{testLimits(), clock, &sink};
    PositionManager positions;
    long long next_candle = kMorning;

    explicit Harness(const execution::PositionConfig& config = execution::PositionConfig())
        : positions(config, gateway, risk, clock, &sink,
                    [this](std::chrono::milliseconds delay) { sleeps.push_back(delay.count()); })
    {
        gateway.setOrderUpdateHandler([this](const network::OrderUpdate& update) {
            positions.onOrderUpdate(update);
        });
    }

    void candle(const std::string& symbol, double open, double high, double low, double close) {
        clock.set(next_candle + kMinute);
        gateway.publishCandle(symbol, Candle(next_candle, open, high, low, close, 10.0));
        next_candle += kMinute;
    }

    int workingKind(const std::string& symbol, OrderKind kind) const {
        const auto orders = gateway.workingOrders(symbol);
        return static_cast<int>(std::count_if(orders.begin(), orders.end(),
            [kind](const Order& o) { return o.kind == kind; }));
    }
};

void testLongLadderToFullClose() {
    Harness h;
    assert(h.positions.openPosition(makeSignal(Direction::LONG), 2.0));
    assert(h.positions.getPosition("BTCUSDT")->state == PositionState::ENTRY_PENDING);
    assert(h.sink.count(NotificationType::ENTRY_SUBMITTED) == 1);

    // Entry limit at 100 fills
    h.candle("BTCUSDT", 100.5, 100.8, 99.8, 100.2);
    auto position = h.positions.getPosition("BTCUSDT");
    assert(position && position->state == PositionState::OPEN);
    assert(near(position->entry_price, 100.0));
    // Stop 1.5 ATR below, targets at +1 and +2 ATR with half each
    assert(near(position->stop_loss_price, 97.0));
    assert(position->take_profits.size() == 2);
    assert(near(position->take_profits[0].price, 102.0));
    assert(near(position->take_profits[1].price, 104.0));
    assert(near(position->take_profits[0].fraction, 0.5));
    assert(near(position->take_profits[1].size, 1.0));
    assert(h.workingKind("BTCUSDT", OrderKind::STOP) == 1);
    assert(h.workingKind("BTCUSDT", OrderKind::TAKE_PROFIT) == 2);
    assert(h.sink.count(NotificationType::POSITION_OPENED) == 1);
    assert(h.risk.getState().daily_trade_count == 1);

    // First target; stop follows to breakeven and is resized
    h.candle("BTCUSDT", 101.5, 102.5, 101.0, 102.2);
    position = h.positions.getPosition("BTCUSDT");
    assert(position->state == PositionState::PARTIALLY_CLOSED);
    assert(near(position->remaining_size, 1.0));
    assert(near(position->stop_loss_price, 100.0));
    assert(near(position->realized_pnl, 2.0));
    const auto orders = h.gateway.workingOrders("BTCUSDT");
    for (const auto& order : orders) {
        if (order.kind == OrderKind::STOP) {
            assert(near(order.size, 1.0));
        }
    }
    assert(h.workingKind("BTCUSDT", OrderKind::STOP) == 1);
    assert(h.sink.count(NotificationType::TAKE_PROFIT_HIT) == 1);
    assert(h.sink.count(NotificationType::STOP_MOVED) == 1);

    // Final target closes the position
    h.candle("BTCUSDT", 103.0, 104.5, 102.5, 104.2);
    assert(!h.positions.getPosition("BTCUSDT"));
    assert(h.sink.count(NotificationType::TAKE_PROFIT_HIT) == 2);
    assert(h.sink.count(NotificationType::POSITION_CLOSED) == 1);
    assert(h.gateway.workingOrders("BTCUSDT").empty());

    const auto closed = h.positions.closedPositions();
    assert(closed.size() == 1);
    assert(near(closed.back().closedFraction(), 1.0));
    assert(near(closed.back().realized_pnl, 6.0));
    assert(near(h.risk.getState().daily_realized_pnl, 6.0));
    assert(h.risk.getState().consecutive_losses == 0);
    assert(h.gateway.queryPositions().value->empty());
}

void testShortStoppedOut() {
    Harness h;
    assert(h.positions.openPosition(makeSignal(Direction::SHORT), 1.0));
    h.candle("BTCUSDT", 99.5, 100.2, 99.3, 99.8);

    auto position = h.positions.getPosition("BTCUSDT");
    assert(position && position->state == PositionState::OPEN);
    assert(near(position->stop_loss_price, 103.0));
    assert(near(position->take_profits[0].price, 98.0));
    assert(near(position->take_profits[1].price, 96.0));

    h.candle("BTCUSDT", 101.0, 104.0, 100.5, 103.5);
    assert(!h.positions.getPosition("BTCUSDT"));
    assert(h.sink.count(NotificationType::STOP_LOSS_HIT) == 1);
    assert(h.sink.count(NotificationType::POSITION_CLOSED) == 1);

    const auto closed = h.positions.closedPositions();
    assert(near(closed.back().realized_pnl, -3.0));
    assert(near(closed.back().closedFraction(), 1.0));
    assert(near(h.risk.getState().daily_realized_pnl, -3.0));
    assert(h.risk.getState().consecutive_losses == 1);
    assert(h.gateway.workingOrders("BTCUSDT").empty());
}

void testEntryTimeout() {
    execution::PositionConfig config;
    config.entry_timeout_sec = 30;
    Harness h(config);

    assert(h.positions.openPosition(makeSignal(Direction::LONG), 1.0));
    h.clock.advance(29 * 1000);
    assert(!h.positions.checkTimeout("BTCUSDT"));

    h.clock.advance(2 * 1000);
    assert(h.positions.checkTimeout("BTCUSDT"));
    assert(!h.positions.getPosition("BTCUSDT"));
    assert(h.sink.count(NotificationType::ENTRY_CANCELLED) == 1);
    assert(h.gateway.workingOrders("BTCUSDT").empty());

    // Already idle: nothing more to cancel
    assert(!h.positions.checkTimeout("BTCUSDT"));
    assert(h.positions.checkTimeouts() == 0);
    assert(h.sink.count(NotificationType::ENTRY_CANCELLED) == 1);
    // An unfilled entry never counts as a trade
    assert(h.risk.getState().daily_trade_count == 0);

    // A failed cancel still frees the slot but flags the symbol
    assert(h.positions.openPosition(makeSignal(Direction::LONG), 1.0));
    h.clock.advance(31 * 1000);
    h.gateway.failNextCancels(network::GatewayErrorKind::VALIDATION);
    assert(h.positions.checkTimeouts() == 1);
    assert(h.risk.isInManualReview("BTCUSDT"));
}

network::OrderUpdate orderUpdate(const std::string& symbol, const std::string& order_id,
                                 OrderStatus status, double filled_size, double price) {
    network::OrderUpdate update;
    update.symbol = symbol;
    update.order_id = order_id;
    update.status = status;
    update.filled_size = filled_size;
    update.avg_price = price;
    update.ts_ms = kMorning;
    return update;
}

void testPartialEntryFillSurvivesTimeout() {
    execution::PositionConfig config;
    config.entry_timeout_sec = 30;
    Harness h(config);

    assert(h.risk.authorize(makeSignal(Direction::LONG), 10000.0).approved);
    assert(h.risk.reservedEntries() == 1);
    assert(h.positions.openPosition(makeSignal(Direction::LONG), 1.0));
    const std::string entry_id = h.positions.getPosition("BTCUSDT")->entry_order_id;

    h.positions.onOrderUpdate(orderUpdate("BTCUSDT", entry_id, OrderStatus::PARTIALLY_FILLED, 0.4, 100.0));
    h.gateway.setPosition("BTCUSDT", 0.4, 100.0);
    assert(h.positions.getPosition("BTCUSDT")->state == PositionState::ENTRY_PENDING);
    assert(near(h.positions.getPosition("BTCUSDT")->entry_filled_size, 0.4));

    // Timeout cancels the rest and keeps the filled part under protection
    h.clock.advance(31 * 1000);
    assert(h.positions.checkTimeouts() == 1);
    auto position = h.positions.getPosition("BTCUSDT");
    assert(position && position->state == PositionState::OPEN);
    assert(near(position->size, 0.4));
    assert(near(position->remaining_size, 0.4));
    assert(near(position->stop_loss_price, 97.0));
    assert(position->take_profits.size() == 2);
    assert(near(position->take_profits[0].size + position->take_profits[1].size, 0.4));
    assert(h.workingKind("BTCUSDT", OrderKind::STOP) == 1);
    assert(h.workingKind("BTCUSDT", OrderKind::TAKE_PROFIT) == 2);
    assert(h.workingKind("BTCUSDT", OrderKind::ENTRY) == 0);
    assert(h.sink.count(NotificationType::POSITION_OPENED) == 1);
    assert(h.sink.count(NotificationType::ENTRY_CANCELLED) == 0);
    assert(h.risk.getState().daily_trade_count == 1);
    assert(h.risk.reservedEntries() == 0);

    // The late cancel acknowledgement changes nothing
    h.positions.onOrderUpdate(orderUpdate("BTCUSDT", entry_id, OrderStatus::CANCELLED, 0.0, 0.0));
    assert(h.positions.getPosition("BTCUSDT")->state == PositionState::OPEN);
    assert(!h.risk.isInManualReview("BTCUSDT"));
    assert(h.positions.reconcile(*h.gateway.queryPositions().value).empty());

    // A venue-side cancel after a partial fill opens the filled part too
    assert(h.positions.openPosition(makeSignal(Direction::LONG, "ETHUSDT", 2000.0, 10.0), 0.5));
    const std::string eth_id = h.positions.getPosition("ETHUSDT")->entry_order_id;
    h.positions.onOrderUpdate(orderUpdate("ETHUSDT", eth_id, OrderStatus::PARTIALLY_FILLED, 0.2, 1999.0));
    h.positions.onOrderUpdate(orderUpdate("ETHUSDT", eth_id, OrderStatus::CANCELLED, 0.0, 0.0));
    position = h.positions.getPosition("ETHUSDT");
    assert(position && position->state == PositionState::OPEN);
    assert(near(position->size, 0.2));
    assert(near(position->entry_price, 1999.0));
    assert(h.risk.getState().daily_trade_count == 2);

    // An unfilled timeout gives the trade slot back
    assert(h.risk.authorize(makeSignal(Direction::LONG, "SOLUSDT", 50.0, 1.0), 10000.0).approved);
    assert(h.positions.openPosition(makeSignal(Direction::LONG, "SOLUSDT", 50.0, 1.0), 1.0));
    assert(h.risk.reservedEntries() == 1);
    h.clock.advance(31 * 1000);
    assert(h.positions.checkTimeout("SOLUSDT"));
    assert(h.risk.reservedEntries() == 0);
    assert(h.risk.getState().daily_trade_count == 2);
}

void testPartialTakeProfitFills() {
    Harness h;
    assert(h.positions.openPosition(makeSignal(Direction::LONG), 2.0));
    h.candle("BTCUSDT", 100.5, 100.8, 99.8, 100.2);
    const std::string tp_id = h.positions.getPosition("BTCUSDT")->take_profits[0].order_id;
    assert(h.gateway.cancelOrder(tp_id).ok());

    h.positions.onOrderUpdate(orderUpdate("BTCUSDT", tp_id, OrderStatus::PARTIALLY_FILLED, 0.4, 102.0));
    auto position = h.positions.getPosition("BTCUSDT");
    assert(position->state == PositionState::PARTIALLY_CLOSED);
    assert(near(position->remaining_size, 1.6));
    assert(near(position->realized_pnl, 0.8));
    assert(!position->take_profits[0].filled);
    assert(near(position->take_profits[0].filled_size, 0.4));
    assert(near(position->stop_loss_price, 97.0));
    assert(near(h.risk.getState().daily_realized_pnl, 0.8));

    // The rest of the level completes it and moves the stop
    h.positions.onOrderUpdate(orderUpdate("BTCUSDT", tp_id, OrderStatus::FILLED, 0.6, 102.0));
    position = h.positions.getPosition("BTCUSDT");
    assert(near(position->remaining_size, 1.0));
    assert(near(position->realized_pnl, 2.0));
    assert(position->take_profits[0].filled);
    assert(near(position->stop_loss_price, 100.0));
    assert(h.sink.count(NotificationType::TAKE_PROFIT_HIT) == 2);

    h.candle("BTCUSDT", 103.0, 104.5, 102.5, 104.2);
    assert(!h.positions.getPosition("BTCUSDT"));
    const auto closed = h.positions.closedPositions();
    assert(near(closed.back().closedFraction(), 1.0));
    assert(near(closed.back().realized_pnl, 6.0));
    assert(!h.risk.isInManualReview("BTCUSDT"));
}

void testOnePositionPerSymbol() {
    Harness h;
    assert(h.positions.openPosition(makeSignal(Direction::LONG), 1.0));
    assert(!h.positions.openPosition(makeSignal(Direction::SHORT), 1.0));
    assert(h.gateway.placedOrderCount() == 1);

    assert(h.positions.openPosition(makeSignal(Direction::LONG, "ETHUSDT", 2000.0, 10.0), 0.5));
    assert(h.positions.getAllPositions().size() == 2);
    assert(!h.positions.openPosition(makeSignal(Direction::LONG, "SOLUSDT"), 0.0));
}

void testTrailingStop() {
    execution::PositionConfig config;
    config.trailing_enabled = true;
    config.trail_activation_atr = 1.0;
    config.trail_distance_atr = 1.0;
    config.take_profit_ladder = {{5.0, 1.0}};
    Harness h(config);

    assert(h.positions.openPosition(makeSignal(Direction::LONG), 2.0));
    h.candle("BTCUSDT", 100.5, 100.8, 99.8, 100.2);
    assert(near(h.positions.getPosition("BTCUSDT")->stop_loss_price, 97.0));

    // Below the breakeven trigger: nothing moves
    h.positions.onPrice("BTCUSDT", 101.0);
    assert(near(h.positions.getPosition("BTCUSDT")->stop_loss_price, 97.0));

    h.positions.onPrice("BTCUSDT", 102.5);
    assert(near(h.positions.getPosition("BTCUSDT")->stop_loss_price, 100.5));
    assert(h.sink.count(NotificationType::STOP_MOVED) == 1);

    // A pullback never loosens the stop
    h.positions.onPrice("BTCUSDT", 101.0);
    assert(near(h.positions.getPosition("BTCUSDT")->stop_loss_price, 100.5));

    h.positions.onPrice("BTCUSDT", 104.0);
    assert(near(h.positions.getPosition("BTCUSDT")->stop_loss_price, 102.0));
    assert(h.sink.count(NotificationType::STOP_MOVED) == 2);

    const auto orders = h.gateway.workingOrders("BTCUSDT");
    assert(h.workingKind("BTCUSDT", OrderKind::STOP) == 1);
    for (const auto& order : orders) {
        if (order.kind == OrderKind::STOP) {
            assert(near(order.price, 102.0));
            assert(order.reduce_only);
        }
    }
}

void testRetryOnTransientErrors() {
    Harness h;
    h.gateway.failNextOrders(network::GatewayErrorKind::NETWORK, 2);
    assert(h.positions.openPosition(makeSignal(Direction::LONG), 1.0));
    assert(h.sleeps.size() == 2);
    assert(h.sleeps[0] == 200 && h.sleeps[1] == 400);

    // Validation failures are final
    h.gateway.failNextOrders(network::GatewayErrorKind::VALIDATION, 1);
    assert(!h.positions.openPosition(makeSignal(Direction::LONG, "ETHUSDT", 2000.0, 10.0), 0.5));
    assert(h.sleeps.size() == 2);
    assert(!h.positions.getPosition("ETHUSDT"));
    assert(h.sink.count(NotificationType::ORDER_ERROR) == 1);

    // Transient failures past the attempt budget give up
    h.gateway.failNextOrders(network::GatewayErrorKind::RATE_LIMITED, 3);
    assert(!h.positions.openPosition(makeSignal(Direction::LONG, "SOLUSDT", 50.0, 1.0), 1.0));
    assert(h.sleeps.size() == 4);
    assert(h.sink.count(NotificationType::ORDER_ERROR) == 2);
}

void testStopPlacementFailureFlattens() {
    Harness h;
    assert(h.positions.openPosition(makeSignal(Direction::LONG), 1.0));
    h.gateway.failNextOrders(network::GatewayErrorKind::VALIDATION, 1);
    h.candle("BTCUSDT", 100.5, 100.8, 99.8, 100.2);

    auto position = h.positions.getPosition("BTCUSDT");
    assert(position && !position->exit_order_id.empty());
    assert(position->stop_order_id.empty());
    assert(h.workingKind("BTCUSDT", OrderKind::EXIT) == 1);

    h.candle("BTCUSDT", 100.4, 100.6, 100.1, 100.3);
    assert(!h.positions.getPosition("BTCUSDT"));
    const auto closed = h.positions.closedPositions();
    assert(near(closed.back().closedFraction(), 1.0));
    assert(near(closed.back().realized_pnl, 0.4));
}

void testUntrackedFillNeedsReview() {
    Harness h;
    assert(h.positions.openPosition(makeSignal(Direction::LONG), 1.0));

    network::OrderUpdate stray;
    stray.order_id = "foreign-1";
    stray.symbol = "BTCUSDT";
    stray.status = OrderStatus::FILLED;
    stray.filled_size = 1.0;
    stray.avg_price = 100.0;
    h.positions.onOrderUpdate(stray);
    assert(h.risk.isInManualReview("BTCUSDT"));
    assert(h.sink.count(NotificationType::RECONCILIATION_MISMATCH) == 1);

    stray.symbol = "XRPUSDT";
    h.positions.onOrderUpdate(stray);
    assert(h.risk.isInManualReview("XRPUSDT"));

    // Non-fill noise is ignored
    stray.symbol = "ETHUSDT";
    stray.status = OrderStatus::CANCELLED;
    h.positions.onOrderUpdate(stray);
    assert(!h.risk.isInManualReview("ETHUSDT"));
}

void testManualClose() {
    Harness h;
    assert(h.positions.openPosition(makeSignal(Direction::LONG), 1.0));
    h.positions.closePosition("BTCUSDT", "operator");
    assert(!h.positions.getPosition("BTCUSDT"));
    assert(h.sink.count(NotificationType::ENTRY_CANCELLED) == 1);

    assert(h.positions.openPosition(makeSignal(Direction::LONG), 1.0));
    h.candle("BTCUSDT", 100.5, 100.8, 99.8, 100.2);
    h.positions.closeAll("shutdown");
    assert(h.workingKind("BTCUSDT", OrderKind::EXIT) == 1);
    assert(h.workingKind("BTCUSDT", OrderKind::STOP) == 0);

    h.candle("BTCUSDT", 101.0, 101.2, 100.9, 101.1);
    assert(!h.positions.getPosition("BTCUSDT"));
    assert(h.positions.closedPositions().back().close_reason == "shutdown");
}

void testReconcileAndRestore() {
    Harness h;
    int persisted = 0;
    h.positions.setPersistCallback([&persisted]() { persisted++; });

    assert(h.positions.openPosition(makeSignal(Direction::LONG), 2.0));
    h.candle("BTCUSDT", 100.5, 100.8, 99.8, 100.2);
    assert(persisted >= 2);

    // Venue agrees on BTC but holds an ETH position we never opened
    h.gateway.setPosition("ETHUSDT", 0.5, 2000.0);
    const auto mismatched = h.positions.reconcile(*h.gateway.queryPositions().value);
    assert(mismatched.size() == 1 && mismatched[0] == "ETHUSDT");
    assert(h.risk.isInManualReview("ETHUSDT"));
    assert(!h.risk.isInManualReview("BTCUSDT"));

    // Snapshot survives a JSON round trip into a fresh manager
    std::vector<execution::Position> restored;
    for (const auto& p : h.positions.snapshot()) {
        restored.push_back(PositionManager::positionFromJson(PositionManager::toJson(p)));
    }
    PositionManager fresh(execution::PositionConfig(), h.gateway, h.risk, h.clock);
    fresh.restore(restored);
    auto position = fresh.getPosition("BTCUSDT");
    assert(position && position->state == PositionState::OPEN);
    assert(near(position->stop_loss_price, 97.0));
    assert(position->take_profits.size() == 2);
    assert(!position->stop_order_id.empty());
    assert(fresh.reconcile(*h.gateway.queryPositions().value).size() == 1);
}
}

int main() {
    std::cout << "[TEST] Starting PositionManager Test..." << std::endl;

    testLongLadderToFullClose();
    testShortStoppedOut();
    testEntryTimeout();
    testPartialEntryFillSurvivesTimeout();
    testPartialTakeProfitFills();
    testOnePositionPerSymbol();
    testTrailingStop();
    testRetryOnTransientErrors();
    testStopPlacementFailureFlattens();
    testUntrackedFillNeedsReview();
    testManualClose();
    testReconcileAndRestore();

    std::cout << "[TEST] PositionManager Test PASSED!" << std::endl;
    return 0;
}
