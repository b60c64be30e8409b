#include "core/orchestration/TradingCycleCoordinator.h"
#include "network/PaperGateway.h"

#include <algorithm>
#include <cassert>
#include <cmath>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

using namespace perpscalp;
using core::CycleStage;
using core::NotificationType;
using core::TradingCycleCoordinator;

namespace {
// 2024-01-01 10:00:00 UTC
constexpr long long kMorning = 1704103200000LL;
constexpr long long kMinute = 60000LL;
constexpr long long kNow = kMorning + 5 * kMinute;

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

// Votes the same way on every candle.
class FixedVoteRule : public strategy::ISignalRule {
public:
    explicit FixedVoteRule(std::optional<Direction> direction) : direction_(direction) {}

    std::string getName() const override { return "fixed"; }

    strategy::RuleVote evaluate(const analytics::IndicatorState&) const override {
        strategy::RuleVote vote;
        vote.rule_name = getName();
        vote.direction = direction_;
        vote.weight = direction_ ? 1.0 : 0.0;
        return vote;
    }

private:
    std::optional<Direction> direction_;
};

strategy::SignalEngine makeEngine(std::optional<Direction> direction, double max_slippage = 0.002) {
    strategy::SignalConfig config;
    config.max_entry_slippage_pct = max_slippage;
    std::vector<std::unique_ptr<strategy::ISignalRule>> rules;
    rules.push_back(std::make_unique<FixedVoteRule>(direction));
    return strategy::SignalEngine(config, std::move(rules));
}

// Uptrend on both SMAs with resistance well above the close.
analytics::IndicatorState closedAt100() {
    analytics::IndicatorState state;
    state.setSeries(analytics::indicator::ATR, {2.0});
    state.setSeries(analytics::indicator::SMA, {98.0});
    state.setSeries(analytics::indicator::SMA_FAST, {99.0});
    state.setSeries(analytics::indicator::SUPPORT, {95.0});
    state.setSeries(analytics::indicator::RESISTANCE, {106.0});
    state.setLastCandle(kMorning + 4 * kMinute, 100.0, 30);
    return state;
}

// Rising volume into the last candle and a bid-heavy book one tick wide.
analytics::MarketAnalyzer bullishTape() {
    analytics::MarketAnalyzer analyzer;
    for (int i = 0; i < 4; ++i) {
        analyzer.onClosedCandle(Candle(kMorning + i * kMinute, 100.0, 100.5, 99.5, 100.2, 10.0));
    }
    analyzer.onClosedCandle(Candle(kMorning + 4 * kMinute, 100.0, 100.5, 99.5, 100.2, 18.0));

    OrderBookSnapshot book;
    book.symbol = "BTCUSDT";
    book.timestamp = kNow - 100;
    book.bids = {{99.9, 3.0}, {99.8, 3.0}};
    book.asks = {{100.1, 1.0}, {100.2, 1.0}};
    analyzer.onOrderBook(book);
    return analyzer;
}

risk::RiskLimits testLimits() {
    risk::RiskLimits limits;
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

struct Harness {
    common::ManualClock clock{kNow};
    RecordingSink sink;
    network::PaperGateway gateway;
    risk::RiskManager risk{testLimits(), clock, &sink};
    execution::PositionManager positions{execution::PositionConfig(), gateway, risk, clock, &sink};
    strategy::SignalEngine signals;
    TradingCycleCoordinator coordinator{signals, risk, positions, gateway, clock, &sink};

    explicit Harness(strategy::SignalEngine engine,
                     const network::PaperGatewayConfig& venue = gatewayConfig())
        : gateway(venue, clock)
        , signals(std::move(engine)) {
        gateway.setOrderUpdateHandler([this](const network::OrderUpdate& update) {
            positions.onOrderUpdate(update);
        });
    }
};

void testNoSignalTouchesNothing() {
    Harness h(makeEngine(std::nullopt));
    const auto analyzer = bullishTape();

    auto result = h.coordinator.runEntryCycle("BTCUSDT", closedAt100(), analyzer);
    assert(result.stage == CycleStage::NO_SIGNAL);
    assert(result.evaluation.outcome == strategy::SignalOutcome::NO_CANDIDATE);
    assert(h.gateway.placedOrderCount() == 0);
    assert(h.sink.count(NotificationType::SIGNAL_GENERATED) == 0);
}

void testRiskDenialPlacesNoOrder() {
    Harness h(makeEngine(Direction::LONG));
    const auto analyzer = bullishTape();
    h.risk.pause("maintenance");

    auto result = h.coordinator.runEntryCycle("BTCUSDT", closedAt100(), analyzer);
    assert(result.stage == CycleStage::RISK_DENIED);
    assert(!result.decision.approved);
    assert(result.decision.reason == risk::DenialReason::ENGINE_PAUSED);
    assert(h.sink.count(NotificationType::SIGNAL_GENERATED) == 1);
    assert(h.sink.count(NotificationType::RISK_DENIED) == 1);
    assert(h.gateway.placedOrderCount() == 0);
    assert(h.risk.reservedEntries() == 0);
    assert(!h.positions.hasActivePosition("BTCUSDT"));
}

void testApprovedLongSubmitsEntry() {
    Harness h(makeEngine(Direction::LONG));
    const auto analyzer = bullishTape();

    auto result = h.coordinator.runEntryCycle("BTCUSDT", closedAt100(), analyzer);
    assert(result.stage == CycleStage::ENTRY_SUBMITTED);
    assert(result.decision.approved);
    // 10 risked over a 3.0 stop distance, capped at the 1.0 size limit
    assert(std::abs(result.decision.quantity - 1.0) < 1e-9);

    const auto position = h.positions.getPosition("BTCUSDT");
    assert(position && position->state == execution::PositionState::ENTRY_PENDING);
    assert(position->direction == Direction::LONG);
    assert(std::abs(position->size - result.decision.quantity) < 1e-12);

    const auto orders = h.gateway.workingOrders("BTCUSDT");
    assert(orders.size() == 1);
    assert(orders[0].kind == OrderKind::ENTRY && orders[0].side == OrderSide::BUY);
    assert(h.risk.reservedEntries() == 1);

    // The pending entry blocks a second cycle
    result = h.coordinator.runEntryCycle("BTCUSDT", closedAt100(), analyzer);
    assert(result.stage == CycleStage::POSITION_ACTIVE);
    assert(h.gateway.placedOrderCount() == 1);

    // The next candle trades through the limit: stop 1.5 ATR below, ladder at 1 and 2 ATR above
    h.gateway.publishCandle("BTCUSDT", Candle(kMorning + 5 * kMinute, 100.0, 100.5, 99.5, 100.2, 12.0));
    const auto filled = h.positions.getPosition("BTCUSDT");
    assert(filled && filled->state == execution::PositionState::OPEN);
    assert(std::abs(filled->entry_price - 100.0) < 1e-9);
    assert(std::abs(filled->stop_loss_price - 97.0) < 1e-9);
    assert(filled->take_profits.size() == 2);
    assert(std::abs(filled->take_profits[0].price - 102.0) < 1e-9);
    assert(std::abs(filled->take_profits[1].price - 104.0) < 1e-9);

    int stops = 0;
    int targets = 0;
    for (const auto& order : h.gateway.workingOrders("BTCUSDT")) {
        assert(order.side == OrderSide::SELL);
        if (order.kind == OrderKind::STOP) {
            ++stops;
            assert(std::abs(order.size - 1.0) < 1e-9);
        } else if (order.kind == OrderKind::TAKE_PROFIT) {
            ++targets;
            assert(std::abs(order.size - 0.5) < 1e-9);
        }
    }
    assert(stops == 1 && targets == 2);
    assert(h.risk.getState().daily_trade_count == 1);
    assert(h.risk.reservedEntries() == 0);
}

void testForcedEntrySkipsRulesNotRisk() {
    // No rule would ever vote
    Harness h(makeEngine(std::nullopt));
    const auto analyzer = bullishTape();

    analytics::IndicatorState cold;
    auto result = h.coordinator.runForcedEntry("BTCUSDT", Direction::SHORT, cold, analyzer);
    assert(result.stage == CycleStage::NO_SIGNAL);
    assert(h.gateway.placedOrderCount() == 0);

    h.risk.pause("maintenance");
    result = h.coordinator.runForcedEntry("BTCUSDT", Direction::SHORT, closedAt100(), analyzer);
    assert(result.stage == CycleStage::RISK_DENIED);
    assert(result.decision.reason == risk::DenialReason::ENGINE_PAUSED);
    assert(h.gateway.placedOrderCount() == 0);

    h.risk.resume();
    result = h.coordinator.runForcedEntry("BTCUSDT", Direction::SHORT, closedAt100(), analyzer);
    assert(result.stage == CycleStage::ENTRY_SUBMITTED);
    assert(result.evaluation.signal);
    assert(result.evaluation.signal->triggering_rules == std::vector<std::string>{"operator"});
    assert(std::abs(result.evaluation.signal->confidence - 1.0) < 1e-12);

    const auto orders = h.gateway.workingOrders("BTCUSDT");
    assert(orders.size() == 1);
    assert(orders[0].kind == OrderKind::ENTRY && orders[0].side == OrderSide::SELL);
    assert(h.sink.count(NotificationType::SIGNAL_GENERATED) == 2);

    result = h.coordinator.runForcedEntry("BTCUSDT", Direction::LONG, closedAt100(), analyzer);
    assert(result.stage == CycleStage::POSITION_ACTIVE);
    assert(h.gateway.placedOrderCount() == 1);
}

void testRejectedEntriesReleaseTheirSlot() {
    // One tick of spread already costs 0.1%
    Harness thin(makeEngine(Direction::LONG, 0.0005));
    const auto analyzer = bullishTape();
    auto result = thin.coordinator.runEntryCycle("BTCUSDT", closedAt100(), analyzer);
    assert(result.stage == CycleStage::SLIPPAGE_REJECTED);
    assert(thin.risk.reservedEntries() == 0);
    assert(thin.gateway.placedOrderCount() == 0);

    Harness refused(makeEngine(Direction::LONG));
    refused.gateway.failNextOrders(network::GatewayErrorKind::VALIDATION);
    result = refused.coordinator.runEntryCycle("BTCUSDT", closedAt100(), analyzer);
    assert(result.stage == CycleStage::ENTRY_FAILED);
    assert(refused.risk.reservedEntries() == 0);
    assert(!refused.positions.hasActivePosition("BTCUSDT"));

    auto venue = gatewayConfig();
    venue.query_rate_per_second = 1;
    Harness throttled(makeEngine(Direction::LONG), venue);
    assert(throttled.gateway.queryMargin().ok());
    result = throttled.coordinator.runEntryCycle("BTCUSDT", closedAt100(), analyzer);
    assert(result.stage == CycleStage::MARGIN_UNAVAILABLE);
    assert(throttled.sink.count(NotificationType::ORDER_ERROR) == 1);
    assert(throttled.risk.reservedEntries() == 0);
}
}

int main() {
    std::cout << "[TEST] Starting TradingCycleCoordinator Test..." << std::endl;

    testNoSignalTouchesNothing();
    testRiskDenialPlacesNoOrder();
    testApprovedLongSubmitsEntry();
    testRejectedEntriesReleaseTheirSlot();
    testForcedEntrySkipsRulesNotRisk();

    std::cout << "[TEST] TradingCycleCoordinator Test PASSED!" << std::endl;
    return 0;
}
