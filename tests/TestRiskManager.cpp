#include "risk/RiskManager.h"
#include "common/DailyBoundary.h"

#include <cassert>
#include <chrono>
#include <cmath>
#include <future>
#include <iostream>
#include <mutex>
#include <vector>

using namespace perpscalp;
using risk::DenialReason;
using risk::FillKind;
using risk::RiskManager;

namespace {
// 2024-01-01 10:00:00 UTC
constexpr long long kMorning = 1704103200000LL;
constexpr long long kDayMs = 86400000LL;

class RecordingSink : public core::INotificationSink {
public:
    void notify(const core::Notification& notification) override {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back(notification);
    }

    int count(core::NotificationType type) const {
        std::lock_guard<std::mutex> lock(mutex_);
        int n = 0;
        for (const auto& e : events_) {
            if (e.type == type) ++n;
        }
        return n;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.clear();
    }

private:
    mutable std::mutex mutex_;
    std::vector<core::Notification> events_;
};

strategy::Signal makeSignal(const std::string& symbol = "BTCUSDT", double price = 100.0, double atr = 1.0) {
    strategy::Signal signal;
    signal.symbol = symbol;
    signal.direction = Direction::LONG;
    signal.confidence = 0.75;
    signal.reference_price = price;
    signal.atr = atr;
    return signal;
}

risk::FillReport fill(FillKind kind, double pnl, const std::string& symbol = "BTCUSDT") {
    risk::FillReport report;
    report.symbol = symbol;
    report.kind = kind;
    report.quantity = 1.0;
    report.price = 100.0;
    report.pnl_delta = pnl;
    report.position_pnl = pnl;
    return report;
}

risk::RiskLimits testLimits() {
    risk::RiskLimits limits;
    limits.max_trades_per_day = 3;
    limits.max_daily_loss = 50.0;
    limits.risk_per_trade = 10.0;
    limits.stop_atr_multiplier = 1.5;
    limits.max_position_size = 100.0;
    limits.leverage = 5.0;
    limits.max_consecutive_losses = 0;
    limits.min_entry_interval_sec = 0;
    return limits;
}

void testSizing() {
    common::ManualClock clock(kMorning);
    RiskManager risk(testLimits(), clock);

    // 10 / (1.0 * 1.5) = 6.666.. floored to the 0.001 lot
    auto decision = risk.authorize(makeSignal(), 10000.0);
    assert(decision.approved);
    assert(std::abs(decision.quantity - 6.666) < 1e-9);

    // Margin cap: 100 * 5 / 100 = 5
    decision = risk.authorize(makeSignal(), 100.0);
    assert(decision.approved);
    assert(std::abs(decision.quantity - 5.0) < 1e-9);

    // Position cap
    auto limits = testLimits();
    limits.max_position_size = 2.0;
    RiskManager capped(limits, clock);
    decision = capped.authorize(makeSignal(), 10000.0);
    assert(std::abs(decision.quantity - 2.0) < 1e-9);

    // Minimum stop distance: 0.1% of 100 = 0.1 beats 0.01 * 1.5
    assert(std::abs(risk.stopDistance("BTCUSDT", 100.0, 0.01) - 0.1) < 1e-12);
    assert(std::abs(risk.stopDistance("BTCUSDT", 100.0, 2.0) - 3.0) < 1e-12);

    // Lot step and minimum quantity per instrument
    common::InstrumentSpec coarse;
    coarse.lot_step = 1.0;
    coarse.min_qty = 1.0;
    risk.setInstrumentSpec("ETHUSDT", coarse);
    decision = risk.authorize(makeSignal("ETHUSDT"), 10000.0);
    assert(decision.approved && decision.quantity == 6.0);

    common::InstrumentSpec big_min;
    big_min.min_qty = 10.0;
    risk.setInstrumentSpec("SOLUSDT", big_min);
    decision = risk.authorize(makeSignal("SOLUSDT"), 10000.0);
    assert(!decision.approved);
    assert(decision.reason == DenialReason::SIZE_BELOW_MINIMUM);
    assert(decision.error == ErrorKind::VALIDATION);

    decision = risk.authorize(makeSignal("BTCUSDT", 100.0, 0.0), 10000.0);
    assert(decision.reason == DenialReason::INVALID_SIGNAL);
    decision = risk.authorize(makeSignal(), 0.0);
    assert(decision.reason == DenialReason::NO_MARGIN);
}

void testTradeCap() {
    common::ManualClock clock(kMorning);
    RecordingSink sink;
    RiskManager risk(testLimits(), clock, &sink);

    for (int i = 0; i < 3; ++i) {
        assert(risk.authorize(makeSignal(), 10000.0).approved);
        risk.recordFill(fill(FillKind::ENTRY, 0.0));
    }
    auto decision = risk.authorize(makeSignal(), 10000.0);
    assert(!decision.approved);
    assert(decision.reason == DenialReason::DAILY_TRADE_LIMIT);
    assert(decision.error == ErrorKind::RISK_LIMIT);
    assert(sink.count(core::NotificationType::RISK_DENIED) == 1);

    // Approvals alone never count: only confirmed entry fills do
    RiskManager fresh(testLimits(), clock);
    for (int i = 0; i < 10; ++i) {
        assert(fresh.authorize(makeSignal(), 10000.0).approved);
    }
    assert(fresh.getState().daily_trade_count == 0);
}

void testTradeCapCountsPendingEntries() {
    common::ManualClock clock(kMorning);
    auto limits = testLimits();
    limits.max_trades_per_day = 2;
    RiskManager risk(limits, clock);

    assert(risk.authorize(makeSignal("BTCUSDT"), 10000.0).approved);
    risk.recordFill(fill(FillKind::ENTRY, 0.0, "BTCUSDT"));
    assert(risk.reservedEntries() == 0);

    // One slot left: the first approval holds it until its entry resolves
    assert(risk.authorize(makeSignal("ETHUSDT"), 10000.0).approved);
    assert(risk.reservedEntries() == 1);
    auto decision = risk.authorize(makeSignal("SOLUSDT"), 10000.0);
    assert(!decision.approved);
    assert(decision.reason == DenialReason::DAILY_TRADE_LIMIT);

    // A re-check for the symbol holding the slot is not blocked by itself
    assert(risk.authorize(makeSignal("ETHUSDT"), 10000.0).approved);
    assert(risk.reservedEntries() == 1);

    // Abandoned entry gives the slot back
    risk.releaseEntry("ETHUSDT");
    assert(risk.authorize(makeSignal("SOLUSDT"), 10000.0).approved);
    risk.recordFill(fill(FillKind::ENTRY, 0.0, "SOLUSDT"));
    assert(risk.getState().daily_trade_count == 2);
    assert(risk.reservedEntries() == 0);
    assert(risk.authorize(makeSignal("ETHUSDT"), 10000.0).reason == DenialReason::DAILY_TRADE_LIMIT);

    // Restored pending entries hold their slot too
    RiskManager restarted(limits, clock);
    restarted.reserveEntry("BTCUSDT");
    restarted.reserveEntry("ETHUSDT");
    assert(restarted.authorize(makeSignal("SOLUSDT"), 10000.0).reason == DenialReason::DAILY_TRADE_LIMIT);
}

// Reads risk state from another thread while a notification is delivered.
class ReentrantSink : public core::INotificationSink {
public:
    void notify(const core::Notification&) override {
        if (risk_ == nullptr) {
            return;
        }
        RiskManager* risk = risk_;
        auto reader = std::async(std::launch::async, [risk]() { return risk->getState().daily_trade_count; });
        if (reader.wait_for(std::chrono::seconds(2)) == std::future_status::ready) {
            ++unblocked_;
        } else {
            ++blocked_;
        }
    }

    void attach(RiskManager* risk) { risk_ = risk; }
    int unblocked() const { return unblocked_; }
    int blocked() const { return blocked_; }

private:
    RiskManager* risk_ = nullptr;
    int unblocked_ = 0;
    int blocked_ = 0;
};

void testSinksRunOutsideTheLock() {
    common::ManualClock clock(kMorning);
    ReentrantSink sink;
    RiskManager risk(testLimits(), clock, &sink);
    sink.attach(&risk);

    risk.pause("maintenance");
    risk.resume();
    risk.recordFill(fill(FillKind::CLOSE, -80.0));
    assert(risk.authorize(makeSignal(), 10000.0).reason == DenialReason::RISK_HALTED);

    // paused, resumed, halt, denial
    assert(sink.unblocked() == 4);
    assert(sink.blocked() == 0);
}

void testLossLimitLatchAndReset() {
    common::ManualClock clock(kMorning);
    RecordingSink sink;
    RiskManager risk(testLimits(), clock, &sink);

    risk.recordFill(fill(FillKind::ENTRY, 0.0));
    risk.recordFill(fill(FillKind::REDUCE, -20.0));
    assert(!risk.isHalted());
    risk.recordFill(fill(FillKind::CLOSE, -35.0));
    assert(risk.isHalted());
    assert(sink.count(core::NotificationType::RISK_HALT) == 1);

    const long long boundary = common::DailyBoundary::nextBoundaryMs(kMorning, 0);
    assert(risk.getState().halted_until_ms == boundary);

    // Further losses and denials do not re-announce the halt
    risk.recordFill(fill(FillKind::CLOSE, -5.0));
    auto decision = risk.authorize(makeSignal(), 10000.0);
    assert(decision.reason == DenialReason::RISK_HALTED);
    clock.advance(3600 * 1000);
    decision = risk.authorize(makeSignal(), 10000.0);
    assert(decision.reason == DenialReason::RISK_HALTED);
    assert(sink.count(core::NotificationType::RISK_HALT) == 1);

    // Next trading day: counters and halt are gone, one reset event
    clock.set(boundary + 1000);
    decision = risk.authorize(makeSignal(), 10000.0);
    assert(decision.approved);
    assert(sink.count(core::NotificationType::DAILY_RESET) == 1);
    const auto state = risk.getState();
    assert(state.daily_realized_pnl == 0.0);
    assert(state.daily_trade_count == 0);
    assert(state.halted_until_ms == 0);
    risk.authorize(makeSignal(), 10000.0);
    assert(sink.count(core::NotificationType::DAILY_RESET) == 1);
}

void testLossLimitCheckedAtGate() {
    // Counters restored past the limit without a latch: the gate latches.
    common::ManualClock clock(kMorning);
    RecordingSink sink;
    RiskManager risk(testLimits(), clock, &sink);

    risk::RiskState state = risk.getState();
    state.daily_realized_pnl = -60.0;
    risk.restoreState(state);
    auto decision = risk.authorize(makeSignal(), 10000.0);
    assert(decision.reason == DenialReason::DAILY_LOSS_LIMIT);
    assert(risk.isHalted());
    assert(sink.count(core::NotificationType::RISK_HALT) == 1);
}

void testOverride() {
    common::ManualClock clock(kMorning);
    RiskManager risk(testLimits(), clock);
    risk.recordFill(fill(FillKind::CLOSE, -80.0));
    assert(risk.isHalted());

    risk.setOverride("operator accepted loss");
    assert(!risk.isHalted());
    assert(risk.authorize(makeSignal(), 10000.0).approved);

    // The override ends with the trading day
    clock.set(common::DailyBoundary::nextBoundaryMs(kMorning, 0) + kDayMs / 2);
    risk.recordFill(fill(FillKind::CLOSE, -80.0));
    assert(risk.isHalted());
}

void testConsecutiveLossesAndCooldown() {
    common::ManualClock clock(kMorning);
    auto limits = testLimits();
    limits.max_trades_per_day = 20;
    limits.max_daily_loss = 1000.0;
    limits.max_consecutive_losses = 2;
    limits.min_entry_interval_sec = 60;
    RiskManager risk(limits, clock);

    risk.recordFill(fill(FillKind::ENTRY, 0.0));
    auto decision = risk.authorize(makeSignal(), 10000.0);
    assert(decision.reason == DenialReason::ENTRY_COOLDOWN);
    // Cooldown is per symbol
    assert(risk.authorize(makeSignal("ETHUSDT"), 10000.0).approved);
    clock.advance(61 * 1000);
    assert(risk.authorize(makeSignal(), 10000.0).approved);

    risk.recordFill(fill(FillKind::CLOSE, -1.0));
    risk.recordFill(fill(FillKind::CLOSE, 2.0));
    assert(risk.getState().consecutive_losses == 0);
    risk.recordFill(fill(FillKind::CLOSE, -1.0));
    risk.recordFill(fill(FillKind::CLOSE, -1.0));
    assert(risk.isHalted());
    assert(risk.getState().halt_reason == "consecutive losses");
}

void testPauseAndManualReview() {
    common::ManualClock clock(kMorning);
    RecordingSink sink;
    RiskManager risk(testLimits(), clock, &sink);

    risk.pause("maintenance");
    risk.pause("again");
    assert(sink.count(core::NotificationType::ENGINE_PAUSED) == 1);
    auto decision = risk.authorize(makeSignal(), 10000.0);
    assert(decision.reason == DenialReason::ENGINE_PAUSED);
    risk.resume();
    assert(sink.count(core::NotificationType::ENGINE_RESUMED) == 1);
    assert(risk.authorize(makeSignal(), 10000.0).approved);

    risk.setManualReview("BTCUSDT", true);
    decision = risk.authorize(makeSignal(), 10000.0);
    assert(decision.reason == DenialReason::MANUAL_REVIEW);
    assert(decision.error == ErrorKind::RECONCILIATION);
    assert(risk.authorize(makeSignal("ETHUSDT"), 10000.0).approved);
    risk.setManualReview("BTCUSDT", false);
    assert(risk.authorize(makeSignal(), 10000.0).approved);
}

void testRestoreAcrossRestart() {
    common::ManualClock clock(kMorning);
    RiskManager before(testLimits(), clock);
    before.recordFill(fill(FillKind::ENTRY, 0.0));
    before.recordFill(fill(FillKind::CLOSE, -60.0));
    assert(before.isHalted());
    const auto saved = RiskManager::toJson(before.getState());

    RiskManager kept(testLimits(), clock);
    kept.restoreState(RiskManager::riskStateFromJson(saved));
    assert(kept.isHalted());
    assert(kept.getState().daily_trade_count == 1);

    auto limits = testLimits();
    limits.persist_halt_across_restart = false;
    RiskManager dropped(limits, clock);
    dropped.restoreState(RiskManager::riskStateFromJson(saved));
    assert(!dropped.isHalted());
    assert(dropped.getState().daily_realized_pnl == -60.0);

    // A snapshot from a previous day restores as a fresh day
    clock.set(kMorning + kDayMs);
    RiskManager next_day(testLimits(), clock);
    next_day.restoreState(RiskManager::riskStateFromJson(saved));
    assert(!next_day.isHalted());
    assert(next_day.getState().daily_trade_count == 0);
}
}

int main() {
    std::cout << "[TEST] Starting RiskManager Test..." << std::endl;

    testSizing();
    testTradeCap();
    testTradeCapCountsPendingEntries();
    testSinksRunOutsideTheLock();
    testLossLimitLatchAndReset();
    testLossLimitCheckedAtGate();
    testOverride();
    testConsecutiveLossesAndCooldown();
    testPauseAndManualReview();
    testRestoreAcrossRestart();

    std::cout << "[TEST] RiskManager Test PASSED!" << std::endl;
    return 0;
}
