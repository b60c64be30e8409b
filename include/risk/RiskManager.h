#pragma once

#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/Clock.h"
#include "common/Errors.h"
#include "common/TickSizeHelper.h"
#include "core/contracts/INotificationSink.h"
#include "strategy/ISignalRule.h"

namespace perpscalp {
namespace risk {

struct RiskLimits {
    int max_trades_per_day = 12;
    double max_daily_loss = 100.0;          // quote currency
    double risk_per_trade = 10.0;           // quote currency lost at the stop
    double stop_atr_multiplier = 1.5;
    double max_position_size = 1.0;         // base currency
    double leverage = 5.0;
    double min_leverage = 1.0;
    double max_leverage = 20.0;
    int max_consecutive_losses = 3;         // 0 disables
    int min_entry_interval_sec = 60;        // per-symbol cooldown between entries
    int reset_utc_offset_minutes = 0;
    bool persist_halt_across_restart = true;
};

// Daily counters. Mutated only by RiskManager and only on confirmed fills.
struct RiskState {
    double daily_realized_pnl = 0.0;
    int daily_trade_count = 0;
    int consecutive_losses = 0;
    long long last_reset_ms = 0;
    long long halted_until_ms = 0;
    std::string halt_reason;
};

enum class DenialReason {
    NONE,
    ENGINE_PAUSED,
    RISK_HALTED,
    MANUAL_REVIEW,
    DAILY_TRADE_LIMIT,
    DAILY_LOSS_LIMIT,
    CONSECUTIVE_LOSSES,
    ENTRY_COOLDOWN,
    INVALID_SIGNAL,
    NO_MARGIN,
    SIZE_BELOW_MINIMUM
};

struct RiskDecision {
    bool approved = false;
    double quantity = 0.0;
    DenialReason reason = DenialReason::NONE;
    ErrorKind error = ErrorKind::NONE;
    std::string detail;

    static RiskDecision approve(double qty) {
        RiskDecision d;
        d.approved = true;
        d.quantity = qty;
        return d;
    }

    static RiskDecision deny(DenialReason reason, ErrorKind error, std::string detail) {
        RiskDecision d;
        d.reason = reason;
        d.error = error;
        d.detail = std::move(detail);
        return d;
    }
};

enum class FillKind { ENTRY, REDUCE, CLOSE };

struct FillReport {
    std::string symbol;
    FillKind kind = FillKind::ENTRY;
    double quantity = 0.0;
    double price = 0.0;
    double pnl_delta = 0.0;       // realized by this fill
    double position_pnl = 0.0;    // CLOSE only: total realized over the position
    long long ts_ms = 0;
};

// Single point of cross-symbol coordination. Every public method takes the
// mutex; the gate, sizing and daily bookkeeping are serialized.
class RiskManager {
public:
    RiskManager(const RiskLimits& limits, const common::IClock& clock,
                core::INotificationSink* sink = nullptr);

    // Checks in order, first failure wins:
    // paused/halted/manual review -> trade cap -> loss limit ->
    // consecutive losses -> cooldown -> sizing.
    // An approval reserves one slot of the daily trade cap for the symbol
    // until its entry fills (recordFill) or is abandoned (releaseEntry).
    RiskDecision authorize(const strategy::Signal& signal, double available_margin);

    void recordFill(const FillReport& fill);

    void reserveEntry(const std::string& symbol);
    void releaseEntry(const std::string& symbol);
    int reservedEntries() const;

    // Operator halt: stops new entries only.
    void pause(const std::string& reason);
    void resume();
    bool isPaused() const;

    // Explicit override of a risk halt for the rest of the day.
    void setOverride(const std::string& reason);
    bool isHalted() const;

    void setManualReview(const std::string& symbol, bool enabled);
    bool isInManualReview(const std::string& symbol) const;
    std::set<std::string> manualReviewSymbols() const;

    void setInstrumentSpec(const std::string& symbol, const common::InstrumentSpec& spec);
    common::InstrumentSpec getInstrumentSpec(const std::string& symbol) const;

    // Stop distance used for sizing; the lifecycle manager uses the same one.
    double stopDistance(const std::string& symbol, double price, double atr) const;

    RiskState getState() const;
    void restoreState(const RiskState& state);
    const RiskLimits& limits() const { return limits_; }

    static nlohmann::json toJson(const RiskState& state);
    static RiskState riskStateFromJson(const nlohmann::json& j);
    static const char* denialReasonToString(DenialReason reason);

private:
    void resetDailyIfNeeded(long long now_ms);
    void latchHalt(long long now_ms, const std::string& reason);
    RiskDecision evaluate(const strategy::Signal& signal, double available_margin);
    void applyFill(const FillReport& fill);
    void publish(core::NotificationType type, const std::string& symbol,
                 const std::string& message, ErrorKind error,
                 nlohmann::json payload = nlohmann::json::object());
    // Sinks are called after the mutex is released.
    void flushNotifications();
    RiskDecision denyAndReport(const strategy::Signal& signal, RiskDecision decision);

    RiskLimits limits_;
    const common::IClock& clock_;
    core::INotificationSink* sink_;

    mutable std::recursive_mutex mutex_;
    RiskState state_;
    bool paused_ = false;
    std::string pause_reason_;
    long long override_until_ms_ = 0;
    std::set<std::string> manual_review_;
    std::set<std::string> reserved_entries_;
    std::map<std::string, long long> last_entry_ms_;
    std::vector<core::Notification> outbox_;
    std::map<std::string, common::InstrumentSpec> instruments_;
};

} // namespace risk
} // namespace perpscalp
