#include "risk/RiskManager.h"
#include "common/DailyBoundary.h"
#include "common/Logger.h"
#include <algorithm>
#include <cmath>

namespace perpscalp {
namespace risk {

RiskManager::RiskManager(const RiskLimits& limits, const common::IClock& clock,
                         core::INotificationSink* sink)
    : limits_(limits)
    , clock_(clock)
    , sink_(sink)
{
    state_.last_reset_ms = common::DailyBoundary::dayStartMs(clock_.nowMs(), limits_.reset_utc_offset_minutes);
    LOG_INFO("RiskManager initialized: max_trades={} max_daily_loss={:.2f} risk_per_trade={:.2f} "
             "stop_mult={:.2f} leverage={:.1f}",
             limits_.max_trades_per_day, limits_.max_daily_loss, limits_.risk_per_trade,
             limits_.stop_atr_multiplier, limits_.leverage);
}

// ===== Gate =====

RiskDecision RiskManager::authorize(const strategy::Signal& signal, double available_margin) {
    RiskDecision decision;
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        decision = evaluate(signal, available_margin);
        if (decision.approved) {
            reserved_entries_.insert(signal.symbol);
        }
    }
    flushNotifications();
    return decision;
}

RiskDecision RiskManager::evaluate(const strategy::Signal& signal, double available_margin) {
    const long long now = clock_.nowMs();
    resetDailyIfNeeded(now);

    // 1) halted
    if (paused_) {
        return denyAndReport(signal, RiskDecision::deny(
            DenialReason::ENGINE_PAUSED, ErrorKind::RISK_LIMIT, "engine paused: " + pause_reason_));
    }
    if (state_.halted_until_ms > now) {
        return denyAndReport(signal, RiskDecision::deny(
            DenialReason::RISK_HALTED, ErrorKind::RISK_LIMIT, "risk halt active: " + state_.halt_reason));
    }
    if (manual_review_.count(signal.symbol) > 0) {
        return denyAndReport(signal, RiskDecision::deny(
            DenialReason::MANUAL_REVIEW, ErrorKind::RECONCILIATION, "symbol under manual review"));
    }

    // 2) daily trade cap, counting entries approved but not yet filled
    const int in_flight = static_cast<int>(reserved_entries_.size()) -
                          static_cast<int>(reserved_entries_.count(signal.symbol));
    if (state_.daily_trade_count + in_flight >= limits_.max_trades_per_day) {
        return denyAndReport(signal, RiskDecision::deny(
            DenialReason::DAILY_TRADE_LIMIT, ErrorKind::RISK_LIMIT,
            "daily trade limit reached (" + std::to_string(state_.daily_trade_count) + "+" +
            std::to_string(in_flight) + " pending/" + std::to_string(limits_.max_trades_per_day) + ")"));
    }

    const bool overridden = override_until_ms_ > now;

    // 3) daily loss limit
    if (!overridden && state_.daily_realized_pnl <= -limits_.max_daily_loss) {
        latchHalt(now, "daily loss limit");
        return denyAndReport(signal, RiskDecision::deny(
            DenialReason::DAILY_LOSS_LIMIT, ErrorKind::RISK_LIMIT, "daily loss limit reached"));
    }

    // 4) streak and cooldown
    if (!overridden && limits_.max_consecutive_losses > 0 &&
        state_.consecutive_losses >= limits_.max_consecutive_losses) {
        latchHalt(now, "consecutive losses");
        return denyAndReport(signal, RiskDecision::deny(
            DenialReason::CONSECUTIVE_LOSSES, ErrorKind::RISK_LIMIT,
            std::to_string(state_.consecutive_losses) + " consecutive losses"));
    }
    auto last_entry = last_entry_ms_.find(signal.symbol);
    if (last_entry != last_entry_ms_.end() &&
        now - last_entry->second < static_cast<long long>(limits_.min_entry_interval_sec) * 1000) {
        return denyAndReport(signal, RiskDecision::deny(
            DenialReason::ENTRY_COOLDOWN, ErrorKind::RISK_LIMIT, "entry cooldown active"));
    }

    // 5) sizing
    if (!(signal.reference_price > 0.0) || !(signal.atr > 0.0) ||
        !std::isfinite(signal.reference_price) || !std::isfinite(signal.atr)) {
        return denyAndReport(signal, RiskDecision::deny(
            DenialReason::INVALID_SIGNAL, ErrorKind::VALIDATION, "signal has no usable price/atr"));
    }
    if (!(available_margin > 0.0)) {
        return denyAndReport(signal, RiskDecision::deny(
            DenialReason::NO_MARGIN, ErrorKind::VALIDATION, "no available margin"));
    }

    const auto spec = getInstrumentSpec(signal.symbol);
    const double distance = stopDistance(signal.symbol, signal.reference_price, signal.atr);
    double quantity = limits_.risk_per_trade / distance;
    quantity = std::min(quantity, limits_.max_position_size);

    const double margin_cap = available_margin * limits_.leverage / signal.reference_price;
    quantity = std::min(quantity, margin_cap);
    quantity = common::roundDownToStep(quantity, spec.lot_step);

    if (quantity < spec.min_qty) {
        return denyAndReport(signal, RiskDecision::deny(
            DenialReason::SIZE_BELOW_MINIMUM, ErrorKind::VALIDATION,
            "sized quantity " + std::to_string(quantity) + " below minimum " + std::to_string(spec.min_qty)));
    }

    LOG_INFO("[{}] entry authorized: qty={} (risk={:.2f} / stop_dist={:.4f}, margin_cap={:.4f})",
             signal.symbol, quantity, limits_.risk_per_trade, distance, margin_cap);
    return RiskDecision::approve(quantity);
}

double RiskManager::stopDistance(const std::string& symbol, double price, double atr) const {
    const auto spec = getInstrumentSpec(symbol);
    const double atr_distance = atr * limits_.stop_atr_multiplier;
    const double floor_distance = price * spec.min_stop_distance_pct / 100.0;
    return std::max(atr_distance, floor_distance);
}

// ===== Fills =====

void RiskManager::recordFill(const FillReport& fill) {
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        applyFill(fill);
    }
    flushNotifications();
}

void RiskManager::applyFill(const FillReport& fill) {
    const long long now = clock_.nowMs();
    resetDailyIfNeeded(now);

    switch (fill.kind) {
        case FillKind::ENTRY:
            reserved_entries_.erase(fill.symbol);
            state_.daily_trade_count++;
            last_entry_ms_[fill.symbol] = fill.ts_ms > 0 ? fill.ts_ms : now;
            break;
        case FillKind::REDUCE:
            state_.daily_realized_pnl += fill.pnl_delta;
            break;
        case FillKind::CLOSE:
            state_.daily_realized_pnl += fill.pnl_delta;
            if (fill.position_pnl < 0.0) {
                state_.consecutive_losses++;
            } else {
                state_.consecutive_losses = 0;
            }
            break;
    }

    LOG_INFO("[{}] fill recorded: daily_pnl={:.4f} trades={}/{} consecutive_losses={}",
             fill.symbol, state_.daily_realized_pnl, state_.daily_trade_count,
             limits_.max_trades_per_day, state_.consecutive_losses);

    const bool already_halted = state_.halted_until_ms > now;
    const bool overridden = override_until_ms_ > now;
    if (already_halted || overridden) {
        return;
    }
    if (state_.daily_realized_pnl <= -limits_.max_daily_loss) {
        latchHalt(now, "daily loss limit");
    } else if (limits_.max_consecutive_losses > 0 &&
               state_.consecutive_losses >= limits_.max_consecutive_losses) {
        latchHalt(now, "consecutive losses");
    }
}

void RiskManager::reserveEntry(const std::string& symbol) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    reserved_entries_.insert(symbol);
}

void RiskManager::releaseEntry(const std::string& symbol) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (reserved_entries_.erase(symbol) > 0) {
        LOG_DEBUG("[{}] entry reservation released", symbol);
    }
}

int RiskManager::reservedEntries() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return static_cast<int>(reserved_entries_.size());
}

// ===== Halt / pause =====

void RiskManager::latchHalt(long long now_ms, const std::string& reason) {
    if (state_.halted_until_ms > now_ms) {
        return;
    }
    state_.halted_until_ms = common::DailyBoundary::nextBoundaryMs(now_ms, limits_.reset_utc_offset_minutes);
    state_.halt_reason = reason;

    nlohmann::json payload;
    payload["halted_until_ms"] = state_.halted_until_ms;
    payload["daily_realized_pnl"] = state_.daily_realized_pnl;
    payload["daily_trade_count"] = state_.daily_trade_count;
    payload["consecutive_losses"] = state_.consecutive_losses;
    publish(core::NotificationType::RISK_HALT, "", "new entries halted: " + reason,
            ErrorKind::RISK_LIMIT, payload);
}

void RiskManager::pause(const std::string& reason) {
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        if (paused_) return;
        paused_ = true;
        pause_reason_ = reason.empty() ? "operator" : reason;
        publish(core::NotificationType::ENGINE_PAUSED, "", "new entries paused: " + pause_reason_, ErrorKind::NONE);
    }
    flushNotifications();
}

void RiskManager::resume() {
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        if (!paused_) return;
        paused_ = false;
        pause_reason_.clear();
        publish(core::NotificationType::ENGINE_RESUMED, "", "new entries resumed", ErrorKind::NONE);
    }
    flushNotifications();
}

bool RiskManager::isPaused() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return paused_;
}

void RiskManager::setOverride(const std::string& reason) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    const long long now = clock_.nowMs();
    state_.halted_until_ms = 0;
    state_.halt_reason.clear();
    override_until_ms_ = common::DailyBoundary::nextBoundaryMs(now, limits_.reset_utc_offset_minutes);
    LOG_WARN("Risk halt cleared by override ({}) until {}", reason, override_until_ms_);
}

bool RiskManager::isHalted() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return state_.halted_until_ms > clock_.nowMs();
}

void RiskManager::setManualReview(const std::string& symbol, bool enabled) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (enabled) {
        manual_review_.insert(symbol);
    } else if (manual_review_.erase(symbol) > 0) {
        LOG_INFO("[{}] manual review cleared", symbol);
    }
}

bool RiskManager::isInManualReview(const std::string& symbol) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return manual_review_.count(symbol) > 0;
}

std::set<std::string> RiskManager::manualReviewSymbols() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return manual_review_;
}

void RiskManager::setInstrumentSpec(const std::string& symbol, const common::InstrumentSpec& spec) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    instruments_[symbol] = spec;
}

common::InstrumentSpec RiskManager::getInstrumentSpec(const std::string& symbol) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto it = instruments_.find(symbol);
    return it != instruments_.end() ? it->second : common::InstrumentSpec();
}

// ===== Daily reset =====

void RiskManager::resetDailyIfNeeded(long long now_ms) {
    const long long day_start = common::DailyBoundary::dayStartMs(now_ms, limits_.reset_utc_offset_minutes);
    if (state_.last_reset_ms >= day_start) {
        return;
    }

    nlohmann::json payload;
    payload["previous_day_pnl"] = state_.daily_realized_pnl;
    payload["previous_day_trades"] = state_.daily_trade_count;
    payload["day"] = common::DailyBoundary::dayKey(now_ms, limits_.reset_utc_offset_minutes);

    state_.daily_realized_pnl = 0.0;
    state_.daily_trade_count = 0;
    state_.consecutive_losses = 0;
    state_.last_reset_ms = day_start;
    if (state_.halted_until_ms <= now_ms) {
        state_.halted_until_ms = 0;
        state_.halt_reason.clear();
    }
    override_until_ms_ = 0;

    publish(core::NotificationType::DAILY_RESET, "", "daily risk counters reset", ErrorKind::NONE, payload);
}

// ===== State =====

RiskState RiskManager::getState() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return state_;
}

void RiskManager::restoreState(const RiskState& state) {
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        state_ = state;
        if (!limits_.persist_halt_across_restart) {
            state_.halted_until_ms = 0;
            state_.halt_reason.clear();
        }
        LOG_INFO("Risk state restored: daily_pnl={:.4f} trades={} consecutive_losses={} halted_until={}",
                 state_.daily_realized_pnl, state_.daily_trade_count,
                 state_.consecutive_losses, state_.halted_until_ms);
        resetDailyIfNeeded(clock_.nowMs());
    }
    flushNotifications();
}

nlohmann::json RiskManager::toJson(const RiskState& state) {
    nlohmann::json j;
    j["daily_realized_pnl"] = state.daily_realized_pnl;
    j["daily_trade_count"] = state.daily_trade_count;
    j["consecutive_losses"] = state.consecutive_losses;
    j["last_reset_ms"] = state.last_reset_ms;
    j["halted_until_ms"] = state.halted_until_ms;
    j["halt_reason"] = state.halt_reason;
    return j;
}

RiskState RiskManager::riskStateFromJson(const nlohmann::json& j) {
    RiskState state;
    state.daily_realized_pnl = j.value("daily_realized_pnl", 0.0);
    state.daily_trade_count = j.value("daily_trade_count", 0);
    state.consecutive_losses = j.value("consecutive_losses", 0);
    state.last_reset_ms = j.value("last_reset_ms", 0LL);
    state.halted_until_ms = j.value("halted_until_ms", 0LL);
    state.halt_reason = j.value("halt_reason", std::string());
    return state;
}

// ===== Reporting =====

RiskDecision RiskManager::denyAndReport(const strategy::Signal& signal, RiskDecision decision) {
    nlohmann::json payload;
    payload["reason"] = denialReasonToString(decision.reason);
    payload["direction"] = signal.direction == Direction::LONG ? "LONG" : "SHORT";
    payload["confidence"] = signal.confidence;
    LOG_WARN("[{}] entry denied: {} ({})", signal.symbol,
             denialReasonToString(decision.reason), decision.detail);
    publish(core::NotificationType::RISK_DENIED, signal.symbol, decision.detail, decision.error, payload);
    return decision;
}

void RiskManager::publish(core::NotificationType type, const std::string& symbol,
                          const std::string& message, ErrorKind error, nlohmann::json payload) {
    if (!sink_) {
        return;
    }
    core::Notification notification;
    notification.type = type;
    notification.ts_ms = clock_.nowMs();
    notification.symbol = symbol;
    notification.message = message;
    notification.error = error;
    notification.payload = std::move(payload);
    outbox_.push_back(std::move(notification));
}

void RiskManager::flushNotifications() {
    std::vector<core::Notification> pending;
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        pending.swap(outbox_);
    }
    for (const auto& notification : pending) {
        sink_->notify(notification);
    }
}

const char* RiskManager::denialReasonToString(DenialReason reason) {
    switch (reason) {
        case DenialReason::NONE: return "NONE";
        case DenialReason::ENGINE_PAUSED: return "ENGINE_PAUSED";
        case DenialReason::RISK_HALTED: return "RISK_HALTED";
        case DenialReason::MANUAL_REVIEW: return "MANUAL_REVIEW";
        case DenialReason::DAILY_TRADE_LIMIT: return "DAILY_TRADE_LIMIT";
        case DenialReason::DAILY_LOSS_LIMIT: return "DAILY_LOSS_LIMIT";
        case DenialReason::CONSECUTIVE_LOSSES: return "CONSECUTIVE_LOSSES";
        case DenialReason::ENTRY_COOLDOWN: return "ENTRY_COOLDOWN";
        case DenialReason::INVALID_SIGNAL: return "INVALID_SIGNAL";
        case DenialReason::NO_MARGIN: return "NO_MARGIN";
        case DenialReason::SIZE_BELOW_MINIMUM: return "SIZE_BELOW_MINIMUM";
    }
    return "UNKNOWN";
}

} // namespace risk
} // namespace perpscalp
