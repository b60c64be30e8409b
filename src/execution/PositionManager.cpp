#include "execution/PositionManager.h"

#include <algorithm>
#include <cmath>

#include "common/Logger.h"
#include "common/TickSizeHelper.h"
#include "core/execution/ExecutionUpdateSchema.h"

namespace perpscalp {
namespace execution {

using core::NotificationType;
using core::execution::LifecycleEvent;
using core::execution::PositionLifecycleStateMachine;
using core::execution::directionToString;
using core::execution::positionStateToString;

namespace {
constexpr size_t kClosedHistory = 50;

// Tighter of two stops for the given direction.
double tighterStop(Direction direction, double a, double b) {
    return direction == Direction::LONG ? std::max(a, b) : std::min(a, b);
}

ErrorKind errorKindForGateway(network::GatewayErrorKind kind) {
    return network::isTransient(kind) ? ErrorKind::TRANSIENT_GATEWAY : ErrorKind::VALIDATION;
}
} // namespace

PositionManager::PositionManager(const PositionConfig& config,
                                 network::IExchangeGateway& gateway,
                                 risk::RiskManager& risk,
                                 const common::IClock& clock,
                                 core::INotificationSink* sink,
                                 RetryPolicy::Sleeper sleeper)
    : config_(config)
    , gateway_(gateway)
    , risk_(risk)
    , clock_(clock)
    , sink_(sink)
    , retry_(config.retry, std::move(sleeper))
{
    LOG_INFO("PositionManager initialized: {} take-profit levels, entry timeout {}s, trailing {}",
             config_.take_profit_ladder.size(), config_.entry_timeout_sec,
             config_.trailing_enabled ? "on" : "off");
}

void PositionManager::setPersistCallback(PersistCallback callback) {
    persist_ = std::move(callback);
}

PositionManager::SymbolSlot& PositionManager::slotFor(const std::string& symbol) {
    std::lock_guard<std::mutex> lock(slots_mutex_);
    auto it = slots_.find(symbol);
    if (it == slots_.end()) {
        auto slot = std::make_unique<SymbolSlot>();
        slot->position.symbol = symbol;
        it = slots_.emplace(symbol, std::move(slot)).first;
    }
    return *it->second;
}

PositionManager::SymbolSlot* PositionManager::findSlot(const std::string& symbol) const {
    std::lock_guard<std::mutex> lock(slots_mutex_);
    auto it = slots_.find(symbol);
    return it != slots_.end() ? it->second.get() : nullptr;
}

bool PositionManager::applyTransition(Position& position, LifecycleEvent event) {
    const auto result = PositionLifecycleStateMachine::transition(position.state, event);
    if (!result.valid) {
        LOG_WARN("[{}] refused transition {} from {}", position.symbol,
                 core::execution::lifecycleEventToString(event), positionStateToString(position.state));
        return false;
    }
    position.state = result.state;
    return true;
}

// ===== Entry =====

bool PositionManager::openPosition(const strategy::Signal& signal, double quantity) {
    auto& slot = slotFor(signal.symbol);
    std::lock_guard<std::mutex> lock(slot.mutex);
    Position& current = slot.position;

    if (current.isActive()) {
        LOG_WARN("[{}] position already {}, entry skipped", signal.symbol, positionStateToString(current.state));
        return false;
    }
    if (!(quantity > 0.0)) {
        LOG_WARN("[{}] entry skipped: quantity {}", signal.symbol, quantity);
        return false;
    }

    const auto spec = risk_.getInstrumentSpec(signal.symbol);
    const long long now = clock_.nowMs();

    Position next;
    next.symbol = signal.symbol;
    next.direction = signal.direction;
    next.entry_price = common::roundToStep(signal.reference_price, spec.tick_size);
    next.size = quantity;
    next.remaining_size = quantity;
    next.atr_at_entry = signal.atr;
    next.best_price = next.entry_price;
    next.entry_submitted_ms = now;
    if (!applyTransition(next, LifecycleEvent::ENTRY_SUBMITTED)) {
        return false;
    }

    Order order;
    order.symbol = signal.symbol;
    order.side = entrySide(signal.direction);
    order.kind = OrderKind::ENTRY;
    order.price = next.entry_price;
    order.size = quantity;
    order.created_at_ms = now;

    auto order_id = submit(next, order, "submit entry");
    if (!order_id) {
        risk_.releaseEntry(signal.symbol);
        applyTransition(next, LifecycleEvent::ENTRY_REJECTED);
        current = Position();
        current.symbol = signal.symbol;
        commit(current);
        return false;
    }

    next.entry_order_id = *order_id;
    current = next;

    nlohmann::json payload;
    payload["order_id"] = current.entry_order_id;
    payload["price"] = current.entry_price;
    payload["size"] = current.size;
    payload["confidence"] = signal.confidence;
    payload["rules"] = signal.triggering_rules;
    notify(NotificationType::ENTRY_SUBMITTED, current,
           std::string(directionToString(current.direction)) + " entry submitted", ErrorKind::NONE, payload);
    commit(current);
    return true;
}

// ===== Order updates =====

void PositionManager::onOrderUpdate(const network::OrderUpdate& update) {
    const bool fill = update.status == OrderStatus::FILLED || update.status == OrderStatus::PARTIALLY_FILLED;
    const bool dead = update.status == OrderStatus::REJECTED || update.status == OrderStatus::CANCELLED;

    SymbolSlot* slot = findSlot(update.symbol);
    if (slot == nullptr) {
        LOG_WARN("Order update for unmanaged symbol {} ({})", update.symbol, update.order_id);
        if (fill) {
            Position unknown;
            unknown.symbol = update.symbol;
            nlohmann::json payload;
            payload["order_id"] = update.order_id;
            payload["filled_size"] = update.filled_size;
            notify(NotificationType::RECONCILIATION_MISMATCH, unknown,
                   "fill for unmanaged symbol", ErrorKind::RECONCILIATION, payload);
            risk_.setManualReview(update.symbol, true);
        }
        return;
    }

    std::lock_guard<std::mutex> lock(slot->mutex);
    Position& position = slot->position;

    if (position.state == PositionState::ENTRY_PENDING && update.order_id == position.entry_order_id) {
        handleEntryUpdate(position, update);
        commit(position);
        return;
    }

    if (position.state == PositionState::OPEN || position.state == PositionState::PARTIALLY_CLOSED) {
        if (!position.stop_order_id.empty() && update.order_id == position.stop_order_id) {
            if (update.status == OrderStatus::FILLED) {
                handleStopFill(position, update);
            } else if (dead) {
                handleProtectiveFailure(position, update);
            }
            commit(position);
            return;
        }
        if (!position.exit_order_id.empty() && update.order_id == position.exit_order_id) {
            if (fill) {
                handleExitFill(position, update);
            } else if (dead) {
                handleProtectiveFailure(position, update);
            }
            commit(position);
            return;
        }
        for (size_t i = 0; i < position.take_profits.size(); ++i) {
            const auto& target = position.take_profits[i];
            if (target.order_id.empty() || target.order_id != update.order_id) {
                continue;
            }
            if (fill) {
                handleTakeProfitFill(position, i, update);
            } else if (dead) {
                handleProtectiveFailure(position, update);
            }
            commit(position);
            return;
        }
    }

    if (fill) {
        // A fill we are not tracking means the venue holds exposure we do not.
        nlohmann::json payload;
        payload["order_id"] = update.order_id;
        payload["filled_size"] = update.filled_size;
        payload["avg_price"] = update.avg_price;
        notify(NotificationType::RECONCILIATION_MISMATCH, position,
               "fill for untracked order", ErrorKind::RECONCILIATION, payload);
        risk_.setManualReview(position.symbol, true);
        return;
    }
    LOG_DEBUG("[{}] ignoring update {} for order {}", update.symbol,
              core::execution::orderStatusToString(update.status), update.order_id);
}

void PositionManager::handleEntryUpdate(Position& position, const network::OrderUpdate& update) {
    const double price = update.avg_price > 0.0 ? update.avg_price : position.entry_price;
    switch (update.status) {
        case OrderStatus::PARTIALLY_FILLED:
            addEntryFill(position, update.filled_size, price);
            LOG_INFO("[{}] entry partially filled: {} of {}", position.symbol,
                     position.entry_filled_size, position.size);
            return;
        case OrderStatus::FILLED: {
            // A bare FILLED with no size completes whatever was outstanding.
            const double size = update.filled_size > 0.0 ? update.filled_size
                                                         : position.size - position.entry_filled_size;
            addEntryFill(position, size, price);
            confirmEntry(position, update.ts_ms, false);
            return;
        }
        case OrderStatus::REJECTED:
        case OrderStatus::CANCELLED: {
            const bool rejected = update.status == OrderStatus::REJECTED;
            addEntryFill(position, update.filled_size, price);
            if (position.entry_filled_size > 0.0) {
                LOG_WARN("[{}] entry {} after {} filled, keeping the filled part", position.symbol,
                         rejected ? "rejected" : "cancelled", position.entry_filled_size);
                confirmEntry(position, update.ts_ms, true);
                return;
            }
            if (!applyTransition(position, rejected ? LifecycleEvent::ENTRY_REJECTED
                                                    : LifecycleEvent::ENTRY_CANCELLED)) {
                return;
            }
            risk_.releaseEntry(position.symbol);
            nlohmann::json payload;
            payload["order_id"] = update.order_id;
            payload["reason"] = update.reason;
            notify(NotificationType::ENTRY_CANCELLED, position,
                   rejected ? "entry rejected by venue" : "entry cancelled by venue",
                   rejected ? ErrorKind::VALIDATION : ErrorKind::NONE, payload);
            const std::string symbol = position.symbol;
            position = Position();
            position.symbol = symbol;
            return;
        }
        default:
            return;
    }
}

void PositionManager::addEntryFill(Position& position, double size, double price) {
    if (!(size > 0.0)) {
        return;
    }
    position.entry_filled_size += size;
    position.entry_fill_notional += size * price;
}

void PositionManager::confirmEntry(Position& position, long long ts_ms, bool partial) {
    const double fill_size = position.entry_filled_size;
    if (!(fill_size > 0.0)) {
        return;
    }
    const double fill_price = position.entry_fill_notional / fill_size;
    if (!applyTransition(position, LifecycleEvent::ENTRY_FILLED)) {
        return;
    }
    const double requested = position.size;
    position.entry_price = fill_price;
    position.size = fill_size;
    position.remaining_size = fill_size;
    position.best_price = fill_price;
    position.opened_ms = ts_ms > 0 ? ts_ms : clock_.nowMs();

    risk::FillReport report;
    report.symbol = position.symbol;
    report.kind = risk::FillKind::ENTRY;
    report.quantity = fill_size;
    report.price = fill_price;
    report.ts_ms = position.opened_ms;
    risk_.recordFill(report);

    armProtection(position);
    if (position.state != PositionState::OPEN) {
        return;
    }

    nlohmann::json payload;
    payload["entry_price"] = position.entry_price;
    payload["size"] = position.size;
    payload["stop_loss_price"] = position.stop_loss_price;
    nlohmann::json targets = nlohmann::json::array();
    for (const auto& target : position.take_profits) {
        targets.push_back({{"price", target.price}, {"fraction", target.fraction}, {"size", target.size}});
    }
    payload["take_profits"] = targets;
    if (partial) {
        payload["requested_size"] = requested;
    }
    notify(NotificationType::POSITION_OPENED, position,
           std::string(directionToString(position.direction)) +
               (partial ? " position opened from partial entry fill" : " position opened"),
           ErrorKind::NONE, payload);
}

// ===== Protection =====

void PositionManager::armProtection(Position& position) {
    const auto spec = risk_.getInstrumentSpec(position.symbol);
    const double sign = directionSign(position.direction);
    const bool is_long = position.direction == Direction::LONG;

    const double distance = risk_.stopDistance(position.symbol, position.entry_price, position.atr_at_entry);
    position.stop_loss_price = common::roundStopPrice(position.entry_price - sign * distance, spec.tick_size, is_long);

    Order stop;
    stop.symbol = position.symbol;
    stop.side = exitSide(position.direction);
    stop.kind = OrderKind::STOP;
    stop.price = position.stop_loss_price;
    stop.size = position.remaining_size;
    stop.reduce_only = true;
    stop.created_at_ms = clock_.nowMs();

    auto stop_id = submit(position, stop, "place stop");
    if (!stop_id) {
        flatten(position, "stop placement failed");
        return;
    }
    position.stop_order_id = *stop_id;

    // Ladder: every level but the last is rounded down to the lot step, the
    // last level takes whatever remains.
    position.take_profits.clear();
    double allocated = 0.0;
    const size_t levels = config_.take_profit_ladder.size();
    for (size_t i = 0; i < levels; ++i) {
        const auto& step = config_.take_profit_ladder[i];
        const bool last = (i + 1 == levels);
        const double size = last ? position.size - allocated
                                 : common::roundDownToStep(position.size * step.fraction, spec.lot_step);
        if (size < spec.min_qty * 0.5) {
            continue;
        }
        allocated += size;

        TakeProfitTarget target;
        target.price = common::roundToStep(position.entry_price + sign * step.atr_multiple * position.atr_at_entry,
                                           spec.tick_size);
        target.fraction = size / position.size;
        target.size = size;

        Order order;
        order.symbol = position.symbol;
        order.side = exitSide(position.direction);
        order.kind = OrderKind::TAKE_PROFIT;
        order.price = target.price;
        order.size = size;
        order.reduce_only = true;
        order.take_profit_level = static_cast<int>(position.take_profits.size());
        order.created_at_ms = clock_.nowMs();

        // A failed target leaves its share to the stop.
        if (auto id = submit(position, order, "place take profit " + std::to_string(i + 1))) {
            target.order_id = *id;
        }
        position.take_profits.push_back(target);
    }
}

bool PositionManager::replaceStop(Position& position, double new_stop, const std::string& why) {
    const auto spec = risk_.getInstrumentSpec(position.symbol);
    const double rounded = common::roundStopPrice(new_stop, spec.tick_size, position.direction == Direction::LONG);

    Order stop;
    stop.symbol = position.symbol;
    stop.side = exitSide(position.direction);
    stop.kind = OrderKind::STOP;
    stop.price = rounded;
    stop.size = position.remaining_size;
    stop.reduce_only = true;
    stop.created_at_ms = clock_.nowMs();

    // New stop first so the position is never unprotected.
    auto id = submit(position, stop, "replace stop");
    if (!id) {
        return false;
    }
    const std::string old_id = position.stop_order_id;
    const double old_price = position.stop_loss_price;
    position.stop_order_id = *id;
    position.stop_loss_price = rounded;
    if (!old_id.empty() && !cancel(position.symbol, old_id)) {
        notify(NotificationType::ORDER_ERROR, position, "previous stop could not be cancelled",
               ErrorKind::TRANSIENT_GATEWAY, {{"order_id", old_id}, {"action", "cancel stop"}});
    }

    if (std::fabs(rounded - old_price) > spec.tick_size * 0.5) {
        nlohmann::json payload;
        payload["from"] = old_price;
        payload["to"] = rounded;
        payload["remaining_size"] = position.remaining_size;
        notify(NotificationType::STOP_MOVED, position, "stop moved: " + why, ErrorKind::NONE, payload);
    }
    return true;
}

void PositionManager::flatten(Position& position, const std::string& reason) {
    if (!position.exit_order_id.empty()) {
        return;
    }

    Order exit;
    exit.symbol = position.symbol;
    exit.side = exitSide(position.direction);
    exit.kind = OrderKind::EXIT;
    exit.price = 0.0;
    exit.size = position.remaining_size;
    exit.reduce_only = true;
    exit.created_at_ms = clock_.nowMs();

    auto id = submit(position, exit, "flatten");
    if (!id) {
        risk_.setManualReview(position.symbol, true);
        notify(NotificationType::ORDER_ERROR, position, "flatten failed, symbol needs manual review",
               ErrorKind::RECONCILIATION, {{"reason", reason}});
        return;
    }
    position.exit_order_id = *id;
    position.close_reason = reason;
    cancelWorkingOrders(position);
    LOG_WARN("[{}] flattening {} remaining ({})", position.symbol, position.remaining_size, reason);
}

void PositionManager::handleProtectiveFailure(Position& position, const network::OrderUpdate& update) {
    nlohmann::json payload;
    payload["order_id"] = update.order_id;
    payload["status"] = core::execution::orderStatusToString(update.status);
    payload["reason"] = update.reason;

    if (update.order_id == position.stop_order_id) {
        position.stop_order_id.clear();
        notify(NotificationType::ORDER_ERROR, position, "stop order lost, flattening",
               ErrorKind::VALIDATION, payload);
        flatten(position, "stop order lost");
        return;
    }
    if (update.order_id == position.exit_order_id) {
        position.exit_order_id.clear();
        risk_.setManualReview(position.symbol, true);
        notify(NotificationType::ORDER_ERROR, position, "exit order failed, symbol needs manual review",
               ErrorKind::RECONCILIATION, payload);
        return;
    }
    for (auto& target : position.take_profits) {
        if (target.order_id == update.order_id) {
            target.order_id.clear();
        }
    }
    notify(NotificationType::ORDER_ERROR, position, "take-profit order lost, stop still working",
           ErrorKind::VALIDATION, payload);
}

// ===== Exits =====

void PositionManager::handleStopFill(Position& position, const network::OrderUpdate& update) {
    const double price = update.avg_price > 0.0 ? update.avg_price : position.stop_loss_price;
    const double size = position.remaining_size;
    const double pnl = pnlFor(position, price, size);

    position.stop_order_id.clear();
    position.realized_pnl += pnl;
    position.final_close_size += size;
    position.remaining_size = 0.0;
    if (position.close_reason.empty()) {
        position.close_reason = "stop";
    }
    finishClose(position, price, size, pnl, LifecycleEvent::STOP_FILLED);
}

void PositionManager::handleTakeProfitFill(Position& position, size_t level, const network::OrderUpdate& update) {
    auto& target = position.take_profits[level];
    if (target.filled) {
        return;
    }
    const auto spec = risk_.getInstrumentSpec(position.symbol);
    const bool complete = update.status == OrderStatus::FILLED;
    const double outstanding = std::max(0.0, target.size - target.filled_size);
    const double requested = update.filled_size > 0.0 ? update.filled_size : (complete ? outstanding : 0.0);
    if (!(requested > 0.0)) {
        return;
    }
    const double price = update.avg_price > 0.0 ? update.avg_price : target.price;
    const double size = std::min(requested, position.remaining_size);
    const double pnl = pnlFor(position, price, size);

    target.filled_size += size;
    if (complete || target.filled_size >= target.size - spec.lot_step * 0.5) {
        target.filled = true;
        target.order_id.clear();
    }
    position.realized_pnl += pnl;
    position.take_profit_closed_size += size;
    position.remaining_size -= size;

    nlohmann::json payload;
    payload["level"] = level + 1;
    payload["price"] = price;
    payload["size"] = size;
    payload["remaining_size"] = position.remaining_size;
    payload["pnl"] = pnl;
    payload["partial"] = !target.filled;

    if (position.remaining_size <= spec.lot_step * 0.5) {
        position.remaining_size = 0.0;
        position.close_reason = "take profit";
        notify(NotificationType::TAKE_PROFIT_HIT, position,
               "final take profit " + std::to_string(level + 1) + " filled", ErrorKind::NONE, payload);
        finishClose(position, price, 0.0, pnl, LifecycleEvent::FINAL_TAKE_PROFIT_FILLED);
        return;
    }

    if (!applyTransition(position, LifecycleEvent::TAKE_PROFIT_FILLED)) {
        return;
    }

    risk::FillReport report;
    report.symbol = position.symbol;
    report.kind = risk::FillKind::REDUCE;
    report.quantity = size;
    report.price = price;
    report.pnl_delta = pnl;
    report.ts_ms = update.ts_ms;
    risk_.recordFill(report);

    notify(NotificationType::TAKE_PROFIT_HIT, position,
           "take profit " + std::to_string(level + 1) + (target.filled ? " filled" : " partially filled"),
           ErrorKind::NONE, payload);
    if (!target.filled) {
        return;
    }

    double stop = position.stop_loss_price;
    if (config_.move_stop_on_take_profit) {
        const double target_stop = level == 0 ? position.entry_price : position.take_profits[level - 1].price;
        stop = tighterStop(position.direction, stop, target_stop);
    }
    // Resized for the remaining quantity even when the price stays.
    replaceStop(position, stop, "take profit " + std::to_string(level + 1));
}

void PositionManager::handleExitFill(Position& position, const network::OrderUpdate& update) {
    const auto spec = risk_.getInstrumentSpec(position.symbol);
    const double price = update.avg_price;
    const double requested = update.filled_size > 0.0 ? update.filled_size : position.remaining_size;
    const double size = std::min(requested, position.remaining_size);
    const double pnl = pnlFor(position, price, size);

    position.realized_pnl += pnl;
    position.final_close_size += size;
    position.remaining_size -= size;

    if (position.remaining_size <= spec.lot_step * 0.5) {
        position.remaining_size = 0.0;
        position.exit_order_id.clear();
        finishClose(position, price, size, pnl, LifecycleEvent::EXIT_FILLED);
        return;
    }

    risk::FillReport report;
    report.symbol = position.symbol;
    report.kind = risk::FillKind::REDUCE;
    report.quantity = size;
    report.price = price;
    report.pnl_delta = pnl;
    report.ts_ms = update.ts_ms;
    risk_.recordFill(report);
}

void PositionManager::finishClose(Position& position, double exit_price, double closing_size,
                                  double pnl_delta, LifecycleEvent event) {
    if (!applyTransition(position, event)) {
        return;
    }
    position.closed_ms = clock_.nowMs();
    position.last_exit_price = exit_price;
    cancelWorkingOrders(position);

    risk::FillReport report;
    report.symbol = position.symbol;
    report.kind = risk::FillKind::CLOSE;
    report.quantity = closing_size;
    report.price = exit_price;
    report.pnl_delta = pnl_delta;
    report.position_pnl = position.realized_pnl;
    report.ts_ms = position.closed_ms;
    risk_.recordFill(report);

    Logger::getInstance().logTrade(position.symbol, directionToString(position.direction),
                                   position.entry_price, exit_price, position.size, position.realized_pnl);

    nlohmann::json payload;
    payload["entry_price"] = position.entry_price;
    payload["exit_price"] = exit_price;
    payload["size"] = position.size;
    payload["realized_pnl"] = position.realized_pnl;
    payload["closed_fraction"] = position.closedFraction();
    payload["reason"] = position.close_reason;

    if (event == LifecycleEvent::STOP_FILLED) {
        notify(NotificationType::STOP_LOSS_HIT, position, "stop filled", ErrorKind::NONE, payload);
    }
    notify(NotificationType::POSITION_CLOSED, position, "position closed (" + position.close_reason + ")",
           ErrorKind::NONE, payload);

    {
        std::lock_guard<std::mutex> lock(snapshot_mutex_);
        closed_.push_back(position);
        while (closed_.size() > kClosedHistory) {
            closed_.pop_front();
        }
    }

    applyTransition(position, LifecycleEvent::RESET);
    const std::string symbol = position.symbol;
    position = Position();
    position.symbol = symbol;
}

void PositionManager::cancelWorkingOrders(Position& position) {
    if (!position.stop_order_id.empty()) {
        cancel(position.symbol, position.stop_order_id);
        position.stop_order_id.clear();
    }
    for (auto& target : position.take_profits) {
        if (!target.filled && !target.order_id.empty()) {
            cancel(position.symbol, target.order_id);
            target.order_id.clear();
        }
    }
}

// ===== Price-driven stop management =====

void PositionManager::onPrice(const std::string& symbol, double price) {
    SymbolSlot* slot = findSlot(symbol);
    if (slot == nullptr || !(price > 0.0)) {
        return;
    }

    std::lock_guard<std::mutex> lock(slot->mutex);
    Position& position = slot->position;
    if (position.state != PositionState::OPEN && position.state != PositionState::PARTIALLY_CLOSED) {
        return;
    }
    if (!position.exit_order_id.empty() || position.atr_at_entry <= 0.0) {
        return;
    }

    const double sign = directionSign(position.direction);
    position.best_price = position.direction == Direction::LONG ? std::max(position.best_price, price)
                                                                : std::min(position.best_price, price);
    const double favorable = (position.best_price - position.entry_price) * sign;
    const double atr = position.atr_at_entry;

    double candidate = position.stop_loss_price;
    std::string why;
    if (config_.breakeven_trigger_atr > 0.0 && favorable >= config_.breakeven_trigger_atr * atr) {
        const double tightened = tighterStop(position.direction, candidate, position.entry_price);
        if (tightened != candidate) {
            candidate = tightened;
            why = "breakeven";
        }
    }
    if (config_.trailing_enabled && favorable >= config_.trail_activation_atr * atr) {
        const double trail = position.best_price - sign * config_.trail_distance_atr * atr;
        const double tightened = tighterStop(position.direction, candidate, trail);
        if (tightened != candidate) {
            candidate = tightened;
            why = "trailing";
        }
    }

    // Never at or through the market, never looser, and only in meaningful steps.
    if ((price - candidate) * sign <= 0.0) {
        return;
    }
    const double improvement = (candidate - position.stop_loss_price) * sign;
    const double min_step = position.stop_loss_price * config_.min_trail_step_pct / 100.0;
    if (improvement <= 0.0 || improvement < min_step) {
        return;
    }

    if (replaceStop(position, candidate, why)) {
        commit(position);
    }
}

// ===== Timeouts / manual close =====

int PositionManager::checkTimeouts() {
    std::vector<SymbolSlot*> slots;
    {
        std::lock_guard<std::mutex> lock(slots_mutex_);
        for (auto& kv : slots_) {
            slots.push_back(kv.second.get());
        }
    }

    const long long now = clock_.nowMs();
    int cancelled = 0;
    for (auto* slot : slots) {
        std::lock_guard<std::mutex> lock(slot->mutex);
        if (expireEntry(slot->position, now)) {
            ++cancelled;
        }
    }
    return cancelled;
}

bool PositionManager::checkTimeout(const std::string& symbol) {
    SymbolSlot* slot = findSlot(symbol);
    if (slot == nullptr) {
        return false;
    }
    std::lock_guard<std::mutex> lock(slot->mutex);
    return expireEntry(slot->position, clock_.nowMs());
}

bool PositionManager::expireEntry(Position& position, long long now) {
    const long long timeout_ms = static_cast<long long>(config_.entry_timeout_sec) * 1000;
    if (position.state != PositionState::ENTRY_PENDING ||
        now - position.entry_submitted_ms < timeout_ms) {
        return false;
    }

    nlohmann::json payload;
    payload["order_id"] = position.entry_order_id;
    payload["pending_ms"] = now - position.entry_submitted_ms;

    if (!cancel(position.symbol, position.entry_order_id)) {
        // The venue may still fill it; do not trade the symbol blind.
        risk_.setManualReview(position.symbol, true);
        notify(NotificationType::ORDER_ERROR, position, "entry cancel failed after timeout",
               ErrorKind::RECONCILIATION, payload);
    }
    if (position.entry_filled_size > 0.0) {
        // The filled part is live exposure: open it and protect it.
        LOG_WARN("[{}] entry timed out with {} of {} filled", position.symbol,
                 position.entry_filled_size, position.size);
        confirmEntry(position, now, true);
        commit(position);
        return true;
    }
    if (!applyTransition(position, LifecycleEvent::ENTRY_TIMEOUT)) {
        return false;
    }
    risk_.releaseEntry(position.symbol);
    notify(NotificationType::ENTRY_CANCELLED, position,
           "entry not filled within " + std::to_string(config_.entry_timeout_sec) + "s",
           ErrorKind::NONE, payload);

    const std::string symbol = position.symbol;
    position = Position();
    position.symbol = symbol;
    commit(position);
    return true;
}

void PositionManager::closePosition(const std::string& symbol, const std::string& reason) {
    SymbolSlot* slot = findSlot(symbol);
    if (slot == nullptr) {
        return;
    }

    std::lock_guard<std::mutex> lock(slot->mutex);
    Position& position = slot->position;

    if (position.state == PositionState::ENTRY_PENDING) {
        nlohmann::json payload;
        payload["order_id"] = position.entry_order_id;
        payload["reason"] = reason;
        if (!cancel(symbol, position.entry_order_id)) {
            risk_.setManualReview(symbol, true);
            notify(NotificationType::ORDER_ERROR, position, "entry cancel failed",
                   ErrorKind::RECONCILIATION, payload);
        }
        if (position.entry_filled_size > 0.0) {
            confirmEntry(position, clock_.nowMs(), true);
            if (position.state == PositionState::OPEN) {
                flatten(position, reason);
            }
            commit(position);
            return;
        }
        if (applyTransition(position, LifecycleEvent::ENTRY_CANCELLED)) {
            risk_.releaseEntry(symbol);
            notify(NotificationType::ENTRY_CANCELLED, position, "entry cancelled: " + reason,
                   ErrorKind::NONE, payload);
            position = Position();
            position.symbol = symbol;
            commit(position);
        }
        return;
    }

    if (position.state == PositionState::OPEN || position.state == PositionState::PARTIALLY_CLOSED) {
        flatten(position, reason);
        commit(position);
    }
}

void PositionManager::closeAll(const std::string& reason) {
    std::vector<std::string> symbols;
    {
        std::lock_guard<std::mutex> lock(slots_mutex_);
        for (const auto& kv : slots_) {
            symbols.push_back(kv.first);
        }
    }
    LOG_WARN("Closing all positions: {}", reason);
    for (const auto& symbol : symbols) {
        closePosition(symbol, reason);
    }
}

// ===== Queries =====

std::optional<Position> PositionManager::getPosition(const std::string& symbol) const {
    std::lock_guard<std::mutex> lock(snapshot_mutex_);
    auto it = snapshots_.find(symbol);
    if (it == snapshots_.end() || !it->second.isActive()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Position> PositionManager::getAllPositions() const {
    return snapshot();
}

std::vector<Position> PositionManager::closedPositions() const {
    std::lock_guard<std::mutex> lock(snapshot_mutex_);
    return std::vector<Position>(closed_.begin(), closed_.end());
}

bool PositionManager::hasActivePosition(const std::string& symbol) const {
    return getPosition(symbol).has_value();
}

std::vector<Position> PositionManager::snapshot() const {
    std::lock_guard<std::mutex> lock(snapshot_mutex_);
    std::vector<Position> out;
    for (const auto& kv : snapshots_) {
        if (kv.second.isActive()) {
            out.push_back(kv.second);
        }
    }
    return out;
}

void PositionManager::restore(const std::vector<Position>& positions) {
    for (const auto& restored : positions) {
        if (!restored.isActive() || restored.symbol.empty()) {
            continue;
        }
        auto& slot = slotFor(restored.symbol);
        std::lock_guard<std::mutex> lock(slot.mutex);
        slot.position = restored;
        if (restored.state == PositionState::ENTRY_PENDING) {
            risk_.reserveEntry(restored.symbol);
        }
        {
            std::lock_guard<std::mutex> snap_lock(snapshot_mutex_);
            snapshots_[restored.symbol] = restored;
        }
        LOG_INFO("[{}] position restored: {} {} remaining={}", restored.symbol,
                 positionStateToString(restored.state), directionToString(restored.direction),
                 restored.remaining_size);
    }
}

std::vector<std::string> PositionManager::reconcile(const std::vector<network::VenuePosition>& venue_positions) {
    std::map<std::string, double> venue;
    for (const auto& p : venue_positions) {
        venue[p.symbol] += p.size;
    }

    std::set<std::string> symbols;
    {
        std::lock_guard<std::mutex> lock(slots_mutex_);
        for (const auto& kv : slots_) {
            symbols.insert(kv.first);
        }
    }
    for (const auto& kv : venue) {
        symbols.insert(kv.first);
    }

    std::vector<std::string> mismatched;
    for (const auto& symbol : symbols) {
        Position local;
        local.symbol = symbol;
        if (auto existing = getPosition(symbol)) {
            local = *existing;
        }
        double local_size = 0.0;
        if (local.state == PositionState::OPEN || local.state == PositionState::PARTIALLY_CLOSED) {
            local_size = directionSign(local.direction) * local.remaining_size;
        }
        auto it = venue.find(symbol);
        const double venue_size = it != venue.end() ? it->second : 0.0;

        const double tolerance = risk_.getInstrumentSpec(symbol).lot_step * 0.5;
        if (std::fabs(local_size - venue_size) <= tolerance) {
            continue;
        }

        nlohmann::json payload;
        payload["local_size"] = local_size;
        payload["venue_size"] = venue_size;
        notify(NotificationType::RECONCILIATION_MISMATCH, local,
               "local position disagrees with venue", ErrorKind::RECONCILIATION, payload);
        risk_.setManualReview(symbol, true);
        mismatched.push_back(symbol);
    }

    LOG_INFO("Reconciliation finished: {} symbols checked, {} mismatched", symbols.size(), mismatched.size());
    return mismatched;
}

// ===== Helpers =====

std::optional<std::string> PositionManager::submit(Position& position, const Order& order, const std::string& action) {
    auto result = retry_.execute<std::string>(
        "[" + order.symbol + "] " + action,
        [&]() { return gateway_.placeOrder(order); });
    if (result.ok()) {
        return *result.value;
    }

    nlohmann::json payload;
    payload["action"] = action;
    payload["order"] = core::execution::toJson(order);
    payload["gateway_error"] = network::gatewayErrorKindToString(result.error.kind);
    payload["detail"] = result.error.message;
    notify(NotificationType::ORDER_ERROR, position, action + " failed",
           errorKindForGateway(result.error.kind), payload);
    return std::nullopt;
}

bool PositionManager::cancel(const std::string& symbol, const std::string& order_id) {
    if (order_id.empty()) {
        return true;
    }
    auto result = retry_.execute<bool>(
        "[" + symbol + "] cancel " + order_id,
        [&]() { return gateway_.cancelOrder(order_id); });
    if (!result.ok()) {
        LOG_WARN("[{}] cancel {} failed: {}", symbol, order_id, result.error.message);
        return false;
    }
    return true;
}

double PositionManager::pnlFor(const Position& position, double exit_price, double size) const {
    return (exit_price - position.entry_price) * size * directionSign(position.direction);
}

void PositionManager::notify(NotificationType type, const Position& position, const std::string& message,
                             ErrorKind error, nlohmann::json payload) {
    if (sink_ == nullptr) {
        return;
    }
    payload["state"] = positionStateToString(position.state);
    payload["direction"] = directionToString(position.direction);

    core::Notification notification;
    notification.type = type;
    notification.ts_ms = clock_.nowMs();
    notification.symbol = position.symbol;
    notification.message = message;
    notification.error = error;
    notification.payload = std::move(payload);
    sink_->notify(notification);
}

void PositionManager::commit(const Position& position) {
    {
        std::lock_guard<std::mutex> lock(snapshot_mutex_);
        snapshots_[position.symbol] = position;
    }
    if (persist_) {
        persist_();
    }
}

// ===== JSON =====

nlohmann::json PositionManager::toJson(const Position& position) {
    nlohmann::json j;
    j["symbol"] = position.symbol;
    j["direction"] = directionToString(position.direction);
    j["state"] = positionStateToString(position.state);
    j["entry_price"] = position.entry_price;
    j["size"] = position.size;
    j["remaining_size"] = position.remaining_size;
    j["stop_loss_price"] = position.stop_loss_price;
    j["realized_pnl"] = position.realized_pnl;
    j["atr_at_entry"] = position.atr_at_entry;
    j["best_price"] = position.best_price;
    j["entry_order_id"] = position.entry_order_id;
    j["stop_order_id"] = position.stop_order_id;
    j["exit_order_id"] = position.exit_order_id;
    j["take_profit_closed_size"] = position.take_profit_closed_size;
    j["final_close_size"] = position.final_close_size;
    j["entry_filled_size"] = position.entry_filled_size;
    j["entry_fill_notional"] = position.entry_fill_notional;
    j["entry_submitted_ms"] = position.entry_submitted_ms;
    j["opened_ms"] = position.opened_ms;
    j["close_reason"] = position.close_reason;

    nlohmann::json targets = nlohmann::json::array();
    for (const auto& target : position.take_profits) {
        targets.push_back({
            {"price", target.price},
            {"fraction", target.fraction},
            {"size", target.size},
            {"filled_size", target.filled_size},
            {"order_id", target.order_id},
            {"filled", target.filled}
        });
    }
    j["take_profits"] = targets;
    return j;
}

Position PositionManager::positionFromJson(const nlohmann::json& j) {
    Position position;
    position.symbol = j.value("symbol", std::string());
    position.direction = core::execution::directionFromString(j.value("direction", std::string("LONG")));
    position.state = core::execution::positionStateFromString(j.value("state", std::string("IDLE")));
    position.entry_price = j.value("entry_price", 0.0);
    position.size = j.value("size", 0.0);
    position.remaining_size = j.value("remaining_size", 0.0);
    position.stop_loss_price = j.value("stop_loss_price", 0.0);
    position.realized_pnl = j.value("realized_pnl", 0.0);
    position.atr_at_entry = j.value("atr_at_entry", 0.0);
    position.best_price = j.value("best_price", position.entry_price);
    position.entry_order_id = j.value("entry_order_id", std::string());
    position.stop_order_id = j.value("stop_order_id", std::string());
    position.exit_order_id = j.value("exit_order_id", std::string());
    position.take_profit_closed_size = j.value("take_profit_closed_size", 0.0);
    position.final_close_size = j.value("final_close_size", 0.0);
    position.entry_filled_size = j.value("entry_filled_size", 0.0);
    position.entry_fill_notional = j.value("entry_fill_notional", 0.0);
    position.entry_submitted_ms = j.value("entry_submitted_ms", 0LL);
    position.opened_ms = j.value("opened_ms", 0LL);
    position.close_reason = j.value("close_reason", std::string());

    if (j.contains("take_profits") && j["take_profits"].is_array()) {
        for (const auto& t : j["take_profits"]) {
            TakeProfitTarget target;
            target.price = t.value("price", 0.0);
            target.fraction = t.value("fraction", 0.0);
            target.size = t.value("size", 0.0);
            target.filled_size = t.value("filled_size", 0.0);
            target.order_id = t.value("order_id", std::string());
            target.filled = t.value("filled", false);
            position.take_profits.push_back(target);
        }
    }
    return position;
}

} // namespace execution
} // namespace perpscalp
