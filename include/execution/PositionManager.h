#pragma once

#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/Clock.h"
#include "common/Types.h"
#include "core/contracts/INotificationSink.h"
#include "core/execution/PositionLifecycleStateMachine.h"
#include "execution/RetryPolicy.h"
#include "network/IExchangeGateway.h"
#include "risk/RiskManager.h"
#include "strategy/ISignalRule.h"

namespace perpscalp {
namespace execution {

using core::execution::PositionState;

struct TakeProfitStep {
    double atr_multiple;
    double fraction;
};

struct PositionConfig {
    std::vector<TakeProfitStep> take_profit_ladder = {{1.0, 0.5}, {2.0, 0.5}};
    bool move_stop_on_take_profit = true;   // breakeven after the first level, prior level after that
    double breakeven_trigger_atr = 0.75;    // price-driven breakeven before the first level, 0 = off
    bool trailing_enabled = false;
    double trail_activation_atr = 1.0;
    double trail_distance_atr = 1.0;
    double min_trail_step_pct = 0.1;
    int entry_timeout_sec = 30;
    RetryConfig retry;
};

struct TakeProfitTarget {
    double price = 0.0;
    double fraction = 0.0;
    double size = 0.0;
    double filled_size = 0.0;
    std::string order_id;
    bool filled = false;
};

struct Position {
    std::string symbol;
    Direction direction = Direction::LONG;
    PositionState state = PositionState::IDLE;

    double entry_price = 0.0;       // reference price while pending, fill price once open
    double size = 0.0;
    double remaining_size = 0.0;
    double stop_loss_price = 0.0;
    std::vector<TakeProfitTarget> take_profits;
    double realized_pnl = 0.0;
    double atr_at_entry = 0.0;
    double best_price = 0.0;

    std::string entry_order_id;
    std::string stop_order_id;
    std::string exit_order_id;

    double take_profit_closed_size = 0.0;
    double final_close_size = 0.0;
    double last_exit_price = 0.0;

    // Entry fills received while still ENTRY_PENDING.
    double entry_filled_size = 0.0;
    double entry_fill_notional = 0.0;

    long long entry_submitted_ms = 0;
    long long opened_ms = 0;
    long long closed_ms = 0;
    std::string close_reason;

    bool isActive() const {
        return core::execution::PositionLifecycleStateMachine::isActive(state);
    }

    // Sum of executed take-profit fractions plus the final closing fraction.
    double closedFraction() const {
        return size > 0.0 ? (take_profit_closed_size + final_close_size) / size : 0.0;
    }
};

// Owns one position slot per symbol and drives it through the lifecycle
// table. Transitions for a symbol are serialized by that symbol's mutex;
// symbols never wait on each other.
class PositionManager {
public:
    using PersistCallback = std::function<void()>;

    PositionManager(const PositionConfig& config,
                    network::IExchangeGateway& gateway,
                    risk::RiskManager& risk,
                    const common::IClock& clock,
                    core::INotificationSink* sink = nullptr,
                    RetryPolicy::Sleeper sleeper = RetryPolicy::Sleeper());

    // IDLE -> ENTRY_PENDING. False when the symbol already has a position or
    // the entry order could not be placed.
    bool openPosition(const strategy::Signal& signal, double quantity);

    void onOrderUpdate(const network::OrderUpdate& update);

    // Price-driven breakeven and trailing stop.
    void onPrice(const std::string& symbol, double price);

    // Cancels entries pending longer than the timeout. Returns how many.
    int checkTimeouts();
    bool checkTimeout(const std::string& symbol);

    void closePosition(const std::string& symbol, const std::string& reason);
    void closeAll(const std::string& reason);

    std::optional<Position> getPosition(const std::string& symbol) const;
    std::vector<Position> getAllPositions() const;
    std::vector<Position> closedPositions() const;
    bool hasActivePosition(const std::string& symbol) const;

    std::vector<Position> snapshot() const;
    void restore(const std::vector<Position>& positions);

    // Compares local positions with the venue. Mismatching symbols go into
    // manual review and are returned.
    std::vector<std::string> reconcile(const std::vector<network::VenuePosition>& venue_positions);

    void setPersistCallback(PersistCallback callback);

    const PositionConfig& config() const { return config_; }

    static nlohmann::json toJson(const Position& position);
    static Position positionFromJson(const nlohmann::json& j);

private:
    struct SymbolSlot {
        std::mutex mutex;
        Position position;
    };

    SymbolSlot& slotFor(const std::string& symbol);
    SymbolSlot* findSlot(const std::string& symbol) const;

    bool applyTransition(Position& position, core::execution::LifecycleEvent event);

    bool expireEntry(Position& position, long long now);

    void handleEntryUpdate(Position& position, const network::OrderUpdate& update);
    void addEntryFill(Position& position, double size, double price);
    // ENTRY_PENDING -> OPEN with whatever has filled so far, then protection.
    void confirmEntry(Position& position, long long ts_ms, bool partial);
    void handleStopFill(Position& position, const network::OrderUpdate& update);
    void handleTakeProfitFill(Position& position, size_t level, const network::OrderUpdate& update);
    void handleExitFill(Position& position, const network::OrderUpdate& update);
    void handleProtectiveFailure(Position& position, const network::OrderUpdate& update);

    void armProtection(Position& position);
    bool replaceStop(Position& position, double new_stop, const std::string& why);
    void flatten(Position& position, const std::string& reason);
    void finishClose(Position& position, double exit_price, double closing_size,
                     double pnl_delta, core::execution::LifecycleEvent event);
    void cancelWorkingOrders(Position& position);

    std::optional<std::string> submit(Position& position, const Order& order, const std::string& action);
    bool cancel(const std::string& symbol, const std::string& order_id);

    double pnlFor(const Position& position, double exit_price, double size) const;
    void notify(core::NotificationType type, const Position& position,
                const std::string& message, ErrorKind error = ErrorKind::NONE,
                nlohmann::json payload = nlohmann::json::object());
    void commit(const Position& position);

    PositionConfig config_;
    network::IExchangeGateway& gateway_;
    risk::RiskManager& risk_;
    const common::IClock& clock_;
    core::INotificationSink* sink_;
    RetryPolicy retry_;

    mutable std::mutex slots_mutex_;
    std::map<std::string, std::unique_ptr<SymbolSlot>> slots_;

    // Copies of every slot, published after each transition so snapshot()
    // never needs a symbol lock.
    mutable std::mutex snapshot_mutex_;
    std::map<std::string, Position> snapshots_;
    std::deque<Position> closed_;
    PersistCallback persist_;
};

} // namespace execution
} // namespace perpscalp
