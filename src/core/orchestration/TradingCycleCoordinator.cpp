#include "core/orchestration/TradingCycleCoordinator.h"
#include "common/Logger.h"
#include "core/execution/ExecutionUpdateSchema.h"

namespace perpscalp {
namespace core {

TradingCycleCoordinator::TradingCycleCoordinator(
    const strategy::SignalEngine& signal_engine,
    risk::RiskManager& risk,
    ::perpscalp::execution::PositionManager& positions,
    network::IExchangeGateway& gateway,
    const common::IClock& clock,
    INotificationSink* sink
)
    : signal_engine_(signal_engine)
    , risk_(risk)
    , positions_(positions)
    , gateway_(gateway)
    , clock_(clock)
    , sink_(sink) {}

CycleResult TradingCycleCoordinator::runEntryCycle(
    const std::string& symbol,
    const analytics::IndicatorState& state,
    const analytics::MarketAnalyzer& analyzer
) {
    CycleResult result;

    if (positions_.hasActivePosition(symbol)) {
        result.stage = CycleStage::POSITION_ACTIVE;
        return result;
    }

    const auto confirmation = analyzer.metrics(clock_.nowMs());
    result.evaluation = signal_engine_.evaluateDetailed(symbol, state, confirmation);
    if (!result.evaluation.signal) {
        result.stage = CycleStage::NO_SIGNAL;
        result.detail = result.evaluation.reason;
        LOG_DEBUG("[{}] no signal: {} {}", symbol,
                  strategy::SignalEngine::outcomeToString(result.evaluation.outcome), result.evaluation.reason);
        return result;
    }
    const auto& signal = *result.evaluation.signal;

    nlohmann::json signal_payload;
    signal_payload["confidence"] = signal.confidence;
    signal_payload["rules"] = signal.triggering_rules;
    signal_payload["reference_price"] = signal.reference_price;
    signal_payload["atr"] = signal.atr;
    signal_payload["imbalance"] = confirmation.imbalance_ratio;
    signal_payload["relative_volume"] = confirmation.relative_volume;
    notify(NotificationType::SIGNAL_GENERATED, symbol,
           std::string(execution::directionToString(signal.direction)) + " signal",
           ErrorKind::NONE, signal_payload);

    submitEntry(result, signal, analyzer);
    return result;
}

CycleResult TradingCycleCoordinator::runForcedEntry(
    const std::string& symbol,
    Direction direction,
    const analytics::IndicatorState& state,
    const analytics::MarketAnalyzer& analyzer
) {
    CycleResult result;

    if (positions_.hasActivePosition(symbol)) {
        result.stage = CycleStage::POSITION_ACTIVE;
        result.detail = "position already active";
        return result;
    }

    // Sizing and the ladder still need a price and an ATR.
    const auto atr = state.value(analytics::indicator::ATR);
    if (!atr || *atr <= 0.0 || state.candleCount() == 0 || !(state.lastClose() > 0.0)) {
        result.stage = CycleStage::NO_SIGNAL;
        result.detail = "no price or atr yet";
        LOG_WARN("[{}] forced {} refused: {}", symbol, execution::directionToString(direction), result.detail);
        return result;
    }

    strategy::Signal signal;
    signal.symbol = symbol;
    signal.direction = direction;
    signal.confidence = 1.0;
    signal.triggering_rules = {"operator"};
    signal.timestamp = state.lastOpenTime();
    signal.reference_price = state.lastClose();
    signal.atr = *atr;
    result.evaluation.outcome = strategy::SignalOutcome::EMITTED;
    result.evaluation.signal = signal;
    result.evaluation.reason = "operator command";

    nlohmann::json payload;
    payload["forced"] = true;
    payload["reference_price"] = signal.reference_price;
    payload["atr"] = signal.atr;
    notify(NotificationType::SIGNAL_GENERATED, symbol,
           std::string("forced ") + execution::directionToString(direction) + " entry",
           ErrorKind::NONE, payload);

    submitEntry(result, signal, analyzer);
    return result;
}

void TradingCycleCoordinator::submitEntry(CycleResult& result, const strategy::Signal& signal,
                                          const analytics::MarketAnalyzer& analyzer) {
    const std::string& symbol = signal.symbol;

    auto margin = gateway_.queryMargin();
    if (!margin.ok()) {
        result.stage = CycleStage::MARGIN_UNAVAILABLE;
        result.detail = margin.error.message;
        notify(NotificationType::ORDER_ERROR, symbol, "margin query failed",
               network::isTransient(margin.error.kind) ? ErrorKind::TRANSIENT_GATEWAY : ErrorKind::VALIDATION,
               {{"action", "query margin"}, {"detail", margin.error.message}});
        return;
    }

    result.decision = risk_.authorize(signal, *margin.value);
    if (!result.decision.approved) {
        result.stage = CycleStage::RISK_DENIED;
        result.detail = result.decision.detail;
        return;
    }

    // Expected cost of taking the sized quantity from the book.
    const double max_slippage = signal_engine_.config().max_entry_slippage_pct;
    const double notional = result.decision.quantity * signal.reference_price;
    if (max_slippage > 0.0) {
        if (auto book = analyzer.bookMetrics(notional)) {
            const bool buy = signal.direction == Direction::LONG;
            const double vwap = buy ? book->vwap_buy : book->vwap_sell;
            if (vwap > 0.0) {
                const double slippage = buy ? (vwap - signal.reference_price) / signal.reference_price
                                            : (signal.reference_price - vwap) / signal.reference_price;
                if (slippage > max_slippage) {
                    risk_.releaseEntry(symbol);
                    result.stage = CycleStage::SLIPPAGE_REJECTED;
                    result.detail = "expected slippage " + std::to_string(slippage);
                    notify(NotificationType::RISK_DENIED, symbol, "entry rejected: book too thin",
                           ErrorKind::VALIDATION,
                           {{"reason", "SLIPPAGE"}, {"slippage", slippage}, {"max", max_slippage}});
                    return;
                }
            }
        }
    }

    if (!positions_.openPosition(signal, result.decision.quantity)) {
        if (!positions_.hasActivePosition(symbol)) {
            risk_.releaseEntry(symbol);
        }
        result.stage = CycleStage::ENTRY_FAILED;
        result.detail = "entry not submitted";
        return;
    }
    result.stage = CycleStage::ENTRY_SUBMITTED;
}

void TradingCycleCoordinator::notify(NotificationType type, const std::string& symbol,
                                     const std::string& message, ErrorKind error, nlohmann::json payload) {
    if (sink_ == nullptr) {
        return;
    }
    Notification notification;
    notification.type = type;
    notification.ts_ms = clock_.nowMs();
    notification.symbol = symbol;
    notification.message = message;
    notification.error = error;
    notification.payload = std::move(payload);
    sink_->notify(notification);
}

const char* TradingCycleCoordinator::stageToString(CycleStage stage) {
    switch (stage) {
        case CycleStage::POSITION_ACTIVE: return "POSITION_ACTIVE";
        case CycleStage::NO_SIGNAL: return "NO_SIGNAL";
        case CycleStage::MARGIN_UNAVAILABLE: return "MARGIN_UNAVAILABLE";
        case CycleStage::RISK_DENIED: return "RISK_DENIED";
        case CycleStage::SLIPPAGE_REJECTED: return "SLIPPAGE_REJECTED";
        case CycleStage::ENTRY_FAILED: return "ENTRY_FAILED";
        case CycleStage::ENTRY_SUBMITTED: return "ENTRY_SUBMITTED";
    }
    return "UNKNOWN";
}

} // namespace core
} // namespace perpscalp
