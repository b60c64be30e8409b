#pragma once

#include <string>

#include "analytics/IndicatorPipeline.h"
#include "analytics/MarketAnalyzer.h"
#include "core/contracts/INotificationSink.h"
#include "execution/PositionManager.h"
#include "network/IExchangeGateway.h"
#include "risk/RiskManager.h"
#include "strategy/SignalEngine.h"

namespace perpscalp {
namespace core {

enum class CycleStage {
    POSITION_ACTIVE,
    NO_SIGNAL,
    MARGIN_UNAVAILABLE,
    RISK_DENIED,
    SLIPPAGE_REJECTED,
    ENTRY_FAILED,
    ENTRY_SUBMITTED
};

struct CycleResult {
    CycleStage stage = CycleStage::NO_SIGNAL;
    strategy::SignalEvaluation evaluation;
    risk::RiskDecision decision;
    std::string detail;
};

// One entry decision for one symbol after a closed candle:
// signal -> margin -> risk gate -> slippage check -> lifecycle.
class TradingCycleCoordinator {
public:
    TradingCycleCoordinator(
        const strategy::SignalEngine& signal_engine,
        risk::RiskManager& risk,
        ::perpscalp::execution::PositionManager& positions,
        network::IExchangeGateway& gateway,
        const common::IClock& clock,
        INotificationSink* sink = nullptr
    );

    CycleResult runEntryCycle(
        const std::string& symbol,
        const analytics::IndicatorState& state,
        const analytics::MarketAnalyzer& analyzer
    );

    // Operator entry: skips the rules and filters but not the margin check,
    // the risk gate or the slippage check.
    CycleResult runForcedEntry(
        const std::string& symbol,
        Direction direction,
        const analytics::IndicatorState& state,
        const analytics::MarketAnalyzer& analyzer
    );

    static const char* stageToString(CycleStage stage);

private:
    void submitEntry(CycleResult& result, const strategy::Signal& signal,
                     const analytics::MarketAnalyzer& analyzer);

    void notify(NotificationType type, const std::string& symbol, const std::string& message,
                ErrorKind error, nlohmann::json payload);

    const strategy::SignalEngine& signal_engine_;
    risk::RiskManager& risk_;
    ::perpscalp::execution::PositionManager& positions_;
    network::IExchangeGateway& gateway_;
    const common::IClock& clock_;
    INotificationSink* sink_;
};

} // namespace core
} // namespace perpscalp
