#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "analytics/MarketAnalyzer.h"
#include "strategy/ISignalRule.h"
#include "strategy/SignalRules.h"
#include "strategy/StrategyConfig.h"

namespace perpscalp {
namespace strategy {

enum class SignalOutcome {
    EMITTED,
    WARMING_UP,
    NO_CANDIDATE,
    CONFLICT,
    VETO_TREND,
    VETO_LEVEL,
    VETO_STALE,
    VETO_IMBALANCE,
    VETO_VOLUME,
    DATA_ERROR
};

struct AggregateResult {
    std::optional<Direction> direction;
    double long_weight = 0.0;
    double short_weight = 0.0;
    bool conflict = false;
    std::vector<std::string> long_rules;
    std::vector<std::string> short_rules;
};

struct SignalEvaluation {
    SignalOutcome outcome = SignalOutcome::NO_CANDIDATE;
    std::optional<Signal> signal;
    AggregateResult aggregate;
    std::string reason;
};

// Rule votes -> candidate direction -> trend and level filters ->
// confirmation veto -> Signal.
// Deterministic: the timestamp comes from the indicator state, never from
// the wall clock.
class SignalEngine {
public:
    explicit SignalEngine(const SignalConfig& config);
    SignalEngine(const SignalConfig& config, std::vector<std::unique_ptr<ISignalRule>> rules);

    std::optional<Signal> evaluate(
        const std::string& symbol,
        const analytics::IndicatorState& state,
        const analytics::ConfirmationMetrics& confirmation
    ) const;

    SignalEvaluation evaluateDetailed(
        const std::string& symbol,
        const analytics::IndicatorState& state,
        const analytics::ConfirmationMetrics& confirmation
    ) const;

    // Pure: a direction is a candidate when its summed weight reaches
    // min_confidence. Two candidates is a conflict and yields no direction.
    static AggregateResult aggregate(const std::vector<RuleVote>& votes, double min_confidence);

    static const char* outcomeToString(SignalOutcome outcome);

    const SignalConfig& config() const { return config_; }

private:
    SignalOutcome applyConfirmationGate(
        Direction direction,
        const analytics::ConfirmationMetrics& confirmation,
        std::string& reason
    ) const;

    SignalConfig config_;
    std::vector<std::unique_ptr<ISignalRule>> rules_;
    TrendFilter trend_filter_;
    LevelFilter level_filter_;
};

} // namespace strategy
} // namespace perpscalp
