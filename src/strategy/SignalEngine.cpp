#include "strategy/SignalEngine.h"
#include "strategy/SignalRules.h"
#include "common/Logger.h"
#include <algorithm>
#include <cmath>

namespace perpscalp {
namespace strategy {

SignalEngine::SignalEngine(const SignalConfig& config)
    : config_(config)
    , trend_filter_(config.trend_filter)
    , level_filter_(config.level_filter)
{
    if (config_.trend.enabled) {
        rules_.push_back(std::make_unique<TrendMomentumRule>(config_.trend));
    }
    if (config_.vwap.enabled) {
        rules_.push_back(std::make_unique<VwapAlignmentRule>(config_.vwap));
    }
    if (config_.mean_reversion.enabled) {
        rules_.push_back(std::make_unique<MeanReversionRule>(config_.mean_reversion));
    }
}

SignalEngine::SignalEngine(const SignalConfig& config, std::vector<std::unique_ptr<ISignalRule>> rules)
    : config_(config)
    , rules_(std::move(rules))
    , trend_filter_(config.trend_filter)
    , level_filter_(config.level_filter) {}

std::optional<Signal> SignalEngine::evaluate(
    const std::string& symbol,
    const analytics::IndicatorState& state,
    const analytics::ConfirmationMetrics& confirmation
) const {
    return evaluateDetailed(symbol, state, confirmation).signal;
}

AggregateResult SignalEngine::aggregate(const std::vector<RuleVote>& votes, double min_confidence) {
    AggregateResult result;
    for (const auto& vote : votes) {
        if (!vote.direction || vote.weight <= 0.0) {
            continue;
        }
        if (*vote.direction == Direction::LONG) {
            result.long_weight += vote.weight;
            result.long_rules.push_back(vote.rule_name);
        } else {
            result.short_weight += vote.weight;
            result.short_rules.push_back(vote.rule_name);
        }
    }

    const bool long_candidate = result.long_weight >= min_confidence;
    const bool short_candidate = result.short_weight >= min_confidence;

    if (long_candidate && short_candidate) {
        result.conflict = true;
    } else if (long_candidate) {
        result.direction = Direction::LONG;
    } else if (short_candidate) {
        result.direction = Direction::SHORT;
    }
    return result;
}

SignalOutcome SignalEngine::applyConfirmationGate(
    Direction direction,
    const analytics::ConfirmationMetrics& confirmation,
    std::string& reason
) const {
    if (confirmation.stale) {
        reason = "confirmation stale: " + confirmation.stale_reason;
        return SignalOutcome::VETO_STALE;
    }

    const double imbalance = confirmation.imbalance_ratio;
    const bool agrees = direction == Direction::LONG
        ? imbalance > 0.0 && imbalance >= config_.gate.min_abs_imbalance
        : imbalance < 0.0 && -imbalance >= config_.gate.min_abs_imbalance;
    if (!agrees) {
        reason = "order book imbalance " + std::to_string(imbalance) + " contradicts direction";
        return SignalOutcome::VETO_IMBALANCE;
    }

    if (confirmation.relative_volume < config_.gate.min_relative_volume) {
        reason = "relative volume " + std::to_string(confirmation.relative_volume) +
                 " below " + std::to_string(config_.gate.min_relative_volume);
        return SignalOutcome::VETO_VOLUME;
    }

    return SignalOutcome::EMITTED;
}

SignalEvaluation SignalEngine::evaluateDetailed(
    const std::string& symbol,
    const analytics::IndicatorState& state,
    const analytics::ConfirmationMetrics& confirmation
) const {
    SignalEvaluation evaluation;

    const auto atr = state.value(analytics::indicator::ATR);
    if (!atr || state.candleCount() == 0) {
        evaluation.outcome = SignalOutcome::WARMING_UP;
        evaluation.reason = "atr warming up";
        return evaluation;
    }
    if (!std::isfinite(*atr) || *atr <= 0.0 || !std::isfinite(state.lastClose())) {
        evaluation.outcome = SignalOutcome::DATA_ERROR;
        evaluation.reason = "invalid atr or price";
        LOG_WARN("[{}] DataError: {}", symbol, evaluation.reason);
        return evaluation;
    }

    std::vector<RuleVote> votes;
    votes.reserve(rules_.size());
    for (const auto& rule : rules_) {
        try {
            votes.push_back(rule->evaluate(state));
        } catch (const std::exception& e) {
            evaluation.outcome = SignalOutcome::DATA_ERROR;
            evaluation.reason = rule->getName() + " failed: " + e.what();
            LOG_WARN("[{}] DataError: {}", symbol, evaluation.reason);
            return evaluation;
        }
    }

    evaluation.aggregate = aggregate(votes, config_.min_confidence);
    if (evaluation.aggregate.conflict) {
        evaluation.outcome = SignalOutcome::CONFLICT;
        evaluation.reason = "long and short candidates in the same cycle";
        return evaluation;
    }
    if (!evaluation.aggregate.direction) {
        evaluation.outcome = SignalOutcome::NO_CANDIDATE;
        return evaluation;
    }

    const Direction direction = *evaluation.aggregate.direction;

    bool trend_following = false;
    for (size_t i = 0; i < votes.size(); ++i) {
        if (votes[i].direction == direction && votes[i].weight > 0.0 && rules_[i]->followsTrend()) {
            trend_following = true;
        }
    }
    if (trend_following) {
        if (auto veto = trend_filter_.check(direction, state)) {
            evaluation.outcome = SignalOutcome::VETO_TREND;
            evaluation.reason = *veto;
            return evaluation;
        }
    }
    if (auto veto = level_filter_.check(direction, state)) {
        evaluation.outcome = SignalOutcome::VETO_LEVEL;
        evaluation.reason = *veto;
        return evaluation;
    }

    evaluation.outcome = applyConfirmationGate(direction, confirmation, evaluation.reason);
    if (evaluation.outcome != SignalOutcome::EMITTED) {
        return evaluation;
    }

    Signal signal;
    signal.symbol = symbol;
    signal.direction = direction;
    const double weight = direction == Direction::LONG
        ? evaluation.aggregate.long_weight
        : evaluation.aggregate.short_weight;
    signal.confidence = std::clamp(weight, 0.0, 1.0);
    signal.triggering_rules = direction == Direction::LONG
        ? evaluation.aggregate.long_rules
        : evaluation.aggregate.short_rules;
    signal.timestamp = state.lastOpenTime();
    signal.reference_price = state.lastClose();
    signal.atr = *atr;

    evaluation.signal = signal;
    return evaluation;
}

const char* SignalEngine::outcomeToString(SignalOutcome outcome) {
    switch (outcome) {
        case SignalOutcome::EMITTED: return "EMITTED";
        case SignalOutcome::WARMING_UP: return "WARMING_UP";
        case SignalOutcome::NO_CANDIDATE: return "NO_CANDIDATE";
        case SignalOutcome::CONFLICT: return "CONFLICT";
        case SignalOutcome::VETO_TREND: return "VETO_TREND";
        case SignalOutcome::VETO_LEVEL: return "VETO_LEVEL";
        case SignalOutcome::VETO_STALE: return "VETO_STALE";
        case SignalOutcome::VETO_IMBALANCE: return "VETO_IMBALANCE";
        case SignalOutcome::VETO_VOLUME: return "VETO_VOLUME";
        case SignalOutcome::DATA_ERROR: return "DATA_ERROR";
    }
    return "UNKNOWN";
}

} // namespace strategy
} // namespace perpscalp
