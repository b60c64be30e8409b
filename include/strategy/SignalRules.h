#pragma once

#include "strategy/ISignalRule.h"
#include "strategy/StrategyConfig.h"

namespace perpscalp {
namespace strategy {

class TrendMomentumRule : public ISignalRule {
public:
    explicit TrendMomentumRule(const TrendMomentumRuleConfig& config) : config_(config) {}

    std::string getName() const override { return "trend_momentum"; }
    RuleVote evaluate(const analytics::IndicatorState& state) const override;

private:
    TrendMomentumRuleConfig config_;
};

class VwapAlignmentRule : public ISignalRule {
public:
    explicit VwapAlignmentRule(const VwapAlignmentRuleConfig& config) : config_(config) {}

    std::string getName() const override { return "vwap_alignment"; }
    RuleVote evaluate(const analytics::IndicatorState& state) const override;

private:
    VwapAlignmentRuleConfig config_;
};

class MeanReversionRule : public ISignalRule {
public:
    explicit MeanReversionRule(const MeanReversionRuleConfig& config) : config_(config) {}

    std::string getName() const override { return "mean_reversion"; }
    RuleVote evaluate(const analytics::IndicatorState& state) const override;
    bool followsTrend() const override { return false; }

private:
    MeanReversionRuleConfig config_;
};

// Checks on a candidate direction after the votes are summed. A returned
// reason vetoes the entry; missing indicators veto as well.
class TrendFilter {
public:
    explicit TrendFilter(const TrendFilterConfig& config) : config_(config) {}
    std::optional<std::string> check(Direction direction, const analytics::IndicatorState& state) const;

private:
    TrendFilterConfig config_;
};

class LevelFilter {
public:
    explicit LevelFilter(const LevelFilterConfig& config) : config_(config) {}
    std::optional<std::string> check(Direction direction, const analytics::IndicatorState& state) const;

private:
    LevelFilterConfig config_;
};

// (close - VWAP) / ATR, empty when either input is missing or ATR <= 0
std::optional<double> vwapDeviationInAtr(const analytics::IndicatorState& state);

} // namespace strategy
} // namespace perpscalp
