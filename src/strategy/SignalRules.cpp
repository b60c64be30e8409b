#include "strategy/SignalRules.h"
#include <cmath>
#include <sstream>

namespace perpscalp {
namespace strategy {

namespace ind = analytics::indicator;

std::optional<double> vwapDeviationInAtr(const analytics::IndicatorState& state) {
    const auto vwap = state.value(ind::VWAP);
    const auto atr = state.value(ind::ATR);
    if (!vwap || !atr || *atr <= 0.0 || state.candleCount() == 0) {
        return std::nullopt;
    }
    const double deviation = (state.lastClose() - *vwap) / *atr;
    if (!std::isfinite(deviation)) {
        return std::nullopt;
    }
    return deviation;
}

RuleVote TrendMomentumRule::evaluate(const analytics::IndicatorState& state) const {
    RuleVote vote;
    vote.rule_name = getName();

    const auto fast = state.value(ind::EMA_FAST);
    const auto slow = state.value(ind::EMA_SLOW);
    const auto prev_fast = state.previous(ind::EMA_FAST);
    const auto prev_slow = state.previous(ind::EMA_SLOW);
    const auto rsi = state.value(ind::RSI);
    if (!fast || !slow || !prev_fast || !prev_slow || !rsi) {
        vote.detail = "warming up";
        return vote;
    }

    const double spread = *fast - *slow;
    const double prev_spread = *prev_fast - *prev_slow;

    std::optional<Direction> trend;
    if (spread > 0.0 && (prev_spread <= 0.0 || spread > prev_spread)) {
        trend = Direction::LONG;
    } else if (spread < 0.0 && (prev_spread >= 0.0 || spread < prev_spread)) {
        trend = Direction::SHORT;
    }

    if (!trend) {
        vote.detail = "no crossover momentum";
        return vote;
    }

    if (*trend == Direction::LONG && *rsi >= config_.rsi_overbought) {
        vote.detail = "rsi overbought";
        return vote;
    }
    if (*trend == Direction::SHORT && *rsi <= config_.rsi_oversold) {
        vote.detail = "rsi oversold";
        return vote;
    }

    std::ostringstream oss;
    oss << "ema spread " << prev_spread << " -> " << spread << ", rsi " << *rsi;
    vote.direction = trend;
    vote.weight = config_.weight;
    vote.detail = oss.str();
    return vote;
}

RuleVote VwapAlignmentRule::evaluate(const analytics::IndicatorState& state) const {
    RuleVote vote;
    vote.rule_name = getName();

    const auto deviation = vwapDeviationInAtr(state);
    if (!deviation) {
        vote.detail = "warming up";
        return vote;
    }

    const double magnitude = std::abs(*deviation);
    if (magnitude < config_.min_deviation_atr || magnitude > config_.max_deviation_atr) {
        vote.detail = "deviation outside alignment band";
        return vote;
    }

    vote.direction = *deviation > 0.0 ? Direction::LONG : Direction::SHORT;
    vote.weight = config_.weight;
    vote.detail = "vwap deviation " + std::to_string(*deviation) + " atr";
    return vote;
}

RuleVote MeanReversionRule::evaluate(const analytics::IndicatorState& state) const {
    RuleVote vote;
    vote.rule_name = getName();

    const auto deviation = vwapDeviationInAtr(state);
    if (!deviation) {
        vote.detail = "warming up";
        return vote;
    }

    if (std::abs(*deviation) <= config_.band_atr) {
        vote.detail = "inside reversion band";
        return vote;
    }

    // stretched above VWAP -> fade short, and vice versa
    vote.direction = *deviation > 0.0 ? Direction::SHORT : Direction::LONG;
    vote.weight = config_.weight;
    vote.detail = "vwap deviation " + std::to_string(*deviation) + " atr beyond band";
    return vote;
}

std::optional<std::string> TrendFilter::check(Direction direction,
                                              const analytics::IndicatorState& state) const {
    if (!config_.enabled) {
        return std::nullopt;
    }
    const auto fast = state.value(ind::SMA_FAST);
    const auto slow = state.value(ind::SMA);
    if (!fast || !slow || state.candleCount() == 0) {
        return std::string("trend filter warming up");
    }

    const double close = state.lastClose();
    const bool aligned = direction == Direction::LONG
        ? close > *fast && *fast > *slow
        : close < *fast && *fast < *slow;
    if (aligned) {
        return std::nullopt;
    }

    std::ostringstream oss;
    oss << "against trend: close " << close << ", sma fast " << *fast << ", sma slow " << *slow;
    return oss.str();
}

std::optional<std::string> LevelFilter::check(Direction direction,
                                              const analytics::IndicatorState& state) const {
    if (!config_.enabled) {
        return std::nullopt;
    }
    const auto atr = state.value(ind::ATR);
    const auto support = state.value(ind::SUPPORT);
    const auto resistance = state.value(ind::RESISTANCE);
    if (!atr || !support || !resistance || state.candleCount() == 0) {
        return std::string("price levels warming up");
    }

    const double close = state.lastClose();
    const double buffer = *atr * config_.buffer_atr;
    if (direction == Direction::LONG && close >= *resistance - buffer) {
        return "close " + std::to_string(close) + " within reach of resistance " + std::to_string(*resistance);
    }
    if (direction == Direction::SHORT && close <= *support + buffer) {
        return "close " + std::to_string(close) + " within reach of support " + std::to_string(*support);
    }
    return std::nullopt;
}

} // namespace strategy
} // namespace perpscalp
