#include "analytics/IndicatorPipeline.h"
#include "analytics/TechnicalIndicators.h"
#include "common/Logger.h"
#include <algorithm>
#include <cmath>

namespace perpscalp {
namespace analytics {

std::optional<double> IndicatorState::value(const std::string& name) const {
    auto it = series_.find(name);
    if (it == series_.end() || it->second.history.empty()) {
        return std::nullopt;
    }
    return it->second.history.back();
}

std::optional<double> IndicatorState::previous(const std::string& name, size_t steps_back) const {
    auto it = series_.find(name);
    if (it == series_.end()) {
        return std::nullopt;
    }
    const auto& history = it->second.history;
    if (history.size() <= steps_back) {
        return std::nullopt;
    }
    return history[history.size() - 1 - steps_back];
}

bool IndicatorState::ready(const std::string& name) const {
    auto it = series_.find(name);
    return it != series_.end() && it->second.ready();
}

bool IndicatorState::allReady() const {
    for (const char* name : {indicator::EMA_FAST, indicator::EMA_SLOW, indicator::SMA,
                             indicator::SMA_FAST, indicator::ATR, indicator::RSI,
                             indicator::VWAP, indicator::SUPPORT, indicator::RESISTANCE}) {
        if (!ready(name)) return false;
    }
    return true;
}

IndicatorPipeline::IndicatorPipeline(const IndicatorConfig& config)
    : config_(config)
    , window_(config.window_capacity)
    , ema_fast_(config.ema_fast_period)
    , ema_slow_(config.ema_slow_period)
    , sma_(config.sma_period)
    , sma_fast_(config.sma_fast_period)
    , atr_(config.atr_period)
    , rsi_(config.rsi_period)
    , vwap_(config.vwap_mode, config.vwap_rolling_period, config.vwap_reset_utc_offset_minutes)
{
    for (const char* name : {indicator::EMA_FAST, indicator::EMA_SLOW, indicator::SMA,
                             indicator::SMA_FAST, indicator::ATR, indicator::RSI,
                             indicator::VWAP, indicator::SUPPORT, indicator::RESISTANCE}) {
        state_.series_[name] = IndicatorSeries{};
    }
}

std::optional<std::string> IndicatorPipeline::validateCandle(const Candle& candle) {
    for (double v : {candle.open, candle.high, candle.low, candle.close, candle.volume}) {
        if (!std::isfinite(v)) {
            return std::string("non-finite field");
        }
    }
    if (candle.low <= 0.0) return std::string("non-positive price");
    if (candle.high < candle.low) return std::string("high below low");
    if (candle.open > candle.high || candle.open < candle.low ||
        candle.close > candle.high || candle.close < candle.low) {
        return std::string("open/close outside high-low range");
    }
    if (candle.volume < 0.0) return std::string("negative volume");
    return std::nullopt;
}

IndicatorUpdate IndicatorPipeline::onClosedCandle(const Candle& candle) {
    IndicatorUpdate update;

    if (auto problem = validateCandle(candle)) {
        update.error = ErrorKind::DATA;
        update.reason = *problem;
        update.state = state_;
        LOG_WARN("Candle rejected ({}): t={} o={} h={} l={} c={} v={}",
                 *problem, candle.open_time, candle.open, candle.high,
                 candle.low, candle.close, candle.volume);
        return update;
    }

    if (candle.open_time <= state_.last_open_time_) {
        update.error = ErrorKind::DATA;
        update.reason = "out-of-order candle";
        update.state = state_;
        LOG_WARN("Out-of-order candle ignored: t={} <= last {}",
                 candle.open_time, state_.last_open_time_);
        return update;
    }

    window_.push(candle);

    record(indicator::EMA_FAST, ema_fast_.update(candle.close));
    record(indicator::EMA_SLOW, ema_slow_.update(candle.close));
    record(indicator::SMA, sma_.update(candle.close));
    record(indicator::SMA_FAST, sma_fast_.update(candle.close));
    record(indicator::ATR, atr_.update(candle));
    record(indicator::RSI, rsi_.update(candle.close));

    const long long previous_session = vwap_.sessionStartMs();
    const auto vwap = vwap_.update(candle);
    if (previous_session >= 0 && vwap_.sessionStartMs() != previous_session) {
        // A new session must not show or cross against the old session's VWAP.
        state_.series_[indicator::VWAP].history.clear();
    }
    record(indicator::VWAP, vwap);
    recordLevels();

    state_.last_open_time_ = candle.open_time;
    state_.last_close_ = candle.close;
    state_.candle_count_++;

    update.accepted = true;
    update.state = state_;
    return update;
}

void IndicatorPipeline::record(const std::string& name, const std::optional<double>& value) {
    if (!value) {
        return;
    }
    auto& history = state_.series_[name].history;
    history.push_back(*value);
    while (history.size() > config_.history_depth) {
        history.pop_front();
    }
}

void IndicatorPipeline::recordLevels() {
    const size_t count = std::min(window_.size(), static_cast<size_t>(std::max(0, config_.level_lookback)));
    std::vector<double> closes;
    closes.reserve(count);
    for (size_t i = window_.size() - count; i < window_.size(); ++i) {
        closes.push_back(window_.at(i).close);
    }

    const auto levels = TechnicalIndicators::calculateSupportResistance(closes, config_.level_trim_pct);
    if (!levels) {
        return;
    }
    record(indicator::SUPPORT, levels->support);
    record(indicator::RESISTANCE, levels->resistance);
}

} // namespace analytics
} // namespace perpscalp
