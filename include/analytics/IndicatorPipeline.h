#pragma once

#include <deque>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "analytics/StreamingIndicators.h"
#include "common/Errors.h"
#include "common/RingBuffer.h"
#include "common/Types.h"

namespace perpscalp {
namespace analytics {

namespace indicator {
constexpr const char* EMA_FAST = "ema_fast";
constexpr const char* EMA_SLOW = "ema_slow";
constexpr const char* SMA = "sma";
constexpr const char* SMA_FAST = "sma_fast";
constexpr const char* ATR = "atr";
constexpr const char* RSI = "rsi";
constexpr const char* VWAP = "vwap";
constexpr const char* SUPPORT = "support";
constexpr const char* RESISTANCE = "resistance";
}

struct IndicatorConfig {
    int ema_fast_period = 9;
    int ema_slow_period = 21;
    int sma_period = 50;
    int sma_fast_period = 20;
    int atr_period = 14;
    int rsi_period = 14;
    VwapMode vwap_mode = VwapMode::SESSION;
    int vwap_rolling_period = 20;
    int vwap_reset_utc_offset_minutes = 0;
    int level_lookback = 50;        // closes scanned for support / resistance
    double level_trim_pct = 5.0;    // outliers dropped on each side
    size_t window_capacity = 200;   // closed candles kept for inspection
    size_t history_depth = 3;       // values kept per indicator for crossovers
};

// Latest values of one indicator, newest at the back.
struct IndicatorSeries {
    std::deque<double> history;

    bool ready() const { return !history.empty(); }
};

// Per-symbol indicator snapshot, updated exactly once per accepted candle.
class IndicatorState {
public:
    std::optional<double> value(const std::string& name) const;

    // steps_back = 1 is the value before the current one
    std::optional<double> previous(const std::string& name, size_t steps_back = 1) const;

    bool ready(const std::string& name) const;
    bool allReady() const;

    const std::map<std::string, IndicatorSeries>& series() const { return series_; }

    long long lastOpenTime() const { return last_open_time_; }
    double lastClose() const { return last_close_; }
    size_t candleCount() const { return candle_count_; }

    // Direct construction for rule evaluation outside the pipeline.
    // History is oldest first.
    void setSeries(const std::string& name, std::deque<double> history) {
        series_[name].history = std::move(history);
    }
    void setLastCandle(long long open_time, double close, size_t count) {
        last_open_time_ = open_time;
        last_close_ = close;
        candle_count_ = count;
    }

private:
    friend class IndicatorPipeline;

    std::map<std::string, IndicatorSeries> series_;
    long long last_open_time_ = -1;
    double last_close_ = 0.0;
    size_t candle_count_ = 0;
};

struct IndicatorUpdate {
    bool accepted = false;
    ErrorKind error = ErrorKind::NONE;
    std::string reason;
    IndicatorState state;
};

class IndicatorPipeline {
public:
    explicit IndicatorPipeline(const IndicatorConfig& config = IndicatorConfig());

    // Malformed or out-of-order candles are rejected with a DataError and
    // leave the state untouched.
    IndicatorUpdate onClosedCandle(const Candle& candle);

    const IndicatorState& state() const { return state_; }
    std::vector<Candle> recentCandles() const { return window_.toVector(); }
    const IndicatorConfig& config() const { return config_; }

    static std::optional<std::string> validateCandle(const Candle& candle);

private:
    void record(const std::string& name, const std::optional<double>& value);
    void recordLevels();

    IndicatorConfig config_;
    common::RingBuffer<Candle> window_;
    EmaCalculator ema_fast_;
    EmaCalculator ema_slow_;
    SmaCalculator sma_;
    SmaCalculator sma_fast_;
    AtrCalculator atr_;
    RsiCalculator rsi_;
    VwapCalculator vwap_;
    IndicatorState state_;
};

} // namespace analytics
} // namespace perpscalp
