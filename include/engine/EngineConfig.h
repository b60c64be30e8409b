#pragma once

#include <string>
#include <vector>

namespace perpscalp {
namespace engine {

enum class TradingMode {
    PAPER,      // paper venue, wall clock, candles paced in real time
    REPLAY      // paper venue, clock driven by candle time, as fast as possible
};

struct EngineConfig {
    TradingMode mode;
    std::vector<std::string> symbols;
    std::string quote_currency;
    long long candle_interval_ms;

    // Worker queue wait; bounds how late timeouts and staleness are noticed.
    int queue_poll_ms;

    std::string state_path;
    std::string journal_path;
    std::string log_dir;
    std::string log_level;

    // Paper venue
    double paper_initial_margin;
    int paper_order_rate;            // venue request budgets per second
    int paper_cancel_rate;
    int paper_query_rate;
    std::string replay_dir;          // <replay_dir>/<SYMBOL>.csv
    int replay_delay_ms;             // PAPER mode pacing between candles

    EngineConfig()
        : mode(TradingMode::PAPER)
        , symbols({"BTCUSDT", "ETHUSDT"})
        , quote_currency("USDT")
        , candle_interval_ms(60000)
        , queue_poll_ms(500)
        , state_path("state/engine_state.json")
        , journal_path("logs/events.jsonl")
        , log_dir("logs")
        , log_level("info")
        , paper_initial_margin(10000.0)
        , paper_order_rate(10)
        , paper_cancel_rate(10)
        , paper_query_rate(50)
        , replay_dir("data")
        , replay_delay_ms(0)
    {}
};

inline const char* tradingModeToString(TradingMode mode) {
    return mode == TradingMode::REPLAY ? "REPLAY" : "PAPER";
}

} // namespace engine
} // namespace perpscalp
