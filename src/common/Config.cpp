#include "common/Config.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace perpscalp {

namespace {
std::string trimCopy(std::string s) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
    return s;
}

std::string upperCopy(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return trimCopy(s);
}

std::string readEnvVar(const char* name) {
#ifdef _WIN32
    char* value = nullptr;
    size_t len = 0;
    if (_dupenv_s(&value, &len, name) != 0 || value == nullptr || len == 0) {
        if (value != nullptr) {
            free(value);
        }
        return "";
    }
    std::string out = trimCopy(value);
    free(value);
    return out;
#else
    const char* value = std::getenv(name);
    return value ? trimCopy(value) : "";
#endif
}

bool endsWith(const std::string& value, const std::string& suffix) {
    return value.size() > suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

common::InstrumentSpec readInstrument(const nlohmann::json& j, const common::InstrumentSpec& base) {
    common::InstrumentSpec spec = base;
    spec.tick_size = j.value("tick_size", base.tick_size);
    spec.lot_step = j.value("lot_step", base.lot_step);
    spec.min_qty = j.value("min_qty", base.min_qty);
    spec.min_stop_distance_pct = j.value("min_stop_distance_pct", base.min_stop_distance_pct);
    return spec;
}
}

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

void Config::resetToDefaults() {
    api_key_.clear();
    api_secret_.clear();
    engine_config_ = engine::EngineConfig();
    indicator_config_ = analytics::IndicatorConfig();
    analyzer_config_ = analytics::AnalyzerConfig();
    signal_config_ = strategy::SignalConfig();
    risk_limits_ = risk::RiskLimits();
    position_config_ = execution::PositionConfig();
    default_instrument_ = common::InstrumentSpec();
    instruments_.clear();
}

bool Config::load(const std::string& path) {
    const std::filesystem::path config_path(path);
    std::cout << "Config path: " << config_path << std::endl;

    if (!std::filesystem::exists(config_path)) {
        std::cout << "Warning: config file not found, using defaults: " << config_path << std::endl;
        resetToDefaults();
        loadFromJson(nlohmann::json::object());
        return false;
    }

    std::ifstream file(config_path);
    if (!file.is_open()) {
        throw std::runtime_error("cannot open config file: " + config_path.string());
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("malformed config file " + config_path.string() + ": " + e.what());
    }

    loadFromJson(j);
    std::cout << "Config loaded: " << engine_config_.symbols.size() << " symbols, mode="
              << engine::tradingModeToString(engine_config_.mode) << std::endl;
    return true;
}

void Config::loadFromJson(const nlohmann::json& j) {
    resetToDefaults();

    if (j.contains("api")) {
        const std::string file_key = trimCopy(j["api"].value("key", ""));
        const std::string file_secret = trimCopy(j["api"].value("secret", ""));
        if (!file_key.empty() || !file_secret.empty()) {
            std::cout << "Warning: api keys in the config file are ignored. "
                         "Use PERPSCALP_API_KEY / PERPSCALP_API_SECRET." << std::endl;
        }
    }
    api_key_ = readEnvVar("PERPSCALP_API_KEY");
    api_secret_ = readEnvVar("PERPSCALP_API_SECRET");

    if (j.contains("trading")) {
        const auto& t = j["trading"];
        const std::string mode = upperCopy(t.value("mode", std::string("PAPER")));
        engine_config_.mode = (mode == "REPLAY") ? engine::TradingMode::REPLAY : engine::TradingMode::PAPER;
        engine_config_.quote_currency = upperCopy(t.value("quote_currency", engine_config_.quote_currency));
        engine_config_.candle_interval_ms = t.value("candle_interval_ms", engine_config_.candle_interval_ms);
        if (t.contains("symbols")) {
            engine_config_.symbols.clear();
            for (const auto& s : t["symbols"]) {
                engine_config_.symbols.push_back(upperCopy(s.get<std::string>()));
            }
        }
        risk_limits_.leverage = t.value("leverage", risk_limits_.leverage);
        risk_limits_.min_leverage = t.value("min_leverage", risk_limits_.min_leverage);
        risk_limits_.max_leverage = t.value("max_leverage", risk_limits_.max_leverage);
    }

    if (j.contains("indicators")) {
        const auto& s = j["indicators"];
        indicator_config_.ema_fast_period = s.value("ema_fast_period", indicator_config_.ema_fast_period);
        indicator_config_.ema_slow_period = s.value("ema_slow_period", indicator_config_.ema_slow_period);
        indicator_config_.sma_period = s.value("sma_period", indicator_config_.sma_period);
        indicator_config_.sma_fast_period = s.value("sma_fast_period", indicator_config_.sma_fast_period);
        indicator_config_.level_lookback = s.value("level_lookback", indicator_config_.level_lookback);
        indicator_config_.level_trim_pct = s.value("level_trim_pct", indicator_config_.level_trim_pct);
        indicator_config_.atr_period = s.value("atr_period", indicator_config_.atr_period);
        indicator_config_.rsi_period = s.value("rsi_period", indicator_config_.rsi_period);
        indicator_config_.vwap_mode = upperCopy(s.value("vwap_mode", std::string("SESSION"))) == "ROLLING"
            ? analytics::VwapMode::ROLLING : analytics::VwapMode::SESSION;
        indicator_config_.vwap_rolling_period = s.value("vwap_rolling_period", indicator_config_.vwap_rolling_period);
        indicator_config_.window_capacity = s.value("window_capacity", indicator_config_.window_capacity);
        indicator_config_.history_depth = s.value("history_depth", indicator_config_.history_depth);
    }

    if (j.contains("analyzer")) {
        const auto& s = j["analyzer"];
        analyzer_config_.depth_levels = s.value("depth_levels", analyzer_config_.depth_levels);
        analyzer_config_.volume_source = upperCopy(s.value("volume_source", std::string("CANDLES"))) == "TRADES"
            ? analytics::VolumeSource::TRADES : analytics::VolumeSource::CANDLES;
        analyzer_config_.trailing_windows = s.value("trailing_windows", analyzer_config_.trailing_windows);
        analyzer_config_.unusual_volume_multiplier =
            s.value("unusual_volume_multiplier", analyzer_config_.unusual_volume_multiplier);
        analyzer_config_.max_book_age_ms = s.value("max_book_age_ms", analyzer_config_.max_book_age_ms);
        analyzer_config_.max_volume_age_ms = s.value("max_volume_age_ms", analyzer_config_.max_volume_age_ms);
    }
    // One volume bucket per candle unless set explicitly.
    analyzer_config_.volume_window_ms = engine_config_.candle_interval_ms;
    if (j.contains("analyzer")) {
        analyzer_config_.volume_window_ms = j["analyzer"].value("volume_window_ms", analyzer_config_.volume_window_ms);
    }

    if (j.contains("signal")) {
        const auto& s = j["signal"];
        signal_config_.min_confidence = s.value("min_confidence", signal_config_.min_confidence);
        signal_config_.max_entry_slippage_pct = s.value("max_entry_slippage_pct", signal_config_.max_entry_slippage_pct);
        if (s.contains("trend_momentum")) {
            const auto& r = s["trend_momentum"];
            signal_config_.trend.enabled = r.value("enabled", signal_config_.trend.enabled);
            signal_config_.trend.weight = r.value("weight", signal_config_.trend.weight);
            signal_config_.trend.rsi_overbought = r.value("rsi_overbought", signal_config_.trend.rsi_overbought);
            signal_config_.trend.rsi_oversold = r.value("rsi_oversold", signal_config_.trend.rsi_oversold);
        }
        if (s.contains("vwap_alignment")) {
            const auto& r = s["vwap_alignment"];
            signal_config_.vwap.enabled = r.value("enabled", signal_config_.vwap.enabled);
            signal_config_.vwap.weight = r.value("weight", signal_config_.vwap.weight);
            signal_config_.vwap.min_deviation_atr = r.value("min_deviation_atr", signal_config_.vwap.min_deviation_atr);
            signal_config_.vwap.max_deviation_atr = r.value("max_deviation_atr", signal_config_.vwap.max_deviation_atr);
        }
        if (s.contains("mean_reversion")) {
            const auto& r = s["mean_reversion"];
            signal_config_.mean_reversion.enabled = r.value("enabled", signal_config_.mean_reversion.enabled);
            signal_config_.mean_reversion.weight = r.value("weight", signal_config_.mean_reversion.weight);
            signal_config_.mean_reversion.band_atr = r.value("band_atr", signal_config_.mean_reversion.band_atr);
        }
        if (s.contains("trend_filter")) {
            signal_config_.trend_filter.enabled =
                s["trend_filter"].value("enabled", signal_config_.trend_filter.enabled);
        }
        if (s.contains("level_filter")) {
            const auto& r = s["level_filter"];
            signal_config_.level_filter.enabled = r.value("enabled", signal_config_.level_filter.enabled);
            signal_config_.level_filter.buffer_atr = r.value("buffer_atr", signal_config_.level_filter.buffer_atr);
        }
        if (s.contains("confirmation")) {
            const auto& r = s["confirmation"];
            signal_config_.gate.min_relative_volume = r.value("min_relative_volume", signal_config_.gate.min_relative_volume);
            signal_config_.gate.min_abs_imbalance = r.value("min_abs_imbalance", signal_config_.gate.min_abs_imbalance);
        }
    }

    if (j.contains("risk")) {
        const auto& s = j["risk"];
        risk_limits_.max_trades_per_day = s.value("max_trades_per_day", risk_limits_.max_trades_per_day);
        risk_limits_.max_daily_loss = s.value("max_daily_loss", risk_limits_.max_daily_loss);
        risk_limits_.risk_per_trade = s.value("risk_per_trade", risk_limits_.risk_per_trade);
        risk_limits_.stop_atr_multiplier = s.value("stop_atr_multiplier", risk_limits_.stop_atr_multiplier);
        risk_limits_.max_position_size = s.value("max_position_size", risk_limits_.max_position_size);
        risk_limits_.max_consecutive_losses = s.value("max_consecutive_losses", risk_limits_.max_consecutive_losses);
        risk_limits_.min_entry_interval_sec = s.value("min_entry_interval_sec", risk_limits_.min_entry_interval_sec);
        risk_limits_.reset_utc_offset_minutes = s.value("reset_utc_offset_minutes", risk_limits_.reset_utc_offset_minutes);
        risk_limits_.persist_halt_across_restart =
            s.value("persist_halt_across_restart", risk_limits_.persist_halt_across_restart);
    }
    // Session VWAP resets on the same day boundary as the risk counters.
    indicator_config_.vwap_reset_utc_offset_minutes = risk_limits_.reset_utc_offset_minutes;

    if (j.contains("position")) {
        const auto& s = j["position"];
        if (s.contains("take_profit_ladder")) {
            position_config_.take_profit_ladder.clear();
            for (const auto& level : s["take_profit_ladder"]) {
                position_config_.take_profit_ladder.push_back(
                    {level.value("atr_multiple", 1.0), level.value("fraction", 0.0)});
            }
        }
        position_config_.move_stop_on_take_profit =
            s.value("move_stop_on_take_profit", position_config_.move_stop_on_take_profit);
        position_config_.breakeven_trigger_atr = s.value("breakeven_trigger_atr", position_config_.breakeven_trigger_atr);
        position_config_.trailing_enabled = s.value("trailing_enabled", position_config_.trailing_enabled);
        position_config_.trail_activation_atr = s.value("trail_activation_atr", position_config_.trail_activation_atr);
        position_config_.trail_distance_atr = s.value("trail_distance_atr", position_config_.trail_distance_atr);
        position_config_.min_trail_step_pct = s.value("min_trail_step_pct", position_config_.min_trail_step_pct);
        position_config_.entry_timeout_sec = s.value("entry_timeout_sec", position_config_.entry_timeout_sec);
        if (s.contains("retry")) {
            const auto& r = s["retry"];
            position_config_.retry.max_attempts = r.value("max_attempts", position_config_.retry.max_attempts);
            position_config_.retry.initial_backoff_ms = r.value("initial_backoff_ms", position_config_.retry.initial_backoff_ms);
            position_config_.retry.multiplier = r.value("multiplier", position_config_.retry.multiplier);
            position_config_.retry.max_backoff_ms = r.value("max_backoff_ms", position_config_.retry.max_backoff_ms);
        }
    }

    if (j.contains("engine")) {
        const auto& s = j["engine"];
        engine_config_.queue_poll_ms = s.value("queue_poll_ms", engine_config_.queue_poll_ms);
        engine_config_.state_path = s.value("state_path", engine_config_.state_path);
        engine_config_.journal_path = s.value("journal_path", engine_config_.journal_path);
        engine_config_.log_dir = s.value("log_dir", engine_config_.log_dir);
        engine_config_.log_level = s.value("log_level", engine_config_.log_level);
        engine_config_.paper_initial_margin = s.value("paper_initial_margin", engine_config_.paper_initial_margin);
        engine_config_.paper_order_rate = s.value("paper_order_rate", engine_config_.paper_order_rate);
        engine_config_.paper_cancel_rate = s.value("paper_cancel_rate", engine_config_.paper_cancel_rate);
        engine_config_.paper_query_rate = s.value("paper_query_rate", engine_config_.paper_query_rate);
        engine_config_.replay_dir = s.value("replay_dir", engine_config_.replay_dir);
        engine_config_.replay_delay_ms = s.value("replay_delay_ms", engine_config_.replay_delay_ms);
    }

    if (j.contains("instruments")) {
        const auto& s = j["instruments"];
        if (s.contains("default")) {
            default_instrument_ = readInstrument(s["default"], default_instrument_);
        }
        for (auto it = s.begin(); it != s.end(); ++it) {
            if (it.key() == "default") {
                continue;
            }
            instruments_[upperCopy(it.key())] = readInstrument(it.value(), default_instrument_);
        }
    }
}

std::vector<std::string> Config::validate() const {
    std::vector<std::string> errors;

    if (risk_limits_.leverage < risk_limits_.min_leverage || risk_limits_.leverage > risk_limits_.max_leverage) {
        errors.push_back("leverage " + std::to_string(risk_limits_.leverage) + " outside [" +
                         std::to_string(risk_limits_.min_leverage) + ", " +
                         std::to_string(risk_limits_.max_leverage) + "]");
    }
    if (!(risk_limits_.risk_per_trade > 0.0)) {
        errors.push_back("risk.risk_per_trade must be positive");
    }
    if (risk_limits_.max_trades_per_day < 1 || risk_limits_.max_trades_per_day > 50) {
        errors.push_back("risk.max_trades_per_day must be within [1, 50]");
    }
    if (!(risk_limits_.max_daily_loss > 0.0)) {
        errors.push_back("risk.max_daily_loss must be positive");
    }
    if (!(risk_limits_.stop_atr_multiplier > 0.0)) {
        errors.push_back("risk.stop_atr_multiplier must be positive");
    }
    if (!(risk_limits_.max_position_size > 0.0)) {
        errors.push_back("risk.max_position_size must be positive");
    }

    if (position_config_.take_profit_ladder.empty()) {
        errors.push_back("position.take_profit_ladder is empty");
    }
    double fraction_sum = 0.0;
    double previous_multiple = 0.0;
    for (const auto& level : position_config_.take_profit_ladder) {
        if (!(level.fraction > 0.0) || level.fraction > 1.0) {
            errors.push_back("take-profit fraction must be within (0, 1]");
        }
        if (!(level.atr_multiple > previous_multiple)) {
            errors.push_back("take-profit ATR multiples must be positive and ascending");
        }
        previous_multiple = level.atr_multiple;
        fraction_sum += level.fraction;
    }
    if (fraction_sum > 1.0 + 1e-9) {
        errors.push_back("take-profit fractions sum to more than 1.0");
    }
    if (position_config_.entry_timeout_sec <= 0) {
        errors.push_back("position.entry_timeout_sec must be positive");
    }

    if (!(signal_config_.min_confidence > 0.0) || signal_config_.min_confidence > 1.0) {
        errors.push_back("signal.min_confidence must be within (0, 1]");
    }
    if (indicator_config_.ema_fast_period <= 0 || indicator_config_.ema_slow_period <= 0 ||
        indicator_config_.sma_period <= 0 || indicator_config_.atr_period <= 0 ||
        indicator_config_.rsi_period <= 0 || indicator_config_.sma_fast_period <= 0) {
        errors.push_back("indicator periods must be positive");
    } else {
        if (indicator_config_.ema_fast_period >= indicator_config_.ema_slow_period) {
            errors.push_back("indicators.ema_fast_period must be below ema_slow_period");
        }
        if (indicator_config_.sma_fast_period >= indicator_config_.sma_period) {
            errors.push_back("indicators.sma_fast_period must be below sma_period");
        }
    }
    if (indicator_config_.level_lookback < 10 ||
        static_cast<size_t>(indicator_config_.level_lookback) > indicator_config_.window_capacity) {
        errors.push_back("indicators.level_lookback must be within [10, window_capacity]");
    }
    if (indicator_config_.level_trim_pct < 0.0 || indicator_config_.level_trim_pct >= 50.0) {
        errors.push_back("indicators.level_trim_pct must be within [0, 50)");
    }
    if (signal_config_.level_filter.buffer_atr < 0.0) {
        errors.push_back("signal.level_filter.buffer_atr must not be negative");
    }

    if (engine_config_.symbols.empty()) {
        errors.push_back("trading.symbols is empty");
    }
    for (const auto& symbol : engine_config_.symbols) {
        if (!endsWith(symbol, engine_config_.quote_currency)) {
            errors.push_back("symbol " + symbol + " is not quoted in " + engine_config_.quote_currency);
        }
    }
    if (engine_config_.candle_interval_ms <= 0) {
        errors.push_back("trading.candle_interval_ms must be positive");
    }
    if (engine_config_.paper_order_rate <= 0 || engine_config_.paper_cancel_rate <= 0 ||
        engine_config_.paper_query_rate <= 0) {
        errors.push_back("engine paper request rates must be positive");
    }

    return errors;
}

network::PaperGatewayConfig Config::getPaperGatewayConfig() const {
    network::PaperGatewayConfig config;
    config.initial_margin = engine_config_.paper_initial_margin;
    config.leverage = risk_limits_.leverage;
    config.candle_interval_ms = engine_config_.candle_interval_ms;
    config.book_levels = analyzer_config_.depth_levels;
    config.tick_size = default_instrument_.tick_size;
    config.order_rate_per_second = engine_config_.paper_order_rate;
    config.cancel_rate_per_second = engine_config_.paper_cancel_rate;
    config.query_rate_per_second = engine_config_.paper_query_rate;
    return config;
}

common::InstrumentSpec Config::getInstrumentSpec(const std::string& symbol) const {
    auto it = instruments_.find(symbol);
    return it != instruments_.end() ? it->second : default_instrument_;
}

} // namespace perpscalp
