#pragma once

#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "analytics/IndicatorPipeline.h"
#include "analytics/MarketAnalyzer.h"
#include "common/TickSizeHelper.h"
#include "engine/EngineConfig.h"
#include "execution/PositionManager.h"
#include "network/PaperGateway.h"
#include "risk/RiskManager.h"
#include "strategy/StrategyConfig.h"

namespace perpscalp {

class Config {
public:
    static Config& getInstance();

    // Missing file keeps defaults and returns false; malformed JSON throws.
    bool load(const std::string& config_path);
    void loadFromJson(const nlohmann::json& j);
    void resetToDefaults();

    // Critical errors; the engine refuses to start while any is present.
    std::vector<std::string> validate() const;

    std::string getApiKey() const { return api_key_; }
    std::string getApiSecret() const { return api_secret_; }
    bool hasCredentials() const { return !api_key_.empty() && !api_secret_.empty(); }

    engine::EngineConfig getEngineConfig() const { return engine_config_; }
    void setEngineConfig(const engine::EngineConfig& config) { engine_config_ = config; }

    analytics::IndicatorConfig getIndicatorConfig() const { return indicator_config_; }
    analytics::AnalyzerConfig getAnalyzerConfig() const { return analyzer_config_; }
    strategy::SignalConfig getSignalConfig() const { return signal_config_; }
    risk::RiskLimits getRiskLimits() const { return risk_limits_; }
    execution::PositionConfig getPositionConfig() const { return position_config_; }
    network::PaperGatewayConfig getPaperGatewayConfig() const;

    // Falls back to the default spec for unlisted symbols.
    common::InstrumentSpec getInstrumentSpec(const std::string& symbol) const;
    const std::map<std::string, common::InstrumentSpec>& getInstruments() const { return instruments_; }

private:
    Config() = default;

    std::string api_key_;
    std::string api_secret_;

    engine::EngineConfig engine_config_;
    analytics::IndicatorConfig indicator_config_;
    analytics::AnalyzerConfig analyzer_config_;
    strategy::SignalConfig signal_config_;
    risk::RiskLimits risk_limits_;
    execution::PositionConfig position_config_;
    common::InstrumentSpec default_instrument_;
    std::map<std::string, common::InstrumentSpec> instruments_;
};

} // namespace perpscalp
