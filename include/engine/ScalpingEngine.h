#pragma once

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "analytics/IndicatorPipeline.h"
#include "analytics/MarketAnalyzer.h"
#include "common/Clock.h"
#include "common/ThreadSafeQueue.h"
#include "common/TickSizeHelper.h"
#include "core/model/EngineTypes.h"
#include "core/notify/NotificationSinks.h"
#include "core/orchestration/TradingCycleCoordinator.h"
#include "core/state/EngineStateStoreJson.h"
#include "core/state/EventJournalJsonl.h"
#include "engine/EngineConfig.h"
#include "engine/SymbolWorker.h"
#include "execution/PositionManager.h"
#include "network/IExchangeGateway.h"
#include "risk/RiskManager.h"
#include "strategy/SignalEngine.h"

namespace perpscalp {

class Config;

namespace engine {

// Everything the engine needs from configuration, as plain values.
struct EngineSettings {
    EngineConfig engine;
    analytics::IndicatorConfig indicators;
    analytics::AnalyzerConfig analyzer;
    strategy::SignalConfig signal;
    risk::RiskLimits risk;
    execution::PositionConfig position;
    std::map<std::string, common::InstrumentSpec> instruments;

    static EngineSettings fromConfig(const Config& config);
};

// Owns the shared components and one worker per symbol. Market data and
// order updates arrive from the gateway and are routed to the owning
// symbol's worker; operator commands go through a queue drained by the
// control thread.
class ScalpingEngine {
public:
    ScalpingEngine(const EngineSettings& settings,
                   network::IExchangeGateway& gateway,
                   const common::IClock& clock);
    ~ScalpingEngine();

    ScalpingEngine(const ScalpingEngine&) = delete;
    ScalpingEngine& operator=(const ScalpingEngine&) = delete;

    // Restores persisted state, reconciles against the venue, subscribes and
    // starts the workers.
    bool start();
    void stop();
    bool isRunning() const { return running_; }

    // Never blocks on the evaluation loops.
    void submitCommand(core::Command command);

    // Blocks until every worker has drained its queue.
    bool waitUntilIdle(std::chrono::milliseconds timeout = std::chrono::milliseconds(5000));

    nlohmann::json status() const;
    bool persistState();

    // Extra observers, e.g. an operator console. Not owned.
    void addNotificationSink(core::INotificationSink* sink);

    risk::RiskManager& riskManager() { return *risk_; }
    execution::PositionManager& positionManager() { return *positions_; }
    const EngineSettings& settings() const { return settings_; }

private:
    void restoreState();
    void reviewAllSymbols(const std::string& reason);
    void reconcileWithVenue();
    void controlLoop();
    void handleCommand(const core::Command& command);
    void routeOrderUpdate(const network::OrderUpdate& update);
    SymbolWorker* workerFor(const std::string& symbol) const;

    EngineSettings settings_;
    network::IExchangeGateway& gateway_;
    const common::IClock& clock_;

    core::EventJournalJsonl journal_;
    core::LogNotificationSink log_sink_;
    core::JournalNotificationSink journal_sink_;
    core::FanoutNotificationSink fanout_;
    core::EngineStateStoreJson state_store_;

    std::unique_ptr<strategy::SignalEngine> signal_engine_;
    std::unique_ptr<risk::RiskManager> risk_;
    std::unique_ptr<execution::PositionManager> positions_;
    std::unique_ptr<core::TradingCycleCoordinator> coordinator_;
    std::map<std::string, std::unique_ptr<SymbolWorker>> workers_;

    common::ThreadSafeQueue<core::Command> commands_;
    std::thread control_thread_;
    std::atomic<bool> running_{false};

    std::mutex persist_mutex_;
};

} // namespace engine
} // namespace perpscalp
