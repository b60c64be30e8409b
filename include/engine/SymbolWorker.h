#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>

#include <nlohmann/json.hpp>

#include "analytics/IndicatorPipeline.h"
#include "analytics/MarketAnalyzer.h"
#include "common/Clock.h"
#include "common/ThreadSafeQueue.h"
#include "core/orchestration/TradingCycleCoordinator.h"
#include "execution/PositionManager.h"
#include "network/IExchangeGateway.h"

namespace perpscalp {
namespace engine {

struct WorkItem {
    enum class Kind { MARKET, ORDER_UPDATE, FORCE_ENTRY };

    Kind kind = Kind::MARKET;
    network::MarketEvent market;
    network::OrderUpdate update;
    Direction direction = Direction::LONG;
};

struct WorkerStats {
    long long candles = 0;
    long long rejected_candles = 0;
    long long signals = 0;
    long long entries = 0;
    long long order_updates = 0;
    std::string last_stage;
};

// Evaluation loop for one symbol. Everything that touches the symbol's
// indicators, analyzer and lifecycle runs on this worker's thread, in queue
// order: order updates before the market data that follows them.
class SymbolWorker {
public:
    SymbolWorker(const std::string& symbol,
                 const analytics::IndicatorConfig& indicator_config,
                 const analytics::AnalyzerConfig& analyzer_config,
                 int queue_poll_ms,
                 execution::PositionManager& positions,
                 core::TradingCycleCoordinator& coordinator,
                 const common::IClock& clock);
    ~SymbolWorker();

    SymbolWorker(const SymbolWorker&) = delete;
    SymbolWorker& operator=(const SymbolWorker&) = delete;

    void start();
    void stop();
    bool isRunning() const { return running_; }

    void post(const network::MarketEvent& event);
    void post(const network::OrderUpdate& update);
    void postForcedEntry(Direction direction);

    // Runs one item on the calling thread. Used by the loop and by tests.
    void process(const WorkItem& item);

    // Blocks until every posted item has been processed.
    bool waitUntilIdle(std::chrono::milliseconds timeout);
    int pending() const { return pending_.load(); }

    const std::string& symbol() const { return symbol_; }
    WorkerStats stats() const;
    nlohmann::json statusJson() const;

private:
    void run();
    void enqueue(WorkItem item);
    void onCandle(const Candle& candle);
    void onForcedEntry(Direction direction);
    void markDone();

    std::string symbol_;
    int queue_poll_ms_;
    execution::PositionManager& positions_;
    core::TradingCycleCoordinator& coordinator_;
    const common::IClock& clock_;

    analytics::IndicatorPipeline pipeline_;
    analytics::MarketAnalyzer analyzer_;

    common::ThreadSafeQueue<WorkItem> queue_;
    std::thread thread_;
    std::atomic<bool> running_{false};

    std::atomic<int> pending_{0};
    std::mutex idle_mutex_;
    std::condition_variable idle_cv_;

    mutable std::mutex stats_mutex_;
    WorkerStats stats_;
    double last_close_ = 0.0;
    double last_atr_ = 0.0;
};

} // namespace engine
} // namespace perpscalp
