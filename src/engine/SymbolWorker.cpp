#include "engine/SymbolWorker.h"

#include <exception>

#include "common/Logger.h"
#include "core/execution/ExecutionUpdateSchema.h"

namespace perpscalp {
namespace engine {

SymbolWorker::SymbolWorker(const std::string& symbol,
                           const analytics::IndicatorConfig& indicator_config,
                           const analytics::AnalyzerConfig& analyzer_config,
                           int queue_poll_ms,
                           execution::PositionManager& positions,
                           core::TradingCycleCoordinator& coordinator,
                           const common::IClock& clock)
    : symbol_(symbol)
    , queue_poll_ms_(queue_poll_ms > 0 ? queue_poll_ms : 500)
    , positions_(positions)
    , coordinator_(coordinator)
    , clock_(clock)
    , pipeline_(indicator_config)
    , analyzer_(analyzer_config) {}

SymbolWorker::~SymbolWorker() {
    stop();
}

void SymbolWorker::start() {
    if (running_) {
        return;
    }
    running_ = true;
    thread_ = std::thread(&SymbolWorker::run, this);
    LOG_INFO("[{}] worker started", symbol_);
}

void SymbolWorker::stop() {
    if (!running_) {
        return;
    }
    running_ = false;
    if (thread_.joinable()) {
        thread_.join();
    }
    LOG_INFO("[{}] worker stopped", symbol_);
}

void SymbolWorker::post(const network::MarketEvent& event) {
    WorkItem item;
    item.kind = WorkItem::Kind::MARKET;
    item.market = event;
    enqueue(std::move(item));
}

void SymbolWorker::post(const network::OrderUpdate& update) {
    WorkItem item;
    item.kind = WorkItem::Kind::ORDER_UPDATE;
    item.update = update;
    enqueue(std::move(item));
}

void SymbolWorker::postForcedEntry(Direction direction) {
    WorkItem item;
    item.kind = WorkItem::Kind::FORCE_ENTRY;
    item.direction = direction;
    enqueue(std::move(item));
}

void SymbolWorker::enqueue(WorkItem item) {
    pending_.fetch_add(1);
    queue_.push(std::move(item));
}

void SymbolWorker::run() {
    while (running_) {
        auto item = queue_.popFor(std::chrono::milliseconds(queue_poll_ms_));
        if (item) {
            try {
                process(*item);
            } catch (const std::exception& e) {
                LOG_ERROR("[{}] work item failed: {}", symbol_, e.what());
            }
            markDone();
        } else {
            // Idle wake-up: pending entries still age against the clock.
            positions_.checkTimeout(symbol_);
        }
    }

    // Items left behind by stop() count as done so waiters are released.
    while (auto item = queue_.tryPop()) {
        markDone();
    }
}

void SymbolWorker::markDone() {
    if (pending_.fetch_sub(1) == 1) {
        std::lock_guard<std::mutex> lock(idle_mutex_);
        idle_cv_.notify_all();
    }
}

bool SymbolWorker::waitUntilIdle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(idle_mutex_);
    return idle_cv_.wait_for(lock, timeout, [this] { return pending_.load() == 0; });
}

void SymbolWorker::process(const WorkItem& item) {
    if (item.kind == WorkItem::Kind::ORDER_UPDATE) {
        {
            std::lock_guard<std::mutex> lock(stats_mutex_);
            ++stats_.order_updates;
        }
        positions_.onOrderUpdate(item.update);
        return;
    }
    if (item.kind == WorkItem::Kind::FORCE_ENTRY) {
        onForcedEntry(item.direction);
        return;
    }

    const auto& event = item.market;
    switch (event.type) {
        case network::MarketEventType::ORDER_BOOK:
            if (!analyzer_.onOrderBook(event.book)) {
                LOG_DEBUG("[{}] out-of-order book snapshot ignored", symbol_);
            }
            break;
        case network::MarketEventType::TRADE:
            analyzer_.onTrade(event.trade);
            break;
        case network::MarketEventType::CANDLE:
            onCandle(event.candle);
            break;
    }
}

void SymbolWorker::onCandle(const Candle& candle) {
    const auto update = pipeline_.onClosedCandle(candle);
    if (!update.accepted) {
        LOG_DEBUG("[{}] candle skipped ({}): {}", symbol_, errorKindToString(update.error), update.reason);
        std::lock_guard<std::mutex> lock(stats_mutex_);
        ++stats_.rejected_candles;
        return;
    }
    analyzer_.onClosedCandle(candle);

    positions_.onPrice(symbol_, candle.close);
    positions_.checkTimeout(symbol_);

    const auto result = coordinator_.runEntryCycle(symbol_, pipeline_.state(), analyzer_);

    std::lock_guard<std::mutex> lock(stats_mutex_);
    ++stats_.candles;
    if (result.evaluation.signal) {
        ++stats_.signals;
    }
    if (result.stage == core::CycleStage::ENTRY_SUBMITTED) {
        ++stats_.entries;
    }
    stats_.last_stage = core::TradingCycleCoordinator::stageToString(result.stage);
    last_close_ = candle.close;
    last_atr_ = pipeline_.state().value(analytics::indicator::ATR).value_or(0.0);
}

void SymbolWorker::onForcedEntry(Direction direction) {
    positions_.checkTimeout(symbol_);
    const auto result = coordinator_.runForcedEntry(symbol_, direction, pipeline_.state(), analyzer_);
    LOG_INFO("[{}] forced {} entry: {} {}", symbol_, core::execution::directionToString(direction),
             core::TradingCycleCoordinator::stageToString(result.stage), result.detail);

    std::lock_guard<std::mutex> lock(stats_mutex_);
    if (result.stage == core::CycleStage::ENTRY_SUBMITTED) {
        ++stats_.entries;
    }
    stats_.last_stage = core::TradingCycleCoordinator::stageToString(result.stage);
}

WorkerStats SymbolWorker::stats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}

nlohmann::json SymbolWorker::statusJson() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    nlohmann::json j;
    j["symbol"] = symbol_;
    j["candles"] = stats_.candles;
    j["rejected_candles"] = stats_.rejected_candles;
    j["signals"] = stats_.signals;
    j["entries"] = stats_.entries;
    j["order_updates"] = stats_.order_updates;
    j["last_stage"] = stats_.last_stage;
    j["last_close"] = last_close_;
    j["atr"] = last_atr_;
    j["pending"] = pending_.load();
    j["as_of_ms"] = clock_.nowMs();
    return j;
}

} // namespace engine
} // namespace perpscalp
