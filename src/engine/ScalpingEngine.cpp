#include "engine/ScalpingEngine.h"

#include <exception>

#include "common/Config.h"
#include "common/Logger.h"

namespace perpscalp {
namespace engine {

EngineSettings EngineSettings::fromConfig(const Config& config) {
    EngineSettings settings;
    settings.engine = config.getEngineConfig();
    settings.indicators = config.getIndicatorConfig();
    settings.analyzer = config.getAnalyzerConfig();
    settings.signal = config.getSignalConfig();
    settings.risk = config.getRiskLimits();
    settings.position = config.getPositionConfig();
    for (const auto& symbol : settings.engine.symbols) {
        settings.instruments[symbol] = config.getInstrumentSpec(symbol);
    }
    return settings;
}

ScalpingEngine::ScalpingEngine(const EngineSettings& settings,
                               network::IExchangeGateway& gateway,
                               const common::IClock& clock)
    : settings_(settings)
    , gateway_(gateway)
    , clock_(clock)
    , journal_(settings.engine.journal_path)
    , journal_sink_(journal_)
    , state_store_(settings.engine.state_path)
{
    fanout_.addSink(&log_sink_);
    fanout_.addSink(&journal_sink_);

    signal_engine_ = std::make_unique<strategy::SignalEngine>(settings_.signal);
    risk_ = std::make_unique<risk::RiskManager>(settings_.risk, clock_, &fanout_);
    for (const auto& kv : settings_.instruments) {
        risk_->setInstrumentSpec(kv.first, kv.second);
    }
    positions_ = std::make_unique<execution::PositionManager>(
        settings_.position, gateway_, *risk_, clock_, &fanout_);
    coordinator_ = std::make_unique<core::TradingCycleCoordinator>(
        *signal_engine_, *risk_, *positions_, gateway_, clock_, &fanout_);

    for (const auto& symbol : settings_.engine.symbols) {
        workers_[symbol] = std::make_unique<SymbolWorker>(
            symbol, settings_.indicators, settings_.analyzer, settings_.engine.queue_poll_ms,
            *positions_, *coordinator_, clock_);
    }

    LOG_INFO("ScalpingEngine created: mode={} symbols={}",
             tradingModeToString(settings_.engine.mode), settings_.engine.symbols.size());
}

ScalpingEngine::~ScalpingEngine() {
    stop();
}

bool ScalpingEngine::start() {
    if (running_) {
        LOG_WARN("Engine already running");
        return false;
    }

    restoreState();
    reconcileWithVenue();
    positions_->setPersistCallback([this]() { persistState(); });

    gateway_.setOrderUpdateHandler([this](const network::OrderUpdate& update) {
        routeOrderUpdate(update);
    });

    for (auto& kv : workers_) {
        SymbolWorker* worker = kv.second.get();
        const bool subscribed = gateway_.subscribeMarketData(kv.first, [worker](const network::MarketEvent& event) {
            worker->post(event);
        });
        if (!subscribed) {
            LOG_ERROR("[{}] market data subscription failed", kv.first);
            for (auto& started : workers_) {
                gateway_.unsubscribe(started.first);
                started.second->stop();
            }
            gateway_.setOrderUpdateHandler(nullptr);
            return false;
        }
        worker->start();
    }

    running_ = true;
    control_thread_ = std::thread(&ScalpingEngine::controlLoop, this);
    persistState();

    LOG_INFO("Engine started");
    return true;
}

void ScalpingEngine::stop() {
    if (!running_) {
        return;
    }
    running_ = false;

    for (const auto& kv : workers_) {
        gateway_.unsubscribe(kv.first);
    }
    if (control_thread_.joinable()) {
        control_thread_.join();
    }
    for (auto& kv : workers_) {
        kv.second->stop();
    }
    gateway_.setOrderUpdateHandler(nullptr);

    persistState();
    LOG_INFO("Engine stopped");
}

void ScalpingEngine::submitCommand(core::Command command) {
    commands_.push(std::move(command));
}

bool ScalpingEngine::waitUntilIdle(std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    // Processing one symbol's fill can enqueue updates for it again, so loop
    // until a full pass finds every queue empty.
    while (true) {
        bool all_idle = true;
        for (auto& kv : workers_) {
            const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0 || !kv.second->waitUntilIdle(remaining)) {
                return false;
            }
        }
        for (const auto& kv : workers_) {
            if (kv.second->pending() != 0) {
                all_idle = false;
            }
        }
        if (all_idle) {
            return true;
        }
    }
}

void ScalpingEngine::addNotificationSink(core::INotificationSink* sink) {
    fanout_.addSink(sink);
}

bool ScalpingEngine::persistState() {
    std::lock_guard<std::mutex> lock(persist_mutex_);

    core::EngineStateSnapshot snapshot;
    snapshot.saved_at_ms = clock_.nowMs();
    snapshot.risk_state = risk::RiskManager::toJson(risk_->getState());
    snapshot.positions = nlohmann::json::array();
    for (const auto& position : positions_->snapshot()) {
        if (position.isActive()) {
            snapshot.positions.push_back(execution::PositionManager::toJson(position));
        }
    }
    snapshot.manual_review = nlohmann::json::array();
    for (const auto& symbol : risk_->manualReviewSymbols()) {
        snapshot.manual_review.push_back(symbol);
    }

    if (!state_store_.save(snapshot)) {
        LOG_ERROR("Failed to persist engine state to {}", settings_.engine.state_path);
        return false;
    }
    return true;
}

void ScalpingEngine::restoreState() {
    auto snapshot = state_store_.load();
    if (!snapshot) {
        if (state_store_.lastLoadCorrupt()) {
            reviewAllSymbols("persisted engine state is corrupt");
            return;
        }
        LOG_INFO("No persisted engine state, starting fresh");
        return;
    }

    try {
        risk_->restoreState(risk::RiskManager::riskStateFromJson(snapshot->risk_state));

        std::vector<execution::Position> restored;
        for (const auto& item : snapshot->positions) {
            restored.push_back(execution::PositionManager::positionFromJson(item));
        }
        positions_->restore(restored);

        for (const auto& symbol : snapshot->manual_review) {
            risk_->setManualReview(symbol.get<std::string>(), true);
        }
        LOG_INFO("Engine state restored: {} open positions, {} symbols in manual review",
                 restored.size(), snapshot->manual_review.size());
    } catch (const nlohmann::json::exception& e) {
        LOG_ERROR("Persisted engine state unreadable: {}", e.what());
        reviewAllSymbols(std::string("persisted engine state unreadable: ") + e.what());
    }
}

void ScalpingEngine::reviewAllSymbols(const std::string& reason) {
    // Open exposure is unknown, so no symbol may trade until an operator clears it.
    LOG_ERROR("{}: all {} symbols placed in manual review", reason, settings_.engine.symbols.size());
    for (const auto& symbol : settings_.engine.symbols) {
        risk_->setManualReview(symbol, true);
    }

    core::Notification notification;
    notification.type = core::NotificationType::RECONCILIATION_MISMATCH;
    notification.ts_ms = clock_.nowMs();
    notification.error = ErrorKind::RECONCILIATION;
    notification.message = reason;
    notification.payload["symbols"] = settings_.engine.symbols;
    fanout_.notify(notification);
}

void ScalpingEngine::reconcileWithVenue() {
    auto venue = gateway_.queryPositions();
    if (!venue.ok()) {
        LOG_ERROR("Position query failed during startup: {}", venue.error.message);
        for (const auto& position : positions_->snapshot()) {
            if (position.isActive()) {
                risk_->setManualReview(position.symbol, true);
            }
        }
        return;
    }

    const auto mismatches = positions_->reconcile(*venue.value);
    if (mismatches.empty()) {
        LOG_INFO("Startup reconciliation clean");
    } else {
        LOG_WARN("Startup reconciliation: {} symbols in manual review", mismatches.size());
    }
}

void ScalpingEngine::controlLoop() {
    const auto poll = std::chrono::milliseconds(settings_.engine.queue_poll_ms);
    while (running_) {
        auto command = commands_.popFor(poll);
        if (!command) {
            continue;
        }
        try {
            handleCommand(*command);
        } catch (const std::exception& e) {
            LOG_ERROR("Command {} failed: {}", core::commandTypeToString(command->type), e.what());
        }
    }
}

void ScalpingEngine::handleCommand(const core::Command& command) {
    LOG_INFO("Command received: {} {}", core::commandTypeToString(command.type), command.symbol);

    nlohmann::json reply;
    reply["command"] = core::commandTypeToString(command.type);

    switch (command.type) {
        case core::CommandType::PAUSE:
            risk_->pause(command.reason);
            break;
        case core::CommandType::RESUME:
            risk_->resume();
            break;
        case core::CommandType::CLOSE_ALL:
            positions_->closeAll(command.reason.empty() ? "operator close all" : command.reason);
            break;
        case core::CommandType::CLEAR_REVIEW:
            if (command.symbol.empty()) {
                for (const auto& symbol : risk_->manualReviewSymbols()) {
                    risk_->setManualReview(symbol, false);
                }
            } else {
                risk_->setManualReview(command.symbol, false);
            }
            break;
        case core::CommandType::OVERRIDE:
            risk_->setOverride(command.reason.empty() ? "operator override" : command.reason);
            break;
        case core::CommandType::FORCE_BUY:
        case core::CommandType::FORCE_SELL: {
            // The entry runs on the symbol's worker like any other cycle.
            SymbolWorker* worker = workerFor(command.symbol);
            if (worker == nullptr) {
                reply["error"] = command.symbol.empty() ? "symbol required" : "unknown symbol " + command.symbol;
                LOG_WARN("Forced entry refused: {}", reply["error"].get<std::string>());
                break;
            }
            worker->postForcedEntry(command.type == core::CommandType::FORCE_BUY ? Direction::LONG : Direction::SHORT);
            reply["queued"] = command.symbol;
            break;
        }
        case core::CommandType::STATUS:
            break;
    }

    if (command.type != core::CommandType::STATUS) {
        persistState();
    }
    reply["status"] = status();

    if (command.type == core::CommandType::STATUS) {
        core::Notification notification;
        notification.type = core::NotificationType::STATUS;
        notification.ts_ms = clock_.nowMs();
        notification.message = "status requested";
        notification.payload = reply["status"];
        fanout_.notify(notification);
    }

    if (command.reply) {
        command.reply(reply);
    }
}

nlohmann::json ScalpingEngine::status() const {
    nlohmann::json j;
    j["mode"] = tradingModeToString(settings_.engine.mode);
    j["running"] = running_.load();
    j["paused"] = risk_->isPaused();
    j["halted"] = risk_->isHalted();
    j["risk_state"] = risk::RiskManager::toJson(risk_->getState());

    j["manual_review"] = nlohmann::json::array();
    for (const auto& symbol : risk_->manualReviewSymbols()) {
        j["manual_review"].push_back(symbol);
    }

    j["positions"] = nlohmann::json::array();
    for (const auto& position : positions_->snapshot()) {
        if (position.isActive()) {
            j["positions"].push_back(execution::PositionManager::toJson(position));
        }
    }
    j["closed_positions"] = positions_->closedPositions().size();

    j["workers"] = nlohmann::json::array();
    for (const auto& kv : workers_) {
        j["workers"].push_back(kv.second->statusJson());
    }

    auto margin = gateway_.queryMargin();
    if (margin.ok()) {
        j["available_margin"] = *margin.value;
    }
    return j;
}

void ScalpingEngine::routeOrderUpdate(const network::OrderUpdate& update) {
    SymbolWorker* worker = workerFor(update.symbol);
    if (worker == nullptr) {
        // No worker thread, but fills on a foreign symbol still need review.
        LOG_WARN("Order update {} for unmanaged symbol {}", update.order_id, update.symbol);
        positions_->onOrderUpdate(update);
        return;
    }
    worker->post(update);
}

SymbolWorker* ScalpingEngine::workerFor(const std::string& symbol) const {
    auto it = workers_.find(symbol);
    return it == workers_.end() ? nullptr : it->second.get();
}

} // namespace engine
} // namespace perpscalp
