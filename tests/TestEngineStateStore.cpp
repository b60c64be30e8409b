#include "core/state/EngineStateStoreJson.h"
#include "execution/PositionManager.h"
#include "risk/RiskManager.h"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>

using namespace perpscalp;

namespace {
std::filesystem::path scratchPath(const std::string& name) {
    const auto dir = std::filesystem::temp_directory_path() / "perpscalp_test";
    std::filesystem::create_directories(dir);
    const auto path = dir / name;
    std::error_code ec;
    std::filesystem::remove(path, ec);
    return path;
}

void testMissingFileIsEmpty() {
    core::EngineStateStoreJson store(scratchPath("missing_state.json"));
    assert(!store.load());
    assert(!store.lastLoadCorrupt());
}

void testSaveAndLoad() {
    const auto path = scratchPath("engine_state.json");
    core::EngineStateStoreJson store(path);

    risk::RiskState risk_state;
    risk_state.daily_realized_pnl = -42.5;
    risk_state.daily_trade_count = 4;
    risk_state.consecutive_losses = 2;
    risk_state.last_reset_ms = 1704067200000LL;
    risk_state.halted_until_ms = 1704153600000LL;
    risk_state.halt_reason = "daily loss limit";

    execution::Position position;
    position.symbol = "BTCUSDT";
    position.direction = Direction::SHORT;
    position.state = execution::PositionState::PARTIALLY_CLOSED;
    position.entry_price = 42000.0;
    position.size = 0.2;
    position.remaining_size = 0.1;
    position.stop_loss_price = 42000.0;
    position.take_profit_closed_size = 0.1;
    position.stop_order_id = "paper-7";
    execution::TakeProfitTarget target;
    target.price = 41800.0;
    target.fraction = 0.5;
    target.size = 0.1;
    target.filled = true;
    position.take_profits.push_back(target);

    core::EngineStateSnapshot snapshot;
    snapshot.saved_at_ms = 1704100000000LL;
    snapshot.risk_state = risk::RiskManager::toJson(risk_state);
    snapshot.positions.push_back(execution::PositionManager::toJson(position));
    snapshot.manual_review.push_back("ETHUSDT");

    assert(store.save(snapshot));
    assert(std::filesystem::exists(path));
    assert(!std::filesystem::exists(path.string() + ".tmp"));

    core::EngineStateStoreJson reopened(path);
    auto loaded = reopened.load();
    assert(loaded);
    assert(loaded->saved_at_ms == snapshot.saved_at_ms);
    assert(loaded->manual_review.size() == 1 && loaded->manual_review[0] == "ETHUSDT");

    const auto restored_risk = risk::RiskManager::riskStateFromJson(loaded->risk_state);
    assert(restored_risk.daily_realized_pnl == -42.5);
    assert(restored_risk.daily_trade_count == 4);
    assert(restored_risk.consecutive_losses == 2);
    assert(restored_risk.halted_until_ms == risk_state.halted_until_ms);
    assert(restored_risk.halt_reason == "daily loss limit");

    assert(loaded->positions.size() == 1);
    const auto restored = execution::PositionManager::positionFromJson(loaded->positions[0]);
    assert(restored.symbol == "BTCUSDT");
    assert(restored.direction == Direction::SHORT);
    assert(restored.state == execution::PositionState::PARTIALLY_CLOSED);
    assert(restored.remaining_size == 0.1);
    assert(restored.stop_order_id == "paper-7");
    assert(restored.take_profits.size() == 1 && restored.take_profits[0].filled);

    // Overwrite replaces the previous snapshot
    snapshot.positions = nlohmann::json::array();
    assert(store.save(snapshot));
    assert(reopened.load()->positions.empty());
}

void testCorruptFileIsReported() {
    const auto path = scratchPath("corrupt_state.json");
    {
        std::ofstream out(path);
        out << "{\"risk_state\": ";
    }
    core::EngineStateStoreJson store(path);
    assert(!store.load());
    assert(store.lastLoadCorrupt());

    // A well-formed file of the wrong shape is just as unusable
    {
        std::ofstream out(path, std::ios::trunc);
        out << "{\"positions\": 7}";
    }
    assert(!store.load());
    assert(store.lastLoadCorrupt());

    // A later clean save and load clears the flag
    core::EngineStateSnapshot snapshot;
    assert(store.save(snapshot));
    assert(store.load());
    assert(!store.lastLoadCorrupt());
}
}

int main() {
    std::cout << "[TEST] Starting EngineStateStore Test..." << std::endl;

    testMissingFileIsEmpty();
    testSaveAndLoad();
    testCorruptFileIsReported();

    std::cout << "[TEST] EngineStateStore Test PASSED!" << std::endl;
    return 0;
}
