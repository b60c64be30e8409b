#include "common/Logger.h"
#include "common/Config.h"
#include "engine/ScalpingEngine.h"
#include "network/PaperGateway.h"
#include "replay/CandleReplay.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <map>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace perpscalp;

// Set by Ctrl+C; polled by the feed and the console loop.
std::atomic<bool> g_stop_requested{false};

void signalHandler(int signal) {
    if (signal == SIGINT) {
        g_stop_requested = true;
    }
}

static std::string trimCopy(const std::string& input) {
    const auto first = input.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = input.find_last_not_of(" \t\r\n");
    return input.substr(first, last - first + 1);
}

static std::string toLowerCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

static void printBanner(const engine::EngineSettings& settings) {
    std::cout << "========================================\n";
    std::cout << "  PerpScalp - Signal & Risk Engine\n";
    std::cout << "========================================\n";
    std::cout << "Mode:             " << engine::tradingModeToString(settings.engine.mode) << "\n";
    std::cout << "Symbols:          ";
    for (size_t i = 0; i < settings.engine.symbols.size(); ++i) {
        std::cout << (i ? ", " : "") << settings.engine.symbols[i];
    }
    std::cout << "\n";
    std::cout << "Leverage:         " << settings.risk.leverage << "x\n";
    std::cout << "Risk per trade:   " << settings.risk.risk_per_trade << " " << settings.engine.quote_currency << "\n";
    std::cout << "Max daily loss:   " << settings.risk.max_daily_loss << " " << settings.engine.quote_currency << "\n";
    std::cout << "Max trades/day:   " << settings.risk.max_trades_per_day << "\n";
    std::cout << "Stop:             " << settings.risk.stop_atr_multiplier << " x ATR\n";
    std::cout << "Take-profit:      ";
    for (size_t i = 0; i < settings.position.take_profit_ladder.size(); ++i) {
        const auto& level = settings.position.take_profit_ladder[i];
        std::cout << (i ? ", " : "") << "+" << level.atr_multiple << " ATR ("
                  << static_cast<int>(level.fraction * 100.0 + 0.5) << "%)";
    }
    std::cout << "\n\n";
}

static replay::CandleReplay loadReplay(const engine::EngineSettings& settings) {
    replay::CandleReplay feed;
    const std::filesystem::path dir(settings.engine.replay_dir);

    for (const auto& symbol : settings.engine.symbols) {
        const auto csv_path = dir / (symbol + ".csv");
        const auto json_path = dir / (symbol + ".json");

        std::vector<Candle> candles;
        if (std::filesystem::exists(csv_path)) {
            candles = replay::CandleReplay::loadCSV(csv_path.string());
        } else if (std::filesystem::exists(json_path)) {
            candles = replay::CandleReplay::loadJSON(json_path.string());
        } else {
            LOG_WARN("[{}] no candle file under {}", symbol, dir.string());
            continue;
        }

        LOG_INFO("[{}] {} candles loaded for replay", symbol, candles.size());
        feed.addSymbol(symbol, std::move(candles));
    }
    return feed;
}

// Console commands: pause [reason] | resume | closeall | status |
// clear [symbol] | override [reason] | buy SYMBOL | sell SYMBOL | quit
static bool parseCommand(const std::string& line, core::Command& command) {
    std::istringstream in(line);
    std::string verb;
    in >> verb;
    verb = toLowerCopy(verb);

    std::string rest;
    std::getline(in, rest);
    rest = trimCopy(rest);

    if (verb == "pause") {
        command.type = core::CommandType::PAUSE;
        command.reason = rest.empty() ? "console" : rest;
    } else if (verb == "resume") {
        command.type = core::CommandType::RESUME;
    } else if (verb == "closeall") {
        command.type = core::CommandType::CLOSE_ALL;
        command.reason = rest.empty() ? "console close all" : rest;
    } else if (verb == "status") {
        command.type = core::CommandType::STATUS;
    } else if (verb == "clear" || verb == "buy" || verb == "sell") {
        if (verb == "clear") {
            command.type = core::CommandType::CLEAR_REVIEW;
        } else if (rest.empty()) {
            return false;
        } else {
            command.type = verb == "buy" ? core::CommandType::FORCE_BUY : core::CommandType::FORCE_SELL;
            command.reason = "console " + verb;
        }
        std::transform(rest.begin(), rest.end(), rest.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        command.symbol = rest;
    } else if (verb == "override") {
        command.type = core::CommandType::OVERRIDE;
        command.reason = rest.empty() ? "console override" : rest;
    } else {
        return false;
    }
    command.reply = [](const nlohmann::json& reply) {
        std::cout << reply.dump(2) << std::endl;
    };
    return true;
}

static int runReplay(engine::ScalpingEngine& engine, network::PaperGateway& gateway,
                     common::ManualClock& clock, replay::CandleReplay& feed,
                     long long interval_ms) {
    size_t published = 0;
    while (!g_stop_requested) {
        auto item = feed.next();
        if (!item) {
            break;
        }
        // A candle is only known once its interval has ended.
        clock.set(item->candle.open_time + interval_ms);
        gateway.publishCandle(item->symbol, item->candle);
        if (!engine.waitUntilIdle(std::chrono::seconds(10))) {
            LOG_WARN("Workers did not drain after {} {}", item->symbol, item->candle.open_time);
        }
        ++published;
    }
    LOG_INFO("Replay finished: {} candles", published);
    std::cout << engine.status().dump(2) << std::endl;
    return 0;
}

static int runPaper(engine::ScalpingEngine& engine, network::PaperGateway& gateway,
                    const common::IClock& clock, replay::CandleReplay& feed,
                    long long interval_ms, int delay_ms) {
    std::atomic<bool> feed_done{false};

    // Recorded candles are re-stamped to the wall clock so staleness checks
    // see them as live.
    std::thread feeder([&]() {
        std::map<std::string, long long> last_open;
        while (!g_stop_requested) {
            auto item = feed.next();
            if (!item) {
                break;
            }
            Candle candle = item->candle;
            long long open_time = clock.nowMs() - interval_ms;
            auto it = last_open.find(item->symbol);
            if (it != last_open.end() && open_time <= it->second) {
                open_time = it->second + 1;
            }
            last_open[item->symbol] = open_time;
            candle.open_time = open_time;

            gateway.publishCandle(item->symbol, candle);
            std::this_thread::sleep_for(std::chrono::milliseconds(std::max(1, delay_ms)));
        }
        feed_done = true;
        LOG_INFO("Paper feed exhausted");
    });

    std::cout << "Commands: pause [reason] | resume | closeall | status | clear [symbol] | override [reason] | buy SYMBOL | sell SYMBOL | quit\n";
    std::string line;
    while (!g_stop_requested && std::getline(std::cin, line)) {
        line = trimCopy(line);
        if (line.empty()) {
            continue;
        }
        if (toLowerCopy(line) == "quit" || toLowerCopy(line) == "exit") {
            break;
        }
        core::Command command;
        if (!parseCommand(line, command)) {
            std::cout << "Unknown command: " << line << "\n";
            continue;
        }
        engine.submitCommand(std::move(command));
    }

    g_stop_requested = true;
    feeder.join();
    engine.waitUntilIdle(std::chrono::seconds(10));
    std::cout << engine.status().dump(2) << std::endl;
    return 0;
}

int main(int argc, char* argv[]) {
    try {
        const std::string config_path = argc > 1 ? argv[1] : "config/config.json";

        auto& config = Config::getInstance();
        config.load(config_path);

        const auto errors = config.validate();
        if (!errors.empty()) {
            std::cout << "Configuration rejected:\n";
            for (const auto& error : errors) {
                std::cout << "  - " << error << "\n";
            }
            return 1;
        }

        const auto settings = engine::EngineSettings::fromConfig(config);
        Logger::getInstance().initialize(settings.engine.log_dir, settings.engine.log_level);
        printBanner(settings);

        if (config.hasCredentials()) {
            LOG_INFO("API credentials present; paper gateway ignores them");
        }

        auto feed = loadReplay(settings);
        if (feed.empty()) {
            std::cout << "No candle data found under " << settings.engine.replay_dir << "\n";
            return 1;
        }

        std::signal(SIGINT, signalHandler);

        const long long interval_ms = settings.engine.candle_interval_ms;
        const bool replay = settings.engine.mode == engine::TradingMode::REPLAY;

        common::SystemClock system_clock;
        common::ManualClock replay_clock(0);
        const common::IClock& clock = replay ? static_cast<const common::IClock&>(replay_clock)
                                             : static_cast<const common::IClock&>(system_clock);

        network::PaperGateway gateway(config.getPaperGatewayConfig(), clock);
        engine::ScalpingEngine engine(settings, gateway, clock);

        if (!engine.start()) {
            LOG_ERROR("Engine start failed");
            return 1;
        }

        int rc = replay
            ? runReplay(engine, gateway, replay_clock, feed, interval_ms)
            : runPaper(engine, gateway, clock, feed, interval_ms, settings.engine.replay_delay_ms);

        engine.stop();
        LOG_INFO("Program terminated");
        return rc;
    } catch (const std::exception& e) {
        LOG_ERROR("Fatal error: {}", e.what());
        std::cout << "\nFatal error: " << e.what() << std::endl;
        return 1;
    }
}
