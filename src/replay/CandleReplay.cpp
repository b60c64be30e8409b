#include "replay/CandleReplay.h"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include "common/Logger.h"

namespace perpscalp {
namespace replay {

namespace {
std::string trim(std::string s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.erase(s.begin());
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.pop_back();
    }
    return s;
}

std::string normalizeCell(std::string s) {
    s = trim(std::move(s));

    // UTF-8 BOM on the first cell
    if (s.size() >= 3 &&
        static_cast<unsigned char>(s[0]) == 0xEF &&
        static_cast<unsigned char>(s[1]) == 0xBB &&
        static_cast<unsigned char>(s[2]) == 0xBF) {
        s = s.substr(3);
    }
    if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
        s = s.substr(1, s.size() - 2);
    }
    return trim(std::move(s));
}

double pick(const nlohmann::json& item, const char* name, const char* alias) {
    if (item.contains(name)) return item[name].get<double>();
    if (item.contains(alias)) return item[alias].get<double>();
    return 0.0;
}

void sortByOpenTime(std::vector<Candle>& candles) {
    std::sort(candles.begin(), candles.end(), [](const Candle& a, const Candle& b) {
        return a.open_time < b.open_time;
    });
}
} // namespace

std::vector<Candle> CandleReplay::loadCSV(const std::string& file_path) {
    std::vector<Candle> candles;
    std::ifstream file(file_path);

    if (!file.is_open()) {
        LOG_ERROR("Failed to open CSV file: {}", file_path);
        return candles;
    }

    std::string line;
    while (std::getline(file, line)) {
        std::stringstream ss(line);
        std::string cell;
        std::vector<std::string> row;

        while (std::getline(ss, cell, ',')) {
            row.push_back(normalizeCell(cell));
        }

        if (row.size() < 6 || row[0].empty()) continue;
        if (!std::isdigit(static_cast<unsigned char>(row[0][0]))) {
            // header
            continue;
        }

        try {
            candles.emplace_back(std::stoll(row[0]), std::stod(row[1]), std::stod(row[2]),
                                 std::stod(row[3]), std::stod(row[4]), std::stod(row[5]));
        } catch (const std::invalid_argument& e) {
            LOG_WARN("Skipping malformed row: {} - {}", line, e.what());
        } catch (const std::out_of_range& e) {
            LOG_WARN("Skipping out-of-range row: {} - {}", line, e.what());
        }
    }

    sortByOpenTime(candles);
    LOG_INFO("Loaded {} candles from {}", candles.size(), file_path);
    return candles;
}

std::vector<Candle> CandleReplay::loadJSON(const std::string& file_path) {
    std::vector<Candle> candles;
    std::ifstream file(file_path);

    if (!file.is_open()) {
        LOG_ERROR("Failed to open JSON file: {}", file_path);
        return candles;
    }

    try {
        nlohmann::json j;
        file >> j;
        for (const auto& item : j) {
            Candle candle;
            if (item.contains("open_time")) candle.open_time = item["open_time"].get<long long>();
            else if (item.contains("t")) candle.open_time = item["t"].get<long long>();
            candle.open = pick(item, "open", "o");
            candle.high = pick(item, "high", "h");
            candle.low = pick(item, "low", "l");
            candle.close = pick(item, "close", "c");
            candle.volume = pick(item, "volume", "v");
            candles.push_back(candle);
        }
    } catch (const nlohmann::json::exception& e) {
        LOG_ERROR("Error parsing JSON file: {} - {}", file_path, e.what());
    }

    sortByOpenTime(candles);
    LOG_INFO("Loaded {} candles from {}", candles.size(), file_path);
    return candles;
}

void CandleReplay::addSymbol(const std::string& symbol, std::vector<Candle> candles) {
    sortByOpenTime(candles);
    candles_[symbol] = std::move(candles);
    cursor_[symbol] = 0;
}

std::optional<ReplayItem> CandleReplay::next() {
    const std::string* best_symbol = nullptr;
    const Candle* best = nullptr;

    for (const auto& kv : candles_) {
        const size_t pos = cursor_[kv.first];
        if (pos >= kv.second.size()) {
            continue;
        }
        const Candle& candidate = kv.second[pos];
        if (best == nullptr || candidate.open_time < best->open_time) {
            best = &candidate;
            best_symbol = &kv.first;
        }
    }

    if (best == nullptr) {
        return std::nullopt;
    }
    ReplayItem item{*best_symbol, *best};
    cursor_[*best_symbol]++;
    return item;
}

bool CandleReplay::empty() const {
    return remaining() == 0;
}

size_t CandleReplay::remaining() const {
    size_t total = 0;
    for (const auto& kv : candles_) {
        auto it = cursor_.find(kv.first);
        const size_t pos = it != cursor_.end() ? it->second : 0;
        total += kv.second.size() - std::min(pos, kv.second.size());
    }
    return total;
}

} // namespace replay
} // namespace perpscalp
