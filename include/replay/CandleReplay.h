#pragma once

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "common/Types.h"

namespace perpscalp {
namespace replay {

struct ReplayItem {
    std::string symbol;
    Candle candle;
};

// Merges per-symbol candle files into one chronological feed for paper mode.
class CandleReplay {
public:
    // Expected format: open_time_ms,open,high,low,close,volume (header optional)
    static std::vector<Candle> loadCSV(const std::string& file_path);

    // Array of {open_time|t, open|o, high|h, low|l, close|c, volume|v}
    static std::vector<Candle> loadJSON(const std::string& file_path);

    void addSymbol(const std::string& symbol, std::vector<Candle> candles);

    // Earliest remaining candle across symbols; ties go to the symbol name order.
    std::optional<ReplayItem> next();

    bool empty() const;
    size_t remaining() const;

private:
    std::map<std::string, std::vector<Candle>> candles_;
    std::map<std::string, size_t> cursor_;
};

} // namespace replay
} // namespace perpscalp
