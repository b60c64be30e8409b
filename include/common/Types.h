#pragma once

#include <string>
#include <vector>

namespace perpscalp {

using Price = double;
using Quantity = double;

enum class Direction { LONG, SHORT };
enum class OrderSide { BUY, SELL };
enum class OrderKind { ENTRY, STOP, TAKE_PROFIT, EXIT };
enum class OrderStatus { PENDING, SUBMITTED, FILLED, PARTIALLY_FILLED, CANCELLED, REJECTED };

struct Candle {
    long long open_time;   // ms, epoch
    double open;
    double high;
    double low;
    double close;
    double volume;

    Candle() : open_time(0), open(0), high(0), low(0), close(0), volume(0) {}

    Candle(long long t, double o, double h, double l, double c, double v)
        : open_time(t), open(o), high(h), low(l), close(c), volume(v) {}
};

struct Trade {
    long long timestamp = 0;
    Price price = 0.0;
    Quantity size = 0.0;
    OrderSide aggressor = OrderSide::BUY;
};

struct BookLevel {
    Price price = 0.0;
    Quantity size = 0.0;
};

// Top-N levels, best price first on each side.
struct OrderBookSnapshot {
    std::string symbol;
    long long timestamp = 0;
    std::vector<BookLevel> bids;
    std::vector<BookLevel> asks;
};

struct Order {
    std::string order_id;
    std::string symbol;
    OrderSide side = OrderSide::BUY;
    OrderKind kind = OrderKind::ENTRY;
    Price price = 0.0;          // limit or trigger price, 0 = market
    Quantity size = 0.0;
    OrderStatus status = OrderStatus::PENDING;
    bool reduce_only = false;
    int take_profit_level = -1;
    long long created_at_ms = 0;
};

inline OrderSide entrySide(Direction direction) {
    return direction == Direction::LONG ? OrderSide::BUY : OrderSide::SELL;
}

inline OrderSide exitSide(Direction direction) {
    return direction == Direction::LONG ? OrderSide::SELL : OrderSide::BUY;
}

// +1 for long, -1 for short
inline double directionSign(Direction direction) {
    return direction == Direction::LONG ? 1.0 : -1.0;
}

} // namespace perpscalp
