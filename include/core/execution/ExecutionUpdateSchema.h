#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "common/Types.h"

namespace perpscalp {
namespace core {
namespace execution {

inline const char* orderStatusToString(OrderStatus status) {
    switch (status) {
        case OrderStatus::PENDING: return "PENDING";
        case OrderStatus::SUBMITTED: return "SUBMITTED";
        case OrderStatus::FILLED: return "FILLED";
        case OrderStatus::PARTIALLY_FILLED: return "PARTIALLY_FILLED";
        case OrderStatus::CANCELLED: return "CANCELLED";
        case OrderStatus::REJECTED: return "REJECTED";
    }
    return "UNKNOWN";
}

inline const char* orderSideToString(OrderSide side) {
    return (side == OrderSide::BUY) ? "BUY" : "SELL";
}

inline const char* orderKindToString(OrderKind kind) {
    switch (kind) {
        case OrderKind::ENTRY: return "ENTRY";
        case OrderKind::STOP: return "STOP";
        case OrderKind::TAKE_PROFIT: return "TAKE_PROFIT";
        case OrderKind::EXIT: return "EXIT";
    }
    return "UNKNOWN";
}

inline const char* directionToString(Direction direction) {
    return (direction == Direction::LONG) ? "LONG" : "SHORT";
}

inline Direction directionFromString(const std::string& value) {
    return (value == "SHORT") ? Direction::SHORT : Direction::LONG;
}

inline bool isTerminalStatus(OrderStatus status) {
    return status == OrderStatus::FILLED ||
           status == OrderStatus::CANCELLED ||
           status == OrderStatus::REJECTED;
}

inline nlohmann::json toJson(const Order& order) {
    nlohmann::json line;
    line["order_id"] = order.order_id;
    line["symbol"] = order.symbol;
    line["side"] = orderSideToString(order.side);
    line["kind"] = orderKindToString(order.kind);
    line["price"] = order.price;
    line["size"] = order.size;
    line["status"] = orderStatusToString(order.status);
    line["reduce_only"] = order.reduce_only;
    if (order.take_profit_level >= 0) {
        line["take_profit_level"] = order.take_profit_level;
    }
    line["created_at_ms"] = order.created_at_ms;
    return line;
}

} // namespace execution
} // namespace core
} // namespace perpscalp
