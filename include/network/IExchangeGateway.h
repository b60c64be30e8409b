#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "common/Types.h"

namespace perpscalp {
namespace network {

enum class GatewayErrorKind {
    NONE,
    NETWORK,
    RATE_LIMITED,
    AUTHENTICATION,
    VALIDATION,
    UNKNOWN
};

inline const char* gatewayErrorKindToString(GatewayErrorKind kind) {
    switch (kind) {
        case GatewayErrorKind::NONE: return "NONE";
        case GatewayErrorKind::NETWORK: return "NETWORK";
        case GatewayErrorKind::RATE_LIMITED: return "RATE_LIMITED";
        case GatewayErrorKind::AUTHENTICATION: return "AUTHENTICATION";
        case GatewayErrorKind::VALIDATION: return "VALIDATION";
        case GatewayErrorKind::UNKNOWN: return "UNKNOWN";
    }
    return "UNKNOWN";
}

// Network and rate limit failures may succeed on retry; the rest are final.
inline bool isTransient(GatewayErrorKind kind) {
    return kind == GatewayErrorKind::NETWORK || kind == GatewayErrorKind::RATE_LIMITED;
}

struct GatewayError {
    GatewayErrorKind kind = GatewayErrorKind::NONE;
    std::string message;
};

template <typename T>
struct GatewayResult {
    std::optional<T> value;
    GatewayError error;

    bool ok() const { return value.has_value(); }

    static GatewayResult success(T v) {
        GatewayResult r;
        r.value = std::move(v);
        return r;
    }

    static GatewayResult failure(GatewayErrorKind kind, std::string message) {
        GatewayResult r;
        r.error.kind = kind;
        r.error.message = std::move(message);
        return r;
    }
};

enum class MarketEventType { CANDLE, TRADE, ORDER_BOOK };

// One market-data item for a symbol. Only the member named by `type` is set.
struct MarketEvent {
    MarketEventType type = MarketEventType::CANDLE;
    std::string symbol;
    Candle candle;
    Trade trade;
    OrderBookSnapshot book;
};

// `filled_size` is the quantity filled by this update, not the running total.
struct OrderUpdate {
    std::string order_id;
    std::string symbol;
    OrderStatus status = OrderStatus::SUBMITTED;
    Quantity filled_size = 0.0;
    Price avg_price = 0.0;
    std::string reason;
    long long ts_ms = 0;
};

// Live position as the venue reports it; size is signed (short < 0).
struct VenuePosition {
    std::string symbol;
    Quantity size = 0.0;
    Price entry_price = 0.0;
};

using MarketDataHandler = std::function<void(const MarketEvent&)>;
using OrderUpdateHandler = std::function<void(const OrderUpdate&)>;

class IExchangeGateway {
public:
    virtual ~IExchangeGateway() = default;

    virtual bool subscribeMarketData(const std::string& symbol, MarketDataHandler handler) = 0;
    virtual void unsubscribe(const std::string& symbol) = 0;
    virtual void setOrderUpdateHandler(OrderUpdateHandler handler) = 0;

    // Returns the venue order id.
    virtual GatewayResult<std::string> placeOrder(const Order& order) = 0;
    virtual GatewayResult<bool> cancelOrder(const std::string& order_id) = 0;

    virtual GatewayResult<double> queryMargin() = 0;
    virtual GatewayResult<std::vector<VenuePosition>> queryPositions() = 0;
};

} // namespace network
} // namespace perpscalp
