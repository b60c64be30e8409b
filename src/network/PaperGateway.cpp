#include "network/PaperGateway.h"

#include <algorithm>
#include <cmath>

#include "common/Logger.h"
#include "core/execution/ExecutionUpdateSchema.h"

namespace perpscalp {
namespace network {

namespace {
int matchPriority(OrderKind kind) {
    // Within one candle: exits, then entries, then stops before targets.
    switch (kind) {
        case OrderKind::EXIT: return 0;
        case OrderKind::ENTRY: return 1;
        case OrderKind::STOP: return 2;
        case OrderKind::TAKE_PROFIT: return 3;
    }
    return 4;
}

double signedQty(OrderSide side, double size) {
    return side == OrderSide::BUY ? size : -size;
}
} // namespace

PaperGateway::PaperGateway(const PaperGatewayConfig& config, const common::IClock& clock)
    : config_(config)
    , clock_(clock)
    , rate_limiter_(clock, config.order_rate_per_second, config.cancel_rate_per_second,
                    config.query_rate_per_second)
{
    LOG_INFO("PaperGateway initialized: margin={:.2f} leverage={:.1f}", config_.initial_margin, config_.leverage);
}

bool PaperGateway::subscribeMarketData(const std::string& symbol, MarketDataHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    market_handlers_[symbol] = std::move(handler);
    LOG_INFO("[{}] paper market data subscribed", symbol);
    return true;
}

void PaperGateway::unsubscribe(const std::string& symbol) {
    std::lock_guard<std::mutex> lock(mutex_);
    market_handlers_.erase(symbol);
}

void PaperGateway::setOrderUpdateHandler(OrderUpdateHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    update_handler_ = std::move(handler);
}

// ===== Orders =====

GatewayResult<std::string> PaperGateway::placeOrder(const Order& order) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!order_failures_.empty()) {
        const auto kind = order_failures_.front();
        order_failures_.pop_front();
        return GatewayResult<std::string>::failure(kind, "injected failure");
    }
    if (!rate_limiter_.tryAcquire("order")) {
        return GatewayResult<std::string>::failure(GatewayErrorKind::RATE_LIMITED, "order rate exceeded");
    }
    if (order.symbol.empty() || !(order.size > 0.0) || !std::isfinite(order.size)) {
        return GatewayResult<std::string>::failure(GatewayErrorKind::VALIDATION, "invalid order size or symbol");
    }
    if (order.price < 0.0 ||
        ((order.kind == OrderKind::STOP || order.kind == OrderKind::TAKE_PROFIT) && !(order.price > 0.0))) {
        return GatewayResult<std::string>::failure(GatewayErrorKind::VALIDATION, "invalid order price");
    }

    Order accepted = order;
    accepted.order_id = "paper-" + std::to_string(next_order_id_++);
    accepted.status = OrderStatus::SUBMITTED;
    accepted.created_at_ms = clock_.nowMs();
    orders_[accepted.order_id] = accepted;
    placed_orders_++;

    LOG_DEBUG("[{}] paper order {} {} {} {} @ {}", accepted.symbol, accepted.order_id,
              core::execution::orderKindToString(accepted.kind),
              core::execution::orderSideToString(accepted.side), accepted.size, accepted.price);
    return GatewayResult<std::string>::success(accepted.order_id);
}

GatewayResult<bool> PaperGateway::cancelOrder(const std::string& order_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!cancel_failures_.empty()) {
        const auto kind = cancel_failures_.front();
        cancel_failures_.pop_front();
        return GatewayResult<bool>::failure(kind, "injected failure");
    }
    if (!rate_limiter_.tryAcquire("cancel")) {
        return GatewayResult<bool>::failure(GatewayErrorKind::RATE_LIMITED, "cancel rate exceeded");
    }
    auto it = orders_.find(order_id);
    if (it == orders_.end()) {
        return GatewayResult<bool>::failure(GatewayErrorKind::VALIDATION, "unknown order " + order_id);
    }
    orders_.erase(it);
    return GatewayResult<bool>::success(true);
}

GatewayResult<double> PaperGateway::queryMargin() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!rate_limiter_.tryAcquire("query")) {
        return GatewayResult<double>::failure(GatewayErrorKind::RATE_LIMITED, "query rate exceeded");
    }
    double used = 0.0;
    for (const auto& kv : positions_) {
        used += std::fabs(kv.second.size) * kv.second.entry_price / config_.leverage;
    }
    return GatewayResult<double>::success(std::max(0.0, config_.initial_margin + realized_pnl_ - used));
}

GatewayResult<std::vector<VenuePosition>> PaperGateway::queryPositions() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!rate_limiter_.tryAcquire("query")) {
        return GatewayResult<std::vector<VenuePosition>>::failure(GatewayErrorKind::RATE_LIMITED,
                                                                  "query rate exceeded");
    }
    std::vector<VenuePosition> out;
    for (const auto& kv : positions_) {
        if (std::fabs(kv.second.size) > 1e-12) {
            out.push_back(kv.second);
        }
    }
    return GatewayResult<std::vector<VenuePosition>>::success(out);
}

// ===== Market feed =====

void PaperGateway::publishCandle(const std::string& symbol, const Candle& candle) {
    std::vector<OrderUpdate> updates;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        updates = matchCandle(symbol, candle);
    }
    dispatch(updates);

    const long long close_time = candle.open_time + config_.candle_interval_ms;

    MarketEvent book_event;
    book_event.type = MarketEventType::ORDER_BOOK;
    book_event.symbol = symbol;
    book_event.book = synthesizeBook(symbol, candle, close_time, config_.book_levels, config_.tick_size);
    dispatchMarket(symbol, book_event);

    MarketEvent candle_event;
    candle_event.type = MarketEventType::CANDLE;
    candle_event.symbol = symbol;
    candle_event.candle = candle;
    dispatchMarket(symbol, candle_event);
}

void PaperGateway::publishTrade(const std::string& symbol, const Trade& trade) {
    MarketEvent event;
    event.type = MarketEventType::TRADE;
    event.symbol = symbol;
    event.trade = trade;
    dispatchMarket(symbol, event);
}

void PaperGateway::publishOrderBook(const OrderBookSnapshot& book) {
    MarketEvent event;
    event.type = MarketEventType::ORDER_BOOK;
    event.symbol = book.symbol;
    event.book = book;
    dispatchMarket(book.symbol, event);
}

// ===== Matching =====

std::vector<OrderUpdate> PaperGateway::matchCandle(const std::string& symbol, const Candle& candle) {
    std::vector<Order> candidates;
    for (const auto& kv : orders_) {
        if (kv.second.symbol == symbol) {
            candidates.push_back(kv.second);
        }
    }
    std::stable_sort(candidates.begin(), candidates.end(), [](const Order& a, const Order& b) {
        return matchPriority(a.kind) < matchPriority(b.kind);
    });

    const long long ts = candle.open_time + config_.candle_interval_ms;
    std::vector<OrderUpdate> updates;

    for (const auto& order : candidates) {
        double price = 0.0;
        if (!triggers(order, candle, price)) {
            continue;
        }

        double size = order.size;
        if (order.reduce_only) {
            const double held = positions_.count(symbol) ? positions_[symbol].size : 0.0;
            const double reducible = (order.side == OrderSide::SELL) ? std::max(0.0, held)
                                                                     : std::max(0.0, -held);
            size = std::min(size, reducible);
            if (size <= 1e-12) {
                orders_.erase(order.order_id);
                OrderUpdate update;
                update.order_id = order.order_id;
                update.symbol = symbol;
                update.status = OrderStatus::CANCELLED;
                update.reason = "reduce-only order with nothing to reduce";
                update.ts_ms = ts;
                updates.push_back(update);
                continue;
            }
        }

        applyFill(order, price, size);
        orders_.erase(order.order_id);

        OrderUpdate update;
        update.order_id = order.order_id;
        update.symbol = symbol;
        update.status = OrderStatus::FILLED;
        update.filled_size = size;
        update.avg_price = price;
        update.ts_ms = ts;
        updates.push_back(update);
    }
    return updates;
}

bool PaperGateway::triggers(const Order& order, const Candle& candle, double& fill_price) const {
    const bool buy = order.side == OrderSide::BUY;

    if (order.price <= 0.0) {
        fill_price = candle.open;
        return true;
    }

    switch (order.kind) {
        case OrderKind::ENTRY:
        case OrderKind::TAKE_PROFIT:
        case OrderKind::EXIT:
            // Limit: buy fills at or below, sell at or above; gaps fill at the open.
            if (buy && candle.low <= order.price) {
                fill_price = std::min(order.price, candle.open);
                return true;
            }
            if (!buy && candle.high >= order.price) {
                fill_price = std::max(order.price, candle.open);
                return true;
            }
            return false;
        case OrderKind::STOP:
            // Stop: buy triggers on the way up, sell on the way down; gaps slip.
            if (buy && candle.high >= order.price) {
                fill_price = std::max(order.price, candle.open);
                return true;
            }
            if (!buy && candle.low <= order.price) {
                fill_price = std::min(order.price, candle.open);
                return true;
            }
            return false;
    }
    return false;
}

void PaperGateway::applyFill(const Order& order, double price, double size) {
    auto& position = positions_[order.symbol];
    position.symbol = order.symbol;

    const double delta = signedQty(order.side, size);
    const double before = position.size;
    const double after = before + delta;

    if (before == 0.0 || (before > 0.0) == (delta > 0.0)) {
        // opening or adding
        const double notional = std::fabs(before) * position.entry_price + std::fabs(delta) * price;
        position.size = after;
        position.entry_price = std::fabs(after) > 0.0 ? notional / std::fabs(after) : 0.0;
        return;
    }

    // reducing
    const double closed = std::min(std::fabs(before), std::fabs(delta));
    const double sign = before > 0.0 ? 1.0 : -1.0;
    realized_pnl_ += (price - position.entry_price) * closed * sign;
    position.size = after;
    if (std::fabs(after) <= 1e-12) {
        position.size = 0.0;
        position.entry_price = 0.0;
    } else if ((after > 0.0) != (before > 0.0)) {
        position.entry_price = price;
    }
}

void PaperGateway::dispatch(const std::vector<OrderUpdate>& updates) {
    if (updates.empty()) {
        return;
    }
    OrderUpdateHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        handler = update_handler_;
    }
    if (!handler) {
        return;
    }
    for (const auto& update : updates) {
        handler(update);
    }
}

void PaperGateway::dispatchMarket(const std::string& symbol, const MarketEvent& event) {
    MarketDataHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = market_handlers_.find(symbol);
        if (it == market_handlers_.end()) {
            return;
        }
        handler = it->second;
    }
    handler(event);
}

// ===== Test hooks =====

void PaperGateway::failNextOrders(GatewayErrorKind kind, int count) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (int i = 0; i < count; ++i) {
        order_failures_.push_back(kind);
    }
}

void PaperGateway::failNextCancels(GatewayErrorKind kind, int count) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (int i = 0; i < count; ++i) {
        cancel_failures_.push_back(kind);
    }
}

void PaperGateway::setPosition(const std::string& symbol, double signed_size, double entry_price) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& position = positions_[symbol];
    position.symbol = symbol;
    position.size = signed_size;
    position.entry_price = entry_price;
}

std::vector<Order> PaperGateway::workingOrders(const std::string& symbol) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Order> out;
    for (const auto& kv : orders_) {
        if (kv.second.symbol == symbol) {
            out.push_back(kv.second);
        }
    }
    return out;
}

int PaperGateway::placedOrderCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return placed_orders_;
}

int PaperGateway::rateLimitedRequests() const {
    return rate_limiter_.rejectedRequests();
}

OrderBookSnapshot PaperGateway::synthesizeBook(const std::string& symbol, const Candle& candle,
                                               long long timestamp, int levels, double tick_size) {
    OrderBookSnapshot book;
    book.symbol = symbol;
    book.timestamp = timestamp;

    const double range = candle.high - candle.low;
    // Body direction tilts resting size toward the side that was buying.
    const double bias = range > 0.0 ? 0.5 * (candle.close - candle.open) / range : 0.0;
    const double base = std::max(candle.volume / 20.0, 1.0);
    const double step = tick_size > 0.0 ? tick_size : 0.01;

    for (int i = 0; i < levels; ++i) {
        BookLevel bid;
        bid.price = candle.close - step * (i + 1);
        bid.size = base * (1.0 + bias);
        book.bids.push_back(bid);

        BookLevel ask;
        ask.price = candle.close + step * (i + 1);
        ask.size = base * (1.0 - bias);
        book.asks.push_back(ask);
    }
    return book;
}

} // namespace network
} // namespace perpscalp
