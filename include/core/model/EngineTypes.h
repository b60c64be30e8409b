#pragma once

#include <cstdint>
#include <functional>
#include <string>

#include <nlohmann/json.hpp>

#include "common/Errors.h"

namespace perpscalp {
namespace core {

enum class NotificationType {
    SIGNAL_GENERATED,
    ENTRY_SUBMITTED,
    POSITION_OPENED,
    TAKE_PROFIT_HIT,
    STOP_LOSS_HIT,
    STOP_MOVED,
    POSITION_CLOSED,
    ENTRY_CANCELLED,
    RISK_DENIED,
    RISK_HALT,
    DAILY_RESET,
    ORDER_ERROR,
    RECONCILIATION_MISMATCH,
    ENGINE_PAUSED,
    ENGINE_RESUMED,
    STATUS
};

// Structured event published to the operator channel.
struct Notification {
    NotificationType type = NotificationType::STATUS;
    long long ts_ms = 0;
    std::string symbol;
    std::string message;
    ErrorKind error = ErrorKind::NONE;
    nlohmann::json payload = nlohmann::json::object();
};

// Journal row: a notification plus its monotonically increasing sequence.
struct JournalEvent {
    std::uint64_t seq = 0;
    long long ts_ms = 0;
    NotificationType type = NotificationType::STATUS;
    std::string symbol;
    std::string error;
    std::string message;
    nlohmann::json payload;
};

enum class CommandType { PAUSE, RESUME, CLOSE_ALL, STATUS, CLEAR_REVIEW, OVERRIDE, FORCE_BUY, FORCE_SELL };

// Operator command. `reply` (optional) receives the result payload on the
// control thread.
struct Command {
    CommandType type = CommandType::STATUS;
    std::string symbol;
    std::string reason;
    std::function<void(const nlohmann::json&)> reply;
};

const char* notificationTypeToString(NotificationType type);
NotificationType notificationTypeFromString(const std::string& value);
const char* commandTypeToString(CommandType type);

} // namespace core
} // namespace perpscalp
