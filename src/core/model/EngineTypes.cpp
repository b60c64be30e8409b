#include "core/model/EngineTypes.h"

#include <array>
#include <utility>

namespace perpscalp {
namespace core {

namespace {
constexpr std::array<std::pair<NotificationType, const char*>, 16> kNotificationNames{{
    {NotificationType::SIGNAL_GENERATED, "SIGNAL_GENERATED"},
    {NotificationType::ENTRY_SUBMITTED, "ENTRY_SUBMITTED"},
    {NotificationType::POSITION_OPENED, "POSITION_OPENED"},
    {NotificationType::TAKE_PROFIT_HIT, "TAKE_PROFIT_HIT"},
    {NotificationType::STOP_LOSS_HIT, "STOP_LOSS_HIT"},
    {NotificationType::STOP_MOVED, "STOP_MOVED"},
    {NotificationType::POSITION_CLOSED, "POSITION_CLOSED"},
    {NotificationType::ENTRY_CANCELLED, "ENTRY_CANCELLED"},
    {NotificationType::RISK_DENIED, "RISK_DENIED"},
    {NotificationType::RISK_HALT, "RISK_HALT"},
    {NotificationType::DAILY_RESET, "DAILY_RESET"},
    {NotificationType::ORDER_ERROR, "ORDER_ERROR"},
    {NotificationType::RECONCILIATION_MISMATCH, "RECONCILIATION_MISMATCH"},
    {NotificationType::ENGINE_PAUSED, "ENGINE_PAUSED"},
    {NotificationType::ENGINE_RESUMED, "ENGINE_RESUMED"},
    {NotificationType::STATUS, "STATUS"},
}};
}

const char* notificationTypeToString(NotificationType type) {
    for (const auto& entry : kNotificationNames) {
        if (entry.first == type) return entry.second;
    }
    return "STATUS";
}

NotificationType notificationTypeFromString(const std::string& value) {
    for (const auto& entry : kNotificationNames) {
        if (value == entry.second) return entry.first;
    }
    return NotificationType::STATUS;
}

const char* commandTypeToString(CommandType type) {
    switch (type) {
        case CommandType::PAUSE: return "PAUSE";
        case CommandType::RESUME: return "RESUME";
        case CommandType::CLOSE_ALL: return "CLOSE_ALL";
        case CommandType::STATUS: return "STATUS";
        case CommandType::CLEAR_REVIEW: return "CLEAR_REVIEW";
        case CommandType::OVERRIDE: return "OVERRIDE";
        case CommandType::FORCE_BUY: return "FORCE_BUY";
        case CommandType::FORCE_SELL: return "FORCE_SELL";
    }
    return "STATUS";
}

} // namespace core
} // namespace perpscalp
