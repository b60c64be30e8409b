#include "core/notify/NotificationSinks.h"
#include "common/Logger.h"

namespace perpscalp {
namespace core {

namespace {
bool isWarning(const Notification& notification) {
    if (notification.error != ErrorKind::NONE) {
        return true;
    }
    switch (notification.type) {
        case NotificationType::RISK_HALT:
        case NotificationType::ORDER_ERROR:
        case NotificationType::RECONCILIATION_MISMATCH:
        case NotificationType::ENTRY_CANCELLED:
            return true;
        default:
            return false;
    }
}
}

void LogNotificationSink::notify(const Notification& notification) {
    const char* type = notificationTypeToString(notification.type);
    const std::string symbol = notification.symbol.empty() ? "-" : notification.symbol;

    if (isWarning(notification)) {
        LOG_WARN("[{}] {} ({}): {} {}", symbol, type, errorKindToString(notification.error),
                 notification.message, notification.payload.dump());
    } else {
        LOG_INFO("[{}] {}: {} {}", symbol, type, notification.message, notification.payload.dump());
    }
}

void JournalNotificationSink::notify(const Notification& notification) {
    if (!journal_.append(notification)) {
        LOG_ERROR("Event journal append failed: {} {}",
                  notificationTypeToString(notification.type), notification.symbol);
    }
}

void FanoutNotificationSink::addSink(INotificationSink* sink) {
    if (sink == nullptr) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.push_back(sink);
}

void FanoutNotificationSink::notify(const Notification& notification) {
    std::vector<INotificationSink*> sinks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sinks = sinks_;
    }
    for (auto* sink : sinks) {
        sink->notify(notification);
    }
}

} // namespace core
} // namespace perpscalp
