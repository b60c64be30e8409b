#pragma once

#include "core/model/EngineTypes.h"

namespace perpscalp {
namespace core {

// Outbound operator channel. Implementations must be thread-safe: symbol
// workers and the risk manager publish concurrently.
class INotificationSink {
public:
    virtual ~INotificationSink() = default;

    virtual void notify(const Notification& notification) = 0;
};

} // namespace core
} // namespace perpscalp
