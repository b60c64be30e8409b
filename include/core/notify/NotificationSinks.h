#pragma once

#include <mutex>
#include <vector>

#include "core/contracts/IEventJournal.h"
#include "core/contracts/INotificationSink.h"

namespace perpscalp {
namespace core {

// Writes every notification to the main log; errors and halts at warn level.
class LogNotificationSink : public INotificationSink {
public:
    void notify(const Notification& notification) override;
};

// Persists notifications to the event journal.
class JournalNotificationSink : public INotificationSink {
public:
    explicit JournalNotificationSink(IEventJournal& journal) : journal_(journal) {}

    void notify(const Notification& notification) override;

private:
    IEventJournal& journal_;
};

// Fans one notification out to several sinks. Sinks are not owned.
class FanoutNotificationSink : public INotificationSink {
public:
    void addSink(INotificationSink* sink);
    void notify(const Notification& notification) override;

private:
    std::mutex mutex_;
    std::vector<INotificationSink*> sinks_;
};

} // namespace core
} // namespace perpscalp
