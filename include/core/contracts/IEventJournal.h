#pragma once

#include <cstdint>
#include <vector>

#include "core/model/EngineTypes.h"

namespace perpscalp {
namespace core {

class IEventJournal {
public:
    virtual ~IEventJournal() = default;

    virtual bool append(const Notification& notification) = 0;
    virtual std::vector<JournalEvent> readFrom(std::uint64_t seq_inclusive) = 0;
    virtual std::uint64_t lastSeq() const = 0;
};

} // namespace core
} // namespace perpscalp
