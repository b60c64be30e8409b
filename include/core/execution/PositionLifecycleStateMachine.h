#pragma once

#include <string>

namespace perpscalp {
namespace core {
namespace execution {

enum class PositionState {
    IDLE,
    ENTRY_PENDING,
    OPEN,
    PARTIALLY_CLOSED,
    CLOSED
};

enum class LifecycleEvent {
    ENTRY_SUBMITTED,
    ENTRY_FILLED,
    ENTRY_REJECTED,
    ENTRY_CANCELLED,
    ENTRY_TIMEOUT,
    TAKE_PROFIT_FILLED,
    FINAL_TAKE_PROFIT_FILLED,
    STOP_FILLED,
    EXIT_FILLED,
    RESET
};

struct PositionTransitionResult {
    PositionState state = PositionState::IDLE;
    bool valid = false;
    bool terminal = false;
};

// Allowed transitions:
//   IDLE -> ENTRY_PENDING -> OPEN -> PARTIALLY_CLOSED* -> CLOSED
//   ENTRY_PENDING -> IDLE on reject/cancel/timeout
//   OPEN | PARTIALLY_CLOSED -> CLOSED on stop, final target or exit
//   CLOSED -> IDLE on RESET
// Anything else is invalid and leaves the state unchanged.
class PositionLifecycleStateMachine {
public:
    static PositionTransitionResult transition(PositionState current, LifecycleEvent event);

    static bool isActive(PositionState state);
};

const char* positionStateToString(PositionState state);
PositionState positionStateFromString(const std::string& value);
const char* lifecycleEventToString(LifecycleEvent event);

} // namespace execution
} // namespace core
} // namespace perpscalp
