#include "core/execution/PositionLifecycleStateMachine.h"

namespace perpscalp {
namespace core {
namespace execution {

namespace {
PositionTransitionResult accept(PositionState next) {
    PositionTransitionResult result;
    result.state = next;
    result.valid = true;
    result.terminal = (next == PositionState::CLOSED);
    return result;
}

PositionTransitionResult reject(PositionState current) {
    PositionTransitionResult result;
    result.state = current;
    result.valid = false;
    result.terminal = (current == PositionState::CLOSED);
    return result;
}
} // namespace

PositionTransitionResult PositionLifecycleStateMachine::transition(
    PositionState current,
    LifecycleEvent event
) {
    switch (current) {
        case PositionState::IDLE:
            if (event == LifecycleEvent::ENTRY_SUBMITTED) {
                return accept(PositionState::ENTRY_PENDING);
            }
            break;

        case PositionState::ENTRY_PENDING:
            if (event == LifecycleEvent::ENTRY_FILLED) {
                return accept(PositionState::OPEN);
            }
            if (event == LifecycleEvent::ENTRY_REJECTED ||
                event == LifecycleEvent::ENTRY_CANCELLED ||
                event == LifecycleEvent::ENTRY_TIMEOUT) {
                return accept(PositionState::IDLE);
            }
            break;

        case PositionState::OPEN:
        case PositionState::PARTIALLY_CLOSED:
            if (event == LifecycleEvent::TAKE_PROFIT_FILLED) {
                return accept(PositionState::PARTIALLY_CLOSED);
            }
            if (event == LifecycleEvent::FINAL_TAKE_PROFIT_FILLED ||
                event == LifecycleEvent::STOP_FILLED ||
                event == LifecycleEvent::EXIT_FILLED) {
                return accept(PositionState::CLOSED);
            }
            break;

        case PositionState::CLOSED:
            if (event == LifecycleEvent::RESET) {
                return accept(PositionState::IDLE);
            }
            break;
    }
    return reject(current);
}

bool PositionLifecycleStateMachine::isActive(PositionState state) {
    return state == PositionState::ENTRY_PENDING ||
           state == PositionState::OPEN ||
           state == PositionState::PARTIALLY_CLOSED;
}

const char* positionStateToString(PositionState state) {
    switch (state) {
        case PositionState::IDLE: return "IDLE";
        case PositionState::ENTRY_PENDING: return "ENTRY_PENDING";
        case PositionState::OPEN: return "OPEN";
        case PositionState::PARTIALLY_CLOSED: return "PARTIALLY_CLOSED";
        case PositionState::CLOSED: return "CLOSED";
    }
    return "UNKNOWN";
}

PositionState positionStateFromString(const std::string& value) {
    if (value == "ENTRY_PENDING") return PositionState::ENTRY_PENDING;
    if (value == "OPEN") return PositionState::OPEN;
    if (value == "PARTIALLY_CLOSED") return PositionState::PARTIALLY_CLOSED;
    if (value == "CLOSED") return PositionState::CLOSED;
    return PositionState::IDLE;
}

const char* lifecycleEventToString(LifecycleEvent event) {
    switch (event) {
        case LifecycleEvent::ENTRY_SUBMITTED: return "ENTRY_SUBMITTED";
        case LifecycleEvent::ENTRY_FILLED: return "ENTRY_FILLED";
        case LifecycleEvent::ENTRY_REJECTED: return "ENTRY_REJECTED";
        case LifecycleEvent::ENTRY_CANCELLED: return "ENTRY_CANCELLED";
        case LifecycleEvent::ENTRY_TIMEOUT: return "ENTRY_TIMEOUT";
        case LifecycleEvent::TAKE_PROFIT_FILLED: return "TAKE_PROFIT_FILLED";
        case LifecycleEvent::FINAL_TAKE_PROFIT_FILLED: return "FINAL_TAKE_PROFIT_FILLED";
        case LifecycleEvent::STOP_FILLED: return "STOP_FILLED";
        case LifecycleEvent::EXIT_FILLED: return "EXIT_FILLED";
        case LifecycleEvent::RESET: return "RESET";
    }
    return "UNKNOWN";
}

} // namespace execution
} // namespace core
} // namespace perpscalp
