#include "core/execution/PositionTransition.h"

namespace zenith {
namespace core {
namespace execution {

const char* toString(TransitionKind kind) {
    switch (kind) {
        case TransitionKind::NOOP: return "noop";
        case TransitionKind::ENTER: return "enter";
        case TransitionKind::HOLD: return "hold";
        case TransitionKind::EXIT: return "exit";
        case TransitionKind::FLIP: return "flip";
    }
    return "noop";
}

PositionTransition PositionTransitionResolver::resolve(
    const Decision& decision,
    const std::optional<Position>& position
) {
    PositionTransition result;
    result.to = decision.bias;
    if (position) {
        result.from = position->side;
    }

    if (decision.bias == Bias::FLAT || decision.action == DecisionAction::EXIT) {
        result.to = Bias::FLAT;
        result.kind = position ? TransitionKind::EXIT : TransitionKind::NOOP;
        return result;
    }

    if (!position) {
        result.kind = TransitionKind::ENTER;
        return result;
    }

    result.kind = (toBias(position->side) == decision.bias) ? TransitionKind::HOLD : TransitionKind::FLIP;
    return result;
}

} // namespace execution
} // namespace core
} // namespace zenith
