#pragma once

#include <optional>

#include "common/Types.h"

namespace zenith {
namespace core {
namespace execution {

// 심볼당 상태: FLAT 또는 OPEN(side)
enum class TransitionKind {
    NOOP,    // FLAT 에서 청산 요청
    ENTER,   // FLAT -> OPEN(bias)
    HOLD,    // OPEN(side) 유지
    EXIT,    // OPEN(side) -> FLAT
    FLIP     // OPEN(side) -> FLAT -> OPEN(bias)
};

struct PositionTransition {
    TransitionKind kind = TransitionKind::NOOP;
    std::optional<PositionSide> from;
    Bias to = Bias::FLAT;

    bool closesExisting() const { return kind == TransitionKind::EXIT || kind == TransitionKind::FLIP; }
    bool opensNew() const { return kind == TransitionKind::ENTER || kind == TransitionKind::FLIP; }
};

class PositionTransitionResolver {
public:
    // bias=flat 또는 action=exit 이면 청산, 같은 방향이면 유지,
    // 반대 방향이면 청산 후 신규, 포지션 없으면 신규 진입
    static PositionTransition resolve(const Decision& decision, const std::optional<Position>& position);
};

const char* toString(TransitionKind kind);

} // namespace execution
} // namespace core
} // namespace zenith
