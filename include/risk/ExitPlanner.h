#pragma once

#include <optional>

#include "common/Types.h"
#include "strategy/ScalpConfig.h"
#include "strategy/ScalpTypes.h"

namespace zenith {
namespace risk {

struct ExitPlan {
    strategy::Side side = strategy::Side::LONG;
    double entry = 0.0;
    double stop = 0.0;
    std::optional<double> tp1;
    std::optional<double> tp2;
    double trail_atr_mult = 0.0;
    bool move_to_breakeven_on_tp1 = true;
};

// 초기 손절/목표가 계산과 손절 갱신
//   손절 거리 = max(후보 stop hint, round(0.6*ATR/tick), 2) tick
//   TP = entry +- 위험폭 x R
class ExitPlanner {
public:
    explicit ExitPlanner(const strategy::ScalpConfig& config);

    ExitPlan build(
        strategy::Side side,
        double entry,
        const strategy::Candidate& candidate,
        double atr,
        double tick_size
    ) const;

    // 손절은 유리한 방향으로만 이동.
    // TP1 이후 본절 이상으로 올리고 ATR 배수로 추적
    static double updateStop(
        const ExitPlan& plan,
        double current_stop,
        const Candle& last,
        double atr,
        bool hit_tp1
    );

private:
    const strategy::ScalpConfig& config_;
};

} // namespace risk
} // namespace zenith
