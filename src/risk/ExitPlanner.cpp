#include "risk/ExitPlanner.h"
#include "common/StepSizeHelper.h"

#include <algorithm>
#include <cmath>

namespace zenith {
namespace risk {

using strategy::Side;

ExitPlanner::ExitPlanner(const strategy::ScalpConfig& config)
    : config_(config) {}

ExitPlan ExitPlanner::build(
    Side side,
    double entry,
    const strategy::Candidate& candidate,
    double atr,
    double tick_size
) const {
    const double tick = tick_size > 0.0 ? tick_size : config_.default_tick_size;
    const int atr_ticks = std::max(2, static_cast<int>(std::lround(atr * 0.6 / tick)));
    const int ticks = std::max(candidate.stop_hint.distance_ticks, atr_ticks);
    const double dist = ticks * tick;

    ExitPlan plan;
    plan.side = side;
    plan.entry = entry;
    plan.stop = side == Side::LONG ? entry - dist : entry + dist;
    plan.trail_atr_mult = config_.trail_atr_mult;

    const double rr1 = candidate.tp_plan.tp1_rr > 0.0 ? candidate.tp_plan.tp1_rr : config_.model1_tp1_rr;
    const double risk = std::abs(entry - plan.stop);
    if (risk > 0.0) {
        plan.tp1 = side == Side::LONG ? entry + risk * rr1 : entry - risk * rr1;
        if (candidate.tp_plan.tp2_rr) {
            const double rr2 = *candidate.tp_plan.tp2_rr;
            plan.tp2 = side == Side::LONG ? entry + risk * rr2 : entry - risk * rr2;
        }
    }
    return plan;
}

double ExitPlanner::updateStop(
    const ExitPlan& plan,
    double current_stop,
    const Candle& last,
    double atr,
    bool hit_tp1
) {
    double stop = current_stop;
    const bool trail = hit_tp1 && atr > 0.0 && plan.trail_atr_mult > 0.0;

    if (plan.side == Side::LONG) {
        if (hit_tp1 && plan.move_to_breakeven_on_tp1) {
            stop = std::max(stop, plan.entry);
        }
        // 직전 캔들 저가 (진입가 상한)
        double candidate = std::min(last.low, plan.entry);
        if (trail) {
            candidate = std::max(candidate, last.close - atr * plan.trail_atr_mult);
        }
        return std::max(stop, candidate);
    }

    if (hit_tp1 && plan.move_to_breakeven_on_tp1) {
        stop = std::min(stop, plan.entry);
    }
    double candidate = std::max(last.high, plan.entry);
    if (trail) {
        candidate = std::min(candidate, last.close + atr * plan.trail_atr_mult);
    }
    return std::min(stop, candidate);
}

} // namespace risk
} // namespace zenith
