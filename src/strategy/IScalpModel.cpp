#include "strategy/IScalpModel.h"
#include "strategy/ScalpHelpers.h"
#include "common/StepSizeHelper.h"

#include <algorithm>

namespace zenith {
namespace strategy {

StopHint IScalpModel::swingStop(const ScalpContext& ctx) {
    StopHint hint;
    hint.type = StopType::SWING;
    hint.distance_ticks = std::max(2, common::distanceTicks(ctx.features.atr22 * 0.6, ctx.features.tick_size));
    return hint;
}

std::string IScalpModel::formatFixed(double value, int decimals) {
    return common::formatFixed(value, decimals);
}

std::string IScalpModel::joinNames(const std::vector<std::string>& names) {
    if (names.empty()) return "none";
    std::string out;
    for (const auto& name : names) {
        if (!out.empty()) out += ",";
        out += name;
    }
    return out;
}

Candidate IScalpModel::finalizeCandidate(
    const ScalpContext& ctx,
    Model model,
    Side side,
    double quality,
    EntryLevel entry_hint,
    double tp1_rr,
    TpTarget target,
    std::vector<std::string> reasons
) {
    const auto& micro = ctx.features.micro;
    const double depth = helpers::depthBias(micro, side);

    MicroInputs inputs;
    inputs.side = side;
    inputs.spread_bp = micro.spread_bp;
    inputs.expected_slip_bp = ctx.expected_slip_bp;
    inputs.latency_ms = micro.latency_ms;
    inputs.quote_age_ms = micro.quote_age_ms;
    inputs.depth_bias = depth;

    const bool micro_ok = !ctx.session_restricted && ctx.gate.passes(inputs, ctx.risk.grade);
    const bool admitted = micro_ok && ctx.signal_fresh && quality >= ctx.scorer.thresholdFor(model);

    Candidate candidate;
    candidate.side = side;
    candidate.signal = admitted ? side : Side::NONE;
    candidate.model = model;
    candidate.quality = quality;
    candidate.entry_hint = entry_hint;
    candidate.stop_hint = swingStop(ctx);
    candidate.tp_plan.tp1_rr = tp1_rr;
    candidate.tp_plan.target = target;
    candidate.micro = MicroSnapshot{micro.spread_bp, micro.latency_ms, micro.quote_age_ms, depth};
    candidate.reasons = std::move(reasons);
    candidate.reasons.push_back("signalFresh=" + formatFixed(ctx.signal_fresh_sec, 1) + "s");
    candidate.reasons.push_back(std::string("microOk=") + (micro_ok ? "true" : "false"));
    return candidate;
}

} // namespace strategy
} // namespace zenith
