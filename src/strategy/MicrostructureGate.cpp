#include "strategy/MicrostructureGate.h"
#include "strategy/QualityScorer.h"

#include <algorithm>

namespace zenith {
namespace strategy {

MicrostructureGate::MicrostructureGate(const MicroFilterCaps& caps)
    : caps_(caps) {}

MicroCaps MicrostructureGate::effectiveCaps(Side side, RiskGrade grade) const {
    MicroCaps caps;
    caps.spread_bp = caps_.spread_bp;
    caps.slippage_bp = caps_.slippage_bp;
    caps.latency_ms = caps_.latency_ms;
    caps.quote_age_ms = caps_.quote_age_ms;
    caps.depth_baseline = side == Side::SHORT ? caps_.depth_bias_short : caps_.depth_bias_long;

    if (grade == RiskGrade::HIGH) {
        caps.spread_bp = std::min(caps.spread_bp, caps_.spread_high_bp);
        caps.slippage_bp = std::min(caps.slippage_bp, caps_.slippage_high_bp);
    }
    return caps;
}

std::vector<std::string> MicrostructureGate::breaches(const MicroInputs& in, RiskGrade grade) const {
    const auto caps = effectiveCaps(in.side, grade);
    std::vector<std::string> out;
    if (!(in.spread_bp <= caps.spread_bp)) out.push_back("spread");
    if (!(in.expected_slip_bp <= caps.slippage_bp)) out.push_back("slippage");
    if (!(in.latency_ms <= caps.latency_ms)) out.push_back("latency");
    if (!(in.quote_age_ms <= caps.quote_age_ms)) out.push_back("quoteAge");
    if (!(in.depth_bias >= caps.depth_baseline)) out.push_back("depthBias");
    return out;
}

bool MicrostructureGate::passes(const MicroInputs& inputs, RiskGrade grade) const {
    return breaches(inputs, grade).empty();
}

bool MicrostructureGate::admit(const MicroInputs& inputs, analytics::TradingSession session, RiskGrade grade) const {
    if (QualityScorer::sessionHardGate(session, grade)) {
        return false;
    }
    return passes(inputs, grade);
}

} // namespace strategy
} // namespace zenith
