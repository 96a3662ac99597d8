#include "strategy/BreakoutModel.h"
#include "analytics/CandlePatterns.h"
#include "strategy/ScalpHelpers.h"

#include <algorithm>

namespace zenith {
namespace strategy {

Model BreakoutModel::model() const {
    return Model::BREAKOUT;
}

std::vector<Candidate> BreakoutModel::evaluate(const ScalpContext& ctx) const {
    std::vector<Candidate> out;
    const auto& f = ctx.features;
    if (f.candles.empty()) {
        return out;
    }

    const Candle& c0 = f.candles.back();
    const double body = helpers::bodySize(c0);
    const double avg_body20 = helpers::avgBody(f.candles, 20);
    const size_t last_idx = f.candles.size() - 1;

    for (Side side : {Side::LONG, Side::SHORT}) {
        const bool is_long = side == Side::LONG;
        const bool regime = helpers::regimeOk(f, side);
        const bool rsi = helpers::rsiOk(f, side);
        const auto of = helpers::orderflowRatio(f, side, ctx.config);
        const auto fvg = helpers::fvgForSide(f, side, ctx.config);
        const auto patterns = analytics::CandlePatterns::confirmingPatterns(f.candles, last_idx, is_long);
        const bool large_print = helpers::hasLargePrint(f, side, ctx.now_ms, ctx.config);

        const double level = is_long ? f.vp.vah : f.vp.val;
        const bool strong_break = (is_long ? c0.close > level : c0.close < level) && body >= avg_body20 * 1.5;

        const bool retrace =
            helpers::retracedWithinBars(level, f, 2) ||
            helpers::retracedWithinBars(f.ema25, f, 2) ||
            helpers::retracedWithinBars(f.ema50, f, 3) ||
            (fvg.zone && helpers::retracedWithinBars((fvg.zone->from + fvg.zone->to) / 2.0, f, 3));

        const double distance = helpers::distanceInAtr(f.close, level, f.atr22);
        const auto vp = helpers::vpNear(f, f.close);

        if (!(regime && rsi && strong_break && of.ok && large_print && retrace &&
              !patterns.empty() && distance <= 1.0)) {
            continue;
        }

        QualityInputs inputs;
        inputs.regime_ok = regime;
        inputs.orderflow_ratio = of.ratio;
        inputs.pattern_count = static_cast<int>(patterns.size());
        inputs.rsi_ok = rsi;
        inputs.fvg_ok = fvg.ok;
        inputs.vp_near_ok = vp.ok;
        const double quality = std::min(1.0, ctx.scorer.score(inputs, f.session, ctx.risk.grade));

        std::vector<std::string> reasons = {
            std::string("regime=") + (regime ? "true" : "false"),
            "RSI=" + formatFixed(f.rsi14, 1),
            of.reason,
            fvg.reason,
            "patterns=" + joinNames(patterns),
            std::string("retrace=") + (retrace ? "true" : "false"),
        };

        auto candidate = finalizeCandidate(
            ctx, Model::BREAKOUT, side, quality,
            helpers::pickNearestEntryLevel(f, fvg.zone),
            ctx.config.model1_tp1_rr, TpTarget::NEXT_VA,
            std::move(reasons));
        candidate.reasons.push_back("distanceATR=" + formatFixed(distance, 2));
        out.push_back(std::move(candidate));
    }
    return out;
}

} // namespace strategy
} // namespace zenith
