#include "strategy/Ema50RetestModel.h"
#include "analytics/CandlePatterns.h"
#include "strategy/ScalpHelpers.h"

#include <algorithm>

namespace zenith {
namespace strategy {

Model Ema50RetestModel::model() const {
    return Model::EMA50;
}

std::vector<Candidate> Ema50RetestModel::evaluate(const ScalpContext& ctx) const {
    std::vector<Candidate> out;
    const auto& f = ctx.features;
    if (f.candles.empty()) {
        return out;
    }

    const Candle& c0 = f.candles.back();
    const double body = helpers::bodySize(c0);
    const double avg_body20 = helpers::avgBody(f.candles, 20);

    const bool crossed_up = c0.close > f.ema50 && c0.open < f.ema50 && body >= avg_body20;
    const bool crossed_down = c0.close < f.ema50 && c0.open > f.ema50 && body >= avg_body20;
    const bool retraced = helpers::retracedWithinBars(f.ema50, f, 3);
    if (!(crossed_up || crossed_down) || !retraced) {
        return out;
    }

    const Side side = crossed_up ? Side::LONG : Side::SHORT;
    const auto of = helpers::orderflowRatio(f, side, ctx.config);
    const bool rsi = helpers::rsiOk(f, side);
    const auto patterns = analytics::CandlePatterns::confirmingPatterns(
        f.candles, f.candles.size() - 1, side == Side::LONG);
    const auto fvg = helpers::fvgForSide(f, side, ctx.config);
    const auto vp = helpers::vpNear(f, f.close);

    // 상향 교차는 최근 스윙 고점 돌파, 하향은 스윙 저점 이탈
    const double swing = helpers::lastSwing(f, crossed_up ? Side::SHORT : Side::LONG);
    const bool swing_break = crossed_up ? f.close > swing : f.close < swing;
    if (!rsi || !swing_break) {
        return out;
    }

    QualityInputs inputs;
    inputs.regime_ok = true;
    inputs.orderflow_ratio = of.ratio;
    inputs.pattern_count = static_cast<int>(patterns.size());
    inputs.rsi_ok = rsi;
    inputs.fvg_ok = fvg.ok;
    inputs.vp_near_ok = vp.ok;
    const double quality = std::min(1.0, ctx.scorer.score(inputs, f.session, ctx.risk.grade));

    std::vector<std::string> reasons = {
        std::string("cross50=") + (crossed_up ? "up" : "down"),
        std::string("retrace=") + (retraced ? "true" : "false"),
        of.reason,
        "RSI=" + formatFixed(f.rsi14, 1),
        fvg.reason,
        std::string("swingBreak=") + (swing_break ? "true" : "false"),
    };

    out.push_back(finalizeCandidate(
        ctx, Model::EMA50, side, quality, EntryLevel::EMA50,
        ctx.config.model3_tp1_rr, TpTarget::NEXT_VA,
        std::move(reasons)));
    return out;
}

} // namespace strategy
} // namespace zenith
