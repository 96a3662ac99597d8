#include "strategy/MeanReversionModel.h"
#include "analytics/CandlePatterns.h"
#include "strategy/ScalpHelpers.h"

#include <algorithm>

namespace zenith {
namespace strategy {

Model MeanReversionModel::model() const {
    return Model::MEAN;
}

std::vector<Candidate> MeanReversionModel::evaluate(const ScalpContext& ctx) const {
    std::vector<Candidate> out;
    const auto& f = ctx.features;
    if (f.candles.size() < 2) {
        return out;
    }

    const Candle& c0 = f.candles.back();
    const Candle& c1 = f.candles[f.candles.size() - 2];
    auto insideValueArea = [&](double x) { return x <= f.vp.vah && x >= f.vp.val; };

    const bool left_up = c1.high > f.vp.vah && insideValueArea(c0.close);
    const bool left_down = c1.low < f.vp.val && insideValueArea(c0.close);
    const bool rsi_mid = f.rsi14 >= 45.0 && f.rsi14 <= 55.0;

    if (!rsi_mid || !(left_up || left_down)) {
        return out;
    }

    // 상단 이탈 후 복귀는 숏
    const Side side = left_up ? Side::SHORT : Side::LONG;
    const auto patterns = analytics::CandlePatterns::confirmingPatterns(
        f.candles, f.candles.size() - 1, side == Side::LONG);
    const auto of = helpers::orderflowRatio(f, side, ctx.config);
    const auto fvg = helpers::fvgForSide(f, side, ctx.config);
    const auto vp = helpers::vpNear(f, f.vp.poc);

    QualityInputs inputs;
    inputs.regime_ok = true;
    inputs.orderflow_ratio = of.ratio;
    inputs.pattern_count = static_cast<int>(patterns.size());
    inputs.rsi_ok = true;
    inputs.fvg_ok = fvg.ok;
    inputs.vp_near_ok = vp.ok;

    double quality = ctx.scorer.score(inputs, f.session, ctx.risk.grade);
    if (fvg.ok && quality > 0.0) {
        quality = std::min(1.0, quality + 0.05);
    }

    std::vector<std::string> reasons = {
        std::string("fakeout=") + (left_up ? "upper→in" : "lower→in"),
        "RSI=" + formatFixed(f.rsi14, 1),
        of.reason,
        fvg.reason,
        "patterns=" + joinNames(patterns),
    };

    out.push_back(finalizeCandidate(
        ctx, Model::MEAN, side, quality,
        left_up ? EntryLevel::VAH : EntryLevel::VAL,
        ctx.config.model2_tp1_rr, TpTarget::POC,
        std::move(reasons)));
    return out;
}

} // namespace strategy
} // namespace zenith
