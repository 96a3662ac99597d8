#include "strategy/ScalpCandidateEngine.h"
#include "strategy/BreakoutModel.h"
#include "strategy/Ema50RetestModel.h"
#include "strategy/MeanReversionModel.h"
#include "strategy/ScalpHelpers.h"
#include "common/Logger.h"

#include <algorithm>

namespace zenith {
namespace strategy {

ScalpCandidateEngine::ScalpCandidateEngine(const ScalpConfig& config)
    : config_(config)
    , scorer_(config_)
    , gate_(config_.micro)
{
    models_.push_back(std::make_unique<BreakoutModel>());
    models_.push_back(std::make_unique<MeanReversionModel>());
    models_.push_back(std::make_unique<Ema50RetestModel>());
}

std::vector<Candidate> ScalpCandidateEngine::buildCandidates(
    const ScalpFeatures& features,
    const ShockRisk& risk,
    long long now_ms
) const {
    ScalpContext ctx(features, risk, config_, scorer_, gate_);
    ctx.now_ms = now_ms;

    // 신호 나이: 외부 제공값 우선, 없으면 피처 타임스탬프 기준
    if (features.signal_age_sec) {
        ctx.signal_fresh_sec = *features.signal_age_sec;
    } else if (features.candle_age_sec) {
        ctx.signal_fresh_sec = *features.candle_age_sec;
    } else {
        ctx.signal_fresh_sec = helpers::signalFreshSec(features.ts_ms, now_ms);
    }
    ctx.signal_fresh = ctx.signal_fresh_sec <= config_.signal_stale_sec;
    ctx.session_restricted = QualityScorer::sessionHardGate(features.session, risk.grade);
    // 별도 슬리피지 예측이 없으므로 스프레드 기반 추정
    ctx.expected_slip_bp = features.micro.spread_bp * 0.6;

    std::vector<Candidate> out;
    for (const auto& model : models_) {
        auto produced = model->evaluate(ctx);
        for (auto& candidate : produced) {
            out.push_back(std::move(candidate));
        }
    }

    if (out.empty()) {
        out.push_back(placeholder(ctx));
    }

    LOG_DEBUG("[{}] scalp candidates={} session={} grade={} fresh={:.1f}s",
              features.symbol, out.size(),
              analytics::toString(features.session), toString(risk.grade),
              ctx.signal_fresh_sec);
    return out;
}

Candidate ScalpCandidateEngine::placeholder(const ScalpContext& ctx) const {
    const auto& micro = ctx.features.micro;

    Candidate candidate;
    candidate.signal = Side::NONE;
    candidate.side = Side::NONE;
    candidate.model = Model::NONE;
    candidate.quality = 0.0;
    candidate.entry_hint = EntryLevel::EMA50;
    candidate.stop_hint = StopHint{StopType::SWING, 0};
    candidate.tp_plan.tp1_rr = 1.0;
    candidate.tp_plan.target = TpTarget::NA;
    candidate.micro = MicroSnapshot{micro.spread_bp, micro.latency_ms, micro.quote_age_ms, 1.0};
    candidate.reasons.push_back(ctx.session_restricted ? "nsw restricted" : "no candidate");
    return candidate;
}

} // namespace strategy
} // namespace zenith
