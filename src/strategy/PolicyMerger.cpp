#include "strategy/PolicyMerger.h"
#include "common/Logger.h"
#include "common/StepSizeHelper.h"

#include <algorithm>

namespace zenith {
namespace strategy {

std::optional<Candidate> MergedPolicy::best() const {
    for (const auto& c : candidates) {
        if (c.signal != Side::NONE && c.quality >= quality_threshold) {
            return c;
        }
    }
    return std::nullopt;
}

PolicyMerger::PolicyMerger(core::IPolicyOracle& oracle, const ScalpConfig& config)
    : oracle_(oracle)
    , config_(config)
{
}

nlohmann::json PolicyMerger::buildPayload(
    const ScalpFeatures& f,
    const ShockRisk& risk,
    const std::vector<Candidate>& candidates
) {
    using common::roundTo;

    nlohmann::json features = {
        {"symbol", f.symbol},
        {"close", f.close},
        {"ema25", roundTo(f.ema25, 4)},
        {"ema50", roundTo(f.ema50, 4)},
        {"ema100", roundTo(f.ema100, 4)},
        {"rsi14", roundTo(f.rsi14, 2)},
        {"atr22", roundTo(f.atr22, 4)},
        {"vp", {{"vah", f.vp.vah}, {"val", f.vp.val}, {"poc", f.vp.poc}}},
        {"orderflow", {{"buy", f.orderflow.buy}, {"sell", f.orderflow.sell}, {"bubble", f.orderflow.bubble}}},
        {"micro", {
            {"spreadBp", roundTo(f.micro.spread_bp, 3)},
            {"latencyMs", f.micro.latency_ms},
            {"quoteAgeMs", f.micro.quote_age_ms}
        }},
        {"session", analytics::toString(f.session)},
        {"regime", toString(f.regime)}
    };

    nlohmann::json nsw = {
        {"aggImpact", risk.agg_impact},
        {"grade", toString(risk.grade)},
        {"policy", {
            {"sizeMul", risk.policy.size_mul},
            {"forbidMarket", risk.policy.forbid_market},
            {"modelPref", toString(risk.policy.model_pref)},
            {"spreadCapBp", risk.policy.spread_cap_bp}
        }}
    };

    nlohmann::json list = nlohmann::json::array();
    for (const auto& c : candidates) {
        std::vector<std::string> reasons(
            c.reasons.begin(),
            c.reasons.begin() + std::min(c.reasons.size(), kMaxReasons));
        // NONE 모델은 스키마상 허용되지 않음
        list.push_back({
            {"model", c.model == Model::NONE ? "BREAKOUT" : toString(c.model)},
            {"side", toString(c.signal)},
            {"reasons", reasons}
        });
    }

    return {{"features", features}, {"nsw", nsw}, {"candidates", list}};
}

MergedPolicy PolicyMerger::merge(
    const ScalpFeatures& features,
    const ShockRisk& risk,
    const std::vector<Candidate>& candidates
) {
    MergedPolicy result;
    result.session = features.session;
    result.regime = features.regime;
    result.quality_threshold = config_.quality_threshold;

    std::vector<Candidate> sorted = candidates;
    std::stable_sort(sorted.begin(), sorted.end(),
                     [](const Candidate& a, const Candidate& b) { return a.quality > b.quality; });
    if (sorted.size() > kMaxCandidates) {
        sorted.resize(kMaxCandidates);
    }
    if (sorted.empty()) {
        return result;
    }

    PolicyVerdict verdict;
    try {
        verdict = oracle_.decide(buildPayload(features, risk, sorted));
    } catch (const std::exception& e) {
        // 정책 판단 불가 -> 불허와 동일하게 처리
        LOG_WARN("[{}] policy oracle failed: {}", features.symbol, e.what());
        verdict = PolicyVerdict{};
    }

    if (!verdict.allow) {
        Candidate fallback = sorted.front();
        fallback.signal = Side::NONE;
        fallback.model = Model::NONE;
        fallback.quality = 0.0;
        fallback.reasons.push_back("policy: disallow");
        result.candidates.push_back(std::move(fallback));
        return result;
    }

    result.allowed = true;
    auto pick = std::find_if(sorted.begin(), sorted.end(), [&](const Candidate& c) {
        return c.model == verdict.model && c.signal == verdict.side && c.signal != Side::NONE;
    });

    if (pick != sorted.end()) {
        pick->quality = std::min(1.0, std::min(pick->quality, verdict.quality));
        if (verdict.tp_rr) {
            pick->tp_plan.tp1_rr = *verdict.tp_rr;
        }
        if (verdict.entry_hint) {
            pick->entry_hint = *verdict.entry_hint;
        }
        const size_t notes = std::min(verdict.notes.size(), kMaxNotes);
        for (size_t i = 0; i < notes; ++i) {
            pick->reasons.push_back(verdict.notes[i]);
        }
        std::rotate(sorted.begin(), pick, pick + 1);
        LOG_INFO("[{}] policy adopted {} {} quality={:.2f}",
                 features.symbol, toString(sorted.front().model),
                 toString(sorted.front().signal), sorted.front().quality);
    }

    result.candidates = std::move(sorted);
    return result;
}

} // namespace strategy
} // namespace zenith
