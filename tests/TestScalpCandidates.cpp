#include "strategy/MicrostructureGate.h"
#include "strategy/PolicyMerger.h"
#include "strategy/QualityScorer.h"
#include "strategy/ScalpCandidateEngine.h"
#include "strategy/ScalpHelpers.h"
#include "TestFakes.h"

#include <algorithm>
#include <cassert>
#include <cmath>
#include <iostream>

using namespace zenith;
using namespace zenith::strategy;
using zenith::analytics::TradingSession;

namespace {

constexpr long long kNow = 1700000400000LL;

// 직전 봉이 VAH 위로 찔렀다가 가치 영역 안에서 마감 -> MEAN 숏 후보
ScalpFeatures meanReversionFeatures(TradingSession session) {
    ScalpFeatures f;
    f.ts_ms = kNow;
    f.symbol = "BTCUSDT";
    f.candles = {
        Candle(100.0, 100.4, 99.8, 100.2, 120.0, kNow - 180000, kNow - 120001),
        Candle(100.2, 101.5, 100.0, 100.8, 150.0, kNow - 120000, kNow - 60001),
        Candle(100.8, 101.0, 100.2, 100.5, 130.0, kNow - 60000, kNow - 1),
    };
    f.close = 100.5;
    f.rsi14 = 50.0;
    f.atr22 = 1.0;
    f.vp.vah = 101.0;
    f.vp.val = 99.0;
    f.vp.poc = 100.0;
    f.orderflow.buy = 100.0;
    f.orderflow.sell = 300.0;
    f.micro.spread_bp = 1.0;
    f.micro.latency_ms = 50.0;
    f.micro.quote_age_ms = 50.0;
    f.micro.bid_qty10 = 10.0;
    f.micro.ask_qty10 = 10.0;
    f.session = session;
    f.signal_age_sec = 1.0;
    return f;
}

// 작은 양봉 12개 뒤에 마지막 봉 c0 (직전 봉 중 하나의 고가만 100.5)
std::vector<Candle> quietCandles(const Candle& last) {
    std::vector<Candle> candles;
    for (int i = 0; i < 12; ++i) {
        const long long t = kNow - static_cast<long long>(13 - i) * 60000LL;
        const double high = i == 7 ? 100.5 : 100.0;
        candles.emplace_back(99.6, high, 99.5, 99.8, 100.0, t, t + 59999);
    }
    candles.push_back(last);
    return candles;
}

ScalpFeatures baseFeatures(std::vector<Candle> candles) {
    ScalpFeatures f;
    f.ts_ms = kNow;
    f.symbol = "BTCUSDT";
    f.close = candles.back().close;
    f.candles = std::move(candles);
    f.rsi14 = 60.0;
    f.atr22 = 1.0;
    f.orderflow.buy = 300.0;
    f.orderflow.sell = 100.0;
    f.micro.spread_bp = 1.0;
    f.micro.latency_ms = 50.0;
    f.micro.quote_age_ms = 50.0;
    f.micro.bid_qty10 = 10.0;
    f.micro.ask_qty10 = 10.0;
    f.session = TradingSession::LONDON;
    f.signal_age_sec = 1.0;
    return f;
}

// VAH 101 위로 장대 양봉 마감, 정배열 EMA, 대량 매수 -> BREAKOUT 롱
ScalpFeatures breakoutFeatures() {
    auto f = baseFeatures(quietCandles(Candle(100.4, 101.55, 100.35, 101.5, 400.0, kNow - 60000, kNow - 1)));
    f.ema25 = 100.5;
    f.ema50 = 100.0;
    f.ema100 = 99.5;
    f.vp.vah = 101.0;
    f.vp.val = 98.0;
    f.vp.poc = 99.5;
    f.orderflow.bubble = true;
    return f;
}

// EMA50(100.0) 아래에서 열고 위에서 마감, 직전 10봉 고점 100.5 돌파 -> EMA50 롱
ScalpFeatures ema50RetestFeatures() {
    auto f = baseFeatures(quietCandles(Candle(99.8, 101.1, 99.7, 101.0, 300.0, kNow - 60000, kNow - 1)));
    f.ema50 = 100.0;
    f.vp.vah = 103.0;
    f.vp.val = 97.0;
    f.vp.poc = 101.0;
    return f;
}

const Candidate* findModel(const std::vector<Candidate>& candidates, Model model) {
    for (const auto& c : candidates) {
        if (c.model == model) return &c;
    }
    return nullptr;
}

bool hasReason(const Candidate& candidate, const std::string& reason) {
    return std::find(candidate.reasons.begin(), candidate.reasons.end(), reason) != candidate.reasons.end();
}

} // namespace

int main() {
    ScalpConfig config;

    // 1. 품질 점수 구간
    {
        assert(QualityScorer::orderFlowScore(3.5) == 1.0);
        assert(QualityScorer::orderFlowScore(2.0) == 0.8);
        assert(QualityScorer::orderFlowScore(1.6) == 0.5);
        assert(QualityScorer::orderFlowScore(1.2) == 0.0);
        assert(QualityScorer::patternScore(4) == 1.0);
        assert(QualityScorer::patternScore(2) == 0.66);
        assert(QualityScorer::patternScore(1) == 0.33);
        assert(QualityScorer::patternScore(0) == 0.0);

        QualityScorer scorer(config);
        QualityInputs all;
        all.regime_ok = true;
        all.orderflow_ratio = 3.0;
        all.pattern_count = 3;
        all.rsi_ok = true;
        all.fvg_ok = true;
        all.vp_near_ok = true;

        assert(std::abs(scorer.score(all, TradingSession::LONDON, RiskGrade::NONE) - 1.0) < 1e-9);
        assert(std::abs(scorer.score(all, TradingSession::ASIA, RiskGrade::NONE) - 0.8) < 1e-9);
        assert(std::abs(scorer.score(all, TradingSession::LONDON, RiskGrade::HIGH) - 0.8) < 1e-9);
        assert(std::abs(scorer.score(all, TradingSession::ASIA, RiskGrade::CRITICAL) - 0.56) < 1e-9);
        assert(scorer.score(all, TradingSession::NY, RiskGrade::NONE) == 1.0);
        assert(scorer.thresholdFor(Model::BREAKOUT) == 0.75);
        assert(scorer.thresholdFor(Model::EMA50) == 0.72);
    }

    // 2. NY/BRIDGE + High/Critical 는 입력과 무관하게 0
    {
        QualityScorer scorer(config);
        QualityInputs all;
        all.regime_ok = true;
        all.orderflow_ratio = 10.0;
        all.pattern_count = 5;
        all.rsi_ok = true;
        all.fvg_ok = true;
        all.vp_near_ok = true;

        for (auto session : {TradingSession::NY, TradingSession::BRIDGE}) {
            for (auto grade : {RiskGrade::HIGH, RiskGrade::CRITICAL}) {
                if (scorer.score(all, session, grade) != 0.0) {
                    std::cerr << "[TEST] hard gate must zero quality for "
                              << analytics::toString(session) << "/" << toString(grade) << "\n";
                    return 1;
                }
            }
        }
        assert(scorer.score(all, TradingSession::NY, RiskGrade::NOTICE) > 0.0);
        assert(!QualityScorer::sessionHardGate(TradingSession::LONDON, RiskGrade::CRITICAL));
        assert(!QualityScorer::sessionHardGate(TradingSession::ASIA, RiskGrade::HIGH));
    }

    // 3. 미시구조 게이트: High 등급에서 캡 강화
    {
        MicrostructureGate gate(config.micro);
        const auto normal = gate.effectiveCaps(Side::LONG, RiskGrade::NONE);
        const auto high = gate.effectiveCaps(Side::LONG, RiskGrade::HIGH);
        assert(normal.spread_bp == 2.5 && normal.slippage_bp == 3.0);
        assert(high.spread_bp == 2.0 && high.slippage_bp == 2.5);
        assert(high.latency_ms == 150.0 && high.quote_age_ms == 200.0);

        MicroInputs in;
        in.side = Side::LONG;
        in.spread_bp = 2.2;
        in.expected_slip_bp = 1.3;
        in.latency_ms = 80.0;
        in.quote_age_ms = 100.0;
        in.depth_bias = 1.1;
        assert(gate.passes(in, RiskGrade::NONE));
        assert(!gate.passes(in, RiskGrade::HIGH));
        const auto breaches = gate.breaches(in, RiskGrade::HIGH);
        assert(breaches.size() == 1 && breaches.front() == "spread");

        in.spread_bp = 1.0;
        in.depth_bias = 0.5;
        in.latency_ms = 200.0;
        const auto two = gate.breaches(in, RiskGrade::NONE);
        assert(two.size() == 2);

        in.depth_bias = 1.1;
        in.latency_ms = 80.0;
        assert(gate.admit(in, TradingSession::LONDON, RiskGrade::HIGH));
        assert(!gate.admit(in, TradingSession::NY, RiskGrade::HIGH));
    }

    // 4. MEAN 후보 생성과 채택
    {
        ScalpCandidateEngine engine(config);
        const auto candidates = engine.buildCandidates(
            meanReversionFeatures(TradingSession::LONDON), ShockRisk{}, kNow);
        const Candidate* mean = findModel(candidates, Model::MEAN);
        if (mean == nullptr) {
            std::cerr << "[TEST] mean reversion candidate expected\n";
            return 1;
        }
        assert(mean->side == Side::SHORT);
        assert(mean->signal == Side::SHORT);
        assert(mean->quality > 0.74 && mean->quality <= 1.0);
        assert(mean->entry_hint == EntryLevel::VAH);
        assert(mean->tp_plan.target == TpTarget::POC);
        assert(hasReason(*mean, "microOk=true"));
        assert(hasReason(*mean, "signalFresh=1.0s"));
        assert(findModel(candidates, Model::BREAKOUT) == nullptr);
    }

    // 5. 같은 피처라도 NY + Critical 이면 품질 0, 신호 없음
    {
        ScalpCandidateEngine engine(config);
        ShockRisk critical;
        critical.grade = RiskGrade::CRITICAL;
        const auto candidates = engine.buildCandidates(
            meanReversionFeatures(TradingSession::NY), critical, kNow);
        const Candidate* mean = findModel(candidates, Model::MEAN);
        assert(mean != nullptr);
        if (mean->quality != 0.0 || mean->signal != Side::NONE) {
            std::cerr << "[TEST] restricted session must produce zero quality\n";
            return 1;
        }
        assert(hasReason(*mean, "microOk=false"));
    }

    // 6. 오래된 신호는 신호 없음
    {
        ScalpCandidateEngine engine(config);
        auto features = meanReversionFeatures(TradingSession::LONDON);
        features.signal_age_sec = 30.0;
        const auto candidates = engine.buildCandidates(features, ShockRisk{}, kNow);
        const Candidate* mean = findModel(candidates, Model::MEAN);
        assert(mean != nullptr);
        assert(mean->signal == Side::NONE);
        assert(mean->quality > 0.0);
    }

    // 7. 후보가 없으면 자리표시 후보 1개
    {
        ScalpCandidateEngine engine(config);
        auto features = meanReversionFeatures(TradingSession::LONDON);
        features.candles.erase(features.candles.begin(), features.candles.end() - 1);

        const auto none = engine.buildCandidates(features, ShockRisk{}, kNow);
        assert(none.size() == 1);
        assert(none.front().signal == Side::NONE && none.front().model == Model::NONE);
        assert(none.front().quality == 0.0);
        assert(none.front().reasons.front() == "no candidate");

        features.session = TradingSession::BRIDGE;
        ShockRisk high;
        high.grade = RiskGrade::HIGH;
        const auto restricted = engine.buildCandidates(features, high, kNow);
        assert(restricted.size() == 1);
        assert(restricted.front().reasons.front() == "nsw restricted");
    }

    // 8. 정책 병합: 채택, 불허, 오라클 실패
    {
        ScalpCandidateEngine engine(config);
        const auto features = meanReversionFeatures(TradingSession::LONDON);
        const auto candidates = engine.buildCandidates(features, ShockRisk{}, kNow);

        test::FakePolicyOracle oracle;
        oracle.verdict.allow = true;
        oracle.verdict.model = Model::MEAN;
        oracle.verdict.side = Side::SHORT;
        oracle.verdict.quality = 0.72;
        oracle.verdict.tp_rr = 1.5;
        oracle.verdict.notes = {"range day", "fade upper", "thin book", "ignored"};

        PolicyMerger merger(oracle, config);
        const auto merged = merger.merge(features, ShockRisk{}, candidates);
        assert(oracle.calls == 1);
        assert(oracle.last_payload["candidates"].size() == candidates.size());
        assert(oracle.last_payload["features"]["session"] == analytics::toString(TradingSession::LONDON));
        assert(oracle.last_payload["nsw"]["grade"] == "None");
        assert(merged.allowed);

        const auto best = merged.best();
        if (!best) {
            std::cerr << "[TEST] adopted candidate expected\n";
            return 1;
        }
        assert(best->model == Model::MEAN && best->signal == Side::SHORT);
        assert(std::abs(best->quality - 0.72) < 1e-9);
        assert(best->tp_plan.tp1_rr == 1.5);
        assert(hasReason(*best, "thin book"));
        assert(!hasReason(*best, "ignored"));

        oracle.verdict.allow = false;
        const auto denied = merger.merge(features, ShockRisk{}, candidates);
        assert(!denied.allowed);
        assert(denied.candidates.size() == 1);
        assert(denied.candidates.front().model == Model::NONE);
        assert(hasReason(denied.candidates.front(), "policy: disallow"));
        assert(!denied.best());

        oracle.fail = true;
        const auto failed = merger.merge(features, ShockRisk{}, candidates);
        assert(!failed.allowed);
        assert(!failed.best());
    }

    // 9. BREAKOUT 후보
    {
        ScalpCandidateEngine engine(config);
        const auto candidates = engine.buildCandidates(breakoutFeatures(), ShockRisk{}, kNow);
        const Candidate* breakout = findModel(candidates, Model::BREAKOUT);
        if (breakout == nullptr) {
            std::cerr << "[TEST] breakout candidate expected\n";
            return 1;
        }
        assert(breakout->side == Side::LONG);
        assert(breakout->signal == Side::LONG);
        assert(breakout->quality >= config.breakout_threshold);
        assert(breakout->tp_plan.tp1_rr == config.model1_tp1_rr);
        assert(breakout->tp_plan.target == TpTarget::NEXT_VA);
        assert(hasReason(*breakout, "regime=true"));
        assert(hasReason(*breakout, "retrace=true"));
        assert(hasReason(*breakout, "distanceATR=0.50"));

        // 몸통이 평균의 1.5배 미만이면 돌파 아님
        auto weak = breakoutFeatures();
        weak.candles.back() = Candle(101.3, 101.55, 100.9, 101.5, 400.0, kNow - 60000, kNow - 1);
        const auto none = engine.buildCandidates(weak, ShockRisk{}, kNow);
        assert(findModel(none, Model::BREAKOUT) == nullptr);
    }

    // 10. EMA50 재시험 후보: 스윙은 현재 봉 이전 10봉 기준
    {
        ScalpCandidateEngine engine(config);
        const auto features = ema50RetestFeatures();
        assert(helpers::lastSwing(features, Side::SHORT) == 100.5);
        assert(helpers::lastSwing(features, Side::LONG) == 99.5);

        const auto candidates = engine.buildCandidates(features, ShockRisk{}, kNow);
        const Candidate* retest = findModel(candidates, Model::EMA50);
        if (retest == nullptr) {
            std::cerr << "[TEST] EMA50 retest candidate expected\n";
            return 1;
        }
        assert(retest->side == Side::LONG);
        assert(retest->signal == Side::LONG);
        assert(retest->entry_hint == EntryLevel::EMA50);
        assert(retest->tp_plan.tp1_rr == config.model3_tp1_rr);
        assert(hasReason(*retest, "cross50=up"));
        assert(hasReason(*retest, "swingBreak=true"));

        // 직전 고점 아래 마감이면 스윙 돌파 실패
        auto below = ema50RetestFeatures();
        below.candles[7] = Candle(99.6, 101.4, 99.5, 99.8, 100.0, kNow - 360000, kNow - 300001);
        assert(findModel(engine.buildCandidates(below, ShockRisk{}, kNow), Model::EMA50) == nullptr);

        // 하향 교차는 스윙 저점 이탈 필요
        auto down = baseFeatures(quietCandles(Candle(100.2, 100.3, 98.9, 99.0, 300.0, kNow - 60000, kNow - 1)));
        down.ema50 = 100.0;
        down.rsi14 = 40.0;
        down.vp.vah = 103.0;
        down.vp.val = 97.0;
        down.vp.poc = 99.0;
        const auto short_candidates = engine.buildCandidates(down, ShockRisk{}, kNow);
        const Candidate* short_retest = findModel(short_candidates, Model::EMA50);
        assert(short_retest != nullptr && short_retest->side == Side::SHORT);
    }

    std::cout << "[TEST] ScalpCandidates PASSED\n";
    return 0;
}
