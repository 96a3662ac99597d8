#include "strategy/DecisionCache.h"
#include "TestFakes.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>

using namespace zenith;
using zenith::strategy::DecisionCache;
using zenith::strategy::OracleHints;
using zenith::test::FakeStrategyOracle;

namespace {

analytics::MarketSnapshot makeSnapshot(double price, const std::string& local_bias = "LONG") {
    analytics::MarketSnapshot snapshot;
    snapshot.symbol = "BTCUSDT";
    snapshot.interval = "1m";
    snapshot.metrics.last_price = price;
    snapshot.metrics.change_5m_pct = 0.5;
    snapshot.metrics.rsi14 = 55.0;
    snapshot.metrics.volume_ratio = 1.2;
    snapshot.metrics.mfi14 = 50.0;
    snapshot.local.bias = local_bias == "SHORT" ? Bias::SHORT : Bias::LONG;
    snapshot.local.confidence = 0.6;
    snapshot.local.edge_score = 0.5;
    snapshot.local.reasoning = "EMA trend up";
    snapshot.context = {
        {"symbol", "BTCUSDT"},
        {"price", price},
        {"change_5m_pct", 0.5},
        {"rsi_14", 55.0},
        {"support", 95.0},
        {"local_signal", {{"bias", local_bias}, {"confidence", 0.6}, {"edgeScore", 0.5},
                          {"reasoning", "EMA trend up"}}}
    };
    return snapshot;
}

Position makePosition(PositionSide side) {
    Position position;
    position.symbol = "BTCUSDT";
    position.side = side;
    position.quantity = 0.01;
    position.entry_price = 99.0;
    return position;
}

bool contains(const std::string& text, const std::string& needle) {
    return text.find(needle) != std::string::npos;
}

} // namespace

int main() {
    const OracleHints hints{5, 10.0, 400.0};

    // 1. 재사용: 안정 구간, 쿨다운 구간, 만료
    {
        FakeStrategyOracle oracle;
        oracle.responses.push_back(FakeStrategyOracle::make(Bias::LONG, 0.7, "Trend continuation"));
        DecisionCache cache(oracle);

        const auto first = cache.resolve(makeSnapshot(100.0), std::nullopt, hints, 0);
        assert(oracle.calls == 1);
        assert(first.bias == Bias::LONG);
        assert(first.action == DecisionAction::ENTRY);
        assert(first.source == DecisionSource::ORACLE);
        assert(std::abs(first.confidence - 0.7) < 1e-9);
        assert(first.local_edge.has_value() && std::abs(*first.local_edge - 0.5) < 1e-9);
        if (first.reasoning != "Trend continuation · Δ5m 0.5%, RSI 55 · Vol 1.2 · MFI 50") {
            std::cerr << "[TEST] unexpected oracle reasoning: " << first.reasoning << "\n";
            return 1;
        }
        assert(oracle.last_context["account"]["leverage"] == 5);
        assert(oracle.last_context["active_position"]["side"] == "flat");
        assert(oracle.last_context.contains("support"));

        const auto cooled = cache.resolve(makeSnapshot(100.2), std::nullopt, hints, 10000);
        assert(oracle.calls == 1);
        assert(contains(cooled.reasoning, "Cooldown reuse"));
        assert(cooled.entry_price.has_value() && *cooled.entry_price == 100.2);

        const auto stable = cache.resolve(makeSnapshot(100.25), std::nullopt, hints, 40000);
        if (oracle.calls != 1 || !contains(stable.reasoning, "Maintaining stance (price drift 0.05%)")) {
            std::cerr << "[TEST] stable context should reuse cached decision\n";
            return 1;
        }

        cache.resolve(makeSnapshot(100.25), std::nullopt, hints, 300000);
        assert(oracle.calls == 2);

        // 로컬 bias 변화는 즉시 재요청
        cache.resolve(makeSnapshot(100.25, "SHORT"), std::nullopt, hints, 310000);
        assert(oracle.calls == 3);

        cache.invalidate("BTCUSDT");
        assert(!cache.entry("BTCUSDT").has_value());
    }

    // 2. 강한 로컬 신호는 사유/신뢰도 보강, 프롬프트 축약
    {
        FakeStrategyOracle oracle;
        oracle.responses.push_back(FakeStrategyOracle::make(Bias::LONG, 0.7, "Breakout"));
        DecisionCache cache(oracle);

        auto snapshot = makeSnapshot(100.0);
        snapshot.local.confidence = 0.85;
        snapshot.local.edge_score = 0.7;
        snapshot.local.reasoning = "EMA trend up · Δ5m +1%";
        const auto decision = cache.resolve(snapshot, std::nullopt, hints, 0);

        assert(contains(decision.reasoning, " · Local confirms: EMA trend up · Δ5m +1% · edge 70% · confidence 85%"));
        assert(std::abs(decision.confidence - 0.85) < 1e-9);
        assert(!oracle.last_context.contains("support"));
    }

    // 3. 포지션 문맥: 유지 / 반전 / 청산
    {
        FakeStrategyOracle oracle;
        oracle.responses.push_back(FakeStrategyOracle::make(Bias::LONG, 0.7, "Uptrend"));
        DecisionCache cache(oracle);

        const auto hold = cache.resolve(makeSnapshot(100.0), makePosition(PositionSide::LONG), hints, 0);
        assert(hold.action == DecisionAction::HOLD);
        assert(contains(hold.reasoning, "Maintaining"));
        assert(oracle.last_context["active_position"]["entryPrice"] == 99.0);

        cache.invalidate("BTCUSDT");
        const auto flip = cache.resolve(makeSnapshot(100.0), makePosition(PositionSide::SHORT), hints, 1000);
        assert(flip.action == DecisionAction::FLIP);
        assert(contains(flip.reasoning, "Flip"));

        cache.invalidate("BTCUSDT");
        oracle.responses.clear();
        oracle.responses.push_back(FakeStrategyOracle::make(Bias::FLAT, 0.7, "Momentum faded"));
        const auto exit = cache.resolve(makeSnapshot(100.0), makePosition(PositionSide::LONG), hints, 2000);
        assert(exit.action == DecisionAction::EXIT);
        assert(contains(exit.reasoning, "Closing"));
    }

    // 4. 오라클 실패: 포지션 있으면 청산, 없으면 관망. fallback 은 재사용 안 함
    {
        FakeStrategyOracle oracle;
        oracle.fail = true;
        DecisionCache cache(oracle);

        const auto exit = cache.resolve(makeSnapshot(100.0), makePosition(PositionSide::LONG), hints, 0);
        if (exit.action != DecisionAction::EXIT || exit.source != DecisionSource::FALLBACK) {
            std::cerr << "[TEST] oracle failure with open position should exit\n";
            return 1;
        }
        assert(exit.bias == Bias::FLAT);
        assert(std::abs(exit.confidence - 0.8) < 1e-9);
        assert(contains(exit.reasoning, "LLM decision unavailable"));

        cache.invalidate("BTCUSDT");
        const auto hold = cache.resolve(makeSnapshot(100.0), std::nullopt, hints, 1000);
        assert(hold.action == DecisionAction::HOLD);
        assert(hold.bias == Bias::FLAT);
        assert(std::abs(hold.confidence - 0.6) < 1e-9);

        cache.resolve(makeSnapshot(100.0), std::nullopt, hints, 2000);
        assert(oracle.calls == 3);
    }

    // 5. conviction gate
    {
        Decision d;
        d.bias = Bias::LONG;
        d.confidence = 0.62;
        d.local_edge = 0.4;
        d.local_confidence = 0.55;
        assert(DecisionCache::passesConvictionGate(d));

        d.local_confidence.reset();
        assert(DecisionCache::passesConvictionGate(d));

        d.local_confidence = 0.5;
        assert(!DecisionCache::passesConvictionGate(d));

        d.local_confidence = 0.9;
        d.confidence = 0.61;
        assert(!DecisionCache::passesConvictionGate(d));

        d.confidence = 0.9;
        d.local_edge.reset();
        assert(!DecisionCache::passesConvictionGate(d));
    }

    // 6. context shift
    {
        const nlohmann::json a = {{"change_5m_pct", 0.5}, {"rsi_14", 55.0}, {"local_signal", {{"bias", "LONG"}}}};
        nlohmann::json b = a;
        b["change_5m_pct"] = 1.1;
        assert(std::abs(DecisionCache::computeContextShift(a, b) - 0.1) < 1e-9);
        b["rsi_14"] = 70.0;
        assert(std::abs(DecisionCache::computeContextShift(a, b) - 0.15) < 1e-9);
        b["local_signal"]["bias"] = "SHORT";
        assert(std::isinf(DecisionCache::computeContextShift(a, b)));
        assert(DecisionCache::computeContextShift(nullptr, a) == 0.0);

        assert(DecisionCache::trimReasoning("a b c d", 2) == "a b...");
        assert(DecisionCache::trimReasoning("a  b", 5) == "a b");
    }

    std::cout << "[TEST] DecisionCache PASSED\n";
    return 0;
}
