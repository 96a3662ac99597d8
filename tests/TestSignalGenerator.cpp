#include "strategy/SignalGenerator.h"

#include <cassert>
#include <cmath>
#include <iostream>

using zenith::Bias;
using zenith::analytics::SnapshotMetrics;
using zenith::strategy::SignalGenerator;

namespace {

SnapshotMetrics bullishMetrics() {
    SnapshotMetrics m;
    m.last_price = 100.0;
    m.ema21 = 102.0;
    m.ema55 = 100.0;
    m.change_5m_pct = 1.0;
    m.change_15m_pct = 1.5;
    m.rsi14 = 66.0;
    m.volume_ratio = 1.8;
    m.support = 95.0;
    m.resistance = 110.0;
    return m;
}

} // namespace

int main() {
    // 1. 상승 지표 -> LONG, 상위 3개 driver 로 사유 구성
    {
        const auto signal = SignalGenerator::derive(bullishMetrics());
        if (signal.bias != Bias::LONG) {
            std::cerr << "[TEST] bullish metrics should produce LONG\n";
            return 1;
        }
        assert(std::abs(signal.confidence - 0.87) < 1e-9);
        assert(std::abs(signal.edge_score - 1.0) < 1e-9);
        assert(std::abs(signal.long_score - 1.72) < 1e-9);
        assert(signal.short_score == 0.0);
        if (signal.reasoning != "Δ15m +1.5% · Δ5m +1% · Volume ratio 1.8") {
            std::cerr << "[TEST] unexpected reasoning: " << signal.reasoning << "\n";
            return 1;
        }
    }

    // 2. 중립 -> FLAT, 기본 신뢰도
    {
        SnapshotMetrics m;
        m.last_price = 100.0;
        m.ema21 = 100.0;
        m.ema55 = 100.0;
        m.support = 90.0;
        m.resistance = 110.0;
        const auto signal = SignalGenerator::derive(m);
        assert(signal.bias == Bias::FLAT);
        assert(std::abs(signal.confidence - 0.4) < 1e-9);
        assert(signal.edge_score == 0.0);
        assert(signal.reasoning == "Signals mixed across indicators");
    }

    // 3. 저항선 앞 long 은 감점
    {
        auto m = bullishMetrics();
        m.last_price = 110.0;
        const auto base = SignalGenerator::derive(bullishMetrics());
        const auto signal = SignalGenerator::derive(m);
        assert(signal.bias == Bias::LONG);
        assert(std::abs(signal.short_score - 0.2) < 1e-9);
        assert(std::abs(signal.confidence - 0.66) < 1e-9);
        assert(signal.confidence < base.confidence);
    }

    // 4. 하락 지표 -> SHORT
    {
        SnapshotMetrics m;
        m.last_price = 100.0;
        m.ema21 = 98.0;
        m.ema55 = 100.0;
        m.change_5m_pct = -1.0;
        m.change_15m_pct = -1.5;
        m.rsi14 = 34.0;
        m.volume_ratio = 0.5;
        m.support = 95.0;
        m.resistance = 110.0;
        const auto signal = SignalGenerator::derive(m);
        assert(signal.bias == Bias::SHORT);
        assert(signal.long_score == 0.0);
        assert(signal.reasoning.rfind("Δ15m -1.5% · Δ5m -1%", 0) == 0);
        assert(signal.confidence >= 0.32 && signal.confidence <= 0.94);
    }

    // 5. 고변동성 감점 후에도 하한 유지
    {
        SnapshotMetrics m;
        m.last_price = 100.0;
        m.ema21 = 100.0;
        m.ema55 = 100.0;
        m.support = 90.0;
        m.resistance = 110.0;
        m.volatility_pct = 3.0;
        const auto signal = SignalGenerator::derive(m);
        assert(std::abs(signal.confidence - 0.35) < 1e-9);
    }

    std::cout << "[TEST] SignalGenerator PASSED\n";
    return 0;
}
