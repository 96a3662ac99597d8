#include "strategy/SignalGenerator.h"
#include "common/StepSizeHelper.h"

#include <algorithm>
#include <cmath>

namespace zenith {
namespace strategy {

namespace {
using common::formatCompact;
using common::roundTo;

constexpr double kBiasThreshold = 0.08;
constexpr double kMinConfidence = 0.32;
constexpr double kMaxConfidence = 0.94;
constexpr double kPenaltyFloor = 0.35;

std::string signedPct(double value) {
    return (value > 0.0 ? "+" : "") + formatCompact(value, 2) + "%";
}
} // namespace

void SignalGenerator::collectDrivers(
    const analytics::SnapshotMetrics& m,
    std::vector<Driver>& long_drivers,
    std::vector<Driver>& short_drivers
) {
    const double trend_slope = m.ema21 - m.ema55;
    const double trend_weight = std::min(std::abs(trend_slope) / std::max(m.ema55, 1.0), 0.6);
    if (trend_slope > 0.0) {
        long_drivers.push_back({trend_weight, "EMA trend up"});
    } else if (trend_slope < 0.0) {
        short_drivers.push_back({trend_weight, "EMA trend down"});
    }

    if (m.change_5m_pct > 0.2) {
        long_drivers.push_back({std::min(m.change_5m_pct / 2.0, 0.7), "Δ5m " + signedPct(m.change_5m_pct)});
    }
    if (m.change_5m_pct < -0.2) {
        short_drivers.push_back({std::min(std::abs(m.change_5m_pct) / 2.0, 0.7), "Δ5m " + signedPct(m.change_5m_pct)});
    }

    if (m.change_15m_pct > 0.25) {
        long_drivers.push_back({std::min(m.change_15m_pct / 2.5, 0.6), "Δ15m " + signedPct(m.change_15m_pct)});
    }
    if (m.change_15m_pct < -0.25) {
        short_drivers.push_back({std::min(std::abs(m.change_15m_pct) / 2.5, 0.6), "Δ15m " + signedPct(m.change_15m_pct)});
    }

    if (m.rsi14 > 60.0) {
        long_drivers.push_back({std::min((m.rsi14 - 60.0) / 30.0, 0.45), "RSI " + formatCompact(m.rsi14, 1)});
    }
    if (m.rsi14 < 40.0) {
        short_drivers.push_back({std::min((40.0 - m.rsi14) / 30.0, 0.45), "RSI " + formatCompact(m.rsi14, 1)});
    }

    if (m.volume_ratio > 1.15) {
        long_drivers.push_back({std::min((m.volume_ratio - 1.0) / 1.6, 0.4),
                                "Volume ratio " + formatCompact(m.volume_ratio, 2)});
    }
    if (m.volume_ratio < 0.85) {
        short_drivers.push_back({std::min((1.0 - m.volume_ratio) / 1.6, 0.4),
                                 "Volume ratio " + formatCompact(m.volume_ratio, 2)});
    }

    if (m.volume_change_pct > 35.0) {
        long_drivers.push_back({std::min(m.volume_change_pct / 150.0, 0.3),
                                "Volume surge " + formatCompact(m.volume_change_pct, 1) + "%"});
    }
    if (m.volume_change_pct < -30.0) {
        short_drivers.push_back({std::min(std::abs(m.volume_change_pct) / 150.0, 0.3),
                                 "Volume drop " + formatCompact(m.volume_change_pct, 1) + "%"});
    }

    if (m.volume_accel_pct > 40.0) {
        long_drivers.push_back({std::min(m.volume_accel_pct / 200.0, 0.22),
                                "Volume acceleration " + formatCompact(m.volume_accel_pct, 1) + "%"});
    }
    if (m.volume_accel_pct < -35.0) {
        short_drivers.push_back({std::min(std::abs(m.volume_accel_pct) / 200.0, 0.22),
                                 "Volume decel " + formatCompact(m.volume_accel_pct, 1) + "%"});
    }

    if (m.mfi14 > 65.0) {
        long_drivers.push_back({std::min((m.mfi14 - 65.0) / 70.0, 0.35), "MFI " + formatCompact(m.mfi14, 1)});
    }
    if (m.mfi14 < 35.0) {
        short_drivers.push_back({std::min((35.0 - m.mfi14) / 70.0, 0.35), "MFI " + formatCompact(m.mfi14, 1)});
    }

    if (m.obv_slope > 0.12) {
        long_drivers.push_back({std::min(m.obv_slope, 0.25),
                                "OBV slope " + formatCompact(m.obv_slope * 100.0, 1) + "%"});
    }
    if (m.obv_slope < -0.12) {
        short_drivers.push_back({std::min(std::abs(m.obv_slope), 0.25),
                                 "OBV slope " + formatCompact(m.obv_slope * 100.0, 1) + "%"});
    }

    // 저변동성 구간의 1분 임펄스
    if (m.change_1m_pct > 0.1 && m.atr_pct < 1.5) {
        long_drivers.push_back({0.15, "Momentum breakout"});
    } else if (m.change_1m_pct < -0.1 && m.atr_pct < 1.5) {
        short_drivers.push_back({0.15, "Momentum breakdown"});
    }

    if (m.last_price >= m.resistance) {
        short_drivers.push_back({0.2, "Testing resistance"});
    }
    if (m.last_price <= m.support) {
        long_drivers.push_back({0.2, "Testing support"});
    }
}

analytics::LocalSignal SignalGenerator::derive(const analytics::SnapshotMetrics& m) {
    std::vector<Driver> long_drivers;
    std::vector<Driver> short_drivers;
    collectDrivers(m, long_drivers, short_drivers);

    auto sum = [](const std::vector<Driver>& drivers) {
        double total = 0.0;
        for (const auto& d : drivers) total += d.weight;
        return total;
    };

    const double long_score = sum(long_drivers);
    const double short_score = sum(short_drivers);
    const double score_diff = long_score - short_score;
    const double score_total = long_score + short_score + 0.0001;
    const double edge = std::min(1.0, std::abs(score_diff) / score_total);

    Bias bias = Bias::FLAT;
    if (score_diff > kBiasThreshold) bias = Bias::LONG;
    if (score_diff < -kBiasThreshold) bias = Bias::SHORT;

    double confidence = 0.4 + edge * 0.45;
    confidence += std::min(std::abs(m.change_15m_pct) / 120.0, 0.1);
    confidence += std::min(std::abs(m.change_5m_pct) / 120.0, 0.08);
    if (m.volatility_pct > 1.8) {
        confidence = std::max(kPenaltyFloor, confidence - 0.1);
    }
    // 저항 앞 long / 지지 앞 short 는 감점
    if (bias == Bias::LONG && m.last_price >= m.resistance * 0.999) {
        confidence = std::max(kPenaltyFloor, confidence - 0.12);
    }
    if (bias == Bias::SHORT && m.last_price <= m.support * 1.001) {
        confidence = std::max(kPenaltyFloor, confidence - 0.12);
    }

    std::vector<Driver> drivers;
    if (bias == Bias::LONG) {
        drivers = long_drivers;
    } else if (bias == Bias::SHORT) {
        drivers = short_drivers;
    } else {
        drivers = long_drivers;
        drivers.insert(drivers.end(), short_drivers.begin(), short_drivers.end());
    }
    std::stable_sort(drivers.begin(), drivers.end(),
                     [](const Driver& a, const Driver& b) { return a.weight > b.weight; });

    std::string reasoning;
    for (size_t i = 0; i < drivers.size() && i < 3; ++i) {
        if (!reasoning.empty()) reasoning += " · ";
        reasoning += drivers[i].reason;
    }
    if (reasoning.empty()) {
        reasoning = "Signals mixed across indicators";
    }

    analytics::LocalSignal signal;
    signal.bias = bias;
    signal.confidence = roundTo(std::max(kMinConfidence, std::min(confidence, kMaxConfidence)), 2);
    signal.edge_score = roundTo(edge, 2);
    signal.reasoning = reasoning;
    signal.long_score = roundTo(long_score, 2);
    signal.short_score = roundTo(short_score, 2);
    return signal;
}

} // namespace strategy
} // namespace zenith
