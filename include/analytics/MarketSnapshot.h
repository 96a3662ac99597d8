#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/Types.h"

namespace zenith {
namespace analytics {

// 로컬 지표 기반 방향성 신호
struct LocalSignal {
    Bias bias = Bias::FLAT;
    double confidence = 0.0;      // [0.32, 0.94]
    double edge_score = 0.0;      // [0, 1]
    std::string reasoning;
    double long_score = 0.0;
    double short_score = 0.0;
};

// 캔들에서 파생한 지표 (단위: % 는 퍼센트 값)
struct SnapshotMetrics {
    double last_price = 0.0;
    double change_1m_pct = 0.0;
    double change_5m_pct = 0.0;
    double change_15m_pct = 0.0;
    double change_24h_pct = 0.0;
    bool has_change_24h = false;

    double sma5 = 0.0;
    double sma15 = 0.0;
    double ema21 = 0.0;
    double ema55 = 0.0;
    double rsi14 = 50.0;

    double volatility_pct = 0.0;
    double atr_pct = 0.0;
    double support = 0.0;
    double resistance = 0.0;

    double volume_ratio = 1.0;
    double volume_change_pct = 0.0;
    double volume_accel_pct = 0.0;
    double mfi14 = 50.0;
    double obv_slope = 0.0;

    long long last_updated_ms = 0;
};

// 틱마다 새로 만들어지는 불변 스냅샷
struct MarketSnapshot {
    std::string symbol;
    std::string interval;
    std::vector<Candle> candles;
    SnapshotMetrics metrics;
    LocalSignal local;

    // 오라클 프롬프트/컨텍스트 비교용 페이로드 (표시용 반올림 적용)
    nlohmann::json context;
};

nlohmann::json toJson(const LocalSignal& signal);

} // namespace analytics
} // namespace zenith
