#pragma once

#include <map>
#include <string>

namespace zenith {
namespace strategy {

// 미시구조 허용 한도 (High 등급에서 spread/slippage 강화)
struct MicroFilterCaps {
    double spread_bp = 2.5;
    double slippage_bp = 3.0;
    double latency_ms = 150.0;
    double quote_age_ms = 200.0;
    double depth_bias_long = 0.8;
    double depth_bias_short = 0.8;

    double spread_high_bp = 2.0;
    double slippage_high_bp = 2.5;
};

struct SessionWeights {
    double asia = 0.8;
    double london = 1.0;
    double ny = 1.2;
    double bridge = 0.9;
};

struct ScalpConfig {
    // 모델별 최소 품질
    double quality_threshold = 0.70;
    double breakout_threshold = 0.75;
    double mean_threshold = 0.70;
    double ema50_threshold = 0.72;

    double orderflow_ratio_min = 2.0;
    double fvg_min_multiple = 1.2;

    // R 배수 (model1=BREAKOUT, model2=MEAN, model3=EMA50)
    double model1_tp1_rr = 2.0;
    double model2_tp1_rr = 1.0;
    double model3_tp1_rr = 2.0;

    MicroFilterCaps micro;
    SessionWeights sessions;

    double signal_stale_sec = 10.0;
    int max_hold_sec = 150;
    int max_bars = 3;

    long long cooldown_window_ms = 120000;
    long long cooldown_ms = 60000;

    // TP1 이후 ATR 배수 추적
    double trail_atr_mult = 1.0;

    // 대량 체결 판정
    double large_trade_abs_qty = 10.0;
    double large_trade_multiple = 2.5;
    long long large_trade_window_ms = 60000;

    // 심볼별 tickSize (거래소 필터 우선)
    std::map<std::string, double> tick_sizes = {{"BTCUSDT", 0.1}, {"ETHUSDT", 0.01}};
    double default_tick_size = 0.1;
};

} // namespace strategy
} // namespace zenith
