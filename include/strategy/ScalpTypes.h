#pragma once

#include <optional>
#include <string>
#include <vector>

#include "analytics/TradingSession.h"
#include "common/Types.h"

namespace zenith {
namespace strategy {

enum class Side { LONG, SHORT, NONE };
enum class Model { BREAKOUT, MEAN, EMA50, NONE };
enum class EntryLevel { LVN, VAH, VAL, EMA25, EMA50, FVG_EDGE, POC, NEXT_VA, NA };
enum class TpTarget { POC, NEXT_VA, NA };
enum class StopType { SWING, CHANDELIER };

// 뉴스/쇼크 위험 등급
enum class RiskGrade { NONE, NOTICE, HIGH, CRITICAL };

enum class MarketRegime { BULLISH, BEARISH, RANGE };

struct StopHint {
    StopType type = StopType::SWING;
    int distance_ticks = 0;
};

struct TpPlan {
    double tp1_rr = 1.0;
    std::optional<double> tp2_rr;
    TpTarget target = TpTarget::NA;
};

// 후보 생성 시점의 미시구조 스냅샷
struct MicroSnapshot {
    double spread_bp = 0.0;
    double latency_ms = 0.0;
    double quote_age_ms = 0.0;
    double depth_bias = 1.0;
};

struct Candidate {
    Side signal = Side::NONE;
    Model model = Model::NONE;
    double quality = 0.0;
    EntryLevel entry_hint = EntryLevel::NA;
    StopHint stop_hint;
    TpPlan tp_plan;
    MicroSnapshot micro;
    std::vector<std::string> reasons;

    // 평가 당시 방향 (signal 이 NONE 으로 게이트돼도 유지)
    Side side = Side::NONE;
};

// ===== 피처 =====

struct VolumeProfile {
    double vah = 0.0;
    double val = 0.0;
    double poc = 0.0;
    std::vector<double> lvn;   // 현재가에 가까운 순
};

enum class FvgType { BULLISH, BEARISH };

struct FvgZone {
    FvgType type = FvgType::BULLISH;
    double from = 0.0;
    double to = 0.0;
    double size = 0.0;
};

struct OrderFlow {
    double buy = 0.0;
    double sell = 0.0;
    bool bubble = false;
};

struct TradePrint {
    double price = 0.0;
    double qty = 0.0;
    bool is_buy = true;        // taker 방향
    long long ts_ms = 0;
};

struct MicroMetrics {
    double spread_bp = 0.0;
    double latency_ms = 0.0;
    double quote_age_ms = 0.0;
    double bid_qty10 = 0.0;
    double ask_qty10 = 0.0;
};

struct ScalpFeatures {
    long long ts_ms = 0;
    std::string symbol;
    std::vector<Candle> candles;

    double ema25 = 0.0;
    double ema50 = 0.0;
    double ema100 = 0.0;
    double rsi14 = 50.0;
    double atr22 = 0.0;

    VolumeProfile vp;
    std::vector<FvgZone> fvg;  // 최신순
    double fvg_avg_size = 0.0;

    OrderFlow orderflow;
    MicroMetrics micro;

    double close = 0.0;
    double tick_size = 0.1;
    double available_usdt = 1000.0;

    analytics::TradingSession session = analytics::TradingSession::ASIA;
    MarketRegime regime = MarketRegime::RANGE;

    std::optional<double> candle_age_sec;
    std::optional<double> signal_age_sec;
    std::vector<TradePrint> trades;
};

// ===== 외부 오라클 결과 =====

struct ShockPolicy {
    double size_mul = 1.0;
    bool forbid_market = false;
    Model model_pref = Model::BREAKOUT;
    double spread_cap_bp = 2.5;
};

struct ShockRisk {
    double agg_impact = 0.0;
    RiskGrade grade = RiskGrade::NONE;
    ShockPolicy policy;
};

struct PolicyVerdict {
    bool allow = false;
    double quality = 0.0;
    Model model = Model::NONE;
    Side side = Side::NONE;
    std::optional<double> tp_rr;
    std::optional<EntryLevel> entry_hint;
    std::vector<std::string> notes;
};

// ===== 문자열 변환 =====

const char* toString(Side side);
const char* toString(Model model);
const char* toString(EntryLevel level);
const char* toString(TpTarget target);
const char* toString(RiskGrade grade);
const char* toString(MarketRegime regime);

std::optional<Side> parseSide(const std::string& text);
std::optional<Model> parseModel(const std::string& text);
std::optional<EntryLevel> parseEntryLevel(const std::string& text);
std::optional<RiskGrade> parseRiskGrade(const std::string& text);

inline Bias toBias(Side side) {
    if (side == Side::LONG) return Bias::LONG;
    if (side == Side::SHORT) return Bias::SHORT;
    return Bias::FLAT;
}

} // namespace strategy
} // namespace zenith
