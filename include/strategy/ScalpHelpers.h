#pragma once

#include <optional>
#include <string>
#include <vector>

#include "strategy/ScalpConfig.h"
#include "strategy/ScalpTypes.h"

namespace zenith {
namespace strategy {

struct OrderFlowCheck {
    bool ok = false;
    double ratio = 0.0;
    std::string reason;
};

struct FvgCheck {
    bool ok = false;
    std::optional<FvgZone> zone;
    std::string reason;
};

struct VpNearCheck {
    bool ok = false;
    EntryLevel where = EntryLevel::NA;
};

// 스캘핑 모델 공용 판정 함수
namespace helpers {

double bodySize(const Candle& candle);
double avgBody(const std::vector<Candle>& candles, size_t n = 20);

// 최근 n 개 캔들 중 하나라도 [low, high] 가 level 을 포함
bool retracedWithinBars(double level, const ScalpFeatures& features, size_t n);

// |price-level| / atr (atr <= 0 이면 가격 일치 시 0, 아니면 무한대)
double distanceInAtr(double price, double level, double atr);

// 현재 봉 이전 10봉 스윙: LONG 은 최저가, SHORT 는 최고가 (봉이 1개 이하면 close)
double lastSwing(const ScalpFeatures& features, Side side);

EntryLevel pickNearestEntryLevel(const ScalpFeatures& features, const std::optional<FvgZone>& fvg);

// VAH/VAL/POC 중 ATR*0.5 이내
VpNearCheck vpNear(const ScalpFeatures& features, double price);

bool rsiOk(const ScalpFeatures& features, Side side);

// EMA25>50>100 & close>EMA25 (SHORT 반대)
bool regimeOk(const ScalpFeatures& features, Side side);

OrderFlowCheck orderflowRatio(const ScalpFeatures& features, Side side, const ScalpConfig& config);
bool hasLargePrint(const ScalpFeatures& features, Side side, long long now_ms, const ScalpConfig& config);
FvgCheck fvgForSide(const ScalpFeatures& features, Side side, const ScalpConfig& config);

double signalFreshSec(long long signal_ts_ms, long long now_ms);

// 보유 시간/봉 수 초과 시 강제 청산
bool shouldForceFlat(double hold_sec, int bars_held, const ScalpConfig& config);

// 방향별 호가 잔량 비율 (LONG: bid/ask, SHORT: ask/bid)
double depthBias(const MicroMetrics& micro, Side side);

} // namespace helpers
} // namespace strategy
} // namespace zenith
