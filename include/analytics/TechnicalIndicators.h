#pragma once

#include <vector>
#include <string>
#include "common/Types.h"

namespace zenith {
namespace analytics {

// Technical Indicators - 스냅샷/스캘핑 피처 공용
class TechnicalIndicators {
public:
    // SMA - 값이 period 보다 적으면 마지막 값
    static double calculateSMA(const std::vector<double>& values, int period);

    // EMA - 첫 값으로 시드, k = 2/(period+1)
    static double calculateEMA(const std::vector<double>& values, int period);
    static std::vector<double> calculateEMAVector(const std::vector<double>& values, int period);

    // RSI - 최근 period 변화량의 단순 평균 (Wilder 평활 아님)
    // 데이터 부족: 50, 손실 없음: 100, 이익 없음: 0
    static double calculateRSI(const std::vector<double>& closes, int period = 14);

    // ATR - 최근 max(period,2) 개 True Range 의 EMA
    static double calculateATR(const std::vector<Candle>& candles, int period = 14);

    // MFI (Money Flow Index) - 데이터 부족 시 50
    static double calculateMFI(const std::vector<Candle>& candles, int period = 14);

    // OBV 기울기: (last-first)/max(|first|,|last|,1), 최근 lookback 개
    static double calculateOBVSlope(const std::vector<Candle>& candles, int lookback = 10);

    // 최근 6개 거래량 후반/전반 비교 (%)
    static double calculateVolumeAcceleration(const std::vector<double>& volumes);

    // 표본 표준편차 (n-1)
    static double calculateStdDev(const std::vector<double>& values);

    // (current-base)/base*100, base 0 이면 0
    static double percentChange(double base, double current);

    // 지지/저항: 최근 lookback 캔들 최저가/최고가
    static double findSupport(const std::vector<Candle>& candles, int lookback = 30);
    static double findResistance(const std::vector<Candle>& candles, int lookback = 30);

    static std::vector<double> extractClosePrices(const std::vector<Candle>& candles);
    static std::vector<double> extractVolumes(const std::vector<Candle>& candles);
};

} // namespace analytics
} // namespace zenith
