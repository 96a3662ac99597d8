#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/Types.h"
#include "strategy/ScalpTypes.h"

namespace zenith {
namespace strategy {

// 거래소 원시 데이터(캔들/호가/체결) -> 스캘핑 피처
class ScalpFeatureBuilder {
public:
    struct Inputs {
        std::string symbol;
        std::vector<Candle> candles;
        nlohmann::json order_book;             // depth 응답
        std::vector<TradePrint> trades;
        long long now_ms = 0;
        double latency_ms = 0.0;               // 호가 요청 왕복 시간
        double tick_size = 0.1;
        double available_usdt = 0.0;
    };

    static constexpr int kProfileCandles = 120;
    static constexpr int kProfileBins = 24;
    static constexpr double kValueAreaShare = 0.70;
    static constexpr double kLvnShare = 0.25;
    static constexpr int kFvgLookback = 50;
    static constexpr double kBubbleMultiple = 2.5;

    // candles 가 비어 있으면 std::invalid_argument
    static ScalpFeatures build(const Inputs& inputs);

    static VolumeProfile volumeProfile(const std::vector<Candle>& candles, double reference_price);
    static std::vector<FvgZone> fairValueGaps(const std::vector<Candle>& candles);
    static OrderFlow orderFlow(const std::vector<TradePrint>& trades);
    static MarketRegime regimeOf(double ema25, double ema50, double ema100);
};

} // namespace strategy
} // namespace zenith
