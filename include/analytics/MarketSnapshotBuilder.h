#pragma once

#include <string>
#include <vector>

#include "analytics/MarketSnapshot.h"

namespace zenith {
namespace analytics {

class MarketSnapshotBuilder {
public:
    static constexpr int kDefaultLimit = 240;
    static constexpr int kMinLimit = 90;
    static constexpr int kMaxLimit = 500;

    // 요청 캔들 수를 [90, 500] 으로 제한
    static int clampLimit(int requested);

    // candles 가 비어 있으면 std::invalid_argument
    static MarketSnapshot build(
        const std::string& symbol,
        const std::string& interval,
        std::vector<Candle> candles
    );

    // 24h 티커 변화율 반영 (context 의 ticker_24h 포함)
    static void applyTicker24h(MarketSnapshot& snapshot, double change_pct);

    static SnapshotMetrics computeMetrics(const std::vector<Candle>& candles);
    static nlohmann::json buildContext(
        const std::string& symbol,
        const SnapshotMetrics& metrics,
        const LocalSignal& local
    );
};

} // namespace analytics
} // namespace zenith
