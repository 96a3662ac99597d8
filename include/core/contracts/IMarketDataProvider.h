#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "analytics/MarketSnapshot.h"
#include "common/Types.h"
#include "strategy/ScalpTypes.h"

namespace zenith {
namespace core {

// 시세 조회. 전송/응답 오류는 std::runtime_error
class IMarketDataProvider {
public:
    virtual ~IMarketDataProvider() = default;

    virtual analytics::MarketSnapshot getSnapshot(
        const std::string& symbol,
        const std::string& interval,
        int limit
    ) = 0;

    virtual std::vector<Candle> fetchKlines(const std::string& symbol, const std::string& interval, int limit) = 0;

    // depth 원본 응답 ({"bids", "asks", "E"})
    virtual nlohmann::json fetchOrderBook(const std::string& symbol, int limit) = 0;

    virtual std::vector<strategy::TradePrint> fetchRecentTrades(const std::string& symbol, int limit) = 0;
};

} // namespace core
} // namespace zenith
