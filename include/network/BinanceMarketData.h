#pragma once

#include "core/contracts/IMarketDataProvider.h"
#include "network/IHttpClient.h"

namespace zenith {
namespace network {

// 공개 시세 엔드포인트 (서명 없음)
class BinanceMarketData : public core::IMarketDataProvider {
public:
    explicit BinanceMarketData(IHttpClient& http);

    // 24h 티커 실패는 경고 후 생략
    analytics::MarketSnapshot getSnapshot(
        const std::string& symbol,
        const std::string& interval,
        int limit
    ) override;

    std::vector<Candle> fetchKlines(const std::string& symbol, const std::string& interval, int limit) override;
    nlohmann::json fetchOrderBook(const std::string& symbol, int limit) override;
    std::vector<strategy::TradePrint> fetchRecentTrades(const std::string& symbol, int limit) override;

    double fetch24hChangePct(const std::string& symbol);

    static std::vector<Candle> parseKlines(const nlohmann::json& payload);
    static std::vector<strategy::TradePrint> parseAggTrades(const nlohmann::json& payload);

private:
    IHttpClient& http_;
};

} // namespace network
} // namespace zenith
