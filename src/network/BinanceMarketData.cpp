#include "network/BinanceMarketData.h"
#include "network/BinanceHttpClient.h"
#include "analytics/MarketSnapshotBuilder.h"
#include "common/Logger.h"
#include "common/StepSizeHelper.h"

#include <algorithm>
#include <stdexcept>

namespace zenith {
namespace network {

namespace {
double asNumber(const nlohmann::json& value) {
    if (value.is_number()) return value.get<double>();
    if (value.is_string()) return common::parseDouble(value.get<std::string>());
    return 0.0;
}
} // namespace

BinanceMarketData::BinanceMarketData(IHttpClient& http)
    : http_(http) {}

std::vector<Candle> BinanceMarketData::parseKlines(const nlohmann::json& payload) {
    if (!payload.is_array()) {
        throw std::runtime_error("Binance klines payload was not an array");
    }
    std::vector<Candle> candles;
    candles.reserve(payload.size());
    for (const auto& row : payload) {
        if (!row.is_array() || row.size() < 7) {
            throw std::runtime_error("Binance kline row is malformed");
        }
        candles.emplace_back(
            asNumber(row[1]), asNumber(row[2]), asNumber(row[3]), asNumber(row[4]), asNumber(row[5]),
            static_cast<long long>(asNumber(row[0])), static_cast<long long>(asNumber(row[6])));
    }
    return candles;
}

std::vector<strategy::TradePrint> BinanceMarketData::parseAggTrades(const nlohmann::json& payload) {
    if (!payload.is_array()) {
        throw std::runtime_error("Binance aggTrades payload was not an array");
    }
    std::vector<strategy::TradePrint> trades;
    trades.reserve(payload.size());
    for (const auto& row : payload) {
        strategy::TradePrint trade;
        trade.price = asNumber(row.value("p", nlohmann::json()));
        trade.qty = asNumber(row.value("q", nlohmann::json()));
        // m = buyer is maker -> taker 는 매도
        trade.is_buy = !row.value("m", false);
        trade.ts_ms = static_cast<long long>(asNumber(row.value("T", nlohmann::json())));
        trades.push_back(trade);
    }
    return trades;
}

std::vector<Candle> BinanceMarketData::fetchKlines(const std::string& symbol, const std::string& interval, int limit) {
    auto payload = BinanceHttpClient::unwrap(http_.get("/fapi/v1/klines", {
        {"symbol", symbol},
        {"interval", interval},
        {"limit", std::to_string(std::max(1, std::min(limit, 500)))}
    }));
    return parseKlines(payload);
}

double BinanceMarketData::fetch24hChangePct(const std::string& symbol) {
    auto payload = BinanceHttpClient::unwrap(http_.get("/fapi/v1/ticker/24hr", {{"symbol", symbol}}));
    return asNumber(payload.value("priceChangePercent", nlohmann::json(0)));
}

analytics::MarketSnapshot BinanceMarketData::getSnapshot(
    const std::string& symbol,
    const std::string& interval,
    int limit
) {
    auto candles = fetchKlines(symbol, interval, analytics::MarketSnapshotBuilder::clampLimit(limit));
    auto snapshot = analytics::MarketSnapshotBuilder::build(symbol, interval, std::move(candles));

    try {
        analytics::MarketSnapshotBuilder::applyTicker24h(snapshot, fetch24hChangePct(symbol));
    } catch (const std::exception& e) {
        LOG_WARN("[{}] 24h ticker unavailable: {}", symbol, e.what());
    }
    return snapshot;
}

nlohmann::json BinanceMarketData::fetchOrderBook(const std::string& symbol, int limit) {
    return BinanceHttpClient::unwrap(http_.get("/fapi/v1/depth", {
        {"symbol", symbol},
        {"limit", std::to_string(limit)}
    }));
}

std::vector<strategy::TradePrint> BinanceMarketData::fetchRecentTrades(const std::string& symbol, int limit) {
    auto payload = BinanceHttpClient::unwrap(http_.get("/fapi/v1/aggTrades", {
        {"symbol", symbol},
        {"limit", std::to_string(std::max(1, std::min(limit, 1000)))}
    }));
    return parseAggTrades(payload);
}

} // namespace network
} // namespace zenith
