#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "core/contracts/IExchangeAdapter.h"
#include "network/IHttpClient.h"

namespace zenith {
namespace network {

// exchangeInfo 의 심볼 메타 (PERPETUAL/TRADING 판정용)
struct SymbolMeta {
    std::string symbol;
    std::string status;
    std::string contract_type;
    std::string quote_asset;
    core::TradingFilters filters;
};

// /fapi 엔드포인트 위의 IExchangeAdapter 구현
class BinanceExchangeAdapter : public core::IExchangeAdapter {
public:
    static constexpr long long kExchangeInfoTtlMs = 5 * 60 * 1000;

    explicit BinanceExchangeAdapter(IHttpClient& http);

    std::vector<core::AccountBalance> fetchAccountBalance() override;
    std::vector<core::RawPosition> fetchPositions() override;
    core::TradingFilters fetchTradingFilters(const std::string& symbol) override;

    core::OrderAttempt placeMarketOrder(
        const std::string& symbol,
        OrderSide side,
        const std::string& quantity_text,
        const core::OrderOptions& options = {}
    ) override;

    core::OrderAttempt placeLimitOrder(
        const std::string& symbol,
        OrderSide side,
        const std::string& quantity_text,
        double price,
        const core::OrderOptions& options = {}
    ) override;

    void setLeverage(const std::string& symbol, int leverage) override;
    std::optional<double> getMaxNotionalForLeverage(const std::string& symbol, int leverage) override;

    // USDT 무기한 선물 중 거래 가능한 심볼만 (입력 순서 유지, 중복 제거)
    std::vector<std::string> filterTradableSymbols(const std::vector<std::string>& symbols);

    // exchangeInfo 파싱 (순수 함수)
    static std::map<std::string, SymbolMeta> parseExchangeInfo(const nlohmann::json& payload);
    static core::TradingFilters parseFilters(const nlohmann::json& symbol_entry);
    static bool isTradablePerpetual(const SymbolMeta& meta);

    // leverageBracket 응답에서 initialLeverage >= leverage 인 구간 중 최대 notionalCap
    static std::optional<double> maxNotionalFromBrackets(
        const nlohmann::json& payload,
        const std::string& symbol,
        int leverage
    );

private:
    using SymbolTable = std::map<std::string, SymbolMeta>;

    std::shared_ptr<const SymbolTable> loadExchangeInfo(bool force = false);
    core::OrderAttempt submitOrder(const std::string& symbol, const QueryParams& params);

    IHttpClient& http_;

    std::shared_ptr<const SymbolTable> symbols_;
    long long symbols_loaded_ms_ = 0;
    std::mutex mutex_;
};

} // namespace network
} // namespace zenith
