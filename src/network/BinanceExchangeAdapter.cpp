#include "network/BinanceExchangeAdapter.h"
#include "network/BinanceHttpClient.h"
#include "common/Logger.h"
#include "common/StepSizeHelper.h"
#include "execution/ExchangeRejection.h"
#include "execution/OrderStateMapper.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>
#include <set>
#include <stdexcept>

namespace zenith {
namespace network {

namespace {
constexpr double kInf = std::numeric_limits<double>::infinity();

std::string upper(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return text;
}

// 바이낸스는 숫자를 문자열로 내려줌
double numberOr(const nlohmann::json& node, const char* key, double fallback) {
    if (!node.is_object() || !node.contains(key)) {
        return fallback;
    }
    const auto& value = node[key];
    if (value.is_number()) {
        const double number = value.get<double>();
        return std::isfinite(number) ? number : fallback;
    }
    if (value.is_string()) {
        const double number = common::parseDouble(value.get<std::string>());
        return std::isfinite(number) ? number : fallback;
    }
    return fallback;
}

std::string textOr(const nlohmann::json& node, const char* key, const std::string& fallback = "") {
    if (node.is_object() && node.contains(key) && node[key].is_string()) {
        return node[key].get<std::string>();
    }
    return fallback;
}

const nlohmann::json* findFilter(const nlohmann::json& entry, const std::string& type) {
    if (!entry.contains("filters") || !entry["filters"].is_array()) {
        return nullptr;
    }
    for (const auto& filter : entry["filters"]) {
        if (textOr(filter, "filterType") == type) {
            return &filter;
        }
    }
    return nullptr;
}

const char* sideText(OrderSide side) {
    return side == OrderSide::BUY ? "BUY" : "SELL";
}
} // namespace

BinanceExchangeAdapter::BinanceExchangeAdapter(IHttpClient& http)
    : http_(http) {}

// ===== exchangeInfo =====

core::TradingFilters BinanceExchangeAdapter::parseFilters(const nlohmann::json& entry) {
    const nlohmann::json* market_lot = findFilter(entry, "MARKET_LOT_SIZE");
    const nlohmann::json* lot = findFilter(entry, "LOT_SIZE");
    const nlohmann::json* effective_lot = market_lot ? market_lot : lot;
    const nlohmann::json* notional = findFilter(entry, "NOTIONAL");
    if (!notional) notional = findFilter(entry, "MIN_NOTIONAL");
    const nlohmann::json* price_filter = findFilter(entry, "PRICE_FILTER");

    const nlohmann::json empty = nlohmann::json::object();
    const auto& market_node = market_lot ? *market_lot : empty;
    const auto& lot_node = lot ? *lot : empty;

    core::TradingFilters filters;

    const auto& step_node = effective_lot ? *effective_lot : lot_node;
    const std::string step_text = textOr(step_node, "stepSize", textOr(lot_node, "stepSize"));
    filters.step_size = numberOr(step_node, "stepSize", numberOr(lot_node, "stepSize", 0.0));
    filters.step_size_precision = common::precisionFromText(step_text);

    filters.min_qty = std::max({numberOr(market_node, "minQty", 0.0), numberOr(lot_node, "minQty", 0.0), 0.0});

    double market_max = numberOr(market_node, "maxQty", kInf);
    double lot_max = numberOr(lot_node, "maxQty", kInf);
    filters.max_qty = std::min(market_max > 0.0 ? market_max : kInf, lot_max > 0.0 ? lot_max : kInf);

    if (notional) {
        filters.min_notional = numberOr(*notional, "notional", numberOr(*notional, "minNotional", 0.0));
        filters.max_notional = numberOr(*notional, "maxNotional", kInf);
    }
    if (price_filter) {
        filters.tick_size = numberOr(*price_filter, "tickSize", 0.0);
    }

    if (entry.contains("quantityPrecision") && entry["quantityPrecision"].is_number()) {
        const double precision = entry["quantityPrecision"].get<double>();
        if (std::isfinite(precision)) {
            filters.quantity_precision = std::max(0, static_cast<int>(std::floor(precision)));
        }
    }
    return filters;
}

std::map<std::string, SymbolMeta> BinanceExchangeAdapter::parseExchangeInfo(const nlohmann::json& payload) {
    if (!payload.is_object() || !payload.contains("symbols") || !payload["symbols"].is_array()) {
        throw std::runtime_error("Binance exchange info payload was not an array");
    }

    std::map<std::string, SymbolMeta> table;
    for (const auto& entry : payload["symbols"]) {
        const std::string symbol = upper(textOr(entry, "symbol"));
        if (symbol.empty()) continue;

        SymbolMeta meta;
        meta.symbol = symbol;
        meta.status = textOr(entry, "status");
        meta.contract_type = textOr(entry, "contractType");
        meta.quote_asset = upper(textOr(entry, "quoteAsset"));
        meta.filters = parseFilters(entry);
        table[symbol] = std::move(meta);
    }
    return table;
}

bool BinanceExchangeAdapter::isTradablePerpetual(const SymbolMeta& meta) {
    if (meta.status != "TRADING") return false;
    if (!meta.contract_type.empty() && meta.contract_type != "PERPETUAL") return false;
    return true;
}

std::shared_ptr<const BinanceExchangeAdapter::SymbolTable> BinanceExchangeAdapter::loadExchangeInfo(bool force) {
    const long long now = currentTimeMs();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!force && symbols_ && !symbols_->empty() && now - symbols_loaded_ms_ < kExchangeInfoTtlMs) {
            return symbols_;
        }
    }

    auto payload = BinanceHttpClient::unwrap(http_.get("/fapi/v1/exchangeInfo"));
    auto table = std::make_shared<const SymbolTable>(parseExchangeInfo(payload));

    std::lock_guard<std::mutex> lock(mutex_);
    symbols_ = table;
    symbols_loaded_ms_ = now;
    LOG_DEBUG("exchangeInfo 갱신: {} symbols", table->size());
    return symbols_;
}

core::TradingFilters BinanceExchangeAdapter::fetchTradingFilters(const std::string& symbol) {
    const std::string key = upper(symbol);
    auto table = loadExchangeInfo();
    auto it = table->find(key);
    if (it == table->end() || !isTradablePerpetual(it->second)) {
        const std::string received = it == table->end() ? "unknown" : it->second.symbol;
        throw std::runtime_error("Exchange info for " + key + " not available on Binance (received " + received + ")");
    }
    return it->second.filters;
}

std::vector<std::string> BinanceExchangeAdapter::filterTradableSymbols(const std::vector<std::string>& symbols) {
    std::vector<std::string> result;
    if (symbols.empty()) {
        return result;
    }
    auto table = loadExchangeInfo();
    std::set<std::string> seen;
    for (const auto& symbol : symbols) {
        const std::string key = upper(symbol);
        if (key.empty() || !seen.insert(key).second) continue;
        auto it = table->find(key);
        if (it != table->end() && isTradablePerpetual(it->second) &&
            (it->second.quote_asset.empty() || it->second.quote_asset == "USDT")) {
            result.push_back(key);
        } else {
            LOG_WARN("{} is not a tradable USDT perpetual, skipping", key);
        }
    }
    return result;
}

// ===== 계정 =====

std::vector<core::AccountBalance> BinanceExchangeAdapter::fetchAccountBalance() {
    auto data = BinanceHttpClient::unwrap(http_.get("/fapi/v2/account", {}, true));

    std::vector<core::AccountBalance> balances;
    if (!data.contains("assets") || !data["assets"].is_array()) {
        return balances;
    }
    for (const auto& asset : data["assets"]) {
        core::AccountBalance balance;
        balance.asset = textOr(asset, "asset");
        balance.balance = numberOr(asset, "walletBalance", 0.0);
        balance.available = numberOr(asset, "availableBalance", balance.balance);
        balances.push_back(balance);
    }
    return balances;
}

std::vector<core::RawPosition> BinanceExchangeAdapter::fetchPositions() {
    auto data = BinanceHttpClient::unwrap(http_.get("/fapi/v2/positionRisk", {}, true));
    if (!data.is_array()) {
        throw std::runtime_error("Binance positionRisk payload was not an array");
    }

    std::vector<core::RawPosition> positions;
    for (const auto& entry : data) {
        core::RawPosition position;
        position.symbol = textOr(entry, "symbol");
        position.position_amt = numberOr(entry, "positionAmt", 0.0);
        position.entry_price = numberOr(entry, "entryPrice", 0.0);
        position.mark_price = numberOr(entry, "markPrice", 0.0);
        position.unrealized_pnl = numberOr(entry, "unRealizedProfit", numberOr(entry, "unrealizedProfit", 0.0));
        position.leverage = static_cast<int>(numberOr(entry, "leverage", 0.0));
        positions.push_back(position);
    }
    return positions;
}

void BinanceExchangeAdapter::setLeverage(const std::string& symbol, int leverage) {
    BinanceHttpClient::unwrap(http_.post("/fapi/v1/leverage", {
        {"symbol", symbol},
        {"leverage", std::to_string(leverage)}
    }));
}

std::optional<double> BinanceExchangeAdapter::maxNotionalFromBrackets(
    const nlohmann::json& payload,
    const std::string& symbol,
    int leverage
) {
    const nlohmann::json* entry = nullptr;
    if (payload.is_array()) {
        for (const auto& item : payload) {
            if (textOr(item, "symbol") == symbol) {
                entry = &item;
                break;
            }
        }
        if (!entry && payload.size() == 1) entry = &payload[0];
    } else if (payload.is_object()) {
        entry = &payload;
    }
    if (!entry || !entry->contains("brackets") || !(*entry)["brackets"].is_array()) {
        return std::nullopt;
    }

    std::optional<double> best;
    for (const auto& bracket : (*entry)["brackets"]) {
        const double initial = numberOr(bracket, "initialLeverage", 0.0);
        const double cap = numberOr(bracket, "notionalCap", 0.0);
        if (initial >= leverage && cap > 0.0 && (!best || cap > *best)) {
            best = cap;
        }
    }
    return best;
}

std::optional<double> BinanceExchangeAdapter::getMaxNotionalForLeverage(const std::string& symbol, int leverage) {
    auto payload = BinanceHttpClient::unwrap(http_.get("/fapi/v1/leverageBracket", {{"symbol", symbol}}, true));
    return maxNotionalFromBrackets(payload, symbol, leverage);
}

// ===== 주문 =====

core::OrderAttempt BinanceExchangeAdapter::submitOrder(const std::string& symbol, const QueryParams& params) {
    core::OrderAttempt attempt;
    auto response = http_.post("/fapi/v1/order", params);
    if (!response.isSuccess()) {
        attempt.message = "Binance request failed: " + std::to_string(response.status_code) +
                          " (" + BinanceHttpClient::errorMessage(response) + ")";
        attempt.reject = execution::ExchangeRejection::classify(attempt.message);
        LOG_ERROR("[{}] order rejected: {}", symbol, attempt.message);
        return attempt;
    }

    nlohmann::json payload;
    try {
        payload = response.json();
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error(std::string("Binance order response is not valid JSON: ") + e.what());
    }
    attempt.fill = execution::OrderStateMapper::toFill(payload);
    return attempt;
}

core::OrderAttempt BinanceExchangeAdapter::placeMarketOrder(
    const std::string& symbol,
    OrderSide side,
    const std::string& quantity_text,
    const core::OrderOptions& options
) {
    QueryParams params = {
        {"symbol", symbol},
        {"side", sideText(side)},
        {"type", "MARKET"},
        {"quantity", quantity_text},
        {"newOrderRespType", options.response_type}
    };
    if (options.reduce_only) {
        params["reduceOnly"] = "true";
    }
    return submitOrder(symbol, params);
}

core::OrderAttempt BinanceExchangeAdapter::placeLimitOrder(
    const std::string& symbol,
    OrderSide side,
    const std::string& quantity_text,
    double price,
    const core::OrderOptions& options
) {
    if (!std::isfinite(price) || price <= 0.0) {
        throw std::invalid_argument("limit price must be positive");
    }
    QueryParams params = {
        {"symbol", symbol},
        {"side", sideText(side)},
        {"type", "LIMIT"},
        {"quantity", quantity_text},
        {"price", common::formatCompact(price, 8)},
        {"timeInForce", options.time_in_force},
        {"newOrderRespType", options.response_type}
    };
    if (options.reduce_only) {
        params["reduceOnly"] = "true";
    }
    return submitOrder(symbol, params);
}

} // namespace network
} // namespace zenith
