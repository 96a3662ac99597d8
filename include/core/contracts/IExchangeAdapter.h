#pragma once

#include <limits>
#include <optional>
#include <string>
#include <vector>

#include "common/Types.h"

namespace zenith {
namespace core {

// 심볼별 거래 규칙 (exchangeInfo 필터)
struct TradingFilters {
    double step_size = 0.0;
    double min_qty = 0.0;
    double max_qty = std::numeric_limits<double>::infinity();
    double min_notional = 0.0;
    double max_notional = std::numeric_limits<double>::infinity();
    std::optional<int> quantity_precision;
    std::optional<int> step_size_precision;
    double tick_size = 0.0;            // PRICE_FILTER (지정가 정렬용)
};

struct AccountBalance {
    std::string asset;
    double balance = 0.0;
    double available = 0.0;
};

// 거래소 원본 포지션 (position_amt 부호 = 방향)
struct RawPosition {
    std::string symbol;
    double position_amt = 0.0;
    double entry_price = 0.0;
    double mark_price = 0.0;
    double unrealized_pnl = 0.0;
    int leverage = 0;
};

struct OrderOptions {
    bool reduce_only = false;
    std::string time_in_force = "GTC";
    std::string response_type = "RESULT";
};

// 재시도 가능 여부를 구분하는 거절 분류
enum class OrderRejectKind { NONE, PERCENT_PRICE, LEVERAGE_BRACKET, INSUFFICIENT_MARGIN, OTHER };

struct OrderAttempt {
    OrderRejectKind reject = OrderRejectKind::NONE;
    std::string message;
    OrderFill fill;

    bool ok() const { return reject == OrderRejectKind::NONE; }
};

inline const char* toString(OrderRejectKind kind) {
    switch (kind) {
        case OrderRejectKind::NONE: return "NONE";
        case OrderRejectKind::PERCENT_PRICE: return "PERCENT_PRICE";
        case OrderRejectKind::LEVERAGE_BRACKET: return "LEVERAGE_BRACKET";
        case OrderRejectKind::INSUFFICIENT_MARGIN: return "INSUFFICIENT_MARGIN";
        case OrderRejectKind::OTHER: return "OTHER";
    }
    return "OTHER";
}

// 선물 거래소 어댑터. 조회 실패는 std::runtime_error,
// 주문 거절은 OrderAttempt.reject 로 반환
class IExchangeAdapter {
public:
    virtual ~IExchangeAdapter() = default;

    virtual std::vector<AccountBalance> fetchAccountBalance() = 0;
    virtual std::vector<RawPosition> fetchPositions() = 0;
    virtual TradingFilters fetchTradingFilters(const std::string& symbol) = 0;

    virtual OrderAttempt placeMarketOrder(
        const std::string& symbol,
        OrderSide side,
        const std::string& quantity_text,
        const OrderOptions& options = {}
    ) = 0;

    virtual OrderAttempt placeLimitOrder(
        const std::string& symbol,
        OrderSide side,
        const std::string& quantity_text,
        double price,
        const OrderOptions& options = {}
    ) = 0;

    virtual void setLeverage(const std::string& symbol, int leverage) = 0;

    // 레버리지 구간 명목 한도 (없으면 nullopt)
    virtual std::optional<double> getMaxNotionalForLeverage(const std::string& symbol, int leverage) = 0;
};

} // namespace core
} // namespace zenith
