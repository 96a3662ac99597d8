#pragma once

#include <optional>
#include <string>

#include "core/contracts/IExchangeAdapter.h"

namespace zenith {
namespace execution {

// 정규화 결과. quantity == 0 이면 "주문하지 않음"
struct NormalizedQuantity {
    double quantity = 0.0;
    std::string quantity_text;
    std::optional<core::TradingFilters> filters;
    bool bumped_to_min_notional = false;

    bool tradable() const { return quantity > 0.0; }
};

class QuantityNormalizer {
public:
    explicit QuantityNormalizer(core::IExchangeAdapter& exchange);

    // 필터 조회 실패 시 로그 후 0
    NormalizedQuantity normalize(
        const std::string& symbol,
        double desired_qty,
        std::optional<double> reference_price
    ) const;

    // 순수 함수: stepSize/min/max/notional/precision 규칙 적용
    static NormalizedQuantity normalize(
        const core::TradingFilters& filters,
        double desired_qty,
        std::optional<double> reference_price
    );

    // 전송 문자열 자릿수: quantityPrecision > stepSizePrecision > stepSize 자릿수 > 6
    static int displayPrecision(const core::TradingFilters& filters);

private:
    core::IExchangeAdapter& exchange_;
};

} // namespace execution
} // namespace zenith
