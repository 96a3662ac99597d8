#include "execution/QuantityNormalizer.h"
#include "common/Logger.h"
#include "common/StepSizeHelper.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace zenith {
namespace execution {

namespace {
using common::quantizeDown;

// 부동소수 오차 허용치 (정렬된 값이 한 step 어긋나지 않도록)
constexpr double kEpsilon = 1e-9;

bool hasMaxQty(const core::TradingFilters& f) {
    return std::isfinite(f.max_qty) && f.max_qty > 0.0;
}

double quantizeOrKeep(double value, double step) {
    return step > 0.0 ? quantizeDown(value, step) : value;
}

// stepSize 배수 중 value 이상인 최소값
double quantizeUp(double value, double step) {
    if (!(step > 0.0)) return value;
    const double steps = std::ceil(value / step - kEpsilon);
    return quantizeDown(steps * step, step);
}

NormalizedQuantity zeroResult(const core::TradingFilters& filters, bool bumped) {
    NormalizedQuantity result;
    result.filters = filters;
    result.bumped_to_min_notional = bumped;
    return result;
}
} // namespace

QuantityNormalizer::QuantityNormalizer(core::IExchangeAdapter& exchange)
    : exchange_(exchange) {}

NormalizedQuantity QuantityNormalizer::normalize(
    const std::string& symbol,
    double desired_qty,
    std::optional<double> reference_price
) const {
    if (!std::isfinite(desired_qty) || desired_qty <= 0.0) {
        return NormalizedQuantity{};
    }
    try {
        const auto filters = exchange_.fetchTradingFilters(symbol);
        return normalize(filters, desired_qty, reference_price);
    } catch (const std::exception& e) {
        LOG_ERROR("{} 수량 정규화 실패 (필터 조회): {}", symbol, e.what());
        return NormalizedQuantity{};
    }
}

int QuantityNormalizer::displayPrecision(const core::TradingFilters& filters) {
    if (filters.quantity_precision) {
        return std::max(0, *filters.quantity_precision);
    }
    if (filters.step_size_precision) {
        return std::max(0, *filters.step_size_precision);
    }
    if (filters.step_size > 0.0) {
        const int digits = common::decimalsForStep(filters.step_size);
        if (digits > 0) {
            return std::min(digits, 8);
        }
    }
    return 6;
}

NormalizedQuantity QuantityNormalizer::normalize(
    const core::TradingFilters& filters,
    double desired_qty,
    std::optional<double> reference_price
) {
    if (!std::isfinite(desired_qty) || desired_qty <= 0.0) {
        return zeroResult(filters, false);
    }

    const double step = filters.step_size;
    const bool price_known = reference_price && std::isfinite(*reference_price) && *reference_price > 0.0;
    bool bumped = false;

    // 1) stepSize 내림 (step 0 이면 6자리)
    double quantity = quantizeDown(desired_qty, step);

    // 2) minQty 미만이면 minQty 이상 최소 step 배수로 올림
    if (quantity < filters.min_qty) {
        quantity = quantizeUp(filters.min_qty, step);
    }

    // 3) maxQty 클램프
    if (hasMaxQty(filters) && quantity > filters.max_qty) {
        quantity = filters.max_qty;
    }

    // 4) minNotional 미달 시 minNotional/price 로 재계산
    if (price_known && filters.min_notional > 0.0) {
        const double notional = quantity * *reference_price;
        if (notional < filters.min_notional) {
            bumped = true;
            quantity = quantizeOrKeep(filters.min_notional / *reference_price, step);
            if (hasMaxQty(filters) && quantity > filters.max_qty) {
                return zeroResult(filters, bumped);
            }
        }
    }

    if (hasMaxQty(filters) && quantity > filters.max_qty) {
        quantity = filters.max_qty;
    }

    // 5) precision 캡: min(quantityPrecision, stepSizePrecision) 자리 내림 후 step 재정렬
    std::optional<int> precision_cap;
    if (filters.quantity_precision) precision_cap = *filters.quantity_precision;
    if (filters.step_size_precision) {
        precision_cap = precision_cap ? std::min(*precision_cap, *filters.step_size_precision)
                                      : *filters.step_size_precision;
    }
    if (precision_cap && *precision_cap >= 0) {
        const int digits = std::min(*precision_cap, 8);
        const double factor = std::pow(10.0, digits);
        quantity = std::floor(quantity * factor + kEpsilon) / factor;
        quantity = quantizeOrKeep(quantity, step);
        quantity = common::roundTo(quantity, digits);
    } else if (step > 0.0) {
        quantity = quantizeDown(quantity, step);
    }

    // 6) 최종 검증
    if (!std::isfinite(quantity) || quantity <= 0.0) {
        return zeroResult(filters, bumped);
    }
    if (quantity + kEpsilon < filters.min_qty) {
        return zeroResult(filters, bumped);
    }
    if (hasMaxQty(filters) && quantity > filters.max_qty + kEpsilon) {
        return zeroResult(filters, bumped);
    }
    if (price_known) {
        const double notional = quantity * *reference_price;
        if (std::isfinite(filters.max_notional) && filters.max_notional > 0.0 && notional > filters.max_notional) {
            return zeroResult(filters, bumped);
        }
        if (filters.min_notional > 0.0 && notional + kEpsilon < filters.min_notional) {
            return zeroResult(filters, bumped);
        }
    }

    // 7) 전송 문자열 기준으로 수량 재해석
    NormalizedQuantity result;
    result.quantity_text = common::formatFixed(quantity, std::min(displayPrecision(filters), 8));
    result.quantity = common::parseDouble(result.quantity_text);
    result.filters = filters;
    result.bumped_to_min_notional = bumped;
    if (result.quantity <= 0.0) {
        return zeroResult(filters, bumped);
    }
    return result;
}

} // namespace execution
} // namespace zenith
