#include "risk/MarginGuard.h"
#include "common/Logger.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace zenith {
namespace risk {

MarginGuard::MarginGuard(core::IExchangeAdapter& exchange, const execution::QuantityNormalizer& normalizer)
    : exchange_(exchange)
    , normalizer_(normalizer) {}

double MarginGuard::marginCap(double available_margin, int leverage) {
    if (!std::isfinite(available_margin) || available_margin <= 0.0) {
        return 0.0;
    }
    return available_margin * std::max(leverage, 1) * kMarginUsageBuffer;
}

MarginCheck MarginGuard::enforce(
    const std::string& symbol,
    int leverage,
    std::optional<double> reference_price,
    const execution::NormalizedQuantity& order,
    double raw_qty,
    double available_margin
) const {
    MarginCheck check;
    check.order = order;

    if (!order.tradable()) {
        return check;
    }
    // 가격을 모르면 명목 계산 불가 -> 그대로 허용
    if (!reference_price || !std::isfinite(*reference_price) || *reference_price <= 0.0) {
        check.allowed = true;
        return check;
    }
    const double price = *reference_price;

    if (!std::isfinite(available_margin) || available_margin <= 0.0) {
        LOG_WARN("{} 가용 증거금 부족으로 신규 진입 불가", symbol);
        return check;
    }

    const int effective_leverage = std::max(leverage, 1);
    check.effective_cap = marginCap(available_margin, effective_leverage);
    check.cap_source = MarginCapSource::MARGIN;

    try {
        const auto bracket_cap = exchange_.getMaxNotionalForLeverage(symbol, effective_leverage);
        if (bracket_cap && std::isfinite(*bracket_cap) && *bracket_cap > 0.0 && *bracket_cap < check.effective_cap) {
            check.effective_cap = *bracket_cap;
            check.cap_source = MarginCapSource::LEVERAGE_BRACKET;
        }
    } catch (const std::exception& e) {
        LOG_WARN("{} 레버리지 구간 한도 조회 실패, 증거금 한도만 적용: {}", symbol, e.what());
    }

    const double desired_notional = order.quantity * price;
    if (desired_notional <= check.effective_cap) {
        check.allowed = true;
        return check;
    }

    const double min_notional = order.filters ? order.filters->min_notional : 0.0;
    if (check.effective_cap < min_notional) {
        LOG_WARN("{} 주문 한도 {:.2f} < 최소 명목 {:.2f}", symbol, check.effective_cap, min_notional);
        check.order = execution::NormalizedQuantity{};
        check.order.filters = order.filters;
        return check;
    }

    const double capped_qty = check.effective_cap / price;
    auto adjusted = order.filters
        ? execution::QuantityNormalizer::normalize(*order.filters, capped_qty, price)
        : normalizer_.normalize(symbol, capped_qty, price);
    if (!adjusted.tradable()) {
        LOG_WARN("{} 한도 내 수량 조정 실패 (cap={:.2f}, capped_qty={:.8f})",
                 symbol, check.effective_cap, capped_qty);
        check.order = adjusted;
        return check;
    }

    LOG_INFO("{} 리스크 한도로 주문 축소: {:.2f} -> {:.2f} USDT (raw={:.8f}, qty={}, lev={}, source={})",
             symbol, desired_notional, adjusted.quantity * price, raw_qty, adjusted.quantity_text,
             effective_leverage,
             check.cap_source == MarginCapSource::LEVERAGE_BRACKET ? "leverageBracket" : "margin");

    check.allowed = true;
    check.reduced = true;
    check.order = adjusted;
    return check;
}

} // namespace risk
} // namespace zenith
