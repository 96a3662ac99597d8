#pragma once

#include <stdexcept>
#include <string>

#include "core/contracts/IExchangeAdapter.h"

namespace zenith {
namespace execution {

// 거래소 거절 메시지 분류 (대소문자 무시)
//   percent_price               -> PERCENT_PRICE
//   maximum allowable position  -> LEVERAGE_BRACKET
//   margin is insufficient      -> INSUFFICIENT_MARGIN
class ExchangeRejection {
public:
    static core::OrderRejectKind classify(const std::string& message);

    // 수량 축소 재시도 대상
    static bool isRetryable(core::OrderRejectKind kind);
};

// 재시도 대상이 아닌 주문 거절. 스케줄러의 심볼 단위 catch 로 전달
class ExchangeError : public std::runtime_error {
public:
    ExchangeError(core::OrderRejectKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    core::OrderRejectKind kind() const { return kind_; }

private:
    core::OrderRejectKind kind_;
};

} // namespace execution
} // namespace zenith
