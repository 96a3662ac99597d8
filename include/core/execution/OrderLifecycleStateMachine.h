#pragma once

#include <string>

#include "common/Types.h"

namespace zenith {
namespace core {
namespace execution {

// /fapi 주문 응답의 status 필드
enum class ExchangeOrderState {
    NEW,
    PARTIALLY_FILLED,
    FILLED,
    CANCELED,
    REJECTED,
    EXPIRED,        // EXPIRED_IN_MATCH 포함
    UNKNOWN
};

// 대소문자 무시
ExchangeOrderState parseExchangeOrderState(const std::string& raw);

// 체결 수량 진행 상황
struct FillProgress {
    double orig_qty = 0.0;
    double executed_qty = 0.0;          // 거래소 누적 체결
    double known_filled_qty = 0.0;      // 이전 응답까지 반영한 체결
};

struct OrderLifecycleTransitionResult {
    OrderStatus status = OrderStatus::SUBMITTED;
    double filled_qty = 0.0;
    bool terminal = false;
};

class OrderLifecycleStateMachine {
public:
    // 체결 수량은 줄어들지 않음. 부분 체결 후 취소/만료는 PARTIALLY_FILLED 로 종료
    static OrderLifecycleTransitionResult transition(ExchangeOrderState state, const FillProgress& progress);

    static OrderLifecycleTransitionResult transition(const std::string& raw_state, const FillProgress& progress) {
        return transition(parseExchangeOrderState(raw_state), progress);
    }

    static bool isTerminal(ExchangeOrderState state);
};

} // namespace execution
} // namespace core
} // namespace zenith
