#include "core/execution/OrderLifecycleStateMachine.h"

#include <algorithm>
#include <cctype>

namespace zenith {
namespace core {
namespace execution {

ExchangeOrderState parseExchangeOrderState(const std::string& raw) {
    std::string state = raw;
    std::transform(state.begin(), state.end(), state.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });

    if (state == "NEW") return ExchangeOrderState::NEW;
    if (state == "PARTIALLY_FILLED") return ExchangeOrderState::PARTIALLY_FILLED;
    if (state == "FILLED") return ExchangeOrderState::FILLED;
    if (state == "CANCELED") return ExchangeOrderState::CANCELED;
    if (state == "REJECTED") return ExchangeOrderState::REJECTED;
    if (state == "EXPIRED" || state == "EXPIRED_IN_MATCH") return ExchangeOrderState::EXPIRED;
    return ExchangeOrderState::UNKNOWN;
}

bool OrderLifecycleStateMachine::isTerminal(ExchangeOrderState state) {
    switch (state) {
        case ExchangeOrderState::FILLED:
        case ExchangeOrderState::CANCELED:
        case ExchangeOrderState::REJECTED:
        case ExchangeOrderState::EXPIRED:
            return true;
        default:
            return false;
    }
}

OrderLifecycleTransitionResult OrderLifecycleStateMachine::transition(
    ExchangeOrderState state,
    const FillProgress& progress
) {
    OrderLifecycleTransitionResult result;
    result.filled_qty = std::max({progress.known_filled_qty, progress.executed_qty, 0.0});
    result.terminal = isTerminal(state);
    const bool has_fill = result.filled_qty > POSITION_EPSILON;

    switch (state) {
        case ExchangeOrderState::FILLED:
            result.status = OrderStatus::FILLED;
            // RESULT 응답에 executedQty 가 빠진 경우 원 수량으로 간주
            if (!has_fill) {
                result.filled_qty = progress.orig_qty;
            }
            break;

        case ExchangeOrderState::CANCELED:
        case ExchangeOrderState::EXPIRED:
            result.status = has_fill ? OrderStatus::PARTIALLY_FILLED : OrderStatus::CANCELLED;
            break;

        case ExchangeOrderState::REJECTED:
            result.status = OrderStatus::REJECTED;
            break;

        case ExchangeOrderState::PARTIALLY_FILLED:
            if (progress.orig_qty > 0.0 && result.filled_qty >= progress.orig_qty - POSITION_EPSILON) {
                result.status = OrderStatus::FILLED;
                result.terminal = true;
            } else {
                result.status = OrderStatus::PARTIALLY_FILLED;
            }
            break;

        case ExchangeOrderState::NEW:
            result.status = has_fill ? OrderStatus::PARTIALLY_FILLED : OrderStatus::SUBMITTED;
            break;

        case ExchangeOrderState::UNKNOWN:
            result.status = has_fill ? OrderStatus::PARTIALLY_FILLED : OrderStatus::PENDING;
            break;
    }
    return result;
}

} // namespace execution
} // namespace core
} // namespace zenith
