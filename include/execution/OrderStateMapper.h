#pragma once

#include "common/Types.h"
#include <nlohmann/json.hpp>

namespace zenith {
namespace execution {

// 주문 응답 JSON -> OrderFill
class OrderStateMapper {
public:
    // /fapi/v1/order 응답 (newOrderRespType=RESULT).
    // 숫자는 문자열/숫자 모두 허용, avgPrice 가 0 이면 price 사용
    static OrderFill toFill(const nlohmann::json& response);
};

} // namespace execution
} // namespace zenith
