#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "common/Types.h"

namespace zenith {
namespace core {

// 외부 전략 오라클 응답 (검증 통과본)
struct OracleDecision {
    std::string symbol;
    std::optional<Bias> bias;
    std::optional<double> confidence;
    std::optional<DecisionAction> action;
    std::optional<double> entry_price;
    std::optional<double> exit_price;
    std::string reasoning;
    std::string model;
};

// 실패/타임아웃/파싱 오류는 std::runtime_error
class IStrategyOracle {
public:
    virtual ~IStrategyOracle() = default;

    virtual OracleDecision request(const std::string& symbol, const nlohmann::json& context) = 0;
};

} // namespace core
} // namespace zenith
