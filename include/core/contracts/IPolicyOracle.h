#pragma once

#include <nlohmann/json.hpp>

#include "strategy/ScalpTypes.h"

namespace zenith {
namespace core {

// 스캘핑 후보 중 하나를 고르는 정책 오라클. 실패 시 std::runtime_error
class IPolicyOracle {
public:
    virtual ~IPolicyOracle() = default;

    virtual strategy::PolicyVerdict decide(const nlohmann::json& payload) = 0;
};

// 뉴스/쇼크 위험 등급 제공자. 실패 시 std::runtime_error
class IShockRiskSource {
public:
    virtual ~IShockRiskSource() = default;

    virtual strategy::ShockRisk fetch(const std::string& symbol) = 0;
};

} // namespace core
} // namespace zenith
