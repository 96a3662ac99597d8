#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "core/contracts/IStrategyOracle.h"
#include "strategy/ScalpTypes.h"

namespace zenith {
namespace network {

// 오라클 응답 검증. 계약 위반은 모두 std::runtime_error
class OraclePayloadParser {
public:
    static constexpr size_t kReasoningWordLimit = 22;

    // ```json ... ``` 펜스 제거
    static std::string stripCodeFences(const std::string& content);

    // 공백 정리 후 22 단어 초과 시 "..." 부착. 비어 있으면 "No reasoning provided"
    static std::string sanitizeReasoning(const nlohmann::json& value);

    // 숫자, 숫자 문자열, "NN%" 허용
    static std::optional<double> parseConfidence(const nlohmann::json& value);

    static core::OracleDecision parseStrategy(const std::string& content, const std::string& fallback_symbol);
    static core::OracleDecision parseStrategy(const nlohmann::json& payload, const std::string& fallback_symbol);

    static strategy::PolicyVerdict parsePolicy(const nlohmann::json& payload);
    static strategy::ShockRisk parseShockRisk(const nlohmann::json& payload);
};

} // namespace network
} // namespace zenith
