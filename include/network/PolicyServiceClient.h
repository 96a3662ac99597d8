#pragma once

#include <string>

#include "core/contracts/IPolicyOracle.h"
#include "network/CurlSession.h"

namespace zenith {
namespace network {

// POST JSON 정책 서비스 -> PolicyVerdict
class HttpPolicyOracle : public core::IPolicyOracle {
public:
    static constexpr long kRequestTimeoutSec = 10L;

    explicit HttpPolicyOracle(std::string endpoint);

    strategy::PolicyVerdict decide(const nlohmann::json& payload) override;

private:
    std::string endpoint_;
    CurlSession session_;
};

// POST {"symbol"} 쇼크 위험 서비스 -> ShockRisk
class HttpShockRiskClient : public core::IShockRiskSource {
public:
    static constexpr long kRequestTimeoutSec = 10L;

    explicit HttpShockRiskClient(std::string endpoint);

    strategy::ShockRisk fetch(const std::string& symbol) override;

private:
    std::string endpoint_;
    CurlSession session_;
};

} // namespace network
} // namespace zenith
