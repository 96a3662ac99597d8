#include "network/PolicyServiceClient.h"
#include "network/OraclePayloadParser.h"

#include <stdexcept>

namespace zenith {
namespace network {

namespace {
nlohmann::json postJson(CurlSession& session, const std::string& endpoint,
                        const nlohmann::json& body, const std::string& service) {
    if (endpoint.empty()) {
        throw std::runtime_error(service + " endpoint is not configured");
    }
    auto response = session.perform("POST", endpoint, body.dump(), {
        {"Content-Type", "application/json"}
    });
    if (!response.isSuccess()) {
        throw std::runtime_error(service + " request failed: " + std::to_string(response.status_code));
    }
    try {
        return response.json();
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error(service + " response is not valid JSON: " + e.what());
    }
}
} // namespace

HttpPolicyOracle::HttpPolicyOracle(std::string endpoint)
    : endpoint_(std::move(endpoint))
    , session_(kRequestTimeoutSec) {}

strategy::PolicyVerdict HttpPolicyOracle::decide(const nlohmann::json& payload) {
    return OraclePayloadParser::parsePolicy(postJson(session_, endpoint_, payload, "Policy service"));
}

HttpShockRiskClient::HttpShockRiskClient(std::string endpoint)
    : endpoint_(std::move(endpoint))
    , session_(kRequestTimeoutSec) {}

strategy::ShockRisk HttpShockRiskClient::fetch(const std::string& symbol) {
    return OraclePayloadParser::parseShockRisk(
        postJson(session_, endpoint_, {{"symbol", symbol}}, "NSW service"));
}

} // namespace network
} // namespace zenith
