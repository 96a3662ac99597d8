#include "network/BinanceHttpClient.h"
#include "network/RequestSigner.h"
#include "common/Logger.h"
#include "common/Types.h"
#include <algorithm>
#include <cctype>
#include <set>
#include <stdexcept>

namespace zenith {
namespace network {
namespace {
bool isSensitiveKey(const std::string& key) {
    static const std::set<std::string> kKeys = {
        "apikey", "api_key", "secret", "secretkey", "signature",
        "authorization", "bearer", "token", "listenkey"
    };
    std::string lower = key;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return kKeys.find(lower) != kKeys.end();
}

void maskSensitiveJson(nlohmann::json& node) {
    if (node.is_object()) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            if (isSensitiveKey(it.key())) {
                it.value() = "***";
            } else {
                maskSensitiveJson(it.value());
            }
        }
        return;
    }
    if (node.is_array()) {
        for (auto& item : node) {
            maskSensitiveJson(item);
        }
    }
}

std::optional<int> retryAfter(const HttpResponse& response) {
    const std::string value = response.header("Retry-After");
    if (value.empty() || value.size() > 6 ||
        !std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return std::nullopt;
    }
    return std::stoi(value);
}
} // namespace

BinanceHttpClient::BinanceHttpClient(
    const std::string& api_key,
    const std::string& api_secret,
    bool use_testnet,
    long recv_window_ms
)
    : api_key_(api_key)
    , api_secret_(api_secret)
    , base_url_(use_testnet ? kTestnetUrl : kProductionUrl)
    , recv_window_ms_(recv_window_ms)
    , session_(30L)
    , rate_limiter_(std::make_shared<execution::RateLimiter>())
{
    LOG_INFO("Binance futures REST: {}", base_url_);
}

std::string BinanceHttpClient::groupFor(const std::string& endpoint) {
    if (endpoint.find("/order") != std::string::npos ||
        endpoint.find("/leverage") != std::string::npos) return "order";
    if (endpoint.find("/exchangeInfo") != std::string::npos) return "exchange_info";
    if (endpoint.find("/account") != std::string::npos ||
        endpoint.find("/positionRisk") != std::string::npos ||
        endpoint.find("/balance") != std::string::npos) return "account";
    if (endpoint.find("/klines") != std::string::npos ||
        endpoint.find("/depth") != std::string::npos ||
        endpoint.find("/aggTrades") != std::string::npos ||
        endpoint.find("/ticker") != std::string::npos) return "market";
    return "default";
}

HttpResponse BinanceHttpClient::get(const std::string& endpoint, const QueryParams& params, bool signed_request) {
    return send("GET", endpoint, params, signed_request);
}

HttpResponse BinanceHttpClient::post(const std::string& endpoint, const QueryParams& params, bool signed_request) {
    return send("POST", endpoint, params, signed_request);
}

HttpResponse BinanceHttpClient::send(
    const std::string& method,
    const std::string& endpoint,
    const QueryParams& params,
    bool signed_request
) {
    rate_limiter_->acquire(groupFor(endpoint));

    std::map<std::string, std::string> headers;
    std::string query;
    if (signed_request) {
        if (api_key_.empty() || api_secret_.empty()) {
            throw std::runtime_error("Binance API credentials are not configured");
        }
        QueryParams signed_params = params;
        signed_params["recvWindow"] = std::to_string(recv_window_ms_);
        signed_params["timestamp"] = std::to_string(currentTimeMs());
        query = RequestSigner::signQuery(RequestSigner::buildQueryString(signed_params), api_secret_);
    } else {
        query = RequestSigner::buildQueryString(params);
    }
    if (!api_key_.empty()) {
        headers["X-MBX-APIKEY"] = api_key_;
    }

    std::string url = base_url_ + endpoint;
    std::string body;
    if (method == "POST") {
        headers["Content-Type"] = "application/x-www-form-urlencoded";
        body = query;
    } else if (!query.empty()) {
        url += "?" + query;
    }

    auto response = session_.perform(method, url, body, headers);

    const std::string used_weight = response.header("X-MBX-USED-WEIGHT-1M");
    if (!used_weight.empty()) {
        rate_limiter_->updateFromHeader(used_weight);
    }
    if (response.isRateLimited() || response.isBlocked()) {
        rate_limiter_->handleRateLimitError(response.status_code, retryAfter(response));
    }
    if (!response.isSuccess()) {
        LOG_WARN("{} {} -> {} {}", method, endpoint, response.status_code, sanitizeForLog(response.body));
    }
    return response;
}

std::string BinanceHttpClient::errorMessage(const HttpResponse& response) {
    try {
        auto payload = response.json();
        if (payload.is_object() && payload.contains("msg") && payload["msg"].is_string()) {
            return payload["msg"].get<std::string>();
        }
    } catch (const nlohmann::json::parse_error&) {
        // 본문이 JSON 이 아니면 원문 사용
    }
    return response.body.empty() ? "empty response" : sanitizeForLog(response.body);
}

nlohmann::json BinanceHttpClient::unwrap(const HttpResponse& response) {
    if (!response.isSuccess()) {
        throw std::runtime_error("Binance request failed: " + std::to_string(response.status_code) +
                                 " (" + errorMessage(response) + ")");
    }
    try {
        return response.json();
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error(std::string("Binance response is not valid JSON: ") + e.what());
    }
}

std::string BinanceHttpClient::sanitizeForLog(const std::string& text) {
    try {
        auto j = nlohmann::json::parse(text);
        maskSensitiveJson(j);
        return j.dump();
    } catch (const nlohmann::json::parse_error&) {
        return text;
    }
}

} // namespace network
} // namespace zenith
