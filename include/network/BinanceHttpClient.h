#pragma once

#include "network/IHttpClient.h"
#include "network/CurlSession.h"
#include "execution/RateLimiter.h"
#include <memory>

namespace zenith {
namespace network {

// USDⓈ-M 선물 REST 클라이언트
class BinanceHttpClient : public IHttpClient {
public:
    static constexpr const char* kProductionUrl = "https://fapi.binance.com";
    static constexpr const char* kTestnetUrl = "https://testnet.binancefuture.com";
    static constexpr long kDefaultRecvWindowMs = 5000;

    BinanceHttpClient(
        const std::string& api_key,
        const std::string& api_secret,
        bool use_testnet,
        long recv_window_ms = kDefaultRecvWindowMs
    );

    HttpResponse get(
        const std::string& endpoint,
        const QueryParams& params = {},
        bool signed_request = false
    ) override;

    HttpResponse post(
        const std::string& endpoint,
        const QueryParams& params = {},
        bool signed_request = true
    ) override;

    const std::string& baseUrl() const { return base_url_; }
    execution::RateLimiter::Stats rateLimitStats() const { return rate_limiter_->getStats(); }

    // 2xx 면 JSON, 아니면 "Binance request failed: <status> (<msg>)"
    static nlohmann::json unwrap(const HttpResponse& response);

    // 오류 응답의 msg 필드 (없으면 본문)
    static std::string errorMessage(const HttpResponse& response);

    // 응답 본문의 민감 키 마스킹
    static std::string sanitizeForLog(const std::string& text);

    static std::string groupFor(const std::string& endpoint);

private:
    HttpResponse send(
        const std::string& method,
        const std::string& endpoint,
        const QueryParams& params,
        bool signed_request
    );

    std::string api_key_;
    std::string api_secret_;
    std::string base_url_;
    long recv_window_ms_;
    CurlSession session_;
    std::shared_ptr<execution::RateLimiter> rate_limiter_;
};

} // namespace network
} // namespace zenith
