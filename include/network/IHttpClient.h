#pragma once

#include <string>
#include <map>
#include <nlohmann/json.hpp>

namespace zenith {
namespace network {

using QueryParams = std::map<std::string, std::string>;

struct HttpResponse {
    int status_code = 0;
    std::string body;
    std::map<std::string, std::string> headers;

    bool isSuccess() const { return status_code >= 200 && status_code < 300; }
    bool isRateLimited() const { return status_code == 429; }
    bool isBlocked() const { return status_code == 418; }

    // 파싱 실패는 nlohmann::json::parse_error
    nlohmann::json json() const {
        return nlohmann::json::parse(body);
    }

    // 헤더 이름은 대소문자 무시
    std::string header(const std::string& name) const;
};

// 거래소 REST 전송 계층. signed_request 이면 timestamp/recvWindow/signature 부착
class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    virtual HttpResponse get(
        const std::string& endpoint,
        const QueryParams& params = {},
        bool signed_request = false
    ) = 0;

    virtual HttpResponse post(
        const std::string& endpoint,
        const QueryParams& params = {},
        bool signed_request = true
    ) = 0;
};

} // namespace network
} // namespace zenith
