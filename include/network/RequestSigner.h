#pragma once

#include <string>
#include "network/IHttpClient.h"

namespace zenith {
namespace network {

// 바이낸스 SIGNED 엔드포인트용 HMAC-SHA256 서명
class RequestSigner {
public:
    // 소문자 hex
    static std::string hmacSha256Hex(const std::string& secret, const std::string& message);

    // key=value&... (키 정렬 순서)
    static std::string buildQueryString(const QueryParams& params);

    // query 뒤에 &signature=<hex> 부착
    static std::string signQuery(const std::string& query, const std::string& secret);
};

} // namespace network
} // namespace zenith
