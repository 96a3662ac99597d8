#pragma once

#include "network/IHttpClient.h"
#include <curl/curl.h>
#include <mutex>

namespace zenith {
namespace network {

struct CurlTimeouts {
    long total_sec = 30L;
    long connect_ms = 5000L;
};

// libcurl easy handle 하나를 잠금 아래 재사용 (GET/POST 만).
// 전송 실패는 std::runtime_error("CURL error: ... [url]"), 쿼리 문자열은 메시지에서 제외
class CurlSession {
public:
    explicit CurlSession(long timeout_sec = 30L);
    explicit CurlSession(const CurlTimeouts& timeouts);
    ~CurlSession();

    CurlSession(const CurlSession&) = delete;
    CurlSession& operator=(const CurlSession&) = delete;

    HttpResponse perform(
        const std::string& method,
        const std::string& url,
        const std::string& body_data,
        const std::map<std::string, std::string>& headers
    );

    // 로그/예외용: '?' 이후 제거 (서명 노출 방지)
    static std::string stripQuery(const std::string& url);

private:
    static size_t appendBody(void* contents, size_t size, size_t nmemb, void* userp);
    static size_t collectHeader(char* buffer, size_t size, size_t nitems, void* userdata);

    CURL* curl_;
    CurlTimeouts timeouts_;
    std::mutex mutex_;
};

} // namespace network
} // namespace zenith
