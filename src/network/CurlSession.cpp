#include "network/CurlSession.h"
#include <algorithm>
#include <cctype>
#include <memory>
#include <stdexcept>

namespace zenith {
namespace network {

namespace {
std::string lowerAscii(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::string trimmed(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

// 프로세스당 한 번
struct CurlGlobalGuard {
    CurlGlobalGuard() { curl_global_init(CURL_GLOBAL_ALL); }
    ~CurlGlobalGuard() { curl_global_cleanup(); }
};

struct SlistDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};
using HeaderList = std::unique_ptr<curl_slist, SlistDeleter>;
} // namespace

std::string HttpResponse::header(const std::string& name) const {
    // CurlSession 은 소문자 키로 저장, 테스트 가짜 응답은 원래 표기 그대로일 수 있음
    auto it = headers.find(lowerAscii(name));
    if (it != headers.end()) {
        return it->second;
    }
    const std::string wanted = lowerAscii(name);
    for (const auto& [key, value] : headers) {
        if (lowerAscii(key) == wanted) {
            return value;
        }
    }
    return "";
}

CurlSession::CurlSession(long timeout_sec)
    : CurlSession(CurlTimeouts{timeout_sec, 5000L}) {}

CurlSession::CurlSession(const CurlTimeouts& timeouts)
    : curl_(nullptr)
    , timeouts_(timeouts)
{
    static CurlGlobalGuard global;
    curl_ = curl_easy_init();
    if (!curl_) {
        throw std::runtime_error("Failed to initialize CURL");
    }
}

CurlSession::~CurlSession() {
    if (curl_) {
        curl_easy_cleanup(curl_);
    }
}

std::string CurlSession::stripQuery(const std::string& url) {
    const auto pos = url.find('?');
    return pos == std::string::npos ? url : url.substr(0, pos);
}

HttpResponse CurlSession::perform(
    const std::string& method,
    const std::string& url,
    const std::string& body_data,
    const std::map<std::string, std::string>& headers
) {
    if (method != "GET" && method != "POST") {
        throw std::invalid_argument("Unsupported HTTP method: " + method);
    }

    std::lock_guard<std::mutex> lock(mutex_);

    HttpResponse response;

    curl_easy_reset(curl_);
    curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, appendBody);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl_, CURLOPT_HEADERFUNCTION, collectHeader);
    curl_easy_setopt(curl_, CURLOPT_HEADERDATA, &response.headers);
    curl_easy_setopt(curl_, CURLOPT_TIMEOUT, timeouts_.total_sec);
    curl_easy_setopt(curl_, CURLOPT_CONNECTTIMEOUT_MS, timeouts_.connect_ms);
    curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl_, CURLOPT_ACCEPT_ENCODING, "");
    curl_easy_setopt(curl_, CURLOPT_USERAGENT, "zenith/1.0");

    if (method == "POST") {
        curl_easy_setopt(curl_, CURLOPT_POST, 1L);
        curl_easy_setopt(curl_, CURLOPT_POSTFIELDS, body_data.c_str());
        curl_easy_setopt(curl_, CURLOPT_POSTFIELDSIZE, static_cast<long>(body_data.size()));
    }

    HeaderList header_list;
    for (const auto& [key, value] : headers) {
        const std::string line = key + ": " + value;
        curl_slist* appended = curl_slist_append(header_list.get(), line.c_str());
        if (!appended) {
            throw std::runtime_error("CURL error: header allocation failed");
        }
        header_list.release();
        header_list.reset(appended);
    }
    curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, header_list.get());

    const CURLcode res = curl_easy_perform(curl_);
    if (res != CURLE_OK) {
        throw std::runtime_error("CURL error: " + std::string(curl_easy_strerror(res)) +
                                 " [" + method + " " + stripQuery(url) + "]");
    }

    long http_code = 0;
    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &http_code);
    response.status_code = static_cast<int>(http_code);
    return response;
}

size_t CurlSession::appendBody(void* contents, size_t size, size_t nmemb, void* userp) {
    const size_t total = size * nmemb;
    static_cast<std::string*>(userp)->append(static_cast<const char*>(contents), total);
    return total;
}

// "Name: value" 줄만 수집, 키는 소문자. 상태줄/빈 줄은 무시
size_t CurlSession::collectHeader(char* buffer, size_t size, size_t nitems, void* userdata) {
    const size_t total = size * nitems;
    const std::string line(buffer, total);

    const auto colon = line.find(':');
    if (colon != std::string::npos) {
        auto* out = static_cast<std::map<std::string, std::string>*>(userdata);
        (*out)[lowerAscii(trimmed(line.substr(0, colon)))] = trimmed(line.substr(colon + 1));
    }
    return total;
}

} // namespace network
} // namespace zenith
