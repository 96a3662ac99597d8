#pragma once

#include <string>
#include <map>
#include <chrono>
#include <mutex>
#include <optional>
#include <condition_variable>

namespace zenith {
namespace execution {

// 바이낸스 선물 요청 제한.
// 엔드포인트 그룹별 고정 윈도우 + 서버가 알려주는 X-MBX-USED-WEIGHT-1M 사용량 + 429/418 전역 정지
class RateLimiter {
public:
    using Clock = std::chrono::steady_clock;

    static constexpr int kWeightLimitPerMinute = 2400;
    static constexpr double kWeightThrottleRatio = 0.9;

    RateLimiter();

    // 즉시 가능하면 토큰 사용 후 true
    bool tryAcquire(const std::string& group);

    // 전역 정지/윈도우 소진 시 풀릴 때까지 대기. 요청을 버리지 않음
    void acquire(const std::string& group);

    int getRemainingRequests(const std::string& group);

    // 한도의 90% 이상이면 다음 분 경계까지 정지
    void updateFromHeader(const std::string& used_weight_header);

    // 429: Retry-After 또는 1초, 418: Retry-After 또는 60초
    void handleRateLimitError(int status_code, std::optional<int> retry_after_sec = std::nullopt);

    bool isBlocked() const;

    struct Stats {
        int total_requests = 0;
        int rejected_requests = 0;
        int forced_waits = 0;
        int last_used_weight = 0;
        std::chrono::milliseconds total_wait_time{0};
    };
    Stats getStats() const;

private:
    struct Window {
        int limit;
        std::chrono::milliseconds length;
        int used = 0;
        Clock::time_point started = Clock::now();
    };

    Window& windowFor(const std::string& group);
    bool takeToken(Window& window, Clock::time_point now);
    void pauseUntil(Clock::time_point until);

    // mutex_ 보유 상태. 정지 중이면 해제 시각
    std::optional<Clock::time_point> pausedUntil(Clock::time_point now);

    std::map<std::string, Window> windows_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;

    Stats stats_;
    std::optional<Clock::time_point> pause_end_;
};

} // namespace execution
} // namespace zenith
