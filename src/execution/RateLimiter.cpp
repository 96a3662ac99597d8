#include "execution/RateLimiter.h"
#include "common/Logger.h"
#include <algorithm>
#include <cctype>

namespace zenith {
namespace execution {

namespace {
using std::chrono::milliseconds;
using std::chrono::seconds;

// "1234" 또는 "1234, ..." 에서 첫 숫자열
std::optional<int> leadingInt(const std::string& text) {
    std::string digits;
    for (char c : text) {
        if (std::isdigit(static_cast<unsigned char>(c))) {
            digits.push_back(c);
        } else if (!digits.empty()) {
            break;
        }
    }
    if (digits.empty() || digits.size() > 9) {
        return std::nullopt;
    }
    return std::stoi(digits);
}

milliseconds elapsedSince(RateLimiter::Clock::time_point start) {
    return std::chrono::duration_cast<milliseconds>(RateLimiter::Clock::now() - start);
}
} // namespace

RateLimiter::RateLimiter() {
    // USDⓈ-M 공개 한도 기준 (IP weight 2400/분, 주문 300/10초)
    windows_.emplace("market", Window{20, seconds(1)});          // klines/depth/aggTrades/ticker
    windows_.emplace("exchange_info", Window{2, seconds(1)});
    windows_.emplace("account", Window{10, seconds(1)});         // account/positionRisk/leverage
    windows_.emplace("order", Window{300, seconds(10)});
    windows_.emplace("default", Window{10, seconds(1)});
}

RateLimiter::Window& RateLimiter::windowFor(const std::string& group) {
    auto it = windows_.find(group);
    if (it == windows_.end()) {
        it = windows_.find("default");
    }
    return it->second;
}

bool RateLimiter::takeToken(Window& window, Clock::time_point now) {
    if (now - window.started >= window.length) {
        window.used = 0;
        window.started = now;
    }
    if (window.used >= window.limit) {
        return false;
    }
    ++window.used;
    ++stats_.total_requests;
    return true;
}

std::optional<RateLimiter::Clock::time_point> RateLimiter::pausedUntil(Clock::time_point now) {
    if (!pause_end_) {
        return std::nullopt;
    }
    if (now >= *pause_end_) {
        pause_end_.reset();
        LOG_INFO("요청 정지 해제");
        return std::nullopt;
    }
    return pause_end_;
}

bool RateLimiter::tryAcquire(const std::string& group) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = Clock::now();
    if (pausedUntil(now) || !takeToken(windowFor(group), now)) {
        ++stats_.rejected_requests;
        return false;
    }
    return true;
}

void RateLimiter::acquire(const std::string& group) {
    std::unique_lock<std::mutex> lock(mutex_);
    Window& window = windowFor(group);

    for (;;) {
        const auto now = Clock::now();
        Clock::time_point wake;
        if (auto paused = pausedUntil(now)) {
            wake = *paused;
        } else if (takeToken(window, now)) {
            return;
        } else {
            wake = window.started + window.length + milliseconds(1);
            ++stats_.forced_waits;
        }

        // pauseUntil() 이 정지를 늘리면 깨어나서 다시 계산
        const auto wait_start = Clock::now();
        cv_.wait_until(lock, wake);
        stats_.total_wait_time += elapsedSince(wait_start);
    }
}

int RateLimiter::getRemainingRequests(const std::string& group) {
    std::lock_guard<std::mutex> lock(mutex_);
    Window& window = windowFor(group);
    if (Clock::now() - window.started >= window.length) {
        return window.limit;
    }
    return std::max(0, window.limit - window.used);
}

void RateLimiter::updateFromHeader(const std::string& used_weight_header) {
    const auto used = leadingInt(used_weight_header);
    if (!used) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    stats_.last_used_weight = *used;
    if (*used < static_cast<int>(kWeightLimitPerMinute * kWeightThrottleRatio)) {
        return;
    }

    // 서버 weight 는 벽시계 분 단위로 초기화
    const auto into_minute = std::chrono::duration_cast<milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()) % std::chrono::minutes(1);
    LOG_WARN("used weight {}/{} - 다음 분까지 요청 정지", *used, kWeightLimitPerMinute);
    pauseUntil(Clock::now() + (std::chrono::minutes(1) - into_minute));
}

void RateLimiter::handleRateLimitError(int status_code, std::optional<int> retry_after_sec) {
    if (status_code != 429 && status_code != 418) {
        return;
    }
    const int pause_sec = retry_after_sec.value_or(status_code == 418 ? 60 : 1);

    std::lock_guard<std::mutex> lock(mutex_);
    if (status_code == 418) {
        LOG_ERROR("418 IP 차단 ({}초간 전체 정지)", pause_sec);
    } else {
        LOG_WARN("429 Too Many Requests ({}초간 전체 정지)", pause_sec);
    }
    ++stats_.forced_waits;
    pauseUntil(Clock::now() + seconds(pause_sec));
}

bool RateLimiter::isBlocked() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pause_end_ && Clock::now() < *pause_end_;
}

RateLimiter::Stats RateLimiter::getStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

// 정지는 늘리기만 함
void RateLimiter::pauseUntil(Clock::time_point until) {
    if (pause_end_ && *pause_end_ >= until) {
        return;
    }
    pause_end_ = until;
    cv_.notify_all();
}

} // namespace execution
} // namespace zenith
