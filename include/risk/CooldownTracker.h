#pragma once

#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace zenith {
namespace risk {

enum class CooldownEvent { STOP, SLIP };

// 심볼별 손절/슬리피지 이벤트를 롤링 윈도우로 추적해 일시 차단
class CooldownTracker {
public:
    CooldownTracker(long long window_ms = 120000, long long cooldown_ms = 60000);

    void registerEvent(const std::string& symbol, CooldownEvent type, long long now_ms);

    // 조회 시 윈도우 밖 이벤트 정리, 남은 게 없으면 심볼 상태 제거
    bool isBlocked(const std::string& symbol, long long now_ms);
    void clear(const std::string& symbol);

    std::optional<long long> blockedUntil(const std::string& symbol) const;
    size_t eventCount(const std::string& symbol, CooldownEvent type, long long now_ms);
    size_t trackedSymbolCount() const;

private:
    struct CooldownState {
        std::deque<long long> stop_events;
        std::deque<long long> slip_events;
        long long blocked_until = 0;
    };

    void prune(std::deque<long long>& events, long long now_ms) const;

    long long window_ms_;
    long long cooldown_ms_;
    std::map<std::string, CooldownState> states_;
    mutable std::mutex mutex_;
};

const char* toString(CooldownEvent type);

} // namespace risk
} // namespace zenith
