#include "risk/CooldownTracker.h"
#include "common/Logger.h"

namespace zenith {
namespace risk {

namespace {
constexpr size_t kEventsToBlock = 2;
}

const char* toString(CooldownEvent type) {
    return type == CooldownEvent::STOP ? "stop" : "slip";
}

CooldownTracker::CooldownTracker(long long window_ms, long long cooldown_ms)
    : window_ms_(window_ms)
    , cooldown_ms_(cooldown_ms) {}

void CooldownTracker::prune(std::deque<long long>& events, long long now_ms) const {
    while (!events.empty() && now_ms - events.front() > window_ms_) {
        events.pop_front();
    }
}

void CooldownTracker::registerEvent(const std::string& symbol, CooldownEvent type, long long now_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& state = states_[symbol];
    auto& events = (type == CooldownEvent::STOP) ? state.stop_events : state.slip_events;

    prune(events, now_ms);
    events.push_back(now_ms);

    if (events.size() >= kEventsToBlock) {
        state.blocked_until = now_ms + cooldown_ms_;
        LOG_WARN("{} 쿨다운 진입: {} 이벤트 {}회 / {}ms, {}ms 동안 신규 진입 차단",
                 symbol, toString(type), events.size(), window_ms_, cooldown_ms_);
    }
}

bool CooldownTracker::isBlocked(const std::string& symbol, long long now_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = states_.find(symbol);
    if (it == states_.end()) {
        return false;
    }
    auto& state = it->second;
    prune(state.stop_events, now_ms);
    prune(state.slip_events, now_ms);

    if (state.blocked_until != 0 && now_ms >= state.blocked_until) {
        state.blocked_until = 0;
    }
    if (state.blocked_until == 0 && state.stop_events.empty() && state.slip_events.empty()) {
        states_.erase(it);
        return false;
    }
    return state.blocked_until != 0;
}

void CooldownTracker::clear(const std::string& symbol) {
    std::lock_guard<std::mutex> lock(mutex_);
    states_.erase(symbol);
}

std::optional<long long> CooldownTracker::blockedUntil(const std::string& symbol) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = states_.find(symbol);
    if (it == states_.end() || it->second.blocked_until == 0) {
        return std::nullopt;
    }
    return it->second.blocked_until;
}

size_t CooldownTracker::eventCount(const std::string& symbol, CooldownEvent type, long long now_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = states_.find(symbol);
    if (it == states_.end()) {
        return 0;
    }
    auto& events = (type == CooldownEvent::STOP) ? it->second.stop_events : it->second.slip_events;
    prune(events, now_ms);
    return events.size();
}

size_t CooldownTracker::trackedSymbolCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return states_.size();
}

} // namespace risk
} // namespace zenith
