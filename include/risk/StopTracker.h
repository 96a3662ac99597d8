#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>

#include "risk/ExitPlanner.h"

namespace zenith {
namespace risk {

enum class StopAction { NONE, TP1_HIT, STOP_HIT };

struct TrackedStop {
    ExitPlan plan;
    double stop = 0.0;
    bool hit_tp1 = false;
    long long opened_ms = 0;
    long long last_bar_open_ms = 0;
    int bars_held = 0;
};

struct StopUpdate {
    StopAction action = StopAction::NONE;
    double stop = 0.0;
    bool hit_tp1 = false;
    double hold_sec = 0.0;
    int bars_held = 0;
};

// 심볼별 진입 후 손절/TP1 추적. 보유시간/봉 수 초과 판정은 호출측
class StopTracker {
public:
    void track(const std::string& symbol, const ExitPlan& plan, long long now_ms, long long bar_open_ms);

    // 추적 중이 아니면 nullopt. 손절 판정은 종가 기준
    std::optional<StopUpdate> update(
        const std::string& symbol,
        const Candle& last,
        double atr,
        long long now_ms
    );

    void release(const std::string& symbol);
    bool isTracking(const std::string& symbol) const;
    std::optional<TrackedStop> get(const std::string& symbol) const;

private:
    std::map<std::string, TrackedStop> tracked_;
    mutable std::mutex mutex_;
};

const char* toString(StopAction action);

} // namespace risk
} // namespace zenith
