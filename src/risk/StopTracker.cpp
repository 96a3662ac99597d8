#include "risk/StopTracker.h"
#include "common/Logger.h"

namespace zenith {
namespace risk {

using strategy::Side;

const char* toString(StopAction action) {
    switch (action) {
        case StopAction::NONE: return "none";
        case StopAction::TP1_HIT: return "tp1";
        case StopAction::STOP_HIT: return "stop";
    }
    return "none";
}

void StopTracker::track(const std::string& symbol, const ExitPlan& plan, long long now_ms, long long bar_open_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    TrackedStop state;
    state.plan = plan;
    state.stop = plan.stop;
    state.opened_ms = now_ms;
    state.last_bar_open_ms = bar_open_ms;
    tracked_[symbol] = state;

    LOG_INFO("[{}] exit plan {} entry={} stop={} tp1={}",
             symbol, strategy::toString(plan.side), plan.entry, plan.stop,
             plan.tp1 ? *plan.tp1 : 0.0);
}

std::optional<StopUpdate> StopTracker::update(
    const std::string& symbol,
    const Candle& last,
    double atr,
    long long now_ms
) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tracked_.find(symbol);
    if (it == tracked_.end()) {
        return std::nullopt;
    }
    auto& state = it->second;
    const bool is_long = state.plan.side == Side::LONG;

    if (last.open_time > state.last_bar_open_ms) {
        ++state.bars_held;
        state.last_bar_open_ms = last.open_time;
    }

    StopUpdate update;

    // 직전까지 유효했던 손절가로 판정
    const bool breached = is_long ? last.close <= state.stop : last.close >= state.stop;

    bool tp1_now = false;
    if (!state.hit_tp1 && state.plan.tp1) {
        tp1_now = is_long ? last.close >= *state.plan.tp1 : last.close <= *state.plan.tp1;
        if (tp1_now) {
            state.hit_tp1 = true;
        }
    }

    if (!breached) {
        const double next = ExitPlanner::updateStop(state.plan, state.stop, last, atr, state.hit_tp1);
        if (next != state.stop) {
            LOG_DEBUG("[{}] stop {} -> {}", symbol, state.stop, next);
            state.stop = next;
        }
    }

    update.stop = state.stop;
    update.hit_tp1 = state.hit_tp1;
    update.hold_sec = static_cast<double>(now_ms - state.opened_ms) / 1000.0;
    update.bars_held = state.bars_held;

    if (breached) {
        update.action = StopAction::STOP_HIT;
    } else if (tp1_now) {
        update.action = StopAction::TP1_HIT;
    }
    return update;
}

void StopTracker::release(const std::string& symbol) {
    std::lock_guard<std::mutex> lock(mutex_);
    tracked_.erase(symbol);
}

bool StopTracker::isTracking(const std::string& symbol) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tracked_.count(symbol) > 0;
}

std::optional<TrackedStop> StopTracker::get(const std::string& symbol) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tracked_.find(symbol);
    if (it == tracked_.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace risk
} // namespace zenith
