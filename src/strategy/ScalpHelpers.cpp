#include "strategy/ScalpHelpers.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <limits>

namespace zenith {
namespace strategy {
namespace helpers {

namespace {
std::string fixed(double value, int decimals) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.*f", decimals, value);
    return buf;
}
} // namespace

double bodySize(const Candle& candle) {
    return std::abs(candle.close - candle.open);
}

double avgBody(const std::vector<Candle>& candles, size_t n) {
    if (candles.empty()) return 0.0;
    const size_t count = std::min(n, candles.size());
    double sum = 0.0;
    for (size_t i = candles.size() - count; i < candles.size(); ++i) {
        sum += bodySize(candles[i]);
    }
    return sum / static_cast<double>(count);
}

bool retracedWithinBars(double level, const ScalpFeatures& features, size_t n) {
    const auto& cs = features.candles;
    if (cs.empty() || !std::isfinite(level)) return false;
    const size_t count = std::min(n, cs.size());
    for (size_t i = cs.size() - count; i < cs.size(); ++i) {
        if (cs[i].low <= level && level <= cs[i].high) {
            return true;
        }
    }
    return false;
}

double distanceInAtr(double price, double level, double atr) {
    const double dist = std::abs(price - level);
    if (!(atr > 0.0)) {
        return dist == 0.0 ? 0.0 : std::numeric_limits<double>::infinity();
    }
    return dist / atr;
}

double lastSwing(const ScalpFeatures& features, Side side) {
    const auto& cs = features.candles;
    if (cs.size() < 2) return features.close;
    // 현재 봉은 제외 (돌파 판정 대상)
    const size_t end = cs.size() - 1;
    const size_t count = std::min<size_t>(10, end);
    double low = cs[end - count].low;
    double high = cs[end - count].high;
    for (size_t i = end - count; i < end; ++i) {
        low = std::min(low, cs[i].low);
        high = std::max(high, cs[i].high);
    }
    return side == Side::LONG ? low : high;
}

EntryLevel pickNearestEntryLevel(const ScalpFeatures& features, const std::optional<FvgZone>& fvg) {
    std::vector<std::pair<EntryLevel, double>> levels;
    if (!features.vp.lvn.empty()) {
        levels.emplace_back(EntryLevel::LVN, features.vp.lvn.front());
    }
    levels.emplace_back(EntryLevel::VAH, features.vp.vah);
    levels.emplace_back(EntryLevel::VAL, features.vp.val);
    levels.emplace_back(EntryLevel::EMA25, features.ema25);
    levels.emplace_back(EntryLevel::EMA50, features.ema50);
    if (fvg) {
        levels.emplace_back(EntryLevel::FVG_EDGE, (fvg->from + fvg->to) / 2.0);
    }

    // 동일 거리면 먼저 나온 레벨 유지
    auto best = levels.front();
    for (const auto& level : levels) {
        if (std::abs(features.close - level.second) < std::abs(features.close - best.second)) {
            best = level;
        }
    }
    return best.first;
}

VpNearCheck vpNear(const ScalpFeatures& features, double price) {
    const double tolerance = features.atr22 * 0.5;
    auto near = [&](double level) { return std::abs(price - level) <= tolerance; };
    if (near(features.vp.vah)) return {true, EntryLevel::VAH};
    if (near(features.vp.val)) return {true, EntryLevel::VAL};
    if (near(features.vp.poc)) return {true, EntryLevel::POC};
    return {false, EntryLevel::NA};
}

bool rsiOk(const ScalpFeatures& features, Side side) {
    return side == Side::LONG ? features.rsi14 > 50.0 : features.rsi14 < 50.0;
}

bool regimeOk(const ScalpFeatures& f, Side side) {
    if (side == Side::LONG) {
        return f.ema25 > f.ema50 && f.ema50 > f.ema100 && f.close > f.ema25;
    }
    return f.ema25 < f.ema50 && f.ema50 < f.ema100 && f.close < f.ema25;
}

OrderFlowCheck orderflowRatio(const ScalpFeatures& features, Side side, const ScalpConfig& config) {
    const auto& of = features.orderflow;
    OrderFlowCheck check;
    check.ratio = side == Side::LONG ? of.buy / std::max(1e-9, of.sell)
                                     : of.sell / std::max(1e-9, of.buy);
    check.ok = check.ratio >= config.orderflow_ratio_min || of.bubble;
    check.reason = "ofRatio=" + fixed(check.ratio, 2) + " bubble=" + (of.bubble ? "true" : "false");
    return check;
}

bool hasLargePrint(const ScalpFeatures& features, Side side, long long now_ms, const ScalpConfig& config) {
    if (features.trades.empty()) {
        return features.orderflow.bubble;
    }
    const bool want_buy = side == Side::LONG;
    std::vector<double> recent;
    for (const auto& t : features.trades) {
        if (now_ms - t.ts_ms <= config.large_trade_window_ms && t.is_buy == want_buy) {
            recent.push_back(t.qty);
        }
    }
    if (recent.empty()) {
        return features.orderflow.bubble;
    }
    for (double qty : recent) {
        if (qty >= config.large_trade_abs_qty) return true;
    }
    double sum = 0.0;
    for (double qty : recent) sum += qty;
    const double avg = sum / static_cast<double>(recent.size());
    for (double qty : recent) {
        if (qty >= avg * config.large_trade_multiple) return true;
    }
    return false;
}

FvgCheck fvgForSide(const ScalpFeatures& features, Side side, const ScalpConfig& config) {
    const FvgType want = side == Side::LONG ? FvgType::BULLISH : FvgType::BEARISH;
    auto it = std::find_if(features.fvg.begin(), features.fvg.end(),
                           [&](const FvgZone& z) { return z.type == want; });
    FvgCheck check;
    if (it == features.fvg.end()) {
        check.reason = "no FVG";
        return check;
    }
    check.ok = it->size >= features.fvg_avg_size * config.fvg_min_multiple;
    if (check.ok) {
        check.zone = *it;
        check.reason = "fvgSize=" + fixed(it->size, 2) + " ok";
    } else {
        check.reason = "fvg too small";
    }
    return check;
}

double signalFreshSec(long long signal_ts_ms, long long now_ms) {
    return std::max(0.0, static_cast<double>(now_ms - signal_ts_ms) / 1000.0);
}

bool shouldForceFlat(double hold_sec, int bars_held, const ScalpConfig& config) {
    return hold_sec >= config.max_hold_sec || bars_held >= config.max_bars;
}

double depthBias(const MicroMetrics& micro, Side side) {
    if (side == Side::LONG) {
        return micro.bid_qty10 / std::max(1.0, micro.ask_qty10);
    }
    return std::max(1.0, micro.ask_qty10) / std::max(1.0, micro.bid_qty10);
}

} // namespace helpers
} // namespace strategy
} // namespace zenith
