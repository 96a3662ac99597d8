#include "analytics/CandlePatterns.h"

#include <algorithm>
#include <cmath>

namespace zenith {
namespace analytics {

namespace {
double body(const Candle& c) { return std::abs(c.close - c.open); }
double range(const Candle& c) { return c.high - c.low; }
bool isBullish(const Candle& c) { return c.close >= c.open; }
bool isBearish(const Candle& c) { return c.close < c.open; }
double upperShadow(const Candle& c) { return c.high - std::max(c.open, c.close); }
double lowerShadow(const Candle& c) { return std::min(c.open, c.close) - c.low; }
} // namespace

bool CandlePatterns::isEngulfing(const std::vector<Candle>& candles, size_t idx, bool long_side) {
    if (idx == 0 || idx >= candles.size()) return false;
    const auto& cur = candles[idx];
    const auto& prev = candles[idx - 1];

    if (long_side) {
        return isBullish(cur) && isBearish(prev) &&
               cur.open <= prev.close && cur.close >= prev.open && body(cur) >= body(prev);
    }
    return isBearish(cur) && isBullish(prev) &&
           cur.open >= prev.close && cur.close <= prev.open && body(cur) >= body(prev);
}

bool CandlePatterns::isHammer(const std::vector<Candle>& candles, size_t idx) {
    if (idx >= candles.size()) return false;
    const auto& cur = candles[idx];
    const double b = body(cur);
    const double r = range(cur);
    if (r <= 0.0) return false;
    return lowerShadow(cur) >= b * 2.0 && upperShadow(cur) <= b && b / r <= 0.5;
}

bool CandlePatterns::isShootingStar(const std::vector<Candle>& candles, size_t idx) {
    if (idx >= candles.size()) return false;
    const auto& cur = candles[idx];
    const double b = body(cur);
    const double r = range(cur);
    if (r <= 0.0) return false;
    return upperShadow(cur) >= b * 2.0 && lowerShadow(cur) <= b && b / r <= 0.5;
}

bool CandlePatterns::isDoji(const std::vector<Candle>& candles, size_t idx) {
    if (idx >= candles.size()) return false;
    const double r = range(candles[idx]);
    if (r <= 0.0) return false;
    return body(candles[idx]) <= r * 0.1;
}

std::optional<TweezerType> CandlePatterns::tweezer(const std::vector<Candle>& candles, size_t idx) {
    if (idx == 0 || idx >= candles.size()) return std::nullopt;
    const auto& cur = candles[idx];
    const auto& prev = candles[idx - 1];
    const double tolerance = (range(cur) + range(prev)) / 2.0 * 0.1;

    if (std::abs(cur.high - prev.high) <= tolerance && isBearish(cur) && isBullish(prev)) {
        return TweezerType::TOP;
    }
    if (std::abs(cur.low - prev.low) <= tolerance && isBullish(cur) && isBearish(prev)) {
        return TweezerType::BOTTOM;
    }
    return std::nullopt;
}

bool CandlePatterns::isMarubozu(const std::vector<Candle>& candles, size_t idx, bool long_side) {
    if (idx >= candles.size()) return false;
    const auto& cur = candles[idx];
    const double r = range(cur);
    if (r <= 0.0) return false;
    if (body(cur) / r < 0.8) return false;
    return long_side ? isBullish(cur) : isBearish(cur);
}

std::vector<std::string> CandlePatterns::confirmingPatterns(
    const std::vector<Candle>& candles, size_t idx, bool long_side) {
    std::vector<std::string> names;
    if (isEngulfing(candles, idx, long_side)) {
        names.push_back(long_side ? "LONGEngulfing" : "SHORTEngulfing");
    }
    if (long_side && isHammer(candles, idx)) names.push_back("Hammer");
    if (!long_side && isShootingStar(candles, idx)) names.push_back("ShootingStar");
    if (isDoji(candles, idx)) names.push_back("Doji");
    if (const auto tw = tweezer(candles, idx)) {
        names.push_back(*tw == TweezerType::TOP ? "Tweezer-top" : "Tweezer-bottom");
    }
    if (isMarubozu(candles, idx, long_side)) names.push_back("Marubozu");
    return names;
}

} // namespace analytics
} // namespace zenith
