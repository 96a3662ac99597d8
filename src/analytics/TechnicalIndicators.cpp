#include "analytics/TechnicalIndicators.h"
#include <cmath>
#include <algorithm>
#include <numeric>

namespace zenith {
namespace analytics {

double TechnicalIndicators::calculateSMA(const std::vector<double>& values, int period) {
    if (values.empty()) return 0.0;
    if (period <= 0 || values.size() < static_cast<size_t>(period)) {
        return values.back();
    }
    const double sum = std::accumulate(values.end() - period, values.end(), 0.0);
    return sum / period;
}

double TechnicalIndicators::calculateEMA(const std::vector<double>& values, int period) {
    auto series = calculateEMAVector(values, period);
    return series.empty() ? 0.0 : series.back();
}

std::vector<double> TechnicalIndicators::calculateEMAVector(const std::vector<double>& values, int period) {
    std::vector<double> series;
    if (values.empty() || period <= 0) return series;

    series.reserve(values.size());
    const double k = 2.0 / (period + 1.0);
    double ema = values.front();
    series.push_back(ema);
    for (size_t i = 1; i < values.size(); ++i) {
        ema = values[i] * k + ema * (1.0 - k);
        series.push_back(ema);
    }
    return series;
}

double TechnicalIndicators::calculateRSI(const std::vector<double>& closes, int period) {
    if (period <= 0 || closes.size() <= static_cast<size_t>(period)) {
        return 50.0;
    }

    double gains = 0.0;
    double losses = 0.0;
    for (size_t i = closes.size() - period; i < closes.size(); ++i) {
        const double diff = closes[i] - closes[i - 1];
        if (diff >= 0) gains += diff;
        else losses -= diff;
    }

    const double avg_gain = gains / period;
    const double avg_loss = losses / period;
    if (avg_loss == 0.0) return 100.0;
    if (avg_gain == 0.0) return 0.0;

    const double rs = avg_gain / avg_loss;
    return 100.0 - (100.0 / (1.0 + rs));
}

double TechnicalIndicators::calculateATR(const std::vector<Candle>& candles, int period) {
    if (candles.empty()) return 0.0;

    // 첫 캔들은 직전 종가가 없으므로 고저폭
    std::vector<double> ranges;
    ranges.reserve(candles.size());
    for (size_t i = 0; i < candles.size(); ++i) {
        const auto& c = candles[i];
        if (i == 0) {
            ranges.push_back(c.high - c.low);
            continue;
        }
        const double prev_close = candles[i - 1].close;
        ranges.push_back(std::max({c.high - c.low,
                                   std::abs(c.high - prev_close),
                                   std::abs(c.low - prev_close)}));
    }

    const size_t window = std::min(ranges.size(), static_cast<size_t>(std::max(period, 2)));
    std::vector<double> recent(ranges.end() - window, ranges.end());
    const int ema_period = std::min(period, static_cast<int>(recent.size()));
    return calculateEMA(recent, ema_period);
}

double TechnicalIndicators::calculateMFI(const std::vector<Candle>& candles, int period) {
    if (period <= 0 || candles.size() < static_cast<size_t>(period + 1)) {
        return 50.0;
    }

    double positive_flow = 0.0;
    double negative_flow = 0.0;
    for (size_t i = candles.size() - period; i < candles.size(); ++i) {
        const auto& cur = candles[i];
        const auto& prev = candles[i - 1];
        const double tp = (cur.high + cur.low + cur.close) / 3.0;
        const double prev_tp = (prev.high + prev.low + prev.close) / 3.0;
        const double flow = tp * cur.volume;
        if (tp > prev_tp) positive_flow += flow;
        else if (tp < prev_tp) negative_flow += flow;
    }

    if (negative_flow == 0.0) return 100.0;
    if (positive_flow == 0.0) return 0.0;
    const double ratio = positive_flow / negative_flow;
    return 100.0 - (100.0 / (1.0 + ratio));
}

double TechnicalIndicators::calculateOBVSlope(const std::vector<Candle>& candles, int lookback) {
    if (candles.size() < 2) return 0.0;

    std::vector<double> obv;
    obv.reserve(candles.size());
    double running = 0.0;
    obv.push_back(running);
    for (size_t i = 1; i < candles.size(); ++i) {
        if (candles[i].close > candles[i - 1].close) running += candles[i].volume;
        else if (candles[i].close < candles[i - 1].close) running -= candles[i].volume;
        obv.push_back(running);
    }

    const size_t window = std::min(obv.size(), static_cast<size_t>(std::max(lookback, 2)));
    const double first = obv[obv.size() - window];
    const double last = obv.back();
    const double scale = std::max({std::abs(first), std::abs(last), 1.0});
    return (last - first) / scale;
}

double TechnicalIndicators::calculateVolumeAcceleration(const std::vector<double>& volumes) {
    if (volumes.size() < 6) return 0.0;

    double early = 0.0;
    double late = 0.0;
    const size_t start = volumes.size() - 6;
    for (size_t i = 0; i < 3; ++i) early += volumes[start + i];
    for (size_t i = 3; i < 6; ++i) late += volumes[start + i];
    early /= 3.0;
    late /= 3.0;

    if (early == 0.0) return 0.0;
    return (late - early) / early * 100.0;
}

double TechnicalIndicators::calculateStdDev(const std::vector<double>& values) {
    if (values.empty()) return 0.0;
    const double mean = std::accumulate(values.begin(), values.end(), 0.0) / values.size();
    double sq_sum = 0.0;
    for (double v : values) {
        sq_sum += (v - mean) * (v - mean);
    }
    const double denom = std::max<double>(1.0, static_cast<double>(values.size()) - 1.0);
    return std::sqrt(sq_sum / denom);
}

double TechnicalIndicators::percentChange(double base, double current) {
    if (base == 0.0) return 0.0;
    return (current - base) / base * 100.0;
}

double TechnicalIndicators::findSupport(const std::vector<Candle>& candles, int lookback) {
    if (candles.empty()) return 0.0;
    const size_t window = std::min(candles.size(), static_cast<size_t>(std::max(lookback, 1)));
    double low = candles[candles.size() - window].low;
    for (size_t i = candles.size() - window; i < candles.size(); ++i) {
        low = std::min(low, candles[i].low);
    }
    return low;
}

double TechnicalIndicators::findResistance(const std::vector<Candle>& candles, int lookback) {
    if (candles.empty()) return 0.0;
    const size_t window = std::min(candles.size(), static_cast<size_t>(std::max(lookback, 1)));
    double high = candles[candles.size() - window].high;
    for (size_t i = candles.size() - window; i < candles.size(); ++i) {
        high = std::max(high, candles[i].high);
    }
    return high;
}

std::vector<double> TechnicalIndicators::extractClosePrices(const std::vector<Candle>& candles) {
    std::vector<double> prices;
    prices.reserve(candles.size());
    for (const auto& c : candles) {
        prices.push_back(c.close);
    }
    return prices;
}

std::vector<double> TechnicalIndicators::extractVolumes(const std::vector<Candle>& candles) {
    std::vector<double> volumes;
    volumes.reserve(candles.size());
    for (const auto& c : candles) {
        volumes.push_back(c.volume);
    }
    return volumes;
}

} // namespace analytics
} // namespace zenith
