#include "strategy/ScalpFeatureBuilder.h"
#include "analytics/OrderbookAnalyzer.h"
#include "analytics/TechnicalIndicators.h"
#include "analytics/TradingSession.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace zenith {
namespace strategy {

using analytics::TechnicalIndicators;

ScalpFeatures ScalpFeatureBuilder::build(const Inputs& in) {
    if (in.candles.empty()) {
        throw std::invalid_argument("No candles for scalp features: " + in.symbol);
    }

    ScalpFeatures f;
    f.ts_ms = in.now_ms;
    f.symbol = in.symbol;
    f.candles = in.candles;
    f.close = in.candles.back().close;
    f.tick_size = in.tick_size;
    f.available_usdt = in.available_usdt;
    f.trades = in.trades;

    const auto closes = TechnicalIndicators::extractClosePrices(in.candles);
    f.ema25 = TechnicalIndicators::calculateEMA(closes, 25);
    f.ema50 = TechnicalIndicators::calculateEMA(closes, 50);
    f.ema100 = TechnicalIndicators::calculateEMA(closes, 100);
    f.rsi14 = TechnicalIndicators::calculateRSI(closes, 14);
    f.atr22 = TechnicalIndicators::calculateATR(in.candles, 22);
    f.regime = regimeOf(f.ema25, f.ema50, f.ema100);

    f.vp = volumeProfile(in.candles, f.close);
    f.fvg = fairValueGaps(in.candles);
    if (!f.fvg.empty()) {
        double sum = 0.0;
        for (const auto& zone : f.fvg) sum += zone.size;
        f.fvg_avg_size = sum / static_cast<double>(f.fvg.size());
    }

    f.orderflow = orderFlow(in.trades);

    const auto book = analytics::OrderbookAnalyzer::analyze(in.order_book, 10);
    f.micro.spread_bp = book.spread_bp;
    f.micro.bid_qty10 = book.bid_qty;
    f.micro.ask_qty10 = book.ask_qty;
    f.micro.latency_ms = in.latency_ms;
    f.micro.quote_age_ms = book.event_time_ms > 0
        ? std::max(0.0, static_cast<double>(in.now_ms - book.event_time_ms))
        : in.latency_ms;

    f.session = analytics::sessionOf(in.now_ms);

    // 신호 나이 = 가장 최근 시장 데이터(체결/호가) 기준
    long long latest_ms = book.event_time_ms;
    for (const auto& t : in.trades) {
        latest_ms = std::max(latest_ms, t.ts_ms);
    }
    if (latest_ms > 0) {
        f.signal_age_sec = std::max(0.0, static_cast<double>(in.now_ms - latest_ms) / 1000.0);
    }
    return f;
}

VolumeProfile ScalpFeatureBuilder::volumeProfile(const std::vector<Candle>& candles, double reference_price) {
    VolumeProfile vp;
    vp.vah = vp.val = vp.poc = reference_price;
    if (candles.empty()) return vp;

    const size_t count = std::min<size_t>(kProfileCandles, candles.size());
    const size_t start = candles.size() - count;

    double lo = candles[start].low;
    double hi = candles[start].high;
    for (size_t i = start; i < candles.size(); ++i) {
        lo = std::min(lo, candles[i].low);
        hi = std::max(hi, candles[i].high);
    }
    if (!(hi > lo)) return vp;

    const double width = (hi - lo) / kProfileBins;
    std::vector<double> bins(kProfileBins, 0.0);
    double total = 0.0;
    for (size_t i = start; i < candles.size(); ++i) {
        const auto& c = candles[i];
        const double typical = (c.high + c.low + c.close) / 3.0;
        int idx = static_cast<int>((typical - lo) / width);
        idx = std::min(kProfileBins - 1, std::max(0, idx));
        bins[idx] += c.volume;
        total += c.volume;
    }
    if (total <= 0.0) return vp;

    auto mid = [&](int idx) { return lo + (idx + 0.5) * width; };

    const int poc_idx = static_cast<int>(std::max_element(bins.begin(), bins.end()) - bins.begin());
    vp.poc = mid(poc_idx);

    // POC 에서 양옆 중 거래량이 큰 쪽으로 확장
    int low_idx = poc_idx;
    int high_idx = poc_idx;
    double covered = bins[poc_idx];
    while (covered < total * kValueAreaShare && (low_idx > 0 || high_idx < kProfileBins - 1)) {
        const double below = low_idx > 0 ? bins[low_idx - 1] : -1.0;
        const double above = high_idx < kProfileBins - 1 ? bins[high_idx + 1] : -1.0;
        if (above >= below) {
            ++high_idx;
            covered += bins[high_idx];
        } else {
            --low_idx;
            covered += bins[low_idx];
        }
    }
    vp.val = lo + low_idx * width;
    vp.vah = lo + (high_idx + 1) * width;

    const double mean_bin = total / kProfileBins;
    for (int i = 0; i < kProfileBins; ++i) {
        if (bins[i] < mean_bin * kLvnShare) {
            vp.lvn.push_back(mid(i));
        }
    }
    std::sort(vp.lvn.begin(), vp.lvn.end(), [&](double a, double b) {
        return std::abs(a - reference_price) < std::abs(b - reference_price);
    });
    return vp;
}

std::vector<FvgZone> ScalpFeatureBuilder::fairValueGaps(const std::vector<Candle>& candles) {
    std::vector<FvgZone> zones;
    if (candles.size() < 3) return zones;

    const size_t first = candles.size() > static_cast<size_t>(kFvgLookback)
        ? candles.size() - kFvgLookback
        : 0;
    for (size_t i = std::max<size_t>(first, 2); i < candles.size(); ++i) {
        const Candle& a = candles[i - 2];
        const Candle& c = candles[i];
        if (c.low > a.high) {
            zones.push_back(FvgZone{FvgType::BULLISH, a.high, c.low, c.low - a.high});
        } else if (c.high < a.low) {
            zones.push_back(FvgZone{FvgType::BEARISH, c.high, a.low, a.low - c.high});
        }
    }
    std::reverse(zones.begin(), zones.end());
    return zones;
}

OrderFlow ScalpFeatureBuilder::orderFlow(const std::vector<TradePrint>& trades) {
    OrderFlow of;
    if (trades.empty()) return of;

    double sum = 0.0;
    for (const auto& t : trades) {
        if (t.is_buy) of.buy += t.qty;
        else of.sell += t.qty;
        sum += t.qty;
    }
    const double avg = sum / static_cast<double>(trades.size());
    for (const auto& t : trades) {
        if (avg > 0.0 && t.qty >= avg * kBubbleMultiple) {
            of.bubble = true;
            break;
        }
    }
    return of;
}

MarketRegime ScalpFeatureBuilder::regimeOf(double ema25, double ema50, double ema100) {
    if (ema25 > ema50 && ema50 > ema100) return MarketRegime::BULLISH;
    if (ema25 < ema50 && ema50 < ema100) return MarketRegime::BEARISH;
    return MarketRegime::RANGE;
}

} // namespace strategy
} // namespace zenith
