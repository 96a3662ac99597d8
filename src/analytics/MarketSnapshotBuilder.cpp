#include "analytics/MarketSnapshotBuilder.h"
#include "analytics/TechnicalIndicators.h"
#include "common/StepSizeHelper.h"
#include "strategy/SignalGenerator.h"

#include <algorithm>
#include <cstdio>
#include <ctime>
#include <stdexcept>

namespace zenith {
namespace analytics {

namespace {
using common::roundTo;

std::string toIso8601(long long ts_ms) {
    const std::time_t seconds = static_cast<std::time_t>(ts_ms / 1000);
    std::tm tm_utc{};
    gmtime_r(&seconds, &tm_utc);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm_utc);
    char out[48];
    std::snprintf(out, sizeof(out), "%s.%03lldZ", buf, ts_ms % 1000);
    return std::string(out);
}
} // namespace

nlohmann::json toJson(const LocalSignal& signal) {
    return {
        {"bias", toString(signal.bias)},
        {"confidence", signal.confidence},
        {"edgeScore", signal.edge_score},
        {"reasoning", signal.reasoning},
        {"longScore", signal.long_score},
        {"shortScore", signal.short_score}
    };
}

int MarketSnapshotBuilder::clampLimit(int requested) {
    if (requested <= 0) {
        requested = kDefaultLimit;
    }
    return std::max(kMinLimit, std::min(requested, kMaxLimit));
}

SnapshotMetrics MarketSnapshotBuilder::computeMetrics(const std::vector<Candle>& candles) {
    SnapshotMetrics m;
    if (candles.empty()) {
        return m;
    }

    const auto closes = TechnicalIndicators::extractClosePrices(candles);
    const auto volumes = TechnicalIndicators::extractVolumes(candles);
    const double last_price = candles.back().close;

    // n 캔들 전 종가 (부족하면 현재가)
    auto lookupClose = [&](int bars_ago) {
        const long long index = static_cast<long long>(candles.size()) - 1 - bars_ago;
        return index >= 0 ? candles[static_cast<size_t>(index)].close : last_price;
    };

    m.last_price = last_price;
    m.change_1m_pct = TechnicalIndicators::percentChange(lookupClose(1), last_price);
    m.change_5m_pct = TechnicalIndicators::percentChange(lookupClose(5), last_price);
    m.change_15m_pct = TechnicalIndicators::percentChange(lookupClose(15), last_price);

    m.sma5 = TechnicalIndicators::calculateSMA(closes, 5);
    m.sma15 = TechnicalIndicators::calculateSMA(closes, 15);
    m.ema21 = TechnicalIndicators::calculateEMA(closes, 21);
    m.ema55 = TechnicalIndicators::calculateEMA(closes, 55);
    m.rsi14 = TechnicalIndicators::calculateRSI(closes, 14);

    std::vector<double> returns;
    returns.reserve(closes.size());
    for (size_t i = 1; i < closes.size(); ++i) {
        if (closes[i - 1] > 0.0) {
            returns.push_back((closes[i] - closes[i - 1]) / closes[i - 1] * 100.0);
        }
    }
    m.volatility_pct = TechnicalIndicators::calculateStdDev(returns);

    const double atr = TechnicalIndicators::calculateATR(candles, 14);
    m.atr_pct = last_price > 0.0 ? (atr / last_price) * 100.0 : 0.0;

    m.support = TechnicalIndicators::findSupport(candles, 30);
    m.resistance = TechnicalIndicators::findResistance(candles, 30);

    const double avg_short = TechnicalIndicators::calculateSMA(volumes, 20);
    const double avg_long = TechnicalIndicators::calculateSMA(volumes, 60);
    m.volume_ratio = avg_long == 0.0 ? 1.0 : avg_short / avg_long;

    const double last_volume = volumes.back();
    const double prior_volume = volumes.size() >= 2 ? volumes[volumes.size() - 2] : last_volume;
    m.volume_change_pct = prior_volume == 0.0 ? 0.0 : (last_volume - prior_volume) / prior_volume * 100.0;
    m.volume_accel_pct = TechnicalIndicators::calculateVolumeAcceleration(volumes);

    m.mfi14 = TechnicalIndicators::calculateMFI(candles, 14);
    m.obv_slope = TechnicalIndicators::calculateOBVSlope(candles, 10);

    m.last_updated_ms = candles.back().close_time > 0 ? candles.back().close_time : candles.back().open_time;
    return m;
}

nlohmann::json MarketSnapshotBuilder::buildContext(
    const std::string& symbol,
    const SnapshotMetrics& m,
    const LocalSignal& local
) {
    nlohmann::json ctx;
    ctx["symbol"] = symbol;
    ctx["price"] = roundTo(m.last_price, 2);
    ctx["change_1m_pct"] = roundTo(m.change_1m_pct, 2);
    ctx["change_5m_pct"] = roundTo(m.change_5m_pct, 2);
    ctx["change_15m_pct"] = roundTo(m.change_15m_pct, 2);
    ctx["sma_fast"] = roundTo(m.sma5, 2);
    ctx["sma_slow"] = roundTo(m.sma15, 2);
    ctx["ema_21"] = roundTo(m.ema21, 2);
    ctx["ema_55"] = roundTo(m.ema55, 2);
    ctx["rsi_14"] = roundTo(m.rsi14, 2);
    ctx["vol_ratio"] = roundTo(m.volume_ratio, 2);
    ctx["vol_change_pct"] = roundTo(m.volume_change_pct, 2);
    ctx["vol_accel_pct"] = roundTo(m.volume_accel_pct, 2);
    ctx["mfi_14"] = roundTo(m.mfi14, 2);
    ctx["obv_slope_pct"] = roundTo(m.obv_slope * 100.0, 2);
    ctx["volatility_pct"] = roundTo(m.volatility_pct, 3);
    ctx["support"] = roundTo(m.support, 2);
    ctx["resistance"] = roundTo(m.resistance, 2);
    ctx["local_signal"] = toJson(local);
    ctx["atr_pct"] = roundTo(m.atr_pct, 3);
    ctx["edge_score"] = local.edge_score;
    ctx["updated_at"] = toIso8601(m.last_updated_ms);
    return ctx;
}

MarketSnapshot MarketSnapshotBuilder::build(
    const std::string& symbol,
    const std::string& interval,
    std::vector<Candle> candles
) {
    if (candles.empty()) {
        throw std::invalid_argument("No candles provided for market snapshot: " + symbol);
    }

    MarketSnapshot snapshot;
    snapshot.symbol = symbol;
    snapshot.interval = interval;
    snapshot.candles = std::move(candles);
    snapshot.metrics = computeMetrics(snapshot.candles);
    snapshot.local = strategy::SignalGenerator::derive(snapshot.metrics);
    snapshot.context = buildContext(symbol, snapshot.metrics, snapshot.local);
    return snapshot;
}

void MarketSnapshotBuilder::applyTicker24h(MarketSnapshot& snapshot, double change_pct) {
    snapshot.metrics.change_24h_pct = change_pct;
    snapshot.metrics.has_change_24h = true;
    snapshot.context["ticker_24h"] = {{"change_pct", roundTo(change_pct, 2)}};
}

} // namespace analytics
} // namespace zenith
