#include "analytics/CandlePatterns.h"
#include "analytics/MarketSnapshotBuilder.h"
#include "analytics/OrderbookAnalyzer.h"
#include "analytics/TechnicalIndicators.h"
#include "analytics/TradingSession.h"
#include "network/BinanceMarketData.h"
#include "strategy/ScalpFeatureBuilder.h"
#include "TestFakes.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <stdexcept>

using namespace zenith;
using zenith::analytics::CandlePatterns;
using zenith::analytics::MarketSnapshotBuilder;
using zenith::analytics::OrderbookAnalyzer;
using zenith::analytics::TechnicalIndicators;
using zenith::analytics::TradingSession;
using zenith::network::BinanceMarketData;
using zenith::strategy::ScalpFeatureBuilder;
using zenith::strategy::TradePrint;

namespace {

bool near(double a, double b, double eps = 1e-9) {
    return std::abs(a - b) < eps;
}

constexpr long long kHourMs = 3600000LL;

TradePrint trade(double qty, bool is_buy, long long ts_ms = 0) {
    TradePrint t;
    t.price = 100.0;
    t.qty = qty;
    t.is_buy = is_buy;
    t.ts_ms = ts_ms;
    return t;
}

} // namespace

int main() {
    // 1. 기본 지표
    {
        assert(near(TechnicalIndicators::calculateSMA({1.0, 2.0, 3.0, 4.0}, 2), 3.5));
        assert(near(TechnicalIndicators::calculateSMA({1.0, 2.0}, 5), 2.0));
        if (!near(TechnicalIndicators::calculateEMA({10.0, 20.0}, 3), 15.0)) {
            std::cerr << "[TEST] EMA should be seeded with the first value\n";
            return 1;
        }

        std::vector<double> rising;
        std::vector<double> falling;
        for (int i = 0; i < 20; ++i) {
            rising.push_back(100.0 + i);
            falling.push_back(100.0 - i);
        }
        assert(near(TechnicalIndicators::calculateRSI(rising, 14), 100.0));
        assert(near(TechnicalIndicators::calculateRSI(falling, 14), 0.0));
        assert(near(TechnicalIndicators::calculateRSI({1.0, 2.0, 3.0}, 14), 50.0));
        assert(near(TechnicalIndicators::percentChange(0.0, 10.0), 0.0));
        assert(near(TechnicalIndicators::percentChange(100.0, 105.0), 5.0));
    }

    // 2. UTC 세션 구분
    {
        assert(analytics::sessionOf(0) == TradingSession::ASIA);
        assert(analytics::sessionOf(8 * kHourMs) == TradingSession::BRIDGE);
        assert(analytics::sessionOf(12 * kHourMs) == TradingSession::LONDON);
        assert(analytics::sessionOf(20 * kHourMs) == TradingSession::NY);
        assert(analytics::sessionOf(24 * kHourMs + 3 * kHourMs) == TradingSession::ASIA);
    }

    // 3. 캔들 패턴
    {
        const std::vector<Candle> engulf{
            Candle(102.0, 102.5, 99.8, 100.0, 10.0, 0),
            Candle(99.5, 103.2, 99.4, 103.0, 15.0, 60000)
        };
        if (!CandlePatterns::isEngulfing(engulf, 1, true)) {
            std::cerr << "[TEST] bullish engulfing not detected\n";
            return 1;
        }
        assert(!CandlePatterns::isEngulfing(engulf, 1, false));
        assert(!CandlePatterns::isEngulfing(engulf, 0, true));
        assert(!CandlePatterns::isEngulfing(engulf, 5, true));

        const std::vector<Candle> doji{Candle(100.0, 101.0, 99.0, 100.05, 5.0, 0)};
        assert(CandlePatterns::isDoji(doji, 0));
        const std::vector<Candle> flat{Candle(100.0, 100.0, 100.0, 100.0, 5.0, 0)};
        assert(!CandlePatterns::isDoji(flat, 0));
    }

    // 4. 호가 요약
    {
        const auto depth = nlohmann::json::parse(R"({
            "E": 1700000000000,
            "bids": [["100.0", "5"], ["99.9", "3"]],
            "asks": [["100.1", "4"], ["100.2", "2"]]
        })");
        const auto book = OrderbookAnalyzer::analyze(depth);
        assert(book.valid);
        assert(near(book.best_bid, 100.0));
        assert(near(book.best_ask, 100.1));
        assert(near(book.mid_price, 100.05));
        assert(near(book.spread_bp, 0.1 / 100.05 * 1e4, 1e-6));
        assert(near(book.bid_qty, 8.0));
        assert(near(book.ask_qty, 6.0));
        assert(near(book.imbalance, 2.0 / 14.0));
        assert(book.event_time_ms == 1700000000000LL);

        const auto shallow = OrderbookAnalyzer::analyze(depth, 1);
        assert(near(shallow.bid_qty, 5.0) && near(shallow.ask_qty, 4.0));

        assert(!OrderbookAnalyzer::analyze(nlohmann::json::object()).valid);
        assert(!OrderbookAnalyzer::analyze(nlohmann::json::parse(R"({"bids": [], "asks": [["1", "1"]]})")).valid);
    }

    // 5. 캔들/체결 응답 파싱
    {
        const auto klines = BinanceMarketData::parseKlines(nlohmann::json::parse(R"([
            [1700000000000, "100.0", "101.0", "99.5", "100.5", "12.3", 1700000059999, "1236.1", 42],
            [1700000060000, "100.5", "100.9", "100.1", "100.2", "8", 1700000119999, "801.6", 30]
        ])"));
        assert(klines.size() == 2);
        assert(near(klines[0].open, 100.0) && near(klines[0].high, 101.0));
        assert(near(klines[0].low, 99.5) && near(klines[0].close, 100.5));
        assert(near(klines[0].volume, 12.3));
        assert(klines[0].open_time == 1700000000000LL);
        assert(klines[1].close_time == 1700000119999LL);

        bool malformed = false;
        try {
            BinanceMarketData::parseKlines(nlohmann::json::parse(R"([[1700000000000, "1", "2"]])"));
        } catch (const std::runtime_error&) {
            malformed = true;
        }
        assert(malformed);

        bool not_array = false;
        try {
            BinanceMarketData::parseKlines(nlohmann::json::parse(R"({"code": -1121, "msg": "Invalid symbol."})"));
        } catch (const std::runtime_error&) {
            not_array = true;
        }
        assert(not_array);

        const auto trades = BinanceMarketData::parseAggTrades(nlohmann::json::parse(R"([
            {"a": 1, "p": "100.1", "q": "0.5", "m": true, "T": 1700000000100},
            {"a": 2, "p": "100.2", "q": "1.5", "m": false, "T": 1700000000200}
        ])"));
        assert(trades.size() == 2);
        assert(!trades[0].is_buy);
        assert(trades[1].is_buy);
        assert(near(trades[1].qty, 1.5));
        assert(trades[1].ts_ms == 1700000000200LL);
    }

    // 6. 스냅샷 빌더
    {
        assert(MarketSnapshotBuilder::clampLimit(0) == MarketSnapshotBuilder::kDefaultLimit);
        assert(MarketSnapshotBuilder::clampLimit(50) == 90);
        assert(MarketSnapshotBuilder::clampLimit(1000) == 500);
        assert(MarketSnapshotBuilder::clampLimit(120) == 120);

        bool thrown = false;
        try {
            MarketSnapshotBuilder::build("BTCUSDT", "1m", {});
        } catch (const std::invalid_argument&) {
            thrown = true;
        }
        assert(thrown);

        auto candles = test::makeTrendCandles(120, 100.0, 0.1);
        const double last_close = candles.back().close;
        auto snapshot = MarketSnapshotBuilder::build("BTCUSDT", "1m", std::move(candles));
        assert(near(snapshot.metrics.last_price, last_close));
        assert(snapshot.metrics.change_5m_pct > 0.0);
        assert(snapshot.context.is_object());
        assert(!snapshot.metrics.has_change_24h);

        MarketSnapshotBuilder::applyTicker24h(snapshot, 3.456);
        assert(snapshot.metrics.has_change_24h);
        assert(near(snapshot.metrics.change_24h_pct, 3.456));
        assert(snapshot.context.contains("ticker_24h"));
    }

    // 7. 스캘핑 피처
    {
        std::vector<TradePrint> calm{trade(1.0, true), trade(1.0, false), trade(1.0, true)};
        const auto calm_flow = ScalpFeatureBuilder::orderFlow(calm);
        assert(near(calm_flow.buy, 2.0) && near(calm_flow.sell, 1.0));
        assert(!calm_flow.bubble);

        auto burst = calm;
        burst.push_back(trade(1.0, false));
        burst.push_back(trade(10.0, true));
        if (!ScalpFeatureBuilder::orderFlow(burst).bubble) {
            std::cerr << "[TEST] outsized print should flag a bubble\n";
            return 1;
        }
        assert(!ScalpFeatureBuilder::orderFlow({}).bubble);

        assert(ScalpFeatureBuilder::regimeOf(3.0, 2.0, 1.0) == strategy::MarketRegime::BULLISH);
        assert(ScalpFeatureBuilder::regimeOf(1.0, 2.0, 3.0) == strategy::MarketRegime::BEARISH);
        assert(ScalpFeatureBuilder::regimeOf(2.0, 3.0, 1.0) == strategy::MarketRegime::RANGE);
        assert(ScalpFeatureBuilder::regimeOf(2.0, 2.0, 1.0) == strategy::MarketRegime::RANGE);

        // 0->2 상승 갭, 3->5 하락 갭
        const std::vector<Candle> gaps{
            Candle(100.0, 101.0, 99.0, 100.5, 10.0, 0),
            Candle(100.5, 103.0, 100.4, 102.8, 10.0, 60000),
            Candle(102.8, 104.0, 102.0, 103.5, 10.0, 120000),
            Candle(103.5, 103.8, 103.0, 103.2, 10.0, 180000),
            Candle(103.2, 103.3, 99.0, 99.5, 10.0, 240000),
            Candle(99.5, 100.0, 98.0, 98.5, 10.0, 300000)
        };
        const auto zones = ScalpFeatureBuilder::fairValueGaps(gaps);
        assert(zones.size() == 2);
        assert(zones[0].type == strategy::FvgType::BEARISH);
        assert(near(zones[0].from, 100.0) && near(zones[0].to, 103.0) && near(zones[0].size, 3.0));
        assert(zones[1].type == strategy::FvgType::BULLISH);
        assert(near(zones[1].from, 101.0) && near(zones[1].to, 102.0) && near(zones[1].size, 1.0));
        assert(ScalpFeatureBuilder::fairValueGaps({gaps[0], gaps[1]}).empty());

        const auto trend = test::makeTrendCandles(150, 100.0, 0.05);
        const auto vp = ScalpFeatureBuilder::volumeProfile(trend, trend.back().close);
        assert(vp.val < vp.vah);
        assert(vp.poc >= vp.val && vp.poc <= vp.vah);
        const auto empty_vp = ScalpFeatureBuilder::volumeProfile({}, 42.0);
        assert(empty_vp.poc == 42.0 && empty_vp.vah == 42.0 && empty_vp.val == 42.0);
        assert(empty_vp.lvn.empty());

        ScalpFeatureBuilder::Inputs inputs;
        inputs.symbol = "BTCUSDT";
        inputs.candles = trend;
        inputs.now_ms = trend.back().close_time + 1000;
        inputs.order_book = nlohmann::json::parse(R"({"bids": [["107.4", "5"]], "asks": [["107.5", "4"]]})");
        inputs.order_book["E"] = inputs.now_ms - 500;
        inputs.trades = {trade(1.0, true, inputs.now_ms - 2000), trade(2.0, false, inputs.now_ms - 200)};
        inputs.latency_ms = 35.0;
        inputs.tick_size = 0.1;
        inputs.available_usdt = 500.0;

        const auto features = ScalpFeatureBuilder::build(inputs);
        assert(features.symbol == "BTCUSDT");
        assert(near(features.close, trend.back().close));
        assert(features.regime == strategy::MarketRegime::BULLISH);
        assert(features.ema25 > features.ema50 && features.ema50 > features.ema100);
        assert(near(features.micro.quote_age_ms, 500.0));
        assert(near(features.micro.latency_ms, 35.0));
        assert(near(features.micro.bid_qty10, 5.0));
        assert(features.signal_age_sec && near(*features.signal_age_sec, 0.2));
        assert(features.session == analytics::sessionOf(inputs.now_ms));
        assert(near(features.available_usdt, 500.0));
        assert(features.trades.size() == 2);

        // 호가 시각이 없으면 지연 시간을 호가 나이로 사용
        inputs.order_book.erase("E");
        inputs.trades.clear();
        const auto stale = ScalpFeatureBuilder::build(inputs);
        assert(near(stale.micro.quote_age_ms, 35.0));
        assert(!stale.signal_age_sec.has_value());

        bool thrown = false;
        try {
            inputs.candles.clear();
            ScalpFeatureBuilder::build(inputs);
        } catch (const std::invalid_argument&) {
            thrown = true;
        }
        assert(thrown);
    }

    std::cout << "[TEST] MarketFeatures PASSED\n";
    return 0;
}
