#include "engine/TradingEngine.h"
#include "TestFakes.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>
#include <stdexcept>

using namespace zenith;
using zenith::core::JournalEventType;
using zenith::engine::EngineConfig;
using zenith::engine::EngineDependencies;
using zenith::engine::StrategyMode;
using zenith::engine::TradingEngine;
using zenith::test::FakeExchangeAdapter;
using zenith::test::FakeMarketData;
using zenith::test::FakePolicyOracle;
using zenith::test::FakeShockRisk;
using zenith::test::FakeStrategyOracle;
using zenith::test::MemoryJournal;

namespace {

// 지정한 심볼은 거래소가 모르는 심볼로 응답
class UnknownSymbolMarketData : public FakeMarketData {
public:
    std::string unknown;

    analytics::MarketSnapshot getSnapshot(const std::string& symbol, const std::string& interval,
                                          int limit) override {
        if (symbol == unknown) {
            throw std::runtime_error("Binance request failed: 400 (Invalid symbol.)");
        }
        return FakeMarketData::getSnapshot(symbol, interval, limit);
    }
};

analytics::MarketSnapshot bullishSnapshot() {
    analytics::MarketSnapshot snapshot;
    snapshot.metrics.last_price = 100.0;
    snapshot.metrics.change_5m_pct = 0.8;
    snapshot.metrics.rsi14 = 58.0;
    snapshot.metrics.volume_ratio = 1.4;
    snapshot.metrics.mfi14 = 55.0;
    snapshot.local.bias = Bias::LONG;
    snapshot.local.confidence = 0.7;
    snapshot.local.edge_score = 0.6;
    snapshot.local.reasoning = "EMA trend up";
    snapshot.context = {
        {"price", 100.0},
        {"change_5m_pct", 0.8},
        {"rsi_14", 58.0},
        {"local_signal", {{"bias", "LONG"}, {"confidence", 0.7}, {"edgeScore", 0.6},
                          {"reasoning", "EMA trend up"}}}
    };
    return snapshot;
}

// 2023-11-14 12:00:00 UTC (LONDON 세션)
constexpr long long kLondonNoon = 1699963200000LL;

// 종가가 100.0/100.1 로 번갈아 (RSI 50), 직전 봉만 고가 105 로 가치 영역 상단 이탈,
// 마지막 봉은 100.0 으로 복귀 -> MEAN 숏
std::vector<Candle> fakeoutCandles(long long now_ms) {
    std::vector<Candle> candles;
    const size_t count = 151;
    for (size_t i = 0; i < count; ++i) {
        const bool up = i % 2 == 1;
        const double open = up ? 100.0 : 100.1;
        const double close = up ? 100.1 : 100.0;
        const double high = i == count - 2 ? 105.0 : 100.15;
        const long long t = now_ms - static_cast<long long>(count - i) * 60000LL;
        candles.emplace_back(open, high, 99.95, close, 100.0, t, t + 59999);
    }
    return candles;
}

std::vector<strategy::TradePrint> sellerTrades(long long now_ms) {
    std::vector<strategy::TradePrint> trades;
    for (int i = 0; i < 4; ++i) {
        strategy::TradePrint t;
        t.price = 100.0;
        t.qty = 1.0;
        t.is_buy = i == 0;
        t.ts_ms = now_ms - 500;
        trades.push_back(t);
    }
    return trades;
}

void appendCandle(std::vector<Candle>& candles, double open, double high, double low, double close) {
    const long long t = candles.back().open_time + 60000LL;
    candles.emplace_back(open, high, low, close, 100.0, t, t + 59999);
}

EngineConfig oracleConfig(const std::vector<std::string>& symbols) {
    EngineConfig config;
    config.mode = StrategyMode::ORACLE;
    config.symbols = symbols;
    config.loop_interval_seconds = 1;
    return config;
}

} // namespace

int main() {
    strategy::ScalpConfig scalp_config;

    // 1. 오라클 경로: 진입 후 다음 주기에는 유지
    {
        FakeExchangeAdapter exchange;
        exchange.filters["BTCUSDT"] = test::makeFilters(0.001, 0.001, 1000.0, 5.0, 0.1);
        FakeMarketData market;
        market.snapshot = bullishSnapshot();
        FakeStrategyOracle oracle;
        oracle.responses.push_back(FakeStrategyOracle::make(Bias::LONG, 0.8, "Trend continuation"));
        MemoryJournal journal;

        TradingEngine engine(oracleConfig({"BTCUSDT"}), scalp_config,
                             EngineDependencies{exchange, market, oracle, nullptr, nullptr, &journal});

        assert(engine.tick());
        if (exchange.orders.size() != 1 || exchange.orders[0].type != "MARKET" ||
            exchange.orders[0].side != OrderSide::BUY) {
            std::cerr << "[TEST] oracle LONG should open a market buy\n";
            return 1;
        }
        assert(exchange.leverage_calls.size() == 1 && exchange.leverage_calls[0].second == 5);

        const auto decision = engine.lastDecision("BTCUSDT");
        assert(decision.has_value());
        assert(decision->bias == Bias::LONG);
        assert(decision->source == DecisionSource::ORACLE);
        assert(journal.count(JournalEventType::DECISION_RECORDED) == 1);
        assert(journal.count(JournalEventType::ORDER_FILLED) == 1);

        assert(engine.tick());
        assert(oracle.calls == 1);
        assert(exchange.orders.size() == 1);
        assert(engine.lastDecision("BTCUSDT")->action == DecisionAction::HOLD);
        assert(engine.tickCount() == 2);

        const auto positions = engine.getPositions();
        assert(positions.size() == 1 && positions[0].side == PositionSide::LONG);
    }

    // 2. 오라클 장애 + 포지션 없음 -> 관망, 주문 없음
    {
        FakeExchangeAdapter exchange;
        exchange.filters["BTCUSDT"] = test::makeFilters(0.001, 0.001, 1000.0, 5.0, 0.1);
        FakeMarketData market;
        market.snapshot = bullishSnapshot();
        FakeStrategyOracle oracle;
        oracle.fail = true;

        TradingEngine engine(oracleConfig({"BTCUSDT"}), scalp_config,
                             EngineDependencies{exchange, market, oracle, nullptr, nullptr, nullptr});
        assert(engine.tick());
        assert(exchange.orders.empty());
        const auto decision = engine.lastDecision("BTCUSDT");
        assert(decision && decision->source == DecisionSource::FALLBACK);
        assert(decision->action == DecisionAction::HOLD);
    }

    // 3. 거래소가 모르는 심볼은 차단, 나머지 심볼은 계속 평가
    {
        FakeExchangeAdapter exchange;
        exchange.filters["BTCUSDT"] = test::makeFilters(0.001, 0.001, 1000.0, 5.0, 0.1);
        UnknownSymbolMarketData market;
        market.snapshot = bullishSnapshot();
        market.unknown = "FOOUSDT";
        FakeStrategyOracle oracle;
        oracle.responses.push_back(FakeStrategyOracle::make(Bias::LONG, 0.8));
        MemoryJournal journal;

        TradingEngine engine(oracleConfig({"FOOUSDT", "BTCUSDT"}), scalp_config,
                             EngineDependencies{exchange, market, oracle, nullptr, nullptr, &journal});
        assert(engine.tick());

        if (!engine.isSymbolBlocked("FOOUSDT")) {
            std::cerr << "[TEST] unknown symbol should be blocked\n";
            return 1;
        }
        const auto active = engine.activeSymbols();
        assert(active.size() == 1 && active[0] == "BTCUSDT");
        assert(journal.count(JournalEventType::SYMBOL_BLOCKED) == 1);
        assert(engine.lastDecision("BTCUSDT").has_value());

        // 일시 장애는 차단하지 않음
        market.fail = true;
        assert(engine.tick());
        assert(!engine.isSymbolBlocked("BTCUSDT"));

        engine.blockSymbol("FOOUSDT", "again");
        assert(journal.count(JournalEventType::SYMBOL_BLOCKED) == 1);
    }

    // 4. 사용자 설정 범위 제한
    {
        FakeExchangeAdapter exchange;
        FakeMarketData market;
        FakeStrategyOracle oracle;
        auto config = oracleConfig({"BTCUSDT"});
        config.leverage = 50;
        config.max_leverage = 10;
        TradingEngine engine(config, scalp_config, EngineDependencies{exchange, market, oracle});

        assert(engine.getUserLeverage() == 10);
        engine.setUserLeverage(3);
        assert(engine.getUserLeverage() == 3);
        engine.setUserLeverage(0);
        assert(engine.getUserLeverage() == 1);
        engine.setUserLeverage(25);
        assert(engine.getUserLeverage() == 10);

        engine.setAllocationPercent(150.0);
        assert(engine.getAllocationPercent() == 100.0);
        engine.setAllocationPercent(0.2);
        assert(engine.getAllocationPercent() == 1.0);
        engine.setAllocationPercent(std::numeric_limits<double>::quiet_NaN());
        assert(engine.getAllocationPercent() == 1.0);
    }

    // 5. 시작/중지
    {
        FakeExchangeAdapter exchange;
        FakeMarketData market;
        FakeStrategyOracle oracle;
        oracle.fail = true;

        TradingEngine empty(oracleConfig({}), scalp_config, EngineDependencies{exchange, market, oracle});
        assert(!empty.start());
        assert(!empty.isRunning());

        TradingEngine engine(oracleConfig({"BTCUSDT"}), scalp_config, EngineDependencies{exchange, market, oracle});
        assert(engine.start());
        assert(engine.isRunning());
        assert(!engine.start());
        engine.stop();
        assert(!engine.isRunning());
        engine.stop();
    }

    // 6. 스캘핑 모드는 정책 오라클 필수
    {
        FakeExchangeAdapter exchange;
        FakeMarketData market;
        FakeStrategyOracle oracle;
        auto config = oracleConfig({"BTCUSDT"});
        config.mode = StrategyMode::SCALP;

        bool thrown = false;
        try {
            TradingEngine engine(config, scalp_config, EngineDependencies{exchange, market, oracle});
        } catch (const std::invalid_argument&) {
            thrown = true;
        }
        assert(thrown);
    }

    // 7. 스캘핑 경로: 정책 불허면 주문 없음, 쇼크 리스크 장애는 None 등급으로 진행
    {
        FakeExchangeAdapter exchange;
        exchange.filters["BTCUSDT"] = test::makeFilters(0.001, 0.001, 1000.0, 5.0, 0.1);
        FakeMarketData market;
        market.candles = test::makeTrendCandles(150, 100.0, 0.05);
        market.order_book = nlohmann::json::parse(
            R"({"bids": [["107.4", "5"], ["107.3", "3"]], "asks": [["107.5", "4"], ["107.6", "2"]]})");
        FakeStrategyOracle oracle;
        FakePolicyOracle policy;
        policy.verdict.allow = false;
        FakeShockRisk shock;
        shock.fail = true;
        MemoryJournal journal;

        auto config = oracleConfig({"BTCUSDT"});
        config.mode = StrategyMode::SCALP;
        TradingEngine engine(config, scalp_config,
                             EngineDependencies{exchange, market, oracle, &policy, &shock, &journal});

        assert(engine.tick());
        if (policy.calls != 1) {
            std::cerr << "[TEST] scalp candidates should be sent to the policy oracle\n";
            return 1;
        }
        assert(policy.last_payload.is_object());
        assert(exchange.orders.empty());
        assert(oracle.calls == 0);
        assert(!engine.lastDecision("BTCUSDT").has_value());
        assert(!engine.isCoolingDown("BTCUSDT"));

        // 캔들이 없으면 해당 심볼만 실패, 차단하지 않음
        market.candles.clear();
        assert(engine.tick());
        assert(!engine.isSymbolBlocked("BTCUSDT"));
        assert(policy.calls == 1);
    }

    // 8. 포지션 조회 실패: 기존 롱 위에 중복 진입하지 않고 해당 심볼만 건너뜀
    {
        FakeExchangeAdapter exchange;
        exchange.filters["BTCUSDT"] = test::makeFilters(0.001, 0.001, 1000.0, 5.0, 0.1);
        exchange.setPosition("BTCUSDT", 4.0, 100.0, 100.0);
        exchange.fail_positions = true;
        FakeMarketData market;
        market.snapshot = bullishSnapshot();
        FakeStrategyOracle oracle;
        oracle.responses.push_back(FakeStrategyOracle::make(Bias::LONG, 0.8));

        TradingEngine engine(oracleConfig({"BTCUSDT"}), scalp_config,
                             EngineDependencies{exchange, market, oracle});
        assert(engine.tick());
        if (!exchange.orders.empty()) {
            std::cerr << "[TEST] unknown position state must not open an order\n";
            return 1;
        }
        assert(oracle.calls == 0);
        assert(!engine.isSymbolBlocked("BTCUSDT"));

        exchange.fail_positions = false;
        assert(engine.tick());
        assert(exchange.orders.empty());
        assert(engine.lastDecision("BTCUSDT")->action == DecisionAction::HOLD);
    }

    // 9. 스캘핑 진입 -> TP1 후 손절 본전 이동 -> 손절 이탈 시 reduce-only IOC 청산
    {
        long long now = kLondonNoon;
        FakeExchangeAdapter exchange;
        exchange.filters["BTCUSDT"] = test::makeFilters(0.001, 0.001, 1000.0, 5.0, 0.1);
        FakeMarketData market;
        market.candles = fakeoutCandles(now);
        market.order_book = nlohmann::json::parse(
            R"({"bids": [["100.0", "10"]], "asks": [["100.01", "10"]]})");
        market.trades = sellerTrades(now);
        FakeStrategyOracle oracle;
        FakePolicyOracle policy;
        policy.verdict.allow = true;
        policy.verdict.model = strategy::Model::MEAN;
        policy.verdict.side = strategy::Side::SHORT;
        policy.verdict.quality = 0.9;
        policy.verdict.tp_rr = 1.0;
        MemoryJournal journal;

        auto config = oracleConfig({"BTCUSDT"});
        config.mode = StrategyMode::SCALP;
        EngineDependencies deps{exchange, market, oracle, &policy, nullptr, &journal};
        deps.clock = [&now]() { return now; };
        TradingEngine engine(config, scalp_config, deps);

        assert(engine.tick());
        if (exchange.orders.size() != 1 || exchange.orders[0].side != OrderSide::SELL) {
            std::cerr << "[TEST] mean reversion short entry expected\n";
            return 1;
        }
        assert(engine.lastDecision("BTCUSDT")->source == DecisionSource::STRATEGY);
        assert(engine.cooldownEventCount("BTCUSDT", risk::CooldownEvent::SLIP) == 0);

        const auto opened = engine.trackedStop("BTCUSDT");
        assert(opened.has_value());
        assert(opened->plan.side == strategy::Side::SHORT);
        assert(opened->stop > opened->plan.entry);
        assert(opened->plan.tp1.has_value() && *opened->plan.tp1 < opened->plan.entry);

        // TP1 도달: 손절가가 진입가 이하로
        now += 60000;
        appendCandle(market.candles, 100.0, 100.05, 98.95, 99.0);
        assert(engine.tick());
        const auto after_tp1 = engine.trackedStop("BTCUSDT");
        assert(after_tp1.has_value() && after_tp1->hit_tp1);
        if (after_tp1->stop > after_tp1->plan.entry) {
            std::cerr << "[TEST] stop should move to breakeven after TP1\n";
            return 1;
        }
        assert(exchange.orders.size() == 1);

        // 손절 이탈, IOC 미체결 -> 추적 유지, 쿨다운 이벤트/청산 기록 없음
        now += 60000;
        appendCandle(market.candles, 99.0, 100.3, 98.9, 100.2);
        exchange.limit_responses.push_back(FakeExchangeAdapter::ack("EXPIRED", OrderStatus::CANCELLED));
        assert(engine.tick());
        assert(exchange.orders.size() == 2);
        const auto& first_exit = exchange.orders[1];
        assert(first_exit.type == "LIMIT" && first_exit.side == OrderSide::BUY);
        assert(first_exit.options.reduce_only);
        assert(first_exit.options.time_in_force == "IOC");
        if (!engine.trackedStop("BTCUSDT")) {
            std::cerr << "[TEST] unfilled exit must keep stop tracking\n";
            return 1;
        }
        assert(engine.cooldownEventCount("BTCUSDT", risk::CooldownEvent::STOP) == 0);
        assert(journal.count(JournalEventType::POSITION_CLOSED) == 0);
        assert(engine.getPositions().size() == 1);

        // 다음 주기 재시도 체결 -> 추적 해제 + STOP 이벤트
        now += 60000;
        assert(engine.tick());
        assert(exchange.orders.size() == 3);
        assert(exchange.orders[2].options.time_in_force == "IOC");
        assert(!engine.trackedStop("BTCUSDT").has_value());
        assert(engine.cooldownEventCount("BTCUSDT", risk::CooldownEvent::STOP) == 1);
        assert(journal.count(JournalEventType::POSITION_CLOSED) == 1);
        assert(engine.getPositions().empty());
    }

    // 10. 슬리피지 한도 초과 체결 -> SLIP 이벤트
    {
        const long long now = kLondonNoon;
        FakeExchangeAdapter exchange;
        exchange.filters["BTCUSDT"] = test::makeFilters(0.001, 0.001, 1000.0, 5.0, 0.1);
        exchange.market_fill_price = 99.5;
        FakeMarketData market;
        market.candles = fakeoutCandles(now);
        market.order_book = nlohmann::json::parse(
            R"({"bids": [["100.0", "10"]], "asks": [["100.01", "10"]]})");
        market.trades = sellerTrades(now);
        FakeStrategyOracle oracle;
        FakePolicyOracle policy;
        policy.verdict.allow = true;
        policy.verdict.model = strategy::Model::MEAN;
        policy.verdict.side = strategy::Side::SHORT;
        policy.verdict.quality = 0.9;

        auto config = oracleConfig({"BTCUSDT"});
        config.mode = StrategyMode::SCALP;
        EngineDependencies deps{exchange, market, oracle, &policy};
        deps.clock = [now]() { return now; };
        TradingEngine engine(config, scalp_config, deps);

        assert(engine.tick());
        assert(exchange.orders.size() == 1);
        if (engine.cooldownEventCount("BTCUSDT", risk::CooldownEvent::SLIP) != 1) {
            std::cerr << "[TEST] 50bp entry slip should register a slip event\n";
            return 1;
        }
        const auto tracked = engine.trackedStop("BTCUSDT");
        assert(tracked && std::abs(tracked->plan.entry - 99.5) < 1e-9);
    }

    std::cout << "[TEST] TradingEngine PASSED\n";
    return 0;
}
