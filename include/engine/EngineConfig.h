#pragma once

#include <string>
#include <vector>

namespace zenith {
namespace engine {

// 결정 경로
enum class StrategyMode {
    ORACLE,     // 스냅샷 -> 결정 캐시/오라클 -> 주문
    SCALP       // 피처 -> 후보 -> 정책 병합 -> 주문 + 손절 추적
};

// 엔진 설정
struct EngineConfig {
    StrategyMode mode = StrategyMode::ORACLE;
    std::vector<std::string> symbols = {"BTCUSDT", "ETHUSDT"};
    bool use_testnet = true;

    int loop_interval_seconds = 30;

    // 사용자 조정 가능 (setUserLeverage / setAllocationPercent)
    int leverage = 5;
    int max_leverage = 5;
    double allocation_pct = 10.0;
    double initial_balance = 100000.0;

    // 스냅샷
    std::string kline_interval = "1m";
    int kline_limit = 240;

    // 스캘핑 입력
    int order_book_depth = 10;
    int trade_lookback = 200;

    // 캐시
    long long position_ttl_ms = 3000;
    long long decision_cooldown_ms = 45000;
    long long decision_revalidation_ms = 240000;

    std::string journal_path = "logs/events.jsonl";
};

const char* toString(StrategyMode mode);

} // namespace engine
} // namespace zenith
