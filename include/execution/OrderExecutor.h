#pragma once

#include <optional>
#include <string>

#include "common/Types.h"
#include "core/contracts/IEventJournal.h"
#include "core/contracts/IExchangeAdapter.h"
#include "core/execution/PositionTransition.h"
#include "execution/PositionLedger.h"
#include "execution/QuantityNormalizer.h"
#include "risk/MarginGuard.h"

namespace zenith {
namespace execution {

enum class ExecutionStatus {
    FILLED,
    HOLD,
    SKIPPED_CONVICTION,
    SKIPPED_ZERO_QUANTITY,
    MARGIN_REJECTED,
    INSUFFICIENT_MARGIN,
    RETRIES_EXHAUSTED,
    CLOSED,
    EXIT_INCOMPLETE,
    NO_POSITION
};

// 청산 지정가 유효기간: RESTING=GTC, IMMEDIATE=IOC (미체결분 즉시 취소)
enum class ExitTiming { RESTING, IMMEDIATE };

struct ExecutionReport {
    ExecutionStatus status = ExecutionStatus::HOLD;
    std::string symbol;
    OrderSide side = OrderSide::BUY;
    double raw_qty = 0.0;
    double quantity = 0.0;
    std::string quantity_text;
    std::optional<double> reference_price;
    std::optional<OrderFill> fill;
    int attempts = 0;
    std::string message;
};

struct TransitionResult {
    core::execution::PositionTransition transition;
    std::optional<ExecutionReport> exit;
    std::optional<ExecutionReport> entry;
};

// 사이징 입력 (런타임 변경 가능한 사용자 설정)
struct SizingParams {
    int leverage = 5;
    double allocation_pct = 10.0;
    double initial_balance = 100000.0;
};

// 결정 -> 포지션 전이 -> 주문.
// PERCENT_PRICE/LEVERAGE_BRACKET 거절은 원 수량을 절반씩 줄여 최대 3회 시도,
// 그 외 거절은 ExchangeError
class OrderExecutor {
public:
    static constexpr int kMaxAttempts = 3;
    static constexpr double kBaseOrderNotional = 40.0;

    OrderExecutor(
        core::IExchangeAdapter& exchange,
        QuantityNormalizer& normalizer,
        risk::MarginGuard& margin_guard,
        PositionLedger& ledger,
        core::IEventJournal* journal = nullptr
    );

    TransitionResult execute(const Decision& decision, const SizingParams& sizing, long long now_ms);

    ExecutionReport executeEntry(const Decision& decision, const SizingParams& sizing, long long now_ms);
    // FILLED 응답일 때만 CLOSED. 미체결/부분 체결은 EXIT_INCOMPLETE (포지션 잔존)
    ExecutionReport executeExit(const Decision& decision, long long now_ms,
                                ExitTiming timing = ExitTiming::RESTING);

    // max(가용 x clamp(배분%,1%,100%), 40) x max(레버리지,1) x max(신뢰도,0.1)
    static double estimateTargetNotional(
        int leverage,
        double confidence,
        std::optional<double> available,
        double allocation_pct,
        double initial_balance
    );

    // notional / price 를 소수 6자리로. 가격이 없으면 notional/1000
    static double calculateOrderSize(double target_notional, std::optional<double> reference_price);

private:
    ExecutionReport placeWithRetries(
        const Decision& decision,
        OrderSide side,
        NormalizedQuantity normalized,
        double raw_qty,
        std::optional<double> reference_price,
        long long now_ms
    );

    void journal(core::JournalEventType type, const std::string& symbol,
                 const std::string& entity_id, nlohmann::json payload, long long now_ms);

    core::IExchangeAdapter& exchange_;
    QuantityNormalizer& normalizer_;
    risk::MarginGuard& margin_guard_;
    PositionLedger& ledger_;
    core::IEventJournal* journal_;
};

const char* toString(ExecutionStatus status);

} // namespace execution
} // namespace zenith
