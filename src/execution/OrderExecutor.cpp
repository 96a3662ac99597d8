#include "execution/OrderExecutor.h"
#include "common/Logger.h"
#include "common/StepSizeHelper.h"
#include "execution/ExchangeRejection.h"
#include "strategy/DecisionCache.h"

#include <algorithm>
#include <cmath>

namespace zenith {
namespace execution {

using core::JournalEventType;
using core::OrderRejectKind;

const char* toString(ExecutionStatus status) {
    switch (status) {
        case ExecutionStatus::FILLED: return "FILLED";
        case ExecutionStatus::HOLD: return "HOLD";
        case ExecutionStatus::SKIPPED_CONVICTION: return "SKIPPED_CONVICTION";
        case ExecutionStatus::SKIPPED_ZERO_QUANTITY: return "SKIPPED_ZERO_QUANTITY";
        case ExecutionStatus::MARGIN_REJECTED: return "MARGIN_REJECTED";
        case ExecutionStatus::INSUFFICIENT_MARGIN: return "INSUFFICIENT_MARGIN";
        case ExecutionStatus::RETRIES_EXHAUSTED: return "RETRIES_EXHAUSTED";
        case ExecutionStatus::CLOSED: return "CLOSED";
        case ExecutionStatus::EXIT_INCOMPLETE: return "EXIT_INCOMPLETE";
        case ExecutionStatus::NO_POSITION: return "NO_POSITION";
    }
    return "HOLD";
}

namespace {
std::optional<double> positivePrice(const std::optional<double>& value) {
    if (value && std::isfinite(*value) && *value > 0.0) {
        return value;
    }
    return std::nullopt;
}
} // namespace

OrderExecutor::OrderExecutor(
    core::IExchangeAdapter& exchange,
    QuantityNormalizer& normalizer,
    risk::MarginGuard& margin_guard,
    PositionLedger& ledger,
    core::IEventJournal* journal
)
    : exchange_(exchange)
    , normalizer_(normalizer)
    , margin_guard_(margin_guard)
    , ledger_(ledger)
    , journal_(journal) {}

void OrderExecutor::journal(JournalEventType type, const std::string& symbol,
                            const std::string& entity_id, nlohmann::json payload, long long now_ms) {
    if (!journal_) {
        return;
    }
    if (!journal_->record(type, now_ms, symbol, entity_id, std::move(payload))) {
        LOG_WARN("[{}] journal append failed: {}", symbol, core::toString(type));
    }
}

// ===== 사이징 =====

double OrderExecutor::estimateTargetNotional(
    int leverage,
    double confidence,
    std::optional<double> available,
    double allocation_pct,
    double initial_balance
) {
    const int safe_leverage = std::max(leverage, 1);
    const double safe_confidence = std::isfinite(confidence) ? std::max(confidence, 0.1) : 0.1;
    const double fraction = std::min(1.0, std::max(0.01, allocation_pct / 100.0));
    const double capital = (available && std::isfinite(*available) && *available > 0.0)
        ? *available
        : initial_balance;
    const double base = std::max(capital * fraction, kBaseOrderNotional);
    return base * safe_leverage * safe_confidence;
}

double OrderExecutor::calculateOrderSize(double target_notional, std::optional<double> reference_price) {
    if (!positivePrice(reference_price)) {
        return common::roundTo(target_notional / 1000.0, 6);
    }
    return common::roundTo(target_notional / *reference_price, 6);
}

// ===== 전이 =====

TransitionResult OrderExecutor::execute(const Decision& decision, const SizingParams& sizing, long long now_ms) {
    TransitionResult result;
    const auto position = ledger_.getPosition(decision.symbol, now_ms);
    result.transition = core::execution::PositionTransitionResolver::resolve(decision, position);

    switch (result.transition.kind) {
        case core::execution::TransitionKind::NOOP: {
            ExecutionReport report;
            report.status = ExecutionStatus::NO_POSITION;
            report.symbol = decision.symbol;
            report.message = "no position to close";
            result.exit = report;
            break;
        }
        case core::execution::TransitionKind::EXIT:
            result.exit = executeExit(decision, now_ms);
            break;
        case core::execution::TransitionKind::HOLD: {
            LOG_INFO("[{}] maintaining {} position aligned with bias",
                     decision.symbol, toString(position->side));
            ExecutionReport report;
            report.status = ExecutionStatus::HOLD;
            report.symbol = decision.symbol;
            result.entry = report;
            break;
        }
        case core::execution::TransitionKind::FLIP: {
            // 기존 포지션 reduce-only 청산 후 신규 방향 진입
            Decision closing = decision;
            closing.action = DecisionAction::EXIT;
            closing.reasoning = decision.reasoning + " · Exiting " +
                                std::string(toString(position->side)) + " to flip";
            result.exit = executeExit(closing, now_ms);
            if (result.exit->status != ExecutionStatus::CLOSED) {
                // 반대 포지션이 남아 있으면 신규 진입 보류
                LOG_WARN("[{}] flip entry deferred: exit {}", decision.symbol, toString(result.exit->status));
                break;
            }
            result.entry = executeEntry(decision, sizing, now_ms);
            break;
        }
        case core::execution::TransitionKind::ENTER:
            result.entry = executeEntry(decision, sizing, now_ms);
            break;
    }
    return result;
}

ExecutionReport OrderExecutor::executeEntry(const Decision& decision, const SizingParams& sizing, long long now_ms) {
    ExecutionReport report;
    report.symbol = decision.symbol;
    report.side = entrySide(decision.bias);

    if (!strategy::DecisionCache::passesConvictionGate(decision)) {
        LOG_INFO("[{}] skipping execution: insufficient conviction (conf={:.2f}, edge={:.2f})",
                 decision.symbol, decision.confidence, decision.local_edge.value_or(0.0));
        report.status = ExecutionStatus::SKIPPED_CONVICTION;
        return report;
    }

    const int leverage = std::max(sizing.leverage, 1);
    const auto reference_price = positivePrice(decision.entry_price);
    report.reference_price = reference_price;

    const double available = ledger_.getAvailableMargin(now_ms);
    const double notional = estimateTargetNotional(
        leverage, decision.confidence, available, sizing.allocation_pct, sizing.initial_balance);
    const double raw_qty = calculateOrderSize(notional, reference_price);
    report.raw_qty = raw_qty;

    auto normalized = normalizer_.normalize(decision.symbol, raw_qty, reference_price);
    if (!normalized.tradable()) {
        LOG_WARN("[{}] normalized order size invalid (raw={:.8f}), skipping", decision.symbol, raw_qty);
        report.status = ExecutionStatus::SKIPPED_ZERO_QUANTITY;
        return report;
    }

    const auto margin = margin_guard_.enforce(
        decision.symbol, leverage, reference_price, normalized, raw_qty, available);
    if (!margin.allowed || !margin.order.tradable()) {
        LOG_WARN("[{}] skipping execution due to margin constraints", decision.symbol);
        report.status = ExecutionStatus::MARGIN_REJECTED;
        return report;
    }
    normalized = margin.order;

    if (std::abs(normalized.quantity - raw_qty) > std::max(1e-8, raw_qty * 0.05)) {
        LOG_DEBUG("[{}] adjusted quantity {:.8f} -> {}", decision.symbol, raw_qty, normalized.quantity_text);
    }

    exchange_.setLeverage(decision.symbol, leverage);

    return placeWithRetries(decision, report.side, normalized, raw_qty, reference_price, now_ms);
}

ExecutionReport OrderExecutor::placeWithRetries(
    const Decision& decision,
    OrderSide side,
    NormalizedQuantity normalized,
    double raw_qty,
    std::optional<double> reference_price,
    long long now_ms
) {
    ExecutionReport report;
    report.symbol = decision.symbol;
    report.side = side;
    report.raw_qty = raw_qty;
    report.reference_price = reference_price;

    double current_raw = raw_qty;
    for (int attempt = 0; attempt < kMaxAttempts; ++attempt) {
        if (!normalized.tradable()) {
            break;
        }
        report.attempts = attempt + 1;
        report.quantity = normalized.quantity;
        report.quantity_text = normalized.quantity_text;

        LOG_INFO("[{}] market {} qty={} (attempt {}/{})",
                 decision.symbol, toString(side), normalized.quantity_text, attempt + 1, kMaxAttempts);
        journal(JournalEventType::ORDER_SUBMITTED, decision.symbol, "", {
            {"side", toString(side)},
            {"type", "MARKET"},
            {"quantity", normalized.quantity_text},
            {"attempt", attempt + 1},
            {"reference_price", reference_price ? *reference_price : 0.0}
        }, now_ms);

        const auto placed = exchange_.placeMarketOrder(decision.symbol, side, normalized.quantity_text);
        if (placed.ok()) {
            report.status = ExecutionStatus::FILLED;
            report.fill = placed.fill;
            journal(JournalEventType::ORDER_FILLED, decision.symbol, placed.fill.order_id, {
                {"side", toString(side)},
                {"status", placed.fill.raw_status},
                {"executed_qty", placed.fill.executed_qty},
                {"avg_price", placed.fill.avg_price},
                {"attempts", attempt + 1},
                {"confidence", decision.confidence},
                {"source", toString(decision.source)}
            }, now_ms);
            Logger::getInstance().logFill(FillLogEntry{decision.symbol, "ENTER", toString(side),
                                                       placed.fill.avg_price, placed.fill.executed_qty,
                                                       std::nullopt, placed.fill.order_id});
            ledger_.invalidate();
            if (attempt > 0) {
                LOG_INFO("[{}] market order succeeded after {} attempts, qty={}",
                         decision.symbol, attempt + 1, normalized.quantity_text);
            }
            return report;
        }

        journal(JournalEventType::ORDER_REJECTED, decision.symbol, "", {
            {"side", toString(side)},
            {"quantity", normalized.quantity_text},
            {"reason", core::toString(placed.reject)},
            {"message", placed.message},
            {"attempt", attempt + 1}
        }, now_ms);

        if (placed.reject == OrderRejectKind::INSUFFICIENT_MARGIN) {
            ledger_.invalidateBalance();
            LOG_ERROR("[{}] order rejected for insufficient margin: {}", decision.symbol, placed.message);
            report.status = ExecutionStatus::INSUFFICIENT_MARGIN;
            report.message = placed.message;
            return report;
        }
        if (!ExchangeRejection::isRetryable(placed.reject)) {
            ledger_.invalidateBalance();
            throw ExchangeError(placed.reject, placed.message);
        }

        report.message = placed.message;
        if (attempt >= kMaxAttempts - 1) {
            break;
        }

        current_raw *= 0.5;
        if (!std::isfinite(current_raw) || current_raw <= 0.0) {
            break;
        }
        const auto next = normalizer_.normalize(decision.symbol, current_raw, reference_price);
        if (!next.tradable()) {
            break;
        }
        if (std::abs(next.quantity - normalized.quantity) <= std::max(1e-8, normalized.quantity * 1e-4)) {
            break;
        }

        LOG_WARN("[{}] retrying market order with reduced quantity {} ({})",
                 decision.symbol, next.quantity_text,
                 placed.reject == OrderRejectKind::PERCENT_PRICE ? "percent_price" : "max_position");
        normalized = next;
    }

    ledger_.invalidateBalance();
    LOG_WARN("[{}] market order aborted after {} attempts: {}", decision.symbol, report.attempts, report.message);
    report.status = ExecutionStatus::RETRIES_EXHAUSTED;
    return report;
}

ExecutionReport OrderExecutor::executeExit(const Decision& decision, long long now_ms, ExitTiming timing) {
    ExecutionReport report;
    report.symbol = decision.symbol;

    const auto position = ledger_.getPosition(decision.symbol, now_ms, true);
    if (!position || position->quantity <= POSITION_EPSILON) {
        LOG_INFO("[{}] skipping exit: no active position", decision.symbol);
        report.status = ExecutionStatus::NO_POSITION;
        return report;
    }

    report.side = closingSide(position->side);

    // 지정가: exitPrice > 결정 기준가 > mark > 진입가
    std::optional<double> price = positivePrice(decision.exit_price);
    if (!price) price = positivePrice(decision.entry_price);
    if (!price) price = positivePrice(position->mark_price);
    if (!price) price = positivePrice(position->entry_price);
    report.reference_price = price;
    if (!price) {
        LOG_WARN("[{}] skipping exit: missing price reference", decision.symbol);
        report.status = ExecutionStatus::SKIPPED_ZERO_QUANTITY;
        return report;
    }

    // 명목 하한 보정 없이 포지션 수량 이내로 정규화
    const auto normalized = normalizer_.normalize(decision.symbol, position->quantity, std::nullopt);
    report.raw_qty = position->quantity;
    if (!normalized.tradable()) {
        LOG_WARN("[{}] unable to normalize exit quantity {:.8f}", decision.symbol, position->quantity);
        report.status = ExecutionStatus::SKIPPED_ZERO_QUANTITY;
        return report;
    }
    report.quantity = normalized.quantity;
    report.quantity_text = normalized.quantity_text;

    double limit_price = *price;
    if (normalized.filters && normalized.filters->tick_size > 0.0) {
        limit_price = common::roundToTick(limit_price, normalized.filters->tick_size);
    }

    core::OrderOptions options;
    options.reduce_only = true;
    options.time_in_force = timing == ExitTiming::IMMEDIATE ? "IOC" : "GTC";

    journal(JournalEventType::ORDER_SUBMITTED, decision.symbol, "", {
        {"side", toString(report.side)},
        {"type", "LIMIT"},
        {"quantity", normalized.quantity_text},
        {"price", limit_price},
        {"time_in_force", options.time_in_force},
        {"reduce_only", true}
    }, now_ms);
    report.attempts = 1;

    const auto placed = exchange_.placeLimitOrder(
        decision.symbol, report.side, normalized.quantity_text, limit_price, options);
    if (!placed.ok()) {
        journal(JournalEventType::ORDER_REJECTED, decision.symbol, "", {
            {"side", toString(report.side)},
            {"reason", core::toString(placed.reject)},
            {"message", placed.message}
        }, now_ms);
        ledger_.invalidate();
        throw ExchangeError(placed.reject, placed.message);
    }

    report.fill = placed.fill;
    ledger_.invalidate();

    const OrderFill& fill = placed.fill;
    const double exit_price = fill.avg_price > 0.0 ? fill.avg_price : limit_price;
    const double filled_qty = fill.status == OrderStatus::FILLED
        ? (fill.executed_qty > 0.0 ? fill.executed_qty : normalized.quantity)
        : fill.executed_qty;

    if (filled_qty > 0.0) {
        const double pnl = position->side == PositionSide::LONG
            ? (exit_price - position->entry_price) * filled_qty
            : (position->entry_price - exit_price) * filled_qty;
        Logger::getInstance().logFill(FillLogEntry{decision.symbol, "EXIT", toString(position->side), exit_price,
                                                   filled_qty, pnl, fill.order_id});
    }

    if (fill.status != OrderStatus::FILLED) {
        // 미체결(NEW/EXPIRED) 또는 부분 체결: 포지션이 남아 있음
        if (filled_qty > 0.0) {
            journal(JournalEventType::ORDER_FILLED, decision.symbol, fill.order_id, {
                {"side", toString(report.side)},
                {"status", fill.raw_status},
                {"executed_qty", filled_qty},
                {"avg_price", exit_price},
                {"reduce_only", true}
            }, now_ms);
        }
        LOG_WARN("[{}] limit exit {} @ {} not filled (status={}, executed={})",
                 decision.symbol, options.time_in_force, limit_price, fill.raw_status, filled_qty);
        report.status = ExecutionStatus::EXIT_INCOMPLETE;
        report.message = "exit order " + fill.raw_status;
        return report;
    }

    report.status = ExecutionStatus::CLOSED;
    journal(JournalEventType::POSITION_CLOSED, decision.symbol, fill.order_id, {
        {"side", toString(position->side)},
        {"quantity", normalized.quantity_text},
        {"price", exit_price},
        {"entry_price", position->entry_price},
        {"status", fill.raw_status},
        {"reason", decision.reasoning}
    }, now_ms);

    LOG_INFO("[{}] closed {} position via limit exit @ {} qty={}",
             decision.symbol, toString(position->side), exit_price, normalized.quantity_text);
    return report;
}

} // namespace execution
} // namespace zenith
